// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_FAKE_DISPLAY_SINK_H_
#define POWER_MANAGER_FAKE_DISPLAY_SINK_H_

#include "power_manager/display_sink_interface.h"

namespace power_manager {

// Records display requests. Reports every request as applied immediately
// unless set_ready(false) was called; tests then simulate completion through
// delegate()->OnDisplayStateChanged().
class FakeDisplaySink : public DisplaySinkInterface {
 public:
  FakeDisplaySink() = default;
  FakeDisplaySink(const FakeDisplaySink&) = delete;
  FakeDisplaySink& operator=(const FakeDisplaySink&) = delete;

  ~FakeDisplaySink() override = default;

  Delegate* delegate() { return delegate_; }
  const DisplayPowerRequest& last_request() const { return last_request_; }
  bool last_wait_for_negative_proximity() const {
    return last_wait_for_negative_proximity_;
  }
  int num_requests() const { return num_requests_; }

  void set_ready(bool ready) { ready_ = ready; }
  void set_proximity_sensor_available(bool available) {
    proximity_sensor_available_ = available;
  }

  // DisplaySinkInterface:
  void SetDelegate(Delegate* delegate) override { delegate_ = delegate; }
  bool RequestPowerState(const DisplayPowerRequest& request,
                         bool wait_for_negative_proximity) override {
    last_request_ = request;
    last_wait_for_negative_proximity_ = wait_for_negative_proximity;
    num_requests_++;
    return ready_;
  }
  bool IsProximitySensorAvailable() const override {
    return proximity_sensor_available_;
  }

 private:
  Delegate* delegate_ = nullptr;
  DisplayPowerRequest last_request_;
  bool last_wait_for_negative_proximity_ = false;
  int num_requests_ = 0;
  bool ready_ = true;
  bool proximity_sensor_available_ = false;
};

}  // namespace power_manager

#endif  // POWER_MANAGER_FAKE_DISPLAY_SINK_H_
