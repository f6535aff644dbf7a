// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_FAKE_DREAM_HOST_H_
#define POWER_MANAGER_FAKE_DREAM_HOST_H_

#include "power_manager/dream_host_interface.h"

namespace power_manager {

class FakeDreamHost : public DreamHostInterface {
 public:
  FakeDreamHost() = default;
  FakeDreamHost(const FakeDreamHost&) = delete;
  FakeDreamHost& operator=(const FakeDreamHost&) = delete;

  ~FakeDreamHost() override = default;

  int num_starts() const { return num_starts_; }
  int num_stops() const { return num_stops_; }

  // If false, StartDream() is recorded but no dream begins.
  void set_start_succeeds(bool start_succeeds) {
    start_succeeds_ = start_succeeds;
  }
  // Simulates the dream exiting by itself.
  void set_dreaming(bool dreaming) { dreaming_ = dreaming; }

  // DreamHostInterface:
  void StartDream() override {
    num_starts_++;
    if (start_succeeds_)
      dreaming_ = true;
  }
  void StopDream() override {
    num_stops_++;
    dreaming_ = false;
  }
  bool IsDreaming() override { return dreaming_; }

 private:
  int num_starts_ = 0;
  int num_stops_ = 0;
  bool start_succeeds_ = true;
  bool dreaming_ = false;
};

}  // namespace power_manager

#endif  // POWER_MANAGER_FAKE_DREAM_HOST_H_
