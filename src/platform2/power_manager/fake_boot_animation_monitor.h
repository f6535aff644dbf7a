// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_FAKE_BOOT_ANIMATION_MONITOR_H_
#define POWER_MANAGER_FAKE_BOOT_ANIMATION_MONITOR_H_

#include "power_manager/boot_animation_monitor_interface.h"

namespace power_manager {

class FakeBootAnimationMonitor : public BootAnimationMonitorInterface {
 public:
  FakeBootAnimationMonitor() = default;
  FakeBootAnimationMonitor(const FakeBootAnimationMonitor&) = delete;
  FakeBootAnimationMonitor& operator=(const FakeBootAnimationMonitor&) =
      delete;

  ~FakeBootAnimationMonitor() override = default;

  void set_running(bool running) { running_ = running; }
  int num_checks() const { return num_checks_; }

  // BootAnimationMonitorInterface:
  bool IsBootAnimationRunning() override {
    num_checks_++;
    return running_;
  }

 private:
  bool running_ = false;
  int num_checks_ = 0;
};

}  // namespace power_manager

#endif  // POWER_MANAGER_FAKE_BOOT_ANIMATION_MONITOR_H_
