// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_BOOT_ANIMATION_MONITOR_INTERFACE_H_
#define POWER_MANAGER_BOOT_ANIMATION_MONITOR_INTERFACE_H_

namespace power_manager {

class BootAnimationMonitorInterface {
 public:
  virtual ~BootAnimationMonitorInterface() = default;

  // Returns true while the boot splash is still on screen.
  virtual bool IsBootAnimationRunning() = 0;
};

}  // namespace power_manager

#endif  // POWER_MANAGER_BOOT_ANIMATION_MONITOR_INTERFACE_H_
