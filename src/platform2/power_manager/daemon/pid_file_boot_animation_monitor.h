// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_DAEMON_PID_FILE_BOOT_ANIMATION_MONITOR_H_
#define POWER_MANAGER_DAEMON_PID_FILE_BOOT_ANIMATION_MONITOR_H_

#include <base/files/file_path.h>

#include "power_manager/boot_animation_monitor_interface.h"

namespace power_manager {

// Treats the boot animation as running while the process named in a pid file
// is alive.
class PidFileBootAnimationMonitor : public BootAnimationMonitorInterface {
 public:
  explicit PidFileBootAnimationMonitor(const base::FilePath& pid_file);
  PidFileBootAnimationMonitor(const PidFileBootAnimationMonitor&) = delete;
  PidFileBootAnimationMonitor& operator=(const PidFileBootAnimationMonitor&) =
      delete;

  ~PidFileBootAnimationMonitor() override;

  // BootAnimationMonitorInterface:
  bool IsBootAnimationRunning() override;

 private:
  const base::FilePath pid_file_;
};

}  // namespace power_manager

#endif  // POWER_MANAGER_DAEMON_PID_FILE_BOOT_ANIMATION_MONITOR_H_
