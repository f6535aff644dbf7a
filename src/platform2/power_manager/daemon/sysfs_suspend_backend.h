// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_DAEMON_SYSFS_SUSPEND_BACKEND_H_
#define POWER_MANAGER_DAEMON_SYSFS_SUSPEND_BACKEND_H_

#include <string>

#include <base/files/file_path.h>

#include "power_manager/suspend_inhibitor.h"

namespace power_manager {

// Holds kernel wakeup sources through /sys/power/wake_lock and
// /sys/power/wake_unlock.
class SysfsSuspendBackend : public SuspendInhibitorBackend {
 public:
  static constexpr char kDefaultPowerDir[] = "/sys/power";

  explicit SysfsSuspendBackend(const base::FilePath& power_dir);
  SysfsSuspendBackend(const SysfsSuspendBackend&) = delete;
  SysfsSuspendBackend& operator=(const SysfsSuspendBackend&) = delete;

  ~SysfsSuspendBackend() override;

  // SuspendInhibitorBackend:
  void Acquire(const std::string& name) override;
  void Release(const std::string& name) override;

 private:
  void WriteName(const char* file, const std::string& name);

  const base::FilePath power_dir_;
};

}  // namespace power_manager

#endif  // POWER_MANAGER_DAEMON_SYSFS_SUSPEND_BACKEND_H_
