// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/daemon/sysfs_suspend_backend.h"

#include <base/files/file_util.h>
#include <base/logging.h>

namespace power_manager {

namespace {

constexpr char kWakeLockFile[] = "wake_lock";
constexpr char kWakeUnlockFile[] = "wake_unlock";

}  // namespace

SysfsSuspendBackend::SysfsSuspendBackend(const base::FilePath& power_dir)
    : power_dir_(power_dir) {}

SysfsSuspendBackend::~SysfsSuspendBackend() = default;

void SysfsSuspendBackend::Acquire(const std::string& name) {
  VLOG(1) << "Acquiring kernel wakeup source " << name;
  WriteName(kWakeLockFile, name);
}

void SysfsSuspendBackend::Release(const std::string& name) {
  VLOG(1) << "Releasing kernel wakeup source " << name;
  WriteName(kWakeUnlockFile, name);
}

void SysfsSuspendBackend::WriteName(const char* file, const std::string& name) {
  const base::FilePath path = power_dir_.Append(file);
  if (!base::WriteFile(path, name))
    PLOG(ERROR) << "Failed to write \"" << name << "\" to " << path.value();
}

}  // namespace power_manager
