// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/daemon/pid_file_boot_animation_monitor.h"

#include <sys/types.h>

#include <string>

#include <base/files/file_util.h>
#include <base/logging.h>
#include <base/strings/string_number_conversions.h>
#include <base/strings/string_util.h>
#include <brillo/process/process.h>

namespace power_manager {

PidFileBootAnimationMonitor::PidFileBootAnimationMonitor(
    const base::FilePath& pid_file)
    : pid_file_(pid_file) {}

PidFileBootAnimationMonitor::~PidFileBootAnimationMonitor() = default;

bool PidFileBootAnimationMonitor::IsBootAnimationRunning() {
  if (pid_file_.empty())
    return false;

  std::string contents;
  if (!base::ReadFileToString(pid_file_, &contents))
    return false;

  int pid = 0;
  base::TrimWhitespaceASCII(contents, base::TRIM_ALL, &contents);
  if (!base::StringToInt(contents, &pid) || pid <= 0) {
    LOG(WARNING) << "Ignoring malformed pid file " << pid_file_.value();
    return false;
  }
  return brillo::Process::ProcessExists(static_cast<pid_t>(pid));
}

}  // namespace power_manager
