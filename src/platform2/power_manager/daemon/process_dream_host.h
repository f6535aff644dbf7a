// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_DAEMON_PROCESS_DREAM_HOST_H_
#define POWER_MANAGER_DAEMON_PROCESS_DREAM_HOST_H_

#include <memory>
#include <string>
#include <vector>

#include <brillo/process/process.h>

#include "power_manager/dream_host_interface.h"

namespace power_manager {

// Runs a screensaver command as the dream. Only used from the worker
// sequence.
class ProcessDreamHost : public DreamHostInterface {
 public:
  // |command| is split on whitespace into the program and its arguments.
  explicit ProcessDreamHost(const std::string& command);
  ProcessDreamHost(const ProcessDreamHost&) = delete;
  ProcessDreamHost& operator=(const ProcessDreamHost&) = delete;

  ~ProcessDreamHost() override;

  // DreamHostInterface:
  void StartDream() override;
  void StopDream() override;
  bool IsDreaming() override;

 private:
  const std::vector<std::string> argv_;
  std::unique_ptr<brillo::Process> process_;
};

}  // namespace power_manager

#endif  // POWER_MANAGER_DAEMON_PROCESS_DREAM_HOST_H_
