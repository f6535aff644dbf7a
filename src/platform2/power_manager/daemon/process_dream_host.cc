// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/daemon/process_dream_host.h"

#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <base/logging.h>
#include <base/posix/eintr_wrapper.h>
#include <base/strings/string_split.h>

namespace power_manager {

namespace {

// How long the dream gets to exit after SIGTERM.
constexpr int kStopTimeoutSeconds = 2;

}  // namespace

ProcessDreamHost::ProcessDreamHost(const std::string& command)
    : argv_(base::SplitString(command,
                              " \t",
                              base::TRIM_WHITESPACE,
                              base::SPLIT_WANT_NONEMPTY)) {}

ProcessDreamHost::~ProcessDreamHost() {
  StopDream();
}

void ProcessDreamHost::StartDream() {
  if (IsDreaming())
    return;
  if (argv_.empty()) {
    LOG(WARNING) << "No dream command configured";
    return;
  }

  auto process = std::make_unique<brillo::ProcessImpl>();
  for (const std::string& arg : argv_)
    process->AddArg(arg);
  if (!process->Start()) {
    LOG(ERROR) << "Failed to start dream " << argv_[0];
    return;
  }
  LOG(INFO) << "Started dream " << argv_[0] << " as pid " << process->pid();
  process_ = std::move(process);
}

void ProcessDreamHost::StopDream() {
  if (!process_)
    return;
  if (IsDreaming()) {
    LOG(INFO) << "Stopping dream pid " << process_->pid();
    if (!process_->Kill(SIGTERM, kStopTimeoutSeconds))
      process_->Kill(SIGKILL, kStopTimeoutSeconds);
  }
  process_.reset();
}

bool ProcessDreamHost::IsDreaming() {
  if (!process_ || process_->pid() <= 0)
    return false;

  const pid_t pid = process_->pid();
  if (HANDLE_EINTR(waitpid(pid, nullptr, WNOHANG)) == 0)
    return true;

  LOG(INFO) << "Dream pid " << pid << " exited";
  process_->Release();
  process_.reset();
  return false;
}

}  // namespace power_manager
