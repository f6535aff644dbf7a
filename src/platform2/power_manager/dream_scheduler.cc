// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/dream_scheduler.h"

#include <utility>

#include <base/check.h>
#include <base/functional/bind.h>
#include <base/location.h>
#include <base/logging.h>

namespace power_manager {

DreamScheduler::DreamScheduler(
    Delegate* delegate,
    DreamHostInterface* dream_host,
    scoped_refptr<base::SequencedTaskRunner> task_runner)
    : delegate_(delegate),
      dream_host_(dream_host),
      task_runner_(std::move(task_runner)) {
  CHECK(delegate_);
}

DreamScheduler::~DreamScheduler() = default;

void DreamScheduler::Schedule() {
  task_runner_->PostTask(
      FROM_HERE, base::BindOnce(&DreamScheduler::Run, base::Unretained(this)));
}

void DreamScheduler::Run() {
  const bool start_dreaming = delegate_->BeginDreamReconciliation();

  bool is_dreaming = false;
  if (dream_host_) {
    if (start_dreaming) {
      LOG(INFO) << "Starting dream";
      dream_host_->StartDream();
    }
    is_dreaming = dream_host_->IsDreaming();
  }

  const bool continue_dreaming =
      delegate_->FinishDreamReconciliation(is_dreaming);

  // If something changed in the meantime that calls for a new dream, the
  // delegate has already scheduled another pass.
  if (dream_host_ && !continue_dreaming) {
    VLOG(1) << "Stopping dream";
    dream_host_->StopDream();
  }
}

}  // namespace power_manager
