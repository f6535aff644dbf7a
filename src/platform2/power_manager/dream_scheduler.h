// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_DREAM_SCHEDULER_H_
#define POWER_MANAGER_DREAM_SCHEDULER_H_

#include <base/memory/scoped_refptr.h>
#include <base/task/sequenced_task_runner.h>

#include "power_manager/dream_host_interface.h"

namespace power_manager {

// Starts and stops dreams on the worker sequence.
//
// The decision to start a dream and the bookkeeping afterwards happen under
// the delegate's lock, but the dream host itself is only called between those
// two steps with no lock held. Only this class talks to the dream host, so
// start and stop calls never race with each other.
class DreamScheduler {
 public:
  class Delegate {
   public:
    virtual ~Delegate() = default;

    // Clears the pending flag and returns true if a dream should be started
    // now.
    virtual bool BeginDreamReconciliation() = 0;

    // Folds the dream host's state back in. Returns true if the dream (if
    // any) should keep running; otherwise it is stopped.
    virtual bool FinishDreamReconciliation(bool is_dreaming) = 0;
  };

  // |dream_host| may be null on devices without dreams.
  DreamScheduler(Delegate* delegate,
                 DreamHostInterface* dream_host,
                 scoped_refptr<base::SequencedTaskRunner> task_runner);
  DreamScheduler(const DreamScheduler&) = delete;
  DreamScheduler& operator=(const DreamScheduler&) = delete;

  ~DreamScheduler();

  // Posts a reconciliation pass. The caller ensures at most one is pending.
  void Schedule();

  // Runs one reconciliation pass. Exposed for tests.
  void Run();

 private:
  Delegate* delegate_;             // Not owned.
  DreamHostInterface* dream_host_;  // Not owned.
  scoped_refptr<base::SequencedTaskRunner> task_runner_;
};

}  // namespace power_manager

#endif  // POWER_MANAGER_DREAM_SCHEDULER_H_
