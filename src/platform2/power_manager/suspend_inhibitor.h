// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_SUSPEND_INHIBITOR_H_
#define POWER_MANAGER_SUSPEND_INHIBITOR_H_

#include <string>

#include <base/synchronization/lock.h>
#include <base/thread_annotations.h>

namespace power_manager {

// Mechanism that actually keeps the system from suspending.
class SuspendInhibitorBackend {
 public:
  virtual ~SuspendInhibitorBackend() = default;

  // Called when the inhibitor named |name| starts or stops blocking suspend.
  virtual void Acquire(const std::string& name) = 0;
  virtual void Release(const std::string& name) = 0;
};

// Named, reference-counted guard that prevents the system from suspending
// while its count is positive. Thread-safe; guarded by its own lock rather
// than the engine lock.
class SuspendInhibitor {
 public:
  SuspendInhibitor(const std::string& name, SuspendInhibitorBackend* backend);
  SuspendInhibitor(const SuspendInhibitor&) = delete;
  SuspendInhibitor& operator=(const SuspendInhibitor&) = delete;

  ~SuspendInhibitor();

  const std::string& name() const { return name_; }

  void Acquire();

  // Releasing more often than acquiring is a bug in the caller. The extra
  // release is reported and ignored.
  void Release();

  int GetReferenceCount() const;
  bool IsHeld() const;

  std::string ToString() const;

 private:
  const std::string name_;
  SuspendInhibitorBackend* backend_;  // Not owned.

  mutable base::Lock lock_;
  int reference_count_ GUARDED_BY(lock_) = 0;
};

}  // namespace power_manager

#endif  // POWER_MANAGER_SUSPEND_INHIBITOR_H_
