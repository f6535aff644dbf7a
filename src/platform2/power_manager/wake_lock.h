// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_WAKE_LOCK_H_
#define POWER_MANAGER_WAKE_LOCK_H_

#include <stdint.h>

#include <memory>
#include <string>

#include <base/functional/callback.h>

#include "power_manager/power_constants.h"
#include "power_manager/work_source.h"

namespace power_manager {

// Tracks whether the process that owns a wake lock is still alive.
// Destroying the object stops watching; the callback will not run after that.
class OwnerLiveness {
 public:
  virtual ~OwnerLiveness() = default;

  // Arranges for |on_owner_lost| to run at most once, on an arbitrary thread,
  // when the owner goes away. Returns false if the owner is already gone.
  virtual bool Watch(base::OnceClosure on_owner_lost) = 0;
};

// Parameters of an acquire request.
struct WakeLockRequest {
  // Opaque identifier chosen by the caller, unique per wake lock.
  std::string handle;
  // A WakeLockLevel OR-ed with kAcquireCausesWakeup and kOnAfterRelease.
  uint32_t flags = 0;
  std::string tag;
  std::string package_name;
  WorkSource work_source;
  int uid = 0;
  int pid = 0;
};

// A wake lock held by some process.
struct WakeLock {
  WakeLock(const WakeLockRequest& request,
           std::unique_ptr<OwnerLiveness> liveness);
  WakeLock(const WakeLock&) = delete;
  WakeLock& operator=(const WakeLock&) = delete;

  ~WakeLock();

  WakeLockLevel level() const {
    return static_cast<WakeLockLevel>(flags & kWakeLockLevelMask);
  }

  // True for levels that keep the screen on: Full, ScreenBright, ScreenDim.
  bool IsScreenLock() const;

  bool HasSameProperties(const WakeLockRequest& request) const;
  void UpdateProperties(const WakeLockRequest& request);

  std::string ToString() const;

  const std::string handle;
  uint32_t flags;
  std::string tag;
  std::string package_name;
  WorkSource work_source;
  const int owner_uid;
  const int owner_pid;

  std::unique_ptr<OwnerLiveness> liveness;
};

}  // namespace power_manager

#endif  // POWER_MANAGER_WAKE_LOCK_H_
