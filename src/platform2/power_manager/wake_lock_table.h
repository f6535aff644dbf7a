// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_WAKE_LOCK_TABLE_H_
#define POWER_MANAGER_WAKE_LOCK_TABLE_H_

#include <memory>
#include <set>
#include <string>
#include <vector>

#include <brillo/errors/error.h>

#include "power_manager/power_constants.h"
#include "power_manager/wake_lock.h"

namespace power_manager {

// The set of wake locks currently held, keyed by handle. Not thread-safe;
// the owner serializes access.
class WakeLockTable {
 public:
  // Receives one call per wake lock transition. Not called for no-op updates.
  class Observer {
   public:
    virtual ~Observer() = default;

    virtual void OnWakeLockAcquired(const WakeLock& wake_lock) = 0;
    virtual void OnWakeLockReleased(const WakeLock& wake_lock) = 0;
  };

  enum class AcquireResult {
    // A new wake lock was added.
    kCreated,
    // An existing wake lock's tag, flags or work source changed.
    kUpdated,
    // The request matched an existing wake lock exactly.
    kUnchanged,
    // The owner is blocked; nothing was added.
    kBlocked,
  };

  explicit WakeLockTable(Observer* observer);
  WakeLockTable(const WakeLockTable&) = delete;
  WakeLockTable& operator=(const WakeLockTable&) = delete;

  ~WakeLockTable();

  // Observers are only notified while enabled. Notifications start disabled.
  void set_notifications_enabled(bool enabled) {
    notifications_enabled_ = enabled;
  }

  // Adds a wake lock for |request| or updates the one already registered
  // under its handle. |liveness| is only consumed when a wake lock is
  // created. Fails with InvalidState if the handle belongs to a different
  // uid or pid, and with InvalidArgument if the owner is already gone.
  bool Acquire(const WakeLockRequest& request,
               std::unique_ptr<OwnerLiveness> liveness,
               base::OnceClosure on_owner_lost,
               AcquireResult* result,
               brillo::ErrorPtr* error);

  // Removes and returns the wake lock registered under |handle|, or nullptr
  // if there is none.
  std::unique_ptr<WakeLock> Release(const std::string& handle);

  // Fails with InvalidArgument if |handle| is unknown. |changed_out| is set
  // to whether the work source differed.
  bool UpdateWorkSource(const std::string& handle,
                        const WorkSource& work_source,
                        bool* changed_out,
                        brillo::ErrorPtr* error);

  const WakeLock* FindByHandle(const std::string& handle) const;

  // Returns the kWakeLock* summary bits for |wakefulness|. Only partial wake
  // locks have an effect while asleep.
  int ComputeSummary(Wakefulness wakefulness) const;

  // Number of Full, ScreenBright and ScreenDim wake locks.
  int CountScreenWakeLocks() const;

  // Marks |uid| as blocked and returns the handles of wake locks it owns or
  // is attributed in, which the caller should release.
  std::vector<std::string> BlockUid(int uid);
  void UnblockUid(int uid);
  bool IsUidBlocked(int uid) const;

  size_t size() const { return wake_locks_.size(); }
  const std::vector<std::unique_ptr<WakeLock>>& wake_locks() const {
    return wake_locks_;
  }

 private:
  std::vector<std::unique_ptr<WakeLock>>::iterator FindIterator(
      const std::string& handle);

  void NotifyAcquired(const WakeLock& wake_lock);
  void NotifyReleased(const WakeLock& wake_lock);

  Observer* observer_;  // Not owned.
  bool notifications_enabled_ = false;

  // Kept in acquisition order.
  std::vector<std::unique_ptr<WakeLock>> wake_locks_;
  std::set<int> blocked_uids_;
};

}  // namespace power_manager

#endif  // POWER_MANAGER_WAKE_LOCK_TABLE_H_
