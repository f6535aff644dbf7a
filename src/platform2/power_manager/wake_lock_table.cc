// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/wake_lock_table.h"

#include <algorithm>
#include <utility>

#include <base/location.h>
#include <base/logging.h>
#include <base/strings/stringprintf.h>

#include "power_manager/power_error.h"

namespace power_manager {

WakeLockTable::WakeLockTable(Observer* observer) : observer_(observer) {}

WakeLockTable::~WakeLockTable() = default;

bool WakeLockTable::Acquire(const WakeLockRequest& request,
                            std::unique_ptr<OwnerLiveness> liveness,
                            base::OnceClosure on_owner_lost,
                            AcquireResult* result,
                            brillo::ErrorPtr* error) {
  DCHECK(result);
  if (IsUidBlocked(request.uid)) {
    VLOG(1) << "Ignoring wake lock \"" << request.tag << "\" from blocked uid "
            << request.uid;
    *result = AcquireResult::kBlocked;
    return true;
  }

  auto it = FindIterator(request.handle);
  if (it != wake_locks_.end()) {
    WakeLock* wake_lock = it->get();
    if (wake_lock->owner_uid != request.uid ||
        wake_lock->owner_pid != request.pid) {
      return SetError(
          FROM_HERE, error, kErrorInvalidState,
          base::StringPrintf("Wake lock %s is owned by uid %d pid %d",
                             request.handle.c_str(), wake_lock->owner_uid,
                             wake_lock->owner_pid));
    }
    if (wake_lock->HasSameProperties(request)) {
      *result = AcquireResult::kUnchanged;
      return true;
    }
    NotifyReleased(*wake_lock);
    wake_lock->UpdateProperties(request);
    NotifyAcquired(*wake_lock);
    *result = AcquireResult::kUpdated;
    return true;
  }

  if (liveness && !liveness->Watch(std::move(on_owner_lost))) {
    return SetError(FROM_HERE, error, kErrorInvalidArgument,
                    "Owner of wake lock " + request.handle + " is gone");
  }
  auto wake_lock = std::make_unique<WakeLock>(request, std::move(liveness));
  NotifyAcquired(*wake_lock);
  wake_locks_.push_back(std::move(wake_lock));
  *result = AcquireResult::kCreated;
  return true;
}

std::unique_ptr<WakeLock> WakeLockTable::Release(const std::string& handle) {
  auto it = FindIterator(handle);
  if (it == wake_locks_.end())
    return nullptr;

  std::unique_ptr<WakeLock> wake_lock = std::move(*it);
  wake_locks_.erase(it);
  NotifyReleased(*wake_lock);
  // Stop watching the owner now that the lock is gone.
  wake_lock->liveness.reset();
  return wake_lock;
}

bool WakeLockTable::UpdateWorkSource(const std::string& handle,
                                     const WorkSource& work_source,
                                     bool* changed_out,
                                     brillo::ErrorPtr* error) {
  auto it = FindIterator(handle);
  if (it == wake_locks_.end()) {
    return SetError(FROM_HERE, error, kErrorInvalidArgument,
                    "Wake lock " + handle + " is not active");
  }

  WakeLock* wake_lock = it->get();
  const bool changed = wake_lock->work_source != work_source;
  if (changed) {
    NotifyReleased(*wake_lock);
    wake_lock->work_source = work_source;
    NotifyAcquired(*wake_lock);
  }
  if (changed_out)
    *changed_out = changed;
  return true;
}

const WakeLock* WakeLockTable::FindByHandle(const std::string& handle) const {
  for (const auto& wake_lock : wake_locks_) {
    if (wake_lock->handle == handle)
      return wake_lock.get();
  }
  return nullptr;
}

int WakeLockTable::ComputeSummary(Wakefulness wakefulness) const {
  const bool asleep = wakefulness == Wakefulness::kAsleep;
  const bool awake = wakefulness == Wakefulness::kAwake;

  int summary = 0;
  for (const auto& wake_lock : wake_locks_) {
    switch (wake_lock->level()) {
      case WakeLockLevel::kPartial:
        summary |= kWakeLockCpu;
        break;
      case WakeLockLevel::kFull:
        if (!asleep) {
          summary |=
              kWakeLockCpu | kWakeLockScreenBright | kWakeLockButtonBright;
          if (awake)
            summary |= kWakeLockStayAwake;
        }
        break;
      case WakeLockLevel::kScreenBright:
        if (!asleep) {
          summary |= kWakeLockCpu | kWakeLockScreenBright;
          if (awake)
            summary |= kWakeLockStayAwake;
        }
        break;
      case WakeLockLevel::kScreenDim:
        if (!asleep) {
          summary |= kWakeLockCpu | kWakeLockScreenDim;
          if (awake)
            summary |= kWakeLockStayAwake;
        }
        break;
      case WakeLockLevel::kProximityScreenOff:
        if (!asleep)
          summary |= kWakeLockProximityScreenOff;
        break;
    }
  }
  return summary;
}

int WakeLockTable::CountScreenWakeLocks() const {
  return std::count_if(wake_locks_.begin(), wake_locks_.end(),
                       [](const std::unique_ptr<WakeLock>& wake_lock) {
                         return wake_lock->IsScreenLock();
                       });
}

std::vector<std::string> WakeLockTable::BlockUid(int uid) {
  blocked_uids_.insert(uid);

  std::vector<std::string> handles;
  for (const auto& wake_lock : wake_locks_) {
    if (wake_lock->owner_uid == uid || wake_lock->work_source.Contains(uid))
      handles.push_back(wake_lock->handle);
  }
  return handles;
}

void WakeLockTable::UnblockUid(int uid) {
  blocked_uids_.erase(uid);
}

bool WakeLockTable::IsUidBlocked(int uid) const {
  return blocked_uids_.count(uid) > 0;
}

std::vector<std::unique_ptr<WakeLock>>::iterator WakeLockTable::FindIterator(
    const std::string& handle) {
  return std::find_if(wake_locks_.begin(), wake_locks_.end(),
                      [&handle](const std::unique_ptr<WakeLock>& wake_lock) {
                        return wake_lock->handle == handle;
                      });
}

void WakeLockTable::NotifyAcquired(const WakeLock& wake_lock) {
  if (notifications_enabled_ && observer_)
    observer_->OnWakeLockAcquired(wake_lock);
}

void WakeLockTable::NotifyReleased(const WakeLock& wake_lock) {
  if (notifications_enabled_ && observer_)
    observer_->OnWakeLockReleased(wake_lock);
}

}  // namespace power_manager
