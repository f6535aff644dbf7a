// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_NOTIFIER_H_
#define POWER_MANAGER_NOTIFIER_H_

#include <base/memory/scoped_refptr.h>
#include <base/observer_list.h>
#include <base/task/sequenced_task_runner.h>

#include "power_manager/power_observer.h"
#include "power_manager/wake_lock_table.h"

namespace power_manager {

// Fans power events out to PowerObservers. The engine calls the On*() methods
// with its lock held; each call posts to |task_runner| so observers run
// outside the lock, in the order the events happened.
//
// Observers must be added and removed on |task_runner|'s sequence. The
// Notifier must outlive every task it posts.
class Notifier : public WakeLockTable::Observer {
 public:
  explicit Notifier(scoped_refptr<base::SequencedTaskRunner> task_runner);
  Notifier(const Notifier&) = delete;
  Notifier& operator=(const Notifier&) = delete;

  ~Notifier() override;

  void AddObserver(PowerObserver* observer);
  void RemoveObserver(PowerObserver* observer);

  // WakeLockTable::Observer:
  void OnWakeLockAcquired(const WakeLock& wake_lock) override;
  void OnWakeLockReleased(const WakeLock& wake_lock) override;

  void OnUserActivity(UserActivityEvent event, int uid);
  void OnWakeUpStarted();
  void OnWakeUpFinished();
  void OnGoToSleepStarted(GoToSleepReason reason);
  void OnGoToSleepFinished();
  void OnSleepRequested(int screen_wake_locks);
  void OnWirelessChargingStarted();

 private:
  void DispatchWakeLockAcquired(const WakeLockInfo& wake_lock);
  void DispatchWakeLockReleased(const WakeLockInfo& wake_lock);
  void DispatchUserActivity(UserActivityEvent event, int uid);
  void DispatchWakeUpStarted();
  void DispatchWakeUpFinished();
  void DispatchGoToSleepStarted(GoToSleepReason reason);
  void DispatchGoToSleepFinished();
  void DispatchSleepRequested(int screen_wake_locks);
  void DispatchWirelessChargingStarted();

  scoped_refptr<base::SequencedTaskRunner> task_runner_;
  base::ObserverList<PowerObserver> observers_;
};

}  // namespace power_manager

#endif  // POWER_MANAGER_NOTIFIER_H_
