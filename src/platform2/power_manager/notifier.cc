// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/notifier.h"

#include <utility>

#include <base/functional/bind.h>
#include <base/location.h>
#include <base/logging.h>

#include "power_manager/wake_lock.h"

namespace power_manager {

WakeLockInfo::WakeLockInfo() = default;

WakeLockInfo::WakeLockInfo(const WakeLock& wake_lock)
    : handle(wake_lock.handle),
      level(wake_lock.level()),
      flags(wake_lock.flags),
      tag(wake_lock.tag),
      package_name(wake_lock.package_name),
      work_source(wake_lock.work_source),
      owner_uid(wake_lock.owner_uid),
      owner_pid(wake_lock.owner_pid) {}

WakeLockInfo::WakeLockInfo(const WakeLockInfo& other) = default;

WakeLockInfo::~WakeLockInfo() = default;

Notifier::Notifier(scoped_refptr<base::SequencedTaskRunner> task_runner)
    : task_runner_(std::move(task_runner)) {}

Notifier::~Notifier() = default;

void Notifier::AddObserver(PowerObserver* observer) {
  observers_.AddObserver(observer);
}

void Notifier::RemoveObserver(PowerObserver* observer) {
  observers_.RemoveObserver(observer);
}

void Notifier::OnWakeLockAcquired(const WakeLock& wake_lock) {
  VLOG(1) << "Wake lock acquired: " << wake_lock.ToString();
  task_runner_->PostTask(
      FROM_HERE, base::BindOnce(&Notifier::DispatchWakeLockAcquired,
                                base::Unretained(this), WakeLockInfo(wake_lock)));
}

void Notifier::OnWakeLockReleased(const WakeLock& wake_lock) {
  VLOG(1) << "Wake lock released: " << wake_lock.ToString();
  task_runner_->PostTask(
      FROM_HERE, base::BindOnce(&Notifier::DispatchWakeLockReleased,
                                base::Unretained(this), WakeLockInfo(wake_lock)));
}

void Notifier::OnUserActivity(UserActivityEvent event, int uid) {
  task_runner_->PostTask(FROM_HERE,
                         base::BindOnce(&Notifier::DispatchUserActivity,
                                        base::Unretained(this), event, uid));
}

void Notifier::OnWakeUpStarted() {
  LOG(INFO) << "Waking up";
  task_runner_->PostTask(FROM_HERE,
                         base::BindOnce(&Notifier::DispatchWakeUpStarted,
                                        base::Unretained(this)));
}

void Notifier::OnWakeUpFinished() {
  VLOG(1) << "Wake up finished";
  task_runner_->PostTask(FROM_HERE,
                         base::BindOnce(&Notifier::DispatchWakeUpFinished,
                                        base::Unretained(this)));
}

void Notifier::OnGoToSleepStarted(GoToSleepReason reason) {
  LOG(INFO) << "Going to sleep (" << GoToSleepReasonToString(reason) << ")";
  task_runner_->PostTask(FROM_HERE,
                         base::BindOnce(&Notifier::DispatchGoToSleepStarted,
                                        base::Unretained(this), reason));
}

void Notifier::OnGoToSleepFinished() {
  VLOG(1) << "Go to sleep finished";
  task_runner_->PostTask(FROM_HERE,
                         base::BindOnce(&Notifier::DispatchGoToSleepFinished,
                                        base::Unretained(this)));
}

void Notifier::OnSleepRequested(int screen_wake_locks) {
  LOG(INFO) << "Sleep requested with " << screen_wake_locks
            << " screen wake lock(s) held";
  task_runner_->PostTask(
      FROM_HERE, base::BindOnce(&Notifier::DispatchSleepRequested,
                                base::Unretained(this), screen_wake_locks));
}

void Notifier::OnWirelessChargingStarted() {
  LOG(INFO) << "Wireless charging started";
  task_runner_->PostTask(
      FROM_HERE, base::BindOnce(&Notifier::DispatchWirelessChargingStarted,
                                base::Unretained(this)));
}

void Notifier::DispatchWakeLockAcquired(const WakeLockInfo& wake_lock) {
  for (auto& observer : observers_)
    observer.OnWakeLockAcquired(wake_lock);
}

void Notifier::DispatchWakeLockReleased(const WakeLockInfo& wake_lock) {
  for (auto& observer : observers_)
    observer.OnWakeLockReleased(wake_lock);
}

void Notifier::DispatchUserActivity(UserActivityEvent event, int uid) {
  for (auto& observer : observers_)
    observer.OnUserActivity(event, uid);
}

void Notifier::DispatchWakeUpStarted() {
  for (auto& observer : observers_)
    observer.OnWakeUpStarted();
}

void Notifier::DispatchWakeUpFinished() {
  for (auto& observer : observers_)
    observer.OnWakeUpFinished();
}

void Notifier::DispatchGoToSleepStarted(GoToSleepReason reason) {
  for (auto& observer : observers_)
    observer.OnGoToSleepStarted(reason);
}

void Notifier::DispatchGoToSleepFinished() {
  for (auto& observer : observers_)
    observer.OnGoToSleepFinished();
}

void Notifier::DispatchSleepRequested(int screen_wake_locks) {
  for (auto& observer : observers_)
    observer.OnSleepRequested(screen_wake_locks);
}

void Notifier::DispatchWirelessChargingStarted() {
  for (auto& observer : observers_)
    observer.OnWirelessChargingStarted();
}

}  // namespace power_manager
