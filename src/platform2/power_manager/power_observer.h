// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_POWER_OBSERVER_H_
#define POWER_MANAGER_POWER_OBSERVER_H_

#include <stdint.h>

#include <string>

#include <base/observer_list_types.h>

#include "power_manager/power_constants.h"
#include "power_manager/work_source.h"

namespace power_manager {

struct WakeLock;

// Copy of the interesting parts of a WakeLock, safe to hand to another
// sequence.
struct WakeLockInfo {
  WakeLockInfo();
  explicit WakeLockInfo(const WakeLock& wake_lock);
  WakeLockInfo(const WakeLockInfo& other);
  ~WakeLockInfo();

  std::string handle;
  WakeLockLevel level = WakeLockLevel::kPartial;
  uint32_t flags = 0;
  std::string tag;
  std::string package_name;
  WorkSource work_source;
  int owner_uid = 0;
  int owner_pid = 0;
};

// Interface for classes interested in power events. All methods are invoked
// on the worker sequence, never with the engine lock held.
class PowerObserver : public base::CheckedObserver {
 public:
  ~PowerObserver() override = default;

  virtual void OnWakeLockAcquired(const WakeLockInfo& wake_lock) {}
  virtual void OnWakeLockReleased(const WakeLockInfo& wake_lock) {}
  virtual void OnUserActivity(UserActivityEvent event, int uid) {}

  // The device started waking up, and the screen finished turning on.
  virtual void OnWakeUpStarted() {}
  virtual void OnWakeUpFinished() {}

  // The device started going to sleep, and the screen finished turning off.
  virtual void OnGoToSleepStarted(GoToSleepReason reason) {}
  virtual void OnGoToSleepFinished() {}

  // Going to sleep made |screen_wake_locks| screen wake locks ineffective.
  virtual void OnSleepRequested(int screen_wake_locks) {}

  virtual void OnWirelessChargingStarted() {}
};

}  // namespace power_manager

#endif  // POWER_MANAGER_POWER_OBSERVER_H_
