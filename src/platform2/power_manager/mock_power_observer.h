// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_MOCK_POWER_OBSERVER_H_
#define POWER_MANAGER_MOCK_POWER_OBSERVER_H_

#include <gmock/gmock.h>

#include "power_manager/power_observer.h"

namespace power_manager {

class MockPowerObserver : public PowerObserver {
 public:
  MockPowerObserver() = default;
  ~MockPowerObserver() override = default;

  MOCK_METHOD(void,
              OnWakeLockAcquired,
              (const WakeLockInfo& wake_lock),
              (override));
  MOCK_METHOD(void,
              OnWakeLockReleased,
              (const WakeLockInfo& wake_lock),
              (override));
  MOCK_METHOD(void,
              OnUserActivity,
              (UserActivityEvent event, int uid),
              (override));
  MOCK_METHOD(void, OnWakeUpStarted, (), (override));
  MOCK_METHOD(void, OnWakeUpFinished, (), (override));
  MOCK_METHOD(void, OnGoToSleepStarted, (GoToSleepReason reason), (override));
  MOCK_METHOD(void, OnGoToSleepFinished, (), (override));
  MOCK_METHOD(void, OnSleepRequested, (int screen_wake_locks), (override));
  MOCK_METHOD(void, OnWirelessChargingStarted, (), (override));
};

}  // namespace power_manager

#endif  // POWER_MANAGER_MOCK_POWER_OBSERVER_H_
