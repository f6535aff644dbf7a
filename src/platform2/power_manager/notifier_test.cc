// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/notifier.h"

#include <memory>

#include <base/test/task_environment.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "power_manager/mock_power_observer.h"
#include "power_manager/wake_lock.h"

namespace power_manager {

using testing::AllOf;
using testing::Field;
using testing::InSequence;
using testing::StrictMock;

class NotifierTest : public testing::Test {
 protected:
  void SetUp() override { notifier_.AddObserver(&observer_); }
  void TearDown() override { notifier_.RemoveObserver(&observer_); }

  base::test::TaskEnvironment task_environment_;
  StrictMock<MockPowerObserver> observer_;
  Notifier notifier_{task_environment_.GetMainThreadTaskRunner()};
};

TEST_F(NotifierTest, EventsAreDeliveredLaterInOrder) {
  notifier_.OnGoToSleepStarted(GoToSleepReason::kTimeout);
  notifier_.OnSleepRequested(2);
  notifier_.OnGoToSleepFinished();
  notifier_.OnWakeUpStarted();
  notifier_.OnUserActivity(UserActivityEvent::kTouch, 10001);
  notifier_.OnWakeUpFinished();
  notifier_.OnWirelessChargingStarted();

  // Nothing runs synchronously.
  testing::Mock::VerifyAndClearExpectations(&observer_);

  {
    InSequence sequence;
    EXPECT_CALL(observer_, OnGoToSleepStarted(GoToSleepReason::kTimeout));
    EXPECT_CALL(observer_, OnSleepRequested(2));
    EXPECT_CALL(observer_, OnGoToSleepFinished());
    EXPECT_CALL(observer_, OnWakeUpStarted());
    EXPECT_CALL(observer_, OnUserActivity(UserActivityEvent::kTouch, 10001));
    EXPECT_CALL(observer_, OnWakeUpFinished());
    EXPECT_CALL(observer_, OnWirelessChargingStarted());
  }
  task_environment_.RunUntilIdle();
}

TEST_F(NotifierTest, WakeLockEventsCarryCopy) {
  WakeLockRequest request;
  request.handle = "handle";
  request.flags = static_cast<uint32_t>(WakeLockLevel::kScreenDim);
  request.tag = "video";
  request.uid = 10001;
  request.pid = 55;
  auto wake_lock = std::make_unique<WakeLock>(request, nullptr);

  notifier_.OnWakeLockAcquired(*wake_lock);
  notifier_.OnWakeLockReleased(*wake_lock);
  // The event must not refer to the wake lock itself.
  wake_lock.reset();

  {
    InSequence sequence;
    EXPECT_CALL(observer_,
                OnWakeLockAcquired(AllOf(
                    Field(&WakeLockInfo::handle, "handle"),
                    Field(&WakeLockInfo::level, WakeLockLevel::kScreenDim),
                    Field(&WakeLockInfo::tag, "video"),
                    Field(&WakeLockInfo::owner_uid, 10001))));
    EXPECT_CALL(observer_,
                OnWakeLockReleased(Field(&WakeLockInfo::owner_pid, 55)));
  }
  task_environment_.RunUntilIdle();
}

TEST_F(NotifierTest, RemovedObserverIsNotCalled) {
  notifier_.OnWakeUpStarted();
  notifier_.RemoveObserver(&observer_);
  task_environment_.RunUntilIdle();
  notifier_.AddObserver(&observer_);
}

}  // namespace power_manager
