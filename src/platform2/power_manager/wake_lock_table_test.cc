// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/wake_lock_table.h"

#include <memory>
#include <string>

#include <base/functional/bind.h>
#include <base/functional/callback_helpers.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "power_manager/fake_owner_liveness.h"
#include "power_manager/power_error.h"

namespace power_manager {

using testing::_;
using testing::ElementsAre;
using testing::Field;
using testing::InSequence;
using testing::StrictMock;

namespace {

constexpr int kUid = 10001;
constexpr int kPid = 4321;

class MockTableObserver : public WakeLockTable::Observer {
 public:
  MOCK_METHOD(void, OnWakeLockAcquired, (const WakeLock&), (override));
  MOCK_METHOD(void, OnWakeLockReleased, (const WakeLock&), (override));
};

WakeLockRequest MakeRequest(const std::string& handle, WakeLockLevel level) {
  WakeLockRequest request;
  request.handle = handle;
  request.flags = static_cast<uint32_t>(level);
  request.tag = "tag-" + handle;
  request.package_name = "com.example";
  request.uid = kUid;
  request.pid = kPid;
  return request;
}

}  // namespace

class WakeLockTableTest : public testing::Test {
 protected:
  void SetUp() override { table_.set_notifications_enabled(true); }

  WakeLockTable::AcquireResult Acquire(const WakeLockRequest& request) {
    WakeLockTable::AcquireResult result;
    brillo::ErrorPtr error;
    EXPECT_TRUE(table_.Acquire(request, std::make_unique<FakeOwnerLiveness>(),
                               base::DoNothing(), &result, &error));
    EXPECT_FALSE(error);
    return result;
  }

  StrictMock<MockTableObserver> observer_;
  WakeLockTable table_{&observer_};
};

TEST_F(WakeLockTableTest, AcquireCreatesAndNotifies) {
  EXPECT_CALL(observer_,
              OnWakeLockAcquired(Field(&WakeLock::handle, "partial")));
  EXPECT_EQ(Acquire(MakeRequest("partial", WakeLockLevel::kPartial)),
            WakeLockTable::AcquireResult::kCreated);
  ASSERT_NE(table_.FindByHandle("partial"), nullptr);
  EXPECT_EQ(table_.size(), 1u);
}

TEST_F(WakeLockTableTest, IdenticalReacquireIsUnchanged) {
  EXPECT_CALL(observer_, OnWakeLockAcquired(_)).Times(1);
  const WakeLockRequest request = MakeRequest("a", WakeLockLevel::kFull);
  EXPECT_EQ(Acquire(request), WakeLockTable::AcquireResult::kCreated);
  EXPECT_EQ(Acquire(request), WakeLockTable::AcquireResult::kUnchanged);
  EXPECT_EQ(table_.size(), 1u);
}

TEST_F(WakeLockTableTest, ChangedReacquireNotifiesReleaseThenAcquire) {
  WakeLockRequest request = MakeRequest("a", WakeLockLevel::kPartial);
  {
    InSequence sequence;
    EXPECT_CALL(observer_, OnWakeLockAcquired(Field(&WakeLock::tag, "tag-a")));
    EXPECT_CALL(observer_, OnWakeLockReleased(Field(&WakeLock::tag, "tag-a")));
    EXPECT_CALL(observer_, OnWakeLockAcquired(Field(&WakeLock::tag, "new")));
  }
  Acquire(request);
  request.tag = "new";
  EXPECT_EQ(Acquire(request), WakeLockTable::AcquireResult::kUpdated);
  EXPECT_EQ(table_.FindByHandle("a")->tag, "new");
}

TEST_F(WakeLockTableTest, ReacquireFromOtherOwnerFails) {
  EXPECT_CALL(observer_, OnWakeLockAcquired(_)).Times(1);
  WakeLockRequest request = MakeRequest("a", WakeLockLevel::kPartial);
  Acquire(request);

  request.pid = kPid + 1;
  WakeLockTable::AcquireResult result;
  brillo::ErrorPtr error;
  EXPECT_FALSE(table_.Acquire(request, nullptr, base::DoNothing(), &result,
                              &error));
  ASSERT_TRUE(error);
  EXPECT_EQ(error->GetCode(), kErrorInvalidState);
}

TEST_F(WakeLockTableTest, AcquireFailsIfOwnerAlreadyGone) {
  auto liveness = std::make_unique<FakeOwnerLiveness>();
  liveness->set_owner_gone(true);
  WakeLockTable::AcquireResult result;
  brillo::ErrorPtr error;
  EXPECT_FALSE(table_.Acquire(MakeRequest("a", WakeLockLevel::kPartial),
                              std::move(liveness), base::DoNothing(), &result,
                              &error));
  ASSERT_TRUE(error);
  EXPECT_EQ(error->GetCode(), kErrorInvalidArgument);
  EXPECT_EQ(table_.size(), 0u);
}

TEST_F(WakeLockTableTest, ReleaseReturnsLockAndStopsWatching) {
  EXPECT_CALL(observer_, OnWakeLockAcquired(_));
  EXPECT_CALL(observer_, OnWakeLockReleased(Field(&WakeLock::handle, "a")));

  bool destroyed = false;
  WakeLockTable::AcquireResult result;
  EXPECT_TRUE(table_.Acquire(
      MakeRequest("a", WakeLockLevel::kPartial),
      std::make_unique<FakeOwnerLiveness>(&destroyed), base::DoNothing(),
      &result, nullptr));

  std::unique_ptr<WakeLock> released = table_.Release("a");
  ASSERT_TRUE(released);
  EXPECT_EQ(released->handle, "a");
  EXPECT_FALSE(released->liveness);
  EXPECT_TRUE(destroyed);
  EXPECT_EQ(table_.Release("a"), nullptr);
}

TEST_F(WakeLockTableTest, NotificationsStartDisabled) {
  WakeLockTable table(&observer_);
  WakeLockTable::AcquireResult result;
  EXPECT_TRUE(table.Acquire(MakeRequest("a", WakeLockLevel::kPartial), nullptr,
                            base::DoNothing(), &result, nullptr));
  EXPECT_NE(table.Release("a"), nullptr);
}

TEST_F(WakeLockTableTest, UpdateWorkSource) {
  EXPECT_CALL(observer_, OnWakeLockAcquired(_)).Times(2);
  EXPECT_CALL(observer_, OnWakeLockReleased(_)).Times(1);
  Acquire(MakeRequest("a", WakeLockLevel::kPartial));

  bool changed = false;
  EXPECT_TRUE(table_.UpdateWorkSource("a", WorkSource({10005}), &changed,
                                      nullptr));
  EXPECT_TRUE(changed);
  EXPECT_TRUE(table_.UpdateWorkSource("a", WorkSource({10005}), &changed,
                                      nullptr));
  EXPECT_FALSE(changed);

  brillo::ErrorPtr error;
  EXPECT_FALSE(table_.UpdateWorkSource("missing", WorkSource(), &changed,
                                       &error));
  ASSERT_TRUE(error);
  EXPECT_EQ(error->GetCode(), kErrorInvalidArgument);
}

TEST_F(WakeLockTableTest, SummaryDependsOnWakefulness) {
  EXPECT_CALL(observer_, OnWakeLockAcquired(_)).Times(testing::AnyNumber());

  Acquire(MakeRequest("bright", WakeLockLevel::kScreenBright));
  EXPECT_EQ(table_.ComputeSummary(Wakefulness::kAwake),
            kWakeLockCpu | kWakeLockScreenBright | kWakeLockStayAwake);
  EXPECT_EQ(table_.ComputeSummary(Wakefulness::kDreaming),
            kWakeLockCpu | kWakeLockScreenBright);
  EXPECT_EQ(table_.ComputeSummary(Wakefulness::kAsleep), 0);

  Acquire(MakeRequest("partial", WakeLockLevel::kPartial));
  EXPECT_EQ(table_.ComputeSummary(Wakefulness::kAsleep), kWakeLockCpu);

  Acquire(MakeRequest("full", WakeLockLevel::kFull));
  EXPECT_TRUE(table_.ComputeSummary(Wakefulness::kAwake) &
              kWakeLockButtonBright);

  Acquire(MakeRequest("dim", WakeLockLevel::kScreenDim));
  EXPECT_TRUE(table_.ComputeSummary(Wakefulness::kNapping) &
              kWakeLockScreenDim);

  Acquire(MakeRequest("proximity", WakeLockLevel::kProximityScreenOff));
  EXPECT_TRUE(table_.ComputeSummary(Wakefulness::kAwake) &
              kWakeLockProximityScreenOff);
  EXPECT_FALSE(table_.ComputeSummary(Wakefulness::kAsleep) &
               kWakeLockProximityScreenOff);

  EXPECT_EQ(table_.CountScreenWakeLocks(), 3);
}

TEST_F(WakeLockTableTest, BlockUidReturnsOwnedAndAttributedHandles) {
  EXPECT_CALL(observer_, OnWakeLockAcquired(_)).Times(3);

  Acquire(MakeRequest("owned", WakeLockLevel::kPartial));
  WakeLockRequest attributed = MakeRequest("attributed", WakeLockLevel::kFull);
  attributed.uid = 1000;
  attributed.work_source = WorkSource({kUid});
  Acquire(attributed);
  WakeLockRequest other = MakeRequest("other", WakeLockLevel::kPartial);
  other.uid = 1000;
  Acquire(other);

  EXPECT_THAT(table_.BlockUid(kUid), ElementsAre("owned", "attributed"));
  EXPECT_TRUE(table_.IsUidBlocked(kUid));

  // New requests from a blocked uid are dropped silently.
  EXPECT_EQ(Acquire(MakeRequest("late", WakeLockLevel::kPartial)),
            WakeLockTable::AcquireResult::kBlocked);
  EXPECT_EQ(table_.FindByHandle("late"), nullptr);

  table_.UnblockUid(kUid);
  EXPECT_FALSE(table_.IsUidBlocked(kUid));
}

}  // namespace power_manager
