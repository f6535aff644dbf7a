// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/dream_scheduler.h"

#include <base/test/task_environment.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "power_manager/fake_dream_host.h"

namespace power_manager {

using testing::Return;
using testing::StrictMock;

namespace {

class MockDreamDelegate : public DreamScheduler::Delegate {
 public:
  MOCK_METHOD(bool, BeginDreamReconciliation, (), (override));
  MOCK_METHOD(bool, FinishDreamReconciliation, (bool is_dreaming), (override));
};

}  // namespace

class DreamSchedulerTest : public testing::Test {
 protected:
  base::test::TaskEnvironment task_environment_;
  StrictMock<MockDreamDelegate> delegate_;
  FakeDreamHost dream_host_;
  DreamScheduler scheduler_{&delegate_, &dream_host_,
                            task_environment_.GetMainThreadTaskRunner()};
};

TEST_F(DreamSchedulerTest, StartsDreamWhenAsked) {
  EXPECT_CALL(delegate_, BeginDreamReconciliation()).WillOnce(Return(true));
  EXPECT_CALL(delegate_, FinishDreamReconciliation(true))
      .WillOnce(Return(true));
  scheduler_.Run();
  EXPECT_EQ(dream_host_.num_starts(), 1);
  EXPECT_EQ(dream_host_.num_stops(), 0);
  EXPECT_TRUE(dream_host_.IsDreaming());
}

TEST_F(DreamSchedulerTest, StopsDreamWhenDelegateDeclines) {
  dream_host_.set_dreaming(true);
  EXPECT_CALL(delegate_, BeginDreamReconciliation()).WillOnce(Return(false));
  EXPECT_CALL(delegate_, FinishDreamReconciliation(true))
      .WillOnce(Return(false));
  scheduler_.Run();
  EXPECT_EQ(dream_host_.num_starts(), 0);
  EXPECT_EQ(dream_host_.num_stops(), 1);
  EXPECT_FALSE(dream_host_.IsDreaming());
}

TEST_F(DreamSchedulerTest, ReportsFailedStart) {
  dream_host_.set_start_succeeds(false);
  EXPECT_CALL(delegate_, BeginDreamReconciliation()).WillOnce(Return(true));
  EXPECT_CALL(delegate_, FinishDreamReconciliation(false))
      .WillOnce(Return(false));
  scheduler_.Run();
  EXPECT_EQ(dream_host_.num_starts(), 1);
  EXPECT_EQ(dream_host_.num_stops(), 1);
}

TEST_F(DreamSchedulerTest, ScheduleRunsOnTaskRunner) {
  scheduler_.Schedule();
  testing::Mock::VerifyAndClearExpectations(&delegate_);

  EXPECT_CALL(delegate_, BeginDreamReconciliation()).WillOnce(Return(false));
  EXPECT_CALL(delegate_, FinishDreamReconciliation(false))
      .WillOnce(Return(false));
  task_environment_.RunUntilIdle();
}

TEST(DreamSchedulerWithoutHostTest, ReportsNotDreaming) {
  base::test::TaskEnvironment task_environment;
  StrictMock<MockDreamDelegate> delegate;
  DreamScheduler scheduler(&delegate, nullptr,
                           task_environment.GetMainThreadTaskRunner());
  EXPECT_CALL(delegate, BeginDreamReconciliation()).WillOnce(Return(true));
  EXPECT_CALL(delegate, FinishDreamReconciliation(false))
      .WillOnce(Return(false));
  scheduler.Run();
}

}  // namespace power_manager
