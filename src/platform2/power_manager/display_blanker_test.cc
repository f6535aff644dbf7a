// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/display_blanker.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace power_manager {

using testing::InSequence;
using testing::StrictMock;

namespace {

class MockBlankerDelegate : public DisplayBlanker::Delegate {
 public:
  MOCK_METHOD(void, SetDisplaysBlanked, (bool blanked), (override));
  MOCK_METHOD(void, SetInteractive, (bool interactive), (override));
  MOCK_METHOD(void, SetAutoSuspend, (bool enabled), (override));
};

}  // namespace

TEST(DisplayBlankerTest, BlankEnablesAutoSuspendFirst) {
  StrictMock<MockBlankerDelegate> delegate;
  DisplayBlanker blanker(&delegate);
  {
    InSequence sequence;
    EXPECT_CALL(delegate, SetAutoSuspend(true));
    EXPECT_CALL(delegate, SetInteractive(false));
    EXPECT_CALL(delegate, SetDisplaysBlanked(true));
  }
  blanker.BlankAllDisplays();
  EXPECT_TRUE(blanker.IsBlanked());
  EXPECT_EQ(blanker.ToString(), "blanked=true");
}

TEST(DisplayBlankerTest, UnblankDisablesAutoSuspendLast) {
  StrictMock<MockBlankerDelegate> delegate;
  DisplayBlanker blanker(&delegate);
  {
    InSequence sequence;
    EXPECT_CALL(delegate, SetDisplaysBlanked(false));
    EXPECT_CALL(delegate, SetInteractive(true));
    EXPECT_CALL(delegate, SetAutoSuspend(false));
  }
  blanker.UnblankAllDisplays();
  EXPECT_FALSE(blanker.IsBlanked());
}

}  // namespace power_manager
