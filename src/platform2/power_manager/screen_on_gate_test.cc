// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/screen_on_gate.h"

#include <base/functional/bind.h>
#include <gtest/gtest.h>

namespace power_manager {

TEST(ScreenOnGateTest, CallbackRunsOnlyWhenFullyReleased) {
  int released_count = 0;
  ScreenOnGate gate(base::BindRepeating([](int* count) { (*count)++; },
                                        &released_count));
  EXPECT_FALSE(gate.IsHeld());

  gate.Acquire();
  gate.Acquire();
  EXPECT_TRUE(gate.IsHeld());
  EXPECT_EQ(gate.GetNestCount(), 2);

  gate.Release();
  EXPECT_TRUE(gate.IsHeld());
  EXPECT_EQ(released_count, 0);

  gate.Release();
  EXPECT_FALSE(gate.IsHeld());
  EXPECT_EQ(released_count, 1);
}

TEST(ScreenOnGateTest, EachFullReleaseRunsCallback) {
  int released_count = 0;
  ScreenOnGate gate(base::BindRepeating([](int* count) { (*count)++; },
                                        &released_count));
  gate.Acquire();
  gate.Release();
  gate.Acquire();
  gate.Release();
  EXPECT_EQ(released_count, 2);
}

TEST(ScreenOnGateTest, NullCallbackIsAllowed) {
  ScreenOnGate gate{base::RepeatingClosure()};
  gate.Acquire();
  gate.Release();
  EXPECT_FALSE(gate.IsHeld());
  EXPECT_EQ(gate.ToString(), "screen on gate: nest count=0");
}

}  // namespace power_manager
