// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/work_source.h"

#include <gtest/gtest.h>

namespace power_manager {

TEST(WorkSourceTest, AddIgnoresDuplicates) {
  WorkSource work_source;
  EXPECT_TRUE(work_source.IsEmpty());
  work_source.Add(10001, "com.example.music");
  work_source.Add(10001, "com.example.music");
  work_source.Add(10002);
  EXPECT_EQ(work_source.entries().size(), 2u);
  EXPECT_TRUE(work_source.Contains(10001));
  EXPECT_TRUE(work_source.Contains(10002));
  EXPECT_FALSE(work_source.Contains(10003));
}

TEST(WorkSourceTest, EqualityIgnoresOrder) {
  WorkSource a({10001, 10002});
  WorkSource b({10002, 10001});
  EXPECT_EQ(a, b);

  b.Add(10003);
  EXPECT_NE(a, b);
}

TEST(WorkSourceTest, SameUidWithDifferentNamesDiffers) {
  WorkSource a;
  a.Add(10001, "first");
  WorkSource b;
  b.Add(10001, "second");
  EXPECT_NE(a, b);
}

TEST(WorkSourceTest, ToString) {
  WorkSource work_source;
  EXPECT_EQ(work_source.ToString(), "{}");
  work_source.Add(10001, "com.example.music");
  work_source.Add(10002);
  EXPECT_EQ(work_source.ToString(), "{10001 com.example.music, 10002}");
}

}  // namespace power_manager
