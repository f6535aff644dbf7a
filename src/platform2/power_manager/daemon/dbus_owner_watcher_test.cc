// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/daemon/dbus_owner_watcher.h"

#include <memory>

#include <base/functional/bind.h>
#include <base/functional/callback_helpers.h>
#include <gtest/gtest.h>

namespace power_manager {

namespace {

constexpr char kClientName[] = ":1.42";
constexpr char kOtherClientName[] = ":1.43";

void SetTrue(bool* value) {
  *value = true;
}

}  // namespace

TEST(DBusOwnerWatcherTest, WatchFiresOnceWhenNameIsLost) {
  DBusOwnerWatcher watcher;
  std::unique_ptr<OwnerLiveness> liveness =
      watcher.CreateLiveness(kClientName);
  bool lost = false;
  ASSERT_TRUE(liveness->Watch(base::BindOnce(&SetTrue, &lost)));
  EXPECT_EQ(watcher.GetWatchCountForTesting(), 1u);

  watcher.HandleNameLost(kOtherClientName);
  EXPECT_FALSE(lost);

  watcher.HandleNameLost(kClientName);
  EXPECT_TRUE(lost);
  EXPECT_EQ(watcher.GetWatchCountForTesting(), 0u);

  lost = false;
  watcher.HandleNameLost(kClientName);
  EXPECT_FALSE(lost);
}

TEST(DBusOwnerWatcherTest, DestroyingLivenessRemovesWatch) {
  DBusOwnerWatcher watcher;
  std::unique_ptr<OwnerLiveness> first = watcher.CreateLiveness(kClientName);
  std::unique_ptr<OwnerLiveness> second = watcher.CreateLiveness(kClientName);
  bool first_lost = false;
  bool second_lost = false;
  ASSERT_TRUE(first->Watch(base::BindOnce(&SetTrue, &first_lost)));
  ASSERT_TRUE(second->Watch(base::BindOnce(&SetTrue, &second_lost)));
  EXPECT_EQ(watcher.GetWatchCountForTesting(), 2u);

  first.reset();
  EXPECT_EQ(watcher.GetWatchCountForTesting(), 1u);

  watcher.HandleNameLost(kClientName);
  EXPECT_FALSE(first_lost);
  EXPECT_TRUE(second_lost);
}

TEST(DBusOwnerWatcherTest, WatchingAgainReplacesCallback) {
  DBusOwnerWatcher watcher;
  std::unique_ptr<OwnerLiveness> liveness =
      watcher.CreateLiveness(kClientName);
  bool first_lost = false;
  bool second_lost = false;
  ASSERT_TRUE(liveness->Watch(base::BindOnce(&SetTrue, &first_lost)));
  ASSERT_TRUE(liveness->Watch(base::BindOnce(&SetTrue, &second_lost)));
  EXPECT_EQ(watcher.GetWatchCountForTesting(), 1u);

  watcher.HandleNameLost(kClientName);
  EXPECT_FALSE(first_lost);
  EXPECT_TRUE(second_lost);
}

TEST(DBusOwnerWatcherTest, CallbackMayDestroyLiveness) {
  DBusOwnerWatcher watcher;
  std::unique_ptr<OwnerLiveness> liveness =
      watcher.CreateLiveness(kClientName);
  ASSERT_TRUE(liveness->Watch(base::BindOnce(
      [](std::unique_ptr<OwnerLiveness>* liveness) { liveness->reset(); },
      &liveness)));

  watcher.HandleNameLost(kClientName);
  EXPECT_FALSE(liveness);
  EXPECT_EQ(watcher.GetWatchCountForTesting(), 0u);
}

TEST(DBusOwnerWatcherTest, EmptyNameCannotBeWatched) {
  DBusOwnerWatcher watcher;
  std::unique_ptr<OwnerLiveness> liveness = watcher.CreateLiveness("");
  EXPECT_FALSE(liveness->Watch(base::DoNothing()));
  EXPECT_EQ(watcher.GetWatchCountForTesting(), 0u);
}

}  // namespace power_manager
