// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/daemon/prefs_settings_source.h"

#include <string>

#include <base/files/file_path.h>
#include <base/files/file_util.h>
#include <base/files/scoped_temp_dir.h>
#include <base/functional/callback_helpers.h>
#include <base/test/task_environment.h>
#include <gtest/gtest.h>

#include "power_manager/power_settings.h"

namespace power_manager {

class PrefsSettingsSourceTest : public testing::Test {
 public:
  PrefsSettingsSourceTest() = default;
  PrefsSettingsSourceTest(const PrefsSettingsSourceTest&) = delete;
  PrefsSettingsSourceTest& operator=(const PrefsSettingsSourceTest&) = delete;

  void SetUp() override {
    ASSERT_TRUE(temp_dir_.CreateUniqueTempDir());
    path_ = temp_dir_.GetPath().Append("power_manager").Append("settings");
  }

 protected:
  base::test::TaskEnvironment task_environment_{
      base::test::TaskEnvironment::MainThreadType::IO};
  base::ScopedTempDir temp_dir_;
  base::FilePath path_;
};

TEST_F(PrefsSettingsSourceTest, MissingFileYieldsEmptySettings) {
  PrefsSettingsSource source(path_);
  EXPECT_TRUE(source.Init(base::DoNothing()));

  std::string value;
  EXPECT_FALSE(source.GetString(kScreenOffTimeoutSetting, &value));
}

TEST_F(PrefsSettingsSourceTest, SetStringPersists) {
  PrefsSettingsSource source(path_);
  source.Reload();
  ASSERT_TRUE(source.SetString(kScreenOffTimeoutSetting, "60000"));
  ASSERT_TRUE(source.SetString(kStayOnWhilePluggedInSetting, "3"));
  EXPECT_TRUE(base::PathExists(path_));

  std::string value;
  ASSERT_TRUE(source.GetString(kScreenOffTimeoutSetting, &value));
  EXPECT_EQ(value, "60000");

  PrefsSettingsSource other(path_);
  other.Reload();
  ASSERT_TRUE(other.GetString(kScreenOffTimeoutSetting, &value));
  EXPECT_EQ(value, "60000");
  ASSERT_TRUE(other.GetString(kStayOnWhilePluggedInSetting, &value));
  EXPECT_EQ(value, "3");
}

TEST_F(PrefsSettingsSourceTest, ReloadPicksUpExternalEdits) {
  PrefsSettingsSource source(path_);
  source.Reload();

  ASSERT_TRUE(base::CreateDirectory(path_.DirName()));
  ASSERT_TRUE(base::WriteFile(path_, std::string(kScreenBrightnessSetting) +
                                         "=180\n"));
  std::string value;
  EXPECT_FALSE(source.GetString(kScreenBrightnessSetting, &value));

  source.Reload();
  ASSERT_TRUE(source.GetString(kScreenBrightnessSetting, &value));
  EXPECT_EQ(value, "180");

  // Removing the file clears everything.
  ASSERT_TRUE(base::DeleteFile(path_));
  source.Reload();
  EXPECT_FALSE(source.GetString(kScreenBrightnessSetting, &value));
}

TEST_F(PrefsSettingsSourceTest, SetStringFailsWithoutWritableDirectory) {
  // A regular file where the settings directory should be.
  ASSERT_TRUE(base::WriteFile(path_.DirName(), "not a directory"));

  PrefsSettingsSource source(path_);
  source.Reload();
  EXPECT_FALSE(source.SetString(kScreenOffTimeoutSetting, "60000"));
}

}  // namespace power_manager
