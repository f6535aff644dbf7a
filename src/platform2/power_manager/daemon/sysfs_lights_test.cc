// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/daemon/sysfs_lights.h"

#include <string>

#include <base/files/file_path.h>
#include <base/files/file_util.h>
#include <base/files/scoped_temp_dir.h>
#include <gtest/gtest.h>

#include "power_manager/power_constants.h"

namespace power_manager {

namespace {

std::string ReadFile(const base::FilePath& path) {
  std::string contents;
  EXPECT_TRUE(base::ReadFileToString(path, &contents)) << path.value();
  return contents;
}

}  // namespace

class SysfsLightsTest : public testing::Test {
 public:
  SysfsLightsTest() = default;
  SysfsLightsTest(const SysfsLightsTest&) = delete;
  SysfsLightsTest& operator=(const SysfsLightsTest&) = delete;

  void SetUp() override {
    ASSERT_TRUE(temp_dir_.CreateUniqueTempDir());
    caps_dir_ = AddLed("input3::capslock", 1);
    func_dir_ = AddLed("platform::fnlock", 1);
    keyboard_dir_ = AddLed("chromeos::kbd_backlight", 100);
  }

 protected:
  base::FilePath AddLed(const std::string& name, int max_brightness) {
    const base::FilePath dir = temp_dir_.GetPath().Append(name);
    EXPECT_TRUE(base::CreateDirectory(dir));
    EXPECT_TRUE(base::WriteFile(dir.Append("max_brightness"),
                                std::to_string(max_brightness) + "\n"));
    EXPECT_TRUE(base::WriteFile(dir.Append("brightness"), "0"));
    return dir;
  }

  base::ScopedTempDir temp_dir_;
  base::FilePath caps_dir_;
  base::FilePath func_dir_;
  base::FilePath keyboard_dir_;
};

TEST_F(SysfsLightsTest, KeyboardLedsFollowLightId) {
  SysfsLights lights(temp_dir_.GetPath());
  lights.SetBrightness(LightId::kCaps, kMaxBrightness);
  EXPECT_EQ(ReadFile(caps_dir_.Append("brightness")), "1");
  EXPECT_EQ(ReadFile(func_dir_.Append("brightness")), "0");

  lights.SetBrightness(LightId::kFunc, kMaxBrightness);
  EXPECT_EQ(ReadFile(func_dir_.Append("brightness")), "1");

  lights.SetBrightness(LightId::kCaps, 0);
  EXPECT_EQ(ReadFile(caps_dir_.Append("brightness")), "0");
  EXPECT_EQ(ReadFile(keyboard_dir_.Append("brightness")), "0");
}

TEST_F(SysfsLightsTest, ScalesToLedRange) {
  SysfsLights lights(temp_dir_.GetPath());
  lights.SetBrightness(LightId::kKeyboard, kMaxBrightness);
  EXPECT_EQ(ReadFile(keyboard_dir_.Append("brightness")), "100");
}

TEST_F(SysfsLightsTest, MissingLedIsIgnored) {
  SysfsLights lights(temp_dir_.GetPath());
  lights.SetBrightness(LightId::kButtons, kMaxBrightness);
  EXPECT_FALSE(base::PathExists(temp_dir_.GetPath().Append("brightness")));
}

}  // namespace power_manager
