// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/power_config.h"

#include <cros_config/fake_cros_config.h>
#include <gtest/gtest.h>

namespace power_manager {

TEST(PowerConfigTest, DefaultsWithoutCrosConfig) {
  const PowerConfig config = LoadPowerConfig(nullptr);
  EXPECT_FALSE(config.wake_up_when_plugged_or_unplugged);
  EXPECT_FALSE(config.suspend_when_screen_off_due_to_proximity);
  EXPECT_TRUE(config.dreams_supported);
  EXPECT_TRUE(config.dreams_enabled_by_default);
  EXPECT_FALSE(config.dreams_activated_on_sleep_by_default);
  EXPECT_TRUE(config.dreams_activated_on_dock_by_default);
  EXPECT_EQ(config.screen_brightness_minimum, 10);
  EXPECT_EQ(config.screen_brightness_maximum, 255);
  EXPECT_EQ(config.screen_brightness_default, 102);
  EXPECT_FALSE(config.proximity_wake_supported);
  EXPECT_EQ(config.proximity_check_timeout, kDefaultProximityCheckTimeout);
}

TEST(PowerConfigTest, EmptyCrosConfigKeepsDefaults) {
  brillo::FakeCrosConfig cros_config;
  const PowerConfig config = LoadPowerConfig(&cros_config);
  EXPECT_TRUE(config.dreams_supported);
  EXPECT_EQ(config.screen_brightness_default, 102);
}

TEST(PowerConfigTest, ReadsBooleans) {
  brillo::FakeCrosConfig cros_config;
  cros_config.SetString(kCrosConfigPowerPath,
                        kCrosConfigWakeWhenPluggedOrUnplugged, "true");
  cros_config.SetString(kCrosConfigPowerPath, kCrosConfigDreamsSupported,
                        "false");
  cros_config.SetString(kCrosConfigPowerPath,
                        kCrosConfigSuspendWhenScreenOffDueToProximity, "true");

  const PowerConfig config = LoadPowerConfig(&cros_config);
  EXPECT_TRUE(config.wake_up_when_plugged_or_unplugged);
  EXPECT_FALSE(config.dreams_supported);
  EXPECT_TRUE(config.suspend_when_screen_off_due_to_proximity);
}

TEST(PowerConfigTest, IgnoresMalformedValues) {
  brillo::FakeCrosConfig cros_config;
  cros_config.SetString(kCrosConfigPowerPath, kCrosConfigDreamsSupported,
                        "yes");
  cros_config.SetString(kCrosConfigPowerPath,
                        kCrosConfigScreenBrightnessDefault, "bright");
  cros_config.SetString(kCrosConfigPowerPath,
                        kCrosConfigScreenBrightnessMaximum, "300");

  const PowerConfig config = LoadPowerConfig(&cros_config);
  EXPECT_TRUE(config.dreams_supported);
  EXPECT_EQ(config.screen_brightness_default, 102);
  EXPECT_EQ(config.screen_brightness_maximum, 255);
}

TEST(PowerConfigTest, ReadsBrightnessRange) {
  brillo::FakeCrosConfig cros_config;
  cros_config.SetString(kCrosConfigPowerPath,
                        kCrosConfigScreenBrightnessMinimum, "20");
  cros_config.SetString(kCrosConfigPowerPath,
                        kCrosConfigScreenBrightnessMaximum, "200");
  cros_config.SetString(kCrosConfigPowerPath,
                        kCrosConfigScreenBrightnessDefault, "150");
  cros_config.SetString(kCrosConfigPowerPath,
                        kCrosConfigButtonBrightnessDefault, "0");

  const PowerConfig config = LoadPowerConfig(&cros_config);
  EXPECT_EQ(config.screen_brightness_minimum, 20);
  EXPECT_EQ(config.screen_brightness_maximum, 200);
  EXPECT_EQ(config.screen_brightness_default, 150);
  EXPECT_EQ(config.button_brightness_default, 0);
}

TEST(PowerConfigTest, SwapsInvertedBrightnessRange) {
  brillo::FakeCrosConfig cros_config;
  cros_config.SetString(kCrosConfigPowerPath,
                        kCrosConfigScreenBrightnessMinimum, "200");
  cros_config.SetString(kCrosConfigPowerPath,
                        kCrosConfigScreenBrightnessMaximum, "50");

  const PowerConfig config = LoadPowerConfig(&cros_config);
  EXPECT_EQ(config.screen_brightness_minimum, 50);
  EXPECT_EQ(config.screen_brightness_maximum, 200);
}

TEST(PowerConfigTest, ReadsProximityWake) {
  brillo::FakeCrosConfig cros_config;
  cros_config.SetString(kCrosConfigPowerPath,
                        kCrosConfigProximityWakeSupported, "true");
  cros_config.SetString(kCrosConfigPowerPath,
                        kCrosConfigProximityCheckTimeoutMs, "400");

  PowerConfig config = LoadPowerConfig(&cros_config);
  EXPECT_TRUE(config.proximity_wake_supported);
  EXPECT_EQ(config.proximity_check_timeout, base::Milliseconds(400));

  // A timeout must be positive.
  cros_config.SetString(kCrosConfigPowerPath,
                        kCrosConfigProximityCheckTimeoutMs, "0");
  config = LoadPowerConfig(&cros_config);
  EXPECT_EQ(config.proximity_check_timeout, kDefaultProximityCheckTimeout);
}

}  // namespace power_manager
