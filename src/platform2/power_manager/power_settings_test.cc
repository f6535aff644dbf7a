// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/power_settings.h"

#include <gtest/gtest.h>

#include "power_manager/fake_settings_source.h"

namespace power_manager {

class PowerSettingsTest : public testing::Test {
 protected:
  FakeSettingsSource source_;
  PowerConfig config_;
};

TEST_F(PowerSettingsTest, DefaultsComeFromConfig) {
  config_.dreams_enabled_by_default = false;
  config_.dreams_activated_on_sleep_by_default = true;
  config_.wake_up_when_plugged_or_unplugged = true;
  config_.screen_brightness_default = 80;
  config_.button_brightness_default = 40;
  config_.keyboard_brightness_default = 30;

  const PowerSettings settings = ReadPowerSettings(source_, config_);
  EXPECT_FALSE(settings.dreams_enabled);
  EXPECT_TRUE(settings.dreams_activate_on_sleep);
  EXPECT_TRUE(settings.dreams_activate_on_dock);
  EXPECT_TRUE(settings.wake_up_when_plugged_or_unplugged);
  EXPECT_EQ(settings.screen_off_timeout, kDefaultScreenOffTimeout);
  EXPECT_EQ(settings.stay_on_while_plugged_in, kPlugTypeAc);
  EXPECT_EQ(settings.screen_brightness, 80);
  EXPECT_EQ(settings.screen_brightness_mode, kScreenBrightnessModeManual);
  EXPECT_FLOAT_EQ(settings.screen_auto_brightness_adjustment, 0.0f);
  EXPECT_FLOAT_EQ(settings.auto_brightness_responsiveness, 1.0f);
  EXPECT_EQ(settings.button_timeout, kDefaultButtonOnDuration);
  EXPECT_EQ(settings.button_brightness, 40);
  EXPECT_EQ(settings.keyboard_brightness, 30);
  EXPECT_FALSE(settings.proximity_wake_enabled);
}

TEST_F(PowerSettingsTest, ReadsStoredValues) {
  source_.SetString(kScreensaverEnabledSetting, "0");
  source_.SetString(kScreenOffTimeoutSetting, "60000");
  source_.SetString(kStayOnWhilePluggedInSetting, "7");
  source_.SetString(kScreenBrightnessSetting, " 200 ");
  source_.SetString(kScreenAutoBrightnessAdjSetting, "-0.5");
  source_.SetString(kScreenBrightnessModeSetting, "1");
  source_.SetString(kButtonBacklightTimeoutSetting, "0");
  source_.SetString(kProximityOnWakeSetting, "1");

  const PowerSettings settings = ReadPowerSettings(source_, config_);
  EXPECT_FALSE(settings.dreams_enabled);
  EXPECT_EQ(settings.screen_off_timeout, base::Seconds(60));
  EXPECT_EQ(settings.stay_on_while_plugged_in, kPlugTypeAny);
  EXPECT_EQ(settings.screen_brightness, 200);
  EXPECT_FLOAT_EQ(settings.screen_auto_brightness_adjustment, -0.5f);
  EXPECT_EQ(settings.screen_brightness_mode, kScreenBrightnessModeAutomatic);
  EXPECT_TRUE(settings.button_timeout.is_zero());
  EXPECT_TRUE(settings.proximity_wake_enabled);
}

TEST_F(PowerSettingsTest, MalformedValuesFallBackToDefaults) {
  source_.SetString(kScreenOffTimeoutSetting, "forever");
  source_.SetString(kScreenAutoBrightnessAdjSetting, "high");

  const PowerSettings settings = ReadPowerSettings(source_, config_);
  EXPECT_EQ(settings.screen_off_timeout, kDefaultScreenOffTimeout);
  EXPECT_FLOAT_EQ(settings.screen_auto_brightness_adjustment, 0.0f);
}

TEST_F(PowerSettingsTest, ResponsivenessIsClamped) {
  source_.SetString(kAutoBrightnessResponsivenessSetting, "10");
  EXPECT_FLOAT_EQ(ReadPowerSettings(source_, config_)
                      .auto_brightness_responsiveness,
                  kMaxResponsivenessFactor);

  source_.SetString(kAutoBrightnessResponsivenessSetting, "0");
  EXPECT_FLOAT_EQ(ReadPowerSettings(source_, config_)
                      .auto_brightness_responsiveness,
                  kMinResponsivenessFactor);
}

TEST_F(PowerSettingsTest, Equality) {
  const PowerSettings a = ReadPowerSettings(source_, config_);
  PowerSettings b = a;
  EXPECT_EQ(a, b);
  b.keyboard_brightness++;
  EXPECT_NE(a, b);

  b = a;
  b.proximity_wake_enabled = !a.proximity_wake_enabled;
  EXPECT_NE(a, b);
}

}  // namespace power_manager
