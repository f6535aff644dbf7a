// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/power_settings.h"

#include <inttypes.h>

#include <algorithm>

#include <base/logging.h>
#include <base/strings/string_number_conversions.h>
#include <base/strings/string_util.h>
#include <base/strings/stringprintf.h>

namespace power_manager {

namespace {

int ReadInt(const SettingsSourceInterface& source,
            const std::string& key,
            int default_value) {
  std::string str;
  if (!source.GetString(key, &str))
    return default_value;
  int value = 0;
  if (!base::StringToInt(base::TrimWhitespaceASCII(str, base::TRIM_ALL),
                         &value)) {
    LOG(WARNING) << "Ignoring non-integer value \"" << str << "\" for " << key;
    return default_value;
  }
  return value;
}

float ReadFloat(const SettingsSourceInterface& source,
                const std::string& key,
                float default_value) {
  std::string str;
  if (!source.GetString(key, &str))
    return default_value;
  double value = 0.0;
  if (!base::StringToDouble(base::TrimWhitespaceASCII(str, base::TRIM_ALL),
                            &value)) {
    LOG(WARNING) << "Ignoring non-numeric value \"" << str << "\" for " << key;
    return default_value;
  }
  return static_cast<float>(value);
}

bool ReadBool(const SettingsSourceInterface& source,
              const std::string& key,
              bool default_value) {
  return ReadInt(source, key, default_value ? 1 : 0) != 0;
}

}  // namespace

bool PowerSettings::operator==(const PowerSettings& other) const {
  return dreams_enabled == other.dreams_enabled &&
         dreams_activate_on_sleep == other.dreams_activate_on_sleep &&
         dreams_activate_on_dock == other.dreams_activate_on_dock &&
         screen_off_timeout == other.screen_off_timeout &&
         stay_on_while_plugged_in == other.stay_on_while_plugged_in &&
         wake_up_when_plugged_or_unplugged ==
             other.wake_up_when_plugged_or_unplugged &&
         screen_brightness == other.screen_brightness &&
         screen_auto_brightness_adjustment ==
             other.screen_auto_brightness_adjustment &&
         screen_brightness_mode == other.screen_brightness_mode &&
         auto_brightness_responsiveness ==
             other.auto_brightness_responsiveness &&
         button_timeout == other.button_timeout &&
         button_brightness == other.button_brightness &&
         keyboard_brightness == other.keyboard_brightness &&
         proximity_wake_enabled == other.proximity_wake_enabled;
}

std::string PowerSettings::ToString() const {
  return base::StringPrintf(
      "dreams_enabled=%d, dreams_activate_on_sleep=%d, "
      "dreams_activate_on_dock=%d, screen_off_timeout=%" PRId64
      " ms, stay_on_while_plugged_in=0x%x, "
      "wake_up_when_plugged_or_unplugged=%d, screen_brightness=%d, "
      "screen_auto_brightness_adjustment=%.2f, screen_brightness_mode=%d, "
      "auto_brightness_responsiveness=%.2f, button_timeout=%" PRId64
      " ms, button_brightness=%d, keyboard_brightness=%d, "
      "proximity_wake_enabled=%d",
      dreams_enabled, dreams_activate_on_sleep, dreams_activate_on_dock,
      screen_off_timeout.InMilliseconds(), stay_on_while_plugged_in,
      wake_up_when_plugged_or_unplugged, screen_brightness,
      screen_auto_brightness_adjustment, screen_brightness_mode,
      auto_brightness_responsiveness, button_timeout.InMilliseconds(),
      button_brightness, keyboard_brightness, proximity_wake_enabled);
}

PowerSettings ReadPowerSettings(const SettingsSourceInterface& source,
                                const PowerConfig& config) {
  PowerSettings settings;
  settings.dreams_enabled = ReadBool(source, kScreensaverEnabledSetting,
                                     config.dreams_enabled_by_default);
  settings.dreams_activate_on_sleep =
      ReadBool(source, kScreensaverActivateOnSleepSetting,
               config.dreams_activated_on_sleep_by_default);
  settings.dreams_activate_on_dock =
      ReadBool(source, kScreensaverActivateOnDockSetting,
               config.dreams_activated_on_dock_by_default);
  settings.screen_off_timeout = base::Milliseconds(
      ReadInt(source, kScreenOffTimeoutSetting,
              kDefaultScreenOffTimeout.InMilliseconds()));
  settings.stay_on_while_plugged_in =
      ReadInt(source, kStayOnWhilePluggedInSetting, kPlugTypeAc);
  settings.wake_up_when_plugged_or_unplugged =
      ReadBool(source, kWakeWhenPluggedOrUnpluggedSetting,
               config.wake_up_when_plugged_or_unplugged);
  settings.screen_brightness = ReadInt(source, kScreenBrightnessSetting,
                                       config.screen_brightness_default);
  settings.screen_auto_brightness_adjustment =
      ReadFloat(source, kScreenAutoBrightnessAdjSetting, 0.0f);
  settings.screen_brightness_mode = ReadInt(
      source, kScreenBrightnessModeSetting, kScreenBrightnessModeManual);
  settings.auto_brightness_responsiveness = std::clamp(
      ReadFloat(source, kAutoBrightnessResponsivenessSetting, 1.0f),
      kMinResponsivenessFactor, kMaxResponsivenessFactor);
  settings.button_timeout = base::Milliseconds(
      ReadInt(source, kButtonBacklightTimeoutSetting,
              kDefaultButtonOnDuration.InMilliseconds()));
  settings.button_brightness = ReadInt(source, kButtonBrightnessSetting,
                                       config.button_brightness_default);
  settings.keyboard_brightness = ReadInt(source, kKeyboardBrightnessSetting,
                                         config.keyboard_brightness_default);
  settings.proximity_wake_enabled =
      ReadBool(source, kProximityOnWakeSetting, false);
  return settings;
}

}  // namespace power_manager
