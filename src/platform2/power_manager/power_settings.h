// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_POWER_SETTINGS_H_
#define POWER_MANAGER_POWER_SETTINGS_H_

#include <string>

#include <base/time/time.h>

#include "power_manager/power_config.h"
#include "power_manager/settings_source_interface.h"

namespace power_manager {

// Setting keys.
inline constexpr char kScreensaverEnabledSetting[] = "screensaver_enabled";
inline constexpr char kScreensaverActivateOnSleepSetting[] =
    "screensaver_activate_on_sleep";
inline constexpr char kScreensaverActivateOnDockSetting[] =
    "screensaver_activate_on_dock";
inline constexpr char kScreenOffTimeoutSetting[] = "screen_off_timeout";
inline constexpr char kStayOnWhilePluggedInSetting[] =
    "stay_on_while_plugged_in";
inline constexpr char kWakeWhenPluggedOrUnpluggedSetting[] =
    "wake_when_plugged_or_unplugged";
inline constexpr char kScreenBrightnessSetting[] = "screen_brightness";
inline constexpr char kScreenAutoBrightnessAdjSetting[] =
    "screen_auto_brightness_adj";
inline constexpr char kScreenBrightnessModeSetting[] = "screen_brightness_mode";
inline constexpr char kAutoBrightnessResponsivenessSetting[] =
    "auto_brightness_responsiveness";
inline constexpr char kButtonBacklightTimeoutSetting[] =
    "button_backlight_timeout";
inline constexpr char kButtonBrightnessSetting[] = "button_brightness";
inline constexpr char kKeyboardBrightnessSetting[] = "keyboard_brightness";
inline constexpr char kProximityOnWakeSetting[] = "proximity_on_wake";

// Values of kScreenBrightnessModeSetting.
inline constexpr int kScreenBrightnessModeManual = 0;
inline constexpr int kScreenBrightnessModeAutomatic = 1;

inline constexpr float kMinResponsivenessFactor = 0.2f;
inline constexpr float kMaxResponsivenessFactor = 3.0f;

// Snapshot of the user settings that affect power policy.
struct PowerSettings {
  bool operator==(const PowerSettings& other) const;
  bool operator!=(const PowerSettings& other) const {
    return !(*this == other);
  }

  std::string ToString() const;

  bool dreams_enabled = false;
  bool dreams_activate_on_sleep = false;
  bool dreams_activate_on_dock = false;
  base::TimeDelta screen_off_timeout = kDefaultScreenOffTimeout;
  // Mask of kPlugType* values.
  int stay_on_while_plugged_in = kPlugTypeAc;
  bool wake_up_when_plugged_or_unplugged = false;
  int screen_brightness = 0;
  float screen_auto_brightness_adjustment = 0.0f;
  int screen_brightness_mode = kScreenBrightnessModeManual;
  float auto_brightness_responsiveness = 1.0f;
  base::TimeDelta button_timeout = kDefaultButtonOnDuration;
  int button_brightness = 0;
  int keyboard_brightness = 0;
  bool proximity_wake_enabled = false;
};

// Reads every setting from |source|, falling back to defaults (some of which
// come from |config|) for unset or malformed values.
PowerSettings ReadPowerSettings(const SettingsSourceInterface& source,
                                const PowerConfig& config);

}  // namespace power_manager

#endif  // POWER_MANAGER_POWER_SETTINGS_H_
