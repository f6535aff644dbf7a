// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/power_config.h"

#include <inttypes.h>

#include <algorithm>

#include <base/logging.h>
#include <base/strings/string_number_conversions.h>
#include <base/strings/stringprintf.h>

#include "power_manager/power_constants.h"

namespace power_manager {

namespace {

void ReadBool(brillo::CrosConfigInterface* cros_config,
              const std::string& property,
              bool* value) {
  std::string str;
  if (!cros_config->GetString(kCrosConfigPowerPath, property, &str))
    return;
  if (str == "true") {
    *value = true;
  } else if (str == "false") {
    *value = false;
  } else {
    LOG(WARNING) << "Ignoring invalid value \"" << str << "\" for "
                 << kCrosConfigPowerPath << "/" << property;
  }
}

void ReadBrightness(brillo::CrosConfigInterface* cros_config,
                    const std::string& property,
                    int* value) {
  std::string str;
  if (!cros_config->GetString(kCrosConfigPowerPath, property, &str))
    return;
  int parsed = 0;
  if (!base::StringToInt(str, &parsed) || parsed < 0 ||
      parsed > kMaxBrightness) {
    LOG(WARNING) << "Ignoring invalid value \"" << str << "\" for "
                 << kCrosConfigPowerPath << "/" << property;
    return;
  }
  *value = parsed;
}

void ReadTimeoutMs(brillo::CrosConfigInterface* cros_config,
                   const std::string& property,
                   base::TimeDelta* value) {
  std::string str;
  if (!cros_config->GetString(kCrosConfigPowerPath, property, &str))
    return;
  int parsed = 0;
  if (!base::StringToInt(str, &parsed) || parsed <= 0) {
    LOG(WARNING) << "Ignoring invalid value \"" << str << "\" for "
                 << kCrosConfigPowerPath << "/" << property;
    return;
  }
  *value = base::Milliseconds(parsed);
}

}  // namespace

std::string PowerConfig::ToString() const {
  return base::StringPrintf(
      "wake_up_when_plugged_or_unplugged=%d, "
      "suspend_when_screen_off_due_to_proximity=%d, dreams_supported=%d, "
      "dreams_enabled_by_default=%d, dreams_activated_on_sleep_by_default=%d, "
      "dreams_activated_on_dock_by_default=%d, screen_brightness=[%d, %d] "
      "default %d, button_brightness_default=%d, "
      "keyboard_brightness_default=%d, proximity_wake_supported=%d, "
      "proximity_check_timeout=%" PRId64 " ms",
      wake_up_when_plugged_or_unplugged,
      suspend_when_screen_off_due_to_proximity, dreams_supported,
      dreams_enabled_by_default, dreams_activated_on_sleep_by_default,
      dreams_activated_on_dock_by_default, screen_brightness_minimum,
      screen_brightness_maximum, screen_brightness_default,
      button_brightness_default, keyboard_brightness_default,
      proximity_wake_supported, proximity_check_timeout.InMilliseconds());
}

PowerConfig LoadPowerConfig(brillo::CrosConfigInterface* cros_config) {
  PowerConfig config;
  if (!cros_config) {
    LOG(INFO) << "No cros_config; using default power configuration";
    return config;
  }

  ReadBool(cros_config, kCrosConfigWakeWhenPluggedOrUnplugged,
           &config.wake_up_when_plugged_or_unplugged);
  ReadBool(cros_config, kCrosConfigSuspendWhenScreenOffDueToProximity,
           &config.suspend_when_screen_off_due_to_proximity);
  ReadBool(cros_config, kCrosConfigDreamsSupported, &config.dreams_supported);
  ReadBool(cros_config, kCrosConfigDreamsEnabledByDefault,
           &config.dreams_enabled_by_default);
  ReadBool(cros_config, kCrosConfigDreamsActivatedOnSleepByDefault,
           &config.dreams_activated_on_sleep_by_default);
  ReadBool(cros_config, kCrosConfigDreamsActivatedOnDockByDefault,
           &config.dreams_activated_on_dock_by_default);
  ReadBrightness(cros_config, kCrosConfigScreenBrightnessMinimum,
                 &config.screen_brightness_minimum);
  ReadBrightness(cros_config, kCrosConfigScreenBrightnessMaximum,
                 &config.screen_brightness_maximum);
  ReadBrightness(cros_config, kCrosConfigScreenBrightnessDefault,
                 &config.screen_brightness_default);
  ReadBrightness(cros_config, kCrosConfigButtonBrightnessDefault,
                 &config.button_brightness_default);
  ReadBrightness(cros_config, kCrosConfigKeyboardBrightnessDefault,
                 &config.keyboard_brightness_default);
  ReadBool(cros_config, kCrosConfigProximityWakeSupported,
           &config.proximity_wake_supported);
  ReadTimeoutMs(cros_config, kCrosConfigProximityCheckTimeoutMs,
                &config.proximity_check_timeout);

  if (config.screen_brightness_minimum > config.screen_brightness_maximum) {
    LOG(WARNING) << "Screen brightness minimum "
                 << config.screen_brightness_minimum << " exceeds maximum "
                 << config.screen_brightness_maximum << "; swapping";
    std::swap(config.screen_brightness_minimum,
              config.screen_brightness_maximum);
  }
  return config;
}

}  // namespace power_manager
