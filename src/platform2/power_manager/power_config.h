// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_POWER_CONFIG_H_
#define POWER_MANAGER_POWER_CONFIG_H_

#include <string>

#include <base/time/time.h>
#include <cros_config/cros_config_interface.h>

#include "power_manager/power_constants.h"

namespace power_manager {

inline constexpr char kCrosConfigPowerPath[] = "/power";

inline constexpr char kCrosConfigWakeWhenPluggedOrUnplugged[] =
    "wake-when-plugged-or-unplugged";
inline constexpr char kCrosConfigSuspendWhenScreenOffDueToProximity[] =
    "suspend-when-screen-off-due-to-proximity";
inline constexpr char kCrosConfigDreamsSupported[] = "dreams-supported";
inline constexpr char kCrosConfigDreamsEnabledByDefault[] =
    "dreams-enabled-by-default";
inline constexpr char kCrosConfigDreamsActivatedOnSleepByDefault[] =
    "dreams-activated-on-sleep-by-default";
inline constexpr char kCrosConfigDreamsActivatedOnDockByDefault[] =
    "dreams-activated-on-dock-by-default";
inline constexpr char kCrosConfigScreenBrightnessMinimum[] =
    "screen-brightness-minimum";
inline constexpr char kCrosConfigScreenBrightnessMaximum[] =
    "screen-brightness-maximum";
inline constexpr char kCrosConfigScreenBrightnessDefault[] =
    "screen-brightness-default";
inline constexpr char kCrosConfigButtonBrightnessDefault[] =
    "button-brightness-default";
inline constexpr char kCrosConfigKeyboardBrightnessDefault[] =
    "keyboard-brightness-default";
inline constexpr char kCrosConfigProximityWakeSupported[] =
    "proximity-wake-supported";
inline constexpr char kCrosConfigProximityCheckTimeoutMs[] =
    "proximity-check-timeout-ms";

// Per-model hardware configuration. Read once at startup.
struct PowerConfig {
  // Whether plugging or unplugging power turns the screen on. Useful on
  // devices without a charging LED.
  bool wake_up_when_plugged_or_unplugged = false;

  // Whether the system may suspend while the screen is off because the
  // proximity sensor is positive. Unsafe on hardware where the sensor is not
  // a wakeup source.
  bool suspend_when_screen_off_due_to_proximity = false;

  bool dreams_supported = true;
  bool dreams_enabled_by_default = true;
  bool dreams_activated_on_sleep_by_default = false;
  bool dreams_activated_on_dock_by_default = true;

  int screen_brightness_minimum = 10;
  int screen_brightness_maximum = 255;
  int screen_brightness_default = 102;
  int button_brightness_default = 255;
  int keyboard_brightness_default = 255;

  // Whether WakeUpWithProximityCheck() may consult the proximity sensor, and
  // how long it waits for a reading.
  bool proximity_wake_supported = false;
  base::TimeDelta proximity_check_timeout = kDefaultProximityCheckTimeout;

  std::string ToString() const;
};

// Reads the /power node of |cros_config|. Missing or malformed properties keep
// their defaults. |cros_config| may be null.
PowerConfig LoadPowerConfig(brillo::CrosConfigInterface* cros_config);

}  // namespace power_manager

#endif  // POWER_MANAGER_POWER_CONFIG_H_
