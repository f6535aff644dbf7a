// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/display_power_request.h"

#include <base/strings/stringprintf.h>

namespace power_manager {

bool DisplayPowerRequest::operator==(const DisplayPowerRequest& other) const {
  return screen_state == other.screen_state &&
         screen_brightness == other.screen_brightness &&
         screen_auto_brightness_adjustment ==
             other.screen_auto_brightness_adjustment &&
         use_auto_brightness == other.use_auto_brightness &&
         use_proximity_sensor == other.use_proximity_sensor &&
         block_screen_on == other.block_screen_on &&
         responsiveness_factor == other.responsiveness_factor;
}

std::string DisplayPowerRequest::ToString() const {
  return base::StringPrintf(
      "screen_state=%s, use_proximity_sensor=%d, screen_brightness=%d, "
      "screen_auto_brightness_adjustment=%.2f, use_auto_brightness=%d, "
      "block_screen_on=%d, responsiveness_factor=%.2f",
      ScreenStateToString(screen_state).c_str(), use_proximity_sensor,
      screen_brightness, screen_auto_brightness_adjustment,
      use_auto_brightness, block_screen_on, responsiveness_factor);
}

}  // namespace power_manager
