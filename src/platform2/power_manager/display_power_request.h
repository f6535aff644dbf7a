// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_DISPLAY_POWER_REQUEST_H_
#define POWER_MANAGER_DISPLAY_POWER_REQUEST_H_

#include <string>

#include "power_manager/power_constants.h"

namespace power_manager {

// Desired display state, rebuilt on every power state update and handed to
// the display sink.
struct DisplayPowerRequest {
  bool operator==(const DisplayPowerRequest& other) const;
  bool operator!=(const DisplayPowerRequest& other) const {
    return !(*this == other);
  }

  std::string ToString() const;

  ScreenState screen_state = ScreenState::kBright;

  // In [0, kMaxBrightness], clamped to the configured range.
  int screen_brightness = kMaxBrightness;

  // In [-1, 1]. Only meaningful when |use_auto_brightness| is set.
  float screen_auto_brightness_adjustment = 0.0f;

  bool use_auto_brightness = false;

  // If true, the screen is turned off while the proximity sensor is positive.
  bool use_proximity_sensor = false;

  // If true, the screen must stay off until the screen-on gate is released.
  bool block_screen_on = false;

  // Scales how quickly auto-brightness reacts. In [0.2, 3.0].
  float responsiveness_factor = 1.0f;
};

}  // namespace power_manager

#endif  // POWER_MANAGER_DISPLAY_POWER_REQUEST_H_
