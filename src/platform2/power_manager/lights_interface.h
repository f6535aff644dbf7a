// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_LIGHTS_INTERFACE_H_
#define POWER_MANAGER_LIGHTS_INTERFACE_H_

#include <stdint.h>

namespace power_manager {

enum class LightId {
  kButtons = 0,
  kKeyboard = 1,
  kAttention = 2,
  // Caps Lock and Fn Lock indicators on the keyboard.
  kCaps = 3,
  kFunc = 4,
};

// Drives LEDs and small backlights. Never called with the engine lock held.
class LightsInterface {
 public:
  virtual ~LightsInterface() = default;

  // |brightness| is in [0, kMaxBrightness].
  virtual void SetBrightness(LightId id, int brightness) = 0;

  // Flashes |id| in |color| (0xAARRGGBB) while |on| is true.
  virtual void SetFlashing(LightId id, uint32_t color, bool on) = 0;
};

}  // namespace power_manager

#endif  // POWER_MANAGER_LIGHTS_INTERFACE_H_
