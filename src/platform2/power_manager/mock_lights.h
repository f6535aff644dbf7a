// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_MOCK_LIGHTS_H_
#define POWER_MANAGER_MOCK_LIGHTS_H_

#include <gmock/gmock.h>

#include "power_manager/lights_interface.h"

namespace power_manager {

class MockLights : public LightsInterface {
 public:
  MockLights() = default;
  ~MockLights() override = default;

  MOCK_METHOD(void, SetBrightness, (LightId id, int brightness), (override));
  MOCK_METHOD(void,
              SetFlashing,
              (LightId id, uint32_t color, bool on),
              (override));
};

}  // namespace power_manager

#endif  // POWER_MANAGER_MOCK_LIGHTS_H_
