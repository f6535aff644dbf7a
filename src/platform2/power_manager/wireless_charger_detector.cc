// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/wireless_charger_detector.h"

#include <base/logging.h>
#include <base/strings/stringprintf.h>

#include "power_manager/power_constants.h"

namespace power_manager {

WirelessChargerDetector::WirelessChargerDetector() = default;

WirelessChargerDetector::~WirelessChargerDetector() = default;

bool WirelessChargerDetector::Update(bool is_powered,
                                     int plug_type,
                                     int battery_level) {
  const bool was_powered_wirelessly = powered_wirelessly_;
  powered_wirelessly_ = is_powered && plug_type == kPlugTypeWireless;
  battery_level_ = battery_level;

  const bool docked = powered_wirelessly_ && !was_powered_wirelessly &&
                      battery_level < kWirelessChargerBatteryLevelThreshold;
  VLOG(1) << "Wireless charger update: powered_wirelessly="
          << powered_wirelessly_ << " battery_level=" << battery_level
          << " docked=" << docked;
  return docked;
}

std::string WirelessChargerDetector::ToString() const {
  return base::StringPrintf("powered_wirelessly=%d, battery_level=%d",
                            powered_wirelessly_, battery_level_);
}

}  // namespace power_manager
