// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_WIRELESS_CHARGER_DETECTOR_H_
#define POWER_MANAGER_WIRELESS_CHARGER_DETECTOR_H_

#include <string>

namespace power_manager {

// Decides whether a change in power source means the device was just placed
// on a wireless charger.
//
// Wireless chargers stop and restart charging on their own once the battery
// is nearly full, which looks exactly like the device being lifted off and
// put back down. Such restarts are not reported as a new dock.
class WirelessChargerDetector {
 public:
  // At or above this level a wireless power transition is not trusted.
  static constexpr int kWirelessChargerBatteryLevelThreshold = 95;

  WirelessChargerDetector();
  WirelessChargerDetector(const WirelessChargerDetector&) = delete;
  WirelessChargerDetector& operator=(const WirelessChargerDetector&) = delete;

  ~WirelessChargerDetector();

  // Updates the detector with the current power state. Returns true if the
  // device was just docked on a wireless charger.
  bool Update(bool is_powered, int plug_type, int battery_level);

  std::string ToString() const;

 private:
  bool powered_wirelessly_ = false;
  int battery_level_ = -1;
};

}  // namespace power_manager

#endif  // POWER_MANAGER_WIRELESS_CHARGER_DETECTOR_H_
