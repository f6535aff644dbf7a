// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_FAKE_BATTERY_SOURCE_H_
#define POWER_MANAGER_FAKE_BATTERY_SOURCE_H_

#include "power_manager/battery_source_interface.h"
#include "power_manager/power_constants.h"

namespace power_manager {

class FakeBatterySource : public BatterySourceInterface {
 public:
  FakeBatterySource() = default;
  FakeBatterySource(const FakeBatterySource&) = delete;
  FakeBatterySource& operator=(const FakeBatterySource&) = delete;

  ~FakeBatterySource() override = default;

  void set_plug_type(int plug_type) { plug_type_ = plug_type; }
  void set_battery_level(int battery_level) { battery_level_ = battery_level; }

  // BatterySourceInterface:
  bool IsPowered() override { return plug_type_ != kPlugTypeNone; }
  bool IsPoweredBy(int plug_type_mask) override {
    return (plug_type_ & plug_type_mask) != 0;
  }
  int GetPlugType() override { return plug_type_; }
  int GetBatteryLevel() override { return battery_level_; }

 private:
  int plug_type_ = kPlugTypeNone;
  int battery_level_ = 100;
};

}  // namespace power_manager

#endif  // POWER_MANAGER_FAKE_BATTERY_SOURCE_H_
