// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_BATTERY_SOURCE_INTERFACE_H_
#define POWER_MANAGER_BATTERY_SOURCE_INTERFACE_H_

namespace power_manager {

// Reports the current power supply state. Read only after a battery-changed
// signal.
class BatterySourceInterface {
 public:
  virtual ~BatterySourceInterface() = default;

  // True if any external power source is connected.
  virtual bool IsPowered() = 0;

  // True if one of the kPlugType* sources in |plug_type_mask| is connected.
  virtual bool IsPoweredBy(int plug_type_mask) = 0;

  // One of the kPlugType* values.
  virtual int GetPlugType() = 0;

  // Charge percentage in [0, 100].
  virtual int GetBatteryLevel() = 0;
};

}  // namespace power_manager

#endif  // POWER_MANAGER_BATTERY_SOURCE_INTERFACE_H_
