// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_DAEMON_SYSFS_BATTERY_SOURCE_H_
#define POWER_MANAGER_DAEMON_SYSFS_BATTERY_SOURCE_H_

#include <string>

#include <base/files/file_path.h>
#include <base/synchronization/lock.h>
#include <base/thread_annotations.h>

#include "power_manager/battery_source_interface.h"
#include "power_manager/power_constants.h"

namespace power_manager {

// Reads power supply state from /sys/class/power_supply. Values are cached by
// Refresh() so that the getters never touch the disk.
class SysfsBatterySource : public BatterySourceInterface {
 public:
  static constexpr char kDefaultPowerSupplyDir[] = "/sys/class/power_supply";

  explicit SysfsBatterySource(const base::FilePath& power_supply_dir);
  SysfsBatterySource(const SysfsBatterySource&) = delete;
  SysfsBatterySource& operator=(const SysfsBatterySource&) = delete;

  ~SysfsBatterySource() override;

  // Rereads every supply. Returns true if anything changed.
  bool Refresh();

  // BatterySourceInterface:
  bool IsPowered() override;
  bool IsPoweredBy(int plug_type_mask) override;
  int GetPlugType() override;
  int GetBatteryLevel() override;

 private:
  const base::FilePath power_supply_dir_;

  base::Lock lock_;
  // Mask of kPlugType* sources that are online.
  int online_sources_ GUARDED_BY(lock_) = kPlugTypeNone;
  int battery_level_ GUARDED_BY(lock_) = 0;
};

}  // namespace power_manager

#endif  // POWER_MANAGER_DAEMON_SYSFS_BATTERY_SOURCE_H_
