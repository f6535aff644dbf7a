// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/daemon/sysfs_battery_source.h"

#include <algorithm>

#include <base/files/file_enumerator.h>
#include <base/files/file_util.h>
#include <base/logging.h>
#include <base/strings/string_number_conversions.h>
#include <base/strings/string_util.h>

namespace power_manager {

namespace {

// Reads |dir|/|name| with surrounding whitespace removed.
bool ReadSysfsString(const base::FilePath& dir,
                     const std::string& name,
                     std::string* value) {
  std::string contents;
  if (!base::ReadFileToString(dir.Append(name), &contents))
    return false;
  base::TrimWhitespaceASCII(contents, base::TRIM_ALL, value);
  return true;
}

bool ReadSysfsInt(const base::FilePath& dir, const std::string& name,
                  int* value) {
  std::string contents;
  return ReadSysfsString(dir, name, &contents) &&
         base::StringToInt(contents, value);
}

// Maps a power_supply "type" to a kPlugType* bit. Batteries and unknown types
// map to kPlugTypeNone.
int PlugTypeForSupplyType(const std::string& type) {
  if (type == "Mains")
    return kPlugTypeAc;
  if (type == "USB" || type == "USB_C" || type == "USB_PD" ||
      type == "USB_PD_DRP" || type == "USB_DCP" || type == "USB_CDP" ||
      type == "USB_ACA") {
    return kPlugTypeUsb;
  }
  if (type == "Wireless")
    return kPlugTypeWireless;
  return kPlugTypeNone;
}

}  // namespace

SysfsBatterySource::SysfsBatterySource(const base::FilePath& power_supply_dir)
    : power_supply_dir_(power_supply_dir) {}

SysfsBatterySource::~SysfsBatterySource() = default;

bool SysfsBatterySource::Refresh() {
  int online_sources = kPlugTypeNone;
  int battery_level = -1;

  base::FileEnumerator enumerator(
      power_supply_dir_, false,
      base::FileEnumerator::DIRECTORIES | base::FileEnumerator::SHOW_SYM_LINKS);
  for (base::FilePath supply = enumerator.Next(); !supply.empty();
       supply = enumerator.Next()) {
    std::string type;
    if (!ReadSysfsString(supply, "type", &type)) {
      VLOG(1) << "Skipping " << supply.value() << " without a type";
      continue;
    }

    if (type == "Battery") {
      int capacity = 0;
      if (ReadSysfsInt(supply, "capacity", &capacity))
        battery_level = std::max(battery_level, std::clamp(capacity, 0, 100));
      else
        LOG(WARNING) << "Unable to read capacity of " << supply.value();
      continue;
    }

    const int plug_type = PlugTypeForSupplyType(type);
    if (plug_type == kPlugTypeNone)
      continue;
    int online = 0;
    if (!ReadSysfsInt(supply, "online", &online)) {
      LOG(WARNING) << "Unable to read online state of " << supply.value();
      continue;
    }
    if (online)
      online_sources |= plug_type;
  }

  // Devices without a battery are treated as full.
  if (battery_level < 0)
    battery_level = 100;

  base::AutoLock lock(lock_);
  const bool changed = online_sources != online_sources_ ||
                       battery_level != battery_level_;
  online_sources_ = online_sources;
  battery_level_ = battery_level;
  if (changed) {
    VLOG(1) << "Power supply: online=0x" << std::hex << online_sources
            << std::dec << " battery=" << battery_level << "%";
  }
  return changed;
}

bool SysfsBatterySource::IsPowered() {
  base::AutoLock lock(lock_);
  return online_sources_ != kPlugTypeNone;
}

bool SysfsBatterySource::IsPoweredBy(int plug_type_mask) {
  base::AutoLock lock(lock_);
  return (online_sources_ & plug_type_mask) != 0;
}

int SysfsBatterySource::GetPlugType() {
  base::AutoLock lock(lock_);
  if (online_sources_ & kPlugTypeAc)
    return kPlugTypeAc;
  if (online_sources_ & kPlugTypeUsb)
    return kPlugTypeUsb;
  if (online_sources_ & kPlugTypeWireless)
    return kPlugTypeWireless;
  return kPlugTypeNone;
}

int SysfsBatterySource::GetBatteryLevel() {
  base::AutoLock lock(lock_);
  return battery_level_;
}

}  // namespace power_manager
