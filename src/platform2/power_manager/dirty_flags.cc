// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/dirty_flags.h"

#include <vector>

#include <base/strings/string_util.h>

namespace power_manager {

namespace {

const char* DirtyFlagToString(DirtyFlag flag) {
  switch (flag) {
    case DirtyFlag::kWakeLocks:
      return "wake_locks";
    case DirtyFlag::kWakefulness:
      return "wakefulness";
    case DirtyFlag::kUserActivity:
      return "user_activity";
    case DirtyFlag::kDisplayStateUpdated:
      return "display_state_updated";
    case DirtyFlag::kBootCompleted:
      return "boot_completed";
    case DirtyFlag::kSettings:
      return "settings";
    case DirtyFlag::kIsPowered:
      return "is_powered";
    case DirtyFlag::kStayOn:
      return "stay_on";
    case DirtyFlag::kBatteryState:
      return "battery_state";
    case DirtyFlag::kProximityPositive:
      return "proximity_positive";
    case DirtyFlag::kScreenOnGateReleased:
      return "screen_on_gate_released";
    case DirtyFlag::kDockState:
      return "dock_state";
    case DirtyFlag::kProximityCheck:
      return "proximity_check";
  }
  return "unknown";
}

}  // namespace

std::string DirtyFlagsToString(DirtyFlags flags) {
  std::vector<std::string> names;
  for (DirtyFlag flag : flags)
    names.push_back(DirtyFlagToString(flag));
  return base::JoinString(names, " ");
}

}  // namespace power_manager
