// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_DIRTY_FLAGS_H_
#define POWER_MANAGER_DIRTY_FLAGS_H_

#include <string>

#include <base/containers/enum_set.h>

namespace power_manager {

// Categories of state that changed since the last power state update.
enum class DirtyFlag {
  // A wake lock was acquired or released.
  kWakeLocks,
  // The wakefulness changed.
  kWakefulness,
  // A user activity was recorded or a user activity timeout expired.
  kUserActivity,
  // The display sink finished applying a power state request.
  kDisplayStateUpdated,
  // Boot finished.
  kBootCompleted,
  // Settings or overrides changed.
  kSettings,
  // The powered state or plug type changed.
  kIsPowered,
  // The stay-on-while-plugged-in state changed.
  kStayOn,
  // The battery source reported a change.
  kBatteryState,
  // The proximity sensor became positive or negative.
  kProximityPositive,
  // The screen-on gate was fully released.
  kScreenOnGateReleased,
  // The dock state changed.
  kDockState,
  // A proximity-checked wake-up started or finished.
  kProximityCheck,
};

using DirtyFlags = base::
    EnumSet<DirtyFlag, DirtyFlag::kWakeLocks, DirtyFlag::kProximityCheck>;

// Returns a space-separated list of the flags in |flags|, e.g.
// "wake_locks user_activity".
std::string DirtyFlagsToString(DirtyFlags flags);

}  // namespace power_manager

#endif  // POWER_MANAGER_DIRTY_FLAGS_H_
