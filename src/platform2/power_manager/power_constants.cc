// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/power_constants.h"

#include <base/strings/string_number_conversions.h>

namespace power_manager {

std::string WakefulnessToString(Wakefulness wakefulness) {
  switch (wakefulness) {
    case Wakefulness::kAsleep:
      return "Asleep";
    case Wakefulness::kAwake:
      return "Awake";
    case Wakefulness::kNapping:
      return "Napping";
    case Wakefulness::kDreaming:
      return "Dreaming";
  }
  return base::NumberToString(static_cast<int>(wakefulness));
}

std::string WakeLockLevelToString(WakeLockLevel level) {
  switch (level) {
    case WakeLockLevel::kPartial:
      return "PARTIAL_WAKE_LOCK";
    case WakeLockLevel::kScreenDim:
      return "SCREEN_DIM_WAKE_LOCK";
    case WakeLockLevel::kScreenBright:
      return "SCREEN_BRIGHT_WAKE_LOCK";
    case WakeLockLevel::kFull:
      return "FULL_WAKE_LOCK";
    case WakeLockLevel::kProximityScreenOff:
      return "PROXIMITY_SCREEN_OFF_WAKE_LOCK";
  }
  return "???";
}

std::string ScreenStateToString(ScreenState state) {
  switch (state) {
    case ScreenState::kOff:
      return "OFF";
    case ScreenState::kDim:
      return "DIM";
    case ScreenState::kBright:
      return "BRIGHT";
  }
  return base::NumberToString(static_cast<int>(state));
}

std::string GoToSleepReasonToString(GoToSleepReason reason) {
  switch (reason) {
    case GoToSleepReason::kUser:
      return "user";
    case GoToSleepReason::kDeviceAdmin:
      return "device_admin";
    case GoToSleepReason::kTimeout:
      return "timeout";
  }
  return base::NumberToString(static_cast<int>(reason));
}

bool IsValidWakeLockLevel(uint32_t level) {
  switch (static_cast<WakeLockLevel>(level)) {
    case WakeLockLevel::kPartial:
    case WakeLockLevel::kScreenDim:
    case WakeLockLevel::kScreenBright:
    case WakeLockLevel::kFull:
    case WakeLockLevel::kProximityScreenOff:
      return true;
  }
  return false;
}

}  // namespace power_manager
