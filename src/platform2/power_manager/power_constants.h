// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_POWER_CONSTANTS_H_
#define POWER_MANAGER_POWER_CONSTANTS_H_

#include <stdint.h>

#include <string>

#include <base/time/time.h>

namespace power_manager {

// Top-level power state of the device.
enum class Wakefulness {
  // The device is asleep and can only be awoken by a call to WakeUp().
  // The screen should be off or in the process of being turned off.
  kAsleep = 0,
  // The device is fully awake and the screen is on or dim.
  kAwake = 1,
  // The device is napping. A dream should be started or is about to start.
  // Napping ends when the dream host reports in; the device then dreams,
  // goes to sleep or wakes up.
  kNapping = 2,
  // The device is dreaming. Dreaming ends when the dream host stops the
  // dream or the device wakes up or goes to sleep.
  kDreaming = 3,
};

// Wake lock levels. The numeric values are part of the D-Bus API.
enum class WakeLockLevel {
  kPartial = 0x00000001,
  kScreenDim = 0x00000006,
  kScreenBright = 0x0000000a,
  kFull = 0x0000001a,
  kProximityScreenOff = 0x00000020,
};

// Flags that may be OR-ed into the acquire flags of a wake lock.
inline constexpr uint32_t kWakeLockLevelMask = 0x0000ffff;
inline constexpr uint32_t kAcquireCausesWakeup = 0x10000000;
inline constexpr uint32_t kOnAfterRelease = 0x20000000;

// Flag passed to ReleaseWakeLock().
inline constexpr uint32_t kWaitForProximityNegative = 1 << 0;

// Flag passed to UserActivity() for activity that must not brighten the
// screen or buttons.
inline constexpr uint32_t kUserActivityFlagNoChangeLights = 1 << 0;

enum class UserActivityEvent {
  kOther = 0,
  kButton = 1,
  kTouch = 2,
};

enum class GoToSleepReason {
  kUser = 0,
  kDeviceAdmin = 1,
  kTimeout = 2,
};

// Screen state requested from the display sink.
enum class ScreenState {
  kOff = 0,
  kDim = 1,
  kBright = 2,
};

// Power source bits reported by the battery source. The stay-on-while-plugged
// setting is a mask of these.
inline constexpr int kPlugTypeNone = 0;
inline constexpr int kPlugTypeAc = 1 << 0;
inline constexpr int kPlugTypeUsb = 1 << 1;
inline constexpr int kPlugTypeWireless = 1 << 2;
inline constexpr int kPlugTypeAny =
    kPlugTypeAc | kPlugTypeUsb | kPlugTypeWireless;

enum class DockState {
  kUndocked = 0,
  kDesk = 1,
  kCar = 2,
  kLowEndDesk = 3,
  kHighEndDesk = 4,
};

// Summary bits describing the effect of all held wake locks.
inline constexpr int kWakeLockCpu = 1 << 0;
inline constexpr int kWakeLockScreenBright = 1 << 1;
inline constexpr int kWakeLockScreenDim = 1 << 2;
inline constexpr int kWakeLockButtonBright = 1 << 3;
inline constexpr int kWakeLockProximityScreenOff = 1 << 4;
// Only set while the device is awake.
inline constexpr int kWakeLockStayAwake = 1 << 5;

// Summary bits describing the user activity schedule.
inline constexpr int kUserActivityScreenBright = 1 << 0;
inline constexpr int kUserActivityScreenDim = 1 << 1;

// Default and minimum screen off timeout.
inline constexpr base::TimeDelta kDefaultScreenOffTimeout =
    base::Milliseconds(15 * 1000);
inline constexpr base::TimeDelta kMinimumScreenOffTimeout =
    base::Milliseconds(10 * 1000);

// The screen dims this long before it turns off, unless the screen off
// timeout is so short that the dim period would exceed
// |kMaximumScreenDimRatio| of it.
inline constexpr base::TimeDelta kScreenDimDuration =
    base::Milliseconds(7 * 1000);
inline constexpr float kMaximumScreenDimRatio = 0.2f;

inline constexpr base::TimeDelta kDefaultButtonOnDuration =
    base::Milliseconds(5 * 1000);

// How often to check whether the boot animation has exited.
inline constexpr base::TimeDelta kBootAnimationPollInterval =
    base::Milliseconds(200);

// How long a proximity-checked wake-up waits for a sensor reading before
// waking up anyway.
inline constexpr base::TimeDelta kDefaultProximityCheckTimeout =
    base::Milliseconds(250);

// Keys accepted by SetKeyboardLight().
inline constexpr int kKeyboardLightCaps = 1;
inline constexpr int kKeyboardLightFunc = 2;

// Stop dreaming once the battery has drained this many percentage points
// below its level when the dream started, unless something else keeps the
// device awake.
inline constexpr int kDreamBatteryLevelDrainCutoff = 5;

// Upper bound on iterations of the wakefulness fixed-point loop.
inline constexpr int kMaxWakefulnessIterations = 100;

// Brightness values are in the range [0, 255].
inline constexpr int kMaxBrightness = 255;

// Uid that activity and wake-ups originating in the power manager itself are
// attributed to.
inline constexpr int kSystemUid = 1000;

std::string WakefulnessToString(Wakefulness wakefulness);
std::string WakeLockLevelToString(WakeLockLevel level);
std::string ScreenStateToString(ScreenState state);
std::string GoToSleepReasonToString(GoToSleepReason reason);

// Returns true if |level| is one of the WakeLockLevel values.
bool IsValidWakeLockLevel(uint32_t level);

}  // namespace power_manager

#endif  // POWER_MANAGER_POWER_CONSTANTS_H_
