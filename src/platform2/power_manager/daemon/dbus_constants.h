// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_DAEMON_DBUS_CONSTANTS_H_
#define POWER_MANAGER_DAEMON_DBUS_CONSTANTS_H_

namespace power_manager {

inline constexpr char kPowerManagerServiceName[] = "org.chromium.PowerManager";
inline constexpr char kPowerManagerServicePath[] = "/org/chromium/PowerManager";
inline constexpr char kPowerManagerInterface[] = "org.chromium.PowerManager";

// Methods.
inline constexpr char kAcquireWakeLockMethod[] = "AcquireWakeLock";
inline constexpr char kReleaseWakeLockMethod[] = "ReleaseWakeLock";
inline constexpr char kUpdateWakeLockWorkSourceMethod[] =
    "UpdateWakeLockWorkSource";
inline constexpr char kIsWakeLockLevelSupportedMethod[] =
    "IsWakeLockLevelSupported";
inline constexpr char kUpdateBlockedUidsMethod[] = "UpdateBlockedUids";
inline constexpr char kUserActivityMethod[] = "UserActivity";
inline constexpr char kWakeUpMethod[] = "WakeUp";
inline constexpr char kWakeUpWithProximityCheckMethod[] =
    "WakeUpWithProximityCheck";
inline constexpr char kGoToSleepMethod[] = "GoToSleep";
inline constexpr char kNapMethod[] = "Nap";
inline constexpr char kIsScreenOnMethod[] = "IsScreenOn";
inline constexpr char kGetWakefulnessMethod[] = "GetWakefulness";
inline constexpr char kTimeSinceScreenWasLastOnMethod[] =
    "TimeSinceScreenWasLastOn";
inline constexpr char kBootCompletedMethod[] = "BootCompleted";
inline constexpr char kSetStayOnSettingMethod[] = "SetStayOnSetting";
inline constexpr char kSetMaximumScreenOffTimeoutFromDeviceAdminMethod[] =
    "SetMaximumScreenOffTimeoutFromDeviceAdmin";
inline constexpr char kSetScreenBrightnessOverrideFromWindowManagerMethod[] =
    "SetScreenBrightnessOverrideFromWindowManager";
inline constexpr char kSetButtonBrightnessOverrideFromWindowManagerMethod[] =
    "SetButtonBrightnessOverrideFromWindowManager";
inline constexpr char kSetUserActivityTimeoutOverrideFromWindowManagerMethod[] =
    "SetUserActivityTimeoutOverrideFromWindowManager";
inline constexpr char kSetTemporaryScreenBrightnessSettingOverrideMethod[] =
    "SetTemporaryScreenBrightnessSettingOverride";
inline constexpr char
    kSetTemporaryScreenAutoBrightnessAdjustmentSettingOverrideMethod[] =
        "SetTemporaryScreenAutoBrightnessAdjustmentSettingOverride";
inline constexpr char kSetKeyboardVisibilityMethod[] = "SetKeyboardVisibility";
inline constexpr char kSetAttentionLightMethod[] = "SetAttentionLight";
inline constexpr char kSetKeyboardLightMethod[] = "SetKeyboardLight";
inline constexpr char kBlockScreenOnMethod[] = "BlockScreenOn";
inline constexpr char kUnblockScreenOnMethod[] = "UnblockScreenOn";
inline constexpr char kSetDockStateMethod[] = "SetDockState";
inline constexpr char kDreamStateChangedMethod[] = "DreamStateChanged";
inline constexpr char kUserSwitchedMethod[] = "UserSwitched";
inline constexpr char kDumpMethod[] = "Dump";

// Signals.
inline constexpr char kWakeLockAcquiredSignal[] = "WakeLockAcquired";
inline constexpr char kWakeLockReleasedSignal[] = "WakeLockReleased";
inline constexpr char kUserActivitySignal[] = "UserActivity";
inline constexpr char kWakeUpStartedSignal[] = "WakeUpStarted";
inline constexpr char kWakeUpFinishedSignal[] = "WakeUpFinished";
inline constexpr char kGoToSleepStartedSignal[] = "GoToSleepStarted";
inline constexpr char kGoToSleepFinishedSignal[] = "GoToSleepFinished";
inline constexpr char kSleepRequestedSignal[] = "SleepRequested";
inline constexpr char kWirelessChargingStartedSignal[] =
    "WirelessChargingStarted";

}  // namespace power_manager

#endif  // POWER_MANAGER_DAEMON_DBUS_CONSTANTS_H_
