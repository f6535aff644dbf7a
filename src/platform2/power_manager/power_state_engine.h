// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_POWER_STATE_ENGINE_H_
#define POWER_MANAGER_POWER_STATE_ENGINE_H_

#include <stdint.h>

#include <memory>
#include <string>

#include <base/cancelable_callback.h>
#include <base/functional/callback.h>
#include <base/memory/scoped_refptr.h>
#include <base/synchronization/lock.h>
#include <base/task/sequenced_task_runner.h>
#include <base/thread_annotations.h>
#include <base/time/tick_clock.h>
#include <base/time/time.h>
#include <brillo/errors/error.h>
#include <cros_config/cros_config_interface.h>

#include "power_manager/activity_timer.h"
#include "power_manager/battery_source_interface.h"
#include "power_manager/boot_animation_monitor_interface.h"
#include "power_manager/display_blanker.h"
#include "power_manager/display_sink_interface.h"
#include "power_manager/dream_host_interface.h"
#include "power_manager/dream_scheduler.h"
#include "power_manager/engine_state.h"
#include "power_manager/lights_interface.h"
#include "power_manager/notifier.h"
#include "power_manager/power_config.h"
#include "power_manager/screen_on_gate.h"
#include "power_manager/settings_source_interface.h"
#include "power_manager/suspend_inhibitor.h"
#include "power_manager/wake_lock.h"
#include "power_manager/wake_lock_table.h"
#include "power_manager/wireless_charger_detector.h"

namespace power_manager {

// Identifies the process behind a wake-up request.
struct CallerIdentity {
  int uid = 0;
  int pid = 0;
  std::string package_name;
};

// Decides wakefulness, screen state and suspend inhibitors from wake locks,
// user activity, the power supply, sensors, settings and overrides.
//
// Public methods may be called from any thread. All state lives in an
// EngineState guarded by a single lock; every entry point that changes it
// marks the affected DirtyFlags and runs UpdatePowerStateLocked() before
// returning, so callers always observe fully recomputed state. Slow or
// re-entrant call-outs (dream host, lights, boot animation polling) are
// posted to the worker task runner and run without the lock.
//
// The worker must be stopped before the engine is destroyed.
class PowerStateEngine : public DisplaySinkInterface::Delegate,
                         public DreamScheduler::Delegate {
 public:
  // Objects the engine talks to. None are owned; all must outlive it.
  struct Collaborators {
    // Per-model configuration. May be null.
    brillo::CrosConfigInterface* cros_config = nullptr;
    scoped_refptr<base::SequencedTaskRunner> task_runner;
    const base::TickClock* clock = nullptr;
    DisplaySinkInterface* display_sink = nullptr;
    // May be null.
    DisplayBlanker* display_blanker = nullptr;
    // May be null on devices without dreams.
    DreamHostInterface* dream_host = nullptr;
    BatterySourceInterface* battery = nullptr;
    SettingsSourceInterface* settings = nullptr;
    // May be null on devices without controllable lights.
    LightsInterface* lights = nullptr;
    BootAnimationMonitorInterface* boot_animation_monitor = nullptr;
    SuspendInhibitorBackend* suspend_backend = nullptr;
    Notifier* notifier = nullptr;
  };

  // Returns true if an explicit wake-up from |caller| should be ignored.
  using WakeSuppressionPredicate =
      base::RepeatingCallback<bool(const CallerIdentity& caller)>;

  // Returns true if plugging or unplugging power should not wake the device.
  // Runs with the engine lock held and must not call back into the engine.
  using PowerChangeWakeSuppressionPredicate = base::RepeatingCallback<bool()>;

  static constexpr char kWakeLockInhibitorName[] = "PowerManager.WakeLocks";
  static constexpr char kDisplayInhibitorName[] = "PowerManager.Display";

  explicit PowerStateEngine(const Collaborators& collaborators);
  PowerStateEngine(const PowerStateEngine&) = delete;
  PowerStateEngine& operator=(const PowerStateEngine&) = delete;

  ~PowerStateEngine() override;

  // Creates the suspend inhibitors and screen-on gate and forces the display
  // on so that it starts in a known state. Must be called first.
  void Init();

  // Reads configuration and settings and performs the first update. Fails
  // with InvalidState if called before Init() or more than once.
  bool SystemReady(brillo::ErrorPtr* error);

  // Starts watching for the boot animation to exit. Fails with InvalidState
  // before SystemReady().
  bool OnBootCompleted(brillo::ErrorPtr* error);

  void SetWakeSuppressionPredicate(WakeSuppressionPredicate predicate);
  void SetPowerChangeWakeSuppressionPredicate(
      PowerChangeWakeSuppressionPredicate predicate);

  // Wake locks.
  bool AcquireWakeLock(const WakeLockRequest& request,
                       std::unique_ptr<OwnerLiveness> liveness,
                       brillo::ErrorPtr* error);
  // |flags| may contain kWaitForProximityNegative. Unknown handles are
  // ignored.
  bool ReleaseWakeLock(const std::string& handle,
                       uint32_t flags,
                       brillo::ErrorPtr* error);
  bool UpdateWakeLockWorkSource(const std::string& handle,
                                const WorkSource& work_source,
                                brillo::ErrorPtr* error);
  bool IsWakeLockLevelSupported(uint32_t level);
  void UpdateBlockedUids(int uid, bool blocked);

  // Transitions. Event times must not be in the future. Requests that don't
  // apply to the current state are ignored without error.
  bool UserActivity(base::TimeTicks event_time,
                    UserActivityEvent event,
                    uint32_t flags,
                    int uid,
                    brillo::ErrorPtr* error);
  bool WakeUp(base::TimeTicks event_time,
              const CallerIdentity& caller,
              brillo::ErrorPtr* error);
  // Wakes up only if the proximity sensor is not covered. While the reading
  // is pending the CPU is kept awake; if none arrives within the configured
  // timeout the device wakes up anyway. Behaves like WakeUp() when proximity
  // wake is unsupported, disabled or the device is already awake. A request
  // made while another check is pending is dropped.
  bool WakeUpWithProximityCheck(base::TimeTicks event_time,
                                const CallerIdentity& caller,
                                brillo::ErrorPtr* error);
  bool GoToSleep(base::TimeTicks event_time,
                 GoToSleepReason reason,
                 brillo::ErrorPtr* error);
  bool Nap(base::TimeTicks event_time, brillo::ErrorPtr* error);

  // Settings and overrides.
  bool SetStayOnSetting(int plug_type_mask, brillo::ErrorPtr* error);
  void SetMaximumScreenOffTimeoutFromDeviceAdmin(int64_t timeout_ms);
  void SetScreenBrightnessOverrideFromWindowManager(int brightness);
  void SetButtonBrightnessOverrideFromWindowManager(int brightness);
  void SetUserActivityTimeoutOverrideFromWindowManager(int64_t timeout_ms);
  void SetTemporaryScreenBrightnessSettingOverride(int brightness);
  void SetTemporaryScreenAutoBrightnessAdjustmentSettingOverride(float adj);
  void SetKeyboardVisibility(bool visible);
  void SetAttentionLight(bool on, uint32_t color);
  // Turns the Caps Lock (|key| == kKeyboardLightCaps) or Fn Lock
  // (kKeyboardLightFunc) LED on or off.
  bool SetKeyboardLight(bool on, int key, brillo::ErrorPtr* error);

  // Screen-on gate, held while something must finish drawing before the
  // screen may turn on.
  void BlockScreenOn();
  void UnblockScreenOn();

  // External signals.
  void OnBatteryChanged();
  void OnSettingsChanged();
  void OnUserSwitched();
  void OnDockStateChanged(DockState dock_state);
  void OnDreamStateChanged();

  // Queries.
  bool IsScreenOn();
  Wakefulness GetWakefulness();
  base::TimeDelta TimeSinceScreenWasLastOn();
  DisplayPowerRequest GetDisplayPowerRequest();
  std::string Dump();

  // DisplaySinkInterface::Delegate:
  void OnDisplayStateChanged() override;
  void OnProximityPositive() override;
  void OnProximityNegative() override;

  // DreamScheduler::Delegate:
  bool BeginDreamReconciliation() override;
  bool FinishDreamReconciliation(bool is_dreaming) override;

  // Accessors for tests.
  SuspendInhibitor* wake_lock_inhibitor_for_testing() {
    return wake_lock_inhibitor_.get();
  }
  SuspendInhibitor* display_inhibitor_for_testing() {
    return display_inhibitor_.get();
  }
  int GetWakeLockSummaryForTesting();
  int GetUserActivitySummaryForTesting();
  // Largest number of passes the wakefulness loop has needed to settle.
  int GetMaxWakefulnessIterationsForTesting();

 private:
  // Returns false and fills |error| if |event_time| is in the future.
  bool CheckEventTime(base::TimeTicks event_time, brillo::ErrorPtr* error);

  // Runs the wake suppression predicate without the lock held.
  bool IsWakeUpSuppressed(const CallerIdentity& caller);

  // Transitions that mark state dirty without recomputing. Return true if
  // something changed.
  bool UserActivityNoUpdateLocked(base::TimeTicks event_time,
                                  UserActivityEvent event,
                                  uint32_t flags,
                                  int uid) EXCLUSIVE_LOCKS_REQUIRED(lock_);
  bool WakeUpNoUpdateLocked(base::TimeTicks event_time)
      EXCLUSIVE_LOCKS_REQUIRED(lock_);
  bool GoToSleepNoUpdateLocked(base::TimeTicks event_time,
                               GoToSleepReason reason)
      EXCLUSIVE_LOCKS_REQUIRED(lock_);
  bool NapNoUpdateLocked(base::TimeTicks event_time)
      EXCLUSIVE_LOCKS_REQUIRED(lock_);

  void ApplyWakeLockFlagsOnAcquireLocked(const WakeLock& wake_lock)
      EXCLUSIVE_LOCKS_REQUIRED(lock_);
  void ApplyWakeLockFlagsOnReleaseLocked(const WakeLock& wake_lock)
      EXCLUSIVE_LOCKS_REQUIRED(lock_);
  // Removes |handle| from the table and applies release side effects. Does
  // not recompute.
  bool RemoveWakeLockLocked(const std::string& handle, uint32_t flags)
      EXCLUSIVE_LOCKS_REQUIRED(lock_);
  void HandleWakeLockOwnerLost(const std::string& handle);

  void UpdateSettingsLocked(const PowerSettings& settings)
      EXCLUSIVE_LOCKS_REQUIRED(lock_);
  void HandleSettingsChanged();

  // The central update. Does nothing until the system is ready or while no
  // state is dirty.
  void UpdatePowerStateLocked() EXCLUSIVE_LOCKS_REQUIRED(lock_);
  void UpdateIsPoweredLocked(DirtyFlags dirty) EXCLUSIVE_LOCKS_REQUIRED(lock_);
  bool ShouldWakeUpWhenPluggedOrUnpluggedLocked(bool was_powered,
                                                int old_plug_type,
                                                bool docked_on_wireless_charger)
      EXCLUSIVE_LOCKS_REQUIRED(lock_);
  void UpdateStayOnLocked(DirtyFlags dirty) EXCLUSIVE_LOCKS_REQUIRED(lock_);
  void UpdateWakeLockSummaryLocked(DirtyFlags dirty)
      EXCLUSIVE_LOCKS_REQUIRED(lock_);
  void UpdateUserActivitySummaryLocked(base::TimeTicks now, DirtyFlags dirty)
      EXCLUSIVE_LOCKS_REQUIRED(lock_);
  bool UpdateWakefulnessLocked(DirtyFlags dirty)
      EXCLUSIVE_LOCKS_REQUIRED(lock_);
  void UpdateDreamLocked(DirtyFlags dirty) EXCLUSIVE_LOCKS_REQUIRED(lock_);
  void UpdateDisplayPowerStateLocked(DirtyFlags dirty)
      EXCLUSIVE_LOCKS_REQUIRED(lock_);
  void UpdateSuspendInhibitorsLocked() EXCLUSIVE_LOCKS_REQUIRED(lock_);
  void SendPendingNotificationsLocked() EXCLUSIVE_LOCKS_REQUIRED(lock_);

  base::TimeDelta GetScreenOffTimeoutLocked() const
      EXCLUSIVE_LOCKS_REQUIRED(lock_);
  bool IsMaximumScreenOffTimeoutFromDeviceAdminEnforcedLocked() const
      EXCLUSIVE_LOCKS_REQUIRED(lock_);
  bool ShouldNapAtBedTimeLocked() const EXCLUSIVE_LOCKS_REQUIRED(lock_);
  bool IsItBedTimeYetLocked() const EXCLUSIVE_LOCKS_REQUIRED(lock_);
  bool IsBeingKeptAwakeLocked() const EXCLUSIVE_LOCKS_REQUIRED(lock_);
  bool CanDreamLocked() const EXCLUSIVE_LOCKS_REQUIRED(lock_);
  bool NeedDisplaySuspendInhibitorLocked() const
      EXCLUSIVE_LOCKS_REQUIRED(lock_);
  ScreenState GetDesiredScreenStateLocked() const
      EXCLUSIVE_LOCKS_REQUIRED(lock_);
  void ScheduleSandmanLocked() EXCLUSIVE_LOCKS_REQUIRED(lock_);
  void HandleDreamFinishedLocked() EXCLUSIVE_LOCKS_REQUIRED(lock_);
  void HandleBootCompletedLocked() EXCLUSIVE_LOCKS_REQUIRED(lock_);
  // Ends the pending proximity check and wakes up if |wake_up| is set.
  void FinishProximityCheckLocked(bool wake_up) EXCLUSIVE_LOCKS_REQUIRED(lock_);
  // Asks the worker to re-arm the user activity timeout for
  // |state_.user_activity_timeout_time|.
  void ScheduleUserActivityTimeoutLocked() EXCLUSIVE_LOCKS_REQUIRED(lock_);

  // Posts a change of |id| to |brightness| if it differs from |*current|.
  void SetLightBrightnessLocked(LightId id, int brightness, int* current)
      EXCLUSIVE_LOCKS_REQUIRED(lock_);
  void ApplyLightBrightness(LightId id, int brightness);

  // Worker-sequence tasks.
  void RearmUserActivityTimeout();
  void HandleUserActivityTimeout();
  void StartProximityCheckTimeout(base::TimeDelta timeout);
  void CancelProximityCheckTimeout();
  void HandleProximityCheckTimeout();
  void OnScreenOnGateReleased();
  void HandleScreenOnGateReleased();
  void CheckIfBootAnimationFinished();

  const Collaborators collaborators_;
  const scoped_refptr<base::SequencedTaskRunner> task_runner_;
  const base::TickClock* clock_;

  WakeSuppressionPredicate wake_suppression_predicate_;

  // Only touched on the worker sequence.
  base::CancelableOnceClosure user_activity_timeout_callback_;
  base::CancelableOnceClosure proximity_check_timeout_callback_;

  std::unique_ptr<SuspendInhibitor> wake_lock_inhibitor_;
  std::unique_ptr<SuspendInhibitor> display_inhibitor_;
  std::unique_ptr<ScreenOnGate> screen_on_gate_;
  DreamScheduler dream_scheduler_;

  base::Lock lock_;
  bool initialized_ GUARDED_BY(lock_) = false;
  // Set while CheckIfBootAnimationFinished() is posted or scheduled.
  bool boot_animation_polling_ GUARDED_BY(lock_) = false;
  int max_wakefulness_iterations_ GUARDED_BY(lock_) = 0;
  PowerChangeWakeSuppressionPredicate power_change_wake_suppression_predicate_
      GUARDED_BY(lock_);
  PowerConfig config_ GUARDED_BY(lock_);
  EngineState state_ GUARDED_BY(lock_);
  WakeLockTable wake_locks_ GUARDED_BY(lock_);
  ActivityTimer activity_timer_ GUARDED_BY(lock_);
  WirelessChargerDetector wireless_charger_detector_ GUARDED_BY(lock_);
};

}  // namespace power_manager

#endif  // POWER_MANAGER_POWER_STATE_ENGINE_H_
