// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/power_state_engine.h"

#include <inttypes.h>

#include <algorithm>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

#include <base/check.h>
#include <base/functional/bind.h>
#include <base/location.h>
#include <base/logging.h>
#include <base/strings/string_number_conversions.h>
#include <base/strings/stringprintf.h>

#include "power_manager/power_error.h"

namespace power_manager {

namespace {

// Categories that can change the wakefulness.
constexpr DirtyFlags kWakefulnessInputs(
    DirtyFlag::kWakeLocks,        DirtyFlag::kUserActivity,
    DirtyFlag::kBootCompleted,    DirtyFlag::kWakefulness,
    DirtyFlag::kStayOn,           DirtyFlag::kProximityPositive,
    DirtyFlag::kDockState);

// Categories that can change whether a dream should run.
constexpr DirtyFlags kDreamInputs(
    DirtyFlag::kWakefulness,   DirtyFlag::kUserActivity,
    DirtyFlag::kWakeLocks,     DirtyFlag::kBootCompleted,
    DirtyFlag::kSettings,      DirtyFlag::kIsPowered,
    DirtyFlag::kStayOn,        DirtyFlag::kProximityPositive,
    DirtyFlag::kBatteryState);

// Categories that can change the display power request.
constexpr DirtyFlags kDisplayInputs(
    DirtyFlag::kWakeLocks,           DirtyFlag::kUserActivity,
    DirtyFlag::kWakefulness,         DirtyFlag::kDisplayStateUpdated,
    DirtyFlag::kBootCompleted,       DirtyFlag::kSettings,
    DirtyFlag::kScreenOnGateReleased, DirtyFlag::kProximityCheck);

constexpr uint32_t kKnownWakeLockFlags =
    kWakeLockLevelMask | kAcquireCausesWakeup | kOnAfterRelease;

bool IsValidBrightness(int value) {
  return value >= 0 && value <= kMaxBrightness;
}

// False for NaN.
bool IsValidAutoBrightnessAdjustment(float value) {
  return value >= -1.0f && value <= 1.0f;
}

int64_t ToMs(base::TimeTicks time) {
  return (time - base::TimeTicks()).InMilliseconds();
}

}  // namespace

PowerStateEngine::PowerStateEngine(const Collaborators& collaborators)
    : collaborators_(collaborators),
      task_runner_(collaborators.task_runner),
      clock_(collaborators.clock),
      dream_scheduler_(this, collaborators.dream_host, task_runner_),
      wake_locks_(collaborators.notifier) {
  CHECK(task_runner_);
  CHECK(clock_);
  CHECK(collaborators_.display_sink);
  CHECK(collaborators_.battery);
  CHECK(collaborators_.settings);
  CHECK(collaborators_.boot_animation_monitor);
  CHECK(collaborators_.suspend_backend);
  CHECK(collaborators_.notifier);
}

PowerStateEngine::~PowerStateEngine() {
  collaborators_.display_sink->SetDelegate(nullptr);
}

void PowerStateEngine::Init() {
  base::AutoLock lock(lock_);
  CHECK(!initialized_) << "Init() called twice";

  wake_lock_inhibitor_ = std::make_unique<SuspendInhibitor>(
      kWakeLockInhibitorName, collaborators_.suspend_backend);
  display_inhibitor_ = std::make_unique<SuspendInhibitor>(
      kDisplayInhibitorName, collaborators_.suspend_backend);
  // The display starts out on, so keep the system up until the first
  // update says otherwise.
  display_inhibitor_->Acquire();
  state_.holding_display_inhibitor = true;

  screen_on_gate_ = std::make_unique<ScreenOnGate>(base::BindRepeating(
      &PowerStateEngine::OnScreenOnGateReleased, base::Unretained(this)));

  state_.wakefulness = Wakefulness::kAwake;
  collaborators_.display_sink->SetDelegate(this);
  if (collaborators_.display_blanker)
    collaborators_.display_blanker->UnblankAllDisplays();

  initialized_ = true;
}

bool PowerStateEngine::SystemReady(brillo::ErrorPtr* error) {
  // Read everything that may touch the disk before taking the lock.
  const PowerConfig config = LoadPowerConfig(collaborators_.cros_config);
  const PowerSettings settings =
      ReadPowerSettings(*collaborators_.settings, config);

  base::AutoLock lock(lock_);
  if (!initialized_) {
    return SetError(FROM_HERE, error, kErrorInvalidState,
                    "SystemReady() called before Init()");
  }
  if (state_.system_ready) {
    return SetError(FROM_HERE, error, kErrorInvalidState,
                    "SystemReady() called twice");
  }

  LOG(INFO) << "System ready: " << config.ToString();
  state_.system_ready = true;
  config_ = config;
  wake_locks_.set_notifications_enabled(true);
  UpdateSettingsLocked(settings);
  state_.dirty.Put(DirtyFlag::kBatteryState);
  UpdatePowerStateLocked();
  return true;
}

bool PowerStateEngine::OnBootCompleted(brillo::ErrorPtr* error) {
  {
    base::AutoLock lock(lock_);
    if (!state_.system_ready) {
      return SetError(FROM_HERE, error, kErrorInvalidState,
                      "Boot completed before the system was ready");
    }
    if (state_.boot_completed || boot_animation_polling_)
      return true;
    boot_animation_polling_ = true;
  }
  LOG(INFO) << "Boot completed; waiting for boot animation to exit";
  task_runner_->PostTask(
      FROM_HERE, base::BindOnce(&PowerStateEngine::CheckIfBootAnimationFinished,
                                base::Unretained(this)));
  return true;
}

void PowerStateEngine::SetWakeSuppressionPredicate(
    WakeSuppressionPredicate predicate) {
  base::AutoLock lock(lock_);
  wake_suppression_predicate_ = std::move(predicate);
}

void PowerStateEngine::SetPowerChangeWakeSuppressionPredicate(
    PowerChangeWakeSuppressionPredicate predicate) {
  base::AutoLock lock(lock_);
  power_change_wake_suppression_predicate_ = std::move(predicate);
}

bool PowerStateEngine::AcquireWakeLock(const WakeLockRequest& request,
                                       std::unique_ptr<OwnerLiveness> liveness,
                                       brillo::ErrorPtr* error) {
  if (request.handle.empty()) {
    return SetError(FROM_HERE, error, kErrorInvalidArgument,
                    "Wake lock handle must not be empty");
  }
  if (!IsValidWakeLockLevel(request.flags & kWakeLockLevelMask)) {
    return SetError(FROM_HERE, error, kErrorInvalidArgument,
                    base::StringPrintf("Invalid wake lock level 0x%x",
                                       request.flags & kWakeLockLevelMask));
  }
  if (request.flags & ~kKnownWakeLockFlags) {
    return SetError(
        FROM_HERE, error, kErrorInvalidArgument,
        base::StringPrintf("Unknown wake lock flags 0x%x",
                           request.flags & ~kKnownWakeLockFlags));
  }

  base::AutoLock lock(lock_);
  VLOG(1) << "AcquireWakeLock: handle=" << request.handle << " flags=0x"
          << std::hex << request.flags << std::dec << " tag=\"" << request.tag
          << "\" ws=" << request.work_source.ToString()
          << " uid=" << request.uid << " pid=" << request.pid;

  WakeLockTable::AcquireResult result;
  if (!wake_locks_.Acquire(
          request, std::move(liveness),
          base::BindOnce(&PowerStateEngine::HandleWakeLockOwnerLost,
                         base::Unretained(this), request.handle),
          &result, error)) {
    return false;
  }
  if (result == WakeLockTable::AcquireResult::kBlocked)
    return true;

  const WakeLock* wake_lock = wake_locks_.FindByHandle(request.handle);
  DCHECK(wake_lock);
  ApplyWakeLockFlagsOnAcquireLocked(*wake_lock);
  if (result != WakeLockTable::AcquireResult::kUnchanged)
    state_.dirty.Put(DirtyFlag::kWakeLocks);
  UpdatePowerStateLocked();
  return true;
}

bool PowerStateEngine::ReleaseWakeLock(const std::string& handle,
                                       uint32_t flags,
                                       brillo::ErrorPtr* error) {
  if (handle.empty()) {
    return SetError(FROM_HERE, error, kErrorInvalidArgument,
                    "Wake lock handle must not be empty");
  }

  base::AutoLock lock(lock_);
  if (!RemoveWakeLockLocked(handle, flags)) {
    VLOG(1) << "ReleaseWakeLock: " << handle << " not found";
    return true;
  }
  UpdatePowerStateLocked();
  return true;
}

bool PowerStateEngine::UpdateWakeLockWorkSource(const std::string& handle,
                                                const WorkSource& work_source,
                                                brillo::ErrorPtr* error) {
  base::AutoLock lock(lock_);
  VLOG(1) << "UpdateWakeLockWorkSource: handle=" << handle
          << " ws=" << work_source.ToString();
  return wake_locks_.UpdateWorkSource(handle, work_source, nullptr, error);
}

bool PowerStateEngine::IsWakeLockLevelSupported(uint32_t level) {
  base::AutoLock lock(lock_);
  if (!IsValidWakeLockLevel(level))
    return false;
  switch (static_cast<WakeLockLevel>(level)) {
    case WakeLockLevel::kPartial:
    case WakeLockLevel::kScreenDim:
    case WakeLockLevel::kScreenBright:
    case WakeLockLevel::kFull:
      return true;
    case WakeLockLevel::kProximityScreenOff:
      return state_.system_ready &&
             collaborators_.display_sink->IsProximitySensorAvailable();
  }
  return false;
}

void PowerStateEngine::UpdateBlockedUids(int uid, bool blocked) {
  base::AutoLock lock(lock_);
  VLOG(1) << "UpdateBlockedUids: uid=" << uid << " blocked=" << blocked;
  if (!blocked) {
    wake_locks_.UnblockUid(uid);
    return;
  }

  for (const std::string& handle : wake_locks_.BlockUid(uid)) {
    const WakeLock* wake_lock = wake_locks_.FindByHandle(handle);
    if (!wake_lock)
      continue;
    LOG(INFO) << "Releasing wake lock \"" << wake_lock->tag
              << "\" for blocked uid " << uid;
    RemoveWakeLockLocked(handle, 0);
  }
  UpdatePowerStateLocked();
}

bool PowerStateEngine::UserActivity(base::TimeTicks event_time,
                                    UserActivityEvent event,
                                    uint32_t flags,
                                    int uid,
                                    brillo::ErrorPtr* error) {
  if (!CheckEventTime(event_time, error))
    return false;

  base::AutoLock lock(lock_);
  if (UserActivityNoUpdateLocked(event_time, event, flags, uid))
    UpdatePowerStateLocked();
  return true;
}

bool PowerStateEngine::WakeUp(base::TimeTicks event_time,
                              const CallerIdentity& caller,
                              brillo::ErrorPtr* error) {
  if (!CheckEventTime(event_time, error))
    return false;
  if (IsWakeUpSuppressed(caller))
    return true;

  base::AutoLock lock(lock_);
  if (WakeUpNoUpdateLocked(event_time))
    UpdatePowerStateLocked();
  return true;
}

bool PowerStateEngine::WakeUpWithProximityCheck(base::TimeTicks event_time,
                                                const CallerIdentity& caller,
                                                brillo::ErrorPtr* error) {
  if (!CheckEventTime(event_time, error))
    return false;
  if (IsWakeUpSuppressed(caller))
    return true;

  base::AutoLock lock(lock_);
  if (state_.proximity_check_pending) {
    VLOG(1) << "Proximity check already in progress; dropping wake-up from uid "
            << caller.uid;
    return true;
  }
  if (!config_.proximity_wake_supported ||
      !state_.settings.proximity_wake_enabled ||
      state_.wakefulness == Wakefulness::kAwake ||
      !collaborators_.display_sink->IsProximitySensorAvailable()) {
    if (WakeUpNoUpdateLocked(event_time))
      UpdatePowerStateLocked();
    return true;
  }

  LOG(INFO) << "Checking proximity before waking up for uid " << caller.uid;
  state_.proximity_check_pending = true;
  state_.proximity_check_event_time = event_time;
  state_.dirty.Put(DirtyFlag::kProximityCheck);
  UpdatePowerStateLocked();
  task_runner_->PostTask(
      FROM_HERE, base::BindOnce(&PowerStateEngine::StartProximityCheckTimeout,
                                base::Unretained(this),
                                config_.proximity_check_timeout));
  return true;
}

bool PowerStateEngine::GoToSleep(base::TimeTicks event_time,
                                 GoToSleepReason reason,
                                 brillo::ErrorPtr* error) {
  if (!CheckEventTime(event_time, error))
    return false;

  base::AutoLock lock(lock_);
  if (GoToSleepNoUpdateLocked(event_time, reason))
    UpdatePowerStateLocked();
  return true;
}

bool PowerStateEngine::Nap(base::TimeTicks event_time,
                           brillo::ErrorPtr* error) {
  if (!CheckEventTime(event_time, error))
    return false;

  base::AutoLock lock(lock_);
  if (NapNoUpdateLocked(event_time))
    UpdatePowerStateLocked();
  return true;
}

bool PowerStateEngine::SetStayOnSetting(int plug_type_mask,
                                        brillo::ErrorPtr* error) {
  if (plug_type_mask & ~kPlugTypeAny) {
    return SetError(FROM_HERE, error, kErrorInvalidArgument,
                    base::StringPrintf("Invalid plug type mask 0x%x",
                                       plug_type_mask));
  }
  if (!collaborators_.settings->SetString(
          kStayOnWhilePluggedInSetting,
          base::NumberToString(plug_type_mask))) {
    return SetError(FROM_HERE, error, kErrorInvalidState,
                    "Failed to save stay-on-while-plugged-in setting");
  }
  HandleSettingsChanged();
  return true;
}

void PowerStateEngine::SetMaximumScreenOffTimeoutFromDeviceAdmin(
    int64_t timeout_ms) {
  base::AutoLock lock(lock_);
  state_.maximum_screen_off_timeout_from_device_admin_ms = timeout_ms;
  state_.dirty.Put(DirtyFlag::kSettings);
  UpdatePowerStateLocked();
}

void PowerStateEngine::SetScreenBrightnessOverrideFromWindowManager(
    int brightness) {
  base::AutoLock lock(lock_);
  if (state_.screen_brightness_override_from_window_manager != brightness) {
    state_.screen_brightness_override_from_window_manager = brightness;
    state_.dirty.Put(DirtyFlag::kSettings);
    UpdatePowerStateLocked();
  }
}

void PowerStateEngine::SetButtonBrightnessOverrideFromWindowManager(
    int brightness) {
  base::AutoLock lock(lock_);
  if (state_.button_brightness_override_from_window_manager != brightness) {
    state_.button_brightness_override_from_window_manager = brightness;
    state_.dirty.Put(DirtyFlag::kSettings);
    UpdatePowerStateLocked();
  }
}

void PowerStateEngine::SetUserActivityTimeoutOverrideFromWindowManager(
    int64_t timeout_ms) {
  base::AutoLock lock(lock_);
  if (state_.user_activity_timeout_override_from_window_manager_ms !=
      timeout_ms) {
    state_.user_activity_timeout_override_from_window_manager_ms = timeout_ms;
    state_.dirty.Put(DirtyFlag::kSettings);
    UpdatePowerStateLocked();
  }
}

void PowerStateEngine::SetTemporaryScreenBrightnessSettingOverride(
    int brightness) {
  base::AutoLock lock(lock_);
  if (state_.temporary_screen_brightness_setting_override != brightness) {
    state_.temporary_screen_brightness_setting_override = brightness;
    state_.dirty.Put(DirtyFlag::kSettings);
    UpdatePowerStateLocked();
  }
}

void PowerStateEngine::
    SetTemporaryScreenAutoBrightnessAdjustmentSettingOverride(float adj) {
  base::AutoLock lock(lock_);
  // NaN never compares equal, so replacing NaN with NaN still counts as a
  // change.
  if (state_.temporary_screen_auto_brightness_adjustment_setting_override !=
      adj) {
    state_.temporary_screen_auto_brightness_adjustment_setting_override = adj;
    state_.dirty.Put(DirtyFlag::kSettings);
    UpdatePowerStateLocked();
  }
}

void PowerStateEngine::SetKeyboardVisibility(bool visible) {
  base::AutoLock lock(lock_);
  VLOG(1) << "SetKeyboardVisibility: " << visible;
  if (state_.keyboard_visible == visible)
    return;
  state_.keyboard_visible = visible;
  if (!visible) {
    SetLightBrightnessLocked(LightId::kKeyboard, 0,
                             &state_.keyboard_light_brightness);
    SetLightBrightnessLocked(LightId::kCaps, 0, &state_.caps_light_brightness);
    SetLightBrightnessLocked(LightId::kFunc, 0, &state_.func_light_brightness);
  }
  state_.dirty.Put(DirtyFlag::kUserActivity);
  UpdatePowerStateLocked();
}

void PowerStateEngine::SetAttentionLight(bool on, uint32_t color) {
  {
    base::AutoLock lock(lock_);
    if (!state_.system_ready)
      return;
  }
  if (collaborators_.lights)
    collaborators_.lights->SetFlashing(LightId::kAttention, color, on);
}

bool PowerStateEngine::SetKeyboardLight(bool on,
                                        int key,
                                        brillo::ErrorPtr* error) {
  base::AutoLock lock(lock_);
  VLOG(1) << "SetKeyboardLight: key=" << key << " on=" << on;
  const int brightness = on ? kMaxBrightness : 0;
  switch (key) {
    case kKeyboardLightCaps:
      SetLightBrightnessLocked(LightId::kCaps, brightness,
                               &state_.caps_light_brightness);
      return true;
    case kKeyboardLightFunc:
      SetLightBrightnessLocked(LightId::kFunc, brightness,
                               &state_.func_light_brightness);
      return true;
  }
  return SetError(FROM_HERE, error, kErrorInvalidArgument,
                  base::StringPrintf("Unknown keyboard light %d", key));
}

void PowerStateEngine::BlockScreenOn() {
  screen_on_gate_->Acquire();
}

void PowerStateEngine::UnblockScreenOn() {
  screen_on_gate_->Release();
}

void PowerStateEngine::OnBatteryChanged() {
  base::AutoLock lock(lock_);
  state_.dirty.Put(DirtyFlag::kBatteryState);
  UpdatePowerStateLocked();
}

void PowerStateEngine::OnSettingsChanged() {
  HandleSettingsChanged();
}

void PowerStateEngine::OnUserSwitched() {
  LOG(INFO) << "User switched; rereading settings";
  HandleSettingsChanged();
}

void PowerStateEngine::OnDockStateChanged(DockState dock_state) {
  base::AutoLock lock(lock_);
  if (state_.dock_state != dock_state) {
    state_.dock_state = dock_state;
    state_.dirty.Put(DirtyFlag::kDockState);
    UpdatePowerStateLocked();
  }
}

void PowerStateEngine::OnDreamStateChanged() {
  base::AutoLock lock(lock_);
  ScheduleSandmanLocked();
}

bool PowerStateEngine::IsScreenOn() {
  base::AutoLock lock(lock_);
  return !state_.system_ready ||
         state_.display_power_request.screen_state != ScreenState::kOff;
}

Wakefulness PowerStateEngine::GetWakefulness() {
  base::AutoLock lock(lock_);
  return state_.wakefulness;
}

base::TimeDelta PowerStateEngine::TimeSinceScreenWasLastOn() {
  base::AutoLock lock(lock_);
  if (state_.display_power_request.screen_state != ScreenState::kOff)
    return base::TimeDelta();
  return clock_->NowTicks() - state_.last_screen_off_time;
}

DisplayPowerRequest PowerStateEngine::GetDisplayPowerRequest() {
  base::AutoLock lock(lock_);
  return state_.display_power_request;
}

std::string PowerStateEngine::Dump() {
  base::AutoLock lock(lock_);
  std::string out = "Power manager\n\n";
  out += "Power Manager State:\n";
  out += base::StringPrintf("  dirty=%s\n",
                            DirtyFlagsToString(state_.dirty).c_str());
  out += "  wakefulness=" + WakefulnessToString(state_.wakefulness) + "\n";
  out += base::StringPrintf(
      "  is_powered=%d (plug_type=%d, battery_level=%d, "
      "battery_level_when_dream_started=%d)\n",
      state_.is_powered, state_.plug_type, state_.battery_level,
      state_.battery_level_when_dream_started);
  out += base::StringPrintf("  dock_state=%d\n",
                            static_cast<int>(state_.dock_state));
  out += base::StringPrintf(
      "  stay_on=%d\n  proximity_positive=%d\n  keyboard_visible=%d\n",
      state_.stay_on, state_.proximity_positive, state_.keyboard_visible);
  out += base::StringPrintf("  boot_completed=%d\n  system_ready=%d\n",
                            state_.boot_completed, state_.system_ready);
  out += base::StringPrintf("  wake_lock_summary=0x%x\n",
                            state_.wake_lock_summary);
  out += base::StringPrintf("  user_activity_summary=0x%x\n",
                            state_.user_activity_summary);
  out += base::StringPrintf(
      "  request_wait_for_negative_proximity=%d\n  sandman_scheduled=%d\n",
      state_.request_wait_for_negative_proximity, state_.sandman_scheduled);
  out += base::StringPrintf("  proximity_check_pending=%d\n",
                            state_.proximity_check_pending);
  out += base::StringPrintf("  max_wakefulness_iterations=%d\n",
                            max_wakefulness_iterations_);
  out += "  " + activity_timer_.ToString() + "\n";
  out += base::StringPrintf("  last_screen_off_time=%" PRId64 " ms\n",
                            ToMs(state_.last_screen_off_time));
  out += base::StringPrintf(
      "  send_wake_up_finished_when_ready=%d\n"
      "  send_go_to_sleep_finished_when_ready=%d\n",
      state_.send_wake_up_finished_when_ready,
      state_.send_go_to_sleep_finished_when_ready);
  out += base::StringPrintf(
      "  display_ready=%d\n  holding_wake_lock_inhibitor=%d\n"
      "  holding_display_inhibitor=%d\n",
      state_.display_ready, state_.holding_wake_lock_inhibitor,
      state_.holding_display_inhibitor);
  out += "  display_power_request: " +
         state_.display_power_request.ToString() + "\n";
  out += "  wireless_charger_detector: " +
         wireless_charger_detector_.ToString() + "\n";

  out += "\nConfig:\n  " + config_.ToString() + "\n";
  out += "\nSettings and Configuration:\n  " + state_.settings.ToString() +
         "\n";
  out += base::StringPrintf(
      "  maximum_screen_off_timeout_from_device_admin=%" PRId64
      " ms (enforced=%d)\n",
      state_.maximum_screen_off_timeout_from_device_admin_ms,
      IsMaximumScreenOffTimeoutFromDeviceAdminEnforcedLocked());
  out += base::StringPrintf(
      "  screen_brightness_override_from_window_manager=%d\n"
      "  button_brightness_override_from_window_manager=%d\n"
      "  user_activity_timeout_override_from_window_manager=%" PRId64 " ms\n"
      "  temporary_screen_brightness_setting_override=%d\n"
      "  temporary_screen_auto_brightness_adjustment_setting_override=%.2f\n",
      state_.screen_brightness_override_from_window_manager,
      state_.button_brightness_override_from_window_manager,
      state_.user_activity_timeout_override_from_window_manager_ms,
      state_.temporary_screen_brightness_setting_override,
      state_.temporary_screen_auto_brightness_adjustment_setting_override);

  const base::TimeDelta screen_off_timeout = GetScreenOffTimeoutLocked();
  out += base::StringPrintf(
      "\nScreen off timeout: %" PRId64 " ms\nScreen dim duration: %" PRId64
      " ms\n",
      screen_off_timeout.InMilliseconds(),
      ActivityTimer::GetScreenDimDuration(screen_off_timeout)
          .InMilliseconds());

  out += base::StringPrintf("\nWake Locks: size=%zu\n", wake_locks_.size());
  for (const auto& wake_lock : wake_locks_.wake_locks())
    out += "  " + wake_lock->ToString() + "\n";

  out += "\nSuspend Inhibitors:\n";
  if (wake_lock_inhibitor_)
    out += "  " + wake_lock_inhibitor_->ToString() + "\n";
  if (display_inhibitor_)
    out += "  " + display_inhibitor_->ToString() + "\n";
  if (screen_on_gate_)
    out += "\n" + screen_on_gate_->ToString() + "\n";
  if (collaborators_.display_blanker)
    out += "\nDisplay blanker: " +
           collaborators_.display_blanker->ToString() + "\n";
  return out;
}

void PowerStateEngine::OnDisplayStateChanged() {
  base::AutoLock lock(lock_);
  state_.dirty.Put(DirtyFlag::kDisplayStateUpdated);
  UpdatePowerStateLocked();
}

void PowerStateEngine::OnProximityPositive() {
  base::AutoLock lock(lock_);
  if (state_.proximity_check_pending) {
    LOG(INFO) << "Proximity sensor is covered; not waking up";
    FinishProximityCheckLocked(false);
    return;
  }
  state_.proximity_positive = true;
  state_.dirty.Put(DirtyFlag::kProximityPositive);
  UpdatePowerStateLocked();
}

void PowerStateEngine::OnProximityNegative() {
  base::AutoLock lock(lock_);
  if (state_.proximity_check_pending) {
    LOG(INFO) << "Proximity sensor is clear; waking up";
    FinishProximityCheckLocked(true);
    return;
  }
  state_.proximity_positive = false;
  state_.dirty.Put(DirtyFlag::kProximityPositive);
  UserActivityNoUpdateLocked(clock_->NowTicks(), UserActivityEvent::kOther, 0,
                             kSystemUid);
  UpdatePowerStateLocked();
}

bool PowerStateEngine::BeginDreamReconciliation() {
  base::AutoLock lock(lock_);
  state_.sandman_scheduled = false;
  const bool can_dream = CanDreamLocked();
  VLOG(1) << "Dream reconciliation: can_dream=" << can_dream
          << " wakefulness=" << WakefulnessToString(state_.wakefulness);
  return can_dream && state_.wakefulness == Wakefulness::kNapping;
}

bool PowerStateEngine::FinishDreamReconciliation(bool is_dreaming) {
  base::AutoLock lock(lock_);
  bool continue_dreaming = false;
  if (is_dreaming && CanDreamLocked()) {
    if (state_.wakefulness == Wakefulness::kNapping) {
      state_.wakefulness = Wakefulness::kDreaming;
      state_.dirty.Put(DirtyFlag::kWakefulness);
      state_.battery_level_when_dream_started = state_.battery_level;
      UpdatePowerStateLocked();
      continue_dreaming = true;
    } else if (state_.wakefulness == Wakefulness::kDreaming) {
      if (!IsBeingKeptAwakeLocked() &&
          state_.battery_level < state_.battery_level_when_dream_started -
                                     kDreamBatteryLevelDrainCutoff) {
        LOG(INFO) << "Stopping dream because the battery appears to be "
                  << "draining faster than it is charging. Battery level "
                  << "when dream started: "
                  << state_.battery_level_when_dream_started
                  << "%. Battery level now: " << state_.battery_level << "%.";
      } else {
        continue_dreaming = true;
      }
    }
  }
  if (!continue_dreaming)
    HandleDreamFinishedLocked();
  return continue_dreaming;
}

int PowerStateEngine::GetWakeLockSummaryForTesting() {
  base::AutoLock lock(lock_);
  return state_.wake_lock_summary;
}

int PowerStateEngine::GetUserActivitySummaryForTesting() {
  base::AutoLock lock(lock_);
  return state_.user_activity_summary;
}

int PowerStateEngine::GetMaxWakefulnessIterationsForTesting() {
  base::AutoLock lock(lock_);
  return max_wakefulness_iterations_;
}

bool PowerStateEngine::CheckEventTime(base::TimeTicks event_time,
                                      brillo::ErrorPtr* error) {
  if (event_time > clock_->NowTicks()) {
    return SetError(FROM_HERE, error, kErrorInvalidArgument,
                    "Event time must not be in the future");
  }
  return true;
}

bool PowerStateEngine::IsWakeUpSuppressed(const CallerIdentity& caller) {
  WakeSuppressionPredicate predicate;
  {
    base::AutoLock lock(lock_);
    predicate = wake_suppression_predicate_;
  }
  if (predicate.is_null() || !predicate.Run(caller))
    return false;
  LOG(INFO) << "Ignoring wake-up request from uid " << caller.uid << " ("
            << caller.package_name << ")";
  return true;
}

bool PowerStateEngine::UserActivityNoUpdateLocked(base::TimeTicks event_time,
                                                  UserActivityEvent event,
                                                  uint32_t flags,
                                                  int uid) {
  VLOG(2) << "UserActivity: event_time=" << ToMs(event_time)
          << " event=" << static_cast<int>(event) << " flags=0x" << std::hex
          << flags << std::dec << " uid=" << uid;

  const bool changes_lights = !(flags & kUserActivityFlagNoChangeLights);
  const ActivityTimer::RecordResult result = activity_timer_.Record(
      event_time, changes_lights, state_.wakefulness,
      state_.boot_completed && state_.system_ready);
  if (result == ActivityTimer::RecordResult::kRejected)
    return false;

  collaborators_.notifier->OnUserActivity(event, uid);
  if (result == ActivityTimer::RecordResult::kUpdated) {
    state_.dirty.Put(DirtyFlag::kUserActivity);
    return true;
  }
  return false;
}

bool PowerStateEngine::WakeUpNoUpdateLocked(base::TimeTicks event_time) {
  if (event_time < activity_timer_.last_sleep_time() ||
      state_.wakefulness == Wakefulness::kAwake || !state_.boot_completed ||
      !state_.system_ready) {
    return false;
  }

  switch (state_.wakefulness) {
    case Wakefulness::kAsleep:
      LOG(INFO) << "Waking up from sleep";
      SendPendingNotificationsLocked();
      collaborators_.notifier->OnWakeUpStarted();
      state_.send_wake_up_finished_when_ready = true;
      break;
    case Wakefulness::kDreaming:
      LOG(INFO) << "Waking up from dream";
      break;
    case Wakefulness::kNapping:
      LOG(INFO) << "Waking up from nap";
      break;
    case Wakefulness::kAwake:
      break;
  }

  activity_timer_.OnWake(event_time);
  state_.wakefulness = Wakefulness::kAwake;
  state_.dirty.Put(DirtyFlag::kWakefulness);

  UserActivityNoUpdateLocked(event_time, UserActivityEvent::kOther, 0,
                             kSystemUid);
  return true;
}

bool PowerStateEngine::GoToSleepNoUpdateLocked(base::TimeTicks event_time,
                                               GoToSleepReason reason) {
  if (event_time < activity_timer_.last_wake_time() ||
      state_.wakefulness == Wakefulness::kAsleep || !state_.boot_completed ||
      !state_.system_ready) {
    return false;
  }

  switch (reason) {
    case GoToSleepReason::kDeviceAdmin:
      LOG(INFO) << "Going to sleep due to device administration policy";
      break;
    case GoToSleepReason::kTimeout:
      LOG(INFO) << "Going to sleep due to screen timeout";
      break;
    case GoToSleepReason::kUser:
      LOG(INFO) << "Going to sleep by user request";
      break;
  }

  SendPendingNotificationsLocked();
  collaborators_.notifier->OnGoToSleepStarted(reason);
  state_.send_go_to_sleep_finished_when_ready = true;

  activity_timer_.OnSleep(event_time);
  state_.dirty.Put(DirtyFlag::kWakefulness);
  state_.wakefulness = Wakefulness::kAsleep;

  collaborators_.notifier->OnSleepRequested(
      wake_locks_.CountScreenWakeLocks());
  return true;
}

bool PowerStateEngine::NapNoUpdateLocked(base::TimeTicks event_time) {
  if (event_time < activity_timer_.last_wake_time() ||
      state_.wakefulness != Wakefulness::kAwake || !state_.boot_completed ||
      !state_.system_ready) {
    return false;
  }

  LOG(INFO) << "Nap time";
  state_.dirty.Put(DirtyFlag::kWakefulness);
  state_.wakefulness = Wakefulness::kNapping;
  return true;
}

void PowerStateEngine::ApplyWakeLockFlagsOnAcquireLocked(
    const WakeLock& wake_lock) {
  if ((wake_lock.flags & kAcquireCausesWakeup) && wake_lock.IsScreenLock())
    WakeUpNoUpdateLocked(clock_->NowTicks());
}

void PowerStateEngine::ApplyWakeLockFlagsOnReleaseLocked(
    const WakeLock& wake_lock) {
  if ((wake_lock.flags & kOnAfterRelease) && wake_lock.IsScreenLock()) {
    UserActivityNoUpdateLocked(clock_->NowTicks(), UserActivityEvent::kOther,
                               kUserActivityFlagNoChangeLights,
                               wake_lock.owner_uid);
  }
}

bool PowerStateEngine::RemoveWakeLockLocked(const std::string& handle,
                                            uint32_t flags) {
  std::unique_ptr<WakeLock> wake_lock = wake_locks_.Release(handle);
  if (!wake_lock)
    return false;

  VLOG(1) << "Released wake lock " << handle << " [" << wake_lock->tag
          << "] flags=0x" << std::hex << flags;
  if (flags & kWaitForProximityNegative)
    state_.request_wait_for_negative_proximity = true;

  ApplyWakeLockFlagsOnReleaseLocked(*wake_lock);
  state_.dirty.Put(DirtyFlag::kWakeLocks);
  return true;
}

void PowerStateEngine::HandleWakeLockOwnerLost(const std::string& handle) {
  base::AutoLock lock(lock_);
  if (!RemoveWakeLockLocked(handle, 0))
    return;
  LOG(INFO) << "Owner of wake lock " << handle << " went away";
  UpdatePowerStateLocked();
}

void PowerStateEngine::UpdateSettingsLocked(const PowerSettings& settings) {
  const PowerSettings old_settings = state_.settings;
  state_.settings = settings;

  if (old_settings.screen_brightness != settings.screen_brightness)
    state_.temporary_screen_brightness_setting_override = -1;
  if (old_settings.screen_auto_brightness_adjustment !=
      settings.screen_auto_brightness_adjustment) {
    state_.temporary_screen_auto_brightness_adjustment_setting_override =
        std::numeric_limits<float>::quiet_NaN();
  }
  if (old_settings != settings)
    VLOG(1) << "Settings: " << settings.ToString();

  state_.dirty.Put(DirtyFlag::kSettings);
}

void PowerStateEngine::HandleSettingsChanged() {
  PowerConfig config;
  {
    base::AutoLock lock(lock_);
    config = config_;
  }
  const PowerSettings settings =
      ReadPowerSettings(*collaborators_.settings, config);

  base::AutoLock lock(lock_);
  UpdateSettingsLocked(settings);
  UpdatePowerStateLocked();
}

void PowerStateEngine::UpdatePowerStateLocked() {
  lock_.AssertAcquired();
  if (!state_.system_ready || state_.dirty.Empty())
    return;

  // Phase 0: basic state updates.
  UpdateIsPoweredLocked(state_.dirty);
  UpdateStayOnLocked(state_.dirty);

  // Phase 1: update wakefulness. Loop because the wake lock and user activity
  // summaries depend on the wakefulness.
  const base::TimeTicks now = clock_->NowTicks();
  DirtyFlags dirty_phase2;
  for (int iteration = 0;; ++iteration) {
    if (iteration >= kMaxWakefulnessIterations) {
      LOG(DFATAL) << "Wakefulness did not settle after " << iteration
                  << " iterations; dirty=" << DirtyFlagsToString(state_.dirty);
      break;
    }
    max_wakefulness_iterations_ =
        std::max(max_wakefulness_iterations_, iteration + 1);
    const DirtyFlags dirty_phase1 = state_.dirty;
    dirty_phase2.PutAll(dirty_phase1);
    state_.dirty.Clear();

    UpdateWakeLockSummaryLocked(dirty_phase1);
    UpdateUserActivitySummaryLocked(now, dirty_phase1);
    if (!UpdateWakefulnessLocked(dirty_phase1))
      break;
  }

  // Phase 2: update dreams and the display.
  UpdateDreamLocked(dirty_phase2);
  UpdateDisplayPowerStateLocked(dirty_phase2);

  // Phase 3: send notifications that were waiting on the display.
  if (state_.display_ready)
    SendPendingNotificationsLocked();

  // Phase 4: suspend inhibitors. This may release the last one, so it must
  // come last.
  UpdateSuspendInhibitorsLocked();
}

void PowerStateEngine::UpdateIsPoweredLocked(DirtyFlags dirty) {
  if (!dirty.Has(DirtyFlag::kBatteryState))
    return;

  const bool was_powered = state_.is_powered;
  const int old_plug_type = state_.plug_type;
  BatterySourceInterface* battery = collaborators_.battery;
  state_.is_powered = battery->IsPowered();
  state_.plug_type = battery->GetPlugType();
  state_.battery_level = battery->GetBatteryLevel();

  VLOG(1) << "UpdateIsPowered: was_powered=" << was_powered
          << " is_powered=" << state_.is_powered
          << " old_plug_type=" << old_plug_type
          << " plug_type=" << state_.plug_type
          << " battery_level=" << state_.battery_level;

  if (was_powered == state_.is_powered && old_plug_type == state_.plug_type)
    return;

  state_.dirty.Put(DirtyFlag::kIsPowered);

  const bool docked_on_wireless_charger = wireless_charger_detector_.Update(
      state_.is_powered, state_.plug_type, state_.battery_level);

  // Plugging and unplugging always count as user activity so the screen
  // doesn't shut off right away. Some devices also wake up because they have
  // no charging LED.
  const base::TimeTicks now = clock_->NowTicks();
  if (ShouldWakeUpWhenPluggedOrUnpluggedLocked(was_powered, old_plug_type,
                                               docked_on_wireless_charger)) {
    WakeUpNoUpdateLocked(now);
  }
  UserActivityNoUpdateLocked(now, UserActivityEvent::kOther, 0, kSystemUid);

  if (docked_on_wireless_charger)
    collaborators_.notifier->OnWirelessChargingStarted();
}

bool PowerStateEngine::ShouldWakeUpWhenPluggedOrUnpluggedLocked(
    bool was_powered, int old_plug_type, bool docked_on_wireless_charger) {
  if (!state_.settings.wake_up_when_plugged_or_unplugged)
    return false;

  if (!power_change_wake_suppression_predicate_.is_null() &&
      power_change_wake_suppression_predicate_.Run()) {
    VLOG(1) << "Wake-up on power change suppressed";
    return false;
  }

  // Lifting the device off a wireless charger is not a reason to wake up.
  if (was_powered && !state_.is_powered &&
      old_plug_type == kPlugTypeWireless) {
    return false;
  }

  // Wireless power can come and go on its own; only wake up once the
  // detector is sure the device was put on a charger.
  if (!was_powered && state_.is_powered &&
      state_.plug_type == kPlugTypeWireless && !docked_on_wireless_charger) {
    return false;
  }

  if (state_.is_powered && (state_.wakefulness == Wakefulness::kNapping ||
                            state_.wakefulness == Wakefulness::kDreaming)) {
    return false;
  }

  return true;
}

void PowerStateEngine::UpdateStayOnLocked(DirtyFlags dirty) {
  if (!dirty.HasAny(
          DirtyFlags(DirtyFlag::kBatteryState, DirtyFlag::kSettings)))
    return;

  const bool was_stay_on = state_.stay_on;
  if (state_.settings.stay_on_while_plugged_in != 0 &&
      !IsMaximumScreenOffTimeoutFromDeviceAdminEnforcedLocked()) {
    state_.stay_on = collaborators_.battery->IsPoweredBy(
        state_.settings.stay_on_while_plugged_in);
  } else {
    state_.stay_on = false;
  }

  if (state_.stay_on != was_stay_on)
    state_.dirty.Put(DirtyFlag::kStayOn);
}

void PowerStateEngine::UpdateWakeLockSummaryLocked(DirtyFlags dirty) {
  if (!dirty.HasAny(
          DirtyFlags(DirtyFlag::kWakeLocks, DirtyFlag::kWakefulness)))
    return;

  state_.wake_lock_summary = wake_locks_.ComputeSummary(state_.wakefulness);
  VLOG(2) << "UpdateWakeLockSummary: wakefulness="
          << WakefulnessToString(state_.wakefulness) << " summary=0x"
          << std::hex << state_.wake_lock_summary;
}

void PowerStateEngine::UpdateUserActivitySummaryLocked(base::TimeTicks now,
                                                       DirtyFlags dirty) {
  if (!dirty.HasAny(DirtyFlags(DirtyFlag::kUserActivity,
                              DirtyFlag::kWakefulness, DirtyFlag::kSettings))) {
    return;
  }

  ActivityTimer::Schedule schedule;
  schedule.screen_off_timeout = GetScreenOffTimeoutLocked();
  schedule.screen_dim_duration =
      ActivityTimer::GetScreenDimDuration(schedule.screen_off_timeout);
  schedule.button_timeout = state_.settings.button_timeout;

  const ActivityTimer::Summary summary = activity_timer_.ComputeSummary(
      now, state_.wakefulness, schedule,
      state_.display_power_request.screen_state);
  state_.user_activity_summary = summary.bits;

  int button_brightness = state_.settings.button_brightness;
  int keyboard_brightness = state_.settings.keyboard_brightness;
  if (state_.button_brightness_override_from_window_manager >= 0) {
    button_brightness = state_.button_brightness_override_from_window_manager;
    keyboard_brightness = state_.button_brightness_override_from_window_manager;
  }
  if (summary.keyboard_lit) {
    SetLightBrightnessLocked(
        LightId::kKeyboard,
        *summary.keyboard_lit && state_.keyboard_visible ? keyboard_brightness
                                                         : 0,
        &state_.keyboard_light_brightness);
  }
  if (summary.buttons_lit) {
    SetLightBrightnessLocked(LightId::kButtons,
                             *summary.buttons_lit ? button_brightness : 0,
                             &state_.button_light_brightness);
  }

  if (summary.next_timeout != state_.user_activity_timeout_time) {
    state_.user_activity_timeout_time = summary.next_timeout;
    ScheduleUserActivityTimeoutLocked();
  }

  VLOG(2) << "UpdateUserActivitySummary: wakefulness="
          << WakefulnessToString(state_.wakefulness) << " summary=0x"
          << std::hex << state_.user_activity_summary << std::dec
          << " next_timeout=" << ToMs(summary.next_timeout);
}

bool PowerStateEngine::UpdateWakefulnessLocked(DirtyFlags dirty) {
  if (!dirty.HasAny(kWakefulnessInputs))
    return false;
  if (state_.wakefulness != Wakefulness::kAwake || !IsItBedTimeYetLocked())
    return false;

  VLOG(1) << "UpdateWakefulness: bed time";
  const base::TimeTicks now = clock_->NowTicks();
  if (ShouldNapAtBedTimeLocked())
    return NapNoUpdateLocked(now);
  return GoToSleepNoUpdateLocked(now, GoToSleepReason::kTimeout);
}

bool PowerStateEngine::ShouldNapAtBedTimeLocked() const {
  return state_.settings.dreams_activate_on_sleep ||
         (state_.settings.dreams_activate_on_dock &&
          state_.dock_state != DockState::kUndocked);
}

bool PowerStateEngine::IsItBedTimeYetLocked() const {
  return state_.boot_completed && !IsBeingKeptAwakeLocked();
}

bool PowerStateEngine::IsBeingKeptAwakeLocked() const {
  return state_.stay_on || state_.proximity_positive ||
         (state_.wake_lock_summary & kWakeLockStayAwake) ||
         (state_.user_activity_summary &
          (kUserActivityScreenBright | kUserActivityScreenDim));
}

void PowerStateEngine::UpdateDreamLocked(DirtyFlags dirty) {
  if (dirty.HasAny(kDreamInputs))
    ScheduleSandmanLocked();
}

void PowerStateEngine::ScheduleSandmanLocked() {
  if (state_.sandman_scheduled)
    return;
  state_.sandman_scheduled = true;
  dream_scheduler_.Schedule();
}

bool PowerStateEngine::CanDreamLocked() const {
  return config_.dreams_supported && state_.settings.dreams_enabled &&
         state_.display_power_request.screen_state != ScreenState::kOff &&
         state_.boot_completed &&
         (state_.is_powered || IsBeingKeptAwakeLocked());
}

void PowerStateEngine::HandleDreamFinishedLocked() {
  if (state_.wakefulness != Wakefulness::kNapping &&
      state_.wakefulness != Wakefulness::kDreaming) {
    return;
  }
  const base::TimeTicks now = clock_->NowTicks();
  if (IsItBedTimeYetLocked())
    GoToSleepNoUpdateLocked(now, GoToSleepReason::kTimeout);
  else
    WakeUpNoUpdateLocked(now);
  UpdatePowerStateLocked();
}

void PowerStateEngine::UpdateDisplayPowerStateLocked(DirtyFlags dirty) {
  if (!dirty.HasAny(kDisplayInputs))
    return;

  DisplayPowerRequest& request = state_.display_power_request;
  const ScreenState new_screen_state = GetDesiredScreenStateLocked();
  if (new_screen_state != request.screen_state) {
    if (new_screen_state == ScreenState::kOff)
      state_.last_screen_off_time = clock_->NowTicks();
    request.screen_state = new_screen_state;
  }

  const PowerSettings& settings = state_.settings;
  int screen_brightness = config_.screen_brightness_default;
  float screen_auto_brightness_adjustment = 0.0f;
  bool auto_brightness =
      settings.screen_brightness_mode == kScreenBrightnessModeAutomatic;
  if (IsValidBrightness(
          state_.screen_brightness_override_from_window_manager)) {
    screen_brightness = state_.screen_brightness_override_from_window_manager;
    auto_brightness = false;
  } else if (IsValidBrightness(
                 state_.temporary_screen_brightness_setting_override)) {
    screen_brightness = state_.temporary_screen_brightness_setting_override;
  } else if (IsValidBrightness(settings.screen_brightness)) {
    screen_brightness = settings.screen_brightness;
  }
  if (auto_brightness) {
    screen_brightness = config_.screen_brightness_default;
    const float temporary_adjustment =
        state_.temporary_screen_auto_brightness_adjustment_setting_override;
    if (IsValidAutoBrightnessAdjustment(temporary_adjustment)) {
      screen_auto_brightness_adjustment = temporary_adjustment;
    } else if (IsValidAutoBrightnessAdjustment(
                   settings.screen_auto_brightness_adjustment)) {
      screen_auto_brightness_adjustment =
          settings.screen_auto_brightness_adjustment;
    }
  }
  request.screen_brightness =
      std::clamp(screen_brightness, config_.screen_brightness_minimum,
                 config_.screen_brightness_maximum);
  request.screen_auto_brightness_adjustment =
      std::clamp(screen_auto_brightness_adjustment, -1.0f, 1.0f);
  request.use_auto_brightness = auto_brightness;
  // A pending proximity check also needs a reading from the sensor.
  request.use_proximity_sensor =
      (state_.wake_lock_summary & kWakeLockProximityScreenOff) != 0 ||
      state_.proximity_check_pending;
  request.block_screen_on = screen_on_gate_->IsHeld();
  request.responsiveness_factor = settings.auto_brightness_responsiveness;

  state_.display_ready = collaborators_.display_sink->RequestPowerState(
      request, state_.request_wait_for_negative_proximity);
  state_.request_wait_for_negative_proximity = false;

  VLOG(1) << "UpdateDisplayPowerState: display_ready=" << state_.display_ready
          << " " << request.ToString()
          << " wakefulness=" << WakefulnessToString(state_.wakefulness)
          << " boot_completed=" << state_.boot_completed;
}

ScreenState PowerStateEngine::GetDesiredScreenStateLocked() const {
  if (state_.wakefulness == Wakefulness::kAsleep)
    return ScreenState::kOff;

  if ((state_.wake_lock_summary & kWakeLockScreenBright) ||
      (state_.user_activity_summary & kUserActivityScreenBright) ||
      !state_.boot_completed) {
    return ScreenState::kBright;
  }
  return ScreenState::kDim;
}

void PowerStateEngine::UpdateSuspendInhibitorsLocked() {
  const bool need_wake_lock_inhibitor =
      (state_.wake_lock_summary & kWakeLockCpu) != 0 ||
      state_.proximity_check_pending;
  const bool need_display_inhibitor = NeedDisplaySuspendInhibitorLocked();

  // Acquire before releasing so there is never a moment with neither held.
  if (need_wake_lock_inhibitor && !state_.holding_wake_lock_inhibitor) {
    wake_lock_inhibitor_->Acquire();
    state_.holding_wake_lock_inhibitor = true;
  }
  if (need_display_inhibitor && !state_.holding_display_inhibitor) {
    display_inhibitor_->Acquire();
    state_.holding_display_inhibitor = true;
  }

  if (!need_wake_lock_inhibitor && state_.holding_wake_lock_inhibitor) {
    wake_lock_inhibitor_->Release();
    state_.holding_wake_lock_inhibitor = false;
  }
  if (!need_display_inhibitor && state_.holding_display_inhibitor) {
    display_inhibitor_->Release();
    state_.holding_display_inhibitor = false;
  }
}

bool PowerStateEngine::NeedDisplaySuspendInhibitorLocked() const {
  if (!state_.display_ready)
    return true;
  const DisplayPowerRequest& request = state_.display_power_request;
  if (request.screen_state != ScreenState::kOff) {
    // The screen may be off because of the proximity sensor. Suspending then
    // is only safe if the sensor can wake the system.
    if (!request.use_proximity_sensor || !state_.proximity_positive ||
        !config_.suspend_when_screen_off_due_to_proximity) {
      return true;
    }
  }
  return false;
}

void PowerStateEngine::SendPendingNotificationsLocked() {
  if (state_.send_wake_up_finished_when_ready) {
    state_.send_wake_up_finished_when_ready = false;
    collaborators_.notifier->OnWakeUpFinished();
  }
  if (state_.send_go_to_sleep_finished_when_ready) {
    state_.send_go_to_sleep_finished_when_ready = false;
    collaborators_.notifier->OnGoToSleepFinished();
  }
}

base::TimeDelta PowerStateEngine::GetScreenOffTimeoutLocked() const {
  std::optional<base::TimeDelta> device_admin_maximum;
  if (IsMaximumScreenOffTimeoutFromDeviceAdminEnforcedLocked()) {
    device_admin_maximum = base::Milliseconds(
        state_.maximum_screen_off_timeout_from_device_admin_ms);
  }
  std::optional<base::TimeDelta> window_manager_override;
  if (state_.user_activity_timeout_override_from_window_manager_ms >= 0) {
    window_manager_override = base::Milliseconds(
        state_.user_activity_timeout_override_from_window_manager_ms);
  }
  return ActivityTimer::GetScreenOffTimeout(
      state_.settings.screen_off_timeout, device_admin_maximum,
      window_manager_override);
}

bool PowerStateEngine::IsMaximumScreenOffTimeoutFromDeviceAdminEnforcedLocked()
    const {
  return state_.maximum_screen_off_timeout_from_device_admin_ms >= 0 &&
         state_.maximum_screen_off_timeout_from_device_admin_ms <
             std::numeric_limits<int32_t>::max();
}

void PowerStateEngine::HandleBootCompletedLocked() {
  LOG(INFO) << "Boot animation finished";
  state_.boot_completed = true;
  state_.dirty.Put(DirtyFlag::kBootCompleted);
  UserActivityNoUpdateLocked(clock_->NowTicks(), UserActivityEvent::kOther, 0,
                             kSystemUid);
  UpdatePowerStateLocked();
}

void PowerStateEngine::FinishProximityCheckLocked(bool wake_up) {
  state_.proximity_check_pending = false;
  state_.dirty.Put(DirtyFlag::kProximityCheck);
  task_runner_->PostTask(
      FROM_HERE, base::BindOnce(&PowerStateEngine::CancelProximityCheckTimeout,
                                base::Unretained(this)));
  if (wake_up)
    WakeUpNoUpdateLocked(state_.proximity_check_event_time);
  UpdatePowerStateLocked();
}

void PowerStateEngine::ScheduleUserActivityTimeoutLocked() {
  if (state_.user_activity_timeout_rearm_posted)
    return;
  state_.user_activity_timeout_rearm_posted = true;
  task_runner_->PostTask(
      FROM_HERE, base::BindOnce(&PowerStateEngine::RearmUserActivityTimeout,
                                base::Unretained(this)));
}

void PowerStateEngine::SetLightBrightnessLocked(LightId id,
                                                int brightness,
                                                int* current) {
  if (*current == brightness)
    return;
  *current = brightness;
  if (!collaborators_.lights)
    return;
  task_runner_->PostTask(
      FROM_HERE, base::BindOnce(&PowerStateEngine::ApplyLightBrightness,
                                base::Unretained(this), id, brightness));
}

void PowerStateEngine::ApplyLightBrightness(LightId id, int brightness) {
  collaborators_.lights->SetBrightness(id, brightness);
}

void PowerStateEngine::RearmUserActivityTimeout() {
  base::TimeTicks timeout_time;
  {
    base::AutoLock lock(lock_);
    state_.user_activity_timeout_rearm_posted = false;
    timeout_time = state_.user_activity_timeout_time;
  }

  if (timeout_time.is_null()) {
    user_activity_timeout_callback_.Cancel();
    return;
  }
  // Reset() cancels the previously armed timeout.
  user_activity_timeout_callback_.Reset(base::BindOnce(
      &PowerStateEngine::HandleUserActivityTimeout, base::Unretained(this)));
  task_runner_->PostDelayedTask(
      FROM_HERE, user_activity_timeout_callback_.callback(),
      std::max(timeout_time - clock_->NowTicks(), base::TimeDelta()));
}

void PowerStateEngine::HandleUserActivityTimeout() {
  base::AutoLock lock(lock_);
  VLOG(1) << "User activity timeout";
  // Forget the expired deadline so the next one is always armed.
  state_.user_activity_timeout_time = base::TimeTicks();
  state_.dirty.Put(DirtyFlag::kUserActivity);
  UpdatePowerStateLocked();
}

void PowerStateEngine::StartProximityCheckTimeout(base::TimeDelta timeout) {
  proximity_check_timeout_callback_.Reset(base::BindOnce(
      &PowerStateEngine::HandleProximityCheckTimeout, base::Unretained(this)));
  task_runner_->PostDelayedTask(
      FROM_HERE, proximity_check_timeout_callback_.callback(), timeout);
}

void PowerStateEngine::CancelProximityCheckTimeout() {
  proximity_check_timeout_callback_.Cancel();
}

void PowerStateEngine::HandleProximityCheckTimeout() {
  base::AutoLock lock(lock_);
  if (!state_.proximity_check_pending)
    return;
  LOG(WARNING) << "No proximity reading in time; waking up anyway";
  FinishProximityCheckLocked(true);
}

void PowerStateEngine::OnScreenOnGateReleased() {
  task_runner_->PostTask(
      FROM_HERE, base::BindOnce(&PowerStateEngine::HandleScreenOnGateReleased,
                                base::Unretained(this)));
}

void PowerStateEngine::HandleScreenOnGateReleased() {
  base::AutoLock lock(lock_);
  state_.dirty.Put(DirtyFlag::kScreenOnGateReleased);
  UpdatePowerStateLocked();
}

void PowerStateEngine::CheckIfBootAnimationFinished() {
  VLOG(1) << "Checking whether the boot animation finished";
  if (collaborators_.boot_animation_monitor->IsBootAnimationRunning()) {
    task_runner_->PostDelayedTask(
        FROM_HERE,
        base::BindOnce(&PowerStateEngine::CheckIfBootAnimationFinished,
                       base::Unretained(this)),
        kBootAnimationPollInterval);
    return;
  }

  base::AutoLock lock(lock_);
  boot_animation_polling_ = false;
  if (!state_.boot_completed)
    HandleBootCompletedLocked();
}

}  // namespace power_manager
