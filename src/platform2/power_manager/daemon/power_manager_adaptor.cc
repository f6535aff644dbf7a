// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/daemon/power_manager_adaptor.h"

#include <utility>

#include <base/functional/bind.h>
#include <base/location.h>
#include <base/logging.h>
#include <base/strings/stringprintf.h>
#include <base/time/time.h>
#include <dbus/object_path.h>

#include "power_manager/daemon/dbus_constants.h"
#include "power_manager/power_error.h"
#include "power_manager/work_source.h"

namespace power_manager {

namespace {

using brillo::dbus_utils::AsyncEventSequencer;
using brillo::dbus_utils::DBusInterface;

// D-Bus event times are milliseconds on the monotonic clock.
base::TimeTicks EventTimeFromMs(int64_t event_time_ms) {
  return base::TimeTicks() + base::Milliseconds(event_time_ms);
}

bool MakeWorkSource(const std::vector<int32_t>& uids,
                    const std::vector<std::string>& names,
                    WorkSource* work_source,
                    brillo::ErrorPtr* error) {
  if (!names.empty() && names.size() != uids.size()) {
    return SetError(FROM_HERE, error, kErrorInvalidArgument,
                    "Work source names must match uids");
  }
  for (size_t i = 0; i < uids.size(); ++i)
    work_source->Add(uids[i], names.empty() ? std::string() : names[i]);
  return true;
}

}  // namespace

PowerManagerAdaptor::PowerManagerAdaptor(scoped_refptr<dbus::Bus> bus,
                                         PowerStateEngine* engine,
                                         Notifier* notifier,
                                         DBusOwnerWatcher* owner_watcher)
    : engine_(engine),
      notifier_(notifier),
      owner_watcher_(owner_watcher),
      dbus_task_runner_(base::SequencedTaskRunner::GetCurrentDefault()),
      dbus_object_(nullptr, bus, dbus::ObjectPath(kPowerManagerServicePath)) {
  weak_ptr_ = weak_factory_.GetWeakPtr();
  notifier_->AddObserver(this);
}

PowerManagerAdaptor::~PowerManagerAdaptor() {
  notifier_->RemoveObserver(this);
}

void PowerManagerAdaptor::RegisterAsync(
    AsyncEventSequencer::CompletionAction cb) {
  DBusInterface* itf = dbus_object_.AddOrGetInterface(kPowerManagerInterface);
  itf->AddSimpleMethodHandlerWithErrorAndMessage(
      kAcquireWakeLockMethod,
      base::BindRepeating(&PowerManagerAdaptor::AcquireWakeLock,
                          base::Unretained(this)));
  itf->AddSimpleMethodHandlerWithError(
      kReleaseWakeLockMethod,
      base::BindRepeating(&PowerManagerAdaptor::ReleaseWakeLock,
                          base::Unretained(this)));
  itf->AddSimpleMethodHandlerWithError(
      kUpdateWakeLockWorkSourceMethod,
      base::BindRepeating(&PowerManagerAdaptor::UpdateWakeLockWorkSource,
                          base::Unretained(this)));
  itf->AddSimpleMethodHandler(
      kIsWakeLockLevelSupportedMethod,
      base::BindRepeating(&PowerManagerAdaptor::IsWakeLockLevelSupported,
                          base::Unretained(this)));
  itf->AddSimpleMethodHandler(
      kUpdateBlockedUidsMethod,
      base::BindRepeating(&PowerManagerAdaptor::UpdateBlockedUids,
                          base::Unretained(this)));
  itf->AddSimpleMethodHandlerWithError(
      kUserActivityMethod,
      base::BindRepeating(&PowerManagerAdaptor::UserActivity,
                          base::Unretained(this)));
  itf->AddSimpleMethodHandlerWithError(
      kWakeUpMethod, base::BindRepeating(&PowerManagerAdaptor::WakeUp,
                                         base::Unretained(this)));
  itf->AddSimpleMethodHandlerWithError(
      kWakeUpWithProximityCheckMethod,
      base::BindRepeating(&PowerManagerAdaptor::WakeUpWithProximityCheck,
                          base::Unretained(this)));
  itf->AddSimpleMethodHandlerWithError(
      kGoToSleepMethod, base::BindRepeating(&PowerManagerAdaptor::GoToSleep,
                                            base::Unretained(this)));
  itf->AddSimpleMethodHandlerWithError(
      kNapMethod,
      base::BindRepeating(&PowerManagerAdaptor::Nap, base::Unretained(this)));
  itf->AddSimpleMethodHandler(
      kIsScreenOnMethod, base::BindRepeating(&PowerManagerAdaptor::IsScreenOn,
                                             base::Unretained(this)));
  itf->AddSimpleMethodHandler(
      kGetWakefulnessMethod,
      base::BindRepeating(&PowerManagerAdaptor::GetWakefulness,
                          base::Unretained(this)));
  itf->AddSimpleMethodHandler(
      kTimeSinceScreenWasLastOnMethod,
      base::BindRepeating(&PowerManagerAdaptor::TimeSinceScreenWasLastOn,
                          base::Unretained(this)));
  itf->AddSimpleMethodHandlerWithError(
      kBootCompletedMethod,
      base::BindRepeating(&PowerManagerAdaptor::BootCompleted,
                          base::Unretained(this)));
  itf->AddSimpleMethodHandlerWithError(
      kSetStayOnSettingMethod,
      base::BindRepeating(&PowerManagerAdaptor::SetStayOnSetting,
                          base::Unretained(this)));
  itf->AddSimpleMethodHandler(
      kSetMaximumScreenOffTimeoutFromDeviceAdminMethod,
      base::BindRepeating(
          &PowerManagerAdaptor::SetMaximumScreenOffTimeoutFromDeviceAdmin,
          base::Unretained(this)));
  itf->AddSimpleMethodHandler(
      kSetScreenBrightnessOverrideFromWindowManagerMethod,
      base::BindRepeating(
          &PowerManagerAdaptor::SetScreenBrightnessOverrideFromWindowManager,
          base::Unretained(this)));
  itf->AddSimpleMethodHandler(
      kSetButtonBrightnessOverrideFromWindowManagerMethod,
      base::BindRepeating(
          &PowerManagerAdaptor::SetButtonBrightnessOverrideFromWindowManager,
          base::Unretained(this)));
  itf->AddSimpleMethodHandler(
      kSetUserActivityTimeoutOverrideFromWindowManagerMethod,
      base::BindRepeating(
          &PowerManagerAdaptor::SetUserActivityTimeoutOverrideFromWindowManager,
          base::Unretained(this)));
  itf->AddSimpleMethodHandler(
      kSetTemporaryScreenBrightnessSettingOverrideMethod,
      base::BindRepeating(
          &PowerManagerAdaptor::SetTemporaryScreenBrightnessSettingOverride,
          base::Unretained(this)));
  itf->AddSimpleMethodHandler(
      kSetTemporaryScreenAutoBrightnessAdjustmentSettingOverrideMethod,
      base::BindRepeating(&PowerManagerAdaptor::
                              SetTemporaryScreenAutoBrightnessAdjustmentSettingOverride,
                          base::Unretained(this)));
  itf->AddSimpleMethodHandler(
      kSetKeyboardVisibilityMethod,
      base::BindRepeating(&PowerManagerAdaptor::SetKeyboardVisibility,
                          base::Unretained(this)));
  itf->AddSimpleMethodHandler(
      kSetAttentionLightMethod,
      base::BindRepeating(&PowerManagerAdaptor::SetAttentionLight,
                          base::Unretained(this)));
  itf->AddSimpleMethodHandlerWithError(
      kSetKeyboardLightMethod,
      base::BindRepeating(&PowerManagerAdaptor::SetKeyboardLight,
                          base::Unretained(this)));
  itf->AddSimpleMethodHandler(
      kBlockScreenOnMethod,
      base::BindRepeating(&PowerManagerAdaptor::BlockScreenOn,
                          base::Unretained(this)));
  itf->AddSimpleMethodHandler(
      kUnblockScreenOnMethod,
      base::BindRepeating(&PowerManagerAdaptor::UnblockScreenOn,
                          base::Unretained(this)));
  itf->AddSimpleMethodHandlerWithError(
      kSetDockStateMethod,
      base::BindRepeating(&PowerManagerAdaptor::SetDockState,
                          base::Unretained(this)));
  itf->AddSimpleMethodHandler(
      kDreamStateChangedMethod,
      base::BindRepeating(&PowerManagerAdaptor::DreamStateChanged,
                          base::Unretained(this)));
  itf->AddSimpleMethodHandler(
      kUserSwitchedMethod,
      base::BindRepeating(&PowerManagerAdaptor::UserSwitched,
                          base::Unretained(this)));
  itf->AddSimpleMethodHandler(
      kDumpMethod,
      base::BindRepeating(&PowerManagerAdaptor::Dump, base::Unretained(this)));
  dbus_object_.RegisterAsync(std::move(cb));
}

void PowerManagerAdaptor::OnWakeLockAcquired(const WakeLockInfo& wake_lock) {
  PostSignal(CreateWakeLockSignal(kWakeLockAcquiredSignal, wake_lock));
}

void PowerManagerAdaptor::OnWakeLockReleased(const WakeLockInfo& wake_lock) {
  PostSignal(CreateWakeLockSignal(kWakeLockReleasedSignal, wake_lock));
}

void PowerManagerAdaptor::OnUserActivity(UserActivityEvent event, int uid) {
  auto signal = std::make_unique<dbus::Signal>(kPowerManagerInterface,
                                               kUserActivitySignal);
  dbus::MessageWriter writer(signal.get());
  writer.AppendInt32(static_cast<int32_t>(event));
  writer.AppendInt32(uid);
  PostSignal(std::move(signal));
}

void PowerManagerAdaptor::OnWakeUpStarted() {
  PostSignal(std::make_unique<dbus::Signal>(kPowerManagerInterface,
                                            kWakeUpStartedSignal));
}

void PowerManagerAdaptor::OnWakeUpFinished() {
  PostSignal(std::make_unique<dbus::Signal>(kPowerManagerInterface,
                                            kWakeUpFinishedSignal));
}

void PowerManagerAdaptor::OnGoToSleepStarted(GoToSleepReason reason) {
  auto signal = std::make_unique<dbus::Signal>(kPowerManagerInterface,
                                               kGoToSleepStartedSignal);
  dbus::MessageWriter writer(signal.get());
  writer.AppendInt32(static_cast<int32_t>(reason));
  PostSignal(std::move(signal));
}

void PowerManagerAdaptor::OnGoToSleepFinished() {
  PostSignal(std::make_unique<dbus::Signal>(kPowerManagerInterface,
                                            kGoToSleepFinishedSignal));
}

void PowerManagerAdaptor::OnSleepRequested(int screen_wake_locks) {
  auto signal = std::make_unique<dbus::Signal>(kPowerManagerInterface,
                                               kSleepRequestedSignal);
  dbus::MessageWriter writer(signal.get());
  writer.AppendInt32(screen_wake_locks);
  PostSignal(std::move(signal));
}

void PowerManagerAdaptor::OnWirelessChargingStarted() {
  PostSignal(std::make_unique<dbus::Signal>(kPowerManagerInterface,
                                            kWirelessChargingStartedSignal));
}

bool PowerManagerAdaptor::AcquireWakeLock(
    brillo::ErrorPtr* error,
    dbus::Message* message,
    const std::string& handle,
    uint32_t flags,
    const std::string& tag,
    const std::string& package_name,
    const std::vector<int32_t>& work_source_uids,
    const std::vector<std::string>& work_source_names,
    int32_t uid,
    int32_t pid) {
  WakeLockRequest request;
  request.handle = handle;
  request.flags = flags;
  request.tag = tag;
  request.package_name = package_name;
  request.uid = uid;
  request.pid = pid;
  if (!MakeWorkSource(work_source_uids, work_source_names,
                      &request.work_source, error)) {
    return false;
  }
  return engine_->AcquireWakeLock(
      request, owner_watcher_->CreateLiveness(message->GetSender()), error);
}

bool PowerManagerAdaptor::ReleaseWakeLock(brillo::ErrorPtr* error,
                                          const std::string& handle,
                                          uint32_t flags) {
  return engine_->ReleaseWakeLock(handle, flags, error);
}

bool PowerManagerAdaptor::UpdateWakeLockWorkSource(
    brillo::ErrorPtr* error,
    const std::string& handle,
    const std::vector<int32_t>& work_source_uids,
    const std::vector<std::string>& work_source_names) {
  WorkSource work_source;
  if (!MakeWorkSource(work_source_uids, work_source_names, &work_source,
                      error)) {
    return false;
  }
  return engine_->UpdateWakeLockWorkSource(handle, work_source, error);
}

bool PowerManagerAdaptor::IsWakeLockLevelSupported(int32_t level) {
  return level > 0 &&
         engine_->IsWakeLockLevelSupported(static_cast<uint32_t>(level));
}

void PowerManagerAdaptor::UpdateBlockedUids(int32_t uid, bool blocked) {
  engine_->UpdateBlockedUids(uid, blocked);
}

bool PowerManagerAdaptor::UserActivity(brillo::ErrorPtr* error,
                                       int64_t event_time_ms,
                                       int32_t event,
                                       uint32_t flags,
                                       int32_t uid) {
  if (event < static_cast<int32_t>(UserActivityEvent::kOther) ||
      event > static_cast<int32_t>(UserActivityEvent::kTouch)) {
    return SetError(
        FROM_HERE, error, kErrorInvalidArgument,
        base::StringPrintf("Unknown user activity event %d", event));
  }
  return engine_->UserActivity(EventTimeFromMs(event_time_ms),
                               static_cast<UserActivityEvent>(event), flags,
                               uid, error);
}

bool PowerManagerAdaptor::WakeUp(brillo::ErrorPtr* error,
                                 int64_t event_time_ms,
                                 int32_t uid,
                                 int32_t pid,
                                 const std::string& package_name) {
  CallerIdentity caller;
  caller.uid = uid;
  caller.pid = pid;
  caller.package_name = package_name;
  return engine_->WakeUp(EventTimeFromMs(event_time_ms), caller, error);
}

bool PowerManagerAdaptor::WakeUpWithProximityCheck(
    brillo::ErrorPtr* error,
    int64_t event_time_ms,
    int32_t uid,
    int32_t pid,
    const std::string& package_name) {
  CallerIdentity caller;
  caller.uid = uid;
  caller.pid = pid;
  caller.package_name = package_name;
  return engine_->WakeUpWithProximityCheck(EventTimeFromMs(event_time_ms),
                                           caller, error);
}

bool PowerManagerAdaptor::GoToSleep(brillo::ErrorPtr* error,
                                    int64_t event_time_ms,
                                    int32_t reason) {
  if (reason < static_cast<int32_t>(GoToSleepReason::kUser) ||
      reason > static_cast<int32_t>(GoToSleepReason::kTimeout)) {
    return SetError(FROM_HERE, error, kErrorInvalidArgument,
                    base::StringPrintf("Unknown sleep reason %d", reason));
  }
  return engine_->GoToSleep(EventTimeFromMs(event_time_ms),
                            static_cast<GoToSleepReason>(reason), error);
}

bool PowerManagerAdaptor::Nap(brillo::ErrorPtr* error, int64_t event_time_ms) {
  return engine_->Nap(EventTimeFromMs(event_time_ms), error);
}

bool PowerManagerAdaptor::IsScreenOn() {
  return engine_->IsScreenOn();
}

int32_t PowerManagerAdaptor::GetWakefulness() {
  return static_cast<int32_t>(engine_->GetWakefulness());
}

int64_t PowerManagerAdaptor::TimeSinceScreenWasLastOn() {
  return engine_->TimeSinceScreenWasLastOn().InMilliseconds();
}

bool PowerManagerAdaptor::BootCompleted(brillo::ErrorPtr* error) {
  return engine_->OnBootCompleted(error);
}

bool PowerManagerAdaptor::SetStayOnSetting(brillo::ErrorPtr* error,
                                           int32_t plug_type_mask) {
  return engine_->SetStayOnSetting(plug_type_mask, error);
}

void PowerManagerAdaptor::SetMaximumScreenOffTimeoutFromDeviceAdmin(
    int64_t timeout_ms) {
  engine_->SetMaximumScreenOffTimeoutFromDeviceAdmin(timeout_ms);
}

void PowerManagerAdaptor::SetScreenBrightnessOverrideFromWindowManager(
    int32_t brightness) {
  engine_->SetScreenBrightnessOverrideFromWindowManager(brightness);
}

void PowerManagerAdaptor::SetButtonBrightnessOverrideFromWindowManager(
    int32_t brightness) {
  engine_->SetButtonBrightnessOverrideFromWindowManager(brightness);
}

void PowerManagerAdaptor::SetUserActivityTimeoutOverrideFromWindowManager(
    int64_t timeout_ms) {
  engine_->SetUserActivityTimeoutOverrideFromWindowManager(timeout_ms);
}

void PowerManagerAdaptor::SetTemporaryScreenBrightnessSettingOverride(
    int32_t brightness) {
  engine_->SetTemporaryScreenBrightnessSettingOverride(brightness);
}

void PowerManagerAdaptor::
    SetTemporaryScreenAutoBrightnessAdjustmentSettingOverride(double adj) {
  engine_->SetTemporaryScreenAutoBrightnessAdjustmentSettingOverride(
      static_cast<float>(adj));
}

void PowerManagerAdaptor::SetKeyboardVisibility(bool visible) {
  engine_->SetKeyboardVisibility(visible);
}

void PowerManagerAdaptor::SetAttentionLight(bool on, uint32_t color) {
  engine_->SetAttentionLight(on, color);
}

bool PowerManagerAdaptor::SetKeyboardLight(brillo::ErrorPtr* error,
                                           bool on,
                                           int32_t key) {
  return engine_->SetKeyboardLight(on, key, error);
}

void PowerManagerAdaptor::BlockScreenOn() {
  engine_->BlockScreenOn();
}

void PowerManagerAdaptor::UnblockScreenOn() {
  engine_->UnblockScreenOn();
}

bool PowerManagerAdaptor::SetDockState(brillo::ErrorPtr* error,
                                       int32_t dock_state) {
  if (dock_state < static_cast<int32_t>(DockState::kUndocked) ||
      dock_state > static_cast<int32_t>(DockState::kHighEndDesk)) {
    return SetError(FROM_HERE, error, kErrorInvalidArgument,
                    base::StringPrintf("Unknown dock state %d", dock_state));
  }
  engine_->OnDockStateChanged(static_cast<DockState>(dock_state));
  return true;
}

void PowerManagerAdaptor::DreamStateChanged() {
  engine_->OnDreamStateChanged();
}

void PowerManagerAdaptor::UserSwitched() {
  engine_->OnUserSwitched();
}

std::string PowerManagerAdaptor::Dump() {
  return engine_->Dump();
}

void PowerManagerAdaptor::PostSignal(std::unique_ptr<dbus::Signal> signal) {
  dbus_task_runner_->PostTask(
      FROM_HERE, base::BindOnce(&PowerManagerAdaptor::SendSignal, weak_ptr_,
                                std::move(signal)));
}

void PowerManagerAdaptor::SendSignal(std::unique_ptr<dbus::Signal> signal) {
  if (!dbus_object_.SendSignal(signal.get()))
    LOG(WARNING) << "Failed to send " << signal->GetMember() << " signal";
}

std::unique_ptr<dbus::Signal> PowerManagerAdaptor::CreateWakeLockSignal(
    const char* name, const WakeLockInfo& wake_lock) {
  auto signal = std::make_unique<dbus::Signal>(kPowerManagerInterface, name);
  dbus::MessageWriter writer(signal.get());
  writer.AppendString(wake_lock.handle);
  writer.AppendUint32(wake_lock.flags);
  writer.AppendString(wake_lock.tag);
  writer.AppendString(wake_lock.package_name);
  writer.AppendInt32(wake_lock.owner_uid);
  writer.AppendInt32(wake_lock.owner_pid);
  return signal;
}

}  // namespace power_manager
