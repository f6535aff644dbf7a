// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_DAEMON_POWER_MANAGER_ADAPTOR_H_
#define POWER_MANAGER_DAEMON_POWER_MANAGER_ADAPTOR_H_

#include <stdint.h>

#include <memory>
#include <string>
#include <vector>

#include <base/memory/scoped_refptr.h>
#include <base/memory/weak_ptr.h>
#include <base/task/sequenced_task_runner.h>
#include <brillo/dbus/async_event_sequencer.h>
#include <brillo/dbus/dbus_object.h>
#include <brillo/errors/error.h>
#include <dbus/bus.h>
#include <dbus/message.h>

#include "power_manager/daemon/dbus_owner_watcher.h"
#include "power_manager/notifier.h"
#include "power_manager/power_observer.h"
#include "power_manager/power_state_engine.h"

namespace power_manager {

// Exports PowerStateEngine on D-Bus and turns power events into signals.
// Lives on the D-Bus thread. Must be destroyed after the worker that delivers
// PowerObserver calls has stopped.
class PowerManagerAdaptor : public PowerObserver {
 public:
  PowerManagerAdaptor(scoped_refptr<dbus::Bus> bus,
                      PowerStateEngine* engine,
                      Notifier* notifier,
                      DBusOwnerWatcher* owner_watcher);
  PowerManagerAdaptor(const PowerManagerAdaptor&) = delete;
  PowerManagerAdaptor& operator=(const PowerManagerAdaptor&) = delete;

  ~PowerManagerAdaptor() override;

  // Registers the D-Bus object and its methods.
  void RegisterAsync(
      brillo::dbus_utils::AsyncEventSequencer::CompletionAction cb);

  // PowerObserver:
  void OnWakeLockAcquired(const WakeLockInfo& wake_lock) override;
  void OnWakeLockReleased(const WakeLockInfo& wake_lock) override;
  void OnUserActivity(UserActivityEvent event, int uid) override;
  void OnWakeUpStarted() override;
  void OnWakeUpFinished() override;
  void OnGoToSleepStarted(GoToSleepReason reason) override;
  void OnGoToSleepFinished() override;
  void OnSleepRequested(int screen_wake_locks) override;
  void OnWirelessChargingStarted() override;

 private:
  // D-Bus methods.
  bool AcquireWakeLock(brillo::ErrorPtr* error,
                       dbus::Message* message,
                       const std::string& handle,
                       uint32_t flags,
                       const std::string& tag,
                       const std::string& package_name,
                       const std::vector<int32_t>& work_source_uids,
                       const std::vector<std::string>& work_source_names,
                       int32_t uid,
                       int32_t pid);
  bool ReleaseWakeLock(brillo::ErrorPtr* error,
                       const std::string& handle,
                       uint32_t flags);
  bool UpdateWakeLockWorkSource(
      brillo::ErrorPtr* error,
      const std::string& handle,
      const std::vector<int32_t>& work_source_uids,
      const std::vector<std::string>& work_source_names);
  bool IsWakeLockLevelSupported(int32_t level);
  void UpdateBlockedUids(int32_t uid, bool blocked);
  bool UserActivity(brillo::ErrorPtr* error,
                    int64_t event_time_ms,
                    int32_t event,
                    uint32_t flags,
                    int32_t uid);
  bool WakeUp(brillo::ErrorPtr* error,
              int64_t event_time_ms,
              int32_t uid,
              int32_t pid,
              const std::string& package_name);
  bool WakeUpWithProximityCheck(brillo::ErrorPtr* error,
                                int64_t event_time_ms,
                                int32_t uid,
                                int32_t pid,
                                const std::string& package_name);
  bool GoToSleep(brillo::ErrorPtr* error,
                 int64_t event_time_ms,
                 int32_t reason);
  bool Nap(brillo::ErrorPtr* error, int64_t event_time_ms);
  bool IsScreenOn();
  int32_t GetWakefulness();
  int64_t TimeSinceScreenWasLastOn();
  bool BootCompleted(brillo::ErrorPtr* error);
  bool SetStayOnSetting(brillo::ErrorPtr* error, int32_t plug_type_mask);
  void SetMaximumScreenOffTimeoutFromDeviceAdmin(int64_t timeout_ms);
  void SetScreenBrightnessOverrideFromWindowManager(int32_t brightness);
  void SetButtonBrightnessOverrideFromWindowManager(int32_t brightness);
  void SetUserActivityTimeoutOverrideFromWindowManager(int64_t timeout_ms);
  void SetTemporaryScreenBrightnessSettingOverride(int32_t brightness);
  void SetTemporaryScreenAutoBrightnessAdjustmentSettingOverride(double adj);
  void SetKeyboardVisibility(bool visible);
  void SetAttentionLight(bool on, uint32_t color);
  bool SetKeyboardLight(brillo::ErrorPtr* error, bool on, int32_t key);
  void BlockScreenOn();
  void UnblockScreenOn();
  bool SetDockState(brillo::ErrorPtr* error, int32_t dock_state);
  void DreamStateChanged();
  void UserSwitched();
  std::string Dump();

  // Sends |signal| from the D-Bus thread.
  void PostSignal(std::unique_ptr<dbus::Signal> signal);
  void SendSignal(std::unique_ptr<dbus::Signal> signal);

  std::unique_ptr<dbus::Signal> CreateWakeLockSignal(
      const char* name, const WakeLockInfo& wake_lock);

  PowerStateEngine* engine_;         // Not owned.
  Notifier* notifier_;               // Not owned.
  DBusOwnerWatcher* owner_watcher_;  // Not owned.
  scoped_refptr<base::SequencedTaskRunner> dbus_task_runner_;
  brillo::dbus_utils::DBusObject dbus_object_;

  base::WeakPtr<PowerManagerAdaptor> weak_ptr_;
  base::WeakPtrFactory<PowerManagerAdaptor> weak_factory_{this};
};

}  // namespace power_manager

#endif  // POWER_MANAGER_DAEMON_POWER_MANAGER_ADAPTOR_H_
