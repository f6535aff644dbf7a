// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_DAEMON_POWER_MANAGER_DAEMON_H_
#define POWER_MANAGER_DAEMON_POWER_MANAGER_DAEMON_H_

#include <memory>
#include <string>

#include <base/files/file_path.h>
#include <base/threading/thread.h>
#include <brillo/daemons/dbus_daemon.h>
#include <cros_config/cros_config_interface.h>

#include "power_manager/daemon/backlight_display_sink.h"
#include "power_manager/daemon/dbus_owner_watcher.h"
#include "power_manager/daemon/pid_file_boot_animation_monitor.h"
#include "power_manager/daemon/power_manager_adaptor.h"
#include "power_manager/daemon/prefs_settings_source.h"
#include "power_manager/daemon/process_dream_host.h"
#include "power_manager/daemon/sysfs_battery_source.h"
#include "power_manager/daemon/sysfs_lights.h"
#include "power_manager/daemon/sysfs_suspend_backend.h"
#include "power_manager/daemon/udev.h"
#include "power_manager/display_blanker.h"
#include "power_manager/notifier.h"
#include "power_manager/power_state_engine.h"

namespace power_manager {

class PowerManagerDaemon : public brillo::DBusServiceDaemon {
 public:
  struct Options {
    base::FilePath settings_path;
    // Empty disables dreams.
    std::string dream_command;
    base::FilePath boot_animation_pid_file;
    base::FilePath backlight_dir;
    base::FilePath leds_dir;
    base::FilePath power_supply_dir;
    base::FilePath power_dir;
  };

  explicit PowerManagerDaemon(const Options& options);
  PowerManagerDaemon(const PowerManagerDaemon&) = delete;
  PowerManagerDaemon& operator=(const PowerManagerDaemon&) = delete;

  ~PowerManagerDaemon() override;

 protected:
  // brillo::DBusServiceDaemon:
  int OnInit() override;
  void RegisterDBusObjectsAsync(
      brillo::dbus_utils::AsyncEventSequencer* sequencer) override;
  void OnShutdown(int* exit_code) override;

 private:
  void OnPowerSupplyEvent(const base::FilePath& syspath);

  const Options options_;

  // Runs the engine's deferred work.
  base::Thread worker_;

  std::unique_ptr<brillo::CrosConfigInterface> cros_config_;
  std::unique_ptr<SysfsSuspendBackend> suspend_backend_;
  std::unique_ptr<SysfsBatterySource> battery_;
  std::unique_ptr<PrefsSettingsSource> settings_;
  std::unique_ptr<SysfsLights> lights_;
  std::unique_ptr<BacklightDisplaySink> display_sink_;
  std::unique_ptr<DisplayBlanker> display_blanker_;
  std::unique_ptr<ProcessDreamHost> dream_host_;
  std::unique_ptr<PidFileBootAnimationMonitor> boot_animation_monitor_;
  std::unique_ptr<Notifier> notifier_;
  DBusOwnerWatcher owner_watcher_;
  std::unique_ptr<PowerStateEngine> engine_;
  std::unique_ptr<PowerManagerAdaptor> adaptor_;
  std::unique_ptr<UdevImpl> udev_;
};

}  // namespace power_manager

#endif  // POWER_MANAGER_DAEMON_POWER_MANAGER_DAEMON_H_
