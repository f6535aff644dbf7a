// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include <base/files/file_path.h>
#include <brillo/flag_helper.h>
#include <brillo/syslog_logging.h>

#include "power_manager/daemon/backlight_display_sink.h"
#include "power_manager/daemon/power_manager_daemon.h"
#include "power_manager/daemon/prefs_settings_source.h"
#include "power_manager/daemon/sysfs_battery_source.h"
#include "power_manager/daemon/sysfs_lights.h"
#include "power_manager/daemon/sysfs_suspend_backend.h"

int main(int argc, char* argv[]) {
  DEFINE_string(settings_path,
                power_manager::PrefsSettingsSource::kDefaultSettingsPath,
                "File holding user power settings");
  DEFINE_string(dream_command, "",
                "Screensaver command run while dreaming; empty disables dreams");
  DEFINE_string(boot_animation_pid_file, "",
                "Pid file of the boot animation; empty means there is none");
  DEFINE_string(backlight_dir,
                power_manager::BacklightDisplaySink::kDefaultBacklightDir,
                "Directory containing the display backlight");
  DEFINE_string(leds_dir, power_manager::SysfsLights::kDefaultLedsDir,
                "Directory containing LED class devices");
  DEFINE_string(power_supply_dir,
                power_manager::SysfsBatterySource::kDefaultPowerSupplyDir,
                "Directory containing power supply devices");
  DEFINE_string(power_dir, power_manager::SysfsSuspendBackend::kDefaultPowerDir,
                "Kernel power management directory");
  brillo::FlagHelper::Init(argc, argv, "Power manager daemon");
  brillo::InitLog(brillo::kLogToSyslog | brillo::kLogToStderrIfTty);

  power_manager::PowerManagerDaemon::Options options;
  options.settings_path = base::FilePath(FLAGS_settings_path);
  options.dream_command = FLAGS_dream_command;
  options.boot_animation_pid_file = base::FilePath(FLAGS_boot_animation_pid_file);
  options.backlight_dir = base::FilePath(FLAGS_backlight_dir);
  options.leds_dir = base::FilePath(FLAGS_leds_dir);
  options.power_supply_dir = base::FilePath(FLAGS_power_supply_dir);
  options.power_dir = base::FilePath(FLAGS_power_dir);
  return power_manager::PowerManagerDaemon(options).Run();
}
