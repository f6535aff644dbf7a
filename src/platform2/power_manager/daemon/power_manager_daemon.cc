// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/daemon/power_manager_daemon.h"

#include <sysexits.h>

#include <utility>

#include <base/functional/bind.h>
#include <base/logging.h>
#include <base/time/default_tick_clock.h>
#include <brillo/errors/error.h>
#include <cros_config/cros_config.h>

#include "power_manager/daemon/dbus_constants.h"

namespace power_manager {

namespace {

constexpr char kPowerSupplySubsystem[] = "power_supply";

}  // namespace

PowerManagerDaemon::PowerManagerDaemon(const Options& options)
    : DBusServiceDaemon(kPowerManagerServiceName),
      options_(options),
      worker_("power_manager_worker") {}

PowerManagerDaemon::~PowerManagerDaemon() {
  worker_.Stop();
}

int PowerManagerDaemon::OnInit() {
  if (!worker_.StartWithOptions(
          base::Thread::Options(base::MessagePumpType::IO, 0))) {
    LOG(ERROR) << "Failed to start worker thread";
    return EX_OSERR;
  }
  scoped_refptr<base::SequencedTaskRunner> worker_runner =
      worker_.task_runner();

  cros_config_ = std::make_unique<brillo::CrosConfig>();
  suspend_backend_ = std::make_unique<SysfsSuspendBackend>(options_.power_dir);
  battery_ = std::make_unique<SysfsBatterySource>(options_.power_supply_dir);
  battery_->Refresh();
  settings_ = std::make_unique<PrefsSettingsSource>(options_.settings_path);
  lights_ = std::make_unique<SysfsLights>(options_.leds_dir);
  display_sink_ = std::make_unique<BacklightDisplaySink>(
      options_.backlight_dir, options_.power_dir, worker_runner);
  display_blanker_ = std::make_unique<DisplayBlanker>(display_sink_.get());
  display_sink_->set_display_blanker(display_blanker_.get());
  if (!options_.dream_command.empty())
    dream_host_ = std::make_unique<ProcessDreamHost>(options_.dream_command);
  boot_animation_monitor_ = std::make_unique<PidFileBootAnimationMonitor>(
      options_.boot_animation_pid_file);
  notifier_ = std::make_unique<Notifier>(worker_runner);

  PowerStateEngine::Collaborators collaborators;
  collaborators.cros_config = cros_config_.get();
  collaborators.task_runner = worker_runner;
  collaborators.clock = base::DefaultTickClock::GetInstance();
  collaborators.display_sink = display_sink_.get();
  collaborators.display_blanker = display_blanker_.get();
  collaborators.dream_host = dream_host_.get();
  collaborators.battery = battery_.get();
  collaborators.settings = settings_.get();
  collaborators.lights = lights_.get();
  collaborators.boot_animation_monitor = boot_animation_monitor_.get();
  collaborators.suspend_backend = suspend_backend_.get();
  collaborators.notifier = notifier_.get();
  engine_ = std::make_unique<PowerStateEngine>(collaborators);
  engine_->Init();

  // Connects to D-Bus and calls RegisterDBusObjectsAsync().
  const int ret = DBusServiceDaemon::OnInit();
  if (ret != EX_OK)
    return ret;

  udev_ = std::make_unique<UdevImpl>(kPowerSupplySubsystem);
  if (!udev_->Init(base::BindRepeating(&PowerManagerDaemon::OnPowerSupplyEvent,
                                       base::Unretained(this)))) {
    LOG(ERROR) << "Power supply changes will not be noticed";
    udev_.reset();
  }
  if (!settings_->Init(base::BindRepeating(
          &PowerStateEngine::OnSettingsChanged,
          base::Unretained(engine_.get())))) {
    LOG(WARNING) << "Settings edits will not be noticed until restart";
  }

  brillo::ErrorPtr error;
  if (!engine_->SystemReady(&error)) {
    LOG(ERROR) << "SystemReady failed: " << error->GetMessage();
    return EX_SOFTWARE;
  }
  return EX_OK;
}

void PowerManagerDaemon::RegisterDBusObjectsAsync(
    brillo::dbus_utils::AsyncEventSequencer* sequencer) {
  owner_watcher_.Init(bus_);
  adaptor_ = std::make_unique<PowerManagerAdaptor>(
      bus_, engine_.get(), notifier_.get(), &owner_watcher_);
  adaptor_->RegisterAsync(
      sequencer->GetHandler("RegisterAsync() failed.", true));
}

void PowerManagerDaemon::OnShutdown(int* exit_code) {
  LOG(INFO) << "Shutting down";
  // Nothing may run on the worker once the objects it uses start going away.
  worker_.Stop();
  udev_.reset();
  adaptor_.reset();
  DBusServiceDaemon::OnShutdown(exit_code);
}

void PowerManagerDaemon::OnPowerSupplyEvent(const base::FilePath& syspath) {
  if (battery_->Refresh())
    engine_->OnBatteryChanged();
}

}  // namespace power_manager
