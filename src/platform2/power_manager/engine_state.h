// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_ENGINE_STATE_H_
#define POWER_MANAGER_ENGINE_STATE_H_

#include <stdint.h>

#include <limits>

#include <base/time/time.h>

#include "power_manager/dirty_flags.h"
#include "power_manager/display_power_request.h"
#include "power_manager/power_constants.h"
#include "power_manager/power_settings.h"

namespace power_manager {

// Mutable state of PowerStateEngine. Every field is guarded by the engine
// lock.
struct EngineState {
  Wakefulness wakefulness = Wakefulness::kAwake;

  // Categories changed since the last update.
  DirtyFlags dirty;

  // Lifecycle.
  bool system_ready = false;
  bool boot_completed = false;

  // Power supply, as of the last battery-changed signal.
  bool is_powered = false;
  int plug_type = kPlugTypeNone;
  int battery_level = 0;
  int battery_level_when_dream_started = 0;

  DockState dock_state = DockState::kUndocked;

  // Derived from the stay-on-while-plugged-in setting and the power supply.
  bool stay_on = false;

  bool proximity_positive = false;
  bool keyboard_visible = false;

  // kWakeLock* and kUserActivity* bits from the last update.
  int wake_lock_summary = 0;
  int user_activity_summary = 0;

  // Set while a dream reconciliation pass is posted but hasn't started.
  bool sandman_scheduled = false;

  // The last request sent to the display sink, and whether it has been
  // applied.
  DisplayPowerRequest display_power_request;
  bool display_ready = false;
  bool request_wait_for_negative_proximity = false;

  // Notifications held back until the display catches up.
  bool send_wake_up_finished_when_ready = false;
  bool send_go_to_sleep_finished_when_ready = false;

  bool holding_wake_lock_inhibitor = false;
  bool holding_display_inhibitor = false;

  base::TimeTicks last_screen_off_time;

  // When the user activity summary next changes, or null. The worker keeps
  // a single timeout armed for it.
  base::TimeTicks user_activity_timeout_time;
  // Set while a RearmUserActivityTimeout() task is posted but hasn't run.
  bool user_activity_timeout_rearm_posted = false;

  // Set while a wake-up waits for a proximity reading.
  bool proximity_check_pending = false;
  base::TimeTicks proximity_check_event_time;

  // Last values applied to the button and keyboard backlights and the
  // keyboard LEDs, or -1.
  int button_light_brightness = -1;
  int keyboard_light_brightness = -1;
  int caps_light_brightness = -1;
  int func_light_brightness = -1;

  PowerSettings settings;

  // Overrides. Negative values (NaN for the adjustment) disable them.
  int64_t maximum_screen_off_timeout_from_device_admin_ms =
      std::numeric_limits<int32_t>::max();
  int screen_brightness_override_from_window_manager = -1;
  int button_brightness_override_from_window_manager = -1;
  int64_t user_activity_timeout_override_from_window_manager_ms = -1;
  int temporary_screen_brightness_setting_override = -1;
  float temporary_screen_auto_brightness_adjustment_setting_override =
      std::numeric_limits<float>::quiet_NaN();
};

}  // namespace power_manager

#endif  // POWER_MANAGER_ENGINE_STATE_H_
