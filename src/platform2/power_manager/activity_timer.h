// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_ACTIVITY_TIMER_H_
#define POWER_MANAGER_ACTIVITY_TIMER_H_

#include <optional>
#include <string>

#include <base/time/time.h>

#include "power_manager/power_constants.h"

namespace power_manager {

// Tracks user activity and derives the bright/dim/off schedule from it.
//
// Two activity timestamps are kept: activity that brightens the screen and
// buttons, and activity that only keeps the device from going to sleep
// without changing the lights (e.g. an ON_AFTER_RELEASE wake lock being
// released). Both only move forward.
class ActivityTimer {
 public:
  enum class RecordResult {
    // The event predates the last wake or sleep, the device is asleep or boot
    // has not finished.
    kRejected,
    // The event was valid but did not advance any timestamp.
    kAccepted,
    // A timestamp advanced; the schedule must be recomputed.
    kUpdated,
  };

  struct Schedule {
    base::TimeDelta screen_off_timeout;
    base::TimeDelta screen_dim_duration;
    // Zero means the buttons stay lit for the whole bright period.
    base::TimeDelta button_timeout;
  };

  struct Summary {
    // kUserActivityScreenBright and/or kUserActivityScreenDim.
    int bits = 0;
    // When the summary next changes on its own, or null if it won't.
    base::TimeTicks next_timeout;
    // Desired button and keyboard backlight state. Unset means leave the
    // lights as they are.
    std::optional<bool> buttons_lit;
    std::optional<bool> keyboard_lit;
  };

  ActivityTimer();
  ActivityTimer(const ActivityTimer&) = delete;
  ActivityTimer& operator=(const ActivityTimer&) = delete;

  ~ActivityTimer();

  // Returns the effective screen off timeout: |setting| lowered to the device
  // admin and window manager ceilings when present, but never below
  // kMinimumScreenOffTimeout.
  static base::TimeDelta GetScreenOffTimeout(
      base::TimeDelta setting,
      std::optional<base::TimeDelta> device_admin_maximum,
      std::optional<base::TimeDelta> window_manager_override);

  // Returns how long before |screen_off_timeout| the screen dims.
  static base::TimeDelta GetScreenDimDuration(
      base::TimeDelta screen_off_timeout);

  base::TimeTicks last_wake_time() const { return last_wake_time_; }
  base::TimeTicks last_sleep_time() const { return last_sleep_time_; }
  base::TimeTicks last_activity_time() const { return last_activity_time_; }
  base::TimeTicks last_activity_time_no_change_lights() const {
    return last_activity_time_no_change_lights_;
  }

  void OnWake(base::TimeTicks time) { last_wake_time_ = time; }
  void OnSleep(base::TimeTicks time) { last_sleep_time_ = time; }

  // Records user activity at |event_time|. |ready| is false until both
  // startup and boot have completed.
  RecordResult Record(base::TimeTicks event_time,
                      bool changes_lights,
                      Wakefulness wakefulness,
                      bool ready);

  // Computes the summary at |now|. |current_screen_state| is the screen state
  // last requested from the display; activity that doesn't change the lights
  // keeps it but never brightens it.
  Summary ComputeSummary(base::TimeTicks now,
                         Wakefulness wakefulness,
                         const Schedule& schedule,
                         ScreenState current_screen_state) const;

  std::string ToString() const;

 private:
  base::TimeTicks last_wake_time_;
  base::TimeTicks last_sleep_time_;
  base::TimeTicks last_activity_time_;
  base::TimeTicks last_activity_time_no_change_lights_;
};

}  // namespace power_manager

#endif  // POWER_MANAGER_ACTIVITY_TIMER_H_
