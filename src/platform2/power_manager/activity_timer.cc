// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/activity_timer.h"

#include <inttypes.h>

#include <algorithm>

#include <base/strings/stringprintf.h>

namespace power_manager {

namespace {

int64_t ToMs(base::TimeTicks time) {
  return (time - base::TimeTicks()).InMilliseconds();
}

}  // namespace

ActivityTimer::ActivityTimer() = default;

ActivityTimer::~ActivityTimer() = default;

// static
base::TimeDelta ActivityTimer::GetScreenOffTimeout(
    base::TimeDelta setting,
    std::optional<base::TimeDelta> device_admin_maximum,
    std::optional<base::TimeDelta> window_manager_override) {
  base::TimeDelta timeout = setting;
  if (device_admin_maximum)
    timeout = std::min(timeout, *device_admin_maximum);
  if (window_manager_override)
    timeout = std::min(timeout, *window_manager_override);
  return std::max(timeout, kMinimumScreenOffTimeout);
}

// static
base::TimeDelta ActivityTimer::GetScreenDimDuration(
    base::TimeDelta screen_off_timeout) {
  const base::TimeDelta ratio_limit = base::Milliseconds(static_cast<int64_t>(
      screen_off_timeout.InMilliseconds() * kMaximumScreenDimRatio));
  return std::min(kScreenDimDuration, ratio_limit);
}

ActivityTimer::RecordResult ActivityTimer::Record(base::TimeTicks event_time,
                                                  bool changes_lights,
                                                  Wakefulness wakefulness,
                                                  bool ready) {
  if (event_time < last_sleep_time_ || event_time < last_wake_time_ ||
      wakefulness == Wakefulness::kAsleep || !ready) {
    return RecordResult::kRejected;
  }

  if (!changes_lights) {
    if (event_time > last_activity_time_no_change_lights_ &&
        event_time > last_activity_time_) {
      last_activity_time_no_change_lights_ = event_time;
      return RecordResult::kUpdated;
    }
  } else if (event_time > last_activity_time_) {
    last_activity_time_ = event_time;
    return RecordResult::kUpdated;
  }
  return RecordResult::kAccepted;
}

ActivityTimer::Summary ActivityTimer::ComputeSummary(
    base::TimeTicks now,
    Wakefulness wakefulness,
    const Schedule& schedule,
    ScreenState current_screen_state) const {
  Summary summary;
  if (wakefulness == Wakefulness::kAsleep)
    return summary;

  base::TimeTicks next_timeout;
  if (last_activity_time_ >= last_wake_time_) {
    const base::TimeTicks bright_end = last_activity_time_ +
                                       schedule.screen_off_timeout -
                                       schedule.screen_dim_duration;
    next_timeout = bright_end;
    if (now < bright_end) {
      summary.keyboard_lit = true;
      const bool buttons_timed_out =
          !schedule.button_timeout.is_zero() &&
          now > last_activity_time_ + schedule.button_timeout;
      summary.buttons_lit = !buttons_timed_out;
      if (!buttons_timed_out && !schedule.button_timeout.is_zero()) {
        next_timeout = std::min(
            bright_end, last_activity_time_ + schedule.button_timeout);
        // The buttons go dark once |now| is strictly past the deadline.
        if (next_timeout <= now)
          next_timeout = now + base::Milliseconds(1);
      }
      summary.bits |= kUserActivityScreenBright;
    } else {
      next_timeout = last_activity_time_ + schedule.screen_off_timeout;
      if (now < next_timeout) {
        summary.buttons_lit = false;
        summary.keyboard_lit = false;
        summary.bits |= kUserActivityScreenDim;
      }
    }
  }

  if (summary.bits == 0 &&
      last_activity_time_no_change_lights_ >= last_wake_time_) {
    next_timeout =
        last_activity_time_no_change_lights_ + schedule.screen_off_timeout;
    if (now < next_timeout && current_screen_state != ScreenState::kOff) {
      summary.bits = current_screen_state == ScreenState::kBright
                         ? kUserActivityScreenBright
                         : kUserActivityScreenDim;
    }
  }

  if (summary.bits != 0)
    summary.next_timeout = next_timeout;
  return summary;
}

std::string ActivityTimer::ToString() const {
  return base::StringPrintf(
      "last wake=%" PRId64 " ms, last sleep=%" PRId64
      " ms, last activity=%" PRId64 " ms, last activity (no lights)=%" PRId64
      " ms",
      ToMs(last_wake_time_), ToMs(last_sleep_time_), ToMs(last_activity_time_),
      ToMs(last_activity_time_no_change_lights_));
}

}  // namespace power_manager
