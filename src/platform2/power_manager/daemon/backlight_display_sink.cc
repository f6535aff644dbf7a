// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/daemon/backlight_display_sink.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include <base/files/file_enumerator.h>
#include <base/files/file_util.h>
#include <base/functional/bind.h>
#include <base/location.h>
#include <base/logging.h>
#include <base/strings/string_number_conversions.h>
#include <base/strings/string_util.h>

#include "power_manager/power_constants.h"

namespace power_manager {

namespace {

// Values for the backlight's bl_power attribute.
constexpr char kBlPowerOn[] = "0";
constexpr char kBlPowerOff[] = "4";

base::FilePath FindBacklight(const base::FilePath& backlight_dir) {
  base::FileEnumerator enumerator(
      backlight_dir, false,
      base::FileEnumerator::DIRECTORIES | base::FileEnumerator::SHOW_SYM_LINKS);
  return enumerator.Next();
}

}  // namespace

BacklightDisplaySink::BacklightDisplaySink(
    const base::FilePath& backlight_dir,
    const base::FilePath& power_dir,
    scoped_refptr<base::SequencedTaskRunner> task_runner)
    : backlight_dir_(backlight_dir),
      power_dir_(power_dir),
      task_runner_(std::move(task_runner)) {}

BacklightDisplaySink::~BacklightDisplaySink() = default;

// static
int BacklightDisplaySink::GetTargetBrightness(
    const DisplayPowerRequest& request) {
  switch (request.screen_state) {
    case ScreenState::kOff:
      return 0;
    case ScreenState::kDim:
      return std::min(kDimBrightness, request.screen_brightness);
    case ScreenState::kBright:
      break;
  }
  if (request.block_screen_on)
    return 0;

  int brightness = request.screen_brightness;
  if (request.use_auto_brightness) {
    // Without a light sensor the adjustment scales the default level.
    brightness = static_cast<int>(std::lround(
        brightness * (1.0f + request.screen_auto_brightness_adjustment)));
  }
  return std::clamp(brightness, 1, kMaxBrightness);
}

void BacklightDisplaySink::SetDelegate(Delegate* delegate) {
  base::AutoLock lock(lock_);
  delegate_ = delegate;
}

bool BacklightDisplaySink::RequestPowerState(
    const DisplayPowerRequest& request, bool wait_for_negative_proximity) {
  const int brightness = GetTargetBrightness(request);

  base::AutoLock lock(lock_);
  pending_brightness_ = brightness;
  if (applied_brightness_ == brightness)
    return true;

  if (!apply_scheduled_) {
    apply_scheduled_ = true;
    task_runner_->PostTask(
        FROM_HERE, base::BindOnce(&BacklightDisplaySink::ApplyPendingBrightness,
                                  base::Unretained(this)));
  }
  return false;
}

bool BacklightDisplaySink::IsProximitySensorAvailable() const {
  return false;
}

void BacklightDisplaySink::SetDisplaysBlanked(bool blanked) {
  const base::FilePath backlight = FindBacklight(backlight_dir_);
  if (backlight.empty())
    return;
  const base::FilePath path = backlight.Append("bl_power");
  if (!base::WriteFile(path, blanked ? kBlPowerOff : kBlPowerOn))
    PLOG(WARNING) << "Failed to write " << path.value();
}

void BacklightDisplaySink::SetInteractive(bool interactive) {
  LOG(INFO) << "Display " << (interactive ? "interactive" : "non-interactive");
}

void BacklightDisplaySink::SetAutoSuspend(bool enabled) {
  const base::FilePath path = power_dir_.Append("autosleep");
  if (!base::WriteFile(path, enabled ? "mem" : "off"))
    PLOG(WARNING) << "Failed to write " << path.value();
}

void BacklightDisplaySink::ApplyPendingBrightness() {
  int brightness = 0;
  bool was_off = true;
  {
    base::AutoLock lock(lock_);
    apply_scheduled_ = false;
    if (!pending_brightness_ || applied_brightness_ == pending_brightness_)
      return;
    brightness = *pending_brightness_;
    was_off = !applied_brightness_ || *applied_brightness_ == 0;
  }

  if (blanker_ && was_off && brightness > 0)
    blanker_->UnblankAllDisplays();
  WriteBrightness(brightness);
  if (blanker_ && !was_off && brightness == 0)
    blanker_->BlankAllDisplays();

  Delegate* delegate = nullptr;
  {
    base::AutoLock lock(lock_);
    applied_brightness_ = brightness;
    delegate = delegate_;
  }
  if (delegate)
    delegate->OnDisplayStateChanged();
}

void BacklightDisplaySink::WriteBrightness(int brightness) {
  const base::FilePath backlight = FindBacklight(backlight_dir_);
  if (backlight.empty()) {
    VLOG(1) << "No backlight under " << backlight_dir_.value();
    return;
  }

  int max_brightness = kMaxBrightness;
  std::string contents;
  if (base::ReadFileToString(backlight.Append("max_brightness"), &contents)) {
    base::TrimWhitespaceASCII(contents, base::TRIM_ALL, &contents);
    if (!base::StringToInt(contents, &max_brightness) || max_brightness <= 0)
      max_brightness = kMaxBrightness;
  }

  const int level = brightness * max_brightness / kMaxBrightness;
  VLOG(1) << "Setting backlight to " << level << "/" << max_brightness;
  const base::FilePath path = backlight.Append("brightness");
  if (!base::WriteFile(path, base::NumberToString(level)))
    PLOG(ERROR) << "Failed to write " << path.value();
}

}  // namespace power_manager
