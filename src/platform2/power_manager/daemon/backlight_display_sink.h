// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_DAEMON_BACKLIGHT_DISPLAY_SINK_H_
#define POWER_MANAGER_DAEMON_BACKLIGHT_DISPLAY_SINK_H_

#include <optional>

#include <base/files/file_path.h>
#include <base/memory/scoped_refptr.h>
#include <base/synchronization/lock.h>
#include <base/task/sequenced_task_runner.h>
#include <base/thread_annotations.h>

#include "power_manager/display_blanker.h"
#include "power_manager/display_power_request.h"
#include "power_manager/display_sink_interface.h"

namespace power_manager {

// Applies display power requests to a sysfs backlight. A request that changes
// the brightness is reported as not ready, written on |task_runner| and then
// acknowledged through OnDisplayStateChanged(). There is no proximity sensor.
class BacklightDisplaySink : public DisplaySinkInterface,
                             public DisplayBlanker::Delegate {
 public:
  static constexpr char kDefaultBacklightDir[] = "/sys/class/backlight";

  // Brightness used for the dim state, in [0, kMaxBrightness].
  static constexpr int kDimBrightness = 10;

  // |backlight_dir| holds one directory per backlight; the first one is used.
  // |power_dir| is normally /sys/power.
  BacklightDisplaySink(const base::FilePath& backlight_dir,
                       const base::FilePath& power_dir,
                       scoped_refptr<base::SequencedTaskRunner> task_runner);
  BacklightDisplaySink(const BacklightDisplaySink&) = delete;
  BacklightDisplaySink& operator=(const BacklightDisplaySink&) = delete;

  ~BacklightDisplaySink() override;

  // Blanks |blanker|'s displays when the backlight turns off and unblanks
  // them when it turns back on. Must be called before the first request.
  void set_display_blanker(DisplayBlanker* blanker) { blanker_ = blanker; }

  // Returns the brightness in [0, kMaxBrightness] that |request| asks for.
  static int GetTargetBrightness(const DisplayPowerRequest& request);

  // DisplaySinkInterface:
  void SetDelegate(Delegate* delegate) override;
  bool RequestPowerState(const DisplayPowerRequest& request,
                         bool wait_for_negative_proximity) override;
  bool IsProximitySensorAvailable() const override;

  // DisplayBlanker::Delegate:
  void SetDisplaysBlanked(bool blanked) override;
  void SetInteractive(bool interactive) override;
  void SetAutoSuspend(bool enabled) override;

 private:
  // Writes the pending brightness and reports back to the delegate.
  void ApplyPendingBrightness();

  void WriteBrightness(int brightness);

  const base::FilePath backlight_dir_;
  const base::FilePath power_dir_;
  scoped_refptr<base::SequencedTaskRunner> task_runner_;
  DisplayBlanker* blanker_ = nullptr;  // Not owned.

  base::Lock lock_;
  Delegate* delegate_ GUARDED_BY(lock_) = nullptr;
  // Brightness most recently written, in [0, kMaxBrightness].
  std::optional<int> applied_brightness_ GUARDED_BY(lock_);
  std::optional<int> pending_brightness_ GUARDED_BY(lock_);
  bool apply_scheduled_ GUARDED_BY(lock_) = false;
};

}  // namespace power_manager

#endif  // POWER_MANAGER_DAEMON_BACKLIGHT_DISPLAY_SINK_H_
