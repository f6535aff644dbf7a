// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_DISPLAY_BLANKER_H_
#define POWER_MANAGER_DISPLAY_BLANKER_H_

#include <string>

#include <base/synchronization/lock.h>
#include <base/thread_annotations.h>

namespace power_manager {

// Forwards blank/unblank requests to the display hardware. Blanking also
// drops the system out of interactive mode and allows autosuspend.
class DisplayBlanker {
 public:
  class Delegate {
   public:
    virtual ~Delegate() = default;

    virtual void SetDisplaysBlanked(bool blanked) = 0;
    virtual void SetInteractive(bool interactive) = 0;
    virtual void SetAutoSuspend(bool enabled) = 0;
  };

  explicit DisplayBlanker(Delegate* delegate);
  DisplayBlanker(const DisplayBlanker&) = delete;
  DisplayBlanker& operator=(const DisplayBlanker&) = delete;

  ~DisplayBlanker();

  void BlankAllDisplays();
  void UnblankAllDisplays();

  bool IsBlanked() const;
  std::string ToString() const;

 private:
  Delegate* delegate_;  // Not owned.

  mutable base::Lock lock_;
  bool blanked_ GUARDED_BY(lock_) = false;
};

}  // namespace power_manager

#endif  // POWER_MANAGER_DISPLAY_BLANKER_H_
