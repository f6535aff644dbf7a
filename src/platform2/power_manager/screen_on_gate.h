// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_SCREEN_ON_GATE_H_
#define POWER_MANAGER_SCREEN_ON_GATE_H_

#include <string>

#include <base/functional/callback.h>
#include <base/synchronization/lock.h>
#include <base/thread_annotations.h>

namespace power_manager {

// Nesting counter that keeps the screen from turning on while any holder
// (e.g. a lock screen that is still drawing) has it acquired.
class ScreenOnGate {
 public:
  // |released_callback| runs each time the count drops back to zero. It is
  // invoked without the gate's lock held but on the releasing thread, so it
  // should only post work.
  explicit ScreenOnGate(base::RepeatingClosure released_callback);
  ScreenOnGate(const ScreenOnGate&) = delete;
  ScreenOnGate& operator=(const ScreenOnGate&) = delete;

  ~ScreenOnGate();

  void Acquire();
  void Release();

  bool IsHeld() const;
  int GetNestCount() const;

  std::string ToString() const;

 private:
  base::RepeatingClosure released_callback_;

  mutable base::Lock lock_;
  int nest_count_ GUARDED_BY(lock_) = 0;
};

}  // namespace power_manager

#endif  // POWER_MANAGER_SCREEN_ON_GATE_H_
