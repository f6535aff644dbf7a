// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/screen_on_gate.h"

#include <utility>

#include <base/logging.h>
#include <base/strings/stringprintf.h>

namespace power_manager {

ScreenOnGate::ScreenOnGate(base::RepeatingClosure released_callback)
    : released_callback_(std::move(released_callback)) {}

ScreenOnGate::~ScreenOnGate() = default;

void ScreenOnGate::Acquire() {
  base::AutoLock lock(lock_);
  nest_count_ += 1;
  VLOG(1) << "Screen on gate acquired, nest count " << nest_count_;
}

void ScreenOnGate::Release() {
  {
    base::AutoLock lock(lock_);
    nest_count_ -= 1;
    if (nest_count_ > 0)
      return;
    if (nest_count_ < 0) {
      LOG(DFATAL) << "Screen on gate was released without being acquired";
      nest_count_ = 0;
      return;
    }
  }
  VLOG(1) << "Screen on gate fully released";
  if (!released_callback_.is_null())
    released_callback_.Run();
}

bool ScreenOnGate::IsHeld() const {
  return GetNestCount() > 0;
}

int ScreenOnGate::GetNestCount() const {
  base::AutoLock lock(lock_);
  return nest_count_;
}

std::string ScreenOnGate::ToString() const {
  base::AutoLock lock(lock_);
  return base::StringPrintf("screen on gate: nest count=%d", nest_count_);
}

}  // namespace power_manager
