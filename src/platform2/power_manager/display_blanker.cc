// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/display_blanker.h"

#include <base/check.h>
#include <base/logging.h>

namespace power_manager {

DisplayBlanker::DisplayBlanker(Delegate* delegate) : delegate_(delegate) {
  CHECK(delegate_);
}

DisplayBlanker::~DisplayBlanker() = default;

void DisplayBlanker::BlankAllDisplays() {
  base::AutoLock lock(lock_);
  delegate_->SetAutoSuspend(true);
  delegate_->SetInteractive(false);
  delegate_->SetDisplaysBlanked(true);
  blanked_ = true;
}

void DisplayBlanker::UnblankAllDisplays() {
  base::AutoLock lock(lock_);
  delegate_->SetDisplaysBlanked(false);
  delegate_->SetInteractive(true);
  delegate_->SetAutoSuspend(false);
  blanked_ = false;
}

bool DisplayBlanker::IsBlanked() const {
  base::AutoLock lock(lock_);
  return blanked_;
}

std::string DisplayBlanker::ToString() const {
  base::AutoLock lock(lock_);
  return std::string("blanked=") + (blanked_ ? "true" : "false");
}

}  // namespace power_manager
