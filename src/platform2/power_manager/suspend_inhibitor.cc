// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/suspend_inhibitor.h"

#include <base/check.h>
#include <base/logging.h>
#include <base/strings/stringprintf.h>

namespace power_manager {

SuspendInhibitor::SuspendInhibitor(const std::string& name,
                                   SuspendInhibitorBackend* backend)
    : name_(name), backend_(backend) {
  CHECK(backend_);
}

SuspendInhibitor::~SuspendInhibitor() {
  base::AutoLock lock(lock_);
  if (reference_count_ != 0) {
    LOG(WARNING) << "Suspend inhibitor \"" << name_
                 << "\" destroyed while held (count " << reference_count_
                 << ")";
    backend_->Release(name_);
  }
}

void SuspendInhibitor::Acquire() {
  base::AutoLock lock(lock_);
  reference_count_ += 1;
  if (reference_count_ == 1) {
    VLOG(1) << "Acquiring suspend inhibitor \"" << name_ << "\"";
    backend_->Acquire(name_);
  }
}

void SuspendInhibitor::Release() {
  base::AutoLock lock(lock_);
  reference_count_ -= 1;
  if (reference_count_ == 0) {
    VLOG(1) << "Releasing suspend inhibitor \"" << name_ << "\"";
    backend_->Release(name_);
  } else if (reference_count_ < 0) {
    LOG(DFATAL) << "Suspend inhibitor \"" << name_
                << "\" was released without being acquired";
    reference_count_ = 0;
  }
}

int SuspendInhibitor::GetReferenceCount() const {
  base::AutoLock lock(lock_);
  return reference_count_;
}

bool SuspendInhibitor::IsHeld() const {
  return GetReferenceCount() > 0;
}

std::string SuspendInhibitor::ToString() const {
  base::AutoLock lock(lock_);
  return base::StringPrintf("%s: ref count=%d", name_.c_str(),
                            reference_count_);
}

}  // namespace power_manager
