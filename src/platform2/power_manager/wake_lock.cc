// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/wake_lock.h"

#include <utility>

#include <base/strings/stringprintf.h>

namespace power_manager {

WakeLock::WakeLock(const WakeLockRequest& request,
                   std::unique_ptr<OwnerLiveness> liveness)
    : handle(request.handle),
      flags(request.flags),
      tag(request.tag),
      package_name(request.package_name),
      work_source(request.work_source),
      owner_uid(request.uid),
      owner_pid(request.pid),
      liveness(std::move(liveness)) {}

WakeLock::~WakeLock() = default;

bool WakeLock::IsScreenLock() const {
  switch (level()) {
    case WakeLockLevel::kFull:
    case WakeLockLevel::kScreenBright:
    case WakeLockLevel::kScreenDim:
      return true;
    default:
      return false;
  }
}

bool WakeLock::HasSameProperties(const WakeLockRequest& request) const {
  return flags == request.flags && tag == request.tag &&
         work_source == request.work_source && owner_uid == request.uid &&
         owner_pid == request.pid;
}

void WakeLock::UpdateProperties(const WakeLockRequest& request) {
  flags = request.flags;
  tag = request.tag;
  package_name = request.package_name;
  work_source = request.work_source;
}

std::string WakeLock::ToString() const {
  std::string result = base::StringPrintf(
      "%s '%s'", WakeLockLevelToString(level()).c_str(), tag.c_str());
  if (flags & kAcquireCausesWakeup)
    result += " ACQUIRE_CAUSES_WAKEUP";
  if (flags & kOnAfterRelease)
    result += " ON_AFTER_RELEASE";
  result += base::StringPrintf(" (uid=%d, pid=%d", owner_uid, owner_pid);
  if (!work_source.IsEmpty())
    result += ", ws=" + work_source.ToString();
  result += ")";
  return result;
}

}  // namespace power_manager
