// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/work_source.h"

#include <algorithm>

#include <base/strings/string_number_conversions.h>
#include <base/strings/string_util.h>

namespace power_manager {

WorkSource::WorkSource() = default;

WorkSource::WorkSource(const std::vector<int>& uids) {
  for (int uid : uids)
    Add(uid);
}

WorkSource::WorkSource(const WorkSource& other) = default;

WorkSource& WorkSource::operator=(const WorkSource& other) = default;

WorkSource::~WorkSource() = default;

void WorkSource::Add(int uid, const std::string& name) {
  Entry entry{uid, name};
  if (std::find(entries_.begin(), entries_.end(), entry) == entries_.end())
    entries_.push_back(entry);
}

bool WorkSource::Contains(int uid) const {
  return std::any_of(entries_.begin(), entries_.end(),
                     [uid](const Entry& entry) { return entry.uid == uid; });
}

bool WorkSource::operator==(const WorkSource& other) const {
  if (entries_.size() != other.entries_.size())
    return false;
  // Entry order is not significant.
  for (const auto& entry : entries_) {
    if (std::find(other.entries_.begin(), other.entries_.end(), entry) ==
        other.entries_.end()) {
      return false;
    }
  }
  return true;
}

std::string WorkSource::ToString() const {
  std::vector<std::string> parts;
  for (const auto& entry : entries_) {
    std::string part = base::NumberToString(entry.uid);
    if (!entry.name.empty())
      part += " " + entry.name;
    parts.push_back(part);
  }
  return "{" + base::JoinString(parts, ", ") + "}";
}

}  // namespace power_manager
