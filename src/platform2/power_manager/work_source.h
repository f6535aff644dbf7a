// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_WORK_SOURCE_H_
#define POWER_MANAGER_WORK_SOURCE_H_

#include <string>
#include <vector>

namespace power_manager {

// The set of uids a wake lock's power use is attributed to. Each uid may carry
// an optional name identifying the work done on its behalf.
class WorkSource {
 public:
  struct Entry {
    int uid = 0;
    std::string name;

    bool operator==(const Entry& other) const {
      return uid == other.uid && name == other.name;
    }
  };

  WorkSource();
  explicit WorkSource(const std::vector<int>& uids);
  WorkSource(const WorkSource& other);
  WorkSource& operator=(const WorkSource& other);
  ~WorkSource();

  // Adds |uid| unless an identical entry is already present.
  void Add(int uid, const std::string& name = std::string());

  bool Contains(int uid) const;
  bool IsEmpty() const { return entries_.empty(); }
  size_t size() const { return entries_.size(); }
  const std::vector<Entry>& entries() const { return entries_; }

  bool operator==(const WorkSource& other) const;
  bool operator!=(const WorkSource& other) const { return !(*this == other); }

  // Returns e.g. "{1000, 10023 sync}".
  std::string ToString() const;

 private:
  std::vector<Entry> entries_;
};

}  // namespace power_manager

#endif  // POWER_MANAGER_WORK_SOURCE_H_
