// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_FAKE_SETTINGS_SOURCE_H_
#define POWER_MANAGER_FAKE_SETTINGS_SOURCE_H_

#include <map>
#include <string>

#include "power_manager/settings_source_interface.h"

namespace power_manager {

// In-memory settings store.
class FakeSettingsSource : public SettingsSourceInterface {
 public:
  FakeSettingsSource() = default;
  FakeSettingsSource(const FakeSettingsSource&) = delete;
  FakeSettingsSource& operator=(const FakeSettingsSource&) = delete;

  ~FakeSettingsSource() override = default;

  // Makes SetString() fail without storing anything.
  void set_fail_writes(bool fail_writes) { fail_writes_ = fail_writes; }

  void Clear(const std::string& key) { values_.erase(key); }

  // SettingsSourceInterface:
  bool GetString(const std::string& key, std::string* value) const override {
    auto it = values_.find(key);
    if (it == values_.end())
      return false;
    *value = it->second;
    return true;
  }
  bool SetString(const std::string& key, const std::string& value) override {
    if (fail_writes_)
      return false;
    values_[key] = value;
    return true;
  }

 private:
  std::map<std::string, std::string> values_;
  bool fail_writes_ = false;
};

}  // namespace power_manager

#endif  // POWER_MANAGER_FAKE_SETTINGS_SOURCE_H_
