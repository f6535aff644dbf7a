// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_SETTINGS_SOURCE_INTERFACE_H_
#define POWER_MANAGER_SETTINGS_SOURCE_INTERFACE_H_

#include <string>

namespace power_manager {

// Flat key/value store holding user settings. Change notifications are
// delivered separately and carry no key.
class SettingsSourceInterface {
 public:
  virtual ~SettingsSourceInterface() = default;

  // Returns false if |key| is unset.
  virtual bool GetString(const std::string& key, std::string* value) const = 0;

  // Stores |value| under |key|. Returns false if it could not be persisted.
  virtual bool SetString(const std::string& key, const std::string& value) = 0;
};

}  // namespace power_manager

#endif  // POWER_MANAGER_SETTINGS_SOURCE_INTERFACE_H_
