// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_DAEMON_PREFS_SETTINGS_SOURCE_H_
#define POWER_MANAGER_DAEMON_PREFS_SETTINGS_SOURCE_H_

#include <memory>
#include <string>

#include <base/files/file_path.h>
#include <base/files/file_path_watcher.h>
#include <base/functional/callback.h>
#include <base/synchronization/lock.h>
#include <base/thread_annotations.h>
#include <brillo/key_value_store.h>

#include "power_manager/settings_source_interface.h"

namespace power_manager {

// User settings stored as KEY=VALUE lines in a file. Edits made by other
// processes are picked up through a file watcher.
class PrefsSettingsSource : public SettingsSourceInterface {
 public:
  static constexpr char kDefaultSettingsPath[] =
      "/var/lib/power_manager/settings";

  explicit PrefsSettingsSource(const base::FilePath& path);
  PrefsSettingsSource(const PrefsSettingsSource&) = delete;
  PrefsSettingsSource& operator=(const PrefsSettingsSource&) = delete;

  ~PrefsSettingsSource() override;

  // Loads the file and starts watching it. |changed_callback| runs on the
  // calling sequence after every reload caused by a change on disk. Returns
  // false if the watch could not be set up; the settings are still usable.
  bool Init(const base::RepeatingClosure& changed_callback);

  // Rereads the file. A missing file yields empty settings.
  void Reload();

  // SettingsSourceInterface:
  bool GetString(const std::string& key, std::string* value) const override;
  bool SetString(const std::string& key, const std::string& value) override;

 private:
  void OnFileChanged(const base::FilePath& path, bool error);

  const base::FilePath path_;
  base::RepeatingClosure changed_callback_;
  std::unique_ptr<base::FilePathWatcher> watcher_;

  mutable base::Lock lock_;
  brillo::KeyValueStore store_ GUARDED_BY(lock_);
};

}  // namespace power_manager

#endif  // POWER_MANAGER_DAEMON_PREFS_SETTINGS_SOURCE_H_
