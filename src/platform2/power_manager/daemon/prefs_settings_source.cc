// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/daemon/prefs_settings_source.h"

#include <utility>

#include <base/files/file_util.h>
#include <base/functional/bind.h>
#include <base/logging.h>

namespace power_manager {

PrefsSettingsSource::PrefsSettingsSource(const base::FilePath& path)
    : path_(path) {}

PrefsSettingsSource::~PrefsSettingsSource() = default;

bool PrefsSettingsSource::Init(const base::RepeatingClosure& changed_callback) {
  changed_callback_ = changed_callback;
  Reload();

  watcher_ = std::make_unique<base::FilePathWatcher>();
  if (!watcher_->Watch(
          path_, base::FilePathWatcher::Type::kNonRecursive,
          base::BindRepeating(&PrefsSettingsSource::OnFileChanged,
                              base::Unretained(this)))) {
    LOG(ERROR) << "Failed to watch " << path_.value();
    watcher_.reset();
    return false;
  }
  return true;
}

void PrefsSettingsSource::Reload() {
  brillo::KeyValueStore store;
  if (base::PathExists(path_) && !store.Load(path_))
    LOG(ERROR) << "Failed to parse settings from " << path_.value();

  base::AutoLock lock(lock_);
  store_ = std::move(store);
}

bool PrefsSettingsSource::GetString(const std::string& key,
                                    std::string* value) const {
  base::AutoLock lock(lock_);
  return store_.GetString(key, value);
}

bool PrefsSettingsSource::SetString(const std::string& key,
                                    const std::string& value) {
  base::AutoLock lock(lock_);
  store_.SetString(key, value);
  if (!base::CreateDirectory(path_.DirName())) {
    PLOG(ERROR) << "Failed to create " << path_.DirName().value();
    return false;
  }
  if (!store_.Save(path_)) {
    LOG(ERROR) << "Failed to save settings to " << path_.value();
    return false;
  }
  return true;
}

void PrefsSettingsSource::OnFileChanged(const base::FilePath& path,
                                        bool error) {
  if (error) {
    LOG(ERROR) << "Error while watching " << path.value();
    return;
  }
  VLOG(1) << "Settings file " << path.value() << " changed";
  Reload();
  if (!changed_callback_.is_null())
    changed_callback_.Run();
}

}  // namespace power_manager
