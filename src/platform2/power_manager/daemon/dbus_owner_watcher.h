// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_DAEMON_DBUS_OWNER_WATCHER_H_
#define POWER_MANAGER_DAEMON_DBUS_OWNER_WATCHER_H_

#include <map>
#include <memory>
#include <string>
#include <utility>

#include <base/functional/callback.h>
#include <base/memory/scoped_refptr.h>
#include <base/synchronization/lock.h>
#include <base/thread_annotations.h>
#include <dbus/bus.h>
#include <dbus/message.h>

#include "power_manager/wake_lock.h"

namespace power_manager {

// Hands out OwnerLiveness objects tied to D-Bus connection names. When a name
// disappears from the bus, every live watch on it fires once.
//
// Must outlive every OwnerLiveness it creates.
class DBusOwnerWatcher {
 public:
  DBusOwnerWatcher();
  DBusOwnerWatcher(const DBusOwnerWatcher&) = delete;
  DBusOwnerWatcher& operator=(const DBusOwnerWatcher&) = delete;

  ~DBusOwnerWatcher();

  // Subscribes to NameOwnerChanged on |bus|.
  void Init(scoped_refptr<dbus::Bus> bus);

  // Returns a liveness handle for the connection |name| (normally the sender
  // of a method call).
  std::unique_ptr<OwnerLiveness> CreateLiveness(const std::string& name);

  // Runs and drops every watch on |name|.
  void HandleNameLost(const std::string& name);

  // Number of armed watches.
  size_t GetWatchCountForTesting();

 private:
  class Liveness;

  void OnNameOwnerChanged(dbus::Signal* signal);

  int AddWatch(const std::string& name, base::OnceClosure on_owner_lost);
  void RemoveWatch(int id);

  base::Lock lock_;
  int next_id_ GUARDED_BY(lock_) = 1;
  // Keyed by watch id.
  std::map<int, std::pair<std::string, base::OnceClosure>> watches_
      GUARDED_BY(lock_);
};

}  // namespace power_manager

#endif  // POWER_MANAGER_DAEMON_DBUS_OWNER_WATCHER_H_
