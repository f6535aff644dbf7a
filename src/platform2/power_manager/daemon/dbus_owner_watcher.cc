// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/daemon/dbus_owner_watcher.h"

#include <string>
#include <utility>
#include <vector>

#include <base/functional/bind.h>
#include <base/logging.h>
#include <dbus/object_path.h>
#include <dbus/object_proxy.h>

namespace power_manager {

namespace {

void LogOnSignalConnected(const std::string& interface_name,
                          const std::string& signal_name,
                          bool success) {
  if (!success)
    LOG(ERROR) << "Failed to connect to signal " << signal_name
               << " of interface " << interface_name;
}

}  // namespace

class DBusOwnerWatcher::Liveness : public OwnerLiveness {
 public:
  Liveness(DBusOwnerWatcher* watcher, const std::string& name)
      : watcher_(watcher), name_(name) {}
  Liveness(const Liveness&) = delete;
  Liveness& operator=(const Liveness&) = delete;

  ~Liveness() override {
    if (id_)
      watcher_->RemoveWatch(id_);
  }

  // OwnerLiveness:
  bool Watch(base::OnceClosure on_owner_lost) override {
    if (name_.empty())
      return false;
    if (id_)
      watcher_->RemoveWatch(id_);
    id_ = watcher_->AddWatch(name_, std::move(on_owner_lost));
    return true;
  }

 private:
  DBusOwnerWatcher* watcher_;  // Not owned.
  const std::string name_;
  int id_ = 0;
};

DBusOwnerWatcher::DBusOwnerWatcher() = default;

DBusOwnerWatcher::~DBusOwnerWatcher() = default;

void DBusOwnerWatcher::Init(scoped_refptr<dbus::Bus> bus) {
  dbus::ObjectProxy* bus_proxy = bus->GetObjectProxy(
      dbus::kDBusServiceName, dbus::ObjectPath(dbus::kDBusServicePath));
  bus_proxy->ConnectToSignal(
      dbus::kDBusInterface, "NameOwnerChanged",
      base::BindRepeating(&DBusOwnerWatcher::OnNameOwnerChanged,
                          base::Unretained(this)),
      base::BindOnce(&LogOnSignalConnected));
}

std::unique_ptr<OwnerLiveness> DBusOwnerWatcher::CreateLiveness(
    const std::string& name) {
  return std::make_unique<Liveness>(this, name);
}

void DBusOwnerWatcher::HandleNameLost(const std::string& name) {
  std::vector<base::OnceClosure> callbacks;
  {
    base::AutoLock lock(lock_);
    for (auto it = watches_.begin(); it != watches_.end();) {
      if (it->second.first == name) {
        callbacks.push_back(std::move(it->second.second));
        it = watches_.erase(it);
      } else {
        ++it;
      }
    }
  }
  if (!callbacks.empty())
    VLOG(1) << name << " left the bus; " << callbacks.size() << " watch(es)";
  // Callbacks may destroy Liveness objects, so run them without the lock.
  for (base::OnceClosure& callback : callbacks)
    std::move(callback).Run();
}

size_t DBusOwnerWatcher::GetWatchCountForTesting() {
  base::AutoLock lock(lock_);
  return watches_.size();
}

void DBusOwnerWatcher::OnNameOwnerChanged(dbus::Signal* signal) {
  dbus::MessageReader reader(signal);
  std::string name, old_owner, new_owner;
  if (!reader.PopString(&name) || !reader.PopString(&old_owner) ||
      !reader.PopString(&new_owner)) {
    LOG(ERROR) << "Received invalid NameOwnerChanged signal";
    return;
  }

  // Only names dropping off the bus are interesting.
  if (name.empty() || !new_owner.empty())
    return;
  HandleNameLost(name);
}

int DBusOwnerWatcher::AddWatch(const std::string& name,
                               base::OnceClosure on_owner_lost) {
  base::AutoLock lock(lock_);
  const int id = next_id_++;
  watches_.emplace(id, std::make_pair(name, std::move(on_owner_lost)));
  return id;
}

void DBusOwnerWatcher::RemoveWatch(int id) {
  base::AutoLock lock(lock_);
  watches_.erase(id);
}

}  // namespace power_manager
