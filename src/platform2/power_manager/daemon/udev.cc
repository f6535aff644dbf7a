// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/daemon/udev.h"

#include <string.h>

#include <base/check.h>
#include <base/functional/bind.h>
#include <base/logging.h>

namespace {

struct UdevDeviceDeleter {
  void operator()(udev_device* device) const { udev_device_unref(device); }
};

struct UdevEnumerateDeleter {
  void operator()(udev_enumerate* enumerate) const {
    udev_enumerate_unref(enumerate);
  }
};

}  // namespace

namespace power_manager {

UdevImpl::UdevImpl(const std::string& subsystem) : subsystem_(subsystem) {}

UdevImpl::~UdevImpl() = default;

bool UdevImpl::Init(const EventCallback& event_callback) {
  event_callback_ = event_callback;

  udev_.reset(udev_new());
  if (!udev_) {
    LOG(ERROR) << "Failed to create libudev instance";
    return false;
  }

  monitor_.reset(udev_monitor_new_from_netlink(udev_.get(), "udev"));
  if (!monitor_) {
    LOG(ERROR) << "Failed to create udev monitor";
    return false;
  }

  if (udev_monitor_filter_add_match_subsystem_devtype(
          monitor_.get(), subsystem_.c_str(), nullptr) < 0) {
    LOG(ERROR) << "Failed to create udev filter for " << subsystem_;
    return false;
  }

  if (udev_monitor_enable_receiving(monitor_.get()) < 0) {
    LOG(ERROR) << "Failed to enable receiving on udev monitor";
    return false;
  }

  watcher_ = base::FileDescriptorWatcher::WatchReadable(
      udev_monitor_get_fd(monitor_.get()),
      base::BindRepeating(&UdevImpl::OnDeviceAction,
                          weak_factory_.GetWeakPtr()));
  if (!watcher_) {
    LOG(ERROR) << "Failed to register listener on udev descriptor";
    return false;
  }

  return true;
}

bool UdevImpl::EnumerateDevices(
    std::vector<base::FilePath>* syspaths_out) const {
  DCHECK(udev_) << "Udev not initialized";

  std::unique_ptr<udev_enumerate, UdevEnumerateDeleter> enumerate(
      udev_enumerate_new(udev_.get()));
  if (!enumerate) {
    LOG(ERROR) << "Failed to create udev enumeration";
    return false;
  }

  if (udev_enumerate_add_match_subsystem(enumerate.get(),
                                         subsystem_.c_str()) < 0) {
    LOG(ERROR) << "Failed to add " << subsystem_ << " filter to enumeration";
    return false;
  }

  if (udev_enumerate_scan_devices(enumerate.get()) < 0) {
    LOG(ERROR) << "Failed to scan devices with udev";
    return false;
  }

  udev_list_entry* entry;
  udev_list_entry* devices_list =
      udev_enumerate_get_list_entry(enumerate.get());
  udev_list_entry_foreach(entry, devices_list) {
    const char* name = udev_list_entry_get_name(entry);
    if (!name) {
      LOG(WARNING) << "Failed to get entry name";
      continue;
    }
    syspaths_out->push_back(base::FilePath(name));
  }

  return true;
}

void UdevImpl::OnDeviceAction() {
  std::unique_ptr<udev_device, UdevDeviceDeleter> device(
      udev_monitor_receive_device(monitor_.get()));
  if (!device)
    return;

  const char* action = udev_device_get_action(device.get());
  if (!action) {
    LOG(WARNING) << "Failed to get device action";
    return;
  }

  const char* syspath = udev_device_get_syspath(device.get());
  if (!syspath) {
    LOG(WARNING) << "Failed to get device syspath";
    return;
  }

  VLOG(1) << "udev " << action << " event for " << syspath;
  if (!strcmp(action, "add") || !strcmp(action, "remove") ||
      !strcmp(action, "change")) {
    event_callback_.Run(base::FilePath(syspath));
  }
}

void UdevImpl::UdevDeleter::operator()(udev* udev) const {
  udev_unref(udev);
}

void UdevImpl::UdevMonitorDeleter::operator()(udev_monitor* monitor) const {
  udev_monitor_unref(monitor);
}

}  // namespace power_manager
