// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_DAEMON_UDEV_H_
#define POWER_MANAGER_DAEMON_UDEV_H_

#include <libudev.h>

#include <memory>
#include <string>
#include <vector>

#include <base/files/file_descriptor_watcher_posix.h>
#include <base/files/file_path.h>
#include <base/functional/callback.h>
#include <base/memory/weak_ptr.h>

namespace power_manager {

// Watches one udev subsystem for device events.
class Udev {
 public:
  // Receives the sysfs path of the device that produced the event.
  using EventCallback = base::RepeatingCallback<void(const base::FilePath&)>;

  virtual ~Udev() = default;

  // Lists the sysfs paths of all devices in the subsystem. Returns false if
  // the enumeration failed.
  virtual bool EnumerateDevices(
      std::vector<base::FilePath>* syspaths_out) const = 0;
};

class UdevImpl : public Udev {
 public:
  explicit UdevImpl(const std::string& subsystem);
  UdevImpl(const UdevImpl&) = delete;
  UdevImpl& operator=(const UdevImpl&) = delete;

  ~UdevImpl() override;

  // Starts monitoring. |event_callback| runs on the calling sequence for every
  // add, remove or change event. Returns false if udev could not be set up.
  bool Init(const EventCallback& event_callback);

  // Udev:
  bool EnumerateDevices(
      std::vector<base::FilePath>* syspaths_out) const override;

 private:
  struct UdevDeleter {
    void operator()(udev* udev) const;
  };

  struct UdevMonitorDeleter {
    void operator()(udev_monitor*) const;
  };

  void OnDeviceAction();

  const std::string subsystem_;
  EventCallback event_callback_;

  std::unique_ptr<udev, UdevDeleter> udev_;
  std::unique_ptr<udev_monitor, UdevMonitorDeleter> monitor_;

  std::unique_ptr<base::FileDescriptorWatcher::Controller> watcher_;

  base::WeakPtrFactory<UdevImpl> weak_factory_{this};
};

}  // namespace power_manager

#endif  // POWER_MANAGER_DAEMON_UDEV_H_
