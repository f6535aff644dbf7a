// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_DAEMON_SYSFS_LIGHTS_H_
#define POWER_MANAGER_DAEMON_SYSFS_LIGHTS_H_

#include <stdint.h>

#include <string>

#include <base/files/file_path.h>

#include "power_manager/lights_interface.h"

namespace power_manager {

// Drives LEDs under /sys/class/leds. Lights whose directory is missing are
// ignored.
class SysfsLights : public LightsInterface {
 public:
  static constexpr char kDefaultLedsDir[] = "/sys/class/leds";

  explicit SysfsLights(const base::FilePath& leds_dir);
  SysfsLights(const SysfsLights&) = delete;
  SysfsLights& operator=(const SysfsLights&) = delete;

  ~SysfsLights() override;

  // LightsInterface:
  void SetBrightness(LightId id, int brightness) override;
  void SetFlashing(LightId id, uint32_t color, bool on) override;

 private:
  // Returns the LED directory for |id| or an empty path if there is none.
  base::FilePath GetLightDir(LightId id) const;

  bool WriteAttribute(const base::FilePath& dir,
                      const std::string& attribute,
                      const std::string& value);

  const base::FilePath leds_dir_;
};

}  // namespace power_manager

#endif  // POWER_MANAGER_DAEMON_SYSFS_LIGHTS_H_
