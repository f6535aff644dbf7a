// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/daemon/sysfs_lights.h"

#include <base/files/file_enumerator.h>
#include <base/files/file_util.h>
#include <base/logging.h>
#include <base/strings/string_number_conversions.h>
#include <base/strings/string_util.h>

#include "power_manager/power_constants.h"

namespace power_manager {

namespace {

// LED class directory name patterns.
constexpr char kButtonsPattern[] = "*button-backlight";
constexpr char kKeyboardPattern[] = "*kbd_backlight";
constexpr char kAttentionPattern[] = "*attention";
constexpr char kCapsPattern[] = "*capslock";
constexpr char kFuncPattern[] = "*fnlock";

// Flash period of the attention light.
constexpr char kAttentionDelayOnMs[] = "500";
constexpr char kAttentionDelayOffMs[] = "500";

const char* PatternForLight(LightId id) {
  switch (id) {
    case LightId::kButtons:
      return kButtonsPattern;
    case LightId::kKeyboard:
      return kKeyboardPattern;
    case LightId::kAttention:
      return kAttentionPattern;
    case LightId::kCaps:
      return kCapsPattern;
    case LightId::kFunc:
      return kFuncPattern;
  }
  return kAttentionPattern;
}

}  // namespace

SysfsLights::SysfsLights(const base::FilePath& leds_dir)
    : leds_dir_(leds_dir) {}

SysfsLights::~SysfsLights() = default;

void SysfsLights::SetBrightness(LightId id, int brightness) {
  const base::FilePath dir = GetLightDir(id);
  if (dir.empty())
    return;

  // Scale [0, kMaxBrightness] to the LED's own range.
  int max_brightness = kMaxBrightness;
  std::string contents;
  if (base::ReadFileToString(dir.Append("max_brightness"), &contents)) {
    base::TrimWhitespaceASCII(contents, base::TRIM_ALL, &contents);
    if (!base::StringToInt(contents, &max_brightness) || max_brightness <= 0)
      max_brightness = kMaxBrightness;
  }
  const int scaled = brightness * max_brightness / kMaxBrightness;
  VLOG(1) << "Setting " << dir.BaseName().value() << " to " << scaled << "/"
          << max_brightness;
  WriteAttribute(dir, "brightness", base::NumberToString(scaled));
}

void SysfsLights::SetFlashing(LightId id, uint32_t color, bool on) {
  const base::FilePath dir = GetLightDir(id);
  if (dir.empty())
    return;

  // Single-color LEDs; any color with a nonzero RGB part lights it.
  const bool lit = on && (color & 0x00ffffff) != 0;
  VLOG(1) << (lit ? "Flashing " : "Stopping ") << dir.BaseName().value();
  if (!lit) {
    WriteAttribute(dir, "trigger", "none");
    WriteAttribute(dir, "brightness", "0");
    return;
  }
  if (!WriteAttribute(dir, "trigger", "timer"))
    return;
  WriteAttribute(dir, "delay_on", kAttentionDelayOnMs);
  WriteAttribute(dir, "delay_off", kAttentionDelayOffMs);
}

base::FilePath SysfsLights::GetLightDir(LightId id) const {
  base::FileEnumerator enumerator(
      leds_dir_, false,
      base::FileEnumerator::DIRECTORIES | base::FileEnumerator::SHOW_SYM_LINKS,
      PatternForLight(id));
  return enumerator.Next();
}

bool SysfsLights::WriteAttribute(const base::FilePath& dir,
                                 const std::string& attribute,
                                 const std::string& value) {
  const base::FilePath path = dir.Append(attribute);
  if (!base::WriteFile(path, value)) {
    PLOG(ERROR) << "Failed to write \"" << value << "\" to " << path.value();
    return false;
  }
  return true;
}

}  // namespace power_manager
