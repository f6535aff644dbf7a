// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/daemon/sysfs_battery_source.h"

#include <string>

#include <base/files/file_path.h>
#include <base/files/file_util.h>
#include <base/files/scoped_temp_dir.h>
#include <gtest/gtest.h>

namespace power_manager {

class SysfsBatterySourceTest : public testing::Test {
 public:
  SysfsBatterySourceTest() = default;
  SysfsBatterySourceTest(const SysfsBatterySourceTest&) = delete;
  SysfsBatterySourceTest& operator=(const SysfsBatterySourceTest&) = delete;

  void SetUp() override { ASSERT_TRUE(temp_dir_.CreateUniqueTempDir()); }

 protected:
  // Creates a supply directory holding |type| and, when non-empty, the
  // |attribute| file.
  void WriteSupply(const std::string& name,
                   const std::string& type,
                   const std::string& attribute,
                   const std::string& value) {
    const base::FilePath dir = temp_dir_.GetPath().Append(name);
    ASSERT_TRUE(base::CreateDirectory(dir));
    ASSERT_TRUE(base::WriteFile(dir.Append("type"), type + "\n"));
    if (!attribute.empty())
      ASSERT_TRUE(base::WriteFile(dir.Append(attribute), value + "\n"));
  }

  void WriteCharger(const std::string& name,
                    const std::string& type,
                    bool online) {
    WriteSupply(name, type, "online", online ? "1" : "0");
  }

  void WriteBattery(const std::string& name, int capacity) {
    WriteSupply(name, "Battery", "capacity", std::to_string(capacity));
  }

  base::ScopedTempDir temp_dir_;
};

TEST_F(SysfsBatterySourceTest, NoSuppliesMeansUnpoweredAndFull) {
  SysfsBatterySource source(temp_dir_.GetPath());
  EXPECT_TRUE(source.Refresh());
  EXPECT_FALSE(source.IsPowered());
  EXPECT_EQ(source.GetPlugType(), kPlugTypeNone);
  EXPECT_EQ(source.GetBatteryLevel(), 100);

  // Nothing changed on the second pass.
  EXPECT_FALSE(source.Refresh());
}

TEST_F(SysfsBatterySourceTest, ReportsOnlineChargers) {
  WriteCharger("AC", "Mains", true);
  WriteCharger("usb0", "USB_PD", true);
  WriteCharger("wlc", "Wireless", false);
  WriteBattery("BAT0", 42);

  SysfsBatterySource source(temp_dir_.GetPath());
  ASSERT_TRUE(source.Refresh());
  EXPECT_TRUE(source.IsPowered());
  EXPECT_TRUE(source.IsPoweredBy(kPlugTypeUsb));
  EXPECT_FALSE(source.IsPoweredBy(kPlugTypeWireless));
  // AC wins over the other sources.
  EXPECT_EQ(source.GetPlugType(), kPlugTypeAc);
  EXPECT_EQ(source.GetBatteryLevel(), 42);
}

TEST_F(SysfsBatterySourceTest, PlugTypePriority) {
  WriteCharger("usb0", "USB", true);
  WriteCharger("wlc", "Wireless", true);
  SysfsBatterySource source(temp_dir_.GetPath());
  source.Refresh();
  EXPECT_EQ(source.GetPlugType(), kPlugTypeUsb);

  WriteCharger("usb0", "USB", false);
  EXPECT_TRUE(source.Refresh());
  EXPECT_EQ(source.GetPlugType(), kPlugTypeWireless);
  EXPECT_TRUE(source.IsPoweredBy(kPlugTypeAny));
}

TEST_F(SysfsBatterySourceTest, BatteryLevelIsClamped) {
  WriteBattery("BAT0", 150);
  SysfsBatterySource source(temp_dir_.GetPath());
  source.Refresh();
  EXPECT_EQ(source.GetBatteryLevel(), 100);

  WriteBattery("BAT0", 37);
  EXPECT_TRUE(source.Refresh());
  EXPECT_EQ(source.GetBatteryLevel(), 37);
}

TEST_F(SysfsBatterySourceTest, IgnoresIncompleteSupplies) {
  // No type file.
  ASSERT_TRUE(base::CreateDirectory(temp_dir_.GetPath().Append("bogus")));
  // Charger without an online file.
  WriteSupply("AC", "Mains", "", "");
  // Unknown supply type.
  WriteSupply("ups", "UPS", "online", "1");

  SysfsBatterySource source(temp_dir_.GetPath());
  source.Refresh();
  EXPECT_FALSE(source.IsPowered());
  EXPECT_EQ(source.GetBatteryLevel(), 100);
}

}  // namespace power_manager
