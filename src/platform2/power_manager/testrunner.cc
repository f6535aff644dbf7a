// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include <base/at_exit.h>
#include <base/command_line.h>
#include <base/logging.h>
#include <base/test/test_timeouts.h>
#include <brillo/syslog_logging.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

int main(int argc, char** argv) {
  base::CommandLine::Init(argc, argv);
  brillo::InitLog(brillo::kLogToStderr);
  // Keep VLOG(1) output from the engine quiet unless --v is passed.
  if (!base::CommandLine::ForCurrentProcess()->HasSwitch("v"))
    logging::SetMinLogLevel(logging::LOGGING_WARNING);

  base::AtExitManager exit_manager;
  TestTimeouts::Initialize();

  testing::InitGoogleTest(&argc, argv);
  testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
