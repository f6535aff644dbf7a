// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_MOCK_SUSPEND_INHIBITOR_BACKEND_H_
#define POWER_MANAGER_MOCK_SUSPEND_INHIBITOR_BACKEND_H_

#include <gmock/gmock.h>

#include <string>

#include "power_manager/suspend_inhibitor.h"

namespace power_manager {

class MockSuspendInhibitorBackend : public SuspendInhibitorBackend {
 public:
  MockSuspendInhibitorBackend() = default;
  ~MockSuspendInhibitorBackend() override = default;

  MOCK_METHOD(void, Acquire, (const std::string& name), (override));
  MOCK_METHOD(void, Release, (const std::string& name), (override));
};

}  // namespace power_manager

#endif  // POWER_MANAGER_MOCK_SUSPEND_INHIBITOR_BACKEND_H_
