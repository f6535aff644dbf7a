// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/power_error.h"

#include <base/logging.h>

namespace power_manager {

bool SetError(const base::Location& location,
              brillo::ErrorPtr* error,
              const std::string& code,
              const std::string& message) {
  VLOG(1) << code << ": " << message;
  if (error) {
    *error = brillo::Error::Create(location, kPowerManagerErrorDomain, code,
                                   message);
  }
  return false;
}

}  // namespace power_manager
