// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_POWER_ERROR_H_
#define POWER_MANAGER_POWER_ERROR_H_

#include <string>

#include <base/location.h>
#include <brillo/errors/error.h>

namespace power_manager {

// Domain for errors reported to callers.
inline constexpr char kPowerManagerErrorDomain[] = "power_manager";

// Malformed parameters, such as an event time in the future or an unknown
// wake lock level.
inline constexpr char kErrorInvalidArgument[] = "InvalidArgument";
// The request conflicts with existing state, such as re-acquiring a wake lock
// handle from a different owner or calling a lifecycle method out of order.
inline constexpr char kErrorInvalidState[] = "InvalidState";

// Fills |error| (if non-null) with an error of |code| and returns false so
// callers can write "return SetError(...);".
bool SetError(const base::Location& location,
              brillo::ErrorPtr* error,
              const std::string& code,
              const std::string& message);

}  // namespace power_manager

#endif  // POWER_MANAGER_POWER_ERROR_H_
