// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_DISPLAY_SINK_INTERFACE_H_
#define POWER_MANAGER_DISPLAY_SINK_INTERFACE_H_

#include "power_manager/display_power_request.h"

namespace power_manager {

// Applies display power requests (screen state, backlight brightness,
// proximity gating).
class DisplaySinkInterface {
 public:
  // Callbacks may arrive on any thread but must never be made from inside
  // RequestPowerState().
  class Delegate {
   public:
    virtual ~Delegate() = default;

    // The display finished applying the most recent request.
    virtual void OnDisplayStateChanged() = 0;

    // The proximity sensor started or stopped detecting an object.
    virtual void OnProximityPositive() = 0;
    virtual void OnProximityNegative() = 0;
  };

  virtual ~DisplaySinkInterface() = default;

  virtual void SetDelegate(Delegate* delegate) = 0;

  // Submits |request|. Returns true if the display is already in the
  // requested state; otherwise OnDisplayStateChanged() follows later. If
  // |wait_for_negative_proximity| is set the screen stays off until the
  // proximity sensor reports negative.
  virtual bool RequestPowerState(const DisplayPowerRequest& request,
                                 bool wait_for_negative_proximity) = 0;

  virtual bool IsProximitySensorAvailable() const = 0;
};

}  // namespace power_manager

#endif  // POWER_MANAGER_DISPLAY_SINK_INTERFACE_H_
