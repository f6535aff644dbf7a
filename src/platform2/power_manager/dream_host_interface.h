// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_DREAM_HOST_INTERFACE_H_
#define POWER_MANAGER_DREAM_HOST_INTERFACE_H_

namespace power_manager {

// Starts and stops the screensaver ("dream"). Only ever called from the
// worker sequence and never with the engine lock held.
class DreamHostInterface {
 public:
  virtual ~DreamHostInterface() = default;

  virtual void StartDream() = 0;
  virtual void StopDream() = 0;
  virtual bool IsDreaming() = 0;
};

}  // namespace power_manager

#endif  // POWER_MANAGER_DREAM_HOST_INTERFACE_H_
