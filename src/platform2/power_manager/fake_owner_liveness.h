// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef POWER_MANAGER_FAKE_OWNER_LIVENESS_H_
#define POWER_MANAGER_FAKE_OWNER_LIVENESS_H_

#include <utility>

#include <base/functional/callback.h>

#include "power_manager/wake_lock.h"

namespace power_manager {

// Liveness whose owner disappears only when the test says so. Tests keep a
// raw pointer after handing ownership to the engine; the object is destroyed
// when its wake lock is released.
class FakeOwnerLiveness : public OwnerLiveness {
 public:
  FakeOwnerLiveness() = default;
  explicit FakeOwnerLiveness(bool* destroyed) : destroyed_(destroyed) {}
  FakeOwnerLiveness(const FakeOwnerLiveness&) = delete;
  FakeOwnerLiveness& operator=(const FakeOwnerLiveness&) = delete;

  ~FakeOwnerLiveness() override {
    if (destroyed_)
      *destroyed_ = true;
  }

  // Makes Watch() report that the owner is already gone.
  void set_owner_gone(bool owner_gone) { owner_gone_ = owner_gone; }
  bool watching() const { return !on_owner_lost_.is_null(); }

  // Runs the pending callback. May destroy this object.
  void LoseOwner() {
    base::OnceClosure callback = std::move(on_owner_lost_);
    if (!callback.is_null())
      std::move(callback).Run();
  }

  // OwnerLiveness:
  bool Watch(base::OnceClosure on_owner_lost) override {
    if (owner_gone_)
      return false;
    on_owner_lost_ = std::move(on_owner_lost);
    return true;
  }

 private:
  bool* destroyed_ = nullptr;
  bool owner_gone_ = false;
  base::OnceClosure on_owner_lost_;
};

}  // namespace power_manager

#endif  // POWER_MANAGER_FAKE_OWNER_LIVENESS_H_
