// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "device_registry.hpp"

#include <map>
#include <string>
#include <vector>

namespace pvo {

enum class LockReason { None, Timing, ManualOverride, Unavailable };

struct LockStatus {
    bool locked{false};
    LockReason reason{LockReason::None};
};

using LockMap = std::map<std::string, LockStatus>;

/// Simulation devices are never commanded, so only availability and timing apply to them.
enum class LockPolicy { Managed, Simulation };

/// \brief Decide whether the engine may change this device's state in the current cycle.
///
/// Checked in order: not engine-managed or unavailable, actual state differing from the last
/// commanded state (manual override), then the minimum on/off time since the last observed change.
/// An unknown change time never produces a timing lock.
LockStatus evaluate_lock(const DeviceConfig& cfg, const DeviceRuntimeState& state, TimePoint now,
                         LockPolicy policy = LockPolicy::Managed);

LockMap evaluate_locks(const std::vector<DeviceEntry>& devices, TimePoint now,
                       LockPolicy policy = LockPolicy::Managed);

std::string lock_reason_to_string(LockReason reason);

} // namespace pvo
