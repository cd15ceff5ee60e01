// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "device_registry.hpp"
#include "lock_evaluator.hpp"

#include <vector>

namespace pvo {

/// \brief Which devices a budget or allocation pass covers.
enum class DeviceScope { Managed, Simulation };

bool in_scope(const DeviceConfig& cfg, DeviceScope scope);

/// \brief Power attributed to a device: its windowed measured average when a measured source
/// is configured and has data, otherwise its rated power.
double effective_power_w(const DeviceEntry& device);

struct Budget {
    double availability_w{0.0};
    double reclaimable_w{0.0}; // power of on, unlocked devices in scope
    double total_w{0.0};
};

/// \brief budget = availability + power of on, unlocked devices in scope.
/// A negative result is a deficit and is returned unchanged.
Budget compute_budget(double availability_w, const std::vector<DeviceEntry>& devices, const LockMap& locks,
                      DeviceScope scope = DeviceScope::Managed);

} // namespace pvo
