// SPDX-License-Identifier: Apache-2.0
#include "budget_calculator.hpp"

#include <everest/logging.hpp>

namespace pvo {

bool in_scope(const DeviceConfig& cfg, DeviceScope scope) {
    return scope == DeviceScope::Managed ? cfg.optimization_enabled : cfg.simulation_active;
}

double effective_power_w(const DeviceEntry& device) {
    if (!device.config.measured_power_entity.empty() && device.state.measured_power_avg_w.has_value()) {
        return *device.state.measured_power_avg_w;
    }
    return device.config.rated_power_w;
}

Budget compute_budget(double availability_w, const std::vector<DeviceEntry>& devices, const LockMap& locks,
                      DeviceScope scope) {
    Budget b;
    b.availability_w = availability_w;
    for (const auto& d : devices) {
        if (!in_scope(d.config, scope) || !d.state.is_on) {
            continue;
        }
        auto it = locks.find(d.config.name);
        if (it == locks.end() || it->second.locked) {
            continue;
        }
        b.reclaimable_w += effective_power_w(d);
    }
    b.total_w = b.availability_w + b.reclaimable_w;
    EVLOG_debug << (scope == DeviceScope::Managed ? "Managed" : "Simulation") << " budget: " << b.availability_w
                << " W available + " << b.reclaimable_w << " W running = " << b.total_w << " W";
    return b;
}

} // namespace pvo
