// SPDX-License-Identifier: Apache-2.0
#include "device_interface.hpp"

#include <algorithm>
#include <cmath>

namespace pvo {

namespace {
constexpr double NUMERIC_MATCH_EPSILON = 1e-6;
} // namespace

bool derive_is_on(const DeviceConfig& cfg, const RawDeviceValues& raw) {
    if (!cfg.measured_power_entity.empty() && raw.measured_power_w.has_value()) {
        return *raw.measured_power_w > cfg.power_threshold_w;
    }

    if (cfg.kind == ControlKind::Switch) {
        if (!raw.switch_on.has_value()) {
            return false;
        }
        return cfg.invert_switch ? !*raw.switch_on : *raw.switch_on;
    }

    const auto n = std::min(cfg.numeric_targets.size(), raw.numeric_values.size());
    for (std::size_t i = 0; i < n; ++i) {
        const auto& value = raw.numeric_values[i];
        if (value && std::fabs(*value - cfg.numeric_targets[i].activated_value) < NUMERIC_MATCH_EPSILON) {
            return true;
        }
    }
    return false;
}

} // namespace pvo
