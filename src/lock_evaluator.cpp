// SPDX-License-Identifier: Apache-2.0
#include "lock_evaluator.hpp"

#include <chrono>

namespace pvo {

namespace {

LockStatus locked(LockReason reason) {
    return LockStatus{true, reason};
}

} // namespace

LockStatus evaluate_lock(const DeviceConfig& cfg, const DeviceRuntimeState& state, TimePoint now,
                         LockPolicy policy) {
    const bool managed = policy == LockPolicy::Simulation || cfg.optimization_enabled;
    if (!managed || !state.available) {
        return locked(LockReason::Unavailable);
    }
    if (policy == LockPolicy::Managed && state.last_target_state.has_value() && *state.last_target_state != state.is_on) {
        return locked(LockReason::ManualOverride);
    }
    if (!state.last_change.has_value()) {
        return {};
    }
    const auto since_change = now - *state.last_change;
    if (state.is_on && since_change < std::chrono::minutes(cfg.min_on_time_min)) {
        return locked(LockReason::Timing);
    }
    if (!state.is_on && since_change < std::chrono::minutes(cfg.min_off_time_min)) {
        return locked(LockReason::Timing);
    }
    return {};
}

LockMap evaluate_locks(const std::vector<DeviceEntry>& devices, TimePoint now, LockPolicy policy) {
    LockMap out;
    for (const auto& d : devices) {
        out[d.config.name] = evaluate_lock(d.config, d.state, now, policy);
    }
    return out;
}

std::string lock_reason_to_string(LockReason reason) {
    switch (reason) {
    case LockReason::None:
        return "none";
    case LockReason::Timing:
        return "timing";
    case LockReason::ManualOverride:
        return "manual-override";
    case LockReason::Unavailable:
        return "unavailable";
    }
    return "none";
}

} // namespace pvo
