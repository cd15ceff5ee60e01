// SPDX-License-Identifier: Apache-2.0
#include "lock_evaluator.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

using namespace pvo;

namespace {

DeviceConfig make_device(int min_on, int min_off) {
    DeviceConfig d;
    d.name = "heater";
    d.priority = 1;
    d.rated_power_w = 1000.0;
    d.switch_entity = "switch.heater";
    d.min_on_time_min = min_on;
    d.min_off_time_min = min_off;
    return d;
}

DeviceRuntimeState make_state(bool on, std::optional<bool> target, std::optional<TimePoint> change) {
    DeviceRuntimeState s;
    s.is_on = on;
    s.last_target_state = target;
    s.last_change = change;
    return s;
}

} // namespace

int main() {
    using std::chrono::minutes;
    const TimePoint now = Clock::now();

    // Scenario C: on for 10 minutes with a 30 minute minimum on time.
    {
        auto cfg = make_device(30, 0);
        auto st = make_state(true, true, now - minutes(10));
        auto lock = evaluate_lock(cfg, st, now);
        assert(lock.locked && lock.reason == LockReason::Timing);
        assert(!evaluate_lock(cfg, st, now + minutes(21)).locked);
    }

    // Minimum off time.
    {
        auto cfg = make_device(0, 15);
        auto st = make_state(false, false, now - minutes(5));
        assert(evaluate_lock(cfg, st, now).reason == LockReason::Timing);
        assert(!evaluate_lock(cfg, st, now + minutes(10)).locked);
    }

    // Scenario D: actual on, engine last commanded off.
    {
        auto cfg = make_device(0, 0);
        auto st = make_state(true, false, now - minutes(60));
        auto lock = evaluate_lock(cfg, st, now);
        assert(lock.locked && lock.reason == LockReason::ManualOverride);
    }

    // Manual override outranks timing.
    {
        auto cfg = make_device(30, 30);
        auto st = make_state(false, true, now - minutes(1));
        assert(evaluate_lock(cfg, st, now).reason == LockReason::ManualOverride);
    }

    // Not engine-managed or unavailable outranks everything.
    {
        auto cfg = make_device(30, 30);
        cfg.optimization_enabled = false;
        auto st = make_state(true, false, now);
        assert(evaluate_lock(cfg, st, now).reason == LockReason::Unavailable);

        cfg.optimization_enabled = true;
        st.available = false;
        assert(evaluate_lock(cfg, st, now).reason == LockReason::Unavailable);
    }

    // Unknown change time never timing-locks; unknown target never override-locks.
    {
        auto cfg = make_device(30, 30);
        auto st = make_state(true, std::nullopt, std::nullopt);
        auto lock = evaluate_lock(cfg, st, now);
        assert(!lock.locked && lock.reason == LockReason::None);
    }

    // Simulation policy: management flag and commanded state do not apply.
    {
        auto cfg = make_device(0, 0);
        cfg.optimization_enabled = false;
        cfg.simulation_active = true;
        auto st = make_state(true, false, now - minutes(60));
        assert(!evaluate_lock(cfg, st, now, LockPolicy::Simulation).locked);
        cfg.min_on_time_min = 90;
        assert(evaluate_lock(cfg, st, now, LockPolicy::Simulation).reason == LockReason::Timing);
    }

    // Map form covers every device.
    {
        std::vector<DeviceEntry> devices;
        DeviceEntry a{make_device(0, 0), make_state(true, true, std::nullopt)};
        DeviceEntry b{make_device(0, 0), make_state(true, false, std::nullopt)};
        b.config.name = "pump";
        devices.push_back(a);
        devices.push_back(b);
        auto locks = evaluate_locks(devices, now);
        assert(locks.size() == 2);
        assert(!locks["heater"].locked);
        assert(locks["pump"].reason == LockReason::ManualOverride);
    }

    assert(lock_reason_to_string(LockReason::ManualOverride) == "manual-override");
    assert(lock_reason_to_string(LockReason::Timing) == "timing");

    std::cout << "lock_evaluator_tests passed\n";
    return 0;
}
