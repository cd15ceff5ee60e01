// SPDX-License-Identifier: Apache-2.0
#include "budget_calculator.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace pvo;

namespace {

DeviceEntry make_entry(const std::string& name, double rated, bool on) {
    DeviceEntry e;
    e.config.name = name;
    e.config.rated_power_w = rated;
    e.config.switch_entity = "switch." + name;
    e.state.is_on = on;
    e.state.last_target_state = on;
    return e;
}

bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

} // namespace

int main() {
    std::vector<DeviceEntry> devices;
    devices.push_back(make_entry("heater", 2000.0, true));
    devices.push_back(make_entry("pump", 800.0, true));
    devices.push_back(make_entry("dryer", 1500.0, false));
    devices.push_back(make_entry("boiler", 1000.0, true));

    // Measured source with data wins over rated power.
    devices[1].config.measured_power_entity = "sensor.pump_power";
    devices[1].state.measured_power_avg_w = 650.0;
    assert(near(effective_power_w(devices[1]), 650.0));
    // Measured source without data falls back to rated power.
    devices[0].config.measured_power_entity = "sensor.heater_power";
    assert(near(effective_power_w(devices[0]), 2000.0));

    LockMap locks;
    locks["heater"] = {};
    locks["pump"] = {};
    locks["dryer"] = {};
    locks["boiler"] = {true, LockReason::Timing};

    // On, managed, unlocked: heater + pump. Boiler is locked; dryer is off.
    auto budget = compute_budget(500.0, devices, locks);
    assert(near(budget.reclaimable_w, 2650.0));
    assert(near(budget.total_w, 3150.0));

    // Deficits propagate unchanged.
    auto deficit = compute_budget(-3000.0, devices, locks);
    assert(near(deficit.total_w, -350.0));

    // Unmanaged devices never contribute to the managed budget.
    devices[0].config.optimization_enabled = false;
    auto unmanaged = compute_budget(0.0, devices, locks);
    assert(near(unmanaged.total_w, 650.0));

    // Simulation scope counts simulation-flagged devices only.
    devices[2].config.simulation_active = true;
    devices[2].state.is_on = true;
    devices[3].config.simulation_active = true;
    auto sim = compute_budget(100.0, devices, locks, DeviceScope::Simulation);
    assert(near(sim.total_w, 1600.0));

    std::cout << "budget_calculator_tests passed\n";
    return 0;
}
