// SPDX-License-Identifier: Apache-2.0
#include "optimizer_engine.hpp"
#include "simulated_devices.hpp"

#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <thread>

using namespace pvo;

namespace {

DeviceConfig make_switch(const std::string& name, int priority, double rated) {
    DeviceConfig d;
    d.name = name;
    d.priority = priority;
    d.rated_power_w = rated;
    d.switch_entity = "switch." + name;
    return d;
}

OptimizerConfig make_config(std::vector<DeviceConfig> devices) {
    OptimizerConfig cfg;
    cfg.global.surplus_entity = "sensor.grid_power";
    cfg.global.command_timeout_ms = 1000;
    cfg.devices = std::move(devices);
    return cfg;
}

bool threw_config_error(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const ConfigurationInvalid&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    using std::chrono::minutes;
    const TimePoint t0 = Clock::now();

    // Scenario A end to end: 2500 W exported, every device fits.
    {
        auto cfg = make_config({make_switch("t1", 1, 500.0), make_switch("t2a", 2, 800.0),
                                make_switch("t2b", 2, 1200.0)});
        auto sim = std::make_shared<SimulatedDevices>(cfg.devices);
        OptimizerEngine engine(cfg, sim);

        engine.surplus().observe(-2500.0, t0);
        auto result = engine.run_cycle(t0);
        assert(result.has_surplus);
        assert(result.budget.total_w == 2500.0);
        assert(result.allocation.ideal_on.size() == 3);
        assert(result.sync.issued == 3 && result.sync.failed == 0);
        assert(sim->switch_state("switch.t1") == true);
        assert(sim->switch_state("switch.t2a") == true);
        assert(sim->switch_state("switch.t2b") == true);

        auto json = engine.get_config(t0 + std::chrono::seconds(30));
        const auto& stats = json["optimizer_stats"];
        assert(stats["power_budget"].get<double>() == 2500.0);
        assert(stats["surplus_average"].get<double>() == 2500.0);
        assert(stats["power_rated_total"].get<double>() == 2500.0);
        assert(stats["elapsed_seconds_since_update"].get<long>() == 30);
        assert(json["version"].is_string() && !json["version"].get<std::string>().empty());
        assert(json["devices"].size() == 3);
        assert(json["devices"][0]["config"]["name"] == "t1");
        assert(json["devices"][0]["state"]["is_on"] == true);
        assert(json["devices"][0]["state"]["pvo_last_target_state"] == true);
        assert(json["global_config"]["surplusSensorEntityId"] == "sensor.grid_power");
    }

    // Scenario C: on for 10 of 30 minimum minutes; kept on through a deficit.
    {
        auto boiler = make_switch("boiler", 1, 1500.0);
        boiler.min_on_time_min = 30;
        auto cfg = make_config({boiler});
        auto sim = std::make_shared<SimulatedDevices>(cfg.devices);
        sim->set_switch_raw("switch.boiler", true);
        sim->set_last_change("boiler", t0 - minutes(10));
        OptimizerEngine engine(cfg, sim);

        engine.surplus().observe(500.0, t0); // importing
        auto result = engine.run_cycle(t0);
        assert(result.locks.at("boiler").reason == LockReason::Timing);
        assert(result.budget.total_w == -500.0);
        assert(!result.allocation.contains("boiler"));
        assert(result.sync.issued == 0 && result.sync.skipped_locked == 1);
        assert(sim->switch_state("switch.boiler") == true);
    }

    // Scenario D and the reset round trip.
    {
        auto cfg = make_config({make_switch("pump", 1, 800.0)});
        auto sim = std::make_shared<SimulatedDevices>(cfg.devices);
        sim->set_switch_raw("switch.pump", true);
        OptimizerEngine engine(cfg, sim);

        engine.surplus().observe(1000.0, t0);
        auto first = engine.run_cycle(t0);
        assert(first.sync.issued == 1);
        assert(sim->switch_state("switch.pump") == false);

        // Someone turns it back on by hand.
        sim->set_switch_raw("switch.pump", true);
        auto second = engine.run_cycle(t0 + minutes(1));
        assert(second.locks.at("pump").reason == LockReason::ManualOverride);
        assert(second.sync.issued == 0);
        assert(sim->switch_state("switch.pump") == true);
        auto json = engine.get_config(t0 + minutes(1));
        assert(json["devices"][0]["state"]["lock_reason"] == "manual-override");
        assert(json["devices"][0]["state"]["is_locked"] == true);

        engine.reset_device_lock("pump");
        auto third = engine.run_cycle(t0 + minutes(2));
        assert(third.locks.at("pump").reason != LockReason::ManualOverride);
        assert(!third.locks.at("pump").locked);

        assert(threw_config_error([&]() { engine.reset_device_lock("nope"); }));
    }

    // Simulation offset only affects the what-if pass.
    {
        auto wallbox = make_switch("wallbox", 1, 1000.0);
        wallbox.optimization_enabled = false;
        wallbox.simulation_active = true;
        auto cfg = make_config({wallbox});
        auto sim = std::make_shared<SimulatedDevices>(cfg.devices);
        OptimizerEngine engine(cfg, sim);

        engine.surplus().observe(-500.0, t0);
        auto before = engine.run_cycle(t0);
        assert(before.simulation.ideal_on.empty());
        assert(before.allocation.ideal_on.empty());

        engine.set_simulation_offset(600.0);
        auto after = engine.run_cycle(t0 + minutes(1));
        assert(after.simulation_budget.total_w == 1100.0);
        assert(after.simulation.contains("wallbox"));
        assert(after.budget.total_w == 500.0);
        assert(sim->commands().empty());

        auto stats = engine.get_config(t0 + minutes(1))["optimizer_stats"];
        assert(stats["surplus_offset"].get<double>() == 600.0);
        assert(stats["simulation_ideal_on_list"].size() == 1);
        assert(stats["simulation_power_budget"].get<double>() == 1100.0);
    }

    // Device configuration updates are validated before they apply.
    {
        auto cfg = make_config({make_switch("heater", 2, 2000.0)});
        auto sim = std::make_shared<SimulatedDevices>(cfg.devices);
        OptimizerEngine engine(cfg, sim);

        assert(threw_config_error([&]() { engine.update_device_config("heater", {{"priority", 11}}); }));
        assert(threw_config_error([&]() { engine.update_device_config("heater", {{"power", 0}}); }));
        assert(threw_config_error([&]() { engine.update_device_config("heater", {{"power", "lots"}}); }));
        assert(threw_config_error([&]() { engine.update_device_config("heater", {{"name", "other"}}); }));
        assert(threw_config_error([&]() { engine.update_device_config("ghost", {{"priority", 1}}); }));
        assert(engine.registry().find("heater")->config.priority == 2);

        engine.update_device_config("heater", {{"priority", 1}, {"minOnTimeMinutes", 20}});
        auto entry = engine.registry().find("heater");
        assert(entry->config.priority == 1);
        assert(entry->config.min_on_time_min == 20);
        assert(entry->config.rated_power_w == 2000.0);

        assert(threw_config_error([&]() { engine.update_global_config({{"slidingWindowMinutes", 0}}); }));
        engine.update_global_config({{"slidingWindowMinutes", 10}, {"optimizationCycleSeconds", 30}});
        assert(engine.global_config().sliding_window_min == 10);
        assert(engine.global_config().cycle_time_s == 30);
    }

    // Sensor and actuator faults are counted and never abort a cycle.
    {
        auto cfg = make_config({make_switch("heater", 1, 1000.0), make_switch("fan", 1, 200.0)});
        auto sim = std::make_shared<SimulatedDevices>(cfg.devices);
        OptimizerEngine engine(cfg, sim);

        sim->set_surplus_failure(true);
        engine.sample_surplus();
        assert(engine.stats().surplus_read_failures == 1);
        auto empty = engine.run_cycle(t0);
        assert(!empty.has_surplus);
        assert(sim->commands().empty());

        sim->set_surplus_failure(false);
        sim->set_surplus_override(-1500.0);
        engine.sample_surplus();
        sim->set_command_failure("switch.heater", true);
        sim->set_unavailable("fan", true);
        auto result = engine.run_cycle(Clock::now());
        assert(result.has_surplus);
        assert(result.locks.at("fan").reason == LockReason::Unavailable);
        assert(result.sync.failed == 1);
        assert(engine.stats().commands_failed == 1);
        assert(engine.stats().surplus_read_failures == 1);
        assert(engine.registry().find("heater")->state.last_target_state == false);
    }

    // A slow actuator that completes after the timeout keeps the device under engine control.
    {
        auto cfg = make_config({make_switch("heater", 1, 1000.0)});
        cfg.global.command_timeout_ms = 50;
        auto sim = std::make_shared<SimulatedDevices>(cfg.devices);
        sim->set_command_delay(std::chrono::milliseconds(200));
        OptimizerEngine engine(cfg, sim);

        engine.surplus().observe(-2000.0, t0);
        auto first = engine.run_cycle(t0);
        assert(first.sync.issued == 1 && first.sync.failed == 1);

        std::this_thread::sleep_for(std::chrono::milliseconds(400));
        assert(sim->switch_state("switch.heater") == true);

        auto second = engine.run_cycle(t0 + minutes(1));
        assert(!second.locks.at("heater").locked);
        assert(second.locks.at("heater").reason == LockReason::None);
        assert(second.sync.issued == 0);
        assert(engine.registry().find("heater")->state.last_target_state == true);

        // Surplus gone: the engine still switches it off.
        sim->set_command_delay(std::chrono::milliseconds(0));
        engine.surplus().observe(1500.0, t0 + minutes(10));
        auto third = engine.run_cycle(t0 + minutes(10));
        assert(third.sync.issued == 1 && third.sync.failed == 0);
        assert(sim->switch_state("switch.heater") == false);
    }

    // History is sampled at the snapshot interval and feeds the statistics.
    {
        auto cfg = make_config({make_switch("heater", 1, 1000.0)});
        auto sim = std::make_shared<SimulatedDevices>(cfg.devices);
        OptimizerEngine engine(cfg, sim);

        assert(engine.get_statistics(t0).empty());
        engine.surplus().observe(-2000.0, t0);
        engine.run_cycle(t0);
        engine.run_cycle(t0 + minutes(1));
        engine.surplus().observe(-2000.0, t0 + minutes(5));
        engine.run_cycle(t0 + minutes(5));

        auto history = engine.get_history(1, t0 + minutes(5));
        assert(history.size() == 2);
        assert(history[1]["active_devices"].size() == 1);
        assert(history[1]["active_devices"][0]["name"] == "heater");
        assert(engine.get_history(0, t0).empty());

        auto stats = engine.get_statistics(t0 + minutes(5));
        assert(stats["snapshots_count"] == 2);
        assert(stats["most_active_device"] == "heater");
        assert(stats["total_events"] == 2);
    }

    std::cout << "optimizer_engine_tests passed\n";
    return 0;
}
