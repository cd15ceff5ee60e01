// SPDX-License-Identifier: Apache-2.0
#include "optimizer_config.hpp"

#include <cassert>
#include <fstream>
#include <functional>
#include <iostream>

using namespace pvo;

namespace {

fs::path write_config(const std::string& name, const std::string& content) {
    const auto dir = fs::temp_directory_path() / "pvo_config_tests";
    fs::create_directories(dir);
    const auto path = dir / name;
    std::ofstream out(path);
    out << content;
    return path;
}

bool rejects(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const ConfigurationInvalid&) {
        return true;
    }
    return false;
}

const char* kValidConfig = R"({
  "simulationMode": true,
  "loggingConfig": "logging.ini",
  "simulation": { "pvProductionW": 5000, "baseLoadW": 300 },
  "global": {
    "surplusSensorEntityId": "sensor.grid",
    "slidingWindowMinutes": 3,
    "optimizationCycleSeconds": 30,
    "invertSurplus": true
  },
  "devices": [
    { "name": "heater", "priority": 1, "power": 2000, "type": "switch",
      "switchEntityId": "switch.heater", "invertSwitch": true, "minOnTimeMinutes": 15,
      "measuredPowerEntityId": "sensor.heater_power", "powerThresholdW": 50 },
    { "name": "boost", "priority": 2, "power": 1200, "type": "Numeric",
      "numericTargets": [ { "entityId": "number.setpoint", "activatedValue": 55, "deactivatedValue": 45 } ],
      "optimizationEnabled": false, "simulationActive": true }
  ]
})";

} // namespace

int main() {
    // Full file with defaults filled in.
    {
        const auto path = write_config("valid.json", kValidConfig);
        const auto cfg = load_optimizer_config(path);
        assert(cfg.global.surplus_entity == "sensor.grid");
        assert(cfg.global.sliding_window_min == 3);
        assert(cfg.global.cycle_time_s == 30);
        assert(cfg.global.invert_surplus);
        assert(cfg.global.surplus_sample_interval_s == 10);
        assert(cfg.global.command_timeout_ms == 5000);
        assert(cfg.global.history_retention_days == 7);
        assert(cfg.logging_config.is_absolute());
        assert(cfg.logging_config.filename() == "logging.ini");
        assert(cfg.simulated_pv_w == 5000.0);
        assert(cfg.simulated_base_load_w == 300.0);

        assert(cfg.devices.size() == 2);
        const auto& heater = cfg.devices[0];
        assert(heater.kind == ControlKind::Switch);
        assert(heater.invert_switch);
        assert(heater.min_on_time_min == 15);
        assert(heater.min_off_time_min == 0);
        assert(heater.power_threshold_w == 50.0);
        assert(heater.optimization_enabled);

        const auto& boost = cfg.devices[1];
        assert(boost.kind == ControlKind::Numeric);
        assert(boost.numeric_targets.size() == 1);
        assert(boost.numeric_targets[0].activated_value == 55.0);
        assert(!boost.optimization_enabled);
        assert(boost.simulation_active);
        assert(boost.power_threshold_w == 100.0);

        const auto json = to_json(boost);
        assert(json["type"] == "numeric");
        assert(json["numericTargets"][0]["entityId"] == "number.setpoint");
        assert(!json.contains("measuredPowerEntityId"));
    }

    // Device validation.
    {
        DeviceConfig d;
        d.name = "pump";
        d.rated_power_w = 500.0;
        d.switch_entity = "switch.pump";
        validate_device_config(d);

        auto bad = d;
        bad.priority = 0;
        assert(rejects([&]() { validate_device_config(bad); }));
        bad.priority = 11;
        assert(rejects([&]() { validate_device_config(bad); }));

        bad = d;
        bad.rated_power_w = 0.0;
        assert(rejects([&]() { validate_device_config(bad); }));
        bad.rated_power_w = 1e300;
        assert(rejects([&]() { validate_device_config(bad); }));
        bad.rated_power_w = MAX_RATED_POWER_W;
        validate_device_config(bad);

        bad = d;
        bad.switch_entity.clear();
        assert(rejects([&]() { validate_device_config(bad); }));

        bad = d;
        bad.kind = ControlKind::Numeric;
        assert(rejects([&]() { validate_device_config(bad); }));
        bad.numeric_targets.push_back({"", 1.0, 0.0});
        assert(rejects([&]() { validate_device_config(bad); }));
        bad.numeric_targets[0].entity = "number.pump";
        validate_device_config(bad);

        bad = d;
        bad.min_off_time_min = -1;
        assert(rejects([&]() { validate_device_config(bad); }));

        assert(rejects([&]() { validate_device_set({d, d}); }));
        assert(rejects([&]() { apply_device_patch(d, {{"type", "dimmer"}}); }));

        const auto patched = apply_device_patch(d, {{"priority", 3}, {"invertSwitch", true}});
        assert(patched.priority == 3);
        assert(patched.invert_switch);
        assert(patched.rated_power_w == 500.0);
    }

    // Global validation.
    {
        GlobalConfig g;
        g.surplus_entity = "sensor.grid";
        validate_global_config(g);

        auto bad = g;
        bad.surplus_entity.clear();
        assert(rejects([&]() { validate_global_config(bad); }));
        bad = g;
        bad.sliding_window_min = 61;
        assert(rejects([&]() { validate_global_config(bad); }));
        bad = g;
        bad.cycle_time_s = 5;
        assert(rejects([&]() { validate_global_config(bad); }));
        bad = g;
        bad.command_timeout_ms = 0;
        assert(rejects([&]() { validate_global_config(bad); }));

        const auto patched = apply_global_patch(g, {{"simulationOffsetW", -250.0}});
        assert(patched.simulation_offset_w == -250.0);
        assert(patched.surplus_entity == "sensor.grid");
    }

    // File-level failures.
    {
        assert(rejects([]() { load_optimizer_config("/nonexistent/pv_optimizer.json"); }));
        const auto malformed = write_config("malformed.json", "{ \"global\": ");
        assert(rejects([&]() { load_optimizer_config(malformed); }));
        const auto duplicate = write_config(
            "duplicate.json",
            R"({"global": {"surplusSensorEntityId": "sensor.grid"},
                "devices": [{"name": "a", "power": 1, "switchEntityId": "switch.a"},
                            {"name": "a", "power": 2, "switchEntityId": "switch.b"}]})");
        assert(rejects([&]() { load_optimizer_config(duplicate); }));
        const auto wrong_type = write_config(
            "wrong_type.json", R"({"global": {"surplusSensorEntityId": "sensor.grid", "slidingWindowMinutes": "five"}})");
        assert(rejects([&]() { load_optimizer_config(wrong_type); }));
    }

    std::cout << "optimizer_config_tests passed\n";
    return 0;
}
