// SPDX-License-Identifier: Apache-2.0
#include "optimizer_config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <set>

namespace pvo {

namespace {
fs::path make_absolute(const fs::path& base, const fs::path& relative_or_absolute) {
    if (relative_or_absolute.is_absolute()) {
        return relative_or_absolute;
    }
    return fs::weakly_canonical(base / relative_or_absolute);
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

NumericTarget parse_numeric_target(const nlohmann::json& target_json) {
    NumericTarget target;
    target.entity = target_json.value("entityId", "");
    target.activated_value = target_json.value("activatedValue", 0.0);
    target.deactivated_value = target_json.value("deactivatedValue", 0.0);
    return target;
}

std::string device_label(const DeviceConfig& cfg) {
    return cfg.name.empty() ? std::string("<unnamed>") : "'" + cfg.name + "'";
}
} // namespace

std::string control_kind_to_string(ControlKind kind) {
    return kind == ControlKind::Numeric ? "numeric" : "switch";
}

std::optional<ControlKind> control_kind_from_string(const std::string& s) {
    const auto lower = lowercase(s);
    if (lower == "switch") return ControlKind::Switch;
    if (lower == "numeric") return ControlKind::Numeric;
    return std::nullopt;
}

GlobalConfig apply_global_patch(const GlobalConfig& base, const nlohmann::json& patch) {
    GlobalConfig cfg = base;
    cfg.surplus_entity = patch.value("surplusSensorEntityId", cfg.surplus_entity);
    cfg.sliding_window_min = patch.value("slidingWindowMinutes", cfg.sliding_window_min);
    cfg.cycle_time_s = patch.value("optimizationCycleSeconds", cfg.cycle_time_s);
    cfg.invert_surplus = patch.value("invertSurplus", cfg.invert_surplus);
    cfg.surplus_sample_interval_s = patch.value("surplusSampleSeconds", cfg.surplus_sample_interval_s);
    cfg.command_timeout_ms = patch.value("commandTimeoutMs", cfg.command_timeout_ms);
    cfg.solver_max_dp_cells = patch.value("solverMaxDpCells", cfg.solver_max_dp_cells);
    cfg.history_snapshot_interval_s = patch.value("historySnapshotSeconds", cfg.history_snapshot_interval_s);
    cfg.history_retention_days = patch.value("historyRetentionDays", cfg.history_retention_days);
    cfg.simulation_offset_w = patch.value("simulationOffsetW", cfg.simulation_offset_w);
    return cfg;
}

GlobalConfig parse_global_config(const nlohmann::json& json) {
    return apply_global_patch(GlobalConfig{}, json);
}

DeviceConfig apply_device_patch(const DeviceConfig& base, const nlohmann::json& patch) {
    DeviceConfig cfg = base;
    cfg.name = patch.value("name", cfg.name);
    cfg.priority = patch.value("priority", cfg.priority);
    cfg.rated_power_w = patch.value("power", cfg.rated_power_w);
    if (patch.contains("type")) {
        const auto kind = control_kind_from_string(patch["type"].get<std::string>());
        if (!kind) {
            throw ConfigurationInvalid("Device " + device_label(cfg) + ": unknown type '" +
                                       patch["type"].get<std::string>() + "' (expected switch or numeric)");
        }
        cfg.kind = *kind;
    }
    cfg.switch_entity = patch.value("switchEntityId", cfg.switch_entity);
    cfg.invert_switch = patch.value("invertSwitch", cfg.invert_switch);
    if (patch.contains("numericTargets") && patch["numericTargets"].is_array()) {
        cfg.numeric_targets.clear();
        for (const auto& t : patch["numericTargets"]) {
            cfg.numeric_targets.push_back(parse_numeric_target(t));
        }
    }
    cfg.min_on_time_min = patch.value("minOnTimeMinutes", cfg.min_on_time_min);
    cfg.min_off_time_min = patch.value("minOffTimeMinutes", cfg.min_off_time_min);
    cfg.optimization_enabled = patch.value("optimizationEnabled", cfg.optimization_enabled);
    cfg.simulation_active = patch.value("simulationActive", cfg.simulation_active);
    cfg.measured_power_entity = patch.value("measuredPowerEntityId", cfg.measured_power_entity);
    cfg.power_threshold_w = patch.value("powerThresholdW", cfg.power_threshold_w);
    return cfg;
}

DeviceConfig parse_device_config(const nlohmann::json& json) {
    return apply_device_patch(DeviceConfig{}, json);
}

void validate_global_config(const GlobalConfig& cfg) {
    if (cfg.surplus_entity.empty()) {
        throw ConfigurationInvalid("Global config: surplusSensorEntityId is required");
    }
    if (cfg.sliding_window_min < 1 || cfg.sliding_window_min > 60) {
        throw ConfigurationInvalid("Global config: slidingWindowMinutes must be within 1..60, got " +
                                   std::to_string(cfg.sliding_window_min));
    }
    if (cfg.cycle_time_s < 10 || cfg.cycle_time_s > 300) {
        throw ConfigurationInvalid("Global config: optimizationCycleSeconds must be within 10..300, got " +
                                   std::to_string(cfg.cycle_time_s));
    }
    if (cfg.surplus_sample_interval_s <= 0) {
        throw ConfigurationInvalid("Global config: surplusSampleSeconds must be positive");
    }
    if (cfg.command_timeout_ms <= 0) {
        throw ConfigurationInvalid("Global config: commandTimeoutMs must be positive");
    }
    if (cfg.solver_max_dp_cells <= 0) {
        throw ConfigurationInvalid("Global config: solverMaxDpCells must be positive");
    }
    if (cfg.history_snapshot_interval_s <= 0 || cfg.history_retention_days <= 0) {
        throw ConfigurationInvalid("Global config: history interval and retention must be positive");
    }
    if (!std::isfinite(cfg.simulation_offset_w)) {
        throw ConfigurationInvalid("Global config: simulationOffsetW must be finite");
    }
}

void validate_device_config(const DeviceConfig& cfg) {
    const auto label = device_label(cfg);
    if (cfg.name.empty()) {
        throw ConfigurationInvalid("Device name is required");
    }
    if (cfg.priority < MIN_PRIORITY || cfg.priority > MAX_PRIORITY) {
        throw ConfigurationInvalid("Device " + label + ": priority must be within " +
                                   std::to_string(MIN_PRIORITY) + ".." + std::to_string(MAX_PRIORITY) +
                                   ", got " + std::to_string(cfg.priority));
    }
    if (!std::isfinite(cfg.rated_power_w) || cfg.rated_power_w <= 0.0 || cfg.rated_power_w > MAX_RATED_POWER_W) {
        throw ConfigurationInvalid("Device " + label + ": power must be a positive number of watts up to " +
                                   std::to_string(static_cast<long>(MAX_RATED_POWER_W)));
    }
    if (cfg.min_on_time_min < 0 || cfg.min_off_time_min < 0) {
        throw ConfigurationInvalid("Device " + label + ": minimum on/off times must not be negative");
    }
    if (cfg.power_threshold_w < 0.0) {
        throw ConfigurationInvalid("Device " + label + ": powerThresholdW must not be negative");
    }
    if (cfg.kind == ControlKind::Switch) {
        if (cfg.switch_entity.empty()) {
            throw ConfigurationInvalid("Device " + label + ": switch devices require switchEntityId");
        }
    } else {
        if (cfg.numeric_targets.empty()) {
            throw ConfigurationInvalid("Device " + label + ": numeric devices require at least one numeric target");
        }
        for (const auto& t : cfg.numeric_targets) {
            if (t.entity.empty()) {
                throw ConfigurationInvalid("Device " + label + ": numeric target without entityId");
            }
        }
    }
}

void validate_device_set(const std::vector<DeviceConfig>& devices) {
    std::set<std::string> names;
    for (const auto& d : devices) {
        validate_device_config(d);
        if (!names.insert(d.name).second) {
            throw ConfigurationInvalid("Duplicate device name '" + d.name + "'. Device names must be unique.");
        }
    }
}

nlohmann::json to_json(const GlobalConfig& cfg) {
    nlohmann::json j;
    j["surplusSensorEntityId"] = cfg.surplus_entity;
    j["slidingWindowMinutes"] = cfg.sliding_window_min;
    j["optimizationCycleSeconds"] = cfg.cycle_time_s;
    j["invertSurplus"] = cfg.invert_surplus;
    j["surplusSampleSeconds"] = cfg.surplus_sample_interval_s;
    j["commandTimeoutMs"] = cfg.command_timeout_ms;
    j["solverMaxDpCells"] = cfg.solver_max_dp_cells;
    j["historySnapshotSeconds"] = cfg.history_snapshot_interval_s;
    j["historyRetentionDays"] = cfg.history_retention_days;
    j["simulationOffsetW"] = cfg.simulation_offset_w;
    return j;
}

nlohmann::json to_json(const DeviceConfig& cfg) {
    nlohmann::json j;
    j["name"] = cfg.name;
    j["priority"] = cfg.priority;
    j["power"] = cfg.rated_power_w;
    j["type"] = control_kind_to_string(cfg.kind);
    if (cfg.kind == ControlKind::Switch) {
        j["switchEntityId"] = cfg.switch_entity;
        j["invertSwitch"] = cfg.invert_switch;
    } else {
        j["numericTargets"] = nlohmann::json::array();
        for (const auto& t : cfg.numeric_targets) {
            j["numericTargets"].push_back(
                {{"entityId", t.entity}, {"activatedValue", t.activated_value}, {"deactivatedValue", t.deactivated_value}});
        }
    }
    j["minOnTimeMinutes"] = cfg.min_on_time_min;
    j["minOffTimeMinutes"] = cfg.min_off_time_min;
    j["optimizationEnabled"] = cfg.optimization_enabled;
    j["simulationActive"] = cfg.simulation_active;
    if (!cfg.measured_power_entity.empty()) {
        j["measuredPowerEntityId"] = cfg.measured_power_entity;
    }
    j["powerThresholdW"] = cfg.power_threshold_w;
    return j;
}

OptimizerConfig load_optimizer_config(const fs::path& config_path) {
    if (!fs::exists(config_path)) {
        throw ConfigurationInvalid("Config file not found: " + config_path.string());
    }

    OptimizerConfig cfg{};
    try {
        std::ifstream file(config_path);
        const auto json = nlohmann::json::parse(file);
        const auto base_dir = config_path.parent_path().empty() ? fs::current_path() : config_path.parent_path();

        cfg.global = parse_global_config(json.value("global", nlohmann::json::object()));
        cfg.simulation_mode = json.value("simulationMode", cfg.simulation_mode);
        if (json.contains("simulation")) {
            const auto& sim = json["simulation"];
            cfg.simulated_pv_w = sim.value("pvProductionW", cfg.simulated_pv_w);
            cfg.simulated_base_load_w = sim.value("baseLoadW", cfg.simulated_base_load_w);
        }
        cfg.logging_config = make_absolute(base_dir, json.value("loggingConfig", "logging.ini"));

        if (json.contains("devices") && json["devices"].is_array()) {
            for (const auto& device_json : json["devices"]) {
                cfg.devices.push_back(parse_device_config(device_json));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationInvalid("Malformed config " + config_path.string() + ": " + e.what());
    }

    validate_global_config(cfg.global);
    validate_device_set(cfg.devices);
    return cfg;
}

} // namespace pvo
