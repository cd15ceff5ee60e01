// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace pvo {

namespace fs = std::filesystem;

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

constexpr int MIN_PRIORITY = 1;
constexpr int MAX_PRIORITY = 10;
constexpr double MAX_RATED_POWER_W = 1e6;

/// \brief Raised when a global or device configuration is rejected. Never reaches the engine.
class ConfigurationInvalid : public std::runtime_error {
public:
    explicit ConfigurationInvalid(const std::string& what) : std::runtime_error(what) {}
};

enum class ControlKind { Switch, Numeric };

struct NumericTarget {
    std::string entity;
    double activated_value{0.0};
    double deactivated_value{0.0};
};

struct DeviceConfig {
    std::string name;
    int priority{5};
    double rated_power_w{0.0};
    ControlKind kind{ControlKind::Switch};
    std::string switch_entity;   // Switch devices only
    bool invert_switch{false};   // true => "off" means activated
    std::vector<NumericTarget> numeric_targets;
    int min_on_time_min{0};
    int min_off_time_min{0};
    bool optimization_enabled{true}; // engine-managed
    bool simulation_active{false};
    std::string measured_power_entity; // optional
    double power_threshold_w{100.0};
};

struct GlobalConfig {
    std::string surplus_entity;
    int sliding_window_min{5};
    int cycle_time_s{60};
    bool invert_surplus{false};
    int surplus_sample_interval_s{10};
    int command_timeout_ms{5000};
    long solver_max_dp_cells{4'000'000};
    int history_snapshot_interval_s{300};
    int history_retention_days{7};
    double simulation_offset_w{0.0};
};

struct OptimizerConfig {
    GlobalConfig global;
    std::vector<DeviceConfig> devices;
    fs::path logging_config;
    bool simulation_mode{true}; // use SimulatedDevices instead of an external collaborator
    double simulated_pv_w{3000.0};
    double simulated_base_load_w{400.0};
};

/// \brief Load pv_optimizer.json and populate an OptimizerConfig with absolute paths.
/// Throws ConfigurationInvalid on any rejected value.
OptimizerConfig load_optimizer_config(const fs::path& config_path);

GlobalConfig parse_global_config(const nlohmann::json& json);
DeviceConfig parse_device_config(const nlohmann::json& json);

/// \brief Apply a partial update (same keys as the config file) on top of an existing device.
DeviceConfig apply_device_patch(const DeviceConfig& base, const nlohmann::json& patch);
GlobalConfig apply_global_patch(const GlobalConfig& base, const nlohmann::json& patch);

void validate_global_config(const GlobalConfig& cfg);
void validate_device_config(const DeviceConfig& cfg);
/// \brief Validates every device plus name uniqueness across the set.
void validate_device_set(const std::vector<DeviceConfig>& devices);

nlohmann::json to_json(const GlobalConfig& cfg);
nlohmann::json to_json(const DeviceConfig& cfg);

std::string control_kind_to_string(ControlKind kind);
std::optional<ControlKind> control_kind_from_string(const std::string& s);

} // namespace pvo
