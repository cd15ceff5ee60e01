// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "device_interface.hpp"
#include "optimizer_config.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace pvo {

/// \brief In-process sensor/actuator stand-in so the engine can run without a home automation backend.
///
/// Models a grid meter as base load + active device load - PV production (negative = export).
/// Devices with a measured-power entity report their rated power while active.
class SimulatedDevices : public DeviceInterface {
public:
    struct Command {
        std::string entity;
        double value{0.0}; // 1/0 for switches
        bool success{false};
    };

    explicit SimulatedDevices(const std::vector<DeviceConfig>& devices);
    ~SimulatedDevices() override = default;

    SurplusSample read_surplus(const std::string& surplus_entity) override;
    DeviceReading read_device_state(const DeviceConfig& device) override;
    bool set_switch(const std::string& switch_entity, bool on) override;
    bool set_numeric(const std::string& entity, double value) override;

    void set_devices(const std::vector<DeviceConfig>& devices);

    // Plant model
    void set_pv_production(double watts);
    void set_base_load(double watts);
    /// \brief Pin the surplus reading to \p watts (grid polarity) regardless of the plant model.
    void set_surplus_override(std::optional<double> watts);
    void set_surplus_failure(bool failing);

    // Fault and operator controls
    void set_command_failure(const std::string& entity, bool failing);
    void set_command_delay(std::chrono::milliseconds delay);
    void set_unavailable(const std::string& device_name, bool unavailable);
    /// \brief Flip a switch entity as a person would, bypassing the command log.
    void set_switch_raw(const std::string& switch_entity, bool on);
    void set_numeric_raw(const std::string& entity, double value);
    void set_measured_power(const std::string& entity, std::optional<double> watts);
    void set_last_change(const std::string& device_name, std::optional<TimePoint> when);

    std::optional<bool> switch_state(const std::string& entity) const;
    std::optional<double> numeric_value(const std::string& entity) const;
    std::vector<Command> commands() const;
    void clear_commands();

private:
    mutable std::mutex mutex_;
    std::vector<DeviceConfig> devices_;
    std::map<std::string, bool> switches_;
    std::map<std::string, double> numerics_;
    std::map<std::string, std::optional<double>> measured_;
    std::map<std::string, TimePoint> last_change_;
    std::set<std::string> failing_entities_;
    std::set<std::string> unavailable_;
    std::vector<Command> commands_;
    double pv_production_w_{0.0};
    double base_load_w_{0.0};
    std::optional<double> surplus_override_;
    bool surplus_failing_{false};
    std::chrono::milliseconds command_delay_{0};

    RawDeviceValues raw_values(const DeviceConfig& device) const;
};

} // namespace pvo
