// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "optimizer_config.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace pvo {

/// \brief Raised by read_surplus when the surplus sensor cannot be read.
class SourceUnavailable : public std::runtime_error {
public:
    explicit SourceUnavailable(const std::string& what) : std::runtime_error(what) {}
};

struct SurplusSample {
    double value_w{0.0}; // grid-meter polarity: negative = export
    TimePoint timestamp{};
};

struct DeviceReading {
    bool is_on{false};
    std::optional<double> measured_power_w; // empty when no measured source or unreadable
    bool available{true};
    std::optional<TimePoint> last_change;   // reported by the collaborator if it tracks it
};

/// \brief Raw entity values a collaborator has read for one device; input to derive_is_on.
struct RawDeviceValues {
    std::optional<bool> switch_on;                 // raw switch entity state, before polarity
    std::vector<std::optional<double>> numeric_values; // parallel to DeviceConfig::numeric_targets
    std::optional<double> measured_power_w;
};

/// \brief Decide whether a device is active from raw readings.
/// A readable measured-power source wins (power above threshold). Otherwise switches honour
/// their polarity and numeric devices are on when any target sits at its activated value.
bool derive_is_on(const DeviceConfig& cfg, const RawDeviceValues& raw);

/// \brief Sensor/actuator collaborator the engine runs against.
class DeviceInterface {
public:
    virtual ~DeviceInterface() = default;

    /// \brief Latest surplus reading. Throws SourceUnavailable if the sensor cannot be read.
    virtual SurplusSample read_surplus(const std::string& surplus_entity) = 0;

    virtual DeviceReading read_device_state(const DeviceConfig& device) = 0;

    /// \brief Drive a switch entity. Polarity is already applied by the caller.
    virtual bool set_switch(const std::string& switch_entity, bool on) = 0;

    virtual bool set_numeric(const std::string& entity, double value) = 0;
};

} // namespace pvo
