// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "device_interface.hpp"
#include "optimizer_config.hpp"
#include "surplus_averager.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pvo {

struct DeviceRuntimeState {
    bool is_on{false};
    std::optional<double> measured_power_w;
    std::optional<double> measured_power_avg_w;
    std::optional<bool> last_target_state; // last state commanded by the engine
    std::optional<TimePoint> last_change;  // last observed on/off transition
    std::optional<TimePoint> last_refresh;
    bool available{true};
};

struct DeviceEntry {
    DeviceConfig config;
    DeviceRuntimeState state;
};

/// \brief Configuration plus last-known runtime state per device, keyed by name and kept in config order.
class DeviceRegistry {
public:
    explicit DeviceRegistry(std::chrono::minutes power_window = std::chrono::minutes(5));

    /// \brief Replace the device set. Runtime state is carried over for names that survive.
    /// Throws ConfigurationInvalid if the set is rejected.
    void set_devices(std::vector<DeviceConfig> devices);
    void set_power_window(std::chrono::minutes window);

    /// \brief Read every device through the collaborator and fold the readings into runtime state.
    /// Read failures mark the device unavailable; the previous on/off state is kept.
    void refresh(DeviceInterface& io, TimePoint now);

    std::vector<DeviceEntry> snapshot() const;
    std::optional<DeviceEntry> find(const std::string& name) const;
    std::size_t size() const;

    /// \brief Record a successfully applied engine command.
    void record_commanded(const std::string& name, bool on, TimePoint now);

    /// \brief Align last_target_state with the actual state; clears a manual-override lock.
    bool reset_lock(const std::string& name);

    /// \brief Replace the configuration of an existing device. Throws ConfigurationInvalid.
    void update_config(const DeviceConfig& cfg);

private:
    mutable std::mutex mutex_;
    std::vector<DeviceEntry> devices_;
    std::map<std::string, std::unique_ptr<SurplusAverager>> power_avg_;
    std::chrono::minutes power_window_;

    DeviceEntry* find_locked(const std::string& name);
    void apply_reading(DeviceEntry& entry, const DeviceReading& reading, TimePoint now);
};

} // namespace pvo
