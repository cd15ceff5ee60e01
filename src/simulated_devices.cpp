// SPDX-License-Identifier: Apache-2.0
#include "simulated_devices.hpp"

#include <everest/logging.hpp>

#include <thread>

namespace pvo {

namespace {

// Switch/numeric view of a device, ignoring its measured-power source.
bool actuator_active(const DeviceConfig& device, const RawDeviceValues& raw) {
    DeviceConfig plain = device;
    plain.measured_power_entity.clear();
    return derive_is_on(plain, raw);
}

} // namespace

SimulatedDevices::SimulatedDevices(const std::vector<DeviceConfig>& devices) {
    set_devices(devices);
}

void SimulatedDevices::set_devices(const std::vector<DeviceConfig>& devices) {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_ = devices;
    for (const auto& d : devices_) {
        if (d.kind == ControlKind::Switch) {
            // Entities start deactivated: raw "off", or raw "on" for inverted switches.
            switches_.emplace(d.switch_entity, d.invert_switch);
        } else {
            for (const auto& t : d.numeric_targets) {
                numerics_.emplace(t.entity, t.deactivated_value);
            }
        }
    }
}

RawDeviceValues SimulatedDevices::raw_values(const DeviceConfig& device) const {
    RawDeviceValues raw;
    if (device.kind == ControlKind::Switch) {
        auto it = switches_.find(device.switch_entity);
        if (it != switches_.end()) {
            raw.switch_on = it->second;
        }
    } else {
        for (const auto& t : device.numeric_targets) {
            auto it = numerics_.find(t.entity);
            raw.numeric_values.push_back(it != numerics_.end() ? std::optional<double>(it->second) : std::nullopt);
        }
    }
    if (!device.measured_power_entity.empty()) {
        auto it = measured_.find(device.measured_power_entity);
        if (it != measured_.end()) {
            raw.measured_power_w = it->second;
        } else {
            raw.measured_power_w = actuator_active(device, raw) ? device.rated_power_w : 0.0;
        }
    }
    return raw;
}

SurplusSample SimulatedDevices::read_surplus(const std::string& surplus_entity) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (surplus_failing_) {
        throw SourceUnavailable("Surplus sensor " + surplus_entity + " unavailable");
    }
    SurplusSample sample;
    sample.timestamp = Clock::now();
    if (surplus_override_) {
        sample.value_w = *surplus_override_;
        return sample;
    }
    double load = base_load_w_;
    for (const auto& d : devices_) {
        if (actuator_active(d, raw_values(d))) {
            load += d.rated_power_w;
        }
    }
    sample.value_w = load - pv_production_w_;
    return sample;
}

DeviceReading SimulatedDevices::read_device_state(const DeviceConfig& device) {
    std::lock_guard<std::mutex> lock(mutex_);
    DeviceReading reading;
    if (unavailable_.count(device.name) != 0) {
        reading.available = false;
        return reading;
    }
    const auto raw = raw_values(device);
    reading.is_on = derive_is_on(device, raw);
    reading.measured_power_w = raw.measured_power_w;
    auto it = last_change_.find(device.name);
    if (it != last_change_.end()) {
        reading.last_change = it->second;
    }
    return reading;
}

bool SimulatedDevices::set_switch(const std::string& switch_entity, bool on) {
    std::chrono::milliseconds delay{0};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        delay = command_delay_;
    }
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const bool ok = failing_entities_.count(switch_entity) == 0 && switches_.count(switch_entity) != 0;
    commands_.push_back({switch_entity, on ? 1.0 : 0.0, ok});
    if (!ok) {
        EVLOG_debug << "Simulated switch " << switch_entity << " rejected command";
        return false;
    }
    switches_[switch_entity] = on;
    return true;
}

bool SimulatedDevices::set_numeric(const std::string& entity, double value) {
    std::chrono::milliseconds delay{0};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        delay = command_delay_;
    }
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const bool ok = failing_entities_.count(entity) == 0 && numerics_.count(entity) != 0;
    commands_.push_back({entity, value, ok});
    if (!ok) {
        EVLOG_debug << "Simulated numeric " << entity << " rejected command";
        return false;
    }
    numerics_[entity] = value;
    return true;
}

void SimulatedDevices::set_pv_production(double watts) {
    std::lock_guard<std::mutex> lock(mutex_);
    pv_production_w_ = watts;
}

void SimulatedDevices::set_base_load(double watts) {
    std::lock_guard<std::mutex> lock(mutex_);
    base_load_w_ = watts;
}

void SimulatedDevices::set_surplus_override(std::optional<double> watts) {
    std::lock_guard<std::mutex> lock(mutex_);
    surplus_override_ = watts;
}

void SimulatedDevices::set_surplus_failure(bool failing) {
    std::lock_guard<std::mutex> lock(mutex_);
    surplus_failing_ = failing;
}

void SimulatedDevices::set_command_failure(const std::string& entity, bool failing) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failing) {
        failing_entities_.insert(entity);
    } else {
        failing_entities_.erase(entity);
    }
}

void SimulatedDevices::set_command_delay(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    command_delay_ = delay;
}

void SimulatedDevices::set_unavailable(const std::string& device_name, bool unavailable) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (unavailable) {
        unavailable_.insert(device_name);
    } else {
        unavailable_.erase(device_name);
    }
}

void SimulatedDevices::set_switch_raw(const std::string& switch_entity, bool on) {
    std::lock_guard<std::mutex> lock(mutex_);
    switches_[switch_entity] = on;
}

void SimulatedDevices::set_numeric_raw(const std::string& entity, double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    numerics_[entity] = value;
}

void SimulatedDevices::set_measured_power(const std::string& entity, std::optional<double> watts) {
    std::lock_guard<std::mutex> lock(mutex_);
    measured_[entity] = watts;
}

void SimulatedDevices::set_last_change(const std::string& device_name, std::optional<TimePoint> when) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (when) {
        last_change_[device_name] = *when;
    } else {
        last_change_.erase(device_name);
    }
}

std::optional<bool> SimulatedDevices::switch_state(const std::string& entity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = switches_.find(entity);
    if (it == switches_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<double> SimulatedDevices::numeric_value(const std::string& entity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = numerics_.find(entity);
    if (it == numerics_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<SimulatedDevices::Command> SimulatedDevices::commands() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return commands_;
}

void SimulatedDevices::clear_commands() {
    std::lock_guard<std::mutex> lock(mutex_);
    commands_.clear();
}

} // namespace pvo
