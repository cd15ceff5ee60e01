// SPDX-License-Identifier: Apache-2.0
#include "device_registry.hpp"

#include <everest/logging.hpp>

#include <utility>

namespace pvo {

DeviceRegistry::DeviceRegistry(std::chrono::minutes power_window) : power_window_(power_window) {
}

void DeviceRegistry::set_devices(std::vector<DeviceConfig> devices) {
    validate_device_set(devices);

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeviceEntry> next;
    next.reserve(devices.size());
    std::map<std::string, std::unique_ptr<SurplusAverager>> next_avg;
    for (auto& cfg : devices) {
        DeviceEntry entry;
        if (auto* existing = find_locked(cfg.name)) {
            entry.state = existing->state;
        }
        auto it = power_avg_.find(cfg.name);
        if (it != power_avg_.end()) {
            next_avg.emplace(cfg.name, std::move(it->second));
        } else {
            next_avg.emplace(cfg.name, std::make_unique<SurplusAverager>());
        }
        entry.config = std::move(cfg);
        next.push_back(std::move(entry));
    }
    devices_ = std::move(next);
    power_avg_ = std::move(next_avg);
}

void DeviceRegistry::set_power_window(std::chrono::minutes window) {
    std::lock_guard<std::mutex> lock(mutex_);
    power_window_ = window;
}

void DeviceRegistry::refresh(DeviceInterface& io, TimePoint now) {
    std::vector<DeviceConfig> configs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        configs.reserve(devices_.size());
        for (const auto& d : devices_) {
            configs.push_back(d.config);
        }
    }

    // Reads happen outside the registry lock; a slow collaborator must not block queries.
    std::vector<std::pair<std::string, std::optional<DeviceReading>>> readings;
    readings.reserve(configs.size());
    for (const auto& cfg : configs) {
        try {
            readings.emplace_back(cfg.name, io.read_device_state(cfg));
        } catch (const std::exception& e) {
            EVLOG_warning << "Reading device " << cfg.name << " failed: " << e.what();
            readings.emplace_back(cfg.name, std::nullopt);
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [name, reading] : readings) {
        auto* entry = find_locked(name);
        if (entry == nullptr) {
            continue; // removed while reading
        }
        if (!reading) {
            entry->state.available = false;
            entry->state.last_refresh = now;
            continue;
        }
        apply_reading(*entry, *reading, now);
    }
}

void DeviceRegistry::apply_reading(DeviceEntry& entry, const DeviceReading& reading, TimePoint now) {
    auto& st = entry.state;
    const bool first_observation = !st.last_refresh.has_value();

    if (reading.available) {
        if (!first_observation && reading.is_on != st.is_on) {
            st.last_change = reading.last_change.value_or(now);
            EVLOG_debug << "Device " << entry.config.name << " changed to " << (reading.is_on ? "on" : "off");
        } else if (reading.last_change) {
            st.last_change = reading.last_change;
        }
        st.is_on = reading.is_on;
    } else if (st.available) {
        EVLOG_info << "Device " << entry.config.name << " became unavailable";
    }
    st.available = reading.available;

    st.measured_power_w = reading.measured_power_w;
    auto& avg = power_avg_[entry.config.name];
    if (!avg) {
        avg = std::make_unique<SurplusAverager>();
    }
    if (reading.measured_power_w) {
        avg->observe(*reading.measured_power_w, now);
    }
    st.measured_power_avg_w = entry.config.measured_power_entity.empty() ? std::nullopt
                                                                         : avg->average(power_window_, now);

    if (!st.last_target_state && reading.available) {
        st.last_target_state = st.is_on;
    }
    st.last_refresh = now;
}

std::vector<DeviceEntry> DeviceRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_;
}

std::optional<DeviceEntry> DeviceRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& d : devices_) {
        if (d.config.name == name) {
            return d;
        }
    }
    return std::nullopt;
}

std::size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.size();
}

void DeviceRegistry::record_commanded(const std::string& name, bool on, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* entry = find_locked(name);
    if (entry == nullptr) {
        return;
    }
    entry->state.last_target_state = on;
    if (entry->state.is_on != on) {
        entry->state.is_on = on;
        entry->state.last_change = now;
    }
}

bool DeviceRegistry::reset_lock(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* entry = find_locked(name);
    if (entry == nullptr) {
        return false;
    }
    entry->state.last_target_state = entry->state.is_on;
    return true;
}

void DeviceRegistry::update_config(const DeviceConfig& cfg) {
    validate_device_config(cfg);
    std::lock_guard<std::mutex> lock(mutex_);
    auto* entry = find_locked(cfg.name);
    if (entry == nullptr) {
        throw ConfigurationInvalid("Unknown device: " + cfg.name);
    }
    entry->config = cfg;
}

DeviceEntry* DeviceRegistry::find_locked(const std::string& name) {
    for (auto& d : devices_) {
        if (d.config.name == name) {
            return &d;
        }
    }
    return nullptr;
}

} // namespace pvo
