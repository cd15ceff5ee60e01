// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "optimizer_config.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace pvo {

struct ActiveDevice {
    std::string name;
    double measured_power_w{0.0};
    int priority{MAX_PRIORITY};
};

struct CycleSnapshot {
    TimePoint timestamp{};
    double current_surplus_w{0.0};  // availability, positive = surplus
    double averaged_surplus_w{0.0};
    double power_budget_w{0.0};
    double power_on_devices_w{0.0};
    std::vector<ActiveDevice> active_devices;
};

struct HistoryStatistics {
    std::size_t total_events{0};
    double utilization_rate{0.0}; // percent, one decimal
    std::string most_active_device{"None"};
    int peak_hour{0};             // local time
    std::size_t snapshots_count{0};
};

/// \brief In-memory time series of cycle results for charts and statistics.
class HistoryTracker {
public:
    HistoryTracker(std::chrono::seconds snapshot_interval, std::chrono::hours retention);

    void configure(std::chrono::seconds snapshot_interval, std::chrono::hours retention);

    /// \brief Store \p snapshot unless one was stored less than the snapshot interval ago.
    /// Drops entries older than the retention period. Returns true when stored.
    bool offer(const CycleSnapshot& snapshot);

    std::vector<CycleSnapshot> get_snapshots(std::chrono::hours hours, TimePoint now) const;

    /// \brief Aggregates over the last 24 h; empty when there is nothing to aggregate.
    std::optional<HistoryStatistics> get_statistics(TimePoint now) const;

    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::deque<CycleSnapshot> snapshots_;
    std::chrono::seconds snapshot_interval_;
    std::chrono::hours retention_;

    std::vector<CycleSnapshot> recent_locked(std::chrono::hours hours, TimePoint now) const;
};

std::string to_iso8601(TimePoint tp);
int local_hour(TimePoint tp);

nlohmann::json to_json(const CycleSnapshot& snapshot);
nlohmann::json to_json(const HistoryStatistics& stats);

} // namespace pvo
