// SPDX-License-Identifier: Apache-2.0
#include "history_tracker.hpp"

#include <everest/logging.hpp>

#include <algorithm>
#include <cmath>
#include <ctime>
#include <utility>

namespace pvo {

HistoryTracker::HistoryTracker(std::chrono::seconds snapshot_interval, std::chrono::hours retention) :
    snapshot_interval_(snapshot_interval), retention_(retention) {
}

void HistoryTracker::configure(std::chrono::seconds snapshot_interval, std::chrono::hours retention) {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot_interval_ = snapshot_interval;
    retention_ = retention;
}

bool HistoryTracker::offer(const CycleSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!snapshots_.empty() && snapshot.timestamp - snapshots_.back().timestamp < snapshot_interval_) {
        return false;
    }
    snapshots_.push_back(snapshot);

    const auto cutoff = snapshot.timestamp - retention_;
    std::size_t removed = 0;
    while (!snapshots_.empty() && snapshots_.front().timestamp <= cutoff) {
        snapshots_.pop_front();
        removed++;
    }
    if (removed > 0) {
        EVLOG_debug << "Removed " << removed << " old snapshot(s)";
    }
    EVLOG_debug << "Snapshot taken: " << snapshot.active_devices.size() << " active devices, surplus "
                << snapshot.current_surplus_w << " W";
    return true;
}

std::vector<CycleSnapshot> HistoryTracker::recent_locked(std::chrono::hours hours, TimePoint now) const {
    const auto cutoff = now - hours;
    std::vector<CycleSnapshot> out;
    for (const auto& s : snapshots_) {
        if (s.timestamp > cutoff) {
            out.push_back(s);
        }
    }
    return out;
}

std::vector<CycleSnapshot> HistoryTracker::get_snapshots(std::chrono::hours hours, TimePoint now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return recent_locked(hours, now);
}

std::optional<HistoryStatistics> HistoryTracker::get_statistics(TimePoint now) const {
    std::vector<CycleSnapshot> recent;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        recent = recent_locked(std::chrono::hours(24), now);
    }
    if (recent.empty()) {
        return std::nullopt;
    }

    HistoryStatistics stats;
    stats.snapshots_count = recent.size();

    double total_surplus = 0.0;
    double total_used = 0.0;
    // First-seen order breaks ties for both maxima.
    std::vector<std::pair<std::string, std::size_t>> device_counts;
    std::vector<std::pair<int, std::size_t>> hour_activity;
    for (const auto& s : recent) {
        stats.total_events += s.active_devices.size();
        total_surplus += s.current_surplus_w;
        total_used += s.power_on_devices_w;
        for (const auto& d : s.active_devices) {
            auto it = std::find_if(device_counts.begin(), device_counts.end(),
                                   [&](const auto& p) { return p.first == d.name; });
            if (it == device_counts.end()) {
                device_counts.emplace_back(d.name, 1);
            } else {
                it->second++;
            }
        }
        const int hour = local_hour(s.timestamp);
        auto hit = std::find_if(hour_activity.begin(), hour_activity.end(),
                                [&](const auto& p) { return p.first == hour; });
        if (hit == hour_activity.end()) {
            hour_activity.emplace_back(hour, s.active_devices.size());
        } else {
            hit->second += s.active_devices.size();
        }
    }

    if (total_surplus > 0.0) {
        stats.utilization_rate = std::round(total_used / total_surplus * 1000.0) / 10.0;
    }
    std::size_t best = 0;
    for (const auto& [name, count] : device_counts) {
        if (count > best) {
            best = count;
            stats.most_active_device = name;
        }
    }
    best = 0;
    bool first = true;
    for (const auto& [hour, count] : hour_activity) {
        if (first || count > best) {
            best = count;
            stats.peak_hour = hour;
            first = false;
        }
    }
    return stats;
}

std::size_t HistoryTracker::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshots_.size();
}

std::string to_iso8601(TimePoint tp) {
    const std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

int local_hour(TimePoint tp) {
    const std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm.tm_hour;
}

nlohmann::json to_json(const CycleSnapshot& snapshot) {
    nlohmann::json j;
    j["timestamp"] = to_iso8601(snapshot.timestamp);
    j["current_surplus"] = snapshot.current_surplus_w;
    j["averaged_surplus"] = snapshot.averaged_surplus_w;
    j["power_budget"] = snapshot.power_budget_w;
    j["measured_power_on_devices"] = snapshot.power_on_devices_w;
    j["active_devices"] = nlohmann::json::array();
    for (const auto& d : snapshot.active_devices) {
        j["active_devices"].push_back({{"name", d.name}, {"measured_power", d.measured_power_w}, {"priority", d.priority}});
    }
    return j;
}

nlohmann::json to_json(const HistoryStatistics& stats) {
    return {{"total_events", stats.total_events},
            {"utilization_rate", stats.utilization_rate},
            {"most_active_device", stats.most_active_device},
            {"peak_hour", stats.peak_hour},
            {"snapshots_count", stats.snapshots_count}};
}

} // namespace pvo
