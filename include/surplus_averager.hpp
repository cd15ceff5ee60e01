// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "optimizer_config.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace pvo {

/// \brief Time-windowed mean of a power signal (grid surplus, or one device's measured power).
///
/// Samples older than the requested window are evicted lazily on read. When the window is empty
/// the most recent sample ever observed is returned (cold start); std::nullopt means no sample
/// has ever arrived. Safe for concurrent observe()/average() calls.
class SurplusAverager {
public:
    struct Sample {
        double value_w{0.0};
        TimePoint timestamp{};
    };

    void observe(double value_w, TimePoint timestamp);

    std::optional<double> average(std::chrono::minutes window, TimePoint now);
    std::optional<Sample> latest() const;

    std::size_t retained_samples() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::deque<Sample> samples_; // ordered by timestamp
    std::optional<Sample> last_;
};

/// \brief Convert an averaged grid reading into power available for allocation.
/// Grid-meter polarity reports export as negative; inverted sensors report it as positive.
inline double surplus_to_availability(double averaged_w, bool invert) {
    return invert ? averaged_w : -averaged_w;
}

} // namespace pvo
