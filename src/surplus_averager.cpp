// SPDX-License-Identifier: Apache-2.0
#include "surplus_averager.hpp"

#include <algorithm>

namespace pvo {

void SurplusAverager::observe(double value_w, TimePoint timestamp) {
    std::lock_guard<std::mutex> lock(mutex_);
    Sample sample{value_w, timestamp};
    // Producers normally deliver in order; a late sample is slotted in place.
    const auto pos = std::upper_bound(samples_.begin(), samples_.end(), timestamp,
                                      [](TimePoint t, const Sample& s) { return t < s.timestamp; });
    samples_.insert(pos, sample);
    if (!last_ || timestamp >= last_->timestamp) {
        last_ = sample;
    }
}

std::optional<double> SurplusAverager::average(std::chrono::minutes window, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto cutoff = now - window;
    while (!samples_.empty() && samples_.front().timestamp < cutoff) {
        samples_.pop_front();
    }

    double sum = 0.0;
    std::size_t count = 0;
    for (const auto& s : samples_) {
        if (s.timestamp > now) break;
        sum += s.value_w;
        count++;
    }
    if (count > 0) {
        return sum / static_cast<double>(count);
    }
    if (last_) {
        return last_->value_w;
    }
    return std::nullopt;
}

std::optional<SurplusAverager::Sample> SurplusAverager::latest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_;
}

std::size_t SurplusAverager::retained_samples() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_.size();
}

void SurplusAverager::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.clear();
    last_.reset();
}

} // namespace pvo
