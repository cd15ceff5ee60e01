// SPDX-License-Identifier: Apache-2.0
#include "ideal_state_solver.hpp"

#include <everest/logging.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <numeric>

namespace pvo {

bool AllocationResult::contains(const std::string& name) const {
    return std::find(ideal_on.begin(), ideal_on.end(), name) != ideal_on.end();
}

double AllocationResult::selected_power_w() const {
    double sum = 0.0;
    for (const auto& t : tiers) {
        sum += t.selected_w;
    }
    return sum;
}

IdealStateSolver::IdealStateSolver(long max_dp_cells) : max_dp_cells_(max_dp_cells) {
}

void IdealStateSolver::set_max_dp_cells(long cells) {
    max_dp_cells_ = cells;
}

long IdealStateSolver::weight_for(double rated_power_w) {
    return std::max(1L, static_cast<long>(std::ceil(rated_power_w)));
}

std::vector<std::size_t> IdealStateSolver::select_exact(const std::vector<long>& weights, long capacity) {
    const std::size_t n = weights.size();
    if (n == 0 || capacity <= 0) {
        return {};
    }
    const auto width = static_cast<std::size_t>(capacity) + 1;
    constexpr int unreachable = std::numeric_limits<int>::max();

    // best[i * width + s]: fewest items from [i, n) summing exactly to s.
    std::vector<int> best((n + 1) * width, unreachable);
    best[n * width] = 0;
    for (std::size_t i = n; i-- > 0;) {
        const auto w = static_cast<std::size_t>(weights[i]);
        for (std::size_t s = 0; s < width; ++s) {
            int v = best[(i + 1) * width + s];
            if (w <= s) {
                const int with = best[(i + 1) * width + s - w];
                if (with != unreachable && with + 1 < v) {
                    v = with + 1;
                }
            }
            best[i * width + s] = v;
        }
    }

    std::size_t target = width;
    while (target-- > 0) {
        if (best[target] != unreachable) {
            break;
        }
    }

    // Walk forward taking the earliest item consistent with an optimal count.
    std::vector<std::size_t> chosen;
    std::size_t s = target;
    for (std::size_t i = 0; i < n && s > 0; ++i) {
        const auto w = static_cast<std::size_t>(weights[i]);
        if (w > s) {
            continue;
        }
        const int with = best[(i + 1) * width + s - w];
        if (with != unreachable && with + 1 == best[i * width + s]) {
            chosen.push_back(i);
            s -= w;
        }
    }
    return chosen;
}

std::vector<std::size_t> IdealStateSolver::select_greedy(const std::vector<long>& weights, long capacity) {
    std::vector<std::size_t> order(weights.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&](std::size_t a, std::size_t b) { return weights[a] > weights[b]; });

    std::vector<std::size_t> chosen;
    long left = capacity;
    for (auto i : order) {
        if (weights[i] <= left) {
            chosen.push_back(i);
            left -= weights[i];
        }
    }
    std::sort(chosen.begin(), chosen.end());
    return chosen;
}

AllocationResult IdealStateSolver::solve(const std::vector<DeviceEntry>& devices, const LockMap& locks,
                                         double budget_w, DeviceScope scope) const {
    std::map<int, std::vector<const DeviceEntry*>> tiers;
    for (const auto& d : devices) {
        if (!in_scope(d.config, scope)) {
            continue;
        }
        auto it = locks.find(d.config.name);
        if (it == locks.end() || it->second.locked) {
            continue;
        }
        tiers[d.config.priority].push_back(&d);
    }

    AllocationResult result;
    double remaining = budget_w;
    for (const auto& [priority, candidates] : tiers) {
        TierTrace trace;
        trace.priority = priority;
        trace.budget_in_w = remaining;

        std::vector<long> weights;
        weights.reserve(candidates.size());
        long total_weight = 0;
        for (const auto* c : candidates) {
            weights.push_back(weight_for(c->config.rated_power_w));
            total_weight += weights.back();
        }

        std::vector<std::size_t> chosen;
        if (remaining >= 1.0) {
            const double floor_budget = std::floor(remaining);
            const long capacity =
                floor_budget >= static_cast<double>(total_weight) ? total_weight : static_cast<long>(floor_budget);
            const auto cells = static_cast<double>(weights.size()) * (static_cast<double>(capacity) + 1.0);
            if (capacity == total_weight) {
                chosen.resize(weights.size());
                std::iota(chosen.begin(), chosen.end(), 0);
            } else if (cells <= static_cast<double>(max_dp_cells_)) {
                chosen = select_exact(weights, capacity);
            } else {
                EVLOG_warning << "Tier " << priority << ": " << weights.size() << " candidates x " << capacity + 1
                              << " W exceeds the solver limit; using greedy packing (may be non-optimal)";
                chosen = select_greedy(weights, capacity);
                trace.exact = false;
            }
        }

        for (auto idx : chosen) {
            const auto* c = candidates[idx];
            trace.selected.push_back(c->config.name);
            trace.selected_w += c->config.rated_power_w;
            result.ideal_on.push_back(c->config.name);
        }
        remaining -= trace.selected_w;
        result.tiers.push_back(std::move(trace));
    }
    result.remaining_budget_w = remaining;
    EVLOG_debug << "Allocated " << result.ideal_on.size() << " device(s), remaining budget " << remaining << " W";
    return result;
}

} // namespace pvo
