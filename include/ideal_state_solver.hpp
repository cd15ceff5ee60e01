// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "budget_calculator.hpp"
#include "device_registry.hpp"
#include "lock_evaluator.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace pvo {

struct TierTrace {
    int priority{0};
    double budget_in_w{0.0};
    double selected_w{0.0};
    std::vector<std::string> selected;
    bool exact{true}; // false when the greedy fallback packed this tier
};

struct AllocationResult {
    std::vector<std::string> ideal_on; // tier order, config order within a tier
    double remaining_budget_w{0.0};
    std::vector<TierTrace> tiers;

    bool contains(const std::string& name) const;
    double selected_power_w() const;
};

/// \brief Priority-tiered 0/1 subset-sum allocator.
///
/// Tiers are processed in ascending priority with the budget threaded through. Within a tier
/// the subset with the largest power not exceeding the remaining budget is chosen; ties prefer
/// fewer devices, then the earliest devices in configuration order. Weights are rated powers
/// rounded up to whole watts so a chosen subset never exceeds the budget entering the tier.
class IdealStateSolver {
public:
    explicit IdealStateSolver(long max_dp_cells = 4'000'000);

    void set_max_dp_cells(long cells);

    AllocationResult solve(const std::vector<DeviceEntry>& devices, const LockMap& locks, double budget_w,
                           DeviceScope scope = DeviceScope::Managed) const;

    /// \brief Exact selection over integer weights; returns chosen indices in ascending order.
    static std::vector<std::size_t> select_exact(const std::vector<long>& weights, long capacity);

    /// \brief Descending-weight packing, ties by index. Not optimal in general.
    static std::vector<std::size_t> select_greedy(const std::vector<long>& weights, long capacity);

    static long weight_for(double rated_power_w);

private:
    long max_dp_cells_;
};

} // namespace pvo
