// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "budget_calculator.hpp"
#include "cycle_scheduler.hpp"
#include "device_interface.hpp"
#include "device_registry.hpp"
#include "history_tracker.hpp"
#include "ideal_state_solver.hpp"
#include "lock_evaluator.hpp"
#include "optimizer_config.hpp"
#include "state_synchronizer.hpp"
#include "surplus_averager.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace pvo {

struct OptimizerStats {
    std::optional<double> surplus_current_w; // availability, positive = surplus
    std::optional<double> surplus_average_w;
    double power_budget_w{0.0};
    double power_rated_total_w{0.0};
    double power_measured_total_w{0.0};
    std::optional<TimePoint> last_update;
    double simulation_power_budget_w{0.0};
    std::vector<std::string> ideal_on;
    std::vector<std::string> simulation_ideal_on;
    std::uint64_t commands_failed{0};
    std::uint64_t surplus_read_failures{0};
};

/// \brief Everything the engine mutates between cycles. Owned by OptimizerEngine, no globals.
struct OptimizerState {
    GlobalConfig global;
    OptimizerStats stats;
};

struct CycleResult {
    bool has_surplus{false};
    double availability_w{0.0};
    LockMap locks;
    Budget budget;
    AllocationResult allocation;
    SyncReport sync;
    Budget simulation_budget;
    AllocationResult simulation;
};

/// \brief Wires the allocation pipeline together and serves the UI/transport request API.
class OptimizerEngine {
public:
    OptimizerEngine(OptimizerConfig cfg, std::shared_ptr<DeviceInterface> io);
    ~OptimizerEngine();

    OptimizerEngine(const OptimizerEngine&) = delete;
    OptimizerEngine& operator=(const OptimizerEngine&) = delete;

    /// \brief Start the surplus sampler and the cycle scheduler.
    void start();
    void stop(StopMode mode = StopMode::Drain);

    /// \brief Read one surplus sample into the sliding window. Sensor faults are counted, not thrown.
    void sample_surplus();

    /// \brief One full optimization cycle: refresh, locks, budget, solve, synchronize, simulate.
    CycleResult run_cycle(TimePoint now, const std::atomic<bool>* cancel = nullptr);

    /// \brief Ask the scheduler for an immediate cycle; false if one is running or the engine is stopped.
    bool run_now();

    nlohmann::json get_config(TimePoint now = Clock::now()) const;
    nlohmann::json get_history(int hours, TimePoint now = Clock::now()) const;
    nlohmann::json get_statistics(TimePoint now = Clock::now()) const;

    /// \brief Apply a partial device update. Throws ConfigurationInvalid; the device keeps its old config then.
    void update_device_config(const std::string& name, const nlohmann::json& patch);
    void update_global_config(const nlohmann::json& patch);

    /// \brief Clear a manual-override lock. Throws ConfigurationInvalid for unknown devices.
    void reset_device_lock(const std::string& name);
    void set_simulation_offset(double watts);

    OptimizerStats stats() const;
    GlobalConfig global_config() const;

    DeviceRegistry& registry() {
        return registry_;
    }
    SurplusAverager& surplus() {
        return surplus_;
    }

private:
    std::shared_ptr<DeviceInterface> io_;
    DeviceRegistry registry_;
    SurplusAverager surplus_;
    IdealStateSolver solver_;
    StateSynchronizer synchronizer_;
    HistoryTracker history_;
    std::unique_ptr<CycleScheduler> scheduler_;

    mutable std::mutex state_mutex_;
    OptimizerState state_;
    std::mutex cycle_mutex_;

    std::atomic<bool> running_{false};
    std::thread sampler_thread_;
    std::mutex sampler_mutex_;
    std::condition_variable sampler_cv_;

    void sampler_loop();
    void publish(const CycleResult& result, const std::vector<DeviceEntry>& devices, TimePoint now);
    CycleSnapshot make_snapshot(const CycleResult& result, const std::vector<DeviceEntry>& devices,
                                TimePoint now) const;
};

} // namespace pvo
