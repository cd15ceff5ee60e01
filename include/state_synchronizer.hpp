// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "device_interface.hpp"
#include "device_registry.hpp"
#include "ideal_state_solver.hpp"
#include "lock_evaluator.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace pvo {

struct CommandRecord {
    std::string device;
    bool on{false};
    bool success{false};
};

struct SyncReport {
    std::vector<CommandRecord> commands;
    int issued{0};
    int failed{0};
    int skipped_locked{0}; // locked devices whose ideal state differed from the actual one
    int in_flight{0};      // devices whose previous command has not returned yet
    bool cancelled{false};
};

/// \brief What a finished device command left behind on the actuators.
struct CommandOutcome {
    std::string device;
    bool on{false};
    bool success{false};
    std::optional<bool> effective; // device state now in effect, unset when unchanged
    TimePoint completed{};
};

/// \brief Owned worker thread executing one device command at a time.
///
/// A command that outlives the caller's wait keeps running; its outcome is kept until
/// take_finished() collects it. No new command is accepted while one is in flight.
class CommandWorker {
public:
    using Job = std::function<CommandOutcome()>;

    explicit CommandWorker(std::string device);
    ~CommandWorker();

    CommandWorker(const CommandWorker&) = delete;
    CommandWorker& operator=(const CommandWorker&) = delete;

    /// \brief Queue \p job. Returns false while a previous job is still running or uncollected.
    bool submit(Job job);

    /// \brief Wait up to \p timeout for the current job and collect its outcome.
    std::optional<CommandOutcome> wait_for(std::chrono::milliseconds timeout);

    /// \brief Collect the outcome of a job that finished after its caller gave up.
    std::optional<CommandOutcome> take_finished();

    bool busy() const;

private:
    enum class Phase {
        Idle,
        Running,
        Finished
    };

    std::string device_;
    mutable std::mutex mutex_;
    std::condition_variable job_cv_;
    std::condition_variable done_cv_;
    Phase phase_{Phase::Idle};
    bool stopping_{false};
    Job job_;
    std::optional<CommandOutcome> outcome_;
    std::thread thread_;

    void run();
};

/// \brief Reconciles the ideal set with actual device state and commands managed actuators.
class StateSynchronizer {
public:
    StateSynchronizer(std::shared_ptr<DeviceInterface> io, std::chrono::milliseconds command_timeout);

    void set_command_timeout(std::chrono::milliseconds timeout);

    /// \brief Issue on/off commands for unlocked, engine-managed devices whose state differs from
    /// the ideal set. Successful commands are recorded in \p registry immediately; failures leave
    /// the recorded target untouched unless part of the command took effect. Devices with a
    /// command still in flight are left alone. \p cancel is checked between devices.
    SyncReport synchronize(const AllocationResult& ideal, const std::vector<DeviceEntry>& devices,
                           const LockMap& locks, DeviceRegistry& registry, TimePoint now,
                           const std::atomic<bool>* cancel = nullptr);

    /// \brief Record commands that completed after their timeout. Returns the number recorded.
    int reconcile(DeviceRegistry& registry);

    /// \brief Drive one device to \p on and wait for the result, bounded by the command timeout.
    std::optional<CommandOutcome> apply(const DeviceConfig& device, bool on);

    bool in_flight(const std::string& device) const;

private:
    std::shared_ptr<DeviceInterface> io_;
    std::chrono::milliseconds command_timeout_;
    std::map<std::string, std::unique_ptr<CommandWorker>> workers_;

    CommandWorker& worker_for(const std::string& device);
    static CommandOutcome execute(DeviceInterface& io, const DeviceConfig& device, bool on);
    static void record(DeviceRegistry& registry, const CommandOutcome& outcome);
};

} // namespace pvo
