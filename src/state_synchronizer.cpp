// SPDX-License-Identifier: Apache-2.0
#include "state_synchronizer.hpp"

#include <everest/logging.hpp>

#include <utility>

namespace pvo {

namespace {

bool guarded(const std::function<bool()>& call, const std::string& what) {
    try {
        return call();
    } catch (const std::exception& e) {
        EVLOG_warning << what << " raised: " << e.what();
        return false;
    }
}

} // namespace

CommandWorker::CommandWorker(std::string device) : device_(std::move(device)) {
    thread_ = std::thread([this]() { run(); });
}

CommandWorker::~CommandWorker() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        if (phase_ == Phase::Running) {
            EVLOG_warning << "Waiting for in-flight command on device " << device_;
        }
    }
    job_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool CommandWorker::submit(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (phase_ != Phase::Idle || stopping_) {
            return false;
        }
        job_ = std::move(job);
        outcome_.reset();
        phase_ = Phase::Running;
    }
    job_cv_.notify_one();
    return true;
}

std::optional<CommandOutcome> CommandWorker::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!done_cv_.wait_for(lock, timeout, [this]() { return phase_ == Phase::Finished; })) {
        return std::nullopt;
    }
    phase_ = Phase::Idle;
    return std::move(outcome_);
}

std::optional<CommandOutcome> CommandWorker::take_finished() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (phase_ != Phase::Finished) {
        return std::nullopt;
    }
    phase_ = Phase::Idle;
    return std::move(outcome_);
}

bool CommandWorker::busy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return phase_ == Phase::Running;
}

void CommandWorker::run() {
    for (;;) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            job_cv_.wait(lock, [this]() { return stopping_ || phase_ == Phase::Running; });
            if (phase_ != Phase::Running) {
                return;
            }
            job = std::move(job_);
        }
        CommandOutcome outcome = job();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            outcome_ = std::move(outcome);
            phase_ = Phase::Finished;
        }
        done_cv_.notify_all();
    }
}

StateSynchronizer::StateSynchronizer(std::shared_ptr<DeviceInterface> io, std::chrono::milliseconds command_timeout) :
    io_(std::move(io)), command_timeout_(command_timeout) {
}

void StateSynchronizer::set_command_timeout(std::chrono::milliseconds timeout) {
    command_timeout_ = timeout;
}

CommandWorker& StateSynchronizer::worker_for(const std::string& device) {
    auto it = workers_.find(device);
    if (it == workers_.end()) {
        it = workers_.emplace(device, std::make_unique<CommandWorker>(device)).first;
    }
    return *it->second;
}

bool StateSynchronizer::in_flight(const std::string& device) const {
    auto it = workers_.find(device);
    return it != workers_.end() && it->second->busy();
}

CommandOutcome StateSynchronizer::execute(DeviceInterface& io, const DeviceConfig& device, bool on) {
    CommandOutcome outcome;
    outcome.device = device.name;
    outcome.on = on;

    if (device.kind == ControlKind::Switch) {
        const bool raw = device.invert_switch ? !on : on;
        outcome.success = guarded([&]() { return io.set_switch(device.switch_entity, raw); },
                                  "set_switch(" + device.switch_entity + ")");
        if (outcome.success) {
            outcome.effective = on;
        }
        outcome.completed = Clock::now();
        return outcome;
    }

    std::vector<const NumericTarget*> written;
    for (const auto& target : device.numeric_targets) {
        const double value = on ? target.activated_value : target.deactivated_value;
        if (guarded([&]() { return io.set_numeric(target.entity, value); }, "set_numeric(" + target.entity + ")")) {
            written.push_back(&target);
        }
    }
    outcome.success = written.size() == device.numeric_targets.size();
    if (outcome.success) {
        outcome.effective = on;
        outcome.completed = Clock::now();
        return outcome;
    }

    // Partial write: restore the targets already moved so the device stays in its previous state.
    std::size_t stuck = 0;
    for (const auto* target : written) {
        const double previous = on ? target->deactivated_value : target->activated_value;
        if (!guarded([&]() { return io.set_numeric(target->entity, previous); },
                     "set_numeric(" + target->entity + ")")) {
            stuck++;
        }
    }
    if (stuck > 0) {
        // Any activated target reads as on; an off command only takes effect once every target moved.
        EVLOG_warning << "Device " << device.name << " left partially " << (on ? "on" : "off") << " (" << stuck
                      << " target(s) could not be restored)";
        if (on) {
            outcome.effective = true;
        }
    }
    outcome.completed = Clock::now();
    return outcome;
}

std::optional<CommandOutcome> StateSynchronizer::apply(const DeviceConfig& device, bool on) {
    auto& worker = worker_for(device.name);
    auto io = io_;
    if (!worker.submit([io, device, on]() { return execute(*io, device, on); })) {
        EVLOG_warning << "Device " << device.name << " still has a command in flight";
        return std::nullopt;
    }
    auto outcome = worker.wait_for(command_timeout_);
    if (!outcome) {
        EVLOG_warning << "Command for device " << device.name << " timed out after " << command_timeout_.count()
                      << " ms; outcome recorded when it returns";
    }
    return outcome;
}

void StateSynchronizer::record(DeviceRegistry& registry, const CommandOutcome& outcome) {
    if (outcome.effective) {
        registry.record_commanded(outcome.device, *outcome.effective, outcome.completed);
    }
}

int StateSynchronizer::reconcile(DeviceRegistry& registry) {
    int recorded = 0;
    for (auto& [name, worker] : workers_) {
        auto outcome = worker->take_finished();
        if (!outcome) {
            continue;
        }
        EVLOG_info << "Late command for device " << name << " returned "
                   << (outcome->success ? "success" : "failure");
        if (outcome->effective) {
            record(registry, *outcome);
            recorded++;
        }
    }
    return recorded;
}

SyncReport StateSynchronizer::synchronize(const AllocationResult& ideal, const std::vector<DeviceEntry>& devices,
                                          const LockMap& locks, DeviceRegistry& registry, TimePoint now,
                                          const std::atomic<bool>* cancel) {
    SyncReport report;
    for (const auto& d : devices) {
        if (!d.config.optimization_enabled) {
            continue;
        }
        const bool should_be_on = ideal.contains(d.config.name);
        if (should_be_on == d.state.is_on) {
            continue;
        }
        auto lock = locks.find(d.config.name);
        if (lock == locks.end() || lock->second.locked) {
            report.skipped_locked++;
            continue;
        }
        if (in_flight(d.config.name)) {
            report.in_flight++;
            continue;
        }
        if (cancel != nullptr && cancel->load()) {
            EVLOG_info << "Cycle cancelled; remaining commands dropped";
            report.cancelled = true;
            break;
        }

        EVLOG_info << "Turning " << (should_be_on ? "on" : "off") << " device " << d.config.name;
        report.issued++;
        const auto outcome = apply(d.config, should_be_on);
        const bool ok = outcome && outcome->success;
        report.commands.push_back({d.config.name, should_be_on, ok});
        if (ok) {
            registry.record_commanded(d.config.name, should_be_on, now);
            continue;
        }
        report.failed++;
        if (outcome) {
            record(registry, *outcome);
        }
        EVLOG_warning << "Command for device " << d.config.name << " failed; retrying next cycle";
    }
    return report;
}

} // namespace pvo
