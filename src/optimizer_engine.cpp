// SPDX-License-Identifier: Apache-2.0
#include "optimizer_engine.hpp"

#include <everest/logging.hpp>

#include <cmath>
#include <sstream>
#include <utility>

namespace pvo {

namespace {

std::string join_names(const std::vector<std::string>& names) {
    std::ostringstream out;
    out << "[";
    for (std::size_t i = 0; i < names.size(); ++i) {
        out << (i == 0 ? "" : ", ") << names[i];
    }
    out << "]";
    return out.str();
}

nlohmann::json optional_number(const std::optional<double>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

OptimizerEngine::OptimizerEngine(OptimizerConfig cfg, std::shared_ptr<DeviceInterface> io) :
    io_(std::move(io)),
    registry_(std::chrono::minutes(cfg.global.sliding_window_min)),
    solver_(cfg.global.solver_max_dp_cells),
    synchronizer_(io_, std::chrono::milliseconds(cfg.global.command_timeout_ms)),
    history_(std::chrono::seconds(cfg.global.history_snapshot_interval_s),
             std::chrono::hours(24 * cfg.global.history_retention_days)) {
    if (!io_) {
        throw std::runtime_error("OptimizerEngine requires a device interface");
    }
    validate_global_config(cfg.global);
    registry_.set_devices(std::move(cfg.devices));
    state_.global = cfg.global;
    scheduler_ = std::make_unique<CycleScheduler>(
        [this](const std::atomic<bool>& cancel) { run_cycle(Clock::now(), &cancel); },
        std::chrono::seconds(cfg.global.cycle_time_s));
}

OptimizerEngine::~OptimizerEngine() {
    stop();
}

void OptimizerEngine::start() {
    if (running_.exchange(true)) {
        return;
    }
    const auto global = global_config();
    EVLOG_info << "Starting PV optimizer: " << registry_.size() << " device(s), cycle " << global.cycle_time_s
               << " s, window " << global.sliding_window_min << " min";
    sample_surplus();
    sampler_thread_ = std::thread([this]() { sampler_loop(); });
    scheduler_->start();
    scheduler_->trigger();
}

void OptimizerEngine::stop(StopMode mode) {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(sampler_mutex_); // pairs with the predicate check in sampler_loop
    }
    sampler_cv_.notify_all();
    if (sampler_thread_.joinable()) {
        sampler_thread_.join();
    }
    scheduler_->stop(mode);
    EVLOG_info << "PV optimizer stopped after " << scheduler_->cycles_run() << " cycle(s)";
}

void OptimizerEngine::sampler_loop() {
    while (running_) {
        const auto interval = std::chrono::seconds(global_config().surplus_sample_interval_s);
        std::unique_lock<std::mutex> lock(sampler_mutex_);
        if (sampler_cv_.wait_for(lock, interval, [this]() { return !running_; })) {
            break;
        }
        lock.unlock();
        sample_surplus();
    }
}

void OptimizerEngine::sample_surplus() {
    const auto entity = global_config().surplus_entity;
    try {
        const auto sample = io_->read_surplus(entity);
        surplus_.observe(sample.value_w, sample.timestamp);
    } catch (const std::exception& e) {
        std::uint64_t failures = 0;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            failures = ++state_.stats.surplus_read_failures;
        }
        EVLOG_warning << "Surplus read failed (" << failures << " total): " << e.what();
    }
}

CycleResult OptimizerEngine::run_cycle(TimePoint now, const std::atomic<bool>* cancel) {
    std::lock_guard<std::mutex> cycle_lock(cycle_mutex_);
    const auto global = global_config();
    solver_.set_max_dp_cells(global.solver_max_dp_cells);
    synchronizer_.set_command_timeout(std::chrono::milliseconds(global.command_timeout_ms));

    registry_.refresh(*io_, now);
    synchronizer_.reconcile(registry_);
    const auto devices = registry_.snapshot();

    CycleResult result;
    result.locks = evaluate_locks(devices, now);
    const auto average = surplus_.average(std::chrono::minutes(global.sliding_window_min), now);
    if (!average) {
        EVLOG_warning << "No surplus sample received yet; allocation skipped this cycle";
        publish(result, devices, now);
        return result;
    }
    result.has_surplus = true;
    result.availability_w = surplus_to_availability(*average, global.invert_surplus);

    result.budget = compute_budget(result.availability_w, devices, result.locks);
    result.allocation = solver_.solve(devices, result.locks, result.budget.total_w);
    result.sync = synchronizer_.synchronize(result.allocation, devices, result.locks, registry_, now, cancel);
    if (result.sync.cancelled) {
        publish(result, registry_.snapshot(), now);
        return result;
    }

    // What-if pass for simulation-flagged devices; never reaches an actuator.
    const auto sim_locks = evaluate_locks(devices, now, LockPolicy::Simulation);
    result.simulation_budget = compute_budget(result.availability_w + global.simulation_offset_w, devices, sim_locks,
                                              DeviceScope::Simulation);
    result.simulation =
        solver_.solve(devices, sim_locks, result.simulation_budget.total_w, DeviceScope::Simulation);

    EVLOG_info << "Optimization cycle completed. Real: budget=" << result.budget.total_w
               << " W, ideal=" << join_names(result.allocation.ideal_on)
               << "; simulation: budget=" << result.simulation_budget.total_w
               << " W, ideal=" << join_names(result.simulation.ideal_on);

    publish(result, registry_.snapshot(), now);
    return result;
}

void OptimizerEngine::publish(const CycleResult& result, const std::vector<DeviceEntry>& devices, TimePoint now) {
    const auto latest = surplus_.latest();
    const auto global = global_config();

    OptimizerStats update;
    if (latest) {
        update.surplus_current_w = surplus_to_availability(latest->value_w, global.invert_surplus);
    }
    if (result.has_surplus) {
        update.surplus_average_w = result.availability_w;
    }
    update.power_budget_w = result.budget.total_w;
    update.simulation_power_budget_w = result.simulation_budget.total_w;
    update.ideal_on = result.allocation.ideal_on;
    update.simulation_ideal_on = result.simulation.ideal_on;
    update.last_update = now;
    for (const auto& d : devices) {
        if (d.state.is_on) {
            update.power_rated_total_w += d.config.rated_power_w;
            update.power_measured_total_w += effective_power_w(d);
        }
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        update.commands_failed = state_.stats.commands_failed + static_cast<std::uint64_t>(result.sync.failed);
        update.surplus_read_failures = state_.stats.surplus_read_failures;
        state_.stats = std::move(update);
    }

    if (result.has_surplus) {
        history_.offer(make_snapshot(result, devices, now));
    }
}

CycleSnapshot OptimizerEngine::make_snapshot(const CycleResult& result, const std::vector<DeviceEntry>& devices,
                                             TimePoint now) const {
    CycleSnapshot snap;
    snap.timestamp = now;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        snap.current_surplus_w = state_.stats.surplus_current_w.value_or(result.availability_w);
        snap.power_on_devices_w = state_.stats.power_measured_total_w;
    }
    snap.averaged_surplus_w = result.availability_w;
    snap.power_budget_w = result.budget.total_w;
    for (const auto& d : devices) {
        if (d.state.is_on) {
            snap.active_devices.push_back({d.config.name, effective_power_w(d), d.config.priority});
        }
    }
    return snap;
}

bool OptimizerEngine::run_now() {
    if (!running_) {
        return false;
    }
    EVLOG_info << "Manual optimization cycle requested";
    return scheduler_->trigger();
}

OptimizerStats OptimizerEngine::stats() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_.stats;
}

GlobalConfig OptimizerEngine::global_config() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_.global;
}

nlohmann::json OptimizerEngine::get_config(TimePoint now) const {
    const auto global = global_config();
    const auto stats = this->stats();
    const auto devices = registry_.snapshot();

    nlohmann::json out;
    out["version"] = PVO_VERSION;
    out["global_config"] = to_json(global);

    out["devices"] = nlohmann::json::array();
    for (const auto& d : devices) {
        const auto lock = evaluate_lock(d.config, d.state, now);
        nlohmann::json state;
        state["is_on"] = d.state.is_on;
        state["available"] = d.state.available;
        state["measured_power"] = optional_number(d.state.measured_power_w);
        state["measured_power_avg"] = optional_number(d.state.measured_power_avg_w);
        state["is_locked"] = lock.locked;
        state["lock_reason"] = lock_reason_to_string(lock.reason);
        state["pvo_last_target_state"] =
            d.state.last_target_state ? nlohmann::json(*d.state.last_target_state) : nlohmann::json(nullptr);
        state["last_change"] = d.state.last_change ? nlohmann::json(to_iso8601(*d.state.last_change))
                                                   : nlohmann::json(nullptr);
        out["devices"].push_back({{"config", to_json(d.config)}, {"state", state}});
    }

    nlohmann::json s;
    s["surplus_current"] = optional_number(stats.surplus_current_w);
    s["surplus_average"] = optional_number(stats.surplus_average_w);
    s["power_budget"] = stats.power_budget_w;
    s["power_rated_total"] = stats.power_rated_total_w;
    s["power_measured_total"] = stats.power_measured_total_w;
    if (stats.last_update) {
        s["last_update_timestamp"] = to_iso8601(*stats.last_update);
        s["elapsed_seconds_since_update"] =
            std::chrono::duration_cast<std::chrono::seconds>(now - *stats.last_update).count();
    } else {
        s["last_update_timestamp"] = nullptr;
        s["elapsed_seconds_since_update"] = nullptr;
    }
    s["surplus_offset"] = global.simulation_offset_w;
    s["ideal_on_list"] = stats.ideal_on;
    s["simulation_power_budget"] = stats.simulation_power_budget_w;
    s["simulation_ideal_on_list"] = stats.simulation_ideal_on;
    s["cycles_run"] = scheduler_->cycles_run();
    s["cycles_skipped"] = scheduler_->cycles_skipped();
    s["commands_failed"] = stats.commands_failed;
    s["surplus_read_failures"] = stats.surplus_read_failures;
    out["optimizer_stats"] = s;
    return out;
}

nlohmann::json OptimizerEngine::get_history(int hours, TimePoint now) const {
    auto out = nlohmann::json::array();
    if (hours <= 0) {
        return out;
    }
    for (const auto& snap : history_.get_snapshots(std::chrono::hours(hours), now)) {
        out.push_back(to_json(snap));
    }
    return out;
}

nlohmann::json OptimizerEngine::get_statistics(TimePoint now) const {
    const auto stats = history_.get_statistics(now);
    if (!stats) {
        return nlohmann::json::object();
    }
    return to_json(*stats);
}

void OptimizerEngine::update_device_config(const std::string& name, const nlohmann::json& patch) {
    const auto existing = registry_.find(name);
    if (!existing) {
        throw ConfigurationInvalid("Unknown device: " + name);
    }
    DeviceConfig updated;
    try {
        updated = apply_device_patch(existing->config, patch);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationInvalid("Device '" + name + "': " + e.what());
    }
    if (updated.name != name) {
        throw ConfigurationInvalid("Device '" + name + "': renaming is not supported");
    }
    registry_.update_config(updated);
    EVLOG_info << "Updated configuration of device " << name;
}

void OptimizerEngine::update_global_config(const nlohmann::json& patch) {
    GlobalConfig updated;
    try {
        updated = apply_global_patch(global_config(), patch);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationInvalid(std::string("Global config: ") + e.what());
    }
    validate_global_config(updated);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_.global = updated;
    }
    registry_.set_power_window(std::chrono::minutes(updated.sliding_window_min));
    history_.configure(std::chrono::seconds(updated.history_snapshot_interval_s),
                       std::chrono::hours(24 * updated.history_retention_days));
    scheduler_->set_period(std::chrono::seconds(updated.cycle_time_s));
    sampler_cv_.notify_all();
    EVLOG_info << "Updated global configuration";
}

void OptimizerEngine::reset_device_lock(const std::string& name) {
    if (!registry_.reset_lock(name)) {
        throw ConfigurationInvalid("Unknown device: " + name);
    }
    EVLOG_info << "Reset lock of device " << name;
}

void OptimizerEngine::set_simulation_offset(double watts) {
    if (!std::isfinite(watts)) {
        throw ConfigurationInvalid("Simulation offset must be finite");
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.global.simulation_offset_w = watts;
    EVLOG_info << "Simulation surplus offset set to " << watts << " W";
}

} // namespace pvo
