// SPDX-License-Identifier: Apache-2.0
#include "cycle_scheduler.hpp"

#include <everest/logging.hpp>

#include <utility>

namespace pvo {

CycleScheduler::CycleScheduler(CycleFn cycle, std::chrono::milliseconds period) :
    cycle_(std::move(cycle)), period_(period) {
}

CycleScheduler::~CycleScheduler() {
    stop();
}

void CycleScheduler::start() {
    if (started_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = false;
        pending_ = false;
    }
    cancel_ = false;
    worker_thread_ = std::thread([this]() { worker_loop(); });
    timer_thread_ = std::thread([this]() { timer_loop(); });
}

void CycleScheduler::stop(StopMode mode) {
    if (!started_.exchange(false)) {
        return;
    }
    if (mode == StopMode::Cancel) {
        cancel_ = true;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    timer_cv_.notify_all();
    worker_cv_.notify_all();
    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
    idle_cv_.notify_all();
}

bool CycleScheduler::trigger() {
    if (!started_) {
        return false;
    }
    bool expected = false;
    if (!busy_.compare_exchange_strong(expected, true)) {
        cycles_skipped_++;
        EVLOG_info << "Optimization cycle still running; trigger skipped (" << cycles_skipped_.load() << " total)";
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            busy_ = false;
            return false;
        }
        pending_ = true;
    }
    worker_cv_.notify_one();
    return true;
}

void CycleScheduler::set_period(std::chrono::milliseconds period) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        period_ = period;
    }
    timer_cv_.notify_all();
}

bool CycleScheduler::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]() { return !pending_ && !busy_.load(); });
}

void CycleScheduler::timer_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    auto next = std::chrono::steady_clock::now() + period_;
    while (!stopping_) {
        const auto period = period_;
        if (timer_cv_.wait_until(lock, next, [this, period]() { return stopping_ || period_ != period; })) {
            if (stopping_) {
                break;
            }
            next = std::chrono::steady_clock::now() + period_; // period changed
            continue;
        }
        lock.unlock();
        trigger();
        lock.lock();
        const auto now = std::chrono::steady_clock::now();
        next += period_;
        while (next <= now) {
            next += period_;
        }
    }
}

void CycleScheduler::worker_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        worker_cv_.wait(lock, [this]() { return pending_ || stopping_; });
        if (!pending_) {
            break; // stopping with nothing queued
        }
        if (stopping_) {
            // Accepted but not yet started: no new cycle after shutdown begins.
            pending_ = false;
            busy_ = false;
            break;
        }
        pending_ = false;
        lock.unlock();
        try {
            cycle_(cancel_);
        } catch (const std::exception& e) {
            EVLOG_warning << "Optimization cycle error: " << e.what();
        }
        cycles_run_++;
        lock.lock();
        busy_ = false;
        idle_cv_.notify_all();
    }
    idle_cv_.notify_all();
}

} // namespace pvo
