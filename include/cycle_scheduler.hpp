// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace pvo {

enum class StopMode {
    Drain, // let the in-flight cycle finish
    Cancel // additionally raise the cooperative cancellation flag
};

/// \brief Fixed-interval, non-overlapping cycle driver.
///
/// A timer thread calls trigger() once per period; cycles execute on a dedicated worker thread.
/// A trigger arriving while a cycle is Running is dropped and counted as a skip.
class CycleScheduler {
public:
    using CycleFn = std::function<void(const std::atomic<bool>& cancel)>;

    CycleScheduler(CycleFn cycle, std::chrono::milliseconds period);
    ~CycleScheduler();

    CycleScheduler(const CycleScheduler&) = delete;
    CycleScheduler& operator=(const CycleScheduler&) = delete;

    void start();
    void stop(StopMode mode = StopMode::Drain);

    /// \brief Request a cycle now. Returns false when one is already running or the scheduler is stopped.
    bool trigger();

    void set_period(std::chrono::milliseconds period);

    /// \brief Block until no cycle is pending or running. Returns false on timeout.
    bool wait_idle(std::chrono::milliseconds timeout);

    bool running() const {
        return busy_.load();
    }
    std::uint64_t cycles_run() const {
        return cycles_run_.load();
    }
    std::uint64_t cycles_skipped() const {
        return cycles_skipped_.load();
    }

private:
    CycleFn cycle_;
    std::chrono::milliseconds period_;

    std::mutex mutex_;
    std::condition_variable timer_cv_;
    std::condition_variable worker_cv_;
    std::condition_variable idle_cv_;
    bool pending_{false};
    bool stopping_{false};

    std::atomic<bool> started_{false};
    std::atomic<bool> busy_{false}; // Idle=false, Running=true
    std::atomic<bool> cancel_{false};
    std::atomic<std::uint64_t> cycles_run_{0};
    std::atomic<std::uint64_t> cycles_skipped_{0};

    std::thread timer_thread_;
    std::thread worker_thread_;

    void timer_loop();
    void worker_loop();
};

} // namespace pvo
