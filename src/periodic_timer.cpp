#include "ofdisc/periodic_timer.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace ofdisc {

PeriodicTimer::PeriodicTimer(const Logger& logger, std::string name)
    : logger_(logger), name_(std::move(name)) {}

PeriodicTimer::~PeriodicTimer() {
    stop();
}

bool PeriodicTimer::start(std::chrono::milliseconds interval, Task task) {
    if (interval.count() <= 0 || !task) {
        logger_.warning("TIMER", name_ + ": refusing to start with a non-positive interval or empty task");
        return false;
    }
    // run_loop() schedules up to two intervals past steady_clock::now()
    auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::time_point::max() - std::chrono::steady_clock::now());
    if (interval >= headroom / 2) {
        logger_.warning("TIMER", name_ + ": refusing to start, interval of " + std::to_string(interval.count()) +
                                 " ms overflows the clock");
        return false;
    }

    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return false; // Already running
    }
    // A previous run may have left a finished thread behind.
    if (worker_.joinable()) {
        worker_.join();
    }

    task_ = std::move(task);
    worker_ = std::thread(&PeriodicTimer::run_loop, this, interval);
    logger_.debug("TIMER", name_ + ": started with interval " + std::to_string(interval.count()) + " ms");
    return true;
}

void PeriodicTimer::stop() {
    bool expected = true;
    if (running_.compare_exchange_strong(expected, false)) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
        }
        wakeup_.notify_all();
        if (worker_.joinable()) {
            worker_.join();
        }
        logger_.debug("TIMER", name_ + ": stopped after " + std::to_string(tick_count_.load()) + " ticks");
    }
}

void PeriodicTimer::run_loop(std::chrono::milliseconds interval) {
    auto next_tick = std::chrono::steady_clock::now();
    while (running_.load()) {
        try {
            task_();
        } catch (const std::exception& e) {
            logger_.error("TIMER", name_ + ": tick failed: " + e.what());
        }
        tick_count_.fetch_add(1);

        // After an overrun, tick once more right away instead of catching up.
        next_tick = std::max(next_tick + interval, std::chrono::steady_clock::now());
        std::unique_lock<std::mutex> lock(state_mutex_);
        wakeup_.wait_until(lock, next_tick, [this] { return !running_.load(); });
    }
}

} // namespace ofdisc
