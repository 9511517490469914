#ifndef OFDISC_PERIODIC_TIMER_HPP
#define OFDISC_PERIODIC_TIMER_HPP

#include "ofdisc/logger.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace ofdisc {

// Runs a task on a dedicated thread, first immediately and then once per
// interval. Ticks never overlap. stop() waits for a running tick to finish.
class PeriodicTimer {
public:
    using Task = std::function<void()>;

    PeriodicTimer(const Logger& logger, std::string name);
    ~PeriodicTimer();

    PeriodicTimer(const PeriodicTimer&) = delete;
    PeriodicTimer& operator=(const PeriodicTimer&) = delete;

    // Returns false if already running, or the interval is not positive or
    // too long to schedule on steady_clock.
    bool start(std::chrono::milliseconds interval, Task task);
    void stop();

    bool is_running() const { return running_.load(); }
    uint64_t tick_count() const { return tick_count_.load(); }

private:
    void run_loop(std::chrono::milliseconds interval);

    const Logger& logger_;
    std::string name_;
    Task task_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> tick_count_{0};
    std::mutex state_mutex_;
    std::condition_variable wakeup_;
    std::thread worker_;
};

} // namespace ofdisc

#endif // OFDISC_PERIODIC_TIMER_HPP
