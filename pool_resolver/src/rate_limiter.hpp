#pragma once
#include "stop_signal.hpp"
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>

// Sliding-window admission control for outbound queries.
// Callers over the ceiling are delayed, never rejected.
class RateLimiter {
public:
    RateLimiter(int max_requests,
                std::chrono::milliseconds window = std::chrono::milliseconds(1000),
                std::shared_ptr<StopSignal> stop = nullptr);

    // Blocks until a slot is free. Returns false only if the stop signal
    // fired while waiting.
    bool acquire();

    // Admits immediately if a slot is free, never waits
    bool try_acquire();

    // Time until the oldest admission leaves the window (0 if a slot is free)
    std::chrono::milliseconds time_until_available();

    size_t admissions_in_window();

private:
    using Clock = std::chrono::steady_clock;

    void prune(Clock::time_point now);
    std::chrono::milliseconds wait_time(Clock::time_point now) const;

    std::mutex mutex_;
    std::deque<Clock::time_point> admissions_;
    int max_requests_;
    std::chrono::milliseconds window_;
    std::shared_ptr<StopSignal> stop_;
};
