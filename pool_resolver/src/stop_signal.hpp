#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>

// Shared cancellation point for every delay the engine takes
// (rate-limit waits, retry backoff, the cache sweep interval).
class StopSignal {
public:
    // Sleeps for delay. Returns false if a stop was requested first.
    bool wait_for(std::chrono::milliseconds delay);

    void request_stop();
    bool stop_requested() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopped_ = false;
};
