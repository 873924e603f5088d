#include "stop_signal.hpp"

bool StopSignal::wait_for(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (delay.count() <= 0) {
        return !stopped_;
    }
    cv_.wait_for(lock, delay, [this] { return stopped_; });
    return !stopped_;
}

void StopSignal::request_stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
    }
    cv_.notify_all();
}

bool StopSignal::stop_requested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopped_;
}
