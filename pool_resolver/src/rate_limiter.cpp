#include "rate_limiter.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

RateLimiter::RateLimiter(int max_requests, std::chrono::milliseconds window, std::shared_ptr<StopSignal> stop)
    : max_requests_(max_requests),
      window_(window),
      stop_(stop ? std::move(stop) : std::make_shared<StopSignal>()) {
    if (max_requests_ < 1) {
        throw std::invalid_argument("RateLimiter requires at least one request per window");
    }
    if (window_.count() <= 0) {
        throw std::invalid_argument("RateLimiter window must be positive");
    }
}

bool RateLimiter::acquire() {
    while (true) {
        std::chrono::milliseconds wait{0};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto now = Clock::now();
            prune(now);

            if (admissions_.size() < static_cast<size_t>(max_requests_)) {
                admissions_.push_back(now);
                return true;
            }

            wait = wait_time(now);
        }

        spdlog::debug("Rate limit reached ({} per {} ms), waiting {} ms",
                      max_requests_, window_.count(), wait.count());

        // Another caller may take the slot first; loop and re-check
        if (!stop_->wait_for(wait)) {
            return false;
        }
    }
}

bool RateLimiter::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    prune(now);

    if (admissions_.size() < static_cast<size_t>(max_requests_)) {
        admissions_.push_back(now);
        return true;
    }
    return false;
}

std::chrono::milliseconds RateLimiter::time_until_available() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    prune(now);

    if (admissions_.size() < static_cast<size_t>(max_requests_)) {
        return std::chrono::milliseconds(0);
    }
    return wait_time(now);
}

size_t RateLimiter::admissions_in_window() {
    std::lock_guard<std::mutex> lock(mutex_);
    prune(Clock::now());
    return admissions_.size();
}

void RateLimiter::prune(Clock::time_point now) {
    while (!admissions_.empty() && now - admissions_.front() >= window_) {
        admissions_.pop_front();
    }
}

std::chrono::milliseconds RateLimiter::wait_time(Clock::time_point now) const {
    if (admissions_.empty()) {
        return std::chrono::milliseconds(0);
    }

    auto elapsed = now - admissions_.front();
    auto remaining = std::chrono::ceil<std::chrono::milliseconds>(window_ - elapsed);
    return remaining.count() > 0 ? remaining : std::chrono::milliseconds(1);
}
