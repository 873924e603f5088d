#include "retry_executor.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>

RetryExecutor::RetryExecutor(RetryPolicy policy, std::shared_ptr<StopSignal> stop)
    : policy_(policy),
      stop_(stop ? std::move(stop) : std::make_shared<StopSignal>()) {
    if (policy_.max_retries < 0) {
        policy_.max_retries = 0;
    }
}

std::chrono::milliseconds RetryExecutor::delay_for(int attempt) const {
    if (attempt < 0) {
        return std::chrono::milliseconds(0);
    }

    double delay_ms = static_cast<double>(policy_.base_delay.count()) * std::pow(2.0, attempt);
    delay_ms = std::min(delay_ms, static_cast<double>(policy_.max_delay.count()));

    // Jitter (±policy_.jitter)
    delay_ms = util::random_jitter(delay_ms, policy_.jitter);

    return std::chrono::milliseconds(static_cast<int64_t>(std::max(delay_ms, 0.0)));
}

bool RetryExecutor::sleep_before_retry(int attempt) {
    auto delay = delay_for(attempt);
    spdlog::debug("Retrying in {} ms", delay.count());
    return stop_->wait_for(delay);
}
