#pragma once
#include "stop_signal.hpp"
#include "upstream_error.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <utility>

struct RetryPolicy {
    int max_retries = 3;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    double jitter = 0.1;
};

// Runs an operation with exponential backoff between attempts.
// An operation gets max_retries + 1 attempts in total; the last error is rethrown.
class RetryExecutor {
public:
    explicit RetryExecutor(RetryPolicy policy, std::shared_ptr<StopSignal> stop = nullptr);

    template <typename Operation>
    auto run(Operation&& operation, std::optional<int> max_retries = std::nullopt)
        -> decltype(operation()) {
        const int retries = max_retries.value_or(policy_.max_retries);

        for (int attempt = 0;; ++attempt) {
            try {
                return operation();
            } catch (const UpstreamException& e) {
                if (!e.retryable() || attempt >= retries) {
                    throw;
                }
                spdlog::debug("Attempt {}/{} failed ({}): {}",
                              attempt + 1, retries + 1, to_string(e.kind()), e.what());
            } catch (const std::exception& e) {
                if (attempt >= retries) {
                    throw;
                }
                spdlog::debug("Attempt {}/{} failed: {}", attempt + 1, retries + 1, e.what());
            }

            if (!sleep_before_retry(attempt)) {
                throw UpstreamException(ErrorKind::Unavailable, "Retry cancelled by shutdown", false);
            }
        }
    }

    // Delay before the retry following attempt (0-based): base * 2^attempt, capped
    std::chrono::milliseconds delay_for(int attempt) const;

private:
    bool sleep_before_retry(int attempt);

    RetryPolicy policy_;
    std::shared_ptr<StopSignal> stop_;
};
