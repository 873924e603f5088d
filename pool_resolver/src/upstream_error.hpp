#pragma once
#include "types.hpp"
#include <stdexcept>
#include <string>

// Raised by upstream clients. The retry loop inspects retryable() to decide
// whether another attempt is worth making.
class UpstreamException : public std::runtime_error {
public:
    UpstreamException(ErrorKind kind, const std::string& message, bool retryable = true)
        : std::runtime_error(message), kind_(kind), retryable_(retryable) {}

    ErrorKind kind() const noexcept { return kind_; }
    bool retryable() const noexcept { return retryable_; }

private:
    ErrorKind kind_;
    bool retryable_;
};
