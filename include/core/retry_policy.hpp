#pragma once

#include "utils/config.hpp"
#include <chrono>

namespace meetscribe {
namespace core {

/**
 * Bounded exponential backoff. Attempt numbers are 1-based: the delay before
 * attempt n+1 is initial * multiplier^(n-1), clamped to the maximum, with
 * +/-25% jitter when enabled.
 */
class RetryPolicy {
public:
    explicit RetryPolicy(const utils::RetrySettings& settings = utils::RetrySettings{});

    int maxAttempts() const { return settings_.maxAttempts; }
    bool shouldRetry(int attemptsMade) const { return attemptsMade < settings_.maxAttempts; }

    std::chrono::milliseconds backoffAfter(int attemptNumber) const;

    const utils::RetrySettings& settings() const { return settings_; }

private:
    utils::RetrySettings settings_;
};

} // namespace core
} // namespace meetscribe
