#include "core/retry_policy.hpp"
#include <algorithm>
#include <cmath>
#include <random>

namespace meetscribe {
namespace core {

RetryPolicy::RetryPolicy(const utils::RetrySettings& settings)
    : settings_(settings) {
    if (settings_.maxAttempts < 1) {
        settings_.maxAttempts = 1;
    }
}

std::chrono::milliseconds RetryPolicy::backoffAfter(int attemptNumber) const {
    double delay = static_cast<double>(settings_.initialBackoff.count());
    if (attemptNumber > 1) {
        delay *= std::pow(settings_.multiplier, attemptNumber - 1);
    }

    if (settings_.jitter) {
        static thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_real_distribution<> jitter(0.75, 1.25);
        delay *= jitter(gen);
    }

    delay = std::min(delay, static_cast<double>(settings_.maxBackoff.count()));
    delay = std::max(delay, 0.0);
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

} // namespace core
} // namespace meetscribe
