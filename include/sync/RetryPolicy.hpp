#pragma once

#include "config/Config.hpp"
#include "sync/model/Job.hpp"

#include <chrono>

namespace es::sync {

// Backoff schedule indexed by retry count. Jitter never pushes an interval
// past the next step of the schedule, so delay(n) <= delay(n + 1).
class RetryPolicy {
public:
    explicit RetryPolicy(config::BackoffConfig cfg);

    // Un-jittered step for the given retry count (1-based; 0 is treated as 1).
    [[nodiscard]] std::chrono::milliseconds baseDelay(unsigned int retryCount) const;

    [[nodiscard]] std::chrono::milliseconds maxJitter(unsigned int retryCount) const;

    [[nodiscard]] std::chrono::milliseconds delay(unsigned int retryCount) const;

    [[nodiscard]] model::TimePoint nextAttempt(unsigned int retryCount, model::TimePoint now) const;

private:
    config::BackoffConfig cfg_;
};

}
