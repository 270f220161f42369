#include "sync/RetryPolicy.hpp"
#include "crypto/random.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

using namespace es::sync;
using namespace std::chrono;

RetryPolicy::RetryPolicy(config::BackoffConfig cfg) : cfg_(std::move(cfg)) {
    if (cfg_.schedule.empty()) throw std::invalid_argument("Backoff schedule must not be empty");
    if (!std::ranges::is_sorted(cfg_.schedule)) throw std::invalid_argument("Backoff schedule must be non-decreasing");
    if (cfg_.schedule.front().count() < 0 || cfg_.cap.count() < 0) throw std::invalid_argument("Backoff delays must be >= 0");
    if (cfg_.jitter_ratio < 0.0 || cfg_.jitter_ratio > 1.0) throw std::invalid_argument("Backoff jitter_ratio must be within [0, 1]");
}

milliseconds RetryPolicy::baseDelay(const unsigned int retryCount) const {
    const size_t idx = std::min<size_t>(retryCount == 0 ? 0 : retryCount - 1, cfg_.schedule.size() - 1);
    return duration_cast<milliseconds>(std::min(cfg_.schedule[idx], cfg_.cap));
}

milliseconds RetryPolicy::maxJitter(const unsigned int retryCount) const {
    const auto base = baseDelay(retryCount);
    if (base >= cfg_.cap) return milliseconds::zero();

    const auto n = std::max(retryCount, 1u);
    const auto next = baseDelay(n == std::numeric_limits<unsigned int>::max() ? n : n + 1);
    const auto byRatio = milliseconds(static_cast<int64_t>(static_cast<double>(base.count()) * cfg_.jitter_ratio));
    return std::max(milliseconds::zero(), std::min(byRatio, next - base));
}

milliseconds RetryPolicy::delay(const unsigned int retryCount) const {
    const auto base = baseDelay(retryCount);
    const auto bound = maxJitter(retryCount).count();
    if (bound <= 0) return base;

    const auto limit = static_cast<uint32_t>(std::min<int64_t>(bound, std::numeric_limits<uint32_t>::max() - 1));
    return base + milliseconds(crypto::uniform_below(limit + 1));
}

es::sync::model::TimePoint RetryPolicy::nextAttempt(const unsigned int retryCount, const model::TimePoint now) const {
    return now + duration_cast<model::TimePoint::duration>(delay(retryCount));
}
