#pragma once
#include <cstdint>
#include <functional>

#include "sleeper.hpp"

namespace convergence {

enum class WaitOutcome { Success, Exhausted };

// Bookkeeping of one wait, alive only inside waitUntil().
struct OrchestrationAttempt {
    uint32_t retry_count = 0;
    uint32_t max_retries = 0;
    uint32_t interval_seconds = 0;
};

/**
 * Fixed-interval bounded polling.
 *
 * The predicate is polled once immediately and then up to `max_retries` more
 * times, with `interval_seconds` of sleep before each retry. So at most
 * max_retries + 1 polls and max_retries sleeps; no sleep follows the last poll.
 */
class RetryPolicy {
public:
    explicit RetryPolicy(Sleeper& sleeper) : sleeper_(sleeper) {}

    WaitOutcome waitUntil(const std::function<bool()>& predicate,
                          uint32_t max_retries, uint32_t interval_seconds);

    inline static constexpr const char* LOG_TAG = "RetryPolicy";

private:
    Sleeper& sleeper_;
};

} // namespace convergence
