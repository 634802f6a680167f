#include "retry_policy.hpp"

#include "logging.hpp"

namespace convergence {

WaitOutcome RetryPolicy::waitUntil(const std::function<bool()>& predicate,
                                   uint32_t max_retries, uint32_t interval_seconds) {
    OrchestrationAttempt attempt{0, max_retries, interval_seconds};

    while (true) {
        if (predicate()) {
            LOGD("Condition met after {} retries", attempt.retry_count);
            return WaitOutcome::Success;
        }
        if (attempt.retry_count >= attempt.max_retries) {
            LOGW("Gave up after {} attempts", attempt.retry_count + 1);
            return WaitOutcome::Exhausted;
        }

        ++attempt.retry_count;
        LOGI("Attempt {} of {}. Waiting {} seconds...",
             attempt.retry_count, attempt.max_retries, attempt.interval_seconds);
        sleeper_.sleepFor(std::chrono::seconds(attempt.interval_seconds));
    }
}

} // namespace convergence
