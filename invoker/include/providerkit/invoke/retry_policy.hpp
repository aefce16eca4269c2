#pragma once

#include "providerkit/invoke/errors.hpp"
#include <algorithm>
#include <cstdint>

namespace providerkit {
namespace invoke {

/**
 * Transport retry policy of the HTTP handler client
 *
 * Only requests that never reached the handler are retried, so a retry can
 * not cause a second execution of the same invocation. The reinvocation loop
 * itself never retries.
 *
 * Implements:
 * - Exponential backoff
 * - Error classification (delivered vs. undelivered)
 * - Retry budget (max_retries)
 */
class RetryPolicy {
public:
    struct Config {
        int64_t base_delay_ms = 100;  // Base delay for exponential backoff
        int64_t max_delay_ms = 2000;  // Maximum delay between retries
        int32_t max_retries = 0;      // 0 = exactly one attempt per invocation
    };

    RetryPolicy(const Config& config = Config()) : config_(config) {}

    /**
     * Delay before retry `attempt` (0-based)
     * Formula: delay = base * 2^attempt (capped at max_delay_ms)
     */
    int64_t calculate_backoff_delay(int32_t attempt) const {
        if (attempt > 30) {
            return config_.max_delay_ms;
        }
        int64_t delay = config_.base_delay_ms * (1LL << attempt);
        return std::min(delay, config_.max_delay_ms);
    }

    /**
     * Check if a failed attempt may be repeated
     *
     * Retryable:
     * - connection errors (request not delivered)
     * - HTTP 429 and 503 (rejected before the function ran)
     *
     * Non-retryable:
     * - timeouts (the handler may have executed)
     * - any other protocol error, validation error or cancellation
     */
    bool is_retryable(ErrorCode error_code, int http_status_code = 0) const {
        if (http_status_code == 429 || http_status_code == 503) {
            return true;
        }

        switch (error_code) {
            case ErrorCode::connection_error:
                return true;

            case ErrorCode::timeout:
            case ErrorCode::protocol_error:
            case ErrorCode::cancelled:
                return false;

            default:
                return false;
        }
    }

    bool is_budget_exhausted(int32_t attempt) const {
        return attempt >= config_.max_retries;
    }

    int32_t max_retries() const {
        return config_.max_retries;
    }

private:
    Config config_;
};

} // namespace invoke
} // namespace providerkit
