#pragma once

#include "providerkit/invoke/core.hpp"
#include <algorithm>
#include <cstdint>

namespace providerkit {
namespace invoke {

/**
 * Timeout Enforcement for handler invocations
 *
 * Implements:
 * - Separate connection timeout
 * - Total per-invocation deadline (connection + transfer)
 */
class TimeoutEnforcement {
public:
    static constexpr int64_t kMinimumTimeoutMs = 100;

    /**
     * Connection establishment timeout, never longer than the invocation deadline
     */
    static int64_t get_connection_timeout_ms(const InvokeConfig& config) {
        int64_t total = get_total_timeout_ms(config);
        if (config.connect_timeout_ms <= 0) {
            return total;
        }
        return std::min(config.connect_timeout_ms, total);
    }

    /**
     * Total deadline of one invocation, including connection establishment
     */
    static int64_t get_total_timeout_ms(const InvokeConfig& config) {
        return std::max(config.timeout_ms, kMinimumTimeoutMs);
    }
};

} // namespace invoke
} // namespace providerkit
