#pragma once

#include "providerkit/invoke/core.hpp"
#include "providerkit/invoke/errors.hpp"
#include <caf/expected.hpp>
#include <cstdint>

namespace providerkit {
namespace invoke {

// Validates a handler response envelope and turns it into a ProgressEvent.
//
// Fatal violations come back as validation errors (unknown_status,
// missing_error_code, invalid_delay, invalid_field, contract_violation).
// Non-fatal ones are recorded in ProgressEvent::warnings. With `strict` set,
// the SUCCESS-event warnings become contract_violation errors.
class ProgressEventParser {
public:
    // Longest delay a handler may request (one year); larger values are invalid_delay
    static constexpr int64_t max_callback_delay_seconds = 365LL * 24 * 60 * 60;

    static caf::expected<ProgressEvent> parse(const RawResponse& response,
                                              Action action,
                                              bool strict = false);

    // Parse a decoded payload directly (no transport metadata)
    static caf::expected<ProgressEvent> parse_payload(const json& payload,
                                                      Action action,
                                                      bool strict = false);
};

} // namespace invoke
} // namespace providerkit
