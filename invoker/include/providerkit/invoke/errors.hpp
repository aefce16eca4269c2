#pragma once

#include <string>
#include <cstdint>
#include <caf/atom.hpp>
#include <caf/error.hpp>
#include <caf/make_message.hpp>
#include <caf/message.hpp>

namespace providerkit {
namespace invoke {

// Category atom for every error raised by this library
constexpr caf::atom_value error_category() {
    return caf::atom("pkinvoke");
}

// Machine-readable error codes, grouped by the stage that detects them
enum class ErrorCode : uint8_t {
    none = 0,
    // Configuration errors (detected before any invocation)
    invalid_action = 1,
    malformed_request = 2,
    invalid_configuration = 3,
    // Transport errors (HandlerClient)
    connection_error = 10,
    timeout = 11,
    protocol_error = 12,
    // Validation errors (ProgressEvent parsing)
    unknown_status = 20,
    missing_error_code = 21,
    invalid_delay = 22,
    invalid_field = 23,
    contract_violation = 24,
    // Run control
    cancelled = 30,
    internal_error = 40
};

inline caf::error make_error(ErrorCode code, std::string message) {
    return caf::error(static_cast<uint8_t>(code), error_category(),
                      caf::make_message(std::move(message)));
}

inline bool is_invoke_error(const caf::error& err) {
    return err && err.category() == error_category();
}

// Errors from other categories (CAF runtime) are folded into internal_error
inline ErrorCode error_code_of(const caf::error& err) {
    if (!err) {
        return ErrorCode::none;
    }
    if (!is_invoke_error(err)) {
        return ErrorCode::internal_error;
    }
    return static_cast<ErrorCode>(err.code());
}

inline std::string error_message_of(const caf::error& err) {
    if (!err) {
        return "";
    }
    const caf::message& ctx = err.context();
    if (ctx.size() == 1 && ctx.match_element<std::string>(0)) {
        return ctx.get_as<std::string>(0);
    }
    return caf::to_string(err);
}

inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::none:
            return "NONE";
        case ErrorCode::invalid_action:
            return "INVALID_ACTION";
        case ErrorCode::malformed_request:
            return "MALFORMED_REQUEST";
        case ErrorCode::invalid_configuration:
            return "INVALID_CONFIGURATION";
        case ErrorCode::connection_error:
            return "CONNECTION_ERROR";
        case ErrorCode::timeout:
            return "TIMEOUT";
        case ErrorCode::protocol_error:
            return "PROTOCOL_ERROR";
        case ErrorCode::unknown_status:
            return "UNKNOWN_STATUS";
        case ErrorCode::missing_error_code:
            return "MISSING_ERROR_CODE";
        case ErrorCode::invalid_delay:
            return "INVALID_DELAY";
        case ErrorCode::invalid_field:
            return "INVALID_FIELD";
        case ErrorCode::contract_violation:
            return "CONTRACT_VIOLATION";
        case ErrorCode::cancelled:
            return "CANCELLED";
        case ErrorCode::internal_error:
            return "INTERNAL_ERROR";
        default:
            return "UNKNOWN_ERROR";
    }
}

inline bool is_configuration_error(ErrorCode code) {
    return code == ErrorCode::invalid_action || code == ErrorCode::malformed_request ||
           code == ErrorCode::invalid_configuration;
}

inline bool is_transport_error(ErrorCode code) {
    return code == ErrorCode::connection_error || code == ErrorCode::timeout ||
           code == ErrorCode::protocol_error;
}

inline bool is_validation_error(ErrorCode code) {
    return code == ErrorCode::unknown_status || code == ErrorCode::missing_error_code ||
           code == ErrorCode::invalid_delay || code == ErrorCode::invalid_field ||
           code == ErrorCode::contract_violation;
}

} // namespace invoke
} // namespace providerkit
