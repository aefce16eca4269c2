#include "providerkit/invoke/progress_event.hpp"
#include "providerkit/invoke/wire_converter.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace providerkit {
namespace invoke {

namespace {

constexpr size_t kMaxQuotedBody = 512;

bool has_value(const json& payload, const char* key) {
    auto it = payload.find(key);
    return it != payload.end() && !it->is_null();
}

std::string quote_body(const std::string& body) {
    if (body.size() <= kMaxQuotedBody) {
        return body;
    }
    // Never cut inside a multi-byte UTF-8 sequence
    size_t cut = kMaxQuotedBody;
    while (cut > 0 && (static_cast<unsigned char>(body[cut]) & 0xC0) == 0x80) {
        cut--;
    }
    return body.substr(0, cut) + "...";
}

} // namespace

caf::expected<ProgressEvent> ProgressEventParser::parse(const RawResponse& response,
                                                        Action action,
                                                        bool strict) {
    auto event = parse_payload(response.payload, action, strict);
    if (!event) {
        // Keep the offending response next to the validation error
        const std::string& body = response.body.empty() ? response.payload.dump() : response.body;
        return make_error(error_code_of(event.error()),
                          error_message_of(event.error()) + " (response: " + quote_body(body) + ")");
    }
    return event;
}

caf::expected<ProgressEvent> ProgressEventParser::parse_payload(const json& payload,
                                                                Action action,
                                                                bool strict) {
    if (!payload.is_object()) {
        return make_error(ErrorCode::invalid_field,
                          std::string("Response must be a JSON object, got ") + payload.type_name());
    }

    ProgressEvent event;

    // status
    if (!has_value(payload, "status") || !payload.at("status").is_string()) {
        return make_error(ErrorCode::unknown_status, "Response has no status");
    }
    const std::string status_text = payload.at("status").get<std::string>();
    auto status = WireConverter::string_to_status(status_text);
    if (!status) {
        return make_error(ErrorCode::unknown_status, "Unknown status '" + status_text + "'");
    }
    event.status = *status;

    // message
    if (has_value(payload, "message")) {
        if (!payload.at("message").is_string()) {
            return make_error(ErrorCode::invalid_field, "message must be a string");
        }
        event.message = payload.at("message").get<std::string>();
    }

    // errorCode
    if (has_value(payload, "errorCode")) {
        if (!payload.at("errorCode").is_string()) {
            return make_error(ErrorCode::invalid_field, "errorCode must be a string");
        }
        event.error_code = payload.at("errorCode").get<std::string>();
    }

    // callbackContext
    if (has_value(payload, "callbackContext")) {
        if (!payload.at("callbackContext").is_object()) {
            return make_error(ErrorCode::invalid_field, "callbackContext must be a JSON object");
        }
        event.callback_context = payload.at("callbackContext");
    }

    // resourceModel(s), nextToken
    if (has_value(payload, "resourceModel")) {
        event.resource_model = payload.at("resourceModel");
    }
    if (has_value(payload, "resourceModels")) {
        if (!payload.at("resourceModels").is_array()) {
            return make_error(ErrorCode::invalid_field, "resourceModels must be a JSON array");
        }
        event.resource_models = payload.at("resourceModels");
    }
    if (has_value(payload, "nextToken")) {
        if (!payload.at("nextToken").is_string()) {
            return make_error(ErrorCode::invalid_field, "nextToken must be a string");
        }
        event.next_token = payload.at("nextToken").get<std::string>();
    }

    switch (event.status) {
        case OperationStatus::failed:
            if (!event.error_code) {
                return make_error(ErrorCode::missing_error_code, "FAILED event without errorCode");
            }
            if (!WireConverter::is_known_handler_error_code(*event.error_code)) {
                event.warnings.push_back("FAILED event carries unrecognized errorCode '" +
                                         *event.error_code + "'");
            }
            if (event.callback_context && !event.callback_context->empty()) {
                event.warnings.push_back("FAILED event carries callbackContext " + event.callback_context->dump());
            }
            if (has_value(payload, "callbackDelaySeconds")) {
                event.warnings.push_back("FAILED event carries callbackDelaySeconds " +
                                         payload.at("callbackDelaySeconds").dump());
            }
            break;

        case OperationStatus::in_progress:
            if (has_value(payload, "callbackDelaySeconds")) {
                const json& delay = payload.at("callbackDelaySeconds");
                if (!delay.is_number_integer()) {
                    return make_error(ErrorCode::invalid_delay, "callbackDelaySeconds must be an integer");
                }
                int64_t seconds = delay.get<int64_t>();
                if (seconds < 0) {
                    return make_error(ErrorCode::invalid_delay,
                                      "callbackDelaySeconds must not be negative, got " + std::to_string(seconds));
                }
                if (seconds > max_callback_delay_seconds) {
                    return make_error(ErrorCode::invalid_delay,
                                      "callbackDelaySeconds must not exceed " +
                                      std::to_string(max_callback_delay_seconds) + ", got " +
                                      std::to_string(seconds));
                }
                event.callback_delay_seconds = seconds;
            }
            if (event.error_code) {
                event.warnings.push_back("IN_PROGRESS event carries errorCode '" + *event.error_code + "'");
            }
            break;

        case OperationStatus::success: {
            std::vector<std::string> violations;
            if (event.error_code) {
                violations.push_back("SUCCESS event carries errorCode '" + *event.error_code + "'");
            }
            if (event.callback_context && !event.callback_context->empty()) {
                violations.push_back("SUCCESS event carries callbackContext " + event.callback_context->dump());
            }
            if (strict && !violations.empty()) {
                return make_error(ErrorCode::contract_violation, violations.front());
            }
            event.warnings.insert(event.warnings.end(), violations.begin(), violations.end());

            if (action == Action::read && !event.resource_model) {
                event.warnings.push_back("READ succeeded without resourceModel");
            }
            if (action == Action::list && !event.resource_models) {
                event.warnings.push_back("LIST succeeded without resourceModels");
            }
            break;
        }
    }

    return event;
}

} // namespace invoke
} // namespace providerkit
