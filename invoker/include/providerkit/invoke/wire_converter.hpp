#pragma once

#include "providerkit/invoke/core.hpp"
#include "providerkit/invoke/errors.hpp"
#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace providerkit {
namespace invoke {

// Conversions between the in-memory model and the handler wire format.
// Wire names are the upper-case forms used by resource handlers.
class WireConverter {
public:
    static std::string action_to_string(Action action) {
        switch (action) {
            case Action::create:
                return "CREATE";
            case Action::read:
                return "READ";
            case Action::update:
                return "UPDATE";
            case Action::remove:
                return "DELETE";
            case Action::list:
                return "LIST";
            default:
                return "CREATE";
        }
    }

    // Unrecognized values fail fast, before any invocation
    static caf::expected<Action> parse_action(const std::string& text) {
        if (text == "CREATE") {
            return Action::create;
        } else if (text == "READ") {
            return Action::read;
        } else if (text == "UPDATE") {
            return Action::update;
        } else if (text == "DELETE") {
            return Action::remove;
        } else if (text == "LIST") {
            return Action::list;
        }
        return make_error(ErrorCode::invalid_action,
                          "Unknown action '" + text + "', expected one of CREATE, READ, UPDATE, DELETE, LIST");
    }

    static std::string status_to_string(OperationStatus status) {
        switch (status) {
            case OperationStatus::success:
                return "SUCCESS";
            case OperationStatus::failed:
                return "FAILED";
            case OperationStatus::in_progress:
                return "IN_PROGRESS";
            default:
                return "FAILED";
        }
    }

    static std::optional<OperationStatus> string_to_status(const std::string& text) {
        if (text == "SUCCESS") {
            return OperationStatus::success;
        } else if (text == "FAILED") {
            return OperationStatus::failed;
        } else if (text == "IN_PROGRESS") {
            return OperationStatus::in_progress;
        }
        return std::nullopt;
    }

    static std::string run_state_to_string(RunState state) {
        switch (state) {
            case RunState::pending:
                return "PENDING";
            case RunState::running:
                return "RUNNING";
            case RunState::continuing:
                return "CONTINUING";
            case RunState::done_success:
                return "DONE_SUCCESS";
            case RunState::done_failed:
                return "DONE_FAILED";
            case RunState::done_exhausted:
                return "DONE_EXHAUSTED";
            case RunState::done_error:
                return "DONE_ERROR";
            default:
                return "DONE_ERROR";
        }
    }

    // Error codes handlers are expected to report with FAILED.
    // Anything else is still passed through verbatim, with a contract warning.
    static bool is_known_handler_error_code(const std::string& code) {
        static const std::vector<std::string> known = {
            "NotUpdatable", "InvalidRequest", "AccessDenied", "InvalidCredentials",
            "AlreadyExists", "NotFound", "ResourceConflict", "Throttling",
            "ServiceLimitExceeded", "NotStabilized", "GeneralServiceException",
            "ServiceInternalError", "NetworkFailure", "InternalFailure",
            "InvalidTypeConfiguration"
        };
        return std::find(known.begin(), known.end(), code) != known.end();
    }

    // Encode a request for the handler endpoint.
    // callbackContext is always an object; requestData is the caller payload verbatim.
    static json encode_request(const InvocationRequest& request) {
        json payload;
        payload["action"] = action_to_string(request.action);
        payload["bearerToken"] = request.bearer_token;
        payload["region"] = request.region;
        payload["callbackContext"] = request.callback_context.is_null() ? json::object()
                                                                        : request.callback_context;
        payload["requestData"] = request.resource_request;
        return payload;
    }

    static json encode_event(const ProgressEvent& event) {
        json out;
        out["status"] = status_to_string(event.status);
        if (event.message) {
            out["message"] = *event.message;
        }
        if (event.error_code) {
            out["errorCode"] = *event.error_code;
        }
        if (event.callback_context) {
            out["callbackContext"] = *event.callback_context;
        }
        if (event.callback_delay_seconds) {
            out["callbackDelaySeconds"] = *event.callback_delay_seconds;
        }
        if (event.resource_model) {
            out["resourceModel"] = *event.resource_model;
        }
        if (event.resource_models) {
            out["resourceModels"] = *event.resource_models;
        }
        if (event.next_token) {
            out["nextToken"] = *event.next_token;
        }
        return out;
    }
};

} // namespace invoke
} // namespace providerkit
