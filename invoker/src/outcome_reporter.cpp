#include "providerkit/invoke/outcome_reporter.hpp"
#include "providerkit/invoke/errors.hpp"
#include "providerkit/invoke/wire_converter.hpp"
#include <sstream>

namespace providerkit {
namespace invoke {

namespace {

const std::string kFailedPrefix = "FAILED:";

void copy_event_payload(ExitOutcome& outcome, const ProgressEvent& event) {
    outcome.message = event.message.value_or("");
    outcome.resource_model = event.resource_model;
    outcome.resource_models = event.resource_models;
    outcome.next_token = event.next_token;
}

} // namespace

ExitOutcome OutcomeReporter::report(const LoopState& state) {
    ExitOutcome outcome;
    outcome.invocations = state.invocations_issued();
    outcome.bearer_token = state.bearer_token;
    outcome.action = WireConverter::action_to_string(state.action);
    outcome.warnings = state.warnings;
    outcome.last_event = state.last_event;

    switch (state.run_state) {
        case RunState::done_success:
            outcome.kind = OutcomeKind::success;
            outcome.exit_code = ExitCode::success;
            if (state.last_event) {
                copy_event_payload(outcome, *state.last_event);
            }
            break;

        case RunState::done_failed:
            outcome.kind = OutcomeKind::failed;
            outcome.exit_code = ExitCode::failed;
            if (state.last_event) {
                copy_event_payload(outcome, *state.last_event);
                outcome.error_code = state.last_event->error_code.value_or("");
            }
            break;

        case RunState::done_exhausted: {
            outcome.kind = OutcomeKind::exhausted;
            outcome.exit_code = ExitCode::exhausted;
            std::ostringstream message;
            message << "Handler still IN_PROGRESS after " << outcome.invocations << " invocation(s)";
            if (state.max_reinvoke) {
                message << " (max re-invocations: " << *state.max_reinvoke << ")";
            }
            if (state.last_event && state.last_event->message) {
                message << ": " << *state.last_event->message;
            }
            outcome.message = message.str();
            break;
        }

        case RunState::done_error:
            outcome.kind = OutcomeKind::error;
            outcome.exit_code = ExitCode::error;
            outcome.error_code = error_code_to_string(error_code_of(state.error));
            outcome.message = error_message_of(state.error);
            break;

        default:
            // A run that never reached a terminal state
            outcome.kind = OutcomeKind::error;
            outcome.exit_code = ExitCode::error;
            outcome.error_code = error_code_to_string(ErrorCode::internal_error);
            outcome.message = "Run ended in non-terminal state " +
                              WireConverter::run_state_to_string(state.run_state);
            break;
    }
    return outcome;
}

ExitOutcome OutcomeReporter::config_error(const caf::error& error) {
    ExitOutcome outcome;
    outcome.kind = OutcomeKind::config_error;
    outcome.exit_code = ExitCode::config_error;
    outcome.error_code = error_code_to_string(error_code_of(error));
    outcome.message = error_message_of(error);
    return outcome;
}

bool OutcomeReporter::is_valid_expectation(const std::string& expected_status) {
    if (expected_status == "SUCCESS" || expected_status == "FAILED" ||
        expected_status == "EXHAUSTED" || expected_status == "ERROR") {
        return true;
    }
    return expected_status.size() > kFailedPrefix.size() &&
           expected_status.compare(0, kFailedPrefix.size(), kFailedPrefix) == 0;
}

ExitOutcome OutcomeReporter::expect(ExitOutcome outcome, const std::string& expected_status) {
    if (expected_status.empty() || outcome.kind == OutcomeKind::config_error) {
        return outcome;
    }
    outcome.expected_status = expected_status;

    bool met;
    if (expected_status.compare(0, kFailedPrefix.size(), kFailedPrefix) == 0) {
        met = outcome.kind == OutcomeKind::failed &&
              outcome.error_code == expected_status.substr(kFailedPrefix.size());
    } else {
        met = kind_to_string(outcome.kind) == expected_status;
    }

    if (!met) {
        outcome.expectation_met = false;
        outcome.exit_code = ExitCode::expectation_mismatch;
    }
    return outcome;
}

std::string OutcomeReporter::kind_to_string(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::success:
            return "SUCCESS";
        case OutcomeKind::failed:
            return "FAILED";
        case OutcomeKind::exhausted:
            return "EXHAUSTED";
        case OutcomeKind::error:
            return "ERROR";
        case OutcomeKind::config_error:
            return "CONFIG_ERROR";
        default:
            return "ERROR";
    }
}

json OutcomeReporter::to_json(const ExitOutcome& outcome) {
    json j;
    j["outcome"] = kind_to_string(outcome.kind);
    j["exitCode"] = outcome.exit_code;
    if (!outcome.action.empty()) {
        j["action"] = outcome.action;
    }
    if (!outcome.bearer_token.empty()) {
        j["bearerToken"] = outcome.bearer_token;
    }
    j["invocations"] = outcome.invocations;
    if (!outcome.message.empty()) {
        j["message"] = outcome.message;
    }
    if (!outcome.error_code.empty()) {
        j["errorCode"] = outcome.error_code;
    }
    if (outcome.resource_model) {
        j["resourceModel"] = *outcome.resource_model;
    }
    if (outcome.resource_models) {
        j["resourceModels"] = *outcome.resource_models;
    }
    if (outcome.next_token) {
        j["nextToken"] = *outcome.next_token;
    }
    if (outcome.last_event) {
        j["lastEvent"] = WireConverter::encode_event(*outcome.last_event);
    }
    if (!outcome.warnings.empty()) {
        j["warnings"] = outcome.warnings;
    }
    if (!outcome.expected_status.empty()) {
        j["expectedStatus"] = outcome.expected_status;
        j["expectationMet"] = outcome.expectation_met;
    }
    return j;
}

std::string OutcomeReporter::to_json_text(const ExitOutcome& outcome) {
    return to_json(outcome).dump(2, ' ', false, json::error_handler_t::replace);
}

std::string OutcomeReporter::to_text(const ExitOutcome& outcome) {
    std::ostringstream out;
    out << "Outcome: " << kind_to_string(outcome.kind) << " (exit " << outcome.exit_code << ")\n";
    if (!outcome.action.empty()) {
        out << "Action: " << outcome.action << "\n";
        out << "Invocations: " << outcome.invocations << "\n";
        out << "Bearer token: " << outcome.bearer_token << "\n";
    }
    if (!outcome.error_code.empty()) {
        out << "Error code: " << outcome.error_code << "\n";
    }
    if (!outcome.message.empty()) {
        out << "Message: " << outcome.message << "\n";
    }
    if (outcome.resource_model) {
        out << "Resource model: " << outcome.resource_model->dump(2) << "\n";
    }
    if (outcome.resource_models) {
        out << "Resource models: " << outcome.resource_models->dump(2) << "\n";
    }
    if (outcome.next_token) {
        out << "Next token: " << *outcome.next_token << "\n";
    }
    if (outcome.kind == OutcomeKind::exhausted && outcome.last_event &&
        outcome.last_event->callback_context) {
        out << "Last callback context: " << outcome.last_event->callback_context->dump() << "\n";
    }
    for (const auto& warning : outcome.warnings) {
        out << "Warning: " << warning << "\n";
    }
    if (!outcome.expected_status.empty()) {
        out << "Expected: " << outcome.expected_status
            << (outcome.expectation_met ? " (met)" : " (NOT met)") << "\n";
    }
    return out.str();
}

} // namespace invoke
} // namespace providerkit
