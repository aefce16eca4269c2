#pragma once

#include "providerkit/invoke/core.hpp"
#include <caf/error.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace providerkit {
namespace invoke {

enum class OutcomeKind {
    success,
    failed,
    exhausted,
    error,
    config_error
};

// Process exit codes of the CLI
struct ExitCode {
    static constexpr int success = 0;
    static constexpr int failed = 1;
    static constexpr int exhausted = 2;
    static constexpr int error = 3;
    static constexpr int config_error = 4;
    static constexpr int expectation_mismatch = 5;
    static constexpr int unhandled_exception = 127;
};

// The single definitive result of a run
struct ExitOutcome {
    OutcomeKind kind = OutcomeKind::error;
    int exit_code = ExitCode::error;
    std::string message;
    // Handler errorCode for `failed`, error kind (e.g. CONNECTION_ERROR) for `error`/`config_error`
    std::string error_code;
    std::optional<json> resource_model;
    std::optional<json> resource_models;
    std::optional<std::string> next_token;
    std::optional<ProgressEvent> last_event;
    std::vector<std::string> warnings;
    int32_t invocations = 0;
    std::string bearer_token;
    std::string action;
    std::string expected_status;
    bool expectation_met = true;
};

class OutcomeReporter {
public:
    // Maps a terminal LoopState to its outcome. Never fails.
    static ExitOutcome report(const LoopState& state);

    // Outcome for errors detected before the first invocation
    static ExitOutcome config_error(const caf::error& error);

    // "SUCCESS", "FAILED", "FAILED:<errorCode>", "EXHAUSTED" or "ERROR"
    static bool is_valid_expectation(const std::string& expected_status);

    // Marks the outcome as mismatched (exit 5) when it did not end as expected.
    // An empty expectation, or a config_error outcome, is returned unchanged.
    static ExitOutcome expect(ExitOutcome outcome, const std::string& expected_status);

    // Upper-case name of the outcome kind
    static std::string kind_to_string(OutcomeKind kind);

    static json to_json(const ExitOutcome& outcome);
    // Pretty-printed to_json(); invalid UTF-8 in handler text becomes U+FFFD
    static std::string to_json_text(const ExitOutcome& outcome);
    static std::string to_text(const ExitOutcome& outcome);
};

} // namespace invoke
} // namespace providerkit
