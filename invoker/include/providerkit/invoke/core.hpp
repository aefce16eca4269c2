#pragma once

#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <chrono>
#include <cstdint>
#include <caf/expected.hpp>
#include <caf/error.hpp>
#include <nlohmann/json.hpp>

namespace providerkit {
namespace invoke {

using json = nlohmann::json;

class CancellationToken;

// Lifecycle action a handler implements
enum class Action {
    create,
    read,
    update,
    remove,  // "DELETE" on the wire
    list
};

// Status reported by the handler in a ProgressEvent
enum class OperationStatus {
    success,
    failed,
    in_progress
};

// State of one reinvocation run. The four done_* values are terminal.
enum class RunState {
    pending,
    running,
    continuing,
    done_success,
    done_failed,
    done_exhausted,
    done_error
};

inline bool is_terminal(OperationStatus status) {
    return status != OperationStatus::in_progress;
}

inline bool is_done(RunState state) {
    return state == RunState::done_success || state == RunState::done_failed ||
           state == RunState::done_exhausted || state == RunState::done_error;
}

// Explicit configuration passed to the builder and the client.
// Nothing here is process-wide state; independent runs may use different values.
struct InvokeConfig {
    std::string endpoint = "http://127.0.0.1:3001";
    std::string function_name = "TestEntrypoint";
    std::string region = "us-east-1";
    std::optional<int32_t> max_reinvoke;  // unset = unbounded
    int64_t timeout_ms = 60000;
    int64_t connect_timeout_ms = 5000;
    int32_t transport_retries = 0;
    bool strict_contract = false;
};

// One request sent to the handler
struct InvocationRequest {
    Action action = Action::create;
    json resource_request = json::object();  // caller payload, never mutated
    json callback_context = json::object();  // empty on the first invocation
    std::string bearer_token;
    std::string region;
};

// Parsed response of one invocation
struct ProgressEvent {
    OperationStatus status = OperationStatus::in_progress;
    std::optional<std::string> message;
    std::optional<std::string> error_code;
    std::optional<json> callback_context;
    std::optional<int64_t> callback_delay_seconds;
    std::optional<json> resource_model;
    std::optional<json> resource_models;
    std::optional<std::string> next_token;
    std::vector<std::string> warnings;  // contract warnings, never fatal here
};

// Raw response handed back by a HandlerClient
struct RawResponse {
    int http_status = 0;
    json payload;      // always a JSON object when returned successfully
    std::string body;  // undecoded body, kept for error reports
};

// Complete state of a run. Owned and mutated only by ReinvocationLoop.
struct LoopState {
    RunState run_state = RunState::pending;
    int32_t invocation_count = 0;
    std::optional<int32_t> max_reinvoke;
    std::optional<ProgressEvent> last_event;
    caf::error error;
    std::vector<std::string> warnings;
    std::string bearer_token;
    Action action = Action::create;

    // Invocations that actually reached the client
    int32_t invocations_issued() const {
        return run_state == RunState::done_exhausted ? invocation_count - 1 : invocation_count;
    }
};

// HandlerClient interface
// A pure transport: one call per invoke(), no status interpretation, no caching.
// Implementations must be safe to share between independent runs.
class HandlerClient {
public:
    virtual ~HandlerClient() = default;

    virtual std::string describe() const = 0;

    virtual caf::expected<RawResponse> invoke(const InvocationRequest& request,
                                              const CancellationToken& token) = 0;
};

} // namespace invoke
} // namespace providerkit
