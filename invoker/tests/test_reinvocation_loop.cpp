#include <iostream>
#include <cassert>
#include <chrono>
#include <deque>
#include <functional>
#include <sstream>
#include <string>
#include <vector>
#include "providerkit/invoke/core.hpp"
#include "providerkit/invoke/cancellation.hpp"
#include "providerkit/invoke/errors.hpp"
#include "providerkit/invoke/observability.hpp"
#include "providerkit/invoke/reinvocation_loop.hpp"
#include "providerkit/invoke/request_builder.hpp"

using namespace providerkit::invoke;

namespace {

// Replays canned responses and records every request it receives
class ScriptedClient : public HandlerClient {
public:
    using Reply = std::function<caf::expected<RawResponse>(const InvocationRequest&)>;

    void push(const json& payload) {
        replies_.push_back([payload](const InvocationRequest&) -> caf::expected<RawResponse> {
            RawResponse raw;
            raw.http_status = 200;
            raw.payload = payload;
            raw.body = payload.dump();
            return raw;
        });
    }

    void push_error(ErrorCode code, const std::string& message) {
        replies_.push_back([code, message](const InvocationRequest&) -> caf::expected<RawResponse> {
            return make_error(code, message);
        });
    }

    void push_reply(Reply reply) {
        replies_.push_back(std::move(reply));
    }

    // Answers every call beyond the script with this payload
    void repeat(const json& payload) {
        repeat_ = payload;
    }

    std::string describe() const override {
        return "scripted";
    }

    caf::expected<RawResponse> invoke(const InvocationRequest& request,
                                      const CancellationToken&) override {
        requests.push_back(request);
        if (replies_.empty()) {
            if (!repeat_.is_null()) {
                RawResponse raw;
                raw.http_status = 200;
                raw.payload = repeat_;
                return raw;
            }
            return make_error(ErrorCode::internal_error, "script exhausted");
        }
        Reply reply = replies_.front();
        replies_.pop_front();
        return reply(request);
    }

    std::vector<InvocationRequest> requests;

private:
    std::deque<Reply> replies_;
    json repeat_;
};

// Records requested delays instead of sleeping
class FakeSleeper : public Sleeper {
public:
    bool sleep_for(std::chrono::seconds delay, const CancellationToken& token) override {
        delays.push_back(delay);
        if (on_sleep) {
            on_sleep();
        }
        return !token.is_cancelled();
    }

    std::vector<std::chrono::seconds> delays;
    std::function<void()> on_sleep;
};

InvocationRequest first_request(Action action, const json& body) {
    RequestBuilder builder{InvokeConfig{}};
    auto request = builder.build(action, body);
    assert(request);
    return *request;
}

json in_progress(const json& context, int delay = 0) {
    json payload = {{"status", "IN_PROGRESS"}, {"callbackDelaySeconds", delay}};
    if (!context.is_null()) {
        payload["callbackContext"] = context;
    }
    return payload;
}

} // namespace

void test_create_completes_after_one_reinvocation() {
    std::cout << "Testing CREATE: IN_PROGRESS then SUCCESS..." << std::endl;

    ScriptedClient client;
    client.push(in_progress({{"step", 1}}));
    client.push({{"status", "SUCCESS"}, {"resourceModel", {{"name", "x"}, {"id", "r-1"}}}});

    FakeSleeper sleeper;
    ReinvocationLoop loop(client, first_request(Action::create, {{"name", "x"}}), std::nullopt);
    const LoopState& state = loop.run(sleeper);

    assert(state.run_state == RunState::done_success);
    assert(state.invocation_count == 2);
    assert(state.invocations_issued() == 2);
    assert(client.requests.size() == 2);
    assert(client.requests[0].callback_context.empty());
    assert(client.requests[1].callback_context == json({{"step", 1}}));
    assert(client.requests[1].resource_request == json({{"name", "x"}}));
    assert(state.last_event->status == OperationStatus::success);
    assert((*state.last_event->resource_model)["id"] == "r-1");
    assert(!state.error);

    std::cout << "✓ CREATE scenario test passed" << std::endl;
}

void test_budget_zero_exhausts_after_one_invocation() {
    std::cout << "Testing maxReinvoke = 0 with a handler that never finishes..." << std::endl;

    ScriptedClient client;
    client.repeat(in_progress({{"poll", true}}));

    FakeSleeper sleeper;
    ReinvocationLoop loop(client, first_request(Action::update, {{"id", "r-1"}}), 0);
    const LoopState& state = loop.run(sleeper);

    assert(state.run_state == RunState::done_exhausted);
    assert(client.requests.size() == 1);
    assert(state.invocations_issued() == 1);
    assert(state.last_event->status == OperationStatus::in_progress);

    std::cout << "✓ Budget zero test passed" << std::endl;
}

void test_budget_bounds_invocations() {
    std::cout << "Testing maxReinvoke = k allows exactly k + 1 invocations..." << std::endl;

    for (int32_t k = 1; k <= 4; k++) {
        ScriptedClient client;
        client.repeat(in_progress(json::object()));

        FakeSleeper sleeper;
        ReinvocationLoop loop(client, first_request(Action::read, {{"id", "r"}}), k);
        const LoopState& state = loop.run(sleeper);

        assert(state.run_state == RunState::done_exhausted);
        assert(client.requests.size() == static_cast<size_t>(k + 1));
        assert(state.invocation_count == k + 2);
    }

    // The (k+1)-th invocation may still succeed
    ScriptedClient client;
    client.push(in_progress({{"n", 1}}));
    client.push(in_progress({{"n", 2}}));
    client.push({{"status", "SUCCESS"}});

    FakeSleeper sleeper;
    ReinvocationLoop loop(client, first_request(Action::remove, {{"id", "r"}}), 2);
    assert(loop.run(sleeper).run_state == RunState::done_success);
    assert(client.requests.size() == 3);

    std::cout << "✓ Budget bound test passed" << std::endl;
}

void test_failed_ends_run() {
    std::cout << "Testing FAILED NotFound ends the run..." << std::endl;

    ScriptedClient client;
    client.push({{"status", "FAILED"}, {"errorCode", "NotFound"}, {"message", "gone"}});

    FakeSleeper sleeper;
    ReinvocationLoop loop(client, first_request(Action::read, {{"id", "missing"}}), std::nullopt);
    const LoopState& state = loop.run(sleeper);

    assert(state.run_state == RunState::done_failed);
    assert(client.requests.size() == 1);
    assert(*state.last_event->error_code == "NotFound");
    assert(*state.last_event->message == "gone");
    assert(sleeper.delays.empty());

    std::cout << "✓ FAILED scenario test passed" << std::endl;
}

void test_connection_error_is_not_retried() {
    std::cout << "Testing connection error ends the run without retry..." << std::endl;

    ScriptedClient client;
    client.push_error(ErrorCode::connection_error, "connection refused");
    client.push({{"status", "SUCCESS"}});

    FakeSleeper sleeper;
    ReinvocationLoop loop(client, first_request(Action::create, {{"name", "x"}}), std::nullopt);
    const LoopState& state = loop.run(sleeper);

    assert(state.run_state == RunState::done_error);
    assert(client.requests.size() == 1);
    assert(error_code_of(state.error) == ErrorCode::connection_error);
    assert(!state.last_event);

    std::cout << "✓ Connection error scenario test passed" << std::endl;
}

void test_validation_error_ends_run() {
    std::cout << "Testing invalid response ends the run..." << std::endl;

    ScriptedClient client;
    client.push(in_progress({{"step", 1}}));
    client.push({{"status", "IN_PROGRESS"}, {"callbackDelaySeconds", -3}});

    FakeSleeper sleeper;
    ReinvocationLoop loop(client, first_request(Action::create, {{"name", "x"}}), std::nullopt);
    const LoopState& state = loop.run(sleeper);

    assert(state.run_state == RunState::done_error);
    assert(error_code_of(state.error) == ErrorCode::invalid_delay);
    assert(client.requests.size() == 2);
    // The last valid event is kept
    assert(*state.last_event->callback_context == json({{"step", 1}}));

    std::cout << "✓ Validation error test passed" << std::endl;
}

void test_context_is_carried_verbatim() {
    std::cout << "Testing callbackContext round trip N -> N+1..." << std::endl;

    json contexts[] = {
        {{"step", 1}},
        {{"nested", {{"ids", {1, 2, 3}}, {"flag", false}}}, {"text", "ü & \"quotes\""}},
        json::object(),
        {{"big", 9007199254740993LL}, {"pi", 3.25}}
    };

    ScriptedClient client;
    for (const auto& context : contexts) {
        client.push(in_progress(context));
    }
    client.push({{"status", "SUCCESS"}});

    FakeSleeper sleeper;
    ReinvocationLoop loop(client, first_request(Action::update, {{"id", "r"}}), std::nullopt);
    assert(loop.run(sleeper).run_state == RunState::done_success);

    assert(client.requests.size() == 5);
    for (size_t i = 0; i < 4; i++) {
        assert(client.requests[i + 1].callback_context == contexts[i]);
    }

    // Absent context on IN_PROGRESS means an empty one next time
    ScriptedClient bare;
    bare.push(in_progress(nullptr));
    bare.push({{"status", "SUCCESS"}});
    ReinvocationLoop bare_loop(bare, first_request(Action::update, {{"id", "r"}}), std::nullopt);
    bare_loop.run(sleeper);
    assert(bare.requests[1].callback_context.is_object());
    assert(bare.requests[1].callback_context.empty());

    std::cout << "✓ callbackContext round trip test passed" << std::endl;
}

void test_bearer_token_is_stable() {
    std::cout << "Testing bearer token within and across runs..." << std::endl;

    ScriptedClient client;
    client.push(in_progress({{"a", 1}}));
    client.push(in_progress({{"a", 2}}));
    client.push({{"status", "SUCCESS"}});

    FakeSleeper sleeper;
    ReinvocationLoop first(client, first_request(Action::create, {{"name", "x"}}), std::nullopt);
    first.run(sleeper);
    assert(client.requests.size() == 3);
    const std::string token = client.requests[0].bearer_token;
    for (const auto& request : client.requests) {
        assert(request.bearer_token == token);
        assert(request.action == Action::create);
    }
    assert(first.loop_state().bearer_token == token);

    client.push({{"status", "SUCCESS"}});
    ReinvocationLoop second(client, first_request(Action::create, {{"name", "x"}}), std::nullopt);
    second.run(sleeper);
    assert(client.requests.back().bearer_token != token);

    std::cout << "✓ Bearer token test passed" << std::endl;
}

void test_first_success_stops() {
    std::cout << "Testing SUCCESS on the first invocation..." << std::endl;

    ScriptedClient client;
    client.push({{"status", "SUCCESS"}, {"resourceModels", json::array()}});
    client.push({{"status", "FAILED"}, {"errorCode", "InternalFailure"}});

    FakeSleeper sleeper;
    ReinvocationLoop loop(client, first_request(Action::list, json::object()), std::nullopt);
    assert(loop.run(sleeper).run_state == RunState::done_success);
    assert(client.requests.size() == 1);

    std::cout << "✓ First SUCCESS test passed" << std::endl;
}

void test_delays_are_observed() {
    std::cout << "Testing callbackDelaySeconds handling..." << std::endl;

    ScriptedClient client;
    client.push(in_progress({{"n", 1}}, 0));
    client.push(in_progress({{"n", 2}}, 7));
    client.push({{"status", "IN_PROGRESS"}});
    client.push({{"status", "SUCCESS"}});

    FakeSleeper sleeper;
    ReinvocationLoop loop(client, first_request(Action::create, {{"name", "x"}}), std::nullopt);
    assert(loop.run(sleeper).run_state == RunState::done_success);

    // Zero or absent delays proceed without waiting
    assert(sleeper.delays.size() == 1);
    assert(sleeper.delays[0] == std::chrono::seconds(7));

    std::cout << "✓ Delay handling test passed" << std::endl;
}

void test_step_by_step() {
    std::cout << "Testing step() state transitions..." << std::endl;

    ScriptedClient client;
    client.push(in_progress({{"n", 1}}, 3));
    client.push({{"status", "SUCCESS"}});

    ReinvocationLoop loop(client, first_request(Action::create, {{"name", "x"}}), std::nullopt);
    assert(loop.state() == RunState::pending);

    auto delay = loop.step();
    assert(loop.state() == RunState::continuing);
    assert(delay == std::chrono::seconds(3));
    assert(loop.current_request().callback_context == json({{"n", 1}}));

    delay = loop.step();
    assert(loop.state() == RunState::done_success);
    assert(delay == std::chrono::seconds(0));

    // Stepping a finished run is a no-op
    loop.step();
    assert(client.requests.size() == 2);

    std::cout << "✓ step() transitions test passed" << std::endl;
}

void test_cancel_during_delay() {
    std::cout << "Testing cancellation during a delay..." << std::endl;

    ScriptedClient client;
    client.repeat(in_progress({{"n", 1}}, 30));

    auto token = std::make_shared<CancellationToken>();
    FakeSleeper sleeper;
    sleeper.on_sleep = [token] { token->cancel("user interrupt"); };

    ReinvocationLoop loop(client, first_request(Action::create, {{"name", "x"}}), std::nullopt, token);
    const LoopState& state = loop.run(sleeper);

    assert(state.run_state == RunState::done_error);
    assert(error_code_of(state.error) == ErrorCode::cancelled);
    assert(error_message_of(state.error).find("user interrupt") != std::string::npos);
    assert(client.requests.size() == 1);

    std::cout << "✓ Cancellation during delay test passed" << std::endl;
}

void test_cancel_in_flight() {
    std::cout << "Testing cancellation of an in-flight invocation..." << std::endl;

    auto token = std::make_shared<CancellationToken>();
    ScriptedClient client;
    client.push_reply([token](const InvocationRequest&) -> caf::expected<RawResponse> {
        token->cancel("shutdown");
        return make_error(ErrorCode::cancelled, "transfer aborted");
    });

    FakeSleeper sleeper;
    ReinvocationLoop loop(client, first_request(Action::remove, {{"id", "r"}}), std::nullopt, token);
    const LoopState& state = loop.run(sleeper);

    assert(state.run_state == RunState::done_error);
    assert(error_code_of(state.error) == ErrorCode::cancelled);
    assert(client.requests.size() == 1);

    // cancel() on a pending run ends it without invoking
    ScriptedClient idle;
    ReinvocationLoop pending(idle, first_request(Action::read, {{"id", "r"}}), std::nullopt);
    pending.cancel("not needed");
    assert(pending.state() == RunState::done_error);
    pending.run(sleeper);
    assert(idle.requests.empty());

    std::cout << "✓ In-flight cancellation test passed" << std::endl;
}

void test_warnings_are_collected() {
    std::cout << "Testing contract warnings reach the loop state..." << std::endl;

    ScriptedClient client;
    client.push({{"status", "IN_PROGRESS"}, {"errorCode", "Throttling"}});
    client.push({{"status", "SUCCESS"}, {"callbackContext", {{"stale", 1}}}});

    FakeSleeper sleeper;
    ReinvocationLoop lenient(client, first_request(Action::update, {{"id", "r"}}), std::nullopt);
    const LoopState& state = lenient.run(sleeper);
    assert(state.run_state == RunState::done_success);
    assert(state.warnings.size() == 2);

    ScriptedClient strict_client;
    strict_client.push({{"status", "SUCCESS"}, {"callbackContext", {{"stale", 1}}}});
    ReinvocationLoop strict(strict_client, first_request(Action::update, {{"id", "r"}}), std::nullopt,
                            std::make_shared<CancellationToken>(), nullptr, true);
    assert(strict.run(sleeper).run_state == RunState::done_error);
    assert(error_code_of(strict.loop_state().error) == ErrorCode::contract_violation);

    std::cout << "✓ Warning collection test passed" << std::endl;
}

void test_loop_observability() {
    std::cout << "Testing loop logs and metrics..." << std::endl;

    auto observability = std::make_shared<Observability>("test_loop", LogLevel::debug, true);
    std::ostringstream log_output;
    observability->set_sink(log_output);

    ScriptedClient client;
    client.push(in_progress({{"n", 1}}));
    client.push({{"status", "FAILED"}, {"errorCode", "AlreadyExists"}});

    FakeSleeper sleeper;
    ReinvocationLoop loop(client, first_request(Action::create, {{"name", "x"}}), std::nullopt,
                          std::make_shared<CancellationToken>(), observability);
    loop.run(sleeper);

    std::string logs = log_output.str();
    assert(logs.find("Invoking handler") != std::string::npos);
    assert(logs.find(loop.loop_state().bearer_token) != std::string::npos);

    std::string metrics = observability->get_metrics_response();
    assert(metrics.find("providerkit_invocations_total") != std::string::npos);
    assert(metrics.find("IN_PROGRESS") != std::string::npos);
    assert(metrics.find("DONE_FAILED") != std::string::npos);

    std::cout << "✓ Loop observability test passed" << std::endl;
}

void test_non_ascii_errors_are_logged() {
    std::cout << "Testing rejected non-ASCII responses are logged and end the run..." << std::endl;

    auto observability = std::make_shared<Observability>("test_loop", LogLevel::debug);
    std::ostringstream log_output;
    observability->set_sink(log_output);

    // Over 512 bytes of two-byte characters, rejected for its status
    std::string message;
    for (int i = 0; i < 300; i++) {
        message += "\xC3\xA9";
    }
    ScriptedClient client;
    client.push({{"ab", 1}, {"message", message}, {"status", "DONE"}});

    FakeSleeper sleeper;
    ReinvocationLoop rejected(client, first_request(Action::create, {{"name", "x"}}), std::nullopt,
                              std::make_shared<CancellationToken>(), observability);
    const LoopState& state = rejected.run(sleeper);
    assert(state.run_state == RunState::done_error);
    assert(error_code_of(state.error) == ErrorCode::unknown_status);

    // Transport errors may carry raw bytes from the endpoint
    ScriptedClient raw_client;
    raw_client.push_error(ErrorCode::protocol_error, "Handler endpoint returned HTTP 502: caf\xE9");
    ReinvocationLoop transport(raw_client, first_request(Action::create, {{"name", "x"}}), std::nullopt,
                               std::make_shared<CancellationToken>(), observability);
    assert(transport.run(sleeper).run_state == RunState::done_error);

    std::istringstream lines(log_output.str());
    std::string line;
    int rejected_lines = 0;
    while (std::getline(lines, line)) {
        json entry = json::parse(line);
        if (entry["message"] == "Handler response rejected" || entry["message"] == "Handler invocation failed") {
            rejected_lines++;
        }
    }
    assert(rejected_lines == 2);

    std::cout << "✓ Non-ASCII error logging test passed" << std::endl;
}

int main() {
    std::cout << "Running reinvocation loop tests..." << std::endl;

    test_create_completes_after_one_reinvocation();
    test_budget_zero_exhausts_after_one_invocation();
    test_budget_bounds_invocations();
    test_failed_ends_run();
    test_connection_error_is_not_retried();
    test_validation_error_ends_run();
    test_context_is_carried_verbatim();
    test_bearer_token_is_stable();
    test_first_success_stops();
    test_delays_are_observed();
    test_step_by_step();
    test_cancel_during_delay();
    test_cancel_in_flight();
    test_warnings_are_collected();
    test_loop_observability();
    test_non_ascii_errors_are_logged();

    std::cout << "All tests passed!" << std::endl;
    return 0;
}
