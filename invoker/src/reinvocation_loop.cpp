#include "providerkit/invoke/reinvocation_loop.hpp"
#include "providerkit/invoke/errors.hpp"
#include "providerkit/invoke/progress_event.hpp"
#include "providerkit/invoke/wire_converter.hpp"
#include <opentelemetry/trace/span.h>

namespace providerkit {
namespace invoke {

ReinvocationLoop::ReinvocationLoop(HandlerClient& client,
                                   InvocationRequest first_request,
                                   std::optional<int32_t> max_reinvoke,
                                   std::shared_ptr<CancellationToken> token,
                                   std::shared_ptr<Observability> observability,
                                   bool strict_contract)
    : client_(client),
      request_(std::move(first_request)),
      token_(token ? std::move(token) : std::make_shared<CancellationToken>()),
      observability_(std::move(observability)),
      strict_contract_(strict_contract) {
    state_.max_reinvoke = max_reinvoke;
    state_.bearer_token = request_.bearer_token;
    state_.action = request_.action;
}

std::chrono::seconds ReinvocationLoop::step() {
    if (done()) {
        return std::chrono::seconds(0);
    }
    if (token_->is_cancelled()) {
        finish_cancelled();
        return std::chrono::seconds(0);
    }

    const std::string action = WireConverter::action_to_string(request_.action);

    // Budget check happens before issuing, never mid-flight
    state_.invocation_count++;
    if (state_.invocation_count > 1 && state_.max_reinvoke &&
        (state_.invocation_count - 1) > *state_.max_reinvoke) {
        if (observability_) {
            observability_->log_warn_with_request("Re-invocation budget exhausted", request_,
                                                  state_.invocation_count, {
                {"max_reinvoke", std::to_string(*state_.max_reinvoke)}
            });
        }
        finish(RunState::done_exhausted);
        return std::chrono::seconds(0);
    }

    state_.run_state = RunState::running;

    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> span;
    if (observability_) {
        span = observability_->start_invocation_span(action, request_.bearer_token, state_.invocation_count);
        observability_->log_info_with_request("Invoking handler", request_, state_.invocation_count, {
            {"client", client_.describe()}
        });
        observability_->log_debug_with_request("Invocation payload", request_, state_.invocation_count, {
            {"callback_context", request_.callback_context.dump()}
        });
    }

    auto start_time = std::chrono::steady_clock::now();
    auto response = client_.invoke(request_, *token_);
    auto end_time = std::chrono::steady_clock::now();
    double duration_seconds = std::chrono::duration<double>(end_time - start_time).count();

    if (!response) {
        ErrorCode code = error_code_of(response.error());
        if (observability_) {
            observability_->record_invocation(action, "TRANSPORT_ERROR", duration_seconds);
            observability_->record_transport_error(error_code_to_string(code));
            observability_->log_warn_with_request("Handler invocation failed", request_, state_.invocation_count, {
                {"error_code", error_code_to_string(code)},
                {"error", error_message_of(response.error())}
            });
        }
        if (span) {
            span->SetStatus(opentelemetry::trace::StatusCode::kError, error_code_to_string(code));
            span->End();
        }
        if (code == ErrorCode::cancelled || token_->is_cancelled()) {
            finish_cancelled();
        } else {
            finish(RunState::done_error, response.error());
        }
        return std::chrono::seconds(0);
    }

    auto event = ProgressEventParser::parse(*response, request_.action, strict_contract_);
    if (!event) {
        if (observability_) {
            observability_->record_invocation(action, "INVALID_RESPONSE", duration_seconds);
            observability_->log_warn_with_request("Handler response rejected", request_, state_.invocation_count, {
                {"error_code", error_code_to_string(error_code_of(event.error()))},
                {"error", error_message_of(event.error())}
            });
        }
        if (span) {
            span->SetStatus(opentelemetry::trace::StatusCode::kError, "invalid response");
            span->End();
        }
        finish(RunState::done_error, event.error());
        return std::chrono::seconds(0);
    }

    const std::string status = WireConverter::status_to_string(event->status);
    if (span) {
        span->SetAttribute("providerkit.status", opentelemetry::nostd::string_view(status));
        span->End();
    }
    if (observability_) {
        observability_->record_invocation(action, status, duration_seconds);
        for (const auto& warning : event->warnings) {
            observability_->log_warn_with_request("Contract warning", request_, state_.invocation_count, {
                {"warning", warning}
            });
        }
    }
    state_.warnings.insert(state_.warnings.end(), event->warnings.begin(), event->warnings.end());

    std::chrono::seconds delay(0);
    switch (event->status) {
        case OperationStatus::success:
            state_.last_event = std::move(*event);
            finish(RunState::done_success);
            break;

        case OperationStatus::failed:
            state_.last_event = std::move(*event);
            finish(RunState::done_failed);
            break;

        case OperationStatus::in_progress: {
            // Copy of the current request, callbackContext replaced wholesale
            InvocationRequest next = request_;
            next.callback_context = event->callback_context ? *event->callback_context : json::object();
            delay = std::chrono::seconds(event->callback_delay_seconds.value_or(0));
            request_ = std::move(next);

            if (observability_) {
                observability_->log_info_with_request("Handler in progress", request_, state_.invocation_count, {
                    {"callback_delay_seconds", std::to_string(delay.count())},
                    {"message", event->message.value_or("")}
                });
            }
            state_.last_event = std::move(*event);
            state_.run_state = RunState::continuing;
            break;
        }
    }
    return delay;
}

const LoopState& ReinvocationLoop::run(Sleeper& sleeper) {
    while (!done()) {
        auto delay = step();
        if (done()) {
            break;
        }
        if (delay.count() > 0 && !sleeper.sleep_for(delay, *token_)) {
            finish_cancelled();
        }
    }
    return state_;
}

void ReinvocationLoop::cancel(const std::string& reason) {
    token_->cancel(reason);
    if (!done()) {
        finish_cancelled();
    }
}

void ReinvocationLoop::finish_cancelled() {
    std::string reason = token_->reason();
    if (reason.empty()) {
        reason = "cancelled";
    }
    finish(RunState::done_error, make_error(ErrorCode::cancelled, "Run cancelled: " + reason));
}

void ReinvocationLoop::finish(RunState terminal, caf::error error) {
    state_.run_state = terminal;
    state_.error = std::move(error);

    if (!observability_) {
        return;
    }
    const std::string outcome = WireConverter::run_state_to_string(terminal);
    observability_->record_run_outcome(WireConverter::action_to_string(request_.action), outcome);
    if (terminal == RunState::done_error) {
        observability_->log_error("Run ended with error", request_.bearer_token,
                                  WireConverter::action_to_string(request_.action),
                                  state_.invocation_count, {
            {"state", outcome},
            {"error_code", error_code_to_string(error_code_of(state_.error))},
            {"error", error_message_of(state_.error)}
        });
    } else {
        observability_->log_info("Run finished", request_.bearer_token,
                                 WireConverter::action_to_string(request_.action),
                                 state_.invocation_count, {
            {"state", outcome},
            {"invocations", std::to_string(state_.invocations_issued())}
        });
    }
}

} // namespace invoke
} // namespace providerkit
