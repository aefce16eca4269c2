#pragma once

#include "providerkit/invoke/core.hpp"
#include "providerkit/invoke/cancellation.hpp"
#include "providerkit/invoke/observability.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace providerkit {
namespace invoke {

/**
 * Drives one logical operation to a terminal state.
 *
 * PENDING/CONTINUING -> RUNNING -> CONTINUING | DONE_SUCCESS | DONE_FAILED
 *                                 | DONE_EXHAUSTED | DONE_ERROR
 *
 * The loop is strictly sequential: step() issues at most one invocation and
 * returns only after its response was parsed. Transport and validation errors
 * end the run; nothing is retried here.
 *
 * step(), run() and cancel() must be called from the thread driving the run.
 * Other threads abort a run through the CancellationToken.
 */
class ReinvocationLoop {
public:
    ReinvocationLoop(HandlerClient& client,
                     InvocationRequest first_request,
                     std::optional<int32_t> max_reinvoke,
                     std::shared_ptr<CancellationToken> token = std::make_shared<CancellationToken>(),
                     std::shared_ptr<Observability> observability = nullptr,
                     bool strict_contract = false);

    // One iteration. When the run is CONTINUING afterwards, the returned
    // duration is the minimum wait before the next step().
    std::chrono::seconds step();

    // Steps until a terminal state, observing delays through `sleeper`
    const LoopState& run(Sleeper& sleeper);

    // Ends an unfinished run in DONE_ERROR with a cancellation error
    void cancel(const std::string& reason);

    bool done() const { return is_done(state_.run_state); }
    RunState state() const { return state_.run_state; }
    const LoopState& loop_state() const { return state_; }

    // Request the next step() will send
    const InvocationRequest& current_request() const { return request_; }

    const std::shared_ptr<CancellationToken>& token() const { return token_; }

private:
    HandlerClient& client_;
    InvocationRequest request_;
    std::shared_ptr<CancellationToken> token_;
    std::shared_ptr<Observability> observability_;
    bool strict_contract_;
    LoopState state_;

    void finish(RunState terminal, caf::error error = caf::error{});
    void finish_cancelled();
};

} // namespace invoke
} // namespace providerkit
