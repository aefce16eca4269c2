#pragma once

#include "providerkit/invoke/core.hpp"
#include "providerkit/invoke/cancellation.hpp"
#include "providerkit/invoke/observability.hpp"
#include "providerkit/invoke/reinvocation_loop.hpp"
#include <caf/actor.hpp>
#include <caf/actor_system.hpp>
#include <caf/error.hpp>
#include <caf/allowed_unsafe_message_type.hpp>
#include <caf/typed_actor.hpp>
#include <caf/typed_event_based_actor.hpp>
#include <exception>
#include <memory>
#include <optional>
#include <string>

namespace providerkit {
namespace invoke {

// Run actor interface
using run_actor = caf::typed_actor<
    caf::reacts_to<caf::atom_value>, // step
    caf::reacts_to<caf::atom_value, std::string> // cancel with reason
>;

// Everything one run needs. The client outlives the actor through shared ownership.
struct RunSpec {
    std::shared_ptr<HandlerClient> client;
    InvocationRequest first_request;
    std::optional<int32_t> max_reinvoke;
    std::shared_ptr<CancellationToken> token;
    std::shared_ptr<Observability> observability;
    bool strict_contract = false;
    caf::actor reply_to;  // receives (atom("done"), LoopState) exactly once
};

// Drives one ReinvocationLoop. The delay between invocations is a delayed
// self-message rather than a blocked thread, so a cancel message is handled
// while the run is waiting.
class RunActorState {
public:
    RunActorState(run_actor::pointer self, RunSpec spec);

    run_actor::behavior_type make_behavior();

    // Ends the run in DONE_ERROR(internal_error) when a handler throws
    caf::error on_exception(std::exception_ptr& eptr);

private:
    run_actor::pointer self_;
    std::shared_ptr<HandlerClient> client_;
    caf::actor reply_to_;
    ReinvocationLoop loop_;
    bool reported_ = false;

    void on_step();
    void finish();
    void report(const LoopState& state);
};

class RunActorImpl : public run_actor::base {
public:
    RunActorImpl(caf::actor_config& cfg, RunSpec spec)
        : run_actor::base(cfg),
          state_(this, std::move(spec)) {
        set_exception_handler([this](caf::scheduled_actor*, std::exception_ptr& eptr) {
            return state_.on_exception(eptr);
        });
    }

    behavior_type make_behavior() override {
        return state_.make_behavior();
    }
private:
    RunActorState state_;
};

using RunActor = RunActorImpl;

} // namespace invoke
} // namespace providerkit

CAF_ALLOW_UNSAFE_MESSAGE_TYPE(providerkit::invoke::LoopState)
