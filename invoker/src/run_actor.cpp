#include "providerkit/invoke/actors.hpp"
#include "providerkit/invoke/errors.hpp"
#include <caf/atom.hpp>
#include <caf/send.hpp>
#include <chrono>

namespace providerkit {
namespace invoke {

RunActorState::RunActorState(run_actor::pointer self, RunSpec spec)
    : self_(self),
      client_(std::move(spec.client)),
      reply_to_(std::move(spec.reply_to)),
      loop_(*client_, std::move(spec.first_request), spec.max_reinvoke,
            spec.token ? std::move(spec.token) : std::make_shared<CancellationToken>(),
            std::move(spec.observability), spec.strict_contract) {}

run_actor::behavior_type RunActorState::make_behavior() {
    // The first invocation is issued as soon as the actor runs
    self_->send(caf::actor_cast<run_actor>(self_), caf::atom("step"));

    return {
        [this](caf::atom_value step_atom) {
            if (step_atom != caf::atom("step")) {
                return;
            }
            on_step();
        },

        [this](caf::atom_value cancel_atom, const std::string& reason) {
            if (cancel_atom != caf::atom("cancel")) {
                return;
            }
            if (loop_.done()) {
                return;
            }
            loop_.cancel(reason);
            finish();
        }
    };
}

void RunActorState::on_step() {
    // A step can still be queued behind a cancel that already finished the run
    if (loop_.done()) {
        return;
    }

    auto delay = loop_.step();
    if (loop_.done()) {
        finish();
        return;
    }

    auto self_handle = caf::actor_cast<run_actor>(self_);
    if (delay.count() > 0) {
        self_->delayed_send(self_handle, delay, caf::atom("step"));
    } else {
        self_->send(self_handle, caf::atom("step"));
    }
}

void RunActorState::finish() {
    report(loop_.loop_state());
    self_->quit();
}

void RunActorState::report(const LoopState& state) {
    if (reported_) {
        return;
    }
    reported_ = true;
    if (reply_to_) {
        self_->send(reply_to_, caf::atom("done"), state);
    }
}

caf::error RunActorState::on_exception(std::exception_ptr& eptr) {
    std::string what = "unknown exception";
    try {
        std::rethrow_exception(eptr);
    } catch (const std::exception& e) {
        what = e.what();
    } catch (...) {
        what = "non-standard exception";
    }

    LoopState state = loop_.loop_state();
    state.run_state = RunState::done_error;
    state.error = make_error(ErrorCode::internal_error, "Run aborted by exception: " + what);
    report(state);
    return state.error;
}

} // namespace invoke
} // namespace providerkit
