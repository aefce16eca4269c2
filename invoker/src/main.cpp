#include <iostream>
#include <caf/actor_system.hpp>
#include <caf/actor_system_config.hpp>
#include <caf/after.hpp>
#include <caf/atom.hpp>
#include <caf/down_msg.hpp>
#include <caf/scoped_actor.hpp>
#include <curl/curl.h>
#include "providerkit/invoke/core.hpp"
#include "providerkit/invoke/actors.hpp"
#include "providerkit/invoke/clients/lambda_http_client.hpp"
#include "providerkit/invoke/errors.hpp"
#include "providerkit/invoke/feature_flags.hpp"
#include "providerkit/invoke/observability.hpp"
#include "providerkit/invoke/outcome_reporter.hpp"
#include "providerkit/invoke/request_builder.hpp"
#include "providerkit/invoke/wire_converter.hpp"
#include <chrono>
#include <csignal>
#include <optional>

using namespace providerkit::invoke;

namespace {

volatile std::sig_atomic_t g_signal_received = 0;

void handle_signal(int signal_number) {
    g_signal_received = signal_number;
}

struct CliOptions {
    std::string action;
    std::string request;
    std::string endpoint = "http://127.0.0.1:3001";
    std::string function_name = "TestEntrypoint";
    std::string region = "us-east-1";
    int32_t max_reinvoke = -1;
    int64_t timeout_ms = 60000;
    int64_t connect_timeout_ms = 5000;
    int32_t transport_retries = 0;
    std::string expect_status;
    std::string output = "text";
    std::string metrics_file;
    int32_t verbose = 0;
    bool trace_spans = false;
};

// Turns parsed options into an InvokeConfig, rejecting values no run could use
caf::expected<InvokeConfig> to_invoke_config(const CliOptions& options) {
    if (options.request.empty()) {
        return make_error(ErrorCode::invalid_configuration, "--request is required");
    }
    if (options.endpoint.empty()) {
        return make_error(ErrorCode::invalid_configuration, "--endpoint must not be empty");
    }
    if (options.function_name.empty()) {
        return make_error(ErrorCode::invalid_configuration, "--function-name must not be empty");
    }
    if (options.max_reinvoke < -1) {
        return make_error(ErrorCode::invalid_configuration,
                          "--max-reinvoke must be -1 (unbounded) or >= 0, got " +
                          std::to_string(options.max_reinvoke));
    }
    if (options.timeout_ms <= 0 || options.connect_timeout_ms <= 0) {
        return make_error(ErrorCode::invalid_configuration, "Timeouts must be positive");
    }
    if (options.transport_retries < 0) {
        return make_error(ErrorCode::invalid_configuration, "--transport-retries must not be negative");
    }
    if (options.output != "text" && options.output != "json") {
        return make_error(ErrorCode::invalid_configuration,
                          "--output must be 'text' or 'json', got '" + options.output + "'");
    }
    if (!options.expect_status.empty() && !OutcomeReporter::is_valid_expectation(options.expect_status)) {
        return make_error(ErrorCode::invalid_configuration,
                          "Unsupported --expect-status '" + options.expect_status + "'");
    }

    InvokeConfig config;
    config.endpoint = options.endpoint;
    config.function_name = options.function_name;
    config.region = options.region;
    if (options.max_reinvoke >= 0) {
        config.max_reinvoke = options.max_reinvoke;
    }
    config.timeout_ms = options.timeout_ms;
    config.connect_timeout_ms = options.connect_timeout_ms;
    config.transport_retries = options.transport_retries;
    config.strict_contract = FeatureFlags::is_strict_contract_enabled();
    return config;
}

} // namespace

class InvokerConfig : public caf::actor_system_config {
public:
    InvokerConfig() {
        opt_group{custom_options_, "global"}
            .add(options.action, "action", "CREATE, READ, UPDATE, DELETE or LIST")
            .add(options.request, "request", "Path to the JSON request body")
            .add(options.endpoint, "endpoint", "Handler endpoint URL")
            .add(options.function_name, "function-name", "Function to invoke")
            .add(options.region, "region", "Region sent with every invocation")
            .add(options.max_reinvoke, "max-reinvoke", "Max IN_PROGRESS re-invocations (-1 = unbounded)")
            .add(options.timeout_ms, "timeout-ms", "Per-invocation deadline (ms)")
            .add(options.connect_timeout_ms, "connect-timeout-ms", "Connection deadline (ms)")
            .add(options.transport_retries, "transport-retries", "Retries of undelivered requests")
            .add(options.expect_status, "expect-status", "Expected outcome (SUCCESS, FAILED[:code], EXHAUSTED, ERROR)")
            .add(options.output, "output", "Outcome rendering: text or json")
            .add(options.metrics_file, "metrics-file", "Write Prometheus metrics to this file on exit")
            .add(options.verbose, "verbose", "Log verbosity: 0 warn, 1 info, 2 debug")
            .add(options.trace_spans, "trace-spans", "Print invocation spans to stderr");
    }

    CliOptions options;
};

int emit_outcome(const ExitOutcome& outcome, const CliOptions& options, Observability& observability) {
    if (options.output == "json") {
        std::cout << OutcomeReporter::to_json_text(outcome) << std::endl;
    } else {
        std::cout << OutcomeReporter::to_text(outcome) << std::flush;
    }

    if (!options.metrics_file.empty()) {
        auto written = observability.write_metrics_file(options.metrics_file);
        if (!written) {
            observability.log_error("Failed to write metrics file", outcome.bearer_token, outcome.action, 0, {
                {"path", options.metrics_file},
                {"error", error_message_of(written.error())}
            });
        }
    }
    return outcome.exit_code;
}

int caf_main(caf::actor_system& system, const InvokerConfig& config) {
    const CliOptions& options = config.options;
    bool metrics_enabled = !options.metrics_file.empty() || FeatureFlags::is_metrics_enabled();
    if (options.trace_spans) {
        Observability::install_span_exporter(std::cerr);
    }
    auto observability = std::make_shared<Observability>(
        "providerkit_invoke", Observability::level_from_verbosity(options.verbose), metrics_enabled);

    // Configuration errors are reported before any invocation
    auto action = WireConverter::parse_action(options.action);
    if (!action) {
        return emit_outcome(OutcomeReporter::config_error(action.error()), options, *observability);
    }
    auto invoke_config = to_invoke_config(options);
    if (!invoke_config) {
        return emit_outcome(OutcomeReporter::config_error(invoke_config.error()), options, *observability);
    }
    auto body = RequestBuilder::load_request_file(options.request);
    if (!body) {
        return emit_outcome(OutcomeReporter::config_error(body.error()), options, *observability);
    }
    RequestBuilder builder(*invoke_config);
    auto request = builder.build(*action, *body);
    if (!request) {
        return emit_outcome(OutcomeReporter::config_error(request.error()), options, *observability);
    }

    auto client = std::make_shared<LambdaHttpClient>(*invoke_config, observability);
    auto token = std::make_shared<CancellationToken>();

    observability->log_info_with_request("Run starting", *request, 0, {
        {"endpoint", client->invocation_url()},
        {"max_reinvoke", invoke_config->max_reinvoke ? std::to_string(*invoke_config->max_reinvoke) : "unbounded"},
        {"strict_contract", invoke_config->strict_contract ? "true" : "false"}
    });

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    caf::scoped_actor self{system};
    RunSpec spec;
    spec.client = client;
    spec.first_request = *request;
    spec.max_reinvoke = invoke_config->max_reinvoke;
    spec.token = token;
    spec.observability = observability;
    spec.strict_contract = invoke_config->strict_contract;
    spec.reply_to = caf::actor{self};
    auto runner = system.spawn<RunActor, caf::detached>(std::move(spec));
    self->monitor(runner);

    std::optional<LoopState> final_state;
    bool cancel_sent = false;
    while (!final_state) {
        self->receive(
            [&](caf::atom_value done_atom, const LoopState& state) {
                if (done_atom == caf::atom("done")) {
                    final_state = state;
                }
            },
            [&](const caf::down_msg& down) {
                // The runner died without reporting, the run still needs an outcome
                LoopState state;
                state.run_state = RunState::done_error;
                state.bearer_token = request->bearer_token;
                state.action = request->action;
                state.error = make_error(ErrorCode::internal_error,
                                         "Run actor terminated without an outcome: " + caf::to_string(down.reason));
                observability->log_error("Run actor terminated", state.bearer_token,
                                         WireConverter::action_to_string(state.action), 0, {
                    {"reason", caf::to_string(down.reason)}
                });
                final_state = state;
            },
            caf::after(std::chrono::milliseconds(100)) >> [&] {
                if (g_signal_received == 0 || cancel_sent) {
                    return;
                }
                std::string reason = "received signal " + std::to_string(g_signal_received);
                // The token aborts an in-flight transfer, the message ends a pending delay
                token->cancel(reason);
                self->send(runner, caf::atom("cancel"), reason);
                cancel_sent = true;
            });
    }

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);

    ExitOutcome outcome = OutcomeReporter::expect(OutcomeReporter::report(*final_state), options.expect_status);
    if (!outcome.expectation_met) {
        observability->log_warn("Outcome does not match expectation", outcome.bearer_token, outcome.action,
                                outcome.invocations, {
            {"expected", options.expect_status},
            {"actual", OutcomeReporter::kind_to_string(outcome.kind)}
        });
    }
    return emit_outcome(outcome, options, *observability);
}

int main(int argc, char** argv) {
    InvokerConfig config;

    // Parse command line arguments
    if (auto err = config.parse(argc, argv)) {
        // Use stderr for argument parsing errors (before observability is initialized)
        std::cerr << "Failed to parse arguments: " << caf::to_string(err) << std::endl;
        return ExitCode::config_error;
    }
    if (config.cli_helptext_printed) {
        return ExitCode::success;
    }

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::cerr << "Failed to initialize libcurl" << std::endl;
        return ExitCode::error;
    }

    int exit_code;
    try {
        caf::actor_system system(config);
        exit_code = caf_main(system, config);
    } catch (const std::exception& e) {
        std::cerr << "providerkit-invoke fatal error: " << e.what() << std::endl;
        exit_code = ExitCode::unhandled_exception;
    }

    curl_global_cleanup();
    return exit_code;
}
