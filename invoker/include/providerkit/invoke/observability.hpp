#pragma once

#include "providerkit/invoke/core.hpp"
#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/trace/span.h>
#include <opentelemetry/trace/tracer.h>
#include <caf/expected.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <unordered_map>

namespace providerkit {
namespace invoke {

enum class LogLevel {
    debug = 0,
    info = 1,
    warn = 2,
    error = 3
};

class Observability {
public:
    explicit Observability(const std::string& component,
                           LogLevel min_level = LogLevel::warn,
                           bool metrics_enabled = false);
    ~Observability() = default;

    // 0 = warnings and errors, 1 = info, 2 and above = debug
    static LogLevel level_from_verbosity(int verbosity);

    // Installs an SDK tracer provider that prints finished spans to `out`.
    // Must run before Observability instances are created.
    static void install_span_exporter(std::ostream& out);

    void set_min_level(LogLevel level) { min_level_ = level; }
    LogLevel min_level() const { return min_level_; }

    // Log lines go to stderr unless redirected (stdout is reserved for the outcome)
    void set_sink(std::ostream& sink);

    // Metrics (gated behind metrics_enabled)
    void record_invocation(const std::string& action,
                           const std::string& status,
                           double duration_seconds);
    void record_transport_error(const std::string& error_code);
    void record_run_outcome(const std::string& action, const std::string& outcome);

    bool metrics_enabled() const { return metrics_enabled_; }
    std::string get_metrics_response();  // Prometheus text format
    caf::expected<void> write_metrics_file(const std::string& path);

    std::shared_ptr<prometheus::Registry> registry() { return registry_; }

    // Tracing: one span per invocation, the caller ends it
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> start_invocation_span(
        const std::string& action,
        const std::string& bearer_token,
        int32_t invocation);

    // Logging
    void log_info(const std::string& message,
                  const std::string& bearer_token = "",
                  const std::string& action = "",
                  int32_t invocation = 0,
                  const std::unordered_map<std::string, std::string>& context = {});

    void log_warn(const std::string& message,
                  const std::string& bearer_token = "",
                  const std::string& action = "",
                  int32_t invocation = 0,
                  const std::unordered_map<std::string, std::string>& context = {});

    void log_error(const std::string& message,
                   const std::string& bearer_token = "",
                   const std::string& action = "",
                   int32_t invocation = 0,
                   const std::unordered_map<std::string, std::string>& context = {});

    void log_debug(const std::string& message,
                   const std::string& bearer_token = "",
                   const std::string& action = "",
                   int32_t invocation = 0,
                   const std::unordered_map<std::string, std::string>& context = {});

    // Correlation fields taken from the request of the current run
    void log_info_with_request(const std::string& message,
                               const InvocationRequest& request,
                               int32_t invocation,
                               const std::unordered_map<std::string, std::string>& context = {});

    void log_warn_with_request(const std::string& message,
                               const InvocationRequest& request,
                               int32_t invocation,
                               const std::unordered_map<std::string, std::string>& context = {});

    void log_debug_with_request(const std::string& message,
                                const InvocationRequest& request,
                                int32_t invocation,
                                const std::unordered_map<std::string, std::string>& context = {});

    std::string format_json_log(const std::string& level,
                                const std::string& message,
                                const std::string& bearer_token,
                                const std::string& action,
                                int32_t invocation,
                                const std::unordered_map<std::string, std::string>& context);

private:
    std::string component_;
    LogLevel min_level_;
    bool metrics_enabled_;
    std::ostream* sink_;
    std::mutex sink_mutex_;

    std::shared_ptr<prometheus::Registry> registry_;
    prometheus::Family<prometheus::Counter>* invocations_total_family_ = nullptr;
    prometheus::Family<prometheus::Histogram>* invocation_duration_seconds_family_ = nullptr;
    prometheus::Family<prometheus::Counter>* runs_total_family_ = nullptr;
    prometheus::Family<prometheus::Counter>* transport_errors_total_family_ = nullptr;

    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer_;

    void initialize_metrics();
    void initialize_tracing();
    void write_line(LogLevel level, const std::string& line);
    static std::string level_to_string(LogLevel level);
};

} // namespace invoke
} // namespace providerkit
