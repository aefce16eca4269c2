#include "providerkit/invoke/observability.hpp"
#include "providerkit/invoke/errors.hpp"
#include "providerkit/invoke/wire_converter.hpp"
#include <prometheus/text_serializer.h>
#include <opentelemetry/exporters/ostream/span_exporter.h>
#include <opentelemetry/sdk/trace/simple_processor.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#include <opentelemetry/trace/provider.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <vector>

namespace providerkit {
namespace invoke {

using json = nlohmann::json;

// Secret-looking field names to filter from the log context
static const std::vector<std::string> PII_FIELDS = {
    "password", "api_key", "secret", "token", "access_token",
    "refresh_token", "authorization", "credentials", "session"
};

// Helper function to check if a field name should be filtered (case-insensitive)
static bool is_pii_field(const std::string& field_name) {
    std::string lower_field = field_name;
    std::transform(lower_field.begin(), lower_field.end(), lower_field.begin(), ::tolower);

    for (const auto& pii_field : PII_FIELDS) {
        if (lower_field.find(pii_field) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// Recursively filter PII from JSON object
static void filter_pii_recursive(json& obj) {
    if (obj.is_object()) {
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            if (is_pii_field(it.key())) {
                it.value() = "[REDACTED]";
            } else if (it.value().is_object() || it.value().is_array()) {
                filter_pii_recursive(it.value());
            }
        }
    } else if (obj.is_array()) {
        for (auto& item : obj) {
            if (item.is_object() || item.is_array()) {
                filter_pii_recursive(item);
            }
        }
    }
}

// Generate ISO 8601 timestamp with microseconds
static std::string get_iso8601_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto duration = now.time_since_epoch();
    auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(duration) % 1000000;

    std::tm tm_buf;
    gmtime_r(&time_t, &tm_buf);

    char buf[32];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06ldZ",
             tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
             static_cast<long>(microseconds.count()));

    return std::string(buf);
}

Observability::Observability(const std::string& component, LogLevel min_level, bool metrics_enabled)
    : component_(component),
      min_level_(min_level),
      metrics_enabled_(metrics_enabled),
      sink_(&std::cerr) {
    initialize_metrics();
    initialize_tracing();
}

LogLevel Observability::level_from_verbosity(int verbosity) {
    if (verbosity > 1) {
        return LogLevel::debug;
    } else if (verbosity > 0) {
        return LogLevel::info;
    }
    return LogLevel::warn;
}

void Observability::install_span_exporter(std::ostream& out) {
    auto exporter = std::unique_ptr<opentelemetry::sdk::trace::SpanExporter>(
        new opentelemetry::exporter::trace::OStreamSpanExporter(out));
    auto processor = std::unique_ptr<opentelemetry::sdk::trace::SpanProcessor>(
        new opentelemetry::sdk::trace::SimpleSpanProcessor(std::move(exporter)));
    auto provider = opentelemetry::nostd::shared_ptr<opentelemetry::trace::TracerProvider>(
        new opentelemetry::sdk::trace::TracerProvider(std::move(processor)));
    opentelemetry::trace::Provider::SetTracerProvider(provider);
}

void Observability::set_sink(std::ostream& sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = &sink;
}

void Observability::initialize_metrics() {
    registry_ = std::make_shared<prometheus::Registry>();

    invocations_total_family_ = &prometheus::BuildCounter()
        .Name("providerkit_invocations_total")
        .Help("Handler invocations by action and reported status")
        .Register(*registry_);

    invocation_duration_seconds_family_ = &prometheus::BuildHistogram()
        .Name("providerkit_invocation_duration_seconds")
        .Help("Wall time of one handler invocation")
        .Register(*registry_);

    runs_total_family_ = &prometheus::BuildCounter()
        .Name("providerkit_runs_total")
        .Help("Completed reinvocation runs by terminal outcome")
        .Register(*registry_);

    transport_errors_total_family_ = &prometheus::BuildCounter()
        .Name("providerkit_transport_errors_total")
        .Help("Invocations that ended in a transport error")
        .Register(*registry_);
}

void Observability::initialize_tracing() {
    // Uses whatever provider the host installed; the default one is a no-op
    auto provider = opentelemetry::trace::Provider::GetTracerProvider();
    tracer_ = provider->GetTracer("providerkit_invoke", "1.0.0");
}

void Observability::record_invocation(const std::string& action,
                                      const std::string& status,
                                      double duration_seconds) {
    if (!metrics_enabled_) {
        return;
    }

    invocations_total_family_->Add({{"action", action}, {"status", status}}).Increment();
    invocation_duration_seconds_family_
        ->Add({{"action", action}},
              prometheus::Histogram::BucketBoundaries{0.01, 0.05, 0.1, 0.5, 1.0, 5.0, 15.0, 60.0})
        .Observe(duration_seconds);
}

void Observability::record_transport_error(const std::string& error_code) {
    if (!metrics_enabled_) {
        return;
    }

    transport_errors_total_family_->Add({{"error_code", error_code}}).Increment();
}

void Observability::record_run_outcome(const std::string& action, const std::string& outcome) {
    if (!metrics_enabled_) {
        return;
    }

    runs_total_family_->Add({{"action", action}, {"outcome", outcome}}).Increment();
}

std::string Observability::get_metrics_response() {
    if (!metrics_enabled_) {
        return "";
    }
    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

caf::expected<void> Observability::write_metrics_file(const std::string& path) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        return make_error(ErrorCode::invalid_configuration, "Cannot open metrics file: " + path);
    }
    out << get_metrics_response();
    if (!out) {
        return make_error(ErrorCode::invalid_configuration, "Cannot write metrics file: " + path);
    }
    return caf::unit;
}

opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> Observability::start_invocation_span(
    const std::string& action,
    const std::string& bearer_token,
    int32_t invocation) {

    auto span = tracer_->StartSpan("handler.invoke");
    span->SetAttribute("providerkit.action", opentelemetry::nostd::string_view(action));
    span->SetAttribute("providerkit.bearer_token", opentelemetry::nostd::string_view(bearer_token));
    span->SetAttribute("providerkit.invocation", static_cast<int64_t>(invocation));
    return span;
}

std::string Observability::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::debug:
            return "DEBUG";
        case LogLevel::info:
            return "INFO";
        case LogLevel::warn:
            return "WARN";
        case LogLevel::error:
            return "ERROR";
        default:
            return "INFO";
    }
}

void Observability::write_line(LogLevel level, const std::string& line) {
    if (level < min_level_) {
        return;
    }
    std::lock_guard<std::mutex> lock(sink_mutex_);
    (*sink_) << line << std::endl;
}

void Observability::log_info(const std::string& message,
                             const std::string& bearer_token,
                             const std::string& action,
                             int32_t invocation,
                             const std::unordered_map<std::string, std::string>& context) {
    if (LogLevel::info < min_level_) {
        return;
    }
    write_line(LogLevel::info, format_json_log("INFO", message, bearer_token, action, invocation, context));
}

void Observability::log_warn(const std::string& message,
                             const std::string& bearer_token,
                             const std::string& action,
                             int32_t invocation,
                             const std::unordered_map<std::string, std::string>& context) {
    write_line(LogLevel::warn, format_json_log("WARN", message, bearer_token, action, invocation, context));
}

void Observability::log_error(const std::string& message,
                              const std::string& bearer_token,
                              const std::string& action,
                              int32_t invocation,
                              const std::unordered_map<std::string, std::string>& context) {
    write_line(LogLevel::error, format_json_log("ERROR", message, bearer_token, action, invocation, context));
}

void Observability::log_debug(const std::string& message,
                              const std::string& bearer_token,
                              const std::string& action,
                              int32_t invocation,
                              const std::unordered_map<std::string, std::string>& context) {
    if (LogLevel::debug < min_level_) {
        return;
    }
    write_line(LogLevel::debug, format_json_log("DEBUG", message, bearer_token, action, invocation, context));
}

void Observability::log_info_with_request(const std::string& message,
                                          const InvocationRequest& request,
                                          int32_t invocation,
                                          const std::unordered_map<std::string, std::string>& context) {
    log_info(message, request.bearer_token, WireConverter::action_to_string(request.action), invocation, context);
}

void Observability::log_warn_with_request(const std::string& message,
                                          const InvocationRequest& request,
                                          int32_t invocation,
                                          const std::unordered_map<std::string, std::string>& context) {
    log_warn(message, request.bearer_token, WireConverter::action_to_string(request.action), invocation, context);
}

void Observability::log_debug_with_request(const std::string& message,
                                           const InvocationRequest& request,
                                           int32_t invocation,
                                           const std::unordered_map<std::string, std::string>& context) {
    log_debug(message, request.bearer_token, WireConverter::action_to_string(request.action), invocation, context);
}

std::string Observability::format_json_log(const std::string& level,
                                           const std::string& message,
                                           const std::string& bearer_token,
                                           const std::string& action,
                                           int32_t invocation,
                                           const std::unordered_map<std::string, std::string>& context) {
    json log_entry;

    // Required fields (always present)
    log_entry["timestamp"] = get_iso8601_timestamp();
    log_entry["level"] = level;
    log_entry["component"] = component_;
    log_entry["message"] = message;

    // Run correlation fields (at top level, when provided)
    if (!bearer_token.empty()) {
        log_entry["bearer_token"] = bearer_token;
    }
    if (!action.empty()) {
        log_entry["action"] = action;
    }
    if (invocation > 0) {
        log_entry["invocation"] = invocation;
    }

    json context_obj = json::object();
    for (const auto& [key, value] : context) {
        context_obj[key] = value;
    }

    filter_pii_recursive(context_obj);

    if (!context_obj.empty()) {
        log_entry["context"] = context_obj;
    }

    // Handler text is not guaranteed to be valid UTF-8
    return log_entry.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace invoke
} // namespace providerkit
