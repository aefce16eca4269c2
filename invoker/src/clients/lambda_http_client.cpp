#include "providerkit/invoke/clients/lambda_http_client.hpp"
#include "providerkit/invoke/errors.hpp"
#include "providerkit/invoke/timeout_enforcement.hpp"
#include "providerkit/invoke/wire_converter.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>

namespace providerkit {
namespace invoke {

namespace {

// Aborts the transfer once the run is cancelled
int progress_callback(void* clientp, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                      curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    const auto* token = static_cast<const CancellationToken*>(clientp);
    return (token != nullptr && token->is_cancelled()) ? 1 : 0;
}

ErrorCode classify_curl_error(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return ErrorCode::connection_error;
        case CURLE_OPERATION_TIMEDOUT:
            return ErrorCode::timeout;
        case CURLE_ABORTED_BY_CALLBACK:
            return ErrorCode::cancelled;
        default:
            return ErrorCode::protocol_error;
    }
}

// Value of a response header, matched case-insensitively; empty if absent
std::string find_header(const std::string& headers, const std::string& name) {
    std::string lower_name = name;
    std::transform(lower_name.begin(), lower_name.end(), lower_name.begin(), ::tolower);

    std::istringstream lines(headers);
    std::string line;
    while (std::getline(lines, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string key = line.substr(0, colon);
        std::transform(key.begin(), key.end(), key.begin(), ::tolower);
        if (key != lower_name) {
            continue;
        }
        std::string value = line.substr(colon + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);
        return value;
    }
    return "";
}

} // namespace

LambdaHttpClient::LambdaHttpClient(InvokeConfig config, std::shared_ptr<Observability> observability)
    : config_(std::move(config)),
      retry_policy_([this] {
          RetryPolicy::Config retry_config;
          retry_config.max_retries = std::max(config_.transport_retries, 0);
          return retry_config;
      }()),
      observability_(std::move(observability)) {}

std::string LambdaHttpClient::describe() const {
    return "lambda-http " + invocation_url();
}

std::string LambdaHttpClient::invocation_url() const {
    std::string base = config_.endpoint;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/2015-03-31/functions/" + config_.function_name + "/invocations";
}

caf::expected<RawResponse> LambdaHttpClient::invoke(const InvocationRequest& request,
                                                    const CancellationToken& token) {
    const std::string body = WireConverter::encode_request(request).dump();

    for (int32_t attempt = 0;; attempt++) {
        if (token.is_cancelled()) {
            return make_error(ErrorCode::cancelled, "Invocation cancelled: " + token.reason());
        }

        int http_status_code = 0;
        caf::error failure;

        auto http = perform_http_request(body, token);
        if (http) {
            http_status_code = http->status_code;
            if (http_status_code >= 200 && http_status_code < 300) {
                return decode_response(*http);
            }
            failure = make_error(ErrorCode::protocol_error,
                                 "Handler endpoint returned HTTP " + std::to_string(http_status_code) +
                                 ": " + http->body);
        } else {
            failure = http.error();
        }

        ErrorCode code = error_code_of(failure);
        if (code == ErrorCode::cancelled ||
            !retry_policy_.is_retryable(code, http_status_code) ||
            retry_policy_.is_budget_exhausted(attempt)) {
            return failure;
        }

        int64_t backoff_ms = retry_policy_.calculate_backoff_delay(attempt);
        if (observability_) {
            observability_->log_debug_with_request("Retrying undelivered invocation", request, 0, {
                {"attempt", std::to_string(attempt + 1)},
                {"backoff_ms", std::to_string(backoff_ms)},
                {"error", error_message_of(failure)}
            });
        }
        if (token.wait_for(std::chrono::milliseconds(backoff_ms))) {
            return make_error(ErrorCode::cancelled, "Invocation cancelled: " + token.reason());
        }
    }
}

caf::expected<RawResponse> LambdaHttpClient::decode_response(const HttpResponse& http) const {
    // Unhandled exceptions inside the function arrive as 200 + X-Amz-Function-Error
    std::string function_error = find_header(http.headers, "X-Amz-Function-Error");
    if (!function_error.empty()) {
        return make_error(ErrorCode::protocol_error,
                          "Handler raised an unhandled error (" + function_error + "): " + http.body);
    }

    RawResponse raw;
    raw.http_status = http.status_code;
    raw.body = http.body;
    try {
        raw.payload = json::parse(http.body);
    } catch (const json::parse_error& e) {
        return make_error(ErrorCode::protocol_error,
                          "Handler response is not valid JSON: " + std::string(e.what()));
    }
    if (!raw.payload.is_object()) {
        return make_error(ErrorCode::protocol_error,
                          std::string("Handler response is not a JSON object, got ") + raw.payload.type_name());
    }
    return raw;
}

caf::expected<LambdaHttpClient::HttpResponse> LambdaHttpClient::perform_http_request(
    const std::string& body, const CancellationToken& token) const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return make_error(ErrorCode::internal_error, "Failed to initialize CURL");
    }

    const std::string url = invocation_url();
    std::string response_body;
    std::string response_headers;
    long response_code = 0;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response_headers);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // Connection timeout is part of the total invocation deadline
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(TimeoutEnforcement::get_connection_timeout_ms(config_)));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                     static_cast<long>(TimeoutEnforcement::get_total_timeout_ms(config_)));

    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<CancellationToken*>(&token));

    struct curl_slist* header_list = nullptr;
    header_list = curl_slist_append(header_list, "Content-Type: application/json");
    header_list = curl_slist_append(header_list, "Accept: application/json");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);

    CURLcode res = curl_easy_perform(curl);

    if (res != CURLE_OK) {
        curl_slist_free_all(header_list);
        curl_easy_cleanup(curl);
        ErrorCode code = classify_curl_error(res);
        if (code == ErrorCode::cancelled) {
            return make_error(code, "Invocation cancelled: " + token.reason());
        }
        return make_error(code, "Request to " + url + " failed: " + std::string(curl_easy_strerror(res)));
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response_code);

    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);

    return HttpResponse{static_cast<int>(response_code), response_body, response_headers};
}

size_t LambdaHttpClient::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    if (userp == nullptr || contents == nullptr) {
        return 0;
    }
    const char* data = static_cast<const char*>(contents);
    userp->append(data, size * nmemb);
    return size * nmemb;
}

size_t LambdaHttpClient::header_callback(char* buffer, size_t size, size_t nitems, std::string* userdata) {
    userdata->append(buffer, size * nitems);
    return size * nitems;
}

} // namespace invoke
} // namespace providerkit
