#pragma once

#include "providerkit/invoke/core.hpp"
#include "providerkit/invoke/cancellation.hpp"
#include "providerkit/invoke/observability.hpp"
#include "providerkit/invoke/retry_policy.hpp"
#include <caf/expected.hpp>
#include <memory>
#include <string>

namespace providerkit {
namespace invoke {

// HandlerClient speaking the Lambda invoke HTTP API, as served by a local
// function emulator: POST {endpoint}/2015-03-31/functions/{name}/invocations.
//
// Every invoke() uses its own curl easy handle, so one client may be shared by
// concurrent runs. curl_global_init() must have been called by the process.
class LambdaHttpClient : public HandlerClient {
public:
    explicit LambdaHttpClient(InvokeConfig config,
                              std::shared_ptr<Observability> observability = nullptr);

    std::string describe() const override;

    caf::expected<RawResponse> invoke(const InvocationRequest& request,
                                      const CancellationToken& token) override;

    std::string invocation_url() const;

private:
    struct HttpResponse {
        int status_code;
        std::string body;
        std::string headers;
    };

    InvokeConfig config_;
    RetryPolicy retry_policy_;
    std::shared_ptr<Observability> observability_;

    caf::expected<HttpResponse> perform_http_request(const std::string& body,
                                                     const CancellationToken& token) const;

    caf::expected<RawResponse> decode_response(const HttpResponse& http) const;

    static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, std::string* userdata);
};

} // namespace invoke
} // namespace providerkit
