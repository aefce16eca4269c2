#pragma once

#include "providerkit/invoke/core.hpp"
#include "providerkit/invoke/errors.hpp"
#include <caf/expected.hpp>
#include <string>

namespace providerkit {
namespace invoke {

// Assembles the first InvocationRequest of a run.
// Every build() call yields a fresh bearer token.
class RequestBuilder {
public:
    explicit RequestBuilder(InvokeConfig config) : config_(std::move(config)) {}

    // Body already parsed by the caller; must be a JSON object
    caf::expected<InvocationRequest> build(Action action, const json& body) const;

    // Raw body text; must parse to a JSON object
    caf::expected<InvocationRequest> build(Action action, const std::string& raw_body) const;

    const InvokeConfig& config() const { return config_; }

    // Random UUIDv4 in canonical text form
    static std::string generate_bearer_token();

    // Request file collaborator: reads and parses a JSON document from disk
    static caf::expected<json> load_request_file(const std::string& path);

private:
    InvokeConfig config_;
};

} // namespace invoke
} // namespace providerkit
