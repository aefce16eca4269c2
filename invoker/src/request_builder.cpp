#include "providerkit/invoke/request_builder.hpp"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <fstream>
#include <random>
#include <sstream>

namespace providerkit {
namespace invoke {

caf::expected<InvocationRequest> RequestBuilder::build(Action action, const json& body) const {
    if (!body.is_object()) {
        return make_error(ErrorCode::malformed_request,
                          std::string("Request body must be a JSON object, got ") + body.type_name());
    }

    InvocationRequest request;
    request.action = action;
    request.resource_request = body;
    request.callback_context = json::object();
    request.bearer_token = generate_bearer_token();
    request.region = config_.region;
    return request;
}

caf::expected<InvocationRequest> RequestBuilder::build(Action action, const std::string& raw_body) const {
    json body;
    try {
        body = json::parse(raw_body);
    } catch (const json::parse_error& e) {
        return make_error(ErrorCode::malformed_request,
                          "Invalid request JSON: " + std::string(e.what()));
    }
    return build(action, body);
}

std::string RequestBuilder::generate_bearer_token() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t hi = dist(engine);
    uint64_t lo = dist(engine);

    // Version 4, RFC 4122 variant
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
             static_cast<unsigned>(hi >> 32),
             static_cast<unsigned>((hi >> 16) & 0xFFFF),
             static_cast<unsigned>(hi & 0xFFFF),
             static_cast<unsigned>(lo >> 48),
             static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return std::string(buf);
}

caf::expected<json> RequestBuilder::load_request_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return make_error(ErrorCode::malformed_request, "Cannot open request file: " + path);
    }

    std::stringstream buffer;
    buffer << in.rdbuf();

    try {
        return json::parse(buffer.str());
    } catch (const json::parse_error& e) {
        return make_error(ErrorCode::malformed_request,
                          "Invalid JSON in request file " + path + ": " + std::string(e.what()));
    }
}

} // namespace invoke
} // namespace providerkit
