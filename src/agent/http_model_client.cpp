// =============================================================================
// DroidPilot - OpenAI-compatible chat client
// =============================================================================
#include "http_model_client.hpp"

#include <httplib.h>

#include "../droidpilot_log.hpp"
#include "../util/string_util.hpp"

namespace droidpilot::agent {

namespace {

constexpr const char* TAG = "model_http";
constexpr const char* COMPLETIONS_PATH = "/chat/completions";
constexpr size_t ERROR_BODY_LIMIT = 300;

ProtocolError transportFailure(const ConnectionError& e) {
    return ProtocolError("model request failed: " + e.message);
}

ConnectionError::Kind connectionKind(httplib::Error err) {
    switch (err) {
    case httplib::Error::Connection:
        return ConnectionError::Kind::Refused;
    case httplib::Error::Read:
    case httplib::Error::Write:
        return ConnectionError::Kind::Closed;
    default:
        return ConnectionError::Kind::Other;
    }
}

} // namespace

Result<ModelEndpoint, ParseError> parseEndpoint(const std::string& base_url) {
    const std::string url = util::trim(base_url);
    if (url.empty()) return ParseError("empty model URL", base_url);
    for (char c : url) {
        if (static_cast<unsigned char>(c) <= ' ') return ParseError("whitespace in model URL", base_url);
    }

    const std::string lower = util::toLower(url);
    size_t scheme_len = 0;
    if (util::startsWith(lower, "https://")) scheme_len = 8;
    else if (util::startsWith(lower, "http://")) scheme_len = 7;
    else return ParseError("model URL must start with http:// or https://", base_url);

    const size_t slash = url.find('/', scheme_len);
    ModelEndpoint ep;
    ep.origin = lower.substr(0, scheme_len) + url.substr(scheme_len, slash - scheme_len);
    if (ep.origin.size() == scheme_len) return ParseError("model URL has no host", base_url);

    std::string path = slash == std::string::npos ? std::string() : url.substr(slash);
    while (!path.empty() && path.back() == '/') path.pop_back();
    const std::string suffix = COMPLETIONS_PATH;
    if (path.size() < suffix.size() || path.compare(path.size() - suffix.size(), suffix.size(), suffix) != 0) {
        path += suffix;
    }
    ep.path = path;
    return ep;
}

HttpModelClient::HttpModelClient(Options options, ModelEndpoint endpoint, HttpPost post)
    : options_(std::move(options)), endpoint_(std::move(endpoint)), post_(std::move(post)) {}

Result<std::unique_ptr<HttpModelClient>, Error> HttpModelClient::create(Options options) {
    if (options.api_key.empty()) return Error("model API key is not configured");
    ModelEndpoint endpoint = DROIDPILOT_TRY(parseEndpoint(options.base_url));

    auto client = std::make_shared<httplib::Client>(endpoint.origin);
    if (!client->is_valid()) {
        return Error("cannot open " + endpoint.origin + " (https needs cpp-httplib with OpenSSL)");
    }
    client->set_connection_timeout(options.connect_timeout_s, 0);
    client->set_read_timeout(options.read_timeout_s, 0);
    client->set_write_timeout(options.write_timeout_s, 0);

    const httplib::Headers headers = {{"Authorization", "Bearer " + options.api_key}};
    HttpPost post = [client, headers](const std::string& path, const std::string& body)
        -> Result<HttpResponse, ConnectionError> {
        auto res = client->Post(path, headers, body, "application/json");
        if (!res) {
            const httplib::Error err = res.error();
            return ConnectionError(httplib::to_string(err), connectionKind(err));
        }
        return HttpResponse{res->status, res->body};
    };

    DPLOG_INFO(TAG, "Model %s at %s%s", options.model.c_str(), endpoint.origin.c_str(),
               endpoint.path.c_str());
    return std::make_unique<HttpModelClient>(std::move(options), std::move(endpoint), std::move(post));
}

Result<ModelReply, ProtocolError> HttpModelClient::nextStep(const StepRequest& request) {
    std::string body;
    try {
        body = buildChatRequest(options_.model, request).dump();
    } catch (const nlohmann::json::type_error& e) {
        return ProtocolError(std::string("cannot encode request: ") + e.what());
    }
    DPLOG_DEBUG(TAG, "POST %s step=%d (%zu bytes)", endpoint_.path.c_str(), request.step, body.size());

    HttpResponse response = DROIDPILOT_TRY(post_(endpoint_.path, body).map_err(transportFailure));
    DPLOG_DEBUG(TAG, "HTTP %d, %zu bytes", response.status, response.body.size());

    if (response.status < 200 || response.status >= 300) {
        std::string detail = util::trim(response.body.substr(0, ERROR_BODY_LIMIT));
        DPLOG_WARN(TAG, "HTTP %d: %s", response.status, detail.c_str());
        return ProtocolError("HTTP " + std::to_string(response.status) +
                             (detail.empty() ? "" : ": " + detail), response.status);
    }
    return parseChatCompletion(response.body);
}

} // namespace droidpilot::agent
