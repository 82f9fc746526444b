#pragma once
// =============================================================================
// DroidPilot - OpenAI-compatible chat client
// =============================================================================
// POSTs buildChatRequest() to <base_url>/chat/completions with a bearer key
// and hands the body to parseChatCompletion(). The HTTP call itself is an
// injectable function; create() wires it to cpp-httplib.
// =============================================================================
#include <functional>
#include <memory>
#include <string>

#include "model_reply.hpp"
#include "../result.hpp"

namespace droidpilot::agent {

struct HttpResponse {
    int status = 0;
    std::string body;
};

// path -> response; the transport owns host, headers and timeouts
using HttpPost = std::function<Result<HttpResponse, ConnectionError>(
    const std::string& path, const std::string& body)>;

struct ModelEndpoint {
    std::string origin;  // scheme://host[:port]
    std::string path;    // request path of the completions call
};

// "https://host/api/v4" -> {"https://host", "/api/v4/chat/completions"}
Result<ModelEndpoint, ParseError> parseEndpoint(const std::string& base_url);

class HttpModelClient : public ModelClient {
public:
    struct Options {
        std::string base_url = "https://open.bigmodel.cn/api/paas/v4";
        std::string api_key;
        std::string model = "autoglm-phone";
        int connect_timeout_s = 60;
        int read_timeout_s = 120;
        int write_timeout_s = 60;
    };

    HttpModelClient(Options options, ModelEndpoint endpoint, HttpPost post);

    // Fails on an empty key, a malformed URL or an unusable scheme
    static Result<std::unique_ptr<HttpModelClient>, Error> create(Options options);

    Result<ModelReply, ProtocolError> nextStep(const StepRequest& request) override;

    const ModelEndpoint& endpoint() const { return endpoint_; }

private:
    Options options_;
    ModelEndpoint endpoint_;
    HttpPost post_;
};

} // namespace droidpilot::agent
