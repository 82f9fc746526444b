// =============================================================================
// DroidPilot - Model reply handling
// =============================================================================
#include "model_reply.hpp"

#include <optional>
#include <sstream>

#include "../droidpilot_log.hpp"
#include "../util/base64.hpp"
#include "../util/string_util.hpp"

namespace droidpilot::agent {

namespace {

constexpr const char* TAG = "model";
constexpr size_t HISTORY_WINDOW = 5;

const char* const SYSTEM_PROMPT =
    "You operate an Android phone for the user. Each turn you get the task and the "
    "current screenshot; decide the single next operation.\n"
    "Coordinates are relative, 0-1000 on both axes.\n"
    "Operations:\n"
    "- do(launch, app=\"name\")\n"
    "- do(tap, element=[x,y])\n"
    "- do(double_tap, element=[x,y])\n"
    "- do(long_press, element=[x,y])\n"
    "- do(type, text=\"text\")\n"
    "- do(swipe, start=[x1,y1], end=[x2,y2], duration=300)\n"
    "- do(back) / do(home)\n"
    "- do(wait, duration=\"2 seconds\")\n"
    "- do(take_over, message=\"why\")\n"
    "- finish(\"result\")\n"
    "Add sensitive=true, message=\"...\" to operations that pay, send or delete.\n"
    "Reply as:\n"
    "<think>your reasoning</think>\n"
    "<action>one operation</action>";

// Content of the first <tag>...</tag>, nullopt if absent
std::optional<std::string> tagBlock(const std::string& text, const std::string& tag) {
    const std::string open = "<" + tag + ">";
    const std::string close = "</" + tag + ">";
    size_t start = text.find(open);
    if (start == std::string::npos) return std::nullopt;
    start += open.size();
    size_t end = text.find(close, start);
    if (end == std::string::npos) return std::nullopt;
    return util::trim(text.substr(start, end - start));
}

std::string lastCommandLine(const std::string& text) {
    std::istringstream in(text);
    std::string line;
    std::string found;
    while (std::getline(in, line)) {
        if (line.find("do(") != std::string::npos || line.find("finish(") != std::string::npos) {
            found = line;
        }
    }
    return util::trim(found);
}

} // namespace

ModelReply extractReply(const std::string& content) {
    ModelReply reply;
    reply.content = content;
    reply.thinking = tagBlock(content, "think").value_or("");

    if (auto action = tagBlock(content, "action")) {
        reply.action = *action;
    } else if (auto answer = tagBlock(content, "answer")) {
        reply.action = *answer;
    } else {
        reply.action = lastCommandLine(content);
        if (reply.action.empty()) reply.action = util::trim(content);
    }
    return reply;
}

Result<ModelReply, ProtocolError> parseChatCompletion(const std::string& body) {
    if (body.empty()) return ProtocolError("empty response body");

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        DPLOG_WARN(TAG, "Response is not JSON: %s", e.what());
        return ProtocolError(std::string("invalid JSON: ") + e.what());
    }

    if (j.contains("error")) {
        std::string message = j["error"].is_object() ? j["error"].value("message", std::string())
                                                     : j["error"].dump();
        return ProtocolError("model error: " + message);
    }
    if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
        return ProtocolError("response has no choices");
    }
    const nlohmann::json& choice = j["choices"][0];
    if (!choice.contains("message") || !choice["message"].is_object()) {
        return ProtocolError("choice has no message");
    }
    const nlohmann::json& message = choice["message"];
    if (!message.contains("content") || !message["content"].is_string()) {
        return ProtocolError("message content is not text");
    }

    ModelReply reply = extractReply(message["content"].get<std::string>());
    DPLOG_DEBUG(TAG, "Reply action: %s", reply.action.c_str());
    return reply;
}

nlohmann::json buildChatRequest(const std::string& model, const StepRequest& request) {
    std::ostringstream text;
    text << "Task: " << request.task << "\n";
    text << "Step: " << request.step << "\n";
    if (!request.history.empty()) {
        size_t first = request.history.size() > HISTORY_WINDOW
                           ? request.history.size() - HISTORY_WINDOW : 0;
        text << "Previous operations: ";
        for (size_t i = first; i < request.history.size(); i++) {
            if (i > first) text << ", ";
            text << request.history[i];
        }
        text << "\n";
    }
    text << "\nLook at the current screen and decide the next operation.";

    nlohmann::json user_content = nlohmann::json::array();
    user_content.push_back({{"type", "text"}, {"text", text.str()}});
    user_content.push_back({
        {"type", "image_url"},
        {"image_url", {{"url", "data:image/png;base64," + util::base64Encode(request.screenshot_png)}}}
    });

    nlohmann::json req;
    req["model"] = model;
    req["messages"] = nlohmann::json::array({
        {{"role", "system"}, {"content", SYSTEM_PROMPT}},
        {{"role", "user"}, {"content", user_content}}
    });
    req["max_tokens"] = 1024;
    return req;
}

} // namespace droidpilot::agent
