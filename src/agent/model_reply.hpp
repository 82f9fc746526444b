#pragma once
// =============================================================================
// DroidPilot - Model reply handling
// =============================================================================
// The model answers in free text with tagged blocks:
//   <think>reasoning</think>
//   <action>do(tap, element=[500,300])</action>
// The chat transport is injected through ModelClient.
// =============================================================================
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../result.hpp"

namespace droidpilot::agent {

struct ModelReply {
    std::string thinking;
    std::string action;   // text handed to ActionParser
    std::string content;  // full reply text
};

// Pulls <think> and <action> (or <answer>) blocks out of `content`. Without an
// action tag the last line containing do( / finish( is used, else the whole
// trimmed text.
ModelReply extractReply(const std::string& content);

// OpenAI-compatible chat completion body -> choices[0].message.content
Result<ModelReply, ProtocolError> parseChatCompletion(const std::string& body);

struct StepRequest {
    std::string task;
    int step = 0;                        // 1-based
    std::vector<uint8_t> screenshot_png;
    std::vector<std::string> history;    // canonical commands of earlier steps
};

// OpenAI-compatible request body with the screenshot as a data URL.
// Only the last five history entries are sent.
nlohmann::json buildChatRequest(const std::string& model, const StepRequest& request);

class ModelClient {
public:
    virtual ~ModelClient() = default;
    virtual Result<ModelReply, ProtocolError> nextStep(const StepRequest& request) = 0;
};

} // namespace droidpilot::agent
