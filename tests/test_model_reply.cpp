// =============================================================================
// Unit tests for model reply handling (src/agent/model_reply.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include "agent/model_reply.hpp"

using namespace droidpilot::agent;

// ---------------------------------------------------------------------------
// extractReply
// ---------------------------------------------------------------------------

TEST(ModelReplyTest, ThinkAndActionTags) {
    ModelReply r = extractReply(
        "<think> The settings icon is top right. </think>\n"
        "<action>do(tap, element=[900,80])</action>");
    EXPECT_EQ(r.thinking, "The settings icon is top right.");
    EXPECT_EQ(r.action, "do(tap, element=[900,80])");
    EXPECT_NE(r.content.find("<think>"), std::string::npos);
}

TEST(ModelReplyTest, AnswerTagAccepted) {
    ModelReply r = extractReply("<answer>finish(\"done\")</answer>");
    EXPECT_EQ(r.action, "finish(\"done\")");
    EXPECT_TRUE(r.thinking.empty());
}

TEST(ModelReplyTest, FallsBackToLastCommandLine) {
    ModelReply r = extractReply("First I go back.\ndo(back)\n  do(home)  \nThat should work.");
    EXPECT_EQ(r.action, "do(home)");
}

TEST(ModelReplyTest, UnclosedTagFallsBack) {
    ModelReply r = extractReply("<action>do(back)");
    EXPECT_EQ(r.action, "<action>do(back)");
}

TEST(ModelReplyTest, PlainTextKeptWhole) {
    ModelReply r = extractReply("  I cannot see the screen  ");
    EXPECT_EQ(r.action, "I cannot see the screen");
}

// ---------------------------------------------------------------------------
// parseChatCompletion
// ---------------------------------------------------------------------------

TEST(ModelReplyTest, ChatCompletionBody) {
    auto r = parseChatCompletion(R"({
        "id": "x",
        "choices": [{"index": 0, "message": {"role": "assistant",
            "content": "<think>ok</think><action>do(home)</action>"}}]
    })");
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_EQ(r.value().thinking, "ok");
    EXPECT_EQ(r.value().action, "do(home)");
}

TEST(ModelReplyTest, ChatCompletionErrors) {
    EXPECT_TRUE(parseChatCompletion("").is_err());
    EXPECT_TRUE(parseChatCompletion("<html>502</html>").is_err());
    EXPECT_TRUE(parseChatCompletion(R"({"choices": []})").is_err());
    EXPECT_TRUE(parseChatCompletion(R"({"choices": [{"text": "x"}]})").is_err());
    EXPECT_TRUE(parseChatCompletion(R"({"choices": [{"message": {"content": null}}]})").is_err());

    auto err = parseChatCompletion(R"({"error": {"message": "quota exceeded"}})");
    ASSERT_TRUE(err.is_err());
    EXPECT_EQ(err.error().message, "model error: quota exceeded");
}

// ---------------------------------------------------------------------------
// buildChatRequest
// ---------------------------------------------------------------------------

TEST(ModelReplyTest, RequestShape) {
    StepRequest req;
    req.task = "Open settings";
    req.step = 3;
    req.screenshot_png = {'f', 'o', 'o'};
    req.history = {"op1", "op2", "op3", "op4", "op5", "op6", "op7"};

    nlohmann::json body = buildChatRequest("vision-model", req);
    EXPECT_EQ(body["model"], "vision-model");
    EXPECT_EQ(body["max_tokens"], 1024);
    ASSERT_EQ(body["messages"].size(), 2u);
    EXPECT_EQ(body["messages"][0]["role"], "system");
    EXPECT_NE(body["messages"][0]["content"].get<std::string>().find("do(tap"), std::string::npos);

    const auto& content = body["messages"][1]["content"];
    ASSERT_EQ(content.size(), 2u);
    const std::string text = content[0]["text"].get<std::string>();
    EXPECT_NE(text.find("Task: Open settings"), std::string::npos);
    EXPECT_NE(text.find("Step: 3"), std::string::npos);
    EXPECT_NE(text.find("op3"), std::string::npos);
    EXPECT_NE(text.find("op7"), std::string::npos);
    EXPECT_EQ(text.find("op2"), std::string::npos);

    EXPECT_EQ(content[1]["image_url"]["url"], "data:image/png;base64,Zm9v");
}

TEST(ModelReplyTest, RequestWithoutHistory) {
    StepRequest req;
    req.task = "t";
    req.step = 1;
    nlohmann::json body = buildChatRequest("m", req);
    const std::string text = body["messages"][1]["content"][0]["text"].get<std::string>();
    EXPECT_EQ(text.find("Previous operations"), std::string::npos);
}
