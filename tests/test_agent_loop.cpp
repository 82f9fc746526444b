// =============================================================================
// Unit tests for AgentLoop (src/agent/agent_loop.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include "agent/agent_loop.hpp"
#include "fake_devices.hpp"

#include <algorithm>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

using namespace droidpilot;
using namespace droidpilot::agent;
using droidpilot::testing::RecordingExecutor;

namespace {

// Connects at once and acknowledges the display, but never answers SCREENSHOT.
// `on_send` sees every outgoing command.
class SilentScreenTransport : public remote::Transport {
public:
    explicit SilentScreenTransport(std::function<void(const std::string&)> on_send)
        : on_send_(std::move(on_send)) {}

    void open(remote::TransportCallbacks callbacks) override {
        callbacks_ = std::move(callbacks);
        callbacks_.on_open();
    }
    bool sendText(const std::string& text) override {
        on_send_(text);
        if (text.rfind("CREATE_DISPLAY", 0) == 0) {
            callbacks_.on_text("DISPLAY_CREATED 3\nDISPLAY_SIZE 1080 2400\n");
        }
        return true;
    }
    void close(int, const std::string&) override {}

private:
    std::function<void(const std::string&)> on_send_;
    remote::TransportCallbacks callbacks_;
};

// Replays canned replies; finishes once the script runs out
class ScriptedModel : public ModelClient {
public:
    Result<ModelReply, ProtocolError> nextStep(const StepRequest& request) override {
        requests.push_back(request);
        if (replies.empty()) return extractReply("finish(\"script exhausted\")");
        Result<ModelReply, ProtocolError> next = replies.front();
        replies.pop_front();
        return next;
    }

    void say(const std::string& text) { replies.push_back(extractReply(text)); }
    void fail(const std::string& message) { replies.push_back(ProtocolError(message)); }

    std::deque<Result<ModelReply, ProtocolError>> replies;
    std::vector<StepRequest> requests;
};

ActionDispatcher::Options fastDispatch() {
    ActionDispatcher::Options o;
    o.wait_tick_ms = 10;
    o.type_settle_before_ms = 0;
    o.type_settle_after_ms = 0;
    o.double_tap_gap_ms = 0;
    return o;
}

} // namespace

class AgentLoopTest : public ::testing::Test {
protected:
    AgentLoopTest() : dispatcher(device, nullptr, normalizer, apps, fastDispatch()) {}

    AgentLoop::Options loopOptions() {
        AgentLoop::Options o;
        o.use_remote = false;
        o.step_delay_ms = 0;
        o.screenshot_dir = ::testing::TempDir();
        return o;
    }

    TaskExecution run(const std::string& task) {
        AgentLoop loop(dispatcher, device, device, model, nullptr, normalizer, loopOptions());
        return loop.run(task);
    }

    RecordingExecutor device;
    CoordinateNormalizer normalizer;
    AppCatalog apps;
    ScriptedModel model;
    ActionDispatcher dispatcher;
};

// ---------------------------------------------------------------------------
// Completion
// ---------------------------------------------------------------------------

TEST_F(AgentLoopTest, CompletesOnFinish) {
    model.say("<think>tap the middle</think><action>do(tap, element=[500,500])</action>");
    model.say("<action>finish(\"done\")</action>");

    TaskExecution exec = run("Open the app");
    EXPECT_EQ(exec.status, TaskStatus::Completed);
    EXPECT_EQ(exec.result_message, "done");
    EXPECT_TRUE(exec.error_message.empty());
    ASSERT_EQ(exec.steps.size(), 2u);
    EXPECT_EQ(exec.steps[0].thinking, "tap the middle");
    EXPECT_EQ(exec.steps[0].action, "do(tap, element=[500,500])");
    EXPECT_TRUE(exec.steps[0].success);
    EXPECT_GE(exec.durationMs(), 0);

    const auto calls = device.calls();
    EXPECT_EQ(std::count(calls.begin(), calls.end(), "tap 540 1200"), 1);
    EXPECT_EQ(std::count(calls.begin(), calls.end(), "screenshot"), 2);
}

TEST_F(AgentLoopTest, RequestsCarryScreenshotAndHistory) {
    model.say("do(back)");
    model.say("do(home)");
    model.say("finish(\"ok\")");
    run("Go home");

    ASSERT_EQ(model.requests.size(), 3u);
    EXPECT_EQ(model.requests[0].task, "Go home");
    EXPECT_EQ(model.requests[0].step, 1);
    EXPECT_TRUE(model.requests[0].history.empty());
    const std::string png(model.requests[0].screenshot_png.begin(),
                          model.requests[0].screenshot_png.end());
    EXPECT_EQ(png, "local-png-bytes");
    EXPECT_EQ(model.requests[2].step, 3);
    EXPECT_EQ(model.requests[2].history, (std::vector<std::string>{"do(back)", "do(home)"}));
}

TEST_F(AgentLoopTest, StepCeiling) {
    for (int i = 0; i < 10; i++) model.say("do(back)");
    AgentLoop::Options o = loopOptions();
    o.max_steps = 3;
    AgentLoop loop(dispatcher, device, device, model, nullptr, normalizer, o);

    TaskExecution exec = loop.run("loop forever");
    EXPECT_EQ(exec.status, TaskStatus::Completed);
    EXPECT_EQ(exec.error_message, AgentLoop::MAX_STEPS_MESSAGE);
    EXPECT_EQ(exec.steps.size(), 3u);
}

// ---------------------------------------------------------------------------
// Failures
// ---------------------------------------------------------------------------

TEST_F(AgentLoopTest, PermissionMissing) {
    device.permission = false;
    TaskExecution exec = run("anything");
    EXPECT_EQ(exec.status, TaskStatus::Failed);
    EXPECT_EQ(exec.error_message, AgentLoop::PERMISSION_MESSAGE);
    EXPECT_TRUE(model.requests.empty());
    EXPECT_TRUE(device.calls().empty());
}

TEST_F(AgentLoopTest, ScreenshotFailure) {
    device.screenshot_ok = false;
    TaskExecution exec = run("anything");
    EXPECT_EQ(exec.status, TaskStatus::Failed);
    EXPECT_EQ(exec.error_message, "Screenshot failed");
    EXPECT_TRUE(model.requests.empty());
}

TEST_F(AgentLoopTest, ModelFailure) {
    model.fail("HTTP 500");
    TaskExecution exec = run("anything");
    EXPECT_EQ(exec.status, TaskStatus::Failed);
    EXPECT_EQ(exec.error_message, "Model request failed: HTTP 500");
}

TEST_F(AgentLoopTest, UnparseableReplyIsNotFatal) {
    model.say("I am not sure yet");
    model.say("finish(\"ok\")");
    TaskExecution exec = run("anything");
    EXPECT_EQ(exec.status, TaskStatus::Completed);
    ASSERT_EQ(exec.steps.size(), 2u);
    EXPECT_FALSE(exec.steps[0].success);
    EXPECT_EQ(exec.steps[0].action, "I am not sure yet");
    EXPECT_EQ(exec.steps[0].message.rfind("Unknown action: ", 0), 0u);
}

TEST_F(AgentLoopTest, FatalUnknownActionFails) {
    ActionDispatcher::Options o = fastDispatch();
    o.unknown_is_fatal = true;
    ActionDispatcher strict(device, nullptr, normalizer, apps, o);
    model.say("do(fly)");
    AgentLoop loop(strict, device, device, model, nullptr, normalizer, loopOptions());

    TaskExecution exec = loop.run("anything");
    EXPECT_EQ(exec.status, TaskStatus::Failed);
    EXPECT_EQ(exec.error_message, "Unknown action: fly");
}

// ---------------------------------------------------------------------------
// Cancellation
// ---------------------------------------------------------------------------

TEST_F(AgentLoopTest, DeclinedConfirmationCancels) {
    model.say("do(tap, element=[1,2], sensitive=true, message=\"Pay 5\")");
    TaskExecution exec = run("buy it");
    EXPECT_EQ(exec.status, TaskStatus::Cancelled);
    EXPECT_EQ(exec.error_message, ActionDispatcher::DECLINED_MESSAGE);
    const auto calls = device.calls();
    EXPECT_EQ(std::count(calls.begin(), calls.end(), "tap 1 2"), 0);
}

TEST_F(AgentLoopTest, StopEndsRunningWait) {
    model.say("do(wait, duration=\"30 seconds\")");
    AgentLoop loop(dispatcher, device, device, model, nullptr, normalizer, loopOptions());

    std::thread stopper([&loop] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        loop.stop();
    });
    const auto start = std::chrono::steady_clock::now();
    TaskExecution exec = loop.run("wait");
    const auto elapsed = std::chrono::steady_clock::now() - start;
    stopper.join();

    EXPECT_EQ(exec.status, TaskStatus::Cancelled);
    EXPECT_FALSE(loop.stopRequested());
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST_F(AgentLoopTest, StopBeforeRunCancelsThatRun) {
    model.say("do(home)");
    AgentLoop loop(dispatcher, device, device, model, nullptr, normalizer, loopOptions());

    loop.stop();
    EXPECT_TRUE(loop.stopRequested());
    TaskExecution exec = loop.run("go home");
    EXPECT_EQ(exec.status, TaskStatus::Cancelled);
    EXPECT_EQ(exec.error_message, ActionDispatcher::CANCELLED_MESSAGE);
    EXPECT_TRUE(exec.steps.empty());
    EXPECT_TRUE(model.requests.empty());
    EXPECT_TRUE(device.calls().empty());
    EXPECT_FALSE(loop.stopRequested());

    // The request is consumed; the next run proceeds
    TaskExecution again = loop.run("go home");
    EXPECT_EQ(again.status, TaskStatus::Completed);
    EXPECT_EQ(model.requests.size(), 2u);
}

// ---------------------------------------------------------------------------
// Remote fallback
// ---------------------------------------------------------------------------

TEST_F(AgentLoopTest, UnreachableRemoteFallsBackToLocal) {
    remote::RemoteControlChannel channel([] { return std::unique_ptr<remote::Transport>(); });
    model.say("do(home)");
    model.say("finish(\"ok\")");

    AgentLoop::Options o = loopOptions();
    o.use_remote = true;
    AgentLoop loop(dispatcher, device, device, model, &channel, normalizer, o);

    TaskExecution exec = loop.run("go home");
    EXPECT_EQ(exec.status, TaskStatus::Completed);
    const auto calls = device.calls();
    EXPECT_EQ(std::count(calls.begin(), calls.end(), "key 3"), 1);
    EXPECT_EQ(channel.state(), remote::RemoteControlChannel::ConnectionState::Disconnected);
}

TEST_F(AgentLoopTest, SilentRemoteScreenshotRetriesThenCapturesLocally) {
    std::mutex mutex;
    std::vector<std::string> sent;
    std::vector<size_t> local_shots_at_send;
    remote::RemoteControlChannel::Options channel_opts;
    channel_opts.connect_timeout_ms = 1000;
    channel_opts.display_ack_timeout_ms = 500;
    remote::RemoteControlChannel channel([&]() -> std::unique_ptr<remote::Transport> {
        return std::make_unique<SilentScreenTransport>([&](const std::string& text) {
            const auto calls = device.calls();
            std::lock_guard<std::mutex> lock(mutex);
            sent.push_back(text);
            local_shots_at_send.push_back(
                static_cast<size_t>(std::count(calls.begin(), calls.end(), "screenshot")));
        });
    }, channel_opts);
    model.say("finish(\"seen\")");

    AgentLoop::Options o = loopOptions();
    o.use_remote = true;
    o.screenshot_attempts = 3;
    o.screenshot_timeout_ms = 40;
    o.screenshot_backoff_ms = 20;
    AgentLoop loop(dispatcher, device, device, model, &channel, normalizer, o);

    TaskExecution exec = loop.run("look");
    EXPECT_EQ(exec.status, TaskStatus::Completed);
    ASSERT_EQ(model.requests.size(), 1u);
    const std::string png(model.requests[0].screenshot_png.begin(),
                          model.requests[0].screenshot_png.end());
    EXPECT_EQ(png, "local-png-bytes");

    const auto calls = device.calls();
    EXPECT_EQ(std::count(calls.begin(), calls.end(), "screenshot"), 1);

    std::lock_guard<std::mutex> lock(mutex);
    size_t screenshot_sends = 0;
    for (size_t i = 0; i < sent.size(); i++) {
        if (sent[i] != "SCREENSHOT") continue;
        screenshot_sends++;
        EXPECT_EQ(local_shots_at_send[i], 0u) << "remote attempt after local capture";
    }
    EXPECT_EQ(screenshot_sends, 3u);
}

TEST(TaskStatusTest, Names) {
    EXPECT_STREQ(taskStatusName(TaskStatus::Completed), "completed");
    EXPECT_STREQ(taskStatusName(TaskStatus::Cancelled), "cancelled");
}
