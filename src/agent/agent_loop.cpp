// =============================================================================
// DroidPilot - Agent loop
// =============================================================================
#include "agent_loop.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <thread>

#include "../droidpilot_log.hpp"

namespace droidpilot::agent {

namespace {

constexpr const char* TAG = "Agent";
constexpr int PAUSE_TICK_MS = 100;

// Shuts the remote channel down when the run leaves scope
class RemoteSession {
public:
    explicit RemoteSession(remote::RemoteControlChannel* channel) : channel_(channel) {}
    ~RemoteSession() {
        if (channel_) {
            channel_->shutdown();
            DPLOG_DEBUG(TAG, "Remote channel shut down");
        }
    }
    RemoteSession(const RemoteSession&) = delete;
    RemoteSession& operator=(const RemoteSession&) = delete;

private:
    remote::RemoteControlChannel* channel_;
};

} // namespace

const char* taskStatusName(TaskStatus s) {
    switch (s) {
        case TaskStatus::Running:   return "running";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed:    return "failed";
        case TaskStatus::Cancelled: return "cancelled";
    }
    return "?";
}

AgentLoop::AgentLoop(ActionDispatcher& dispatcher, DeviceExecutor& local, AuthorizationGate& gate,
                     ModelClient& model, remote::RemoteControlChannel* remote,
                     CoordinateNormalizer& normalizer, Options options)
    : dispatcher_(dispatcher),
      local_(local),
      gate_(gate),
      model_(model),
      remote_(remote),
      normalizer_(normalizer),
      options_(std::move(options)),
      parser_(dispatcher.options().default_swipe_ms) {
    dispatcher_.setCancelPredicate([this] { return stop_requested_.load(); });
}

AgentLoop::AgentLoop(ActionDispatcher& dispatcher, DeviceExecutor& local, AuthorizationGate& gate,
                     ModelClient& model, remote::RemoteControlChannel* remote,
                     CoordinateNormalizer& normalizer)
    : AgentLoop(dispatcher, local, gate, model, remote, normalizer, Options{}) {}

bool AgentLoop::pause(int ms) const {
    int elapsed = 0;
    while (elapsed < ms) {
        if (stop_requested_.load()) return false;
        int step = std::min(PAUSE_TICK_MS, ms - elapsed);
        std::this_thread::sleep_for(std::chrono::milliseconds(step));
        elapsed += step;
    }
    return !stop_requested_.load();
}

bool AgentLoop::prepareRemote() {
    if (!options_.use_remote || !remote_) return false;

    if (!remote_->ensureConnected()) {
        auto err = remote_->lastError();
        DPLOG_WARN(TAG, "Remote channel unavailable (%s), using local path",
                   err ? err->message.c_str() : "unknown");
        return false;
    }
    if (!remote_->ensureDisplay(options_.display_width, options_.display_height,
                                options_.display_dpi, options_.bitrate_kbps)) {
        DPLOG_WARN(TAG, "Virtual display not created, using local path");
        return false;
    }
    DPLOG_INFO(TAG, "Virtual display ready (%dx%d)", options_.display_width, options_.display_height);
    return true;
}

std::optional<std::vector<uint8_t>> AgentLoop::captureScreenshot(bool remote_ready) {
    if (remote_ready) {
        const int attempts = std::max(1, options_.screenshot_attempts);
        for (int attempt = 1; attempt <= attempts; attempt++) {
            auto png = remote_->requestScreenshot(
                std::chrono::milliseconds(options_.screenshot_timeout_ms));
            if (png && !png->empty()) {
                DPLOG_DEBUG(TAG, "Remote screenshot %zu bytes (attempt %d)", png->size(), attempt);
                return png;
            }
            DPLOG_WARN(TAG, "Remote screenshot failed (attempt %d/%d)", attempt, attempts);
            if (attempt < attempts && !pause(options_.screenshot_backoff_ms)) return std::nullopt;
        }
        DPLOG_WARN(TAG, "Falling back to local screencap");
    }
    return captureLocal();
}

std::optional<std::vector<uint8_t>> AgentLoop::captureLocal() {
    const auto stamp = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    const std::string path = options_.screenshot_dir + "/droidpilot_screenshot_" +
                             std::to_string(stamp) + ".png";

    if (!local_.screenshot(path)) {
        DPLOG_ERROR(TAG, "Local screenshot failed");
        return std::nullopt;
    }
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        DPLOG_ERROR(TAG, "Screenshot file missing: %s", path.c_str());
        return std::nullopt;
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    file.close();
    if (std::remove(path.c_str()) != 0) {
        DPLOG_DEBUG(TAG, "Could not remove %s", path.c_str());
    }
    if (bytes.empty()) {
        DPLOG_ERROR(TAG, "Screenshot file empty: %s", path.c_str());
        return std::nullopt;
    }
    return bytes;
}

TaskExecution AgentLoop::run(const std::string& task) {
    TaskExecution exec;
    exec.task = task;
    exec.started = std::chrono::steady_clock::now();

    auto finish = [&](TaskStatus status, std::string error = {}) {
        stop_requested_ = false;
        exec.status = status;
        if (!error.empty()) exec.error_message = std::move(error);
        exec.finished = std::chrono::steady_clock::now();
        DPLOG_INFO(TAG, "Task %s after %zu step(s), %lld ms%s%s", taskStatusName(status),
                   exec.steps.size(), static_cast<long long>(exec.durationMs()),
                   exec.error_message.empty() ? "" : ": ", exec.error_message.c_str());
        return exec;
    };

    DPLOG_INFO(TAG, "===== Task start: %s =====", task.c_str());

    if (!gate_.hasPermission()) {
        DPLOG_ERROR(TAG, "Permission check failed");
        return finish(TaskStatus::Failed, PERMISSION_MESSAGE);
    }

    RemoteSession session(options_.use_remote ? remote_ : nullptr);
    const bool remote_ready = prepareRemote();

    normalizer_.setScreenSize(options_.display_width, options_.display_height);

    DisplayContext ctx;
    ctx.use_remote = remote_ready;
    ctx.normalize_coordinates = options_.normalize_coordinates;
    if (remote_ready) ctx.display_id = remote_->displayId();

    std::vector<std::string> history;

    for (int step = 1; step <= options_.max_steps; step++) {
        if (stop_requested_.load()) return finish(TaskStatus::Cancelled, ActionDispatcher::CANCELLED_MESSAGE);
        DPLOG_INFO(TAG, "----- Step %d -----", step);

        auto screenshot = captureScreenshot(remote_ready);
        if (!screenshot) {
            if (stop_requested_.load()) return finish(TaskStatus::Cancelled, ActionDispatcher::CANCELLED_MESSAGE);
            return finish(TaskStatus::Failed, "Screenshot failed");
        }

        StepRequest request;
        request.task = task;
        request.step = step;
        request.screenshot_png = std::move(*screenshot);
        request.history = history;

        auto reply = model_.nextStep(request);
        if (reply.is_err()) {
            DPLOG_ERROR(TAG, "Model request failed: %s", reply.error().message.c_str());
            return finish(TaskStatus::Failed, "Model request failed: " + reply.error().message);
        }
        const ModelReply& r = reply.value();
        if (!r.thinking.empty()) {
            DPLOG_DEBUG(TAG, "Thinking: %.200s", r.thinking.c_str());
        }

        StepRecord record;
        record.step = step;
        record.thinking = r.thinking;

        auto parsed = parser_.parse(r.action);
        if (parsed.is_err()) {
            record.action = r.action;
            record.message = "Unknown action: " + parsed.error().message;
            DPLOG_WARN(TAG, "%s", record.message.c_str());
            exec.steps.push_back(record);
            history.push_back(r.action);
        } else {
            const Action& action = parsed.value();
            record.action = toCommandString(action);
            ActionResult result = dispatcher_.execute(action, ctx);
            record.success = result.success;
            record.message = result.message;
            exec.steps.push_back(record);
            history.push_back(record.action);

            if (result.should_finish) {
                if (action.isFinish()) {
                    exec.result_message = result.message;
                    return finish(TaskStatus::Completed);
                }
                const bool declined = result.requires_confirmation &&
                                      result.message == ActionDispatcher::DECLINED_MESSAGE;
                if (result.cancelled || declined) {
                    return finish(TaskStatus::Cancelled, result.message);
                }
                return finish(TaskStatus::Failed, result.message);
            }
        }

        if (step < options_.max_steps && !pause(options_.step_delay_ms)) {
            return finish(TaskStatus::Cancelled, ActionDispatcher::CANCELLED_MESSAGE);
        }
    }

    return finish(TaskStatus::Completed, MAX_STEPS_MESSAGE);
}

} // namespace droidpilot::agent
