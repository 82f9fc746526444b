#pragma once
// =============================================================================
// DroidPilot - Agent loop
// =============================================================================
// Drives one task: screenshot -> model -> parse -> dispatch, one step at a
// time, until the model finishes, a fatal error occurs, stop() is called or
// the step ceiling is reached. The remote channel is shut down on every exit.
// =============================================================================
#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "action_dispatcher.hpp"
#include "action_parser.hpp"
#include "coordinate_normalizer.hpp"
#include "device_executor.hpp"
#include "model_reply.hpp"
#include "../remote/remote_control_channel.hpp"

namespace droidpilot::agent {

enum class TaskStatus { Running, Completed, Failed, Cancelled };

const char* taskStatusName(TaskStatus s);

struct StepRecord {
    int step = 0;
    std::string thinking;
    std::string action;   // canonical command, or the raw text if unparseable
    bool success = false;
    std::string message;
};

struct TaskExecution {
    std::string task;
    TaskStatus status = TaskStatus::Running;
    std::vector<StepRecord> steps;
    std::string result_message;  // finish() text on completion
    std::string error_message;
    std::chrono::steady_clock::time_point started;
    std::chrono::steady_clock::time_point finished;

    int64_t durationMs() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(finished - started).count();
    }
};

class AgentLoop {
public:
    struct Options {
        int max_steps = 30;
        int step_delay_ms = 500;
        int screenshot_attempts = 2;
        int screenshot_backoff_ms = 500;
        int screenshot_timeout_ms = 3000;
        bool use_remote = true;
        bool normalize_coordinates = true;
        int display_width = 1080;
        int display_height = 2400;
        int display_dpi = 420;
        int bitrate_kbps = 3000;
        std::string screenshot_dir = "/tmp";
    };

    static constexpr const char* PERMISSION_MESSAGE =
        "Device permission missing: authorize adb / shell access and retry";
    static constexpr const char* MAX_STEPS_MESSAGE = "max steps reached";

    // `remote` may be null. The loop installs its stop flag as the
    // dispatcher's cancel predicate.
    AgentLoop(ActionDispatcher& dispatcher, DeviceExecutor& local, AuthorizationGate& gate,
              ModelClient& model, remote::RemoteControlChannel* remote,
              CoordinateNormalizer& normalizer, Options options);
    AgentLoop(ActionDispatcher& dispatcher, DeviceExecutor& local, AuthorizationGate& gate,
              ModelClient& model, remote::RemoteControlChannel* remote,
              CoordinateNormalizer& normalizer);

    AgentLoop(const AgentLoop&) = delete;
    AgentLoop& operator=(const AgentLoop&) = delete;

    TaskExecution run(const std::string& task);

    // Thread-safe; the running step ends within one dispatcher tick. A stop()
    // issued before run() cancels that run. run() clears the request on return.
    void stop() { stop_requested_ = true; }
    bool stopRequested() const { return stop_requested_.load(); }

private:
    bool prepareRemote();
    std::optional<std::vector<uint8_t>> captureScreenshot(bool remote_ready);
    std::optional<std::vector<uint8_t>> captureLocal();
    bool pause(int ms) const;

    ActionDispatcher& dispatcher_;
    DeviceExecutor& local_;
    AuthorizationGate& gate_;
    ModelClient& model_;
    remote::RemoteControlChannel* remote_;
    CoordinateNormalizer& normalizer_;
    Options options_;
    ActionParser parser_;

    std::atomic<bool> stop_requested_{false};
};

} // namespace droidpilot::agent
