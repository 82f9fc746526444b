#pragma once
// =============================================================================
// DroidPilot - adb shell executor
// =============================================================================
// Local device path: `adb [-s serial] shell input ...`, screencap and
// monkey launches. Also sets up the port forward used by the remote channel.
// =============================================================================

#include <functional>
#include <mutex>
#include <string>

#include "agent/device_executor.hpp"
#include "result.hpp"

namespace droidpilot {

struct CommandOutput {
    int exit_code = -1;
    std::string output;  // stdout, binary safe
};

class AdbShellExecutor : public agent::DeviceExecutor, public agent::AuthorizationGate {
public:
    // Runs one host command line. The default uses popen().
    using CommandRunner = std::function<CommandOutput(const std::string& command)>;

    explicit AdbShellExecutor(std::string serial = {});
    AdbShellExecutor(std::string serial, CommandRunner runner);

    void setSerial(const std::string& serial);
    std::string serial() const;

    // DeviceExecutor
    bool tap(int x, int y) override;
    bool swipe(int x1, int y1, int x2, int y2, int duration_ms) override;
    bool keyEvent(int keycode) override;
    bool inputText(const std::string& text) override;
    bool launchApp(const std::string& package) override;
    bool screenshot(const std::string& path) override;

    // AuthorizationGate: `adb get-state` reports "device"
    bool hasPermission() override;

    // PNG bytes from `adb exec-out screencap -p`
    Result<std::string, IoError> screencap();
    // screencap() written to `path`
    Result<void, IoError> captureTo(const std::string& path);

    // adb forward tcp:<port> tcp:<port>
    Result<void, IoError> forward(int local_port, int remote_port);

    // Host command line for a device shell command (exposed for tests)
    std::string buildShellCommand(const std::string& device_command) const;
    std::string buildAdbCommand(const std::string& args) const;

    static CommandOutput runPopen(const std::string& command);

private:
    bool shell(const std::string& device_command);

    mutable std::mutex mutex_;
    std::string serial_;
    CommandRunner runner_;
};

} // namespace droidpilot
