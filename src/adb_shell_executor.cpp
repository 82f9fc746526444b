// =============================================================================
// DroidPilot - adb shell executor
// =============================================================================
#include "adb_shell_executor.hpp"

#include <sys/wait.h>

#include <cstdio>
#include <fstream>
#include <memory>

#include "adb_security.hpp"
#include "droidpilot_log.hpp"
#include "util/base64.hpp"

namespace droidpilot {

namespace {

constexpr const char* TAG = "adb";
constexpr size_t MAX_OUTPUT_BYTES = 50 * 1024 * 1024;

// RAII wrapper for FILE* with pclose; exit status is read explicitly
struct PipeDeleter {
    void operator()(FILE* fp) const {
        if (fp) pclose(fp);
    }
};
using UniquePipe = std::unique_ptr<FILE, PipeDeleter>;

std::string trimTrailing(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
    return s;
}

} // namespace

AdbShellExecutor::AdbShellExecutor(std::string serial)
    : AdbShellExecutor(std::move(serial), &AdbShellExecutor::runPopen) {}

AdbShellExecutor::AdbShellExecutor(std::string serial, CommandRunner runner)
    : serial_(std::move(serial)), runner_(std::move(runner)) {
    if (!serial_.empty() && !security::isValidAdbId(serial_)) {
        DPLOG_ERROR(TAG, "Invalid device serial rejected: %s", serial_.c_str());
        serial_.clear();
    }
}

void AdbShellExecutor::setSerial(const std::string& serial) {
    if (!serial.empty() && !security::isValidAdbId(serial)) {
        DPLOG_ERROR(TAG, "Invalid device serial rejected: %s", serial.c_str());
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    serial_ = serial;
}

std::string AdbShellExecutor::serial() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return serial_;
}

CommandOutput AdbShellExecutor::runPopen(const std::string& command) {
    CommandOutput out;
    FILE* raw = popen(command.c_str(), "r");
    if (!raw) {
        DPLOG_ERROR(TAG, "popen failed: %s", command.c_str());
        return out;
    }
    UniquePipe pipe(raw);

    char buffer[4096];
    size_t n;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe.get())) > 0) {
        out.output.append(buffer, n);
        if (out.output.size() > MAX_OUTPUT_BYTES) {
            DPLOG_WARN(TAG, "Output truncated (exceeded %zu bytes)", MAX_OUTPUT_BYTES);
            break;
        }
    }
    int status = pclose(pipe.release());
    out.exit_code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
    return out;
}

std::string AdbShellExecutor::buildAdbCommand(const std::string& args) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string cmd = "adb";
    if (!serial_.empty()) cmd += " -s " + serial_;
    return cmd + " " + args;
}

std::string AdbShellExecutor::buildShellCommand(const std::string& device_command) const {
    return buildAdbCommand("shell " + security::shellQuote(device_command));
}

bool AdbShellExecutor::shell(const std::string& device_command) {
    const std::string cmd = buildShellCommand(device_command) + " 2>&1";
    CommandOutput out = runner_(cmd);
    if (out.exit_code != 0) {
        DPLOG_WARN(TAG, "'%s' failed (exit %d): %s", device_command.c_str(), out.exit_code,
                   trimTrailing(out.output).substr(0, 200).c_str());
        return false;
    }
    DPLOG_TRACE(TAG, "%s", device_command.c_str());
    return true;
}

bool AdbShellExecutor::tap(int x, int y) {
    return shell("input tap " + std::to_string(x) + " " + std::to_string(y));
}

bool AdbShellExecutor::swipe(int x1, int y1, int x2, int y2, int duration_ms) {
    return shell("input swipe " + std::to_string(x1) + " " + std::to_string(y1) + " " +
                 std::to_string(x2) + " " + std::to_string(y2) + " " +
                 std::to_string(duration_ms));
}

bool AdbShellExecutor::keyEvent(int keycode) {
    return shell("input keyevent " + std::to_string(keycode));
}

bool AdbShellExecutor::inputText(const std::string& text) {
    if (text.empty()) return true;
    if (!security::isAscii(text)) {
        // `input text` is ASCII only; ADBKeyBoard takes base64 UTF-8
        return shell("am broadcast -a ADB_INPUT_B64 --es msg " +
                     util::base64Encode(reinterpret_cast<const uint8_t*>(text.data()), text.size()));
    }
    return shell("input text " + security::shellQuote(security::escapeInputText(text)));
}

bool AdbShellExecutor::launchApp(const std::string& package) {
    if (!security::isValidPackageName(package)) {
        DPLOG_ERROR(TAG, "Invalid package name rejected: %s", package.c_str());
        return false;
    }
    return shell("monkey -p " + package + " -c android.intent.category.LAUNCHER 1");
}

Result<std::string, IoError> AdbShellExecutor::screencap() {
    CommandOutput out = runner_(buildAdbCommand("exec-out screencap -p"));
    if (out.exit_code != 0 || out.output.empty()) {
        return IoError("screencap failed (exit " + std::to_string(out.exit_code) + ", " +
                       std::to_string(out.output.size()) + " bytes)");
    }
    return std::move(out.output);
}

Result<void, IoError> AdbShellExecutor::captureTo(const std::string& path) {
    std::string png = DROIDPILOT_TRY(screencap());
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) return IoError("cannot write screenshot to " + path, IoError::Kind::NotFound);
    file.write(png.data(), static_cast<std::streamsize>(png.size()));
    if (!file) return IoError("short write to " + path);
    DPLOG_DEBUG(TAG, "Screenshot captured: %zu bytes -> %s", png.size(), path.c_str());
    return {};
}

bool AdbShellExecutor::screenshot(const std::string& path) {
    auto r = captureTo(path);
    if (r.is_err()) {
        DPLOG_ERROR(TAG, "Screenshot: %s", r.error().message.c_str());
        return false;
    }
    return true;
}

bool AdbShellExecutor::hasPermission() {
    CommandOutput out = runner_(buildAdbCommand("get-state 2>&1"));
    const std::string state = trimTrailing(out.output);
    if (out.exit_code != 0 || state != "device") {
        DPLOG_WARN(TAG, "Device not ready: %s", state.empty() ? "(no output)" : state.c_str());
        return false;
    }
    return true;
}

Result<void, IoError> AdbShellExecutor::forward(int local_port, int remote_port) {
    if (local_port <= 0 || local_port > 65535 || remote_port <= 0 || remote_port > 65535) {
        return IoError("invalid port");
    }
    const std::string args = "forward tcp:" + std::to_string(local_port) +
                             " tcp:" + std::to_string(remote_port) + " 2>&1";
    CommandOutput out = runner_(buildAdbCommand(args));
    if (out.exit_code != 0) {
        std::string msg = trimTrailing(out.output);
        DPLOG_ERROR(TAG, "adb forward failed: %s", msg.c_str());
        return IoError("adb forward failed: " + msg, IoError::Kind::ConnectionRefused);
    }
    DPLOG_INFO(TAG, "Forwarded tcp:%d -> device tcp:%d", local_port, remote_port);
    return {};
}

} // namespace droidpilot
