#pragma once
// =============================================================================
// DroidPilot - Local device collaborators
// =============================================================================
// The shell-level executor used when the virtual-display channel is not
// available, and the permission check run before an agent task starts.
// =============================================================================
#include <string>

namespace droidpilot::agent {

// Android KeyEvent codes used by the dispatcher
constexpr int KEYCODE_HOME = 3;
constexpr int KEYCODE_BACK = 4;

class DeviceExecutor {
public:
    virtual ~DeviceExecutor() = default;

    virtual bool tap(int x, int y) = 0;
    virtual bool swipe(int x1, int y1, int x2, int y2, int duration_ms) = 0;
    virtual bool keyEvent(int keycode) = 0;
    virtual bool inputText(const std::string& text) = 0;
    virtual bool launchApp(const std::string& package) = 0;
    // Writes a PNG of the current screen to `path`
    virtual bool screenshot(const std::string& path) = 0;
};

class AuthorizationGate {
public:
    virtual ~AuthorizationGate() = default;
    virtual bool hasPermission() = 0;
};

} // namespace droidpilot::agent
