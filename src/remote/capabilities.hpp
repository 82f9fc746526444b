#pragma once
// =============================================================================
// DroidPilot - Virtual display capabilities
// =============================================================================
// Narrow interfaces over the virtual-display server. The agent side only sees
// these; RemoteControlChannel is the single implementation.
// =============================================================================
#include <optional>
#include <string>

namespace droidpilot::remote {

class DisplayProvisioner {
public:
    virtual ~DisplayProvisioner() = default;

    // Creates the virtual display unless one already exists
    virtual bool ensureDisplay(int width, int height, int dpi,
                               std::optional<int> bitrate_kbps = std::nullopt) = 0;
    virtual std::optional<int> displayId() const = 0;
    virtual void shutdown() = 0;
};

class InputInjector {
public:
    virtual ~InputInjector() = default;

    virtual bool isConnected() const = 0;
    virtual bool tap(int x, int y) = 0;
    virtual bool swipe(int x1, int y1, int x2, int y2, int duration_ms) = 0;
    virtual bool key(int keycode) = 0;
    virtual bool launchApp(const std::string& package) = 0;
    virtual bool touchDown(int x, int y) = 0;
    virtual bool touchMove(int x, int y) = 0;
    virtual bool touchUp(int x, int y) = 0;
};

} // namespace droidpilot::remote
