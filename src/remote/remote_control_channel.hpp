#pragma once
// =============================================================================
// DroidPilot - Remote control channel to the virtual display server
// =============================================================================
// Text protocol, one command per message:
//   CREATE_DISPLAY <w> <h> <dpi> [<bitrateKbps>]  -> DISPLAY_CREATED <id>
//                                                    DISPLAY_SIZE <w> <h>
//   SCREENSHOT                                    -> SCREENSHOT_DATA <base64>
//                                                  | SCREENSHOT_ERROR ...
//   TAP x y | SWIPE x1 y1 x2 y2 ms | KEY code | LAUNCH_APP pkg
//   TOUCH_DOWN/TOUCH_MOVE/TOUCH_UP x y | DESTROY_DISPLAY
// Binary messages carry the H.264 elementary stream and go to the video
// callback untouched.
//
// All mutable state sits behind one mutex. Transport callbacks from an older
// connection attempt are ignored.
// =============================================================================
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "capabilities.hpp"
#include "transport.hpp"
#include "../result.hpp"

namespace droidpilot::remote {

class RemoteControlChannel : public DisplayProvisioner, public InputInjector {
public:
    enum class ConnectionState { Disconnected, Connecting, Connected };

    struct Options {
        int connect_timeout_ms = 5000;
        int screenshot_timeout_ms = 3000;
        int display_ack_timeout_ms = 5000;
    };

    using VideoCallback = std::function<void(const std::vector<uint8_t>& chunk)>;
    using DisplaySizeCallback = std::function<void(int width, int height)>;

    RemoteControlChannel(TransportFactory factory, Options options);
    explicit RemoteControlChannel(TransportFactory factory);
    ~RemoteControlChannel() override;

    RemoteControlChannel(const RemoteControlChannel&) = delete;
    RemoteControlChannel& operator=(const RemoteControlChannel&) = delete;

    // Idempotent. Concurrent callers share one connection attempt.
    bool ensureConnected();

    // Fails fast (false) unless Connected
    bool send(const std::string& command);

    // Single pending slot: a newer request supersedes an older one, whose
    // waiter then receives nullopt. Replies still owed to superseded or
    // timed-out requests are discarded, so a caller only ever sees the
    // reply to its own SCREENSHOT.
    std::optional<std::vector<uint8_t>> requestScreenshot(std::chrono::milliseconds timeout);
    std::optional<std::vector<uint8_t>> requestScreenshot();

    // DisplayProvisioner
    bool ensureDisplay(int width, int height, int dpi,
                       std::optional<int> bitrate_kbps = std::nullopt) override;
    std::optional<int> displayId() const override;
    void shutdown() override;

    // InputInjector
    bool isConnected() const override;
    bool tap(int x, int y) override;
    bool swipe(int x1, int y1, int x2, int y2, int duration_ms) override;
    bool key(int keycode) override;
    bool launchApp(const std::string& package) override;
    bool touchDown(int x, int y) override;
    bool touchMove(int x, int y) override;
    bool touchUp(int x, int y) override;

    ConnectionState state() const;
    // (0, 0) until the server reports DISPLAY_SIZE
    std::pair<int, int> videoSize() const;
    // Most recent connect / send failure
    std::optional<ConnectionError> lastError() const;

    void setVideoCallback(VideoCallback cb);
    void setDisplaySizeCallback(DisplaySizeCallback cb);

    static const char* stateName(ConnectionState s);

private:
    using ScreenshotBytes = std::optional<std::vector<uint8_t>>;

    struct ScreenshotSlot {
        uint64_t id = 0;
        bool sent = false;       // SCREENSHOT went out for this slot
        bool abandoned = false;  // superseded or timed out
        std::promise<ScreenshotBytes> promise;
    };

    TransportCallbacks makeCallbacks(uint64_t attempt);
    void onOpen(uint64_t attempt);
    void onDisconnected(uint64_t attempt, const std::string& why, bool failure);
    void onText(uint64_t attempt, const std::string& text);
    void onBinary(uint64_t attempt, std::vector<uint8_t> data);
    void handleLine(const std::string& line);

    // Caller holds mutex_
    void resolveConnectLocked(bool ok);
    std::shared_ptr<ScreenshotSlot> takeSlotLocked();
    void abandonSlotLocked(ScreenshotSlot& slot);
    // false when the slot was already taken by a reply or a newer request
    bool clearSlot(uint64_t id);

    TransportFactory factory_;
    Options options_;

    mutable std::mutex mutex_;
    std::condition_variable display_cv_;

    ConnectionState state_ = ConnectionState::Disconnected;
    std::shared_ptr<Transport> transport_;
    uint64_t attempt_id_ = 0;
    std::shared_ptr<std::promise<bool>> connect_promise_;
    std::shared_future<bool> connect_future_;

    std::shared_ptr<ScreenshotSlot> pending_screenshot_;
    uint64_t next_slot_id_ = 0;
    int stale_replies_ = 0;  // replies owed to abandoned slots

    std::optional<ConnectionError> last_error_;
    std::optional<int> display_id_;
    int video_width_ = 0;
    int video_height_ = 0;

    VideoCallback video_cb_;
    DisplaySizeCallback size_cb_;
};

} // namespace droidpilot::remote
