// =============================================================================
// DroidPilot - Remote control channel
// =============================================================================
#include "remote_control_channel.hpp"

#include <cerrno>
#include <cstdlib>
#include <exception>

#include "../droidpilot_log.hpp"
#include "../util/base64.hpp"
#include "../util/string_util.hpp"

namespace droidpilot::remote {

namespace {

constexpr const char* TAG = "remote";

constexpr const char* PREFIX_DISPLAY_CREATED = "DISPLAY_CREATED ";
constexpr const char* PREFIX_DISPLAY_SIZE = "DISPLAY_SIZE ";
constexpr const char* PREFIX_SCREENSHOT_DATA = "SCREENSHOT_DATA ";
constexpr const char* PREFIX_SCREENSHOT_ERROR = "SCREENSHOT_ERROR";

std::optional<int> parseInt(const std::string& s) {
    std::string t = util::trim(s);
    if (t.empty()) return std::nullopt;
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(t.c_str(), &end, 10);
    if (*end != '\0' || errno == ERANGE) return std::nullopt;
    return static_cast<int>(v);
}

} // namespace

RemoteControlChannel::RemoteControlChannel(TransportFactory factory, Options options)
    : factory_(std::move(factory)), options_(options) {}

RemoteControlChannel::RemoteControlChannel(TransportFactory factory)
    : RemoteControlChannel(std::move(factory), Options{}) {}

RemoteControlChannel::~RemoteControlChannel() {
    shutdown();
}

const char* RemoteControlChannel::stateName(ConnectionState s) {
    switch (s) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting:   return "Connecting";
        case ConnectionState::Connected:    return "Connected";
    }
    return "?";
}

// -----------------------------------------------------------------------------
// Connection
// -----------------------------------------------------------------------------

bool RemoteControlChannel::ensureConnected() {
    std::shared_future<bool> fut;
    std::shared_ptr<Transport> starting;
    std::shared_ptr<Transport> stale;
    uint64_t attempt = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ConnectionState::Connected) return true;

        if (state_ == ConnectionState::Connecting) {
            fut = connect_future_;
            attempt = attempt_id_;
        } else {
            state_ = ConnectionState::Connecting;
            attempt = ++attempt_id_;
            connect_promise_ = std::make_shared<std::promise<bool>>();
            connect_future_ = connect_promise_->get_future().share();
            fut = connect_future_;

            stale = std::move(transport_);
            transport_ = std::shared_ptr<Transport>(factory_());
            starting = transport_;
            if (!starting) {
                last_error_ = ConnectionError("no transport", ConnectionError::Kind::Other);
                state_ = ConnectionState::Disconnected;
                resolveConnectLocked(false);
            }
        }
    }

    if (stale) stale->close(1000, "reconnect");
    stale.reset();

    if (starting) {
        DPLOG_INFO(TAG, "Connecting (attempt %llu)", static_cast<unsigned long long>(attempt));
        starting->open(makeCallbacks(attempt));
    }

    if (fut.wait_for(std::chrono::milliseconds(options_.connect_timeout_ms)) !=
        std::future_status::ready) {
        std::shared_ptr<Transport> abandon;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (attempt_id_ == attempt && state_ == ConnectionState::Connecting) {
                DPLOG_WARN(TAG, "Connect timed out after %d ms", options_.connect_timeout_ms);
                last_error_ = ConnectionError("connect timed out", ConnectionError::Kind::Timeout);
                state_ = ConnectionState::Disconnected;
                resolveConnectLocked(false);
                ++attempt_id_;
                abandon = transport_;
            }
        }
        if (abandon) abandon->close(1000, "connect timeout");
        return false;
    }
    return fut.get();
}

void RemoteControlChannel::resolveConnectLocked(bool ok) {
    if (!connect_promise_) return;
    connect_promise_->set_value(ok);
    connect_promise_.reset();
}

TransportCallbacks RemoteControlChannel::makeCallbacks(uint64_t attempt) {
    TransportCallbacks cb;
    cb.on_open = [this, attempt]() { onOpen(attempt); };
    cb.on_text = [this, attempt](const std::string& text) { onText(attempt, text); };
    cb.on_binary = [this, attempt](std::vector<uint8_t> data) {
        onBinary(attempt, std::move(data));
    };
    cb.on_closed = [this, attempt](int code, const std::string& reason) {
        onDisconnected(attempt, std::to_string(code) + " " + reason, false);
    };
    cb.on_failure = [this, attempt](const std::string& error) {
        onDisconnected(attempt, error, true);
    };
    return cb;
}

void RemoteControlChannel::onOpen(uint64_t attempt) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (attempt != attempt_id_) return;
    state_ = ConnectionState::Connected;
    stale_replies_ = 0;
    resolveConnectLocked(true);
    DPLOG_INFO(TAG, "Connected");
}

void RemoteControlChannel::onDisconnected(uint64_t attempt, const std::string& why, bool failure) {
    std::shared_ptr<ScreenshotSlot> slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (attempt != attempt_id_) return;
        if (failure) {
            DPLOG_ERROR(TAG, "Connection failed: %s", why.c_str());
            last_error_ = ConnectionError(why, state_ == ConnectionState::Connecting
                                                   ? ConnectionError::Kind::Refused
                                                   : ConnectionError::Kind::Other);
        } else {
            DPLOG_INFO(TAG, "Connection closed: %s", why.c_str());
            last_error_ = ConnectionError(why, ConnectionError::Kind::Closed);
        }
        state_ = ConnectionState::Disconnected;
        resolveConnectLocked(false);
        display_id_.reset();
        stale_replies_ = 0;
        slot = takeSlotLocked();
    }
    display_cv_.notify_all();
    if (slot) slot->promise.set_value(std::nullopt);
}

bool RemoteControlChannel::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == ConnectionState::Connected;
}

RemoteControlChannel::ConnectionState RemoteControlChannel::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<int> RemoteControlChannel::displayId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return display_id_;
}

std::optional<ConnectionError> RemoteControlChannel::lastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

std::pair<int, int> RemoteControlChannel::videoSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {video_width_, video_height_};
}

void RemoteControlChannel::setVideoCallback(VideoCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    video_cb_ = std::move(cb);
}

void RemoteControlChannel::setDisplaySizeCallback(DisplaySizeCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_cb_ = std::move(cb);
}

// -----------------------------------------------------------------------------
// Outbound
// -----------------------------------------------------------------------------

bool RemoteControlChannel::send(const std::string& command) {
    if (command.find('\n') != std::string::npos) {
        DPLOG_ERROR(TAG, "Refusing multi-line command");
        return false;
    }
    std::shared_ptr<Transport> t;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ConnectionState::Connected || !transport_) {
            DPLOG_WARN(TAG, "Not connected, dropping: %s", command.c_str());
            last_error_ = ConnectionError("not connected", ConnectionError::Kind::NotConnected);
            return false;
        }
        t = transport_;
    }
    DPLOG_DEBUG(TAG, "send: %s", command.c_str());
    return t->sendText(command);
}

bool RemoteControlChannel::tap(int x, int y) {
    return send("TAP " + std::to_string(x) + " " + std::to_string(y));
}

bool RemoteControlChannel::swipe(int x1, int y1, int x2, int y2, int duration_ms) {
    return send("SWIPE " + std::to_string(x1) + " " + std::to_string(y1) + " " +
                std::to_string(x2) + " " + std::to_string(y2) + " " +
                std::to_string(duration_ms));
}

bool RemoteControlChannel::key(int keycode) {
    return send("KEY " + std::to_string(keycode));
}

bool RemoteControlChannel::launchApp(const std::string& package) {
    return send("LAUNCH_APP " + package);
}

bool RemoteControlChannel::touchDown(int x, int y) {
    return send("TOUCH_DOWN " + std::to_string(x) + " " + std::to_string(y));
}

bool RemoteControlChannel::touchMove(int x, int y) {
    return send("TOUCH_MOVE " + std::to_string(x) + " " + std::to_string(y));
}

bool RemoteControlChannel::touchUp(int x, int y) {
    return send("TOUCH_UP " + std::to_string(x) + " " + std::to_string(y));
}

bool RemoteControlChannel::ensureDisplay(int width, int height, int dpi,
                                         std::optional<int> bitrate_kbps) {
    if (!ensureConnected()) return false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (display_id_) return true;
    }

    std::string cmd = "CREATE_DISPLAY " + std::to_string(width) + " " +
                      std::to_string(height) + " " + std::to_string(dpi);
    if (bitrate_kbps) cmd += " " + std::to_string(*bitrate_kbps);
    DPLOG_INFO(TAG, "Creating virtual display: %s", cmd.c_str());
    if (!send(cmd)) return false;

    std::unique_lock<std::mutex> lock(mutex_);
    bool acked = display_cv_.wait_for(
        lock, std::chrono::milliseconds(options_.display_ack_timeout_ms), [this] {
            return display_id_.has_value() || state_ != ConnectionState::Connected;
        });
    if (state_ != ConnectionState::Connected) return false;
    if (!acked || !display_id_) {
        DPLOG_WARN(TAG, "No DISPLAY_CREATED within %d ms", options_.display_ack_timeout_ms);
    }
    return true;
}

// -----------------------------------------------------------------------------
// Screenshots
// -----------------------------------------------------------------------------

std::shared_ptr<RemoteControlChannel::ScreenshotSlot> RemoteControlChannel::takeSlotLocked() {
    std::shared_ptr<ScreenshotSlot> slot = std::move(pending_screenshot_);
    pending_screenshot_.reset();
    return slot;
}

void RemoteControlChannel::abandonSlotLocked(ScreenshotSlot& slot) {
    slot.abandoned = true;
    if (slot.sent) ++stale_replies_;
}

bool RemoteControlChannel::clearSlot(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pending_screenshot_ || pending_screenshot_->id != id) return false;
    abandonSlotLocked(*pending_screenshot_);
    pending_screenshot_.reset();
    return true;
}

std::optional<std::vector<uint8_t>> RemoteControlChannel::requestScreenshot() {
    return requestScreenshot(std::chrono::milliseconds(options_.screenshot_timeout_ms));
}

std::optional<std::vector<uint8_t>> RemoteControlChannel::requestScreenshot(
        std::chrono::milliseconds timeout) {
    if (!ensureConnected()) {
        DPLOG_WARN(TAG, "Not connected, cannot take screenshot");
        return std::nullopt;
    }

    auto slot = std::make_shared<ScreenshotSlot>();
    auto fut = slot->promise.get_future();
    std::shared_ptr<ScreenshotSlot> superseded;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        slot->id = ++next_slot_id_;
        superseded = takeSlotLocked();
        if (superseded) abandonSlotLocked(*superseded);
        pending_screenshot_ = slot;
    }
    if (superseded) {
        DPLOG_WARN(TAG, "Screenshot request %llu superseded",
                   static_cast<unsigned long long>(superseded->id));
        superseded->promise.set_value(std::nullopt);
    }

    if (!send("SCREENSHOT")) {
        if (!clearSlot(slot->id)) return fut.get();
        return std::nullopt;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        slot->sent = true;
        // Superseded while the command was in flight
        if (slot->abandoned) ++stale_replies_;
    }

    if (fut.wait_for(timeout) != std::future_status::ready) {
        // A reply that raced the timeout already owns the promise
        if (!clearSlot(slot->id)) return fut.get();
        DPLOG_WARN(TAG, "Screenshot timed out after %lld ms",
                   static_cast<long long>(timeout.count()));
        return std::nullopt;
    }
    return fut.get();
}

// -----------------------------------------------------------------------------
// Inbound
// -----------------------------------------------------------------------------

void RemoteControlChannel::onText(uint64_t attempt, const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (attempt != attempt_id_) return;
    }
    size_t start = 0;
    while (start <= text.size()) {
        size_t nl = text.find('\n', start);
        std::string line = text.substr(start, nl == std::string::npos ? std::string::npos
                                                                       : nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) handleLine(line);
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
}

void RemoteControlChannel::handleLine(const std::string& line) {
    if (util::startsWith(line, PREFIX_DISPLAY_CREATED)) {
        auto id = parseInt(line.substr(std::char_traits<char>::length(PREFIX_DISPLAY_CREATED)));
        if (!id) {
            ProtocolError err("bad display id: " + line);
            DPLOG_WARN(TAG, "%s", err.message.c_str());
            return;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            display_id_ = id;
        }
        display_cv_.notify_all();
        DPLOG_INFO(TAG, "Virtual display created: %d", *id);
        return;
    }

    if (util::startsWith(line, PREFIX_DISPLAY_SIZE)) {
        auto parts = util::splitWhitespace(
            line.substr(std::char_traits<char>::length(PREFIX_DISPLAY_SIZE)));
        std::optional<int> w, h;
        if (parts.size() >= 2) {
            w = parseInt(parts[0]);
            h = parseInt(parts[1]);
        }
        if (!w || !h) {
            ProtocolError err("bad display size: " + line);
            DPLOG_WARN(TAG, "%s", err.message.c_str());
            return;
        }
        DisplaySizeCallback cb;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            video_width_ = *w;
            video_height_ = *h;
            cb = size_cb_;
        }
        DPLOG_DEBUG(TAG, "Display size %dx%d", *w, *h);
        if (cb) cb(*w, *h);
        return;
    }

    if (util::startsWith(line, PREFIX_SCREENSHOT_DATA)) {
        auto bytes = util::base64Decode(
            line.substr(std::char_traits<char>::length(PREFIX_SCREENSHOT_DATA)));
        if (!bytes) DPLOG_ERROR(TAG, "Screenshot payload is not valid base64");
        std::shared_ptr<ScreenshotSlot> slot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stale_replies_ > 0) {
                --stale_replies_;
                DPLOG_DEBUG(TAG, "Late reply to an abandoned screenshot request, dropped");
                return;
            }
            slot = takeSlotLocked();
        }
        if (!slot) {
            DPLOG_DEBUG(TAG, "Screenshot reply with no pending request, dropped");
            return;
        }
        slot->promise.set_value(std::move(bytes));
        return;
    }

    if (util::startsWith(line, PREFIX_SCREENSHOT_ERROR)) {
        DPLOG_ERROR(TAG, "Screenshot error: %s", line.c_str());
        std::shared_ptr<ScreenshotSlot> slot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stale_replies_ > 0) {
                --stale_replies_;
                return;
            }
            slot = takeSlotLocked();
        }
        if (slot) slot->promise.set_value(std::nullopt);
        return;
    }

    DPLOG_DEBUG(TAG, "[server] %s", line.c_str());
}

void RemoteControlChannel::onBinary(uint64_t attempt, std::vector<uint8_t> data) {
    VideoCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (attempt != attempt_id_) return;
        cb = video_cb_;
    }
    if (cb) cb(data);
}

// -----------------------------------------------------------------------------
// Shutdown
// -----------------------------------------------------------------------------

void RemoteControlChannel::shutdown() {
    std::shared_ptr<Transport> t;
    std::shared_ptr<ScreenshotSlot> slot;
    bool was_connected = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        was_connected = state_ == ConnectionState::Connected;
        t = std::move(transport_);
        transport_.reset();
        state_ = ConnectionState::Disconnected;
        resolveConnectLocked(false);
        ++attempt_id_;  // late callbacks from `t` are ignored from here on
        display_id_.reset();
        video_width_ = 0;
        video_height_ = 0;
        stale_replies_ = 0;
        slot = takeSlotLocked();
    }
    display_cv_.notify_all();
    if (slot) slot->promise.set_value(std::nullopt);
    if (!t) return;

    DPLOG_INFO(TAG, "Shutting down");
    try {
        if (was_connected && !t->sendText("DESTROY_DISPLAY")) {
            DPLOG_DEBUG(TAG, "DESTROY_DISPLAY not delivered");
        }
        t->close(1000, "Client shutdown");
    } catch (const std::exception& e) {
        DPLOG_WARN(TAG, "Error during shutdown: %s", e.what());
    }
}

} // namespace droidpilot::remote
