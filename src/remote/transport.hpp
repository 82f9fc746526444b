#pragma once
// =============================================================================
// DroidPilot - Message transport to the virtual display server
// =============================================================================
// One Transport instance per connection attempt. Callbacks may run on the
// caller's thread (inside open()) or on the transport's reader thread.
// =============================================================================
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace droidpilot::remote {

struct TransportCallbacks {
    std::function<void()> on_open;
    std::function<void(const std::string& line)> on_text;
    std::function<void(std::vector<uint8_t> data)> on_binary;
    std::function<void(int code, const std::string& reason)> on_closed;
    std::function<void(const std::string& error)> on_failure;
};

class Transport {
public:
    virtual ~Transport() = default;

    // Starts connecting. Exactly one of on_open / on_failure follows.
    virtual void open(TransportCallbacks callbacks) = 0;
    virtual bool sendText(const std::string& text) = 0;
    // Best effort; never throws
    virtual void close(int code, const std::string& reason) = 0;
};

using TransportFactory = std::function<std::unique_ptr<Transport>()>;

} // namespace droidpilot::remote
