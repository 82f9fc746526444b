#pragma once
// =============================================================================
// DroidPilot - WebSocket client transport (POSIX sockets)
// =============================================================================
// Connects to ws://host:port/path, performs the upgrade handshake and runs a
// reader thread that reassembles fragmented messages, answers pings and
// delivers text / binary messages to the callbacks.
//
// Do not destroy the transport from inside one of its own callbacks.
// =============================================================================
#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "transport.hpp"
#include "ws_frame.hpp"

namespace droidpilot::remote {

class WebSocketTransport : public Transport {
public:
    struct Endpoint {
        std::string host = "127.0.0.1";
        int port = 8986;
        std::string path = "/";
        int connect_timeout_ms = 5000;
    };

    explicit WebSocketTransport(Endpoint endpoint);
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    void open(TransportCallbacks callbacks) override;
    bool sendText(const std::string& text) override;
    void close(int code, const std::string& reason) override;

    static TransportFactory factory(Endpoint endpoint);

private:
    void run();
    bool connectSocket(std::string& error);
    bool handshake(std::string& error);
    void readLoop();
    bool handleFrame(WsFrame& frame);
    bool sendRaw(const std::vector<uint8_t>& bytes);

    void fireClosed(int code, const std::string& reason);
    void fireFailure(const std::string& error);

    Endpoint endpoint_;
    TransportCallbacks callbacks_;

    std::atomic<int> fd_{-1};
    std::mutex write_mutex_;
    std::thread thread_;

    std::atomic<bool> open_{false};
    std::atomic<bool> closing_{false};
    std::atomic<bool> terminal_fired_{false};
    std::atomic<int> close_code_{1000};

    std::vector<uint8_t> rx_;
    std::vector<uint8_t> message_;  // fragments of the current message
    WsOpcode message_opcode_ = WsOpcode::Text;
};

} // namespace droidpilot::remote
