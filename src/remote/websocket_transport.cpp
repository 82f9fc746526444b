// =============================================================================
// DroidPilot - WebSocket client transport
// =============================================================================
#include "websocket_transport.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "../droidpilot_log.hpp"

namespace droidpilot::remote {

namespace {

constexpr const char* TAG = "ws";
constexpr size_t RECV_BUF_SIZE = 64 * 1024;
constexpr size_t MAX_HANDSHAKE_BYTES = 16 * 1024;

void setRecvTimeout(int fd, int timeout_ms) {
    struct timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

} // namespace

WebSocketTransport::WebSocketTransport(Endpoint endpoint) : endpoint_(std::move(endpoint)) {}

WebSocketTransport::~WebSocketTransport() {
    close(1001, "going away");
    if (thread_.joinable()) {
        if (thread_.get_id() == std::this_thread::get_id()) {
            DPLOG_ERROR(TAG, "Transport destroyed from its own reader thread");
            thread_.detach();
        } else {
            thread_.join();
        }
    }
}

TransportFactory WebSocketTransport::factory(Endpoint endpoint) {
    return [endpoint]() -> std::unique_ptr<Transport> {
        return std::make_unique<WebSocketTransport>(endpoint);
    };
}

void WebSocketTransport::open(TransportCallbacks callbacks) {
    if (thread_.joinable()) {
        DPLOG_WARN(TAG, "open() called twice on one transport");
        return;
    }
    callbacks_ = std::move(callbacks);
    thread_ = std::thread(&WebSocketTransport::run, this);
}

bool WebSocketTransport::sendText(const std::string& text) {
    if (!open_.load() || closing_.load()) return false;
    return sendRaw(WsFrameCodec::encodeText(text, WsFrameCodec::randomMaskKey()));
}

void WebSocketTransport::close(int code, const std::string& reason) {
    if (closing_.exchange(true)) return;
    close_code_ = code;
    int fd = fd_.load();
    if (fd < 0) return;
    if (open_.load()) {
        if (!sendRaw(WsFrameCodec::encodeClose(static_cast<uint16_t>(code),
                                                WsFrameCodec::randomMaskKey()))) {
            DPLOG_DEBUG(TAG, "Close frame not sent");
        }
    }
    DPLOG_INFO(TAG, "Closing (%d %s)", code, reason.c_str());
    // Unblocks the reader's recv()
    shutdown(fd, SHUT_RDWR);
}

bool WebSocketTransport::sendRaw(const std::vector<uint8_t>& bytes) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    int fd = fd_.load();
    if (fd < 0) return false;
    size_t sent = 0;
    while (sent < bytes.size()) {
        ssize_t n = ::send(fd, bytes.data() + sent, bytes.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            DPLOG_WARN(TAG, "send() failed: %s", strerror(errno));
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

void WebSocketTransport::fireClosed(int code, const std::string& reason) {
    if (terminal_fired_.exchange(true)) return;
    if (callbacks_.on_closed) callbacks_.on_closed(code, reason);
}

void WebSocketTransport::fireFailure(const std::string& error) {
    if (terminal_fired_.exchange(true)) return;
    if (callbacks_.on_failure) callbacks_.on_failure(error);
}

// -----------------------------------------------------------------------------
// Reader thread
// -----------------------------------------------------------------------------

void WebSocketTransport::run() {
    std::string error;
    if (!connectSocket(error) || !handshake(error)) {
        DPLOG_WARN(TAG, "Connect to %s:%d failed: %s",
                   endpoint_.host.c_str(), endpoint_.port, error.c_str());
        int fd = fd_.exchange(-1);
        if (fd >= 0) ::close(fd);
        fireFailure(error);
        return;
    }

    open_ = true;
    DPLOG_INFO(TAG, "Connected to ws://%s:%d%s",
               endpoint_.host.c_str(), endpoint_.port, endpoint_.path.c_str());
    if (callbacks_.on_open) callbacks_.on_open();

    readLoop();

    open_ = false;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        int fd = fd_.exchange(-1);
        if (fd >= 0) ::close(fd);
    }
}

bool WebSocketTransport::connectSocket(std::string& error) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    const std::string port = std::to_string(endpoint_.port);
    int rc = getaddrinfo(endpoint_.host.c_str(), port.c_str(), &hints, &res);
    if (rc != 0 || !res) {
        error = std::string("resolve failed: ") + gai_strerror(rc);
        return false;
    }

    int fd = socket(res->ai_family, res->ai_socktype, res->ai_protocol);
    if (fd < 0) {
        error = std::string("socket() failed: ") + strerror(errno);
        freeaddrinfo(res);
        return false;
    }
    fd_ = fd;

    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    rc = ::connect(fd, res->ai_addr, res->ai_addrlen);
    freeaddrinfo(res);
    if (rc < 0 && errno != EINPROGRESS) {
        error = std::string("connect() failed: ") + strerror(errno);
        return false;
    }
    if (rc < 0) {
        struct pollfd pfd{fd, POLLOUT, 0};
        int ready = poll(&pfd, 1, endpoint_.connect_timeout_ms);
        if (ready == 0) {
            error = "connect timed out";
            return false;
        }
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
        if (ready < 0 || so_error != 0) {
            error = std::string("connect() failed: ") + strerror(so_error ? so_error : errno);
            return false;
        }
    }
    fcntl(fd, F_SETFL, flags);

    int one = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    if (closing_.load()) {
        error = "closed during connect";
        return false;
    }
    return true;
}

bool WebSocketTransport::handshake(std::string& error) {
    const int fd = fd_.load();
    const std::string key = WsHandshake::makeKey();
    const std::string request =
        WsHandshake::buildRequest(endpoint_.host, endpoint_.port, endpoint_.path, key);
    if (!sendRaw(std::vector<uint8_t>(request.begin(), request.end()))) {
        error = "handshake send failed";
        return false;
    }

    setRecvTimeout(fd, endpoint_.connect_timeout_ms);
    std::string header;
    char buf[1024];
    size_t header_end = std::string::npos;
    while (header_end == std::string::npos) {
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) {
            if (n < 0 && errno == EINTR) continue;
            error = n == 0 ? "closed during handshake"
                           : std::string("handshake recv failed: ") + strerror(errno);
            return false;
        }
        header.append(buf, static_cast<size_t>(n));
        header_end = header.find("\r\n\r\n");
        if (header.size() > MAX_HANDSHAKE_BYTES) {
            error = "handshake reply too large";
            return false;
        }
    }
    setRecvTimeout(fd, 0);

    if (!WsHandshake::checkResponse(header.substr(0, header_end + 4), error)) return false;

    // Frames that arrived together with the reply
    rx_.assign(header.begin() + static_cast<std::ptrdiff_t>(header_end + 4), header.end());
    return true;
}

void WebSocketTransport::readLoop() {
    std::vector<uint8_t> buf(RECV_BUF_SIZE);
    for (;;) {
        // Drain complete frames first
        for (;;) {
            WsFrame frame;
            int consumed = WsFrameCodec::decode(rx_.data(), rx_.size(), frame);
            if (consumed < 0) {
                DPLOG_ERROR(TAG, "Protocol error in incoming frame");
                close(1002, "protocol error");
                fireFailure("protocol error");
                return;
            }
            if (consumed == 0) break;
            rx_.erase(rx_.begin(), rx_.begin() + consumed);
            if (!handleFrame(frame)) return;
        }

        ssize_t n = recv(fd_.load(), buf.data(), buf.size(), 0);
        if (n > 0) {
            rx_.insert(rx_.end(), buf.begin(), buf.begin() + n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;

        if (closing_.load()) {
            fireClosed(close_code_.load(), "closed locally");
        } else if (n == 0) {
            DPLOG_WARN(TAG, "Peer closed the connection without a close frame");
            fireFailure("connection closed by peer");
        } else {
            DPLOG_WARN(TAG, "recv() failed: %s", strerror(errno));
            fireFailure(std::string("recv failed: ") + strerror(errno));
        }
        return;
    }
}

bool WebSocketTransport::handleFrame(WsFrame& frame) {
    switch (frame.opcode) {
        case WsOpcode::Ping:
            if (!sendRaw(WsFrameCodec::encodePong(frame.payload, WsFrameCodec::randomMaskKey()))) {
                DPLOG_DEBUG(TAG, "Pong not sent");
            }
            return true;
        case WsOpcode::Pong:
            return true;
        case WsOpcode::Close: {
            int code = WsFrameCodec::closeCode(frame);
            std::string reason;
            if (frame.payload.size() > 2) reason.assign(frame.payload.begin() + 2, frame.payload.end());
            DPLOG_INFO(TAG, "Server closed (%d %s)", code, reason.c_str());
            if (!closing_.exchange(true)) {
                const uint16_t echo = static_cast<uint16_t>(code == 1005 ? 1000 : code);
                if (!sendRaw(WsFrameCodec::encodeClose(echo, WsFrameCodec::randomMaskKey()))) {
                    DPLOG_DEBUG(TAG, "Close reply not sent");
                }
            }
            fireClosed(code, reason);
            return false;
        }
        case WsOpcode::Text:
        case WsOpcode::Binary:
            message_opcode_ = frame.opcode;
            message_ = std::move(frame.payload);
            break;
        case WsOpcode::Continuation:
            message_.insert(message_.end(), frame.payload.begin(), frame.payload.end());
            break;
    }

    if (!frame.fin) return true;

    if (message_opcode_ == WsOpcode::Text) {
        if (callbacks_.on_text) callbacks_.on_text(std::string(message_.begin(), message_.end()));
    } else if (callbacks_.on_binary) {
        callbacks_.on_binary(std::move(message_));
    }
    message_.clear();
    return true;
}

} // namespace droidpilot::remote
