#pragma once
// =============================================================================
// DroidPilot - WebSocket framing (RFC 6455, client side)
// =============================================================================
#include <cstdint>
#include <string>
#include <vector>

namespace droidpilot::remote {

enum class WsOpcode : uint8_t {
    Continuation = 0x0,
    Text = 0x1,
    Binary = 0x2,
    Close = 0x8,
    Ping = 0x9,
    Pong = 0xA
};

struct WsFrame {
    bool fin = true;
    WsOpcode opcode = WsOpcode::Text;
    bool masked = false;
    uint32_t mask_key = 0;
    std::vector<uint8_t> payload;  // always unmasked
};

class WsFrameCodec {
public:
    // Frames larger than this are rejected by decode()
    static constexpr uint64_t MAX_PAYLOAD = 64ull * 1024 * 1024;

    // Masks the payload when frame.masked (client -> server frames must be)
    static std::vector<uint8_t> encode(const WsFrame& frame);

    static std::vector<uint8_t> encodeText(const std::string& text, uint32_t mask_key);
    static std::vector<uint8_t> encodeClose(uint16_t code, uint32_t mask_key);
    static std::vector<uint8_t> encodePong(const std::vector<uint8_t>& payload, uint32_t mask_key);

    // Returns bytes consumed, 0 if more data is needed, -1 on a protocol error
    static int decode(const uint8_t* data, size_t len, WsFrame& out_frame);

    // Close frame payload -> status code (1005 when absent)
    static uint16_t closeCode(const WsFrame& frame);

    static uint32_t randomMaskKey();

private:
    static void applyMask(uint8_t* data, size_t len, uint32_t mask_key);
};

class WsHandshake {
public:
    // 16 random bytes, base64
    static std::string makeKey();

    static std::string buildRequest(const std::string& host, int port,
                                    const std::string& path, const std::string& key);

    // Checks the status line of the server reply for 101. `header` is
    // everything up to and including the blank line.
    static bool checkResponse(const std::string& header, std::string& error);
};

} // namespace droidpilot::remote
