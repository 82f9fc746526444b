// =============================================================================
// DroidPilot - WebSocket framing
// =============================================================================
#include "ws_frame.hpp"

#include <cstring>
#include <random>
#include <sstream>

#include "../util/base64.hpp"
#include "../util/string_util.hpp"

namespace droidpilot::remote {

namespace {

std::mt19937& rng() {
    thread_local std::mt19937 gen{std::random_device{}()};
    return gen;
}

bool isControl(WsOpcode op) {
    return (static_cast<uint8_t>(op) & 0x08) != 0;
}

bool isKnownOpcode(uint8_t op) {
    return op == 0x0 || op == 0x1 || op == 0x2 || op == 0x8 || op == 0x9 || op == 0xA;
}

} // namespace

std::vector<uint8_t> WsFrameCodec::encode(const WsFrame& frame) {
    std::vector<uint8_t> result;
    const size_t payload_len = frame.payload.size();
    result.reserve(payload_len + 14);

    result.push_back(static_cast<uint8_t>((frame.fin ? 0x80 : 0x00) |
                                          static_cast<uint8_t>(frame.opcode)));

    const uint8_t mask_bit = frame.masked ? 0x80 : 0x00;
    if (payload_len <= 125) {
        result.push_back(mask_bit | static_cast<uint8_t>(payload_len));
    } else if (payload_len <= 65535) {
        result.push_back(mask_bit | 126);
        result.push_back((payload_len >> 8) & 0xFF);
        result.push_back(payload_len & 0xFF);
    } else {
        result.push_back(mask_bit | 127);
        for (int i = 7; i >= 0; --i) {
            result.push_back((static_cast<uint64_t>(payload_len) >> (i * 8)) & 0xFF);
        }
    }

    if (frame.masked) {
        result.push_back((frame.mask_key >> 24) & 0xFF);
        result.push_back((frame.mask_key >> 16) & 0xFF);
        result.push_back((frame.mask_key >> 8) & 0xFF);
        result.push_back(frame.mask_key & 0xFF);
    }

    const size_t offset = result.size();
    result.insert(result.end(), frame.payload.begin(), frame.payload.end());
    if (frame.masked && payload_len > 0) {
        applyMask(result.data() + offset, payload_len, frame.mask_key);
    }
    return result;
}

std::vector<uint8_t> WsFrameCodec::encodeText(const std::string& text, uint32_t mask_key) {
    WsFrame frame;
    frame.opcode = WsOpcode::Text;
    frame.masked = true;
    frame.mask_key = mask_key;
    frame.payload.assign(text.begin(), text.end());
    return encode(frame);
}

std::vector<uint8_t> WsFrameCodec::encodeClose(uint16_t code, uint32_t mask_key) {
    WsFrame frame;
    frame.opcode = WsOpcode::Close;
    frame.masked = true;
    frame.mask_key = mask_key;
    frame.payload.push_back((code >> 8) & 0xFF);
    frame.payload.push_back(code & 0xFF);
    return encode(frame);
}

std::vector<uint8_t> WsFrameCodec::encodePong(const std::vector<uint8_t>& payload,
                                              uint32_t mask_key) {
    WsFrame frame;
    frame.opcode = WsOpcode::Pong;
    frame.masked = true;
    frame.mask_key = mask_key;
    frame.payload = payload;
    return encode(frame);
}

int WsFrameCodec::decode(const uint8_t* data, size_t len, WsFrame& out_frame) {
    if (len < 2) return 0;

    size_t pos = 0;
    if (data[pos] & 0x70) return -1;  // RSV bits without a negotiated extension
    const uint8_t op = data[pos] & 0x0F;
    if (!isKnownOpcode(op)) return -1;
    out_frame.fin = (data[pos] & 0x80) != 0;
    out_frame.opcode = static_cast<WsOpcode>(op);
    pos++;

    out_frame.masked = (data[pos] & 0x80) != 0;
    uint64_t payload_len = data[pos] & 0x7F;
    pos++;

    if (payload_len == 126) {
        if (len < pos + 2) return 0;
        payload_len = (static_cast<uint64_t>(data[pos]) << 8) | data[pos + 1];
        pos += 2;
    } else if (payload_len == 127) {
        if (len < pos + 8) return 0;
        payload_len = 0;
        for (int i = 0; i < 8; ++i) {
            payload_len = (payload_len << 8) | data[pos + i];
        }
        pos += 8;
    }

    if (isControl(out_frame.opcode) && (payload_len > 125 || !out_frame.fin)) return -1;
    if (payload_len > MAX_PAYLOAD) return -1;

    if (out_frame.masked) {
        if (len < pos + 4) return 0;
        out_frame.mask_key = (static_cast<uint32_t>(data[pos]) << 24) |
                             (static_cast<uint32_t>(data[pos + 1]) << 16) |
                             (static_cast<uint32_t>(data[pos + 2]) << 8) |
                             data[pos + 3];
        pos += 4;
    }

    if (len < pos + payload_len) return 0;

    out_frame.payload.resize(payload_len);
    if (payload_len > 0) {
        std::memcpy(out_frame.payload.data(), data + pos, payload_len);
    }
    if (out_frame.masked && payload_len > 0) {
        applyMask(out_frame.payload.data(), payload_len, out_frame.mask_key);
    }

    return static_cast<int>(pos + payload_len);
}

uint16_t WsFrameCodec::closeCode(const WsFrame& frame) {
    if (frame.payload.size() < 2) return 1005;
    return static_cast<uint16_t>((frame.payload[0] << 8) | frame.payload[1]);
}

uint32_t WsFrameCodec::randomMaskKey() {
    return static_cast<uint32_t>(rng()());
}

void WsFrameCodec::applyMask(uint8_t* data, size_t len, uint32_t mask_key) {
    const uint8_t mask[4] = {
        static_cast<uint8_t>((mask_key >> 24) & 0xFF),
        static_cast<uint8_t>((mask_key >> 16) & 0xFF),
        static_cast<uint8_t>((mask_key >> 8) & 0xFF),
        static_cast<uint8_t>(mask_key & 0xFF)
    };
    for (size_t i = 0; i < len; ++i) {
        data[i] ^= mask[i % 4];
    }
}

// -----------------------------------------------------------------------------
// Handshake
// -----------------------------------------------------------------------------

std::string WsHandshake::makeKey() {
    uint8_t nonce[16];
    for (auto& b : nonce) b = static_cast<uint8_t>(rng()() & 0xFF);
    return util::base64Encode(nonce, sizeof(nonce));
}

std::string WsHandshake::buildRequest(const std::string& host, int port,
                                      const std::string& path, const std::string& key) {
    std::ostringstream req;
    req << "GET " << (path.empty() ? "/" : path) << " HTTP/1.1\r\n";
    req << "Host: " << host << ":" << port << "\r\n";
    req << "Upgrade: websocket\r\n";
    req << "Connection: Upgrade\r\n";
    req << "Sec-WebSocket-Key: " << key << "\r\n";
    req << "Sec-WebSocket-Version: 13\r\n";
    req << "\r\n";
    return req.str();
}

bool WsHandshake::checkResponse(const std::string& header, std::string& error) {
    size_t eol = header.find("\r\n");
    std::string status = util::trim(header.substr(0, eol));
    // "HTTP/1.1 101 Switching Protocols"
    size_t sp = status.find(' ');
    if (!util::startsWith(status, "HTTP/") || sp == std::string::npos) {
        error = "malformed handshake reply: " + status;
        return false;
    }
    std::string code = status.substr(sp + 1, 3);
    if (code != "101") {
        error = "handshake rejected: " + status;
        return false;
    }
    return true;
}

} // namespace droidpilot::remote
