#pragma once
// =============================================================================
// DroidPilot - Base64 (RFC 4648, standard alphabet)
// =============================================================================
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace droidpilot::util {

static constexpr const char* BASE64_TABLE =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

inline std::string base64Encode(const uint8_t* data, size_t len) {
    std::string result;
    result.reserve((len + 2) / 3 * 4);

    for (size_t i = 0; i < len; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < len) n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < len) n |= static_cast<uint32_t>(data[i + 2]);

        result.push_back(BASE64_TABLE[(n >> 18) & 0x3F]);
        result.push_back(BASE64_TABLE[(n >> 12) & 0x3F]);
        result.push_back((i + 1 < len) ? BASE64_TABLE[(n >> 6) & 0x3F] : '=');
        result.push_back((i + 2 < len) ? BASE64_TABLE[n & 0x3F] : '=');
    }
    return result;
}

inline std::string base64Encode(const std::vector<uint8_t>& data) {
    return base64Encode(data.data(), data.size());
}

// Whitespace (line-wrapped payloads) is skipped. Any other character outside
// the alphabet, bad padding, or a truncated quantum yields nullopt.
inline std::optional<std::vector<uint8_t>> base64Decode(const std::string& text) {
    auto value = [](char c) -> int {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '+') return 62;
        if (c == '/') return 63;
        return -1;
    };

    std::vector<uint8_t> out;
    out.reserve(text.size() / 4 * 3);
    uint32_t acc = 0;
    int count = 0;    // sextets in the current quantum
    int padding = 0;

    for (char c : text) {
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
        if (c == '=') {
            padding++;
            if (padding > 2 || count < 2) return std::nullopt;
            continue;
        }
        if (padding > 0) return std::nullopt;  // data after padding
        int v = value(c);
        if (v < 0) return std::nullopt;
        acc = (acc << 6) | static_cast<uint32_t>(v);
        if (++count == 4) {
            out.push_back(static_cast<uint8_t>((acc >> 16) & 0xFF));
            out.push_back(static_cast<uint8_t>((acc >> 8) & 0xFF));
            out.push_back(static_cast<uint8_t>(acc & 0xFF));
            acc = 0;
            count = 0;
        }
    }

    if (count == 1) return std::nullopt;
    if (padding > 0 && count + padding != 4) return std::nullopt;
    if (count == 2) {
        out.push_back(static_cast<uint8_t>((acc >> 4) & 0xFF));
    } else if (count == 3) {
        out.push_back(static_cast<uint8_t>((acc >> 10) & 0xFF));
        out.push_back(static_cast<uint8_t>((acc >> 2) & 0xFF));
    }
    return out;
}

} // namespace droidpilot::util
