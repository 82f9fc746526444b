#pragma once
// =============================================================================
// DroidPilot - adb argument validation
// =============================================================================
// Everything that ends up on an adb command line passes through here.
// Commands run through two shells (host popen, then the device's sh), so
// free text is quoted for both.
// =============================================================================

#include <cctype>
#include <cstring>
#include <string>

namespace droidpilot {
namespace security {

// Shell metacharacters never accepted in identifiers
constexpr const char* SHELL_METACHARACTERS = "|;&$`\\\"'<>(){}[]!#*?~\n\r ";

/**
 * Validate adb device serial format.
 * Valid: alphanumeric plus ':', '.', '-', '_' (USB serials and IP:port).
 */
inline bool isValidAdbId(const std::string& adb_id) {
    if (adb_id.empty() || adb_id.length() > 64) {
        return false;
    }
    for (char c : adb_id) {
        if (std::strchr(SHELL_METACHARACTERS, c) != nullptr) return false;
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != ':' && c != '.' && c != '-' && c != '_') {
            return false;
        }
    }
    return true;
}

// Android package id: letters, digits, '_' and '.', no leading/trailing '.'
inline bool isValidPackageName(const std::string& package) {
    if (package.empty() || package.length() > 255) return false;
    if (package.front() == '.' || package.back() == '.') return false;
    for (char c : package) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '_') {
            return false;
        }
    }
    return true;
}

// POSIX single-quote quoting: it's -> 'it'\''s'
inline std::string shellQuote(const std::string& arg) {
    std::string quoted;
    quoted.reserve(arg.size() + 2);
    quoted += '\'';
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

// `input text` treats %s as a space and rejects literal spaces
inline std::string escapeInputText(const std::string& text) {
    std::string out;
    out.reserve(text.size() + 8);
    for (char c : text) {
        if (c == ' ') {
            out += "%s";
        } else {
            out += c;
        }
    }
    return out;
}

inline bool isAscii(const std::string& text) {
    for (char c : text) {
        if (static_cast<unsigned char>(c) >= 0x80) return false;
    }
    return true;
}

} // namespace security
} // namespace droidpilot
