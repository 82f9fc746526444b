// =============================================================================
// DroidPilot - Result Type for Unified Error Handling
// =============================================================================
// A Result<T, E> type that encapsulates either a success value or an error.
// Parser, dispatcher, remote channel and decoder report failures through it
// instead of throwing across their public API.
//
// Usage:
//   Result<int, IoError> readPort(const std::string& s) {
//       if (s.empty()) return IoError("no port");
//       return std::stoi(s);
//   }
//
//   auto result = readPort(text);
//   if (result.is_ok()) {
//       use(result.value());
//   } else {
//       DPLOG_WARN("cfg", "%s", result.error().message.c_str());
//   }
// =============================================================================

#pragma once

#include <variant>
#include <string>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace droidpilot {

// =============================================================================
// Error Types
// =============================================================================

// Generic error with message
struct Error {
    std::string message;
    int code = 0;

    Error() = default;
    explicit Error(std::string msg, int c = 0) : message(std::move(msg)), code(c) {}
    explicit Error(const char* msg, int c = 0) : message(msg), code(c) {}

    bool operator==(const Error& other) const {
        return code == other.code && message == other.message;
    }
};

// Malformed action text. `raw` keeps the input for diagnostics.
struct ParseError : Error {
    std::string raw;

    ParseError() = default;
    ParseError(std::string msg, std::string raw_text)
        : Error(std::move(msg)), raw(std::move(raw_text)) {}
};

// Remote channel not connected, refused, closed or timed out
struct ConnectionError : Error {
    enum class Kind {
        NotConnected,
        Timeout,
        Refused,
        Closed,
        Other
    };
    Kind kind = Kind::Other;

    ConnectionError() = default;
    explicit ConnectionError(std::string msg, Kind k = Kind::Other)
        : Error(std::move(msg)), kind(k) {}
};

// Unexpected or malformed data from a peer
struct ProtocolError : Error {
    ProtocolError() = default;
    explicit ProtocolError(std::string msg, int c = 0) : Error(std::move(msg), c) {}
};

// Decoder construction / submission failure
struct DecodeError : Error {
    DecodeError() = default;
    explicit DecodeError(std::string msg, int av_err = 0) : Error(std::move(msg), av_err) {}
};

// IO error (file, process, network)
struct IoError : Error {
    enum class Kind {
        NotFound,
        PermissionDenied,
        ConnectionRefused,
        Timeout,
        Other
    };
    Kind kind = Kind::Other;

    IoError() = default;
    explicit IoError(std::string msg, Kind k = Kind::Other)
        : Error(std::move(msg)), kind(k) {}
};

// =============================================================================
// Result<T, E> Type
// =============================================================================

template<typename T, typename E = Error>
class Result {
public:
    // Success constructor
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}

    // Error constructor (from E or derived)
    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(std::in_place_index<1>, E(std::move(error))) {}

    // Check status
    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }

    explicit operator bool() const { return is_ok(); }

    // Access value (throws if error)
    T& value() & {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    const T& value() const& {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    T&& value() && {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(std::move(data_));
    }

    // Access error (throws if success)
    E& error() & {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<1>(data_);
    }

    const E& error() const& {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<1>(data_);
    }

    // Safe access with default
    T value_or(T default_value) const& {
        return is_ok() ? std::get<0>(data_) : std::move(default_value);
    }

    T value_or(T default_value) && {
        return is_ok() ? std::get<0>(std::move(data_)) : std::move(default_value);
    }

    // Optional-style access
    std::optional<T> ok() const& {
        if (is_ok()) return std::get<0>(data_);
        return std::nullopt;
    }

    // Map error
    template<typename F>
    auto map_err(F&& f) const& -> Result<T, decltype(f(std::declval<E>()))> {
        using U = decltype(f(std::declval<E>()));
        if (is_err()) return Result<T, U>(f(std::get<1>(data_)));
        return Result<T, U>(std::get<0>(data_));
    }

private:
    std::variant<T, E> data_;
};

// =============================================================================
// Result<void, E> Specialization
// =============================================================================

template<typename E>
class Result<void, E> {
public:
    // Success constructor
    Result() : data_(std::monostate{}) {}

    // Error constructor
    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(E(std::move(error))) {}

    bool is_ok() const { return std::holds_alternative<std::monostate>(data_); }
    bool is_err() const { return std::holds_alternative<E>(data_); }
    explicit operator bool() const { return is_ok(); }

    void value() const {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
    }

    E& error() & {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<E>(data_);
    }

    const E& error() const& {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<E>(data_);
    }

private:
    std::variant<std::monostate, E> data_;
};

// =============================================================================
// Macros for Early Return
// =============================================================================

// TRY macro: unwrap result or return error (GNU statement expression)
// Usage: auto value = DROIDPILOT_TRY(some_function());
#define DROIDPILOT_TRY(expr) \
    ({ \
        auto _result = (expr); \
        if (_result.is_err()) return _result.error(); \
        std::move(_result).value(); \
    })

} // namespace droidpilot
