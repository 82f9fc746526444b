#pragma once
// =============================================================================
// DroidPilot - Action model
// =============================================================================
// Closed set of device actions decoded from model output. An Action is built
// once by ActionParser and never modified afterwards.
// =============================================================================
#include <string>
#include <variant>
#include <vector>

namespace droidpilot::agent {

struct Point {
    int x = 0;
    int y = 0;

    bool operator==(const Point& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Point& o) const { return !(*this == o); }
};

namespace actions {

struct Launch    { std::string app; };
struct Tap       { Point at; };
struct DoubleTap { Point at; };
struct LongPress { Point at; };
struct Type      { std::string text; };
struct Swipe     { Point from; Point to; int duration_ms = 300; };
struct Back      {};
struct Home      {};
struct Wait      { int duration_ms = 1000; };
struct TakeOver  { std::string message; };
struct Finish    { std::string message; };
// Inert variants: accepted so model vocabulary never fails to parse
struct Note      { std::string content; };
struct CallApi   { std::string payload; };
struct Interact  { std::string content; };
// Unrecognised action name; the dispatcher decides whether it is fatal
struct Unknown   { std::string name; std::string raw; };

inline bool operator==(const Launch& a, const Launch& b)       { return a.app == b.app; }
inline bool operator==(const Tap& a, const Tap& b)             { return a.at == b.at; }
inline bool operator==(const DoubleTap& a, const DoubleTap& b) { return a.at == b.at; }
inline bool operator==(const LongPress& a, const LongPress& b) { return a.at == b.at; }
inline bool operator==(const Type& a, const Type& b)           { return a.text == b.text; }
inline bool operator==(const Swipe& a, const Swipe& b) {
    return a.from == b.from && a.to == b.to && a.duration_ms == b.duration_ms;
}
inline bool operator==(const Back&, const Back&)               { return true; }
inline bool operator==(const Home&, const Home&)               { return true; }
inline bool operator==(const Wait& a, const Wait& b)           { return a.duration_ms == b.duration_ms; }
inline bool operator==(const TakeOver& a, const TakeOver& b)   { return a.message == b.message; }
inline bool operator==(const Finish& a, const Finish& b)       { return a.message == b.message; }
inline bool operator==(const Note& a, const Note& b)           { return a.content == b.content; }
inline bool operator==(const CallApi& a, const CallApi& b)     { return a.payload == b.payload; }
inline bool operator==(const Interact& a, const Interact& b)   { return a.content == b.content; }
inline bool operator==(const Unknown& a, const Unknown& b)     { return a.name == b.name && a.raw == b.raw; }

} // namespace actions

// Order matches the variant alternatives below
enum class ActionKind {
    Launch = 0,
    Tap,
    DoubleTap,
    LongPress,
    Type,
    Swipe,
    Back,
    Home,
    Wait,
    TakeOver,
    Finish,
    Note,
    CallApi,
    Interact,
    Unknown
};

using ActionPayload = std::variant<
    actions::Launch,
    actions::Tap,
    actions::DoubleTap,
    actions::LongPress,
    actions::Type,
    actions::Swipe,
    actions::Back,
    actions::Home,
    actions::Wait,
    actions::TakeOver,
    actions::Finish,
    actions::Note,
    actions::CallApi,
    actions::Interact,
    actions::Unknown>;

class Action {
public:
    Action(ActionPayload payload, bool sensitive = false, std::string message = {},
           std::string source = {})
        : payload_(std::move(payload)),
          sensitive_(sensitive),
          message_(std::move(message)),
          source_(std::move(source)) {}

    ActionKind kind() const { return static_cast<ActionKind>(payload_.index()); }
    const ActionPayload& payload() const { return payload_; }

    template<typename T>
    const T* as() const { return std::get_if<T>(&payload_); }

    template<typename T>
    bool is() const { return std::holds_alternative<T>(payload_); }

    bool sensitive() const { return sensitive_; }
    // Confirmation text attached by the model (`message=` parameter)
    const std::string& message() const { return message_; }
    // Sensitive flag plus a non-empty message
    bool requiresConfirmation() const { return sensitive_ && !message_.empty(); }

    // Text the action was parsed from (diagnostics only, not compared)
    const std::string& source() const { return source_; }

    bool isFinish() const { return is<actions::Finish>(); }

    bool operator==(const Action& o) const {
        return payload_ == o.payload_ && sensitive_ == o.sensitive_ && message_ == o.message_;
    }
    bool operator!=(const Action& o) const { return !(*this == o); }

private:
    ActionPayload payload_;
    bool sensitive_ = false;
    std::string message_;
    std::string source_;
};

const char* kindName(ActionKind kind);

// Canonical model-facing form: do(tap, element=[x,y]), finish("done"), ...
std::string toCommandString(const Action& action);

} // namespace droidpilot::agent
