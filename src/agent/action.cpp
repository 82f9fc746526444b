// =============================================================================
// DroidPilot - Action model (names, canonical serialisation)
// =============================================================================
#include "action.hpp"

#include <sstream>

namespace droidpilot::agent {

namespace {

// Prefer double quotes; fall back to single quotes when the text has a '"'
// and no '\''. Backslashes and the chosen quote are escaped.
std::string quote(const std::string& s) {
    const char q = (s.find('"') != std::string::npos && s.find('\'') == std::string::npos)
        ? '\'' : '"';
    std::string out;
    out.reserve(s.size() + 2);
    out += q;
    for (char c : s) {
        if (c == '\\' || c == q) out += '\\';
        out += c;
    }
    out += q;
    return out;
}

std::string point(const Point& p) {
    return "[" + std::to_string(p.x) + "," + std::to_string(p.y) + "]";
}

std::string durationText(int ms) {
    if (ms % 1000 == 0) return std::to_string(ms / 1000) + " seconds";
    return std::to_string(ms) + " ms";
}

struct CommandWriter {
    std::ostringstream& os;

    void operator()(const actions::Launch& a)    { os << "do(launch, app=" << quote(a.app); }
    void operator()(const actions::Tap& a)       { os << "do(tap, element=" << point(a.at); }
    void operator()(const actions::DoubleTap& a) { os << "do(double_tap, element=" << point(a.at); }
    void operator()(const actions::LongPress& a) { os << "do(long_press, element=" << point(a.at); }
    void operator()(const actions::Type& a)      { os << "do(type, text=" << quote(a.text); }
    void operator()(const actions::Swipe& a) {
        os << "do(swipe, start=" << point(a.from) << ", end=" << point(a.to)
           << ", duration=" << a.duration_ms;
    }
    void operator()(const actions::Back&)        { os << "do(back"; }
    void operator()(const actions::Home&)        { os << "do(home"; }
    void operator()(const actions::Wait& a)      { os << "do(wait, duration=" << quote(durationText(a.duration_ms)); }
    void operator()(const actions::TakeOver& a) {
        os << "do(take_over";
        if (!a.message.empty()) os << ", message=" << quote(a.message);
    }
    void operator()(const actions::Finish& a)    { os << "finish(" << quote(a.message); }
    void operator()(const actions::Note& a)      { os << "do(note, content=" << quote(a.content); }
    void operator()(const actions::CallApi& a)   { os << "do(call_api, instruction=" << quote(a.payload); }
    void operator()(const actions::Interact& a) {
        os << "do(interact";
        if (!a.content.empty()) os << ", content=" << quote(a.content);
    }
    void operator()(const actions::Unknown& a)   { os << "do(" << a.name; }
};

} // namespace

const char* kindName(ActionKind kind) {
    switch (kind) {
        case ActionKind::Launch:    return "launch";
        case ActionKind::Tap:       return "tap";
        case ActionKind::DoubleTap: return "double_tap";
        case ActionKind::LongPress: return "long_press";
        case ActionKind::Type:      return "type";
        case ActionKind::Swipe:     return "swipe";
        case ActionKind::Back:      return "back";
        case ActionKind::Home:      return "home";
        case ActionKind::Wait:      return "wait";
        case ActionKind::TakeOver:  return "take_over";
        case ActionKind::Finish:    return "finish";
        case ActionKind::Note:      return "note";
        case ActionKind::CallApi:   return "call_api";
        case ActionKind::Interact:  return "interact";
        case ActionKind::Unknown:   return "unknown";
    }
    return "unknown";
}

std::string toCommandString(const Action& action) {
    std::ostringstream os;
    std::visit(CommandWriter{os}, action.payload());
    if (!action.isFinish()) {
        if (action.sensitive()) os << ", sensitive=true";
        if (!action.message().empty()) os << ", message=" << quote(action.message());
    }
    os << ")";
    return os.str();
}

} // namespace droidpilot::agent
