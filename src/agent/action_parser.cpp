// =============================================================================
// DroidPilot - Action string parser
// =============================================================================
#include "action_parser.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>

#include "../droidpilot_log.hpp"
#include "../util/string_util.hpp"

namespace droidpilot::agent {

namespace {

constexpr const char* TAG = "ActionParser";

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// A quote only opens a value when it follows a delimiter. Apostrophes inside
// barewords ("don't") are plain characters.
bool quoteCanOpen(const std::string& text, size_t i) {
    while (i > 0) {
        char p = text[--i];
        if (std::isspace(static_cast<unsigned char>(p))) continue;
        return p == '(' || p == ',' || p == '=' || p == '[';
    }
    return true;
}

bool isPlainInteger(const std::string& s) {
    std::string t = util::trim(s);
    if (t.empty()) return false;
    size_t i = (t[0] == '-' || t[0] == '+') ? 1 : 0;
    if (i == t.size()) return false;
    for (; i < t.size(); i++) {
        if (!std::isdigit(static_cast<unsigned char>(t[i]))) return false;
    }
    return true;
}

// Unquotes and resolves \" \' \\ escapes inside a quoted value
std::string unquoteValue(const std::string& s) {
    std::string t = util::trim(s);
    if (t.size() < 2 || (t.front() != '"' && t.front() != '\'') || t.back() != t.front()) {
        return t;
    }
    std::string out;
    out.reserve(t.size() - 2);
    for (size_t i = 1; i + 1 < t.size(); i++) {
        if (t[i] == '\\' && i + 2 < t.size() &&
            (t[i + 1] == '"' || t[i + 1] == '\'' || t[i + 1] == '\\')) {
            out += t[++i];
        } else {
            out += t[i];
        }
    }
    return out;
}

// "key=value" -> (key, value). Key must be an identifier.
bool splitKeyValue(const std::string& param, std::string& key, std::string& value) {
    size_t eq = param.find('=');
    if (eq == std::string::npos) return false;
    std::string k = util::trim(param.substr(0, eq));
    if (k.empty() || std::isdigit(static_cast<unsigned char>(k[0]))) return false;
    for (char c : k) {
        if (!isIdentChar(c)) return false;
    }
    key = util::toLower(k);
    value = unquoteValue(param.substr(eq + 1));
    return true;
}

bool isCoordinateKey(const std::string& key) {
    return key == "element" || key == "start" || key == "end";
}

// Case-insensitive search for `word` not preceded by an identifier char
size_t findCall(const std::string& lowered, const std::string& word) {
    size_t pos = lowered.find(word);
    while (pos != std::string::npos) {
        if (pos == 0 || !isIdentChar(lowered[pos - 1])) return pos;
        pos = lowered.find(word, pos + 1);
    }
    return std::string::npos;
}

const std::map<std::string, ActionKind>& nameTable() {
    static const std::map<std::string, ActionKind> table = {
        {"launch", ActionKind::Launch},
        {"open_app", ActionKind::Launch},
        {"open", ActionKind::Launch},
        {"tap", ActionKind::Tap},
        {"click", ActionKind::Tap},
        {"double_tap", ActionKind::DoubleTap},
        {"doubletap", ActionKind::DoubleTap},
        {"long_press", ActionKind::LongPress},
        {"longpress", ActionKind::LongPress},
        {"type", ActionKind::Type},
        {"input", ActionKind::Type},
        {"type_name", ActionKind::Type},
        {"swipe", ActionKind::Swipe},
        {"scroll", ActionKind::Swipe},
        {"back", ActionKind::Back},
        {"home", ActionKind::Home},
        {"wait", ActionKind::Wait},
        {"sleep", ActionKind::Wait},
        {"take_over", ActionKind::TakeOver},
        {"takeover", ActionKind::TakeOver},
        {"finish", ActionKind::Finish},
        {"note", ActionKind::Note},
        {"call_api", ActionKind::CallApi},
        {"callapi", ActionKind::CallApi},
        {"interact", ActionKind::Interact},
    };
    return table;
}

const std::string* findParam(const ParsedCommandLine& cmd,
                             std::initializer_list<const char*> keys) {
    for (const char* k : keys) {
        auto it = cmd.kv.find(k);
        if (it != cmd.kv.end()) return &it->second;
    }
    return nullptr;
}

std::string textParam(const ParsedCommandLine& cmd, std::initializer_list<const char*> keys) {
    if (const std::string* v = findParam(cmd, keys)) return *v;
    if (!cmd.positional.empty()) return cmd.positional.front();
    return {};
}

std::string joinPositional(const ParsedCommandLine& cmd) {
    std::string out;
    for (const auto& p : cmd.positional) {
        if (!out.empty()) out += ',';
        out += p;
    }
    return out;
}

Result<Point, ParseError> pointParam(const ParsedCommandLine& cmd, const std::string& source) {
    std::string value;
    if (const std::string* v = findParam(cmd, {"element", "point"})) {
        value = *v;
    } else {
        value = joinPositional(cmd);
    }
    auto coords = ActionParser::parseCoordinates(value);
    if (coords.is_err()) return ParseError(coords.error().message, source);
    const auto& c = coords.value();
    if (c.size() < 2) {
        return ParseError(cmd.name + " requires element coordinates [x,y]", source);
    }
    return Point{c[0], c[1]};
}

Result<actions::Swipe, ParseError> buildSwipe(const ParsedCommandLine& cmd,
                                              const std::string& source, int default_ms) {
    actions::Swipe swipe;
    swipe.duration_ms = default_ms;
    const std::string* start = findParam(cmd, {"start"});
    const std::string* end = findParam(cmd, {"end"});
    if (start || end) {
        if (!start || !end) {
            return ParseError("swipe requires both start and end", source);
        }
        auto s = ActionParser::parseCoordinates(*start);
        auto e = ActionParser::parseCoordinates(*end);
        if (s.is_err()) return ParseError(s.error().message, source);
        if (e.is_err()) return ParseError(e.error().message, source);
        if (s.value().size() < 2 || e.value().size() < 2) {
            return ParseError("swipe requires start=[x1,y1] and end=[x2,y2]", source);
        }
        swipe.from = {s.value()[0], s.value()[1]};
        swipe.to = {e.value()[0], e.value()[1]};
    } else {
        auto all = ActionParser::parseCoordinates(joinPositional(cmd));
        if (all.is_err()) return ParseError(all.error().message, source);
        const auto& v = all.value();
        if (v.size() < 4) {
            return ParseError("swipe requires four coordinates", source);
        }
        swipe.from = {v[0], v[1]};
        swipe.to = {v[2], v[3]};
        if (v.size() >= 5) swipe.duration_ms = v[4];
    }
    if (const std::string* d = findParam(cmd, {"duration"})) {
        swipe.duration_ms = ActionParser::parseDurationMs(*d, false);
    }
    if (swipe.duration_ms < 0) swipe.duration_ms = 0;
    return swipe;
}

} // namespace

// -----------------------------------------------------------------------------
// Scanning
// -----------------------------------------------------------------------------

std::optional<size_t> ActionParser::findMatchingParen(const std::string& text, size_t open_pos) {
    if (open_pos >= text.size() || text[open_pos] != '(') return std::nullopt;
    int depth = 0;
    char quote = 0;
    for (size_t i = open_pos; i < text.size(); i++) {
        char c = text[i];
        if (quote) {
            if (c == '\\' && i + 1 < text.size()) {
                i++;
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if ((c == '"' || c == '\'') && quoteCanOpen(text, i)) {
            quote = c;
        } else if (c == '(') {
            depth++;
        } else if (c == ')') {
            if (--depth == 0) return i;
        }
    }
    return std::nullopt;
}

std::vector<std::string> ActionParser::splitArgs(const std::string& content) {
    std::vector<std::string> out;
    std::string cur;
    int depth = 0;
    char quote = 0;
    for (size_t i = 0; i < content.size(); i++) {
        char c = content[i];
        if (quote) {
            cur += c;
            if (c == '\\' && i + 1 < content.size()) {
                cur += content[++i];
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if ((c == '"' || c == '\'') && quoteCanOpen(content, i)) {
            quote = c;
        } else if (c == '[' || c == '(') {
            depth++;
        } else if ((c == ']' || c == ')') && depth > 0) {
            depth--;
        } else if (c == ',' && depth == 0) {
            std::string t = util::trim(cur);
            if (!t.empty()) out.push_back(t);
            cur.clear();
            continue;
        }
        cur += c;
    }
    std::string t = util::trim(cur);
    if (!t.empty()) out.push_back(t);
    return out;
}

std::string ActionParser::normalizeName(const std::string& name) {
    std::string n = util::toLower(util::unquote(name));
    for (char& c : n) {
        if (c == ' ' || c == '-') c = '_';
    }
    return n;
}

Result<ParsedCommandLine, ParseError> ActionParser::scan(const std::string& raw) {
    const std::string text = util::trim(raw);
    const std::string lowered = util::toLower(text);

    ParsedCommandLine cmd;
    size_t start = std::string::npos;
    size_t open = std::string::npos;

    size_t fin = findCall(lowered, "finish(");
    size_t dof = findCall(lowered, "do(");
    if (fin != std::string::npos && (dof == std::string::npos || fin < dof)) {
        cmd.form = ParsedCommandLine::Form::Finish;
        start = fin;
        open = fin + 6;
    } else if (dof != std::string::npos) {
        cmd.form = ParsedCommandLine::Form::Do;
        start = dof;
        open = dof + 2;
    } else {
        // Bare call: first '(' directly preceded by an identifier
        cmd.form = ParsedCommandLine::Form::Bare;
        for (size_t p = text.find('('); p != std::string::npos; p = text.find('(', p + 1)) {
            size_t b = p;
            while (b > 0 && isIdentChar(text[b - 1])) b--;
            if (b < p) {
                start = b;
                open = p;
                break;
            }
        }
        if (start == std::string::npos) {
            return ParseError("No action call found", text);
        }
        cmd.name = normalizeName(text.substr(start, open - start));
    }

    size_t close;
    if (auto m = findMatchingParen(text, open)) {
        close = *m;
    } else {
        size_t last = text.rfind(')');
        close = (last != std::string::npos && last > open) ? last : text.size();
        DPLOG_WARN(TAG, "Unbalanced call, using best-effort end: %s", text.c_str());
    }

    const std::string body = text.substr(open + 1, close - open - 1);
    cmd.matched = text.substr(start, std::min(close + 1, text.size()) - start);
    cmd.params = splitArgs(body);

    // "element=100,200" arrives as two arguments; rejoin them
    std::vector<std::string> params;
    for (size_t i = 0; i < cmd.params.size(); i++) {
        std::string key, value;
        if (i + 1 < cmd.params.size() && splitKeyValue(cmd.params[i], key, value) &&
            isCoordinateKey(key) && isPlainInteger(value) && isPlainInteger(cmd.params[i + 1])) {
            params.push_back(cmd.params[i] + "," + cmd.params[i + 1]);
            i++;
            continue;
        }
        params.push_back(cmd.params[i]);
    }

    for (const auto& p : params) {
        std::string key, value;
        if (splitKeyValue(p, key, value)) {
            cmd.kv[key] = value;
        } else {
            cmd.positional.push_back(unquoteValue(p));
        }
    }

    if (cmd.form == ParsedCommandLine::Form::Finish) {
        cmd.name = "finish";
        auto it = cmd.kv.find("message");
        cmd.positional.clear();
        if (it == cmd.kv.end()) cmd.positional.push_back(unquoteValue(body));
    } else if (cmd.form == ParsedCommandLine::Form::Do) {
        auto it = cmd.kv.find("action");
        if (it != cmd.kv.end()) {
            cmd.name = normalizeName(it->second);
            cmd.kv.erase(it);
        } else if (!cmd.positional.empty()) {
            cmd.name = normalizeName(cmd.positional.front());
            cmd.positional.erase(cmd.positional.begin());
        } else {
            return ParseError("do() without an action name", text);
        }
    }

    auto s = cmd.kv.find("sensitive");
    if (s != cmd.kv.end()) {
        std::string v = util::toLower(s->second);
        cmd.sensitive = (v == "true" || v == "1" || v == "yes");
    }
    return cmd;
}

// -----------------------------------------------------------------------------
// Value helpers
// -----------------------------------------------------------------------------

Result<std::vector<int>, ParseError> ActionParser::parseCoordinates(const std::string& value) {
    std::string cleaned;
    cleaned.reserve(value.size());
    for (char c : value) {
        if (c == '[' || c == ']' || c == '(' || c == ')' || c == '"' || c == '\'') {
            cleaned += ' ';
        } else if (c == ',') {
            cleaned += ' ';
        } else {
            cleaned += c;
        }
    }
    std::vector<int> out;
    for (const auto& part : util::splitWhitespace(cleaned)) {
        char* end = nullptr;
        double d = std::strtod(part.c_str(), &end);
        if (end == part.c_str() || *end != '\0') {
            return ParseError("Invalid coordinate: " + part, value);
        }
        out.push_back(static_cast<int>(std::lround(d)));
    }
    return out;
}

int ActionParser::parseDurationMs(const std::string& text, bool bare_is_seconds) {
    std::string t = util::toLower(util::unquote(text));
    size_t i = 0;
    while (i < t.size() && !std::isdigit(static_cast<unsigned char>(t[i])) && t[i] != '.') i++;
    if (i == t.size()) return 1000;

    char* end = nullptr;
    double n = std::strtod(t.c_str() + i, &end);
    if (end == t.c_str() + i) return 1000;

    std::string unit = util::trim(std::string(end));
    size_t u = 0;
    while (u < unit.size() && std::isalpha(static_cast<unsigned char>(unit[u]))) u++;
    unit = unit.substr(0, u);

    double ms;
    if (unit == "ms" || unit == "msec" || unit == "millisecond" || unit == "milliseconds") {
        ms = n;
    } else if (unit == "s" || unit == "sec" || unit == "secs" || unit == "second" ||
               unit == "seconds") {
        ms = n * 1000.0;
    } else {
        ms = bare_is_seconds ? n * 1000.0 : n;
    }
    return ms < 0 ? 0 : static_cast<int>(std::lround(ms));
}

// -----------------------------------------------------------------------------
// parse
// -----------------------------------------------------------------------------

Result<Action, ParseError> ActionParser::parse(const std::string& raw) const {
    const std::string source = util::trim(raw);
    if (source.empty()) {
        return Action(actions::Finish{"completed with no action"}, false, {}, source);
    }

    auto scanned = scan(source);
    if (scanned.is_err()) {
        DPLOG_DEBUG(TAG, "Parse failed: %s", scanned.error().message.c_str());
        return scanned.error();
    }
    const ParsedCommandLine& cmd = scanned.value();

    const auto& table = nameTable();
    auto it = table.find(cmd.name);
    ActionKind kind = ActionKind::Unknown;
    if (it != table.end()) {
        kind = it->second;
    } else if (cmd.name == "done" && cmd.form == ParsedCommandLine::Form::Bare) {
        kind = ActionKind::Finish;
    }

    std::string message;
    if (auto m = cmd.kv.find("message"); m != cmd.kv.end()) message = m->second;
    const bool sensitive = cmd.sensitive;

    switch (kind) {
        case ActionKind::Launch: {
            std::string app = textParam(cmd, {"app", "app_name", "package", "name"});
            if (app.empty()) return ParseError("launch requires an app name", source);
            return Action(actions::Launch{app}, sensitive, message, source);
        }
        case ActionKind::Tap:
        case ActionKind::DoubleTap:
        case ActionKind::LongPress: {
            auto p = pointParam(cmd, source);
            if (p.is_err()) return p.error();
            if (kind == ActionKind::Tap) {
                return Action(actions::Tap{p.value()}, sensitive, message, source);
            }
            if (kind == ActionKind::DoubleTap) {
                return Action(actions::DoubleTap{p.value()}, sensitive, message, source);
            }
            return Action(actions::LongPress{p.value()}, sensitive, message, source);
        }
        case ActionKind::Type:
            return Action(actions::Type{textParam(cmd, {"text", "content"})},
                          sensitive, message, source);
        case ActionKind::Swipe: {
            auto swipe = buildSwipe(cmd, source, default_swipe_ms_);
            if (swipe.is_err()) return swipe.error();
            return Action(swipe.value(), sensitive, message, source);
        }
        case ActionKind::Back:
            return Action(actions::Back{}, sensitive, message, source);
        case ActionKind::Home:
            return Action(actions::Home{}, sensitive, message, source);
        case ActionKind::Wait: {
            std::string d = textParam(cmd, {"duration", "time"});
            const bool bare_seconds = cmd.form != ParsedCommandLine::Form::Bare;
            int ms = d.empty() ? 1000 : parseDurationMs(d, bare_seconds);
            return Action(actions::Wait{ms}, sensitive, message, source);
        }
        case ActionKind::TakeOver:
            return Action(actions::TakeOver{textParam(cmd, {"message"})}, sensitive, {}, source);
        case ActionKind::Finish:
            return Action(actions::Finish{textParam(cmd, {"message"})}, false, {}, source);
        case ActionKind::Note:
            return Action(actions::Note{textParam(cmd, {"content", "message"})},
                          sensitive, message, source);
        case ActionKind::CallApi:
            return Action(actions::CallApi{textParam(cmd, {"instruction", "payload"})},
                          sensitive, message, source);
        case ActionKind::Interact:
            return Action(actions::Interact{textParam(cmd, {"content"})},
                          sensitive, message, source);
        case ActionKind::Unknown:
            break;
    }
    DPLOG_DEBUG(TAG, "Unknown action name '%s'", cmd.name.c_str());
    return Action(actions::Unknown{cmd.name, cmd.matched}, sensitive, message, source);
}

} // namespace droidpilot::agent
