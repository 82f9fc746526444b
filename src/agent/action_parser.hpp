#pragma once
// =============================================================================
// DroidPilot - Action string parser
// =============================================================================
// Accepts the model-facing command language:
//   do(tap, element=[500,300])
//   do(swipe, start=[100,800], end=[100,200], duration=400)
//   do(type, text="close (it)")
//   finish("done")
//   tap(100, 200)                 <- bare call, deprecated alias
// Noise around the call (reasoning text, markdown) is skipped.
// =============================================================================
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "action.hpp"
#include "../result.hpp"

namespace droidpilot::agent {

// Intermediate scan result of one call; consumed immediately by parse()
struct ParsedCommandLine {
    enum class Form { Finish, Do, Bare };

    Form form = Form::Do;
    std::string name;                          // normalised action name
    std::vector<std::string> params;           // raw top-level arguments, in order
    std::vector<std::string> positional;       // arguments without key=
    std::map<std::string, std::string> kv;     // key -> unquoted value
    bool sensitive = false;
    std::string matched;                       // call text as found in the input
};

class ActionParser {
public:
    explicit ActionParser(int default_swipe_ms = 300) : default_swipe_ms_(default_swipe_ms) {}

    Result<Action, ParseError> parse(const std::string& raw) const;

    // Locates and tokenises the first call in `raw`
    static Result<ParsedCommandLine, ParseError> scan(const std::string& raw);

    // Index of the ')' closing the '(' at `open_pos`. Parentheses inside quoted
    // values do not count.
    static std::optional<size_t> findMatchingParen(const std::string& text, size_t open_pos);

    // "[x,y]", "(x,y)" or "x,y" -> {x, y}. Non-numeric parts fail.
    static Result<std::vector<int>, ParseError> parseCoordinates(const std::string& value);

    // "2 seconds", "500ms", "3". A bare number is seconds when
    // `bare_is_seconds`, else milliseconds. Unparseable -> 1000.
    static int parseDurationMs(const std::string& text, bool bare_is_seconds);

    // Lower-case; spaces and '-' become '_'; surrounding quotes dropped
    static std::string normalizeName(const std::string& name);

    // Top-level comma split that respects quotes and brackets
    static std::vector<std::string> splitArgs(const std::string& content);

private:
    int default_swipe_ms_;
};

} // namespace droidpilot::agent
