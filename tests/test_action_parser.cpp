// =============================================================================
// Unit tests for the action command parser (src/agent/action_parser.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include "agent/action_parser.hpp"

using namespace droidpilot;
using namespace droidpilot::agent;

class ActionParserTest : public ::testing::Test {
protected:
    Action parseOk(const std::string& text) {
        auto r = parser.parse(text);
        EXPECT_TRUE(r.is_ok()) << text << ": " << (r.is_err() ? r.error().message : "");
        if (r.is_err()) return Action(actions::Unknown{"<error>", text});
        return r.value();
    }

    ActionParser parser;
};

// ===========================================================================
// Canonical do()/finish() grammar
// ===========================================================================

TEST_F(ActionParserTest, Tap) {
    Action a = parseOk("do(tap, element=[500,300])");
    ASSERT_TRUE(a.is<actions::Tap>());
    EXPECT_EQ(a.as<actions::Tap>()->at, (Point{500, 300}));
    EXPECT_FALSE(a.sensitive());
}

TEST_F(ActionParserTest, ActionKeyword) {
    Action a = parseOk("do(action=\"Double Tap\", element=[10,20])");
    ASSERT_TRUE(a.is<actions::DoubleTap>());
    EXPECT_EQ(a.as<actions::DoubleTap>()->at, (Point{10, 20}));
}

TEST_F(ActionParserTest, LongPress) {
    Action a = parseOk("do(long-press, element=[7,8])");
    ASSERT_TRUE(a.is<actions::LongPress>());
    EXPECT_EQ(a.as<actions::LongPress>()->at, (Point{7, 8}));
}

TEST_F(ActionParserTest, SwipeWithDuration) {
    Action a = parseOk("do(swipe, start=[100,800], end=[100,200], duration=400)");
    ASSERT_TRUE(a.is<actions::Swipe>());
    const auto* s = a.as<actions::Swipe>();
    EXPECT_EQ(s->from, (Point{100, 800}));
    EXPECT_EQ(s->to, (Point{100, 200}));
    EXPECT_EQ(s->duration_ms, 400);
}

TEST_F(ActionParserTest, SwipeDefaultDuration) {
    ActionParser custom(450);
    auto r = custom.parse("do(swipe, start=[1,2], end=[3,4])");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().as<actions::Swipe>()->duration_ms, 450);
}

TEST_F(ActionParserTest, TypeKeepsParenthesesInsideQuotes) {
    Action a = parseOk("do(type, text=\"close (it)\")");
    ASSERT_TRUE(a.is<actions::Type>());
    EXPECT_EQ(a.as<actions::Type>()->text, "close (it)");
}

TEST_F(ActionParserTest, TypeWithApostrophe) {
    Action a = parseOk("do(type, text=don't)");
    ASSERT_TRUE(a.is<actions::Type>());
    EXPECT_EQ(a.as<actions::Type>()->text, "don't");
}

TEST_F(ActionParserTest, LaunchBackHome) {
    Action launch = parseOk("do(launch, app=\"Settings\")");
    ASSERT_TRUE(launch.is<actions::Launch>());
    EXPECT_EQ(launch.as<actions::Launch>()->app, "Settings");

    EXPECT_TRUE(parseOk("do(back)").is<actions::Back>());
    EXPECT_TRUE(parseOk("do(Home)").is<actions::Home>());
}

TEST_F(ActionParserTest, WaitDurations) {
    EXPECT_EQ(parseOk("do(wait, duration=\"2 seconds\")").as<actions::Wait>()->duration_ms, 2000);
    EXPECT_EQ(parseOk("do(wait, duration=3)").as<actions::Wait>()->duration_ms, 3000);
    EXPECT_EQ(parseOk("do(wait, duration=\"250ms\")").as<actions::Wait>()->duration_ms, 250);
    EXPECT_EQ(parseOk("do(wait)").as<actions::Wait>()->duration_ms, 1000);
}

TEST_F(ActionParserTest, TakeOverMessage) {
    Action a = parseOk("do(take_over, message=\"Please log in\")");
    ASSERT_TRUE(a.is<actions::TakeOver>());
    EXPECT_EQ(a.as<actions::TakeOver>()->message, "Please log in");
}

TEST_F(ActionParserTest, FinishPositionalAndKeyword) {
    Action a = parseOk("finish(\"done\")");
    ASSERT_TRUE(a.isFinish());
    EXPECT_EQ(a.as<actions::Finish>()->message, "done");

    Action b = parseOk("finish(message=\"All done\")");
    ASSERT_TRUE(b.isFinish());
    EXPECT_EQ(b.as<actions::Finish>()->message, "All done");
}

TEST_F(ActionParserTest, EmptyInputFinishes) {
    Action a = parseOk("   ");
    EXPECT_TRUE(a.isFinish());
}

TEST_F(ActionParserTest, InertVariants) {
    EXPECT_TRUE(parseOk("do(note, content=\"price is 12\")").is<actions::Note>());
    EXPECT_TRUE(parseOk("do(call_api, instruction=\"summarise\")").is<actions::CallApi>());
    EXPECT_TRUE(parseOk("do(interact)").is<actions::Interact>());
}

TEST_F(ActionParserTest, SensitiveWithMessage) {
    Action a = parseOk("do(tap, element=[1,2], sensitive=true, message=\"Pay now\")");
    EXPECT_TRUE(a.sensitive());
    EXPECT_EQ(a.message(), "Pay now");
    EXPECT_TRUE(a.requiresConfirmation());

    Action b = parseOk("do(tap, element=[1,2], sensitive=true)");
    EXPECT_TRUE(b.sensitive());
    EXPECT_FALSE(b.requiresConfirmation());
}

TEST_F(ActionParserTest, UnknownActionIsKept) {
    Action a = parseOk("do(fly, to=\"moon\")");
    ASSERT_TRUE(a.is<actions::Unknown>());
    EXPECT_EQ(a.as<actions::Unknown>()->name, "fly");
    EXPECT_EQ(a.as<actions::Unknown>()->raw, "do(fly, to=\"moon\")");
}

// ===========================================================================
// Noise and deprecated forms
// ===========================================================================

TEST_F(ActionParserTest, SkipsSurroundingText) {
    Action a = parseOk("I should open the menu first.\n```\ndo(tap, element=[10,20])\n```");
    ASSERT_TRUE(a.is<actions::Tap>());
    EXPECT_EQ(a.as<actions::Tap>()->at, (Point{10, 20}));
}

TEST_F(ActionParserTest, CaseInsensitiveCall) {
    Action a = parseOk("Do(Tap, Element=[1,2])");
    ASSERT_TRUE(a.is<actions::Tap>());
}

TEST_F(ActionParserTest, BareCallAlias) {
    Action tap = parseOk("tap(100, 200)");
    ASSERT_TRUE(tap.is<actions::Tap>());
    EXPECT_EQ(tap.as<actions::Tap>()->at, (Point{100, 200}));

    Action swipe = parseOk("swipe(1, 2, 3, 4, 600)");
    ASSERT_TRUE(swipe.is<actions::Swipe>());
    EXPECT_EQ(swipe.as<actions::Swipe>()->duration_ms, 600);

    // Bare wait counts milliseconds
    EXPECT_EQ(parseOk("wait(500)").as<actions::Wait>()->duration_ms, 500);
}

TEST_F(ActionParserTest, SplitElementCoordinatesRejoined) {
    Action a = parseOk("do(tap, element=100,200)");
    ASSERT_TRUE(a.is<actions::Tap>());
    EXPECT_EQ(a.as<actions::Tap>()->at, (Point{100, 200}));
}

TEST_F(ActionParserTest, UnbalancedCallBestEffort) {
    Action a = parseOk("do(tap, element=[1,2]");
    ASSERT_TRUE(a.is<actions::Tap>());
    EXPECT_EQ(a.as<actions::Tap>()->at, (Point{1, 2}));
}

// ===========================================================================
// Errors
// ===========================================================================

TEST_F(ActionParserTest, NoCallFound) {
    auto r = parser.parse("hello world");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().raw, "hello world");
}

TEST_F(ActionParserTest, DoWithoutName) {
    EXPECT_TRUE(parser.parse("do()").is_err());
}

TEST_F(ActionParserTest, TapWithoutCoordinates) {
    EXPECT_TRUE(parser.parse("do(tap)").is_err());
    EXPECT_TRUE(parser.parse("do(tap, element=[a,b])").is_err());
}

TEST_F(ActionParserTest, SwipeNeedsBothEnds) {
    EXPECT_TRUE(parser.parse("do(swipe, start=[1,2])").is_err());
    EXPECT_TRUE(parser.parse("swipe(1, 2, 3)").is_err());
}

TEST_F(ActionParserTest, LaunchWithoutApp) {
    EXPECT_TRUE(parser.parse("do(launch)").is_err());
}

// ===========================================================================
// Helpers
// ===========================================================================

TEST(ActionParserHelpersTest, FindMatchingParen) {
    EXPECT_EQ(ActionParser::findMatchingParen("f(a(b)c)", 1), std::optional<size_t>(7));
    EXPECT_EQ(ActionParser::findMatchingParen("f(\")\")", 1), std::optional<size_t>(5));
    EXPECT_FALSE(ActionParser::findMatchingParen("f(a", 1).has_value());
    EXPECT_FALSE(ActionParser::findMatchingParen("abc", 0).has_value());
}

TEST(ActionParserHelpersTest, SplitArgs) {
    auto args = ActionParser::splitArgs("tap, element=[1,2], text=\"a, b\"");
    ASSERT_EQ(args.size(), 3u);
    EXPECT_EQ(args[0], "tap");
    EXPECT_EQ(args[1], "element=[1,2]");
    EXPECT_EQ(args[2], "text=\"a, b\"");
}

TEST(ActionParserHelpersTest, ParseCoordinates) {
    auto c = ActionParser::parseCoordinates("[12, 34]");
    ASSERT_TRUE(c.is_ok());
    EXPECT_EQ(c.value(), (std::vector<int>{12, 34}));

    auto rounded = ActionParser::parseCoordinates("(1.6,2.4)");
    ASSERT_TRUE(rounded.is_ok());
    EXPECT_EQ(rounded.value(), (std::vector<int>{2, 2}));

    EXPECT_TRUE(ActionParser::parseCoordinates("[x,1]").is_err());
}

TEST(ActionParserHelpersTest, ParseDuration) {
    EXPECT_EQ(ActionParser::parseDurationMs("2 seconds", false), 2000);
    EXPECT_EQ(ActionParser::parseDurationMs("2.5 s", false), 2500);
    EXPECT_EQ(ActionParser::parseDurationMs("500ms", true), 500);
    EXPECT_EQ(ActionParser::parseDurationMs("3", true), 3000);
    EXPECT_EQ(ActionParser::parseDurationMs("3", false), 3);
    EXPECT_EQ(ActionParser::parseDurationMs("soon", true), 1000);
}

TEST(ActionParserHelpersTest, NormalizeName) {
    EXPECT_EQ(ActionParser::normalizeName("Double Tap"), "double_tap");
    EXPECT_EQ(ActionParser::normalizeName("\"long-press\""), "long_press");
}

// ===========================================================================
// Canonical serialisation
// ===========================================================================

TEST_F(ActionParserTest, CommandStringParsesBack) {
    const std::vector<Action> samples = {
        Action(actions::Tap{{500, 300}}),
        Action(actions::Swipe{{100, 800}, {100, 200}, 400}),
        Action(actions::Type{"say \"hi\""}),
        Action(actions::Type{"it's \"x\", y"}),
        Action(actions::Type{"C:\\temp\\"}),
        Action(actions::Finish{"both ' and \" (done)"}),
        Action(actions::Wait{2000}),
        Action(actions::Wait{1500}),
        Action(actions::Launch{"Settings"}),
        Action(actions::Back{}),
        Action(actions::TakeOver{"Log in"}),
        Action(actions::Finish{"done"}),
        Action(actions::Tap{{1, 2}}, true, "Pay"),
    };
    for (const auto& a : samples) {
        const std::string text = toCommandString(a);
        Action back = parseOk(text);
        EXPECT_EQ(back, a) << text;
    }
}

TEST(ActionTest, CommandStringShape) {
    EXPECT_EQ(toCommandString(Action(actions::Tap{{5, 6}})), "do(tap, element=[5,6])");
    EXPECT_EQ(toCommandString(Action(actions::Finish{"ok"})), "finish(\"ok\")");
    EXPECT_EQ(toCommandString(Action(actions::Type{"it's \"x\""})),
              "do(type, text=\"it's \\\"x\\\"\")");
    EXPECT_STREQ(kindName(ActionKind::LongPress), "long_press");
}
