#include "shell/command.hpp"

#include <gtest/gtest.h>

#include <string>
#include <variant>

using namespace cask::shell;

// ── Helpers ───────────────────────────────────────────────────────────────────

// Parse `line` and return the command, failing the test on a parse error.
static Command parse_ok(std::string_view line) {
    auto result = parse_command(line);
    if (auto* err = std::get_if<ParseError>(&result)) {
        ADD_FAILURE() << "unexpected parse error for '" << line << "': " << err->message;
        return HelpCmd{};
    }
    return std::get<Command>(result);
}

// Parse `line` and return the error message, failing the test on success.
static std::string parse_err(std::string_view line) {
    auto result = parse_command(line);
    if (!std::holds_alternative<ParseError>(result)) {
        ADD_FAILURE() << "expected a parse error for '" << line << "'";
        return {};
    }
    return std::get<ParseError>(result).message;
}

// ── Data commands ─────────────────────────────────────────────────────────────

TEST(ParseCommand, Set) {
    auto cmd = parse_ok("set Alice age: 18");
    ASSERT_TRUE(std::holds_alternative<SetCmd>(cmd));
    EXPECT_EQ(std::get<SetCmd>(cmd).key,   "Alice");
    EXPECT_EQ(std::get<SetCmd>(cmd).value, "age: 18");
}

TEST(ParseCommand, SetKeepsInnerSpacesOfValue) {
    auto cmd = parse_ok("set k  a  b");
    ASSERT_TRUE(std::holds_alternative<SetCmd>(cmd));
    EXPECT_EQ(std::get<SetCmd>(cmd).value, "a  b");
}

TEST(ParseCommand, Get) {
    auto cmd = parse_ok("get Bob");
    ASSERT_TRUE(std::holds_alternative<GetCmd>(cmd));
    EXPECT_EQ(std::get<GetCmd>(cmd).key, "Bob");
}

TEST(ParseCommand, Del) {
    auto cmd = parse_ok("del Bob");
    ASSERT_TRUE(std::holds_alternative<DelCmd>(cmd));
    EXPECT_EQ(std::get<DelCmd>(cmd).key, "Bob");
}

TEST(ParseCommand, Open) {
    auto cmd = parse_ok("open /tmp/db");
    ASSERT_TRUE(std::holds_alternative<OpenCmd>(cmd));
    EXPECT_EQ(std::get<OpenCmd>(cmd).directory, "/tmp/db");
}

TEST(ParseCommand, NoArgumentCommands) {
    EXPECT_TRUE(std::holds_alternative<DumpCmd>(parse_ok("dump")));
    EXPECT_TRUE(std::holds_alternative<StatsCmd>(parse_ok("stats")));
    EXPECT_TRUE(std::holds_alternative<GrowCmd>(parse_ok("grow")));
    EXPECT_TRUE(std::holds_alternative<CompactCmd>(parse_ok("compact")));
    EXPECT_TRUE(std::holds_alternative<HelpCmd>(parse_ok("help")));
    EXPECT_TRUE(std::holds_alternative<QuitCmd>(parse_ok("quit")));
    EXPECT_TRUE(std::holds_alternative<QuitCmd>(parse_ok("exit")));
}

TEST(ParseCommand, VerbIsCaseInsensitive) {
    EXPECT_TRUE(std::holds_alternative<GetCmd>(parse_ok("GET k")));
    EXPECT_TRUE(std::holds_alternative<SetCmd>(parse_ok("Set k v")));
}

TEST(ParseCommand, KeyKeepsItsCase) {
    auto cmd = parse_ok("GET MixedKey");
    EXPECT_EQ(std::get<GetCmd>(cmd).key, "MixedKey");
}

TEST(ParseCommand, SurroundingWhitespaceIgnored) {
    auto cmd = parse_ok("  \tget   k  \r");
    ASSERT_TRUE(std::holds_alternative<GetCmd>(cmd));
    EXPECT_EQ(std::get<GetCmd>(cmd).key, "k");
}

// ── Errors ────────────────────────────────────────────────────────────────────

TEST(ParseCommand, EmptyLine) {
    EXPECT_EQ(parse_err(""),    "empty command");
    EXPECT_EQ(parse_err("   "), "empty command");
}

TEST(ParseCommand, UnknownVerb) {
    EXPECT_EQ(parse_err("frobnicate x"), "unknown command: frobnicate");
}

TEST(ParseCommand, MissingArguments) {
    EXPECT_EQ(parse_err("get"),   "get requires a key");
    EXPECT_EQ(parse_err("del"),   "del requires a key");
    EXPECT_EQ(parse_err("open"),  "open requires a directory");
    EXPECT_EQ(parse_err("set"),   "set requires a key and a value");
    EXPECT_EQ(parse_err("set k"), "set requires a value");
}

TEST(ParseCommand, ExtraArguments) {
    EXPECT_EQ(parse_err("get a b"),   "get takes exactly one argument");
    EXPECT_EQ(parse_err("stats now"), "stats takes no arguments");
    EXPECT_EQ(parse_err("quit 1"),    "quit takes no arguments");
}
