#pragma once

#include <string>
#include <string_view>
#include <variant>

namespace cask::shell {

// ── Commands ──────────────────────────────────────────────────────────────────
//
// Parsed representation of one shell line.  Each command type is a plain
// struct; the whole thing is wrapped in a std::variant so callers can
// std::visit over it without inheritance.

struct OpenCmd {
    std::string directory;
};

struct SetCmd {
    std::string key;
    std::string value;
};

struct GetCmd {
    std::string key;
};

struct DelCmd {
    std::string key;
};

struct DumpCmd {};
struct StatsCmd {};
struct GrowCmd {};
struct CompactCmd {};
struct HelpCmd {};
struct QuitCmd {};

using Command = std::variant<OpenCmd, SetCmd, GetCmd, DelCmd, DumpCmd, StatsCmd,
                             GrowCmd, CompactCmd, HelpCmd, QuitCmd>;

struct ParseError {
    std::string message;
};

// Parse one line (without the trailing '\n').  Verbs are case-insensitive;
// the value of "set" is everything after the key and may contain spaces.
//
// Pure function, no shared state.
[[nodiscard]] std::variant<Command, ParseError> parse_command(std::string_view line);

} // namespace cask::shell
