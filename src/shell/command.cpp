#include "shell/command.hpp"

#include <cctype>
#include <string>
#include <utility>

namespace cask::shell {

// ── Helpers ───────────────────────────────────────────────────────────────────

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

// Split `line` on the first run of whitespace, returning {head, rest}.
// If there is no whitespace, rest is empty.
std::pair<std::string_view, std::string_view> split_once(std::string_view line) {
    std::size_t pos = 0;
    while (pos < line.size() && !std::isspace(static_cast<unsigned char>(line[pos]))) {
        ++pos;
    }
    return {line.substr(0, pos), trim(line.substr(pos))};
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

// Commands that take no arguments.
template <typename Cmd>
std::variant<Command, ParseError> no_args(const std::string& verb, std::string_view rest) {
    if (!rest.empty()) {
        return ParseError{verb + " takes no arguments"};
    }
    return Cmd{};
}

// Commands that take exactly one token.
template <typename Cmd>
std::variant<Command, ParseError> one_arg(const std::string& verb, std::string_view rest,
                                          const char* what) {
    if (rest.empty()) {
        return ParseError{verb + " requires " + what};
    }
    auto [arg, extra] = split_once(rest);
    if (!extra.empty()) {
        return ParseError{verb + " takes exactly one argument"};
    }
    return Cmd{std::string(arg)};
}

} // namespace

// ── parse_command ─────────────────────────────────────────────────────────────

std::variant<Command, ParseError> parse_command(std::string_view line) {
    line = trim(line);
    if (line.empty()) {
        return ParseError{"empty command"};
    }

    auto [verb_tok, rest] = split_once(line);
    const std::string verb = to_lower(verb_tok);

    if (verb == "open")    return one_arg<OpenCmd>(verb, rest, "a directory");
    if (verb == "get")     return one_arg<GetCmd>(verb, rest, "a key");
    if (verb == "del")     return one_arg<DelCmd>(verb, rest, "a key");
    if (verb == "dump")    return no_args<DumpCmd>(verb, rest);
    if (verb == "stats")   return no_args<StatsCmd>(verb, rest);
    if (verb == "grow")    return no_args<GrowCmd>(verb, rest);
    if (verb == "compact") return no_args<CompactCmd>(verb, rest);
    if (verb == "help")    return no_args<HelpCmd>(verb, rest);
    if (verb == "quit" || verb == "exit") return no_args<QuitCmd>(verb, rest);

    // ── set key value ─────────────────────────────────────────────────────────
    //
    // The value is everything after "set <key> "; it may contain spaces.
    if (verb == "set") {
        if (rest.empty()) {
            return ParseError{"set requires a key and a value"};
        }
        auto [key, value] = split_once(rest);
        if (value.empty()) {
            return ParseError{"set requires a value"};
        }
        return SetCmd{std::string(key), std::string(value)};
    }

    return ParseError{"unknown command: " + std::string(verb_tok)};
}

} // namespace cask::shell
