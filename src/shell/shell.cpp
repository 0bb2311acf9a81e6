#include "shell/shell.hpp"

#include <istream>
#include <optional>
#include <ostream>
#include <sstream>
#include <type_traits>
#include <utility>
#include <vector>

namespace cask::shell {

namespace {

constexpr const char* kNoDatabase = "ERROR no database open (use: open <dir>)";

constexpr const char* kHelpText =
    "open <dir>         open (or create) a database directory\n"
    "set <key> <value>  store a value (may contain spaces)\n"
    "get <key>          print the value, or (nil)\n"
    "del <key>          delete a key\n"
    "dump               print every record of every segment\n"
    "stats              segment and key counts\n"
    "grow               start a new active segment\n"
    "compact            merge the two oldest segments\n"
    "quit               leave the shell";

std::string error_text(const std::error_code& ec) {
    return "ERROR " + ec.message();
}

std::string format_dump(const std::vector<storage::SegmentDump>& segments) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& seg : segments) {
        if (!first) oss << '\n';
        first = false;
        oss << seg.path.string() << ":";
        for (const auto& rec : seg.records) {
            oss << "\n  \"" << rec.key.bytes << "\": ";
            if (rec.is_tombstone()) {
                oss << "<deleted>";
            } else {
                oss << '"' << rec.value.bytes << '"';
            }
        }
    }
    return oss.str();
}

std::string format_stats(const storage::EngineStats& s) {
    std::ostringstream oss;
    oss << "segments=" << s.segments
        << " live_keys=" << s.live_keys
        << " indexed_keys=" << s.indexed_keys
        << " bytes=" << s.total_bytes
        << " compactions=" << s.compactions;
    return oss.str();
}

} // anonymous namespace

Shell::Shell(storage::EngineOptions options, std::shared_ptr<spdlog::logger> logger)
    : options_(options), logger_(std::move(logger)) {}

std::string Shell::open(const std::string& directory) {
    auto engine = std::make_unique<storage::Engine>(directory, options_, logger_);
    if (auto ec = engine->open()) {
        logger_->error("Cannot open {}: {}", directory, ec.message());
        return error_text(ec);
    }
    engine_ = std::move(engine);
    return "OK";
}

std::string Shell::execute(const Command& cmd) {
    return std::visit(
        [this](const auto& c) -> std::string {
            using T = std::decay_t<decltype(c)>;

            if constexpr (std::is_same_v<T, OpenCmd>) {
                return open(c.directory);
            } else if constexpr (std::is_same_v<T, HelpCmd>) {
                return kHelpText;
            } else if constexpr (std::is_same_v<T, QuitCmd>) {
                done_ = true;
                return "";
            } else {
                if (!engine_) {
                    return kNoDatabase;
                }
                auto& engine = *engine_;

                if constexpr (std::is_same_v<T, SetCmd>) {
                    if (auto ec = engine.set(c.key, c.value)) return error_text(ec);
                    return "OK";
                } else if constexpr (std::is_same_v<T, GetCmd>) {
                    std::optional<std::string> value;
                    if (auto ec = engine.get(c.key, value)) return error_text(ec);
                    return value ? *value : "(nil)";
                } else if constexpr (std::is_same_v<T, DelCmd>) {
                    bool deleted = false;
                    if (auto ec = engine.del(c.key, deleted)) return error_text(ec);
                    return deleted ? "DELETED" : "NOT_FOUND";
                } else if constexpr (std::is_same_v<T, DumpCmd>) {
                    std::vector<storage::SegmentDump> segments;
                    if (auto ec = engine.dump(segments)) return error_text(ec);
                    return format_dump(segments);
                } else if constexpr (std::is_same_v<T, StatsCmd>) {
                    return format_stats(engine.stats());
                } else if constexpr (std::is_same_v<T, GrowCmd>) {
                    if (auto ec = engine.grow()) return error_text(ec);
                    return "OK";
                } else if constexpr (std::is_same_v<T, CompactCmd>) {
                    if (auto ec = engine.compact()) return error_text(ec);
                    return "OK";
                }
            }
        },
        cmd);
}

std::string Shell::execute_line(std::string_view line) {
    auto parsed = parse_command(line);
    if (std::holds_alternative<ParseError>(parsed)) {
        return "ERROR " + std::get<ParseError>(parsed).message;
    }
    return execute(std::get<Command>(parsed));
}

void Shell::run(std::istream& in, std::ostream& out) {
    std::string line;
    while (!done_) {
        out << "> " << std::flush;

        if (!std::getline(in, line)) {
            out << '\n';
            break;
        }
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        const auto response = execute_line(line);
        if (!response.empty()) {
            out << response << '\n';
        }
    }
}

} // namespace cask::shell
