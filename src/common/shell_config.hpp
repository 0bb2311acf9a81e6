#pragma once

#include "storage/engine.hpp"

#include <string>

#include <boost/program_options.hpp>

namespace cask {

// ── ShellConfig ───────────────────────────────────────────────────────────────
// Configuration for one caskdb-shell process.
// Populated by parse_config() from CLI arguments.

struct ShellConfig {
    std::string data_dir;           // Directory opened at startup; empty = none
    storage::EngineOptions engine;  // Rotation, compaction, sync, recovery
    std::string log_level;          // spdlog level string
};

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into a ShellConfig.
//
// On success: returns a fully validated ShellConfig.
// On error  : throws std::runtime_error with a human-readable message.
//             --help is reported the same way, carrying the help text.
//
// Validates:
//   - --segment-size > 0
//   - --max-segments >= 2 (the merged pair must never include the active
//     segment)
//   - --recovery is "truncate" or "strict"
//   - --log-level names an spdlog level

[[nodiscard]] ShellConfig parse_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with shell options.
// Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

// "truncate" | "strict"; throws std::runtime_error otherwise.
[[nodiscard]] storage::RecoveryMode parse_recovery_mode(const std::string& s);

} // namespace cask
