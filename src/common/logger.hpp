#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace cask {

// ── Logger façade ─────────────────────────────────────────────────────────────
//
// Every caskdb logger writes to stderr: stdout carries shell replies and
// benchmark reports, and log lines must not interleave with them.

// Install the "cask" logger as spdlog's default.  Safe to call again; the
// second call only changes the level.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Create (or retrieve if already exists) a named component logger, e.g. the
// one handed to storage::Engine.
//   name   – embedded in every log line as [<name>]
//   level  – log level; also applied to an existing logger
std::shared_ptr<spdlog::logger> make_component_logger(
    const std::string& name,
    spdlog::level::level_enum level = spdlog::level::info);

// "trace" | "debug" | "info" | "warn" | "error" | "critical" | "off".
// Throws std::runtime_error on anything else.
spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace cask
