#pragma once

#include "shell/command.hpp"
#include "storage/engine.hpp"

#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace cask::shell {

// ── Shell ─────────────────────────────────────────────────────────────────────
//
// Interactive front end over one storage::Engine.  Every command yields the
// text to print; failures become "ERROR <message>" and never end the session.
// "open" may be issued again to switch to another directory.

class Shell {
public:
    explicit Shell(storage::EngineOptions options = {},
                   std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    // Output for one command, without a trailing newline.
    [[nodiscard]] std::string execute(const Command& cmd);

    // Parse and execute one line.
    [[nodiscard]] std::string execute_line(std::string_view line);

    // Prompt/read/execute/print until EOF or "quit".
    void run(std::istream& in, std::ostream& out);

    [[nodiscard]] bool done() const { return done_; }

    // nullptr until a directory has been opened.
    [[nodiscard]] const storage::Engine* engine() const { return engine_.get(); }

private:
    [[nodiscard]] std::string open(const std::string& directory);

    storage::EngineOptions options_;
    std::shared_ptr<spdlog::logger> logger_;
    std::unique_ptr<storage::Engine> engine_;
    bool done_ = false;
};

} // namespace cask::shell
