#include "common/logger.hpp"
#include "common/shell_config.hpp"
#include "shell/shell.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>

int main(int argc, char* argv[]) {
    // ── Parse CLI arguments ──────────────────────────────────────────────────
    cask::ShellConfig cfg;
    try {
        cfg = cask::parse_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    // ── Logging ──────────────────────────────────────────────────────────────
    const auto level = cask::parse_log_level(cfg.log_level);
    cask::init_default_logger(level);
    auto logger = cask::make_component_logger("engine", level);

    logger->debug("caskdb-shell starting – segment_size={} max_segments={} sync={}",
                  cfg.engine.segment_size_limit, cfg.engine.max_segments,
                  cfg.engine.sync_writes);

    // ── Shell ────────────────────────────────────────────────────────────────
    cask::shell::Shell shell{cfg.engine, logger};

    if (!cfg.data_dir.empty()) {
        const auto opened = shell.execute(cask::shell::OpenCmd{cfg.data_dir});
        if (opened != "OK") {
            fprintf(stderr, "%s\n", opened.c_str());
            return 1;
        }
        fprintf(stdout, "Opened %s.\n", cfg.data_dir.c_str());
    }

    fprintf(stdout, "caskdb shell. Type 'help' for commands, Ctrl+D to quit.\n");
    fflush(stdout);

    shell.run(std::cin, std::cout);
    return 0;
}
