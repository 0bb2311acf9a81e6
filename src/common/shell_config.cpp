#include "common/shell_config.hpp"

#include "common/logger.hpp"

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace cask {

namespace {

// Validate the fully populated ShellConfig.
void validate(const ShellConfig& cfg) {
    if (cfg.engine.segment_size_limit == 0) {
        throw std::runtime_error("--segment-size must be > 0");
    }
    if (cfg.engine.max_segments < 2) {
        throw std::runtime_error(
            "--max-segments must be >= 2, got " +
            std::to_string(cfg.engine.max_segments));
    }
    try {
        (void)parse_log_level(cfg.log_level);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(std::string("--log-level: ") + e.what());
    }
}

} // anonymous namespace

storage::RecoveryMode parse_recovery_mode(const std::string& s) {
    if (s == "truncate") return storage::RecoveryMode::truncate;
    if (s == "strict")   return storage::RecoveryMode::strict;
    throw std::runtime_error(
        "--recovery must be 'truncate' or 'strict', got '" + s + "'");
}

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("data-dir,d",
            po::value<std::string>()->default_value(""),
            "Database directory to open at startup (optional)")
        ("segment-size",
            po::value<uint64_t>()->default_value(36),
            "Rotate the active segment once it reaches this many bytes")
        ("max-segments",
            po::value<std::size_t>()->default_value(2),
            "Merge the two oldest segments when there are more than this")
        ("sync",
            po::value<bool>()->default_value(true),
            "fdatasync after every write (true|false)")
        ("recovery",
            po::value<std::string>()->default_value("truncate"),
            "Incomplete trailing records: truncate (default) or strict")
        ("log-level,l",
            po::value<std::string>()->default_value("warn"),
            "Log level: trace|debug|info|warn|error|critical|off");
}

// ── parse_config ──────────────────────────────────────────────────────────────

ShellConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("caskdb-shell options");
    add_options(desc);

    po::variables_map vm;
    try {
        po::store(
            po::parse_command_line(argc, argv, desc),
            vm);

        if (vm.count("help")) {
            std::ostringstream oss;
            oss << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(std::string("Argument error: ") + e.what());
    }

    ShellConfig cfg;
    cfg.data_dir                  = vm["data-dir"].as<std::string>();
    cfg.engine.segment_size_limit = vm["segment-size"].as<uint64_t>();
    cfg.engine.max_segments       = vm["max-segments"].as<std::size_t>();
    cfg.engine.sync_writes        = vm["sync"].as<bool>();
    cfg.engine.recovery           = parse_recovery_mode(vm["recovery"].as<std::string>());
    cfg.log_level                 = vm["log-level"].as<std::string>();

    validate(cfg);
    return cfg;
}

} // namespace cask
