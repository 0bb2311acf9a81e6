#pragma once

#include "storage/compactor.hpp"
#include "storage/key_index.hpp"
#include "storage/record.hpp"
#include "storage/segment.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

namespace cask::storage {

// What open() does with a segment whose last record is incomplete.
enum class RecoveryMode : uint8_t {
    truncate = 0,  // cut the tail back to the last complete record
    strict   = 1,  // fail open() with corrupt_segment
};

struct EngineOptions {
    // Rotate once the active segment reaches this many bytes.  The default
    // holds two small records and exists to exercise rotation.
    uint64_t segment_size_limit = 36;

    // Merge the two oldest segments when the count exceeds this (>= 2).
    std::size_t max_segments = 2;

    // fdatasync after every append.
    bool sync_writes = true;

    RecoveryMode recovery = RecoveryMode::truncate;
};

struct EngineStats {
    std::size_t segments = 0;
    std::size_t indexed_keys = 0;   // index entries over all segments
    std::size_t live_keys = 0;      // keys get() would return
    uint64_t total_bytes = 0;
    uint64_t compactions = 0;       // merges performed since open()
};

struct SegmentDump {
    uint64_t id = 0;
    std::filesystem::path path;
    std::vector<Record> records;
};

// ── Engine ───────────────────────────────────────────────────────────────────
//
// Bitcask-style store over a directory of numbered segment files.
//
// Every write goes to the newest ("active") segment and its index.  Reads
// consult indexes from newest to oldest and stop at the first hit; a
// tombstone hit means the key is absent.  When the active segment reaches
// segment_size_limit a new one is started, and when there are more than
// max_segments segments the two oldest are merged before the write lands.
//
// Thread-safety: NOT thread-safe.  One engine per directory per process;
// nothing guards against a second process opening the same directory.

class Engine {
public:
    explicit Engine(std::filesystem::path directory,
                    EngineOptions options = {},
                    std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());
    ~Engine() = default;

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Creates the directory if needed, resolves an interrupted merge, opens
    // and indexes every "<n>.log" in id order, and starts segment 0 if there
    // are none.  On failure the engine stays closed.
    [[nodiscard]] std::error_code open();

    [[nodiscard]] bool is_open() const { return !slots_.empty(); }

    // Rotates and compacts as configured, then appends.  `value` must not be
    // empty.
    [[nodiscard]] std::error_code set(std::string_view key, std::string_view value);

    // `value` is std::nullopt when the key is absent or deleted.
    [[nodiscard]] std::error_code get(std::string_view key,
                                      std::optional<std::string>& value) const;

    // Appends a tombstone if the key is live.  `deleted` reports whether it
    // was; deleting an absent key is not an error.
    [[nodiscard]] std::error_code del(std::string_view key, bool& deleted);
    [[nodiscard]] std::error_code del(std::string_view key);

    // Starts a new, empty active segment named max id + 1.
    [[nodiscard]] std::error_code grow();

    // Merges the two oldest segments if neither is the active one.  A merge
    // that fails before its commit marker lands leaves the engine as it was.
    // A swap that fails after it, and cannot be finished, closes the engine;
    // open() again to resolve the directory.
    [[nodiscard]] std::error_code compact();

    // Raw records of every segment, oldest first.
    [[nodiscard]] std::error_code dump(std::vector<SegmentDump>& out) const;

    [[nodiscard]] EngineStats stats() const;

    // Segment ids, oldest first.
    [[nodiscard]] std::vector<uint64_t> segment_ids() const;

    [[nodiscard]] std::size_t segment_count() const { return slots_.size(); }

    [[nodiscard]] const std::filesystem::path& directory() const { return directory_; }
    [[nodiscard]] const EngineOptions& options() const { return options_; }

private:
    // A segment and the index describing it, kept at the same position.
    struct Slot {
        std::unique_ptr<Segment> segment;
        KeyIndex index;
    };

    [[nodiscard]] std::error_code load_segments();
    [[nodiscard]] std::error_code open_slot(const std::filesystem::path& path,
                                            uint64_t id, Slot& slot,
                                            std::size_t& records);
    [[nodiscard]] std::error_code compact_oldest();

    Slot& active() { return slots_.back(); }

    std::filesystem::path directory_;
    EngineOptions options_;
    std::shared_ptr<spdlog::logger> logger_;
    std::vector<Slot> slots_;
    uint64_t compactions_ = 0;
};

} // namespace cask::storage
