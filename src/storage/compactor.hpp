#pragma once

#include "storage/key_index.hpp"
#include "storage/segment.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

namespace cask::storage {

// Commit marker: present on disk exactly while a merge result is durable but
// the source files have not all been replaced yet.
static constexpr const char* kMergeMarkerName = "merge.commit";

struct CompactionResult {
    KeyIndex index;             // index of the merged segment
    std::size_t live_keys = 0;  // records written to the merged segment
    std::size_t dropped = 0;    // superseded entries and tombstones
    uint64_t bytes_before = 0;  // sum of source sizes
    uint64_t bytes_after = 0;   // merged segment size
};

// ── Compactor ────────────────────────────────────────────────────────────────
//
// Collapses the oldest segments of a directory into one.
//
// merge() rebuilds a private index for every source (oldest first) and writes
// each key that is neither tombstoned nor present in a later source to
// <dir>/log.merging.  Tombstones are dropped outright: the sources are the
// oldest segments left, so there is nothing older for them to mask.
//
// commit() swaps the result in with a marker-based protocol:
//   1. write <dir>/merge.commit (tmp + fsync + rename + fsync dir)
//   2. unlink every source except the oldest
//   3. rename log.merging onto the oldest source, fsync dir
//   4. unlink the marker, fsync dir
// recover() finishes a swap interrupted after step 1 and discards merge
// output whose marker never landed, so a crash leaves either the old or the
// new segment set.
//
// The caller must close its own handles on the sources before commit().

class Compactor {
public:
    explicit Compactor(std::filesystem::path dir,
                       std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    // `sources` must hold at least two segment paths, oldest first.
    [[nodiscard]] std::error_code merge(
        const std::vector<std::filesystem::path>& sources,
        CompactionResult& result);

    // `committed` becomes true once the marker is durable; from then on the
    // merged state is authoritative even if a later step fails.
    [[nodiscard]] std::error_code commit(
        const std::vector<std::filesystem::path>& sources,
        bool& committed);

    // Removes log.merging if present (abandoned merge).
    void discard();

    // Resolves leftovers of an interrupted swap.  Call before scanning the
    // directory for segments.
    [[nodiscard]] static std::error_code recover(const std::filesystem::path& dir,
                                                 spdlog::logger& logger);

    [[nodiscard]] std::filesystem::path merge_path() const { return dir_ / kMergeFileName; }
    [[nodiscard]] std::filesystem::path marker_path() const { return dir_ / kMergeMarkerName; }

private:
    [[nodiscard]] std::error_code write_marker(
        const std::vector<std::filesystem::path>& sources);

    std::filesystem::path dir_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace cask::storage
