#pragma once

#include "storage/record.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace cask::storage {

// ── Segment file naming ──────────────────────────────────────────────────────

static constexpr const char* kSegmentExtension = ".log";

// Transient output of a compaction; never a live segment.
static constexpr const char* kMergeFileName = "log.merging";

// "<id>.log"
[[nodiscard]] std::string segment_file_name(uint64_t id);

// Parses "<decimal id>.log".  Returns std::nullopt for anything else,
// including "log.merging", signs, leading zeros and an empty stem.
[[nodiscard]] std::optional<uint64_t> parse_segment_file_name(std::string_view name);

// fsync a directory so that renames and unlinks inside it are durable.
[[nodiscard]] std::error_code fsync_directory(const std::filesystem::path& dir);

// ── Segment ──────────────────────────────────────────────────────────────────
//
// One append-only segment file.  Records are appended at the end and never
// rewritten; the only in-place change is truncate(), used by recovery to cut a
// partially written tail.
//
// open() opens the file for read + append and creates it when missing; it is
// never truncated on open.  Reads use pread() and do not move the append position.
//
// Thread-safety: NOT thread-safe.  The engine serialises all access.

class Segment {
public:
    Segment(std::filesystem::path path, uint64_t id, bool sync_writes = false);
    ~Segment();

    // Non-copyable, non-movable (owns a file descriptor).
    Segment(const Segment&) = delete;
    Segment& operator=(const Segment&) = delete;
    Segment(Segment&&) = delete;
    Segment& operator=(Segment&&) = delete;

    // Opens (or creates) the file.  No-op when already open.
    [[nodiscard]] std::error_code open();

    // Opens an existing file for reading only; a missing file is an error.
    // append() and truncate() fail on a segment opened this way.
    [[nodiscard]] std::error_code open_readonly();

    void close();

    // Append one record.  On success `value_offset` is the file offset of the
    // first value byte, which is what the index stores.  An empty value
    // writes a tombstone.  A failed write is cut back so the file still ends
    // on a record boundary.
    [[nodiscard]] std::error_code append(std::string_view key,
                                         std::string_view value,
                                         uint64_t& value_offset);

    // Read exactly `length` bytes at `offset`.  A short read is an io_error.
    [[nodiscard]] std::error_code read(uint64_t offset, uint64_t length,
                                       std::string& out) const;

    // Load the whole file into `cursor`, positioned at the first record.
    [[nodiscard]] std::error_code iterate(RecordCursor& cursor) const;

    // All records in file order (diagnostics).  Stops with corrupt_segment at
    // a malformed tail, keeping the records decoded before it.
    [[nodiscard]] std::error_code dump(std::vector<Record>& out) const;

    // fdatasync the file.
    [[nodiscard]] std::error_code sync();

    // Cut the file to `length` bytes.
    [[nodiscard]] std::error_code truncate(uint64_t length);

    // Current file length in bytes.
    [[nodiscard]] uint64_t size() const { return size_; }

    [[nodiscard]] bool is_open() const { return fd_ != -1; }
    [[nodiscard]] uint64_t id() const { return id_; }
    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    // Re-reads the file length from the descriptor.
    [[nodiscard]] std::error_code refresh_size();

    [[nodiscard]] std::error_code open_with(int flags);

    std::filesystem::path path_;
    uint64_t id_ = 0;
    bool sync_writes_ = false;
    int fd_ = -1;
    uint64_t size_ = 0;
};

} // namespace cask::storage
