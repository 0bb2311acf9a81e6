#pragma once

#include <string>
#include <system_error>

namespace cask::storage {

// ── Storage error codes ──────────────────────────────────────────────────────
//
// Conditions specific to the segment store.  OS-level failures are reported
// with errno in std::system_category() instead.

enum class StorageErrc {
    corrupt_segment = 1,    // malformed record stream in a segment file
    invalid_segment_name,   // "*.log" file whose stem is not a segment id
    empty_value,            // zero-length value outside of a delete
    engine_closed,          // operation on an engine that is not open
    merge_incomplete,       // interrupted compaction swap left unresolved
};

[[nodiscard]] const std::error_category& storage_category() noexcept;

[[nodiscard]] std::error_code make_error_code(StorageErrc e) noexcept;

} // namespace cask::storage

template <>
struct std::is_error_code_enum<cask::storage::StorageErrc> : std::true_type {};
