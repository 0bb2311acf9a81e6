#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>

namespace cask::storage {

class Segment;

// Where a key's latest value lives inside one segment.  `offset` points at
// the first value byte, not at the record start.
struct Location {
    uint64_t offset = 0;
    uint64_t length = 0;

    // offset = 0, length = 0
    [[nodiscard]] static constexpr Location tombstone() { return {}; }

    [[nodiscard]] bool is_tombstone() const { return length == 0; }

    bool operator==(const Location&) const = default;
};

struct RebuildResult {
    std::size_t records = 0;    // records replayed
    uint64_t valid_bytes = 0;   // end of the last complete record
};

// ── KeyIndex ─────────────────────────────────────────────────────────────────
//
// In-memory projection of one segment: key -> location of the last record for
// that key in the segment, or a tombstone.  Nothing here touches the disk
// except rebuild(), which replays the segment from the start.

class KeyIndex {
public:
    // Lets lookups take a std::string_view without building a std::string.
    struct KeyHash {
        using is_transparent = void;
        std::size_t operator()(std::string_view key) const noexcept {
            return std::hash<std::string_view>{}(key);
        }
    };

    using Map = std::unordered_map<std::string, Location, KeyHash, std::equal_to<>>;

    void insert(std::string key, Location location);

    [[nodiscard]] std::optional<Location> get(std::string_view key) const;

    [[nodiscard]] bool contains(std::string_view key) const;

    void remove(std::string_view key);

    void clear() { map_.clear(); }

    [[nodiscard]] std::size_t size() const { return map_.size(); }

    [[nodiscard]] Map::const_iterator begin() const { return map_.begin(); }
    [[nodiscard]] Map::const_iterator end() const { return map_.end(); }

    // Clears the index and replays `segment` in file order; later records
    // for a key overwrite earlier ones, zero-length values become
    // tombstones.  On a malformed tail, returns corrupt_segment and keeps
    // everything decoded before it; `result.valid_bytes` marks the cut.
    [[nodiscard]] std::error_code rebuild(const Segment& segment,
                                          RebuildResult& result);

private:
    Map map_;
};

} // namespace cask::storage
