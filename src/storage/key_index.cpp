#include "storage/key_index.hpp"

#include "storage/record.hpp"
#include "storage/segment.hpp"

#include <utility>

namespace cask::storage {

void KeyIndex::insert(std::string key, Location location) {
    map_.insert_or_assign(std::move(key), location);
}

std::optional<Location> KeyIndex::get(std::string_view key) const {
    auto it = map_.find(key);
    if (it == map_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool KeyIndex::contains(std::string_view key) const {
    return map_.find(key) != map_.end();
}

void KeyIndex::remove(std::string_view key) {
    if (auto it = map_.find(key); it != map_.end()) {
        map_.erase(it);
    }
}

std::error_code KeyIndex::rebuild(const Segment& segment, RebuildResult& result) {
    result = {};
    map_.clear();

    RecordCursor cursor;
    if (auto ec = segment.iterate(cursor)) {
        return ec;
    }

    Record rec;
    while (cursor.next(rec)) {
        const Location loc = rec.is_tombstone()
            ? Location::tombstone()
            : Location{rec.value.offset, rec.value.length};
        insert(std::move(rec.key.bytes), loc);
        ++result.records;
    }

    result.valid_bytes = cursor.position();
    return cursor.status();
}

} // namespace cask::storage
