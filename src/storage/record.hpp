#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace cask::storage {

// ── On-disk record format ────────────────────────────────────────────────────
//
//   [key_len: u64 BE][key][value_len: u64 BE][value]
//
// A record with value_len == 0 is a tombstone for `key`.  There is no file
// header, no checksum and no padding: a segment is a plain concatenation of
// records.

static constexpr std::size_t kLengthPrefixSize = sizeof(uint64_t);
static constexpr std::size_t kRecordHeaderSize = 2 * kLengthPrefixSize;

// One field of a decoded record and where its bytes live in the file.
struct Point {
    uint64_t offset = 0;
    uint64_t length = 0;
    std::string bytes;
};

struct Record {
    Point key;
    Point value;

    [[nodiscard]] bool is_tombstone() const { return value.length == 0; }
};

// Serialise one record.  An empty `value` produces a tombstone.
[[nodiscard]] std::vector<uint8_t> encode_record(std::string_view key,
                                                 std::string_view value);

// Offset of the value bytes relative to the start of the record.
[[nodiscard]] constexpr uint64_t value_offset_in_record(std::size_t key_size) {
    return kLengthPrefixSize + key_size + kLengthPrefixSize;
}

void put_u64_be(std::vector<uint8_t>& buf, uint64_t v);
[[nodiscard]] uint64_t get_u64_be(const uint8_t* p);

// ── RecordCursor ─────────────────────────────────────────────────────────────
//
// Walks an in-memory copy of a segment file, yielding records in file order.
//
// next() returns false at the end of data.  It also returns false when the
// remaining bytes do not form a complete record (fewer than 8 bytes of length
// prefix, or a declared length running past the end); status() is then
// StorageErrc::corrupt_segment and position() is the offset just past the
// last complete record.  rewind() restarts from the first record.

class RecordCursor {
public:
    RecordCursor() = default;
    explicit RecordCursor(std::vector<uint8_t> data);

    bool next(Record& out);

    void rewind();

    [[nodiscard]] std::error_code status() const { return status_; }
    [[nodiscard]] uint64_t position() const { return position_; }
    [[nodiscard]] uint64_t size() const { return data_.size(); }

private:
    std::vector<uint8_t> data_;
    uint64_t position_ = 0;
    std::error_code status_;
};

} // namespace cask::storage
