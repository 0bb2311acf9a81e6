#include "storage/record.hpp"

#include "storage/errors.hpp"

#include <utility>

namespace cask::storage {

// ── Big-endian helpers ───────────────────────────────────────────────────────

void put_u64_be(std::vector<uint8_t>& buf, uint64_t v) {
    for (int i = 7; i >= 0; --i) {
        buf.push_back(static_cast<uint8_t>((v >> (i * 8)) & 0xFF));
    }
}

uint64_t get_u64_be(const uint8_t* p) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v = (v << 8) | static_cast<uint64_t>(p[i]);
    }
    return v;
}

// ── Serialisation ────────────────────────────────────────────────────────────

std::vector<uint8_t> encode_record(std::string_view key, std::string_view value) {
    std::vector<uint8_t> buf;
    buf.reserve(kRecordHeaderSize + key.size() + value.size());

    put_u64_be(buf, key.size());
    buf.insert(buf.end(), key.begin(), key.end());
    put_u64_be(buf, value.size());
    buf.insert(buf.end(), value.begin(), value.end());

    return buf;
}

// ── RecordCursor ─────────────────────────────────────────────────────────────

RecordCursor::RecordCursor(std::vector<uint8_t> data) : data_(std::move(data)) {}

void RecordCursor::rewind() {
    position_ = 0;
    status_.clear();
}

bool RecordCursor::next(Record& out) {
    if (status_ || position_ >= data_.size()) {
        return false;
    }

    const uint64_t end = data_.size();
    uint64_t i = position_;

    // Reads one length-prefixed field starting at `i`.
    auto read_field = [&](Point& field) -> bool {
        if (end - i < kLengthPrefixSize) return false;
        const uint64_t len = get_u64_be(data_.data() + i);
        i += kLengthPrefixSize;
        if (len > end - i) return false;
        field.offset = i;
        field.length = len;
        field.bytes.assign(reinterpret_cast<const char*>(data_.data() + i),
                           static_cast<std::size_t>(len));
        i += len;
        return true;
    };

    Record rec;
    if (!read_field(rec.key) || !read_field(rec.value)) {
        status_ = make_error_code(StorageErrc::corrupt_segment);
        return false;
    }

    position_ = i;
    out = std::move(rec);
    return true;
}

} // namespace cask::storage
