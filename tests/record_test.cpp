#include "storage/errors.hpp"
#include "storage/record.hpp"

#include <cstdint>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace cask::storage {

// ── encode_record ────────────────────────────────────────────────────────────

TEST(RecordTest, EncodeLayoutIsBigEndianLengthPrefixed) {
    auto buf = encode_record("ab", "xyz");

    const std::vector<uint8_t> expected{
        0, 0, 0, 0, 0, 0, 0, 2, 'a', 'b',
        0, 0, 0, 0, 0, 0, 0, 3, 'x', 'y', 'z'};
    EXPECT_EQ(buf, expected);
}

TEST(RecordTest, EncodeEmptyValueIsTombstone) {
    auto buf = encode_record("k", "");
    ASSERT_EQ(buf.size(), kRecordHeaderSize + 1);
    EXPECT_EQ(get_u64_be(buf.data() + 9), 0u);
}

TEST(RecordTest, ValueOffsetSkipsBothPrefixesAndKey) {
    EXPECT_EQ(value_offset_in_record(0), 16u);
    EXPECT_EQ(value_offset_in_record(5), 21u);
}

TEST(RecordTest, BigEndianHelpers) {
    std::vector<uint8_t> buf;
    put_u64_be(buf, 0x0102030405060708ULL);
    const std::vector<uint8_t> expected{1, 2, 3, 4, 5, 6, 7, 8};
    EXPECT_EQ(buf, expected);
    EXPECT_EQ(get_u64_be(buf.data()), 0x0102030405060708ULL);
}

// ── RecordCursor ─────────────────────────────────────────────────────────────

TEST(RecordCursorTest, EmptyDataYieldsNothing) {
    RecordCursor cursor{{}};
    Record rec;
    EXPECT_FALSE(cursor.next(rec));
    EXPECT_FALSE(cursor.status());
    EXPECT_EQ(cursor.position(), 0u);
}

TEST(RecordCursorTest, YieldsRecordsWithOffsets) {
    auto data = encode_record("Alice", "age: 18");
    auto second = encode_record("Bob", "");
    data.insert(data.end(), second.begin(), second.end());

    RecordCursor cursor{data};
    Record rec;

    ASSERT_TRUE(cursor.next(rec));
    EXPECT_EQ(rec.key.bytes, "Alice");
    EXPECT_EQ(rec.key.offset, 8u);
    EXPECT_EQ(rec.key.length, 5u);
    EXPECT_EQ(rec.value.bytes, "age: 18");
    EXPECT_EQ(rec.value.offset, 21u);
    EXPECT_EQ(rec.value.length, 7u);
    EXPECT_FALSE(rec.is_tombstone());

    ASSERT_TRUE(cursor.next(rec));
    EXPECT_EQ(rec.key.bytes, "Bob");
    EXPECT_TRUE(rec.is_tombstone());

    EXPECT_FALSE(cursor.next(rec));
    EXPECT_FALSE(cursor.status());
    EXPECT_EQ(cursor.position(), data.size());
}

TEST(RecordCursorTest, ShortLengthPrefixIsCorrupt) {
    auto data = encode_record("k", "v");
    const auto good = data.size();
    data.insert(data.end(), {0, 0, 0});  // 3 of 8 prefix bytes

    RecordCursor cursor{data};
    Record rec;
    ASSERT_TRUE(cursor.next(rec));
    EXPECT_FALSE(cursor.next(rec));
    EXPECT_EQ(cursor.status(), StorageErrc::corrupt_segment);
    EXPECT_EQ(cursor.position(), good);
}

TEST(RecordCursorTest, DeclaredLengthPastEndIsCorrupt) {
    auto data = encode_record("key", "value");
    data.resize(data.size() - 2);  // value cut short

    RecordCursor cursor{data};
    Record rec;
    EXPECT_FALSE(cursor.next(rec));
    EXPECT_EQ(cursor.status(), StorageErrc::corrupt_segment);
    EXPECT_EQ(cursor.position(), 0u);
}

TEST(RecordCursorTest, HugeDeclaredLengthIsCorrupt) {
    std::vector<uint8_t> data;
    put_u64_be(data, UINT64_MAX);
    data.push_back('x');

    RecordCursor cursor{data};
    Record rec;
    EXPECT_FALSE(cursor.next(rec));
    EXPECT_EQ(cursor.status(), StorageErrc::corrupt_segment);
}

TEST(RecordCursorTest, RewindRestartsFromFirstRecord) {
    auto data = encode_record("a", "1");
    auto more = encode_record("b", "2");
    data.insert(data.end(), more.begin(), more.end());

    RecordCursor cursor{data};
    Record rec;
    while (cursor.next(rec)) {}
    cursor.rewind();

    ASSERT_TRUE(cursor.next(rec));
    EXPECT_EQ(rec.key.bytes, "a");
}

TEST(StorageErrcTest, MessagesAndCategory) {
    std::error_code ec = StorageErrc::corrupt_segment;
    EXPECT_EQ(ec.category().name(), std::string("cask.storage"));
    EXPECT_EQ(ec.message(), "corrupt segment");
    EXPECT_NE(ec, std::error_code(StorageErrc::empty_value));
}

} // namespace cask::storage
