#include "storage/errors.hpp"
#include "storage/key_index.hpp"
#include "storage/segment.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include <gtest/gtest.h>

namespace cask::storage {

// ── In-memory operations ─────────────────────────────────────────────────────

TEST(KeyIndexTest, GetMissingKeyReturnsNullopt) {
    KeyIndex index;
    EXPECT_FALSE(index.get("nope").has_value());
    EXPECT_FALSE(index.contains("nope"));
    EXPECT_EQ(index.size(), 0u);
}

TEST(KeyIndexTest, InsertOverwritesSameKey) {
    KeyIndex index;
    index.insert("k", Location{10, 3});
    index.insert("k", Location{40, 5});

    ASSERT_EQ(index.size(), 1u);
    auto loc = index.get("k");
    ASSERT_TRUE(loc.has_value());
    EXPECT_EQ(*loc, (Location{40, 5}));
}

TEST(KeyIndexTest, TombstoneSentinel) {
    KeyIndex index;
    index.insert("gone", Location::tombstone());
    auto loc = index.get("gone");
    ASSERT_TRUE(loc.has_value());
    EXPECT_TRUE(loc->is_tombstone());
    EXPECT_EQ(loc->offset, 0u);
    EXPECT_EQ(loc->length, 0u);
    EXPECT_TRUE(index.contains("gone"));
}

TEST(KeyIndexTest, RemoveAndClear) {
    KeyIndex index;
    index.insert("a", Location{1, 1});
    index.insert("b", Location{2, 1});
    index.remove("a");
    EXPECT_FALSE(index.contains("a"));
    EXPECT_EQ(index.size(), 1u);
    index.remove("missing");  // no-op
    index.clear();
    EXPECT_EQ(index.size(), 0u);
}

TEST(KeyIndexTest, LookupBySliceOfLargerBuffer) {
    KeyIndex index;
    index.insert("user:42", Location{8, 2});

    const std::string line = "get user:42 extra";
    const std::string_view key = std::string_view(line).substr(4, 7);
    ASSERT_EQ(key, "user:42");

    EXPECT_TRUE(index.contains(key));
    ASSERT_TRUE(index.get(key).has_value());
    EXPECT_EQ(*index.get(key), (Location{8, 2}));
    EXPECT_FALSE(index.contains(std::string_view(line).substr(4, 6)));

    index.remove(key);
    EXPECT_FALSE(index.contains("user:42"));
}

// ── rebuild ──────────────────────────────────────────────────────────────────

class KeyIndexRebuildTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("key_index_test_" + std::string(info->name()));
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
        segment_ = std::make_unique<Segment>(test_dir_ / "0.log", 0);
        ASSERT_FALSE(segment_->open());
    }

    void TearDown() override {
        segment_.reset();
        std::filesystem::remove_all(test_dir_);
    }

    uint64_t append(const std::string& key, const std::string& value) {
        uint64_t offset = 0;
        EXPECT_FALSE(segment_->append(key, value, offset));
        return offset;
    }

    std::filesystem::path test_dir_;
    std::unique_ptr<Segment> segment_;
};

TEST_F(KeyIndexRebuildTest, EmptySegment) {
    KeyIndex index;
    RebuildResult result;
    ASSERT_FALSE(index.rebuild(*segment_, result));
    EXPECT_EQ(result.records, 0u);
    EXPECT_EQ(result.valid_bytes, 0u);
    EXPECT_EQ(index.size(), 0u);
}

TEST_F(KeyIndexRebuildTest, LastRecordInSegmentWins) {
    append("k", "first");
    const auto second = append("k", "second!");
    const auto other = append("other", "x");

    KeyIndex index;
    RebuildResult result;
    ASSERT_FALSE(index.rebuild(*segment_, result));
    EXPECT_EQ(result.records, 3u);
    EXPECT_EQ(result.valid_bytes, segment_->size());
    ASSERT_EQ(index.size(), 2u);
    EXPECT_EQ(*index.get("k"), (Location{second, 7}));
    EXPECT_EQ(*index.get("other"), (Location{other, 1}));
}

TEST_F(KeyIndexRebuildTest, EmptyValueBecomesTombstone) {
    append("k", "v");
    append("k", "");

    KeyIndex index;
    RebuildResult result;
    ASSERT_FALSE(index.rebuild(*segment_, result));
    auto loc = index.get("k");
    ASSERT_TRUE(loc.has_value());
    EXPECT_TRUE(loc->is_tombstone());
}

TEST_F(KeyIndexRebuildTest, RebuildReplacesPreviousContents) {
    append("fresh", "1");

    KeyIndex index;
    index.insert("stale", Location{99, 1});
    RebuildResult result;
    ASSERT_FALSE(index.rebuild(*segment_, result));
    EXPECT_FALSE(index.contains("stale"));
    EXPECT_TRUE(index.contains("fresh"));
}

TEST_F(KeyIndexRebuildTest, CorruptTailKeepsEarlierEntries) {
    append("a", "1");
    append("b", "2");
    const auto good = segment_->size();

    int fd = ::open((test_dir_ / "0.log").c_str(), O_WRONLY | O_APPEND);
    ASSERT_GE(fd, 0);
    const uint8_t partial[] = {0, 0, 0, 0, 0};
    ASSERT_EQ(::write(fd, partial, sizeof(partial)), 5);
    ::close(fd);

    KeyIndex index;
    RebuildResult result;
    EXPECT_EQ(index.rebuild(*segment_, result), StorageErrc::corrupt_segment);
    EXPECT_EQ(result.records, 2u);
    EXPECT_EQ(result.valid_bytes, good);
    EXPECT_TRUE(index.contains("a"));
    EXPECT_TRUE(index.contains("b"));
}

} // namespace cask::storage
