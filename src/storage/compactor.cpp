#include "storage/compactor.hpp"

#include "storage/errors.hpp"
#include "storage/record.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <string>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace cask::storage {

namespace fs = std::filesystem;

namespace {

constexpr const char* kMarkerHeader = "caskdb-merge 1";

struct MarkerContents {
    std::string dest;
    std::vector<std::string> sources;  // every source except `dest`
};

[[nodiscard]] std::error_code write_file_synced(const fs::path& path,
                                                const std::string& text) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return {errno, std::system_category()};
    }

    std::size_t written = 0;
    while (written < text.size()) {
        auto n = ::write(fd, text.data() + written, text.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::error_code ec{errno, std::system_category()};
            ::close(fd);
            return ec;
        }
        written += static_cast<std::size_t>(n);
    }

    if (::fsync(fd) < 0) {
        std::error_code ec{errno, std::system_category()};
        ::close(fd);
        return ec;
    }
    ::close(fd);
    return {};
}

// Parses the marker.  Returns merge_incomplete if it is unreadable or
// malformed; there is then no safe way to tell which side won.
[[nodiscard]] std::error_code read_marker(const fs::path& path, MarkerContents& out) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return make_error_code(StorageErrc::merge_incomplete);
    }

    std::string line;
    if (!std::getline(in, line) || line != kMarkerHeader) {
        return make_error_code(StorageErrc::merge_incomplete);
    }

    out = {};
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        const auto space = line.find(' ');
        if (space == std::string::npos) {
            return make_error_code(StorageErrc::merge_incomplete);
        }
        const std::string tag = line.substr(0, space);
        std::string name = line.substr(space + 1);
        if (!parse_segment_file_name(name)) {
            return make_error_code(StorageErrc::merge_incomplete);
        }
        if (tag == "dest") {
            out.dest = std::move(name);
        } else if (tag == "source") {
            out.sources.push_back(std::move(name));
        } else {
            return make_error_code(StorageErrc::merge_incomplete);
        }
    }

    if (out.dest.empty()) {
        return make_error_code(StorageErrc::merge_incomplete);
    }
    return {};
}

} // anonymous namespace

Compactor::Compactor(fs::path dir, std::shared_ptr<spdlog::logger> logger)
    : dir_(std::move(dir)), logger_(std::move(logger)) {}

// ── merge ────────────────────────────────────────────────────────────────────

std::error_code Compactor::merge(const std::vector<fs::path>& sources,
                                 CompactionResult& result) {
    result = {};
    if (sources.size() < 2) {
        return std::make_error_code(std::errc::invalid_argument);
    }

    // Re-open every source with its own handle and a private index; the
    // engine's live handles are left alone until commit().
    std::vector<std::unique_ptr<Segment>> segments;
    std::vector<KeyIndex> indexes(sources.size());
    for (std::size_t i = 0; i < sources.size(); ++i) {
        const auto id = parse_segment_file_name(sources[i].filename().string());
        if (!id) {
            return make_error_code(StorageErrc::invalid_segment_name);
        }
        auto seg = std::make_unique<Segment>(sources[i], *id);
        if (auto ec = seg->open_readonly()) {
            logger_->error("Merge: cannot open {}: {}", sources[i].string(), ec.message());
            return ec;
        }
        RebuildResult rebuilt;
        if (auto ec = indexes[i].rebuild(*seg, rebuilt)) {
            logger_->error("Merge: cannot index {}: {}", sources[i].string(), ec.message());
            return ec;
        }
        result.bytes_before += seg->size();
        segments.push_back(std::move(seg));
    }

    std::error_code fs_ec;
    if (fs::exists(merge_path(), fs_ec)) {
        logger_->info("Merge: stale {} exists, deleting", merge_path().string());
        fs::remove(merge_path(), fs_ec);
        if (fs_ec) return fs_ec;
    }

    const uint64_t dest_id = segments.front()->id();
    Segment merged{merge_path(), dest_id};
    if (auto ec = merged.open()) {
        return ec;
    }

    logger_->info("Merge: compacting {} segments into {}", sources.size(),
                  segment_file_name(dest_id));

    for (std::size_t i = 0; i < indexes.size(); ++i) {
        // Sorted by key for deterministic output.
        std::vector<std::pair<std::string, Location>> entries(indexes[i].begin(),
                                                              indexes[i].end());
        std::sort(entries.begin(), entries.end(),
                  [](const auto& a, const auto& b) { return a.first < b.first; });

        for (const auto& [key, loc] : entries) {
            const bool overwritten = std::any_of(
                indexes.begin() + static_cast<std::ptrdiff_t>(i) + 1, indexes.end(),
                [&key](const KeyIndex& later) { return later.contains(key); });

            logger_->debug("Merge: key={} overwritten={} tombstone={}",
                           key, overwritten, loc.is_tombstone());

            if (overwritten || loc.is_tombstone()) {
                ++result.dropped;
                continue;
            }

            std::string value;
            if (auto ec = segments[i]->read(loc.offset, loc.length, value)) {
                return ec;
            }
            uint64_t offset = 0;
            if (auto ec = merged.append(key, value, offset)) {
                return ec;
            }
            result.index.insert(key, Location{offset, loc.length});
            ++result.live_keys;
        }
    }

    if (auto ec = merged.sync()) {
        return ec;
    }
    result.bytes_after = merged.size();

    logger_->info("Merge: {} live keys kept, {} entries dropped, {} -> {} bytes",
                  result.live_keys, result.dropped,
                  result.bytes_before, result.bytes_after);
    return {};
}

// ── commit ───────────────────────────────────────────────────────────────────

std::error_code Compactor::write_marker(const std::vector<fs::path>& sources) {
    std::string text = kMarkerHeader;
    text += "\ndest " + sources.front().filename().string() + "\n";
    for (std::size_t i = 1; i < sources.size(); ++i) {
        text += "source " + sources[i].filename().string() + "\n";
    }

    auto tmp_path = marker_path();
    tmp_path += ".tmp";

    if (auto ec = write_file_synced(tmp_path, text)) {
        return ec;
    }

    std::error_code ec;
    fs::rename(tmp_path, marker_path(), ec);
    if (ec) {
        fs::remove(tmp_path, ec);
        return ec;
    }
    return fsync_directory(dir_);
}

std::error_code Compactor::commit(const std::vector<fs::path>& sources,
                                  bool& committed) {
    committed = false;
    if (sources.size() < 2) {
        return std::make_error_code(std::errc::invalid_argument);
    }

    if (auto ec = write_marker(sources)) {
        logger_->error("Merge: cannot write commit marker: {}", ec.message());
        return ec;
    }
    committed = true;

    std::error_code ec;
    for (std::size_t i = 1; i < sources.size(); ++i) {
        fs::remove(sources[i], ec);
        if (ec) {
            logger_->error("Merge: cannot delete {}: {}", sources[i].string(), ec.message());
            return ec;
        }
    }

    fs::rename(merge_path(), sources.front(), ec);
    if (ec) {
        logger_->error("Merge: cannot rename {} to {}: {}", merge_path().string(),
                       sources.front().string(), ec.message());
        return ec;
    }
    if (auto sync_ec = fsync_directory(dir_)) {
        return sync_ec;
    }

    fs::remove(marker_path(), ec);
    if (ec) {
        logger_->error("Merge: cannot delete commit marker: {}", ec.message());
        return ec;
    }
    return fsync_directory(dir_);
}

void Compactor::discard() {
    std::error_code ec;
    fs::remove(merge_path(), ec);
    if (ec) {
        logger_->warn("Merge: cannot delete {}: {}", merge_path().string(), ec.message());
    }
}

// ── recover ──────────────────────────────────────────────────────────────────

std::error_code Compactor::recover(const fs::path& dir, spdlog::logger& logger) {
    const fs::path merging = dir / kMergeFileName;
    const fs::path marker = dir / kMergeMarkerName;
    fs::path marker_tmp = marker;
    marker_tmp += ".tmp";

    std::error_code ec;
    fs::remove(marker_tmp, ec);
    if (ec) return ec;

    if (!fs::exists(marker, ec)) {
        if (ec) return ec;
        if (fs::exists(merging, ec)) {
            logger.warn("Recovery: discarding incomplete merge output {}", merging.string());
            fs::remove(merging, ec);
            if (ec) return ec;
        }
        return ec;
    }

    MarkerContents contents;
    if (auto marker_ec = read_marker(marker, contents)) {
        logger.error("Recovery: unreadable commit marker {}", marker.string());
        return marker_ec;
    }

    logger.warn("Recovery: finishing interrupted merge into {}", contents.dest);

    for (const auto& name : contents.sources) {
        fs::remove(dir / name, ec);
        if (ec) return ec;
    }

    if (fs::exists(merging, ec)) {
        fs::rename(merging, dir / contents.dest, ec);
        if (ec) return ec;
    } else if (ec) {
        return ec;
    } else if (!fs::exists(dir / contents.dest, ec)) {
        // Neither the merge output nor its renamed copy survived.
        logger.error("Recovery: merged segment {} is missing", contents.dest);
        return make_error_code(StorageErrc::merge_incomplete);
    }

    if (auto sync_ec = fsync_directory(dir)) {
        return sync_ec;
    }
    fs::remove(marker, ec);
    if (ec) return ec;
    return fsync_directory(dir);
}

} // namespace cask::storage
