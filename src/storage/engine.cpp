#include "storage/engine.hpp"

#include "storage/errors.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace cask::storage {

namespace fs = std::filesystem;

Engine::Engine(fs::path directory, EngineOptions options,
               std::shared_ptr<spdlog::logger> logger)
    : directory_(std::move(directory)),
      options_(options),
      logger_(std::move(logger)) {}

// ── open ─────────────────────────────────────────────────────────────────────

std::error_code Engine::open() {
    if (is_open()) {
        return {};  // Already open.
    }

    if (options_.segment_size_limit == 0 || options_.max_segments < 2) {
        return std::make_error_code(std::errc::invalid_argument);
    }

    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        logger_->error("Cannot create data directory {}: {}",
                       directory_.string(), ec.message());
        return ec;
    }

    if (auto recover_ec = Compactor::recover(directory_, *logger_)) {
        return recover_ec;
    }

    if (auto load_ec = load_segments()) {
        slots_.clear();
        return load_ec;
    }

    if (slots_.empty()) {
        if (auto grow_ec = grow()) {
            slots_.clear();
            return grow_ec;
        }
    }
    return {};
}

std::error_code Engine::load_segments() {
    std::vector<std::pair<uint64_t, fs::path>> found;

    std::error_code ec;
    for (fs::directory_iterator it{directory_, ec}, end; !ec && it != end; it.increment(ec)) {
        const auto& path = it->path();
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec) || path.extension() != kSegmentExtension) {
            continue;
        }
        const auto id = parse_segment_file_name(path.filename().string());
        if (!id) {
            if (options_.recovery == RecoveryMode::strict) {
                logger_->error("Invalid segment file name {}", path.string());
                return make_error_code(StorageErrc::invalid_segment_name);
            }
            logger_->warn("Skipping {}: not a segment file name", path.string());
            continue;
        }
        found.emplace_back(*id, path);
    }
    if (ec) {
        logger_->error("Cannot list {}: {}", directory_.string(), ec.message());
        return ec;
    }

    std::sort(found.begin(), found.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::size_t records = 0;
    for (const auto& [id, path] : found) {
        logger_->info("Reading segment {}", path.string());
        Slot slot;
        if (auto slot_ec = open_slot(path, id, slot, records)) {
            return slot_ec;
        }
        slots_.push_back(std::move(slot));
    }

    std::size_t keys = 0;
    for (const auto& slot : slots_) {
        keys += slot.index.size();
    }
    logger_->info("Processed {} entries, {} index entries rebuilt across {} segments",
                  records, keys, slots_.size());
    return {};
}

std::error_code Engine::open_slot(const fs::path& path, uint64_t id, Slot& slot,
                                  std::size_t& records) {
    slot.segment = std::make_unique<Segment>(path, id, options_.sync_writes);
    if (auto ec = slot.segment->open()) {
        logger_->error("Cannot open segment {}: {}", path.string(), ec.message());
        return ec;
    }

    RebuildResult rebuilt;
    auto ec = slot.index.rebuild(*slot.segment, rebuilt);
    records += rebuilt.records;

    if (ec == StorageErrc::corrupt_segment) {
        if (options_.recovery == RecoveryMode::strict) {
            logger_->error("Segment {} is corrupt after byte {}", path.string(),
                           rebuilt.valid_bytes);
            return ec;
        }
        logger_->warn("Segment {}: dropping incomplete tail ({} of {} bytes kept)",
                      path.string(), rebuilt.valid_bytes, slot.segment->size());
        return slot.segment->truncate(rebuilt.valid_bytes);
    }
    return ec;
}

// ── Writes ───────────────────────────────────────────────────────────────────

std::error_code Engine::grow() {
    if (!slots_.empty() && !active().segment->is_open()) {
        return make_error_code(StorageErrc::engine_closed);
    }

    uint64_t next_id = 0;
    for (const auto& slot : slots_) {
        next_id = std::max(next_id, slot.segment->id() + 1);
    }

    const fs::path path = directory_ / segment_file_name(next_id);
    std::error_code ec;
    if (fs::exists(path, ec)) {
        logger_->error("Cannot create segment {}: file exists", path.string());
        return std::make_error_code(std::errc::file_exists);
    }
    if (ec) return ec;

    Slot slot;
    slot.segment = std::make_unique<Segment>(path, next_id, options_.sync_writes);
    if (auto open_ec = slot.segment->open()) {
        logger_->error("Cannot create segment {}: {}", path.string(), open_ec.message());
        return open_ec;
    }
    slots_.push_back(std::move(slot));

    logger_->info("Rotated to segment {} ({} segments)", next_id, slots_.size());
    return {};
}

std::error_code Engine::set(std::string_view key, std::string_view value) {
    if (!is_open()) return make_error_code(StorageErrc::engine_closed);
    if (value.empty()) return make_error_code(StorageErrc::empty_value);

    if (active().segment->size() >= options_.segment_size_limit) {
        if (auto ec = grow()) {
            return ec;
        }
    }

    while (slots_.size() > options_.max_segments) {
        if (auto ec = compact_oldest()) {
            return ec;
        }
    }

    uint64_t offset = 0;
    if (auto ec = active().segment->append(key, value, offset)) {
        return ec;
    }
    active().index.insert(std::string(key), Location{offset, value.size()});
    return {};
}

std::error_code Engine::del(std::string_view key, bool& deleted) {
    deleted = false;

    std::optional<std::string> current;
    if (auto ec = get(key, current)) {
        return ec;
    }
    if (!current) {
        return {};
    }

    uint64_t offset = 0;
    if (auto ec = active().segment->append(key, {}, offset)) {
        return ec;
    }
    active().index.insert(std::string(key), Location::tombstone());
    deleted = true;
    return {};
}

std::error_code Engine::del(std::string_view key) {
    bool deleted = false;
    return del(key, deleted);
}

// ── Reads ────────────────────────────────────────────────────────────────────

std::error_code Engine::get(std::string_view key,
                            std::optional<std::string>& value) const {
    value.reset();
    if (!is_open()) return make_error_code(StorageErrc::engine_closed);

    for (auto it = slots_.rbegin(); it != slots_.rend(); ++it) {
        const auto loc = it->index.get(key);
        if (!loc) {
            continue;
        }
        if (loc->is_tombstone()) {
            return {};
        }
        std::string bytes;
        if (auto ec = it->segment->read(loc->offset, loc->length, bytes)) {
            return ec;
        }
        value = std::move(bytes);
        return {};
    }
    return {};
}

std::error_code Engine::dump(std::vector<SegmentDump>& out) const {
    out.clear();
    if (!is_open()) return make_error_code(StorageErrc::engine_closed);

    for (const auto& slot : slots_) {
        SegmentDump entry;
        entry.id = slot.segment->id();
        entry.path = slot.segment->path();
        if (auto ec = slot.segment->dump(entry.records)) {
            return ec;
        }
        out.push_back(std::move(entry));
    }
    return {};
}

EngineStats Engine::stats() const {
    EngineStats s;
    s.segments = slots_.size();
    s.compactions = compactions_;

    std::unordered_set<std::string> seen;
    for (auto it = slots_.rbegin(); it != slots_.rend(); ++it) {
        s.indexed_keys += it->index.size();
        s.total_bytes += it->segment->size();
        for (const auto& [key, loc] : it->index) {
            if (seen.insert(key).second && !loc.is_tombstone()) {
                ++s.live_keys;
            }
        }
    }
    return s;
}

std::vector<uint64_t> Engine::segment_ids() const {
    std::vector<uint64_t> ids;
    ids.reserve(slots_.size());
    for (const auto& slot : slots_) {
        ids.push_back(slot.segment->id());
    }
    return ids;
}

// ── Compaction ───────────────────────────────────────────────────────────────

std::error_code Engine::compact() {
    if (!is_open()) return make_error_code(StorageErrc::engine_closed);
    // The active segment never takes part in a merge.
    if (slots_.size() < 3) {
        return {};
    }
    return compact_oldest();
}

std::error_code Engine::compact_oldest() {
    const std::vector<fs::path> sources{slots_[0].segment->path(),
                                        slots_[1].segment->path()};
    const uint64_t dest_id = slots_[0].segment->id();

    Compactor compactor{directory_, logger_};
    CompactionResult result;
    if (auto ec = compactor.merge(sources, result)) {
        logger_->error("Merge of {} and {} failed: {}", sources[0].string(),
                       sources[1].string(), ec.message());
        compactor.discard();
        return ec;
    }

    // Close our handles before the files are replaced.
    slots_[0].segment->close();
    slots_[1].segment->close();

    bool committed = false;
    if (auto ec = compactor.commit(sources, committed)) {
        if (!committed) {
            // Nothing on disk changed; carry on with the old pair.
            compactor.discard();
            for (std::size_t i = 0; i < 2; ++i) {
                if (auto reopen_ec = slots_[i].segment->open()) {
                    logger_->error("Cannot reopen {}: {}; closing engine",
                                   sources[i].string(), reopen_ec.message());
                    slots_.clear();
                    return reopen_ec;
                }
            }
            return ec;
        }
        logger_->error("Merge swap interrupted ({}), rolling forward", ec.message());
        if (auto recover_ec = Compactor::recover(directory_, *logger_)) {
            // The directory is between the old and the new segment set; only
            // a fresh open() can tell which files are live.
            logger_->error("Cannot finish merge swap: {}; closing engine",
                           recover_ec.message());
            slots_.clear();
            return recover_ec;
        }
    }

    Slot merged;
    merged.segment = std::make_unique<Segment>(sources.front(), dest_id,
                                               options_.sync_writes);
    merged.index = std::move(result.index);
    if (auto open_ec = merged.segment->open()) {
        logger_->error("Cannot reopen merged segment {}: {}; closing engine",
                       sources.front().string(), open_ec.message());
        slots_.clear();
        return open_ec;
    }

    slots_.erase(slots_.begin() + 1);
    slots_.front() = std::move(merged);
    ++compactions_;
    return {};
}

} // namespace cask::storage
