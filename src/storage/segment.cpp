#include "storage/segment.hpp"

#include "storage/errors.hpp"

#include <cerrno>
#include <charconv>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace cask::storage {

namespace {

std::error_code make_errno_error() {
    return {errno, std::system_category()};
}

std::error_code make_error(std::errc e) {
    return std::make_error_code(e);
}

[[nodiscard]] std::error_code write_all(int fd, const uint8_t* data, std::size_t len) {
    std::size_t written = 0;
    while (written < len) {
        auto n = ::write(fd, data + written, len - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return make_errno_error();
        }
        written += static_cast<std::size_t>(n);
    }
    return {};
}

// Read exactly `len` bytes at `offset`.  EOF before `len` is an io_error.
[[nodiscard]] std::error_code pread_all(int fd, uint8_t* buf, std::size_t len,
                                        uint64_t offset) {
    std::size_t total = 0;
    while (total < len) {
        auto n = ::pread(fd, buf + total, len - total,
                         static_cast<off_t>(offset + total));
        if (n < 0) {
            if (errno == EINTR) continue;
            return make_errno_error();
        }
        if (n == 0) {
            return make_error(std::errc::io_error);  // unexpected EOF
        }
        total += static_cast<std::size_t>(n);
    }
    return {};
}

} // anonymous namespace

// ── Naming ───────────────────────────────────────────────────────────────────

std::string segment_file_name(uint64_t id) {
    return std::to_string(id) + kSegmentExtension;
}

std::optional<uint64_t> parse_segment_file_name(std::string_view name) {
    const std::string_view ext{kSegmentExtension};
    if (name.size() <= ext.size() ||
        name.substr(name.size() - ext.size()) != ext) {
        return std::nullopt;
    }
    const std::string_view stem = name.substr(0, name.size() - ext.size());
    if (stem.size() > 1 && stem.front() == '0') {
        return std::nullopt;  // "007.log" would alias "7.log"
    }

    uint64_t id = 0;
    auto [ptr, ec] = std::from_chars(stem.data(), stem.data() + stem.size(), id);
    if (ec != std::errc{} || ptr != stem.data() + stem.size()) {
        return std::nullopt;
    }
    return id;
}

std::error_code fsync_directory(const std::filesystem::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return make_errno_error();
    }
    std::error_code ec;
    if (::fsync(fd) < 0) {
        ec = make_errno_error();
    }
    ::close(fd);
    return ec;
}

// ── Segment ──────────────────────────────────────────────────────────────────

Segment::Segment(std::filesystem::path path, uint64_t id, bool sync_writes)
    : path_(std::move(path)), id_(id), sync_writes_(sync_writes) {}

Segment::~Segment() {
    close();
}

std::error_code Segment::open() {
    return open_with(O_RDWR | O_CREAT | O_APPEND | O_CLOEXEC);
}

std::error_code Segment::open_readonly() {
    return open_with(O_RDONLY | O_CLOEXEC);
}

std::error_code Segment::open_with(int flags) {
    if (fd_ != -1) {
        return {};  // Already open.
    }

    fd_ = ::open(path_.c_str(), flags, 0644);
    if (fd_ < 0) {
        fd_ = -1;
        return make_errno_error();
    }

    if (auto ec = refresh_size()) {
        close();
        return ec;
    }
    return {};
}

void Segment::close() {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::error_code Segment::refresh_size() {
    struct stat st {};
    if (::fstat(fd_, &st) < 0) {
        return make_errno_error();
    }
    size_ = static_cast<uint64_t>(st.st_size);
    return {};
}

std::error_code Segment::append(std::string_view key, std::string_view value,
                                uint64_t& value_offset) {
    if (fd_ == -1) return make_error(std::errc::bad_file_descriptor);

    const auto data = encode_record(key, value);
    if (auto ec = write_all(fd_, data.data(), data.size())) {
        // Drop whatever part of the record landed so the next append starts
        // on a record boundary.
        if (::ftruncate(fd_, static_cast<off_t>(size_)) < 0) {
            spdlog::warn("Segment {}: cannot cut partial record after failed append: {}",
                         path_.string(), make_errno_error().message());
            if (auto refresh_ec = refresh_size()) {
                spdlog::warn("Segment {}: cannot re-read size: {}",
                             path_.string(), refresh_ec.message());
            }
        }
        return ec;
    }

    value_offset = size_ + value_offset_in_record(key.size());
    size_ += data.size();

    if (sync_writes_) {
        return sync();
    }
    return {};
}

std::error_code Segment::read(uint64_t offset, uint64_t length,
                              std::string& out) const {
    if (fd_ == -1) return make_error(std::errc::bad_file_descriptor);

    out.assign(static_cast<std::size_t>(length), '\0');
    if (length == 0) {
        return {};
    }
    return pread_all(fd_, reinterpret_cast<uint8_t*>(out.data()),
                     static_cast<std::size_t>(length), offset);
}

std::error_code Segment::iterate(RecordCursor& cursor) const {
    if (fd_ == -1) return make_error(std::errc::bad_file_descriptor);

    struct stat st {};
    if (::fstat(fd_, &st) < 0) {
        return make_errno_error();
    }

    std::vector<uint8_t> data(static_cast<std::size_t>(st.st_size));
    if (!data.empty()) {
        if (auto ec = pread_all(fd_, data.data(), data.size(), 0)) {
            return ec;
        }
    }

    cursor = RecordCursor{std::move(data)};
    return {};
}

std::error_code Segment::dump(std::vector<Record>& out) const {
    out.clear();

    RecordCursor cursor;
    if (auto ec = iterate(cursor)) {
        return ec;
    }

    Record rec;
    while (cursor.next(rec)) {
        out.push_back(std::move(rec));
    }
    return cursor.status();
}

std::error_code Segment::sync() {
    if (fd_ == -1) return make_error(std::errc::bad_file_descriptor);
    if (::fdatasync(fd_) < 0) {
        return make_errno_error();
    }
    return {};
}

std::error_code Segment::truncate(uint64_t length) {
    if (fd_ == -1) return make_error(std::errc::bad_file_descriptor);
    if (::ftruncate(fd_, static_cast<off_t>(length)) < 0) {
        return make_errno_error();
    }
    size_ = length;
    return {};
}

} // namespace cask::storage
