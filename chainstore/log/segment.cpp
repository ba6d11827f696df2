// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <chainstore/core/assert.h>
#include <chainstore/core/byte_string.hpp>
#include <chainstore/core/result.hpp>
#include <chainstore/core/store_error.hpp>
#include <chainstore/log/segment.hpp>

#include <boost/outcome/try.hpp>
#include <quill/Quill.h>

#include <fmt/format.h>

#include <cerrno>
#include <charconv>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

CHAINSTORE_NAMESPACE_BEGIN

namespace
{
    constexpr std::string_view segment_prefix = "segment_";
    constexpr std::string_view segment_suffix = ".log";
}

std::string segment_file_name(uint64_t const id)
{
    return fmt::format("{}{:020}{}", segment_prefix, id, segment_suffix);
}

bool parse_segment_file_name(std::string const &name, uint64_t &id)
{
    if (name.size() <= segment_prefix.size() + segment_suffix.size() ||
        !name.starts_with(segment_prefix) || !name.ends_with(segment_suffix)) {
        return false;
    }
    char const *const begin = name.data() + segment_prefix.size();
    char const *const end = name.data() + name.size() - segment_suffix.size();
    auto const [ptr, ec] = std::from_chars(begin, end, id);
    return ec == std::errc{} && ptr == end;
}

Segment::Segment(
    uint64_t const id, std::filesystem::path path, int const fd,
    uint64_t const size)
    : id_{id}
    , path_{std::move(path)}
    , fd_{fd}
    , size_{size}
    , sealed_{false}
{
}

Segment::~Segment()
{
    if (fd_ != -1) {
        ::close(fd_);
    }
}

Result<std::shared_ptr<Segment>>
Segment::create(std::filesystem::path const &dir, uint64_t const id)
{
    auto path = dir / segment_file_name(id);
    int const fd =
        ::open(path.c_str(), O_RDWR | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd == -1) {
        LOG_ERROR(
            "failed to create segment {}: {}", path.string(), strerror(errno));
        return StoreError::IoFailure;
    }
    return std::shared_ptr<Segment>{new Segment{id, std::move(path), fd, 0}};
}

Result<std::shared_ptr<Segment>>
Segment::open(std::filesystem::path const &dir, uint64_t const id)
{
    auto path = dir / segment_file_name(id);
    int const fd = ::open(path.c_str(), O_RDWR | O_CLOEXEC);
    if (fd == -1) {
        LOG_ERROR(
            "failed to open segment {}: {}", path.string(), strerror(errno));
        return StoreError::IoFailure;
    }
    struct stat st;
    if (::fstat(fd, &st) == -1) {
        LOG_ERROR(
            "failed to stat segment {}: {}", path.string(), strerror(errno));
        ::close(fd);
        return StoreError::IoFailure;
    }
    return std::shared_ptr<Segment>{new Segment{
        id, std::move(path), fd, static_cast<uint64_t>(st.st_size)}};
}

Result<uint64_t> Segment::append(byte_string_view const bytes)
{
    CHAINSTORE_ASSERT(!is_sealed());
    uint64_t const offset = size_.load(std::memory_order_relaxed);
    size_t written = 0;
    while (written < bytes.size()) {
        ssize_t const n = ::pwrite(
            fd_,
            bytes.data() + written,
            bytes.size() - written,
            static_cast<off_t>(offset + written));
        if (n == -1) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR(
                "write to segment {} failed: {}",
                path_.string(),
                strerror(errno));
            return StoreError::IoFailure;
        }
        written += static_cast<size_t>(n);
    }
    if (::fdatasync(fd_) == -1) {
        LOG_ERROR(
            "fdatasync of segment {} failed: {}",
            path_.string(),
            strerror(errno));
        return StoreError::IoFailure;
    }
    size_.store(offset + bytes.size(), std::memory_order_release);
    return offset;
}

Result<void> Segment::read(
    uint64_t const offset, unsigned char *const buf, size_t const len) const
{
    if (offset + len > size()) {
        return StoreError::Corrupted;
    }
    size_t done = 0;
    while (done < len) {
        ssize_t const n = ::pread(
            fd_, buf + done, len - done, static_cast<off_t>(offset + done));
        if (n == -1) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR(
                "read from segment {} failed: {}",
                path_.string(),
                strerror(errno));
            return StoreError::IoFailure;
        }
        if (n == 0) {
            // file shorter than the published size
            return StoreError::Corrupted;
        }
        done += static_cast<size_t>(n);
    }
    return success();
}

Result<void> Segment::sync()
{
    if (::fsync(fd_) == -1) {
        LOG_ERROR(
            "fsync of segment {} failed: {}", path_.string(), strerror(errno));
        return StoreError::IoFailure;
    }
    return success();
}

Result<void> Segment::seal()
{
    BOOST_OUTCOME_TRY(sync());
    sealed_.store(true, std::memory_order_release);
    return success();
}

Result<void> Segment::truncate(uint64_t const size)
{
    CHAINSTORE_ASSERT(size <= this->size());
    if (::ftruncate(fd_, static_cast<off_t>(size)) == -1) {
        LOG_ERROR(
            "truncate of segment {} to {} failed: {}",
            path_.string(),
            size,
            strerror(errno));
        return StoreError::IoFailure;
    }
    size_.store(size, std::memory_order_release);
    return sync();
}

Result<void> sync_directory(std::filesystem::path const &dir)
{
    int const fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd == -1) {
        LOG_ERROR("failed to open dir {}: {}", dir.string(), strerror(errno));
        return StoreError::IoFailure;
    }
    int const rc = ::fsync(fd);
    int const err = errno;
    ::close(fd);
    if (rc == -1) {
        LOG_ERROR("fsync of dir {} failed: {}", dir.string(), strerror(err));
        return StoreError::IoFailure;
    }
    return success();
}

CHAINSTORE_NAMESPACE_END
