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

#pragma once

#include <chainstore/core/byte_string.hpp>
#include <chainstore/core/config.hpp>
#include <chainstore/core/result.hpp>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

CHAINSTORE_NAMESPACE_BEGIN

std::string segment_file_name(uint64_t id);

bool parse_segment_file_name(std::string const &, uint64_t &id);

/**
 * One file of a record log. Only the owning log's writer appends or
 * truncates; readers use positional reads bounded by `size()`, which is
 * published after the bytes are written.
 */
class Segment
{
    uint64_t const id_;
    std::filesystem::path const path_;
    int fd_;
    std::atomic<uint64_t> size_;
    std::atomic<bool> sealed_;

    Segment(uint64_t id, std::filesystem::path path, int fd, uint64_t size);

public:
    static Result<std::shared_ptr<Segment>>
    create(std::filesystem::path const &dir, uint64_t id);
    static Result<std::shared_ptr<Segment>>
    open(std::filesystem::path const &dir, uint64_t id);

    Segment(Segment const &) = delete;
    Segment &operator=(Segment const &) = delete;
    ~Segment();

    uint64_t id() const
    {
        return id_;
    }

    std::filesystem::path const &path() const
    {
        return path_;
    }

    uint64_t size() const
    {
        return size_.load(std::memory_order_acquire);
    }

    bool is_sealed() const
    {
        return sealed_.load(std::memory_order_acquire);
    }

    // returns the offset the bytes were written at
    Result<uint64_t> append(byte_string_view);

    Result<void> read(uint64_t offset, unsigned char *buf, size_t len) const;

    Result<void> sync();

    // sync and mark read only
    Result<void> seal();

    Result<void> truncate(uint64_t size);
};

// fsync a directory so that created and removed entries are durable
Result<void> sync_directory(std::filesystem::path const &);

CHAINSTORE_NAMESPACE_END
