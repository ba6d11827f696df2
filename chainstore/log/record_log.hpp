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
#include <chainstore/log/compression.hpp>
#include <chainstore/log/record_locator.hpp>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <vector>

CHAINSTORE_NAMESPACE_BEGIN

class Segment;

struct RecordLogConfig
{
    uint64_t segment_size{64ul << 20};
    RecordCompression compression{RecordCompression::None};
};

struct SegmentScan
{
    std::vector<uint64_t> segments;
    // end of the last complete frame in the tail segment
    uint64_t tail_valid_end{0};
    uint64_t tail_file_size{0};
};

/**
 * Append-only storage of immutable records split over segment files.
 *
 * Every appended record is framed as
 *   be32 payload length | be32 crc32(payload) | u8 codec | payload
 * and synced to disk before its locator is returned. A freshly opened log
 * refuses appends until `reconcile` has aligned the files on disk with the
 * last head committed to the index.
 */
class RecordLog
{
    std::string const name_;
    std::filesystem::path const dir_;
    RecordLogConfig const config_;

    mutable std::shared_mutex segments_mutex_;
    std::map<uint64_t, std::shared_ptr<Segment>> segments_;

    std::mutex write_mutex_;
    std::atomic<bool> ready_{false};

    RecordLog(
        std::string name, std::filesystem::path dir, RecordLogConfig const &);

    std::shared_ptr<Segment> find_segment(uint64_t id) const;
    std::shared_ptr<Segment> active_segment() const;
    Result<std::shared_ptr<Segment>> roll(std::shared_ptr<Segment> const &);

public:
    static Result<std::unique_ptr<RecordLog>> open(
        std::string name, std::filesystem::path const &dir,
        RecordLogConfig const & = {});

    RecordLog(RecordLog const &) = delete;
    RecordLog &operator=(RecordLog const &) = delete;
    ~RecordLog();

    std::string const &name() const
    {
        return name_;
    }

    std::filesystem::path const &dir() const
    {
        return dir_;
    }

    bool is_ready() const
    {
        return ready_.load(std::memory_order_acquire);
    }

    std::vector<uint64_t> segment_ids() const;

    // total bytes over all segments
    uint64_t size() const;

    Result<SegmentScan> scan() const;

    // drop everything written after `committed_head` and enable appends
    Result<void> reconcile(std::optional<RecordLocator> const &committed_head);

    Result<RecordLocator> append(byte_string_view payload);

    Result<byte_string> read(RecordLocator const &) const;

    Result<std::vector<byte_string>>
        read_range(std::span<RecordLocator const>) const;

    Result<void> sync();

    // locator of the first damaged frame in a sealed segment, if any
    Result<std::optional<RecordLocator>> verify_sealed_segments() const;
};

CHAINSTORE_NAMESPACE_END
