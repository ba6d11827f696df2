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
#include <chainstore/log/compression.hpp>
#include <chainstore/log/record_locator.hpp>
#include <chainstore/log/record_log.hpp>
#include <chainstore/log/segment.hpp>

#include <boost/crc.hpp>
#include <boost/endian/conversion.hpp>
#include <boost/outcome/try.hpp>
#include <quill/Quill.h>

#include <fmt/format.h>

#include <cstdint>
#include <filesystem>
#include <iterator>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

CHAINSTORE_NAMESPACE_BEGIN

namespace
{
    constexpr uint8_t CODEC_RAW = 0;
    constexpr uint8_t CODEC_BROTLI = 1;

    struct FrameHeader
    {
        uint32_t length;
        uint32_t crc;
        uint8_t codec;
    };

    uint32_t crc32(byte_string_view const data)
    {
        boost::crc_32_type crc;
        crc.process_bytes(data.data(), data.size());
        return crc.checksum();
    }

    FrameHeader load_frame_header(unsigned char const *const p)
    {
        return FrameHeader{
            .length = boost::endian::load_big_u32(p),
            .crc = boost::endian::load_big_u32(p + 4),
            .codec = p[8]};
    }

    Result<byte_string>
    decode_frame_payload(FrameHeader const &header, byte_string_view const body)
    {
        if (body.size() != header.length || crc32(body) != header.crc) {
            return StoreError::Corrupted;
        }
        switch (header.codec) {
        case CODEC_RAW:
            return byte_string{body};
        case CODEC_BROTLI:
            return brotli_decompress(body);
        default:
            return StoreError::Corrupted;
        }
    }

    Result<byte_string>
    read_frame(Segment const &segment, RecordLocator const &loc)
    {
        uint64_t const size = segment.size();
        if (loc.offset > size || loc.length > size ||
            frame_end(loc) > size) {
            return StoreError::Corrupted;
        }
        byte_string buf(RECORD_FRAME_HEADER_SIZE + loc.length, 0);
        BOOST_OUTCOME_TRY(segment.read(loc.offset, buf.data(), buf.size()));
        auto const header = load_frame_header(buf.data());
        if (header.length != loc.length) {
            return StoreError::Corrupted;
        }
        return decode_frame_payload(
            header, byte_string_view{buf}.substr(RECORD_FRAME_HEADER_SIZE));
    }

    struct FrameWalk
    {
        uint64_t valid_end{0};
        std::optional<RecordLocator> damaged{};
    };

    // walks frames from the start of the segment up to the first incomplete
    // or damaged one
    Result<FrameWalk> walk_frames(Segment const &segment)
    {
        FrameWalk walk;
        uint64_t const size = segment.size();
        unsigned char header_buf[RECORD_FRAME_HEADER_SIZE];
        byte_string body;
        while (walk.valid_end < size) {
            uint64_t const offset = walk.valid_end;
            if (offset + RECORD_FRAME_HEADER_SIZE > size) {
                walk.damaged = RecordLocator{segment.id(), offset, 0};
                break;
            }
            BOOST_OUTCOME_TRY(
                segment.read(offset, header_buf, RECORD_FRAME_HEADER_SIZE));
            auto const header = load_frame_header(header_buf);
            RecordLocator const loc{segment.id(), offset, header.length};
            if (frame_end(loc) > size) {
                walk.damaged = loc;
                break;
            }
            body.resize(header.length);
            BOOST_OUTCOME_TRY(segment.read(
                offset + RECORD_FRAME_HEADER_SIZE, body.data(), body.size()));
            if (crc32(body) != header.crc) {
                walk.damaged = loc;
                break;
            }
            walk.valid_end = frame_end(loc);
        }
        return walk;
    }

    Result<void> remove_segment(Segment const &segment)
    {
        std::error_code ec;
        std::filesystem::remove(segment.path(), ec);
        if (ec) {
            LOG_ERROR(
                "failed to remove segment {}: {}",
                segment.path().string(),
                ec.message());
            return StoreError::IoFailure;
        }
        return success();
    }
}

RecordLog::RecordLog(
    std::string name, std::filesystem::path dir,
    RecordLogConfig const &config)
    : name_{std::move(name)}
    , dir_{std::move(dir)}
    , config_{config}
{
}

RecordLog::~RecordLog() = default;

Result<std::unique_ptr<RecordLog>> RecordLog::open(
    std::string name, std::filesystem::path const &dir,
    RecordLogConfig const &config)
{
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        LOG_ERROR(
            "failed to create record log dir {}: {}",
            dir.string(),
            ec.message());
        return StoreError::IoFailure;
    }
    std::unique_ptr<RecordLog> log{
        new RecordLog{std::move(name), dir, config}};
    std::filesystem::directory_iterator it{dir, ec};
    for (; !ec && it != std::filesystem::directory_iterator{};
         it.increment(ec)) {
        uint64_t id;
        if (!parse_segment_file_name(it->path().filename().string(), id)) {
            continue;
        }
        bool const regular = it->is_regular_file(ec);
        if (ec) {
            break;
        }
        if (!regular) {
            continue;
        }
        BOOST_OUTCOME_TRY(auto segment, Segment::open(dir, id));
        log->segments_.emplace(id, std::move(segment));
    }
    if (ec) {
        LOG_ERROR(
            "failed to list record log dir {}: {}", dir.string(), ec.message());
        return StoreError::IoFailure;
    }
    LOG_INFO(
        "opened record log {} with {} segments",
        log->name_,
        log->segments_.size());
    return log;
}

std::shared_ptr<Segment> RecordLog::find_segment(uint64_t const id) const
{
    std::shared_lock const lock{segments_mutex_};
    auto const it = segments_.find(id);
    return it == segments_.end() ? nullptr : it->second;
}

std::shared_ptr<Segment> RecordLog::active_segment() const
{
    std::shared_lock const lock{segments_mutex_};
    CHAINSTORE_ASSERT(!segments_.empty());
    return segments_.rbegin()->second;
}

std::vector<uint64_t> RecordLog::segment_ids() const
{
    std::shared_lock const lock{segments_mutex_};
    std::vector<uint64_t> ids;
    ids.reserve(segments_.size());
    for (auto const &[id, segment] : segments_) {
        ids.push_back(id);
    }
    return ids;
}

uint64_t RecordLog::size() const
{
    std::shared_lock const lock{segments_mutex_};
    uint64_t total = 0;
    for (auto const &[id, segment] : segments_) {
        total += segment->size();
    }
    return total;
}

Result<SegmentScan> RecordLog::scan() const
{
    SegmentScan scan;
    std::shared_ptr<Segment> tail;
    {
        std::shared_lock const lock{segments_mutex_};
        for (auto const &[id, segment] : segments_) {
            scan.segments.push_back(id);
        }
        if (!segments_.empty()) {
            tail = segments_.rbegin()->second;
        }
    }
    if (tail) {
        BOOST_OUTCOME_TRY(auto const walk, walk_frames(*tail));
        scan.tail_valid_end = walk.valid_end;
        scan.tail_file_size = tail->size();
    }
    return scan;
}

Result<void>
RecordLog::reconcile(std::optional<RecordLocator> const &committed_head)
{
    std::lock_guard const write_lock{write_mutex_};
    std::unique_lock const lock{segments_mutex_};

    if (!committed_head.has_value()) {
        // nothing was ever indexed, so every byte on disk is orphaned
        for (auto const &[id, segment] : segments_) {
            LOG_WARNING(
                "{}: discarding unindexed segment {} ({} bytes)",
                name_,
                id,
                segment->size());
            BOOST_OUTCOME_TRY(remove_segment(*segment));
        }
        segments_.clear();
        BOOST_OUTCOME_TRY(auto segment, Segment::create(dir_, 0));
        segments_.emplace(0, std::move(segment));
        BOOST_OUTCOME_TRY(sync_directory(dir_));
        ready_.store(true, std::memory_order_release);
        return success();
    }

    RecordLocator const &head = *committed_head;
    auto const head_it = segments_.find(head.segment);
    if (head_it == segments_.end()) {
        LOG_ERROR(
            "{}: committed head {} names a missing segment",
            name_,
            fmt::format("{}", head));
        return StoreError::Corrupted;
    }
    auto const head_segment = head_it->second;
    uint64_t const head_end = frame_end(head);
    if (head_segment->size() < head_end) {
        LOG_ERROR(
            "{}: committed head {} is past the end of its segment ({} bytes)",
            name_,
            fmt::format("{}", head),
            head_segment->size());
        return StoreError::Corrupted;
    }
    if (auto const res = read_frame(*head_segment, head); res.has_error()) {
        LOG_ERROR(
            "{}: committed head {} is damaged",
            name_,
            fmt::format("{}", head));
        return StoreError::Corrupted;
    }

    bool removed = false;
    for (auto it = std::next(head_it); it != segments_.end();) {
        LOG_WARNING(
            "{}: discarding segment {} written past the committed head",
            name_,
            it->first);
        BOOST_OUTCOME_TRY(remove_segment(*it->second));
        it = segments_.erase(it);
        removed = true;
    }
    if (removed) {
        BOOST_OUTCOME_TRY(sync_directory(dir_));
    }
    if (head_segment->size() > head_end) {
        LOG_WARNING(
            "{}: truncating {} unindexed bytes from segment {}",
            name_,
            head_segment->size() - head_end,
            head.segment);
        BOOST_OUTCOME_TRY(head_segment->truncate(head_end));
    }
    for (auto const &[id, segment] : segments_) {
        if (id != head.segment) {
            BOOST_OUTCOME_TRY(segment->seal());
        }
    }
    ready_.store(true, std::memory_order_release);
    return success();
}

Result<std::shared_ptr<Segment>>
RecordLog::roll(std::shared_ptr<Segment> const &current)
{
    uint64_t const next_id = current->id() + 1;
    auto const next_path = dir_ / segment_file_name(next_id);

    // a file under the next id that is not in the segment table was left by
    // an earlier roll that failed before registering it and holds no records
    std::error_code ec;
    if (std::filesystem::is_regular_file(next_path, ec)) {
        LOG_WARNING(
            "{}: removing leftover segment file {}",
            name_,
            next_path.string());
        std::filesystem::remove(next_path, ec);
        if (ec) {
            LOG_ERROR(
                "failed to remove {}: {}", next_path.string(), ec.message());
            return StoreError::IoFailure;
        }
    }

    BOOST_OUTCOME_TRY(auto next, Segment::create(dir_, next_id));
    auto discard_next = [&next] {
        std::error_code remove_ec;
        std::filesystem::remove(next->path(), remove_ec);
    };
    if (auto res = sync_directory(dir_); res.has_error()) {
        discard_next();
        return std::move(res).error();
    }
    // `current` stays active and unsealed until its successor is durable
    if (auto res = current->seal(); res.has_error()) {
        discard_next();
        return std::move(res).error();
    }
    {
        std::unique_lock const lock{segments_mutex_};
        segments_.emplace(next_id, next);
    }
    LOG_INFO(
        "{}: sealed segment {} at {} bytes",
        name_,
        current->id(),
        current->size());
    return next;
}

Result<RecordLocator> RecordLog::append(byte_string_view const payload)
{
    if (!is_ready()) {
        return StoreError::NotReady;
    }

    byte_string compressed;
    byte_string_view body = payload;
    uint8_t codec = CODEC_RAW;
    if (config_.compression == RecordCompression::Brotli) {
        BOOST_OUTCOME_TRY(compressed, brotli_compress(payload));
        body = compressed;
        codec = CODEC_BROTLI;
    }
    if (body.size() > std::numeric_limits<uint32_t>::max()) {
        return StoreError::SerializationError;
    }

    byte_string frame;
    frame.resize(RECORD_FRAME_HEADER_SIZE);
    boost::endian::store_big_u32(
        frame.data(), static_cast<uint32_t>(body.size()));
    boost::endian::store_big_u32(frame.data() + 4, crc32(body));
    frame[8] = codec;
    frame.append(body);

    std::lock_guard const lock{write_mutex_};
    auto segment = active_segment();
    if (segment->size() > 0 &&
        segment->size() + frame.size() > config_.segment_size) {
        BOOST_OUTCOME_TRY(segment, roll(segment));
    }
    BOOST_OUTCOME_TRY(auto const offset, segment->append(frame));
    return RecordLocator{segment->id(), offset, body.size()};
}

Result<byte_string> RecordLog::read(RecordLocator const &loc) const
{
    auto const segment = find_segment(loc.segment);
    if (!segment) {
        LOG_ERROR(
            "{}: {} names an unknown segment", name_, fmt::format("{}", loc));
        return StoreError::Corrupted;
    }
    return read_frame(*segment, loc);
}

Result<std::vector<byte_string>>
RecordLog::read_range(std::span<RecordLocator const> const locators) const
{
    std::vector<byte_string> records;
    records.reserve(locators.size());
    size_t next = 0;
    for (auto const &range : fold_consecutive_locators(locators)) {
        auto const segment = find_segment(range.segment);
        if (!segment || range.offset + range.byte_length > segment->size()) {
            return StoreError::Corrupted;
        }
        byte_string buf(range.byte_length, 0);
        BOOST_OUTCOME_TRY(
            segment->read(range.offset, buf.data(), buf.size()));
        byte_string_view rest{buf};
        for (uint32_t i = 0; i < range.count; ++i, ++next) {
            auto const &loc = locators[next];
            auto const header = load_frame_header(rest.data());
            if (header.length != loc.length) {
                return StoreError::Corrupted;
            }
            BOOST_OUTCOME_TRY(
                auto record,
                decode_frame_payload(
                    header,
                    rest.substr(RECORD_FRAME_HEADER_SIZE, loc.length)));
            records.push_back(std::move(record));
            rest.remove_prefix(RECORD_FRAME_HEADER_SIZE + loc.length);
        }
    }
    CHAINSTORE_ASSERT(next == locators.size());
    return records;
}

Result<void> RecordLog::sync()
{
    if (!is_ready()) {
        return success();
    }
    std::lock_guard const lock{write_mutex_};
    return active_segment()->sync();
}

Result<std::optional<RecordLocator>> RecordLog::verify_sealed_segments() const
{
    std::vector<std::shared_ptr<Segment>> sealed;
    {
        std::shared_lock const lock{segments_mutex_};
        for (auto const &[id, segment] : segments_) {
            if (segment->is_sealed()) {
                sealed.push_back(segment);
            }
        }
    }
    for (auto const &segment : sealed) {
        BOOST_OUTCOME_TRY(auto const walk, walk_frames(*segment));
        if (walk.damaged.has_value()) {
            LOG_ERROR(
                "{}: damaged frame {} in sealed segment",
                name_,
                fmt::format("{}", *walk.damaged));
            return walk.damaged;
        }
    }
    return std::optional<RecordLocator>{};
}

CHAINSTORE_NAMESPACE_END
