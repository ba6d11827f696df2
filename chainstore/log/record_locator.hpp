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

#include <fmt/format.h>

#include <cstdint>
#include <span>
#include <vector>

CHAINSTORE_NAMESPACE_BEGIN

/**
 * Precisely identifies a record in a record log. `offset` is the position of
 * the record frame inside its segment and `length` the number of payload
 * bytes stored after the frame header.
 */
struct RecordLocator
{
    uint64_t segment{0};
    uint64_t offset{0};
    uint64_t length{0};

    friend bool operator==(RecordLocator const &, RecordLocator const &) =
        default;
};

// u32 length, u32 crc32, u8 codec
inline constexpr uint64_t RECORD_FRAME_HEADER_SIZE = 9;

inline uint64_t frame_end(RecordLocator const &loc)
{
    return loc.offset + RECORD_FRAME_HEADER_SIZE + loc.length;
}

/**
 * A run of records that sit back to back in one segment and can be fetched
 * with a single read.
 */
struct LocatorRange
{
    uint64_t segment{0};
    uint64_t offset{0};
    uint64_t byte_length{0};
    uint32_t count{0};

    friend bool operator==(LocatorRange const &, LocatorRange const &) =
        default;
};

std::vector<LocatorRange> fold_consecutive_locators(
    std::span<RecordLocator const>);

void encode_record_locator(byte_string &, RecordLocator const &);
Result<RecordLocator> decode_record_locator(byte_string_view &);

CHAINSTORE_NAMESPACE_END

template <>
struct fmt::formatter<chainstore::RecordLocator>
{
    constexpr auto parse(format_parse_context &ctx)
    {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(chainstore::RecordLocator const &loc, FormatContext &ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "Location({},{},{})",
            loc.segment,
            loc.offset,
            loc.length);
    }
};
