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
#include <chainstore/core/bytes.hpp>
#include <chainstore/core/config.hpp>
#include <chainstore/core/result.hpp>

#include <cstdint>
#include <optional>

CHAINSTORE_NAMESPACE_BEGIN

using BlockHash = bytes32_t;

struct BlockHeader
{
    uint64_t level{0};
    // absent only for genesis
    std::optional<BlockHash> predecessor{};
    int64_t timestamp{0};
    bytes32_t context{};
    byte_string fitness{};
    byte_string protocol_data{};

    friend bool operator==(BlockHeader const &, BlockHeader const &) = default;
};

struct BlockHeaderWithHash
{
    BlockHash hash{};
    BlockHeader header{};
};

// SerializationError when a field is too large to encode
Result<void> validate_block_header(BlockHeader const &);

byte_string encode_block_header(BlockHeader const &);
Result<BlockHeader> decode_block_header(byte_string_view &);

CHAINSTORE_NAMESPACE_END
