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

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>

// Fixed-width big-endian encoding for index keys and values. Big-endian
// integers keep RocksDB's bytewise ordering equal to numeric ordering.
// Decoders consume from the front of the view they are given.

CHAINSTORE_NAMESPACE_BEGIN

namespace codec
{
    void encode_u8(byte_string &, uint8_t);
    void encode_u32(byte_string &, uint32_t);
    void encode_u64(byte_string &, uint64_t);
    void encode_i64(byte_string &, int64_t);
    void encode_bool(byte_string &, bool);
    void encode_bytes32(byte_string &, bytes32_t const &);
    void encode_optional_bytes32(
        byte_string &, std::optional<bytes32_t> const &);

    inline constexpr size_t MAX_STRING_SIZE =
        std::numeric_limits<uint32_t>::max();

    // SerializationError when `size` does not fit the u32 length prefix
    Result<void> check_string_size(size_t size);

    // u32 length prefix followed by the bytes; the caller checks the size
    void encode_string(byte_string &, byte_string_view);

    Result<uint8_t> decode_u8(byte_string_view &);
    Result<uint32_t> decode_u32(byte_string_view &);
    Result<uint64_t> decode_u64(byte_string_view &);
    Result<int64_t> decode_i64(byte_string_view &);
    Result<bool> decode_bool(byte_string_view &);
    Result<bytes32_t> decode_bytes32(byte_string_view &);
    Result<std::optional<bytes32_t>>
    decode_optional_bytes32(byte_string_view &);
    Result<byte_string> decode_string(byte_string_view &);

    // fails unless the whole input was consumed
    Result<void> expect_end(byte_string_view);
}

CHAINSTORE_NAMESPACE_END
