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

#include <chainstore/codec/codec.hpp>
#include <chainstore/core/assert.h>
#include <chainstore/core/byte_string.hpp>
#include <chainstore/core/bytes.hpp>
#include <chainstore/core/likely.h>
#include <chainstore/core/result.hpp>
#include <chainstore/core/store_error.hpp>

#include <boost/endian/conversion.hpp>
#include <boost/outcome/try.hpp>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>

CHAINSTORE_NAMESPACE_BEGIN

namespace codec
{
    void encode_u8(byte_string &out, uint8_t const value)
    {
        out.push_back(value);
    }

    void encode_u32(byte_string &out, uint32_t const value)
    {
        unsigned char buf[sizeof(uint32_t)];
        boost::endian::store_big_u32(buf, value);
        out.append(buf, sizeof(buf));
    }

    void encode_u64(byte_string &out, uint64_t const value)
    {
        unsigned char buf[sizeof(uint64_t)];
        boost::endian::store_big_u64(buf, value);
        out.append(buf, sizeof(buf));
    }

    void encode_i64(byte_string &out, int64_t const value)
    {
        unsigned char buf[sizeof(int64_t)];
        boost::endian::store_big_s64(buf, value);
        out.append(buf, sizeof(buf));
    }

    void encode_bool(byte_string &out, bool const value)
    {
        out.push_back(value ? 1 : 0);
    }

    void encode_bytes32(byte_string &out, bytes32_t const &value)
    {
        out.append(value.bytes, bytes32_t::size);
    }

    void encode_optional_bytes32(
        byte_string &out, std::optional<bytes32_t> const &value)
    {
        encode_bool(out, value.has_value());
        if (value.has_value()) {
            encode_bytes32(out, value.value());
        }
    }

    Result<void> check_string_size(size_t const size)
    {
        if (CHAINSTORE_UNLIKELY(size > MAX_STRING_SIZE)) {
            return StoreError::SerializationError;
        }
        return success();
    }

    void encode_string(byte_string &out, byte_string_view const value)
    {
        CHAINSTORE_ASSERT(value.size() <= MAX_STRING_SIZE);
        encode_u32(out, static_cast<uint32_t>(value.size()));
        out.append(value);
    }

    Result<uint8_t> decode_u8(byte_string_view &enc)
    {
        if (CHAINSTORE_UNLIKELY(enc.empty())) {
            return StoreError::SerializationError;
        }
        uint8_t const value = enc.front();
        enc.remove_prefix(1);
        return value;
    }

    Result<uint32_t> decode_u32(byte_string_view &enc)
    {
        if (CHAINSTORE_UNLIKELY(enc.size() < sizeof(uint32_t))) {
            return StoreError::SerializationError;
        }
        uint32_t const value = boost::endian::load_big_u32(enc.data());
        enc.remove_prefix(sizeof(uint32_t));
        return value;
    }

    Result<uint64_t> decode_u64(byte_string_view &enc)
    {
        if (CHAINSTORE_UNLIKELY(enc.size() < sizeof(uint64_t))) {
            return StoreError::SerializationError;
        }
        uint64_t const value = boost::endian::load_big_u64(enc.data());
        enc.remove_prefix(sizeof(uint64_t));
        return value;
    }

    Result<int64_t> decode_i64(byte_string_view &enc)
    {
        if (CHAINSTORE_UNLIKELY(enc.size() < sizeof(int64_t))) {
            return StoreError::SerializationError;
        }
        int64_t const value = boost::endian::load_big_s64(enc.data());
        enc.remove_prefix(sizeof(int64_t));
        return value;
    }

    Result<bool> decode_bool(byte_string_view &enc)
    {
        BOOST_OUTCOME_TRY(auto const b, decode_u8(enc));
        if (CHAINSTORE_UNLIKELY(b > 1)) {
            return StoreError::SerializationError;
        }
        return b == 1;
    }

    Result<bytes32_t> decode_bytes32(byte_string_view &enc)
    {
        if (CHAINSTORE_UNLIKELY(enc.size() < bytes32_t::size)) {
            return StoreError::SerializationError;
        }
        bytes32_t value;
        std::memcpy(value.bytes, enc.data(), bytes32_t::size);
        enc.remove_prefix(bytes32_t::size);
        return value;
    }

    Result<std::optional<bytes32_t>>
    decode_optional_bytes32(byte_string_view &enc)
    {
        BOOST_OUTCOME_TRY(auto const present, decode_bool(enc));
        if (!present) {
            return std::optional<bytes32_t>{};
        }
        BOOST_OUTCOME_TRY(auto const value, decode_bytes32(enc));
        return std::optional<bytes32_t>{value};
    }

    Result<byte_string> decode_string(byte_string_view &enc)
    {
        BOOST_OUTCOME_TRY(auto const length, decode_u32(enc));
        if (CHAINSTORE_UNLIKELY(enc.size() < length)) {
            return StoreError::SerializationError;
        }
        byte_string value{enc.substr(0, length)};
        enc.remove_prefix(length);
        return value;
    }

    Result<void> expect_end(byte_string_view const enc)
    {
        if (CHAINSTORE_UNLIKELY(!enc.empty())) {
            return StoreError::SerializationError;
        }
        return success();
    }
}

CHAINSTORE_NAMESPACE_END
