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
#include <chainstore/core/byte_string.hpp>
#include <chainstore/core/bytes.hpp>
#include <chainstore/core/store_error.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <optional>

using namespace chainstore;
using namespace chainstore::codec;

TEST(Codec, integers_are_big_endian)
{
    byte_string out;
    encode_u32(out, 0x01020304);
    encode_u64(out, 5);
    EXPECT_EQ(
        out,
        (byte_string{0x01, 0x02, 0x03, 0x04, 0, 0, 0, 0, 0, 0, 0, 0x05}));
}

TEST(Codec, signed_values)
{
    byte_string out;
    encode_i64(out, -1);
    encode_i64(out, std::numeric_limits<int64_t>::min());
    EXPECT_EQ(out.size(), 2 * sizeof(int64_t));

    byte_string_view view{out};
    EXPECT_EQ(decode_i64(view).value(), -1);
    EXPECT_EQ(
        decode_i64(view).value(), std::numeric_limits<int64_t>::min());
    EXPECT_TRUE(view.empty());
}

TEST(Codec, decode_consumes_prefix)
{
    byte_string out;
    encode_u8(out, 7);
    encode_string(out, byte_string{0xaa, 0xbb});
    encode_optional_bytes32(out, std::nullopt);
    encode_bool(out, true);

    byte_string_view view{out};
    EXPECT_EQ(decode_u8(view).value(), 7);
    EXPECT_EQ(decode_string(view).value(), (byte_string{0xaa, 0xbb}));
    EXPECT_FALSE(decode_optional_bytes32(view).value().has_value());
    EXPECT_TRUE(decode_bool(view).value());
    EXPECT_FALSE(expect_end(view).has_error());
}

TEST(Codec, truncated_input)
{
    byte_string out;
    encode_u64(out, 1);
    out.pop_back();
    byte_string_view view{out};
    auto const res = decode_u64(view);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), StoreError::SerializationError);

    byte_string str;
    encode_u32(str, 10);
    str.push_back(0x01);
    byte_string_view str_view{str};
    EXPECT_TRUE(decode_string(str_view).has_error());
}

TEST(Codec, trailing_bytes)
{
    byte_string const out{0x00};
    auto const res = expect_end(out);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), StoreError::SerializationError);
}

TEST(Codec, bool_rejects_other_values)
{
    byte_string const out{0x02};
    byte_string_view view{out};
    EXPECT_TRUE(decode_bool(view).has_error());
}

TEST(Codec, string_size_limit)
{
    EXPECT_FALSE(check_string_size(0).has_error());
    EXPECT_FALSE(check_string_size(MAX_STRING_SIZE).has_error());
    auto const res = check_string_size(size_t{MAX_STRING_SIZE} + 1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), StoreError::SerializationError);
}
