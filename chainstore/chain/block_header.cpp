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

#include <chainstore/chain/block_header.hpp>
#include <chainstore/codec/codec.hpp>
#include <chainstore/core/byte_string.hpp>
#include <chainstore/core/result.hpp>

#include <boost/outcome/try.hpp>

CHAINSTORE_NAMESPACE_BEGIN

Result<void> validate_block_header(BlockHeader const &header)
{
    BOOST_OUTCOME_TRY(codec::check_string_size(header.fitness.size()));
    return codec::check_string_size(header.protocol_data.size());
}

byte_string encode_block_header(BlockHeader const &header)
{
    byte_string out;
    codec::encode_u64(out, header.level);
    codec::encode_optional_bytes32(out, header.predecessor);
    codec::encode_i64(out, header.timestamp);
    codec::encode_bytes32(out, header.context);
    codec::encode_string(out, header.fitness);
    codec::encode_string(out, header.protocol_data);
    return out;
}

Result<BlockHeader> decode_block_header(byte_string_view &enc)
{
    BlockHeader header;
    BOOST_OUTCOME_TRY(header.level, codec::decode_u64(enc));
    BOOST_OUTCOME_TRY(header.predecessor, codec::decode_optional_bytes32(enc));
    BOOST_OUTCOME_TRY(header.timestamp, codec::decode_i64(enc));
    BOOST_OUTCOME_TRY(header.context, codec::decode_bytes32(enc));
    BOOST_OUTCOME_TRY(header.fitness, codec::decode_string(enc));
    BOOST_OUTCOME_TRY(header.protocol_data, codec::decode_string(enc));
    return header;
}

CHAINSTORE_NAMESPACE_END
