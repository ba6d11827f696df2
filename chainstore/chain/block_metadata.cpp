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

#include <chainstore/chain/block_metadata.hpp>
#include <chainstore/codec/codec.hpp>
#include <chainstore/core/byte_string.hpp>
#include <chainstore/core/result.hpp>
#include <chainstore/core/store_error.hpp>

#include <boost/outcome/try.hpp>

#include <cstdint>
#include <string_view>

CHAINSTORE_NAMESPACE_BEGIN

std::string_view to_string(ValidationStatus const status)
{
    switch (status) {
    case ValidationStatus::Unknown:
        return "unknown";
    case ValidationStatus::Applied:
        return "applied";
    case ValidationStatus::Invalid:
        return "invalid";
    }
    return "?";
}

namespace
{
    Result<ValidationStatus> decode_status(byte_string_view &enc)
    {
        BOOST_OUTCOME_TRY(auto const status, codec::decode_u8(enc));
        if (status > static_cast<uint8_t>(ValidationStatus::Invalid)) {
            return StoreError::SerializationError;
        }
        return static_cast<ValidationStatus>(status);
    }
}

byte_string encode_block_metadata(BlockMetadata const &meta)
{
    byte_string out;
    codec::encode_u8(out, static_cast<uint8_t>(meta.status));
    codec::encode_bool(out, meta.on_main_chain);
    codec::encode_u64(out, meta.level);
    codec::encode_optional_bytes32(out, meta.predecessor);
    codec::encode_u32(out, static_cast<uint32_t>(meta.successors.size()));
    for (auto const &successor : meta.successors) {
        codec::encode_bytes32(out, successor);
    }
    return out;
}

Result<BlockMetadata> decode_block_metadata(byte_string_view &enc)
{
    BlockMetadata meta;
    BOOST_OUTCOME_TRY(meta.status, decode_status(enc));
    BOOST_OUTCOME_TRY(meta.on_main_chain, codec::decode_bool(enc));
    BOOST_OUTCOME_TRY(meta.level, codec::decode_u64(enc));
    BOOST_OUTCOME_TRY(meta.predecessor, codec::decode_optional_bytes32(enc));
    BOOST_OUTCOME_TRY(auto const count, codec::decode_u32(enc));
    if (count > enc.size() / BlockHash::size) {
        return StoreError::SerializationError;
    }
    meta.successors.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        BOOST_OUTCOME_TRY(auto const successor, codec::decode_bytes32(enc));
        meta.successors.push_back(successor);
    }
    return meta;
}

void encode_operation_metadata(byte_string &out, OperationMetadata const &meta)
{
    codec::encode_u8(out, static_cast<uint8_t>(meta.status));
}

Result<OperationMetadata> decode_operation_metadata(byte_string_view &enc)
{
    OperationMetadata meta;
    BOOST_OUTCOME_TRY(meta.status, decode_status(enc));
    return meta;
}

CHAINSTORE_NAMESPACE_END
