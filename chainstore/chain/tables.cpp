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
#include <chainstore/chain/block_metadata.hpp>
#include <chainstore/chain/tables.hpp>
#include <chainstore/codec/codec.hpp>
#include <chainstore/core/byte_string.hpp>
#include <chainstore/core/result.hpp>
#include <chainstore/core/store_error.hpp>
#include <chainstore/kv/schema.hpp>
#include <chainstore/log/record_locator.hpp>

#include <boost/outcome/try.hpp>

#include <string>
#include <string_view>
#include <variant>

CHAINSTORE_NAMESPACE_BEGIN

namespace
{
    constexpr std::string_view log_head_prefix = "log_head/";

    Result<BlockHash> decode_hash_key(byte_string_view enc)
    {
        BOOST_OUTCOME_TRY(auto const hash, codec::decode_bytes32(enc));
        BOOST_OUTCOME_TRY(codec::expect_end(enc));
        return hash;
    }

    Result<RecordLocator> decode_locator_value(byte_string_view enc)
    {
        BOOST_OUTCOME_TRY(auto const loc, decode_record_locator(enc));
        BOOST_OUTCOME_TRY(codec::expect_end(enc));
        return loc;
    }

    byte_string encode_locator_value(RecordLocator const &loc)
    {
        byte_string out;
        encode_record_locator(out, loc);
        return out;
    }
}

byte_string block_key_prefix(BlockHash const &hash)
{
    byte_string out;
    codec::encode_bytes32(out, hash);
    return out;
}

byte_string MetaTable::encode_key(key_type const &key)
{
    return byte_string{to_byte_string_view(key)};
}

Result<MetaTable::key_type> MetaTable::decode_key(byte_string_view const enc)
{
    return std::string{to_string_view(enc)};
}

byte_string MetaTable::encode_value(value_type const &value)
{
    return value;
}

Result<MetaTable::value_type>
MetaTable::decode_value(byte_string_view const enc)
{
    return byte_string{enc};
}

byte_string LogHeadTable::encode_key(key_type const &name)
{
    std::string key{log_head_prefix};
    key += name;
    return byte_string{to_byte_string_view(key)};
}

Result<LogHeadTable::key_type>
LogHeadTable::decode_key(byte_string_view const enc)
{
    auto const key = to_string_view(enc);
    if (!key.starts_with(log_head_prefix)) {
        return StoreError::SerializationError;
    }
    return std::string{key.substr(log_head_prefix.size())};
}

byte_string LogHeadTable::encode_value(value_type const &loc)
{
    return encode_locator_value(loc);
}

Result<LogHeadTable::value_type>
LogHeadTable::decode_value(byte_string_view const enc)
{
    return decode_locator_value(enc);
}

byte_string BlocksTable::encode_key(key_type const &hash)
{
    return block_key_prefix(hash);
}

Result<BlocksTable::key_type>
BlocksTable::decode_key(byte_string_view const enc)
{
    return decode_hash_key(enc);
}

byte_string BlocksTable::encode_value(value_type const &record)
{
    byte_string out = encode_block_header(record.header);
    encode_record_locator(out, record.locator);
    return out;
}

Result<BlocksTable::value_type>
BlocksTable::decode_value(byte_string_view enc)
{
    BlockRecord record;
    BOOST_OUTCOME_TRY(record.header, decode_block_header(enc));
    BOOST_OUTCOME_TRY(record.locator, decode_record_locator(enc));
    BOOST_OUTCOME_TRY(codec::expect_end(enc));
    return record;
}

byte_string BlockMetaTable::encode_key(key_type const &hash)
{
    return block_key_prefix(hash);
}

Result<BlockMetaTable::key_type>
BlockMetaTable::decode_key(byte_string_view const enc)
{
    return decode_hash_key(enc);
}

byte_string BlockMetaTable::encode_value(value_type const &meta)
{
    return encode_block_metadata(meta);
}

Result<BlockMetaTable::value_type>
BlockMetaTable::decode_value(byte_string_view enc)
{
    BOOST_OUTCOME_TRY(auto meta, decode_block_metadata(enc));
    BOOST_OUTCOME_TRY(codec::expect_end(enc));
    return meta;
}

byte_string BlockLevelsTable::encode_level(uint64_t const level)
{
    byte_string out;
    codec::encode_u64(out, level);
    return out;
}

byte_string BlockLevelsTable::encode_key(key_type const &key)
{
    byte_string out = encode_level(key.first);
    codec::encode_bytes32(out, key.second);
    return out;
}

Result<BlockLevelsTable::key_type>
BlockLevelsTable::decode_key(byte_string_view enc)
{
    BOOST_OUTCOME_TRY(auto const level, codec::decode_u64(enc));
    BOOST_OUTCOME_TRY(auto const hash, codec::decode_bytes32(enc));
    BOOST_OUTCOME_TRY(codec::expect_end(enc));
    return key_type{level, hash};
}

byte_string BlockLevelsTable::encode_value(value_type const &)
{
    return {};
}

Result<BlockLevelsTable::value_type>
BlockLevelsTable::decode_value(byte_string_view const enc)
{
    BOOST_OUTCOME_TRY(codec::expect_end(enc));
    return std::monostate{};
}

byte_string OperationsTable::encode_key(key_type const &key)
{
    byte_string out = block_key_prefix(key.first);
    codec::encode_u32(out, key.second);
    return out;
}

Result<OperationsTable::key_type>
OperationsTable::decode_key(byte_string_view enc)
{
    BOOST_OUTCOME_TRY(auto const hash, codec::decode_bytes32(enc));
    BOOST_OUTCOME_TRY(auto const index, codec::decode_u32(enc));
    BOOST_OUTCOME_TRY(codec::expect_end(enc));
    return key_type{hash, index};
}

byte_string OperationsTable::encode_value(value_type const &record)
{
    byte_string out;
    encode_record_locator(out, record.locator);
    encode_operation_metadata(out, record.meta);
    return out;
}

Result<OperationsTable::value_type>
OperationsTable::decode_value(byte_string_view enc)
{
    OperationRecord record;
    BOOST_OUTCOME_TRY(record.locator, decode_record_locator(enc));
    BOOST_OUTCOME_TRY(record.meta, decode_operation_metadata(enc));
    BOOST_OUTCOME_TRY(codec::expect_end(enc));
    return record;
}

byte_string PredecessorTable::encode_key(key_type const &key)
{
    byte_string out = block_key_prefix(key.first);
    codec::encode_u8(out, key.second);
    return out;
}

Result<PredecessorTable::key_type>
PredecessorTable::decode_key(byte_string_view enc)
{
    BOOST_OUTCOME_TRY(auto const hash, codec::decode_bytes32(enc));
    BOOST_OUTCOME_TRY(auto const exponent, codec::decode_u8(enc));
    BOOST_OUTCOME_TRY(codec::expect_end(enc));
    return key_type{hash, exponent};
}

byte_string PredecessorTable::encode_value(value_type const &ancestor)
{
    return block_key_prefix(ancestor);
}

Result<PredecessorTable::value_type>
PredecessorTable::decode_value(byte_string_view const enc)
{
    return decode_hash_key(enc);
}

byte_string ContextActionsTable::encode_key(key_type const &key)
{
    byte_string out = block_key_prefix(key.first);
    codec::encode_u64(out, key.second);
    return out;
}

Result<ContextActionsTable::key_type>
ContextActionsTable::decode_key(byte_string_view enc)
{
    BOOST_OUTCOME_TRY(auto const hash, codec::decode_bytes32(enc));
    BOOST_OUTCOME_TRY(auto const seq, codec::decode_u64(enc));
    BOOST_OUTCOME_TRY(codec::expect_end(enc));
    return key_type{hash, seq};
}

byte_string ContextActionsTable::encode_value(value_type const &loc)
{
    return encode_locator_value(loc);
}

Result<ContextActionsTable::value_type>
ContextActionsTable::decode_value(byte_string_view const enc)
{
    return decode_locator_value(enc);
}

static_assert(Schema<MetaTable>);
static_assert(Schema<LogHeadTable>);
static_assert(Schema<BlocksTable>);
static_assert(Schema<BlockMetaTable>);
static_assert(Schema<BlockLevelsTable>);
static_assert(Schema<OperationsTable>);
static_assert(Schema<PredecessorTable>);
static_assert(Schema<ContextActionsTable>);

CHAINSTORE_NAMESPACE_END
