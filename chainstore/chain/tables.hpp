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

#include <chainstore/chain/block_header.hpp>
#include <chainstore/chain/block_metadata.hpp>
#include <chainstore/core/byte_string.hpp>
#include <chainstore/core/config.hpp>
#include <chainstore/core/result.hpp>
#include <chainstore/kv/schema.hpp>
#include <chainstore/kv/table.hpp>
#include <chainstore/log/record_locator.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

CHAINSTORE_NAMESPACE_BEGIN

inline constexpr std::string_view BLOCKS_LOG = "blocks";
inline constexpr std::string_view OPERATIONS_LOG = "operations";
inline constexpr std::string_view ACTIONS_LOG = "actions";

inline constexpr std::string_view MAIN_CHAIN_HEAD_KEY = "main_chain_head";
inline constexpr std::string_view SCHEMA_VERSION_KEY = "schema_version";

inline constexpr uint32_t SCHEMA_VERSION = 2;

struct BlockRecord
{
    BlockHeader header{};
    RecordLocator locator{};
};

struct OperationRecord
{
    RecordLocator locator{};
    OperationMetadata meta{};
};

// free form keys of the default column family
struct MetaTable
{
    static constexpr Table table = Table::Meta;
    using key_type = std::string;
    using value_type = byte_string;

    static byte_string encode_key(key_type const &);
    static Result<key_type> decode_key(byte_string_view);
    static byte_string encode_value(value_type const &);
    static Result<value_type> decode_value(byte_string_view);
};

// log name -> locator of the last record covered by a committed batch
struct LogHeadTable
{
    static constexpr Table table = Table::Meta;
    using key_type = std::string;
    using value_type = RecordLocator;

    static byte_string encode_key(key_type const &);
    static Result<key_type> decode_key(byte_string_view);
    static byte_string encode_value(value_type const &);
    static Result<value_type> decode_value(byte_string_view);
};

struct BlocksTable
{
    static constexpr Table table = Table::Blocks;
    using key_type = BlockHash;
    using value_type = BlockRecord;

    static byte_string encode_key(key_type const &);
    static Result<key_type> decode_key(byte_string_view);
    static byte_string encode_value(value_type const &);
    static Result<value_type> decode_value(byte_string_view);
};

struct BlockMetaTable
{
    static constexpr Table table = Table::BlockMeta;
    using key_type = BlockHash;
    using value_type = BlockMetadata;

    static byte_string encode_key(key_type const &);
    static Result<key_type> decode_key(byte_string_view);
    static byte_string encode_value(value_type const &);
    static Result<value_type> decode_value(byte_string_view);
};

// (level, hash), scanned by level
struct BlockLevelsTable
{
    static constexpr Table table = Table::BlockLevels;
    using key_type = std::pair<uint64_t, BlockHash>;
    using value_type = std::monostate;

    static byte_string encode_level(uint64_t);
    static byte_string encode_key(key_type const &);
    static Result<key_type> decode_key(byte_string_view);
    static byte_string encode_value(value_type const &);
    static Result<value_type> decode_value(byte_string_view);
};

// (block, operation index) -> locator in the operations log
struct OperationsTable
{
    static constexpr Table table = Table::Operations;
    using key_type = std::pair<BlockHash, uint32_t>;
    using value_type = OperationRecord;

    static byte_string encode_key(key_type const &);
    static Result<key_type> decode_key(byte_string_view);
    static byte_string encode_value(value_type const &);
    static Result<value_type> decode_value(byte_string_view);
};

// (block, exponent i) -> ancestor at distance 2^i
struct PredecessorTable
{
    static constexpr Table table = Table::PredecessorIndex;
    using key_type = std::pair<BlockHash, uint8_t>;
    using value_type = BlockHash;

    static byte_string encode_key(key_type const &);
    static Result<key_type> decode_key(byte_string_view);
    static byte_string encode_value(value_type const &);
    static Result<value_type> decode_value(byte_string_view);
};

// (block, sequence) -> locator in the actions log
struct ContextActionsTable
{
    static constexpr Table table = Table::ContextActions;
    using key_type = std::pair<BlockHash, uint64_t>;
    using value_type = RecordLocator;

    static byte_string encode_key(key_type const &);
    static Result<key_type> decode_key(byte_string_view);
    static byte_string encode_value(value_type const &);
    static Result<value_type> decode_value(byte_string_view);
};

// all keys of one block in a hash-prefixed table
byte_string block_key_prefix(BlockHash const &);

CHAINSTORE_NAMESPACE_END
