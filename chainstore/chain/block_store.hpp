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
#include <chainstore/chain/tables.hpp>
#include <chainstore/core/byte_string.hpp>
#include <chainstore/core/config.hpp>
#include <chainstore/core/result.hpp>
#include <chainstore/kv/indexed_store.hpp>
#include <chainstore/log/record_locator.hpp>

#include <cstdint>
#include <optional>
#include <vector>

CHAINSTORE_NAMESPACE_BEGIN

class ChainWriter;
class PredecessorIndex;
class RecordLog;

struct StoredBlock
{
    BlockHash hash{};
    BlockHeader header{};
    RecordLocator locator{};
};

struct Operation
{
    BlockHash block{};
    uint32_t index{0};
    RecordLocator locator{};
    OperationMetadata meta{};
    byte_string data{};
};

/**
 * Blocks and their operations: raw bytes live in record logs, headers,
 * chain position and validation state in the indexed store. Every mutation
 * is one atomic batch that also advances the committed head of the log it
 * appended to.
 */
class BlockStore
{
    IndexedStore &store_;
    RecordLog &blocks_log_;
    RecordLog &operations_log_;
    PredecessorIndex const &predecessors_;

    Result<BlockMetadata> require_metadata(BlockHash const &) const;

public:
    BlockStore(
        IndexedStore &, RecordLog &blocks_log, RecordLog &operations_log,
        PredecessorIndex const &);

    Result<void> put_block(
        ChainWriter &, BlockHeaderWithHash const &, byte_string_view raw);

    Result<std::optional<StoredBlock>> get_block(BlockHash const &) const;

    Result<std::optional<byte_string>> get_block_bytes(BlockHash const &) const;

    Result<std::optional<BlockMetadata>>
    get_block_metadata(BlockHash const &) const;

    Result<bool> contains(BlockHash const &) const;

    Result<void> update_validation_status(
        ChainWriter &, BlockHash const &, ValidationStatus);

    Result<void> put_operation(
        ChainWriter &, BlockHash const &block, uint32_t index,
        byte_string_view raw,
        ValidationStatus = ValidationStatus::Unknown);

    Result<void> update_operation_status(
        ChainWriter &, BlockHash const &block, uint32_t index,
        ValidationStatus);

    Result<std::optional<Operation>>
    get_operation(BlockHash const &block, uint32_t index) const;

    // every operation of the block in index order
    Result<std::vector<Operation>> get_operations(BlockHash const &) const;

    TableRange<BlockLevelsTable> blocks_at_level(uint64_t level) const;

    // levels in [from, to), empty when from >= to
    TableRange<BlockLevelsTable>
    blocks_in_levels(uint64_t from, uint64_t to) const;

    Result<void> set_main_chain_head(ChainWriter &, BlockHash const &);

    Result<std::optional<BlockHash>> main_chain_head() const;
};

CHAINSTORE_NAMESPACE_END
