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
#include <chainstore/chain/block_store.hpp>
#include <chainstore/chain/chain_writer.hpp>
#include <chainstore/chain/predecessor_index.hpp>
#include <chainstore/chain/tables.hpp>
#include <chainstore/codec/codec.hpp>
#include <chainstore/core/byte_string.hpp>
#include <chainstore/core/fmt/bytes_fmt.hpp>
#include <chainstore/core/result.hpp>
#include <chainstore/core/store_error.hpp>
#include <chainstore/kv/indexed_store.hpp>
#include <chainstore/kv/key_range.hpp>
#include <chainstore/kv/write_batch.hpp>
#include <chainstore/log/record_locator.hpp>
#include <chainstore/log/record_log.hpp>

#include <boost/outcome/try.hpp>
#include <quill/Quill.h>

#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

CHAINSTORE_NAMESPACE_BEGIN

BlockStore::BlockStore(
    IndexedStore &store, RecordLog &blocks_log, RecordLog &operations_log,
    PredecessorIndex const &predecessors)
    : store_{store}
    , blocks_log_{blocks_log}
    , operations_log_{operations_log}
    , predecessors_{predecessors}
{
}

Result<BlockMetadata> BlockStore::require_metadata(BlockHash const &hash) const
{
    BOOST_OUTCOME_TRY(auto meta, store_.get<BlockMetaTable>(hash));
    if (!meta.has_value()) {
        return StoreError::NotFound;
    }
    return std::move(meta).value();
}

Result<void> BlockStore::put_block(
    ChainWriter &, BlockHeaderWithHash const &block, byte_string_view const raw)
{
    auto const &header = block.header;
    BOOST_OUTCOME_TRY(validate_block_header(header));
    BOOST_OUTCOME_TRY(auto const exists, contains(block.hash));
    if (exists) {
        return StoreError::DuplicateKey;
    }

    std::optional<BlockMetadata> parent;
    if (header.predecessor.has_value()) {
        auto res = require_metadata(*header.predecessor);
        if (res.has_error()) {
            LOG_WARNING(
                "block {} has unknown predecessor {}",
                fmt::format("{}", block.hash),
                fmt::format("{}", *header.predecessor));
            return std::move(res).error();
        }
        parent = std::move(res).value();
        if (header.level != parent->level + 1) {
            LOG_WARNING(
                "block {} at level {} does not follow its predecessor at {}",
                fmt::format("{}", block.hash),
                header.level,
                parent->level);
            return StoreError::InvalidBlock;
        }
    }
    else if (header.level != 0) {
        return StoreError::InvalidBlock;
    }

    WriteBatch batch;
    if (header.predecessor.has_value()) {
        BOOST_OUTCOME_TRY(predecessors_.stage(
            batch, block.hash, *header.predecessor, header.level));
    }

    BOOST_OUTCOME_TRY(auto const locator, blocks_log_.append(raw));

    batch.put<BlocksTable>(block.hash, BlockRecord{header, locator});
    batch.put<BlockMetaTable>(
        block.hash,
        BlockMetadata{
            .status = ValidationStatus::Unknown,
            .on_main_chain = false,
            .level = header.level,
            .predecessor = header.predecessor,
            .successors = {}});
    batch.put<BlockLevelsTable>({header.level, block.hash}, {});
    if (parent.has_value()) {
        parent->successors.push_back(block.hash);
        batch.put<BlockMetaTable>(*header.predecessor, *parent);
    }
    batch.put<LogHeadTable>(std::string{blocks_log_.name()}, locator);
    BOOST_OUTCOME_TRY(store_.write(batch));

    LOG_DEBUG(
        "stored block {} at level {}",
        fmt::format("{}", block.hash),
        header.level);
    return success();
}

Result<std::optional<StoredBlock>>
BlockStore::get_block(BlockHash const &hash) const
{
    BOOST_OUTCOME_TRY(auto record, store_.get<BlocksTable>(hash));
    if (!record.has_value()) {
        return std::optional<StoredBlock>{};
    }
    return std::optional<StoredBlock>{StoredBlock{
        .hash = hash,
        .header = std::move(record->header),
        .locator = record->locator}};
}

Result<std::optional<byte_string>>
BlockStore::get_block_bytes(BlockHash const &hash) const
{
    BOOST_OUTCOME_TRY(auto const record, store_.get<BlocksTable>(hash));
    if (!record.has_value()) {
        return std::optional<byte_string>{};
    }
    BOOST_OUTCOME_TRY(auto bytes, blocks_log_.read(record->locator));
    return std::optional<byte_string>{std::move(bytes)};
}

Result<std::optional<BlockMetadata>>
BlockStore::get_block_metadata(BlockHash const &hash) const
{
    return store_.get<BlockMetaTable>(hash);
}

Result<bool> BlockStore::contains(BlockHash const &hash) const
{
    BOOST_OUTCOME_TRY(
        auto const raw,
        store_.get_raw(BlocksTable::table, BlocksTable::encode_key(hash)));
    return raw.has_value();
}

Result<void> BlockStore::update_validation_status(
    ChainWriter &, BlockHash const &hash, ValidationStatus const status)
{
    BOOST_OUTCOME_TRY(auto meta, require_metadata(hash));
    meta.status = status;
    WriteBatch batch;
    batch.put<BlockMetaTable>(hash, meta);
    return store_.write(batch);
}

Result<void> BlockStore::put_operation(
    ChainWriter &, BlockHash const &block, uint32_t const index,
    byte_string_view const raw, ValidationStatus const status)
{
    BOOST_OUTCOME_TRY(auto const exists, contains(block));
    if (!exists) {
        return StoreError::NotFound;
    }
    OperationsTable::key_type const key{block, index};
    BOOST_OUTCOME_TRY(auto const existing, store_.get<OperationsTable>(key));
    if (existing.has_value()) {
        return StoreError::DuplicateKey;
    }

    BOOST_OUTCOME_TRY(auto const locator, operations_log_.append(raw));

    WriteBatch batch;
    batch.put<OperationsTable>(
        key, OperationRecord{.locator = locator, .meta = {.status = status}});
    batch.put<LogHeadTable>(std::string{operations_log_.name()}, locator);
    return store_.write(batch);
}

Result<void> BlockStore::update_operation_status(
    ChainWriter &, BlockHash const &block, uint32_t const index,
    ValidationStatus const status)
{
    OperationsTable::key_type const key{block, index};
    BOOST_OUTCOME_TRY(auto record, store_.get<OperationsTable>(key));
    if (!record.has_value()) {
        return StoreError::NotFound;
    }
    record->meta.status = status;
    WriteBatch batch;
    batch.put<OperationsTable>(key, *record);
    return store_.write(batch);
}

Result<std::optional<Operation>>
BlockStore::get_operation(BlockHash const &block, uint32_t const index) const
{
    OperationsTable::key_type const key{block, index};
    BOOST_OUTCOME_TRY(auto const record, store_.get<OperationsTable>(key));
    if (!record.has_value()) {
        return std::optional<Operation>{};
    }
    BOOST_OUTCOME_TRY(auto data, operations_log_.read(record->locator));
    return std::optional<Operation>{Operation{
        .block = block,
        .index = index,
        .locator = record->locator,
        .meta = record->meta,
        .data = std::move(data)}};
}

Result<std::vector<Operation>>
BlockStore::get_operations(BlockHash const &block) const
{
    auto const snapshot = store_.snapshot();
    BOOST_OUTCOME_TRY(
        auto const entries,
        store_
            .iterate<OperationsTable>(
                KeyRange::prefix(block_key_prefix(block)), &snapshot)
            .collect());

    std::vector<RecordLocator> locators;
    locators.reserve(entries.size());
    for (auto const &[key, record] : entries) {
        locators.push_back(record.locator);
    }
    BOOST_OUTCOME_TRY(auto data, operations_log_.read_range(locators));

    std::vector<Operation> operations;
    operations.reserve(entries.size());
    for (size_t i = 0; i < entries.size(); ++i) {
        operations.push_back(Operation{
            .block = block,
            .index = entries[i].first.second,
            .locator = entries[i].second.locator,
            .meta = entries[i].second.meta,
            .data = std::move(data[i])});
    }
    return operations;
}

TableRange<BlockLevelsTable>
BlockStore::blocks_at_level(uint64_t const level) const
{
    return store_.iterate<BlockLevelsTable>(
        KeyRange::prefix(BlockLevelsTable::encode_level(level)));
}

TableRange<BlockLevelsTable>
BlockStore::blocks_in_levels(uint64_t const from, uint64_t const to) const
{
    // an inverted range scans nothing
    auto const upper = std::max(from, to);
    return store_.iterate<BlockLevelsTable>(KeyRange{
        BlockLevelsTable::encode_level(from),
        BlockLevelsTable::encode_level(upper)});
}

Result<void>
BlockStore::set_main_chain_head(ChainWriter &, BlockHash const &new_head)
{
    BOOST_OUTCOME_TRY(require_metadata(new_head));
    BOOST_OUTCOME_TRY(auto const old_head, main_chain_head());
    if (old_head == new_head) {
        return success();
    }

    std::optional<BlockHash> fork_point;
    if (old_head.has_value()) {
        auto res = predecessors_.common_ancestor(*old_head, new_head);
        if (res.has_value()) {
            fork_point = res.value();
        }
        else if (res.error() != StoreError::NotFound) {
            return std::move(res).error();
        }
    }

    WriteBatch batch;
    size_t abandoned = 0;
    size_t adopted = 0;
    if (old_head.has_value()) {
        std::optional<BlockHash> hash = old_head;
        while (hash.has_value() && hash != fork_point) {
            BOOST_OUTCOME_TRY(auto meta, require_metadata(*hash));
            meta.on_main_chain = false;
            batch.put<BlockMetaTable>(*hash, meta);
            hash = meta.predecessor;
            ++abandoned;
        }
    }
    std::optional<BlockHash> hash = new_head;
    while (hash.has_value() && hash != fork_point) {
        BOOST_OUTCOME_TRY(auto meta, require_metadata(*hash));
        meta.on_main_chain = true;
        batch.put<BlockMetaTable>(*hash, meta);
        hash = meta.predecessor;
        ++adopted;
    }
    batch.put<MetaTable>(
        std::string{MAIN_CHAIN_HEAD_KEY}, block_key_prefix(new_head));
    BOOST_OUTCOME_TRY(store_.write(batch));

    LOG_INFO(
        "main chain head {} ({} blocks abandoned, {} adopted)",
        fmt::format("{}", new_head),
        abandoned,
        adopted);
    return success();
}

Result<std::optional<BlockHash>> BlockStore::main_chain_head() const
{
    BOOST_OUTCOME_TRY(
        auto const raw,
        store_.get<MetaTable>(std::string{MAIN_CHAIN_HEAD_KEY}));
    if (!raw.has_value()) {
        return std::optional<BlockHash>{};
    }
    byte_string_view enc{*raw};
    BOOST_OUTCOME_TRY(auto const hash, codec::decode_bytes32(enc));
    BOOST_OUTCOME_TRY(codec::expect_end(enc));
    return std::optional<BlockHash>{hash};
}

CHAINSTORE_NAMESPACE_END
