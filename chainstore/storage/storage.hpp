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

#include <chainstore/chain/block_store.hpp>
#include <chainstore/chain/chain_writer.hpp>
#include <chainstore/chain/context_action_log.hpp>
#include <chainstore/chain/predecessor_index.hpp>
#include <chainstore/core/config.hpp>
#include <chainstore/core/result.hpp>
#include <chainstore/kv/indexed_store.hpp>
#include <chainstore/log/record_log.hpp>
#include <chainstore/storage/storage_config.hpp>

#include <atomic>
#include <filesystem>
#include <future>
#include <memory>
#include <vector>

CHAINSTORE_NAMESPACE_BEGIN

namespace fiber
{
    class MaintenancePool;
}

/**
 * Owns the indexed store and the record logs of one data directory:
 *
 *   <dir>/index              RocksDB
 *   <dir>/logs/blocks        raw block bytes
 *   <dir>/logs/operations    raw operation bytes
 *   <dir>/logs/actions       context action bytes
 *
 * `open` runs recovery before anything can be written. Reads are safe from
 * any thread; writes need the single `ChainWriter`.
 */
class Storage
{
    std::filesystem::path const dir_;
    std::unique_ptr<IndexedStore> index_;
    std::unique_ptr<RecordLog> blocks_log_;
    std::unique_ptr<RecordLog> operations_log_;
    std::unique_ptr<RecordLog> actions_log_;
    std::unique_ptr<PredecessorIndex> predecessors_;
    std::unique_ptr<BlockStore> blocks_;
    std::unique_ptr<ContextActionLog> actions_;
    ChainWriter writer_;
    std::atomic<bool> writer_taken_{false};

    explicit Storage(std::filesystem::path);

public:
    static Result<std::unique_ptr<Storage>>
    open(std::filesystem::path const &dir, StorageConfig const & = {});

    Storage(Storage const &) = delete;
    Storage &operator=(Storage const &) = delete;
    ~Storage();

    std::filesystem::path const &dir() const
    {
        return dir_;
    }

    // may be taken once
    ChainWriter &writer();

    BlockStore &blocks()
    {
        return *blocks_;
    }

    BlockStore const &blocks() const
    {
        return *blocks_;
    }

    PredecessorIndex const &predecessors() const
    {
        return *predecessors_;
    }

    ContextActionLog &actions()
    {
        return *actions_;
    }

    ContextActionLog const &actions() const
    {
        return *actions_;
    }

    IndexedStore &index()
    {
        return *index_;
    }

    std::vector<RecordLog const *> logs() const;

    // syncs every record log, then flushes the index
    Result<void> flush();

    // queues index compaction and sealed segment verification
    std::vector<std::future<Result<void>>>
    schedule_maintenance(fiber::MaintenancePool &);
};

CHAINSTORE_NAMESPACE_END
