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

#include <chainstore/chain/block_store.hpp>
#include <chainstore/chain/chain_writer.hpp>
#include <chainstore/chain/context_action_log.hpp>
#include <chainstore/chain/predecessor_index.hpp>
#include <chainstore/chain/tables.hpp>
#include <chainstore/core/assert.h>
#include <chainstore/core/fiber/maintenance_pool.hpp>
#include <chainstore/core/result.hpp>
#include <chainstore/core/store_error.hpp>
#include <chainstore/kv/indexed_store.hpp>
#include <chainstore/log/record_log.hpp>
#include <chainstore/storage/recovery.hpp>
#include <chainstore/storage/storage.hpp>
#include <chainstore/storage/storage_config.hpp>

#include <boost/outcome/try.hpp>
#include <quill/Quill.h>

#include <fmt/format.h>

#include <filesystem>
#include <future>
#include <memory>
#include <string>
#include <utility>
#include <vector>

CHAINSTORE_NAMESPACE_BEGIN

Storage::Storage(std::filesystem::path dir)
    : dir_{std::move(dir)}
{
}

Storage::~Storage()
{
    if (!actions_) {
        return;
    }
    auto const res = flush();
    if (res.has_error()) {
        LOG_ERROR(
            "flush of {} on close failed: {}",
            dir_.string(),
            res.error().message().c_str());
    }
}

Result<std::unique_ptr<Storage>>
Storage::open(std::filesystem::path const &dir, StorageConfig const &config)
{
    std::unique_ptr<Storage> storage{new Storage{dir}};
    auto const logs_dir = dir / "logs";

    BOOST_OUTCOME_TRY(
        storage->index_, IndexedStore::open(dir / "index", config.db));
    BOOST_OUTCOME_TRY(
        storage->blocks_log_,
        RecordLog::open(
            std::string{BLOCKS_LOG}, logs_dir / BLOCKS_LOG, config.log));
    BOOST_OUTCOME_TRY(
        storage->operations_log_,
        RecordLog::open(
            std::string{OPERATIONS_LOG},
            logs_dir / OPERATIONS_LOG,
            config.log));
    BOOST_OUTCOME_TRY(
        storage->actions_log_,
        RecordLog::open(
            std::string{ACTIONS_LOG}, logs_dir / ACTIONS_LOG, config.log));

    RecordLog *const logs[] = {
        storage->blocks_log_.get(),
        storage->operations_log_.get(),
        storage->actions_log_.get()};
    Recovery recovery{*storage->index_, logs};
    BOOST_OUTCOME_TRY(recovery.run());

    storage->predecessors_ =
        std::make_unique<PredecessorIndex>(*storage->index_);
    storage->blocks_ = std::make_unique<BlockStore>(
        *storage->index_,
        *storage->blocks_log_,
        *storage->operations_log_,
        *storage->predecessors_);
    storage->actions_ = std::make_unique<ContextActionLog>(
        *storage->index_, *storage->actions_log_);
    LOG_INFO("opened storage at {}", dir.string());
    return storage;
}

ChainWriter &Storage::writer()
{
    bool const taken = writer_taken_.exchange(true);
    CHAINSTORE_ASSERT_PRINTF(
        !taken, "writer of %s already taken", dir_.c_str());
    return writer_;
}

std::vector<RecordLog const *> Storage::logs() const
{
    return {blocks_log_.get(), operations_log_.get(), actions_log_.get()};
}

Result<void> Storage::flush()
{
    BOOST_OUTCOME_TRY(blocks_log_->sync());
    BOOST_OUTCOME_TRY(operations_log_->sync());
    BOOST_OUTCOME_TRY(actions_log_->sync());
    return index_->flush();
}

std::vector<std::future<Result<void>>>
Storage::schedule_maintenance(fiber::MaintenancePool &pool)
{
    std::vector<std::future<Result<void>>> futures;
    futures.push_back(pool.submit([this]() -> Result<void> {
        LOG_INFO("compacting index");
        return index_->compact();
    }));
    for (auto const *const log : logs()) {
        futures.push_back(pool.submit([log]() -> Result<void> {
            BOOST_OUTCOME_TRY(
                auto const damaged, log->verify_sealed_segments());
            if (damaged.has_value()) {
                return StoreError::Corrupted;
            }
            return success();
        }));
    }
    return futures;
}

CHAINSTORE_NAMESPACE_END
