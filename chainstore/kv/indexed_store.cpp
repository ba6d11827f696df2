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

#include <chainstore/core/assert.h>
#include <chainstore/core/byte_string.hpp>
#include <chainstore/core/result.hpp>
#include <chainstore/core/store_error.hpp>
#include <chainstore/kv/db_config.hpp>
#include <chainstore/kv/indexed_store.hpp>
#include <chainstore/kv/key_range.hpp>
#include <chainstore/kv/snapshot.hpp>
#include <chainstore/kv/table.hpp>
#include <chainstore/kv/write_batch.hpp>

#include <quill/Quill.h>

#include <rocksdb/cache.h>
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/snapshot.h>
#include <rocksdb/statistics.h>
#include <rocksdb/status.h>
#include <rocksdb/table.h>
#include <rocksdb/write_batch.h>

#include <algorithm>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

CHAINSTORE_NAMESPACE_BEGIN

namespace
{
    rocksdb::Slice to_slice(byte_string_view const s)
    {
        return rocksdb::Slice{
            reinterpret_cast<char const *>(s.data()), s.size()};
    }

    byte_string_view to_view(rocksdb::Slice const &s)
    {
        return byte_string_view{
            reinterpret_cast<unsigned char const *>(s.data()), s.size()};
    }

    StoreError to_store_error(rocksdb::Status const &s)
    {
        if (s.IsNotFound()) {
            return StoreError::NotFound;
        }
        if (s.IsCorruption()) {
            return StoreError::Corrupted;
        }
        return StoreError::IoFailure;
    }

    rocksdb::DBOptions make_db_options(DbConfig const &config)
    {
        rocksdb::DBOptions options;
        unsigned const hw = std::max(1u, std::thread::hardware_concurrency());
        options.IncreaseParallelism(
            static_cast<int>(std::clamp(config.max_threads, 1u, hw)));
        options.create_if_missing = true;
        options.create_missing_column_families = true;
        options.max_background_jobs = 6;
        options.bytes_per_sync = 1 << 20;
        return options;
    }

    rocksdb::ColumnFamilyOptions
    make_cf_options(std::shared_ptr<rocksdb::Cache> const &cache)
    {
        rocksdb::BlockBasedTableOptions table_options;
        table_options.block_cache = cache;
        table_options.block_size = 16 * 1024;
        table_options.format_version = 4;
        table_options.cache_index_and_filter_blocks = true;
        table_options.pin_l0_filter_and_index_blocks_in_cache = true;
        table_options.index_block_restart_interval = 16;

        rocksdb::ColumnFamilyOptions cf_options;
        cf_options.OptimizeLevelStyleCompaction();
        cf_options.level_compaction_dynamic_level_bytes = true;
        cf_options.table_factory.reset(
            rocksdb::NewBlockBasedTableFactory(table_options));
        return cf_options;
    }

    void set_snapshot(rocksdb::ReadOptions &ro, Snapshot const *snapshot)
    {
        if (snapshot != nullptr) {
            ro.snapshot = snapshot->get();
        }
    }
}

struct RawCursor::Impl
{
    byte_string lower;
    std::optional<byte_string> upper;
    rocksdb::Slice lower_slice;
    rocksdb::Slice upper_slice;
    std::unique_ptr<rocksdb::Iterator> it;
};

RawCursor::RawCursor(std::unique_ptr<Impl> impl)
    : impl_{std::move(impl)}
{
}

RawCursor::~RawCursor() = default;

bool RawCursor::valid() const
{
    return impl_->it->Valid();
}

byte_string_view RawCursor::key() const
{
    return to_view(impl_->it->key());
}

byte_string_view RawCursor::value() const
{
    return to_view(impl_->it->value());
}

void RawCursor::next()
{
    impl_->it->Next();
}

Result<void> RawCursor::status() const
{
    auto const s = impl_->it->status();
    if (!s.ok()) {
        LOG_ERROR("index scan failed: {}", s.ToString());
        return to_store_error(s);
    }
    return success();
}

Snapshot::Snapshot(rocksdb::DB *const db)
    : snapshot_{std::make_unique<rocksdb::ManagedSnapshot>(db)}
{
}

Snapshot::Snapshot(Snapshot &&) noexcept = default;
Snapshot &Snapshot::operator=(Snapshot &&) noexcept = default;
Snapshot::~Snapshot() = default;

rocksdb::Snapshot const *Snapshot::get() const
{
    return snapshot_->snapshot();
}

IndexedStore::IndexedStore(std::filesystem::path path)
    : path_{std::move(path)}
{
}

IndexedStore::~IndexedStore()
{
    if (!db_) {
        return;
    }
    for (auto *const cf : cfs_) {
        if (cf == db_->DefaultColumnFamily()) {
            continue;
        }
        db_->DestroyColumnFamilyHandle(cf);
    }
    cfs_.clear();
    auto const s = db_->Close();
    if (!s.ok()) {
        LOG_ERROR("closing index {} failed: {}", path_.string(), s.ToString());
    }
}

Result<std::unique_ptr<IndexedStore>>
IndexedStore::open(std::filesystem::path const &path, DbConfig const &config)
{
    std::unique_ptr<IndexedStore> store{new IndexedStore{path}};
    store->cache_ = rocksdb::NewLRUCache(config.block_cache_size);
    store->statistics_ = rocksdb::CreateDBStatistics();

    auto db_options = make_db_options(config);
    db_options.statistics = store->statistics_;

    auto const cf_options = make_cf_options(store->cache_);
    std::vector<rocksdb::ColumnFamilyDescriptor> cfds;
    for (auto const name : table_names) {
        cfds.emplace_back(std::string{name}, cf_options);
    }

    rocksdb::DB *db = nullptr;
    auto const s =
        rocksdb::DB::Open(db_options, path.string(), cfds, &store->cfs_, &db);
    if (!s.ok()) {
        LOG_ERROR("failed to open index {}: {}", path.string(), s.ToString());
        return to_store_error(s);
    }
    CHAINSTORE_ASSERT(db);
    CHAINSTORE_ASSERT(store->cfs_.size() == TABLE_COUNT);
    store->db_.reset(db);
    LOG_INFO("opened index {}", path.string());
    return store;
}

rocksdb::ColumnFamilyHandle *IndexedStore::handle(Table const table) const
{
    return cfs_[static_cast<size_t>(table)];
}

Snapshot IndexedStore::snapshot() const
{
    return Snapshot{db_.get()};
}

Result<std::optional<byte_string>> IndexedStore::get_raw(
    Table const table, byte_string_view const key,
    Snapshot const *const snapshot) const
{
    rocksdb::ReadOptions ro;
    set_snapshot(ro, snapshot);
    rocksdb::PinnableSlice value;
    auto const s = db_->Get(ro, handle(table), to_slice(key), &value);
    if (s.IsNotFound()) {
        return std::optional<byte_string>{};
    }
    if (!s.ok()) {
        LOG_ERROR(
            "index read from {} failed: {}", table_name(table), s.ToString());
        return to_store_error(s);
    }
    return std::optional<byte_string>{byte_string{to_view(value)}};
}

Result<std::optional<std::pair<byte_string, byte_string>>>
IndexedStore::last_raw(
    Table const table, KeyRange const &range,
    Snapshot const *const snapshot) const
{
    using entry_type = std::pair<byte_string, byte_string>;
    rocksdb::ReadOptions ro;
    set_snapshot(ro, snapshot);
    rocksdb::Slice const lower = to_slice(range.lower);
    ro.iterate_lower_bound = &lower;
    std::unique_ptr<rocksdb::Iterator> const it{
        db_->NewIterator(ro, handle(table))};
    if (range.upper.has_value()) {
        it->SeekForPrev(to_slice(*range.upper));
        // upper bound is exclusive
        if (it->Valid() &&
            to_view(it->key()) == byte_string_view{*range.upper}) {
            it->Prev();
        }
    }
    else {
        it->SeekToLast();
    }
    if (!it->Valid()) {
        auto const s = it->status();
        if (!s.ok()) {
            LOG_ERROR(
                "index seek in {} failed: {}", table_name(table), s.ToString());
            return to_store_error(s);
        }
        return std::optional<entry_type>{};
    }
    CHAINSTORE_DEBUG_ASSERT(range.contains(to_view(it->key())));
    return std::optional<entry_type>{entry_type{
        byte_string{to_view(it->key())}, byte_string{to_view(it->value())}}};
}

std::shared_ptr<RawCursor> IndexedStore::cursor(
    Table const table, KeyRange const &range,
    Snapshot const *const snapshot) const
{
    auto impl = std::make_unique<RawCursor::Impl>();
    impl->lower = range.lower;
    impl->upper = range.upper;
    impl->lower_slice = to_slice(impl->lower);
    rocksdb::ReadOptions ro;
    set_snapshot(ro, snapshot);
    ro.iterate_lower_bound = &impl->lower_slice;
    if (impl->upper.has_value()) {
        impl->upper_slice = to_slice(*impl->upper);
        ro.iterate_upper_bound = &impl->upper_slice;
    }
    impl->it.reset(db_->NewIterator(ro, handle(table)));
    impl->it->Seek(impl->lower_slice);
    return std::make_shared<RawCursor>(std::move(impl));
}

Result<void> IndexedStore::write(WriteBatch const &batch)
{
    rocksdb::WriteBatch wb;
    for (auto const &op : batch.ops()) {
        rocksdb::Status s;
        if (op.value.has_value()) {
            s = wb.Put(
                handle(op.table), to_slice(op.key), to_slice(*op.value));
        }
        else {
            s = wb.Delete(handle(op.table), to_slice(op.key));
        }
        if (!s.ok()) {
            LOG_ERROR("staging batch failed: {}", s.ToString());
            return StoreError::IoFailure;
        }
    }
    rocksdb::WriteOptions wo;
    wo.sync = true;
    auto const s = db_->Write(wo, &wb);
    if (!s.ok()) {
        LOG_ERROR("index batch write failed: {}", s.ToString());
        return StoreError::IoFailure;
    }
    return success();
}

Result<void> IndexedStore::flush()
{
    auto s = db_->Flush(rocksdb::FlushOptions{}, cfs_);
    if (s.ok()) {
        s = db_->FlushWAL(true);
    }
    if (!s.ok()) {
        LOG_ERROR("index flush failed: {}", s.ToString());
        return StoreError::IoFailure;
    }
    return success();
}

Result<void> IndexedStore::compact()
{
    for (auto *const cf : cfs_) {
        auto const s = db_->CompactRange(
            rocksdb::CompactRangeOptions{}, cf, nullptr, nullptr);
        if (!s.ok()) {
            LOG_ERROR(
                "compaction of {} failed: {}", cf->GetName(), s.ToString());
            return StoreError::IoFailure;
        }
    }
    return success();
}

std::string IndexedStore::stats() const
{
    std::string out;
    if (!db_->GetProperty("rocksdb.stats", &out)) {
        return {};
    }
    return out;
}

CHAINSTORE_NAMESPACE_END
