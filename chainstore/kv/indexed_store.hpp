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

#include <chainstore/core/byte_string.hpp>
#include <chainstore/core/config.hpp>
#include <chainstore/core/result.hpp>
#include <chainstore/kv/db_config.hpp>
#include <chainstore/kv/key_range.hpp>
#include <chainstore/kv/schema.hpp>
#include <chainstore/kv/snapshot.hpp>
#include <chainstore/kv/table.hpp>
#include <chainstore/kv/write_batch.hpp>

#include <boost/outcome/try.hpp>

#include <cstddef>
#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rocksdb
{
    class Cache;
    class ColumnFamilyHandle;
    class DB;
    class Statistics;
}

CHAINSTORE_NAMESPACE_BEGIN

class IndexedStore;

// forward-only cursor over the encoded entries of one table range
class RawCursor
{
public:
    struct Impl;

private:
    std::unique_ptr<Impl> impl_;

public:
    explicit RawCursor(std::unique_ptr<Impl>);
    RawCursor(RawCursor const &) = delete;
    RawCursor &operator=(RawCursor const &) = delete;
    ~RawCursor();

    bool valid() const;
    byte_string_view key() const;
    byte_string_view value() const;
    void next();
    Result<void> status() const;
};

/**
 * Lazy, bounded, ordered range over a typed table. Every call to `begin`
 * starts a fresh scan, so a range can be walked more than once. A decode
 * or storage failure is yielded as an errored element and ends the scan.
 * Iterators are move only.
 */
template <Schema S>
class TableRange
{
public:
    using entry_type = std::pair<typename S::key_type, typename S::value_type>;

    class iterator
    {
        std::shared_ptr<RawCursor> cursor_{};
        std::optional<entry_type> entry_{};
        Result<void> failure_{success()};

        Result<entry_type> decode() const
        {
            BOOST_OUTCOME_TRY(auto key, S::decode_key(cursor_->key()));
            BOOST_OUTCOME_TRY(auto value, S::decode_value(cursor_->value()));
            return entry_type{std::move(key), std::move(value)};
        }

        void load()
        {
            entry_.reset();
            if (cursor_->valid()) {
                auto res = decode();
                if (res.has_error()) {
                    failure_ = std::move(res).error();
                }
                else {
                    entry_.emplace(std::move(res).value());
                }
                return;
            }
            auto status = cursor_->status();
            if (status.has_error()) {
                failure_ = std::move(status);
                return;
            }
            cursor_.reset();
        }

    public:
        using value_type = Result<entry_type>;
        using difference_type = std::ptrdiff_t;

        iterator() = default;

        explicit iterator(std::shared_ptr<RawCursor> cursor)
            : cursor_{std::move(cursor)}
        {
            load();
        }

        iterator(iterator &&) = default;
        iterator &operator=(iterator &&) = default;

        value_type operator*() const
        {
            if (failure_.has_error()) {
                return failure_.error().clone();
            }
            return *entry_;
        }

        iterator &operator++()
        {
            if (failure_.has_error()) {
                cursor_.reset();
                return *this;
            }
            cursor_->next();
            load();
            return *this;
        }

        void operator++(int)
        {
            ++*this;
        }

        friend bool operator==(iterator const &it, std::default_sentinel_t)
        {
            return it.cursor_ == nullptr;
        }
    };

private:
    IndexedStore const *store_;
    KeyRange range_;
    Snapshot const *snapshot_;

public:
    TableRange(
        IndexedStore const &store, KeyRange range, Snapshot const *snapshot)
        : store_{&store}
        , range_{std::move(range)}
        , snapshot_{snapshot}
    {
    }

    iterator begin() const;

    std::default_sentinel_t end() const
    {
        return {};
    }

    Result<std::vector<entry_type>> collect() const
    {
        std::vector<entry_type> entries;
        for (auto entry : *this) {
            BOOST_OUTCOME_TRY(auto kv, std::move(entry));
            entries.push_back(std::move(kv));
        }
        return entries;
    }
};

/**
 * RocksDB backed metadata index, one column family per table. Reads may be
 * pinned to a `Snapshot`; writes go through atomic, synced batches.
 */
class IndexedStore
{
    std::filesystem::path const path_;
    std::shared_ptr<rocksdb::Cache> cache_;
    std::shared_ptr<rocksdb::Statistics> statistics_;
    std::unique_ptr<rocksdb::DB> db_;
    std::vector<rocksdb::ColumnFamilyHandle *> cfs_;

    explicit IndexedStore(std::filesystem::path);

    rocksdb::ColumnFamilyHandle *handle(Table) const;

public:
    static Result<std::unique_ptr<IndexedStore>>
    open(std::filesystem::path const &, DbConfig const & = {});

    IndexedStore(IndexedStore const &) = delete;
    IndexedStore &operator=(IndexedStore const &) = delete;
    ~IndexedStore();

    std::filesystem::path const &path() const
    {
        return path_;
    }

    Snapshot snapshot() const;

    Result<std::optional<byte_string>> get_raw(
        Table, byte_string_view key, Snapshot const * = nullptr) const;

    // greatest entry inside the range
    Result<std::optional<std::pair<byte_string, byte_string>>> last_raw(
        Table, KeyRange const &, Snapshot const * = nullptr) const;

    std::shared_ptr<RawCursor>
    cursor(Table, KeyRange const &, Snapshot const * = nullptr) const;

    Result<void> write(WriteBatch const &);

    Result<void> flush();

    Result<void> compact();

    std::string stats() const;

    template <Schema S>
    Result<std::optional<typename S::value_type>>
    get(typename S::key_type const &key, Snapshot const *snapshot = nullptr)
        const
    {
        BOOST_OUTCOME_TRY(
            auto const raw, get_raw(S::table, S::encode_key(key), snapshot));
        if (!raw.has_value()) {
            return std::optional<typename S::value_type>{};
        }
        BOOST_OUTCOME_TRY(auto value, S::decode_value(*raw));
        return std::optional<typename S::value_type>{std::move(value)};
    }

    template <Schema S>
    TableRange<S>
    iterate(KeyRange range, Snapshot const *snapshot = nullptr) const
    {
        return TableRange<S>{*this, std::move(range), snapshot};
    }

    template <Schema S>
    Result<std::optional<typename TableRange<S>::entry_type>>
    last(KeyRange const &range, Snapshot const *snapshot = nullptr) const
    {
        using entry_type = typename TableRange<S>::entry_type;
        BOOST_OUTCOME_TRY(auto const raw, last_raw(S::table, range, snapshot));
        if (!raw.has_value()) {
            return std::optional<entry_type>{};
        }
        BOOST_OUTCOME_TRY(auto key, S::decode_key(raw->first));
        BOOST_OUTCOME_TRY(auto value, S::decode_value(raw->second));
        return std::optional<entry_type>{
            entry_type{std::move(key), std::move(value)}};
    }
};

template <Schema S>
typename TableRange<S>::iterator TableRange<S>::begin() const
{
    return iterator{store_->cursor(S::table, range_, snapshot_)};
}

CHAINSTORE_NAMESPACE_END
