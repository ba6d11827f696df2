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
#include <chainstore/chain/predecessor_index.hpp>
#include <chainstore/chain/tables.hpp>
#include <chainstore/core/assert.h>
#include <chainstore/core/fmt/bytes_fmt.hpp>
#include <chainstore/core/result.hpp>
#include <chainstore/core/store_error.hpp>
#include <chainstore/kv/indexed_store.hpp>
#include <chainstore/kv/snapshot.hpp>
#include <chainstore/kv/write_batch.hpp>

#include <boost/outcome/try.hpp>
#include <quill/Quill.h>

#include <fmt/format.h>

#include <algorithm>
#include <bit>
#include <cstdint>
#include <optional>

CHAINSTORE_NAMESPACE_BEGIN

namespace
{
    // highest exponent with 2^i <= level
    uint8_t max_exponent(uint64_t const level)
    {
        CHAINSTORE_ASSERT(level > 0);
        return static_cast<uint8_t>(std::bit_width(level) - 1);
    }

    Result<uint64_t> block_level(
        IndexedStore const &store, BlockHash const &block,
        Snapshot const &snapshot)
    {
        BOOST_OUTCOME_TRY(
            auto const meta, store.get<BlockMetaTable>(block, &snapshot));
        if (!meta.has_value()) {
            return StoreError::NotFound;
        }
        return meta->level;
    }
}

PredecessorIndex::PredecessorIndex(IndexedStore const &store)
    : store_{store}
{
}

Result<void> PredecessorIndex::stage(
    WriteBatch &batch, BlockHash const &block, BlockHash const &predecessor,
    uint64_t const level) const
{
    CHAINSTORE_ASSERT(level > 0);
    batch.put<PredecessorTable>({block, 0}, predecessor);
    BlockHash prev = predecessor;
    for (uint8_t i = 1; i <= max_exponent(level); ++i) {
        PredecessorTable::key_type const key{
            prev, static_cast<uint8_t>(i - 1)};
        BOOST_OUTCOME_TRY(auto const next, store_.get<PredecessorTable>(key));
        if (!next.has_value()) {
            LOG_ERROR(
                "missing predecessor entry {}/{} while indexing {}",
                fmt::format("{}", prev),
                i - 1,
                fmt::format("{}", block));
            return StoreError::Corrupted;
        }
        batch.put<PredecessorTable>({block, i}, *next);
        prev = *next;
    }
    return success();
}

Result<std::optional<BlockHash>> PredecessorIndex::entry(
    BlockHash const &block, uint8_t const exponent,
    Snapshot const *const snapshot) const
{
    return store_.get<PredecessorTable>({block, exponent}, snapshot);
}

Result<BlockHash> PredecessorIndex::lift(
    BlockHash const &block, uint64_t const distance,
    Snapshot const &snapshot) const
{
    BlockHash current = block;
    for (int bit = std::bit_width(distance) - 1; bit >= 0; --bit) {
        if ((distance & (uint64_t{1} << bit)) == 0) {
            continue;
        }
        BOOST_OUTCOME_TRY(
            auto const next,
            entry(current, static_cast<uint8_t>(bit), &snapshot));
        if (!next.has_value()) {
            LOG_ERROR(
                "missing predecessor entry {}/{}",
                fmt::format("{}", current),
                bit);
            return StoreError::Corrupted;
        }
        current = *next;
    }
    return current;
}

Result<BlockHash> PredecessorIndex::ancestor_at(
    BlockHash const &block, int64_t const distance) const
{
    if (distance < 0) {
        return StoreError::InvalidDistance;
    }
    auto const snapshot = store_.snapshot();
    BOOST_OUTCOME_TRY(
        auto const level, block_level(store_, block, snapshot));
    if (static_cast<uint64_t>(distance) > level) {
        return StoreError::InvalidDistance;
    }
    return lift(block, static_cast<uint64_t>(distance), snapshot);
}

Result<BlockHash> PredecessorIndex::common_ancestor(
    BlockHash const &a, BlockHash const &b) const
{
    auto const snapshot = store_.snapshot();
    BOOST_OUTCOME_TRY(auto const level_a, block_level(store_, a, snapshot));
    BOOST_OUTCOME_TRY(auto const level_b, block_level(store_, b, snapshot));
    uint64_t const level = std::min(level_a, level_b);

    BOOST_OUTCOME_TRY(auto x, lift(a, level_a - level, snapshot));
    BOOST_OUTCOME_TRY(auto y, lift(b, level_b - level, snapshot));
    if (x == y) {
        return x;
    }
    if (level == 0) {
        // distinct roots
        return StoreError::NotFound;
    }
    // x and y are at the same level and differ; step both up while their
    // ancestors at 2^i still differ
    uint64_t remaining = level;
    for (int i = max_exponent(level); i >= 0; --i) {
        if ((uint64_t{1} << i) > remaining) {
            continue;
        }
        BOOST_OUTCOME_TRY(
            auto const ax, entry(x, static_cast<uint8_t>(i), &snapshot));
        BOOST_OUTCOME_TRY(
            auto const ay, entry(y, static_cast<uint8_t>(i), &snapshot));
        if (!ax.has_value() || !ay.has_value()) {
            return StoreError::Corrupted;
        }
        if (*ax != *ay) {
            x = *ax;
            y = *ay;
            remaining -= uint64_t{1} << i;
        }
    }
    BOOST_OUTCOME_TRY(auto const px, entry(x, 0, &snapshot));
    BOOST_OUTCOME_TRY(auto const py, entry(y, 0, &snapshot));
    if (!px.has_value() || !py.has_value()) {
        // the two branches end in distinct roots
        return StoreError::NotFound;
    }
    if (*px != *py) {
        return StoreError::Corrupted;
    }
    return *px;
}

CHAINSTORE_NAMESPACE_END
