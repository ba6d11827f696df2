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
#include <chainstore/core/config.hpp>
#include <chainstore/core/result.hpp>

#include <cstdint>
#include <optional>

CHAINSTORE_NAMESPACE_BEGIN

class IndexedStore;
class Snapshot;
class WriteBatch;

/**
 * Binary lifting index over the block tree. For a block B at level L the
 * index holds, for every i with 2^i <= L, the ancestor of B at distance
 * 2^i. Entries are written once, together with the block they belong to,
 * and never change; a fork only adds entries for its own blocks.
 */
class PredecessorIndex
{
    IndexedStore const &store_;

    Result<BlockHash> lift(
        BlockHash const &, uint64_t distance, Snapshot const &) const;

public:
    explicit PredecessorIndex(IndexedStore const &);

    // stages the entries of a new block at `level` into `batch`; reads only
    // entries that are already committed
    Result<void> stage(
        WriteBatch &batch, BlockHash const &block,
        BlockHash const &predecessor, uint64_t level) const;

    Result<std::optional<BlockHash>> entry(
        BlockHash const &, uint8_t exponent,
        Snapshot const * = nullptr) const;

    // ancestor of `block` at `distance`, consistent with one snapshot
    Result<BlockHash>
    ancestor_at(BlockHash const &block, int64_t distance) const;

    // deepest block that is an ancestor of (or equal to) both
    Result<BlockHash>
    common_ancestor(BlockHash const &, BlockHash const &) const;
};

CHAINSTORE_NAMESPACE_END
