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
#include <chainstore/core/byte_string.hpp>
#include <chainstore/core/config.hpp>
#include <chainstore/core/result.hpp>
#include <chainstore/log/record_locator.hpp>

#include <cstdint>
#include <span>
#include <vector>

CHAINSTORE_NAMESPACE_BEGIN

class ChainWriter;
class IndexedStore;
class RecordLog;

struct ContextActionRecord
{
    BlockHash block{};
    uint64_t sequence{0};
    RecordLocator locator{};
    byte_string data{};
};

/**
 * Ordered trace of the context mutations performed while applying a block.
 * Sequence numbers of a block start at 0 and are dense.
 */
class ContextActionLog
{
    IndexedStore &store_;
    RecordLog &log_;

    Result<uint64_t> next_sequence(BlockHash const &) const;

public:
    ContextActionLog(IndexedStore &, RecordLog &);

    // returns the sequence assigned to the action
    Result<uint64_t>
    append_action(ChainWriter &, BlockHash const &, byte_string_view action);

    // all actions in one batch; returns the sequence of the first one
    Result<uint64_t> append_actions(
        ChainWriter &, BlockHash const &, std::span<byte_string const>);

    Result<std::vector<ContextActionRecord>>
    get_actions(BlockHash const &) const;

    Result<uint64_t> action_count(BlockHash const &) const;
};

CHAINSTORE_NAMESPACE_END
