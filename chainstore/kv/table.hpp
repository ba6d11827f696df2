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

#include <chainstore/core/config.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

CHAINSTORE_NAMESPACE_BEGIN

// one RocksDB column family per table
enum class Table : uint8_t
{
    Meta = 0,
    Blocks,
    BlockMeta,
    BlockLevels,
    Operations,
    PredecessorIndex,
    ContextActions,
};

inline constexpr size_t TABLE_COUNT = 7;

inline constexpr std::array<std::string_view, TABLE_COUNT> table_names = {
    "default",
    "blocks",
    "block_meta",
    "block_levels",
    "operations",
    "predecessor_index",
    "context_actions",
};

constexpr std::string_view table_name(Table const table)
{
    return table_names[static_cast<size_t>(table)];
}

CHAINSTORE_NAMESPACE_END
