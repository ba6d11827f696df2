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
#include <chainstore/kv/schema.hpp>
#include <chainstore/kv/table.hpp>

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

CHAINSTORE_NAMESPACE_BEGIN

/**
 * Mutations staged for one atomic write to the indexed store. Nothing is
 * visible to readers until `IndexedStore::write` commits the whole batch.
 */
class WriteBatch
{
public:
    struct Op
    {
        Table table;
        byte_string key;
        // absent for a delete
        std::optional<byte_string> value;
    };

private:
    std::vector<Op> ops_;

public:
    void put_raw(Table const table, byte_string key, byte_string value)
    {
        ops_.push_back(Op{table, std::move(key), std::move(value)});
    }

    void remove_raw(Table const table, byte_string key)
    {
        ops_.push_back(Op{table, std::move(key), std::nullopt});
    }

    template <Schema S>
    void
    put(typename S::key_type const &key, typename S::value_type const &value)
    {
        put_raw(S::table, S::encode_key(key), S::encode_value(value));
    }

    template <Schema S>
    void remove(typename S::key_type const &key)
    {
        remove_raw(S::table, S::encode_key(key));
    }

    std::vector<Op> const &ops() const
    {
        return ops_;
    }

    size_t size() const
    {
        return ops_.size();
    }

    bool empty() const
    {
        return ops_.empty();
    }
};

CHAINSTORE_NAMESPACE_END
