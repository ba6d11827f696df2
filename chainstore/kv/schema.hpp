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
#include <chainstore/kv/table.hpp>

#include <concepts>

CHAINSTORE_NAMESPACE_BEGIN

/**
 * A typed view of one table. Keys must encode so that the bytewise order of
 * the encoding is the order the table is meant to be scanned in.
 */
template <class S>
concept Schema = requires(
    typename S::key_type const &key, typename S::value_type const &value,
    byte_string_view view) {
    { S::table } -> std::convertible_to<Table>;
    { S::encode_key(key) } -> std::same_as<byte_string>;
    { S::decode_key(view) } -> std::same_as<Result<typename S::key_type>>;
    { S::encode_value(value) } -> std::same_as<byte_string>;
    {
        S::decode_value(view)
    } -> std::same_as<Result<typename S::value_type>>;
};

CHAINSTORE_NAMESPACE_END
