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
#include <chainstore/core/bytes.hpp>
#include <chainstore/core/config.hpp>

#include <ethash/keccak.hpp>

#include <cstring>

CHAINSTORE_NAMESPACE_BEGIN

// Wrapper function around ethash::keccak256 to return a friendlier type
inline bytes32_t keccak256(byte_string_view const target)
{
    auto const hashed = ethash::keccak256(target.data(), target.size());
    bytes32_t result;
    static_assert(sizeof(hashed.bytes) == sizeof(result.bytes));
    std::memcpy(result.bytes, hashed.bytes, sizeof(result.bytes));
    return result;
}

CHAINSTORE_NAMESPACE_END
