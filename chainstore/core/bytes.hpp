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

#include <algorithm>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>

CHAINSTORE_NAMESPACE_BEGIN

struct bytes32_t
{
    static constexpr size_t size = 32;

    uint8_t bytes[size]{};

    constexpr bytes32_t() = default;

    explicit bytes32_t(byte_string_view const view)
    {
        std::memcpy(bytes, view.data(), std::min(view.size(), size));
    }

    friend bool operator==(bytes32_t const &, bytes32_t const &) = default;
    friend auto operator<=>(bytes32_t const &, bytes32_t const &) = default;
};

static_assert(sizeof(bytes32_t) == 32);

inline byte_string_view to_byte_string_view(bytes32_t const &b)
{
    return {b.bytes, bytes32_t::size};
}

inline bytes32_t to_bytes(byte_string_view const view)
{
    return bytes32_t{view};
}

CHAINSTORE_NAMESPACE_END

template <>
struct std::hash<chainstore::bytes32_t>
{
    size_t operator()(chainstore::bytes32_t const &b) const noexcept
    {
        // digests are uniformly distributed, the leading word is enough
        size_t h;
        std::memcpy(&h, b.bytes, sizeof(h));
        return h;
    }
};
