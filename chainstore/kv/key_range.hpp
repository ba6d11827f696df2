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

#include <optional>
#include <utility>

CHAINSTORE_NAMESPACE_BEGIN

// [lower, upper) over encoded keys; no upper bound runs to the table end
struct KeyRange
{
    byte_string lower{};
    std::optional<byte_string> upper{};

    static KeyRange prefix(byte_string prefix)
    {
        // smallest key greater than every key starting with prefix
        byte_string upper = prefix;
        while (!upper.empty() && upper.back() == 0xff) {
            upper.pop_back();
        }
        if (upper.empty()) {
            return KeyRange{std::move(prefix), std::nullopt};
        }
        ++upper.back();
        return KeyRange{std::move(prefix), std::move(upper)};
    }

    bool contains(byte_string_view const key) const
    {
        return key >= byte_string_view{lower} &&
               (!upper.has_value() || key < byte_string_view{*upper});
    }
};

CHAINSTORE_NAMESPACE_END
