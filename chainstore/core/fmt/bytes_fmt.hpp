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

#include <fmt/format.h>

#include <iterator>
#include <string>

// Log byte strings as a span due to below issue
//
// https://github.com/fmtlib/fmt/issues/1621
struct FmtDefaultParse
{
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx)
    {
        return ctx.begin();
    }
};

template <>
struct fmt::formatter<chainstore::bytes32_t> : public FmtDefaultParse
{
    template <typename FormatContext>
    auto format(chainstore::bytes32_t const &value, FormatContext &ctx) const
    {
        auto out = fmt::format_to(ctx.out(), "0x");
        for (auto const b : value.bytes) {
            out = fmt::format_to(out, "{:02x}", b);
        }
        return out;
    }
};

CHAINSTORE_NAMESPACE_BEGIN

inline std::string to_hex(byte_string_view const view)
{
    std::string out;
    out.reserve(view.size() * 2);
    for (auto const b : view) {
        fmt::format_to(std::back_inserter(out), "{:02x}", b);
    }
    return out;
}

CHAINSTORE_NAMESPACE_END
