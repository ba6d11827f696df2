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

#include <cstdint>

CHAINSTORE_NAMESPACE_BEGIN

enum class RecordCompression : uint8_t
{
    None = 0,
    Brotli = 1,
};

Result<byte_string> brotli_compress(byte_string_view);

Result<byte_string> brotli_decompress(byte_string_view);

CHAINSTORE_NAMESPACE_END
