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

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

CHAINSTORE_NAMESPACE_BEGIN

enum class ValidationStatus : uint8_t
{
    Unknown = 0,
    Applied,
    Invalid,
};

std::string_view to_string(ValidationStatus);

struct BlockMetadata
{
    ValidationStatus status{ValidationStatus::Unknown};
    bool on_main_chain{false};
    uint64_t level{0};
    std::optional<BlockHash> predecessor{};
    // children in the order they were stored
    std::vector<BlockHash> successors{};

    friend bool
    operator==(BlockMetadata const &, BlockMetadata const &) = default;
};

struct OperationMetadata
{
    ValidationStatus status{ValidationStatus::Unknown};

    friend bool
    operator==(OperationMetadata const &, OperationMetadata const &) = default;
};

byte_string encode_block_metadata(BlockMetadata const &);
Result<BlockMetadata> decode_block_metadata(byte_string_view &);

void encode_operation_metadata(byte_string &, OperationMetadata const &);
Result<OperationMetadata> decode_operation_metadata(byte_string_view &);

CHAINSTORE_NAMESPACE_END
