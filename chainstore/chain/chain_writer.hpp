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

CHAINSTORE_NAMESPACE_BEGIN

class Storage;

/**
 * Capability to mutate the store. `Storage` hands out exactly one, so
 * holding a reference proves the caller is the single writer.
 */
class ChainWriter
{
    friend class Storage;

    ChainWriter() = default;

public:
    ChainWriter(ChainWriter const &) = delete;
    ChainWriter &operator=(ChainWriter const &) = delete;
    ChainWriter(ChainWriter &&) = delete;
    ChainWriter &operator=(ChainWriter &&) = delete;
};

CHAINSTORE_NAMESPACE_END
