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

#include <boost/outcome/config.hpp>
// include paths differ between Boost releases
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

CHAINSTORE_NAMESPACE_BEGIN

enum class StoreError
{
    Success = 0,
    NotFound,
    Corrupted,
    IoFailure,
    DuplicateKey,
    InvalidDistance,
    SerializationError,
    InvalidBlock,
    NotReady,
};

CHAINSTORE_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<chainstore::StoreError>
    : quick_status_code_from_enum_defaults<chainstore::StoreError>
{
    static constexpr auto const domain_name = "Store Error";
    static constexpr auto const domain_uuid =
        "3f1a2b7e-8c44-4d1e-9b0f-6a5d2e917c30";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
