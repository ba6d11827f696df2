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

#include <chainstore/core/store_error.hpp>

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

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<chainstore::StoreError>::mapping> const &
quick_status_code_from_enum<chainstore::StoreError>::value_mappings()
{
    using chainstore::StoreError;

    static std::initializer_list<mapping> const v = {
        {StoreError::Success, "success", {errc::success}},
        {StoreError::NotFound, "not found", {errc::no_such_file_or_directory}},
        {StoreError::Corrupted, "corrupted", {errc::illegal_byte_sequence}},
        {StoreError::IoFailure, "io failure", {errc::io_error}},
        {StoreError::DuplicateKey, "duplicate key", {errc::file_exists}},
        {StoreError::InvalidDistance,
         "invalid distance",
         {errc::argument_out_of_domain}},
        {StoreError::SerializationError,
         "serialization error",
         {errc::bad_message}},
        {StoreError::InvalidBlock, "invalid block", {errc::invalid_argument}},
        {StoreError::NotReady, "not ready", {errc::operation_not_permitted}}};

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
