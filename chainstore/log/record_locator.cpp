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

#include <chainstore/codec/codec.hpp>
#include <chainstore/core/byte_string.hpp>
#include <chainstore/core/result.hpp>
#include <chainstore/log/record_locator.hpp>

#include <boost/outcome/try.hpp>

#include <span>
#include <vector>

CHAINSTORE_NAMESPACE_BEGIN

std::vector<LocatorRange>
fold_consecutive_locators(std::span<RecordLocator const> const locators)
{
    std::vector<LocatorRange> ranges;
    if (locators.empty()) {
        return ranges;
    }

    RecordLocator prev = locators.front();
    LocatorRange range{
        prev.segment, prev.offset, frame_end(prev) - prev.offset, 1};
    for (auto const &curr : locators.subspan(1)) {
        if (curr.segment == prev.segment && curr.offset == frame_end(prev)) {
            range.byte_length += frame_end(curr) - curr.offset;
            ++range.count;
        }
        else {
            ranges.push_back(range);
            range = LocatorRange{
                curr.segment, curr.offset, frame_end(curr) - curr.offset, 1};
        }
        prev = curr;
    }
    ranges.push_back(range);
    return ranges;
}

void encode_record_locator(byte_string &out, RecordLocator const &loc)
{
    codec::encode_u64(out, loc.segment);
    codec::encode_u64(out, loc.offset);
    codec::encode_u64(out, loc.length);
}

Result<RecordLocator> decode_record_locator(byte_string_view &enc)
{
    RecordLocator loc;
    BOOST_OUTCOME_TRY(loc.segment, codec::decode_u64(enc));
    BOOST_OUTCOME_TRY(loc.offset, codec::decode_u64(enc));
    BOOST_OUTCOME_TRY(loc.length, codec::decode_u64(enc));
    return loc;
}

CHAINSTORE_NAMESPACE_END
