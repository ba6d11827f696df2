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

#include <chainstore/chain/chain_writer.hpp>
#include <chainstore/chain/context_action_log.hpp>
#include <chainstore/chain/tables.hpp>
#include <chainstore/core/byte_string.hpp>
#include <chainstore/core/result.hpp>
#include <chainstore/kv/indexed_store.hpp>
#include <chainstore/kv/key_range.hpp>
#include <chainstore/kv/write_batch.hpp>
#include <chainstore/log/record_locator.hpp>
#include <chainstore/log/record_log.hpp>

#include <boost/outcome/try.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

CHAINSTORE_NAMESPACE_BEGIN

ContextActionLog::ContextActionLog(IndexedStore &store, RecordLog &log)
    : store_{store}
    , log_{log}
{
}

Result<uint64_t> ContextActionLog::next_sequence(BlockHash const &block) const
{
    BOOST_OUTCOME_TRY(
        auto const last,
        store_.last<ContextActionsTable>(
            KeyRange::prefix(block_key_prefix(block))));
    if (!last.has_value()) {
        return uint64_t{0};
    }
    return last->first.second + 1;
}

Result<uint64_t> ContextActionLog::append_action(
    ChainWriter &writer, BlockHash const &block, byte_string_view const action)
{
    byte_string const copy{action};
    return append_actions(writer, block, std::span{&copy, 1});
}

Result<uint64_t> ContextActionLog::append_actions(
    ChainWriter &, BlockHash const &block,
    std::span<byte_string const> const actions)
{
    BOOST_OUTCOME_TRY(auto const first, next_sequence(block));
    if (actions.empty()) {
        return first;
    }

    WriteBatch batch;
    uint64_t seq = first;
    RecordLocator head;
    for (auto const &action : actions) {
        BOOST_OUTCOME_TRY(head, log_.append(action));
        batch.put<ContextActionsTable>({block, seq++}, head);
    }
    batch.put<LogHeadTable>(std::string{log_.name()}, head);
    BOOST_OUTCOME_TRY(store_.write(batch));
    return first;
}

Result<std::vector<ContextActionRecord>>
ContextActionLog::get_actions(BlockHash const &block) const
{
    auto const snapshot = store_.snapshot();
    BOOST_OUTCOME_TRY(
        auto const entries,
        store_
            .iterate<ContextActionsTable>(
                KeyRange::prefix(block_key_prefix(block)), &snapshot)
            .collect());

    std::vector<RecordLocator> locators;
    locators.reserve(entries.size());
    for (auto const &[key, locator] : entries) {
        locators.push_back(locator);
    }
    BOOST_OUTCOME_TRY(auto data, log_.read_range(locators));

    std::vector<ContextActionRecord> records;
    records.reserve(entries.size());
    for (size_t i = 0; i < entries.size(); ++i) {
        records.push_back(ContextActionRecord{
            .block = block,
            .sequence = entries[i].first.second,
            .locator = entries[i].second,
            .data = std::move(data[i])});
    }
    return records;
}

Result<uint64_t> ContextActionLog::action_count(BlockHash const &block) const
{
    return next_sequence(block);
}

CHAINSTORE_NAMESPACE_END
