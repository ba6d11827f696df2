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

#include <chainstore/chain/block_header.hpp>
#include <chainstore/chain/tables.hpp>
#include <chainstore/codec/codec.hpp>
#include <chainstore/core/byte_string.hpp>
#include <chainstore/core/fmt/bytes_fmt.hpp>
#include <chainstore/core/result.hpp>
#include <chainstore/core/store_error.hpp>
#include <chainstore/kv/indexed_store.hpp>
#include <chainstore/kv/write_batch.hpp>
#include <chainstore/log/record_locator.hpp>
#include <chainstore/log/record_log.hpp>
#include <chainstore/storage/recovery.hpp>

#include <boost/outcome/try.hpp>
#include <quill/Quill.h>

#include <fmt/format.h>

#include <algorithm>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

CHAINSTORE_NAMESPACE_BEGIN

std::string_view to_string(RecoveryState const state)
{
    switch (state) {
    case RecoveryState::ScanningSegments:
        return "scanning segments";
    case RecoveryState::ValidatingIndex:
        return "validating index";
    case RecoveryState::Ready:
        return "ready";
    case RecoveryState::Fatal:
        return "fatal";
    }
    return "?";
}

Recovery::Recovery(IndexedStore &store, std::span<RecordLog *const> const logs)
    : store_{store}
    , logs_{logs.begin(), logs.end()}
{
}

Result<void> Recovery::scan_segments()
{
    heads_.clear();
    scans_.clear();
    for (auto *const log : logs_) {
        BOOST_OUTCOME_TRY(auto scan, log->scan());
        BOOST_OUTCOME_TRY(
            auto head, store_.get<LogHeadTable>(std::string{log->name()}));
        LOG_INFO(
            "{}: {} segments, tail valid to {} of {} bytes, committed head {}",
            log->name(),
            scan.segments.size(),
            scan.tail_valid_end,
            scan.tail_file_size,
            head.has_value() ? fmt::format("{}", *head) : "none");
        scans_.push_back(std::move(scan));
        heads_.push_back(std::move(head));
    }
    return success();
}

Result<void> Recovery::validate_index()
{
    BOOST_OUTCOME_TRY(
        auto const version,
        store_.get<MetaTable>(std::string{SCHEMA_VERSION_KEY}));
    if (version.has_value()) {
        byte_string_view enc{*version};
        BOOST_OUTCOME_TRY(auto const stored, codec::decode_u32(enc));
        BOOST_OUTCOME_TRY(codec::expect_end(enc));
        if (stored != SCHEMA_VERSION) {
            LOG_ERROR(
                "index schema version {} is not supported (expected {})",
                stored,
                SCHEMA_VERSION);
            return StoreError::Corrupted;
        }
    }
    else {
        byte_string enc;
        codec::encode_u32(enc, SCHEMA_VERSION);
        WriteBatch batch;
        batch.put<MetaTable>(std::string{SCHEMA_VERSION_KEY}, enc);
        BOOST_OUTCOME_TRY(store_.write(batch));
    }

    for (size_t i = 0; i < logs_.size(); ++i) {
        auto *const log = logs_[i];
        auto const &scan = scans_[i];
        auto const &head = heads_[i];
        if (head.has_value()) {
            auto const &segments = scan.segments;
            if (std::find(segments.begin(), segments.end(), head->segment) ==
                segments.end()) {
                LOG_ERROR(
                    "{}: segment of committed head {} is missing",
                    log->name(),
                    fmt::format("{}", *head));
                return StoreError::Corrupted;
            }
            if (head->segment == segments.back() &&
                frame_end(*head) > scan.tail_valid_end) {
                LOG_ERROR(
                    "{}: committed head {} is past the last intact frame at {}",
                    log->name(),
                    fmt::format("{}", *head),
                    scan.tail_valid_end);
                return StoreError::Corrupted;
            }
        }
        else if (!scan.segments.empty()) {
            LOG_WARNING(
                "{}: no committed head, discarding {} segments",
                log->name(),
                scan.segments.size());
        }
        BOOST_OUTCOME_TRY(log->reconcile(head));
    }

    BOOST_OUTCOME_TRY(
        auto const main_head,
        store_.get<MetaTable>(std::string{MAIN_CHAIN_HEAD_KEY}));
    if (main_head.has_value()) {
        byte_string_view enc{*main_head};
        BOOST_OUTCOME_TRY(auto const hash, codec::decode_bytes32(enc));
        BOOST_OUTCOME_TRY(auto const meta, store_.get<BlockMetaTable>(hash));
        if (!meta.has_value()) {
            LOG_ERROR(
                "main chain head {} is not a stored block",
                fmt::format("{}", hash));
            return StoreError::Corrupted;
        }
    }
    return success();
}

Result<void> Recovery::step()
{
    Result<void> res = success();
    switch (state_) {
    case RecoveryState::ScanningSegments:
        res = scan_segments();
        break;
    case RecoveryState::ValidatingIndex:
        res = validate_index();
        break;
    case RecoveryState::Ready:
        return success();
    case RecoveryState::Fatal:
        return StoreError::NotReady;
    }
    if (res.has_error()) {
        LOG_ERROR(
            "recovery failed while {}: {}",
            to_string(state_),
            res.error().message().c_str());
        state_ = RecoveryState::Fatal;
        return res;
    }
    state_ = state_ == RecoveryState::ScanningSegments
                 ? RecoveryState::ValidatingIndex
                 : RecoveryState::Ready;
    return success();
}

Result<void> Recovery::run()
{
    while (state_ != RecoveryState::Ready) {
        BOOST_OUTCOME_TRY(step());
    }
    LOG_INFO("recovery complete");
    return success();
}

CHAINSTORE_NAMESPACE_END
