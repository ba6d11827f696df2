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
#include <chainstore/core/result.hpp>
#include <chainstore/log/record_locator.hpp>
#include <chainstore/log/record_log.hpp>

#include <optional>
#include <span>
#include <string_view>
#include <vector>

CHAINSTORE_NAMESPACE_BEGIN

class IndexedStore;

enum class RecoveryState
{
    ScanningSegments,
    ValidatingIndex,
    Ready,
    Fatal,
};

std::string_view to_string(RecoveryState);

/**
 * Startup reconciliation of the record logs with the indexed store.
 *
 * The committed head of every log is the locator of the last record whose
 * index batch was written. Bytes after it were appended by a writer that
 * crashed before committing and are dropped; a head that does not point at
 * an intact frame means the logs lost committed data, which is fatal.
 */
class Recovery
{
    IndexedStore &store_;
    std::vector<RecordLog *> logs_;
    RecoveryState state_{RecoveryState::ScanningSegments};
    std::vector<std::optional<RecordLocator>> heads_;
    std::vector<SegmentScan> scans_;

    Result<void> scan_segments();
    Result<void> validate_index();

public:
    Recovery(IndexedStore &, std::span<RecordLog *const> logs);

    RecoveryState state() const
    {
        return state_;
    }

    // advances by one state; an error moves to Fatal
    Result<void> step();

    Result<void> run();
};

CHAINSTORE_NAMESPACE_END
