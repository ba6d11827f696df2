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

#include <chainstore/core/assert.h>
#include <chainstore/core/config.hpp>

#include <boost/fiber/buffered_channel.hpp>
#include <boost/fiber/channel_op_status.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

CHAINSTORE_NAMESPACE_BEGIN

namespace fiber
{
    /**
     * Background workers for long running housekeeping such as index
     * compaction and sealed segment verification. Tasks are taken from a
     * shared channel in submission order; no task holds a lock that blocks
     * foreground readers.
     */
    class MaintenancePool
    {
        boost::fibers::buffered_channel<std::function<void()>> channel_;
        std::atomic<bool> stopping_{false};
        std::vector<std::jthread> threads_;

    public:
        // zero selects the hardware concurrency
        explicit MaintenancePool(unsigned nthreads = 0);

        MaintenancePool(MaintenancePool const &) = delete;
        MaintenancePool &operator=(MaintenancePool const &) = delete;

        // waits for running tasks; tasks not yet started are dropped and
        // their futures report a broken promise
        ~MaintenancePool();

        size_t size() const
        {
            return threads_.size();
        }

        template <class F>
        std::future<std::invoke_result_t<F>> submit(F &&f)
        {
            using R = std::invoke_result_t<F>;
            auto task =
                std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
            auto future = task->get_future();
            auto const status = channel_.push([task] { (*task)(); });
            CHAINSTORE_ASSERT(
                status == boost::fibers::channel_op_status::success);
            return future;
        }
    };
}

CHAINSTORE_NAMESPACE_END
