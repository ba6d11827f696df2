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

#include <chainstore/core/fiber/maintenance_pool.hpp>

#include <boost/fiber/buffered_channel.hpp>
#include <boost/fiber/channel_op_status.hpp>

#include <algorithm>
#include <atomic>
#include <functional>
#include <thread>

CHAINSTORE_NAMESPACE_BEGIN

namespace fiber
{
    MaintenancePool::MaintenancePool(unsigned const nthreads)
        : channel_{1024}
    {
        unsigned const n =
            nthreads != 0 ? nthreads
                          : std::max(1u, std::thread::hardware_concurrency());
        threads_.reserve(n);
        for (unsigned i = 0; i < n; ++i) {
            threads_.emplace_back([this] {
                std::function<void()> task;
                // pop keeps returning queued tasks after close
                while (channel_.pop(task) ==
                           boost::fibers::channel_op_status::success &&
                       !stopping_.load(std::memory_order_acquire)) {
                    task();
                    task = nullptr;
                }
            });
        }
    }

    MaintenancePool::~MaintenancePool()
    {
        stopping_.store(true, std::memory_order_release);
        channel_.close();
        threads_.clear();
    }
}

CHAINSTORE_NAMESPACE_END
