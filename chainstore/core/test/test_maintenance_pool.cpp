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

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace chainstore::fiber;

TEST(MaintenancePool, runs_every_task)
{
    std::atomic<unsigned> count{0};
    std::vector<std::future<unsigned>> futures;
    {
        MaintenancePool pool{3};
        EXPECT_EQ(pool.size(), 3);
        for (unsigned i = 0; i < 100; ++i) {
            futures.push_back(pool.submit([&count, i] {
                ++count;
                return i * 2;
            }));
        }
        for (unsigned i = 0; i < 100; ++i) {
            EXPECT_EQ(futures[i].get(), i * 2);
        }
    }
    EXPECT_EQ(count.load(), 100);
}

TEST(MaintenancePool, exception_reaches_future)
{
    MaintenancePool pool{1};
    auto future = pool.submit([]() -> int {
        throw std::runtime_error{"compaction failed"};
    });
    EXPECT_THROW(future.get(), std::runtime_error);
    // the worker survives the failed task
    EXPECT_EQ(pool.submit([] { return 1; }).get(), 1);
}

TEST(MaintenancePool, default_size)
{
    MaintenancePool pool;
    EXPECT_GE(pool.size(), 1);
}

TEST(MaintenancePool, shutdown_drops_queued_tasks)
{
    std::promise<void> started;
    std::future<int> running;
    std::future<int> queued;
    {
        MaintenancePool pool{1};
        running = pool.submit([&started] {
            started.set_value();
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            return 1;
        });
        queued = pool.submit([] { return 2; });
        started.get_future().wait();
    }
    EXPECT_EQ(running.get(), 1);
    try {
        queued.get();
        FAIL() << "queued task ran after shutdown";
    }
    catch (std::future_error const &e) {
        EXPECT_EQ(e.code(), std::future_errc::broken_promise);
    }
}
