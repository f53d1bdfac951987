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

#include <evmcore/core/synchronization/spin_lock.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

using namespace evmcore;

namespace
{
    TEST(SpinLock, try_lock_is_exclusive)
    {
        SpinLock lock;
        EXPECT_TRUE(lock.try_lock());
        EXPECT_FALSE(lock.try_lock());
        lock.unlock();
        EXPECT_TRUE(lock.try_lock());
        lock.unlock();
    }

    TEST(SpinLock, guards_counter_across_threads)
    {
        constexpr unsigned nthreads = 4;
        constexpr uint64_t iterations = 100'000;

        SpinLock lock;
        uint64_t counter = 0;

        std::vector<std::thread> threads;
        for (unsigned t = 0; t < nthreads; ++t) {
            threads.emplace_back([&] {
                for (uint64_t i = 0; i < iterations; ++i) {
                    std::lock_guard const g{lock};
                    ++counter;
                }
            });
        }
        for (auto &t : threads) {
            t.join();
        }
        EXPECT_EQ(counter, nthreads * iterations);
    }
}
