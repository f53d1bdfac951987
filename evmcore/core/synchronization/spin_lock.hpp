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

#include <evmcore/core/config.hpp>
#include <evmcore/core/likely.h>

#include <atomic>
#include <cstdint>

EVMCORE_NAMESPACE_BEGIN

/**
 * Test-and-test-and-set lock for very short critical sections, e.g. pushing
 * or popping a free list. Satisfies Lockable, so it composes with
 * std::lock_guard and std::unique_lock.
 */
class SpinLock
{
    static constexpr uint64_t backoff_start = 100;
    static constexpr uint64_t backoff_count = 100;

    std::atomic<bool> state_{false};

public:
    SpinLock() = default;
    SpinLock(SpinLock const &) = delete;
    SpinLock &operator=(SpinLock const &) = delete;

    bool try_lock() noexcept
    {
        return !state_.exchange(true, std::memory_order_acquire);
    }

    void lock() noexcept
    {
        if (EVMCORE_LIKELY(try_lock())) {
            return;
        }
        uint64_t spin = 0;
        do {
            while (state_.load(std::memory_order_relaxed)) {
                if (++spin > backoff_start) {
                    backoff();
                }
            }
        }
        while (!try_lock());
    }

    void unlock() noexcept
    {
        state_.store(false, std::memory_order_release);
    }

private:
    static void backoff() noexcept
    {
#ifdef __x86_64__
        __builtin_ia32_pause();
#else
        for (uint64_t i = 0; i < backoff_count; ++i) {
            __asm__ __volatile__("" : : : "memory");
        }
#endif
    }
};

EVMCORE_NAMESPACE_END
