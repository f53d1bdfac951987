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

#include <evmcore/core/synchronization/spin_lock.hpp>
#include <evmcore/vm/interpreter/value_stack.hpp>

#include <cstddef>
#include <limits>
#include <memory>
#include <vector>

namespace evmcore::vm
{
    class StackPool;

    /**
     * Scoped ownership of a pooled ValueStack. The stack goes back to its
     * pool when the handle is destroyed, whichever way the owning call frame
     * exits.
     */
    class PooledStack
    {
        StackPool *pool_;
        std::unique_ptr<ValueStack> stack_;

        friend class StackPool;

        PooledStack(StackPool &, std::unique_ptr<ValueStack>) noexcept;

    public:
        PooledStack(PooledStack &&) noexcept;
        PooledStack &operator=(PooledStack &&) noexcept;
        PooledStack(PooledStack const &) = delete;
        PooledStack &operator=(PooledStack const &) = delete;

        ~PooledStack();

        ValueStack &operator*() const noexcept
        {
            return *stack_;
        }

        ValueStack *operator->() const noexcept
        {
            return stack_.get();
        }

        ValueStack *get() const noexcept
        {
            return stack_.get();
        }

    private:
        void release() noexcept;
    };

    /**
     * Free list of ValueStack instances shared by all executions. Only
     * acquire() and the release performed by ~PooledStack synchronize; an
     * acquired stack belongs to a single execution.
     */
    class StackPool
    {
    public:
        struct Config
        {
            /// Idle instances kept for reuse; surplus instances are freed.
            std::size_t max_cached{std::numeric_limits<std::size_t>::max()};
        };

        StackPool();
        explicit StackPool(Config const &);

        StackPool(StackPool const &) = delete;
        StackPool &operator=(StackPool const &) = delete;

        ~StackPool();

        /// Returns an empty stack, recycled if one is available.
        PooledStack acquire();

        std::size_t cached() const noexcept;

        /// Instances owned by the pool, idle or acquired.
        std::size_t live() const noexcept;

    private:
        friend class PooledStack;

        void release(std::unique_ptr<ValueStack>) noexcept;

        Config const config_;
        mutable SpinLock lock_;
        std::vector<std::unique_ptr<ValueStack>> free_;
        std::size_t live_{0};
    };
}
