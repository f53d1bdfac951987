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

#include <evmcore/core/assert.h>
#include <evmcore/vm/interpreter/stack_pool.hpp>
#include <evmcore/vm/interpreter/value_stack.hpp>

#include <cstddef>
#include <memory>
#include <mutex>
#include <utility>

namespace evmcore::vm
{
    PooledStack::PooledStack(
        StackPool &pool, std::unique_ptr<ValueStack> stack) noexcept
        : pool_{&pool}
        , stack_{std::move(stack)}
    {
    }

    PooledStack::PooledStack(PooledStack &&other) noexcept
        : pool_{other.pool_}
        , stack_{std::move(other.stack_)}
    {
    }

    PooledStack &PooledStack::operator=(PooledStack &&other) noexcept
    {
        if (this != &other) {
            release();
            pool_ = other.pool_;
            stack_ = std::move(other.stack_);
        }
        return *this;
    }

    PooledStack::~PooledStack()
    {
        release();
    }

    void PooledStack::release() noexcept
    {
        if (stack_) {
            pool_->release(std::move(stack_));
        }
    }

    StackPool::StackPool()
        : StackPool{Config{}}
    {
    }

    StackPool::StackPool(Config const &config)
        : config_{config}
    {
    }

    StackPool::~StackPool()
    {
        // every handle must have been returned before the pool goes away
        EVMCORE_ASSERT(free_.size() == live_);
    }

    PooledStack StackPool::acquire()
    {
        {
            std::lock_guard const g{lock_};
            if (!free_.empty()) {
                auto stack = std::move(free_.back());
                free_.pop_back();
                return PooledStack{*this, std::move(stack)};
            }
        }
        auto stack = std::make_unique<ValueStack>();
        {
            std::lock_guard const g{lock_};
            // release() must not allocate
            free_.reserve(live_ + 1);
            ++live_;
        }
        return PooledStack{*this, std::move(stack)};
    }

    void StackPool::release(std::unique_ptr<ValueStack> stack) noexcept
    {
        EVMCORE_DEBUG_ASSERT(stack != nullptr);
        stack->reset();
        std::lock_guard const g{lock_};
        if (free_.size() < config_.max_cached) {
            free_.push_back(std::move(stack));
        }
        else {
            --live_;
        }
    }

    std::size_t StackPool::cached() const noexcept
    {
        std::lock_guard const g{lock_};
        return free_.size();
    }

    std::size_t StackPool::live() const noexcept
    {
        std::lock_guard const g{lock_};
        return live_;
    }
}
