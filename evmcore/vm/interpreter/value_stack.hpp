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

#include <evmcore/core/assert.h>
#include <evmcore/core/int.hpp>

#include <cstddef>
#include <span>
#include <tuple>
#include <vector>

namespace evmcore::vm
{
    constexpr std::size_t stack_limit = 1024;

    /**
     * LIFO operand stack of 256-bit words.
     *
     * None of the operations check bounds. The caller (the interpreter's
     * pre-dispatch validation, see stack_requirements.hpp) guarantees that
     * every pop/peek/swap/dup touches only live slots and that the stack
     * never exceeds `stack_limit`. Violating a precondition is undefined
     * behaviour; debug builds assert.
     *
     * Multi-element pops return values deepest first: after push(a),
     * push(b), push(c), pop3() returns {a, b, c}.
     *
     * References returned by peek(), back() and the pop*_peek() family stay
     * valid only until the next operation that changes size().
     */
    class ValueStack
    {
        std::vector<uint256_t> data_;

    public:
        static constexpr std::size_t initial_capacity = 16;

        ValueStack();

        ValueStack(ValueStack const &) = delete;
        ValueStack &operator=(ValueStack const &) = delete;
        ValueStack(ValueStack &&) noexcept = default;
        ValueStack &operator=(ValueStack &&) noexcept = default;

        std::size_t size() const noexcept
        {
            return data_.size();
        }

        bool empty() const noexcept
        {
            return data_.empty();
        }

        std::size_t capacity() const noexcept
        {
            return data_.capacity();
        }

        /// Live slots, bottom first.
        std::span<uint256_t const> data() const noexcept
        {
            return data_;
        }

        /// Drops every element; the storage is kept for reuse.
        void reset() noexcept
        {
            data_.clear();
        }

        [[gnu::always_inline]] void push(uint256_t const &v)
        {
            data_.push_back(v);
        }

        [[gnu::always_inline]] uint256_t pop() noexcept
        {
            EVMCORE_DEBUG_ASSERT(size() >= 1);
            uint256_t const v = data_.back();
            data_.pop_back();
            return v;
        }

        [[gnu::always_inline]] std::tuple<uint256_t, uint256_t> pop2() noexcept
        {
            EVMCORE_DEBUG_ASSERT(size() >= 2);
            auto const *const p = top_ptr() - 1;
            std::tuple<uint256_t, uint256_t> r{p[0], p[1]};
            shrink(2);
            return r;
        }

        [[gnu::always_inline]] std::tuple<uint256_t, uint256_t, uint256_t>
        pop3() noexcept
        {
            EVMCORE_DEBUG_ASSERT(size() >= 3);
            auto const *const p = top_ptr() - 2;
            std::tuple<uint256_t, uint256_t, uint256_t> r{p[0], p[1], p[2]};
            shrink(3);
            return r;
        }

        [[gnu::always_inline]] std::
            tuple<uint256_t, uint256_t, uint256_t, uint256_t>
            pop4() noexcept
        {
            EVMCORE_DEBUG_ASSERT(size() >= 4);
            auto const *const p = top_ptr() - 3;
            std::tuple<uint256_t, uint256_t, uint256_t, uint256_t> r{
                p[0], p[1], p[2], p[3]};
            shrink(4);
            return r;
        }

        /// Pops the top element and returns it together with the new top,
        /// which the caller overwrites with the result.
        [[gnu::always_inline]] std::tuple<uint256_t, uint256_t &>
        pop_peek() noexcept
        {
            EVMCORE_DEBUG_ASSERT(size() >= 2);
            auto *const p = top_ptr() - 1;
            std::tuple<uint256_t, uint256_t &> r{p[1], p[0]};
            shrink(1);
            return r;
        }

        [[gnu::always_inline]] std::tuple<uint256_t, uint256_t, uint256_t &>
        pop2_peek() noexcept
        {
            EVMCORE_DEBUG_ASSERT(size() >= 3);
            auto *const p = top_ptr() - 2;
            std::tuple<uint256_t, uint256_t, uint256_t &> r{p[1], p[2], p[0]};
            shrink(2);
            return r;
        }

        [[gnu::always_inline]] std::
            tuple<uint256_t, uint256_t, uint256_t, uint256_t &>
            pop3_peek() noexcept
        {
            EVMCORE_DEBUG_ASSERT(size() >= 4);
            auto *const p = top_ptr() - 3;
            std::tuple<uint256_t, uint256_t, uint256_t, uint256_t &> r{
                p[1], p[2], p[3], p[0]};
            shrink(3);
            return r;
        }

        [[gnu::always_inline]] std::tuple<
            uint256_t, uint256_t, uint256_t, uint256_t, uint256_t,
            uint256_t &>
        pop5_peek() noexcept
        {
            EVMCORE_DEBUG_ASSERT(size() >= 6);
            auto *const p = top_ptr() - 5;
            std::tuple<
                uint256_t,
                uint256_t,
                uint256_t,
                uint256_t,
                uint256_t,
                uint256_t &>
                r{p[1], p[2], p[3], p[4], p[5], p[0]};
            shrink(5);
            return r;
        }

        [[gnu::always_inline]] std::tuple<
            uint256_t, uint256_t, uint256_t, uint256_t, uint256_t, uint256_t,
            uint256_t &>
        pop6_peek() noexcept
        {
            EVMCORE_DEBUG_ASSERT(size() >= 7);
            auto *const p = top_ptr() - 6;
            std::tuple<
                uint256_t,
                uint256_t,
                uint256_t,
                uint256_t,
                uint256_t,
                uint256_t,
                uint256_t &>
                r{p[1], p[2], p[3], p[4], p[5], p[6], p[0]};
            shrink(6);
            return r;
        }

        /// Exchanges the top with the element `n` below it, n in [1, 16].
        [[gnu::always_inline]] void swap(std::size_t const n) noexcept
        {
            EVMCORE_DEBUG_ASSERT(n >= 1 && n <= 16 && size() > n);
            auto *const top = top_ptr();
            auto &a = *(top - n);
            uint256_t const t = *top;
            *top = a;
            a = t;
        }

        template <std::size_t N>
        [[gnu::always_inline]] void swap() noexcept
        {
            static_assert(N >= 1 && N <= 16);
            swap(N);
        }

        /// Pushes a copy of the n-th element from the top; dup(1) copies the
        /// top itself.
        [[gnu::always_inline]] void dup(std::size_t const n)
        {
            EVMCORE_DEBUG_ASSERT(n >= 1 && size() >= n);
            uint256_t const v = *(top_ptr() - (n - 1));
            data_.push_back(v);
        }

        [[gnu::always_inline]] uint256_t &peek() noexcept
        {
            EVMCORE_DEBUG_ASSERT(size() >= 1);
            return *top_ptr();
        }

        /// The element `n` below the top; back(0) is the top.
        [[gnu::always_inline]] uint256_t &back(std::size_t const n) noexcept
        {
            EVMCORE_DEBUG_ASSERT(size() > n);
            return *(top_ptr() - n);
        }

        [[gnu::always_inline]] uint256_t const &
        back(std::size_t const n) const noexcept
        {
            EVMCORE_DEBUG_ASSERT(size() > n);
            return data_[data_.size() - 1 - n];
        }

    private:
        uint256_t *top_ptr() noexcept
        {
            return data_.data() + data_.size() - 1;
        }

        // uint256_t is trivially destructible, so shrinking only moves the
        // end; the popped slots keep their old values until overwritten.
        void shrink(std::size_t const n) noexcept
        {
            data_.resize(data_.size() - n);
        }
    };
}
