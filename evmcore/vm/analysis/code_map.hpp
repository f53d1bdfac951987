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

#include <evmcore/core/byte_string.hpp>
#include <evmcore/vm/evm/opcodes.hpp>

#include <climits>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace evmcore::vm
{
    /**
     * Packed boolean sequence over the byte positions of a code buffer. Bit
     * `i` is set iff byte `i` is an immediate data byte of a preceding
     * PUSH1..PUSH32 instruction, and therefore can never start an instruction
     * or be a jump destination.
     *
     * The map always holds `code_size / bits_per_word + 2` words. The extra
     * guard word lets a push near the end of the code mark its whole
     * immediate range, and lets the short-run fast path write the word after
     * the current one unconditionally. Bits at positions >= code_size() may
     * be set in words() but are never reported by is_push_data().
     */
    template <std::unsigned_integral Word>
    class BasicCodeMap
    {
    public:
        static constexpr std::size_t bits_per_word = sizeof(Word) * CHAR_BIT;

        // a 32 byte push run spans at most the current word and the guard
        static_assert(bits_per_word >= 32);

        /// Single left-to-right pass over `code`. Total: never fails.
        static BasicCodeMap build(byte_string_view code);

        /// Same result as build(), marking one bit at a time.
        static BasicCodeMap build_bitwise(byte_string_view code);

        bool is_push_data(std::size_t const pos) const noexcept
        {
            return pos < code_size_ && test(pos);
        }

        /// A position is a legal jump destination iff it holds JUMPDEST and
        /// is not push data. `code` must be the buffer this map was built
        /// from.
        bool
        is_jumpdest(byte_string_view code, std::size_t pos) const noexcept;

        std::size_t code_size() const noexcept
        {
            return code_size_;
        }

        std::span<Word const> words() const noexcept
        {
            return words_;
        }

        friend bool
        operator==(BasicCodeMap const &, BasicCodeMap const &) = default;

    private:
        std::vector<Word> words_;
        std::size_t code_size_{0};

        explicit BasicCodeMap(std::size_t code_size);

        bool test(std::size_t const pos) const noexcept
        {
            return (words_[pos / bits_per_word] >> (pos % bits_per_word)) & 1;
        }

        void set1(std::size_t pos) noexcept;
        void set_short(std::size_t pos, unsigned n) noexcept;
        void set_range(std::size_t pos, unsigned n) noexcept;
    };

    using CodeMap = BasicCodeMap<std::uint32_t>;

    extern template class BasicCodeMap<std::uint32_t>;
    extern template class BasicCodeMap<std::uint64_t>;
}
