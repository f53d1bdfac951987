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
#include <evmcore/core/byte_string.hpp>
#include <evmcore/core/likely.h>
#include <evmcore/vm/analysis/code_map.hpp>
#include <evmcore/vm/evm/opcodes.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>

namespace evmcore::vm
{
    template <std::unsigned_integral Word>
    BasicCodeMap<Word>::BasicCodeMap(std::size_t const code_size)
        : words_(code_size / bits_per_word + 2, Word{0})
        , code_size_{code_size}
    {
    }

    template <std::unsigned_integral Word>
    void BasicCodeMap<Word>::set1(std::size_t const pos) noexcept
    {
        words_[pos / bits_per_word] |= Word{1} << (pos % bits_per_word);
    }

    // Sets bits [pos, pos + n) for n <= 8. The run spans at most two words;
    // the high half is written even when it is empty, which the guard word
    // makes safe.
    template <std::unsigned_integral Word>
    void
    BasicCodeMap<Word>::set_short(std::size_t const pos, unsigned const n) noexcept
    {
        EVMCORE_DEBUG_ASSERT(n >= 1 && n <= 8);
        auto const idx = pos / bits_per_word;
        auto const shift = static_cast<unsigned>(pos % bits_per_word);
        auto const mask = static_cast<Word>((Word{1} << n) - 1);
        EVMCORE_DEBUG_ASSERT(idx + 1 < words_.size());
        words_[idx] |= static_cast<Word>(mask << shift);
        // mask >> (bits_per_word - shift), without shifting by the full width
        words_[idx + 1] |=
            static_cast<Word>((mask >> 1) >> (bits_per_word - 1 - shift));
    }

    template <std::unsigned_integral Word>
    void
    BasicCodeMap<Word>::set_range(std::size_t const pos, unsigned n) noexcept
    {
        auto idx = pos / bits_per_word;
        auto shift = static_cast<unsigned>(pos % bits_per_word);
        while (n > 0) {
            auto const take = std::min<unsigned>(
                n, static_cast<unsigned>(bits_per_word) - shift);
            auto const mask = take == bits_per_word
                                  ? static_cast<Word>(~Word{0})
                                  : static_cast<Word>((Word{1} << take) - 1);
            EVMCORE_DEBUG_ASSERT(idx < words_.size());
            words_[idx] |= static_cast<Word>(mask << shift);
            n -= take;
            shift = 0;
            ++idx;
        }
    }

    template <std::unsigned_integral Word>
    BasicCodeMap<Word> BasicCodeMap<Word>::build(byte_string_view const code)
    {
        BasicCodeMap map{code.size()};
        auto const size = code.size();
        for (std::size_t pc = 0; pc < size;) {
            auto const op = code[pc++];
            if (EVMCORE_LIKELY(!is_push_opcode(op))) {
                continue;
            }
            unsigned const n = get_push_opcode_index(op);
            if (n <= 8) {
                map.set_short(pc, n);
            }
            else {
                map.set_range(pc, n);
            }
            pc += n;
        }
        return map;
    }

    template <std::unsigned_integral Word>
    BasicCodeMap<Word>
    BasicCodeMap<Word>::build_bitwise(byte_string_view const code)
    {
        BasicCodeMap map{code.size()};
        for (std::size_t pc = 0; pc < code.size(); ++pc) {
            auto const op = code[pc];
            if (is_push_opcode(op)) {
                auto const n = get_push_opcode_index(op);
                for (std::size_t i = 1; i <= n; ++i) {
                    map.set1(pc + i);
                }
                pc += n;
            }
        }
        return map;
    }

    template <std::unsigned_integral Word>
    bool BasicCodeMap<Word>::is_jumpdest(
        byte_string_view const code, std::size_t const pos) const noexcept
    {
        EVMCORE_DEBUG_ASSERT(code.size() == code_size_);
        return pos < code.size() && code[pos] == JUMPDEST && !test(pos);
    }

    template class BasicCodeMap<std::uint32_t>;
    template class BasicCodeMap<std::uint64_t>;
}
