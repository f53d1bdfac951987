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

#include <evmcore/core/likely.h>
#include <evmcore/vm/evm/opcodes.hpp>
#include <evmcore/vm/interpreter/value_stack.hpp>

#include <cstddef>
#include <cstdint>

namespace evmcore::vm
{
    enum class StackCheck : std::uint8_t
    {
        ok,
        underflow,
        overflow,
        undefined_instruction,
    };

    /**
     * Pre-dispatch validation for the instruction `opcode` against a stack
     * currently holding `stack_size` elements. Once this returns ok, the
     * ValueStack operations the instruction performs are within bounds.
     */
    StackCheck
    check_stack_requirements(std::uint8_t opcode, std::size_t stack_size) noexcept;

    template <std::uint8_t Instr>
    [[gnu::always_inline]] inline StackCheck
    check_stack_requirements(std::size_t const stack_size) noexcept
    {
        static constexpr auto info = opcode_table[Instr];

        if constexpr (info == unknown_opcode_info) {
            return StackCheck::undefined_instruction;
        }

        if constexpr (info.min_stack == 0 && info.stack_increase == 0) {
            return StackCheck::ok;
        }

        EVMCORE_DEBUG_ASSERT(stack_size <= stack_limit);

        if constexpr (info.min_stack > 0) {
            if (EVMCORE_UNLIKELY(stack_size < info.min_stack)) {
                return StackCheck::underflow;
            }
        }

        if constexpr (info.stack_increase > info.min_stack) {
            static constexpr auto delta =
                std::size_t{info.stack_increase} - info.min_stack;
            static constexpr auto max_safe_size = stack_limit - delta;

            if (EVMCORE_UNLIKELY(stack_size > max_safe_size)) {
                return StackCheck::overflow;
            }
        }

        return StackCheck::ok;
    }
}
