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
#include <evmcore/core/likely.h>
#include <evmcore/vm/evm/opcodes.hpp>
#include <evmcore/vm/interpreter/stack_requirements.hpp>
#include <evmcore/vm/interpreter/value_stack.hpp>

#include <cstddef>
#include <cstdint>

namespace evmcore::vm
{
    StackCheck check_stack_requirements(
        std::uint8_t const opcode, std::size_t const stack_size) noexcept
    {
        auto const &info = opcode_table[opcode];
        if (EVMCORE_UNLIKELY(!is_known_opcode(opcode))) {
            return StackCheck::undefined_instruction;
        }

        EVMCORE_DEBUG_ASSERT(stack_size <= stack_limit);

        if (EVMCORE_UNLIKELY(stack_size < info.min_stack)) {
            return StackCheck::underflow;
        }
        if (EVMCORE_UNLIKELY(
                stack_size - info.min_stack + info.stack_increase >
                stack_limit)) {
            return StackCheck::overflow;
        }
        return StackCheck::ok;
    }
}
