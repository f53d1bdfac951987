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
#include <evmcore/core/int.hpp>
#include <evmcore/vm/analysis/code_map.hpp>
#include <evmcore/vm/evm/opcodes.hpp>
#include <evmcore/vm/interpreter/analyzed_code.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace evmcore::vm
{
    AnalyzedCode::AnalyzedCode(byte_string_view const code)
        : padded_code_{pad(code)}
        , code_size_{code.size()}
        , code_map_{CodeMap::build(code)}
    {
    }

    std::unique_ptr<std::uint8_t[]> AnalyzedCode::pad(byte_string_view const code)
    {
        auto buffer =
            std::make_unique<std::uint8_t[]>(code.size() + end_padding_size);
        // make_unique zero-fills the padding
        std::copy(code.begin(), code.end(), buffer.get());
        return buffer;
    }

    byte_string_view AnalyzedCode::push_data(std::size_t const pc) const noexcept
    {
        EVMCORE_DEBUG_ASSERT(pc < code_size_);
        auto const op = padded_code_[pc];
        EVMCORE_DEBUG_ASSERT(is_push_opcode(op));
        return {&padded_code_[pc + 1], get_push_opcode_index(op)};
    }

    uint256_t AnalyzedCode::push_value(std::size_t const pc) const noexcept
    {
        uint256_t value = 0;
        for (auto const b : push_data(pc)) {
            value = (value << 8) | b;
        }
        return value;
    }
}
