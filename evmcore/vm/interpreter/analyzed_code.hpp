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
#include <evmcore/core/int.hpp>
#include <evmcore/vm/analysis/code_map.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>

namespace evmcore::vm
{
    /**
     * Code as the interpreter sees it: a zero-padded copy of the program
     * together with its push-data map.
     */
    class AnalyzedCode
    {
        // 32 for a truncated PUSH32, 1 for a STOP so that we don't have to
        // worry about going off the end.
        static constexpr std::size_t end_padding_size = 32 + 1;

    public:
        explicit AnalyzedCode(byte_string_view code);

        AnalyzedCode(std::uint8_t const *code, std::size_t code_size)
            : AnalyzedCode{byte_string_view{code, code_size}}
        {
        }

        std::uint8_t const *code() const noexcept
        {
            return padded_code_.get();
        }

        std::size_t size() const noexcept
        {
            return code_size_;
        }

        byte_string_view bytes() const noexcept
        {
            return {padded_code_.get(), code_size_};
        }

        CodeMap const &code_map() const noexcept
        {
            return code_map_;
        }

        bool is_jumpdest(std::size_t const pc) const noexcept
        {
            return code_map_.is_jumpdest(bytes(), pc);
        }

        /// Immediate bytes of the push instruction at `pc`. Bytes past the
        /// end of the code read as zero.
        byte_string_view push_data(std::size_t pc) const noexcept;

        /// push_data(pc) as a big-endian integer.
        uint256_t push_value(std::size_t pc) const noexcept;

    private:
        std::unique_ptr<std::uint8_t[]> padded_code_;
        std::size_t code_size_;
        CodeMap code_map_;

        static std::unique_ptr<std::uint8_t[]> pad(byte_string_view code);
    };
}
