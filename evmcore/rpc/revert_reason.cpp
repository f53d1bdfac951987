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

#include <evmcore/core/byte_string.hpp>
#include <evmcore/core/config.hpp>
#include <evmcore/core/int.hpp>
#include <evmcore/rpc/revert_reason.hpp>

#include <intx/intx.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

EVMCORE_NAMESPACE_BEGIN

namespace
{
    constexpr std::size_t selector_size = 4;
    constexpr std::size_t word_size = 32;

    // keccak256("Error(string)")[:4]
    constexpr unsigned char error_selector[] = {0x08, 0xc3, 0x79, 0xa0};
    // keccak256("Panic(uint256)")[:4]
    constexpr unsigned char panic_selector[] = {0x4e, 0x48, 0x7b, 0x71};

    constexpr std::pair<std::uint64_t, char const *> panic_reasons[] = {
        {0x00, "generic panic"},
        {0x01, "assert(false)"},
        {0x11, "arithmetic underflow or overflow"},
        {0x12, "division or modulo by zero"},
        {0x21, "enum overflow"},
        {0x22, "invalid encoded storage byte array accessed"},
        {0x31, "out-of-bounds array access; popping on an empty array"},
        {0x32, "out-of-bounds access of an array or bytesN"},
        {0x41, "out of memory"},
        {0x51, "uninitialized function"},
    };

    uint256_t load_word(byte_string_view const data, std::size_t const offset)
    {
        return intx::be::unsafe::load<uint256_t>(data.data() + offset);
    }

    std::optional<std::string> decode_error_string(byte_string_view const args)
    {
        if (args.size() < 2 * word_size) {
            return std::nullopt;
        }
        auto const offset = load_word(args, 0);
        if (offset > args.size() - word_size) {
            return std::nullopt;
        }
        auto const start = static_cast<std::size_t>(offset) + word_size;
        auto const length = load_word(args, start - word_size);
        if (length > args.size() - start) {
            return std::nullopt;
        }
        return std::string{
            reinterpret_cast<char const *>(args.data() + start),
            static_cast<std::size_t>(length)};
    }

    std::optional<std::string> decode_panic(byte_string_view const args)
    {
        if (args.size() < word_size) {
            return std::nullopt;
        }
        auto const code = load_word(args, 0);
        for (auto const &[value, reason] : panic_reasons) {
            if (code == value) {
                return std::string{reason};
            }
        }
        return "unknown panic code: 0x" + intx::hex(code);
    }
}

std::optional<std::string> decode_revert_reason(byte_string_view const output)
{
    if (output.size() < selector_size) {
        return std::nullopt;
    }
    auto const selector = output.substr(0, selector_size);
    auto const args = output.substr(selector_size);
    if (selector == to_byte_string_view(error_selector)) {
        return decode_error_string(args);
    }
    if (selector == to_byte_string_view(panic_selector)) {
        return decode_panic(args);
    }
    return std::nullopt;
}

EVMCORE_NAMESPACE_END
