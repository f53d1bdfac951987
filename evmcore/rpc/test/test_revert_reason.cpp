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
#include <evmcore/rpc/revert_reason.hpp>

#include <evmc/hex.hpp>

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <string_view>

using namespace evmcore;

namespace
{
    byte_string from_hex(std::string_view const hex)
    {
        auto const bytes = evmc::from_hex(hex);
        EXPECT_TRUE(bytes.has_value());
        return bytes.value_or(byte_string{});
    }

    byte_string word(unsigned char const last)
    {
        byte_string w(32, 0);
        w[31] = last;
        return w;
    }

    byte_string const error_selector{0x08, 0xc3, 0x79, 0xa0};
    byte_string const panic_selector{0x4e, 0x48, 0x7b, 0x71};

    TEST(RevertReason, error_string)
    {
        // Error("Insufficient balance")
        auto const output = from_hex(
            "0x08c379a0"
            "0000000000000000000000000000000000000000000000000000000000000020"
            "0000000000000000000000000000000000000000000000000000000000000014"
            "496e73756666696369656e742062616c616e6365000000000000000000000000");
        EXPECT_EQ(decode_revert_reason(output), "Insufficient balance");
    }

    TEST(RevertReason, empty_error_string)
    {
        auto const output = error_selector + word(0x20) + word(0);
        EXPECT_EQ(decode_revert_reason(output), "");
    }

    TEST(RevertReason, panic_codes)
    {
        EXPECT_EQ(
            decode_revert_reason(panic_selector + word(0x01)), "assert(false)");
        EXPECT_EQ(
            decode_revert_reason(panic_selector + word(0x11)),
            "arithmetic underflow or overflow");
        EXPECT_EQ(
            decode_revert_reason(panic_selector + word(0x12)),
            "division or modulo by zero");
        EXPECT_EQ(
            decode_revert_reason(panic_selector + word(0x32)),
            "out-of-bounds access of an array or bytesN");
        EXPECT_EQ(
            decode_revert_reason(panic_selector + word(0x00)), "generic panic");
        EXPECT_EQ(
            decode_revert_reason(panic_selector + word(0x51)),
            "uninitialized function");
    }

    TEST(RevertReason, unknown_panic_code)
    {
        EXPECT_EQ(
            decode_revert_reason(panic_selector + word(0x99)),
            "unknown panic code: 0x99");
    }

    TEST(RevertReason, not_a_revert_encoding)
    {
        EXPECT_EQ(decode_revert_reason(byte_string{}), std::nullopt);
        EXPECT_EQ(decode_revert_reason(from_hex("08c379")), std::nullopt);
        EXPECT_EQ(
            decode_revert_reason(from_hex("deadbeef") + word(0x20)),
            std::nullopt);
    }

    TEST(RevertReason, malformed_error_string)
    {
        // too short for offset and length
        EXPECT_EQ(
            decode_revert_reason(error_selector + word(0x20)), std::nullopt);
        // offset past the end
        EXPECT_EQ(
            decode_revert_reason(error_selector + word(0xff) + word(0)),
            std::nullopt);
        // length past the end
        EXPECT_EQ(
            decode_revert_reason(error_selector + word(0x20) + word(0x40)),
            std::nullopt);
        // truncated panic
        EXPECT_EQ(
            decode_revert_reason(panic_selector + byte_string(31, 0)),
            std::nullopt);
    }
}
