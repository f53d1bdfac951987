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
#include <evmcore/vm/analysis/code_map.hpp>
#include <evmcore/vm/evm/opcodes.hpp>

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <random>
#include <vector>

using namespace evmcore;
using namespace evmcore::vm;

namespace
{
    byte_string make_code(std::initializer_list<std::uint8_t> const bytes)
    {
        return byte_string{bytes.begin(), bytes.end()};
    }

    template <typename Word>
    std::vector<Word> words_of(BasicCodeMap<Word> const &map)
    {
        return {map.words().begin(), map.words().end()};
    }

    struct BitmapCase
    {
        byte_string code;
        std::vector<std::uint32_t> want;
    };

    std::vector<BitmapCase> bitmap_cases()
    {
        auto zeros = [](std::size_t n) { return byte_string(n, 0x00); };
        return {
            {make_code({}), {0, 0}},
            {make_code({PUSH1, 0x01, 0x01, 0x01}), {0b10, 0}},
            {make_code({PUSH2, 0x01, 0x01, 0x01}), {0b110, 0}},
            {make_code({PUSH1, PUSH1, PUSH1, PUSH1}), {0b1010, 0}},
            {make_code({0x00, PUSH1, 0x00, PUSH1, 0x00, PUSH1, 0x00, PUSH1}),
             {0b1'0101'0100, 0}},
            {make_code(
                 {PUSH8,
                  PUSH8,
                  PUSH8,
                  PUSH8,
                  PUSH8,
                  PUSH8,
                  PUSH8,
                  PUSH8,
                  0x01,
                  0x01,
                  0x01}),
             {0b1'1111'1110, 0}},
            {make_code(
                 {0x01,
                  0x01,
                  0x01,
                  0x01,
                  0x01,
                  PUSH2,
                  0x01,
                  0x01,
                  0x01,
                  0x01,
                  0x01}),
             {0b1100'0000, 0}},
            {make_code(
                 {PUSH3,
                  0x01,
                  0x01,
                  0x01,
                  PUSH1,
                  0x01,
                  0x01,
                  0x01,
                  0x01,
                  0x01,
                  0x01}),
             {0b10'1110, 0}},
            {make_code(
                 {0x01,
                  PUSH8,
                  0x01,
                  0x01,
                  0x01,
                  0x01,
                  0x01,
                  0x01,
                  0x01,
                  0x01,
                  0x01,
                  0x01}),
             {0b11'1111'1100, 0}},
            {make_code(
                 {PUSH16,
                  0x01,
                  0x01,
                  0x01,
                  0x01,
                  0x01,
                  0x01,
                  0x01,
                  0x01,
                  0x01,
                  0x01}),
             {0x1'FFFE, 0}},
            {make_code(
                 {PUSH8,
                  0x01,
                  0x02,
                  0x03,
                  0x04,
                  0x05,
                  0x06,
                  0x07,
                  0x08,
                  PUSH1,
                  0x01}),
             {0b101'1111'1110, 0}},
            {make_code({PUSH32}), {0xFFFF'FFFE, 0x1}},
            {zeros(30) + make_code({PUSH2, 0xff, 0xff}),
             {0x8000'0000, 0x1, 0}},
            {zeros(31) + make_code({PUSH32}), {0, 0xFFFF'FFFF, 0}},
        };
    }

    TEST(CodeMap, reference_bitmaps)
    {
        auto const cases = bitmap_cases();
        for (std::size_t i = 0; i < cases.size(); ++i) {
            SCOPED_TRACE(i);
            auto const &c = cases[i];
            EXPECT_EQ(words_of(CodeMap::build(c.code)), c.want);
            EXPECT_EQ(words_of(CodeMap::build_bitwise(c.code)), c.want);
        }
    }

    TEST(CodeMap, word_count)
    {
        EXPECT_EQ(CodeMap::build(byte_string{}).words().size(), 2);
        EXPECT_EQ(CodeMap::build(byte_string(31, 0)).words().size(), 2);
        EXPECT_EQ(CodeMap::build(byte_string(32, 0)).words().size(), 3);
        EXPECT_EQ(CodeMap::build(byte_string(65, 0)).words().size(), 4);
        EXPECT_EQ(
            BasicCodeMap<std::uint64_t>::build(byte_string(64, 0))
                .words()
                .size(),
            3);
    }

    TEST(CodeMap, guard_bits_are_not_push_data)
    {
        auto const code = make_code({PUSH32});
        auto const map = CodeMap::build(code);
        EXPECT_EQ(map.code_size(), 1);
        EXPECT_FALSE(map.is_push_data(0));
        for (std::size_t pos = 1; pos <= 32; ++pos) {
            EXPECT_FALSE(map.is_push_data(pos)) << pos;
        }
    }

    TEST(CodeMap, is_push_data)
    {
        auto const code = make_code({PUSH2, 0x5b, 0x5b, JUMPDEST, PUSH0, 0x5b});
        auto const map = CodeMap::build(code);
        EXPECT_FALSE(map.is_push_data(0));
        EXPECT_TRUE(map.is_push_data(1));
        EXPECT_TRUE(map.is_push_data(2));
        EXPECT_FALSE(map.is_push_data(3));
        // PUSH0 has no immediate
        EXPECT_FALSE(map.is_push_data(4));
        EXPECT_FALSE(map.is_push_data(5));
    }

    TEST(CodeMap, jumpdest_inside_push_data_is_invalid)
    {
        auto const code =
            make_code({PUSH1, JUMPDEST, JUMPDEST, PUSH3, JUMPDEST, 0x00, 0x00});
        auto const map = CodeMap::build(code);
        EXPECT_FALSE(map.is_jumpdest(code, 0));
        EXPECT_FALSE(map.is_jumpdest(code, 1));
        EXPECT_TRUE(map.is_jumpdest(code, 2));
        EXPECT_FALSE(map.is_jumpdest(code, 4));
        EXPECT_FALSE(map.is_jumpdest(code, 5));
    }

    TEST(CodeMap, jumpdest_out_of_range)
    {
        auto const code = make_code({JUMPDEST});
        auto const map = CodeMap::build(code);
        EXPECT_TRUE(map.is_jumpdest(code, 0));
        EXPECT_FALSE(map.is_jumpdest(code, 1));
        EXPECT_FALSE(map.is_jumpdest(code, 1'000'000));
    }

    TEST(CodeMap, truncated_push_at_end)
    {
        auto const code = make_code({JUMPDEST, PUSH4, JUMPDEST});
        auto const map = CodeMap::build(code);
        EXPECT_TRUE(map.is_jumpdest(code, 0));
        EXPECT_TRUE(map.is_push_data(2));
        EXPECT_FALSE(map.is_jumpdest(code, 2));
    }

    TEST(CodeMap, deterministic)
    {
        std::mt19937_64 rng{42};
        byte_string code(4096, 0);
        for (auto &b : code) {
            b = static_cast<std::uint8_t>(rng());
        }
        EXPECT_EQ(CodeMap::build(code), CodeMap::build(code));
    }

    template <typename Word>
    void check_matches_bitwise(byte_string const &code)
    {
        auto const fast = BasicCodeMap<Word>::build(code);
        auto const slow = BasicCodeMap<Word>::build_bitwise(code);
        ASSERT_EQ(fast, slow);
        for (std::size_t pos = 0; pos < code.size(); ++pos) {
            ASSERT_EQ(fast.is_push_data(pos), slow.is_push_data(pos)) << pos;
        }
    }

    TEST(CodeMap, random_code_matches_bitwise)
    {
        std::mt19937_64 rng{1};
        for (std::size_t size : {1u, 7u, 31u, 32u, 33u, 63u, 64u, 65u, 1000u}) {
            for (int round = 0; round < 20; ++round) {
                byte_string code(size, 0);
                for (auto &b : code) {
                    b = static_cast<std::uint8_t>(rng());
                }
                check_matches_bitwise<std::uint32_t>(code);
                check_matches_bitwise<std::uint64_t>(code);
            }
        }
    }

    TEST(CodeMap, repeated_opcode_matches_bitwise)
    {
        for (unsigned op = 0; op < 256; ++op) {
            SCOPED_TRACE(op);
            for (std::size_t size : {1u, 31u, 32u, 33u, 97u, 1024u}) {
                byte_string const code(size, static_cast<std::uint8_t>(op));
                check_matches_bitwise<std::uint32_t>(code);
                check_matches_bitwise<std::uint64_t>(code);
            }
        }
    }

    TEST(CodeMap, every_push_at_every_alignment)
    {
        for (std::uint8_t op = PUSH1; op <= PUSH32; ++op) {
            auto const n = get_push_opcode_index(op);
            for (std::size_t offset = 0; offset < 64; ++offset) {
                byte_string code(offset, 0x00);
                code.push_back(op);
                code += byte_string(n, JUMPDEST);
                code.push_back(JUMPDEST);

                auto const map = CodeMap::build(code);
                for (std::size_t pos = 0; pos < code.size(); ++pos) {
                    bool const in_run = pos > offset && pos <= offset + n;
                    ASSERT_EQ(map.is_push_data(pos), in_run)
                        << opcode_name(op) << " offset " << offset << " pos "
                        << pos;
                }
                EXPECT_TRUE(map.is_jumpdest(code, code.size() - 1));
            }
        }
    }
}
