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

#include <array>
#include <cstdint>
#include <string_view>

namespace evmcore::vm
{
    /**
     * Details of how an individual opcode affects the operand stack and the
     * instruction stream.
     */
    struct OpCodeInfo
    {
        /**
         * The human-readable (disassembled) form of the opcode.
         */
        std::string_view name;

        /**
         * The number of immediate bytes that follow this opcode in a program.
         *
         * This value is 0 for all instructions other than PUSH1..PUSH32, each
         * of which expects N bytes to follow.
         */
        std::uint8_t num_args;

        /**
         * The minimum stack size required to execute this instruction.
         */
        std::uint8_t min_stack;

        /**
         * The number of elements this instruction leaves on the stack in place
         * of the `min_stack` elements it consumes.
         */
        std::uint8_t stack_increase;

        /**
         * N for all PUSHN, SWAPN, DUPN and LOGN instructions, and 0 otherwise.
         */
        std::uint8_t index;

        friend constexpr bool
        operator==(OpCodeInfo const &, OpCodeInfo const &) = default;
    };

    /**
     * Mnemonic mapping of human-readable opcode names to their byte values.
     */
    enum EvmOpCode : std::uint8_t
    {
        STOP = 0x00,
        ADD = 0x01,
        MUL = 0x02,
        SUB = 0x03,
        DIV = 0x04,
        SDIV = 0x05,
        MOD = 0x06,
        SMOD = 0x07,
        ADDMOD = 0x08,
        MULMOD = 0x09,
        EXP = 0x0A,
        SIGNEXTEND = 0x0B,
        LT = 0x10,
        GT = 0x11,
        SLT = 0x12,
        SGT = 0x13,
        EQ = 0x14,
        ISZERO = 0x15,
        AND = 0x16,
        OR = 0x17,
        XOR = 0x18,
        NOT = 0x19,
        BYTE = 0x1A,
        SHL = 0x1B,
        SHR = 0x1C,
        SAR = 0x1D,
        SHA3 = 0x20,
        ADDRESS = 0x30,
        BALANCE = 0x31,
        ORIGIN = 0x32,
        CALLER = 0x33,
        CALLVALUE = 0x34,
        CALLDATALOAD = 0x35,
        CALLDATASIZE = 0x36,
        CALLDATACOPY = 0x37,
        CODESIZE = 0x38,
        CODECOPY = 0x39,
        GASPRICE = 0x3A,
        EXTCODESIZE = 0x3B,
        EXTCODECOPY = 0x3C,
        RETURNDATASIZE = 0x3D,
        RETURNDATACOPY = 0x3E,
        EXTCODEHASH = 0x3F,
        BLOCKHASH = 0x40,
        COINBASE = 0x41,
        TIMESTAMP = 0x42,
        NUMBER = 0x43,
        DIFFICULTY = 0x44,
        GASLIMIT = 0x45,
        CHAINID = 0x46,
        SELFBALANCE = 0x47,
        BASEFEE = 0x48,
        BLOBHASH = 0x49,
        BLOBBASEFEE = 0x4A,
        POP = 0x50,
        MLOAD = 0x51,
        MSTORE = 0x52,
        MSTORE8 = 0x53,
        SLOAD = 0x54,
        SSTORE = 0x55,
        JUMP = 0x56,
        JUMPI = 0x57,
        PC = 0x58,
        MSIZE = 0x59,
        GAS = 0x5A,
        JUMPDEST = 0x5B,
        TLOAD = 0x5C,
        TSTORE = 0x5D,
        MCOPY = 0x5E,
        PUSH0 = 0x5F,
        PUSH1 = 0x60,
        PUSH2 = 0x61,
        PUSH3 = 0x62,
        PUSH4 = 0x63,
        PUSH5 = 0x64,
        PUSH6 = 0x65,
        PUSH7 = 0x66,
        PUSH8 = 0x67,
        PUSH9 = 0x68,
        PUSH10 = 0x69,
        PUSH11 = 0x6A,
        PUSH12 = 0x6B,
        PUSH13 = 0x6C,
        PUSH14 = 0x6D,
        PUSH15 = 0x6E,
        PUSH16 = 0x6F,
        PUSH17 = 0x70,
        PUSH18 = 0x71,
        PUSH19 = 0x72,
        PUSH20 = 0x73,
        PUSH21 = 0x74,
        PUSH22 = 0x75,
        PUSH23 = 0x76,
        PUSH24 = 0x77,
        PUSH25 = 0x78,
        PUSH26 = 0x79,
        PUSH27 = 0x7A,
        PUSH28 = 0x7B,
        PUSH29 = 0x7C,
        PUSH30 = 0x7D,
        PUSH31 = 0x7E,
        PUSH32 = 0x7F,
        DUP1 = 0x80,
        DUP2 = 0x81,
        DUP3 = 0x82,
        DUP4 = 0x83,
        DUP5 = 0x84,
        DUP6 = 0x85,
        DUP7 = 0x86,
        DUP8 = 0x87,
        DUP9 = 0x88,
        DUP10 = 0x89,
        DUP11 = 0x8A,
        DUP12 = 0x8B,
        DUP13 = 0x8C,
        DUP14 = 0x8D,
        DUP15 = 0x8E,
        DUP16 = 0x8F,
        SWAP1 = 0x90,
        SWAP2 = 0x91,
        SWAP3 = 0x92,
        SWAP4 = 0x93,
        SWAP5 = 0x94,
        SWAP6 = 0x95,
        SWAP7 = 0x96,
        SWAP8 = 0x97,
        SWAP9 = 0x98,
        SWAP10 = 0x99,
        SWAP11 = 0x9A,
        SWAP12 = 0x9B,
        SWAP13 = 0x9C,
        SWAP14 = 0x9D,
        SWAP15 = 0x9E,
        SWAP16 = 0x9F,
        LOG0 = 0xA0,
        LOG1 = 0xA1,
        LOG2 = 0xA2,
        LOG3 = 0xA3,
        LOG4 = 0xA4,
        CREATE = 0xF0,
        CALL = 0xF1,
        CALLCODE = 0xF2,
        RETURN = 0xF3,
        DELEGATECALL = 0xF4,
        CREATE2 = 0xF5,
        STATICCALL = 0xFA,
        REVERT = 0xFD,
        SELFDESTRUCT = 0xFF,
    };

    /**
     * Placeholder for byte values that are not instructions.
     */
    inline constexpr auto unknown_opcode_info = OpCodeInfo{"UNKNOWN", 0, 0, 0, 0};

    /**
     * Lookup table of opcode info for each possible 1-byte value.
     */
    inline constexpr std::array<OpCodeInfo, 256> opcode_table = {
            OpCodeInfo{"STOP", 0, 0, 0, 0}, // 0x00
            OpCodeInfo{"ADD", 0, 2, 1, 0}, // 0x01
            OpCodeInfo{"MUL", 0, 2, 1, 0}, // 0x02
            OpCodeInfo{"SUB", 0, 2, 1, 0}, // 0x03
            OpCodeInfo{"DIV", 0, 2, 1, 0}, // 0x04
            OpCodeInfo{"SDIV", 0, 2, 1, 0}, // 0x05
            OpCodeInfo{"MOD", 0, 2, 1, 0}, // 0x06
            OpCodeInfo{"SMOD", 0, 2, 1, 0}, // 0x07
            OpCodeInfo{"ADDMOD", 0, 3, 1, 0}, // 0x08
            OpCodeInfo{"MULMOD", 0, 3, 1, 0}, // 0x09
            OpCodeInfo{"EXP", 0, 2, 1, 0}, // 0x0A
            OpCodeInfo{"SIGNEXTEND", 0, 2, 1, 0}, // 0x0B
            unknown_opcode_info, // 0x0C
            unknown_opcode_info, // 0x0D
            unknown_opcode_info, // 0x0E
            unknown_opcode_info, // 0x0F

            OpCodeInfo{"LT", 0, 2, 1, 0}, // 0x10
            OpCodeInfo{"GT", 0, 2, 1, 0}, // 0x11
            OpCodeInfo{"SLT", 0, 2, 1, 0}, // 0x12
            OpCodeInfo{"SGT", 0, 2, 1, 0}, // 0x13
            OpCodeInfo{"EQ", 0, 2, 1, 0}, // 0x14
            OpCodeInfo{"ISZERO", 0, 1, 1, 0}, // 0x15
            OpCodeInfo{"AND", 0, 2, 1, 0}, // 0x16
            OpCodeInfo{"OR", 0, 2, 1, 0}, // 0x17
            OpCodeInfo{"XOR", 0, 2, 1, 0}, // 0x18
            OpCodeInfo{"NOT", 0, 1, 1, 0}, // 0x19
            OpCodeInfo{"BYTE", 0, 2, 1, 0}, // 0x1A
            OpCodeInfo{"SHL", 0, 2, 1, 0}, // 0x1B
            OpCodeInfo{"SHR", 0, 2, 1, 0}, // 0x1C
            OpCodeInfo{"SAR", 0, 2, 1, 0}, // 0x1D
            unknown_opcode_info, // 0x1E
            unknown_opcode_info, // 0x1F

            OpCodeInfo{"SHA3", 0, 2, 1, 0}, // 0x20
            unknown_opcode_info, // 0x21
            unknown_opcode_info, // 0x22
            unknown_opcode_info, // 0x23
            unknown_opcode_info, // 0x24
            unknown_opcode_info, // 0x25
            unknown_opcode_info, // 0x26
            unknown_opcode_info, // 0x27
            unknown_opcode_info, // 0x28
            unknown_opcode_info, // 0x29
            unknown_opcode_info, // 0x2A
            unknown_opcode_info, // 0x2B
            unknown_opcode_info, // 0x2C
            unknown_opcode_info, // 0x2D
            unknown_opcode_info, // 0x2E
            unknown_opcode_info, // 0x2F

            OpCodeInfo{"ADDRESS", 0, 0, 1, 0}, // 0x30
            OpCodeInfo{"BALANCE", 0, 1, 1, 0}, // 0x31
            OpCodeInfo{"ORIGIN", 0, 0, 1, 0}, // 0x32
            OpCodeInfo{"CALLER", 0, 0, 1, 0}, // 0x33
            OpCodeInfo{"CALLVALUE", 0, 0, 1, 0}, // 0x34
            OpCodeInfo{"CALLDATALOAD", 0, 1, 1, 0}, // 0x35
            OpCodeInfo{"CALLDATASIZE", 0, 0, 1, 0}, // 0x36
            OpCodeInfo{"CALLDATACOPY", 0, 3, 0, 0}, // 0x37
            OpCodeInfo{"CODESIZE", 0, 0, 1, 0}, // 0x38
            OpCodeInfo{"CODECOPY", 0, 3, 0, 0}, // 0x39
            OpCodeInfo{"GASPRICE", 0, 0, 1, 0}, // 0x3A
            OpCodeInfo{"EXTCODESIZE", 0, 1, 1, 0}, // 0x3B
            OpCodeInfo{"EXTCODECOPY", 0, 4, 0, 0}, // 0x3C
            OpCodeInfo{"RETURNDATASIZE", 0, 0, 1, 0}, // 0x3D
            OpCodeInfo{"RETURNDATACOPY", 0, 3, 0, 0}, // 0x3E
            OpCodeInfo{"EXTCODEHASH", 0, 1, 1, 0}, // 0x3F

            OpCodeInfo{"BLOCKHASH", 0, 1, 1, 0}, // 0x40
            OpCodeInfo{"COINBASE", 0, 0, 1, 0}, // 0x41
            OpCodeInfo{"TIMESTAMP", 0, 0, 1, 0}, // 0x42
            OpCodeInfo{"NUMBER", 0, 0, 1, 0}, // 0x43
            OpCodeInfo{"DIFFICULTY", 0, 0, 1, 0}, // 0x44
            OpCodeInfo{"GASLIMIT", 0, 0, 1, 0}, // 0x45
            OpCodeInfo{"CHAINID", 0, 0, 1, 0}, // 0x46
            OpCodeInfo{"SELFBALANCE", 0, 0, 1, 0}, // 0x47
            OpCodeInfo{"BASEFEE", 0, 0, 1, 0}, // 0x48
            OpCodeInfo{"BLOBHASH", 0, 1, 1, 0}, // 0x49
            OpCodeInfo{"BLOBBASEFEE", 0, 0, 1, 0}, // 0x4A
            unknown_opcode_info, // 0x4B
            unknown_opcode_info, // 0x4C
            unknown_opcode_info, // 0x4D
            unknown_opcode_info, // 0x4E
            unknown_opcode_info, // 0x4F

            OpCodeInfo{"POP", 0, 1, 0, 0}, // 0x50
            OpCodeInfo{"MLOAD", 0, 1, 1, 0}, // 0x51
            OpCodeInfo{"MSTORE", 0, 2, 0, 0}, // 0x52
            OpCodeInfo{"MSTORE8", 0, 2, 0, 0}, // 0x53
            OpCodeInfo{"SLOAD", 0, 1, 1, 0}, // 0x54
            OpCodeInfo{"SSTORE", 0, 2, 0, 0}, // 0x55
            OpCodeInfo{"JUMP", 0, 1, 0, 0}, // 0x56
            OpCodeInfo{"JUMPI", 0, 2, 0, 0}, // 0x57
            OpCodeInfo{"PC", 0, 0, 1, 0}, // 0x58
            OpCodeInfo{"MSIZE", 0, 0, 1, 0}, // 0x59
            OpCodeInfo{"GAS", 0, 0, 1, 0}, // 0x5A
            OpCodeInfo{"JUMPDEST", 0, 0, 0, 0}, // 0x5B
            OpCodeInfo{"TLOAD", 0, 1, 1, 0}, // 0x5C
            OpCodeInfo{"TSTORE", 0, 2, 0, 0}, // 0x5D
            OpCodeInfo{"MCOPY", 0, 3, 0, 0}, // 0x5E
            OpCodeInfo{"PUSH0", 0, 0, 1, 0}, // 0x5F

            OpCodeInfo{"PUSH1", 1, 0, 1, 1}, // 0x60
            OpCodeInfo{"PUSH2", 2, 0, 1, 2}, // 0x61
            OpCodeInfo{"PUSH3", 3, 0, 1, 3}, // 0x62
            OpCodeInfo{"PUSH4", 4, 0, 1, 4}, // 0x63
            OpCodeInfo{"PUSH5", 5, 0, 1, 5}, // 0x64
            OpCodeInfo{"PUSH6", 6, 0, 1, 6}, // 0x65
            OpCodeInfo{"PUSH7", 7, 0, 1, 7}, // 0x66
            OpCodeInfo{"PUSH8", 8, 0, 1, 8}, // 0x67
            OpCodeInfo{"PUSH9", 9, 0, 1, 9}, // 0x68
            OpCodeInfo{"PUSH10", 10, 0, 1, 10}, // 0x69
            OpCodeInfo{"PUSH11", 11, 0, 1, 11}, // 0x6A
            OpCodeInfo{"PUSH12", 12, 0, 1, 12}, // 0x6B
            OpCodeInfo{"PUSH13", 13, 0, 1, 13}, // 0x6C
            OpCodeInfo{"PUSH14", 14, 0, 1, 14}, // 0x6D
            OpCodeInfo{"PUSH15", 15, 0, 1, 15}, // 0x6E
            OpCodeInfo{"PUSH16", 16, 0, 1, 16}, // 0x6F

            OpCodeInfo{"PUSH17", 17, 0, 1, 17}, // 0x70
            OpCodeInfo{"PUSH18", 18, 0, 1, 18}, // 0x71
            OpCodeInfo{"PUSH19", 19, 0, 1, 19}, // 0x72
            OpCodeInfo{"PUSH20", 20, 0, 1, 20}, // 0x73
            OpCodeInfo{"PUSH21", 21, 0, 1, 21}, // 0x74
            OpCodeInfo{"PUSH22", 22, 0, 1, 22}, // 0x75
            OpCodeInfo{"PUSH23", 23, 0, 1, 23}, // 0x76
            OpCodeInfo{"PUSH24", 24, 0, 1, 24}, // 0x77
            OpCodeInfo{"PUSH25", 25, 0, 1, 25}, // 0x78
            OpCodeInfo{"PUSH26", 26, 0, 1, 26}, // 0x79
            OpCodeInfo{"PUSH27", 27, 0, 1, 27}, // 0x7A
            OpCodeInfo{"PUSH28", 28, 0, 1, 28}, // 0x7B
            OpCodeInfo{"PUSH29", 29, 0, 1, 29}, // 0x7C
            OpCodeInfo{"PUSH30", 30, 0, 1, 30}, // 0x7D
            OpCodeInfo{"PUSH31", 31, 0, 1, 31}, // 0x7E
            OpCodeInfo{"PUSH32", 32, 0, 1, 32}, // 0x7F

            OpCodeInfo{"DUP1", 0, 1, 2, 1}, // 0x80
            OpCodeInfo{"DUP2", 0, 2, 3, 2}, // 0x81
            OpCodeInfo{"DUP3", 0, 3, 4, 3}, // 0x82
            OpCodeInfo{"DUP4", 0, 4, 5, 4}, // 0x83
            OpCodeInfo{"DUP5", 0, 5, 6, 5}, // 0x84
            OpCodeInfo{"DUP6", 0, 6, 7, 6}, // 0x85
            OpCodeInfo{"DUP7", 0, 7, 8, 7}, // 0x86
            OpCodeInfo{"DUP8", 0, 8, 9, 8}, // 0x87
            OpCodeInfo{"DUP9", 0, 9, 10, 9}, // 0x88
            OpCodeInfo{"DUP10", 0, 10, 11, 10}, // 0x89
            OpCodeInfo{"DUP11", 0, 11, 12, 11}, // 0x8A
            OpCodeInfo{"DUP12", 0, 12, 13, 12}, // 0x8B
            OpCodeInfo{"DUP13", 0, 13, 14, 13}, // 0x8C
            OpCodeInfo{"DUP14", 0, 14, 15, 14}, // 0x8D
            OpCodeInfo{"DUP15", 0, 15, 16, 15}, // 0x8E
            OpCodeInfo{"DUP16", 0, 16, 17, 16}, // 0x8F

            OpCodeInfo{"SWAP1", 0, 2, 2, 1}, // 0x90
            OpCodeInfo{"SWAP2", 0, 3, 3, 2}, // 0x91
            OpCodeInfo{"SWAP3", 0, 4, 4, 3}, // 0x92
            OpCodeInfo{"SWAP4", 0, 5, 5, 4}, // 0x93
            OpCodeInfo{"SWAP5", 0, 6, 6, 5}, // 0x94
            OpCodeInfo{"SWAP6", 0, 7, 7, 6}, // 0x95
            OpCodeInfo{"SWAP7", 0, 8, 8, 7}, // 0x96
            OpCodeInfo{"SWAP8", 0, 9, 9, 8}, // 0x97
            OpCodeInfo{"SWAP9", 0, 10, 10, 9}, // 0x98
            OpCodeInfo{"SWAP10", 0, 11, 11, 10}, // 0x99
            OpCodeInfo{"SWAP11", 0, 12, 12, 11}, // 0x9A
            OpCodeInfo{"SWAP12", 0, 13, 13, 12}, // 0x9B
            OpCodeInfo{"SWAP13", 0, 14, 14, 13}, // 0x9C
            OpCodeInfo{"SWAP14", 0, 15, 15, 14}, // 0x9D
            OpCodeInfo{"SWAP15", 0, 16, 16, 15}, // 0x9E
            OpCodeInfo{"SWAP16", 0, 17, 17, 16}, // 0x9F

            OpCodeInfo{"LOG0", 0, 2, 0, 0}, // 0xA0
            OpCodeInfo{"LOG1", 0, 3, 0, 1}, // 0xA1
            OpCodeInfo{"LOG2", 0, 4, 0, 2}, // 0xA2
            OpCodeInfo{"LOG3", 0, 5, 0, 3}, // 0xA3
            OpCodeInfo{"LOG4", 0, 6, 0, 4}, // 0xA4
            unknown_opcode_info, // 0xA5
            unknown_opcode_info, // 0xA6
            unknown_opcode_info, // 0xA7
            unknown_opcode_info, // 0xA8
            unknown_opcode_info, // 0xA9
            unknown_opcode_info, // 0xAA
            unknown_opcode_info, // 0xAB
            unknown_opcode_info, // 0xAC
            unknown_opcode_info, // 0xAD
            unknown_opcode_info, // 0xAE
            unknown_opcode_info, // 0xAF

            unknown_opcode_info, // 0xB0
            unknown_opcode_info, // 0xB1
            unknown_opcode_info, // 0xB2
            unknown_opcode_info, // 0xB3
            unknown_opcode_info, // 0xB4
            unknown_opcode_info, // 0xB5
            unknown_opcode_info, // 0xB6
            unknown_opcode_info, // 0xB7
            unknown_opcode_info, // 0xB8
            unknown_opcode_info, // 0xB9
            unknown_opcode_info, // 0xBA
            unknown_opcode_info, // 0xBB
            unknown_opcode_info, // 0xBC
            unknown_opcode_info, // 0xBD
            unknown_opcode_info, // 0xBE
            unknown_opcode_info, // 0xBF

            unknown_opcode_info, // 0xC0
            unknown_opcode_info, // 0xC1
            unknown_opcode_info, // 0xC2
            unknown_opcode_info, // 0xC3
            unknown_opcode_info, // 0xC4
            unknown_opcode_info, // 0xC5
            unknown_opcode_info, // 0xC6
            unknown_opcode_info, // 0xC7
            unknown_opcode_info, // 0xC8
            unknown_opcode_info, // 0xC9
            unknown_opcode_info, // 0xCA
            unknown_opcode_info, // 0xCB
            unknown_opcode_info, // 0xCC
            unknown_opcode_info, // 0xCD
            unknown_opcode_info, // 0xCE
            unknown_opcode_info, // 0xCF

            unknown_opcode_info, // 0xD0
            unknown_opcode_info, // 0xD1
            unknown_opcode_info, // 0xD2
            unknown_opcode_info, // 0xD3
            unknown_opcode_info, // 0xD4
            unknown_opcode_info, // 0xD5
            unknown_opcode_info, // 0xD6
            unknown_opcode_info, // 0xD7
            unknown_opcode_info, // 0xD8
            unknown_opcode_info, // 0xD9
            unknown_opcode_info, // 0xDA
            unknown_opcode_info, // 0xDB
            unknown_opcode_info, // 0xDC
            unknown_opcode_info, // 0xDD
            unknown_opcode_info, // 0xDE
            unknown_opcode_info, // 0xDF

            unknown_opcode_info, // 0xE0
            unknown_opcode_info, // 0xE1
            unknown_opcode_info, // 0xE2
            unknown_opcode_info, // 0xE3
            unknown_opcode_info, // 0xE4
            unknown_opcode_info, // 0xE5
            unknown_opcode_info, // 0xE6
            unknown_opcode_info, // 0xE7
            unknown_opcode_info, // 0xE8
            unknown_opcode_info, // 0xE9
            unknown_opcode_info, // 0xEA
            unknown_opcode_info, // 0xEB
            unknown_opcode_info, // 0xEC
            unknown_opcode_info, // 0xED
            unknown_opcode_info, // 0xEE
            unknown_opcode_info, // 0xEF

            OpCodeInfo{"CREATE", 0, 3, 1, 0}, // 0xF0
            OpCodeInfo{"CALL", 0, 7, 1, 0}, // 0xF1
            OpCodeInfo{"CALLCODE", 0, 7, 1, 0}, // 0xF2
            OpCodeInfo{"RETURN", 0, 2, 0, 0}, // 0xF3
            OpCodeInfo{"DELEGATECALL", 0, 6, 1, 0}, // 0xF4
            OpCodeInfo{"CREATE2", 0, 4, 1, 0}, // 0xF5
            unknown_opcode_info, // 0xF6
            unknown_opcode_info, // 0xF7
            unknown_opcode_info, // 0xF8
            unknown_opcode_info, // 0xF9
            OpCodeInfo{"STATICCALL", 0, 6, 1, 0}, // 0xFA
            unknown_opcode_info, // 0xFB
            unknown_opcode_info, // 0xFC
            OpCodeInfo{"REVERT", 0, 2, 0, 0}, // 0xFD
            unknown_opcode_info, // 0xFE
            OpCodeInfo{"SELFDESTRUCT", 0, 1, 0, 0}, // 0xFF
    };

    constexpr bool is_push_opcode(std::uint8_t const opcode) noexcept
    {
        return opcode >= PUSH1 && opcode <= PUSH32;
    }

    /**
     * Number of immediate bytes carried by a push instruction; linear in the
     * opcode value, from 1 for PUSH1 to 32 for PUSH32.
     */
    constexpr std::uint8_t
    get_push_opcode_index(std::uint8_t const opcode) noexcept
    {
        return static_cast<std::uint8_t>(opcode - PUSH0);
    }

    constexpr bool is_dup_opcode(std::uint8_t const opcode) noexcept
    {
        return opcode >= DUP1 && opcode <= DUP16;
    }

    constexpr bool is_swap_opcode(std::uint8_t const opcode) noexcept
    {
        return opcode >= SWAP1 && opcode <= SWAP16;
    }

    constexpr bool is_known_opcode(std::uint8_t const opcode) noexcept
    {
        return opcode_table[opcode] != unknown_opcode_info;
    }

    constexpr std::string_view opcode_name(std::uint8_t const opcode) noexcept
    {
        return opcode_table[opcode].name;
    }

    static_assert(get_push_opcode_index(PUSH1) == 1);
    static_assert(get_push_opcode_index(PUSH32) == 32);
    static_assert(!is_push_opcode(PUSH0));
    static_assert(!is_push_opcode(JUMPDEST));
    static_assert(opcode_table[PUSH32].num_args == 32);
    static_assert(opcode_table[SWAP16].min_stack == 17);
}
