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
#include <evmcore/core/config.hpp>

#include <optional>
#include <string>

EVMCORE_NAMESPACE_BEGIN

/**
 * Human-readable reason carried in the return data of a reverted call.
 * Understands the two encodings the Solidity compiler emits,
 * `Error(string)` and `Panic(uint256)`. Returns std::nullopt for anything
 * else, including malformed ABI data.
 */
std::optional<std::string> decode_revert_reason(byte_string_view output);

EVMCORE_NAMESPACE_END
