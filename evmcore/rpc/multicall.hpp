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
#include <evmcore/core/bytes.hpp>
#include <evmcore/core/config.hpp>
#include <evmcore/core/int.hpp>
#include <evmcore/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

EVMCORE_NAMESPACE_BEGIN

struct Log
{
    byte_string data{};
    std::vector<bytes32_t> topics{};
    Address address{};

    friend bool operator==(Log const &, Log const &) = default;
};

struct AccessEntry
{
    Address a{};
    std::vector<bytes32_t> keys{};

    friend bool operator==(AccessEntry const &, AccessEntry const &) = default;
};

using AccessList = std::vector<AccessEntry>;

struct CallRequest
{
    Address from{};
    std::optional<Address> to{};
    uint64_t gas{0};
    uint256_t value{0};
    byte_string data{};
};

// What one call produced. `error` is set when the call ran but failed
// (revert, out of gas, ...); `output` then holds the revert data.
struct ExecutionOutcome
{
    uint64_t gas_used{0};
    uint64_t gas_refund{0};
    byte_string output{};
    AccessList access_list{};
    std::vector<Log> logs{};
    std::optional<std::string> error{};
};

/**
 * Runs simulated calls against a mutable state snapshot. execute() leaves
 * its state changes pending; commit() applies them so that the next call
 * observes them.
 */
class CallExecutor
{
public:
    virtual ~CallExecutor() = default;

    virtual Result<ExecutionOutcome> execute(CallRequest const &) = 0;
    virtual void commit() = 0;
};

struct CallResult
{
    uint64_t gas_used{0};
    uint64_t min_gas_limit{0};
    byte_string output{};
    AccessList access_list{};
    std::vector<Log> logs{};
    std::optional<std::string> error{};

    friend bool operator==(CallResult const &, CallResult const &) = default;
};

struct CallFailure
{
    std::size_t index{0};
    std::string message{};

    friend bool operator==(CallFailure const &, CallFailure const &) = default;
};

struct MulticallResponse
{
    std::vector<CallResult> results{};
    std::optional<CallFailure> first_failure{};
};

/**
 * Executes `calls` in order on one snapshot, committing between calls. A
 * call that fails does not stop the sequence; an executor error aborts it.
 */
Result<std::vector<CallResult>>
execute_calls(CallExecutor &, std::span<CallRequest const> calls);

/// execute_calls() plus revert reason decoding and first failure reporting.
Result<MulticallResponse>
multicall(CallExecutor &, std::span<CallRequest const> calls);

EVMCORE_NAMESPACE_END
