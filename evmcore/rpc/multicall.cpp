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

#include <evmcore/core/address_fmt.hpp>
#include <evmcore/core/basic_formatter.hpp>
#include <evmcore/core/config.hpp>
#include <evmcore/core/result.hpp>
#include <evmcore/rpc/multicall.hpp>
#include <evmcore/rpc/revert_reason.hpp>

#include <boost/outcome/try.hpp>
#include <quill/Quill.h>

#include <chrono>
#include <cstddef>
#include <span>
#include <utility>
#include <vector>

EVMCORE_NAMESPACE_BEGIN

Result<std::vector<CallResult>> execute_calls(
    CallExecutor &executor, std::span<CallRequest const> const calls)
{
    auto const start = std::chrono::steady_clock::now();

    std::vector<CallResult> results;
    results.reserve(calls.size());
    for (std::size_t i = 0; i < calls.size(); ++i) {
        BOOST_OUTCOME_TRY(auto outcome, executor.execute(calls[i]));
        results.push_back(CallResult{
            .gas_used = outcome.gas_used,
            .min_gas_limit = outcome.gas_used + outcome.gas_refund,
            .output = std::move(outcome.output),
            .access_list = std::move(outcome.access_list),
            .logs = std::move(outcome.logs),
            .error = std::move(outcome.error)});
        if (i + 1 < calls.size()) {
            executor.commit();
        }
    }

    auto const elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    LOG_DEBUG(
        "executing {} calls finished, runtime={}us",
        calls.size(),
        elapsed.count());
    return results;
}

Result<MulticallResponse>
multicall(CallExecutor &executor, std::span<CallRequest const> const calls)
{
    BOOST_OUTCOME_TRY(auto results, execute_calls(executor, calls));

    MulticallResponse response{.results = std::move(results)};
    for (std::size_t i = 0; i < response.results.size(); ++i) {
        auto &result = response.results[i];
        if (!result.error.has_value()) {
            continue;
        }
        if (auto const reason = decode_revert_reason(result.output)) {
            *result.error = fmt::format("{}: {}", *result.error, *reason);
        }
        LOG_DEBUG(
            "call {} from {} failed: {}",
            i + 1,
            calls[i].from,
            *result.error);
        if (!response.first_failure.has_value()) {
            response.first_failure = CallFailure{
                .index = i,
                .message = fmt::format(
                    "call {} reverted: {}", i + 1, *result.error)};
        }
    }
    return response;
}

EVMCORE_NAMESPACE_END
