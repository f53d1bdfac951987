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

#include <evmcore/core/basic_formatter.hpp>
#include <evmcore/core/byte_string.hpp>
#include <evmcore/vm/analysis/code_map.hpp>
#include <evmcore/vm/evm/opcodes.hpp>
#include <evmcore/vm/interpreter/stack_pool.hpp>
#include <evmcore/vm/interpreter/value_stack.hpp>

#include <benchmark/benchmark.h>
#include <quill/bundled/fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>

using namespace evmcore;
using namespace evmcore::vm;

namespace
{
    constexpr std::size_t analysis_code_size = 1200 * 1024;

    byte_string random_code()
    {
        std::mt19937_64 rng{0};
        byte_string code(analysis_code_size, 0);
        for (auto &b : code) {
            b = static_cast<std::uint8_t>(rng());
        }
        return code;
    }

    template <typename Map>
    void run_analysis(benchmark::State &state, byte_string const &code)
    {
        for (auto _ : state) {
            auto map = Map::build(code);
            benchmark::DoNotOptimize(map);
        }
        state.SetBytesProcessed(
            static_cast<std::int64_t>(state.iterations() * code.size()));
    }

    void analysis_zeros(benchmark::State &state)
    {
        run_analysis<CodeMap>(state, byte_string(analysis_code_size, 0));
    }

    BENCHMARK(analysis_zeros);

    void analysis_random(benchmark::State &state)
    {
        run_analysis<CodeMap>(state, random_code());
    }

    BENCHMARK(analysis_random);

    void analysis_random_64(benchmark::State &state)
    {
        run_analysis<BasicCodeMap<std::uint64_t>>(state, random_code());
    }

    BENCHMARK(analysis_random_64);

    void analysis_random_bitwise(benchmark::State &state)
    {
        auto const code = random_code();
        for (auto _ : state) {
            auto map = CodeMap::build_bitwise(code);
            benchmark::DoNotOptimize(map);
        }
        state.SetBytesProcessed(
            static_cast<std::int64_t>(state.iterations() * code.size()));
    }

    BENCHMARK(analysis_random_bitwise);

    void analysis_opcode(benchmark::State &state, std::uint8_t const op)
    {
        run_analysis<CodeMap>(state, byte_string(analysis_code_size, op));
    }

    void register_opcode_benchmarks()
    {
        for (unsigned op = PUSH1; op <= PUSH32; ++op) {
            benchmark::RegisterBenchmark(
                fmt::format("analysis_opcode/{}", opcode_name(op)).c_str(),
                analysis_opcode,
                static_cast<std::uint8_t>(op));
        }
        for (std::uint8_t const op : {JUMPDEST, STOP}) {
            benchmark::RegisterBenchmark(
                fmt::format("analysis_opcode/{}", opcode_name(op)).c_str(),
                analysis_opcode,
                op);
        }
    }

    void value_stack_push_pop(benchmark::State &state)
    {
        ValueStack stack;
        for (auto _ : state) {
            for (std::size_t i = 0; i < stack_limit; ++i) {
                stack.push(i);
            }
            while (!stack.empty()) {
                benchmark::DoNotOptimize(stack.pop());
            }
        }
        state.SetItemsProcessed(
            static_cast<std::int64_t>(state.iterations() * stack_limit));
    }

    BENCHMARK(value_stack_push_pop);

    void stack_pool_acquire_release(benchmark::State &state)
    {
        static StackPool pool;
        for (auto _ : state) {
            auto stack = pool.acquire();
            stack->push(1);
            benchmark::DoNotOptimize(stack->peek());
        }
    }

    BENCHMARK(stack_pool_acquire_release)->ThreadRange(1, 8);
}

int main(int argc, char **argv)
{
    register_opcode_benchmarks();

    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();
    benchmark::Shutdown();
}
