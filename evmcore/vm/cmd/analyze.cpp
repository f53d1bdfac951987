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
#include <evmcore/core/log_level_map.hpp>
#include <evmcore/vm/analysis/code_map.hpp>
#include <evmcore/vm/interpreter/analyzed_code.hpp>

#include <CLI/CLI.hpp>

#include <evmc/hex.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

using namespace evmcore;
using namespace evmcore::vm;

namespace
{
    std::string_view trim(std::string_view s)
    {
        constexpr std::string_view whitespace{" \t\r\n"};
        auto const begin = s.find_first_not_of(whitespace);
        if (begin == std::string_view::npos) {
            return {};
        }
        auto const end = s.find_last_not_of(whitespace);
        return s.substr(begin, end - begin + 1);
    }

    std::optional<std::string> read_file(fs::path const &path)
    {
        std::ifstream in{path};
        if (!in) {
            return std::nullopt;
        }
        std::ostringstream buf;
        buf << in.rdbuf();
        return buf.str();
    }
}

int main(int const argc, char const *argv[])
{
    CLI::App cli{"evmcore-analyze"};
    cli.option_defaults()->always_capture_default();

    std::string code_hex;
    fs::path code_file;
    bool dump = false;
    bool jumpdests = false;
    auto log_level = quill::LogLevel::Info;

    auto *const group = cli.add_option_group("input", "bytecode to analyze");
    group->add_option("--code", code_hex, "hex encoded bytecode");
    group->add_option("--code-file", code_file, "file holding hex bytecode")
        ->check(CLI::ExistingFile);
    group->require_option(1);
    cli.add_flag("--dump", dump, "print the push data bitmap words");
    cli.add_flag("--jumpdests", jumpdests, "print every valid jump target");
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(ascii_time) [%(thread)] %(filename):%(lineno) LOG_%(level_name)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    if (!code_file.empty()) {
        auto contents = read_file(code_file);
        if (!contents.has_value()) {
            LOG_ERROR("could not read {}", code_file.string());
            return 1;
        }
        code_hex = std::move(*contents);
    }

    auto const code = evmc::from_hex(trim(code_hex));
    if (!code.has_value()) {
        LOG_ERROR("input is not valid hex");
        return 1;
    }
    LOG_DEBUG("analyzing {} bytes", code->size());

    AnalyzedCode const analyzed{*code};
    auto const &map = analyzed.code_map();

    std::size_t push_data_bytes = 0;
    std::vector<std::size_t> targets;
    for (std::size_t pc = 0; pc < analyzed.size(); ++pc) {
        if (map.is_push_data(pc)) {
            ++push_data_bytes;
        }
        else if (analyzed.is_jumpdest(pc)) {
            targets.push_back(pc);
        }
    }

    fmt::print("code size:       {}\n", analyzed.size());
    fmt::print("push data bytes: {}\n", push_data_bytes);
    fmt::print("jump targets:    {}\n", targets.size());

    if (dump) {
        fmt::print("bitmap words ({}):\n", map.words().size());
        for (auto const word : map.words()) {
            fmt::print("  {:#010x}\n", word);
        }
    }
    if (jumpdests) {
        for (auto const pc : targets) {
            fmt::print("  {:#x}\n", pc);
        }
    }

    quill::flush();
    return 0;
}
