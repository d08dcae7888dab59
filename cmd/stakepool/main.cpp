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

#include "scenario.hpp"

#include <stakepool/core/log_level_map.hpp>
#include <stakepool/ledger/account_store.hpp>
#include <stakepool/ledger/transfer.hpp>

#include <CLI/CLI.hpp>

#include <nlohmann/json.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

using namespace stakepool;
namespace fs = std::filesystem;

int main(int const argc, char const *argv[])
{
    CLI::App cli{"stakepool"};
    cli.option_defaults()->always_capture_default();

    fs::path scenario_path;
    bool stop_on_error = false;
    auto log_level = quill::LogLevel::Info;

    cli.add_option("--scenario", scenario_path, "JSON scenario to replay")
        ->required()
        ->check(CLI::ExistingFile);
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));
    cli.add_flag(
        "--stop_on_error",
        stop_on_error,
        "stop at the first rejected instruction and exit with failure");

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(time) [%(thread_id)] %(file_name):%(line_number) LOG_%(log_level)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    Scenario scenario;
    try {
        scenario = load_scenario(scenario_path);
    }
    catch (std::exception const &e) {
        LOG_ERROR(
            "Failed to load scenario {}: {}", scenario_path.string(), e.what());
        quill::flush();
        return EXIT_FAILURE;
    }
    LOG_INFO(
        "Replaying {} instructions from {}",
        scenario.instructions.size(),
        scenario_path.string());

    ledger::InMemoryAccountStore store;
    ledger::InMemoryAssetLedger assets;
    auto const results = replay(scenario, store, assets, stop_on_error);

    auto const rejected = static_cast<size_t>(
        std::ranges::count_if(results, [](ReplayResult const &r) {
            return r.error.has_value();
        }));
    LOG_INFO(
        "Finished replay, applied = {}, rejected = {}",
        results.size() - rejected,
        rejected);
    quill::flush();

    std::cout << dump_state(scenario, store, assets, results).dump(2)
              << std::endl;

    return (stop_on_error && rejected != 0) ? EXIT_FAILURE : EXIT_SUCCESS;
}
