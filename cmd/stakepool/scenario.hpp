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

#include <stakepool/core/byte_string.hpp>
#include <stakepool/core/bytes.hpp>
#include <stakepool/core/config.hpp>
#include <stakepool/ledger/account_store.hpp>
#include <stakepool/ledger/staking_pool.hpp>
#include <stakepool/ledger/transfer.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

STAKEPOOL_NAMESPACE_BEGIN

struct ScenarioBalance
{
    bytes32_t asset;
    bytes32_t holder;
    uint64_t amount;
};

struct ScenarioInstruction
{
    std::string op;
    byte_string data;
    std::vector<ledger::AccountMeta> accounts;
};

struct Scenario
{
    ledger::PoolConfig config;
    std::vector<ScenarioBalance> balances;
    std::vector<ScenarioInstruction> instructions;
};

struct ReplayResult
{
    std::string op;
    std::optional<std::string> error;
    std::string kind;
};

// Throws nlohmann::json::exception for missing or mistyped fields and
// std::invalid_argument for malformed hex or an unknown op.
Scenario parse_scenario(nlohmann::json const &);

Scenario load_scenario(std::filesystem::path const &);

// Seeds `assets` with the scenario balances, then executes every instruction
// in order against `store`. Stops after the first rejection when
// `stop_on_error` is set.
std::vector<ReplayResult> replay(
    Scenario const &, ledger::InMemoryAccountStore &,
    ledger::InMemoryAssetLedger &, bool stop_on_error);

nlohmann::json dump_state(
    Scenario const &, ledger::InMemoryAccountStore const &,
    ledger::InMemoryAssetLedger const &, std::vector<ReplayResult> const &);

STAKEPOOL_NAMESPACE_END
