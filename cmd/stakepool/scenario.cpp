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

#include <stakepool/core/basic_formatter.hpp>
#include <stakepool/core/byte_string.hpp>
#include <stakepool/core/bytes.hpp>
#include <stakepool/core/fmt/bytes_fmt.hpp> // NOLINT
#include <stakepool/ledger/account_state.hpp>
#include <stakepool/ledger/account_variable.hpp>
#include <stakepool/ledger/error_kind.hpp>
#include <stakepool/ledger/instruction.hpp>
#include <stakepool/ledger/pool_record.hpp>
#include <stakepool/ledger/position_record.hpp>

#include <evmc/hex.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <fstream>
#include <stdexcept>
#include <string_view>

using namespace stakepool::ledger;

STAKEPOOL_ANONYMOUS_NAMESPACE_BEGIN

bytes32_t parse_bytes32(nlohmann::json const &value)
{
    auto const s = value.get<std::string>();
    auto const parsed = evmc::from_hex<bytes32_t>(s);
    if (!parsed.has_value()) {
        throw std::invalid_argument{"invalid 32 byte hex value '" + s + "'"};
    }
    return parsed.value();
}

std::string to_hex(bytes32_t const &value)
{
    return fmt::format("{}", value);
}

// An account is either {"key": hex} or {"position_of": hex}, the latter
// naming the position account derived for that participant.
std::vector<AccountMeta> parse_accounts(
    nlohmann::json const &accounts, bytes32_t const &program_id)
{
    std::vector<AccountMeta> out;
    for (auto const &account : accounts) {
        out.push_back(AccountMeta{
            .key = account.contains("position_of")
                       ? position_key(
                             program_id,
                             parse_bytes32(account.at("position_of")))
                       : parse_bytes32(account.at("key")),
            .is_signer = account.value("signer", false)});
    }
    return out;
}

byte_string encode(std::string const &op, nlohmann::json const &item)
{
    if (op == "raw") {
        auto const data = item.at("data").get<std::string>();
        auto decoded = evmc::from_hex(data);
        if (!decoded.has_value()) {
            throw std::invalid_argument{"invalid hex data '" + data + "'"};
        }
        return std::move(decoded).value();
    }

    auto const opcode = opcode_from_name(op);
    if (!opcode.has_value()) {
        throw std::invalid_argument{"unknown op '" + op + "'"};
    }
    switch (opcode.value()) {
    case Opcode::Initialize:
        if (item.contains("stake_asset") || item.contains("reward_asset")) {
            return encode_initialize(
                item.contains("stake_asset")
                    ? parse_bytes32(item.at("stake_asset"))
                    : bytes32_t{},
                item.contains("reward_asset")
                    ? parse_bytes32(item.at("reward_asset"))
                    : bytes32_t{});
        }
        return encode_initialize();
    case Opcode::Deposit:
        return encode_deposit(item.at("amount").get<uint64_t>());
    case Opcode::Withdraw:
        return encode_withdraw(item.at("amount").get<uint64_t>());
    case Opcode::StartEpoch:
        return encode_start_epoch(
            item.at("start_time").get<uint64_t>(),
            item.at("end_time").get<uint64_t>(),
            item.at("reward_amount").get<uint64_t>());
    case Opcode::Claim:
        return encode_claim();
    }
    throw std::invalid_argument{"unknown op '" + op + "'"};
}

nlohmann::json position_to_json(bytes32_t const &key, PositionRecord const &p)
{
    return {
        {"key", to_hex(key)},
        {"initialized", p.is_initialized()},
        {"owner", to_hex(p.owner)},
        {"staked_amount", p.staked_amount.native()},
        {"last_claimed_epoch", p.last_claimed_epoch.native()}};
}

nlohmann::json pool_to_json(PoolRecord const &p)
{
    return {
        {"initialized", p.is_initialized()},
        {"owner", to_hex(p.owner)},
        {"stake_asset", to_hex(p.stake_asset)},
        {"reward_asset", to_hex(p.reward_asset)},
        {"total_staked", p.total_staked.native()},
        {"epoch_reward", p.epoch_reward.native()},
        {"epoch_start", p.epoch_start.native()},
        {"epoch_end", p.epoch_end.native()},
        {"epoch_id", p.epoch_id.native()}};
}

STAKEPOOL_ANONYMOUS_NAMESPACE_END

STAKEPOOL_NAMESPACE_BEGIN

Scenario parse_scenario(nlohmann::json const &json)
{
    Scenario scenario{
        .config =
            PoolConfig{
                .program_id = parse_bytes32(json.at("program_id")),
                .pool_account = parse_bytes32(json.at("pool_account"))},
        .balances = {},
        .instructions = {}};

    if (json.contains("balances")) {
        for (auto const &item : json.at("balances")) {
            scenario.balances.push_back(ScenarioBalance{
                .asset = parse_bytes32(item.at("asset")),
                .holder = parse_bytes32(item.at("holder")),
                .amount = item.at("amount").get<uint64_t>()});
        }
    }

    for (auto const &item : json.at("instructions")) {
        auto op = item.at("op").get<std::string>();
        auto data = encode(op, item);
        scenario.instructions.push_back(ScenarioInstruction{
            .op = std::move(op),
            .data = std::move(data),
            .accounts = item.contains("accounts")
                            ? parse_accounts(
                                  item.at("accounts"),
                                  scenario.config.program_id)
                            : std::vector<AccountMeta>{}});
    }

    return scenario;
}

Scenario load_scenario(std::filesystem::path const &path)
{
    std::ifstream in{path};
    if (!in) {
        throw std::invalid_argument{"cannot open " + path.string()};
    }
    return parse_scenario(nlohmann::json::parse(in));
}

std::vector<ReplayResult> replay(
    Scenario const &scenario, InMemoryAccountStore &store,
    InMemoryAssetLedger &assets, bool const stop_on_error)
{
    for (auto const &balance : scenario.balances) {
        assets.set_balance(balance.asset, balance.holder, balance.amount);
    }

    AccountState state{store};
    StakingPool pool{scenario.config, state, assets};

    std::vector<ReplayResult> results;
    for (auto const &instruction : scenario.instructions) {
        auto const res = pool.execute(instruction.data, instruction.accounts);
        if (res.has_error()) {
            results.push_back(ReplayResult{
                .op = instruction.op,
                .error = res.error().message().c_str(),
                .kind = std::string{error_kind_name(error_kind(res.error()))}});
            if (stop_on_error) {
                LOG_ERROR(
                    "Stopping after instruction {} of {}",
                    results.size(),
                    scenario.instructions.size());
                break;
            }
            continue;
        }
        results.push_back(ReplayResult{
            .op = instruction.op, .error = std::nullopt, .kind = {}});
    }
    return results;
}

nlohmann::json dump_state(
    Scenario const &scenario, InMemoryAccountStore const &store,
    InMemoryAssetLedger const &assets, std::vector<ReplayResult> const &results)
{
    auto const &config = scenario.config;

    nlohmann::json out;
    out["pool"] = nullptr;
    out["positions"] = nlohmann::json::array();
    for (auto const &[key, account] : store) {
        if (account.owner != config.program_id) {
            continue;
        }
        if (key == config.pool_account) {
            auto const pool =
                AccountVariable<PoolRecord>::from_bytes(account.data);
            if (pool.has_value()) {
                out["pool"] = pool_to_json(pool.value());
            }
            continue;
        }
        auto const position =
            AccountVariable<PositionRecord>::from_bytes(account.data);
        if (position.has_value()) {
            out["positions"].push_back(position_to_json(key, position.value()));
        }
    }

    out["balances"] = nlohmann::json::array();
    for (auto const &[key, amount] : assets) {
        out["balances"].push_back(
            {{"asset", to_hex(key.asset)},
             {"holder", to_hex(key.holder)},
             {"amount", amount}});
    }

    out["results"] = nlohmann::json::array();
    for (auto const &result : results) {
        nlohmann::json item{{"op", result.op}};
        if (result.error.has_value()) {
            item["error"] = result.error.value();
            item["kind"] = result.kind;
        }
        else {
            item["status"] = "ok";
        }
        out["results"].push_back(std::move(item));
    }
    return out;
}

STAKEPOOL_NAMESPACE_END
