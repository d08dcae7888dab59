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

#include <stakepool/core/blake3.hpp>
#include <stakepool/core/byte_string.hpp>
#include <stakepool/core/checked_math.hpp>
#include <stakepool/core/fmt/bytes_fmt.hpp> // NOLINT
#include <stakepool/core/likely.h>
#include <stakepool/core/little_endian.hpp>
#include <stakepool/ledger/decode.hpp>
#include <stakepool/ledger/error_kind.hpp>
#include <stakepool/ledger/ledger_error.hpp>
#include <stakepool/ledger/reward.hpp>
#include <stakepool/ledger/staking_pool.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <cstddef>
#include <string>
#include <utility>

STAKEPOOL_LEDGER_ANONYMOUS_NAMESPACE_BEGIN

Result<void>
require_accounts(StakingPool::Accounts const accounts, size_t const n)
{
    if (STAKEPOOL_UNLIKELY(accounts.size() < n)) {
        return DecodeError::MissingAccounts;
    }
    return outcome::success();
}

Result<void> require_signer(AccountMeta const &account)
{
    if (STAKEPOOL_UNLIKELY(!account.is_signer)) {
        return LedgerError::MissingSignature;
    }
    return outcome::success();
}

STAKEPOOL_LEDGER_ANONYMOUS_NAMESPACE_END

STAKEPOOL_LEDGER_NAMESPACE_BEGIN

bytes32_t
position_key(bytes32_t const &program_id, bytes32_t const &participant)
{
    struct
    {
        bytes32_t program_id;
        bytes32_t participant;
        unsigned char seed[8];
    } const preimage{
        .program_id = program_id,
        .participant = participant,
        .seed = {'p', 'o', 's', 'i', 't', 'i', 'o', 'n'}};
    static_assert(sizeof(preimage) == 72);

    return blake3(byte_string_view{
        reinterpret_cast<unsigned char const *>(&preimage), sizeof(preimage)});
}

StakingPool::StakingPool(
    PoolConfig const &config, AccountState &state, AssetTransfer &transfer)
    : config_{config}
    , state_{state}
    , transfer_{transfer}
    , vars{state, config_}
{
}

//////////////
// Helpers //
//////////////

Result<PositionRecord> StakingPool::load_position(
    AccountVariable<PositionRecord> const &position_var,
    AccountMeta const &named, AccountMeta const &participant)
{
    if (STAKEPOOL_UNLIKELY(named.key != position_var.key())) {
        LOG_DEBUG(
            "Position account {} is not derived from participant {}",
            named.key,
            participant.key);
        return LedgerError::InvalidAccountData;
    }
    BOOST_OUTCOME_TRY(auto const position, position_var.load());
    if (position.is_initialized() && position.owner != participant.key) {
        return LedgerError::Unauthorized;
    }
    return position;
}

/////////////////
// Dispatcher //
/////////////////

Result<std::pair<Opcode, StakingPool::HandlerFunc>>
StakingPool::dispatch(byte_string_view &input)
{
    if (STAKEPOOL_UNLIKELY(input.empty())) {
        return DecodeError::InvalidOperation;
    }

    auto const op = static_cast<Opcode>(input[0]);
    input.remove_prefix(1);

    switch (op) {
    case Opcode::Initialize:
        return std::make_pair(op, &StakingPool::initialize);
    case Opcode::Deposit:
        return std::make_pair(op, &StakingPool::deposit);
    case Opcode::Withdraw:
        return std::make_pair(op, &StakingPool::withdraw);
    case Opcode::StartEpoch:
        return std::make_pair(op, &StakingPool::start_epoch);
    case Opcode::Claim:
        return std::make_pair(op, &StakingPool::claim);
    }
    return DecodeError::InvalidOperation;
}

Result<void> StakingPool::execute(
    byte_string_view const instruction, Accounts const accounts)
{
    byte_string_view input = instruction;

    auto const run = [&]() -> Result<Opcode> {
        BOOST_OUTCOME_TRY(auto const handler, dispatch(input));
        auto const [op, func] = handler;

        auto pool_var = vars.pool();
        BOOST_OUTCOME_TRY(auto pool, pool_var.load());
        if (op != Opcode::Initialize && !pool.is_initialized()) {
            return LedgerError::Uninitialized;
        }

        BOOST_OUTCOME_TRY((this->*func)(input, accounts, pool));

        pool_var.store(pool);
        return op;
    };

    state_.push();
    auto res = run();
    if (res.has_error()) {
        state_.pop_reject();
        LOG_WARNING(
            "Rejected instruction on pool {}: {} ({})",
            config_.pool_account,
            res.error().message().c_str(),
            std::string{error_kind_name(error_kind(res.error()))});
        return std::move(res).assume_error();
    }
    state_.pop_accept();

    LOG_INFO(
        "Applied {} on pool {}",
        std::string{opcode_name(res.value())},
        config_.pool_account);
    return outcome::success();
}

//////////////////
// Transitions //
//////////////////

Result<void> StakingPool::initialize(
    byte_string_view input, Accounts const accounts, PoolRecord &pool)
{
    BOOST_OUTCOME_TRY(require_accounts(accounts, 1));
    auto const &owner = accounts[0];

    bytes32_t stake_asset{};
    bytes32_t reward_asset{};
    if (!input.empty()) {
        BOOST_OUTCOME_TRY(auto const stake, decode_fixed<bytes32_t>(input));
        BOOST_OUTCOME_TRY(auto const reward, decode_fixed<bytes32_t>(input));
        stake_asset = stake;
        reward_asset = reward;
    }
    BOOST_OUTCOME_TRY(decode_end(input));

    BOOST_OUTCOME_TRY(require_signer(owner));
    if (STAKEPOOL_UNLIKELY(pool.is_initialized())) {
        return LedgerError::AlreadyInitialized;
    }

    pool.initialized = 1;
    pool.owner = owner.key;
    pool.stake_asset = stake_asset;
    pool.reward_asset = reward_asset;

    LOG_INFO(
        "Initialized pool {} with owner {}", config_.pool_account, owner.key);
    return outcome::success();
}

Result<void> StakingPool::deposit(
    byte_string_view input, Accounts const accounts, PoolRecord &pool)
{
    BOOST_OUTCOME_TRY(require_accounts(accounts, 3));
    auto const &participant = accounts[0];
    auto const &custody = accounts[1];

    BOOST_OUTCOME_TRY(auto const amount_le, decode_fixed<u64_le>(input));
    BOOST_OUTCOME_TRY(decode_end(input));
    uint64_t const amount = amount_le.native();

    BOOST_OUTCOME_TRY(require_signer(participant));

    auto position_var = vars.position(participant.key);
    BOOST_OUTCOME_TRY(
        auto position, load_position(position_var, accounts[2], participant));
    if (!position.is_initialized()) {
        position.initialized = 1;
        position.owner = participant.key;
    }

    BOOST_OUTCOME_TRY(
        auto const staked,
        checked_add(position.staked_amount.native(), amount));
    BOOST_OUTCOME_TRY(
        auto const total, checked_add(pool.total_staked.native(), amount));

    if (STAKEPOOL_LIKELY(amount != 0)) {
        BOOST_OUTCOME_TRY(transfer_.transfer(
            pool.stake_asset, participant.key, custody.key, amount));
    }

    position.staked_amount = staked;
    position_var.store(position);
    pool.total_staked = total;

    LOG_INFO("Deposited {} tokens from {}", amount, participant.key);
    return outcome::success();
}

Result<void> StakingPool::withdraw(
    byte_string_view input, Accounts const accounts, PoolRecord &pool)
{
    BOOST_OUTCOME_TRY(require_accounts(accounts, 3));
    auto const &participant = accounts[0];
    auto const &custody = accounts[1];

    BOOST_OUTCOME_TRY(auto const amount_le, decode_fixed<u64_le>(input));
    BOOST_OUTCOME_TRY(decode_end(input));
    uint64_t const amount = amount_le.native();

    BOOST_OUTCOME_TRY(require_signer(participant));

    auto position_var = vars.position(participant.key);
    BOOST_OUTCOME_TRY(
        auto position, load_position(position_var, accounts[2], participant));
    if (STAKEPOOL_UNLIKELY(!position.is_initialized())) {
        return LedgerError::Uninitialized;
    }
    if (STAKEPOOL_UNLIKELY(position.staked_amount.native() < amount)) {
        LOG_DEBUG(
            "Insufficient staked tokens: {} < {}",
            position.staked_amount.native(),
            amount);
        return LedgerError::InsufficientFunds;
    }

    BOOST_OUTCOME_TRY(
        auto const staked,
        checked_sub(position.staked_amount.native(), amount));
    BOOST_OUTCOME_TRY(
        auto const total, checked_sub(pool.total_staked.native(), amount));

    if (STAKEPOOL_LIKELY(amount != 0)) {
        BOOST_OUTCOME_TRY(transfer_.transfer(
            pool.stake_asset, custody.key, participant.key, amount));
    }

    position.staked_amount = staked;
    position_var.store(position);
    pool.total_staked = total;

    LOG_INFO("Unstaked {} tokens to {}", amount, participant.key);
    return outcome::success();
}

Result<void> StakingPool::start_epoch(
    byte_string_view input, Accounts const accounts, PoolRecord &pool)
{
    BOOST_OUTCOME_TRY(require_accounts(accounts, 1));
    auto const &owner = accounts[0];

    BOOST_OUTCOME_TRY(auto const start_le, decode_fixed<u64_le>(input));
    BOOST_OUTCOME_TRY(auto const end_le, decode_fixed<u64_le>(input));
    BOOST_OUTCOME_TRY(auto const reward_le, decode_fixed<u64_le>(input));
    BOOST_OUTCOME_TRY(decode_end(input));
    uint64_t const start_time = start_le.native();
    uint64_t const end_time = end_le.native();

    BOOST_OUTCOME_TRY(require_signer(owner));
    if (STAKEPOOL_UNLIKELY(owner.key != pool.owner)) {
        return LedgerError::Unauthorized;
    }

    if (STAKEPOOL_UNLIKELY(start_time <= pool.epoch_end.native())) {
        LOG_DEBUG(
            "Epoch start {} is not after current epoch end {}",
            start_time,
            pool.epoch_end.native());
        return LedgerError::InvalidArgument;
    }
    if (STAKEPOOL_UNLIKELY(end_time <= start_time)) {
        LOG_DEBUG(
            "Epoch end {} is not after epoch start {}", end_time, start_time);
        return LedgerError::InvalidArgument;
    }
    BOOST_OUTCOME_TRY(
        auto const epoch_id, checked_increment(pool.epoch_id.native()));

    pool.epoch_start = start_time;
    pool.epoch_end = end_time;
    pool.epoch_reward = reward_le;
    pool.epoch_id = epoch_id;

    LOG_INFO(
        "Started new epoch with ID {}: [{}, {}) reward {}",
        epoch_id,
        start_time,
        end_time,
        reward_le.native());
    return outcome::success();
}

Result<void> StakingPool::claim(
    byte_string_view input, Accounts const accounts, PoolRecord &pool)
{
    BOOST_OUTCOME_TRY(require_accounts(accounts, 3));
    auto const &participant = accounts[0];
    auto const &custody = accounts[1];

    BOOST_OUTCOME_TRY(decode_end(input));

    BOOST_OUTCOME_TRY(require_signer(participant));

    auto position_var = vars.position(participant.key);
    BOOST_OUTCOME_TRY(
        auto position, load_position(position_var, accounts[2], participant));
    if (STAKEPOOL_UNLIKELY(!position.is_initialized())) {
        return LedgerError::Uninitialized;
    }

    uint16_t const epoch_id = pool.epoch_id.native();
    uint16_t const last_claimed = position.last_claimed_epoch.native();
    if (STAKEPOOL_UNLIKELY(epoch_id != 0 && last_claimed == epoch_id)) {
        return LedgerError::AlreadyClaimed;
    }

    BOOST_OUTCOME_TRY(
        auto const reward,
        calculate_reward(
            position.staked_amount.native(),
            pool.epoch_reward.native(),
            pool.total_staked.native()));

    if (STAKEPOOL_LIKELY(reward != 0)) {
        BOOST_OUTCOME_TRY(transfer_.transfer(
            pool.reward_asset, custody.key, participant.key, reward));
    }

    position.last_claimed_epoch = epoch_id;
    position_var.store(position);

    LOG_INFO(
        "Claimed {} rewards for epoch {} to {}",
        reward,
        epoch_id,
        participant.key);
    return outcome::success();
}

STAKEPOOL_LEDGER_NAMESPACE_END
