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

#include <stakepool/core/byte_string.hpp>
#include <stakepool/core/bytes.hpp>
#include <stakepool/core/checked_math.hpp>
#include <stakepool/core/result.hpp>
#include <stakepool/ledger/account_state.hpp>
#include <stakepool/ledger/account_store.hpp>
#include <stakepool/ledger/account_variable.hpp>
#include <stakepool/ledger/decode_error.hpp>
#include <stakepool/ledger/error_kind.hpp>
#include <stakepool/ledger/instruction.hpp>
#include <stakepool/ledger/ledger_error.hpp>
#include <stakepool/ledger/pool_record.hpp>
#include <stakepool/ledger/position_record.hpp>
#include <stakepool/ledger/staking_pool.hpp>
#include <stakepool/ledger/transfer.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <vector>

#include <gtest/gtest.h>

using namespace stakepool;
using namespace stakepool::ledger;

namespace
{
    constexpr bytes32_t PROGRAM_ID{0x5ea1};
    constexpr bytes32_t OTHER_PROGRAM{0x0bad};
    constexpr bytes32_t POOL{0x9001};
    constexpr bytes32_t OWNER{0x0e};
    constexpr bytes32_t ALICE{0xa11ce};
    constexpr bytes32_t BOB{0xb0b};
    constexpr bytes32_t CAROL{0xca201};
    constexpr bytes32_t CUSTODY{0xc057};
    constexpr bytes32_t REWARD_CUSTODY{0x7e7a};
    constexpr bytes32_t STRAY_POSITION{0xa2};
    constexpr bytes32_t STAKE_ASSET{0x57a};
    constexpr bytes32_t REWARD_ASSET{0x7e};

    constexpr uint64_t U64_MAX = std::numeric_limits<uint64_t>::max();

    bytes32_t const ALICE_POSITION = position_key(PROGRAM_ID, ALICE);
    bytes32_t const BOB_POSITION = position_key(PROGRAM_ID, BOB);

    template <typename E>
    ErrorKind kind_of(E const e)
    {
        Result<void> const res = e;
        return error_kind(res.error());
    }
}

struct StakePool : public ::testing::Test
{
    InMemoryAccountStore store;
    AccountState state{store};
    InMemoryAssetLedger assets;
    StakingPool contract{
        PoolConfig{.program_id = PROGRAM_ID, .pool_account = POOL},
        state,
        assets};

    void SetUp() override
    {
        store.create(POOL, PROGRAM_ID, PoolRecord::MIN_SIZE);
        store.create(ALICE_POSITION, PROGRAM_ID, sizeof(PositionRecord));
        store.create(BOB_POSITION, PROGRAM_ID, sizeof(PositionRecord));
        store.create(STRAY_POSITION, PROGRAM_ID, sizeof(PositionRecord));
        assets.set_balance(STAKE_ASSET, ALICE, 1'000);
        assets.set_balance(STAKE_ASSET, BOB, 1'000);
        assets.set_balance(REWARD_ASSET, REWARD_CUSTODY, 1'000'000);
    }

    Result<void>
    execute(byte_string const &input, std::vector<AccountMeta> const &accounts)
    {
        auto res = contract.execute(input, accounts);
        EXPECT_EQ(state.version(), 0);
        return res;
    }

    Result<void> initialize(bytes32_t const &owner = OWNER, bool signer = true)
    {
        return execute(
            encode_initialize(STAKE_ASSET, REWARD_ASSET), {{owner, signer}});
    }

    Result<void> deposit(
        bytes32_t const &user, bytes32_t const &position, uint64_t amount,
        bool signer = true)
    {
        return execute(
            encode_deposit(amount),
            {{user, signer}, {CUSTODY, false}, {position, false}});
    }

    Result<void> withdraw(
        bytes32_t const &user, bytes32_t const &position, uint64_t amount,
        bool signer = true)
    {
        return execute(
            encode_withdraw(amount),
            {{user, signer}, {CUSTODY, false}, {position, false}});
    }

    Result<void> start_epoch(
        uint64_t start, uint64_t end, uint64_t reward,
        bytes32_t const &owner = OWNER, bool signer = true)
    {
        return execute(
            encode_start_epoch(start, end, reward), {{owner, signer}});
    }

    Result<void> claim(
        bytes32_t const &user, bytes32_t const &position, bool signer = true)
    {
        return execute(
            encode_claim(),
            {{user, signer}, {REWARD_CUSTODY, false}, {position, false}});
    }

    PoolRecord pool_record()
    {
        return contract.vars.pool().load().value();
    }

    PositionRecord position(bytes32_t const &key)
    {
        return AccountVariable<PositionRecord>{state, key, PROGRAM_ID}
            .load()
            .value();
    }

    // Overwrites the pool record outside of any instruction.
    void poke_pool(PoolRecord const &record)
    {
        state.push();
        contract.vars.pool().store(record);
        state.pop_accept();
    }

    std::vector<std::optional<StoredAccount>> snapshot() const
    {
        return {
            store.load(POOL),
            store.load(ALICE_POSITION),
            store.load(BOB_POSITION),
            store.load(STRAY_POSITION)};
    }

    uint64_t stake_balance(bytes32_t const &holder) const
    {
        return assets.balance(STAKE_ASSET, holder);
    }

    uint64_t reward_balance(bytes32_t const &holder) const
    {
        return assets.balance(REWARD_ASSET, holder);
    }
};

/////////////////
// initialize //
/////////////////

TEST_F(StakePool, initialize)
{
    ASSERT_FALSE(initialize().has_error());

    auto const record = pool_record();
    EXPECT_TRUE(record.is_initialized());
    EXPECT_EQ(record.owner, OWNER);
    EXPECT_EQ(record.stake_asset, STAKE_ASSET);
    EXPECT_EQ(record.reward_asset, REWARD_ASSET);
    EXPECT_EQ(record.total_staked.native(), 0);
    EXPECT_EQ(record.epoch_id.native(), 0);
    EXPECT_EQ(record.epoch_end.native(), 0);
    EXPECT_EQ(store.load(POOL)->owner, PROGRAM_ID);
}

TEST_F(StakePool, initialize_without_assets)
{
    ASSERT_FALSE(execute(encode_initialize(), {{OWNER, true}}).has_error());

    auto const record = pool_record();
    EXPECT_TRUE(record.is_initialized());
    EXPECT_EQ(record.owner, OWNER);
    EXPECT_EQ(record.stake_asset, bytes32_t{});
    EXPECT_EQ(record.reward_asset, bytes32_t{});
}

TEST_F(StakePool, initialize_creates_missing_pool_account)
{
    InMemoryAccountStore empty;
    AccountState empty_state{empty};
    StakingPool fresh{
        PoolConfig{.program_id = PROGRAM_ID, .pool_account = POOL},
        empty_state,
        assets};

    std::vector<AccountMeta> const accounts{{OWNER, true}};
    ASSERT_FALSE(fresh.execute(encode_initialize(), accounts).has_error());
    ASSERT_TRUE(empty.load(POOL).has_value());
    EXPECT_EQ(empty.load(POOL)->data.size(), PoolRecord::MIN_SIZE);
}

TEST_F(StakePool, initialize_revert_not_signed)
{
    auto const before = snapshot();
    auto const res = initialize(OWNER, false);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::MissingSignature);
    EXPECT_EQ(error_kind(res.error()), ErrorKind::Authorization);
    EXPECT_EQ(snapshot(), before);
    EXPECT_FALSE(pool_record().is_initialized());
}

TEST_F(StakePool, initialize_revert_already_initialized)
{
    ASSERT_FALSE(initialize().has_error());

    auto const res = initialize(ALICE);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::AlreadyInitialized);
    EXPECT_EQ(error_kind(res.error()), ErrorKind::State);
    EXPECT_EQ(pool_record().owner, OWNER);
}

TEST_F(StakePool, initialize_revert_bad_payload)
{
    auto input = encode_initialize(STAKE_ASSET, REWARD_ASSET);
    input.pop_back();
    auto res = execute(input, {{OWNER, true}});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DecodeError::InputTooShort);

    input = encode_initialize(STAKE_ASSET, REWARD_ASSET);
    input.push_back(0);
    res = execute(input, {{OWNER, true}});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DecodeError::InputTooLong);

    EXPECT_FALSE(pool_record().is_initialized());
}

TEST_F(StakePool, initialize_revert_no_accounts)
{
    auto const res = execute(encode_initialize(), {});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DecodeError::MissingAccounts);
}

/////////////
// common //
/////////////

TEST_F(StakePool, revert_uninitialized_pool)
{
    for (auto const &input :
         {encode_deposit(1),
          encode_withdraw(1),
          encode_start_epoch(1, 2, 3),
          encode_claim()}) {
        auto const res = execute(
            input, {{ALICE, true}, {CUSTODY, false}, {ALICE_POSITION, false}});
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.assume_error(), LedgerError::Uninitialized);
    }
    EXPECT_EQ(stake_balance(ALICE), 1'000);
}

TEST_F(StakePool, revert_invalid_operation)
{
    ASSERT_FALSE(initialize().has_error());

    auto res = execute(byte_string{}, {{OWNER, true}});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DecodeError::InvalidOperation);
    EXPECT_EQ(error_kind(res.error()), ErrorKind::Decode);

    res = execute(byte_string{5}, {{OWNER, true}});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DecodeError::InvalidOperation);
}

TEST_F(StakePool, revert_pool_owned_by_other_program)
{
    store.create(POOL, OTHER_PROGRAM, PoolRecord::MIN_SIZE);

    auto const res = initialize();
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::NotOwnedByProgram);
    EXPECT_EQ(store.load(POOL)->owner, OTHER_PROGRAM);
}

TEST_F(StakePool, revert_pool_account_too_small)
{
    store.create(POOL, PROGRAM_ID, 97);

    auto const res = initialize();
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::InvalidAccountData);
}

//////////////
// deposit //
//////////////

TEST_F(StakePool, deposit_creates_position)
{
    ASSERT_FALSE(initialize().has_error());
    ASSERT_FALSE(deposit(ALICE, ALICE_POSITION, 100).has_error());

    auto const pos = position(ALICE_POSITION);
    EXPECT_TRUE(pos.is_initialized());
    EXPECT_EQ(pos.owner, ALICE);
    EXPECT_EQ(pos.staked_amount.native(), 100);
    EXPECT_EQ(pos.last_claimed_epoch.native(), 0);
    EXPECT_EQ(pool_record().total_staked.native(), 100);

    EXPECT_EQ(stake_balance(ALICE), 900);
    EXPECT_EQ(stake_balance(CUSTODY), 100);
}

TEST_F(StakePool, deposit_accumulates)
{
    ASSERT_FALSE(initialize().has_error());
    ASSERT_FALSE(deposit(ALICE, ALICE_POSITION, 100).has_error());
    ASSERT_FALSE(deposit(ALICE, ALICE_POSITION, 50).has_error());
    ASSERT_FALSE(deposit(BOB, BOB_POSITION, 300).has_error());

    EXPECT_EQ(position(ALICE_POSITION).staked_amount.native(), 150);
    EXPECT_EQ(position(BOB_POSITION).staked_amount.native(), 300);
    EXPECT_EQ(pool_record().total_staked.native(), 450);
    EXPECT_EQ(stake_balance(CUSTODY), 450);
}

TEST_F(StakePool, deposit_zero_creates_position)
{
    ASSERT_FALSE(initialize().has_error());
    ASSERT_FALSE(deposit(ALICE, ALICE_POSITION, 0).has_error());

    auto const pos = position(ALICE_POSITION);
    EXPECT_TRUE(pos.is_initialized());
    EXPECT_EQ(pos.owner, ALICE);
    EXPECT_EQ(pos.staked_amount.native(), 0);
    EXPECT_EQ(stake_balance(ALICE), 1'000);
}

TEST_F(StakePool, deposit_into_missing_position_account)
{
    bytes32_t const fresh = position_key(PROGRAM_ID, CAROL);
    ASSERT_FALSE(store.load(fresh).has_value());
    assets.set_balance(STAKE_ASSET, CAROL, 10);
    ASSERT_FALSE(initialize().has_error());
    ASSERT_FALSE(deposit(CAROL, fresh, 10).has_error());

    auto const stored = store.load(fresh);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->owner, PROGRAM_ID);
    EXPECT_EQ(position(fresh).staked_amount.native(), 10);
}

TEST_F(StakePool, deposit_upgrades_legacy_position)
{
    ASSERT_FALSE(initialize().has_error());
    store.create(ALICE_POSITION, PROGRAM_ID, PositionRecord::MIN_SIZE);

    ASSERT_FALSE(deposit(ALICE, ALICE_POSITION, 10).has_error());
    EXPECT_EQ(store.load(ALICE_POSITION)->data.size(), sizeof(PositionRecord));
    EXPECT_EQ(position(ALICE_POSITION).staked_amount.native(), 10);
}

TEST_F(StakePool, deposit_revert_not_signed)
{
    ASSERT_FALSE(initialize().has_error());
    auto const before = snapshot();

    auto const res = deposit(ALICE, ALICE_POSITION, 100, false);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::MissingSignature);
    EXPECT_EQ(error_kind(res.error()), ErrorKind::Authorization);

    EXPECT_EQ(snapshot(), before);
    EXPECT_FALSE(position(ALICE_POSITION).is_initialized());
    EXPECT_EQ(stake_balance(ALICE), 1'000);
    EXPECT_EQ(stake_balance(CUSTODY), 0);
}

TEST_F(StakePool, deposit_revert_transfer_failed)
{
    ASSERT_FALSE(initialize().has_error());
    auto const before = snapshot();

    auto const res = deposit(ALICE, ALICE_POSITION, 1'001);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), TransferError::InsufficientBalance);
    EXPECT_EQ(error_kind(res.error()), ErrorKind::Transfer);

    EXPECT_EQ(snapshot(), before);
    EXPECT_EQ(pool_record().total_staked.native(), 0);
    EXPECT_EQ(stake_balance(ALICE), 1'000);
}

TEST_F(StakePool, deposit_revert_foreign_position)
{
    ASSERT_FALSE(initialize().has_error());
    ASSERT_FALSE(deposit(ALICE, ALICE_POSITION, 100).has_error());

    auto const res = deposit(BOB, ALICE_POSITION, 100);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::InvalidAccountData);
    EXPECT_EQ(position(ALICE_POSITION).staked_amount.native(), 100);
    EXPECT_EQ(stake_balance(BOB), 1'000);
}

TEST_F(StakePool, deposit_revert_position_is_pool)
{
    ASSERT_FALSE(initialize().has_error());
    auto const before = snapshot();

    auto const res = deposit(ALICE, POOL, 100);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::InvalidAccountData);
    EXPECT_EQ(snapshot(), before);
}

TEST_F(StakePool, position_key_is_per_program_and_participant)
{
    EXPECT_EQ(position_key(PROGRAM_ID, ALICE), ALICE_POSITION);
    EXPECT_NE(ALICE_POSITION, BOB_POSITION);
    EXPECT_NE(position_key(OTHER_PROGRAM, ALICE), ALICE_POSITION);
    EXPECT_NE(ALICE_POSITION, ALICE);
    EXPECT_EQ(contract.vars.position(ALICE).key(), ALICE_POSITION);
}

TEST_F(StakePool, revert_position_not_derived_from_signer)
{
    ASSERT_FALSE(initialize().has_error());
    ASSERT_FALSE(deposit(ALICE, ALICE_POSITION, 100).has_error());
    ASSERT_FALSE(start_epoch(100, 200, 100).has_error());
    auto const before = snapshot();

    auto res = deposit(ALICE, STRAY_POSITION, 100);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::InvalidAccountData);

    res = withdraw(ALICE, STRAY_POSITION, 0);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::InvalidAccountData);

    res = claim(ALICE, STRAY_POSITION);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::InvalidAccountData);

    // the participant's own identity is not its position account either
    res = claim(ALICE, ALICE);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::InvalidAccountData);

    EXPECT_EQ(snapshot(), before);
    EXPECT_FALSE(position(STRAY_POSITION).is_initialized());
    EXPECT_EQ(stake_balance(ALICE), 900);
    EXPECT_EQ(reward_balance(ALICE), 0);
}

TEST_F(StakePool, revert_position_bound_to_other_owner)
{
    ASSERT_FALSE(initialize().has_error());

    PositionRecord record{};
    record.initialized = 1;
    record.owner = BOB;
    record.staked_amount = 100;
    state.push();
    contract.vars.position(ALICE).store(record);
    state.pop_accept();

    auto const res = withdraw(ALICE, ALICE_POSITION, 100);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::Unauthorized);
    EXPECT_EQ(position(ALICE_POSITION).staked_amount.native(), 100);
    EXPECT_EQ(stake_balance(ALICE), 1'000);
}

TEST_F(StakePool, deposit_revert_position_owned_by_other_program)
{
    ASSERT_FALSE(initialize().has_error());
    store.create(ALICE_POSITION, OTHER_PROGRAM, sizeof(PositionRecord));

    auto const res = deposit(ALICE, ALICE_POSITION, 100);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::NotOwnedByProgram);
    EXPECT_EQ(store.load(ALICE_POSITION)->owner, OTHER_PROGRAM);
}

TEST_F(StakePool, deposit_revert_bad_payload)
{
    ASSERT_FALSE(initialize().has_error());

    auto input = encode_deposit(100);
    input.resize(5);
    auto res = execute(
        input, {{ALICE, true}, {CUSTODY, false}, {ALICE_POSITION, false}});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DecodeError::InputTooShort);

    input = encode_deposit(100);
    input.push_back(0);
    res = execute(
        input, {{ALICE, true}, {CUSTODY, false}, {ALICE_POSITION, false}});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DecodeError::InputTooLong);

    res = execute(encode_deposit(100), {{ALICE, true}, {CUSTODY, false}});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DecodeError::MissingAccounts);

    EXPECT_EQ(stake_balance(ALICE), 1'000);
}

TEST_F(StakePool, deposit_revert_total_overflow)
{
    ASSERT_FALSE(initialize().has_error());
    assets.set_balance(STAKE_ASSET, ALICE, U64_MAX);
    ASSERT_FALSE(deposit(ALICE, ALICE_POSITION, U64_MAX).has_error());

    auto const res = deposit(BOB, BOB_POSITION, 1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MathError::Overflow);
    EXPECT_EQ(error_kind(res.error()), ErrorKind::Arithmetic);
    EXPECT_EQ(pool_record().total_staked.native(), U64_MAX);
    EXPECT_FALSE(position(BOB_POSITION).is_initialized());
    EXPECT_EQ(stake_balance(BOB), 1'000);
}

///////////////
// withdraw //
///////////////

TEST_F(StakePool, deposit_then_withdraw_restores_balances)
{
    ASSERT_FALSE(initialize().has_error());
    ASSERT_FALSE(deposit(ALICE, ALICE_POSITION, 400).has_error());
    ASSERT_FALSE(withdraw(ALICE, ALICE_POSITION, 400).has_error());

    auto const pos = position(ALICE_POSITION);
    EXPECT_TRUE(pos.is_initialized());
    EXPECT_EQ(pos.owner, ALICE);
    EXPECT_EQ(pos.staked_amount.native(), 0);
    EXPECT_EQ(pool_record().total_staked.native(), 0);
    EXPECT_EQ(stake_balance(ALICE), 1'000);
    EXPECT_EQ(stake_balance(CUSTODY), 0);
}

TEST_F(StakePool, withdraw_partial)
{
    ASSERT_FALSE(initialize().has_error());
    ASSERT_FALSE(deposit(ALICE, ALICE_POSITION, 400).has_error());
    ASSERT_FALSE(deposit(BOB, BOB_POSITION, 100).has_error());
    ASSERT_FALSE(withdraw(ALICE, ALICE_POSITION, 150).has_error());

    EXPECT_EQ(position(ALICE_POSITION).staked_amount.native(), 250);
    EXPECT_EQ(position(BOB_POSITION).staked_amount.native(), 100);
    EXPECT_EQ(pool_record().total_staked.native(), 350);
    EXPECT_EQ(stake_balance(ALICE), 750);
    EXPECT_EQ(stake_balance(CUSTODY), 350);
}

TEST_F(StakePool, withdraw_revert_insufficient_funds)
{
    ASSERT_FALSE(initialize().has_error());
    ASSERT_FALSE(deposit(ALICE, ALICE_POSITION, 100).has_error());
    auto const before = snapshot();

    auto const res = withdraw(ALICE, ALICE_POSITION, 101);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::InsufficientFunds);
    EXPECT_EQ(error_kind(res.error()), ErrorKind::InsufficientFunds);

    EXPECT_EQ(snapshot(), before);
    EXPECT_EQ(stake_balance(ALICE), 900);
    EXPECT_EQ(stake_balance(CUSTODY), 100);
}

TEST_F(StakePool, withdraw_revert_uninitialized_position)
{
    ASSERT_FALSE(initialize().has_error());

    auto const res = withdraw(ALICE, ALICE_POSITION, 0);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::Uninitialized);
    EXPECT_FALSE(position(ALICE_POSITION).is_initialized());
}

TEST_F(StakePool, withdraw_revert_foreign_position)
{
    ASSERT_FALSE(initialize().has_error());
    ASSERT_FALSE(deposit(ALICE, ALICE_POSITION, 100).has_error());

    auto const res = withdraw(BOB, ALICE_POSITION, 100);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::InvalidAccountData);
    EXPECT_EQ(position(ALICE_POSITION).staked_amount.native(), 100);
    EXPECT_EQ(stake_balance(BOB), 1'000);
}

TEST_F(StakePool, withdraw_revert_not_signed)
{
    ASSERT_FALSE(initialize().has_error());
    ASSERT_FALSE(deposit(ALICE, ALICE_POSITION, 100).has_error());

    auto const res = withdraw(ALICE, ALICE_POSITION, 100, false);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::MissingSignature);
    EXPECT_EQ(position(ALICE_POSITION).staked_amount.native(), 100);
}

TEST_F(StakePool, withdraw_revert_custody_drained)
{
    ASSERT_FALSE(initialize().has_error());
    ASSERT_FALSE(deposit(ALICE, ALICE_POSITION, 100).has_error());
    assets.set_balance(STAKE_ASSET, CUSTODY, 10);
    auto const before = snapshot();

    auto const res = withdraw(ALICE, ALICE_POSITION, 50);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), TransferError::InsufficientBalance);
    EXPECT_EQ(snapshot(), before);
    EXPECT_EQ(position(ALICE_POSITION).staked_amount.native(), 100);
}

TEST_F(StakePool, withdraw_revert_total_underflow)
{
    ASSERT_FALSE(initialize().has_error());
    ASSERT_FALSE(deposit(ALICE, ALICE_POSITION, 100).has_error());

    auto record = pool_record();
    record.total_staked = 10;
    poke_pool(record);

    auto const res = withdraw(ALICE, ALICE_POSITION, 50);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MathError::Underflow);
    EXPECT_EQ(position(ALICE_POSITION).staked_amount.native(), 100);
    EXPECT_EQ(stake_balance(ALICE), 900);
}

TEST_F(StakePool, total_tracks_sum_of_positions)
{
    ASSERT_FALSE(initialize().has_error());

    struct Step
    {
        bool is_deposit;
        bool alice;
        uint64_t amount;
    };

    Step const steps[] = {
        {true, true, 300},
        {true, false, 120},
        {false, true, 100},
        {true, true, 5},
        {false, false, 120},
        {false, true, 500},
        {true, false, 999},
        {false, true, 205},
    };
    for (auto const &step : steps) {
        auto const &user = step.alice ? ALICE : BOB;
        auto const &pos = step.alice ? ALICE_POSITION : BOB_POSITION;
        (void)(step.is_deposit ? deposit(user, pos, step.amount)
                               : withdraw(user, pos, step.amount));

        uint64_t const alice = position(ALICE_POSITION).staked_amount.native();
        uint64_t const bob = position(BOB_POSITION).staked_amount.native();
        EXPECT_EQ(pool_record().total_staked.native(), alice + bob);
        EXPECT_EQ(stake_balance(CUSTODY), alice + bob);
    }
}

//////////////////
// start_epoch //
//////////////////

TEST_F(StakePool, start_epoch)
{
    ASSERT_FALSE(initialize().has_error());
    ASSERT_FALSE(start_epoch(100, 200, 1'000).has_error());

    auto record = pool_record();
    EXPECT_EQ(record.epoch_id.native(), 1);
    EXPECT_EQ(record.epoch_start.native(), 100);
    EXPECT_EQ(record.epoch_end.native(), 200);
    EXPECT_EQ(record.epoch_reward.native(), 1'000);

    ASSERT_FALSE(start_epoch(201, 300, 7).has_error());
    record = pool_record();
    EXPECT_EQ(record.epoch_id.native(), 2);
    EXPECT_EQ(record.epoch_start.native(), 201);
    EXPECT_EQ(record.epoch_end.native(), 300);
    EXPECT_EQ(record.epoch_reward.native(), 7);
}

TEST_F(StakePool, start_epoch_revert_overlapping)
{
    ASSERT_FALSE(initialize().has_error());
    ASSERT_FALSE(start_epoch(100, 200, 1'000).has_error());
    auto const before = snapshot();

    auto const res = start_epoch(200, 300, 1'000);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::InvalidArgument);
    EXPECT_EQ(error_kind(res.error()), ErrorKind::Validation);
    EXPECT_EQ(snapshot(), before);
    EXPECT_EQ(pool_record().epoch_id.native(), 1);
}

TEST_F(StakePool, start_epoch_revert_start_zero)
{
    ASSERT_FALSE(initialize().has_error());

    auto const res = start_epoch(0, 10, 1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::InvalidArgument);
}

TEST_F(StakePool, start_epoch_revert_empty_range)
{
    ASSERT_FALSE(initialize().has_error());

    auto res = start_epoch(100, 100, 1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::InvalidArgument);

    res = start_epoch(100, 50, 1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::InvalidArgument);

    EXPECT_EQ(pool_record().epoch_id.native(), 0);
}

TEST_F(StakePool, start_epoch_revert_not_owner)
{
    ASSERT_FALSE(initialize().has_error());

    auto const res = start_epoch(100, 200, 1'000, ALICE);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::Unauthorized);
    EXPECT_EQ(error_kind(res.error()), ErrorKind::Authorization);
    EXPECT_EQ(pool_record().epoch_id.native(), 0);
}

TEST_F(StakePool, start_epoch_revert_not_signed)
{
    ASSERT_FALSE(initialize().has_error());

    auto const res = start_epoch(100, 200, 1'000, OWNER, false);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::MissingSignature);
}

TEST_F(StakePool, start_epoch_revert_bad_payload)
{
    ASSERT_FALSE(initialize().has_error());

    auto input = encode_start_epoch(100, 200, 1'000);
    input.pop_back();
    auto const res = execute(input, {{OWNER, true}});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DecodeError::InputTooShort);
}

TEST_F(StakePool, start_epoch_revert_epoch_id_overflow)
{
    ASSERT_FALSE(initialize().has_error());

    auto record = pool_record();
    record.epoch_id = std::numeric_limits<uint16_t>::max();
    poke_pool(record);

    auto const res = start_epoch(100, 200, 1'000);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MathError::Overflow);
    EXPECT_EQ(pool_record().epoch_end.native(), 0);
}

////////////
// claim //
////////////

TEST_F(StakePool, claim_pays_share)
{
    ASSERT_FALSE(initialize().has_error());
    ASSERT_FALSE(deposit(ALICE, ALICE_POSITION, 250).has_error());
    ASSERT_FALSE(deposit(BOB, BOB_POSITION, 750).has_error());
    ASSERT_FALSE(start_epoch(100, 200, 100).has_error());

    ASSERT_FALSE(claim(ALICE, ALICE_POSITION).has_error());
    ASSERT_FALSE(claim(BOB, BOB_POSITION).has_error());

    EXPECT_EQ(reward_balance(ALICE), 25);
    EXPECT_EQ(reward_balance(BOB), 75);
    EXPECT_EQ(reward_balance(REWARD_CUSTODY), 1'000'000 - 100);

    // claiming never moves stake
    EXPECT_EQ(position(ALICE_POSITION).staked_amount.native(), 250);
    EXPECT_EQ(position(BOB_POSITION).staked_amount.native(), 750);
    EXPECT_EQ(pool_record().total_staked.native(), 1'000);
    EXPECT_EQ(position(ALICE_POSITION).last_claimed_epoch.native(), 1);
}

TEST_F(StakePool, claim_rounds_down)
{
    ASSERT_FALSE(initialize().has_error());
    ASSERT_FALSE(deposit(ALICE, ALICE_POSITION, 333).has_error());
    ASSERT_FALSE(deposit(BOB, BOB_POSITION, 667).has_error());
    ASSERT_FALSE(start_epoch(100, 200, 100).has_error());

    ASSERT_FALSE(claim(ALICE, ALICE_POSITION).has_error());
    ASSERT_FALSE(claim(BOB, BOB_POSITION).has_error());

    EXPECT_EQ(reward_balance(ALICE), 33);
    EXPECT_EQ(reward_balance(BOB), 66);
}

TEST_F(StakePool, claim_revert_already_claimed)
{
    ASSERT_FALSE(initialize().has_error());
    ASSERT_FALSE(deposit(ALICE, ALICE_POSITION, 100).has_error());
    ASSERT_FALSE(start_epoch(100, 200, 100).has_error());
    ASSERT_FALSE(claim(ALICE, ALICE_POSITION).has_error());
    auto const before = snapshot();

    auto const res = claim(ALICE, ALICE_POSITION);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::AlreadyClaimed);
    EXPECT_EQ(error_kind(res.error()), ErrorKind::State);
    EXPECT_EQ(snapshot(), before);
    EXPECT_EQ(reward_balance(ALICE), 100);

    // a new epoch opens a new claim
    ASSERT_FALSE(start_epoch(300, 400, 40).has_error());
    ASSERT_FALSE(claim(ALICE, ALICE_POSITION).has_error());
    EXPECT_EQ(reward_balance(ALICE), 140);
    EXPECT_EQ(position(ALICE_POSITION).last_claimed_epoch.native(), 2);
}

TEST_F(StakePool, claim_revert_already_claimed_after_restake)
{
    ASSERT_FALSE(initialize().has_error());
    ASSERT_FALSE(deposit(ALICE, ALICE_POSITION, 500).has_error());
    ASSERT_FALSE(deposit(BOB, BOB_POSITION, 500).has_error());
    ASSERT_FALSE(start_epoch(100, 200, 100).has_error());
    ASSERT_FALSE(claim(ALICE, ALICE_POSITION).has_error());
    EXPECT_EQ(reward_balance(ALICE), 50);

    ASSERT_FALSE(withdraw(ALICE, ALICE_POSITION, 500).has_error());

    // a second position account for the same participant is refused
    auto res = deposit(ALICE, STRAY_POSITION, 500);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::InvalidAccountData);

    // restaking lands in the same position, which keeps its claim marker
    ASSERT_FALSE(deposit(ALICE, ALICE_POSITION, 500).has_error());
    EXPECT_EQ(position(ALICE_POSITION).last_claimed_epoch.native(), 1);

    res = claim(ALICE, ALICE_POSITION);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::AlreadyClaimed);

    ASSERT_FALSE(claim(BOB, BOB_POSITION).has_error());
    EXPECT_EQ(reward_balance(ALICE), 50);
    EXPECT_EQ(reward_balance(BOB), 50);
    EXPECT_EQ(reward_balance(REWARD_CUSTODY), 1'000'000 - 100);
}

TEST_F(StakePool, claim_before_first_epoch)
{
    ASSERT_FALSE(initialize().has_error());
    ASSERT_FALSE(deposit(ALICE, ALICE_POSITION, 100).has_error());

    ASSERT_FALSE(claim(ALICE, ALICE_POSITION).has_error());
    ASSERT_FALSE(claim(ALICE, ALICE_POSITION).has_error());
    EXPECT_EQ(reward_balance(ALICE), 0);
    EXPECT_EQ(reward_balance(REWARD_CUSTODY), 1'000'000);
}

TEST_F(StakePool, claim_after_full_withdraw)
{
    ASSERT_FALSE(initialize().has_error());
    ASSERT_FALSE(deposit(ALICE, ALICE_POSITION, 100).has_error());
    ASSERT_FALSE(start_epoch(100, 200, 100).has_error());
    ASSERT_FALSE(withdraw(ALICE, ALICE_POSITION, 100).has_error());

    ASSERT_FALSE(claim(ALICE, ALICE_POSITION).has_error());
    EXPECT_EQ(reward_balance(ALICE), 0);
}

TEST_F(StakePool, claim_revert_uninitialized_position)
{
    ASSERT_FALSE(initialize().has_error());
    ASSERT_FALSE(start_epoch(100, 200, 100).has_error());

    auto const res = claim(ALICE, ALICE_POSITION);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::Uninitialized);
}

TEST_F(StakePool, claim_revert_foreign_position)
{
    ASSERT_FALSE(initialize().has_error());
    ASSERT_FALSE(deposit(ALICE, ALICE_POSITION, 100).has_error());
    ASSERT_FALSE(start_epoch(100, 200, 100).has_error());

    auto const res = claim(BOB, ALICE_POSITION);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::InvalidAccountData);
    EXPECT_EQ(reward_balance(BOB), 0);
}

TEST_F(StakePool, claim_revert_not_signed)
{
    ASSERT_FALSE(initialize().has_error());
    ASSERT_FALSE(deposit(ALICE, ALICE_POSITION, 100).has_error());
    ASSERT_FALSE(start_epoch(100, 200, 100).has_error());

    auto const res = claim(ALICE, ALICE_POSITION, false);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::MissingSignature);
    EXPECT_EQ(reward_balance(ALICE), 0);
}

TEST_F(StakePool, claim_revert_reward_custody_empty)
{
    ASSERT_FALSE(initialize().has_error());
    ASSERT_FALSE(deposit(ALICE, ALICE_POSITION, 100).has_error());
    ASSERT_FALSE(start_epoch(100, 200, 100).has_error());
    assets.set_balance(REWARD_ASSET, REWARD_CUSTODY, 0);

    auto res = claim(ALICE, ALICE_POSITION);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), TransferError::InsufficientBalance);
    EXPECT_EQ(position(ALICE_POSITION).last_claimed_epoch.native(), 0);

    // still claimable once the custody is refunded
    assets.set_balance(REWARD_ASSET, REWARD_CUSTODY, 100);
    res = claim(ALICE, ALICE_POSITION);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(reward_balance(ALICE), 100);
}

TEST_F(StakePool, claim_revert_trailing_input)
{
    ASSERT_FALSE(initialize().has_error());
    ASSERT_FALSE(deposit(ALICE, ALICE_POSITION, 100).has_error());

    auto input = encode_claim();
    input.push_back(1);
    auto const res = execute(
        input,
        {{ALICE, true}, {REWARD_CUSTODY, false}, {ALICE_POSITION, false}});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DecodeError::InputTooLong);
}

/////////////////
// error kind //
/////////////////

TEST(ErrorKind, classification)
{
    EXPECT_EQ(kind_of(LedgerError::MissingSignature), ErrorKind::Authorization);
    EXPECT_EQ(kind_of(LedgerError::Unauthorized), ErrorKind::Authorization);
    EXPECT_EQ(kind_of(LedgerError::NotOwnedByProgram), ErrorKind::State);
    EXPECT_EQ(kind_of(LedgerError::Uninitialized), ErrorKind::State);
    EXPECT_EQ(kind_of(LedgerError::AlreadyInitialized), ErrorKind::State);
    EXPECT_EQ(kind_of(LedgerError::InvalidAccountData), ErrorKind::State);
    EXPECT_EQ(kind_of(LedgerError::AlreadyClaimed), ErrorKind::State);
    EXPECT_EQ(kind_of(LedgerError::InvalidArgument), ErrorKind::Validation);
    EXPECT_EQ(
        kind_of(LedgerError::InsufficientFunds), ErrorKind::InsufficientFunds);
    EXPECT_EQ(kind_of(MathError::Overflow), ErrorKind::Arithmetic);
    EXPECT_EQ(kind_of(MathError::DivisionByZero), ErrorKind::Arithmetic);
    EXPECT_EQ(kind_of(DecodeError::InputTooShort), ErrorKind::Decode);
    EXPECT_EQ(kind_of(DecodeError::MissingAccounts), ErrorKind::Decode);
    EXPECT_EQ(
        kind_of(TransferError::InsufficientBalance), ErrorKind::Transfer);

    EXPECT_EQ(error_kind_name(ErrorKind::Authorization), "AuthorizationError");
    EXPECT_EQ(error_kind_name(ErrorKind::Arithmetic), "ArithmeticError");
}
