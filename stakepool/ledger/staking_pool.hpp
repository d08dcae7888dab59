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
#include <stakepool/core/result.hpp>
#include <stakepool/ledger/account_state.hpp>
#include <stakepool/ledger/account_store.hpp>
#include <stakepool/ledger/account_variable.hpp>
#include <stakepool/ledger/config.hpp>
#include <stakepool/ledger/instruction.hpp>
#include <stakepool/ledger/pool_record.hpp>
#include <stakepool/ledger/position_record.hpp>
#include <stakepool/ledger/transfer.hpp>

#include <span>
#include <utility>

STAKEPOOL_LEDGER_NAMESPACE_BEGIN

struct PoolConfig
{
    // Owner tag that every account this program writes must carry.
    bytes32_t program_id;

    // Account holding the PoolRecord. Read and written by every transition
    // in addition to the accounts the instruction names.
    bytes32_t pool_account;
};

// Key of the account holding `participant`'s position:
// blake3(program_id || participant || "position").
bytes32_t
position_key(bytes32_t const &program_id, bytes32_t const &participant);

class StakingPool
{
    PoolConfig const config_;
    AccountState &state_;
    AssetTransfer &transfer_;

public:
    StakingPool(PoolConfig const &, AccountState &, AssetTransfer &);

    using Accounts = std::span<AccountMeta const>;

    /////////////////////////
    // Account Variables  //
    /////////////////////////
    class Variables
    {
        AccountState &state_;
        PoolConfig const &config_;

    public:
        Variables(AccountState &state, PoolConfig const &config)
            : state_{state}
            , config_{config}
        {
        }

        AccountVariable<PoolRecord> pool() noexcept
        {
            return {state_, config_.pool_account, config_.program_id};
        }

        // mapping (participant => PositionRecord)
        AccountVariable<PositionRecord>
        position(bytes32_t const &participant) noexcept
        {
            return {
                state_,
                position_key(config_.program_id, participant),
                config_.program_id};
        }
    } vars;

    PoolConfig const &config() const noexcept
    {
        return config_;
    }

    using HandlerFunc = Result<void> (StakingPool::*)(
        byte_string_view, Accounts, PoolRecord &);

    // Consumes the opcode byte of `input` and resolves its handler.
    static Result<std::pair<Opcode, HandlerFunc>>
    dispatch(byte_string_view &input);

    // Runs one instruction to completion. The pool record and any position
    // the handler touched are written only if every step succeeded; on error
    // the store is left exactly as it was.
    Result<void> execute(byte_string_view instruction, Accounts);

    //////////////////
    // Transitions  //
    //////////////////

    // accounts: [owner]
    Result<void> initialize(byte_string_view, Accounts, PoolRecord &);

    // accounts: [participant, pool custody, position]
    Result<void> deposit(byte_string_view, Accounts, PoolRecord &);

    // accounts: [participant, pool custody, position]
    Result<void> withdraw(byte_string_view, Accounts, PoolRecord &);

    // accounts: [owner]
    Result<void> start_epoch(byte_string_view, Accounts, PoolRecord &);

    // accounts: [participant, reward custody, position]
    Result<void> claim(byte_string_view, Accounts, PoolRecord &);

private:
    // Loads `participant`'s position. The instruction must name the derived
    // position account and an initialized record must be bound to
    // `participant`. Uninitialized positions are returned as is.
    Result<PositionRecord> load_position(
        AccountVariable<PositionRecord> const &, AccountMeta const &named,
        AccountMeta const &participant);
};

STAKEPOOL_LEDGER_NAMESPACE_END
