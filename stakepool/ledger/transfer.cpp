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

#include <stakepool/core/likely.h>
#include <stakepool/ledger/transfer.hpp>

#include <boost/outcome/experimental/status-code/config.hpp>
#include <boost/outcome/experimental/status-code/generic_code.hpp>
#include <boost/outcome/success_failure.hpp>

STAKEPOOL_LEDGER_NAMESPACE_BEGIN

Result<void> InMemoryAssetLedger::transfer(
    bytes32_t const &asset, bytes32_t const &from, bytes32_t const &to,
    uint64_t const amount)
{
    uint64_t const from_balance = balance(asset, from);
    if (STAKEPOOL_UNLIKELY(from_balance < amount)) {
        return TransferError::InsufficientBalance;
    }
    if (from == to) {
        return outcome::success();
    }
    uint64_t to_balance;
    if (STAKEPOOL_UNLIKELY(
            __builtin_add_overflow(balance(asset, to), amount, &to_balance))) {
        return TransferError::BalanceOverflow;
    }
    balances_[{.asset = asset, .holder = from}] = from_balance - amount;
    balances_[{.asset = asset, .holder = to}] = to_balance;
    return outcome::success();
}

uint64_t InMemoryAssetLedger::balance(
    bytes32_t const &asset, bytes32_t const &holder) const
{
    auto const it = balances_.find({.asset = asset, .holder = holder});
    return it == balances_.end() ? 0 : it->second;
}

void InMemoryAssetLedger::set_balance(
    bytes32_t const &asset, bytes32_t const &holder, uint64_t const amount)
{
    balances_[{.asset = asset, .holder = holder}] = amount;
}

STAKEPOOL_LEDGER_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<stakepool::ledger::TransferError>::mapping> const &
quick_status_code_from_enum<stakepool::ledger::TransferError>::value_mappings()
{
    using stakepool::ledger::TransferError;

    static std::initializer_list<mapping> const v = {
        {TransferError::Success, "success", {errc::success}},
        {TransferError::InsufficientBalance, "insufficient balance", {}},
        {TransferError::BalanceOverflow, "balance overflow", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
