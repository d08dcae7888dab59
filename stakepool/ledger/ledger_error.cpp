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

#include <stakepool/ledger/ledger_error.hpp>

#include <boost/outcome/experimental/status-code/config.hpp>
#include <boost/outcome/experimental/status-code/generic_code.hpp>
#include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<stakepool::ledger::LedgerError>::mapping> const &
quick_status_code_from_enum<stakepool::ledger::LedgerError>::value_mappings()
{
    using stakepool::ledger::LedgerError;

    static std::initializer_list<mapping> const v = {
        {LedgerError::Success, "success", {errc::success}},
        {LedgerError::MissingSignature, "missing required signature", {}},
        {LedgerError::Unauthorized, "signer is not the record owner", {}},
        {LedgerError::NotOwnedByProgram,
         "account not owned by this program",
         {}},
        {LedgerError::Uninitialized, "account is not initialized", {}},
        {LedgerError::AlreadyInitialized, "pool is already initialized", {}},
        {LedgerError::InvalidAccountData, "invalid account data", {}},
        {LedgerError::AlreadyClaimed, "reward already claimed for epoch", {}},
        {LedgerError::InvalidArgument, "invalid argument", {}},
        {LedgerError::InsufficientFunds, "insufficient staked tokens", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
