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

#include <stakepool/ledger/config.hpp>

#include <boost/outcome/experimental/status-code/config.hpp>
#include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>

#include <initializer_list>

STAKEPOOL_LEDGER_NAMESPACE_BEGIN

enum class LedgerError
{
    Success = 0,
    MissingSignature,
    Unauthorized,
    NotOwnedByProgram,
    Uninitialized,
    AlreadyInitialized,
    InvalidAccountData,
    AlreadyClaimed,
    InvalidArgument,
    InsufficientFunds,
};

STAKEPOOL_LEDGER_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<stakepool::ledger::LedgerError>
    : quick_status_code_from_enum_defaults<stakepool::ledger::LedgerError>
{
    static constexpr auto const domain_name = "Ledger Error";
    static constexpr auto const domain_uuid =
        "8d3c21f6-52a4-4b0e-a1c9-6e07f5d2b84a";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
