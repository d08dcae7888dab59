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

#include <stakepool/core/result.hpp>
#include <stakepool/ledger/config.hpp>

#include <string_view>

STAKEPOOL_LEDGER_NAMESPACE_BEGIN

// Coarse classification of every error a transition can return, for hosts
// that surface failures to end users.
enum class ErrorKind
{
    Authorization,
    State,
    Validation,
    InsufficientFunds,
    Arithmetic,
    Decode,
    Transfer,
    Unknown,
};

ErrorKind error_kind(ErrorCode const &);

std::string_view error_kind_name(ErrorKind);

STAKEPOOL_LEDGER_NAMESPACE_END
