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

#include <stakepool/core/checked_math.hpp>
#include <stakepool/ledger/decode_error.hpp>
#include <stakepool/ledger/error_kind.hpp>
#include <stakepool/ledger/ledger_error.hpp>
#include <stakepool/ledger/transfer.hpp>

#include <initializer_list>

STAKEPOOL_LEDGER_ANONYMOUS_NAMESPACE_BEGIN

template <typename E>
bool matches_any(ErrorCode const &code, std::initializer_list<E> const errors)
{
    for (auto const e : errors) {
        if (code == e) {
            return true;
        }
    }
    return false;
}

STAKEPOOL_LEDGER_ANONYMOUS_NAMESPACE_END

STAKEPOOL_LEDGER_NAMESPACE_BEGIN

ErrorKind error_kind(ErrorCode const &code)
{
    if (matches_any(
            code, {LedgerError::MissingSignature, LedgerError::Unauthorized})) {
        return ErrorKind::Authorization;
    }
    if (matches_any(
            code,
            {LedgerError::NotOwnedByProgram,
             LedgerError::Uninitialized,
             LedgerError::AlreadyInitialized,
             LedgerError::InvalidAccountData,
             LedgerError::AlreadyClaimed})) {
        return ErrorKind::State;
    }
    if (code == LedgerError::InvalidArgument) {
        return ErrorKind::Validation;
    }
    if (code == LedgerError::InsufficientFunds) {
        return ErrorKind::InsufficientFunds;
    }
    if (matches_any(
            code,
            {MathError::Overflow,
             MathError::Underflow,
             MathError::DivisionByZero})) {
        return ErrorKind::Arithmetic;
    }
    if (matches_any(
            code,
            {DecodeError::InvalidOperation,
             DecodeError::InputTooShort,
             DecodeError::InputTooLong,
             DecodeError::MissingAccounts})) {
        return ErrorKind::Decode;
    }
    if (matches_any(
            code,
            {TransferError::InsufficientBalance,
             TransferError::BalanceOverflow})) {
        return ErrorKind::Transfer;
    }
    return ErrorKind::Unknown;
}

std::string_view error_kind_name(ErrorKind const kind)
{
    switch (kind) {
    case ErrorKind::Authorization:
        return "AuthorizationError";
    case ErrorKind::State:
        return "StateError";
    case ErrorKind::Validation:
        return "ValidationError";
    case ErrorKind::InsufficientFunds:
        return "InsufficientFundsError";
    case ErrorKind::Arithmetic:
        return "ArithmeticError";
    case ErrorKind::Decode:
        return "DecodeError";
    case ErrorKind::Transfer:
        return "TransferError";
    case ErrorKind::Unknown:
        break;
    }
    return "UnknownError";
}

STAKEPOOL_LEDGER_NAMESPACE_END
