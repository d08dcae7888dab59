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
#include <stakepool/core/likely.h>
#include <stakepool/core/result.hpp>
#include <stakepool/ledger/account_state.hpp>
#include <stakepool/ledger/account_store.hpp>
#include <stakepool/ledger/config.hpp>
#include <stakepool/ledger/ledger_error.hpp>

#include <algorithm>
#include <cstring>
#include <type_traits>

STAKEPOOL_LEDGER_NAMESPACE_BEGIN

// A fixed layout record stored as the data of a single program-owned account.
// The record's in-memory representation is its byte image, so loading and
// storing are plain copies. An account that does not exist yet reads as the
// zero record; this is how positions come into existence on first deposit.
template <typename T>
    requires std::has_unique_object_representations_v<T>
class AccountVariable
{
    AccountState &state_;
    bytes32_t const key_;
    bytes32_t const program_id_;

public:
    static constexpr size_t N = sizeof(T);

    static byte_string to_bytes(T const &t)
    {
        byte_string data(N, 0);
        std::memcpy(data.data(), &t, N);
        return data;
    }

    // Buffers between T::MIN_SIZE and N bytes are zero extended; longer ones
    // are truncated to the canonical layout.
    static Result<T> from_bytes(byte_string_view const data)
    {
        if (STAKEPOOL_UNLIKELY(data.size() < T::MIN_SIZE)) {
            return LedgerError::InvalidAccountData;
        }
        T t{};
        std::memcpy(&t, data.data(), std::min(N, data.size()));
        return t;
    }

    AccountVariable(
        AccountState &state, bytes32_t const &key, bytes32_t const &program_id)
        : state_{state}
        , key_{key}
        , program_id_{program_id}
    {
    }

    bytes32_t const &key() const noexcept
    {
        return key_;
    }

    Result<T> load() const
    {
        auto const account = state_.get(key_);
        if (!account.has_value()) {
            return T{};
        }
        if (STAKEPOOL_UNLIKELY(account->owner != program_id_)) {
            return LedgerError::NotOwnedByProgram;
        }
        return from_bytes(account->data);
    }

    void store(T const &value)
    {
        state_.set(
            key_, StoredAccount{.owner = program_id_, .data = to_bytes(value)});
    }
};

STAKEPOOL_LEDGER_NAMESPACE_END
