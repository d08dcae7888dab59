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

#include <stakepool/core/bytes.hpp>
#include <stakepool/ledger/account_store.hpp>
#include <stakepool/ledger/config.hpp>

#include <ankerl/unordered_dense.h>

#include <optional>
#include <vector>

STAKEPOOL_LEDGER_NAMESPACE_BEGIN

// Journaled view of an AccountStore. Writes land in the innermost version
// opened by push(); pop_accept() folds it into the enclosing version, or into
// the store when it is the outermost one, and pop_reject() discards it.
// Nothing reaches the store until the outermost version is accepted.
class AccountState
{
    template <typename K, typename V>
    using Map = ankerl::unordered_dense::map<K, V>;

    AccountStore &store_;

    std::vector<Map<bytes32_t, StoredAccount>> versions_{};

public:
    explicit AccountState(AccountStore &);

    AccountState(AccountState &&) = delete;
    AccountState(AccountState const &) = delete;
    AccountState &operator=(AccountState &&) = delete;
    AccountState &operator=(AccountState const &) = delete;

    std::optional<StoredAccount> get(bytes32_t const &) const;

    void set(bytes32_t const &, StoredAccount);

    unsigned version() const noexcept
    {
        return static_cast<unsigned>(versions_.size());
    }

    void push();

    void pop_accept();

    void pop_reject();
};

STAKEPOOL_LEDGER_NAMESPACE_END
