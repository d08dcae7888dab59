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

#include <stakepool/ledger/account_store.hpp>

#include <optional>

STAKEPOOL_LEDGER_NAMESPACE_BEGIN

std::optional<StoredAccount>
InMemoryAccountStore::load(bytes32_t const &key) const
{
    auto const it = accounts_.find(key);
    if (it == accounts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryAccountStore::store(
    bytes32_t const &key, StoredAccount const &account)
{
    accounts_.insert_or_assign(key, account);
}

void InMemoryAccountStore::create(
    bytes32_t const &key, bytes32_t const &owner, size_t const size)
{
    accounts_.insert_or_assign(
        key, StoredAccount{.owner = owner, .data = byte_string(size, 0)});
}

STAKEPOOL_LEDGER_NAMESPACE_END
