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

#include <stakepool/core/assert.h>
#include <stakepool/ledger/account_state.hpp>

#include <utility>

STAKEPOOL_LEDGER_NAMESPACE_BEGIN

AccountState::AccountState(AccountStore &store)
    : store_{store}
{
}

std::optional<StoredAccount>
AccountState::get(bytes32_t const &key) const
{
    for (auto it = versions_.rbegin(); it != versions_.rend(); ++it) {
        auto const found = it->find(key);
        if (found != it->end()) {
            return found->second;
        }
    }
    return store_.load(key);
}

void AccountState::set(bytes32_t const &key, StoredAccount account)
{
    STAKEPOOL_ASSERT(!versions_.empty(), "write outside of a version");

    versions_.back().insert_or_assign(key, std::move(account));
}

void AccountState::push()
{
    versions_.emplace_back();
}

void AccountState::pop_accept()
{
    STAKEPOOL_ASSERT(!versions_.empty());

    auto top = std::move(versions_.back());
    versions_.pop_back();

    if (versions_.empty()) {
        for (auto const &[key, account] : top) {
            store_.store(key, account);
        }
        return;
    }

    auto &below = versions_.back();
    for (auto &[key, account] : top) {
        below.insert_or_assign(key, std::move(account));
    }
}

void AccountState::pop_reject()
{
    STAKEPOOL_ASSERT(!versions_.empty());

    versions_.pop_back();
}

STAKEPOOL_LEDGER_NAMESPACE_END
