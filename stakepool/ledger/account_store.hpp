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
#include <stakepool/ledger/config.hpp>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <optional>

STAKEPOOL_LEDGER_NAMESPACE_BEGIN

// An account as handed to a transition by the host. The host has already
// verified signatures; `is_signer` is its verdict.
struct AccountMeta
{
    bytes32_t key;
    bool is_signer;
};

// Persisted form of an account: the program that owns it and its raw data.
struct StoredAccount
{
    bytes32_t owner;
    byte_string data;

    bool operator==(StoredAccount const &) const = default;
};

// Storage medium for account byte buffers. Implementations are expected to
// persist each store() whole.
class AccountStore
{
public:
    virtual ~AccountStore() = default;

    virtual std::optional<StoredAccount> load(bytes32_t const &) const = 0;

    virtual void store(bytes32_t const &, StoredAccount const &) = 0;
};

class InMemoryAccountStore final : public AccountStore
{
    ankerl::unordered_dense::map<bytes32_t, StoredAccount> accounts_{};

public:
    std::optional<StoredAccount> load(bytes32_t const &) const override;

    void store(bytes32_t const &, StoredAccount const &) override;

    // Allocates a zero filled account of `size` bytes owned by `owner`, the
    // way a host funds and assigns an account before the first call.
    void create(bytes32_t const &key, bytes32_t const &owner, size_t size);

    size_t size() const noexcept
    {
        return accounts_.size();
    }

    auto begin() const
    {
        return accounts_.begin();
    }

    auto end() const
    {
        return accounts_.end();
    }
};

STAKEPOOL_LEDGER_NAMESPACE_END
