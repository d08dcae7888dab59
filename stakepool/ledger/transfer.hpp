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
#include <stakepool/core/result.hpp>
#include <stakepool/ledger/config.hpp>

#include <ankerl/unordered_dense.h>

#include <boost/outcome/experimental/status-code/config.hpp>
#include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>

#include <cstddef>
#include <cstdint>
#include <initializer_list>

STAKEPOOL_LEDGER_NAMESPACE_BEGIN

enum class TransferError
{
    Success = 0,
    InsufficientBalance,
    BalanceOverflow,
};

// The value transfer mechanism. A failed transfer must have no effect.
class AssetTransfer
{
public:
    virtual ~AssetTransfer() = default;

    virtual Result<void> transfer(
        bytes32_t const &asset, bytes32_t const &from, bytes32_t const &to,
        uint64_t amount) = 0;
};

// Balance sheet keyed by (asset, holder) that refuses overdrafts. Used by the
// replay tool and by tests in place of a real token program.
class InMemoryAssetLedger final : public AssetTransfer
{
public:
    struct AssetHolder
    {
        bytes32_t asset;
        bytes32_t holder;

        bool operator==(AssetHolder const &) const = default;
    };

    static_assert(sizeof(AssetHolder) == 64);

    struct AssetHolderHash
    {
        using is_avalanching = void;

        size_t operator()(AssetHolder const &key) const noexcept
        {
            return size_t(ankerl::unordered_dense::detail::wyhash::hash(
                &key, sizeof(key)));
        }
    };

private:
    ankerl::unordered_dense::map<AssetHolder, uint64_t, AssetHolderHash>
        balances_{};

public:
    Result<void> transfer(
        bytes32_t const &asset, bytes32_t const &from, bytes32_t const &to,
        uint64_t amount) override;

    uint64_t balance(bytes32_t const &asset, bytes32_t const &holder) const;

    void set_balance(
        bytes32_t const &asset, bytes32_t const &holder, uint64_t amount);

    auto begin() const
    {
        return balances_.begin();
    }

    auto end() const
    {
        return balances_.end();
    }
};

STAKEPOOL_LEDGER_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<stakepool::ledger::TransferError>
    : quick_status_code_from_enum_defaults<stakepool::ledger::TransferError>
{
    static constexpr auto const domain_name = "Transfer Error";
    static constexpr auto const domain_uuid =
        "5b9e0c47-d1f3-4a86-b2e8-71c4a09f3d65";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
