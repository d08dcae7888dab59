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
#include <stakepool/core/little_endian.hpp>
#include <stakepool/ledger/config.hpp>

#include <cstddef>
#include <cstdint>

STAKEPOOL_LEDGER_NAMESPACE_BEGIN

// Global pool configuration and epoch state, one per deployed pool.
struct PoolRecord
{
    uint8_t initialized;
    bytes32_t owner;
    bytes32_t stake_asset;
    bytes32_t reward_asset;

    // Sum of all outstanding position balances. Maintained incrementally by
    // deposit and withdraw, never recomputed from the positions.
    u64_le total_staked;

    u64_le epoch_reward;
    u64_le epoch_start;
    u64_le epoch_end;
    u16_le epoch_id;

    static constexpr size_t MIN_SIZE = 131;

    bool is_initialized() const noexcept
    {
        return initialized != 0;
    }
};

static_assert(sizeof(PoolRecord) == PoolRecord::MIN_SIZE);
static_assert(alignof(PoolRecord) == 1);
static_assert(offsetof(PoolRecord, total_staked) == 97);
static_assert(offsetof(PoolRecord, epoch_id) == 129);

STAKEPOOL_LEDGER_NAMESPACE_END
