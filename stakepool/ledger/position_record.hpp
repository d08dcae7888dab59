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

// A participant's stake. Created lazily by the first deposit.
struct PositionRecord
{
    uint8_t initialized;
    bytes32_t owner;
    u64_le staked_amount;

    // epoch_id of the last successful claim, zero if none. Records written
    // before this field existed are 41 bytes long and read it as zero.
    u16_le last_claimed_epoch;

    static constexpr size_t MIN_SIZE = 41;

    bool is_initialized() const noexcept
    {
        return initialized != 0;
    }
};

static_assert(sizeof(PositionRecord) == 43);
static_assert(alignof(PositionRecord) == 1);
static_assert(offsetof(PositionRecord, staked_amount) == 33);
static_assert(
    offsetof(PositionRecord, last_claimed_epoch) == PositionRecord::MIN_SIZE);

STAKEPOOL_LEDGER_NAMESPACE_END
