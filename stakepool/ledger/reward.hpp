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

#include <cstdint>

STAKEPOOL_LEDGER_NAMESPACE_BEGIN

// A participant's share of an epoch's reward:
//
//     floor(user_staked * epoch_reward / total_staked)
//
// with the product taken in 128 bits. An empty pool pays nothing. The
// remainder of the division is not tracked or redistributed.
Result<uint64_t> calculate_reward(
    uint64_t user_staked, uint64_t epoch_reward, uint64_t total_staked);

STAKEPOOL_LEDGER_NAMESPACE_END
