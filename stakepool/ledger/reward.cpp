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
#include <stakepool/ledger/reward.hpp>

STAKEPOOL_LEDGER_NAMESPACE_BEGIN

Result<uint64_t> calculate_reward(
    uint64_t const user_staked, uint64_t const epoch_reward,
    uint64_t const total_staked)
{
    if (total_staked == 0) {
        return uint64_t{0};
    }
    return checked_mul_div(user_staked, epoch_reward, total_staked);
}

STAKEPOOL_LEDGER_NAMESPACE_END
