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

#include <stakepool/core/config.hpp>
#include <stakepool/core/int.hpp>
#include <stakepool/core/likely.h>
#include <stakepool/core/result.hpp>

#include <boost/outcome/experimental/status-code/config.hpp>
#include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>

#include <cstdint>
#include <initializer_list>

STAKEPOOL_NAMESPACE_BEGIN

enum class MathError
{
    Success = 0,
    Overflow,
    Underflow,
    DivisionByZero,
};

Result<uint64_t> checked_add(uint64_t x, uint64_t y);
Result<uint64_t> checked_sub(uint64_t x, uint64_t y);
Result<uint16_t> checked_increment(uint16_t x);

// floor(x * y / z) with the product taken in 128 bits. Fails if z is zero or
// the quotient does not fit back into 64 bits.
Result<uint64_t> checked_mul_div(uint64_t x, uint64_t y, uint64_t z);

STAKEPOOL_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<stakepool::MathError>
    : quick_status_code_from_enum_defaults<stakepool::MathError>
{
    static constexpr auto const domain_name = "Math Error";
    static constexpr auto const domain_uuid =
        "0f6b4e1d-7a52-4c1e-9d7e-3b8f2a61c5d4";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
