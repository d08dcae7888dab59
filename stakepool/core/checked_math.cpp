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

#include <boost/outcome/config.hpp>
#include <boost/outcome/experimental/status-code/config.hpp>
#include <boost/outcome/experimental/status-code/generic_code.hpp>

#include <limits>

STAKEPOOL_NAMESPACE_BEGIN

Result<uint64_t> checked_add(uint64_t const x, uint64_t const y)
{
    uint64_t res;
    if (STAKEPOOL_UNLIKELY(__builtin_add_overflow(x, y, &res))) {
        return MathError::Overflow;
    }
    return res;
}

Result<uint64_t> checked_sub(uint64_t const x, uint64_t const y)
{
    uint64_t res;
    if (STAKEPOOL_UNLIKELY(__builtin_sub_overflow(x, y, &res))) {
        return MathError::Underflow;
    }
    return res;
}

Result<uint16_t> checked_increment(uint16_t const x)
{
    if (STAKEPOOL_UNLIKELY(x == std::numeric_limits<uint16_t>::max())) {
        return MathError::Overflow;
    }
    return static_cast<uint16_t>(x + 1);
}

Result<uint64_t>
checked_mul_div(uint64_t const x, uint64_t const y, uint64_t const z)
{
    if (STAKEPOOL_UNLIKELY(z == 0)) {
        return MathError::DivisionByZero;
    }
    uint128_t const q = intx::umul(x, y) / uint128_t{z};
    uint128_t const max{std::numeric_limits<uint64_t>::max()};
    if (STAKEPOOL_UNLIKELY(q > max)) {
        return MathError::Overflow;
    }
    return static_cast<uint64_t>(q);
}

STAKEPOOL_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<stakepool::MathError>::mapping> const &
quick_status_code_from_enum<stakepool::MathError>::value_mappings()
{
    using stakepool::MathError;

    static std::initializer_list<mapping> const v = {
        {MathError::Success, "success", {errc::success}},
        {MathError::Overflow, "overflow", {}},
        {MathError::Underflow, "underflow", {}},
        {MathError::DivisionByZero, "division by zero", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
