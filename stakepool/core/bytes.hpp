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

#include <stakepool/core/assert.h>
#include <stakepool/core/byte_string.hpp>

#include <evmc/evmc.hpp>

#include <algorithm>
#include <cstddef>
#include <functional>

STAKEPOOL_NAMESPACE_BEGIN

// Identities, asset ids and account keys are all opaque 32 byte values.
using bytes32_t = ::evmc::bytes32;

static_assert(sizeof(bytes32_t) == 32);
static_assert(alignof(bytes32_t) == 1);

inline bytes32_t to_bytes32(byte_string_view const data) noexcept
{
    STAKEPOOL_ASSERT(data.size() == sizeof(bytes32_t));

    bytes32_t byte;
    std::copy_n(data.begin(), sizeof(bytes32_t), byte.bytes);
    return byte;
}

STAKEPOOL_NAMESPACE_END
