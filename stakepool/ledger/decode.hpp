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
#include <stakepool/core/likely.h>
#include <stakepool/core/little_endian.hpp>
#include <stakepool/core/result.hpp>
#include <stakepool/ledger/config.hpp>
#include <stakepool/ledger/decode_error.hpp>

#include <boost/outcome/success_failure.hpp>

#include <concepts>
#include <cstring>

STAKEPOOL_LEDGER_NAMESPACE_BEGIN

// Instruction payloads are a flat concatenation of fixed width fields with no
// padding: integers are little endian, identities are 32 raw bytes.
template <typename T>
    requires(LittleEndianType<T> || std::same_as<T, bytes32_t>)
Result<T> decode_fixed(byte_string_view &enc)
{
    if (STAKEPOOL_UNLIKELY(enc.size() < sizeof(T))) {
        return DecodeError::InputTooShort;
    }

    T output{};
    std::memcpy(&output, enc.data(), sizeof(T));
    enc.remove_prefix(sizeof(T));
    return output;
}

inline Result<void> decode_end(byte_string_view const enc)
{
    if (STAKEPOOL_UNLIKELY(!enc.empty())) {
        return DecodeError::InputTooLong;
    }
    return outcome::success();
}

STAKEPOOL_LEDGER_NAMESPACE_END
