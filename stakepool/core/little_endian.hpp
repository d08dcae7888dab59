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

#include <intx/intx.hpp>

#include <algorithm>
#include <array>
#include <bit>
#include <type_traits>

STAKEPOOL_NAMESPACE_BEGIN

// LittleEndian is a strongly typed little endian wrapper. Account records and
// instruction payloads are little endian on the wire regardless of the host,
// so records are declared as packed structs of these wrappers and bit_cast to
// and from their byte images.
template <typename T>
    requires(unsigned_integral<T>)
struct LittleEndian
{
    using native_type = T;

    unsigned char bytes[sizeof(T)];

    LittleEndian() = default;

    constexpr LittleEndian(T const &x) noexcept
    {
        store(x);
    }

    constexpr bool operator==(LittleEndian<T> const &other) const noexcept
    {
        return std::ranges::equal(bytes, other.bytes);
    }

    [[nodiscard]] constexpr native_type native() const noexcept
    {
        std::array<unsigned char, sizeof(T)> data;
        std::copy_n(bytes, sizeof(T), data.data());
        auto const x = std::bit_cast<native_type>(data);
        if constexpr (std::endian::native == std::endian::big) {
            return intx::bswap(x);
        }
        else {
            return x;
        }
    }

    constexpr LittleEndian<T> &operator=(T const &x) noexcept
    {
        store(x);
        return *this;
    }

private:
    constexpr void store(T x) noexcept
    {
        if constexpr (std::endian::native == std::endian::big) {
            x = intx::bswap(x);
        }
        auto const data =
            std::bit_cast<std::array<unsigned char, sizeof(T)>>(x);
        std::copy_n(data.data(), sizeof(T), bytes);
    }
};

using u8_le = LittleEndian<uint8_t>;
using u16_le = LittleEndian<uint16_t>;
using u32_le = LittleEndian<uint32_t>;
using u64_le = LittleEndian<uint64_t>;
static_assert(sizeof(u8_le) == sizeof(uint8_t));
static_assert(alignof(u8_le) == 1);
static_assert(sizeof(u16_le) == sizeof(uint16_t));
static_assert(alignof(u16_le) == 1);
static_assert(sizeof(u32_le) == sizeof(uint32_t));
static_assert(alignof(u32_le) == 1);
static_assert(sizeof(u64_le) == sizeof(uint64_t));
static_assert(alignof(u64_le) == 1);

template <typename T>
struct is_little_endian_wrapper : std::false_type
{
};

template <typename U>
struct is_little_endian_wrapper<LittleEndian<U>> : std::true_type
{
};

template <typename T>
concept LittleEndianType = is_little_endian_wrapper<T>::value;

STAKEPOOL_NAMESPACE_END
