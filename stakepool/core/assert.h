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

#include <stakepool/core/likely.h>

#ifdef __cplusplus
extern "C"
{
#endif

[[noreturn]] void stakepool_assertion_failed(
    char const *expr, char const *function, char const *file, long line,
    char const *msg);

#ifdef __cplusplus
}
#endif

inline constexpr char const *stakepool_assertion_message(
    char const *const msg = nullptr) noexcept
{
    return msg;
}

/// Assert, with backtrace upon failure; accepts an optional message, which
/// must be a compile-time-constant string
#define STAKEPOOL_ASSERT(expr, ...)                                            \
    if (STAKEPOOL_LIKELY(expr)) { /* likeliest */                              \
    }                                                                          \
    else {                                                                     \
        stakepool_assertion_failed(                                            \
            #expr,                                                             \
            __extension__ __PRETTY_FUNCTION__,                                 \
            __FILE__,                                                          \
            __LINE__,                                                          \
            stakepool_assertion_message(__VA_ARGS__));                         \
    }
