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

#include <chainstore/core/likely.h>

#ifdef __cplusplus
extern "C"
{
#endif

[[noreturn]] void chainstore_assertion_failed(
    char const *expr, char const *function, char const *file, long line,
    char const *msg);

[[noreturn]] void chainstore_assertion_failed_printf(
    char const *expr, char const *function, char const *file, long line,
    char const *format, ...) __attribute__((format(printf, 5, 6)));

#ifdef __cplusplus
}
#endif

#define CHAINSTORE_ASSERT(expr)                                                \
    if (CHAINSTORE_LIKELY(expr)) {                                             \
    }                                                                          \
    else {                                                                     \
        chainstore_assertion_failed(                                           \
            #expr, __extension__ __PRETTY_FUNCTION__, __FILE__, __LINE__,      \
            nullptr);                                                          \
    }

#define CHAINSTORE_ASSERT_PRINTF(expr, format, ...)                            \
    if (CHAINSTORE_LIKELY(expr)) {                                             \
    }                                                                          \
    else {                                                                     \
        chainstore_assertion_failed_printf(                                    \
            #expr,                                                             \
            __extension__ __PRETTY_FUNCTION__,                                 \
            __FILE__,                                                          \
            __LINE__,                                                          \
            format,                                                            \
            ##__VA_ARGS__);                                                    \
    }

#define CHAINSTORE_ABORT(msg)                                                  \
    chainstore_assertion_failed(                                               \
        nullptr, __extension__ __PRETTY_FUNCTION__, __FILE__, __LINE__, msg)

#ifdef NDEBUG
    #define CHAINSTORE_DEBUG_ASSERT(x)                                         \
        do {                                                                   \
            (void)sizeof(x);                                                   \
        }                                                                      \
        while (0)
#else
    #define CHAINSTORE_DEBUG_ASSERT(x) CHAINSTORE_ASSERT(x)
#endif
