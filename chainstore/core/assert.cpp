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

#include <chainstore/core/assert.h>

#include <cstdarg>
#include <cstdio>
#include <cstdlib>

extern "C" void chainstore_assertion_failed(
    char const *const expr, char const *const function, char const *const file,
    long const line, char const *const msg)
{
    if (expr != nullptr) {
        fprintf(
            stderr,
            "%s:%ld: %s: Assertion '%s' failed.%s%s\n",
            file,
            line,
            function,
            expr,
            msg != nullptr ? " " : "",
            msg != nullptr ? msg : "");
    }
    else {
        fprintf(
            stderr,
            "%s:%ld: %s: Aborted.%s%s\n",
            file,
            line,
            function,
            msg != nullptr ? " " : "",
            msg != nullptr ? msg : "");
    }
    fflush(stderr);
    abort();
}

extern "C" void chainstore_assertion_failed_printf(
    char const *const expr, char const *const function, char const *const file,
    long const line, char const *const format, ...)
{
    char buffer[1024];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);
    chainstore_assertion_failed(expr, function, file, line, buffer);
}
