/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "utils/err.hpp"
#include "utils/macros.hpp"

#if defined __GLIBC__
#include <execinfo.h>
#endif

const char *zwire::errno_to_string (int errno_)
{
    switch (errno_) {
#if defined _WIN32
        case EMSGSIZE:
            return "Message too long";
        case ECANCELED:
            return "Operation canceled";
#endif
        case EEMPTYDATA:
            return "Byte source has no data";
        case EENDOFSTREAM:
            return "Unexpected end of stream";
        case EINVALIDOPCODE:
            return "Invalid opcode";
        case EINVALIDOPERAND:
            return "Invalid operand";
        case EINVALIDINSTR:
            return "Invalid instruction";
        case ECONTEXT:
            return "Byte source I/O error";
        case ENESTING:
            return "Container nesting too deep";
        default:
#if defined _MSC_VER
#pragma warning(push)
#pragma warning(disable : 4996)
#endif
            return strerror (errno_);
#if defined _MSC_VER
#pragma warning(pop)
#endif
    }
}

void zwire::zwire_abort (const char *errmsg_)
{
    LIBZWIRE_UNUSED (errmsg_);
    print_backtrace ();
    abort ();
}

void zwire::print_backtrace ()
{
#if defined __GLIBC__
    void *frames[64];
    const int depth = backtrace (frames, sizeof frames / sizeof frames[0]);
    backtrace_symbols_fd (frames, depth, 2);
#endif
}
