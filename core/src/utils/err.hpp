/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZWIRE_ERR_HPP_INCLUDED__
#define __ZWIRE_ERR_HPP_INCLUDED__

#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include "utils/likely.hpp"
#include "zwire.h"

//  0MQ-style error handling. Library functions report failures by returning
//  -1 and setting errno; the macros below are for broken internal invariants
//  only and terminate the process.

namespace zwire
{
const char *errno_to_string (int errno_);
#if defined __clang__
#if __has_feature(attribute_analyzer_noreturn)
void zwire_abort (const char *errmsg_) __attribute__ ((analyzer_noreturn));
#else
void zwire_abort (const char *errmsg_);
#endif
#elif defined __GNUC__
void zwire_abort (const char *errmsg_) __attribute__ ((noreturn));
#else
void zwire_abort (const char *errmsg_);
#endif
void print_backtrace ();
}

//  Stays active in release builds, unlike assert.
#define zwire_assert(x)                                                        \
    do {                                                                       \
        if (unlikely (!(x))) {                                                 \
            fprintf (stderr, "Assertion failed: %s (%s:%d)\n", #x, __FILE__,   \
                     __LINE__);                                                \
            fflush (stderr);                                                   \
            zwire::zwire_abort (#x);                                           \
        }                                                                      \
    } while (false)

#endif
