/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZWIRE_OPTIONS_HPP_INCLUDED__
#define __ZWIRE_OPTIONS_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>

namespace zwire
{
struct options_t
{
    options_t ();

    int set_option (int option_, const void *optval_, size_t optvallen_);
    int get_option (int option_, void *optval_, size_t *optvallen_) const;

    //  Number of containers that may enclose one another.
    int max_depth;

    //  Largest accepted string length or container element count,
    //  -1 for no limit beyond the 32-bit wire field.
    int64_t max_length;

    //  Bytes a streaming source asks for per blocking read.
    int read_chunk_size;
};
}

#endif
