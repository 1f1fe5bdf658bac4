/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZWIRE_I_BYTE_SOURCE_HPP_INCLUDED__
#define __ZWIRE_I_BYTE_SOURCE_HPP_INCLUDED__

#include <stddef.h>

#include "utils/macros.hpp"

namespace zwire
{
//  Interface to the bytes a decoder consumes. Implementations either pull
//  from a live stream (blocking) or walk an in-memory buffer.

struct i_byte_source
{
    virtual ~i_byte_source () ZWIRE_DEFAULT

    //  Makes exactly size_ bytes available at *data_ and consumes them.
    //  The pointer stays valid until the next call on the source. Never
    //  returns fewer bytes: on a shortfall it returns -1 with errno set to
    //  EENDOFSTREAM (ECANCELED or ECONTEXT for streams that were aborted or
    //  failed). Bytes pulled before a failure are discarded.
    virtual int read_exact (size_t size_, const unsigned char **data_) = 0;

    //  Total bytes consumed so far.
    virtual size_t bytes_read () const = 0;

    int read_byte (unsigned char *byte_)
    {
        const unsigned char *data;
        const int rc = read_exact (1, &data);
        if (rc == 0)
            *byte_ = *data;
        return rc;
    }
};
}

#endif
