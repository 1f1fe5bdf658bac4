/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZWIRE_WIRE_HPP_INCLUDED__
#define __ZWIRE_WIRE_HPP_INCLUDED__

#include <stdint.h>
#include <string.h>

namespace zwire
{
//  Helper functions to convert different integer types to/from little-endian
//  network byte order. All multi-byte quantities on the wire are little-endian.

inline void put_uint32 (unsigned char *buffer_, uint32_t value_)
{
    buffer_[0] = static_cast<unsigned char> (value_ & 0xff);
    buffer_[1] = static_cast<unsigned char> ((value_ >> 8) & 0xff);
    buffer_[2] = static_cast<unsigned char> ((value_ >> 16) & 0xff);
    buffer_[3] = static_cast<unsigned char> ((value_ >> 24) & 0xff);
}

inline uint32_t get_uint32 (const unsigned char *buffer_)
{
    return (static_cast<uint32_t> (buffer_[0]))
           | (static_cast<uint32_t> (buffer_[1]) << 8)
           | (static_cast<uint32_t> (buffer_[2]) << 16)
           | (static_cast<uint32_t> (buffer_[3]) << 24);
}

inline void put_uint64 (unsigned char *buffer_, uint64_t value_)
{
    buffer_[0] = static_cast<unsigned char> (value_ & 0xff);
    buffer_[1] = static_cast<unsigned char> ((value_ >> 8) & 0xff);
    buffer_[2] = static_cast<unsigned char> ((value_ >> 16) & 0xff);
    buffer_[3] = static_cast<unsigned char> ((value_ >> 24) & 0xff);
    buffer_[4] = static_cast<unsigned char> ((value_ >> 32) & 0xff);
    buffer_[5] = static_cast<unsigned char> ((value_ >> 40) & 0xff);
    buffer_[6] = static_cast<unsigned char> ((value_ >> 48) & 0xff);
    buffer_[7] = static_cast<unsigned char> ((value_ >> 56) & 0xff);
}

inline uint64_t get_uint64 (const unsigned char *buffer_)
{
    return (static_cast<uint64_t> (buffer_[0]))
           | (static_cast<uint64_t> (buffer_[1]) << 8)
           | (static_cast<uint64_t> (buffer_[2]) << 16)
           | (static_cast<uint64_t> (buffer_[3]) << 24)
           | (static_cast<uint64_t> (buffer_[4]) << 32)
           | (static_cast<uint64_t> (buffer_[5]) << 40)
           | (static_cast<uint64_t> (buffer_[6]) << 48)
           | (static_cast<uint64_t> (buffer_[7]) << 56);
}

inline int64_t get_int64 (const unsigned char *buffer_)
{
    const uint64_t bits = get_uint64 (buffer_);
    int64_t value;
    memcpy (&value, &bits, sizeof value);
    return value;
}

inline double get_double (const unsigned char *buffer_)
{
    const uint64_t bits = get_uint64 (buffer_);
    double value;
    memcpy (&value, &bits, sizeof value);
    return value;
}
}

#endif
