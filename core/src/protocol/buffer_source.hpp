/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZWIRE_BUFFER_SOURCE_HPP_INCLUDED__
#define __ZWIRE_BUFFER_SOURCE_HPP_INCLUDED__

#include "protocol/i_byte_source.hpp"
#include "utils/macros.hpp"

namespace zwire
{
//  Cursor over a fully available buffer. Reads return views into the
//  buffer, which the caller must keep alive while the source is in use.
class buffer_source_t ZWIRE_FINAL : public i_byte_source
{
  public:
    buffer_source_t ();

    //  Fails with EEMPTYDATA when size_ is zero.
    int init (const void *data_, size_t size_);

    int read_exact (size_t size_, const unsigned char **data_) ZWIRE_OVERRIDE;
    size_t bytes_read () const ZWIRE_OVERRIDE { return _pos; }

    size_t position () const { return _pos; }
    size_t remaining () const { return _size - _pos; }
    bool eof () const { return _pos == _size; }

  private:
    const unsigned char *_data;
    size_t _size;
    size_t _pos;

    ZWIRE_NON_COPYABLE_NOR_MOVABLE (buffer_source_t)
};
}

#endif
