/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZWIRE_STREAM_SOURCE_HPP_INCLUDED__
#define __ZWIRE_STREAM_SOURCE_HPP_INCLUDED__

#include <boost/asio.hpp>

#include <algorithm>
#include <memory_resource>
#include <vector>

#include "core/options.hpp"
#include "protocol/i_byte_source.hpp"
#include "utils/allocator.hpp"
#include "utils/macros.hpp"
#include "zwire.h"

#ifndef ZWIRE_SOURCE_DEBUG
#define ZWIRE_SOURCE_DEBUG 0
#endif

#if ZWIRE_SOURCE_DEBUG
#include <cstdio>
#define ZWIRE_SOURCE_DBG(fmt, ...)                                             \
    fprintf (stderr, "[ZWIRE_STREAM_SOURCE] " fmt "\n", ##__VA_ARGS__)
#else
#define ZWIRE_SOURCE_DBG(fmt, ...)
#endif

namespace zwire
{
//  Maps a Boost.Asio read failure onto the decoder's errno values.
inline int stream_error_to_errno (const boost::system::error_code &ec_)
{
    if (ec_ == boost::asio::error::eof)
        return EENDOFSTREAM;
    if (ec_ == boost::asio::error::operation_aborted)
        return ECANCELED;
    return ECONTEXT;
}

//  Blocking source over any Boost.Asio SyncReadStream (tcp::socket,
//  local::stream_protocol::socket, serial_port, ...). Bytes are received in
//  chunks of options_t::read_chunk_size; whatever a chunk holds beyond the
//  current read is kept for the next one, so a source should live as long
//  as the connection it reads from. An idle stream is not an error until a
//  read finds it closed.
//
//  Result buffers grow with the bytes actually received, so a length
//  prefix claiming more than the peer sends fails with EENDOFSTREAM without
//  reserving the claimed size.
template <typename SyncReadStream>
class stream_source_t ZWIRE_FINAL : public i_byte_source
{
  public:
    stream_source_t (SyncReadStream &stream_, const options_t &options_) :
        _stream (stream_),
        _chunk_size (static_cast<size_t> (
          options_.read_chunk_size > 0 ? options_.read_chunk_size
                                       : ZWIRE_RCVBUF_DFLT)),
        _rx (get_memory_resource ()),
        _rx_pos (0),
        _out (get_memory_resource ()),
        _bytes_read (0)
    {
    }

    int read_exact (size_t size_, const unsigned char **data_) ZWIRE_OVERRIDE
    {
        const size_t buffered = _rx.size () - _rx_pos;
        if (buffered >= size_) {
            *data_ = _rx.data () + _rx_pos;
            _rx_pos += size_;
            _bytes_read += size_;
            return 0;
        }

        _out.assign (_rx.begin () + _rx_pos, _rx.end ());
        _rx.clear ();
        _rx_pos = 0;

        while (_out.size () < size_) {
            const int rc = receive ();
            if (rc == -1) {
                _bytes_read += _out.size ();
                _out.clear ();
                return -1;
            }
            const size_t take = std::min (size_ - _out.size (), _rx.size ());
            _out.insert (_out.end (), _rx.begin (), _rx.begin () + take);
            _rx_pos = take;
        }

        *data_ = _out.data ();
        _bytes_read += size_;
        return 0;
    }

    size_t bytes_read () const ZWIRE_OVERRIDE { return _bytes_read; }

    //  Bytes received from the stream but not consumed yet.
    size_t buffered () const { return _rx.size () - _rx_pos; }

  private:
    //  Replaces the receive buffer with the next chunk from the stream.
    //  Blocks until at least one byte arrives.
    int receive ()
    {
        _rx.resize (_chunk_size);
        _rx_pos = 0;

        boost::system::error_code ec;
        const size_t n =
          _stream.read_some (boost::asio::buffer (_rx.data (), _rx.size ()), ec);
        _rx.resize (n);
        if (n > 0)
            return 0;

        ZWIRE_SOURCE_DBG ("read_some failed: %s", ec.message ().c_str ());
        errno = ec ? stream_error_to_errno (ec) : EENDOFSTREAM;
        return -1;
    }

    SyncReadStream &_stream;
    const size_t _chunk_size;

    std::pmr::vector<unsigned char> _rx;
    size_t _rx_pos;
    std::pmr::vector<unsigned char> _out;
    size_t _bytes_read;

    ZWIRE_NON_COPYABLE_NOR_MOVABLE (stream_source_t)
};
}

#endif
