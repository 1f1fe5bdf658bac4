/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "protocol/buffer_source.hpp"
#include "utils/likely.hpp"

zwire::buffer_source_t::buffer_source_t () : _data (NULL), _size (0), _pos (0)
{
}

int zwire::buffer_source_t::init (const void *data_, size_t size_)
{
    if (unlikely (data_ == NULL || size_ == 0)) {
        errno = EEMPTYDATA;
        return -1;
    }

    _data = static_cast<const unsigned char *> (data_);
    _size = size_;
    _pos = 0;
    return 0;
}

int zwire::buffer_source_t::read_exact (size_t size_,
                                        const unsigned char **data_)
{
    if (unlikely (size_ > _size - _pos)) {
        errno = EENDOFSTREAM;
        return -1;
    }

    *data_ = _data + _pos;
    _pos += size_;
    return 0;
}
