/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "core/options.hpp"

namespace
{
template <typename T>
int do_setopt (const void *optval_, size_t optvallen_, T *out_)
{
    if (optvallen_ != sizeof (T) || optval_ == NULL) {
        errno = EINVAL;
        return -1;
    }
    memcpy (out_, optval_, sizeof (T));
    return 0;
}

template <typename T>
int do_getopt (void *optval_, size_t *optvallen_, T value_)
{
    if (optval_ == NULL || optvallen_ == NULL || *optvallen_ < sizeof (T)) {
        errno = EINVAL;
        return -1;
    }
    memcpy (optval_, &value_, sizeof (T));
    *optvallen_ = sizeof (T);
    return 0;
}
}

zwire::options_t::options_t () :
    max_depth (ZWIRE_MAXDEPTH_DFLT),
    max_length (-1),
    read_chunk_size (ZWIRE_RCVBUF_DFLT)
{
}

int zwire::options_t::set_option (int option_,
                                  const void *optval_,
                                  size_t optvallen_)
{
    switch (option_) {
        case ZWIRE_MAXDEPTH: {
            int value;
            if (do_setopt (optval_, optvallen_, &value) == -1)
                return -1;
            if (value < 0)
                break;
            max_depth = value;
            return 0;
        }

        case ZWIRE_MAXLEN: {
            int64_t value;
            if (do_setopt (optval_, optvallen_, &value) == -1)
                return -1;
            if (value < -1)
                break;
            max_length = value;
            return 0;
        }

        case ZWIRE_RCVBUF: {
            int value;
            if (do_setopt (optval_, optvallen_, &value) == -1)
                return -1;
            if (value <= 0)
                break;
            read_chunk_size = value;
            return 0;
        }

        default:
            break;
    }

    errno = EINVAL;
    return -1;
}

int zwire::options_t::get_option (int option_,
                                  void *optval_,
                                  size_t *optvallen_) const
{
    switch (option_) {
        case ZWIRE_MAXDEPTH:
            return do_getopt (optval_, optvallen_, max_depth);

        case ZWIRE_MAXLEN:
            return do_getopt (optval_, optvallen_, max_length);

        case ZWIRE_RCVBUF:
            return do_getopt (optval_, optvallen_, read_chunk_size);

        default:
            break;
    }

    errno = EINVAL;
    return -1;
}
