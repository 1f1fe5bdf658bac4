/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "protocol/value_decoder.hpp"
#include "protocol/wire.hpp"
#include "utils/err.hpp"
#include "utils/likely.hpp"

#ifndef ZWIRE_DECODER_DEBUG
#define ZWIRE_DECODER_DEBUG 0
#endif

#if ZWIRE_DECODER_DEBUG
#include <cstdio>
#define ZWIRE_DECODER_DBG(fmt, ...)                                            \
    fprintf (stderr, "[ZWIRE_DECODER] " fmt "\n", ##__VA_ARGS__)
#else
#define ZWIRE_DECODER_DBG(fmt, ...)
#endif

zwire::value_decoder_t::value_decoder_t (i_byte_source *source_,
                                         const options_t &options_) :
    _source (source_), _options (options_)
{
    zwire_assert (_source);
}

int zwire::value_decoder_t::decode (value_t *value_)
{
    return decode_tagged (operand_any, 0, value_);
}

int zwire::value_decoder_t::decode (operand_t expected_, value_t *value_)
{
    return decode_tagged (expected_, 0, value_);
}

int zwire::value_decoder_t::decode_tagged (operand_t expected_,
                                           int depth_,
                                           value_t *value_)
{
    unsigned char byte;
    if (_source->read_byte (&byte) == -1)
        return -1;

    operand_t tag;
    if (unlikely (operand_from_byte (byte, &tag) == -1)) {
        ZWIRE_DECODER_DBG ("unknown operand tag 0x%02x at offset %zu", byte,
                           _source->bytes_read () - 1);
        return -1;
    }

    if (expected_ != operand_any && unlikely (tag != expected_)) {
        ZWIRE_DECODER_DBG ("operand %s where %s was expected",
                           operand_name (tag), operand_name (expected_));
        errno = EINVALIDOPERAND;
        return -1;
    }

    return dispatch (tag, depth_, value_);
}

int zwire::value_decoder_t::dispatch (operand_t tag_,
                                      int depth_,
                                      value_t *value_)
{
    switch (tag_) {
        case operand_simple_string: {
            std::string bytes;
            if (read_simple_string (&bytes) == -1)
                return -1;
            value_->init_simple_string (bytes.data (), bytes.size ());
            return 0;
        }

        case operand_string: {
            std::string bytes;
            if (read_string (&bytes) == -1)
                return -1;
            value_->init_string (bytes.data (), bytes.size ());
            return 0;
        }

        case operand_integer: {
            int64_t integer;
            if (read_integer (&integer) == -1)
                return -1;
            value_->init_integer (integer);
            return 0;
        }

        case operand_float: {
            double floating;
            if (read_float (&floating) == -1)
                return -1;
            value_->init_float (floating);
            return 0;
        }

        case operand_boolean_true:
            value_->init_boolean (true);
            return 0;

        case operand_boolean_false:
            value_->init_boolean (false);
            return 0;

        case operand_null:
            value_->init_null ();
            return 0;

        case operand_array:
            return read_array (depth_, value_);

        case operand_map:
            return read_map (depth_, value_);

        case operand_unordered_set:
            return read_unordered_set (depth_, value_);

        case operand_set:
            return read_set (depth_, value_);

        case operand_err: {
            std::string message;
            if (read_simple_string (&message) == -1)
                return -1;
            value_->init_err (message.data (), message.size ());
            return 0;
        }

        case operand_any:
            break;
    }

    errno = EINVALIDOPERAND;
    return -1;
}

int zwire::value_decoder_t::check_length (uint32_t length_) const
{
    if (_options.max_length >= 0
        && unlikely (static_cast<int64_t> (length_) > _options.max_length)) {
        errno = EMSGSIZE;
        return -1;
    }
    return 0;
}

int zwire::value_decoder_t::read_length (uint32_t *out_)
{
    const unsigned char *data;
    if (_source->read_exact (zwire_protocol::length_size, &data) == -1)
        return -1;
    *out_ = get_uint32 (data);
    return 0;
}

int zwire::value_decoder_t::read_simple_string (std::string *out_)
{
    std::string bytes;
    unsigned char byte;

    while (true) {
        if (_source->read_byte (&byte) == -1)
            return -1;

        if (byte == zwire_protocol::delimiter0) {
            unsigned char next;
            if (_source->read_byte (&next) == -1)
                return -1;
            if (next == zwire_protocol::delimiter1)
                break;

            //  A lone LF is payload; so is whatever followed it.
            bytes.push_back (static_cast<char> (byte));
            bytes.push_back (static_cast<char> (next));
        } else
            bytes.push_back (static_cast<char> (byte));

        if (_options.max_length >= 0
            && unlikely (static_cast<int64_t> (bytes.size ())
                         > _options.max_length)) {
            errno = EMSGSIZE;
            return -1;
        }
    }

    out_->swap (bytes);
    return 0;
}

int zwire::value_decoder_t::read_string (std::string *out_)
{
    uint32_t length;
    if (read_length (&length) == -1)
        return -1;
    if (check_length (length) == -1)
        return -1;

    if (length == 0) {
        out_->clear ();
        return 0;
    }

    const unsigned char *data;
    if (_source->read_exact (length, &data) == -1)
        return -1;
    out_->assign (reinterpret_cast<const char *> (data), length);
    return 0;
}

int zwire::value_decoder_t::read_integer (int64_t *out_)
{
    const unsigned char *data;
    if (_source->read_exact (zwire_protocol::integer_size, &data) == -1)
        return -1;
    *out_ = get_int64 (data);
    return 0;
}

int zwire::value_decoder_t::read_float (double *out_)
{
    const unsigned char *data;
    if (_source->read_exact (zwire_protocol::float_size, &data) == -1)
        return -1;
    *out_ = get_double (data);
    return 0;
}

int zwire::value_decoder_t::enter_container (int depth_, uint32_t *count_)
{
    if (unlikely (depth_ >= _options.max_depth)) {
        ZWIRE_DECODER_DBG ("container at depth %d exceeds limit %d", depth_,
                           _options.max_depth);
        errno = ENESTING;
        return -1;
    }

    if (read_length (count_) == -1)
        return -1;
    return check_length (*count_);
}

int zwire::value_decoder_t::read_array (int depth_, value_t *value_)
{
    uint32_t count;
    if (enter_container (depth_, &count) == -1)
        return -1;

    value_t array;
    array.init_array ();
    for (uint32_t i = 0; i != count; ++i) {
        value_t element;
        if (decode_tagged (operand_any, depth_ + 1, &element) == -1)
            return -1;
        array.push_back (std::move (element));
    }

    *value_ = std::move (array);
    return 0;
}

int zwire::value_decoder_t::read_map (int depth_, value_t *value_)
{
    uint32_t count;
    if (enter_container (depth_, &count) == -1)
        return -1;

    value_t map;
    map.init_map ();
    for (uint32_t i = 0; i != count; ++i) {
        std::string key;
        if (read_simple_string (&key) == -1)
            return -1;
        if (unlikely (key.empty ())) {
            ZWIRE_DECODER_DBG ("empty map key at entry %u", i);
            errno = EINVALIDOPERAND;
            return -1;
        }

        value_t element;
        if (decode_tagged (operand_any, depth_ + 1, &element) == -1)
            return -1;
        map.map_put (key, std::move (element));
    }

    *value_ = std::move (map);
    return 0;
}

int zwire::value_decoder_t::read_set (int depth_, value_t *value_)
{
    uint32_t count;
    if (enter_container (depth_, &count) == -1)
        return -1;

    value_t set;
    set.init_set ();
    for (uint32_t i = 0; i != count; ++i) {
        value_t element;
        if (decode_tagged (operand_any, depth_ + 1, &element) == -1)
            return -1;
        set.set_insert (std::move (element));
    }

    *value_ = std::move (set);
    return 0;
}

int zwire::value_decoder_t::read_unordered_set (int depth_, value_t *value_)
{
    uint32_t count;
    if (enter_container (depth_, &count) == -1)
        return -1;

    value_t set;
    set.init_unordered_set ();
    for (uint32_t i = 0; i != count; ++i) {
        value_t element;
        if (decode_tagged (operand_any, depth_ + 1, &element) == -1)
            return -1;
        set.uset_insert (std::move (element));
    }

    *value_ = std::move (set);
    return 0;
}
