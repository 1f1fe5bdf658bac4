/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZWIRE_VALUE_DECODER_HPP_INCLUDED__
#define __ZWIRE_VALUE_DECODER_HPP_INCLUDED__

#include <stdint.h>

#include <string>

#include "core/options.hpp"
#include "core/value.hpp"
#include "protocol/i_byte_source.hpp"
#include "protocol/zwire_protocol.hpp"
#include "utils/macros.hpp"

namespace zwire
{
//  Decodes tagged operands from a byte source. One algorithm per wire type,
//  whatever the source is.
//
//  Every call either fills its output completely and returns 0, or returns
//  -1 with errno set and leaves the output untouched:
//
//    EENDOFSTREAM     source ran dry (ECANCELED/ECONTEXT from streams)
//    EINVALIDOPERAND  unknown tag, tag differs from the expected one,
//                     empty map key
//    ENESTING         containers nested deeper than options_t::max_depth
//    EMSGSIZE         length or count above options_t::max_length
class value_decoder_t
{
  public:
    value_decoder_t (i_byte_source *source_, const options_t &options_);

    //  Reads a tag byte and whatever value it announces.
    int decode (value_t *value_);

    //  Reads a tag byte that must equal expected_, then its value.
    //  operand_any behaves like decode (value_).
    int decode (operand_t expected_, value_t *value_);

    //  Payload decoders, without tag byte.
    int read_simple_string (std::string *out_);
    int read_string (std::string *out_);
    int read_integer (int64_t *out_);
    int read_float (double *out_);
    int read_length (uint32_t *out_);

  private:
    int decode_tagged (operand_t expected_, int depth_, value_t *value_);
    int dispatch (operand_t tag_, int depth_, value_t *value_);

    int read_array (int depth_, value_t *value_);
    int read_map (int depth_, value_t *value_);
    int read_set (int depth_, value_t *value_);
    int read_unordered_set (int depth_, value_t *value_);

    int enter_container (int depth_, uint32_t *count_);
    int check_length (uint32_t length_) const;

    i_byte_source *const _source;
    const options_t _options;

    ZWIRE_NON_COPYABLE_NOR_MOVABLE (value_decoder_t)
};
}

#endif
