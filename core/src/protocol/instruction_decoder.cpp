/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "protocol/instruction_decoder.hpp"
#include "utils/err.hpp"
#include "utils/likely.hpp"

#ifndef ZWIRE_DECODER_DEBUG
#define ZWIRE_DECODER_DEBUG 0
#endif

#if ZWIRE_DECODER_DEBUG
#include <cstdio>
#define ZWIRE_DECODER_DBG(fmt, ...)                                            \
    fprintf (stderr, "[ZWIRE_INSTRUCTION] " fmt "\n", ##__VA_ARGS__)
#else
#define ZWIRE_DECODER_DBG(fmt, ...)
#endif

zwire::instruction_decoder_t::instruction_decoder_t (
  i_byte_source *source_, const options_t &options_) :
    _source (source_), _values (source_, options_), _state (awaiting_opcode)
{
}

int zwire::instruction_decoder_t::decode (const instruction_schema_t &schema_,
                                          instruction_t *instr_)
{
    _state = awaiting_opcode;

    opcode_t opcode;
    if (read_opcode (&opcode) == -1)
        return fail ();

    const std::vector<operand_t> *operands = schema_.find (opcode);
    if (unlikely (!operands)) {
        ZWIRE_DECODER_DBG ("no operand layout for %s", opcode_name (opcode));
        errno = EINVALIDINSTR;
        return fail ();
    }

    if (opcode_ready (opcode) == -1)
        return fail ();
    if (operands_ready (operands->empty () ? NULL : &(*operands)[0],
                        operands->size ())
        == -1)
        return fail ();

    *instr_ = std::move (_in_progress);
    return 0;
}

int zwire::instruction_decoder_t::decode (const operand_t *expected_,
                                          size_t count_,
                                          instruction_t *instr_)
{
    zwire_assert (expected_ || count_ == 0);
    _state = awaiting_opcode;

    opcode_t opcode;
    if (read_opcode (&opcode) == -1)
        return fail ();
    if (opcode_ready (opcode) == -1)
        return fail ();
    if (operands_ready (expected_, count_) == -1)
        return fail ();

    *instr_ = std::move (_in_progress);
    return 0;
}

int zwire::instruction_decoder_t::read_opcode (opcode_t *opcode_)
{
    _state = awaiting_opcode;

    unsigned char byte;
    if (_source->read_byte (&byte) == -1)
        return -1;

    if (unlikely (opcode_from_byte (byte, opcode_) == -1)) {
        ZWIRE_DECODER_DBG ("unknown opcode 0x%02x", byte);
        return -1;
    }

    _state = awaiting_operands;
    return 0;
}

int zwire::instruction_decoder_t::read_operand (value_t *value_)
{
    return read_operand (operand_any, value_);
}

int zwire::instruction_decoder_t::read_operand (operand_t expected_,
                                                value_t *value_)
{
    if (_values.decode (expected_, value_) == -1)
        return fail ();

    _state = awaiting_operands;
    return 0;
}

int zwire::instruction_decoder_t::opcode_ready (opcode_t opcode_)
{
    _in_progress.opcode = opcode_;
    _in_progress.operands.clear ();
    _state = awaiting_operands;
    return 0;
}

int zwire::instruction_decoder_t::operands_ready (const operand_t *expected_,
                                                  size_t count_)
{
    _in_progress.operands.reserve (count_);
    for (size_t i = 0; i != count_; ++i) {
        value_t operand;
        if (_values.decode (expected_[i], &operand) == -1) {
            ZWIRE_DECODER_DBG ("%s: operand %zu failed: %s",
                               opcode_name (_in_progress.opcode), i,
                               errno_to_string (errno));
            return -1;
        }
        _in_progress.operands.push_back (std::move (operand));
    }

    _state = done;
    return 0;
}

int zwire::instruction_decoder_t::fail ()
{
    const int err = errno;
    _in_progress.operands.clear ();
    _state = awaiting_opcode;
    errno = err;
    return -1;
}
