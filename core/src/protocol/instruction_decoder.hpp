/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZWIRE_INSTRUCTION_DECODER_HPP_INCLUDED__
#define __ZWIRE_INSTRUCTION_DECODER_HPP_INCLUDED__

#include <stddef.h>

#include <vector>

#include "core/options.hpp"
#include "protocol/i_byte_source.hpp"
#include "protocol/instruction.hpp"
#include "protocol/value_decoder.hpp"
#include "utils/macros.hpp"

namespace zwire
{
//  Reads one opcode byte followed by its operands. Decoding walks
//  awaiting_opcode -> awaiting_operands -> done; any failure drops the
//  instruction built so far and returns to awaiting_opcode. Bytes after the
//  last operand are left in the source.
class instruction_decoder_t
{
  public:
    enum state_t
    {
        awaiting_opcode,
        awaiting_operands,
        done
    };

    instruction_decoder_t (i_byte_source *source_, const options_t &options_);

    //  Operands as declared for the opcode in schema_. EINVALIDINSTR if the
    //  schema has no entry for the opcode read.
    int decode (const instruction_schema_t &schema_, instruction_t *instr_);

    //  Operands as listed by the caller, whatever the opcode.
    int decode (const operand_t *expected_,
                size_t count_,
                instruction_t *instr_);

    //  Single steps, for callers that drive the operand sequence
    //  themselves. EINVALIDOPCODE on a byte outside the opcode table.
    //  A successful step leaves the decoder in awaiting_operands, since only
    //  the caller knows when the instruction is complete; a failed one
    //  returns it to awaiting_opcode.
    int read_opcode (opcode_t *opcode_);
    int read_operand (value_t *value_);
    int read_operand (operand_t expected_, value_t *value_);

    state_t state () const { return _state; }

  private:
    int opcode_ready (opcode_t opcode_);
    int operands_ready (const operand_t *expected_, size_t count_);
    int fail ();

    i_byte_source *const _source;
    value_decoder_t _values;
    state_t _state;
    instruction_t _in_progress;

    ZWIRE_NON_COPYABLE_NOR_MOVABLE (instruction_decoder_t)
};
}

#endif
