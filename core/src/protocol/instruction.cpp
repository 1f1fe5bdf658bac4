/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "protocol/instruction.hpp"
#include "utils/err.hpp"

zwire::instruction_schema_t::instruction_schema_t ()
{
    for (size_t i = 0; i != zwire_protocol::opcode_count; ++i)
        _defined[i] = false;
}

void zwire::instruction_schema_t::define (opcode_t opcode_,
                                          const operand_t *operands_,
                                          size_t count_)
{
    const size_t slot = static_cast<size_t> (opcode_);
    zwire_assert (slot < zwire_protocol::opcode_count);
    zwire_assert (operands_ || count_ == 0);

    _operands[slot].assign (operands_, operands_ + count_);
    _defined[slot] = true;
}

void zwire::instruction_schema_t::define (
  opcode_t opcode_, const std::vector<operand_t> &operands_)
{
    define (opcode_, operands_.empty () ? NULL : &operands_[0],
            operands_.size ());
}

const std::vector<zwire::operand_t> *
zwire::instruction_schema_t::find (opcode_t opcode_) const
{
    const size_t slot = static_cast<size_t> (opcode_);
    if (slot >= zwire_protocol::opcode_count || !_defined[slot])
        return NULL;
    return &_operands[slot];
}
