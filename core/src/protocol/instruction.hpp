/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZWIRE_INSTRUCTION_HPP_INCLUDED__
#define __ZWIRE_INSTRUCTION_HPP_INCLUDED__

#include <stddef.h>

#include <vector>

#include "core/value.hpp"
#include "protocol/zwire_protocol.hpp"

namespace zwire
{
//  One decoded instruction: the opcode and its operands in wire order.
struct instruction_t
{
    instruction_t () : opcode (opcode_ping) {}

    opcode_t opcode;
    std::vector<value_t> operands;
};

//  Operand layout per opcode, supplied by whoever executes instructions.
//  Opcodes without an entry are rejected with EINVALIDINSTR.
class instruction_schema_t
{
  public:
    instruction_schema_t ();

    //  Declares the operands of opcode_, replacing any previous entry.
    //  operand_any accepts whatever tag is present at that position.
    void define (opcode_t opcode_, const operand_t *operands_, size_t count_);
    void define (opcode_t opcode_, const std::vector<operand_t> &operands_);

    //  NULL if opcode_ was never defined.
    const std::vector<operand_t> *find (opcode_t opcode_) const;

  private:
    bool _defined[zwire_protocol::opcode_count];
    std::vector<operand_t> _operands[zwire_protocol::opcode_count];
};
}

#endif
