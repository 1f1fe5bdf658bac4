/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZWIRE_PROTOCOL_HPP_INCLUDED__
#define __ZWIRE_PROTOCOL_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>

namespace zwire
{
//  Instruction kinds. The numeric values are the opcode bytes on the wire.
enum opcode_t
{
    opcode_ping = 0x00,
    opcode_get = 0x01,
    opcode_set = 0x02,
    opcode_delete = 0x03,
    opcode_flush = 0x04,
    opcode_dbsize = 0x05,
    opcode_save = 0x06,
    opcode_mget = 0x07,
    opcode_mset = 0x08,
    opcode_keys = 0x09,
    opcode_sizeof = 0x0A,
    opcode_echo = 0x0B,
    opcode_rename = 0x0C,
    opcode_copy = 0x0D
};

//  Operand tags. The numeric values are the tag bytes on the wire, except
//  operand_any which never appears on the wire and stands for "accept
//  whatever tag is present".
enum operand_t
{
    operand_simple_string = 0x00,
    operand_string = 0x01,
    operand_integer = 0x02,
    operand_float = 0x03,
    operand_boolean_true = 0x04,
    operand_boolean_false = 0x05,
    operand_null = 0x06,
    operand_array = 0x07,
    operand_map = 0x08,
    operand_unordered_set = 0x09,
    operand_set = 0x0A,
    operand_err = 0x0B,
    operand_any = -1
};

namespace zwire_protocol
{
const unsigned char opcode_count = 0x0E;
const unsigned char operand_count = 0x0C;

//  Simple strings and errors end with LF CR.
const unsigned char delimiter0 = 0x0A;
const unsigned char delimiter1 = 0x0D;

const size_t length_size = 4;
const size_t integer_size = 8;
const size_t float_size = 8;
}

//  Checked conversions from wire bytes. Return 0 and fill the output on a
//  known byte; return -1 with errno set to EINVALIDOPCODE/EINVALIDOPERAND
//  otherwise. The output is left untouched on failure.
int opcode_from_byte (unsigned char byte_, opcode_t *opcode_);
int operand_from_byte (unsigned char byte_, operand_t *operand_);

const char *opcode_name (opcode_t opcode_);
const char *operand_name (operand_t operand_);
}

#endif
