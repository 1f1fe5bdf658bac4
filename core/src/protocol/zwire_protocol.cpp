/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "protocol/zwire_protocol.hpp"
#include "utils/likely.hpp"

int zwire::opcode_from_byte (unsigned char byte_, opcode_t *opcode_)
{
    if (unlikely (byte_ >= zwire_protocol::opcode_count)) {
        errno = EINVALIDOPCODE;
        return -1;
    }
    *opcode_ = static_cast<opcode_t> (byte_);
    return 0;
}

int zwire::operand_from_byte (unsigned char byte_, operand_t *operand_)
{
    if (unlikely (byte_ >= zwire_protocol::operand_count)) {
        errno = EINVALIDOPERAND;
        return -1;
    }
    *operand_ = static_cast<operand_t> (byte_);
    return 0;
}

const char *zwire::opcode_name (opcode_t opcode_)
{
    switch (opcode_) {
        case opcode_ping:
            return "ping";
        case opcode_get:
            return "get";
        case opcode_set:
            return "set";
        case opcode_delete:
            return "delete";
        case opcode_flush:
            return "flush";
        case opcode_dbsize:
            return "dbsize";
        case opcode_save:
            return "save";
        case opcode_mget:
            return "mget";
        case opcode_mset:
            return "mset";
        case opcode_keys:
            return "keys";
        case opcode_sizeof:
            return "sizeof";
        case opcode_echo:
            return "echo";
        case opcode_rename:
            return "rename";
        case opcode_copy:
            return "copy";
    }
    return "unknown";
}

const char *zwire::operand_name (operand_t operand_)
{
    switch (operand_) {
        case operand_simple_string:
            return "simple_string";
        case operand_string:
            return "string";
        case operand_integer:
            return "integer";
        case operand_float:
            return "float";
        case operand_boolean_true:
            return "boolean_true";
        case operand_boolean_false:
            return "boolean_false";
        case operand_null:
            return "null";
        case operand_array:
            return "array";
        case operand_map:
            return "map";
        case operand_unordered_set:
            return "unordered_set";
        case operand_set:
            return "set";
        case operand_err:
            return "err";
        case operand_any:
            return "any";
    }
    return "unknown";
}
