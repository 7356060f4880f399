//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ir/Opcode.cpp
// Purpose: Defines the opcode metadata table.
// Key invariants: Table order matches the Opcode enumeration.
// Ownership/Lifetime: Static data only.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "ir/Opcode.hpp"

namespace strata::ir
{

const std::array<OpcodeInfo, kNumOpcodes> kOpcodeTable = {{
    {"module", false, false, 1, false},
    {"func", false, false, 1, false},
    {"constant", false, false, 0, true},
    {"add", false, false, 0, true},
    {"sub", false, false, 0, true},
    {"mul", false, false, 0, true},
    {"lt", false, false, 0, true},
    {"eq", false, false, 0, true},
    {"call", false, true, 0, false},
    {"funcref", false, false, 0, false},
    {"exec", false, true, 0, false},
    {"br", true, false, 0, false},
    {"cond_br", true, false, 0, false},
    {"switch", true, false, 0, false},
    {"ret", true, false, 0, false},
    {"unreachable", true, false, 0, false},
    {"if", false, false, 2, false},
    {"while", false, false, 2, false},
    {"yield", true, false, 0, false},
    {"condition", true, false, 0, false},
    {"spill", false, true, 0, false},
    {"reload", false, true, 0, false},
    {"local.store", false, true, 0, false},
    {"local.load", false, true, 0, false},
}};

const OpcodeInfo &getOpcodeInfo(Opcode op)
{
    return kOpcodeTable[static_cast<std::size_t>(op)];
}

const char *toString(Opcode op)
{
    return getOpcodeInfo(op).name;
}

} // namespace strata::ir
