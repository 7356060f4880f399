//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ir/Opcode.hpp
// Purpose: Declares the closed opcode vocabulary and its metadata table.
// Key invariants: kOpcodeTable has exactly one entry per Opcode enumerator,
//                 in declaration order.
// Ownership/Lifetime: Static data only.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace strata::ir
{

/// @brief Operations understood by the analyses and the spill transform.
enum class Opcode
{
    Module,
    Func,
    Constant,
    Add,
    Sub,
    Mul,
    Lt,
    Eq,
    Call,
    FuncRef,
    Exec,
    Br,
    CondBr,
    Switch,
    Ret,
    Unreachable,
    If,
    While,
    Yield,
    Condition,
    Spill,
    Reload,
    LocalStore,
    LocalLoad,
    Count
};

inline constexpr std::size_t kNumOpcodes = static_cast<std::size_t>(Opcode::Count);

/// @brief Static description of an opcode's structural properties.
struct OpcodeInfo
{
    const char *name;     ///< Canonical mnemonic.
    bool isTerminator;    ///< Instruction terminates a block.
    bool hasSideEffects;  ///< Instruction is observable beyond its results.
    uint8_t numRegions;   ///< Number of nested regions the op owns.
    bool isFoldable;      ///< Results are a pure function of constant operands.
};

/// @brief Metadata table indexed by @c Opcode enumerators.
extern const std::array<OpcodeInfo, kNumOpcodes> kOpcodeTable;

/// @brief Access metadata for a specific opcode.
const OpcodeInfo &getOpcodeInfo(Opcode op);

/// @brief Convert opcode to mnemonic string.
const char *toString(Opcode op);

} // namespace strata::ir
