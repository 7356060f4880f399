//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ir/Interfaces.hpp
// Purpose: Control-flow capabilities of the opcode vocabulary: region
//          branching, CFG branching, calls, callables and the spill
//          pseudo-ops.
// Key invariants: Queries switch over the closed Opcode enumeration; an
//                 opcode without the capability answers "none" rather than
//                 guessing.
// Ownership/Lifetime: Free functions over a borrowed Context.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/Context.hpp"

#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

namespace strata::ir
{

/// @brief Constant operand values, one entry per ordinary operand; nullopt
///        when the operand is not a known constant.
using ConstOperands = std::vector<std::optional<int64_t>>;

/// @brief Target of a region control-flow transfer.
/// @details An invalid region denotes the parent operation itself.
struct RegionSuccessor
{
    RegionId region;
    std::vector<ValueId> inputs; ///< Entry block params, or parent results.

    bool isParent() const
    {
        return !region.isValid();
    }
};

//===----------------------------------------------------------------------===//
// Region branches (if, while)
//===----------------------------------------------------------------------===//

bool isRegionBranchOp(const Context &ctx, OpId op);

/// @brief Terminator that transfers control out of a region branch region.
bool isRegionBranchTerminator(const Context &ctx, OpId op);

/// @brief Regions entered from the parent of @p op, folding constant operands.
std::vector<RegionSuccessor> getEntrySuccessorRegions(const Context &ctx,
                                                      OpId op,
                                                      const ConstOperands &operands);

/// @brief Successors reachable from @p from; an invalid region means the parent.
std::vector<RegionSuccessor> getSuccessorRegions(const Context &ctx, OpId op, RegionId from);

/// @brief Successors of region terminator @p term, folding constant operands.
std::vector<RegionSuccessor> getTerminatorSuccessorRegions(const Context &ctx,
                                                           OpId term,
                                                           const ConstOperands &operands);

/// @brief Values forwarded by region branch @p op into region @p succ.
std::vector<ValueId> getEntrySuccessorOperands(const Context &ctx, OpId op, const RegionSuccessor &succ);

/// @brief Values forwarded by region terminator @p term to @p succ.
std::vector<ValueId> getTerminatorSuccessorOperands(const Context &ctx,
                                                    OpId term,
                                                    const RegionSuccessor &succ);

/// @brief Report whether control can return to @p region after leaving it.
bool isRepetitiveRegion(const Context &ctx, RegionId region);

//===----------------------------------------------------------------------===//
// CFG branches
//===----------------------------------------------------------------------===//

bool isBranchOp(const Context &ctx, OpId op);

/// @brief Successor index taken by @p op for @p operands, when determined.
std::optional<uint32_t> getSuccessorForOperands(const Context &ctx,
                                                OpId op,
                                                const ConstOperands &operands);

//===----------------------------------------------------------------------===//
// Calls and callables
//===----------------------------------------------------------------------===//

bool isCallOp(const Context &ctx, OpId op);
bool isCallableOp(const Context &ctx, OpId op);

/// @brief Callable body region, or an invalid id for non-callables.
RegionId callableRegion(const Context &ctx, OpId op);

/// @brief Look up @p name in the nearest enclosing module of @p from.
OpId lookupSymbol(const Context &ctx, OpId from, const std::string &name);

/// @brief Function called by @p call, or an invalid id when unresolved.
OpId resolveCallee(const Context &ctx, OpId call);

/// @brief Terminator returning control to the callers of its function.
bool isReturnLike(const Context &ctx, OpId op);

//===----------------------------------------------------------------------===//
// Spill pseudo-ops
//===----------------------------------------------------------------------===//

/// @brief Pseudo-op storing its single operand to spill memory.
struct SpillLike
{
    OpId op;
    ValueId value;
};

/// @brief Pseudo-op loading a previously spilled value into a fresh result.
struct ReloadLike
{
    OpId op;
    ValueId value;   ///< Spilled value being reloaded.
    ValueId result;  ///< Fresh definition produced by the reload.
};

using SpillPseudo = std::variant<SpillLike, ReloadLike>;

/// @brief Classify @p op as a spill pseudo-op, if it is one.
std::optional<SpillPseudo> matchSpillPseudo(const Context &ctx, OpId op);

} // namespace strata::ir
