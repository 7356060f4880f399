//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ir/Interfaces.cpp
// Purpose: Implements the control-flow capability queries for each opcode.
// Key invariants: "if" regions exit to the parent; "while" alternates
//                 between its before and after regions until its condition
//                 exits to the parent.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "ir/Interfaces.hpp"

#include <algorithm>
#include <cassert>

namespace strata::ir
{
namespace
{

RegionSuccessor regionSuccessor(const Context &ctx, RegionId region)
{
    RegionSuccessor succ;
    succ.region = region;
    BlockId entry = ctx.entryBlock(region);
    if (entry.isValid())
        succ.inputs = ctx.block(entry).params;
    return succ;
}

RegionSuccessor parentSuccessor(const Context &ctx, OpId op)
{
    RegionSuccessor succ;
    succ.inputs = ctx.op(op).results;
    return succ;
}

/// Enter @p region, or fall through to the parent when it has no body.
RegionSuccessor enterOrSkip(const Context &ctx, OpId op, RegionId region)
{
    if (ctx.region(region).blocks.empty())
        return parentSuccessor(ctx, op);
    return regionSuccessor(ctx, region);
}

std::optional<int64_t> constantOperand(const ConstOperands &operands, std::size_t index)
{
    if (index >= operands.size())
        return std::nullopt;
    return operands[index];
}

} // namespace

bool isRegionBranchOp(const Context &ctx, OpId op)
{
    const Opcode opc = ctx.op(op).opcode;
    return opc == Opcode::If || opc == Opcode::While;
}

bool isRegionBranchTerminator(const Context &ctx, OpId op)
{
    const Opcode opc = ctx.op(op).opcode;
    if (opc != Opcode::Yield && opc != Opcode::Condition)
        return false;
    OpId parent = ctx.parentOp(op);
    return parent.isValid() && isRegionBranchOp(ctx, parent);
}

std::vector<RegionSuccessor> getEntrySuccessorRegions(const Context &ctx,
                                                      OpId op,
                                                      const ConstOperands &operands)
{
    const Operation &o = ctx.op(op);
    switch (o.opcode)
    {
        case Opcode::If:
        {
            std::optional<int64_t> cond = constantOperand(operands, 0);
            if (cond)
                return {enterOrSkip(ctx, op, o.regions[*cond != 0 ? 0 : 1])};
            return {enterOrSkip(ctx, op, o.regions[0]), enterOrSkip(ctx, op, o.regions[1])};
        }
        case Opcode::While:
            return {regionSuccessor(ctx, o.regions[0])};
        default:
            return {};
    }
}

std::vector<RegionSuccessor> getSuccessorRegions(const Context &ctx, OpId op, RegionId from)
{
    if (!from.isValid())
        return getEntrySuccessorRegions(ctx, op, {});

    const Operation &o = ctx.op(op);
    switch (o.opcode)
    {
        case Opcode::If:
            return {parentSuccessor(ctx, op)};
        case Opcode::While:
            if (from == o.regions[0])
                return {regionSuccessor(ctx, o.regions[1]), parentSuccessor(ctx, op)};
            return {regionSuccessor(ctx, o.regions[0])};
        default:
            return {};
    }
}

std::vector<RegionSuccessor> getTerminatorSuccessorRegions(const Context &ctx,
                                                           OpId term,
                                                           const ConstOperands &operands)
{
    OpId parent = ctx.parentOp(term);
    RegionId from = ctx.parentRegion(term);
    if (ctx.op(term).opcode == Opcode::Condition)
    {
        std::optional<int64_t> cond = constantOperand(operands, 0);
        if (cond)
        {
            if (*cond != 0)
                return {regionSuccessor(ctx, ctx.op(parent).regions[1])};
            return {parentSuccessor(ctx, parent)};
        }
    }
    return getSuccessorRegions(ctx, parent, from);
}

std::vector<ValueId> getEntrySuccessorOperands(const Context &ctx, OpId op, const RegionSuccessor &succ)
{
    const Operation &o = ctx.op(op);
    if (o.opcode == Opcode::While && !succ.isParent())
        return o.operands;
    return {};
}

std::vector<ValueId> getTerminatorSuccessorOperands(const Context &ctx,
                                                    OpId term,
                                                    const RegionSuccessor &)
{
    const Operation &o = ctx.op(term);
    if (o.opcode == Opcode::Condition)
        return std::vector<ValueId>(o.operands.begin() + 1, o.operands.end());
    return o.operands;
}

bool isRepetitiveRegion(const Context &ctx, RegionId region)
{
    OpId op = ctx.region(region).parentOp;
    if (!op.isValid() || !isRegionBranchOp(ctx, op))
        return false;

    std::vector<RegionId> worklist;
    std::vector<RegionId> visited;
    for (const RegionSuccessor &s : getSuccessorRegions(ctx, op, region))
        if (!s.isParent())
            worklist.push_back(s.region);

    while (!worklist.empty())
    {
        RegionId cur = worklist.back();
        worklist.pop_back();
        if (cur == region)
            return true;
        if (std::find(visited.begin(), visited.end(), cur) != visited.end())
            continue;
        visited.push_back(cur);
        for (const RegionSuccessor &s : getSuccessorRegions(ctx, op, cur))
            if (!s.isParent())
                worklist.push_back(s.region);
    }
    return false;
}

bool isBranchOp(const Context &ctx, OpId op)
{
    const Opcode opc = ctx.op(op).opcode;
    return opc == Opcode::Br || opc == Opcode::CondBr || opc == Opcode::Switch;
}

std::optional<uint32_t> getSuccessorForOperands(const Context &ctx,
                                                OpId op,
                                                const ConstOperands &operands)
{
    const Operation &o = ctx.op(op);
    switch (o.opcode)
    {
        case Opcode::Br:
            return 0u;
        case Opcode::CondBr:
        {
            std::optional<int64_t> cond = constantOperand(operands, 0);
            if (!cond)
                return std::nullopt;
            return *cond != 0 ? 0u : 1u;
        }
        case Opcode::Switch:
        {
            std::optional<int64_t> value = constantOperand(operands, 0);
            if (!value)
                return std::nullopt;
            for (uint32_t i = 0; i < o.caseValues.size(); ++i)
                if (o.caseValues[i] == *value)
                    return i;
            return static_cast<uint32_t>(o.successors.size() - 1);
        }
        default:
            return std::nullopt;
    }
}

bool isCallOp(const Context &ctx, OpId op)
{
    return ctx.op(op).opcode == Opcode::Call;
}

bool isCallableOp(const Context &ctx, OpId op)
{
    return ctx.op(op).opcode == Opcode::Func;
}

RegionId callableRegion(const Context &ctx, OpId op)
{
    if (!isCallableOp(ctx, op))
        return RegionId();
    return ctx.op(op).regions[0];
}

OpId lookupSymbol(const Context &ctx, OpId from, const std::string &name)
{
    OpId module = from;
    while (module.isValid() && ctx.op(module).opcode != Opcode::Module)
        module = ctx.parentOp(module);
    if (!module.isValid())
        return OpId();

    for (BlockId b : ctx.region(ctx.op(module).regions[0]).blocks)
        for (OpId op : ctx.opsIn(b))
            if (ctx.op(op).opcode == Opcode::Func && ctx.op(op).symbol == name)
                return op;
    return OpId();
}

OpId resolveCallee(const Context &ctx, OpId call)
{
    assert(isCallOp(ctx, call) && "resolveCallee expects a call");
    return lookupSymbol(ctx, call, ctx.op(call).symbol);
}

bool isReturnLike(const Context &ctx, OpId op)
{
    return ctx.op(op).opcode == Opcode::Ret;
}

std::optional<SpillPseudo> matchSpillPseudo(const Context &ctx, OpId op)
{
    const Operation &o = ctx.op(op);
    switch (o.opcode)
    {
        case Opcode::Spill:
            return SpillPseudo(SpillLike{op, o.operands[0]});
        case Opcode::Reload:
            return SpillPseudo(ReloadLike{op, o.operands[0], o.results[0]});
        default:
            return std::nullopt;
    }
}

} // namespace strata::ir
