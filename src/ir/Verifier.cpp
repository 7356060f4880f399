//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ir/Verifier.cpp
// Purpose: Implements the structural IR verifier.
// Key invariants: Module bodies are graph-like and carry no terminator; every
//                 other non-empty region block must end in exactly one
//                 terminator appropriate for its parent op.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "ir/Verifier.hpp"

#include <sstream>
#include <string>

namespace strata::ir
{
namespace
{

using support::ErrorCode;
using support::Expected;

Expected<void> fail(const Context &ctx, OpId op, const std::string &msg)
{
    std::ostringstream os;
    os << msg << " (op" << op.index << ": " << toString(ctx.op(op).opcode) << ')';
    return support::makeError(ctx.op(op).loc, os.str(), ErrorCode::InvalidIR);
}

bool terminatorAllowed(const Context &ctx, OpId parent, uint32_t regionNumber, Opcode term)
{
    switch (ctx.op(parent).opcode)
    {
        case Opcode::Func:
            return term == Opcode::Ret || term == Opcode::Unreachable || term == Opcode::Br ||
                   term == Opcode::CondBr || term == Opcode::Switch;
        case Opcode::If:
            return term == Opcode::Yield;
        case Opcode::While:
            return regionNumber == 0 ? term == Opcode::Condition : term == Opcode::Yield;
        default:
            return false;
    }
}

bool valueAvailable(const Context &ctx, ValueId v)
{
    const Value &val = ctx.value(v);
    if (val.kind == ValueKind::BlockParam)
        return !ctx.block(val.ownerBlock).erased;
    const Operation &def = ctx.op(val.definingOp);
    return !def.erased && def.parent.isValid();
}

Expected<void> verifyOp(const Context &ctx, OpId id);

Expected<void> verifyBlock(const Context &ctx, OpId parent, const Region &region, BlockId b)
{
    const bool graphRegion = ctx.op(parent).opcode == Opcode::Module;
    for (OpId op : ctx.opsIn(b))
    {
        const bool isLast = op == ctx.block(b).last;
        const bool isTerm = getOpcodeInfo(ctx.op(op).opcode).isTerminator;
        if (isTerm && !isLast)
            return fail(ctx, op, "terminator in the middle of ^bb" + std::to_string(b.index));
        if (isTerm && !terminatorAllowed(ctx, parent, region.number, ctx.op(op).opcode))
            return fail(ctx, op, "terminator not allowed in this region");
        if (auto r = verifyOp(ctx, op); !r)
            return r;
    }

    if (!graphRegion && !ctx.terminator(b).isValid())
    {
        std::ostringstream os;
        os << "block ^bb" << b.index << " lacks a terminator";
        return support::makeError(ctx.op(parent).loc, os.str(), ErrorCode::InvalidIR);
    }
    return {};
}

Expected<void> verifyOp(const Context &ctx, OpId id)
{
    const Operation &op = ctx.op(id);
    if (op.erased)
        return fail(ctx, id, "reference to an erased operation");

    for (const OpOperand &ref : ctx.operandRefs(id))
        if (!valueAvailable(ctx, ctx.operandValue(ref)))
            return fail(ctx, id, "operand %" + std::to_string(ctx.operandValue(ref).index) +
                                     " has no live definition");

    for (const Successor &succ : op.successors)
    {
        const Block &dest = ctx.block(succ.dest);
        if (dest.erased)
            return fail(ctx, id, "branch to an erased block");
        if (dest.parent != ctx.parentRegion(id))
            return fail(ctx, id, "branch leaves its region");
        if (dest.params.size() != succ.args.size())
            return fail(ctx, id,
                        "successor ^bb" + std::to_string(succ.dest.index) + " expects " +
                            std::to_string(dest.params.size()) + " arguments, got " +
                            std::to_string(succ.args.size()));
    }

    for (RegionId r : op.regions)
    {
        const Region &region = ctx.region(r);
        for (BlockId b : region.blocks)
            if (auto res = verifyBlock(ctx, id, region, b); !res)
                return res;
    }
    return {};
}

} // namespace

Expected<void> Verifier::verify(const Context &ctx, OpId op)
{
    return verifyOp(ctx, op);
}

} // namespace strata::ir
