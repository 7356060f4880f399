//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ir/ProgramPoint.cpp
// Purpose: Canonicalisation and neighbour lookup for program points.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "ir/ProgramPoint.hpp"

#include "ir/Context.hpp"

namespace strata::ir
{

ProgramPoint ProgramPoint::before(const Context &ctx, OpId o)
{
    return ProgramPoint{Kind::BeforeOp, ctx.op(o).parent, o};
}

ProgramPoint ProgramPoint::after(const Context &ctx, OpId o)
{
    return ProgramPoint{Kind::AfterOp, ctx.op(o).parent, o};
}

ProgramPoint ProgramPoint::canonicalize(const Context &ctx) const
{
    switch (kind)
    {
        case Kind::BlockStart:
        case Kind::AfterOp:
            return *this;
        case Kind::BeforeOp:
        {
            OpId prev = ctx.op(op).prev;
            if (prev.isValid())
                return ProgramPoint{Kind::AfterOp, block, prev};
            return atStartOf(block);
        }
        case Kind::BlockEnd:
        {
            OpId last = ctx.block(block).last;
            if (last.isValid())
                return ProgramPoint{Kind::AfterOp, block, last};
            return atStartOf(block);
        }
    }
    return *this;
}

OpId ProgramPoint::nextOp(const Context &ctx) const
{
    switch (kind)
    {
        case Kind::BlockStart:
            return ctx.block(block).first;
        case Kind::BlockEnd:
            return OpId();
        case Kind::BeforeOp:
            return op;
        case Kind::AfterOp:
            return ctx.op(op).next;
    }
    return OpId();
}

OpId ProgramPoint::prevOp(const Context &ctx) const
{
    switch (kind)
    {
        case Kind::BlockStart:
            return OpId();
        case Kind::BlockEnd:
            return ctx.block(block).last;
        case Kind::BeforeOp:
            return ctx.op(op).prev;
        case Kind::AfterOp:
            return op;
    }
    return OpId();
}

std::string ProgramPoint::toString() const
{
    const std::string b = "^bb" + std::to_string(block.index);
    switch (kind)
    {
        case Kind::BlockStart:
            return "start of " + b;
        case Kind::BlockEnd:
            return "end of " + b;
        case Kind::BeforeOp:
            return "before op" + std::to_string(op.index) + " in " + b;
        case Kind::AfterOp:
            return "after op" + std::to_string(op.index) + " in " + b;
    }
    return b;
}

} // namespace strata::ir
