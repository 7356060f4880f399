//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ir/Printer.cpp
// Purpose: Implements the textual IR printer.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "ir/Printer.hpp"

#include <sstream>

namespace strata::ir
{
namespace
{

const char *visibilityName(Visibility vis)
{
    switch (vis)
    {
        case Visibility::Public:
            return "public";
        case Visibility::Internal:
            return "internal";
        case Visibility::Private:
            return "private";
    }
    return "private";
}

void writeValueList(const std::vector<ValueId> &values, std::ostream &os)
{
    for (std::size_t i = 0; i < values.size(); ++i)
    {
        if (i != 0)
            os << ", ";
        os << '%' << values[i].index;
    }
}

void writeOp(const Context &ctx, OpId id, unsigned indent, std::ostream &os);

void writeRegion(const Context &ctx, RegionId region, unsigned indent, std::ostream &os)
{
    os << "{\n";
    for (BlockId b : ctx.region(region).blocks)
    {
        const Block &block = ctx.block(b);
        os << std::string(indent, ' ') << "^bb" << b.index;
        if (!block.params.empty())
        {
            os << '(';
            for (std::size_t i = 0; i < block.params.size(); ++i)
            {
                if (i != 0)
                    os << ", ";
                ValueId p = block.params[i];
                os << '%' << p.index << ": " << ctx.value(p).type.toString();
            }
            os << ')';
        }
        os << ":\n";
        for (OpId op : ctx.opsIn(b))
            writeOp(ctx, op, indent + 2, os);
    }
    os << std::string(indent >= 2 ? indent - 2 : 0, ' ') << '}';
}

void writeOp(const Context &ctx, OpId id, unsigned indent, std::ostream &os)
{
    const Operation &op = ctx.op(id);
    os << std::string(indent, ' ');
    if (!op.results.empty())
    {
        writeValueList(op.results, os);
        os << " = ";
    }
    os << toString(op.opcode);

    switch (op.opcode)
    {
        case Opcode::Func:
            os << " @" << op.symbol << ' ' << visibilityName(op.visibility);
            break;
        case Opcode::Call:
        case Opcode::FuncRef:
        case Opcode::Exec:
            os << " @" << op.symbol;
            break;
        case Opcode::Constant:
        case Opcode::LocalStore:
        case Opcode::LocalLoad:
            os << ' ' << op.imm;
            break;
        default:
            break;
    }

    if (!op.operands.empty())
    {
        os << ' ';
        writeValueList(op.operands, os);
    }

    for (std::size_t s = 0; s < op.successors.size(); ++s)
    {
        os << (s == 0 ? " " : ", ");
        if (op.opcode == Opcode::Switch)
        {
            if (s < op.caseValues.size())
                os << op.caseValues[s] << " -> ";
            else
                os << "default -> ";
        }
        os << "^bb" << op.successors[s].dest.index;
        if (!op.successors[s].args.empty())
        {
            os << '(';
            writeValueList(op.successors[s].args, os);
            os << ')';
        }
    }

    if (!op.results.empty())
    {
        os << " : ";
        for (std::size_t i = 0; i < op.results.size(); ++i)
        {
            if (i != 0)
                os << ", ";
            os << ctx.value(op.results[i]).type.toString();
        }
    }

    for (RegionId r : op.regions)
    {
        os << ' ';
        writeRegion(ctx, r, indent + 2, os);
    }
    os << '\n';
}

} // namespace

void Printer::write(const Context &ctx, OpId op, std::ostream &os)
{
    writeOp(ctx, op, 0, os);
}

std::string Printer::toString(const Context &ctx, OpId op)
{
    std::ostringstream os;
    write(ctx, op, os);
    return os.str();
}

} // namespace strata::ir
