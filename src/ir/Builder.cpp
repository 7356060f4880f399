//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ir/Builder.cpp
// Purpose: Implements the per-opcode creation helpers of Builder.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "ir/Builder.hpp"

#include <cassert>

namespace strata::ir
{

void Builder::setInsertionPointAfter(OpId op)
{
    const Operation &o = ctx_.op(op);
    if (o.next.isValid())
    {
        setInsertionPoint(o.next);
        return;
    }
    setInsertionPointToEnd(o.parent);
}

void Builder::setInsertionPoint(const ProgramPoint &point)
{
    switch (point.kind)
    {
        case ProgramPoint::Kind::BeforeOp:
            setInsertionPoint(point.op);
            break;
        case ProgramPoint::Kind::AfterOp:
            setInsertionPointAfter(point.op);
            break;
        case ProgramPoint::Kind::BlockStart:
        {
            const OpId first = ctx_.block(point.block).first;
            if (first.isValid())
                setInsertionPoint(first);
            else
                setInsertionPointToEnd(point.block);
            break;
        }
        case ProgramPoint::Kind::BlockEnd:
            setInsertionPointToEnd(point.block);
            break;
    }
}

OpId Builder::insert(OpId op)
{
    assert(block_.isValid() && "builder has no insertion point");
    if (before_.isValid())
        ctx_.insertBefore(op, before_);
    else
        ctx_.insertAtEnd(op, block_);
    return op;
}

OpId Builder::createModule()
{
    OpId module = ctx_.createOp(Opcode::Module, {}, {}, loc_);
    ctx_.createBlock(ctx_.op(module).regions[0]);
    return module;
}

BlockId Builder::moduleBody(OpId module) const
{
    return ctx_.entryBlock(ctx_.op(module).regions[0]);
}

OpId Builder::func(const std::string &name,
                   const std::vector<Type> &params,
                   Visibility vis,
                   bool declaration)
{
    OpId fn = ctx_.createOp(Opcode::Func, {}, {}, loc_);
    Operation &o = ctx_.op(fn);
    o.symbol = name;
    o.visibility = vis;
    if (!declaration)
        ctx_.createBlock(o.regions[0], params);
    return insert(fn);
}

BlockId Builder::entryOf(OpId op) const
{
    return ctx_.entryBlock(ctx_.op(op).regions[0]);
}

BlockId Builder::addBlock(OpId op, const std::vector<Type> &params, unsigned index)
{
    return ctx_.createBlock(ctx_.op(op).regions[index], params);
}

ValueId Builder::constant(int64_t value, Type type)
{
    OpId op = ctx_.createOp(Opcode::Constant, {}, {type}, loc_);
    ctx_.op(op).imm = value;
    return result(insert(op));
}

ValueId Builder::binary(Opcode opcode, ValueId lhs, ValueId rhs, Type type)
{
    return result(insert(ctx_.createOp(opcode, {lhs, rhs}, {type}, loc_)));
}

ValueId Builder::add(ValueId lhs, ValueId rhs)
{
    return binary(Opcode::Add, lhs, rhs, ctx_.value(lhs).type);
}

ValueId Builder::sub(ValueId lhs, ValueId rhs)
{
    return binary(Opcode::Sub, lhs, rhs, ctx_.value(lhs).type);
}

ValueId Builder::mul(ValueId lhs, ValueId rhs)
{
    return binary(Opcode::Mul, lhs, rhs, ctx_.value(lhs).type);
}

ValueId Builder::lt(ValueId lhs, ValueId rhs)
{
    return binary(Opcode::Lt, lhs, rhs, Type(Type::Kind::I1));
}

ValueId Builder::eq(ValueId lhs, ValueId rhs)
{
    return binary(Opcode::Eq, lhs, rhs, Type(Type::Kind::I1));
}

OpId Builder::call(const std::string &callee,
                   const std::vector<ValueId> &args,
                   const std::vector<Type> &results)
{
    OpId op = ctx_.createOp(Opcode::Call, args, results, loc_);
    ctx_.op(op).symbol = callee;
    return insert(op);
}

ValueId Builder::funcRef(const std::string &name)
{
    OpId op = ctx_.createOp(Opcode::FuncRef, {}, {Type(Type::Kind::Ptr)}, loc_);
    ctx_.op(op).symbol = name;
    return result(insert(op));
}

OpId Builder::exec(const std::string &mnemonic,
                   const std::vector<ValueId> &operands,
                   const std::vector<Type> &results)
{
    OpId op = ctx_.createOp(Opcode::Exec, operands, results, loc_);
    ctx_.op(op).symbol = mnemonic;
    return insert(op);
}

OpId Builder::br(BlockId dest, const std::vector<ValueId> &args)
{
    OpId op = ctx_.createOp(Opcode::Br, {}, {}, loc_);
    ctx_.addSuccessor(op, dest, args);
    return insert(op);
}

OpId Builder::condBr(ValueId cond,
                     BlockId t,
                     const std::vector<ValueId> &targs,
                     BlockId f,
                     const std::vector<ValueId> &fargs)
{
    OpId op = ctx_.createOp(Opcode::CondBr, {cond}, {}, loc_);
    ctx_.addSuccessor(op, t, targs);
    ctx_.addSuccessor(op, f, fargs);
    return insert(op);
}

OpId Builder::switchOp(ValueId scrutinee,
                       const std::vector<int64_t> &cases,
                       const std::vector<BlockId> &dests,
                       BlockId defaultDest)
{
    assert(cases.size() == dests.size() && "switch case/destination mismatch");
    OpId op = ctx_.createOp(Opcode::Switch, {scrutinee}, {}, loc_);
    ctx_.op(op).caseValues = cases;
    for (BlockId dest : dests)
        ctx_.addSuccessor(op, dest, {});
    ctx_.addSuccessor(op, defaultDest, {});
    return insert(op);
}

OpId Builder::ret(const std::vector<ValueId> &values)
{
    return insert(ctx_.createOp(Opcode::Ret, values, {}, loc_));
}

OpId Builder::unreachable()
{
    return insert(ctx_.createOp(Opcode::Unreachable, {}, {}, loc_));
}

OpId Builder::ifOp(ValueId cond, const std::vector<Type> &results)
{
    OpId op = ctx_.createOp(Opcode::If, {cond}, results, loc_);
    ctx_.createBlock(ctx_.op(op).regions[0]);
    ctx_.createBlock(ctx_.op(op).regions[1]);
    return insert(op);
}

OpId Builder::whileOp(const std::vector<ValueId> &inits, const std::vector<Type> &results)
{
    OpId op = ctx_.createOp(Opcode::While, inits, results, loc_);
    std::vector<Type> initTypes;
    for (ValueId v : inits)
        initTypes.push_back(ctx_.value(v).type);
    ctx_.createBlock(ctx_.op(op).regions[0], initTypes);
    ctx_.createBlock(ctx_.op(op).regions[1], results);
    return insert(op);
}

OpId Builder::yield(const std::vector<ValueId> &values)
{
    return insert(ctx_.createOp(Opcode::Yield, values, {}, loc_));
}

OpId Builder::condition(ValueId cond, const std::vector<ValueId> &values)
{
    std::vector<ValueId> operands{cond};
    operands.insert(operands.end(), values.begin(), values.end());
    return insert(ctx_.createOp(Opcode::Condition, operands, {}, loc_));
}

OpId Builder::spill(ValueId value)
{
    return insert(ctx_.createOp(Opcode::Spill, {value}, {}, loc_));
}

OpId Builder::reload(ValueId value)
{
    return insert(ctx_.createOp(Opcode::Reload, {value}, {ctx_.value(value).type}, loc_));
}

OpId Builder::localStore(int64_t slot, ValueId value)
{
    OpId op = ctx_.createOp(Opcode::LocalStore, {value}, {}, loc_);
    ctx_.op(op).imm = slot;
    return insert(op);
}

OpId Builder::localLoad(int64_t slot, Type type)
{
    OpId op = ctx_.createOp(Opcode::LocalLoad, {}, {type}, loc_);
    ctx_.op(op).imm = slot;
    return insert(op);
}

} // namespace strata::ir
