//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: analysis/dataflow/ConstantPropagation.cpp
// Purpose: Implements sparse constant propagation over executable code.
// Key invariants: Only blocks marked executable contribute facts; block
//                 parameters only join arguments of executable edges.
// Ownership/Lifetime: See ConstantPropagation.hpp.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "analysis/dataflow/ConstantPropagation.hpp"

#include "analysis/dataflow/DeadCodeAnalysis.hpp"
#include "support/trace.hpp"

#include <cassert>

using strata::ir::BlockId;
using strata::ir::OpId;
using strata::ir::Opcode;
using strata::ir::ProgramPoint;
using strata::ir::ValueId;

namespace strata::analysis::dataflow
{
namespace
{

/// Fold a binary integer op; arithmetic wraps like two's complement.
int64_t foldBinary(Opcode opcode, int64_t lhs, int64_t rhs)
{
    const auto ul = static_cast<uint64_t>(lhs);
    const auto ur = static_cast<uint64_t>(rhs);
    switch (opcode)
    {
        case Opcode::Add:
            return static_cast<int64_t>(ul + ur);
        case Opcode::Sub:
            return static_cast<int64_t>(ul - ur);
        case Opcode::Mul:
            return static_cast<int64_t>(ul * ur);
        case Opcode::Lt:
            return lhs < rhs ? 1 : 0;
        case Opcode::Eq:
            return lhs == rhs ? 1 : 0;
        default:
            assert(false && "opcode is not a foldable binary op");
            return 0;
    }
}

} // namespace

//===----------------------------------------------------------------------===//
// ConstantValue
//===----------------------------------------------------------------------===//

ChangeResult ConstantValue::join(const ConstantValue &rhs)
{
    switch (rhs.kind_)
    {
        case Kind::Uninitialized:
            return ChangeResult::Unchanged;
        case Kind::Constant:
            return joinConstant(rhs.value_);
        case Kind::Overdefined:
            return markOverdefined();
    }
    return ChangeResult::Unchanged;
}

ChangeResult ConstantValue::joinConstant(int64_t value)
{
    switch (kind_)
    {
        case Kind::Uninitialized:
            kind_ = Kind::Constant;
            value_ = value;
            return ChangeResult::Changed;
        case Kind::Constant:
            if (value_ == value)
                return ChangeResult::Unchanged;
            return markOverdefined();
        case Kind::Overdefined:
            return ChangeResult::Unchanged;
    }
    return ChangeResult::Unchanged;
}

ChangeResult ConstantValue::markOverdefined()
{
    if (kind_ == Kind::Overdefined)
        return ChangeResult::Unchanged;
    kind_ = Kind::Overdefined;
    return ChangeResult::Changed;
}

void ConstantValue::print(std::ostream &os) const
{
    switch (kind_)
    {
        case Kind::Uninitialized:
            os << "<uninitialized>";
            break;
        case Kind::Constant:
            os << value_;
            break;
        case Kind::Overdefined:
            os << "<overdefined>";
            break;
    }
}

//===----------------------------------------------------------------------===//
// SparseConstantPropagation
//===----------------------------------------------------------------------===//

support::Expected<void> SparseConstantPropagation::initialize(const AnalysisScope &scope,
                                                             DataFlowSolver &solver)
{
    for (BlockId block : solver.context().nestedBlocks(scope.top))
    {
        auto &exec = solver.getOrCreate<Executable>(ProgramPoint::atStartOf(block));
        solver.subscribe(&exec, this);
        solver.enqueueBlock(block, this);
    }
    return {};
}

support::Expected<void> SparseConstantPropagation::visit(const AnalysisScope &,
                                                        const ProgramPoint &point,
                                                        DataFlowSolver &solver)
{
    if (point.isBlockStart())
        visitBlock(point.block, solver);
    else if (point.isAfter())
        visitOperation(point.op, solver);
    return {};
}

void SparseConstantPropagation::visitBlock(BlockId block, DataFlowSolver &solver)
{
    const ir::Context &ctx = solver.context();
    if (!solver.getOrCreate<Executable>(ProgramPoint::atStartOf(block)).isLive())
        return;

    const ir::Block &b = ctx.block(block);
    if (b.params.empty())
        return;

    // Entry parameters come from callers or region branch ops.
    if (ctx.entryBlock(b.parent) == block)
    {
        markAllOverdefined(b.params, solver);
        return;
    }

    const ProgramPoint here = ProgramPoint::atStartOf(block);
    for (const ir::BlockOperand &pred : b.predecessors)
    {
        const BlockId from = ctx.op(pred.op).parent;
        if (!solver.require<Executable>(CfgEdge{from, block}, here, this).isLive())
            continue;

        const std::vector<ValueId> &args = ctx.op(pred.op).successors[pred.successor].args;
        assert(args.size() == b.params.size() && "successor argument count mismatch");
        for (std::size_t i = 0; i < b.params.size(); ++i)
        {
            const auto &incoming = solver.require<ConstantValue>(args[i], here, this);
            auto &param = solver.getOrCreate<ConstantValue>(b.params[i]);
            solver.propagateIfChanged(&param, param.join(incoming));
        }
    }
}

void SparseConstantPropagation::visitOperation(OpId op, DataFlowSolver &solver)
{
    const ir::Context &ctx = solver.context();
    const ir::Operation &o = ctx.op(op);
    if (!o.parent.isValid() || !solver.getOrCreate<Executable>(ProgramPoint::atStartOf(o.parent)).isLive())
        return;
    if (o.results.empty())
        return;

    if (o.opcode == Opcode::Constant)
    {
        auto &result = solver.getOrCreate<ConstantValue>(o.results[0]);
        solver.propagateIfChanged(&result, result.joinConstant(o.imm));
        return;
    }

    if (!ir::getOpcodeInfo(o.opcode).isFoldable)
    {
        markAllOverdefined(o.results, solver);
        return;
    }

    std::vector<int64_t> operands;
    for (ValueId v : o.operands)
    {
        auto &state = solver.getOrCreate<ConstantValue>(v);
        solver.subscribe(&state, this);
        if (state.isUninitialized())
            return;
        if (state.isOverdefined())
        {
            markAllOverdefined(o.results, solver);
            return;
        }
        operands.push_back(*state.constant());
    }

    assert(operands.size() == 2 && "foldable ops are binary");
    const int64_t folded = foldBinary(o.opcode, operands[0], operands[1]);
    support::trace(support::TraceTopic::Dataflow)
        << "folded " << ir::toString(o.opcode) << " to " << folded << "\n";
    auto &result = solver.getOrCreate<ConstantValue>(o.results[0]);
    solver.propagateIfChanged(&result, result.joinConstant(folded));
}

void SparseConstantPropagation::markAllOverdefined(const std::vector<ValueId> &values, DataFlowSolver &solver)
{
    for (ValueId v : values)
    {
        auto &state = solver.getOrCreate<ConstantValue>(v);
        solver.propagateIfChanged(&state, state.markOverdefined());
    }
}

} // namespace strata::analysis::dataflow
