//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: analysis/dataflow/DeadCodeAnalysis.cpp
// Purpose: Implements executability and control-flow predecessor analysis.
// Key invariants: An operation is only analyzed once its parent block is
//                 live; successors are resolved from constant operands when
//                 every operand lattice is initialized.
// Ownership/Lifetime: See DeadCodeAnalysis.hpp.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "analysis/dataflow/DeadCodeAnalysis.hpp"

#include "analysis/dataflow/ConstantPropagation.hpp"
#include "support/trace.hpp"

#include <algorithm>
#include <cassert>

using strata::ir::BlockId;
using strata::ir::OpId;
using strata::ir::Opcode;
using strata::ir::ProgramPoint;
using strata::ir::RegionId;
using strata::ir::ValueId;
using strata::support::TraceTopic;

namespace strata::analysis::dataflow
{

//===----------------------------------------------------------------------===//
// PredecessorState
//===----------------------------------------------------------------------===//

const std::vector<ValueId> &PredecessorState::successorInputs(OpId predecessor) const
{
    static const std::vector<ValueId> kNone;
    auto it = inputs_.find(predecessor);
    return it == inputs_.end() ? kNone : it->second;
}

ChangeResult PredecessorState::setHasUnknownPredecessors()
{
    if (!allKnown_)
        return ChangeResult::Unchanged;
    allKnown_ = false;
    return ChangeResult::Changed;
}

ChangeResult PredecessorState::join(OpId predecessor)
{
    if (std::find(known_.begin(), known_.end(), predecessor) != known_.end())
        return ChangeResult::Unchanged;
    known_.push_back(predecessor);
    inputs_[predecessor];
    return ChangeResult::Changed;
}

ChangeResult PredecessorState::joinWithInputs(OpId predecessor, std::vector<ValueId> inputs)
{
    ChangeResult result = join(predecessor);
    std::vector<ValueId> &prev = inputs_[predecessor];
    if (prev != inputs)
    {
        prev = std::move(inputs);
        result = ChangeResult::Changed;
    }
    return result;
}

void PredecessorState::print(std::ostream &os) const
{
    os << "[";
    for (std::size_t i = 0; i < known_.size(); ++i)
        os << (i ? ", " : "") << "op" << known_[i].index;
    os << "]" << (allKnown_ ? "" : " + unknown");
}

//===----------------------------------------------------------------------===//
// DeadCodeAnalysis
//===----------------------------------------------------------------------===//

bool isRegionOrCallableReturn(const ir::Context &ctx, OpId op)
{
    const ir::Operation &o = ctx.op(op);
    if (!o.successors.empty() || !o.parent.isValid())
        return false;
    OpId parent = ctx.parentOp(o.parent);
    if (!parent.isValid())
        return false;
    if (!ir::isRegionBranchOp(ctx, parent) && !ir::isCallableOp(ctx, parent))
        return false;
    return ctx.terminator(o.parent) == op;
}

support::Expected<void> DeadCodeAnalysis::initialize(const AnalysisScope &scope, DataFlowSolver &solver)
{
    const ir::Context &ctx = solver.context();
    for (RegionId region : ctx.op(scope.top).regions)
    {
        BlockId entry = ctx.entryBlock(region);
        if (!entry.isValid())
            continue;
        auto &exec = solver.getOrCreate<Executable>(ProgramPoint::atStartOf(entry));
        solver.propagateIfChanged(&exec, exec.markLive());
    }

    initializeCallableSymbols(scope, solver);
    return initializeRecursively(scope, scope.top, solver);
}

void DeadCodeAnalysis::initializeCallableSymbols(const AnalysisScope &scope, DataFlowSolver &solver)
{
    const ir::Context &ctx = solver.context();
    const bool allUsesVisible = !ctx.parentOp(scope.top).isValid();

    auto markUnknown = [&](OpId callable)
    {
        auto &callsites = solver.getOrCreate<PredecessorState>(ProgramPoint::after(ctx, callable));
        solver.propagateIfChanged(&callsites, callsites.setHasUnknownPredecessors());
    };

    ctx.walk(scope.top,
             [&](OpId table)
             {
                 if (ctx.op(table).opcode != Opcode::Module)
                     return;

                 bool foundCallable = false;
                 for (BlockId b : ctx.region(ctx.op(table).regions[0]).blocks)
                 {
                     for (OpId candidate : ctx.opsIn(b))
                     {
                         if (!ir::isCallableOp(ctx, candidate))
                             continue;
                         if (!ctx.entryBlock(ir::callableRegion(ctx, candidate)).isValid())
                             continue;

                         const ir::Visibility vis = ctx.op(candidate).visibility;
                         if (vis == ir::Visibility::Public ||
                             (!allUsesVisible && vis == ir::Visibility::Internal))
                         {
                             support::trace(TraceTopic::DeadCode)
                                 << "@" << ctx.op(candidate).symbol << " has unknown callers\n";
                             markUnknown(candidate);
                         }
                         foundCallable = true;
                     }
                 }
                 if (!foundCallable)
                     return;

                 // Taking the address of a function hides its call sites.
                 ctx.walk(table,
                          [&](OpId user)
                          {
                              if (ctx.op(user).opcode != Opcode::FuncRef)
                                  return;
                              OpId callee = ir::lookupSymbol(ctx, user, ctx.op(user).symbol);
                              if (callee.isValid())
                                  markUnknown(callee);
                          });
             });
}

support::Expected<void> DeadCodeAnalysis::initializeRecursively(const AnalysisScope &scope,
                                                                OpId op,
                                                                DataFlowSolver &solver)
{
    const ir::Context &ctx = solver.context();
    const ir::Operation &o = ctx.op(op);
    if (!o.regions.empty() || !o.successors.empty() || isRegionOrCallableReturn(ctx, op) ||
        ir::isCallOp(ctx, op))
    {
        if (o.parent.isValid())
        {
            auto &exec = solver.getOrCreate<Executable>(ProgramPoint::atStartOf(o.parent));
            solver.subscribe(&exec, this);
        }
        auto visited = visit(scope, ProgramPoint::after(ctx, op), solver);
        if (!visited)
            return visited;
    }

    for (RegionId region : o.regions)
        for (BlockId block : ctx.region(region).blocks)
            for (OpId nested : ctx.opsIn(block))
            {
                auto init = initializeRecursively(scope, nested, solver);
                if (!init)
                    return init;
            }
    return {};
}

support::Expected<void> DeadCodeAnalysis::visit(const AnalysisScope &scope,
                                               const ProgramPoint &point,
                                               DataFlowSolver &solver)
{
    if (!point.isAfter())
        return {};

    const ir::Context &ctx = solver.context();
    const OpId op = point.op;
    const ir::Operation &o = ctx.op(op);
    if (!o.parent.isValid() || !solver.getOrCreate<Executable>(ProgramPoint::atStartOf(o.parent)).isLive())
        return {};

    if (ir::isCallOp(ctx, op))
        visitCallOperation(scope, op, solver);

    if (!o.regions.empty())
    {
        if (ir::isRegionBranchOp(ctx, op))
        {
            visitRegionBranchOperation(op, solver);
        }
        else if (ir::isCallableOp(ctx, op))
        {
            const auto &callsites = solver.require<PredecessorState>(point, point, this);
            if (!callsites.allPredecessorsKnown() || !callsites.knownPredecessors().empty())
                markEntryBlocksLive(op, solver);
        }
        else
        {
            markEntryBlocksLive(op, solver);
        }
    }

    if (isRegionOrCallableReturn(ctx, op))
    {
        OpId parent = ctx.parentOp(op);
        if (ir::isRegionBranchOp(ctx, parent))
            visitRegionTerminator(op, parent, solver);
        else if (ir::isCallableOp(ctx, parent))
            visitCallableTerminator(op, parent, solver);
    }

    if (!o.successors.empty())
    {
        if (ir::isBranchOp(ctx, op))
        {
            visitBranchOperation(op, solver);
        }
        else
        {
            for (const ir::Successor &succ : o.successors)
                markEdgeLive(o.parent, succ.dest, solver);
        }
    }
    return {};
}

void DeadCodeAnalysis::visitCallOperation(const AnalysisScope &scope, OpId call, DataFlowSolver &solver)
{
    const ir::Context &ctx = solver.context();
    const OpId callee = ir::resolveCallee(ctx, call);

    auto isExternal = [&](OpId callable)
    {
        if (!scope.contains(ctx, callable))
            return true;
        return !ctx.entryBlock(ir::callableRegion(ctx, callable)).isValid();
    };

    if (callee.isValid() && !isExternal(callee))
    {
        auto &callsites = solver.getOrCreate<PredecessorState>(ProgramPoint::after(ctx, callee));
        solver.propagateIfChanged(&callsites, callsites.join(call));
        return;
    }

    support::trace(TraceTopic::DeadCode) << "call to @" << ctx.op(call).symbol << " returns from unknown code\n";
    auto &returns = solver.getOrCreate<PredecessorState>(ProgramPoint::after(ctx, call));
    solver.propagateIfChanged(&returns, returns.setHasUnknownPredecessors());
}

void DeadCodeAnalysis::visitBranchOperation(OpId branch, DataFlowSolver &solver)
{
    const ir::Context &ctx = solver.context();
    std::optional<ir::ConstOperands> operands = getOperandValues(branch, solver);
    if (!operands)
        return;

    const ir::Operation &o = ctx.op(branch);
    if (std::optional<uint32_t> taken = ir::getSuccessorForOperands(ctx, branch, *operands))
    {
        markEdgeLive(o.parent, o.successors[*taken].dest, solver);
        return;
    }
    for (const ir::Successor &succ : o.successors)
        markEdgeLive(o.parent, succ.dest, solver);
}

void DeadCodeAnalysis::visitRegionBranchOperation(OpId branch, DataFlowSolver &solver)
{
    const ir::Context &ctx = solver.context();
    std::optional<ir::ConstOperands> operands = getOperandValues(branch, solver);
    if (!operands)
        return;

    for (const ir::RegionSuccessor &succ : ir::getEntrySuccessorRegions(ctx, branch, *operands))
    {
        const ProgramPoint point = succ.isParent()
                                       ? ProgramPoint::after(ctx, branch)
                                       : ProgramPoint::atStartOf(ctx.entryBlock(succ.region));
        auto &exec = solver.getOrCreate<Executable>(point);
        solver.propagateIfChanged(&exec, exec.markLive());

        auto &preds = solver.getOrCreate<PredecessorState>(point);
        solver.propagateIfChanged(&preds,
                                  preds.joinWithInputs(branch, ir::getEntrySuccessorOperands(ctx, branch, succ)));
    }
}

void DeadCodeAnalysis::visitRegionTerminator(OpId term, OpId branch, DataFlowSolver &solver)
{
    const ir::Context &ctx = solver.context();
    std::optional<ir::ConstOperands> operands = getOperandValues(term, solver);
    if (!operands)
        return;

    for (const ir::RegionSuccessor &succ : ir::getTerminatorSuccessorRegions(ctx, term, *operands))
    {
        ProgramPoint point = ProgramPoint::after(ctx, branch);
        if (!succ.isParent())
        {
            point = ProgramPoint::atStartOf(ctx.entryBlock(succ.region));
            auto &exec = solver.getOrCreate<Executable>(point);
            solver.propagateIfChanged(&exec, exec.markLive());
        }
        auto &preds = solver.getOrCreate<PredecessorState>(point);
        solver.propagateIfChanged(&preds,
                                  preds.joinWithInputs(term, ir::getTerminatorSuccessorOperands(ctx, term, succ)));
    }
}

void DeadCodeAnalysis::visitCallableTerminator(OpId term, OpId callable, DataFlowSolver &solver)
{
    const ir::Context &ctx = solver.context();
    const auto &callsites =
        solver.require<PredecessorState>(ProgramPoint::after(ctx, callable), ProgramPoint::after(ctx, term), this);
    const bool canResolve = ir::isReturnLike(ctx, term);

    for (OpId call : callsites.knownPredecessors())
    {
        assert(ir::isCallOp(ctx, call) && "call site predecessor must be a call");
        auto &returns = solver.getOrCreate<PredecessorState>(ProgramPoint::after(ctx, call));
        if (canResolve)
            solver.propagateIfChanged(&returns, returns.join(term));
        else
            solver.propagateIfChanged(&returns, returns.setHasUnknownPredecessors());
    }
}

void DeadCodeAnalysis::markEdgeLive(BlockId from, BlockId to, DataFlowSolver &solver)
{
    auto &block = solver.getOrCreate<Executable>(ProgramPoint::atStartOf(to));
    solver.propagateIfChanged(&block, block.markLive());

    auto &edge = solver.getOrCreate<Executable>(CfgEdge{from, to});
    ChangeResult changed = edge.markLive();
    if (changed == ChangeResult::Changed)
        support::trace(TraceTopic::DeadCode) << "edge ^bb" << from.index << " -> ^bb" << to.index << " is live\n";
    solver.propagateIfChanged(&edge, changed);
}

void DeadCodeAnalysis::markEntryBlocksLive(OpId op, DataFlowSolver &solver)
{
    const ir::Context &ctx = solver.context();
    for (RegionId region : ctx.op(op).regions)
    {
        BlockId entry = ctx.entryBlock(region);
        if (!entry.isValid())
            continue;
        auto &exec = solver.getOrCreate<Executable>(ProgramPoint::atStartOf(entry));
        solver.propagateIfChanged(&exec, exec.markLive());
    }
}

std::optional<ir::ConstOperands> DeadCodeAnalysis::getOperandValues(OpId op, DataFlowSolver &solver)
{
    ir::ConstOperands operands;
    for (ValueId v : solver.context().op(op).operands)
    {
        auto &lattice = solver.getOrCreate<ConstantValue>(v);
        solver.subscribe(&lattice, this);
        if (lattice.isUninitialized())
            return std::nullopt;
        operands.push_back(lattice.constant());
    }
    return operands;
}

} // namespace strata::analysis::dataflow
