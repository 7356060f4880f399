//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: analysis/dataflow/Liveness.cpp
// Purpose: Implements next-use distance transfer functions and the liveness
//          query surface.
// Key invariants: A value defined by an op is recorded as dead immediately
//                 before the op that follows its definition when nothing
//                 uses it, so every defined value has an entry.
// Ownership/Lifetime: See Liveness.hpp.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "analysis/dataflow/Liveness.hpp"

#include "analysis/dataflow/ConstantPropagation.hpp"
#include "support/fatal.hpp"
#include "support/trace.hpp"

using strata::ir::BlockId;
using strata::ir::OpId;
using strata::ir::ProgramPoint;
using strata::ir::RegionId;
using strata::ir::ValueId;

namespace strata::analysis::dataflow
{
namespace
{

/// Record the values defined immediately before @p op as known but unused.
void definePrecedingValues(const ir::Context &ctx, OpId op, NextUseSet &set)
{
    const ir::Operation &o = ctx.op(op);
    const std::vector<ValueId> &defs = o.prev.isValid() ? ctx.op(o.prev).results : ctx.block(o.parent).params;
    for (ValueId v : defs)
        set.insert(v, NextUseSet::kDead);
}

void useOperands(const ir::Context &ctx, OpId op, NextUseSet &set)
{
    for (const ir::OpOperand &ref : ctx.operandRefs(op))
        set.insert(ctx.operandValue(ref), 0);
}

void removeAll(const std::vector<ValueId> &values, NextUseSet &set)
{
    for (ValueId v : values)
        set.remove(v);
}

void removeEntryParams(const ir::Context &ctx, RegionId region, NextUseSet &set)
{
    const BlockId entry = ctx.entryBlock(region);
    if (entry.isValid())
        removeAll(ctx.block(entry).params, set);
}

} // namespace

//===----------------------------------------------------------------------===//
// NextUseAnalysis
//===----------------------------------------------------------------------===//

void NextUseAnalysis::visitOperation(OpId op, const NextUseSet &after, NextUseSet &before, DataFlowSolver &solver)
{
    const ir::Context &ctx = solver.context();
    NextUseSet live = after;
    live.incrementAll(1);
    removeAll(ctx.op(op).results, live);
    useOperands(ctx, op, live);
    definePrecedingValues(ctx, op, live);
    before.join(live);
}

void NextUseAnalysis::visitBranchControlFlowTransfer(BlockId from,
                                                     BlockId to,
                                                     const NextUseSet &after,
                                                     NextUseSet &before,
                                                     DataFlowSolver &solver)
{
    const ir::Context &ctx = solver.context();
    NextUseSet live = after;
    removeAll(ctx.block(to).params, live);
    if (loops_.isLoopExit(from, to))
    {
        live.incrementAll(solver.options().loopExitDistance);
        support::trace(support::TraceTopic::Liveness)
            << "loop exit ^bb" << from.index << " -> ^bb" << to.index << "\n";
    }
    before.join(live);
}

void NextUseAnalysis::visitRegionBranchControlFlowTransfer(OpId branch,
                                                           RegionId from,
                                                           RegionId to,
                                                           const NextUseSet &after,
                                                           NextUseSet &before,
                                                           DataFlowSolver &solver)
{
    const ir::Context &ctx = solver.context();
    const uint32_t penalty = solver.options().loopExitDistance;
    NextUseSet live = after;

    if (!from.isValid() && !to.isValid())
    {
        // The op skips all of its regions.
        NextUseSet skipped;
        visitOperation(branch, after, skipped, solver);
        before.join(skipped);
        return;
    }

    if (!from.isValid())
    {
        // Entering a region from before the op.
        removeEntryParams(ctx, to, live);
        removeAll(ctx.op(branch).results, live);
        useOperands(ctx, branch, live);
        definePrecedingValues(ctx, branch, live);
        before.join(live);
        return;
    }

    if (!to.isValid())
    {
        // Returning to the parent after the op.
        if (ir::isRepetitiveRegion(ctx, from))
            live.incrementAll(penalty);
        removeAll(ctx.op(branch).results, live);
        before.join(live);
        return;
    }

    removeEntryParams(ctx, to, live);
    if (ir::isRepetitiveRegion(ctx, from) && !ir::isRepetitiveRegion(ctx, to))
        live.incrementAll(penalty);
    before.join(live);
}

void NextUseAnalysis::visitCallControlFlowTransfer(OpId call,
                                                   CallControlFlowAction action,
                                                   const NextUseSet &after,
                                                   NextUseSet &before,
                                                   DataFlowSolver &solver)
{
    if (action != CallControlFlowAction::External)
        support::unimplemented("interprocedural liveness analysis");
    visitOperation(call, after, before, solver);
}

//===----------------------------------------------------------------------===//
// LivenessAnalysis
//===----------------------------------------------------------------------===//

support::Expected<LivenessAnalysis> LivenessAnalysis::compute(const ir::Context &ctx,
                                                              OpId op,
                                                              const support::AnalysisOptions &options)
{
    LivenessAnalysis result(ctx, op);
    DominanceInfo dom(ctx, op, options);
    result.loops_ = std::make_unique<LoopForest>(LoopForest::compute(ctx, dom));
    result.solver_ = std::make_unique<DataFlowSolver>(ctx, options);
    result.solver_->load<DeadCodeAnalysis>();
    result.solver_->load<SparseConstantPropagation>();
    result.solver_->load<NextUseAnalysis>(*result.loops_);

    auto ran = result.solver_->initializeAndRun(op);
    if (!ran)
        return ran.error();
    return result;
}

const NextUseSet *LivenessAnalysis::nextUsesAt(const ProgramPoint &point) const
{
    const auto *state = solver_->lookup<NextUseAnalysis::State>(point);
    return state ? &state->value() : nullptr;
}

bool LivenessAnalysis::isLiveAtStart(ValueId value, BlockId block) const
{
    const NextUseSet *set = nextUsesAt(ProgramPoint::atStartOf(block));
    return set && set->isLive(value);
}

bool LivenessAnalysis::isLiveAtEnd(ValueId value, BlockId block) const
{
    const NextUseSet *set = nextUsesAt(ProgramPoint::atEndOf(block));
    return set && set->isLive(value);
}

bool LivenessAnalysis::isLiveBefore(ValueId value, OpId op) const
{
    const NextUseSet *set = nextUsesAt(ProgramPoint::before(*ctx_, op));
    return set && set->isLive(value);
}

bool LivenessAnalysis::isLiveAfter(ValueId value, OpId op) const
{
    const NextUseSet *set = nextUsesAt(ProgramPoint::after(*ctx_, op));
    return set && set->isLive(value);
}

bool LivenessAnalysis::isLiveAfterEntry(ValueId value, OpId op) const
{
    if (isLiveAfter(value, op))
        return true;
    if (!ir::isRegionBranchOp(*ctx_, op))
        return false;
    for (const ir::RegionSuccessor &succ : ir::getSuccessorRegions(*ctx_, op, RegionId()))
    {
        if (succ.isParent())
            continue;
        const BlockId entry = ctx_->entryBlock(succ.region);
        if (entry.isValid() && isBlockExecutable(entry) && isLiveAtStart(value, entry))
            return true;
    }
    return false;
}

uint32_t LivenessAnalysis::nextUseAfter(ValueId value, OpId op) const
{
    const NextUseSet *set = nextUsesAt(ProgramPoint::after(*ctx_, op));
    return set ? set->distance(value) : NextUseSet::kDead;
}

bool LivenessAnalysis::isBlockExecutable(BlockId block) const
{
    const auto *exec = solver_->lookup<Executable>(ProgramPoint::atStartOf(block));
    return !exec || exec->isLive();
}

} // namespace strata::analysis::dataflow
