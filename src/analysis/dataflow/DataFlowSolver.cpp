//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: analysis/dataflow/DataFlowSolver.cpp
// Purpose: Implements the fixpoint worklist shared by the dataflow analyses.
// Key invariants: A (point, analysis) pair is queued at most once at a time;
//                 the worklist is processed in FIFO order.
// Ownership/Lifetime: See DataFlowSolver.hpp.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "analysis/dataflow/DataFlowSolver.hpp"

#include "support/trace.hpp"

#include <algorithm>

using strata::support::TraceTopic;

namespace strata::analysis::dataflow
{

DataFlowSolver::DataFlowSolver(const ir::Context &ctx, support::AnalysisOptions options)
    : ctx_(ctx), options_(options)
{
}

support::Expected<void> DataFlowSolver::initializeAndRun(ir::OpId top)
{
    const AnalysisScope scope{top};
    for (auto &analysis : analyses_)
    {
        support::trace(TraceTopic::Dataflow) << "initializing " << analysis->debugName() << "\n";
        auto init = analysis->initialize(scope, *this);
        if (!init)
            return init;
    }

    std::size_t visits = 0;
    while (!worklist_.empty())
    {
        WorkItem item = worklist_.front();
        worklist_.pop_front();
        queued_.erase(item);
        ++visits;

        if (support::traceEnabled(TraceTopic::Dataflow))
            support::trace(TraceTopic::Dataflow)
                << "visiting " << item.point.toString() << " with " << item.analysis->debugName() << "\n";

        auto visited = item.analysis->visit(scope, item.point, *this);
        if (!visited)
            return visited;
    }

    support::trace(TraceTopic::Dataflow) << "fixpoint reached after " << visits << " visits\n";
    return {};
}

void DataFlowSolver::addDependency(AnalysisState *state,
                                   const ir::ProgramPoint &dependent,
                                   DataFlowAnalysis *analysis)
{
    std::vector<WorkItem> &deps = dependents_[state];
    WorkItem item{dependent, analysis};
    if (std::find(deps.begin(), deps.end(), item) == deps.end())
        deps.push_back(item);
}

void DataFlowSolver::subscribe(AnalysisState *state, DataFlowAnalysis *analysis)
{
    std::vector<DataFlowAnalysis *> &subs = subscribers_[state];
    if (std::find(subs.begin(), subs.end(), analysis) == subs.end())
        subs.push_back(analysis);
}

void DataFlowSolver::propagateIfChanged(AnalysisState *state, ChangeResult changed)
{
    if (changed == ChangeResult::Unchanged)
        return;

    if (support::traceEnabled(TraceTopic::Dataflow))
    {
        std::ostream &os = support::trace(TraceTopic::Dataflow);
        os << "state at " << anchorToString(state->anchor()) << " changed: ";
        state->print(os);
        os << "\n";
    }

    if (auto it = dependents_.find(state); it != dependents_.end())
        for (const WorkItem &item : it->second)
            enqueue(item.point, item.analysis);

    if (auto it = subscribers_.find(state); it != subscribers_.end())
        for (DataFlowAnalysis *analysis : it->second)
            enqueueSubscriber(state->anchor(), analysis);
}

void DataFlowSolver::enqueue(const ir::ProgramPoint &point, DataFlowAnalysis *analysis)
{
    WorkItem item{point, analysis};
    if (queued_.insert(item).second)
        worklist_.push_back(item);
}

void DataFlowSolver::enqueueBlock(ir::BlockId block, DataFlowAnalysis *analysis)
{
    std::vector<ir::OpId> ops = ctx_.opsIn(block);
    if (analysis->direction() == Direction::Forward)
    {
        enqueue(ir::ProgramPoint::atStartOf(block), analysis);
        for (ir::OpId op : ops)
            enqueue(ir::ProgramPoint::after(ctx_, op), analysis);
        return;
    }

    enqueue(ir::ProgramPoint::atEndOf(block), analysis);
    for (auto it = ops.rbegin(); it != ops.rend(); ++it)
        enqueue(ir::ProgramPoint::before(ctx_, *it), analysis);
}

void DataFlowSolver::enqueueSubscriber(const LatticeAnchor &anchor, DataFlowAnalysis *analysis)
{
    const bool forward = analysis->direction() == Direction::Forward;

    if (const auto *point = std::get_if<ir::ProgramPoint>(&anchor))
    {
        if (point->isBlockStart())
            enqueueBlock(point->block, analysis);
        else
            enqueue(*point, analysis);
        return;
    }

    if (const auto *value = std::get_if<ir::ValueId>(&anchor))
    {
        for (const ir::OpOperand &use : ctx_.value(*value).uses)
        {
            if (!ctx_.op(use.owner).parent.isValid())
                continue;
            enqueue(forward ? ir::ProgramPoint::after(ctx_, use.owner) : ir::ProgramPoint::before(ctx_, use.owner),
                    analysis);
        }
        return;
    }

    const auto &edge = std::get<CfgEdge>(anchor);
    enqueue(forward ? ir::ProgramPoint::atStartOf(edge.to) : ir::ProgramPoint::atEndOf(edge.from), analysis);
}

} // namespace strata::analysis::dataflow
