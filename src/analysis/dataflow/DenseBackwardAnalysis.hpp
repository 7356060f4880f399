//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: analysis/dataflow/DenseBackwardAnalysis.hpp
// Purpose: Declares the framework for dense analyses that propagate a lattice
//          value from the end of the program towards its start.
// Key invariants: Only executable blocks are visited. The state before an op
//                 is recomputed from the state after it; the state at the end
//                 of a block joins the contributions of every live successor.
// Ownership/Lifetime: Lattice states are owned by the DataFlowSolver.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "analysis/CFG.hpp"
#include "analysis/dataflow/DeadCodeAnalysis.hpp"
#include "ir/Interfaces.hpp"

#include <utility>

namespace strata::analysis::dataflow
{

/// @brief Analysis state wrapping a lattice value @p T.
/// @tparam T Copyable value with operator== and operator<<.
template <typename T> class Lattice : public AnalysisState
{
  public:
    using AnalysisState::AnalysisState;

    const T &value() const
    {
        return value_;
    }

    /// @brief Replace the value, reporting whether it differs.
    ChangeResult set(T value)
    {
        if (value == value_)
            return ChangeResult::Unchanged;
        value_ = std::move(value);
        return ChangeResult::Changed;
    }

    void print(std::ostream &os) const override
    {
        os << value_;
    }

  private:
    T value_{};
};

/// @brief Kind of control transfer across a call boundary.
enum class CallControlFlowAction
{
    Enter,    ///< From the callee entry to before the call.
    Exit,     ///< From after the call to the end of a callee exit block.
    External, ///< The callee is opaque; treat the call as one operation.
};

/// @brief Backward dense dataflow over the CFG and region control flow.
/// @tparam T Lattice value stored at every program point.
/// @details Subclasses supply the per-operation transfer and the exit state;
///          the edge, region and call transfers default to a plain join.
template <typename T> class DenseBackwardAnalysis : public DataFlowAnalysis
{
  public:
    using State = Lattice<T>;

    Direction direction() const override
    {
        return Direction::Backward;
    }

    support::Expected<void> initialize(const AnalysisScope &scope, DataFlowSolver &solver) override
    {
        for (ir::BlockId block : solver.context().nestedBlocks(scope.top))
        {
            auto &exec = solver.getOrCreate<Executable>(ir::ProgramPoint::atStartOf(block));
            solver.subscribe(&exec, this);
            solver.enqueueBlock(block, this);
        }
        return {};
    }

    support::Expected<void> visit(const AnalysisScope &,
                                  const ir::ProgramPoint &point,
                                  DataFlowSolver &solver) override
    {
        if (point.isBlockEnd())
            visitBlock(point.block, solver);
        else if (point.isBefore())
            processOperation(point.op, solver);
        return {};
    }

  protected:
    /// @brief Compute @p before from the state @p after the plain operation @p op.
    virtual void visitOperation(ir::OpId op, const T &after, T &before, DataFlowSolver &solver) = 0;

    /// @brief State at the end of a block that leaves the analyzed code.
    virtual void setToExitState(T &state) = 0;

    /// @brief Contribute @p after, the state at the start of @p to, to the end of @p from.
    virtual void visitBranchControlFlowTransfer(ir::BlockId /*from*/,
                                                ir::BlockId /*to*/,
                                                const T &after,
                                                T &before,
                                                DataFlowSolver & /*solver*/)
    {
        before.join(after);
    }

    /// @brief Contribute a region control-flow transfer of @p branch.
    /// @details An invalid @p from means control comes from the parent op; an
    ///          invalid @p to means control returns to it.
    virtual void visitRegionBranchControlFlowTransfer(ir::OpId /*branch*/,
                                                      ir::RegionId /*from*/,
                                                      ir::RegionId /*to*/,
                                                      const T &after,
                                                      T &before,
                                                      DataFlowSolver & /*solver*/)
    {
        before.join(after);
    }

    /// @brief Contribute a transfer across the call boundary of @p call.
    virtual void visitCallControlFlowTransfer(ir::OpId /*call*/,
                                              CallControlFlowAction action,
                                              const T &after,
                                              T &before,
                                              DataFlowSolver & /*solver*/)
    {
        before.join(after);
        if (action == CallControlFlowAction::External)
            setToExitState(before);
    }

  private:
    void processOperation(ir::OpId op, DataFlowSolver &solver)
    {
        const ir::Context &ctx = solver.context();
        const ir::BlockId parent = ctx.op(op).parent;
        if (!parent.isValid())
            return;

        const ir::ProgramPoint point = ir::ProgramPoint::before(ctx, op);
        if (!solver.require<Executable>(ir::ProgramPoint::atStartOf(parent), point, this).isLive())
            return;

        const T &after = solver.require<State>(ir::ProgramPoint::after(ctx, op), point, this).value();
        T before{};
        if (ir::isRegionBranchOp(ctx, op))
            visitRegionBranchOperation(point, op, ir::RegionId(), before, solver);
        else if (ir::isCallOp(ctx, op))
            visitCallOperation(point, op, after, before, solver);
        else
            visitOperation(op, after, before, solver);

        auto &state = solver.getOrCreate<State>(point);
        solver.propagateIfChanged(&state, state.set(std::move(before)));
    }

    void visitBlock(ir::BlockId block, DataFlowSolver &solver)
    {
        const ir::Context &ctx = solver.context();
        const ir::ProgramPoint point = ir::ProgramPoint::atEndOf(block);
        if (!solver.require<Executable>(ir::ProgramPoint::atStartOf(block), point, this).isLive())
            return;

        T before{};
        const ir::OpId term = ctx.block(block).last;
        const bool exitsRegion = !term.isValid() || ctx.op(term).successors.empty();
        if (exitsRegion)
        {
            visitRegionExit(point, block, before, solver);
        }
        else
        {
            for (ir::BlockId succ : successors(ctx, block))
            {
                if (!solver.require<Executable>(CfgEdge{block, succ}, point, this).isLive())
                    continue;
                const T &after = solver.require<State>(ir::ProgramPoint::atStartOf(succ), point, this).value();
                visitBranchControlFlowTransfer(block, succ, after, before, solver);
            }
        }

        auto &state = solver.getOrCreate<State>(point);
        solver.propagateIfChanged(&state, state.set(std::move(before)));
    }

    void visitRegionExit(const ir::ProgramPoint &point, ir::BlockId block, T &before, DataFlowSolver &solver)
    {
        const ir::Context &ctx = solver.context();
        const ir::RegionId region = ctx.block(block).parent;
        const ir::OpId parentOp = ctx.region(region).parentOp;
        if (!parentOp.isValid())
        {
            setToExitState(before);
            return;
        }

        if (ir::isCallableOp(ctx, parentOp) && ir::callableRegion(ctx, parentOp) == region)
        {
            const auto &callsites =
                solver.require<PredecessorState>(ir::ProgramPoint::after(ctx, parentOp), point, this);
            if (!callsites.allPredecessorsKnown() || !solver.options().interprocedural)
            {
                setToExitState(before);
                return;
            }
            for (ir::OpId call : callsites.knownPredecessors())
            {
                const T &after = solver.require<State>(ir::ProgramPoint::after(ctx, call), point, this).value();
                visitCallControlFlowTransfer(call, CallControlFlowAction::Exit, after, before, solver);
            }
            return;
        }

        if (ir::isRegionBranchOp(ctx, parentOp))
        {
            visitRegionBranchOperation(point, parentOp, region, before, solver);
            return;
        }

        setToExitState(before);
    }

    void visitRegionBranchOperation(const ir::ProgramPoint &point,
                                    ir::OpId branch,
                                    ir::RegionId from,
                                    T &before,
                                    DataFlowSolver &solver)
    {
        const ir::Context &ctx = solver.context();
        for (const ir::RegionSuccessor &succ : ir::getSuccessorRegions(ctx, branch, from))
        {
            ir::ProgramPoint target = ir::ProgramPoint::after(ctx, branch);
            if (!succ.isParent())
            {
                target = ir::ProgramPoint::atStartOf(ctx.entryBlock(succ.region));
                if (!solver.require<Executable>(target, point, this).isLive())
                    continue;
            }
            const T &after = solver.require<State>(target, point, this).value();
            visitRegionBranchControlFlowTransfer(branch, from, succ.region, after, before, solver);
        }
    }

    void visitCallOperation(const ir::ProgramPoint &point,
                            ir::OpId call,
                            const T &after,
                            T &before,
                            DataFlowSolver &solver)
    {
        const ir::Context &ctx = solver.context();
        const ir::OpId callee = ir::resolveCallee(ctx, call);
        const ir::BlockId entry = callee.isValid() ? ctx.entryBlock(ir::callableRegion(ctx, callee)) : ir::BlockId();
        if (!entry.isValid() || !solver.options().interprocedural)
        {
            visitCallControlFlowTransfer(call, CallControlFlowAction::External, after, before, solver);
            return;
        }

        const T &atEntry = solver.require<State>(ir::ProgramPoint::atStartOf(entry), point, this).value();
        visitCallControlFlowTransfer(call, CallControlFlowAction::Enter, atEntry, before, solver);
    }
};

} // namespace strata::analysis::dataflow
