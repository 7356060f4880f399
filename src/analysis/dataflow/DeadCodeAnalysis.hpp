//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: analysis/dataflow/DeadCodeAnalysis.hpp
// Purpose: Declares the executability lattices and the forward analysis that
//          decides which blocks, CFG edges and control-flow predecessors are
//          live.
// Key invariants: Blocks and edges start dead and are only ever marked live;
//                 predecessor sets only grow.
// Ownership/Lifetime: States are owned by the DataFlowSolver.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "analysis/dataflow/DataFlowSolver.hpp"
#include "ir/Interfaces.hpp"

#include <unordered_map>
#include <vector>

namespace strata::analysis::dataflow
{

/// @brief Liveness of a block (anchored at its start) or of a CFG edge.
class Executable : public AnalysisState
{
  public:
    using AnalysisState::AnalysisState;

    bool isLive() const
    {
        return live_;
    }

    ChangeResult markLive()
    {
        if (live_)
            return ChangeResult::Unchanged;
        live_ = true;
        return ChangeResult::Changed;
    }

    void print(std::ostream &os) const override
    {
        os << (live_ ? "live" : "dead");
    }

  private:
    bool live_ = false;
};

/// @brief Control-flow predecessors of a program point.
/// @details Attached to the point after a callable (its call sites), after a
///          call or region branch op (the terminators returning to it), and
///          to region entry blocks (the ops entering them). Optionally records
///          the values each predecessor forwards.
class PredecessorState : public AnalysisState
{
  public:
    using AnalysisState::AnalysisState;

    bool allPredecessorsKnown() const
    {
        return allKnown_;
    }

    const std::vector<ir::OpId> &knownPredecessors() const
    {
        return known_;
    }

    /// @brief Values forwarded by @p predecessor; empty when none were recorded.
    const std::vector<ir::ValueId> &successorInputs(ir::OpId predecessor) const;

    ChangeResult setHasUnknownPredecessors();

    ChangeResult join(ir::OpId predecessor);

    ChangeResult joinWithInputs(ir::OpId predecessor, std::vector<ir::ValueId> inputs);

    void print(std::ostream &os) const override;

  private:
    bool allKnown_ = true;
    std::vector<ir::OpId> known_;
    std::unordered_map<ir::OpId, std::vector<ir::ValueId>> inputs_;
};

/// @brief Forward analysis of block, edge and call graph liveness.
/// @details Uses ConstantValue states of branch operands to resolve which
///          successors and regions can execute. Region branch ops and
///          callables get PredecessorState information for their entries and
///          returns.
class DeadCodeAnalysis : public DataFlowAnalysis
{
  public:
    const char *debugName() const override
    {
        return "dead-code";
    }

    support::Expected<void> initialize(const AnalysisScope &scope, DataFlowSolver &solver) override;

    support::Expected<void> visit(const AnalysisScope &scope,
                                  const ir::ProgramPoint &point,
                                  DataFlowSolver &solver) override;

  private:
    void initializeCallableSymbols(const AnalysisScope &scope, DataFlowSolver &solver);
    support::Expected<void> initializeRecursively(const AnalysisScope &scope,
                                                  ir::OpId op,
                                                  DataFlowSolver &solver);

    void visitCallOperation(const AnalysisScope &scope, ir::OpId call, DataFlowSolver &solver);
    void visitBranchOperation(ir::OpId branch, DataFlowSolver &solver);
    void visitRegionBranchOperation(ir::OpId branch, DataFlowSolver &solver);
    void visitRegionTerminator(ir::OpId term, ir::OpId branch, DataFlowSolver &solver);
    void visitCallableTerminator(ir::OpId term, ir::OpId callable, DataFlowSolver &solver);

    void markEdgeLive(ir::BlockId from, ir::BlockId to, DataFlowSolver &solver);
    void markEntryBlocksLive(ir::OpId op, DataFlowSolver &solver);

    /// @brief Constant operand values of @p op, subscribing to each one.
    /// @return nullopt while any operand is still uninitialized.
    std::optional<ir::ConstOperands> getOperandValues(ir::OpId op, DataFlowSolver &solver);
};

/// @brief Report whether @p op returns from a region branch region or a callable.
bool isRegionOrCallableReturn(const ir::Context &ctx, ir::OpId op);

} // namespace strata::analysis::dataflow
