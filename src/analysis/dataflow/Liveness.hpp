//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: analysis/dataflow/Liveness.hpp
// Purpose: Declares next-use distance liveness and its query surface.
// Key invariants: Distances saturate at NextUseSet::kDead. Edges leaving a
//                 loop add AnalysisOptions::loopExitDistance. Only blocks
//                 proven executable carry liveness facts.
// Ownership/Lifetime: LivenessAnalysis owns its solver and loop forest; the
//                     Context must outlive it and must not be mutated while
//                     results are queried.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "analysis/LoopForest.hpp"
#include "analysis/dataflow/DenseBackwardAnalysis.hpp"
#include "analysis/dataflow/NextUseSet.hpp"

#include <memory>

namespace strata::analysis::dataflow
{

/// @brief Backward dense analysis computing a NextUseSet at every program point.
/// @details Walking an operation bottom-up increments every distance, drops
///          the op's results and resets its operands to distance 0. Across a
///          CFG edge the successor's parameters are dropped and the loop exit
///          penalty is applied. Structured region transfers follow the same
///          rules so that `while` behaves like an unstructured loop.
class NextUseAnalysis : public DenseBackwardAnalysis<NextUseSet>
{
  public:
    explicit NextUseAnalysis(const LoopForest &loops) : loops_(loops) {}

    const char *debugName() const override
    {
        return "liveness";
    }

  protected:
    void visitOperation(ir::OpId op, const NextUseSet &after, NextUseSet &before, DataFlowSolver &solver) override;

    void setToExitState(NextUseSet &state) override
    {
        state.clear();
    }

    void visitBranchControlFlowTransfer(ir::BlockId from,
                                        ir::BlockId to,
                                        const NextUseSet &after,
                                        NextUseSet &before,
                                        DataFlowSolver &solver) override;

    void visitRegionBranchControlFlowTransfer(ir::OpId branch,
                                              ir::RegionId from,
                                              ir::RegionId to,
                                              const NextUseSet &after,
                                              NextUseSet &before,
                                              DataFlowSolver &solver) override;

    void visitCallControlFlowTransfer(ir::OpId call,
                                      CallControlFlowAction action,
                                      const NextUseSet &after,
                                      NextUseSet &before,
                                      DataFlowSolver &solver) override;

  private:
    const LoopForest &loops_;
};

/// @brief Liveness and next-use results for every program point under an op.
/// @details Runs dead-code analysis, sparse constant propagation and
///          NextUseAnalysis to a fixpoint in one solver.
class LivenessAnalysis
{
  public:
    /// @brief Analyze @p op and everything nested in it.
    /// @return The first analysis error, if any.
    /// @throws support::InternalCompilerError when interprocedural propagation
    ///         is requested across a call to a defined function.
    static support::Expected<LivenessAnalysis> compute(const ir::Context &ctx,
                                                       ir::OpId op,
                                                       const support::AnalysisOptions &options = {});

    bool isLiveAtStart(ir::ValueId value, ir::BlockId block) const;
    bool isLiveAtEnd(ir::ValueId value, ir::BlockId block) const;
    bool isLiveBefore(ir::ValueId value, ir::OpId op) const;
    bool isLiveAfter(ir::ValueId value, ir::OpId op) const;

    /// @brief True when @p value is live after @p op, or at the start of any
    ///        executable region @p op enters.
    bool isLiveAfterEntry(ir::ValueId value, ir::OpId op) const;

    /// @brief Distance from the point after @p op to the next use of @p value.
    /// @return NextUseSet::kDead when the value is dead or unknown there.
    uint32_t nextUseAfter(ir::ValueId value, ir::OpId op) const;

    /// @brief Report whether dead-code analysis left @p block executable.
    /// @details Blocks the analysis never saw are assumed executable.
    bool isBlockExecutable(ir::BlockId block) const;

    /// @brief Next-use set at @p point, or nullptr when it was never computed.
    const NextUseSet *nextUsesAt(const ir::ProgramPoint &point) const;

    const DataFlowSolver &solver() const
    {
        return *solver_;
    }

    ir::OpId op() const
    {
        return op_;
    }

  private:
    LivenessAnalysis(const ir::Context &ctx, ir::OpId op) : ctx_(&ctx), op_(op) {}

    const ir::Context *ctx_;
    ir::OpId op_;
    std::unique_ptr<LoopForest> loops_;
    std::unique_ptr<DataFlowSolver> solver_;
};

} // namespace strata::analysis::dataflow
