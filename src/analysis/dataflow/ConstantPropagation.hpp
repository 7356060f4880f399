//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: analysis/dataflow/ConstantPropagation.hpp
// Purpose: Declares the per-value constant lattice and the sparse forward
//          analysis that computes it.
// Key invariants: Uninitialized < Constant < Overdefined; a value only moves
//                 up the lattice.
// Ownership/Lifetime: States are owned by the DataFlowSolver.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "analysis/dataflow/DataFlowSolver.hpp"

#include <cstdint>
#include <optional>

namespace strata::analysis::dataflow
{

/// @brief Three-point constant lattice attached to an SSA value.
class ConstantValue : public AnalysisState
{
  public:
    using AnalysisState::AnalysisState;

    bool isUninitialized() const
    {
        return kind_ == Kind::Uninitialized;
    }

    bool isConstant() const
    {
        return kind_ == Kind::Constant;
    }

    bool isOverdefined() const
    {
        return kind_ == Kind::Overdefined;
    }

    /// @brief Known constant, or nullopt when uninitialized or overdefined.
    std::optional<int64_t> constant() const
    {
        if (kind_ == Kind::Constant)
            return value_;
        return std::nullopt;
    }

    /// @brief Least upper bound with @p rhs.
    ChangeResult join(const ConstantValue &rhs);

    /// @brief Least upper bound with the constant @p value.
    ChangeResult joinConstant(int64_t value);

    ChangeResult markOverdefined();

    void print(std::ostream &os) const override;

  private:
    enum class Kind
    {
        Uninitialized,
        Constant,
        Overdefined
    };

    Kind kind_ = Kind::Uninitialized;
    int64_t value_ = 0;
};

/// @brief Sparse forward constant propagation over executable blocks.
/// @details Folds constant and integer arithmetic/compare ops, and joins
///          block parameters over the incoming edges dead-code analysis
///          proved executable. Region and function entry parameters are
///          overdefined.
class SparseConstantPropagation : public DataFlowAnalysis
{
  public:
    const char *debugName() const override
    {
        return "constant-propagation";
    }

    support::Expected<void> initialize(const AnalysisScope &scope, DataFlowSolver &solver) override;

    support::Expected<void> visit(const AnalysisScope &scope,
                                  const ir::ProgramPoint &point,
                                  DataFlowSolver &solver) override;

  private:
    void visitBlock(ir::BlockId block, DataFlowSolver &solver);
    void visitOperation(ir::OpId op, DataFlowSolver &solver);
    void markAllOverdefined(const std::vector<ir::ValueId> &values, DataFlowSolver &solver);
};

} // namespace strata::analysis::dataflow
