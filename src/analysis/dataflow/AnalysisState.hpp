//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: analysis/dataflow/AnalysisState.hpp
// Purpose: Declares lattice anchors and the base class of every state the
//          dataflow solver stores.
// Key invariants: Program point anchors are stored in canonical form, so two
//                 spellings of the same position share one state.
// Ownership/Lifetime: States are owned by the DataFlowSolver that created
//                     them and live as long as the solver.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/Ids.hpp"
#include "ir/ProgramPoint.hpp"

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

namespace strata::ir
{
class Context;
} // namespace strata::ir

namespace strata::analysis::dataflow
{

/// @brief Outcome of a lattice mutation.
enum class ChangeResult
{
    Unchanged,
    Changed
};

inline ChangeResult operator|(ChangeResult lhs, ChangeResult rhs)
{
    return lhs == ChangeResult::Changed ? lhs : rhs;
}

inline ChangeResult &operator|=(ChangeResult &lhs, ChangeResult rhs)
{
    lhs = lhs | rhs;
    return lhs;
}

/// @brief Control-flow edge between two blocks of the same region.
struct CfgEdge
{
    ir::BlockId from;
    ir::BlockId to;

    friend bool operator==(const CfgEdge &, const CfgEdge &) = default;
};

/// @brief Entity a state is attached to.
using LatticeAnchor = std::variant<ir::ProgramPoint, ir::ValueId, CfgEdge>;

struct LatticeAnchorHash
{
    std::size_t operator()(const LatticeAnchor &anchor) const noexcept;
};

/// @brief Rewrite program point anchors to their canonical spelling.
LatticeAnchor canonicalAnchor(const ir::Context &ctx, const LatticeAnchor &anchor);

/// @brief Render @p anchor for traces.
std::string anchorToString(const LatticeAnchor &anchor);

/// @brief Base class of the per-anchor facts computed by an analysis.
class AnalysisState
{
  public:
    explicit AnalysisState(LatticeAnchor anchor) : anchor_(std::move(anchor)) {}

    virtual ~AnalysisState() = default;

    AnalysisState(const AnalysisState &) = delete;
    AnalysisState &operator=(const AnalysisState &) = delete;

    const LatticeAnchor &anchor() const
    {
        return anchor_;
    }

    virtual void print(std::ostream &os) const = 0;

  private:
    LatticeAnchor anchor_;
};

} // namespace strata::analysis::dataflow
