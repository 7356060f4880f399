//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: analysis/DominanceInfo.hpp
// Purpose: Dominance between operations and values across nested regions,
//          backed by one lazily built dominator tree per region.
// Key invariants: Queries between entities in different regions are answered
//                 by hoisting the dominated entity to its ancestor in the
//                 dominating entity's region.
// Ownership/Lifetime: Owns its trees; borrows the Context. Trees for regions
//                     whose CFG changes must be invalidated or updated.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "analysis/DominatorTree.hpp"

#include <memory>
#include <unordered_map>

namespace strata::analysis
{

/// @brief Dominance queries for every region nested under an operation.
class DominanceInfo
{
  public:
    DominanceInfo(const ir::Context &ctx, ir::OpId top, const support::AnalysisOptions &options = {});

    ir::OpId top() const
    {
        return top_;
    }

    /// @brief Dominator tree of @p region, built on first use.
    /// @return nullptr when @p region has no blocks.
    DominatorTree *tree(ir::RegionId region) const;

    /// @brief Discard the cached tree of @p region.
    void invalidate(ir::RegionId region);

    /// @brief Discard every cached tree.
    void invalidate();

    bool dominates(ir::BlockId a, ir::BlockId b) const;
    bool properlyDominates(ir::BlockId a, ir::BlockId b) const;

    /// @brief True when @p a executes before @p b on every path reaching @p b.
    /// @param enclosingOpOk Whether an op properly dominates the ops nested in its regions.
    bool properlyDominates(ir::OpId a, ir::OpId b, bool enclosingOpOk = true) const;

    bool dominates(ir::OpId a, ir::OpId b) const
    {
        return a == b || properlyDominates(a, b);
    }

    /// @brief True when @p value is available immediately before @p op.
    bool properlyDominates(ir::ValueId value, ir::OpId op) const;

  private:
    /// Ancestor of @p op whose parent region is @p region, if any.
    ir::OpId ancestorInRegion(ir::RegionId region, ir::OpId op) const;

    /// Ancestor of @p block whose parent region is @p region, if any.
    ir::BlockId ancestorBlockInRegion(ir::RegionId region, ir::BlockId block) const;

    const ir::Context &ctx_;
    ir::OpId top_;
    support::AnalysisOptions options_;
    mutable std::unordered_map<ir::RegionId, std::unique_ptr<DominatorTree>> trees_;
};

} // namespace strata::analysis
