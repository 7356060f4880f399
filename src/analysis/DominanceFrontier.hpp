//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: analysis/DominanceFrontier.hpp
// Purpose: Dominance frontiers of a region and iterated frontiers for phi
//          placement.
// Key invariants: Y is in DF(X) when X dominates a predecessor of Y but does
//                 not strictly dominate Y. Blocks unreachable from the entry
//                 have empty frontiers.
// Ownership/Lifetime: Snapshot computed from a dominator tree; recompute after
//                     the CFG changes.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "analysis/DominatorTree.hpp"

#include <unordered_map>
#include <vector>

namespace strata::analysis
{

/// @brief Dominance frontier of every block of a region.
class DominanceFrontier
{
  public:
    DominanceFrontier(const ir::Context &ctx, const DominatorTree &tree);

    /// @brief DF(@p block), in discovery order.
    const std::vector<ir::BlockId> &frontier(ir::BlockId block) const;

    /// @brief Iterated frontier DF+(@p block).
    std::vector<ir::BlockId> iterate(ir::BlockId block) const
    {
        return iterateAll({block});
    }

    /// @brief Iterated frontier DF+ of a set of blocks.
    /// @details Seeds appear in the result only when they lie in the frontier
    ///          of some block of the closure.
    std::vector<ir::BlockId> iterateAll(const std::vector<ir::BlockId> &seeds) const;

  private:
    std::unordered_map<ir::BlockId, std::vector<ir::BlockId>> frontiers_;
};

} // namespace strata::analysis
