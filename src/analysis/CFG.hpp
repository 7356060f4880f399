//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: analysis/CFG.hpp
// Purpose: Control-flow graph queries over the blocks of a single region.
// Key invariants: Edges mirror terminator successors; duplicate edges
//                 between the same pair of blocks are reported once;
//                 postorder is deterministic for a fixed block order.
// Ownership/Lifetime: CFG snapshots borrow the Context and must be rebuilt
//                     after the region's edges change.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/Context.hpp"

#include <cstddef>
#include <unordered_map>
#include <vector>

namespace strata::analysis
{

/// @brief Distinct successor blocks of @p block in terminator order.
std::vector<ir::BlockId> successors(const ir::Context &ctx, ir::BlockId block);

/// @brief Distinct predecessor blocks of @p block in edge creation order.
std::vector<ir::BlockId> predecessors(const ir::Context &ctx, ir::BlockId block);

/// @brief Snapshot of a region's control-flow graph.
/// Provides predecessor/successor queries and postorder numbering.
class CFG
{
  public:
    /// @brief Build the CFG of @p region.
    CFG(const ir::Context &ctx, ir::RegionId region);

    const std::vector<ir::BlockId> &successors(ir::BlockId bb) const;

    const std::vector<ir::BlockId> &predecessors(ir::BlockId bb) const;

    /// @brief Postorder index of @p bb (0-based, entry has the highest index).
    /// @return SIZE_MAX for blocks unreachable from the entry.
    std::size_t postorderIndex(ir::BlockId bb) const;

    /// @brief Reachable blocks in postorder (leaves first, entry last).
    const std::vector<ir::BlockId> &postorderBlocks() const
    {
        return postorder_;
    }

    /// @brief Reachable blocks in reverse postorder (entry first).
    std::vector<ir::BlockId> reversePostorder() const;

  private:
    void compute(const ir::Context &ctx, ir::RegionId region);

    std::unordered_map<ir::BlockId, std::vector<ir::BlockId>> succ_;
    std::unordered_map<ir::BlockId, std::vector<ir::BlockId>> pred_;
    std::vector<ir::BlockId> postorder_;
    std::unordered_map<ir::BlockId, std::size_t> postIndex_;
};

} // namespace strata::analysis
