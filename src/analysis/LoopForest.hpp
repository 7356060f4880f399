//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: analysis/LoopForest.hpp
// Purpose: Natural loop discovery for every multi-block region nested under
//          an operation, with loop-exit edge queries.
// Key invariants: A loop is identified by its header; a back edge is an edge
//                 whose target dominates its source. Loops sharing a header
//                 are merged. Each loop's parent is the smallest loop that
//                 contains all of its blocks.
// Ownership/Lifetime: Owns the loop nodes; children are owned by parents.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "analysis/DominanceInfo.hpp"

#include <memory>
#include <vector>

namespace strata::analysis
{

/// @brief Natural loop rooted at a header block.
struct Loop
{
    ir::BlockId header;                          ///< Loop entry block dominating the body.
    std::vector<ir::BlockId> blocks;             ///< Blocks participating in the loop.
    std::vector<ir::BlockId> latches;            ///< Blocks with back edges to the header.
    std::vector<ir::BlockId> exits;              ///< Successors that leave the loop.
    Loop *parent = nullptr;                      ///< Immediate parent loop or nullptr.
    std::vector<std::unique_ptr<Loop>> children; ///< Nested child loops.

    bool contains(ir::BlockId block) const;
};

/// @brief Loop forests of all regions nested under an operation.
class LoopForest
{
  public:
    /// @brief Discover the natural loops of every region under @p dom.top().
    static LoopForest compute(const ir::Context &ctx, const DominanceInfo &dom);

    /// @brief Innermost loop containing @p block, or nullptr.
    const Loop *getLoopFor(ir::BlockId block) const;

    /// @brief True when the CFG edge @p from -> @p to leaves a loop containing @p from.
    bool isLoopExit(ir::BlockId from, ir::BlockId to) const;

    const std::vector<std::unique_ptr<Loop>> &topLevelLoops() const
    {
        return topLevel_;
    }

  private:
    std::vector<std::unique_ptr<Loop>> topLevel_;
};

} // namespace strata::analysis
