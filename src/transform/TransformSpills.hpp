//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: transform/TransformSpills.hpp
// Purpose: Declares the rewrite that materializes a SpillAnalysis: it splits
//          edges, inserts spill and reload pseudo-ops, reconnects uses of
//          spilled values to the closest reload or inserted block parameter,
//          and lowers the surviving pseudo-ops to memory operations.
// Key invariants: After the rewrite every use of a spilled value is reached by
//                 exactly one definition: the original, a reload, or a block
//                 parameter merging them. Spills that feed no used reload and
//                 unused reloads are erased.
// Ownership/Lifetime: The transform mutates the Context in place and fills in
//                     the materialized ids of the SpillAnalysis records.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/Builder.hpp"
#include "support/diag_expected.hpp"
#include "transform/AnalysisManager.hpp"
#include "transform/SpillAnalysis.hpp"

#include <vector>

namespace strata::transform
{

/// @brief Host hooks the spill rewrite uses to build and lower IR.
/// @details The rewrite only recognizes the spill pseudo-ops through
///          ir::matchSpillPseudo; everything it creates goes through this
///          interface so hosts decide how branches and memory accesses look.
class TransformSpillsInterface
{
  public:
    virtual ~TransformSpillsInterface() = default;

    /// @brief Terminate the block at the builder's insertion point with a jump
    ///        to @p dest forwarding @p args.
    virtual support::Expected<void> createUnconditionalBranch(ir::Builder &builder,
                                                              ir::BlockId dest,
                                                              const std::vector<ir::ValueId> &args,
                                                              support::SourceLoc loc) = 0;

    /// @brief Insert a spill-like op for @p value at the builder's insertion point.
    virtual support::Expected<ir::OpId> createSpill(ir::Builder &builder, ir::ValueId value, support::SourceLoc loc) = 0;

    /// @brief Insert a reload-like op for @p value at the builder's insertion point.
    virtual support::Expected<ir::OpId> createReload(ir::Builder &builder, ir::ValueId value, support::SourceLoc loc) = 0;

    /// @brief Replace spill-like op @p spill by a store of the spilled value.
    virtual support::Expected<void> convertSpillToStore(ir::Builder &builder, ir::OpId spill) = 0;

    /// @brief Replace reload-like op @p reload by a load producing its result.
    virtual support::Expected<void> convertReloadToLoad(ir::Builder &builder, ir::OpId reload) = 0;
};

/// @brief Apply @p analysis to the single-region op @p op.
/// @param analyses Supplies the dominance of @p op; results for @p op are
///        invalidated when the IR changes.
/// @return PassStatus::Changed when anything was rewritten, or the first
///         error reported by @p iface or by an analysis.
/// @throws support::InternalCompilerError for shapes the rewrite does not
///         support: roots with several regions, splits of region control-flow
///         edges and multi-block nested regions.
support::Expected<PassStatus> transformSpills(ir::Context &ctx,
                                              ir::OpId op,
                                              SpillAnalysis &analysis,
                                              TransformSpillsInterface &iface,
                                              AnalysisManager &analyses);

} // namespace strata::transform
