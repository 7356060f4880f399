//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: transform/StackSpillLowering.hpp
// Purpose: Declares a TransformSpillsInterface host that keeps every spilled
//          value in its own frame slot, lowering spills to local.store and
//          reloads to local.load.
// Key invariants: Slots are numbered from 0 in the order values are first
//                 stored or loaded and are never reused.
// Ownership/Lifetime: Holds no IR; the slot table lives as long as the host.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "transform/TransformSpills.hpp"

#include <cstdint>
#include <map>

namespace strata::transform
{

class StackSpillLowering final : public TransformSpillsInterface
{
  public:
    support::Expected<void> createUnconditionalBranch(ir::Builder &builder,
                                                      ir::BlockId dest,
                                                      const std::vector<ir::ValueId> &args,
                                                      support::SourceLoc loc) override;

    support::Expected<ir::OpId> createSpill(ir::Builder &builder, ir::ValueId value, support::SourceLoc loc) override;

    support::Expected<ir::OpId> createReload(ir::Builder &builder, ir::ValueId value, support::SourceLoc loc) override;

    support::Expected<void> convertSpillToStore(ir::Builder &builder, ir::OpId spill) override;

    support::Expected<void> convertReloadToLoad(ir::Builder &builder, ir::OpId reload) override;

    /// @brief Frame slot of @p value, allocated on first request.
    int64_t slotFor(ir::ValueId value);

    /// @brief Number of slots allocated so far.
    std::size_t numSlots() const
    {
        return slots_.size();
    }

  private:
    std::map<ir::ValueId, int64_t> slots_;
};

} // namespace strata::transform
