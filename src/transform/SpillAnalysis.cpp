//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: transform/SpillAnalysis.cpp
// Purpose: Implements recording and lookup of spill placement decisions.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "transform/SpillAnalysis.hpp"

#include <algorithm>
#include <cassert>

namespace strata::transform
{

SplitId SpillAnalysis::addSplit(const SplitEdge &edge)
{
    for (const SplitInfo &info : splits_)
        if (info.edge == edge)
            return info.id;

    SplitId id{static_cast<uint32_t>(splits_.size())};
    splits_.push_back(SplitInfo{id, edge, ir::BlockId()});
    return id;
}

SplitId SpillAnalysis::addSplit(const ir::Context &ctx, ir::OpId terminator, uint32_t successor)
{
    const ir::Operation &term = ctx.op(terminator);
    assert(successor < term.successors.size() && "successor index out of range");
    return addSplit(LocalEdge{term.parent, term.successors[successor].dest, terminator, successor});
}

uint32_t SpillAnalysis::addSpill(const Placement &placement, ir::ValueId value, support::SourceLoc loc)
{
    const auto id = static_cast<uint32_t>(spills_.size());
    spills_.push_back(SpillInfo{id, placement, value, loc, ir::OpId()});
    spilled_.insert(value);
    return id;
}

uint32_t SpillAnalysis::addReload(const Placement &placement, ir::ValueId value, support::SourceLoc loc)
{
    const auto id = static_cast<uint32_t>(reloads_.size());
    reloads_.push_back(ReloadInfo{id, placement, value, loc, ir::OpId()});
    return id;
}

bool SpillAnalysis::isReloaded(ir::ValueId value) const
{
    return std::any_of(reloads_.begin(), reloads_.end(), [&](const ReloadInfo &r) { return r.value == value; });
}

bool SpillAnalysis::isSpilledAt(ir::ValueId value, const Placement &placement) const
{
    return std::any_of(spills_.begin(),
                       spills_.end(),
                       [&](const SpillInfo &s) { return s.value == value && s.placement == placement; });
}

bool SpillAnalysis::isReloadedAt(ir::ValueId value, const Placement &placement) const
{
    return std::any_of(reloads_.begin(),
                       reloads_.end(),
                       [&](const ReloadInfo &r) { return r.value == value && r.placement == placement; });
}

} // namespace strata::transform
