//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: analysis/DominanceInfo.cpp
// Purpose: Implements region-aware dominance queries.
// Key invariants: Within a block, program order decides dominance; graph
//                 regions (the module body) hold a single block.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "analysis/DominanceInfo.hpp"

#include "support/trace.hpp"

using namespace strata::ir;

namespace strata::analysis
{

DominanceInfo::DominanceInfo(const Context &ctx, OpId top, const support::AnalysisOptions &options)
    : ctx_(ctx), top_(top), options_(options)
{
}

DominatorTree *DominanceInfo::tree(RegionId region) const
{
    auto it = trees_.find(region);
    if (it != trees_.end())
        return it->second.get();

    auto built = DominatorTree::build(ctx_, region, options_);
    if (!built)
        return nullptr;
    support::trace(support::TraceTopic::DomTree) << "built dominator tree for region " << region.index << '\n';
    auto inserted = trees_.emplace(region, std::make_unique<DominatorTree>(built.takeValue()));
    return inserted.first->second.get();
}

void DominanceInfo::invalidate(RegionId region)
{
    trees_.erase(region);
}

void DominanceInfo::invalidate()
{
    trees_.clear();
}

OpId DominanceInfo::ancestorInRegion(RegionId region, OpId op) const
{
    for (OpId cur = op; cur.isValid(); cur = ctx_.parentOp(cur))
        if (ctx_.parentRegion(cur) == region)
            return cur;
    return OpId();
}

BlockId DominanceInfo::ancestorBlockInRegion(RegionId region, BlockId block) const
{
    while (block.isValid() && ctx_.block(block).parent != region)
    {
        OpId owner = ctx_.parentOp(block);
        if (!owner.isValid())
            return BlockId();
        block = ctx_.op(owner).parent;
    }
    return block;
}

bool DominanceInfo::dominates(BlockId a, BlockId b) const
{
    return a == b || properlyDominates(a, b);
}

bool DominanceInfo::properlyDominates(BlockId a, BlockId b) const
{
    if (a == b)
        return false;
    const RegionId region = ctx_.block(a).parent;
    const BlockId hoisted = ancestorBlockInRegion(region, b);
    if (!hoisted.isValid())
        return false;
    // A block properly dominates the blocks nested inside its own operations.
    if (hoisted == a)
        return true;
    DominatorTree *dt = tree(region);
    return dt && dt->properlyDominates(a, hoisted);
}

bool DominanceInfo::properlyDominates(OpId a, OpId b, bool enclosingOpOk) const
{
    if (a == b)
        return false;

    const RegionId region = ctx_.parentRegion(a);
    const OpId hoisted = ancestorInRegion(region, b);
    if (!hoisted.isValid())
        return false;
    if (hoisted == a)
        return enclosingOpOk;

    const BlockId blockA = ctx_.op(a).parent;
    const BlockId blockB = ctx_.op(hoisted).parent;
    if (blockA == blockB)
    {
        for (OpId cur = ctx_.op(a).next; cur.isValid(); cur = ctx_.op(cur).next)
            if (cur == hoisted)
                return true;
        return false;
    }
    DominatorTree *dt = tree(region);
    return dt && dt->properlyDominates(blockA, blockB);
}

bool DominanceInfo::properlyDominates(ValueId value, OpId op) const
{
    const Value &v = ctx_.value(value);
    if (v.kind == ValueKind::OpResult)
        return properlyDominates(v.definingOp, op, /*enclosingOpOk=*/false);
    return dominates(v.ownerBlock, ctx_.op(op).parent);
}

} // namespace strata::analysis
