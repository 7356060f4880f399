//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: analysis/CFG.cpp
// Purpose: Builds control-flow graph information for a region.
// Key invariants: Predecessor/successor lists mirror terminator successors.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "analysis/CFG.hpp"

#include <algorithm>
#include <functional>
#include <unordered_set>

using namespace strata::ir;

namespace strata::analysis
{

std::vector<BlockId> successors(const Context &ctx, BlockId block)
{
    std::vector<BlockId> out;
    OpId term = ctx.terminator(block);
    if (!term.isValid())
        return out;
    for (const Successor &s : ctx.op(term).successors)
        if (std::find(out.begin(), out.end(), s.dest) == out.end())
            out.push_back(s.dest);
    return out;
}

std::vector<BlockId> predecessors(const Context &ctx, BlockId block)
{
    std::vector<BlockId> out;
    for (const BlockOperand &edge : ctx.block(block).predecessors)
    {
        BlockId from = ctx.op(edge.op).parent;
        if (from.isValid() && std::find(out.begin(), out.end(), from) == out.end())
            out.push_back(from);
    }
    return out;
}

CFG::CFG(const Context &ctx, RegionId region)
{
    compute(ctx, region);
}

void CFG::compute(const Context &ctx, RegionId region)
{
    for (BlockId bb : ctx.region(region).blocks)
    {
        succ_[bb] = analysis::successors(ctx, bb);
        pred_[bb] = analysis::predecessors(ctx, bb);
    }

    std::unordered_set<BlockId> visited;
    std::function<void(BlockId)> dfs = [&](BlockId b)
    {
        if (!visited.insert(b).second)
            return;
        for (BlockId s : succ_[b])
            dfs(s);
        postIndex_[b] = postorder_.size();
        postorder_.push_back(b);
    };

    BlockId entry = ctx.entryBlock(region);
    if (entry.isValid())
        dfs(entry);
}

const std::vector<BlockId> &CFG::successors(BlockId bb) const
{
    return succ_.at(bb);
}

const std::vector<BlockId> &CFG::predecessors(BlockId bb) const
{
    return pred_.at(bb);
}

std::size_t CFG::postorderIndex(BlockId bb) const
{
    auto it = postIndex_.find(bb);
    return it == postIndex_.end() ? static_cast<std::size_t>(-1) : it->second;
}

std::vector<BlockId> CFG::reversePostorder() const
{
    return std::vector<BlockId>(postorder_.rbegin(), postorder_.rend());
}

} // namespace strata::analysis
