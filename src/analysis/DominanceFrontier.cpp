//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: analysis/DominanceFrontier.cpp
// Purpose: Computes dominance frontiers by walking from each predecessor up
//          the dominator tree until the join block's immediate dominator.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "analysis/DominanceFrontier.hpp"

#include "analysis/CFG.hpp"

#include <algorithm>
#include <deque>
#include <unordered_set>

using namespace strata::ir;

namespace strata::analysis
{

DominanceFrontier::DominanceFrontier(const Context &ctx, const DominatorTree &tree)
{
    for (BlockId block : tree.postorder())
    {
        const BlockId idom = tree.idom(block);
        for (BlockId pred : predecessors(ctx, block))
        {
            if (!tree.isReachableFromEntry(pred))
                continue;
            for (BlockId runner = pred; runner.isValid() && runner != idom; runner = tree.idom(runner))
            {
                auto &df = frontiers_[runner];
                if (std::find(df.begin(), df.end(), block) == df.end())
                    df.push_back(block);
            }
        }
    }
}

const std::vector<BlockId> &DominanceFrontier::frontier(BlockId block) const
{
    static const std::vector<BlockId> kEmpty;
    auto it = frontiers_.find(block);
    return it == frontiers_.end() ? kEmpty : it->second;
}

std::vector<BlockId> DominanceFrontier::iterateAll(const std::vector<BlockId> &seeds) const
{
    std::vector<BlockId> idf;
    std::unordered_set<BlockId> inIdf;
    std::deque<BlockId> queue;

    auto visit = [&](BlockId block)
    {
        for (BlockId y : frontier(block))
        {
            if (!inIdf.insert(y).second)
                continue;
            idf.push_back(y);
            queue.push_back(y);
        }
    };

    for (BlockId seed : seeds)
        visit(seed);
    while (!queue.empty())
    {
        BlockId next = queue.front();
        queue.pop_front();
        visit(next);
    }
    return idf;
}

} // namespace strata::analysis
