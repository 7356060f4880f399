//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: analysis/LoopForest.cpp
// Purpose: Discovers natural loops from back edges and nests them.
// Key invariants: Loop bodies are collected by walking predecessors from each
//                 latch until the header; blocks unreachable from the entry
//                 never join a loop.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "analysis/LoopForest.hpp"

#include "analysis/CFG.hpp"

#include <algorithm>
#include <limits>
#include <unordered_map>
#include <unordered_set>

using namespace strata::ir;

namespace strata::analysis
{
namespace
{

struct LoopRecord
{
    std::unique_ptr<Loop> node;
    std::unordered_set<BlockId> blocks;
};

LoopRecord &getOrCreateRecord(BlockId header,
                              std::vector<std::unique_ptr<LoopRecord>> &records,
                              std::unordered_map<BlockId, LoopRecord *> &map)
{
    auto it = map.find(header);
    if (it != map.end())
        return *it->second;

    auto record = std::make_unique<LoopRecord>();
    record->node = std::make_unique<Loop>();
    record->node->header = header;
    record->blocks.insert(header);
    record->node->blocks.push_back(header);

    records.push_back(std::move(record));
    LoopRecord *ptr = records.back().get();
    map[header] = ptr;
    return *ptr;
}

bool isSubset(const LoopRecord &needle, const LoopRecord &haystack)
{
    for (BlockId block : needle.blocks)
        if (haystack.blocks.count(block) == 0)
            return false;
    return true;
}

const Loop *findInnermost(const Loop *loop, BlockId block)
{
    if (!loop->contains(block))
        return nullptr;
    for (const auto &child : loop->children)
        if (const Loop *nested = findInnermost(child.get(), block))
            return nested;
    return loop;
}

/// Collect the loops of one region into @p records.
void discoverLoops(const Context &ctx,
                   const DominatorTree &dom,
                   RegionId region,
                   std::vector<std::unique_ptr<LoopRecord>> &records)
{
    std::unordered_map<BlockId, LoopRecord *> headerToRecord;
    const std::size_t first = records.size();

    for (BlockId block : ctx.region(region).blocks)
    {
        if (!dom.isReachableFromEntry(block))
            continue;
        for (BlockId succ : successors(ctx, block))
        {
            if (!dom.dominates(succ, block))
                continue;

            LoopRecord &record = getOrCreateRecord(succ, records, headerToRecord);
            auto &latches = record.node->latches;
            if (std::find(latches.begin(), latches.end(), block) == latches.end())
                latches.push_back(block);

            std::vector<BlockId> worklist{block};
            while (!worklist.empty())
            {
                BlockId current = worklist.back();
                worklist.pop_back();
                if (!record.blocks.insert(current).second)
                    continue;
                record.node->blocks.push_back(current);
                for (BlockId pred : predecessors(ctx, current))
                    if (record.blocks.count(pred) == 0 && dom.isReachableFromEntry(pred))
                        worklist.push_back(pred);
            }
        }
    }

    for (std::size_t i = first; i < records.size(); ++i)
    {
        Loop &loop = *records[i]->node;
        std::unordered_set<BlockId> exitSet;
        for (BlockId block : loop.blocks)
            for (BlockId succ : successors(ctx, block))
                if (records[i]->blocks.count(succ) == 0 && exitSet.insert(succ).second)
                    loop.exits.push_back(succ);
    }
}

} // namespace

bool Loop::contains(BlockId block) const
{
    return std::find(blocks.begin(), blocks.end(), block) != blocks.end();
}

LoopForest LoopForest::compute(const Context &ctx, const DominanceInfo &dom)
{
    LoopForest forest;
    std::vector<std::unique_ptr<LoopRecord>> records;

    std::vector<OpId> worklist{dom.top()};
    while (!worklist.empty())
    {
        OpId op = worklist.back();
        worklist.pop_back();
        for (RegionId region : ctx.op(op).regions)
        {
            if (const DominatorTree *tree = dom.tree(region))
                discoverLoops(ctx, *tree, region, records);
            for (BlockId b : ctx.region(region).blocks)
                for (OpId inner : ctx.opsIn(b))
                    if (!ctx.op(inner).regions.empty())
                        worklist.push_back(inner);
        }
    }

    // Loops of different regions never share blocks, so nesting only pairs
    // loops of the same region.
    for (auto &record : records)
    {
        Loop *parent = nullptr;
        std::size_t parentSize = std::numeric_limits<std::size_t>::max();
        for (auto &candidate : records)
        {
            if (candidate.get() == record.get() || !isSubset(*record, *candidate))
                continue;
            if (candidate->blocks.size() < parentSize)
            {
                parent = candidate->node.get();
                parentSize = candidate->blocks.size();
            }
        }
        record->node->parent = parent;
    }

    for (auto &record : records)
        if (Loop *parent = record->node->parent)
            parent->children.push_back(std::move(record->node));

    for (auto &record : records)
        if (record->node)
            forest.topLevel_.push_back(std::move(record->node));

    return forest;
}

const Loop *LoopForest::getLoopFor(BlockId block) const
{
    for (const auto &loop : topLevel_)
        if (const Loop *found = findInnermost(loop.get(), block))
            return found;
    return nullptr;
}

bool LoopForest::isLoopExit(BlockId from, BlockId to) const
{
    for (const Loop *loop = getLoopFor(from); loop; loop = loop->parent)
        if (!loop->contains(to))
            return true;
    return false;
}

} // namespace strata::analysis
