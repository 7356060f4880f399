//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: transform/TransformSpills.cpp
// Purpose: Implements the spill rewrite. Uses of spilled values are resolved
//          bottom-up: a pending use is bound to the first reload, block
//          parameter or original definition found walking towards the entry.
//          Multi-block regions walk the dominator tree, after block parameters
//          have been added on the iterated dominance frontier of the reloads
//          wherever the value is live on entry. Parameters left without a
//          use are erased again.
// Key invariants: Edges are split before any pseudo-op is placed, and the
//                 dominator tree is updated incrementally as they are.
// Ownership/Lifetime: See TransformSpills.hpp.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "transform/TransformSpills.hpp"

#include "analysis/DominanceFrontier.hpp"
#include "analysis/DominanceInfo.hpp"
#include "analysis/dataflow/Liveness.hpp"
#include "ir/Interfaces.hpp"
#include "ir/Printer.hpp"
#include "support/fatal.hpp"
#include "support/trace.hpp"
#include "transform/AnalysisIDs.hpp"

#include <algorithm>
#include <functional>
#include <map>
#include <unordered_map>
#include <unordered_set>

using strata::ir::BlockId;
using strata::ir::OpId;
using strata::ir::ProgramPoint;
using strata::ir::RegionId;
using strata::ir::ValueId;
using strata::support::TraceTopic;

namespace strata::transform
{
namespace
{

/// Operand slots reading a spilled value that still need a definition.
using UseMap = std::map<ValueId, std::vector<ir::OpOperand>>;

/// Block parameters inserted for spilled values, per block.
using PhiMap = std::unordered_map<BlockId, std::map<ValueId, ValueId>>;

std::ostream &trace()
{
    return support::trace(TraceTopic::Spills);
}

void addUse(UseMap &used, ValueId value, const ir::OpOperand &ref)
{
    auto &refs = used[value];
    if (std::find(refs.begin(), refs.end(), ref) == refs.end())
        refs.push_back(ref);
}

void mergeUses(UseMap &into, const UseMap &from)
{
    for (const auto &[value, refs] : from)
        for (const ir::OpOperand &ref : refs)
            addUse(into, value, ref);
}

/// @brief Point every pending use of @p value at @p def.
/// @return False when nothing was pending.
bool resolveUses(ir::Context &ctx, UseMap &used, ValueId value, ValueId def)
{
    auto it = used.find(value);
    if (it == used.end())
        return false;
    for (const ir::OpOperand &ref : it->second)
        ctx.setOperand(ref, def);
    used.erase(it);
    return true;
}

/// @brief Regions of @p branch reachable from its parent, in postorder of the region graph.
std::vector<RegionId> postorderRegionGraph(const ir::Context &ctx, OpId branch)
{
    std::vector<RegionId> order;
    std::vector<RegionId> visited;
    std::function<void(RegionId)> visit = [&](RegionId region)
    {
        if (std::find(visited.begin(), visited.end(), region) != visited.end())
            return;
        visited.push_back(region);
        for (const ir::RegionSuccessor &succ : ir::getSuccessorRegions(ctx, branch, region))
            if (!succ.isParent())
                visit(succ.region);
        order.push_back(region);
    };
    for (const ir::RegionSuccessor &succ : ir::getSuccessorRegions(ctx, branch, RegionId()))
        if (!succ.isParent())
            visit(succ.region);
    return order;
}

void findInstUses(ir::Context &ctx, OpId op, UseMap &used, const SpillAnalysis &analysis);

/// @brief Pending uses at the top of @p block, after resolving its own defs.
UseMap collectBlockUses(ir::Context &ctx, BlockId block, const SpillAnalysis &analysis)
{
    UseMap used;
    std::vector<OpId> ops = ctx.opsIn(block);
    for (auto it = ops.rbegin(); it != ops.rend(); ++it)
        findInstUses(ctx, *it, used, analysis);
    for (ValueId param : ctx.block(block).params)
        used.erase(param);
    return used;
}

/// @brief Merge the unresolved uses of the regions nested in @p op.
/// @details Each region is resolved on its own so that a reload in one branch
///          of an `if` never satisfies a use in the other.
void mergeNestedRegionUses(ir::Context &ctx, OpId op, UseMap &used, const SpillAnalysis &analysis)
{
    if (ir::isCallableOp(ctx, op) || ctx.op(op).opcode == ir::Opcode::Module)
        return;

    if (ir::isRegionBranchOp(ctx, op))
    {
        for (RegionId region : postorderRegionGraph(ctx, op))
        {
            if (ctx.region(region).blocks.size() != 1)
                support::unimplemented("spill rewriting of multi-block nested regions");
            mergeUses(used, collectBlockUses(ctx, ctx.entryBlock(region), analysis));
        }
        return;
    }

    for (RegionId region : ctx.op(op).regions)
    {
        const auto &blocks = ctx.region(region).blocks;
        if (blocks.empty())
            continue;
        if (blocks.size() != 1)
        {
            trace() << "skipping multi-block nested region " << region.index << " when collecting spill uses\n";
            continue;
        }
        mergeUses(used, collectBlockUses(ctx, blocks.front(), analysis));
    }
}

/// @brief Account for @p op itself: a reload resolves pending uses, an
///        original definition ends them, and ordinary operands add to them.
void findInstUsesInOp(ir::Context &ctx, OpId op, UseMap &used, const SpillAnalysis &analysis)
{
    const auto pseudo = ir::matchSpillPseudo(ctx, op);
    const auto *reload = pseudo ? std::get_if<ir::ReloadLike>(&*pseudo) : nullptr;
    if (reload && !resolveUses(ctx, used, reload->value, reload->result))
        return;

    for (ValueId result : ctx.op(op).results)
        if (analysis.isSpilled(result))
            used.erase(result);

    if (reload)
        return;
    for (const ir::OpOperand &ref : ctx.operandRefs(op))
    {
        const ValueId value = ctx.operandValue(ref);
        if (analysis.isSpilled(value))
            addUse(used, value, ref);
    }
}

void findInstUses(ir::Context &ctx, OpId op, UseMap &used, const SpillAnalysis &analysis)
{
    mergeNestedRegionUses(ctx, op, used, analysis);
    findInstUsesInOp(ctx, op, used, analysis);
}

/// Ancestor of @p block that belongs to @p region.
BlockId blockInRegion(const ir::Context &ctx, RegionId region, BlockId block)
{
    while (block.isValid() && ctx.block(block).parent != region)
    {
        const OpId parent = ctx.parentOp(block);
        if (!parent.isValid())
            return BlockId();
        block = ctx.op(parent).parent;
    }
    return block;
}

/// @brief True when the block of @p def dominates every reachable
///        predecessor of @p block, so each of them can forward @p def.
bool reachesEveryPredecessor(const ir::Context &ctx, BlockId def, BlockId block, const analysis::DominatorTree &tree)
{
    if (!def.isValid())
        return true;
    for (const ir::BlockOperand &pred : ctx.block(block).predecessors)
    {
        const BlockId from = ctx.op(pred.op).parent;
        if (tree.isReachableFromEntry(from) && !tree.dominates(def, from))
            return false;
    }
    return true;
}

/// @brief Add a block parameter for each spilled value at the blocks of the
///        iterated dominance frontier of its definition and reloads where the
///        value is still live on entry.
/// @details Every predecessor initially forwards the original value; the
///          dominator tree walk later rebinds those arguments like any use.
PhiMap insertRequiredPhis(ir::Context &ctx,
                          RegionId region,
                          const SpillAnalysis &analysis,
                          const analysis::DominatorTree &tree,
                          const analysis::DominanceFrontier &frontier,
                          const analysis::dataflow::LivenessAnalysis &liveness)
{
    std::map<ValueId, std::vector<BlockId>> defBlocks;
    for (const ReloadInfo &reload : analysis.reloads())
    {
        auto &blocks = defBlocks[reload.value];
        if (blocks.empty())
            blocks.push_back(blockInRegion(ctx, region, ctx.definingBlock(reload.value)));
        const BlockId block = blockInRegion(ctx, region, ctx.op(reload.op).parent);
        if (block.isValid() && std::find(blocks.begin(), blocks.end(), block) == blocks.end())
            blocks.push_back(block);
    }

    PhiMap inserted;
    for (auto &[value, blocks] : defBlocks)
    {
        const BlockId def = blocks.front();
        if (!def.isValid())
            blocks.erase(blocks.begin());
        for (BlockId block : frontier.iterateAll(blocks))
        {
            auto &phis = inserted[block];
            if (phis.count(value))
                continue;
            if (!liveness.isLiveAtStart(value, block) || !reachesEveryPredecessor(ctx, def, block, tree))
            {
                trace() << "no block parameter for %" << value.index << " in ^bb" << block.index << "\n";
                continue;
            }
            const ValueId phi = ctx.addBlockParam(block, ctx.value(value).type);
            phis.emplace(value, phi);
            trace() << "inserted %" << phi.index << " in ^bb" << block.index << " for %" << value.index << "\n";

            const std::vector<ir::BlockOperand> preds = ctx.block(block).predecessors;
            for (const ir::BlockOperand &pred : preds)
                ctx.appendSuccessorArg(pred.op, pred.successor, value);
        }
    }
    return inserted;
}

void rewriteInsertedPhiUses(ir::Context &ctx, const PhiMap &phis, BlockId block, UseMap &used)
{
    auto it = phis.find(block);
    if (it == phis.end())
        return;
    for (const auto &[spilled, phi] : it->second)
        if (!resolveUses(ctx, used, spilled, phi))
            trace() << "unused block parameter %" << phi.index << " in ^bb" << block.index << "\n";
}

/// Inserted parameter receiving the argument in slot @p ref, if any.
ValueId forwardedInto(const ir::Context &ctx, const ir::OpOperand &ref, const std::unordered_set<ValueId> &inserted)
{
    if (ref.group == 0)
        return ValueId();
    const BlockId dest = ctx.op(ref.owner).successors[ref.group - 1].dest;
    const ValueId param = ctx.block(dest).params[ref.index];
    return inserted.count(param) ? param : ValueId();
}

/// @brief Erase inserted block parameters whose value reaches no real use.
/// @details A parameter only forwarded into dead parameters is dead as well,
///          so liveness flows backwards from ordinary uses along the edges.
void eraseDeadPhis(ir::Context &ctx, const PhiMap &phis)
{
    std::unordered_set<ValueId> inserted;
    for (const auto &[block, byValue] : phis)
        for (const auto &[spilled, phi] : byValue)
            inserted.insert(phi);

    std::unordered_set<ValueId> live;
    std::vector<ValueId> worklist;
    for (ValueId phi : inserted)
    {
        for (const ir::OpOperand &use : ctx.value(phi).uses)
        {
            if (!forwardedInto(ctx, use, inserted).isValid())
            {
                live.insert(phi);
                worklist.push_back(phi);
                break;
            }
        }
    }
    while (!worklist.empty())
    {
        const ValueId phi = worklist.back();
        worklist.pop_back();
        const ir::Value &param = ctx.value(phi);
        for (const ir::BlockOperand &pred : ctx.block(param.ownerBlock).predecessors)
        {
            const ValueId arg = ctx.op(pred.op).successors[pred.successor].args[param.index];
            if (inserted.count(arg) && live.insert(arg).second)
                worklist.push_back(arg);
        }
    }

    // Dead parameters first stop feeding each other, then go away.
    std::vector<std::pair<ValueId, ValueId>> dead;
    for (const auto &[block, byValue] : phis)
        for (const auto &[spilled, phi] : byValue)
            if (!live.count(phi))
                dead.emplace_back(phi, spilled);
    for (const auto &[phi, spilled] : dead)
    {
        const ir::Value &param = ctx.value(phi);
        for (const ir::BlockOperand &pred : ctx.block(param.ownerBlock).predecessors)
            ctx.setOperand(ir::OpOperand{pred.op, pred.successor + 1, param.index}, spilled);
    }
    for (const auto &[phi, spilled] : dead)
    {
        trace() << "erase dead block parameter %" << phi.index << " for %" << spilled.index << "\n";
        ctx.eraseBlockParam(ctx.value(phi).ownerBlock, ctx.value(phi).index);
    }
}

void rewriteSingleBlockSpills(ir::Context &ctx, RegionId region, const SpillAnalysis &analysis)
{
    const UseMap unresolved = collectBlockUses(ctx, ctx.entryBlock(region), analysis);
    for (const auto &[value, refs] : unresolved)
        trace() << refs.size() << " use(s) of %" << value.index << " keep the original definition\n";
}

void rewriteCfgSpills(ir::Context &ctx,
                      RegionId region,
                      const SpillAnalysis &analysis,
                      const analysis::DominatorTree &tree,
                      const analysis::dataflow::LivenessAnalysis &liveness)
{
    const analysis::DominanceFrontier frontier(ctx, tree);
    const PhiMap phis = insertRequiredPhis(ctx, region, analysis, tree, frontier, liveness);

    // Children are visited before their immediate dominator, so a block
    // starts from the uses its dominated blocks could not resolve.
    std::unordered_map<BlockId, UseMap> usedSets;
    for (BlockId block : tree.postorder())
    {
        UseMap used;
        const auto &node = tree.node(tree.nodeFor(block));
        for (auto child : node.children)
        {
            auto it = usedSets.find(tree.node(child).block);
            if (it != usedSets.end())
                mergeUses(used, it->second);
        }

        std::vector<OpId> ops = ctx.opsIn(block);
        for (auto it = ops.rbegin(); it != ops.rend(); ++it)
            findInstUses(ctx, *it, used, analysis);
        for (ValueId param : ctx.block(block).params)
            used.erase(param);
        rewriteInsertedPhiUses(ctx, phis, block, used);
        usedSets[block] = std::move(used);
    }
    eraseDeadPhis(ctx, phis);
}

/// @brief Lower the pseudo-ops that still matter and erase the rest.
/// @details A spill survives only when it dominates a used reload of the value
///          it stores. Without @p dom every such reload counts.
support::Expected<void> rewriteSpillPseudoInstructions(ir::Context &ctx,
                                                       const SpillAnalysis &analysis,
                                                       TransformSpillsInterface &iface,
                                                       const analysis::DominanceInfo *dom)
{
    ir::Builder builder(ctx);
    for (const SpillInfo &spill : analysis.spills())
    {
        const auto pseudo = ir::matchSpillPseudo(ctx, spill.op);
        const auto *spillLike = pseudo ? std::get_if<ir::SpillLike>(&*pseudo) : nullptr;
        if (!spillLike)
            support::internalError("materialized spill is not spill-like");

        bool used = false;
        for (const ReloadInfo &reload : analysis.reloads())
        {
            if (reload.value != spillLike->value || !reload.op.isValid())
                continue;
            const ValueId reloaded = ctx.op(reload.op).results[0];
            if (!ctx.value(reloaded).uses.empty() && (!dom || dom->dominates(spill.op, reload.op)))
            {
                used = true;
                break;
            }
        }

        if (!used)
        {
            trace() << "erase dead spill of %" << spill.value.index << "\n";
            ctx.eraseOp(spill.op);
            continue;
        }
        builder.setInsertionPointAfter(spill.op);
        auto converted = iface.convertSpillToStore(builder, spill.op);
        if (!converted)
            return converted.error();
    }

    for (const ReloadInfo &reload : analysis.reloads())
    {
        const ValueId reloaded = ctx.op(reload.op).results[0];
        if (ctx.value(reloaded).uses.empty())
        {
            trace() << "erase unused reload of %" << reload.value.index << "\n";
            ctx.eraseOp(reload.op);
            continue;
        }
        builder.setInsertionPointAfter(reload.op);
        auto converted = iface.convertReloadToLoad(builder, reload.op);
        if (!converted)
            return converted.error();
    }
    return {};
}

ProgramPoint insertionPointFor(const ir::Context &ctx, const SpillAnalysis &analysis, const Placement &placement)
{
    if (const auto *point = std::get_if<ProgramPoint>(&placement))
        return *point;
    const BlockId split = analysis.split(std::get<SplitId>(placement)).split;
    if (!split.isValid())
        support::internalError("spill placed in a split that was never materialized");
    return ProgramPoint::before(ctx, ctx.terminator(split));
}

/// @brief Route the edge of @p info through a new block ending in a branch
///        to the original destination.
support::Expected<void> splitEdge(ir::Context &ctx,
                                  SplitInfo &info,
                                  TransformSpillsInterface &iface,
                                  analysis::DominatorTree &tree,
                                  const support::AnalysisOptions &options)
{
    const auto *edge = std::get_if<LocalEdge>(&info.edge);
    if (!edge)
    {
        const auto &regional = std::get<RegionalEdge>(info.edge);
        if (!regional.from.isValid())
            support::unimplemented("splits on entry to the regions of a region branch op");
        support::todo("splits following a region branch op");
    }

    const ir::Operation &term = ctx.op(edge->predecessor);
    if (term.successors[edge->successor].dest != edge->to)
        support::internalError("split edge no longer targets its recorded successor");

    const BlockId split = ctx.createBlockAfter(edge->from);
    trace() << "splitting ^bb" << edge->from.index << " -> ^bb" << edge->to.index << " with ^bb" << split.index
            << "\n";
    const support::SourceLoc loc = term.loc;
    ctx.setSuccessorDest(edge->predecessor, edge->successor, split);
    const std::vector<ValueId> args = ctx.takeSuccessorArgs(edge->predecessor, edge->successor);

    ir::Builder builder(ctx);
    builder.setInsertionPointToEnd(split);
    auto branched = iface.createUnconditionalBranch(builder, edge->to, args, loc);
    if (!branched)
        return branched.error();
    info.split = split;

    tree.splitBlock(split);
    if (options.verifyDominance && !tree.verify(analysis::DomTreeVerificationLevel::Full))
        support::internalError("dominator tree is stale after splitting an edge");
    return {};
}

} // namespace

support::Expected<PassStatus> transformSpills(ir::Context &ctx,
                                              OpId op,
                                              SpillAnalysis &analysis,
                                              TransformSpillsInterface &iface,
                                              AnalysisManager &analyses)
{
    if (ctx.op(op).regions.size() != 1)
        support::internalError("the spills transformation requires a single-region root op");
    if (analysis.empty())
        return PassStatus::Unchanged;

    trace() << "rewriting @" << ctx.op(op).symbol << ": " << analysis.splits().size() << " edge(s) to split, "
            << analysis.spilled().size() << " value(s) spilled, " << analysis.reloads().size()
            << " reload(s) issued\n";

    const RegionId region = ctx.op(op).regions.front();
    auto dom = analyses.getResult<analysis::DominanceInfo>(kAnalysisDominance, op);
    if (!dom)
        return dom.error();
    analysis::DominatorTree *tree = dom.value()->tree(region);
    if (!tree)
        support::internalError("spill placement recorded for an empty region");

    for (SplitInfo &info : analysis.splits())
    {
        auto split = splitEdge(ctx, info, iface, *tree, analyses.options());
        if (!split)
            return split.error();
    }

    ir::Builder builder(ctx);
    for (SpillInfo &spill : analysis.spills())
    {
        builder.setInsertionPoint(insertionPointFor(ctx, analysis, spill.placement));
        auto created = iface.createSpill(builder, spill.value, spill.loc);
        if (!created)
            return created.error();
        spill.op = created.value();
    }
    for (ReloadInfo &reload : analysis.reloads())
    {
        builder.setInsertionPoint(insertionPointFor(ctx, analysis, reload.placement));
        auto created = iface.createReload(builder, reload.value, reload.loc);
        if (!created)
            return created.error();
        reload.op = created.value();
    }

    if (support::traceEnabled(TraceTopic::Spills))
        trace() << "after inserting spills:\n" << ir::Printer::toString(ctx, op);

    const bool singleBlock = ctx.region(region).blocks.size() == 1;
    if (singleBlock)
    {
        rewriteSingleBlockSpills(ctx, region, analysis);
    }
    else
    {
        // Liveness has to see the split edges and pseudo-ops; the dominator
        // tree was kept current while splitting.
        analyses.invalidate(PreservedAnalyses::none().preserve(kAnalysisDominance), op);
        auto liveness = analyses.getResult<analysis::dataflow::LivenessAnalysis>(kAnalysisLiveness, op);
        if (!liveness)
            return liveness.error();
        rewriteCfgSpills(ctx, region, analysis, *tree, *liveness.value());
    }

    auto lowered = rewriteSpillPseudoInstructions(ctx, analysis, iface, singleBlock ? nullptr : dom.value());
    if (!lowered)
        return lowered.error();

    if (support::traceEnabled(TraceTopic::Spills))
        trace() << "after rewriting spills:\n" << ir::Printer::toString(ctx, op);

    analyses.invalidate(PreservedAnalyses::none(), op);
    return PassStatus::Changed;
}

} // namespace strata::transform
