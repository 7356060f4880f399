//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements preservation summaries, registration of the built-in analyses and
// cache invalidation for AnalysisManager.
//
//===----------------------------------------------------------------------===//

#include "transform/AnalysisManager.hpp"

#include "analysis/DominanceInfo.hpp"
#include "analysis/LoopForest.hpp"
#include "analysis/dataflow/Liveness.hpp"
#include "transform/AnalysisIDs.hpp"

namespace strata::transform
{

/// @brief Describe a summary where every cached analysis remains valid.
PreservedAnalyses PreservedAnalyses::all()
{
    PreservedAnalyses p;
    p.preserveAll_ = true;
    return p;
}

/// @brief Produce a summary indicating that no analyses remain valid.
PreservedAnalyses PreservedAnalyses::none()
{
    return PreservedAnalyses{};
}

PreservedAnalyses &PreservedAnalyses::preserve(const std::string &id)
{
    preserved_.insert(id);
    return *this;
}

bool PreservedAnalyses::isPreserved(const std::string &id) const
{
    return preserveAll_ || preserved_.count(id) != 0;
}

/// @brief Construct a manager and register dominance, loops and liveness.
///
/// Loops reuse the cached dominance of the same op, so requesting both costs a
/// single dominator tree construction per region.
AnalysisManager::AnalysisManager(const ir::Context &ctx, support::AnalysisOptions options)
    : ctx_(ctx), options_(options)
{
    registry_.registerAnalysis<analysis::DominanceInfo>(
        kAnalysisDominance,
        [](AnalysisManager &am, ir::OpId op) -> support::Expected<std::shared_ptr<analysis::DominanceInfo>>
        { return std::make_shared<analysis::DominanceInfo>(am.context(), op, am.options()); });

    registry_.registerAnalysis<analysis::LoopForest>(
        kAnalysisLoops,
        [](AnalysisManager &am, ir::OpId op) -> support::Expected<std::shared_ptr<analysis::LoopForest>>
        {
            auto dom = am.getResult<analysis::DominanceInfo>(kAnalysisDominance, op);
            if (!dom)
                return dom.error();
            return std::make_shared<analysis::LoopForest>(analysis::LoopForest::compute(am.context(), *dom.value()));
        });

    registry_.registerAnalysis<analysis::dataflow::LivenessAnalysis>(
        kAnalysisLiveness,
        [](AnalysisManager &am, ir::OpId op) -> support::Expected<std::shared_ptr<analysis::dataflow::LivenessAnalysis>>
        {
            auto liveness = analysis::dataflow::LivenessAnalysis::compute(am.context(), op, am.options());
            if (!liveness)
                return liveness.error();
            return std::make_shared<analysis::dataflow::LivenessAnalysis>(liveness.takeValue());
        });
}

bool AnalysisManager::isCached(const std::string &id, ir::OpId op) const
{
    auto it = cache_.find(id);
    if (it == cache_.end())
        return false;
    auto entry = it->second.find(op);
    return entry != it->second.end() && entry->second != nullptr;
}

/// @brief Apply invalidation after a transform rewrote @p op.
///
/// Results computed for an enclosing op observed the old body of @p op, and
/// results computed for a nested op may describe blocks that no longer exist,
/// so both are dropped together with the results for @p op itself.
void AnalysisManager::invalidate(const PreservedAnalyses &preserved, ir::OpId op)
{
    if (preserved.preservesAll())
        return;

    for (auto it = cache_.begin(); it != cache_.end();)
    {
        if (preserved.isPreserved(it->first))
        {
            ++it;
            continue;
        }
        auto &perOp = it->second;
        for (auto entry = perOp.begin(); entry != perOp.end();)
        {
            const ir::OpId cached = entry->first;
            if (ctx_.isAncestor(cached, op) || ctx_.isAncestor(op, cached))
                entry = perOp.erase(entry);
            else
                ++entry;
        }
        if (perOp.empty())
            it = cache_.erase(it);
        else
            ++it;
    }
}

} // namespace strata::transform
