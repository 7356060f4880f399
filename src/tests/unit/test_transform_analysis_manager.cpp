//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_transform_analysis_manager.cpp
// Purpose: Verify analysis caching, reuse between dependent analyses and
//          invalidation scoped to the rewritten op.
// Key invariants: A cached result is reused until invalidated; invalidation
//                 never touches unrelated sibling ops.
// Ownership/Lifetime: Each test owns its fixture and manager.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "analysis/DominanceInfo.hpp"
#include "analysis/LoopForest.hpp"
#include "analysis/dataflow/Liveness.hpp"
#include "tests/common/IrFixture.hpp"
#include "transform/AnalysisIDs.hpp"
#include "transform/AnalysisManager.hpp"

#include <gtest/gtest.h>

using namespace strata;
using strata::transform::kAnalysisDominance;
using strata::transform::kAnalysisLiveness;
using strata::transform::kAnalysisLoops;
using strata::transform::PreservedAnalyses;

namespace
{

struct TwoFunctions : tests::IrFixture
{
    ir::OpId first;
    ir::OpId second;

    TwoFunctions()
    {
        first = addFunction("first");
        builder.ret();
        second = addFunction("second");
        builder.ret();
    }
};

} // namespace

TEST(AnalysisManagerTest, ResultsAreComputedOncePerOp)
{
    TwoFunctions f;
    transform::AnalysisManager am(f.ctx);

    auto a = am.getResult<analysis::DominanceInfo>(kAnalysisDominance, f.first);
    auto b = am.getResult<analysis::DominanceInfo>(kAnalysisDominance, f.first);
    ASSERT_TRUE(a.hasValue());
    ASSERT_TRUE(b.hasValue());
    EXPECT_EQ(a.value(), b.value());
    EXPECT_EQ(am.counts().computations, 1u);

    auto other = am.getResult<analysis::DominanceInfo>(kAnalysisDominance, f.second);
    ASSERT_TRUE(other.hasValue());
    EXPECT_NE(other.value(), a.value());
    EXPECT_EQ(am.counts().computations, 2u);
}

TEST(AnalysisManagerTest, LoopsReuseCachedDominance)
{
    TwoFunctions f;
    transform::AnalysisManager am(f.ctx);

    ASSERT_TRUE(am.getResult<analysis::LoopForest>(kAnalysisLoops, f.first).hasValue());
    EXPECT_TRUE(am.isCached(kAnalysisDominance, f.first));
    EXPECT_EQ(am.counts().computations, 2u);

    ASSERT_TRUE(am.getResult<analysis::DominanceInfo>(kAnalysisDominance, f.first).hasValue());
    EXPECT_EQ(am.counts().computations, 2u);
}

TEST(AnalysisManagerTest, InvalidationCoversAncestorsButNotSiblings)
{
    TwoFunctions f;
    transform::AnalysisManager am(f.ctx);
    for (ir::OpId op : {f.module, f.first, f.second})
        ASSERT_TRUE(am.getResult<analysis::DominanceInfo>(kAnalysisDominance, op).hasValue());

    am.invalidate(PreservedAnalyses::none(), f.first);
    EXPECT_FALSE(am.isCached(kAnalysisDominance, f.first));
    EXPECT_FALSE(am.isCached(kAnalysisDominance, f.module));
    EXPECT_TRUE(am.isCached(kAnalysisDominance, f.second));
}

TEST(AnalysisManagerTest, InvalidatingARootDropsNestedResults)
{
    TwoFunctions f;
    transform::AnalysisManager am(f.ctx);
    ASSERT_TRUE(am.getResult<analysis::DominanceInfo>(kAnalysisDominance, f.second).hasValue());

    am.invalidate(PreservedAnalyses::none(), f.module);
    EXPECT_FALSE(am.isCached(kAnalysisDominance, f.second));
}

TEST(AnalysisManagerTest, PreservedAnalysesSurviveInvalidation)
{
    TwoFunctions f;
    transform::AnalysisManager am(f.ctx);
    ASSERT_TRUE(am.getResult<analysis::LoopForest>(kAnalysisLoops, f.first).hasValue());

    am.invalidate(PreservedAnalyses::none().preserve(kAnalysisDominance), f.first);
    EXPECT_TRUE(am.isCached(kAnalysisDominance, f.first));
    EXPECT_FALSE(am.isCached(kAnalysisLoops, f.first));

    am.invalidate(PreservedAnalyses::all(), f.first);
    EXPECT_TRUE(am.isCached(kAnalysisDominance, f.first));

    const PreservedAnalyses none = PreservedAnalyses::none();
    EXPECT_FALSE(none.hasPreservations());
    EXPECT_TRUE(PreservedAnalyses::all().isPreserved(kAnalysisLiveness));
}

TEST(AnalysisManagerTest, LivenessIsAvailableThroughTheManager)
{
    tests::IrFixture f;
    const ir::OpId fn = f.addFunction("f");
    const ir::ValueId x = f.opaque("def");
    f.builder.exec("use", {x});
    f.builder.ret();

    support::AnalysisOptions options;
    options.loopExitDistance = 7;
    transform::AnalysisManager am(f.ctx, options);
    EXPECT_EQ(am.options().loopExitDistance, 7u);

    auto liveness = am.getResult<analysis::dataflow::LivenessAnalysis>(kAnalysisLiveness, fn);
    ASSERT_TRUE(liveness.hasValue());
    EXPECT_EQ(liveness.value()->nextUseAfter(x, f.ctx.value(x).definingOp), 0u);
    EXPECT_TRUE(am.isCached(kAnalysisLiveness, fn));
}
