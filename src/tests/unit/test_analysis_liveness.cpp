//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_analysis_liveness.cpp
// Purpose: Regression tests for next-use distances on straight-line code,
//          branches with block arguments, loops and structured region ops.
// Key invariants: Distances count the operations executed before the next
//                 use; leaving a loop adds the configured loop-exit distance.
// Ownership/Lifetime: LivenessAnalysis borrows the fixture's Context.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "analysis/dataflow/Liveness.hpp"
#include "support/fatal.hpp"
#include "tests/common/IrFixture.hpp"

#include <gtest/gtest.h>

using namespace strata;
using strata::analysis::dataflow::LivenessAnalysis;
using strata::analysis::dataflow::NextUseSet;
using strata::tests::i1;
using strata::tests::i64;

namespace
{

LivenessAnalysis computeLiveness(const ir::Context &ctx,
                                 ir::OpId op,
                                 const support::AnalysisOptions &options = {})
{
    auto liveness = LivenessAnalysis::compute(ctx, op, options);
    EXPECT_TRUE(liveness.hasValue());
    return liveness.takeValue();
}

support::AnalysisOptions withLoopExitDistance(uint32_t distance)
{
    support::AnalysisOptions options;
    options.loopExitDistance = distance;
    return options;
}

} // namespace

TEST(LivenessTest, StraightLineDistancesCountOperations)
{
    tests::IrFixture f;
    const ir::OpId fn = f.addFunction("f", {i64()});
    const ir::BlockId entry = f.entryOf(fn);
    const ir::ValueId a = f.builder.param(entry, 0);
    const ir::ValueId b = f.builder.add(a, a);
    const ir::ValueId c = f.opaque("produce");
    const ir::ValueId d = f.builder.add(b, c);
    const ir::ValueId e = f.opaque("unused");
    const ir::OpId ret = f.builder.ret({d});

    const ir::OpId defB = f.ctx.value(b).definingOp;
    const ir::OpId defC = f.ctx.value(c).definingOp;
    const ir::OpId defD = f.ctx.value(d).definingOp;
    const ir::OpId defE = f.ctx.value(e).definingOp;

    const LivenessAnalysis liveness = computeLiveness(f.ctx, fn);

    EXPECT_TRUE(liveness.isLiveAtStart(a, entry));
    EXPECT_FALSE(liveness.isLiveAfter(a, defB));
    EXPECT_EQ(liveness.nextUseAfter(a, defB), NextUseSet::kDead);

    EXPECT_EQ(liveness.nextUseAfter(b, defB), 1u);
    EXPECT_EQ(liveness.nextUseAfter(c, defC), 0u);
    EXPECT_EQ(liveness.nextUseAfter(d, defD), 1u);
    EXPECT_TRUE(liveness.isLiveBefore(d, ret));
    EXPECT_FALSE(liveness.isLiveAtEnd(d, entry));

    // A value nobody reads is still recorded, at the dead distance.
    const NextUseSet *afterE = liveness.nextUsesAt(ir::ProgramPoint::after(f.ctx, defE));
    ASSERT_NE(afterE, nullptr);
    EXPECT_TRUE(afterE->contains(e));
    EXPECT_EQ(afterE->distance(e), NextUseSet::kDead);
    EXPECT_FALSE(liveness.isLiveAfter(e, defE));
}

TEST(LivenessTest, BlockParametersAreDefinedAtBlockStart)
{
    tests::IrFixture f;
    const ir::OpId fn = f.addFunction("f", {i64()});
    const ir::BlockId entry = f.entryOf(fn);
    const ir::BlockId next = f.builder.addBlock(fn, {i64()});
    const ir::ValueId a = f.builder.param(entry, 0);
    const ir::OpId br = f.builder.br(next, {a});
    f.at(next);
    const ir::ValueId p = f.builder.param(next, 0);
    f.builder.ret({f.builder.add(p, p)});

    const LivenessAnalysis liveness = computeLiveness(f.ctx, fn);

    EXPECT_TRUE(liveness.isLiveAtStart(p, next));
    EXPECT_FALSE(liveness.isLiveAtEnd(p, entry));
    EXPECT_FALSE(liveness.isLiveAtEnd(a, entry));
    EXPECT_TRUE(liveness.isLiveBefore(a, br));

    const NextUseSet *atEnd = liveness.nextUsesAt(ir::ProgramPoint::atEndOf(entry));
    ASSERT_NE(atEnd, nullptr);
    EXPECT_FALSE(atEnd->contains(p));
}

TEST(LivenessTest, ValuesFlowAcrossBothArmsOfABranch)
{
    tests::IrFixture f;
    const ir::OpId fn = f.addFunction("f", {i1()});
    const ir::BlockId entry = f.entryOf(fn);
    const ir::BlockId near = f.builder.addBlock(fn);
    const ir::BlockId far = f.builder.addBlock(fn);
    const ir::ValueId x = f.opaque("def");
    const ir::OpId defX = f.ctx.value(x).definingOp;
    f.builder.condBr(f.builder.param(entry, 0), near, {}, far, {});
    f.at(near);
    f.builder.exec("use", {x});
    f.builder.ret();
    f.at(far);
    f.builder.exec("work", {});
    f.builder.exec("work", {});
    f.builder.exec("use", {x});
    f.builder.ret();

    const LivenessAnalysis liveness = computeLiveness(f.ctx, fn);

    // The nearer use wins: one op for the branch, none inside `near`.
    EXPECT_EQ(liveness.nextUseAfter(x, defX), 1u);
    EXPECT_TRUE(liveness.isLiveAtEnd(x, entry));
    EXPECT_TRUE(liveness.isLiveAtStart(x, far));
}

TEST(LivenessTest, LeavingALoopAddsTheLoopExitDistance)
{
    tests::IrFixture f;
    const ir::OpId fn = f.addFunction("f", {i1()});
    const ir::BlockId entry = f.entryOf(fn);
    const ir::BlockId loop = f.builder.addBlock(fn);
    const ir::BlockId exit = f.builder.addBlock(fn);
    const ir::ValueId cond = f.builder.param(entry, 0);
    const ir::ValueId x = f.opaque("def");
    const ir::OpId defX = f.ctx.value(x).definingOp;
    f.builder.br(loop);
    f.at(loop);
    f.builder.exec("body", {});
    f.builder.condBr(cond, loop, {}, exit, {});
    f.at(exit);
    f.builder.exec("use", {x});
    f.builder.ret();

    const LivenessAnalysis liveness = computeLiveness(f.ctx, fn, withLoopExitDistance(1000));

    // br, body, cond_br, then the loop exit.
    EXPECT_EQ(liveness.nextUseAfter(x, defX), 1003u);
    EXPECT_TRUE(liveness.isLiveAtStart(x, loop));

    const NextUseSet *atLoopEnd = liveness.nextUsesAt(ir::ProgramPoint::atEndOf(loop));
    ASSERT_NE(atLoopEnd, nullptr);
    EXPECT_EQ(atLoopEnd->distance(x), 1000u);
    EXPECT_EQ(atLoopEnd->distance(cond), 1u);
}

TEST(LivenessTest, ValuesUsedAfterALoopLookFartherAwayThanLoopValues)
{
    tests::IrFixture f;
    const ir::OpId fn = f.addFunction("f", {i1()});
    const ir::BlockId entry = f.entryOf(fn);
    const ir::BlockId header = f.builder.addBlock(fn);
    const ir::BlockId exit = f.builder.addBlock(fn);
    const ir::ValueId cond = f.builder.param(entry, 0);
    const ir::ValueId after = f.opaque("def");
    const ir::ValueId inLoop = f.opaque("def");
    f.builder.br(header);
    f.at(header);
    f.builder.exec("head", {inLoop});
    f.builder.condBr(cond, header, {}, exit, {});
    f.at(exit);
    f.builder.exec("use", {after});
    f.builder.ret();

    const LivenessAnalysis liveness = computeLiveness(f.ctx, fn);

    const NextUseSet *atHeaderEnd = liveness.nextUsesAt(ir::ProgramPoint::atEndOf(header));
    ASSERT_NE(atHeaderEnd, nullptr);
    EXPECT_EQ(atHeaderEnd->distance(inLoop), 0u);
    EXPECT_EQ(atHeaderEnd->distance(after), 100000u);
    EXPECT_GE(atHeaderEnd->distance(after) - atHeaderEnd->distance(inLoop), 100000u);

    // def, br, head, cond_br, then the loop exit.
    EXPECT_EQ(liveness.nextUseAfter(after, f.ctx.value(after).definingOp), 100004u);
    EXPECT_EQ(liveness.nextUseAfter(inLoop, f.ctx.value(inLoop).definingOp), 1u);
}

TEST(LivenessTest, DeadBlocksCarryNoFacts)
{
    tests::IrFixture f;
    const ir::OpId fn = f.addFunction("f");
    const ir::BlockId live = f.builder.addBlock(fn);
    const ir::BlockId dead = f.builder.addBlock(fn);
    const ir::ValueId x = f.opaque("def");
    const ir::OpId defX = f.ctx.value(x).definingOp;
    f.builder.condBr(f.builder.constant(1, i1()), live, {}, dead, {});
    f.at(live);
    f.builder.ret();
    f.at(dead);
    f.builder.exec("use", {x});
    f.builder.ret();

    const LivenessAnalysis liveness = computeLiveness(f.ctx, fn);

    EXPECT_TRUE(liveness.isBlockExecutable(live));
    EXPECT_FALSE(liveness.isBlockExecutable(dead));
    EXPECT_EQ(liveness.nextUsesAt(ir::ProgramPoint::atStartOf(dead)), nullptr);
    EXPECT_FALSE(liveness.isLiveAfter(x, defX));
}

TEST(LivenessTest, IfRegionsContributeTheirUses)
{
    tests::IrFixture f;
    const ir::OpId fn = f.addFunction("f", {i1()});
    const ir::BlockId entry = f.entryOf(fn);
    const ir::ValueId x = f.opaque("def");
    const ir::OpId defX = f.ctx.value(x).definingOp;
    const ir::OpId branch = f.builder.ifOp(f.builder.param(entry, 0));
    f.builder.ret();
    const ir::BlockId thenBlock = f.entryOf(branch);
    f.at(thenBlock);
    f.builder.exec("use", {x});
    f.builder.yield();
    f.at(f.ctx.entryBlock(f.regionOf(branch, 1)));
    f.builder.yield();

    const LivenessAnalysis liveness = computeLiveness(f.ctx, fn);

    EXPECT_TRUE(liveness.isLiveBefore(x, branch));
    EXPECT_FALSE(liveness.isLiveAfter(x, branch));
    EXPECT_TRUE(liveness.isLiveAfterEntry(x, branch));
    EXPECT_TRUE(liveness.isLiveAtStart(x, thenBlock));
    EXPECT_EQ(liveness.nextUseAfter(x, defX), 0u);
}

TEST(LivenessTest, LeavingARepetitiveRegionAddsTheLoopExitDistance)
{
    tests::IrFixture f;
    const ir::OpId fn = f.addFunction("f", {i1()});
    const ir::ValueId cond = f.builder.param(f.entryOf(fn), 0);
    const ir::ValueId x = f.opaque("def");
    const ir::OpId defX = f.ctx.value(x).definingOp;
    const ir::OpId loop = f.builder.whileOp({}, {});
    f.builder.exec("use", {x});
    f.builder.ret();
    const ir::BlockId before = f.entryOf(loop);
    const ir::BlockId body = f.ctx.entryBlock(f.regionOf(loop, 1));
    f.at(before);
    f.builder.condition(cond);
    f.at(body);
    f.builder.exec("work", {});
    f.builder.yield();

    const LivenessAnalysis liveness = computeLiveness(f.ctx, fn, withLoopExitDistance(1000));

    // condition, then the region exit; the while op itself is not counted.
    EXPECT_EQ(liveness.nextUseAfter(x, defX), 1001u);
    EXPECT_TRUE(liveness.isLiveAtStart(x, body));
    EXPECT_TRUE(liveness.isLiveAfter(x, loop));
}

TEST(LivenessTest, CallsToOtherFunctionsAreOpaque)
{
    tests::IrFixture f;
    f.addFunction("callee");
    f.builder.ret();
    f.addFunction("caller");
    const ir::ValueId x = f.opaque("def");
    const ir::OpId defX = f.ctx.value(x).definingOp;
    f.builder.call("callee", {});
    f.builder.exec("use", {x});
    f.builder.ret();

    const LivenessAnalysis liveness = computeLiveness(f.ctx, f.module);
    EXPECT_EQ(liveness.nextUseAfter(x, defX), 1u);
}

TEST(LivenessTest, InterproceduralPropagationIsRejected)
{
    tests::IrFixture f;
    f.addFunction("callee");
    f.builder.ret();
    f.addFunction("caller");
    f.builder.call("callee", {});
    f.builder.ret();

    support::AnalysisOptions options;
    options.interprocedural = true;
    EXPECT_THROW((void)LivenessAnalysis::compute(f.ctx, f.module, options), support::InternalCompilerError);
}
