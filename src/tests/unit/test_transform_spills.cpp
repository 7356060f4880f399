//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_transform_spills.cpp
// Purpose: Exercise spill/reload materialization, SSA repair through block
//          parameters, edge splitting and lowering to frame slots.
// Key invariants: After the rewrite every use of a spilled value reads the
//                 original definition, a dominating reload, or a block
//                 parameter merging both.
// Ownership/Lifetime: Each test owns its fixture, SpillAnalysis and manager.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "analysis/DominanceInfo.hpp"
#include "ir/Verifier.hpp"
#include "support/fatal.hpp"
#include "tests/common/IrFixture.hpp"
#include "transform/AnalysisIDs.hpp"
#include "transform/StackSpillLowering.hpp"
#include "transform/TransformSpills.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace strata;
using strata::ir::Opcode;
using strata::ir::ProgramPoint;
using strata::tests::i1;

namespace
{

std::vector<Opcode> opcodesIn(const ir::Context &ctx, ir::BlockId block)
{
    std::vector<Opcode> opcodes;
    for (ir::OpId op : ctx.opsIn(block))
        opcodes.push_back(ctx.op(op).opcode);
    return opcodes;
}

ir::OpId definingOp(const ir::Context &ctx, ir::ValueId value)
{
    return ctx.value(value).definingOp;
}

/// Operand slots under @p root, successor arguments included, whose value
/// is not defined on every path reaching them.
std::vector<ir::OpOperand> undominatedUses(const ir::Context &ctx, ir::OpId root)
{
    const analysis::DominanceInfo dom(ctx, root);
    std::vector<ir::OpOperand> undominated;
    ctx.walk(root,
             [&](ir::OpId op)
             {
                 for (const ir::OpOperand &ref : ctx.operandRefs(op))
                     if (!dom.properlyDominates(ctx.operandValue(ref), op))
                         undominated.push_back(ref);
             });
    return undominated;
}

/// Run the rewrite on @p fn, require it to report a change and leave
/// every use dominated by its definition.
void rewrite(tests::IrFixture &f,
             ir::OpId fn,
             transform::SpillAnalysis &spills,
             transform::StackSpillLowering &lowering,
             const support::AnalysisOptions &options = {})
{
    transform::AnalysisManager analyses(f.ctx, options);
    auto status = transform::transformSpills(f.ctx, fn, spills, lowering, analyses);
    ASSERT_TRUE(status.hasValue());
    EXPECT_EQ(status.value(), transform::PassStatus::Changed);
    for (const ir::OpOperand &ref : undominatedUses(f.ctx, fn))
        ADD_FAILURE() << "operand " << ref.index << " of group " << ref.group << " in op " << ref.owner.index
                      << " reads %" << f.ctx.operandValue(ref).index << " where it is not defined";
}

} // namespace

TEST(TransformSpillsTest, SingleBlockReloadFeedsLaterUses)
{
    tests::IrFixture f;
    const ir::OpId fn = f.addFunction("f");
    const ir::BlockId entry = f.entryOf(fn);
    const ir::ValueId x = f.opaque("def");
    const ir::OpId early = f.builder.exec("early", {x});
    const ir::OpId clobber = f.builder.exec("clobber", {});
    const ir::ValueId sum = f.builder.add(x, x);
    f.builder.ret({sum});

    transform::SpillAnalysis spills;
    spills.addSpill(ProgramPoint::after(f.ctx, definingOp(f.ctx, x)), x);
    spills.addReload(ProgramPoint::after(f.ctx, clobber), x);
    transform::StackSpillLowering lowering;
    rewrite(f, fn, spills, lowering);

    const std::vector<Opcode> expected{Opcode::Exec,
                                       Opcode::LocalStore,
                                       Opcode::Exec,
                                       Opcode::Exec,
                                       Opcode::LocalLoad,
                                       Opcode::Add,
                                       Opcode::Ret};
    EXPECT_EQ(opcodesIn(f.ctx, entry), expected);

    const std::vector<ir::OpId> ops = f.ctx.opsIn(entry);
    const ir::Operation &store = f.ctx.op(ops[1]);
    const ir::Operation &load = f.ctx.op(ops[4]);
    EXPECT_EQ(f.ctx.op(early).operands[0], x);
    EXPECT_EQ(store.operands[0], x);
    EXPECT_EQ(store.imm, 0);
    EXPECT_EQ(load.imm, 0);

    const ir::Operation &add = f.ctx.op(definingOp(f.ctx, sum));
    EXPECT_EQ(add.operands[0], load.results[0]);
    EXPECT_EQ(add.operands[1], load.results[0]);
    EXPECT_EQ(lowering.numSlots(), 1u);
    EXPECT_TRUE(ir::Verifier::verify(f.ctx, f.module).hasValue());
}

TEST(TransformSpillsTest, JoinReceivesABlockParameter)
{
    tests::IrFixture f;
    const ir::OpId fn = f.addFunction("f", {i1()});
    const ir::BlockId entry = f.entryOf(fn);
    const ir::BlockId thenBlock = f.builder.addBlock(fn);
    const ir::BlockId elseBlock = f.builder.addBlock(fn);
    const ir::BlockId join = f.builder.addBlock(fn);
    const ir::ValueId x = f.opaque("def");
    f.builder.condBr(f.builder.param(entry, 0), thenBlock, {}, elseBlock, {});
    f.at(thenBlock);
    f.builder.exec("clobber", {});
    const ir::OpId thenBr = f.builder.br(join);
    f.at(elseBlock);
    const ir::OpId elseBr = f.builder.br(join);
    f.at(join);
    const ir::ValueId sum = f.builder.add(x, x);
    f.builder.ret({sum});

    transform::SpillAnalysis spills;
    spills.addSpill(ProgramPoint::after(f.ctx, definingOp(f.ctx, x)), x);
    spills.addReload(ProgramPoint::before(f.ctx, thenBr), x);
    transform::StackSpillLowering lowering;
    rewrite(f, fn, spills, lowering);

    ASSERT_EQ(f.ctx.block(join).params.size(), 1u);
    const ir::ValueId merged = f.ctx.block(join).params[0];
    const ir::Operation &add = f.ctx.op(definingOp(f.ctx, sum));
    EXPECT_EQ(add.operands[0], merged);
    EXPECT_EQ(add.operands[1], merged);

    const std::vector<Opcode> thenOps{Opcode::Exec, Opcode::LocalLoad, Opcode::Br};
    EXPECT_EQ(opcodesIn(f.ctx, thenBlock), thenOps);
    const ir::OpId load = f.ctx.opsIn(thenBlock)[1];
    ASSERT_EQ(f.ctx.op(thenBr).successors[0].args.size(), 1u);
    EXPECT_EQ(f.ctx.op(thenBr).successors[0].args[0], f.ctx.op(load).results[0]);
    ASSERT_EQ(f.ctx.op(elseBr).successors[0].args.size(), 1u);
    EXPECT_EQ(f.ctx.op(elseBr).successors[0].args[0], x);

    EXPECT_EQ(opcodesIn(f.ctx, entry)[1], Opcode::LocalStore);
    EXPECT_TRUE(ir::Verifier::verify(f.ctx, f.module).hasValue());
}

TEST(TransformSpillsTest, DefInOneArmInsertsNoPhiAtJoin)
{
    tests::IrFixture f;
    const ir::OpId fn = f.addFunction("f", {i1()});
    const ir::BlockId entry = f.entryOf(fn);
    const ir::BlockId thenBlock = f.builder.addBlock(fn);
    const ir::BlockId elseBlock = f.builder.addBlock(fn);
    const ir::BlockId join = f.builder.addBlock(fn);
    f.builder.condBr(f.builder.param(entry, 0), thenBlock, {}, elseBlock, {});
    f.at(thenBlock);
    const ir::ValueId x = f.opaque("def");
    const ir::OpId clobber = f.builder.exec("clobber", {});
    const ir::OpId use = f.builder.exec("use", {x});
    const ir::OpId thenBr = f.builder.br(join);
    f.at(elseBlock);
    const ir::OpId elseBr = f.builder.br(join);
    f.at(join);
    f.builder.ret();

    transform::SpillAnalysis spills;
    spills.addSpill(ProgramPoint::after(f.ctx, definingOp(f.ctx, x)), x);
    spills.addReload(ProgramPoint::after(f.ctx, clobber), x);
    transform::StackSpillLowering lowering;
    rewrite(f, fn, spills, lowering);

    EXPECT_TRUE(f.ctx.block(join).params.empty());
    EXPECT_TRUE(f.ctx.op(thenBr).successors[0].args.empty());
    EXPECT_TRUE(f.ctx.op(elseBr).successors[0].args.empty());

    const std::vector<Opcode> thenOps{Opcode::Exec,
                                      Opcode::LocalStore,
                                      Opcode::Exec,
                                      Opcode::LocalLoad,
                                      Opcode::Exec,
                                      Opcode::Br};
    EXPECT_EQ(opcodesIn(f.ctx, thenBlock), thenOps);
    const ir::OpId load = f.ctx.opsIn(thenBlock)[3];
    EXPECT_EQ(f.ctx.op(use).operands[0], f.ctx.op(load).results[0]);
    EXPECT_TRUE(ir::Verifier::verify(f.ctx, f.module).hasValue());
}

TEST(TransformSpillsTest, LoopHeaderMergesTheOriginalAndTheReload)
{
    tests::IrFixture f;
    const ir::OpId fn = f.addFunction("f", {i1()});
    const ir::BlockId entry = f.entryOf(fn);
    const ir::BlockId header = f.builder.addBlock(fn);
    const ir::BlockId body = f.builder.addBlock(fn);
    const ir::BlockId exit = f.builder.addBlock(fn);
    const ir::ValueId cond = f.builder.param(entry, 0);
    const ir::ValueId x = f.opaque("def");
    const ir::OpId entryBr = f.builder.br(header);
    f.at(header);
    const ir::OpId use = f.builder.exec("use", {x});
    f.builder.condBr(cond, body, {}, exit, {});
    f.at(body);
    f.builder.exec("clobber", {});
    const ir::OpId latch = f.builder.br(header);
    f.at(exit);
    f.builder.ret();

    transform::SpillAnalysis spills;
    spills.addSpill(ProgramPoint::after(f.ctx, definingOp(f.ctx, x)), x);
    spills.addReload(ProgramPoint::before(f.ctx, latch), x);
    transform::StackSpillLowering lowering;
    rewrite(f, fn, spills, lowering);

    ASSERT_EQ(f.ctx.block(header).params.size(), 1u);
    const ir::ValueId merged = f.ctx.block(header).params[0];
    EXPECT_EQ(f.ctx.op(use).operands[0], merged);

    const ir::OpId load = f.ctx.opsIn(body)[1];
    ASSERT_EQ(f.ctx.op(load).opcode, Opcode::LocalLoad);
    ASSERT_EQ(f.ctx.op(latch).successors[0].args.size(), 1u);
    EXPECT_EQ(f.ctx.op(latch).successors[0].args[0], f.ctx.op(load).results[0]);
    ASSERT_EQ(f.ctx.op(entryBr).successors[0].args.size(), 1u);
    EXPECT_EQ(f.ctx.op(entryBr).successors[0].args[0], x);
    EXPECT_TRUE(ir::Verifier::verify(f.ctx, f.module).hasValue());
}

TEST(TransformSpillsTest, BlockParameterWithoutUsesIsErasedWithItsReload)
{
    tests::IrFixture f;
    const ir::OpId fn = f.addFunction("f", {i1()});
    const ir::BlockId entry = f.entryOf(fn);
    const ir::BlockId thenBlock = f.builder.addBlock(fn);
    const ir::BlockId elseBlock = f.builder.addBlock(fn);
    const ir::BlockId join = f.builder.addBlock(fn);
    const ir::ValueId x = f.opaque("def");
    f.builder.condBr(f.builder.param(entry, 0), thenBlock, {}, elseBlock, {});
    f.at(thenBlock);
    f.builder.exec("clobber", {});
    const ir::OpId thenBr = f.builder.br(join);
    f.at(elseBlock);
    const ir::OpId elseBr = f.builder.br(join);
    f.at(join);
    const ir::OpId clobber = f.builder.exec("clobber", {});
    const ir::OpId use = f.builder.exec("use", {x});
    f.builder.ret();

    // The reload in the join makes the one in the then arm redundant.
    transform::SpillAnalysis spills;
    spills.addSpill(ProgramPoint::after(f.ctx, definingOp(f.ctx, x)), x);
    spills.addReload(ProgramPoint::before(f.ctx, thenBr), x);
    spills.addReload(ProgramPoint::after(f.ctx, clobber), x);
    transform::StackSpillLowering lowering;
    rewrite(f, fn, spills, lowering);

    EXPECT_TRUE(f.ctx.block(join).params.empty());
    EXPECT_TRUE(f.ctx.op(thenBr).successors[0].args.empty());
    EXPECT_TRUE(f.ctx.op(elseBr).successors[0].args.empty());

    const std::vector<Opcode> thenOps{Opcode::Exec, Opcode::Br};
    EXPECT_EQ(opcodesIn(f.ctx, thenBlock), thenOps);
    const std::vector<Opcode> joinOps{Opcode::Exec, Opcode::LocalLoad, Opcode::Exec, Opcode::Ret};
    EXPECT_EQ(opcodesIn(f.ctx, join), joinOps);
    const ir::OpId load = f.ctx.opsIn(join)[1];
    EXPECT_EQ(f.ctx.op(use).operands[0], f.ctx.op(load).results[0]);
    EXPECT_EQ(lowering.numSlots(), 1u);
    EXPECT_TRUE(ir::Verifier::verify(f.ctx, f.module).hasValue());
}

TEST(TransformSpillsTest, CriticalEdgeIsSplitForAReload)
{
    tests::IrFixture f;
    const ir::OpId fn = f.addFunction("f", {i1()});
    const ir::BlockId entry = f.entryOf(fn);
    const ir::BlockId body = f.builder.addBlock(fn);
    const ir::BlockId join = f.builder.addBlock(fn);
    const ir::ValueId x = f.opaque("def");
    const ir::OpId branch = f.builder.condBr(f.builder.param(entry, 0), body, {}, join, {});
    f.at(body);
    f.builder.exec("clobber", {});
    const ir::OpId bodyBr = f.builder.br(join);
    f.at(join);
    const ir::ValueId sum = f.builder.add(x, x);
    f.builder.ret({sum});

    transform::SpillAnalysis spills;
    const transform::SplitId edge = spills.addSplit(f.ctx, branch, 1);
    EXPECT_EQ(spills.addSplit(f.ctx, branch, 1), edge);
    spills.addSpill(ProgramPoint::after(f.ctx, definingOp(f.ctx, x)), x);
    spills.addReload(edge, x);
    spills.addReload(ProgramPoint::before(f.ctx, bodyBr), x);
    EXPECT_TRUE(spills.isReloadedAt(x, edge));

    support::AnalysisOptions options;
    options.verifyDominance = true;
    transform::StackSpillLowering lowering;
    rewrite(f, fn, spills, lowering, options);

    const ir::BlockId split = spills.split(edge).split;
    ASSERT_TRUE(split.isValid());
    EXPECT_EQ(f.ctx.blockIndex(split), 1u);
    EXPECT_EQ(f.ctx.op(branch).successors[1].dest, split);

    const std::vector<Opcode> splitOps{Opcode::LocalLoad, Opcode::Br};
    EXPECT_EQ(opcodesIn(f.ctx, split), splitOps);
    const ir::OpId splitLoad = f.ctx.opsIn(split)[0];
    const ir::OpId splitBr = f.ctx.terminator(split);
    EXPECT_EQ(f.ctx.op(splitBr).successors[0].dest, join);
    ASSERT_EQ(f.ctx.op(splitBr).successors[0].args.size(), 1u);
    EXPECT_EQ(f.ctx.op(splitBr).successors[0].args[0], f.ctx.op(splitLoad).results[0]);

    ASSERT_EQ(f.ctx.block(join).params.size(), 1u);
    const ir::Operation &add = f.ctx.op(definingOp(f.ctx, sum));
    EXPECT_EQ(add.operands[0], f.ctx.block(join).params[0]);
    EXPECT_EQ(lowering.numSlots(), 1u);
    EXPECT_TRUE(ir::Verifier::verify(f.ctx, f.module).hasValue());
}

TEST(TransformSpillsTest, SpillWithoutReloadIsErased)
{
    tests::IrFixture f;
    const ir::OpId fn = f.addFunction("f");
    const ir::BlockId entry = f.entryOf(fn);
    const ir::ValueId x = f.opaque("def");
    f.builder.exec("use", {x});
    f.builder.ret();

    transform::SpillAnalysis spills;
    spills.addSpill(ProgramPoint::after(f.ctx, definingOp(f.ctx, x)), x);
    transform::StackSpillLowering lowering;
    rewrite(f, fn, spills, lowering);

    const std::vector<Opcode> expected{Opcode::Exec, Opcode::Exec, Opcode::Ret};
    EXPECT_EQ(opcodesIn(f.ctx, entry), expected);
    EXPECT_EQ(lowering.numSlots(), 0u);
}

TEST(TransformSpillsTest, UnusedReloadTakesItsSpillWithIt)
{
    tests::IrFixture f;
    const ir::OpId fn = f.addFunction("f");
    const ir::BlockId entry = f.entryOf(fn);
    const ir::ValueId x = f.opaque("def");
    const ir::OpId clobber = f.builder.exec("clobber", {});
    f.builder.ret();

    transform::SpillAnalysis spills;
    spills.addSpill(ProgramPoint::after(f.ctx, definingOp(f.ctx, x)), x);
    spills.addReload(ProgramPoint::after(f.ctx, clobber), x);
    transform::StackSpillLowering lowering;
    rewrite(f, fn, spills, lowering);

    const std::vector<Opcode> expected{Opcode::Exec, Opcode::Exec, Opcode::Ret};
    EXPECT_EQ(opcodesIn(f.ctx, entry), expected);
    EXPECT_TRUE(f.ctx.value(x).uses.empty());
}

TEST(TransformSpillsTest, ReloadInOneArmOfAnIfStaysInThatArm)
{
    tests::IrFixture f;
    const ir::OpId fn = f.addFunction("f", {i1()});
    const ir::BlockId entry = f.entryOf(fn);
    const ir::ValueId x = f.opaque("def");
    const ir::OpId branch = f.builder.ifOp(f.builder.param(entry, 0));
    f.builder.ret();
    const ir::BlockId thenBlock = f.entryOf(branch);
    f.at(thenBlock);
    f.builder.exec("clobber", {});
    const ir::OpId thenUse = f.builder.exec("use", {x});
    f.builder.yield();
    f.at(f.ctx.entryBlock(f.regionOf(branch, 1)));
    const ir::OpId elseUse = f.builder.exec("use", {x});
    f.builder.yield();

    transform::SpillAnalysis spills;
    spills.addSpill(ProgramPoint::after(f.ctx, definingOp(f.ctx, x)), x);
    spills.addReload(ProgramPoint::before(f.ctx, thenUse), x);
    transform::StackSpillLowering lowering;
    rewrite(f, fn, spills, lowering);

    const ir::OpId load = f.ctx.opsIn(thenBlock)[1];
    ASSERT_EQ(f.ctx.op(load).opcode, Opcode::LocalLoad);
    EXPECT_EQ(f.ctx.op(thenUse).operands[0], f.ctx.op(load).results[0]);
    EXPECT_EQ(f.ctx.op(elseUse).operands[0], x);
    EXPECT_TRUE(ir::Verifier::verify(f.ctx, f.module).hasValue());
}

TEST(TransformSpillsTest, NothingToDoLeavesTheFunctionAlone)
{
    tests::IrFixture f;
    const ir::OpId fn = f.addFunction("f");
    f.builder.ret();

    transform::SpillAnalysis spills;
    transform::StackSpillLowering lowering;
    transform::AnalysisManager analyses(f.ctx);
    auto status = transform::transformSpills(f.ctx, fn, spills, lowering, analyses);
    ASSERT_TRUE(status.hasValue());
    EXPECT_EQ(status.value(), transform::PassStatus::Unchanged);
    EXPECT_EQ(analyses.counts().computations, 0u);
}

TEST(TransformSpillsTest, RewriteInvalidatesCachedAnalyses)
{
    tests::IrFixture f;
    const ir::OpId fn = f.addFunction("f");
    const ir::ValueId x = f.opaque("def");
    const ir::OpId clobber = f.builder.exec("clobber", {});
    f.builder.exec("use", {x});
    f.builder.ret();

    transform::SpillAnalysis spills;
    spills.addSpill(ProgramPoint::after(f.ctx, definingOp(f.ctx, x)), x);
    spills.addReload(ProgramPoint::after(f.ctx, clobber), x);
    transform::StackSpillLowering lowering;
    transform::AnalysisManager analyses(f.ctx);
    ASSERT_TRUE(analyses.getResult<analysis::DominanceInfo>(transform::kAnalysisDominance, f.module).hasValue());

    auto status = transform::transformSpills(f.ctx, fn, spills, lowering, analyses);
    ASSERT_TRUE(status.hasValue());
    EXPECT_FALSE(analyses.isCached(transform::kAnalysisDominance, fn));
    EXPECT_FALSE(analyses.isCached(transform::kAnalysisDominance, f.module));
}

TEST(TransformSpillsTest, RootMustHaveExactlyOneRegion)
{
    tests::IrFixture f;
    const ir::OpId fn = f.addFunction("f", {i1()});
    const ir::OpId branch = f.builder.ifOp(f.builder.param(f.entryOf(fn), 0));
    f.builder.ret();

    transform::SpillAnalysis spills;
    transform::StackSpillLowering lowering;
    transform::AnalysisManager analyses(f.ctx);
    EXPECT_THROW((void)transform::transformSpills(f.ctx, branch, spills, lowering, analyses),
                 support::InternalCompilerError);
}

TEST(TransformSpillsTest, MultiBlockNestedRegionsAreUnsupported)
{
    tests::IrFixture f;
    const ir::OpId fn = f.addFunction("f", {i1()});
    const ir::ValueId x = f.opaque("def");
    const ir::OpId branch = f.builder.ifOp(f.builder.param(f.entryOf(fn), 0));
    f.builder.ret();
    const ir::BlockId tail = f.builder.addBlock(branch, {}, 0);
    f.at(f.entryOf(branch));
    f.builder.br(tail);
    f.at(tail);
    f.builder.exec("use", {x});
    f.builder.yield();
    f.at(f.ctx.entryBlock(f.regionOf(branch, 1)));
    f.builder.yield();

    transform::SpillAnalysis spills;
    spills.addSpill(ProgramPoint::after(f.ctx, definingOp(f.ctx, x)), x);
    transform::StackSpillLowering lowering;
    transform::AnalysisManager analyses(f.ctx);
    EXPECT_THROW((void)transform::transformSpills(f.ctx, fn, spills, lowering, analyses),
                 support::InternalCompilerError);
}

TEST(TransformSpillsTest, RegionEdgeSplitsAreUnsupported)
{
    tests::IrFixture f;
    const ir::OpId fn = f.addFunction("f", {i1()});
    const ir::OpId branch = f.builder.ifOp(f.builder.param(f.entryOf(fn), 0));
    f.builder.ret();
    f.at(f.entryOf(branch));
    f.builder.yield();
    f.at(f.ctx.entryBlock(f.regionOf(branch, 1)));
    f.builder.yield();

    transform::SpillAnalysis spills;
    spills.addSplit(transform::RegionalEdge{branch, ir::RegionId(), f.regionOf(branch, 0)});
    transform::StackSpillLowering lowering;
    transform::AnalysisManager analyses(f.ctx);
    EXPECT_THROW((void)transform::transformSpills(f.ctx, fn, spills, lowering, analyses),
                 support::InternalCompilerError);
}
