//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_ir_builder.cpp
// Purpose: Cover IR construction, use-list maintenance, program points and
//          the structural verifier.
// Key invariants: Every operand slot appears exactly once in the use list of
//                 the value it reads.
// Ownership/Lifetime: Each test builds and discards its own Context.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "ir/Interfaces.hpp"
#include "ir/Printer.hpp"
#include "ir/Verifier.hpp"
#include "tests/common/IrFixture.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

using namespace strata;
using strata::tests::i1;
using strata::tests::i64;

namespace
{

bool hasUse(const ir::Context &ctx, ir::ValueId value, const ir::OpOperand &ref)
{
    const auto &uses = ctx.value(value).uses;
    return std::find(uses.begin(), uses.end(), ref) != uses.end();
}

} // namespace

TEST(IrBuilderTest, BuildsBranchesWithForwardedArguments)
{
    tests::IrFixture f;
    const ir::OpId fn = f.addFunction("f", {i1()});
    const ir::BlockId entry = f.entryOf(fn);
    const ir::BlockId join = f.builder.addBlock(fn, {i64()});

    const ir::ValueId cond = f.builder.param(entry, 0);
    const ir::ValueId one = f.builder.constant(1);
    const ir::ValueId two = f.builder.constant(2);
    const ir::OpId br = f.builder.condBr(cond, join, {one}, join, {two});
    f.at(join);
    f.builder.ret({f.builder.param(join, 0)});

    EXPECT_EQ(f.ctx.terminator(entry), br);
    EXPECT_EQ(f.ctx.block(join).predecessors.size(), 2u);

    const auto refs = f.ctx.operandRefs(br);
    ASSERT_EQ(refs.size(), 3u);
    EXPECT_EQ(refs[1].group, 1u);
    EXPECT_EQ(f.ctx.operandValue(refs[1]), one);
    EXPECT_EQ(f.ctx.operandValue(refs[2]), two);
    EXPECT_TRUE(hasUse(f.ctx, two, refs[2]));

    EXPECT_TRUE(ir::Verifier::verify(f.ctx, f.module).hasValue());
}

TEST(IrBuilderTest, ReplaceAllUsesUpdatesOperandsAndUseLists)
{
    tests::IrFixture f;
    f.addFunction("f");
    const ir::ValueId a = f.opaque("a");
    const ir::ValueId b = f.opaque("b");
    const ir::ValueId sum = f.builder.add(a, a);
    const ir::OpId ret = f.builder.ret({a});

    f.ctx.replaceAllUsesWith(a, b);

    const ir::OpId addOp = f.ctx.value(sum).definingOp;
    EXPECT_EQ(f.ctx.op(addOp).operands[0], b);
    EXPECT_EQ(f.ctx.op(addOp).operands[1], b);
    EXPECT_EQ(f.ctx.op(ret).operands[0], b);
    EXPECT_FALSE(f.ctx.isUsed(a));
    EXPECT_EQ(f.ctx.value(b).uses.size(), 3u);
}

TEST(IrBuilderTest, SuccessorArgumentsCanBeMovedBetweenEdges)
{
    tests::IrFixture f;
    const ir::OpId fn = f.addFunction("f");
    const ir::BlockId entry = f.entryOf(fn);
    const ir::BlockId target = f.builder.addBlock(fn, {i64()});
    const ir::ValueId v = f.opaque("v");
    const ir::OpId br = f.builder.br(target, {v});
    f.at(target);
    f.builder.ret();

    const ir::BlockId split = f.ctx.createBlockAfter(entry);
    EXPECT_EQ(f.ctx.blockIndex(split), 1u);

    f.ctx.setSuccessorDest(br, 0, split);
    const std::vector<ir::ValueId> args = f.ctx.takeSuccessorArgs(br, 0);
    ASSERT_EQ(args.size(), 1u);
    EXPECT_EQ(args[0], v);
    EXPECT_FALSE(f.ctx.isUsed(v));
    EXPECT_TRUE(f.ctx.block(target).predecessors.empty());
    ASSERT_EQ(f.ctx.block(split).predecessors.size(), 1u);
    EXPECT_EQ(f.ctx.block(split).predecessors[0].op, br);

    f.at(split);
    f.builder.br(target, args);
    EXPECT_TRUE(ir::Verifier::verify(f.ctx, f.module).hasValue());
}

TEST(IrBuilderTest, ErasingABlockParameterDropsItsForwardedArguments)
{
    tests::IrFixture f;
    const ir::OpId fn = f.addFunction("f", {i1()});
    const ir::BlockId entry = f.entryOf(fn);
    const ir::BlockId target = f.builder.addBlock(fn, {i64(), i64(), i64()});
    const ir::ValueId a = f.opaque("a");
    const ir::ValueId b = f.opaque("b");
    const ir::ValueId c = f.opaque("c");
    const ir::OpId br = f.builder.condBr(f.builder.param(entry, 0), target, {a, b, c}, target, {c, b, a});
    f.at(target);
    const ir::ValueId last = f.builder.param(target, 2);
    f.builder.ret({f.builder.add(f.builder.param(target, 0), last)});

    f.ctx.eraseBlockParam(target, 1);

    ASSERT_EQ(f.ctx.block(target).params.size(), 2u);
    EXPECT_EQ(f.ctx.block(target).params[1], last);
    EXPECT_EQ(f.ctx.value(last).index, 1u);
    EXPECT_EQ(f.ctx.op(br).successors[0].args, (std::vector<ir::ValueId>{a, c}));
    EXPECT_EQ(f.ctx.op(br).successors[1].args, (std::vector<ir::ValueId>{c, a}));
    EXPECT_FALSE(f.ctx.isUsed(b));
    EXPECT_TRUE(hasUse(f.ctx, c, ir::OpOperand{br, 1, 1}));
    EXPECT_TRUE(hasUse(f.ctx, c, ir::OpOperand{br, 2, 0}));
    EXPECT_FALSE(hasUse(f.ctx, c, ir::OpOperand{br, 1, 2}));
    EXPECT_TRUE(hasUse(f.ctx, a, ir::OpOperand{br, 2, 1}));
    EXPECT_TRUE(ir::Verifier::verify(f.ctx, f.module).hasValue());
}

TEST(IrBuilderTest, ProgramPointsCanonicalizeToTheOpBefore)
{
    tests::IrFixture f;
    const ir::OpId fn = f.addFunction("f");
    const ir::BlockId entry = f.entryOf(fn);
    const ir::OpId first = f.builder.exec("first", {});
    const ir::OpId ret = f.builder.ret();

    const ir::ProgramPoint beforeFirst = ir::ProgramPoint::before(f.ctx, first).canonicalize(f.ctx);
    EXPECT_EQ(beforeFirst, ir::ProgramPoint::atStartOf(entry));

    const ir::ProgramPoint beforeRet = ir::ProgramPoint::before(f.ctx, ret).canonicalize(f.ctx);
    EXPECT_EQ(beforeRet, ir::ProgramPoint::after(f.ctx, first));

    const ir::ProgramPoint end = ir::ProgramPoint::atEndOf(entry).canonicalize(f.ctx);
    EXPECT_EQ(end, ir::ProgramPoint::after(f.ctx, ret));
    EXPECT_EQ(ir::ProgramPoint::atStartOf(entry).nextOp(f.ctx), first);
}

TEST(IrBuilderTest, InsertionAtProgramPoints)
{
    tests::IrFixture f;
    const ir::OpId fn = f.addFunction("f");
    const ir::BlockId entry = f.entryOf(fn);
    const ir::OpId middle = f.builder.exec("middle", {});
    f.builder.ret();

    f.builder.setInsertionPoint(ir::ProgramPoint::atStartOf(entry));
    const ir::OpId head = f.builder.exec("head", {});
    f.builder.setInsertionPoint(ir::ProgramPoint::after(f.ctx, middle));
    const ir::OpId tail = f.builder.exec("tail", {});

    const std::vector<ir::OpId> ops = f.ctx.opsIn(entry);
    ASSERT_EQ(ops.size(), 4u);
    EXPECT_EQ(ops[0], head);
    EXPECT_EQ(ops[1], middle);
    EXPECT_EQ(ops[2], tail);
    EXPECT_EQ(f.ctx.op(ops[3]).opcode, ir::Opcode::Ret);
}

TEST(IrBuilderTest, StructuredOpsExposeRegionSuccessors)
{
    tests::IrFixture f;
    f.addFunction("f", {i1()});
    const ir::ValueId init = f.builder.constant(0);
    const ir::OpId loop = f.builder.whileOp({init}, {i64()});
    const ir::BlockId before = f.entryOf(loop);
    const ir::BlockId after = f.ctx.entryBlock(f.regionOf(loop, 1));
    f.builder.ret();

    f.at(before);
    const ir::ValueId cond = f.builder.lt(f.builder.param(before, 0), f.builder.constant(10));
    f.builder.condition(cond, {f.builder.param(before, 0)});
    f.at(after);
    f.builder.yield({f.builder.add(f.builder.param(after, 0), f.builder.constant(1))});

    EXPECT_TRUE(ir::isRegionBranchOp(f.ctx, loop));
    EXPECT_TRUE(ir::isRepetitiveRegion(f.ctx, f.regionOf(loop, 0)));
    EXPECT_TRUE(ir::isRepetitiveRegion(f.ctx, f.regionOf(loop, 1)));

    const auto fromBefore = ir::getSuccessorRegions(f.ctx, loop, f.regionOf(loop, 0));
    ASSERT_EQ(fromBefore.size(), 2u);
    EXPECT_EQ(fromBefore[0].region, f.regionOf(loop, 1));
    EXPECT_TRUE(fromBefore[1].isParent());

    EXPECT_TRUE(ir::Verifier::verify(f.ctx, f.module).hasValue());
}

TEST(IrBuilderTest, VerifierRejectsMissingTerminator)
{
    tests::IrFixture f;
    f.addFunction("f");
    f.builder.exec("work", {});

    auto result = ir::Verifier::verify(f.ctx, f.module);
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().code, support::ErrorCode::InvalidIR);
    EXPECT_NE(result.error().message.find("lacks a terminator"), std::string::npos);
}

TEST(IrBuilderTest, VerifierRejectsArgumentCountMismatch)
{
    tests::IrFixture f;
    const ir::OpId fn = f.addFunction("f");
    const ir::BlockId target = f.builder.addBlock(fn, {i64()});
    f.builder.br(target);
    f.at(target);
    f.builder.ret();

    auto result = ir::Verifier::verify(f.ctx, f.module);
    ASSERT_FALSE(result.hasValue());
    EXPECT_NE(result.error().message.find("expects 1 arguments, got 0"), std::string::npos);
}

TEST(IrBuilderTest, PrinterShowsBlocksAndSuccessors)
{
    tests::IrFixture f;
    const ir::OpId fn = f.addFunction("main");
    const ir::BlockId exit = f.builder.addBlock(fn);
    f.builder.br(exit);
    f.at(exit);
    f.builder.ret();

    const std::string text = ir::Printer::toString(f.ctx, f.module);
    EXPECT_NE(text.find("func @main public"), std::string::npos);
    EXPECT_NE(text.find("br ^bb" + std::to_string(exit.index)), std::string::npos);
}
