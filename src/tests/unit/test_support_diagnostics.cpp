//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_support_diagnostics.cpp
// Purpose: Cover the support layer: Expected, diagnostic formatting and
//          counting, internal compiler errors and trace sinks.
// Key invariants: An Expected holds a value or a diagnostic, never both.
// Ownership/Lifetime: All objects are test-local values.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/fatal.hpp"
#include "support/trace.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <string>

using namespace strata::support;

TEST(SupportTest, ExpectedCarriesValueOrDiagnostic)
{
    Expected<int> ok(42);
    ASSERT_TRUE(ok.hasValue());
    EXPECT_EQ(ok.value(), 42);

    Expected<int> failed(makeError({}, "no entry block", ErrorCode::EmptyRegion));
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().code, ErrorCode::EmptyRegion);
    EXPECT_EQ(failed.error().severity, Severity::Error);
    EXPECT_EQ(failed.error().message, "no entry block");

    Expected<void> done;
    EXPECT_TRUE(done.hasValue());
    Expected<void> broken(makeError({}, "bad"));
    EXPECT_FALSE(broken.hasValue());
    EXPECT_EQ(broken.error().code, ErrorCode::None);
}

TEST(SupportTest, TakeValueMovesOutMoveOnlyPayloads)
{
    Expected<std::unique_ptr<int>> boxed(std::make_unique<int>(7));
    ASSERT_TRUE(boxed.hasValue());
    std::unique_ptr<int> taken = boxed.takeValue();
    ASSERT_NE(taken.get(), nullptr);
    EXPECT_EQ(*taken, 7);
}

TEST(SupportTest, PrintDiagIncludesKnownLocationParts)
{
    std::ostringstream located;
    printDiag(makeError(SourceLoc{3, 12, 5}, "operand has no definition"), located);
    EXPECT_EQ(located.str(), "file#3:12:5: error: operand has no definition\n");

    std::ostringstream lineOnly;
    printDiag(makeError(SourceLoc{3, 12, 0}, "x"), lineOnly);
    EXPECT_EQ(lineOnly.str(), "file#3:12: error: x\n");

    std::ostringstream unknown;
    printDiag(makeError({}, "region is empty"), unknown);
    EXPECT_EQ(unknown.str(), "error: region is empty\n");
}

TEST(SupportTest, DiagnosticEngineCountsBySeverity)
{
    DiagnosticEngine engine;
    engine.report(Diagnostic{Severity::Warning, "slow query threshold reached", {}});
    engine.report(Diagnostic{Severity::Note, "rebuilding dfs numbers", {}});
    engine.report(makeError({}, "block lacks a terminator", ErrorCode::InvalidIR));

    EXPECT_EQ(engine.errorCount(), 1u);
    EXPECT_EQ(engine.warningCount(), 1u);
    ASSERT_EQ(engine.diagnostics().size(), 3u);
    EXPECT_EQ(engine.diagnostics().back().code, ErrorCode::InvalidIR);

    std::ostringstream os;
    engine.printAll(os);
    EXPECT_EQ(os.str(),
              "warning: slow query threshold reached\n"
              "note: rebuilding dfs numbers\n"
              "error: block lacks a terminator\n");
}

TEST(SupportTest, FatalHelpersThrowInternalCompilerError)
{
    try
    {
        unimplemented("interprocedural liveness analysis");
        FAIL() << "unimplemented returned";
    }
    catch (const InternalCompilerError &e)
    {
        EXPECT_EQ(std::string(e.what()), "not implemented: interprocedural liveness analysis");
    }

    EXPECT_THROW(todo("splits following a region branch op"), InternalCompilerError);
    EXPECT_THROW(internalError("stale dominator tree"), InternalCompilerError);
}

TEST(SupportTest, TraceTopicsHaveStableNames)
{
    EXPECT_EQ(traceTopicName(TraceTopic::DomTree), "domtree");
    EXPECT_EQ(traceTopicName(TraceTopic::Dataflow), "dataflow");
    EXPECT_EQ(traceTopicName(TraceTopic::DeadCode), "dce");
    EXPECT_EQ(traceTopicName(TraceTopic::Liveness), "liveness");
    EXPECT_EQ(traceTopicName(TraceTopic::Spills), "spills");

    // Writing to a topic never fails, whether or not it is enabled.
    std::ostream &os = trace(TraceTopic::Spills);
    os << "trace line\n";
    EXPECT_TRUE(os.good());
}
