//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/SupportTests.cpp
// Purpose: Cover the support layer used across the evaluator: Expected,
//          diagnostics, evaluation error rendering, interning and alignment.
// Key invariants: Error kinds have stable names; internal errors are
//                 distinguishable from user-facing ones in diagnostics.
// Ownership/Lifetime: Test-local objects only.
// Links: docs/dev/eval.md
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "eval/EvalError.hpp"
#include "support/alignment.hpp"
#include "support/debug_log.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/string_interner.hpp"

#include <cstdint>
#include <sstream>
#include <string>

using namespace kiln;
using kiln::eval::EvalErrorKind;

TEST(ExpectedTest, HoldsValueOrError)
{
    support::Expected<int> ok(42);
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), 42);

    support::Expected<int> bad(support::makeError(support::SourceLoc{}, "boom"));
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().message, "boom");
    EXPECT_EQ(bad.error().severity, support::Severity::Error);

    eval::EvalResult<void> done;
    EXPECT_TRUE(done);
    eval::EvalResult<void> failed(eval::makeEvalError(EvalErrorKind::Overflow, "wrapped"));
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().kind, EvalErrorKind::Overflow);
}

TEST(EvalErrorTest, KindsHaveStableNames)
{
    static_assert(eval::toString(EvalErrorKind::ReadBytesAsPointer) == "ReadBytesAsPointer");
    EXPECT_EQ(eval::toString(EvalErrorKind::Internal), "Internal");
    EXPECT_EQ(eval::toString(EvalErrorKind::UnimplementedTraitSelection), "UnimplementedTraitSelection");
    EXPECT_EQ(eval::toString(EvalErrorKind::ModifiedConstantMemory), "ModifiedConstantMemory");
}

TEST(EvalErrorTest, DiagnosticsDistinguishInternalErrors)
{
    const support::SourceLoc loc{4, 10, 2};
    const support::Diagnostic internal = eval::toDiagnostic(eval::internalError("bad slot"), loc);
    EXPECT_EQ(internal.severity, support::Severity::Error);
    EXPECT_EQ(internal.message, "internal error: bad slot");

    const support::Diagnostic user =
        eval::toDiagnostic(eval::makeEvalError(EvalErrorKind::PointerOutOfBounds, "read past end"), loc);
    EXPECT_EQ(user.message, "read past end [PointerOutOfBounds]");
    EXPECT_EQ(user.loc.file_id, 4u);

    const support::Diagnostic bare = eval::toDiagnostic(eval::EvalError{EvalErrorKind::TooGeneric, ""}, loc);
    EXPECT_EQ(bare.message, "TooGeneric");
}

TEST(DiagnosticEngineTest, CountsAndPrints)
{
    support::DiagnosticEngine engine;
    engine.report(support::Diagnostic{support::Severity::Warning, "odd", support::SourceLoc{}});
    engine.report(support::makeError(support::SourceLoc{2, 7, 0}, "broken"));
    EXPECT_EQ(engine.count(support::Severity::Warning), 1u);
    EXPECT_EQ(engine.count(support::Severity::Error), 1u);

    std::ostringstream os;
    engine.printAll(os);
    EXPECT_EQ(os.str(), "warning: odd\n#2:7: error: broken\n");
}

TEST(StringInternerTest, SameTextSameSymbol)
{
    support::StringInterner interner;
    const support::Symbol a = interner.intern("MAX");
    const support::Symbol b = interner.intern(std::string("MA") + "X");
    const support::Symbol c = interner.intern("MIN");
    EXPECT_NE(a.id, 0u);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(interner.lookup(c), "MIN");
}

TEST(AlignmentTest, PowerOfTwoHelpers)
{
    EXPECT_TRUE(support::isPowerOfTwo(uint64_t{8}));
    EXPECT_FALSE(support::isPowerOfTwo(uint64_t{0}));
    EXPECT_FALSE(support::isPowerOfTwo(uint64_t{12}));
    EXPECT_EQ(support::alignUp<uint64_t>(13, 8), 16u);
    EXPECT_TRUE(support::isAligned<uint64_t>(24, 8));
    EXPECT_FALSE(support::isAligned<uint64_t>(20, 8));
}

TEST(DebugLogTest, OverrideTogglesLogging)
{
    support::setDebugLogging(true);
    EXPECT_TRUE(support::isDebugLoggingEnabled());
    testing::internal::CaptureStderr();
    support::debugLog("MEM", "alloc%d", 3);
    EXPECT_EQ(testing::internal::GetCapturedStderr(), "[DEBUG][MEM] alloc3\n");

    support::setDebugLogging(false);
    EXPECT_FALSE(support::isDebugLoggingEnabled());
    testing::internal::CaptureStderr();
    support::debugLog("MEM", "silent");
    EXPECT_TRUE(testing::internal::GetCapturedStderr().empty());
}

TEST(DebugLogTest, ScopedOverrideRestoresPreviousSetting)
{
    support::setDebugLogging(false);
    {
        support::ScopedDebugLogging on(true);
        EXPECT_TRUE(support::isDebugLoggingEnabled());
        {
            support::ScopedDebugLogging off(false);
            EXPECT_FALSE(support::isDebugLoggingEnabled());
        }
        EXPECT_TRUE(support::isDebugLoggingEnabled());
    }
    EXPECT_FALSE(support::isDebugLoggingEnabled());
}
