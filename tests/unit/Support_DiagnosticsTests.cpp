// File: tests/unit/Support_DiagnosticsTests.cpp
// Purpose: Verify source registration, location formatting and diagnostic
//          printing.
// Key invariants: Paths are normalized and deduplicated; diagnostics print as
//                 `location: severity: message`.
// Ownership: Standalone.
#include <gtest/gtest.h>

#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <sstream>

using namespace garnet::support;

TEST(SourceManager, RegistersNormalizedPathsOnce)
{
    SourceManager sm;
    uint32_t a = sm.addFile("lib/../src/main.gt");
    uint32_t b = sm.addFile("src/main.gt");
    uint32_t c = sm.addFile("src/other.gt");
    EXPECT_EQ(a, 1u);
    EXPECT_EQ(b, a);
    EXPECT_EQ(c, 2u);
    EXPECT_EQ(sm.getPath(a), "src/main.gt");
    EXPECT_EQ(sm.getPath(0), "");
    EXPECT_EQ(sm.getPath(3), "");
    EXPECT_EQ(sm.getPath(c), "src/other.gt");
}

TEST(SourceLoc, Queries)
{
    SourceLoc none;
    EXPECT_FALSE(none.isValid());
    EXPECT_FALSE(none.hasLine());

    SourceLoc lineOnly{0, 4, 0};
    EXPECT_FALSE(lineOnly.isValid());
    EXPECT_TRUE(lineOnly.hasLine());
    EXPECT_EQ(formatLoc(lineOnly), "line 4");

    SourceManager sm;
    SourceLoc full{sm.addFile("x.gt"), 2, 7};
    EXPECT_TRUE(full.isValid());
    EXPECT_EQ(formatLoc(full, &sm), "x.gt:2:7");
    EXPECT_EQ(formatLoc(SourceLoc{full.file_id, 2, 0}, &sm), "x.gt:2");
    EXPECT_EQ(formatLoc(full), "line 2");
}

TEST(Diagnostics, PrintDiagFormats)
{
    std::ostringstream os;
    printDiag(makeError({}, "plain"), os);
    EXPECT_EQ(os.str(), "error: plain\n");

    os.str("");
    printDiag(Diag{Severity::Warning, "careful", SourceLoc{0, 3, 0}}, os);
    EXPECT_EQ(os.str(), "line 3: warning: careful\n");
}

TEST(Diagnostics, EngineKeepsReportOrderAndCountsErrors)
{
    DiagnosticEngine engine;
    engine.report(makeError({}, "one"));
    engine.report(Diag{Severity::Warning, "two", {}});
    engine.report(Diag{Severity::Note, "three", {}});
    engine.report(makeError(SourceLoc{0, 8, 0}, "four"));
    EXPECT_EQ(engine.errorCount(), 2u);
    ASSERT_EQ(engine.diagnostics().size(), 4u);

    std::ostringstream os;
    for (const auto &d : engine.diagnostics())
        printDiag(d, os);
    EXPECT_EQ(os.str(), "error: one\nwarning: two\nnote: three\nline 8: error: four\n");
}

TEST(Expected, HoldsValueOrDiagnostic)
{
    Expected<int> ok(3);
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), 3);

    Expected<int> bad(makeError({}, "nope"));
    EXPECT_FALSE(bad);
    EXPECT_EQ(bad.error().message, "nope");

    Expected<void> done;
    EXPECT_TRUE(done.hasValue());
    Expected<void> failed(makeError({}, "x"));
    EXPECT_FALSE(failed.hasValue());
}
