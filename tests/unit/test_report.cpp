// File: tests/unit/test_report.cpp
// Purpose: Diagnostic collection, filtering, merging and caret rendering.
// Key invariants: Formatting prints "path:line:col: severity[CODE]: message"
//                 followed by the source line and a caret underline of at
//                 least one character; zip keeps each source's entries together.
// Ownership/Lifetime: Standalone unit test executable.
// Links: src/support/diagnostics.hpp, src/support/diag_codes.hpp

#include <gtest/gtest.h>

#include "support/diag_codes.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <sstream>

using namespace sous::support;

TEST(Report, CountsBySeverityAndCode)
{
    SourceReport report;
    EXPECT_TRUE(report.empty());
    report.warning(DiagCode::P003_BadName, {}, "a");
    report.error(DiagCode::A003_ReferenceNotFound, {}, "b");
    report.warning(DiagCode::P003_BadName, {}, "c");

    EXPECT_FALSE(report.empty());
    EXPECT_EQ(report.warningCount(), 2u);
    EXPECT_EQ(report.errorCount(), 1u);
    EXPECT_TRUE(report.hasErrors());
    EXPECT_EQ(report.count(DiagCode::P003_BadName), 2u);
    EXPECT_EQ(report.errors().size(), 1u);
    EXPECT_EQ(report.warnings()[1].message, "c");

    SourceReport errorsOnly = report.removeWarnings();
    ASSERT_EQ(errorsOnly.diagnostics().size(), 1u);
    EXPECT_EQ(errorsOnly.diagnostics()[0].message, "b");
    EXPECT_EQ(errorsOnly.warningCount(), 0u);
    EXPECT_EQ(report.diagnostics().size(), 3u);
}

TEST(Report, AppendKeepsOrder)
{
    SourceReport a;
    a.warning(DiagCode::P001_UnterminatedComponent, {}, "first");
    SourceReport b;
    b.error(DiagCode::A006_ConflictingServings, {}, "second");
    a.append(b);
    ASSERT_EQ(a.diagnostics().size(), 2u);
    EXPECT_EQ(a.diagnostics()[1].message, "second");
    EXPECT_TRUE(a.hasErrors());
}

TEST(Report, ZipGroupsBySource)
{
    SourceReport a;
    a.warning(DiagCode::P001_UnterminatedComponent, Span{2, 0, 1}, "a-file2");
    a.error(DiagCode::A003_ReferenceNotFound, Span{1, 0, 1}, "a-file1");
    SourceReport b;
    b.warning(DiagCode::P003_BadName, Span{1, 0, 1}, "b-file1");
    b.warning(DiagCode::P003_BadName, Span{3, 0, 1}, "b-file3");
    b.warning(DiagCode::P003_BadName, Span{2, 0, 1}, "b-file2");

    SourceReport zipped = a.zip(b);
    const auto &d = zipped.diagnostics();
    ASSERT_EQ(d.size(), 5u);
    EXPECT_EQ(d[0].message, "a-file2");
    EXPECT_EQ(d[1].message, "b-file2");
    EXPECT_EQ(d[2].message, "a-file1");
    EXPECT_EQ(d[3].message, "b-file1");
    EXPECT_EQ(d[4].message, "b-file3");
    EXPECT_EQ(zipped.errorCount(), 1u);
    EXPECT_EQ(zipped.warningCount(), 4u);
}

TEST(Report, FormatsWithCarets)
{
    SourceManager sm;
    const uint32_t id = sm.addSource("soup.cook", "Add @salt{2%pinch}.\n");
    SourceReport report;
    report.warning(DiagCode::A002_UnknownUnit, Span{id, 12, 17}, "unknown unit 'pinch'")
        .withHelp("the quantity cannot be converted");

    EXPECT_EQ(report.format(sm),
              "soup.cook:1:13: warning[A002]: unknown unit 'pinch'\n"
              "Add @salt{2%pinch}.\n"
              "            ^^^^^\n"
              "help: the quantity cannot be converted\n");
}

TEST(Report, FormatsLabelsOnOtherLines)
{
    SourceManager sm;
    const uint32_t id = sm.addSource("menu.cook", "line one\nsecond line\n");
    SourceReport report;
    report.error(DiagCode::A006_ConflictingServings, Span{id, 0, 4}, "conflict")
        .label(Span{id, 9, 15}, "first given here")
        .label(Span{}, "detached");

    EXPECT_EQ(report.format(sm),
              "menu.cook:1:1: error[A006]: conflict\n"
              "line one\n"
              "^^^^\n"
              "menu.cook:2:1: note: first given here\n"
              "second line\n"
              "^^^^^^\n"
              "note: detached\n");
}

TEST(Report, CaretsAreClippedAndNeverEmpty)
{
    SourceManager sm;
    const uint32_t id = sm.addSource("a.cook", "ab\ncd");
    SourceReport report;
    report.warning(DiagCode::P001_UnterminatedComponent, Span{id, 1, 5}, "wide");
    report.warning(DiagCode::P006_EmptyMetadataValue, Span{id, 5, 5}, "empty");

    EXPECT_EQ(report.format(sm),
              "a.cook:1:2: warning[P001]: wide\n"
              "ab\n"
              " ^\n"
              "a.cook:2:3: warning[P006]: empty\n"
              "cd\n"
              "  ^\n");
}

TEST(Report, PrintsWithoutSources)
{
    SourceReport report;
    report.warning(DiagCode::U002_UnknownUnit, Span{4, 0, 2}, "unknown unit 'x'")
        .label(Span{4, 3, 4}, "used here")
        .withHelp("define it");
    std::ostringstream os;
    report.print(os);
    EXPECT_EQ(os.str(), "warning[U002]: unknown unit 'x'\nnote: used here\nhelp: define it\n");
}

TEST(Report, DiagCodeCatalog)
{
    EXPECT_STREQ(diagCodeStr(DiagCode::P014_InvalidIntermediateReference), "P014");
    EXPECT_STREQ(diagCodeName(DiagCode::A016_RedundantServings), "redundant-servings");
    EXPECT_EQ(diagKind(DiagCode::U001_IncompatibleUnits), DiagKind::Conversion);
    EXPECT_EQ(diagKind(DiagCode::A010_RecipeNotFound), DiagKind::Semantic);
    EXPECT_EQ(diagKind(DiagCode::P010_EmptyComponent), DiagKind::Syntax);
    EXPECT_EQ(parseDiagCode("P003"), DiagCode::P003_BadName);
    EXPECT_EQ(parseDiagCode("conflicting-servings"), DiagCode::A006_ConflictingServings);
    EXPECT_FALSE(parseDiagCode("Z999").has_value());
}

TEST(Report, ExpectedCarriesValueOrDiagnostic)
{
    Expected<int> ok(42);
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), 42);

    Expected<int> bad(makeError(DiagCode::U003_NoUnit, {}, "no unit"));
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, DiagCode::U003_NoUnit);
    EXPECT_EQ(bad.error().severity, Severity::Error);

    Expected<void> fine;
    EXPECT_TRUE(fine);
}
