// File: tests/unit/test_parser_recovery.cpp
// Purpose: Malformed markup degrades to text with a warning instead of failing.
// Key invariants: Parsing never aborts; rejected components re-emit their
//                 source as Text; warnings carry the expected codes.
// Ownership/Lifetime: Standalone unit test executable.
// Links: src/parse/Parser_Component.cpp, src/parse/Parser_Line.cpp

#include <gtest/gtest.h>

#include "parse/Parser.hpp"

#include <string>
#include <vector>

using namespace sous::parse;
using sous::support::DiagCode;
using sous::support::SourceReport;

namespace
{
struct Parsed
{
    std::vector<Event> events;
    SourceReport report;
};

Parsed run(const std::string &src)
{
    Parsed out;
    out.events = parseEvents(src, 1, Extensions::All, out.report);
    return out;
}

std::string allText(const std::vector<Event> &events)
{
    std::string out;
    for (const auto &e : events)
    {
        if (const auto *t = std::get_if<TextEvent>(&e))
            out += t->text;
    }
    return out;
}

size_t components(const std::vector<Event> &events)
{
    size_t n = 0;
    for (const auto &e : events)
    {
        if (std::holds_alternative<IngredientEvent>(e) || std::holds_alternative<CookwareEvent>(e) ||
            std::holds_alternative<TimerEvent>(e))
            ++n;
    }
    return n;
}
} // namespace

TEST(ParserRecovery, UnterminatedBraceBecomesText)
{
    auto p = run("Add @salt{1%tsp and stir");
    EXPECT_EQ(p.report.count(DiagCode::P001_UnterminatedComponent), 1u);
    EXPECT_EQ(p.report.warningCount(), 1u);
    EXPECT_FALSE(p.report.hasErrors());
    ASSERT_EQ(p.events.size(), 3u);
    EXPECT_EQ(std::get<TextEvent>(p.events[1]).text, "Add @salt{1%tsp and stir");
}

TEST(ParserRecovery, LoneSigilIsText)
{
    auto p = run("mail me @ home or @ salt{}");
    EXPECT_TRUE(p.report.empty());
    EXPECT_EQ(components(p.events), 0u);
    EXPECT_EQ(allText(p.events), "mail me @ home or @ salt{}");
}

TEST(ParserRecovery, AmbiguousDecimalAfterName)
{
    auto p = run("Add @salt.5 now");
    EXPECT_EQ(p.report.count(DiagCode::P002_AmbiguousDecimalName), 1u);
    ASSERT_EQ(components(p.events), 1u);
    EXPECT_EQ(std::get<IngredientEvent>(p.events[2]).name, "salt");
    EXPECT_EQ(allText(p.events), "Add .5 now");
}

TEST(ParserRecovery, SymbolGluedToName)
{
    auto p = run("Use @salt-free butter");
    EXPECT_EQ(p.report.count(DiagCode::P003_BadName), 1u);
    ASSERT_EQ(components(p.events), 1u);
    EXPECT_EQ(std::get<IngredientEvent>(p.events[2]).name, "salt");
}

TEST(ParserRecovery, MetadataWithoutColon)
{
    auto p = run(">> no colon here");
    EXPECT_EQ(p.report.count(DiagCode::P004_InvalidMetadataLine), 1u);
    ASSERT_EQ(p.events.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<StepStartEvent>(p.events[0]));
    EXPECT_EQ(std::get<TextEvent>(p.events[1]).text, ">> no colon here");
}

TEST(ParserRecovery, MetadataWithoutValue)
{
    auto p = run(">> title:");
    EXPECT_EQ(p.report.count(DiagCode::P006_EmptyMetadataValue), 1u);
    ASSERT_EQ(p.events.size(), 1u);
    const auto &ev = std::get<MetadataEvent>(p.events[0]);
    EXPECT_EQ(ev.key, "title");
    EXPECT_TRUE(ev.value.empty());
}

TEST(ParserRecovery, SectionWithComponent)
{
    auto p = run("= @salt =");
    EXPECT_EQ(p.report.count(DiagCode::P005_InvalidSectionLine), 1u);
    EXPECT_EQ(components(p.events), 0u);
    EXPECT_EQ(allText(p.events), "= @salt =");
}

TEST(ParserRecovery, CookwareRejectsUnitsAndRecipes)
{
    auto p = run("Heat #pan{2%large} and #@wok{}.");
    EXPECT_EQ(p.report.count(DiagCode::P007_ComponentPartIgnored), 2u);
    ASSERT_EQ(components(p.events), 2u);
    const auto &pan = std::get<CookwareEvent>(p.events[2]);
    ASSERT_TRUE(pan.quantity.has_value());
    EXPECT_EQ(pan.quantity->value.toString(), "2");
    EXPECT_FALSE(pan.quantity->unit.has_value());
    const auto &wok = std::get<CookwareEvent>(p.events[4]);
    EXPECT_FALSE(wok.modifiers.recipe);
}

TEST(ParserRecovery, CookwareCannotBeFixed)
{
    auto p = run("#pan{1}*");
    EXPECT_EQ(p.report.count(DiagCode::P007_ComponentPartIgnored), 1u);
    EXPECT_EQ(components(p.events), 1u);
}

TEST(ParserRecovery, TimerModifiersAndAliasIgnored)
{
    auto p = run("Wait ~?{5%min} then ~a|b{5%min}.");
    EXPECT_EQ(p.report.count(DiagCode::P007_ComponentPartIgnored), 2u);
    ASSERT_EQ(components(p.events), 2u);
    const auto &anon = std::get<TimerEvent>(p.events[2]);
    EXPECT_FALSE(anon.modifiers.any());
    const auto &named = std::get<TimerEvent>(p.events[4]);
    EXPECT_EQ(named.name, "a");
    EXPECT_FALSE(named.alias.has_value());
}

TEST(ParserRecovery, DuplicateAndConflictingModifiers)
{
    auto p = run("@??salt and @&+pepper");
    EXPECT_EQ(p.report.count(DiagCode::P008_DuplicateModifier), 1u);
    EXPECT_EQ(p.report.count(DiagCode::P009_ConflictingModifiers), 1u);
    const auto &pepper = std::get<IngredientEvent>(p.events[3]);
    EXPECT_TRUE(pepper.modifiers.reference);
    EXPECT_FALSE(pepper.modifiers.isNew);
}

TEST(ParserRecovery, EmptyComponents)
{
    auto p = run("@{2%cups} flour and ~{}");
    EXPECT_EQ(p.report.count(DiagCode::P010_EmptyComponent), 2u);
    EXPECT_EQ(components(p.events), 0u);
    EXPECT_EQ(allText(p.events), "@{2%cups} flour and ~{}");
}

TEST(ParserRecovery, InvalidIntermediateReference)
{
    auto p = run("@&(x)flour{}");
    EXPECT_EQ(p.report.count(DiagCode::P014_InvalidIntermediateReference), 1u);
    EXPECT_EQ(components(p.events), 1u);
}

TEST(ParserRecovery, UnterminatedBlockComment)
{
    auto p = run("Stir [- oops");
    EXPECT_EQ(p.report.count(DiagCode::P015_UnterminatedBlockComment), 1u);
    EXPECT_EQ(allText(p.events), "Stir");
}
