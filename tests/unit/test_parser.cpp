// File: tests/unit/test_parser.cpp
// Purpose: Unit tests for the event parser on well-formed recipes.
// Key invariants: Events appear in source order with non-overlapping,
//                 increasing spans.
// Ownership/Lifetime: Standalone unit test executable.
// Links: src/parse/Parser.hpp

#include <gtest/gtest.h>

#include "parse/Parser.hpp"

#include <string>
#include <vector>

using namespace sous;
using namespace sous::parse;
using sous::support::SourceReport;

namespace
{
std::vector<Event> parseAll(const std::string &src,
                            SourceReport &report,
                            Extensions ext = Extensions::All)
{
    return parseEvents(src, 1, ext, report);
}

template <typename T> size_t countOf(const std::vector<Event> &events)
{
    size_t n = 0;
    for (const auto &e : events)
    {
        if (std::holds_alternative<T>(e))
            ++n;
    }
    return n;
}

template <typename T> const T &nth(const std::vector<Event> &events, size_t index)
{
    size_t n = 0;
    for (const auto &e : events)
    {
        if (const auto *v = std::get_if<T>(&e))
        {
            if (n++ == index)
                return *v;
        }
    }
    throw std::out_of_range("event not found");
}
} // namespace

TEST(Parser, SimpleStep)
{
    SourceReport report;
    auto events = parseAll("Add @salt{1%tsp} to #pot{}.", report);
    EXPECT_TRUE(report.empty());
    ASSERT_EQ(events.size(), 7u);
    EXPECT_TRUE(std::holds_alternative<StepStartEvent>(events[0]));
    EXPECT_EQ(std::get<TextEvent>(events[1]).text, "Add ");
    const auto &salt = std::get<IngredientEvent>(events[2]);
    EXPECT_EQ(salt.name, "salt");
    ASSERT_TRUE(salt.quantity.has_value());
    EXPECT_EQ(salt.quantity->value.toString(), "1");
    EXPECT_EQ(*salt.quantity->unit, "tsp");
    EXPECT_EQ(salt.span.begin, 4u);
    EXPECT_EQ(salt.span.end, 16u);
    EXPECT_EQ(std::get<TextEvent>(events[3]).text, " to ");
    const auto &pot = std::get<CookwareEvent>(events[4]);
    EXPECT_EQ(pot.name, "pot");
    EXPECT_FALSE(pot.quantity.has_value());
    EXPECT_EQ(std::get<TextEvent>(events[5]).text, ".");
    EXPECT_TRUE(std::holds_alternative<StepEndEvent>(events[6]));
}

TEST(Parser, Metadata)
{
    SourceReport report;
    auto events = parseAll(">> servings: 4\n>>title:  Tomato Soup  \n", report);
    EXPECT_TRUE(report.empty());
    ASSERT_EQ(events.size(), 2u);
    const auto &servings = std::get<MetadataEvent>(events[0]);
    EXPECT_EQ(servings.key, "servings");
    EXPECT_EQ(servings.value, "4");
    EXPECT_EQ(servings.valueSpan.begin, 13u);
    const auto &title = std::get<MetadataEvent>(events[1]);
    EXPECT_EQ(title.key, "title");
    EXPECT_EQ(title.value, "Tomato Soup");
}

TEST(Parser, MetadataValueMayContainColons)
{
    SourceReport report;
    auto events = parseAll(">> source: https://example.com/soup", report);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(std::get<MetadataEvent>(events[0]).value, "https://example.com/soup");
}

TEST(Parser, MultilineStepsJoinParagraphs)
{
    const std::string src = "Mix @flour{200%g}\nand @water{1%cup}.\n\nBake.";
    SourceReport report;
    auto events = parseAll(src, report);
    EXPECT_TRUE(report.empty());
    EXPECT_EQ(countOf<StepStartEvent>(events), 2u);
    EXPECT_EQ(countOf<IngredientEvent>(events), 2u);
    EXPECT_EQ(nth<TextEvent>(events, 1).text, " and ");

    SourceReport single;
    auto lines = parseAll(src, single, Extensions::All & ~Extensions::MultilineSteps);
    EXPECT_EQ(countOf<StepStartEvent>(lines), 3u);
}

TEST(Parser, CommentsAreSkipped)
{
    SourceReport report;
    auto events = parseAll("-- a note\nBoil [- gently -] water. -- trailing", report);
    EXPECT_TRUE(report.empty());
    EXPECT_EQ(countOf<StepStartEvent>(events), 1u);
    EXPECT_EQ(nth<TextEvent>(events, 0).text, "Boil  water.");
}

TEST(Parser, Sections)
{
    SourceReport report;
    auto events = parseAll("= Dough =\nKnead.\n\n== Filling ==\nStir.\n\n==\nServe.", report);
    EXPECT_TRUE(report.empty());
    ASSERT_EQ(countOf<SectionEvent>(events), 3u);
    EXPECT_EQ(nth<SectionEvent>(events, 0).name, "Dough");
    EXPECT_EQ(nth<SectionEvent>(events, 1).name, "Filling");
    EXPECT_FALSE(nth<SectionEvent>(events, 2).name.has_value());

    SourceReport off;
    auto plain = parseAll("= Dough =", off, Extensions::All & ~Extensions::Sections);
    EXPECT_EQ(countOf<SectionEvent>(plain), 0u);
    EXPECT_EQ(nth<TextEvent>(plain, 0).text, "= Dough =");
}

TEST(Parser, TextBlocks)
{
    SourceReport report;
    auto events = parseAll("> Serve warm.\n>  Enjoy @salt.", report);
    ASSERT_EQ(events.size(), 3u);
    EXPECT_TRUE(std::get<StepStartEvent>(events[0]).isText);
    EXPECT_EQ(std::get<TextEvent>(events[1]).text, "Serve warm. Enjoy @salt.");
    EXPECT_TRUE(std::get<StepEndEvent>(events[2]).isText);
    EXPECT_EQ(countOf<IngredientEvent>(events), 0u);
}

TEST(Parser, MultiWordNamesAndAliases)
{
    SourceReport report;
    auto events = parseAll("Pour @white wine|wine{1%cup} and @olive oil{}.", report);
    EXPECT_TRUE(report.empty());
    ASSERT_EQ(countOf<IngredientEvent>(events), 2u);
    const auto &wine = nth<IngredientEvent>(events, 0);
    EXPECT_EQ(wine.name, "white wine");
    ASSERT_TRUE(wine.alias.has_value());
    EXPECT_EQ(*wine.alias, "wine");
    EXPECT_EQ(nth<IngredientEvent>(events, 1).name, "olive oil");
}

TEST(Parser, SingleWordStopsAtBlank)
{
    SourceReport report;
    auto events = parseAll("Add @salt and @pepper to taste.", report);
    EXPECT_TRUE(report.empty());
    ASSERT_EQ(countOf<IngredientEvent>(events), 2u);
    EXPECT_EQ(nth<IngredientEvent>(events, 0).name, "salt");
    EXPECT_FALSE(nth<IngredientEvent>(events, 0).quantity.has_value());
    EXPECT_EQ(nth<IngredientEvent>(events, 1).name, "pepper");
}

TEST(Parser, Modifiers)
{
    SourceReport report;
    auto events = parseAll("@@tomato sauce{100%ml} @&flour @?salt @-pepper @+egg{2}", report);
    EXPECT_TRUE(report.empty());
    ASSERT_EQ(countOf<IngredientEvent>(events), 5u);
    EXPECT_TRUE(nth<IngredientEvent>(events, 0).modifiers.recipe);
    EXPECT_EQ(nth<IngredientEvent>(events, 0).name, "tomato sauce");
    EXPECT_TRUE(nth<IngredientEvent>(events, 1).modifiers.reference);
    EXPECT_TRUE(nth<IngredientEvent>(events, 2).modifiers.optional);
    EXPECT_TRUE(nth<IngredientEvent>(events, 3).modifiers.hidden);
    EXPECT_TRUE(nth<IngredientEvent>(events, 4).modifiers.isNew);
}

TEST(Parser, IntermediateReferences)
{
    SourceReport report;
    auto events = parseAll("Use @&(1)dough{} and @&(=~1)filling{}.", report);
    EXPECT_TRUE(report.empty());
    ASSERT_EQ(countOf<IngredientEvent>(events), 2u);
    const auto &dough = nth<IngredientEvent>(events, 0);
    ASSERT_TRUE(dough.intermediate.has_value());
    EXPECT_EQ(dough.intermediate->kind, IntermediateKind::Step);
    EXPECT_FALSE(dough.intermediate->relative);
    EXPECT_EQ(dough.intermediate->value, 1u);
    EXPECT_TRUE(dough.modifiers.reference);
    EXPECT_EQ(dough.name, "dough");

    const auto &filling = nth<IngredientEvent>(events, 1);
    ASSERT_TRUE(filling.intermediate.has_value());
    EXPECT_EQ(filling.intermediate->kind, IntermediateKind::Section);
    EXPECT_TRUE(filling.intermediate->relative);
}

TEST(Parser, NotesAndFixedQuantities)
{
    SourceReport report;
    auto events = parseAll("@butter{50%g}(softened) and @salt{1%tsp}*", report);
    EXPECT_TRUE(report.empty());
    const auto &butter = nth<IngredientEvent>(events, 0);
    ASSERT_TRUE(butter.note.has_value());
    EXPECT_EQ(*butter.note, "softened");
    EXPECT_FALSE(butter.quantity->fixed);
    const auto &salt = nth<IngredientEvent>(events, 1);
    EXPECT_TRUE(salt.quantity->fixed);
    EXPECT_FALSE(salt.note.has_value());
}

TEST(Parser, Timers)
{
    SourceReport report;
    auto events = parseAll("Boil ~{10%minutes}, then rest ~rest{2-3%min}.", report);
    EXPECT_TRUE(report.empty());
    ASSERT_EQ(countOf<TimerEvent>(events), 2u);
    const auto &anon = nth<TimerEvent>(events, 0);
    EXPECT_TRUE(anon.name.empty());
    EXPECT_EQ(anon.quantity->value.toString(), "10");
    EXPECT_EQ(*anon.quantity->unit, "minutes");
    const auto &rest = nth<TimerEvent>(events, 1);
    EXPECT_EQ(rest.name, "rest");
    EXPECT_EQ(rest.quantity->value.toString(), "2-3");
}

TEST(Parser, EscapedSigilIsText)
{
    SourceReport report;
    auto events = parseAll("Email \\@chef for help", report);
    EXPECT_EQ(countOf<IngredientEvent>(events), 0u);
    EXPECT_EQ(nth<TextEvent>(events, 0).text, "Email @chef for help");
}

TEST(Parser, MetadataOnly)
{
    SourceReport report;
    Parser parser(">> title: Soup\nAdd @salt{}.\n>> servings: 2", 1, Extensions::All, report);
    auto events = parser.parseMetadata();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(std::get<MetadataEvent>(events[0]).key, "title");
    EXPECT_EQ(std::get<MetadataEvent>(events[1]).key, "servings");
}

TEST(Parser, SpansIncreaseMonotonically)
{
    const std::string src = ">> servings: 2\n"
                            "= Prep =\n"
                            "Chop @onion{1} with #knife{} -- sharp\n"
                            "and @garlic{2%cloves}.\n"
                            "\n"
                            "> Note the time.\n"
                            "Simmer for ~{20%min} @&onion.\n";
    SourceReport report;
    auto events = parseAll(src, report);
    ASSERT_FALSE(events.empty());
    uint32_t lastEnd = 0;
    for (const auto &e : events)
    {
        const auto span = eventSpan(e);
        EXPECT_LE(lastEnd, span.begin);
        EXPECT_LE(span.begin, span.end);
        EXPECT_LE(span.end, src.size());
        lastEnd = span.end;
    }
}
