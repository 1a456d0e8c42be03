// File: tests/unit/test_pipeline.cpp
// Purpose: End-to-end parsing through the public entry points.
// Key invariants: Sources are registered so diagnostics render with
//                 locations; succeeded() is false only when errors exist.
// Ownership/Lifetime: Standalone unit test executable.
// Links: include/sous/Sous.hpp, src/pipeline/Pipeline.hpp

#include <gtest/gtest.h>

#include "sous/Sous.hpp"

#include <string>

using namespace sous;

namespace
{
const char *kSoup = ">> title: Tomato Soup\n"
                    ">> servings: 2\n"
                    "\n"
                    "= Prep =\n"
                    "Chop @onion{1} and @tomatoes{400%g} with a #knife{}.\n"
                    "\n"
                    "= Cook =\n"
                    "Simmer @&tomatoes{200%g} in a #pot{} for ~{20%min}.\n"
                    "\n"
                    "> Serve hot.\n";
}

TEST(Pipeline, ParsesACompleteRecipe)
{
    support::SourceManager sm;
    auto result = parseRecipe(ParseInput{kSoup, "soup.cook"}, units::Converter::bundled(), sm);
    EXPECT_TRUE(result.succeeded());
    EXPECT_TRUE(result.report.empty());
    EXPECT_EQ(sm.getPath(result.fileId), "soup.cook");
    EXPECT_EQ(sm.getText(result.fileId), kSoup);

    const auto &recipe = result.recipe;
    EXPECT_EQ(recipe.metadata.title, "Tomato Soup");
    EXPECT_EQ(recipe.metadata.servings, 2u);
    ASSERT_EQ(recipe.sections.size(), 2u);
    EXPECT_EQ(recipe.sections[1].name, "Cook");
    EXPECT_EQ(recipe.sections[1].content.size(), 2u);
    EXPECT_EQ(recipe.ingredients.size(), 3u);
    EXPECT_EQ(recipe.cookware.size(), 2u);
    EXPECT_EQ(recipe.totalTimeMinutes, 20u);

    auto grouped = recipe.groupIngredients(units::Converter::bundled());
    ASSERT_EQ(grouped.size(), 2u);
    EXPECT_EQ(grouped[1].quantity.total()[0].toString(), "600 g");

    auto scaled = scale::scale(recipe, scale::ScaleTarget::servings(4), units::Converter::bundled());
    EXPECT_EQ(scaled.recipe.ingredients[1].quantity->toString(), "800 g");
    EXPECT_EQ(scaled.recipe.metadata.servings, 4u);
}

TEST(Pipeline, DiagnosticsPointIntoTheRegisteredSource)
{
    support::SourceManager sm;
    auto result = parseRecipe(ParseInput{"Melt @&butter{}.\n", "bad.cook"}, units::Converter::bundled(), sm);
    EXPECT_FALSE(result.succeeded());
    ASSERT_EQ(result.report.diagnostics().size(), 1u);
    EXPECT_EQ(result.report.format(sm),
              "bad.cook:1:8: error[A003]: reference to undefined ingredient 'butter'\n"
              "Melt @&butter{}.\n"
              "       ^^^^^^\n"
              "help: remove '&' or define the ingredient earlier\n");
}

TEST(Pipeline, WarningsDoNotFail)
{
    support::SourceManager sm;
    auto result = parseRecipe(ParseInput{"Add @salt{1%pinch}.", ""}, units::Converter::bundled(), sm);
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.report.warningCount(), 1u);
    EXPECT_EQ(sm.getPath(result.fileId), "<input>");
}

TEST(Pipeline, ReusesAnExistingFileId)
{
    support::SourceManager sm;
    const std::string text = ">> servings: 3\n@rice{1%cup}";
    const uint32_t id = sm.addSource("rice.cook", text);
    ParseInput input{text, "ignored"};
    input.fileId = id;
    auto result = parseRecipe(input, units::Converter::bundled(), sm);
    EXPECT_EQ(result.fileId, id);
    EXPECT_EQ(sm.getPath(id), "rice.cook");
    EXPECT_EQ(result.recipe.metadata.servings, 3u);
}

TEST(Pipeline, ExtensionsCanBeDisabled)
{
    support::SourceManager sm;
    ParseOptions options;
    options.extensions = parse::Extensions::None;
    auto result = parseRecipe(ParseInput{"= Prep =\n@salt{1%tsp}(fine)\nand more", "x"},
                              units::Converter::bundled(),
                              sm,
                              options);
    ASSERT_EQ(result.recipe.ingredients.size(), 1u);
    EXPECT_FALSE(result.recipe.ingredients[0].note.has_value());
    EXPECT_FALSE(result.recipe.sections[0].name.has_value());
    EXPECT_EQ(result.recipe.sections[0].content.size(), 3u);
}

TEST(Pipeline, MetadataOnly)
{
    support::SourceManager sm;
    auto result = parseMetadata(ParseInput{kSoup, "soup.cook"}, units::Converter::bundled(), sm);
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.recipe.metadata.title, "Tomato Soup");
    EXPECT_EQ(result.recipe.metadata.servings, 2u);
    EXPECT_TRUE(result.recipe.ingredients.empty());
    EXPECT_TRUE(result.recipe.sections.empty());
}

TEST(Pipeline, ValidatorsAndCheckersArePassedThrough)
{
    support::SourceManager sm;
    analysis::MetadataValidator validator = [](std::string_view key, std::string_view)
    { return key == "rating" ? analysis::CheckOutcome::error("") : analysis::CheckOutcome::accept(); };
    analysis::RecipeRefChecker checker = [](std::string_view)
    { return analysis::RecipeRefResult::notFound(""); };

    auto result = parseRecipe(ParseInput{">> rating: 5\nUse @@stock{}.", "x"},
                              units::Converter::bundled(),
                              sm,
                              {},
                              validator,
                              checker);
    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.report.count(support::DiagCode::A009_MetadataError), 1u);
    EXPECT_EQ(result.report.count(support::DiagCode::A010_RecipeNotFound), 1u);

    auto meta = parseMetadata(ParseInput{">> rating: 5\n", "x"}, units::Converter::bundled(), sm, {}, validator);
    EXPECT_EQ(meta.report.count(support::DiagCode::A009_MetadataError), 1u);
}
