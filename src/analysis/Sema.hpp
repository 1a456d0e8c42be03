//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Sema.hpp
/// @brief Semantic analyzer turning parse events into a ScalableRecipe.
///
/// @details The analyzer consumes events in order and performs:
///
/// **Structure**
/// - Builds sections, numbered steps and text blocks
///
/// **Components**
/// - Links repeated ingredient and cookware names to their first definition
///   (case and whitespace insensitive, aliases included)
/// - Resolves `&(N)` style references against the steps and sections seen so
///   far
/// - Resolves units through the converter
/// - Passes recipe references to the RecipeRefChecker
///
/// **Metadata**
/// - Interprets servings, times, tags, author and the other special keys
/// - Runs the MetadataValidator on every entry
/// - Reconciles total time with prep, cook and timer time
///
/// Problems are reported with A-coded diagnostics; analysis always produces a
/// recipe.
///
/// ## Usage Example
///
/// ```cpp
/// SourceReport report;
/// auto events = parse::parseEvents(text, fileId, Extensions::All, report);
/// Sema sema(units::Converter::bundled(), report);
/// ScalableRecipe recipe = sema.analyze(events);
/// ```
///
//===----------------------------------------------------------------------===//

#pragma once

#include "analysis/Checks.hpp"
#include "model/Recipe.hpp"
#include "parse/Event.hpp"
#include "support/diagnostics.hpp"

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sous::units
{
class Converter;
}

namespace sous::analysis
{

/// @brief Which time wins when both a total and a composed time exist.
enum class TimePrecedence
{
    TotalOverridesComposed,
    ComposedOverridesTotal
};

struct AnalysisOptions
{
    TimePrecedence timePrecedence = TimePrecedence::TotalOverridesComposed;

    /// Compose a total time from timers when prep and cook time are absent.
    bool composeTimeFromTimers = true;
};

class Sema
{
  public:
    Sema(const units::Converter &converter,
         support::SourceReport &report,
         AnalysisOptions options = {},
         MetadataValidator validator = {},
         RecipeRefChecker checker = {});

    /// @brief Analyze @p events and return the recipe.
    model::ScalableRecipe analyze(const std::vector<parse::Event> &events);

  private:
    //===------------------------------------------------------------------===//
    // Structure (Sema.cpp)
    //===------------------------------------------------------------------===//

    void beginSection(const parse::SectionEvent &ev);
    void beginStep(const parse::StepStartEvent &ev);
    void endStep();
    void addText(const std::string &text);
    void addItem(model::ComponentRef ref);
    model::Section &currentSection();

    //===------------------------------------------------------------------===//
    // Components (Sema_Component.cpp)
    //===------------------------------------------------------------------===//

    void analyzeIngredient(const parse::IngredientEvent &ev);
    void analyzeCookware(const parse::CookwareEvent &ev);
    void analyzeTimer(const parse::TimerEvent &ev);

    std::optional<units::Quantity> resolveQuantity(const parse::ParsedQuantity &pq);

    std::optional<model::IntermediateReference> resolveIntermediate(const parse::IntermediateRef &ref);

    void checkRecipeReference(const parse::Component &comp);

    //===------------------------------------------------------------------===//
    // Metadata (Sema_Metadata.cpp)
    //===------------------------------------------------------------------===//

    void analyzeMetadata(const parse::MetadataEvent &ev);
    bool applySpecial(model::SpecialKey key, const parse::MetadataEvent &ev, bool duplicate);
    bool applyServings(const parse::MetadataEvent &ev, bool duplicate, support::Span previous);
    void invalidSpecial(const parse::MetadataEvent &ev, const std::string &expected);
    void composeTime();

    const units::Converter &converter_;
    support::SourceReport &report_;
    AnalysisOptions options_;
    MetadataValidator validator_;
    RecipeRefChecker checker_;

    model::ScalableRecipe recipe_;

    /// Normalized name or alias -> definition index.
    std::unordered_map<std::string, size_t> ingredientIndex_;
    std::unordered_map<std::string, size_t> cookwareIndex_;

    /// Step or text block under construction.
    std::optional<model::Step> step_;
    bool stepIsText_ = false;
    bool implicitSection_ = false;

    /// Key span of the first entry of each special key.
    std::map<model::SpecialKey, support::Span> specialSpans_;
};

/// @brief Analyze @p events with a fresh Sema.
model::ScalableRecipe analyze(const std::vector<parse::Event> &events,
                              const units::Converter &converter,
                              support::SourceReport &report,
                              const AnalysisOptions &options = {},
                              MetadataValidator validator = {},
                              RecipeRefChecker checker = {});

/// @brief Normalize a component name for lookup: lowercase, single spaces.
std::string normalizeName(std::string_view name);

} // namespace sous::analysis
