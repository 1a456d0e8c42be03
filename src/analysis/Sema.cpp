//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Sema.cpp
/// @brief Event dispatch and recipe structure.
///
//===----------------------------------------------------------------------===//

#include "analysis/Sema.hpp"

#include "support/debug_log.hpp"
#include "units/Converter.hpp"

#include <cctype>
#include <type_traits>

namespace sous::analysis
{

Sema::Sema(const units::Converter &converter,
           support::SourceReport &report,
           AnalysisOptions options,
           MetadataValidator validator,
           RecipeRefChecker checker)
    : converter_(converter),
      report_(report),
      options_(options),
      validator_(std::move(validator)),
      checker_(std::move(checker))
{
}

model::ScalableRecipe Sema::analyze(const std::vector<parse::Event> &events)
{
    for (const auto &event : events)
    {
        std::visit(
            [this](const auto &ev)
            {
                using T = std::decay_t<decltype(ev)>;
                if constexpr (std::is_same_v<T, parse::MetadataEvent>)
                    analyzeMetadata(ev);
                else if constexpr (std::is_same_v<T, parse::SectionEvent>)
                    beginSection(ev);
                else if constexpr (std::is_same_v<T, parse::StepStartEvent>)
                    beginStep(ev);
                else if constexpr (std::is_same_v<T, parse::StepEndEvent>)
                    endStep();
                else if constexpr (std::is_same_v<T, parse::TextEvent>)
                    addText(ev.text);
                else if constexpr (std::is_same_v<T, parse::IngredientEvent>)
                    analyzeIngredient(ev);
                else if constexpr (std::is_same_v<T, parse::CookwareEvent>)
                    analyzeCookware(ev);
                else
                    analyzeTimer(ev);
            },
            event);
    }
    endStep();
    composeTime();

    if (support::isDebugLoggingEnabled())
    {
        support::debugLog("sema",
                          std::to_string(recipe_.sections.size()) + " sections, " +
                              std::to_string(recipe_.ingredients.size()) + " ingredients, " +
                              std::to_string(recipe_.cookware.size()) + " cookware, " +
                              std::to_string(recipe_.timers.size()) + " timers");
    }
    return std::move(recipe_);
}

//===----------------------------------------------------------------------===//
// Structure
//===----------------------------------------------------------------------===//

model::Section &Sema::currentSection()
{
    if (recipe_.sections.empty())
    {
        recipe_.sections.emplace_back();
        implicitSection_ = true;
    }
    return recipe_.sections.back();
}

void Sema::beginSection(const parse::SectionEvent &ev)
{
    endStep();
    // A leading section line names the implicit first section instead of
    // leaving it empty.
    if (implicitSection_ && recipe_.sections.size() == 1 && recipe_.sections.front().content.empty())
    {
        recipe_.sections.front().name = ev.name;
        implicitSection_ = false;
        return;
    }
    implicitSection_ = false;
    model::Section section;
    section.name = ev.name;
    recipe_.sections.push_back(std::move(section));
}

void Sema::beginStep(const parse::StepStartEvent &ev)
{
    endStep();
    model::Section &section = currentSection();
    step_.emplace();
    stepIsText_ = ev.isText;
    // Only stored steps are counted, so an empty step leaves its number to
    // the next one.
    if (!stepIsText_)
        step_->number = static_cast<uint32_t>(section.stepCount() + 1);
}

void Sema::endStep()
{
    if (!step_)
        return;
    model::Section &section = currentSection();
    if (stepIsText_)
    {
        model::TextBlock block;
        for (const auto &item : step_->items)
        {
            if (const auto *text = std::get_if<std::string>(&item))
                block.text += *text;
        }
        if (!block.text.empty())
            section.content.emplace_back(std::move(block));
    }
    else if (!step_->items.empty())
    {
        section.content.emplace_back(std::move(*step_));
    }
    step_.reset();
}

void Sema::addText(const std::string &text)
{
    if (!step_)
        return;
    if (!step_->items.empty())
    {
        if (auto *last = std::get_if<std::string>(&step_->items.back()))
        {
            *last += text;
            return;
        }
    }
    step_->items.emplace_back(text);
}

void Sema::addItem(model::ComponentRef ref)
{
    if (step_)
        step_->items.emplace_back(ref);
}

//===----------------------------------------------------------------------===//
// Entry points
//===----------------------------------------------------------------------===//

std::string normalizeName(std::string_view name)
{
    std::string out;
    bool pendingSpace = false;
    for (char c : name)
    {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r')
        {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace)
        {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

model::ScalableRecipe analyze(const std::vector<parse::Event> &events,
                              const units::Converter &converter,
                              support::SourceReport &report,
                              const AnalysisOptions &options,
                              MetadataValidator validator,
                              RecipeRefChecker checker)
{
    Sema sema(converter, report, options, std::move(validator), std::move(checker));
    return sema.analyze(events);
}

} // namespace sous::analysis
