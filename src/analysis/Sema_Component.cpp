//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Sema_Component.cpp
/// @brief Ingredient, cookware and timer analysis.
///
//===----------------------------------------------------------------------===//

#include "analysis/Sema.hpp"

#include "units/Converter.hpp"

namespace sous::analysis
{

using support::DiagCode;

namespace
{

bool isRecipePath(std::string_view name)
{
    return name.starts_with("./") || name.starts_with("../");
}

/// @brief Link @p item to an earlier definition or register it as one.
/// @return True when @p item became a definition.
template <typename T>
bool linkByName(std::vector<T> &items,
                T &item,
                std::unordered_map<std::string, size_t> &index,
                bool isNew)
{
    const std::string key = normalizeName(item.name);
    const size_t self = items.size();
    if (!isNew)
    {
        auto it = index.find(key);
        if (it == index.end() && item.alias)
            it = index.find(normalizeName(*item.alias));
        if (it != index.end())
        {
            item.relation = model::Reference{it->second};
            std::get<model::Definition>(items[it->second].relation).referencedFrom.push_back(self);
            return false;
        }
    }
    item.relation = model::Definition{};
    index[key] = self;
    if (item.alias)
        index[normalizeName(*item.alias)] = self;
    return true;
}

} // namespace

std::optional<units::Quantity> Sema::resolveQuantity(const parse::ParsedQuantity &pq)
{
    units::Quantity q(pq.value);
    if (!pq.unit)
        return q;

    if (pq.unit->empty())
    {
        report_.warning(DiagCode::A001_EmptyUnit, pq.unitSpan.value_or(pq.span), "unit is empty")
            .withHelp("remove the '%' or write a unit after it");
        return q;
    }

    q.unit = *pq.unit;
    q = converter_.resolve(std::move(q));
    if (!q.unitInfo && !converter_.empty())
    {
        report_.warning(DiagCode::A002_UnknownUnit,
                        pq.unitSpan.value_or(pq.span),
                        "unknown unit '" + *pq.unit + "'")
            .withHelp("the quantity cannot be converted");
    }
    return q;
}

std::optional<model::IntermediateReference> Sema::resolveIntermediate(const parse::IntermediateRef &ref)
{
    model::IntermediateReference out;
    out.kind = ref.kind;

    if (ref.kind == parse::IntermediateKind::Step)
    {
        const model::Section &section = currentSection();
        const uint32_t current = step_ ? step_->number : static_cast<uint32_t>(section.stepCount() + 1);
        const int64_t target =
            ref.relative ? static_cast<int64_t>(current) - ref.value : static_cast<int64_t>(ref.value);

        if (target == current)
        {
            report_.error(DiagCode::A005_IntermediateNotBefore, ref.span, "a step cannot reference itself");
            return std::nullopt;
        }
        if (target <= 0 || target > current)
        {
            const std::string what = ref.relative ? std::to_string(ref.value) + " steps back"
                                                  : "step " + std::to_string(ref.value);
            report_.error(DiagCode::A004_IntermediateOutOfRange,
                          ref.span,
                          "reference to " + what + ", but only " + std::to_string(current - 1) +
                              " steps come before this one in the section")
                .withHelp("only earlier steps of the same section can be referenced");
            return std::nullopt;
        }

        for (size_t i = 0; i < section.content.size(); ++i)
        {
            const auto *step = std::get_if<model::Step>(&section.content[i]);
            if (step && step->number == target)
            {
                out.section = recipe_.sections.size() - 1;
                out.step = i;
                out.number = static_cast<uint32_t>(target);
                return out;
            }
        }
        // Empty steps are not stored; the number exists but has no content.
        report_.error(DiagCode::A004_IntermediateOutOfRange,
                      ref.span,
                      "step " + std::to_string(target) + " has no content to reference");
        return std::nullopt;
    }

    currentSection();
    const auto current = static_cast<int64_t>(recipe_.sections.size());
    const int64_t target = ref.relative ? current - ref.value : static_cast<int64_t>(ref.value);
    if (target == current)
    {
        report_.error(DiagCode::A005_IntermediateNotBefore, ref.span, "a section cannot reference itself");
        return std::nullopt;
    }
    if (target <= 0 || target > current)
    {
        const std::string what = ref.relative ? std::to_string(ref.value) + " sections back"
                                              : "section " + std::to_string(ref.value);
        report_.error(DiagCode::A004_IntermediateOutOfRange,
                      ref.span,
                      "reference to " + what + ", but only " + std::to_string(current - 1) +
                          " sections come before this one")
            .withHelp("sections are numbered from 1");
        return std::nullopt;
    }
    out.section = static_cast<size_t>(target - 1);
    out.number = static_cast<uint32_t>(target);
    return out;
}

void Sema::checkRecipeReference(const parse::Component &comp)
{
    if (!checker_)
        return;

    const RecipeRefResult result = checker_(comp.name);
    switch (result.kind)
    {
        case RecipeRefResult::Kind::Found:
            return;

        case RecipeRefResult::Kind::NotFound:
        {
            support::Diagnostic d;
            d.severity = result.severity;
            d.code = DiagCode::A010_RecipeNotFound;
            d.message = result.message.empty() ? "recipe '" + comp.name + "' not found" : result.message;
            d.span = comp.nameSpan;
            for (const auto &hint : result.hints)
            {
                if (!d.help.empty())
                    d.help += "; ";
                d.help += hint;
            }
            report_.report(std::move(d));
            return;
        }

        case RecipeRefResult::Kind::Ambiguous:
        {
            std::string list;
            for (const auto &c : result.candidates)
            {
                if (!list.empty())
                    list += ", ";
                list += c;
            }
            report_.warning(DiagCode::A011_AmbiguousRecipeReference,
                            comp.nameSpan,
                            "recipe reference '" + comp.name + "' is ambiguous")
                .withHelp("candidates: " + list);
            return;
        }
    }
}

void Sema::analyzeIngredient(const parse::IngredientEvent &ev)
{
    model::Ingredient ing;
    ing.name = ev.name;
    ing.alias = ev.alias;
    ing.note = ev.note;
    ing.modifiers = ev.modifiers;
    ing.span = ev.span;
    if (ev.quantity)
    {
        ing.quantity = resolveQuantity(*ev.quantity);
        ing.fixed = ev.quantity->fixed;
    }

    bool definition = false;
    if (ev.intermediate)
    {
        if (auto target = resolveIntermediate(*ev.intermediate))
            ing.relation = *target;
    }
    else
    {
        definition = linkByName(recipe_.ingredients, ing, ingredientIndex_, ing.modifiers.isNew);
        if (definition && ing.modifiers.reference)
        {
            report_.error(DiagCode::A003_ReferenceNotFound,
                          ev.nameSpan,
                          "reference to undefined ingredient '" + ev.name + "'")
                .withHelp("remove '&' or define the ingredient earlier");
        }
    }

    if (definition && (ing.modifiers.recipe || isRecipePath(ing.name)))
        checkRecipeReference(ev);

    recipe_.ingredients.push_back(std::move(ing));
    addItem({model::ComponentKind::Ingredient, recipe_.ingredients.size() - 1});
}

void Sema::analyzeCookware(const parse::CookwareEvent &ev)
{
    model::Cookware cw;
    cw.name = ev.name;
    cw.alias = ev.alias;
    cw.note = ev.note;
    cw.modifiers = ev.modifiers;
    cw.span = ev.span;
    if (ev.quantity)
        cw.quantity = resolveQuantity(*ev.quantity);

    const bool definition = linkByName(recipe_.cookware, cw, cookwareIndex_, cw.modifiers.isNew);
    if (definition && cw.modifiers.reference)
    {
        report_.error(DiagCode::A003_ReferenceNotFound,
                      ev.nameSpan,
                      "reference to undefined cookware '" + ev.name + "'")
            .withHelp("remove '&' or define the cookware earlier");
    }

    recipe_.cookware.push_back(std::move(cw));
    addItem({model::ComponentKind::Cookware, recipe_.cookware.size() - 1});
}

void Sema::analyzeTimer(const parse::TimerEvent &ev)
{
    model::Timer timer;
    if (!ev.name.empty())
        timer.name = ev.name;
    timer.span = ev.span;

    if (ev.quantity)
    {
        timer.quantity = resolveQuantity(*ev.quantity);
        const units::Quantity &q = *timer.quantity;
        if (!q.hasUnit())
        {
            report_.warning(DiagCode::A015_TimerMissingUnit, ev.quantity->span, "timer duration has no unit")
                .withHelp("add a time unit, as in '~{10%minutes}'");
        }
        else if (q.unitInfo && q.unitInfo->quantity != units::PhysicalQuantity::Time)
        {
            report_.warning(DiagCode::A014_TimerUnitNotTime,
                            ev.quantity->unitSpan.value_or(ev.quantity->span),
                            "timer unit '" + *q.unit + "' is not a unit of time");
        }
    }

    recipe_.timers.push_back(std::move(timer));
    addItem({model::ComponentKind::Timer, recipe_.timers.size() - 1});
}

} // namespace sous::analysis
