//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/scale/Scaler.cpp
// Purpose: Per-component scaling rules.
// Key invariants: Rules apply in order: no quantity, fixed, text value, bad
//                 target, then multiply.  Cookware and timers never scale.
// Ownership/Lifetime: Works on a copy of the input recipe.
// Links: scale/Scaler.hpp
//
//===----------------------------------------------------------------------===//

#include "scale/Scaler.hpp"

#include "support/debug_log.hpp"
#include "units/Converter.hpp"

#include <cmath>
#include <string>

namespace sous::scale
{

namespace
{

ScaleOutcome fixedOrNothing(const std::optional<units::Quantity> &q)
{
    return q ? ScaleOutcome::fixed() : ScaleOutcome::noQuantity();
}

ScaledRecipe scaleBy(const model::ScalableRecipe &recipe,
                     double factor,
                     std::optional<ScaleError> targetError,
                     const units::Converter *converter)
{
    ScaledRecipe out{recipe, {}};
    out.data.factor = factor;

    for (auto &ing : out.recipe.ingredients)
    {
        if (!ing.quantity)
        {
            out.data.ingredients.push_back(ScaleOutcome::noQuantity());
            continue;
        }
        if (ing.fixed)
        {
            out.data.ingredients.push_back(ScaleOutcome::fixed());
            continue;
        }
        if (ing.quantity->value.isText())
        {
            out.data.ingredients.push_back(ScaleOutcome::failed(ScaleError::TextValue));
            continue;
        }
        if (targetError)
        {
            out.data.ingredients.push_back(ScaleOutcome::failed(*targetError));
            continue;
        }

        units::Quantity scaled = ing.quantity->scaled(factor);
        if (converter)
            scaled = converter->fit(scaled);
        ing.quantity = std::move(scaled);
        out.data.ingredients.push_back(ScaleOutcome::scaled());
    }

    for (const auto &cw : out.recipe.cookware)
        out.data.cookware.push_back(fixedOrNothing(cw.quantity));
    for (const auto &timer : out.recipe.timers)
        out.data.timers.push_back(fixedOrNothing(timer.quantity));
    return out;
}

} // namespace

const char *scaleErrorMessage(ScaleError error)
{
    switch (error)
    {
        case ScaleError::TextValue:
            return "text value cannot be scaled";
        case ScaleError::MissingServings:
            return "recipe does not declare servings";
        case ScaleError::InvalidFactor:
            return "scale factor must be a positive number";
    }
    return "?";
}

ScaledRecipe scale(const model::ScalableRecipe &recipe,
                   const ScaleTarget &target,
                   const units::Converter &converter,
                   const ScaleOptions &options)
{
    double factor = target.value();
    std::optional<ScaleError> targetError;
    std::optional<uint32_t> targetServings;

    if (!std::isfinite(target.value()) || target.value() <= 0.0)
    {
        targetError = ScaleError::InvalidFactor;
        factor = 1.0;
    }
    else if (target.isServings())
    {
        targetServings = static_cast<uint32_t>(target.value());
        if (!recipe.metadata.servings)
        {
            targetError = ScaleError::MissingServings;
            factor = 1.0;
        }
        else
        {
            factor = target.value() / static_cast<double>(*recipe.metadata.servings);
        }
    }

    if (support::isDebugLoggingEnabled())
        support::debugLog("scale", "factor " + std::to_string(factor));

    ScaledRecipe out = scaleBy(recipe, factor, targetError, options.fitUnits ? &converter : nullptr);
    out.data.targetServings = targetServings;
    if (targetServings && !targetError)
        out.recipe.metadata.servings = targetServings;
    return out;
}

ScaledRecipe defaultScale(const model::ScalableRecipe &recipe)
{
    ScaledRecipe out = scaleBy(recipe, 1.0, std::nullopt, nullptr);
    out.data.targetServings = recipe.metadata.servings;
    return out;
}

} // namespace sous::scale
