//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/scale/Scaler.hpp
// Purpose: Scale an analyzed recipe by a factor or to a number of servings.
// Key invariants: Scaling never fails as a whole; each component records how
//                 its quantity was treated.  The source recipe is not modified.
// Ownership/Lifetime: ScaledRecipe owns a copy of the recipe.
// Links: model/Recipe.hpp, units/Converter.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "model/Recipe.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace sous::units
{
class Converter;
}

namespace sous::scale
{

/// @brief Multiply by a factor or scale to a number of servings.
class ScaleTarget
{
  public:
    static ScaleTarget factor(double f)
    {
        ScaleTarget t;
        t.value_ = f;
        return t;
    }

    /// @details The factor is @p n divided by the recipe's servings.
    static ScaleTarget servings(uint32_t n)
    {
        ScaleTarget t;
        t.servings_ = true;
        t.value_ = static_cast<double>(n);
        return t;
    }

    bool isServings() const
    {
        return servings_;
    }

    double value() const
    {
        return value_;
    }

  private:
    bool servings_ = false;
    double value_ = 1.0;
};

struct ScaleOptions
{
    /// Re-express scaled quantities in the best unit of their system.
    bool fitUnits = false;
};

enum class ScaleError
{
    TextValue,       ///< The value is text and cannot be multiplied
    MissingServings, ///< Servings target without declared servings
    InvalidFactor    ///< Factor or target is zero, negative or not finite
};

const char *scaleErrorMessage(ScaleError error);

struct ScaleOutcome
{
    enum class Kind
    {
        Scaled,
        Fixed,
        NoQuantity,
        Error
    };

    Kind kind = Kind::NoQuantity;
    ScaleError error = ScaleError::TextValue; ///< Meaningful for Error only

    static ScaleOutcome scaled()
    {
        return {Kind::Scaled};
    }

    static ScaleOutcome fixed()
    {
        return {Kind::Fixed};
    }

    static ScaleOutcome noQuantity()
    {
        return {Kind::NoQuantity};
    }

    static ScaleOutcome failed(ScaleError e)
    {
        return {Kind::Error, e};
    }

    bool operator==(const ScaleOutcome &other) const
    {
        return kind == other.kind && (kind != Kind::Error || error == other.error);
    }
};

struct ScaleData
{
    double factor = 1.0;
    std::optional<uint32_t> targetServings;

    /// One outcome per component, parallel to the recipe arrays.
    std::vector<ScaleOutcome> ingredients;
    std::vector<ScaleOutcome> cookware;
    std::vector<ScaleOutcome> timers;
};

struct ScaledRecipe
{
    model::ScalableRecipe recipe;
    ScaleData data;
};

/// @brief Scale @p recipe toward @p target.
ScaledRecipe scale(const model::ScalableRecipe &recipe,
                   const ScaleTarget &target,
                   const units::Converter &converter,
                   const ScaleOptions &options = {});

/// @brief Copy of @p recipe with factor 1, as if scaled to itself.
ScaledRecipe defaultScale(const model::ScalableRecipe &recipe);

} // namespace sous::scale
