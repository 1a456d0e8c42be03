//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/model/Recipe.hpp
// Purpose: Analyzed recipe model.
// Key invariants: Components live in flat arrays owned by the recipe; steps
//                 and relations refer to them by index.  A reference always
//                 points at an earlier definition, and that definition lists
//                 the reference back.
// Ownership/Lifetime: ScalableRecipe owns everything it indexes; it is not
//                     modified after analysis.
// Links: analysis/Sema.hpp, scale/Scaler.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "model/Metadata.hpp"
#include "parse/Event.hpp"
#include "support/source_location.hpp"
#include "units/GroupedQuantity.hpp"
#include "units/Quantity.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sous::units
{
class Converter;
}

namespace sous::model
{

using parse::IntermediateKind;
using parse::Modifiers;

enum class ComponentKind
{
    Ingredient,
    Cookware,
    Timer
};

/// @brief Index of a component in its recipe array.
struct ComponentRef
{
    ComponentKind kind = ComponentKind::Ingredient;
    size_t index = 0;

    bool operator==(const ComponentRef &) const = default;
};

/// @brief Step content: literal text or a component.
using Item = std::variant<std::string, ComponentRef>;

struct Step
{
    std::vector<Item> items;
    uint32_t number = 0; ///< 1-based within its section
};

struct TextBlock
{
    std::string text;
};

using Content = std::variant<Step, TextBlock>;

struct Section
{
    std::optional<std::string> name;
    std::vector<Content> content;

    /// @brief Number of steps, text blocks excluded.
    size_t stepCount() const;
};

//===----------------------------------------------------------------------===//
// Relations
//===----------------------------------------------------------------------===//

/// @brief First occurrence of a name; lists later occurrences.
struct Definition
{
    std::vector<size_t> referencedFrom;
};

/// @brief Later occurrence of a defined name.
struct Reference
{
    size_t to = 0;
};

/// @brief Output of an earlier step or section.
struct IntermediateReference
{
    IntermediateKind kind = IntermediateKind::Step;
    size_t section = 0;               ///< 0-based section index
    std::optional<size_t> step;       ///< 0-based content index for steps
    uint32_t number = 0;              ///< Target's user-visible number
};

using Relation = std::variant<Definition, Reference, IntermediateReference>;

//===----------------------------------------------------------------------===//
// Components
//===----------------------------------------------------------------------===//

struct Ingredient
{
    std::string name;
    std::optional<std::string> alias;
    std::optional<units::Quantity> quantity;
    bool fixed = false; ///< Quantity never scales
    std::optional<std::string> note;
    Modifiers modifiers;
    Relation relation = Definition{};
    support::Span span;

    /// @brief Alias when present, otherwise the name.
    const std::string &displayName() const;

    bool isReference() const;
    bool isDefinition() const;
};

struct Cookware
{
    std::string name;
    std::optional<std::string> alias;
    std::optional<units::Quantity> quantity;
    std::optional<std::string> note;
    Modifiers modifiers;
    Relation relation = Definition{};
    support::Span span;

    const std::string &displayName() const;

    bool isReference() const;
    bool isDefinition() const;
};

struct Timer
{
    std::optional<std::string> name;
    std::optional<units::Quantity> quantity;
    support::Span span;
};

//===----------------------------------------------------------------------===//
// Recipe
//===----------------------------------------------------------------------===//

/// @brief Total quantity of one listed component.
struct GroupedEntry
{
    size_t index = 0; ///< Definition index
    units::GroupedQuantity quantity;
};

struct ScalableRecipe
{
    Metadata metadata;
    std::vector<Section> sections;
    std::vector<Ingredient> ingredients;
    std::vector<Cookware> cookware;
    std::vector<Timer> timers;

    /// Composed from prep and cook time or timers when total time is absent.
    std::optional<uint32_t> totalTimeMinutes;

    /// @brief One entry per ingredient definition, summing its references.
    /// @details Hidden ingredients and intermediate references are skipped.
    std::vector<GroupedEntry> groupIngredients(const units::Converter &converter) const;

    /// @brief One entry per cookware definition, summing its references.
    std::vector<GroupedEntry> groupCookware(const units::Converter &converter) const;
};

} // namespace sous::model
