//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/model/Recipe.cpp
// Purpose: Component accessors and quantity grouping for ingredient lists.
// Key invariants: Grouping visits definitions in source order.
// Ownership/Lifetime: Read-only over the recipe.
// Links: model/Recipe.hpp
//
//===----------------------------------------------------------------------===//

#include "model/Recipe.hpp"

namespace sous::model
{

namespace
{

template <typename T> std::vector<GroupedEntry> groupDefinitions(const std::vector<T> &items,
                                                                 const units::Converter &converter)
{
    std::vector<GroupedEntry> out;
    for (size_t i = 0; i < items.size(); ++i)
    {
        const T &item = items[i];
        const auto *def = std::get_if<Definition>(&item.relation);
        if (!def || item.modifiers.hidden)
            continue;

        GroupedEntry entry;
        entry.index = i;
        if (item.quantity)
            entry.quantity.add(*item.quantity, converter);
        for (size_t ref : def->referencedFrom)
        {
            if (items[ref].quantity)
                entry.quantity.add(*items[ref].quantity, converter);
        }
        out.push_back(std::move(entry));
    }
    return out;
}

} // namespace

size_t Section::stepCount() const
{
    size_t n = 0;
    for (const auto &c : content)
    {
        if (std::holds_alternative<Step>(c))
            ++n;
    }
    return n;
}

const std::string &Ingredient::displayName() const
{
    return alias ? *alias : name;
}

bool Ingredient::isReference() const
{
    return std::holds_alternative<Reference>(relation);
}

bool Ingredient::isDefinition() const
{
    return std::holds_alternative<Definition>(relation);
}

const std::string &Cookware::displayName() const
{
    return alias ? *alias : name;
}

bool Cookware::isReference() const
{
    return std::holds_alternative<Reference>(relation);
}

bool Cookware::isDefinition() const
{
    return std::holds_alternative<Definition>(relation);
}

std::vector<GroupedEntry> ScalableRecipe::groupIngredients(const units::Converter &converter) const
{
    return groupDefinitions(ingredients, converter);
}

std::vector<GroupedEntry> ScalableRecipe::groupCookware(const units::Converter &converter) const
{
    return groupDefinitions(cookware, converter);
}

} // namespace sous::model
