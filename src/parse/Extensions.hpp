//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: parse/Extensions.hpp
// Purpose: Syntax extensions over the base markup, as a bit set.
// Key invariants: Extensions::All enables every defined flag.
// Ownership/Lifetime: Value type.
// Links: parse/Parser.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace sous::parse
{

enum class Extensions : uint32_t
{
    None = 0,
    /// Consecutive lines form one step until a blank line.
    MultilineSteps = 1u << 0,
    /// `@`, `&`, `?`, `-` and `+` after a component sigil.
    ComponentModifiers = 1u << 1,
    /// `(note)` after an ingredient or cookware.
    ComponentNote = 1u << 2,
    /// `name|alias` component names.
    ComponentAlias = 1u << 3,
    /// `= Section =` lines.
    Sections = 1u << 4,
    /// `{200 g}` units without `%`.
    AdvancedUnits = 1u << 5,
    /// `> text` blocks.
    TextSteps = 1u << 6,
    /// `{2-3}` ranges.
    RangeValues = 1u << 7,
    /// `&(N)`, `&(~N)`, `&(=N)` and `&(=~N)` step and section references.
    IntermediatePreparations = 1u << 8,

    All = (1u << 9) - 1,
};

constexpr Extensions operator|(Extensions a, Extensions b)
{
    return static_cast<Extensions>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

constexpr Extensions operator&(Extensions a, Extensions b)
{
    return static_cast<Extensions>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

constexpr Extensions operator~(Extensions a)
{
    return static_cast<Extensions>(~static_cast<uint32_t>(a) & static_cast<uint32_t>(Extensions::All));
}

/// @brief True when every flag of @p flag is set in @p set.
constexpr bool hasExtension(Extensions set, Extensions flag)
{
    return (set & flag) == flag;
}

} // namespace sous::parse
