//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Event.hpp
/// @brief Structural events emitted by the Parser.
///
/// @details The parser flattens a recipe into a stream of events:
///
///   Metadata           `>> key: value`
///   Section            `= Name =`
///   StepStart/StepEnd  brackets around a step or a text block
///   Text               prose inside a step or text block
///   Ingredient         `@name{quantity}(note)`
///   Cookware           `#name{quantity}(note)`
///   Timer              `~name{quantity}`
///
/// Components carry their raw name, alias, quantity and modifiers; nothing is
/// resolved yet.  Malformed markup never produces a component event: it is
/// re-emitted as Text over the same span.
///
/// @invariant Event spans do not overlap and increase monotonically.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"
#include "units/Value.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sous::parse
{

/// @brief Component modifiers written after the sigil.
struct Modifiers
{
    bool recipe = false;    ///< `@`: the ingredient is another recipe
    bool reference = false; ///< `&`: refers to an earlier definition
    bool optional = false;  ///< `?`
    bool hidden = false;    ///< `-`: not shown in ingredient lists
    bool isNew = false;     ///< `+`: never treated as a reference

    bool any() const
    {
        return recipe || reference || optional || hidden || isNew;
    }

    bool operator==(const Modifiers &) const = default;
};

/// @brief What an intermediate reference points at.
enum class IntermediateKind
{
    Step,
    Section
};

/// @brief `&(N)` style reference to an earlier step or section.
struct IntermediateRef
{
    IntermediateKind kind = IntermediateKind::Step;
    bool relative = false; ///< `~N`: N back from the current one
    uint32_t value = 0;
    support::Span span;
};

/// @brief Quantity as written inside component braces.
struct ParsedQuantity
{
    units::Value value;
    /// Unit text; present but empty when `%` is followed by nothing.
    std::optional<std::string> unit;
    bool fixed = false; ///< `=` prefix or `*` suffix: never scaled
    support::Span span;
    std::optional<support::Span> unitSpan;
};

/// @brief Payload shared by ingredient, cookware and timer events.
struct Component
{
    std::string name; ///< Empty for anonymous timers
    std::optional<std::string> alias;
    std::optional<ParsedQuantity> quantity;
    std::optional<std::string> note;
    Modifiers modifiers;
    std::optional<IntermediateRef> intermediate;
    support::Span nameSpan;
    support::Span span;
};

struct MetadataEvent
{
    std::string key;
    std::string value;
    support::Span keySpan;
    support::Span valueSpan;
    support::Span span;
};

struct SectionEvent
{
    std::optional<std::string> name;
    support::Span span;
};

struct StepStartEvent
{
    bool isText = false;
    support::Span span;
};

struct StepEndEvent
{
    bool isText = false;
    support::Span span;
};

struct TextEvent
{
    std::string text;
    support::Span span;
};

struct IngredientEvent : Component
{
};

struct CookwareEvent : Component
{
};

struct TimerEvent : Component
{
};

using Event = std::variant<MetadataEvent,
                           SectionEvent,
                           StepStartEvent,
                           StepEndEvent,
                           TextEvent,
                           IngredientEvent,
                           CookwareEvent,
                           TimerEvent>;

/// @brief Span of any event.
inline support::Span eventSpan(const Event &e)
{
    return std::visit([](const auto &ev) { return ev.span; }, e);
}

} // namespace sous::parse
