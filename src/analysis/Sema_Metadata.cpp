//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Sema_Metadata.cpp
/// @brief Metadata interpretation, validation and time reconciliation.
///
//===----------------------------------------------------------------------===//

#include "analysis/Sema.hpp"

#include "units/Converter.hpp"

#include <cmath>
#include <limits>
#include <string>

namespace sous::analysis
{

using model::SpecialKey;
using support::DiagCode;
using support::Span;

namespace
{

/// @brief Split a servings value on '|' into trimmed parts.
std::vector<std::string_view> splitAlternatives(std::string_view value)
{
    std::vector<std::string_view> parts;
    while (true)
    {
        const size_t bar = value.find('|');
        parts.push_back(value.substr(0, bar));
        if (bar == std::string_view::npos)
            break;
        value.remove_prefix(bar + 1);
    }
    return parts;
}

} // namespace

void Sema::analyzeMetadata(const parse::MetadataEvent &ev)
{
    const auto special = model::specialKeyFor(ev.key);

    // Aliases of a special key ("serves" and "servings") count as repeats.
    Span previous;
    bool duplicate = false;
    if (const model::MetadataEntry *prev = recipe_.metadata.find(ev.key))
    {
        duplicate = true;
        previous = prev->keySpan;
    }
    else if (special)
    {
        if (auto it = specialSpans_.find(*special); it != specialSpans_.end())
        {
            duplicate = true;
            previous = it->second;
        }
    }

    recipe_.metadata.entries.push_back(model::MetadataEntry{ev.key, ev.value, ev.keySpan, ev.valueSpan});

    if (special == SpecialKey::Servings)
    {
        applyServings(ev, duplicate, previous);
    }
    else
    {
        if (duplicate)
        {
            report_.warning(DiagCode::A013_DuplicateMetadataKey,
                            ev.keySpan,
                            "metadata key '" + ev.key + "' is repeated")
                .label(previous, "first given here")
                .withHelp("the first value is used");
        }
        if (special)
            applySpecial(*special, ev, duplicate);
    }

    if (!validator_)
        return;
    const CheckOutcome outcome = validator_(ev.key, ev.value);
    switch (outcome.result)
    {
        case CheckResult::Accept:
            break;
        case CheckResult::Reject:
            report_.warning(DiagCode::A008_MetadataRejected,
                            ev.span,
                            "metadata entry '" + ev.key + "' was rejected" +
                                (outcome.reason.empty() ? std::string() : ": " + outcome.reason));
            break;
        case CheckResult::Error:
            report_.error(DiagCode::A009_MetadataError,
                          ev.span,
                          "invalid metadata entry '" + ev.key + "'" +
                              (outcome.reason.empty() ? std::string() : ": " + outcome.reason));
            break;
    }
}

void Sema::invalidSpecial(const parse::MetadataEvent &ev, const std::string &expected)
{
    report_.warning(DiagCode::A007_InvalidSpecialMetadata,
                    ev.valueSpan,
                    "invalid value for '" + ev.key + "': expected " + expected)
        .withHelp("the value is kept as plain text");
}

bool Sema::applySpecial(SpecialKey key, const parse::MetadataEvent &ev, bool duplicate)
{
    model::Metadata &meta = recipe_.metadata;
    if (!duplicate)
        specialSpans_[key] = ev.keySpan;

    switch (key)
    {
        case SpecialKey::Title:
        case SpecialKey::Description:
        case SpecialKey::Emoji:
        {
            if (ev.value.empty())
                return false;
            auto &field = key == SpecialKey::Title         ? meta.title
                          : key == SpecialKey::Description ? meta.description
                                                           : meta.emoji;
            if (!field)
                field = ev.value;
            return true;
        }

        case SpecialKey::Tags:
        {
            auto tags = model::parseTags(ev.value);
            if (tags.empty())
            {
                invalidSpecial(ev, "a comma separated list of tags");
                return false;
            }
            if (meta.tags.empty())
                meta.tags = std::move(tags);
            return true;
        }

        case SpecialKey::Author:
        case SpecialKey::Source:
        {
            auto parsed = model::parseNameAndUrl(ev.value);
            if (!parsed)
            {
                invalidSpecial(ev, "a name, a URL or 'name <URL>'");
                return false;
            }
            auto &field = key == SpecialKey::Author ? meta.author : meta.source;
            if (!field)
                field = std::move(*parsed);
            return true;
        }

        case SpecialKey::Time:
        case SpecialKey::PrepTime:
        case SpecialKey::CookTime:
        {
            auto minutes = model::parseDuration(ev.value, converter_);
            if (!minutes)
            {
                invalidSpecial(ev, "a duration such as '1h 30min' or '45'");
                return false;
            }
            auto &field = key == SpecialKey::Time       ? meta.totalTime
                          : key == SpecialKey::PrepTime ? meta.prepTime
                                                        : meta.cookTime;
            if (!field)
                field = *minutes;
            return true;
        }

        case SpecialKey::Servings:
            break;
    }
    return false;
}

bool Sema::applyServings(const parse::MetadataEvent &ev, bool duplicate, Span previous)
{
    model::Metadata &meta = recipe_.metadata;

    std::vector<uint32_t> amounts;
    for (auto part : splitAlternatives(ev.value))
    {
        auto n = model::parseServings(part);
        if (!n)
        {
            invalidSpecial(ev, "a positive whole number");
            if (duplicate)
            {
                report_.warning(DiagCode::A013_DuplicateMetadataKey,
                                ev.keySpan,
                                "metadata key '" + ev.key + "' is repeated")
                    .label(previous, "first given here");
            }
            return false;
        }
        amounts.push_back(*n);
    }

    const uint32_t amount = amounts.front();
    for (uint32_t other : amounts)
    {
        if (other != amount)
        {
            report_.error(DiagCode::A006_ConflictingServings,
                          ev.valueSpan,
                          "servings lists different amounts: '" + ev.value + "'")
                .withHelp("give a single amount of servings");
            return false;
        }
    }
    if (amounts.size() > 1)
    {
        report_.warning(DiagCode::A016_RedundantServings,
                        ev.valueSpan,
                        "servings repeats the amount " + std::to_string(amount))
            .withHelp("write '" + std::to_string(amount) + "'");
    }

    if (duplicate)
    {
        if (meta.servings && *meta.servings != amount)
        {
            report_.error(DiagCode::A006_ConflictingServings,
                          ev.valueSpan,
                          "servings was already given as " + std::to_string(*meta.servings))
                .label(previous, "first given here");
            return false;
        }
        report_.warning(DiagCode::A013_DuplicateMetadataKey,
                        ev.keySpan,
                        "metadata key '" + ev.key + "' is repeated")
            .label(previous, "first given here");
    }
    else
    {
        specialSpans_[SpecialKey::Servings] = ev.keySpan;
    }

    if (!meta.servings)
        meta.servings = amount;
    return true;
}

void Sema::composeTime()
{
    const model::Metadata &meta = recipe_.metadata;

    constexpr uint64_t kMaxMinutes = std::numeric_limits<uint32_t>::max();

    std::optional<uint64_t> composed;
    Span composedSpan;
    if (meta.prepTime || meta.cookTime)
    {
        composed = uint64_t{meta.prepTime.value_or(0)} + meta.cookTime.value_or(0);
        auto it = specialSpans_.find(meta.prepTime ? SpecialKey::PrepTime : SpecialKey::CookTime);
        if (it != specialSpans_.end())
            composedSpan = it->second;
    }
    else if (options_.composeTimeFromTimers && !recipe_.timers.empty())
    {
        double seconds = 0.0;
        bool any = false;
        for (const auto &timer : recipe_.timers)
        {
            if (!timer.quantity || !timer.quantity->unitInfo ||
                timer.quantity->unitInfo->quantity != units::PhysicalQuantity::Time)
                continue;
            const auto lowest = timer.quantity->value.lowest();
            if (!lowest)
                continue;
            seconds += timer.quantity->unitInfo->toBase(*lowest);
            if (!any)
                composedSpan = timer.span;
            any = true;
        }
        if (any)
        {
            const double minutes = std::round(seconds / 60.0);
            composed = minutes > static_cast<double>(kMaxMinutes) ? kMaxMinutes + 1
                                                                   : static_cast<uint64_t>(minutes);
        }
    }

    if (composed && *composed > kMaxMinutes)
    {
        report_.warning(DiagCode::A007_InvalidSpecialMetadata,
                        composedSpan,
                        "composed time exceeds " + std::to_string(kMaxMinutes) + " min")
            .withHelp("the composed time is ignored");
        composed.reset();
    }

    if (!meta.totalTime)
    {
        if (composed)
            recipe_.totalTimeMinutes = static_cast<uint32_t>(*composed);
        return;
    }
    if (!composed)
    {
        recipe_.totalTimeMinutes = meta.totalTime;
        return;
    }

    const Span totalSpan = specialSpans_.count(SpecialKey::Time) ? specialSpans_[SpecialKey::Time] : Span{};
    if (options_.timePrecedence == TimePrecedence::TotalOverridesComposed)
    {
        recipe_.totalTimeMinutes = meta.totalTime;
        report_.warning(DiagCode::A012_RedundantTimeOverride,
                        composedSpan,
                        "total time of " + std::to_string(*meta.totalTime) + " min overrides the composed time of " +
                            std::to_string(*composed) + " min")
            .label(totalSpan, "total time given here");
    }
    else
    {
        recipe_.totalTimeMinutes = static_cast<uint32_t>(*composed);
        report_.warning(DiagCode::A012_RedundantTimeOverride,
                        totalSpan,
                        "composed time of " + std::to_string(*composed) + " min overrides the total time of " +
                            std::to_string(*meta.totalTime) + " min")
            .label(composedSpan, "composed from here");
    }
}

} // namespace sous::analysis
