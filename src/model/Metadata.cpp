//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/model/Metadata.cpp
// Purpose: Key normalization and typed parsing of metadata values.
// Key invariants: Parsers never throw; unparseable input yields nullopt.
// Ownership/Lifetime: Stateless helpers.
// Links: model/Metadata.hpp
//
//===----------------------------------------------------------------------===//

#include "model/Metadata.hpp"

#include "units/Converter.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <utility>

namespace sous::model
{

namespace
{

bool isBlank(char c)
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

std::string_view trim(std::string_view s)
{
    while (!s.empty() && isBlank(s.front()))
        s.remove_prefix(1);
    while (!s.empty() && isBlank(s.back()))
        s.remove_suffix(1);
    return s;
}

bool isDigit(char c)
{
    return c >= '0' && c <= '9';
}

struct KeyAlias
{
    const char *name;
    SpecialKey key;
};

constexpr std::array<KeyAlias, 17> kKeyAliases = {{
    {"title", SpecialKey::Title},
    {"description", SpecialKey::Description},
    {"tags", SpecialKey::Tags},
    {"tag", SpecialKey::Tags},
    {"author", SpecialKey::Author},
    {"source", SpecialKey::Source},
    {"servings", SpecialKey::Servings},
    {"serves", SpecialKey::Servings},
    {"time", SpecialKey::Time},
    {"total time", SpecialKey::Time},
    {"duration", SpecialKey::Time},
    {"prep time", SpecialKey::PrepTime},
    {"preparation time", SpecialKey::PrepTime},
    {"cook time", SpecialKey::CookTime},
    {"cooking time", SpecialKey::CookTime},
    {"emoji", SpecialKey::Emoji},
    {"icon", SpecialKey::Emoji},
}};

struct DurationUnit
{
    const char *name;
    double seconds;
};

constexpr std::array<DurationUnit, 18> kDurationUnits = {{
    {"s", 1.0},
    {"sec", 1.0},
    {"secs", 1.0},
    {"second", 1.0},
    {"seconds", 1.0},
    {"m", 60.0},
    {"min", 60.0},
    {"mins", 60.0},
    {"minute", 60.0},
    {"minutes", 60.0},
    {"h", 3600.0},
    {"hr", 3600.0},
    {"hrs", 3600.0},
    {"hour", 3600.0},
    {"hours", 3600.0},
    {"d", 86400.0},
    {"day", 86400.0},
    {"days", 86400.0},
}};

/// @brief Seconds per @p unit, or nullopt when it is not a time unit.
std::optional<double> secondsPer(std::string_view unit, const units::Converter &converter)
{
    if (auto u = converter.findUnit(unit); u && u->quantity == units::PhysicalQuantity::Time)
        return u->toBase(1.0);

    std::string lower;
    for (char c : unit)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    for (const auto &entry : kDurationUnits)
    {
        if (lower == entry.name)
            return entry.seconds;
    }
    return std::nullopt;
}

} // namespace

const char *specialKeyName(SpecialKey key)
{
    switch (key)
    {
        case SpecialKey::Title:
            return "title";
        case SpecialKey::Description:
            return "description";
        case SpecialKey::Tags:
            return "tags";
        case SpecialKey::Author:
            return "author";
        case SpecialKey::Source:
            return "source";
        case SpecialKey::Servings:
            return "servings";
        case SpecialKey::Time:
            return "time";
        case SpecialKey::PrepTime:
            return "prep time";
        case SpecialKey::CookTime:
            return "cook time";
        case SpecialKey::Emoji:
            return "emoji";
    }
    return "?";
}

std::string normalizeKey(std::string_view key)
{
    std::string out;
    bool pendingSpace = false;
    for (char c : trim(key))
    {
        if (isBlank(c) || c == '_' || c == '-' || c == '.')
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

std::optional<SpecialKey> specialKeyFor(std::string_view key)
{
    const std::string norm = normalizeKey(key);
    for (const auto &alias : kKeyAliases)
    {
        if (norm == alias.name)
            return alias.key;
    }
    return std::nullopt;
}

const MetadataEntry *Metadata::find(std::string_view key) const
{
    const std::string norm = normalizeKey(key);
    for (const auto &e : entries)
    {
        if (normalizeKey(e.key) == norm)
            return &e;
    }
    return nullptr;
}

std::string Metadata::serialize() const
{
    std::string out;
    for (const auto &e : entries)
    {
        out += ">> ";
        out += e.key;
        out += ": ";
        out += e.value;
        out += '\n';
    }
    return out;
}

std::vector<std::string> parseTags(std::string_view text)
{
    std::vector<std::string> tags;
    while (!text.empty())
    {
        const size_t comma = text.find(',');
        const auto tag = trim(text.substr(0, comma));
        if (!tag.empty())
            tags.emplace_back(tag);
        if (comma == std::string_view::npos)
            break;
        text.remove_prefix(comma + 1);
    }
    return tags;
}

std::optional<NameAndUrl> parseNameAndUrl(std::string_view text)
{
    text = trim(text);
    if (text.empty())
        return std::nullopt;

    NameAndUrl out;
    const size_t open = text.rfind('<');
    if (text.back() == '>' && open != std::string_view::npos)
    {
        const auto name = trim(text.substr(0, open));
        const auto url = trim(text.substr(open + 1, text.size() - open - 2));
        if (!name.empty())
            out.name = std::string(name);
        if (!url.empty())
            out.url = std::string(url);
        if (!out.name && !out.url)
            return std::nullopt;
        return out;
    }

    if (text.starts_with("http://") || text.starts_with("https://"))
        out.url = std::string(text);
    else
        out.name = std::string(text);
    return out;
}

std::optional<uint32_t> parseServings(std::string_view text)
{
    text = trim(text);
    uint32_t value = 0;
    const auto r = std::from_chars(text.data(), text.data() + text.size(), value);
    if (r.ec != std::errc{} || r.ptr != text.data() + text.size() || value == 0)
        return std::nullopt;
    return value;
}

std::optional<uint32_t> parseDuration(std::string_view text, const units::Converter &converter)
{
    text = trim(text);
    if (text.empty())
        return std::nullopt;

    double seconds = 0.0;
    size_t i = 0;
    while (i < text.size())
    {
        while (i < text.size() && isBlank(text[i]))
            ++i;
        if (i == text.size())
            break;

        const size_t numBegin = i;
        while (i < text.size() && (isDigit(text[i]) || text[i] == '.'))
            ++i;
        if (i == numBegin)
            return std::nullopt;
        const std::string numText(text.substr(numBegin, i - numBegin));
        char *endp = nullptr;
        const double amount = std::strtod(numText.c_str(), &endp);
        if (endp != numText.c_str() + numText.size())
            return std::nullopt;

        while (i < text.size() && isBlank(text[i]))
            ++i;
        const size_t unitBegin = i;
        while (i < text.size() && !isBlank(text[i]) && !isDigit(text[i]) && text[i] != ',')
            ++i;
        const auto unit = text.substr(unitBegin, i - unitBegin);
        while (i < text.size() && (isBlank(text[i]) || text[i] == ','))
            ++i;

        if (unit.empty())
        {
            seconds += amount * 60.0;
            continue;
        }
        const auto per = secondsPer(unit, converter);
        if (!per)
            return std::nullopt;
        seconds += amount * *per;
    }

    const double minutes = std::round(seconds / 60.0);
    if (minutes < 0.0 || minutes > static_cast<double>(UINT32_MAX))
        return std::nullopt;
    return static_cast<uint32_t>(minutes);
}

} // namespace sous::model
