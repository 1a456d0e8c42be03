//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/model/Metadata.hpp
// Purpose: Recipe metadata: raw entries in source order plus typed values for
//          the keys the analyzer recognizes.
// Key invariants: Entries keep source order, duplicates included.  A special
//                 field is set only when its entry parsed successfully.
// Ownership/Lifetime: Plain value type.
// Links: analysis/Sema.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sous::units
{
class Converter;
}

namespace sous::model
{

/// @brief Metadata keys with a typed meaning.
enum class SpecialKey
{
    Title,
    Description,
    Tags,
    Author,
    Source,
    Servings,
    Time,
    PrepTime,
    CookTime,
    Emoji
};

/// @brief Canonical spelling of @p key, e.g. "prep time".
const char *specialKeyName(SpecialKey key);

/// @brief Lowercase @p key and fold '_', '-' and '.' into single spaces.
std::string normalizeKey(std::string_view key);

/// @brief Recognize a special key, ignoring case and separators.
/// @details Accepts the aliases "serves" (servings), "total time" and
///          "duration" (time), "prep_time" and similar spellings.
std::optional<SpecialKey> specialKeyFor(std::string_view key);

/// @brief A person or site with an optional link: "Name <https://...>".
struct NameAndUrl
{
    std::optional<std::string> name;
    std::optional<std::string> url;

    bool operator==(const NameAndUrl &) const = default;
};

struct MetadataEntry
{
    std::string key;
    std::string value;
    support::Span keySpan;
    support::Span valueSpan;
};

struct Metadata
{
    /// Every entry in source order.
    std::vector<MetadataEntry> entries;

    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<std::string> emoji;
    std::vector<std::string> tags;
    std::optional<NameAndUrl> author;
    std::optional<NameAndUrl> source;
    std::optional<uint32_t> servings;

    /// Durations in minutes.
    std::optional<uint32_t> totalTime;
    std::optional<uint32_t> prepTime;
    std::optional<uint32_t> cookTime;

    /// @brief First entry whose key matches @p key after normalization.
    const MetadataEntry *find(std::string_view key) const;

    /// @brief Render entries back as `>> key: value` lines.
    std::string serialize() const;
};

/// @brief Split a comma separated tag list, dropping empty tags.
std::vector<std::string> parseTags(std::string_view text);

/// @brief Parse "Name", "<url>", "url" or "Name <url>".
std::optional<NameAndUrl> parseNameAndUrl(std::string_view text);

/// @brief Parse a positive integer amount of servings.
std::optional<uint32_t> parseServings(std::string_view text);

/// @brief Parse a duration such as "90", "1h 30min" or "1.5 hours" into minutes.
/// @details Units are looked up as time units in @p converter, falling back to
///          a built-in table of common spellings.  A bare number is minutes.
std::optional<uint32_t> parseDuration(std::string_view text, const units::Converter &converter);

} // namespace sous::model
