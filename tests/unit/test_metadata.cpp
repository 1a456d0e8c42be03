// File: tests/unit/test_metadata.cpp
// Purpose: Metadata key normalization and typed value parsers.
// Key invariants: Keys match ignoring case and separators; durations resolve
//                 to whole minutes; invalid values yield nullopt.
// Ownership/Lifetime: Standalone unit test executable.
// Links: src/model/Metadata.hpp

#include <gtest/gtest.h>

#include "model/Metadata.hpp"
#include "units/Converter.hpp"

using namespace sous::model;
using sous::units::Converter;

TEST(Metadata, NormalizeKey)
{
    EXPECT_EQ(normalizeKey("Prep_Time"), "prep time");
    EXPECT_EQ(normalizeKey("  cook--time "), "cook time");
    EXPECT_EQ(normalizeKey("source.url"), "source url");
    EXPECT_EQ(normalizeKey("TITLE"), "title");
}

TEST(Metadata, SpecialKeys)
{
    EXPECT_EQ(specialKeyFor("Title"), SpecialKey::Title);
    EXPECT_EQ(specialKeyFor("serves"), SpecialKey::Servings);
    EXPECT_EQ(specialKeyFor("total-time"), SpecialKey::Time);
    EXPECT_EQ(specialKeyFor("duration"), SpecialKey::Time);
    EXPECT_EQ(specialKeyFor("prep_time"), SpecialKey::PrepTime);
    EXPECT_EQ(specialKeyFor("Cooking Time"), SpecialKey::CookTime);
    EXPECT_EQ(specialKeyFor("tag"), SpecialKey::Tags);
    EXPECT_EQ(specialKeyFor("icon"), SpecialKey::Emoji);
    EXPECT_FALSE(specialKeyFor("difficulty").has_value());
    EXPECT_STREQ(specialKeyName(SpecialKey::PrepTime), "prep time");
}

TEST(Metadata, Tags)
{
    auto tags = parseTags(" soup, winter ,, vegan ");
    ASSERT_EQ(tags.size(), 3u);
    EXPECT_EQ(tags[0], "soup");
    EXPECT_EQ(tags[1], "winter");
    EXPECT_EQ(tags[2], "vegan");
    EXPECT_TRUE(parseTags(" , ").empty());
}

TEST(Metadata, NameAndUrl)
{
    auto both = parseNameAndUrl("Jane Doe <https://example.com>");
    ASSERT_TRUE(both.has_value());
    EXPECT_EQ(both->name, "Jane Doe");
    EXPECT_EQ(both->url, "https://example.com");

    auto url = parseNameAndUrl("https://example.com/soup");
    ASSERT_TRUE(url.has_value());
    EXPECT_FALSE(url->name.has_value());
    EXPECT_EQ(url->url, "https://example.com/soup");

    auto name = parseNameAndUrl("Grandma");
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(name->name, "Grandma");
    EXPECT_FALSE(name->url.has_value());

    EXPECT_FALSE(parseNameAndUrl("   ").has_value());
    EXPECT_FALSE(parseNameAndUrl("<>").has_value());
}

TEST(Metadata, Servings)
{
    EXPECT_EQ(parseServings(" 4 "), 4u);
    EXPECT_FALSE(parseServings("0").has_value());
    EXPECT_FALSE(parseServings("-2").has_value());
    EXPECT_FALSE(parseServings("4 people").has_value());
    EXPECT_FALSE(parseServings("").has_value());
}

TEST(Metadata, Durations)
{
    const Converter &conv = Converter::bundled();
    EXPECT_EQ(parseDuration("45", conv), 45u);
    EXPECT_EQ(parseDuration("1h 30min", conv), 90u);
    EXPECT_EQ(parseDuration("1.5 hours", conv), 90u);
    EXPECT_EQ(parseDuration("1h30m", conv), 90u);
    EXPECT_EQ(parseDuration("2 hours, 15 minutes", conv), 135u);
    EXPECT_EQ(parseDuration("90 s", conv), 2u);
    EXPECT_FALSE(parseDuration("2 weeks", conv).has_value());
    EXPECT_FALSE(parseDuration("soon", conv).has_value());
    EXPECT_FALSE(parseDuration("", conv).has_value());
}

TEST(Metadata, DurationsWithoutUnitTable)
{
    Converter empty;
    EXPECT_EQ(parseDuration("1 hour 5 mins", empty), 65u);
    EXPECT_EQ(parseDuration("1 day", empty), 1440u);
}

TEST(Metadata, FindAndSerialize)
{
    Metadata meta;
    meta.entries.push_back(MetadataEntry{"Prep Time", "10 min", {}, {}});
    meta.entries.push_back(MetadataEntry{"title", "Soup", {}, {}});

    const MetadataEntry *prep = meta.find("prep_time");
    ASSERT_NE(prep, nullptr);
    EXPECT_EQ(prep->value, "10 min");
    EXPECT_EQ(meta.find("author"), nullptr);
    EXPECT_EQ(meta.serialize(), ">> Prep Time: 10 min\n>> title: Soup\n");
}
