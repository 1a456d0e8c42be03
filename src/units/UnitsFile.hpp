//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: units/UnitsFile.hpp
// Purpose: Declares the in-memory form of a unit definition layer.  Loaders
//          for on-disk formats fill these structures; ConverterBuilder merges
//          any number of them into one Converter.
// Key invariants: None; validation happens in ConverterBuilder::finish.
// Ownership/Lifetime: Plain aggregates owned by the caller.
// Links: units/Converter.hpp, units/BundledUnits.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "units/Unit.hpp"

#include <array>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sous::units
{

/// @brief How new names, symbols or aliases combine with existing ones.
enum class Precedence
{
    Before,  ///< Prepend; the new entries become the preferred ones
    After,   ///< Append
    Override ///< Replace
};

/// @brief SI prefixes applied to units declared with expandSi.
enum class SiPrefix
{
    Kilo,
    Hecto,
    Deca,
    Deci,
    Centi,
    Milli
};

inline constexpr size_t kSiPrefixCount = 6;

/// @brief Ratio of @p prefix relative to the unprefixed unit.
double siPrefixRatio(SiPrefix prefix);

/// @brief Prefix texts per SI prefix, indexed by SiPrefix.
using SiPrefixTable = std::array<std::vector<std::string>, kSiPrefixCount>;

struct SiConfig
{
    std::optional<SiPrefixTable> prefixes;       ///< Prepended to names
    std::optional<SiPrefixTable> symbolPrefixes; ///< Prepended to symbols
    Precedence precedence = Precedence::Before;
};

/// @brief Resolved fraction display settings for one unit.
struct FractionsConfig
{
    bool enabled = false;
    double accuracy = 0.05;      ///< Accepted relative error, 0..1
    uint32_t maxDenominator = 4; ///< 1..16
    uint32_t maxWhole = std::numeric_limits<uint32_t>::max();
};

/// @brief Partially specified FractionsConfig; unset fields inherit.
struct FractionsOverride
{
    std::optional<bool> enabled;
    std::optional<double> accuracy;
    std::optional<uint32_t> maxDenominator;
    std::optional<uint32_t> maxWhole;

    /// @brief Shorthand for {enabled = on}.
    static FractionsOverride toggle(bool on);

    /// @brief Fields of *this, falling back to @p fallback.
    FractionsOverride merge(const FractionsOverride &fallback) const;

    /// @brief Fill unset fields with defaults and clamp to valid ranges.
    FractionsConfig define() const;
};

/// @brief Fraction layers, most specific last: all, system, quantity, unit.
struct FractionsLayers
{
    std::optional<FractionsOverride> all;
    std::optional<FractionsOverride> metric;
    std::optional<FractionsOverride> imperial;
    std::map<PhysicalQuantity, FractionsOverride> quantity;
    std::map<std::string, FractionsOverride> unit; ///< Keyed by any unit text
};

/// @brief Edits to an already defined unit.
struct ExtendUnitEntry
{
    std::optional<double> ratio;
    std::optional<double> difference;
    std::optional<std::vector<std::string>> names;
    std::optional<std::vector<std::string>> symbols;
    std::optional<std::vector<std::string>> aliases;
};

struct ExtendConfig
{
    Precedence precedence = Precedence::Before;
    std::map<std::string, ExtendUnitEntry> units; ///< Keyed by any unit text
};

/// @brief New unit declaration.
struct UnitEntry
{
    std::vector<std::string> names;
    std::vector<std::string> symbols;
    std::vector<std::string> aliases;
    double ratio = 1.0;
    double difference = 0.0;
    bool expandSi = false;
};

/// @brief Best units for fitting, either shared or per system.
struct BestUnits
{
    std::vector<std::string> unified;
    std::vector<std::string> metric;
    std::vector<std::string> imperial;

    bool isUnified() const
    {
        return !unified.empty();
    }
};

/// @brief Units of one physical quantity.
struct QuantityGroup
{
    PhysicalQuantity quantity = PhysicalQuantity::Volume;
    std::optional<BestUnits> best;
    std::vector<UnitEntry> metric;
    std::vector<UnitEntry> imperial;
    std::vector<UnitEntry> unspecified; ///< Units without a system
};

/// @brief One unit definition layer.
struct UnitsFile
{
    std::optional<System> defaultSystem;
    std::optional<SiConfig> si;
    std::optional<FractionsLayers> fractions;
    std::optional<ExtendConfig> extend;
    std::vector<QuantityGroup> quantities;
};

/// @brief The built-in unit table: volume, mass, length, temperature, time.
const UnitsFile &bundledUnits();

} // namespace sous::units
