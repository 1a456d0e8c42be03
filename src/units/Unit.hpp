//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: units/Unit.hpp
// Purpose: Declares measurement units, physical quantities and systems.
// Key invariants: A unit converts to the base unit of its physical quantity
//                 as base = value * ratio + difference.
// Ownership/Lifetime: Units are shared immutably through shared_ptr<const Unit>
//                     once a Converter is built.
// Links: units/Converter.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sous::units
{

/// @brief Physical quantity a unit measures.
enum class PhysicalQuantity
{
    Volume,
    Mass,
    Length,
    Temperature,
    Time
};

/// @brief Measurement system.
enum class System
{
    Metric,
    Imperial
};

const char *physicalQuantityName(PhysicalQuantity q);
const char *systemName(System s);

/// @brief Canonical unit definition.
struct Unit
{
    std::vector<std::string> names;
    std::vector<std::string> symbols;
    std::vector<std::string> aliases;
    double ratio = 1.0;
    double difference = 0.0;
    PhysicalQuantity quantity = PhysicalQuantity::Volume;
    std::optional<System> system;

    /// @brief Preferred display text: first symbol, else first name.
    const std::string &symbol() const;

    /// @brief Every text the unit answers to: names, symbols, then aliases.
    std::vector<std::string> allKeys() const;

    /// @brief Convert @p v in this unit to the base unit.
    double toBase(double v) const
    {
        return v * ratio + difference;
    }

    /// @brief Convert @p base from the base unit to this unit.
    double fromBase(double base) const
    {
        return (base - difference) / ratio;
    }
};

} // namespace sous::units
