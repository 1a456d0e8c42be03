//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: units/Quantity.hpp
// Purpose: Declares a value paired with optional unit text and resolved unit.
// Key invariants: unitInfo, when set, is the unit the unit text resolves to.
// Ownership/Lifetime: Value type; the resolved unit is shared read-only.
// Links: units/Converter.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "units/Unit.hpp"
#include "units/Value.hpp"

#include <memory>
#include <optional>
#include <string>

namespace sous::units
{

struct Quantity
{
    Value value;
    std::optional<std::string> unit;        ///< Unit text as written
    std::shared_ptr<const Unit> unitInfo;   ///< Resolved unit, null when unknown

    Quantity() = default;
    Quantity(Value v, std::optional<std::string> u = std::nullopt,
             std::shared_ptr<const Unit> info = nullptr)
        : value(std::move(v)), unit(std::move(u)), unitInfo(std::move(info))
    {
    }

    bool hasUnit() const
    {
        return unit.has_value();
    }

    /// @brief Physical quantity of the resolved unit, if any.
    std::optional<PhysicalQuantity> physicalQuantity() const;

    /// @brief Same quantity with its value multiplied by @p factor.
    Quantity scaled(double factor) const;

    /// @brief "2 tsp", "1 1/2 cup" or just the value without a unit.
    std::string toString() const;

    /// @brief Equal values and equal unit text.
    bool operator==(const Quantity &other) const;
};

} // namespace sous::units
