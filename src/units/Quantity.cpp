//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "units/Quantity.hpp"

namespace sous::units
{

std::optional<PhysicalQuantity> Quantity::physicalQuantity() const
{
    if (!unitInfo)
        return std::nullopt;
    return unitInfo->quantity;
}

Quantity Quantity::scaled(double factor) const
{
    return Quantity(value.scaled(factor), unit, unitInfo);
}

std::string Quantity::toString() const
{
    std::string out = value.toString();
    if (unit && !unit->empty())
    {
        out += ' ';
        out += *unit;
    }
    return out;
}

bool Quantity::operator==(const Quantity &other) const
{
    return value == other.value && unit == other.unit;
}

} // namespace sous::units
