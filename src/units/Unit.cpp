//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "units/Unit.hpp"

namespace sous::units
{

const char *physicalQuantityName(PhysicalQuantity q)
{
    switch (q)
    {
        case PhysicalQuantity::Volume:
            return "volume";
        case PhysicalQuantity::Mass:
            return "mass";
        case PhysicalQuantity::Length:
            return "length";
        case PhysicalQuantity::Temperature:
            return "temperature";
        case PhysicalQuantity::Time:
            return "time";
    }
    return "unknown";
}

const char *systemName(System s)
{
    switch (s)
    {
        case System::Metric:
            return "metric";
        case System::Imperial:
            return "imperial";
    }
    return "unknown";
}

const std::string &Unit::symbol() const
{
    if (!symbols.empty())
        return symbols.front();
    return names.front();
}

std::vector<std::string> Unit::allKeys() const
{
    std::vector<std::string> keys;
    keys.reserve(names.size() + symbols.size() + aliases.size());
    keys.insert(keys.end(), names.begin(), names.end());
    keys.insert(keys.end(), symbols.begin(), symbols.end());
    keys.insert(keys.end(), aliases.begin(), aliases.end());
    return keys;
}

} // namespace sous::units
