//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// The built-in unit table.  Base units: liter (volume), gram (mass), meter
// (length), degree Celsius (temperature) and second (time).  Metric units
// expand SI prefixes; imperial quantities display as fractions.
//
//===----------------------------------------------------------------------===//

#include "units/UnitsFile.hpp"

namespace sous::units
{

namespace
{

UnitEntry entry(std::vector<std::string> names,
                std::vector<std::string> symbols,
                double ratio,
                std::vector<std::string> aliases = {},
                double difference = 0.0,
                bool expandSi = false)
{
    UnitEntry e;
    e.names = std::move(names);
    e.symbols = std::move(symbols);
    e.aliases = std::move(aliases);
    e.ratio = ratio;
    e.difference = difference;
    e.expandSi = expandSi;
    return e;
}

UnitEntry siEntry(std::vector<std::string> names, std::vector<std::string> symbols)
{
    return entry(std::move(names), std::move(symbols), 1.0, {}, 0.0, true);
}

UnitsFile makeBundled()
{
    UnitsFile file;
    file.defaultSystem = System::Metric;

    SiConfig si;
    si.prefixes = SiPrefixTable{{{"kilo"}, {"hecto"}, {"deca"}, {"deci"}, {"centi"}, {"milli"}}};
    si.symbolPrefixes = SiPrefixTable{{{"k"}, {"h"}, {"da"}, {"d"}, {"c"}, {"m"}}};
    file.si = si;

    FractionsLayers fractions;
    fractions.metric = FractionsOverride::toggle(false);
    FractionsOverride imperial = FractionsOverride::toggle(true);
    imperial.maxDenominator = 8;
    fractions.imperial = imperial;
    fractions.quantity[PhysicalQuantity::Temperature] = FractionsOverride::toggle(false);
    file.fractions = fractions;

    QuantityGroup volume;
    volume.quantity = PhysicalQuantity::Volume;
    volume.best = BestUnits{{}, {"ml", "l"}, {"tsp", "tbsp", "cup", "gal"}};
    volume.metric = {siEntry({"liter", "liters", "litre", "litres"}, {"l", "L"})};
    volume.imperial = {
        entry({"teaspoon", "teaspoons"}, {"tsp"}, 0.00492892159375, {"tsps"}),
        entry({"tablespoon", "tablespoons"}, {"tbsp"}, 0.01478676478125, {"tbsps", "tbs"}),
        entry({"fluid ounce", "fluid ounces"}, {"fl oz"}, 0.0295735295625, {"floz"}),
        entry({"cup", "cups"}, {"c"}, 0.2365882365),
        entry({"pint", "pints"}, {"pt"}, 0.473176473),
        entry({"quart", "quarts"}, {"qt"}, 0.946352946),
        entry({"gallon", "gallons"}, {"gal"}, 3.785411784),
    };
    file.quantities.push_back(volume);

    QuantityGroup mass;
    mass.quantity = PhysicalQuantity::Mass;
    mass.best = BestUnits{{}, {"mg", "g", "kg"}, {"oz", "lb"}};
    mass.metric = {siEntry({"gram", "grams", "gramme", "grammes"}, {"g"})};
    mass.imperial = {
        entry({"ounce", "ounces"}, {"oz"}, 28.349523125),
        entry({"pound", "pounds"}, {"lb"}, 453.59237, {"lbs"}),
    };
    file.quantities.push_back(mass);

    QuantityGroup length;
    length.quantity = PhysicalQuantity::Length;
    length.best = BestUnits{{}, {"mm", "cm", "m"}, {"in", "ft"}};
    length.metric = {siEntry({"meter", "meters", "metre", "metres"}, {"m"})};
    length.imperial = {
        entry({"inch", "inches"}, {"in"}, 0.0254, {"\""}),
        entry({"foot", "feet"}, {"ft"}, 0.3048, {"'"}),
    };
    file.quantities.push_back(length);

    QuantityGroup temperature;
    temperature.quantity = PhysicalQuantity::Temperature;
    temperature.best = BestUnits{{}, {"°C"}, {"°F"}};
    temperature.metric = {entry({"celsius"}, {"°C", "C"}, 1.0, {"ºC"})};
    temperature.imperial = {entry({"fahrenheit"}, {"°F", "F"}, 5.0 / 9.0, {"ºF"}, -160.0 / 9.0)};
    temperature.unspecified = {entry({"kelvin"}, {"K"}, 1.0, {}, -273.15)};
    file.quantities.push_back(temperature);

    QuantityGroup time;
    time.quantity = PhysicalQuantity::Time;
    time.best = BestUnits{{"s", "min", "h", "d"}, {}, {}};
    time.unspecified = {
        entry({"second", "seconds"}, {"s"}, 1.0, {"sec", "secs"}),
        entry({"minute", "minutes"}, {"min"}, 60.0, {"mins"}),
        entry({"hour", "hours"}, {"h"}, 3600.0, {"hr", "hrs"}),
        entry({"day", "days"}, {"d"}, 86400.0),
    };
    file.quantities.push_back(time);

    return file;
}

} // namespace

const UnitsFile &bundledUnits()
{
    static const UnitsFile file = makeBundled();
    return file;
}

} // namespace sous::units
