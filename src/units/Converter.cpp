//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements lookups, conversions and best-unit fitting over a built unit
// table.  Every conversion goes through the base unit of the physical quantity
// and then through the target unit's fraction settings.
//
//===----------------------------------------------------------------------===//

#include "units/Converter.hpp"

#include <algorithm>
#include <cassert>
#include <cctype>
#include <iostream>

namespace sous::units
{

using support::DiagCode;
using support::makeError;

namespace
{
std::string toLower(std::string_view text)
{
    std::string out(text);
    std::transform(out.begin(),
                   out.end(),
                   out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string describe(const Unit &unit)
{
    return "'" + unit.symbol() + "' (" + physicalQuantityName(unit.quantity) + ")";
}
} // namespace

ConvertTarget ConvertTarget::unit(std::string name)
{
    ConvertTarget t;
    t.unitName_ = std::move(name);
    return t;
}

ConvertTarget ConvertTarget::best(System system)
{
    ConvertTarget t;
    t.best_ = true;
    t.system_ = system;
    return t;
}

support::Expected<Converter> Converter::buildBundled()
{
    return ConverterBuilder().addUnitsFile(bundledUnits()).finish();
}

const Converter &Converter::bundled()
{
    static const Converter instance = []
    {
        auto built = buildBundled();
        if (!built)
        {
            std::cerr << "sous: bundled units rejected: " << built.error().message << '\n';
            assert(false && "bundled unit table must build");
            return Converter();
        }
        return std::move(built.value());
    }();
    return instance;
}

Converter::UnitPtr Converter::findUnit(std::string_view text) const
{
    if (auto it = index_.find(std::string(text)); it != index_.end())
        return units_[it->second];
    const std::string lower = toLower(text);
    if (auto it = index_.find(lower); it != index_.end())
        return units_[it->second];
    if (auto it = lowerIndex_.find(lower); it != lowerIndex_.end())
        return units_[it->second];
    return nullptr;
}

Quantity Converter::resolve(Quantity q) const
{
    if (q.unit && !q.unit->empty())
        q.unitInfo = findUnit(*q.unit);
    return q;
}

FractionsConfig Converter::fractionsFor(const Unit &unit) const
{
    if (auto it = fractions_.find(&unit); it != fractions_.end())
        return it->second;
    return FractionsConfig{};
}

std::vector<Converter::UnitPtr> Converter::bestUnits(PhysicalQuantity quantity,
                                                     std::optional<System> system) const
{
    std::vector<UnitPtr> out;
    auto it = best_.find(quantity);
    if (it == best_.end())
        return out;
    const Best &best = it->second;

    if (!best.unified.empty())
    {
        for (size_t idx : best.unified)
        {
            const auto &u = units_[idx];
            if (!system || !u->system || *u->system == *system)
                out.push_back(u);
        }
        if (out.empty())
        {
            for (size_t idx : best.unified)
                out.push_back(units_[idx]);
        }
        return out;
    }

    if (!system || *system == System::Metric)
    {
        for (size_t idx : best.metric)
            out.push_back(units_[idx]);
    }
    if (!system || *system == System::Imperial)
    {
        for (size_t idx : best.imperial)
            out.push_back(units_[idx]);
    }
    return out;
}

Number Converter::present(double v, const Unit &unit) const
{
    const FractionsConfig cfg = fractionsFor(unit);
    if (cfg.enabled)
    {
        if (auto f = approximateFraction(v, cfg.accuracy, cfg.maxDenominator, cfg.maxWhole))
            return Number::approximated(*f);
    }
    return Number::decimal(v);
}

Quantity Converter::convertTo(const Quantity &q, const Unit &from, const UnitPtr &to) const
{
    Value converted = q.value.map([&](const Number &n)
                                  { return present(to->fromBase(from.toBase(n.value())), *to); });
    return Quantity(std::move(converted), to->symbol(), to);
}

Converter::UnitPtr Converter::pickBest(const std::vector<UnitPtr> &candidates,
                                       const Unit &from,
                                       double v) const
{
    std::vector<UnitPtr> sorted = candidates;
    std::stable_sort(sorted.begin(),
                     sorted.end(),
                     [](const UnitPtr &a, const UnitPtr &b) { return a->ratio < b->ratio; });

    const double base = from.toBase(v);
    UnitPtr chosen = sorted.front();
    for (const auto &candidate : sorted)
    {
        if (candidate->fromBase(base) >= 1.0 - 1e-9)
            chosen = candidate;
    }
    return chosen;
}

support::Expected<Quantity> Converter::convert(const Quantity &q, const ConvertTarget &target) const
{
    if (q.value.isText())
        return makeError(DiagCode::U004_TextValue, {}, "cannot convert the text value '" + q.value.asText() + "'");
    if (!q.unit || q.unit->empty())
        return makeError(DiagCode::U003_NoUnit, {}, "cannot convert a quantity without a unit");

    UnitPtr from = q.unitInfo ? q.unitInfo : findUnit(*q.unit);
    if (!from)
        return makeError(DiagCode::U002_UnknownUnit, {}, "unknown unit '" + *q.unit + "'");

    UnitPtr to;
    if (target.isBest())
    {
        auto candidates = bestUnits(from->quantity, target.system());
        if (candidates.empty())
        {
            return makeError(DiagCode::U005_BestUnitNotFound,
                             {},
                             std::string("no best ") + systemName(target.system()) + " unit for " +
                                 physicalQuantityName(from->quantity));
        }
        to = pickBest(candidates, *from, q.value.lowest().value_or(0.0));
    }
    else
    {
        to = findUnit(target.unitName());
        if (!to)
            return makeError(DiagCode::U002_UnknownUnit, {}, "unknown unit '" + target.unitName() + "'");
        if (to->quantity != from->quantity)
        {
            return makeError(DiagCode::U001_IncompatibleUnits,
                             {},
                             "cannot convert " + describe(*from) + " to " + describe(*to));
        }
    }
    return convertTo(q, *from, to);
}

Quantity Converter::fit(const Quantity &q) const
{
    if (q.value.isText() || !q.unit || q.unit->empty())
        return q;
    UnitPtr from = q.unitInfo ? q.unitInfo : findUnit(*q.unit);
    if (!from)
        return q;

    std::optional<System> system;
    if (!mixSystems_)
        system = from->system.value_or(defaultSystem_);
    auto candidates = bestUnits(from->quantity, system);
    if (candidates.empty())
        return q;

    UnitPtr to = pickBest(candidates, *from, q.value.lowest().value_or(0.0));
    return convertTo(q, *from, to);
}

} // namespace sous::units
