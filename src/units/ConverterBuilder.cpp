//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements ConverterBuilder.  Building runs in phases over every added layer:
//   1. merge settings (default system, SI prefixes, fraction layers, best)
//   2. declare units, expanding SI prefixes where requested
//   3. apply extensions to the declared units
//   4. index every unit text, rejecting duplicates
//   5. resolve best units and per-unit fraction settings
//
//===----------------------------------------------------------------------===//

#include "units/Converter.hpp"

#include "support/debug_log.hpp"

#include <algorithm>
#include <cctype>

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

/// @brief Combine @p incoming with @p existing according to @p precedence.
std::vector<std::string> combine(const std::vector<std::string> &existing,
                                 const std::vector<std::string> &incoming,
                                 Precedence precedence)
{
    std::vector<std::string> out;
    switch (precedence)
    {
        case Precedence::Override:
            return incoming;
        case Precedence::Before:
            out = incoming;
            for (const auto &e : existing)
            {
                if (std::find(out.begin(), out.end(), e) == out.end())
                    out.push_back(e);
            }
            return out;
        case Precedence::After:
            out = existing;
            for (const auto &e : incoming)
            {
                if (std::find(out.begin(), out.end(), e) == out.end())
                    out.push_back(e);
            }
            return out;
    }
    return out;
}

SiPrefixTable combineTables(const std::optional<SiPrefixTable> &existing,
                            const SiPrefixTable &incoming,
                            Precedence precedence)
{
    if (!existing)
        return incoming;
    SiPrefixTable out;
    for (size_t i = 0; i < kSiPrefixCount; ++i)
        out[i] = combine((*existing)[i], incoming[i], precedence);
    return out;
}

std::vector<std::string> prefixed(const std::vector<std::string> &prefixes,
                                  const std::vector<std::string> &bases)
{
    std::vector<std::string> out;
    for (const auto &p : prefixes)
    {
        for (const auto &b : bases)
            out.push_back(p + b);
    }
    return out;
}

} // namespace

double siPrefixRatio(SiPrefix prefix)
{
    switch (prefix)
    {
        case SiPrefix::Kilo:
            return 1e3;
        case SiPrefix::Hecto:
            return 1e2;
        case SiPrefix::Deca:
            return 1e1;
        case SiPrefix::Deci:
            return 1e-1;
        case SiPrefix::Centi:
            return 1e-2;
        case SiPrefix::Milli:
            return 1e-3;
    }
    return 1.0;
}

FractionsOverride FractionsOverride::toggle(bool on)
{
    FractionsOverride o;
    o.enabled = on;
    return o;
}

FractionsOverride FractionsOverride::merge(const FractionsOverride &fallback) const
{
    FractionsOverride out;
    out.enabled = enabled ? enabled : fallback.enabled;
    out.accuracy = accuracy ? accuracy : fallback.accuracy;
    out.maxDenominator = maxDenominator ? maxDenominator : fallback.maxDenominator;
    out.maxWhole = maxWhole ? maxWhole : fallback.maxWhole;
    return out;
}

FractionsConfig FractionsOverride::define() const
{
    const FractionsConfig d;
    FractionsConfig out;
    out.enabled = enabled.value_or(d.enabled);
    out.accuracy = std::clamp(accuracy.value_or(d.accuracy), 0.0, 1.0);
    out.maxDenominator = std::clamp<uint32_t>(maxDenominator.value_or(d.maxDenominator), 1, 16);
    out.maxWhole = maxWhole.value_or(d.maxWhole);
    return out;
}

ConverterBuilder &ConverterBuilder::addUnitsFile(UnitsFile file)
{
    files_.push_back(std::move(file));
    return *this;
}

ConverterBuilder &ConverterBuilder::mixSystems(bool enabled)
{
    mixSystems_ = enabled;
    return *this;
}

support::Expected<Converter> ConverterBuilder::finish() const
{
    Converter conv;
    conv.mixSystems_ = mixSystems_;

    // Phase 1: settings.
    std::optional<SiPrefixTable> namePrefixes;
    std::optional<SiPrefixTable> symbolPrefixes;
    FractionsLayers fractions;
    std::map<PhysicalQuantity, BestUnits> best;
    for (const auto &file : files_)
    {
        if (file.defaultSystem)
            conv.defaultSystem_ = *file.defaultSystem;
        if (file.si)
        {
            if (file.si->prefixes)
                namePrefixes = combineTables(namePrefixes, *file.si->prefixes, file.si->precedence);
            if (file.si->symbolPrefixes)
                symbolPrefixes =
                    combineTables(symbolPrefixes, *file.si->symbolPrefixes, file.si->precedence);
        }
        if (file.fractions)
        {
            auto layer = [](std::optional<FractionsOverride> &slot,
                            const std::optional<FractionsOverride> &incoming)
            {
                if (incoming)
                    slot = slot ? incoming->merge(*slot) : *incoming;
            };
            layer(fractions.all, file.fractions->all);
            layer(fractions.metric, file.fractions->metric);
            layer(fractions.imperial, file.fractions->imperial);
            for (const auto &[q, o] : file.fractions->quantity)
            {
                auto it = fractions.quantity.find(q);
                fractions.quantity[q] = it == fractions.quantity.end() ? o : o.merge(it->second);
            }
            for (const auto &[u, o] : file.fractions->unit)
            {
                auto it = fractions.unit.find(u);
                fractions.unit[u] = it == fractions.unit.end() ? o : o.merge(it->second);
            }
        }
        for (const auto &group : file.quantities)
        {
            if (group.best)
                best[group.quantity] = *group.best;
        }
    }

    // Phase 2: declarations.
    std::vector<Unit> units;
    auto declare = [&](const UnitEntry &entry, PhysicalQuantity q, std::optional<System> sys)
    {
        Unit u;
        u.names = entry.names;
        u.symbols = entry.symbols;
        u.aliases = entry.aliases;
        u.ratio = entry.ratio;
        u.difference = entry.difference;
        u.quantity = q;
        u.system = sys;
        units.push_back(u);
        if (!entry.expandSi)
            return;
        for (size_t i = 0; i < kSiPrefixCount; ++i)
        {
            Unit p;
            if (namePrefixes)
                p.names = prefixed((*namePrefixes)[i], entry.names);
            if (symbolPrefixes)
                p.symbols = prefixed((*symbolPrefixes)[i], entry.symbols);
            if (p.names.empty() && p.symbols.empty())
                continue;
            p.ratio = entry.ratio * siPrefixRatio(static_cast<SiPrefix>(i));
            p.difference = entry.difference;
            p.quantity = q;
            p.system = sys;
            units.push_back(std::move(p));
        }
    };
    for (const auto &file : files_)
    {
        for (const auto &group : file.quantities)
        {
            for (const auto &e : group.metric)
                declare(e, group.quantity, System::Metric);
            for (const auto &e : group.imperial)
                declare(e, group.quantity, System::Imperial);
            for (const auto &e : group.unspecified)
                declare(e, group.quantity, std::nullopt);
        }
    }

    for (const auto &u : units)
    {
        if (u.names.empty() && u.symbols.empty())
        {
            return makeError(DiagCode::U007_InvalidUnitsFile,
                             {},
                             "a unit needs at least one name or symbol");
        }
        if (!(u.ratio > 0.0))
        {
            return makeError(DiagCode::U007_InvalidUnitsFile,
                             {},
                             "unit '" + u.symbol() + "' has a non-positive ratio");
        }
    }

    auto findDeclared = [&units](const std::string &key) -> Unit *
    {
        for (auto &u : units)
        {
            for (const auto &k : u.allKeys())
            {
                if (k == key)
                    return &u;
            }
        }
        return nullptr;
    };

    // Phase 3: extensions.  Ratio edits never touch the system assignment.
    for (const auto &file : files_)
    {
        if (!file.extend)
            continue;
        const Precedence precedence = file.extend->precedence;
        for (const auto &[key, ext] : file.extend->units)
        {
            Unit *target = findDeclared(key);
            if (!target)
            {
                return makeError(DiagCode::U007_InvalidUnitsFile,
                                 {},
                                 "cannot extend unknown unit '" + key + "'");
            }
            if (ext.ratio)
                target->ratio = *ext.ratio;
            if (ext.difference)
                target->difference = *ext.difference;
            if (ext.names)
                target->names = combine(target->names, *ext.names, precedence);
            if (ext.symbols)
                target->symbols = combine(target->symbols, *ext.symbols, precedence);
            if (ext.aliases)
                target->aliases = combine(target->aliases, *ext.aliases, precedence);
            if (target->names.empty() && target->symbols.empty())
            {
                return makeError(DiagCode::U007_InvalidUnitsFile,
                                 {},
                                 "extending '" + key + "' left it without a name or symbol");
            }
        }
    }

    // Phase 4: index.
    for (auto &u : units)
        conv.units_.push_back(std::make_shared<const Unit>(std::move(u)));
    for (size_t i = 0; i < conv.units_.size(); ++i)
    {
        for (const auto &key : conv.units_[i]->allKeys())
        {
            auto [it, inserted] = conv.index_.emplace(key, i);
            if (!inserted && it->second != i)
                return makeError(DiagCode::U006_DuplicateUnit, {}, "duplicate unit '" + key + "'");
        }
    }
    for (size_t i = 0; i < conv.units_.size(); ++i)
    {
        for (const auto &key : conv.units_[i]->allKeys())
        {
            std::string lower = toLower(key);
            if (!conv.index_.count(lower))
                conv.lowerIndex_.emplace(std::move(lower), i);
        }
    }

    // Phase 5: best units and fractions.
    auto resolveList = [&conv](const std::vector<std::string> &names,
                               PhysicalQuantity q,
                               std::vector<size_t> &out) -> support::Expected<void>
    {
        for (const auto &name : names)
        {
            auto it = conv.index_.find(name);
            if (it == conv.index_.end())
            {
                return makeError(DiagCode::U007_InvalidUnitsFile,
                                 {},
                                 "best unit '" + name + "' is not defined");
            }
            if (conv.units_[it->second]->quantity != q)
            {
                return makeError(DiagCode::U007_InvalidUnitsFile,
                                 {},
                                 "best unit '" + name + "' does not measure " +
                                     physicalQuantityName(q));
            }
            out.push_back(it->second);
        }
        return {};
    };
    for (const auto &[q, b] : best)
    {
        Converter::Best resolved;
        if (auto r = resolveList(b.unified, q, resolved.unified); !r)
            return r.error();
        if (auto r = resolveList(b.metric, q, resolved.metric); !r)
            return r.error();
        if (auto r = resolveList(b.imperial, q, resolved.imperial); !r)
            return r.error();
        conv.best_[q] = std::move(resolved);
    }

    for (const auto &u : conv.units_)
    {
        FractionsOverride cfg;
        for (const auto &key : u->allKeys())
        {
            if (auto it = fractions.unit.find(key); it != fractions.unit.end())
            {
                cfg = it->second;
                break;
            }
        }
        if (auto it = fractions.quantity.find(u->quantity); it != fractions.quantity.end())
            cfg = cfg.merge(it->second);
        if (u->system == System::Metric && fractions.metric)
            cfg = cfg.merge(*fractions.metric);
        if (u->system == System::Imperial && fractions.imperial)
            cfg = cfg.merge(*fractions.imperial);
        if (fractions.all)
            cfg = cfg.merge(*fractions.all);
        conv.fractions_[u.get()] = cfg.define();
    }

    support::debugLog("units",
                      "built converter with " + std::to_string(conv.units_.size()) + " units");
    return conv;
}

} // namespace sous::units
