//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: units/Converter.hpp
// Purpose: Declares the unit table with conversion and best-unit fitting,
//          and the builder that merges unit definition layers into it.
// Key invariants: A built Converter is never mutated; it can be shared across
//                 threads and parses.  Every unit text maps to one unit.
// Ownership/Lifetime: Converter owns its units through shared_ptr<const Unit>;
//                     quantities resolved against it keep their units alive.
// Links: units/UnitsFile.hpp, units/BundledUnits.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "units/Quantity.hpp"
#include "units/UnitsFile.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sous::units
{

/// @brief Destination of Converter::convert.
class ConvertTarget
{
  public:
    /// @brief Convert to the unit named @p name.
    static ConvertTarget unit(std::string name);

    /// @brief Convert to the best unit of @p system for the magnitude.
    static ConvertTarget best(System system);

    bool isBest() const
    {
        return best_;
    }

    const std::string &unitName() const
    {
        return unitName_;
    }

    System system() const
    {
        return system_;
    }

  private:
    bool best_ = false;
    std::string unitName_;
    System system_ = System::Metric;
};

/// @brief Immutable unit table.
class Converter
{
  public:
    using UnitPtr = std::shared_ptr<const Unit>;

    /// @brief Converter with no units; every unit is unknown.
    Converter() = default;

    /// @brief Build a converter from bundledUnits().
    /// @return The converter, or the diagnostic explaining why the table was
    ///         rejected.
    static support::Expected<Converter> buildBundled();

    /// @brief Shared converter built from bundledUnits().
    /// @note The bundled table must build; a rejected table asserts in debug
    ///       builds and is reported on stderr before falling back to an empty
    ///       converter.
    static const Converter &bundled();

    [[nodiscard]] bool empty() const
    {
        return units_.empty();
    }

    size_t unitCount() const
    {
        return units_.size();
    }

    const std::vector<UnitPtr> &units() const
    {
        return units_;
    }

    System defaultSystem() const
    {
        return defaultSystem_;
    }

    bool mixSystems() const
    {
        return mixSystems_;
    }

    /// @brief Look up a unit by name, symbol or alias.
    /// @details Exact matches win; otherwise the lowercase text is tried.
    UnitPtr findUnit(std::string_view text) const;

    /// @brief Copy of @p q with its unit text resolved, if known.
    Quantity resolve(Quantity q) const;

    /// @brief Convert @p q to @p target.
    /// @return The converted quantity, or a U-coded error diagnostic when the
    ///         request is impossible (text value, no unit, unknown unit,
    ///         incompatible units, no best unit).
    support::Expected<Quantity> convert(const Quantity &q, const ConvertTarget &target) const;

    /// @brief Re-express @p q in the best unit for its magnitude.
    /// @details Candidates are the best units of the quantity's system (the
    ///          default system for units without one), or of every system when
    ///          mixSystems() is set.  Quantities that cannot be fitted are
    ///          returned unchanged.
    Quantity fit(const Quantity &q) const;

    /// @brief Fraction display settings for @p unit.
    FractionsConfig fractionsFor(const Unit &unit) const;

    /// @brief Best units for @p quantity, restricted to @p system when given.
    std::vector<UnitPtr> bestUnits(PhysicalQuantity quantity, std::optional<System> system) const;

  private:
    friend class ConverterBuilder;

    struct Best
    {
        std::vector<size_t> unified;
        std::vector<size_t> metric;
        std::vector<size_t> imperial;
    };

    Quantity convertTo(const Quantity &q, const Unit &from, const UnitPtr &to) const;
    Number present(double v, const Unit &unit) const;
    UnitPtr pickBest(const std::vector<UnitPtr> &candidates, const Unit &from, double v) const;

    std::vector<UnitPtr> units_;
    std::unordered_map<const Unit *, FractionsConfig> fractions_;
    std::unordered_map<std::string, size_t> index_;
    std::unordered_map<std::string, size_t> lowerIndex_;
    std::map<PhysicalQuantity, Best> best_;
    System defaultSystem_ = System::Metric;
    bool mixSystems_ = false;
};

/// @brief Merges unit definition layers into a Converter.
/// @details Layers are applied in the order they are added: later default
///          systems, SI prefixes, fraction layers and best units override
///          earlier ones; extensions apply after every layer's units exist.
class ConverterBuilder
{
  public:
    ConverterBuilder &addUnitsFile(UnitsFile file);

    /// @brief Allow fit() to choose units from any system.
    ConverterBuilder &mixSystems(bool enabled);

    /// @brief Validate and build.
    /// @return The converter, or a U006/U007 diagnostic describing the first
    ///         duplicate unit text or invalid reference found.
    support::Expected<Converter> finish() const;

  private:
    std::vector<UnitsFile> files_;
    bool mixSystems_ = false;
};

} // namespace sous::units
