//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: units/GroupedQuantity.hpp
// Purpose: Declares the running total of repeated component quantities.
// Key invariants: Quantities are only summed when they share a slot; a slot
//                 for known units is keyed by (physical quantity, system).
// Ownership/Lifetime: Value type.
// Links: model/Recipe.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "units/Quantity.hpp"

#include <optional>
#include <vector>

namespace sous::units
{

class Converter;

/// @brief Sum of quantities that refer to the same ingredient or cookware.
/// @details Slots, in output order:
///   - one per (physical quantity, system) of known units, summed after
///     converting to the unit first seen in the slot
///   - one per unknown unit text, summed as written
///   - one for unitless numbers
///   - every text value, kept individually since text cannot be added
class GroupedQuantity
{
  public:
    /// @brief Add @p q, resolving its unit through @p converter.
    void add(const Quantity &q, const Converter &converter);

    /// @brief Merge every slot of @p other into this group.
    void merge(const GroupedQuantity &other, const Converter &converter);

    /// @brief Contents of every slot in output order.
    std::vector<Quantity> total() const;

    [[nodiscard]] bool empty() const;

    /// @brief Re-express each known-unit slot with Converter::fit.
    void fit(const Converter &converter);

  private:
    struct KnownSlot
    {
        PhysicalQuantity quantity;
        std::optional<System> system;
        Quantity total;
    };

    std::vector<KnownSlot> known_;
    std::vector<Quantity> unknown_;
    std::optional<Quantity> noUnit_;
    std::vector<Quantity> other_;
};

} // namespace sous::units
