//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "units/GroupedQuantity.hpp"

#include "units/Converter.hpp"

namespace sous::units
{

void GroupedQuantity::add(const Quantity &q, const Converter &converter)
{
    if (q.value.isText())
    {
        other_.push_back(q);
        return;
    }

    if (!q.unit || q.unit->empty())
    {
        if (!noUnit_)
        {
            noUnit_ = Quantity(q.value);
            return;
        }
        if (auto sum = noUnit_->value.add(q.value))
            noUnit_->value = *sum;
        else
            other_.push_back(q);
        return;
    }

    const Quantity resolved = q.unitInfo ? q : converter.resolve(q);
    if (!resolved.unitInfo)
    {
        for (auto &slot : unknown_)
        {
            if (*slot.unit == *resolved.unit)
            {
                if (auto sum = slot.value.add(resolved.value))
                {
                    slot.value = *sum;
                    return;
                }
            }
        }
        unknown_.push_back(resolved);
        return;
    }

    const Unit &unit = *resolved.unitInfo;
    for (auto &slot : known_)
    {
        if (slot.quantity != unit.quantity || slot.system != unit.system)
            continue;
        if (slot.total.unitInfo == resolved.unitInfo)
        {
            if (auto sum = slot.total.value.add(resolved.value))
            {
                slot.total.value = *sum;
                return;
            }
            break;
        }
        auto converted =
            converter.convert(resolved, ConvertTarget::unit(*slot.total.unit));
        if (!converted)
            break;
        if (auto sum = slot.total.value.add(converted.value().value))
        {
            slot.total.value = *sum;
            return;
        }
        break;
    }
    known_.push_back(KnownSlot{unit.quantity, unit.system, resolved});
}

void GroupedQuantity::merge(const GroupedQuantity &other, const Converter &converter)
{
    for (const auto &q : other.total())
        add(q, converter);
}

std::vector<Quantity> GroupedQuantity::total() const
{
    std::vector<Quantity> out;
    for (const auto &slot : known_)
        out.push_back(slot.total);
    out.insert(out.end(), unknown_.begin(), unknown_.end());
    if (noUnit_)
        out.push_back(*noUnit_);
    out.insert(out.end(), other_.begin(), other_.end());
    return out;
}

bool GroupedQuantity::empty() const
{
    return known_.empty() && unknown_.empty() && !noUnit_ && other_.empty();
}

void GroupedQuantity::fit(const Converter &converter)
{
    for (auto &slot : known_)
        slot.total = converter.fit(slot.total);
}

} // namespace sous::units
