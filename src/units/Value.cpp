//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "units/Value.hpp"

namespace sous::units
{

Value::Value(Range r)
{
    if (r.end.value() < r.start.value())
        std::swap(r.start, r.end);
    repr_ = std::move(r);
}

Value::Kind Value::kind() const
{
    switch (repr_.index())
    {
        case 0:
            return Kind::Number;
        case 1:
            return Kind::Range;
        default:
            return Kind::Text;
    }
}

const Number &Value::asNumber() const
{
    return std::get<Number>(repr_);
}

const Range &Value::asRange() const
{
    return std::get<Range>(repr_);
}

const std::string &Value::asText() const
{
    return std::get<std::string>(repr_);
}

Value Value::map(const std::function<Number(const Number &)> &fn) const
{
    switch (kind())
    {
        case Kind::Number:
            return Value(fn(asNumber()));
        case Kind::Range:
            return Value(Range{fn(asRange().start), fn(asRange().end)});
        case Kind::Text:
            break;
    }
    return *this;
}

Value Value::scaled(double factor) const
{
    return map([factor](const Number &n) { return n.scaled(factor); });
}

std::optional<Value> Value::add(const Value &other) const
{
    if (isText() || other.isText())
        return std::nullopt;

    auto bounds = [](const Value &v) -> Range
    {
        if (v.kind() == Kind::Number)
            return Range{v.asNumber(), v.asNumber()};
        return v.asRange();
    };

    if (kind() == Kind::Number && other.kind() == Kind::Number)
        return Value(asNumber() + other.asNumber());

    const Range a = bounds(*this);
    const Range b = bounds(other);
    return Value(Range{a.start + b.start, a.end + b.end});
}

std::optional<double> Value::lowest() const
{
    switch (kind())
    {
        case Kind::Number:
            return asNumber().value();
        case Kind::Range:
            return asRange().start.value();
        case Kind::Text:
            break;
    }
    return std::nullopt;
}

std::string Value::toString() const
{
    switch (kind())
    {
        case Kind::Number:
            return asNumber().toString();
        case Kind::Range:
            return asRange().start.toString() + "-" + asRange().end.toString();
        case Kind::Text:
            return asText();
    }
    return {};
}

bool Value::operator==(const Value &other) const
{
    if (kind() != other.kind())
        return false;
    switch (kind())
    {
        case Kind::Number:
            return asNumber() == other.asNumber();
        case Kind::Range:
            return asRange().start == other.asRange().start &&
                   asRange().end == other.asRange().end;
        case Kind::Text:
            return asText() == other.asText();
    }
    return false;
}

} // namespace sous::units
