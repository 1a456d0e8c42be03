//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: units/Value.hpp
// Purpose: Declares quantity values: a number, a range of numbers or opaque text.
// Key invariants: A range's start is never greater than its end.
// Ownership/Lifetime: Value type.
// Links: units/Number.hpp, units/Quantity.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "units/Number.hpp"

#include <functional>
#include <optional>
#include <string>
#include <variant>

namespace sous::units
{

/// @brief Inclusive range "start-end".
struct Range
{
    Number start;
    Number end;
};

/// @brief Value of a quantity.
class Value
{
  public:
    enum class Kind
    {
        Number,
        Range,
        Text
    };

    Value() = default;
    Value(Number n) : repr_(n) {}
    Value(Range r);
    Value(std::string text) : repr_(std::move(text)) {}

    Kind kind() const;

    bool isText() const
    {
        return kind() == Kind::Text;
    }

    const Number &asNumber() const;
    const Range &asRange() const;
    const std::string &asText() const;

    /// @brief Multiply numbers by @p factor; text is returned unchanged.
    Value scaled(double factor) const;

    /// @brief Apply @p fn to every number in the value.
    Value map(const std::function<Number(const Number &)> &fn) const;

    /// @brief Sum of two numeric values; std::nullopt when either is text.
    std::optional<Value> add(const Value &other) const;

    /// @brief Smallest number in the value; std::nullopt for text.
    std::optional<double> lowest() const;

    /// @brief "2", "1 1/2", "2-3" or the text itself.
    std::string toString() const;

    bool operator==(const Value &other) const;

  private:
    std::variant<Number, Range, std::string> repr_;
};

} // namespace sous::units
