//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: units/Number.hpp
// Purpose: Declares the numeric value used by quantities: integer, decimal or
//          fraction, with arithmetic that stays exact where it can.
// Key invariants: Fractions are stored as whole + num/den with num < den and
//                 den > 0, reduced to lowest terms.
// Ownership/Lifetime: Value type.
// Links: units/Value.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace sous::units
{

/// @brief Mixed-number representation "whole num/den".
struct Fraction
{
    uint64_t whole = 0;
    uint64_t num = 0;
    uint64_t den = 1;
    /// @brief Signed difference between this fraction and the value it
    ///        approximates; 0 for exact fractions.
    double err = 0.0;
};

/// @brief Quantity number.
class Number
{
  public:
    enum class Kind
    {
        Integer,
        Decimal,
        Fraction
    };

    Number() : repr_(int64_t{0}) {}

    static Number integer(int64_t v);
    static Number decimal(double v);

    /// @brief Exact fraction whole + num/den, normalized and reduced.
    /// @return std::nullopt when @p den is zero or the whole part overflows.
    static std::optional<Number> fraction(uint64_t whole, uint64_t num, uint64_t den);

    /// @brief Approximated fraction carrying its error.
    static Number approximated(Fraction f);

    Kind kind() const;

    /// @brief Numeric value as a double.
    double value() const;

    /// @brief Fraction parts; requires kind() == Kind::Fraction.
    const Fraction &asFraction() const;

    /// @brief Integer payload; requires kind() == Kind::Integer.
    int64_t asInteger() const;

    /// @brief Sum keeping integers and fractions exact when possible.
    Number operator+(const Number &other) const;

    /// @brief Multiply by @p factor keeping the representation exact when the
    ///        factor is a non-negative whole number.
    Number scaled(double factor) const;

    /// @brief Human-readable text: "2", "1 1/2", "0.333".
    std::string toString() const;

    /// @brief Compares numeric values regardless of representation.
    bool operator==(const Number &other) const;

  private:
    explicit Number(std::variant<int64_t, double, Fraction> r) : repr_(r) {}

    std::variant<int64_t, double, Fraction> repr_;
};

/// @brief Best fraction approximating @p value.
/// @param value Non-negative value to approximate.
/// @param accuracy Maximum relative error accepted (0..1).
/// @param maxDenominator Largest denominator tried.
/// @param maxWhole Largest whole part accepted.
/// @return The approximation, or std::nullopt when none is accurate enough.
std::optional<Fraction> approximateFraction(double value,
                                            double accuracy,
                                            uint64_t maxDenominator,
                                            uint64_t maxWhole);

/// @brief Closest continued-fraction convergent of @p value whose denominator
///        does not exceed @p maxDenominator; the error is kept in Fraction::err.
/// @return std::nullopt for negative, non-finite or out-of-range values.
std::optional<Fraction> closestFraction(double value, uint64_t maxDenominator);

/// @brief Format @p v with up to three decimals, trailing zeros removed.
std::string formatDecimal(double v);

} // namespace sous::units
