//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements quantity numbers.  Integers and exact fractions survive addition
// and whole-number scaling unchanged in kind; anything else degrades to a
// decimal.  Fraction approximation serves both the parser's precision fallback
// and the converter's fraction display.
//
//===----------------------------------------------------------------------===//

#include "units/Number.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <numeric>

namespace sous::units
{

namespace
{
/// Denominators above this are not combined exactly by operator+.
constexpr uint64_t kMaxExactDenominator = 1'000'000;

bool isWholeFactor(double factor)
{
    return factor >= 0.0 && factor < 1e15 && std::floor(factor) == factor;
}
} // namespace

Number Number::integer(int64_t v)
{
    return Number(v);
}

Number Number::decimal(double v)
{
    return Number(v);
}

std::optional<Number> Number::fraction(uint64_t whole, uint64_t num, uint64_t den)
{
    if (den == 0)
        return std::nullopt;
    const uint64_t carry = num / den;
    num %= den;
    if (whole > std::numeric_limits<uint64_t>::max() - carry)
        return std::nullopt;
    whole += carry;
    if (num == 0)
        return Number(Fraction{whole, 0, 1, 0.0});
    const uint64_t g = std::gcd(num, den);
    return Number(Fraction{whole, num / g, den / g, 0.0});
}

Number Number::approximated(Fraction f)
{
    return Number(f);
}

Number::Kind Number::kind() const
{
    switch (repr_.index())
    {
        case 0:
            return Kind::Integer;
        case 1:
            return Kind::Decimal;
        default:
            return Kind::Fraction;
    }
}

double Number::value() const
{
    if (const auto *i = std::get_if<int64_t>(&repr_))
        return static_cast<double>(*i);
    if (const auto *d = std::get_if<double>(&repr_))
        return *d;
    const auto &f = std::get<Fraction>(repr_);
    return static_cast<double>(f.whole) + static_cast<double>(f.num) / static_cast<double>(f.den);
}

const Fraction &Number::asFraction() const
{
    return std::get<Fraction>(repr_);
}

int64_t Number::asInteger() const
{
    return std::get<int64_t>(repr_);
}

Number Number::operator+(const Number &other) const
{
    const Kind a = kind();
    const Kind b = other.kind();

    if (a == Kind::Integer && b == Kind::Integer)
    {
        const int64_t x = asInteger();
        const int64_t y = other.asInteger();
        const bool overflow = (y > 0 && x > std::numeric_limits<int64_t>::max() - y) ||
                              (y < 0 && x < std::numeric_limits<int64_t>::min() - y);
        if (!overflow)
            return integer(x + y);
        return decimal(value() + other.value());
    }

    auto exactParts = [](const Number &n) -> std::optional<Fraction>
    {
        if (n.kind() == Kind::Integer && n.asInteger() >= 0)
            return Fraction{static_cast<uint64_t>(n.asInteger()), 0, 1, 0.0};
        if (n.kind() == Kind::Fraction && n.asFraction().err == 0.0)
            return n.asFraction();
        return std::nullopt;
    };

    auto lhs = exactParts(*this);
    auto rhs = exactParts(other);
    if (lhs && rhs && lhs->den <= kMaxExactDenominator && rhs->den <= kMaxExactDenominator)
    {
        const uint64_t den = std::lcm(lhs->den, rhs->den);
        const uint64_t num = lhs->num * (den / lhs->den) + rhs->num * (den / rhs->den);
        if (lhs->whole <= std::numeric_limits<uint64_t>::max() - rhs->whole)
        {
            if (auto sum = fraction(lhs->whole + rhs->whole, num, den))
                return *sum;
        }
    }
    return decimal(value() + other.value());
}

Number Number::scaled(double factor) const
{
    if (isWholeFactor(factor))
    {
        const auto k = static_cast<uint64_t>(factor);
        if (kind() == Kind::Integer)
        {
            const int64_t v = asInteger();
            const uint64_t mag = v < 0 ? static_cast<uint64_t>(-(v + 1)) + 1 : static_cast<uint64_t>(v);
            if (k == 0 || mag <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) / k)
                return integer(v * static_cast<int64_t>(k));
        }
        else if (kind() == Kind::Fraction && asFraction().err == 0.0)
        {
            const Fraction &f = asFraction();
            const uint64_t limit = std::numeric_limits<uint64_t>::max();
            if (k == 0)
                return integer(0);
            if (f.whole <= limit / k && f.num <= limit / k)
            {
                if (auto out = fraction(f.whole * k, f.num * k, f.den))
                    return *out;
            }
        }
    }
    return decimal(value() * factor);
}

std::string Number::toString() const
{
    switch (kind())
    {
        case Kind::Integer:
            return std::to_string(asInteger());
        case Kind::Decimal:
            return formatDecimal(std::get<double>(repr_));
        case Kind::Fraction:
        {
            const Fraction &f = asFraction();
            if (f.num == 0)
                return std::to_string(f.whole);
            std::string frac = std::to_string(f.num) + "/" + std::to_string(f.den);
            if (f.whole == 0)
                return frac;
            return std::to_string(f.whole) + " " + frac;
        }
    }
    return {};
}

bool Number::operator==(const Number &other) const
{
    const double a = value();
    const double b = other.value();
    const double scale = std::max({1.0, std::fabs(a), std::fabs(b)});
    return std::fabs(a - b) <= 1e-9 * scale;
}

std::optional<Fraction> approximateFraction(double value,
                                            double accuracy,
                                            uint64_t maxDenominator,
                                            uint64_t maxWhole)
{
    if (!std::isfinite(value) || value < 0.0 || maxDenominator == 0)
        return std::nullopt;
    if (value == 0.0)
        return Fraction{0, 0, 1, 0.0};
    if (value > static_cast<double>(maxWhole) + 1.0)
        return std::nullopt;

    const double wholePart = std::floor(value);
    if (wholePart > static_cast<double>(std::numeric_limits<uint64_t>::max()))
        return std::nullopt;
    const auto whole = static_cast<uint64_t>(wholePart);
    const double frac = value - wholePart;

    auto accept = [&](uint64_t w, uint64_t num, uint64_t den) -> std::optional<Fraction>
    {
        if (num == den)
        {
            ++w;
            num = 0;
        }
        if (w > maxWhole)
            return std::nullopt;
        const double approx =
            static_cast<double>(w) + static_cast<double>(num) / static_cast<double>(den);
        const double err = approx - value;
        if (std::fabs(err) > accuracy * value)
            return std::nullopt;
        if (num == 0)
            return Fraction{w, 0, 1, err};
        const uint64_t g = std::gcd(num, den);
        return Fraction{w, num / g, den / g, err};
    };

    if (maxDenominator <= 64)
    {
        // Small denominators: the first one that is accurate enough wins, so
        // 0.49 reads as 1/2 rather than 24/49.
        for (uint64_t den = 1; den <= maxDenominator; ++den)
        {
            const auto num = static_cast<uint64_t>(std::llround(frac * static_cast<double>(den)));
            if (auto f = accept(whole, num, den))
                return f;
        }
        return std::nullopt;
    }

    // Large denominators: walk the continued-fraction convergents of frac.
    uint64_t hPrev = 1, h = 0; // numerators
    uint64_t kPrev = 0, k = 1; // denominators
    double x = frac;
    for (int iter = 0; iter < 64; ++iter)
    {
        if (auto f = accept(whole, h, k))
            return f;
        if (x == 0.0)
            break;
        const double inv = 1.0 / x;
        const double aFloor = std::floor(inv);
        if (aFloor > 1e12)
            break;
        const auto a = static_cast<uint64_t>(aFloor);
        const uint64_t hNext = a * h + hPrev;
        const uint64_t kNext = a * k + kPrev;
        if (kNext > maxDenominator)
            break;
        hPrev = h;
        h = hNext;
        kPrev = k;
        k = kNext;
        x = inv - aFloor;
    }
    return std::nullopt;
}

std::optional<Fraction> closestFraction(double value, uint64_t maxDenominator)
{
    if (!std::isfinite(value) || value < 0.0 || maxDenominator == 0)
        return std::nullopt;
    const double wholePart = std::floor(value);
    // 2^64; every double below it fits in uint64_t.
    if (wholePart >= 18446744073709551616.0)
        return std::nullopt;
    uint64_t whole = static_cast<uint64_t>(wholePart);

    uint64_t hPrev = 1, h = 0;
    uint64_t kPrev = 0, k = 1;
    double x = value - wholePart;
    for (int iter = 0; iter < 64 && x != 0.0; ++iter)
    {
        const double inv = 1.0 / x;
        const double aFloor = std::floor(inv);
        if (aFloor > 1e12)
            break;
        const auto a = static_cast<uint64_t>(aFloor);
        const uint64_t kNext = a * k + kPrev;
        if (kNext > maxDenominator)
            break;
        const uint64_t hNext = a * h + hPrev;
        hPrev = h;
        h = hNext;
        kPrev = k;
        k = kNext;
        x = inv - aFloor;
    }

    if (h == k)
    {
        if (whole == std::numeric_limits<uint64_t>::max())
            return std::nullopt;
        ++whole;
        h = 0;
    }
    if (h == 0)
        k = 1;
    const double approx = static_cast<double>(whole) + static_cast<double>(h) / static_cast<double>(k);
    return Fraction{whole, h, k, approx - value};
}

std::string formatDecimal(double v)
{
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.3f", v);
    std::string s(buf);
    if (s.find('.') != std::string::npos)
    {
        while (!s.empty() && s.back() == '0')
            s.pop_back();
        if (!s.empty() && s.back() == '.')
            s.pop_back();
    }
    if (s == "-0")
        s = "0";
    return s;
}

} // namespace sous::units
