//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: parse/NumberParsing.hpp
// Purpose: Parsing of the digit literals found inside component quantities.
//
// Integers must fit int64_t; decimals must not carry more significant digits
// than a double holds exactly.  Literals outside those limits are reported as
// overflow or precision loss so the caller can fall back to a fraction.
//
//===----------------------------------------------------------------------===//
#pragma once

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <system_error>

namespace sous::parse::number_parsing
{

/// @brief Significant decimal digits a double represents exactly.
inline constexpr int kMaxExactDigits = 15;

/// @brief Result of parsing a numeric literal.
struct ParsedNumber
{
    bool isFloat = false;       ///< True if the literal has a decimal point
    int64_t intValue = 0;       ///< Integer value (valid when !isFloat)
    double floatValue = 0.0;    ///< Value as a double, always set when valid
    bool overflow = false;      ///< Integer does not fit int64_t
    bool precisionLoss = false; ///< Decimal has more digits than a double keeps
    bool valid = true;          ///< True if the text is a numeric literal
};

/// @brief Count significant digits of @p text, ignoring leading zeros.
[[nodiscard]] inline int countSignificantDigits(std::string_view text)
{
    int count = 0;
    bool leading = true;
    for (char c : text)
    {
        if (c < '0' || c > '9')
            continue;
        if (leading && c == '0')
            continue;
        leading = false;
        ++count;
    }
    return count;
}

/// @brief Parse a decimal literal of the form `digits` or `digits.digits`.
[[nodiscard]] inline ParsedNumber parseDecimalLiteral(std::string_view text)
{
    ParsedNumber result;

    if (text.empty())
    {
        result.valid = false;
        return result;
    }

    result.isFloat = text.find('.') != std::string_view::npos;

    // Parse as double using strtod for portability.
    std::string textStr(text);
    char *endPtr = nullptr;
    result.floatValue = std::strtod(textStr.c_str(), &endPtr);
    if (endPtr != textStr.c_str() + textStr.size())
    {
        result.valid = false;
        return result;
    }

    if (result.isFloat)
    {
        result.precisionLoss = countSignificantDigits(text) > kMaxExactDigits;
        return result;
    }

    auto parseResult = std::from_chars(text.data(), text.data() + text.size(), result.intValue);
    if (parseResult.ec == std::errc::result_out_of_range)
        result.overflow = true;
    else if (parseResult.ec != std::errc{})
        result.valid = false;

    return result;
}

} // namespace sous::parse::number_parsing
