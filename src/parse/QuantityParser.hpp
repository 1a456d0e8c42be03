//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: parse/QuantityParser.hpp
// Purpose: Turns the tokens between component braces into a ParsedQuantity.
// Key invariants: Never fails; anything that is not a number, fraction, mixed
//                 number or range becomes a text value.
// Ownership/Lifetime: Borrows the report it writes warnings to.
// Links: parse/NumberParsing.hpp, units/Value.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "parse/Event.hpp"
#include "parse/Extensions.hpp"
#include "parse/Token.hpp"
#include "support/diagnostics.hpp"

#include <optional>
#include <span>

namespace sous::parse
{

class QuantityParser
{
  public:
    QuantityParser(Extensions extensions, support::SourceReport &report);

    /// @brief Parse the body of `{...}`.
    /// @param tokens Tokens strictly between the braces.
    /// @param span Span of the body.
    ParsedQuantity parseQuantity(std::span<const Token> tokens, support::Span span);

    /// @brief Parse a value: number, fraction, mixed number, range or text.
    units::Value parseValue(std::span<const Token> tokens);

  private:
    /// @brief Outcome of parsing a numeric token pattern.
    enum class NumericStatus
    {
        Ok,         ///< number holds the value
        NotNumeric, ///< tokens do not form a number
        Failed      ///< numeric syntax, but unusable; a warning was raised
    };

    NumericStatus parseNumber(std::span<const Token> tokens, units::Number &number, bool report);

    NumericStatus parseInteger(const Token &tok, uint64_t &out, bool report);

    /// @brief True when @p tokens parse as a value without falling back to text.
    bool isNumeric(std::span<const Token> tokens);

    Extensions extensions_;
    support::SourceReport &report_;
};

/// @brief Drop leading and trailing whitespace and comment tokens.
std::span<const Token> trimTrivia(std::span<const Token> tokens);

/// @brief Source text of @p tokens with escapes resolved and comments removed.
std::string joinTokens(std::span<const Token> tokens);

/// @brief Span covering @p tokens; empty span at @p fallback when empty.
support::Span spanOf(std::span<const Token> tokens, support::Span fallback);

} // namespace sous::parse
