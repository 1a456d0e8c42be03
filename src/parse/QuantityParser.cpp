//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements quantity parsing.  Recognized number shapes, ignoring blanks
// except where noted:
//
//   12          integer
//   1.5         decimal
//   3/4         fraction
//   1 3/4       mixed number (blank required between whole and fraction)
//   2-3         range of any two of the above
//
// Literals too precise or too large for exact storage fall back to a fraction
// approximation; when that fails the value is kept as text with a warning.
//
//===----------------------------------------------------------------------===//

#include "parse/QuantityParser.hpp"

#include "parse/NumberParsing.hpp"

#include <charconv>
#include <vector>

namespace sous::parse
{

using support::DiagCode;

namespace
{
constexpr uint64_t kFallbackMaxDenominator = 1'000'000;

std::vector<Token> significant(std::span<const Token> tokens)
{
    std::vector<Token> out;
    for (const auto &t : tokens)
    {
        if (!t.isTrivia())
            out.push_back(t);
    }
    return out;
}
} // namespace

std::span<const Token> trimTrivia(std::span<const Token> tokens)
{
    size_t b = 0;
    size_t e = tokens.size();
    while (b < e && tokens[b].isTrivia())
        ++b;
    while (e > b && tokens[e - 1].isTrivia())
        --e;
    return tokens.subspan(b, e - b);
}

std::string joinTokens(std::span<const Token> tokens)
{
    std::string out;
    for (const auto &t : tokens)
    {
        switch (t.kind)
        {
            case TokenKind::LineComment:
            case TokenKind::BlockComment:
                break;
            case TokenKind::Escaped:
                out.append(t.text.substr(1));
                break;
            case TokenKind::Newline:
                out.push_back(' ');
                break;
            default:
                out.append(t.text);
                break;
        }
    }
    return out;
}

support::Span spanOf(std::span<const Token> tokens, support::Span fallback)
{
    if (tokens.empty())
        return support::Span{fallback.file_id, fallback.begin, fallback.begin};
    return support::Span::merge(tokens.front().span, tokens.back().span);
}

QuantityParser::QuantityParser(Extensions extensions, support::SourceReport &report)
    : extensions_(extensions), report_(report)
{
}

QuantityParser::NumericStatus QuantityParser::parseInteger(const Token &tok,
                                                           uint64_t &out,
                                                           bool report)
{
    auto r = std::from_chars(tok.text.data(), tok.text.data() + tok.text.size(), out);
    if (r.ec == std::errc{})
        return NumericStatus::Ok;
    if (report)
    {
        report_.warning(DiagCode::P011_InvalidNumber,
                        tok.span,
                        "number '" + std::string(tok.text) + "' is too large");
    }
    return NumericStatus::Failed;
}

QuantityParser::NumericStatus QuantityParser::parseNumber(std::span<const Token> tokens,
                                                          units::Number &number,
                                                          bool report)
{
    using number_parsing::parseDecimalLiteral;
    const std::vector<Token> sig = significant(tokens);

    if (sig.size() == 1 && sig[0].isOneOf(TokenKind::Int, TokenKind::Float))
    {
        const Token &tok = sig[0];
        const auto parsed = parseDecimalLiteral(tok.text);
        if (!parsed.valid)
            return NumericStatus::NotNumeric;

        if (!parsed.isFloat && !parsed.overflow)
        {
            number = units::Number::integer(parsed.intValue);
            return NumericStatus::Ok;
        }
        if (parsed.isFloat && !parsed.precisionLoss)
        {
            number = units::Number::decimal(parsed.floatValue);
            return NumericStatus::Ok;
        }
        if (!parsed.isFloat)
        {
            uint64_t wide = 0;
            auto r = std::from_chars(tok.text.data(), tok.text.data() + tok.text.size(), wide);
            if (r.ec == std::errc{})
            {
                if (auto f = units::Number::fraction(wide, 0, 1))
                {
                    number = *f;
                    return NumericStatus::Ok;
                }
            }
        }
        if (auto f = units::closestFraction(parsed.floatValue, kFallbackMaxDenominator))
        {
            number = units::Number::approximated(*f);
            return NumericStatus::Ok;
        }
        if (report)
        {
            report_
                .warning(DiagCode::P011_InvalidNumber,
                         tok.span,
                         "number '" + std::string(tok.text) + "' cannot be represented")
                .withHelp("the value is kept as text");
        }
        return NumericStatus::Failed;
    }

    const bool isFraction = sig.size() == 3 && sig[0].is(TokenKind::Int) &&
                            sig[1].is(TokenKind::Slash) && sig[2].is(TokenKind::Int);
    const bool isMixed = sig.size() == 4 && sig[0].is(TokenKind::Int) &&
                         sig[1].is(TokenKind::Int) && sig[2].is(TokenKind::Slash) &&
                         sig[3].is(TokenKind::Int);
    if (!isFraction && !isMixed)
        return NumericStatus::NotNumeric;

    const size_t first = isMixed ? 1 : 0;
    uint64_t whole = 0;
    uint64_t num = 0;
    uint64_t den = 0;
    if (isMixed && parseInteger(sig[0], whole, report) != NumericStatus::Ok)
        return NumericStatus::Failed;
    if (parseInteger(sig[first], num, report) != NumericStatus::Ok)
        return NumericStatus::Failed;
    if (parseInteger(sig[first + 2], den, report) != NumericStatus::Ok)
        return NumericStatus::Failed;

    if (den == 0)
    {
        if (report)
        {
            report_
                .warning(DiagCode::P012_DivisionByZero,
                         support::Span::merge(sig[first].span, sig[first + 2].span),
                         "division by zero")
                .withHelp("the value is kept as text");
        }
        return NumericStatus::Failed;
    }

    auto f = units::Number::fraction(whole, num, den);
    if (!f)
    {
        if (report)
        {
            report_.warning(DiagCode::P011_InvalidNumber,
                            spanOf(tokens, sig[0].span),
                            "fraction is too large");
        }
        return NumericStatus::Failed;
    }
    number = *f;
    return NumericStatus::Ok;
}

bool QuantityParser::isNumeric(std::span<const Token> tokens)
{
    units::Number n;
    const auto t = trimTrivia(tokens);
    if (t.empty())
        return false;
    if (parseNumber(t, n, false) == NumericStatus::Ok)
        return true;
    if (!hasExtension(extensions_, Extensions::RangeValues))
        return false;
    for (size_t k = 0; k < t.size(); ++k)
    {
        if (!t[k].is(TokenKind::Minus))
            continue;
        units::Number a;
        units::Number b;
        return parseNumber(trimTrivia(t.first(k)), a, false) == NumericStatus::Ok &&
               parseNumber(trimTrivia(t.subspan(k + 1)), b, false) == NumericStatus::Ok;
    }
    return false;
}

units::Value QuantityParser::parseValue(std::span<const Token> tokens)
{
    const auto t = trimTrivia(tokens);
    if (t.empty())
        return units::Value(std::string());

    if (hasExtension(extensions_, Extensions::RangeValues))
    {
        for (size_t k = 0; k < t.size(); ++k)
        {
            if (!t[k].is(TokenKind::Minus))
                continue;
            const auto left = trimTrivia(t.first(k));
            const auto right = trimTrivia(t.subspan(k + 1));
            if (left.empty() || right.empty())
                break;
            units::Number a;
            units::Number b;
            const auto sa = parseNumber(left, a, true);
            const auto sb = parseNumber(right, b, true);
            if (sa == NumericStatus::Ok && sb == NumericStatus::Ok)
            {
                if (b.value() < a.value())
                {
                    report_
                        .warning(DiagCode::P013_InvertedRange,
                                 spanOf(t, t.front().span),
                                 "range '" + joinTokens(t) + "' starts above its end")
                        .withHelp("the bounds were swapped");
                }
                return units::Value(units::Range{a, b});
            }
            return units::Value(joinTokens(t));
        }
    }

    units::Number n;
    if (parseNumber(t, n, true) == NumericStatus::Ok)
        return units::Value(n);
    return units::Value(joinTokens(t));
}

ParsedQuantity QuantityParser::parseQuantity(std::span<const Token> tokens, support::Span span)
{
    ParsedQuantity pq;
    pq.span = span;

    auto t = trimTrivia(tokens);
    if (!t.empty() && t.front().is(TokenKind::Eq))
    {
        pq.fixed = true;
        t = trimTrivia(t.subspan(1));
    }

    std::span<const Token> valueTokens = t;
    for (size_t k = 0; k < t.size(); ++k)
    {
        if (!t[k].is(TokenKind::Percent))
            continue;
        valueTokens = trimTrivia(t.first(k));
        const auto unitTokens = trimTrivia(t.subspan(k + 1));
        pq.unit = joinTokens(unitTokens);
        pq.unitSpan = spanOf(unitTokens, support::Span{t[k].span.file_id, t[k].span.end, t[k].span.end});
        break;
    }

    if (!pq.unit && hasExtension(extensions_, Extensions::AdvancedUnits))
    {
        for (size_t k = 1; k < t.size(); ++k)
        {
            if (!t[k].is(TokenKind::Word))
                continue;
            if (isNumeric(t.first(k)))
            {
                valueTokens = trimTrivia(t.first(k));
                const auto unitTokens = t.subspan(k);
                pq.unit = joinTokens(unitTokens);
                pq.unitSpan = spanOf(unitTokens, t[k].span);
            }
            break;
        }
    }

    if (valueTokens.empty())
    {
        if (pq.unit)
        {
            report_.warning(DiagCode::P011_InvalidNumber, span, "quantity has a unit but no value");
        }
        pq.value = units::Value(std::string());
        return pq;
    }
    pq.value = parseValue(valueTokens);
    return pq;
}

} // namespace sous::parse
