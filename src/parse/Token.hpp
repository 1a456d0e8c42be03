//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Token.hpp
/// @brief Token kinds and the Token value type produced by the recipe Lexer.
///
/// @details The recipe markup is mostly prose, so the token set is small:
///
/// 1. **Text**: words, numbers, whitespace and punctuation that carry no
///    markup meaning on their own
/// 2. **Sigils**: `@` ingredient, `#` cookware, `~` timer
/// 3. **Component syntax**: braces, parentheses, `%`, `*`, `|`, `&`, ...
/// 4. **Line markers**: `>>` metadata, `>` text block, `=` sections
/// 5. **Trivia**: line comments `--`, block comments `[- -]`, escapes `\x`
///
/// Tokens do not own their text; it is a view into the source buffer which
/// must outlive every token taken from it.
///
/// @invariant Consecutive tokens of one source are contiguous: the end of a
///            token's span is the begin of the next one's.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <string_view>

namespace sous::parse
{

/// @brief Kinds of lexical tokens.
enum class TokenKind
{
    Eof,

    // Text
    Word,
    Int,
    Float,
    Whitespace,
    Newline,
    Punctuation,

    // Sigils
    At,
    Hash,
    Tilde,

    // Component syntax
    OpenBrace,
    CloseBrace,
    OpenParen,
    CloseParen,
    Percent,
    Star,
    Slash,
    Minus,
    Plus,
    Question,
    And,
    Or,
    Eq,
    Colon,

    // Line markers
    MetaStart,
    Greater,

    // Trivia
    LineComment,
    BlockComment,
    Escaped,
};

/// @brief Lexical token.
struct Token
{
    TokenKind kind = TokenKind::Eof;
    std::string_view text;   ///< Exact source text of the token
    support::Span span;      ///< Byte range in the source
    uint32_t line = 0;       ///< 1-based line of the first byte
    uint32_t column = 0;     ///< 1-based column of the first byte
    bool unterminated = false; ///< Block comment that runs to end of input

    bool is(TokenKind k) const
    {
        return kind == k;
    }

    /// @brief Check if this token is one of several kinds.
    template <typename... Kinds> bool isOneOf(Kinds... kinds) const
    {
        return (is(kinds) || ...);
    }

    /// @brief Whitespace or comment: has no visible content.
    bool isTrivia() const
    {
        return isOneOf(TokenKind::Whitespace, TokenKind::LineComment, TokenKind::BlockComment);
    }
};

/// @brief Printable name for @p kind, used in debug output and tests.
const char *tokenKindToString(TokenKind kind);

} // namespace sous::parse
