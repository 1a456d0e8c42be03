//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "parse/Token.hpp"

namespace sous::parse
{

const char *tokenKindToString(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::Eof:
            return "eof";
        case TokenKind::Word:
            return "word";
        case TokenKind::Int:
            return "int";
        case TokenKind::Float:
            return "float";
        case TokenKind::Whitespace:
            return "whitespace";
        case TokenKind::Newline:
            return "newline";
        case TokenKind::Punctuation:
            return "punctuation";
        case TokenKind::At:
            return "'@'";
        case TokenKind::Hash:
            return "'#'";
        case TokenKind::Tilde:
            return "'~'";
        case TokenKind::OpenBrace:
            return "'{'";
        case TokenKind::CloseBrace:
            return "'}'";
        case TokenKind::OpenParen:
            return "'('";
        case TokenKind::CloseParen:
            return "')'";
        case TokenKind::Percent:
            return "'%'";
        case TokenKind::Star:
            return "'*'";
        case TokenKind::Slash:
            return "'/'";
        case TokenKind::Minus:
            return "'-'";
        case TokenKind::Plus:
            return "'+'";
        case TokenKind::Question:
            return "'?'";
        case TokenKind::And:
            return "'&'";
        case TokenKind::Or:
            return "'|'";
        case TokenKind::Eq:
            return "'='";
        case TokenKind::Colon:
            return "':'";
        case TokenKind::MetaStart:
            return "'>>'";
        case TokenKind::Greater:
            return "'>'";
        case TokenKind::LineComment:
            return "line comment";
        case TokenKind::BlockComment:
            return "block comment";
        case TokenKind::Escaped:
            return "escape";
    }
    return "?";
}

} // namespace sous::parse
