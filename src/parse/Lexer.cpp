//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the recipe Lexer.  Scanning is a single forward pass with at most
// two bytes of lookahead; each call to next() consumes at least one byte until
// the end of input, which is what guarantees gap-free coverage.
//
//===----------------------------------------------------------------------===//

#include "parse/Lexer.hpp"

#include <cctype>

namespace sous::parse
{

bool isWordByte(char c)
{
    const auto uc = static_cast<unsigned char>(c);
    return uc >= 0x80 || std::isalpha(uc) || c == '_';
}

namespace
{
bool isDigit(char c)
{
    return c >= '0' && c <= '9';
}

bool isBlank(char c)
{
    return c == ' ' || c == '\t' || c == '\v' || c == '\f';
}
} // namespace

Lexer::Lexer(std::string_view src, uint32_t file_id) : src_(src), file_id_(file_id) {}

void Lexer::reset()
{
    pos_ = 0;
    line_ = 1;
    column_ = 1;
}

char Lexer::peek(size_t ahead) const
{
    return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0';
}

char Lexer::get()
{
    char c = src_[pos_++];
    if (c == '\n')
    {
        ++line_;
        column_ = 1;
    }
    else
    {
        ++column_;
    }
    return c;
}

bool Lexer::eof() const
{
    return pos_ >= src_.size();
}

Token Lexer::make(TokenKind kind, size_t start, uint32_t line, uint32_t column) const
{
    Token t;
    t.kind = kind;
    t.text = src_.substr(start, pos_ - start);
    t.span = support::Span{
        file_id_, static_cast<uint32_t>(start), static_cast<uint32_t>(pos_)};
    t.line = line;
    t.column = column;
    return t;
}

Token Lexer::lexNumber(size_t start, uint32_t line, uint32_t column)
{
    while (isDigit(peek()))
        get();
    if (peek() == '.' && isDigit(peek(1)))
    {
        get();
        while (isDigit(peek()))
            get();
        return make(TokenKind::Float, start, line, column);
    }
    return make(TokenKind::Int, start, line, column);
}

Token Lexer::lexWord(size_t start, uint32_t line, uint32_t column)
{
    while (!eof() && isWordByte(peek()))
        get();
    return make(TokenKind::Word, start, line, column);
}

Token Lexer::lexWhitespace(size_t start, uint32_t line, uint32_t column)
{
    while (isBlank(peek()) || (peek() == '\r' && peek(1) != '\n'))
        get();
    return make(TokenKind::Whitespace, start, line, column);
}

Token Lexer::lexLineComment(size_t start, uint32_t line, uint32_t column)
{
    while (!eof() && peek() != '\n' && !(peek() == '\r' && peek(1) == '\n'))
        get();
    return make(TokenKind::LineComment, start, line, column);
}

Token Lexer::lexBlockComment(size_t start, uint32_t line, uint32_t column)
{
    // Opening "[-" already consumed.
    while (!eof())
    {
        if (peek() == '-' && peek(1) == ']')
        {
            get();
            get();
            return make(TokenKind::BlockComment, start, line, column);
        }
        get();
    }
    Token t = make(TokenKind::BlockComment, start, line, column);
    t.unterminated = true;
    return t;
}

Token Lexer::next()
{
    const size_t start = pos_;
    const uint32_t line = line_;
    const uint32_t column = column_;
    if (eof())
        return make(TokenKind::Eof, start, line, column);

    const char c = peek();
    if (isDigit(c))
        return lexNumber(start, line, column);
    if (isWordByte(c))
        return lexWord(start, line, column);
    if (c == '\n')
    {
        get();
        return make(TokenKind::Newline, start, line, column);
    }
    if (c == '\r' && peek(1) == '\n')
    {
        get();
        get();
        return make(TokenKind::Newline, start, line, column);
    }
    if (isBlank(c) || c == '\r')
        return lexWhitespace(start, line, column);

    get();
    switch (c)
    {
        case '@':
            return make(TokenKind::At, start, line, column);
        case '#':
            return make(TokenKind::Hash, start, line, column);
        case '~':
            return make(TokenKind::Tilde, start, line, column);
        case '{':
            return make(TokenKind::OpenBrace, start, line, column);
        case '}':
            return make(TokenKind::CloseBrace, start, line, column);
        case '(':
            return make(TokenKind::OpenParen, start, line, column);
        case ')':
            return make(TokenKind::CloseParen, start, line, column);
        case '%':
            return make(TokenKind::Percent, start, line, column);
        case '*':
            return make(TokenKind::Star, start, line, column);
        case '/':
            return make(TokenKind::Slash, start, line, column);
        case '+':
            return make(TokenKind::Plus, start, line, column);
        case '?':
            return make(TokenKind::Question, start, line, column);
        case '&':
            return make(TokenKind::And, start, line, column);
        case '|':
            return make(TokenKind::Or, start, line, column);
        case '=':
            return make(TokenKind::Eq, start, line, column);
        case ':':
            return make(TokenKind::Colon, start, line, column);
        case '-':
            if (peek() == '-')
            {
                get();
                return lexLineComment(start, line, column);
            }
            return make(TokenKind::Minus, start, line, column);
        case '>':
            if (peek() == '>')
            {
                get();
                return make(TokenKind::MetaStart, start, line, column);
            }
            return make(TokenKind::Greater, start, line, column);
        case '[':
            if (peek() == '-')
            {
                get();
                return lexBlockComment(start, line, column);
            }
            return make(TokenKind::Punctuation, start, line, column);
        case '\\':
            if (!eof() && peek() != '\n' && peek() != '\r')
            {
                // Escape a whole UTF-8 sequence, not just its lead byte.
                get();
                while (!eof() && (static_cast<unsigned char>(peek()) & 0xC0) == 0x80)
                    get();
                return make(TokenKind::Escaped, start, line, column);
            }
            return make(TokenKind::Punctuation, start, line, column);
        default:
            return make(TokenKind::Punctuation, start, line, column);
    }
}

std::vector<Token> Lexer::tokenize()
{
    std::vector<Token> out;
    while (true)
    {
        out.push_back(next());
        if (out.back().is(TokenKind::Eof))
            break;
    }
    return out;
}

} // namespace sous::parse
