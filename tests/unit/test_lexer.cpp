// File: tests/unit/test_lexer.cpp
// Purpose: Unit tests for recipe tokenization.
// Key invariants: Tokens cover the input without gaps; the lexer never fails.
// Ownership/Lifetime: Standalone unit test executable.
// Links: src/parse/Lexer.hpp

#include <gtest/gtest.h>

#include "parse/Lexer.hpp"

#include <string>
#include <vector>

using namespace sous::parse;

namespace
{
std::vector<TokenKind> kindsOf(std::string_view src)
{
    Lexer lex(src, 1);
    std::vector<TokenKind> kinds;
    for (Token t = lex.next(); !t.is(TokenKind::Eof); t = lex.next())
        kinds.push_back(t.kind);
    return kinds;
}
} // namespace

TEST(Lexer, IngredientWithQuantity)
{
    const std::vector<TokenKind> expected = {TokenKind::At,
                                             TokenKind::Word,
                                             TokenKind::OpenBrace,
                                             TokenKind::Int,
                                             TokenKind::Percent,
                                             TokenKind::Word,
                                             TokenKind::CloseBrace};
    EXPECT_EQ(kindsOf("@salt{1%tsp}"), expected);
}

TEST(Lexer, NumbersAndWords)
{
    Lexer lex("1.5 200g", 1);
    Token t = lex.next();
    EXPECT_EQ(t.kind, TokenKind::Float);
    EXPECT_EQ(t.text, "1.5");
    EXPECT_EQ(lex.next().kind, TokenKind::Whitespace);
    t = lex.next();
    EXPECT_EQ(t.kind, TokenKind::Int);
    EXPECT_EQ(t.text, "200");
    t = lex.next();
    EXPECT_EQ(t.kind, TokenKind::Word);
    EXPECT_EQ(t.text, "g");
    EXPECT_EQ(lex.next().kind, TokenKind::Eof);
}

TEST(Lexer, TrailingDotIsNotDecimal)
{
    const std::vector<TokenKind> expected = {TokenKind::Int, TokenKind::Punctuation};
    EXPECT_EQ(kindsOf("3."), expected);
}

TEST(Lexer, MetadataAndGreater)
{
    const std::vector<TokenKind> expected = {TokenKind::MetaStart,
                                             TokenKind::Whitespace,
                                             TokenKind::Word,
                                             TokenKind::Colon,
                                             TokenKind::Whitespace,
                                             TokenKind::Int,
                                             TokenKind::Newline,
                                             TokenKind::Greater,
                                             TokenKind::Word};
    EXPECT_EQ(kindsOf(">> servings: 4\n>note"), expected);
}

TEST(Lexer, Comments)
{
    Lexer lex("a -- rest\nb [- inner -] c", 1);
    auto tokens = lex.tokenize();
    ASSERT_EQ(tokens.size(), 10u);
    EXPECT_EQ(tokens[2].kind, TokenKind::LineComment);
    EXPECT_EQ(tokens[2].text, "-- rest");
    EXPECT_EQ(tokens[3].kind, TokenKind::Newline);
    EXPECT_EQ(tokens[6].kind, TokenKind::BlockComment);
    EXPECT_EQ(tokens[6].text, "[- inner -]");
    EXPECT_FALSE(tokens[6].unterminated);
    EXPECT_EQ(tokens.back().kind, TokenKind::Eof);
}

TEST(Lexer, UnterminatedBlockCommentRunsToEnd)
{
    Lexer lex("x [- never\nclosed", 1);
    auto tokens = lex.tokenize();
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[2].kind, TokenKind::BlockComment);
    EXPECT_TRUE(tokens[2].unterminated);
    EXPECT_EQ(tokens[2].span.end, 17u);
}

TEST(Lexer, EscapesAndUtf8)
{
    Lexer lex("\\@ caf\xC3\xA9", 1);
    Token t = lex.next();
    EXPECT_EQ(t.kind, TokenKind::Escaped);
    EXPECT_EQ(t.text, "\\@");
    EXPECT_EQ(lex.next().kind, TokenKind::Whitespace);
    t = lex.next();
    EXPECT_EQ(t.kind, TokenKind::Word);
    EXPECT_EQ(t.text, "caf\xC3\xA9");
}

TEST(Lexer, CrLfIsOneNewline)
{
    const std::vector<TokenKind> expected = {TokenKind::Word, TokenKind::Newline, TokenKind::Word};
    EXPECT_EQ(kindsOf("a\r\nb"), expected);
}

TEST(Lexer, SpansAreContiguous)
{
    const std::string src = ">> title: Pancakes\n@eggs{2} and #pan{} ~{10%min} -- done\n";
    Lexer lex(src, 7);
    auto tokens = lex.tokenize();
    uint32_t expectedBegin = 0;
    for (const auto &t : tokens)
    {
        EXPECT_EQ(t.span.file_id, 7u);
        EXPECT_EQ(t.span.begin, expectedBegin);
        expectedBegin = t.span.end;
    }
    EXPECT_EQ(expectedBegin, src.size());
}

TEST(Lexer, LineAndColumn)
{
    Lexer lex("a\n  b", 1);
    auto tokens = lex.tokenize();
    ASSERT_EQ(tokens.size(), 5u);
    EXPECT_EQ(tokens[3].text, "b");
    EXPECT_EQ(tokens[3].line, 2u);
    EXPECT_EQ(tokens[3].column, 3u);
}

TEST(Lexer, ResetRestarts)
{
    Lexer lex("@a", 1);
    EXPECT_EQ(lex.next().kind, TokenKind::At);
    EXPECT_EQ(lex.next().kind, TokenKind::Word);
    lex.reset();
    EXPECT_EQ(lex.next().kind, TokenKind::At);
}
