//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser.cpp
/// @brief Line splitting, block grouping and text collection.
///
//===----------------------------------------------------------------------===//

#include "parse/Parser.hpp"

namespace sous::parse
{

using support::DiagCode;
using support::Span;

Parser::Parser(std::string_view source,
               uint32_t fileId,
               Extensions extensions,
               support::SourceReport &report)
    : source_(source),
      fileId_(fileId),
      extensions_(extensions),
      report_(report),
      quantities_(extensions, report)
{
    Lexer lexer(source_, fileId_);
    tokens_ = lexer.tokenize();
}

//===----------------------------------------------------------------------===//
// Lines
//===----------------------------------------------------------------------===//

void Parser::splitLines()
{
    lines_.clear();
    size_t begin = 0;
    for (size_t i = 0; i < tokens_.size(); ++i)
    {
        const Token &tok = tokens_[i];
        if (tok.is(TokenKind::BlockComment) && tok.unterminated)
            report_.warning(DiagCode::P015_UnterminatedBlockComment, tok.span, "block comment is not closed");

        if (tok.is(TokenKind::Newline))
        {
            lines_.push_back(Line{begin, i});
            begin = i + 1;
        }
        else if (tok.is(TokenKind::Eof))
        {
            lines_.push_back(Line{begin, i});
        }
    }
}

size_t Parser::firstVisible(const Line &line) const
{
    size_t i = line.begin;
    while (i < line.end && tokens_[i].isTrivia())
        ++i;
    return i;
}

size_t Parser::endVisible(const Line &line) const
{
    size_t i = line.end;
    while (i > line.begin && tokens_[i - 1].isTrivia())
        --i;
    return i;
}

Parser::LineKind Parser::classify(const Line &line) const
{
    const size_t first = firstVisible(line);
    if (first == line.end)
    {
        for (size_t i = line.begin; i < line.end; ++i)
        {
            if (!tokens_[i].is(TokenKind::Whitespace))
                return LineKind::Comment;
        }
        return LineKind::Blank;
    }

    const Token &tok = tokens_[first];
    if (tok.is(TokenKind::MetaStart))
        return LineKind::Metadata;
    if (tok.is(TokenKind::Eq) && hasExtension(extensions_, Extensions::Sections))
        return LineKind::Section;
    if (tok.is(TokenKind::Greater) && hasExtension(extensions_, Extensions::TextSteps))
        return LineKind::Text;
    return LineKind::Step;
}

std::span<const Token> Parser::tokensOf(size_t begin, size_t end) const
{
    return std::span<const Token>(tokens_).subspan(begin, end - begin);
}

std::vector<Event> Parser::parse()
{
    events_.clear();
    block_.clear();
    splitLines();

    const bool multiline = hasExtension(extensions_, Extensions::MultilineSteps);

    for (const auto &line : lines_)
    {
        const LineKind kind = classify(line);
        switch (kind)
        {
            case LineKind::Blank:
                flushBlock();
                break;

            case LineKind::Comment:
                break;

            case LineKind::Metadata:
                flushBlock();
                if (!parseMetadataLine(line))
                    emitLineAsText(line);
                break;

            case LineKind::Section:
                flushBlock();
                if (!parseSectionLine(line))
                    emitLineAsText(line);
                break;

            case LineKind::Text:
            case LineKind::Step:
            {
                const bool isText = kind == LineKind::Text;
                if (!block_.empty() && blockIsText_ != isText)
                    flushBlock();
                blockIsText_ = isText;
                block_.push_back(line);
                if (!multiline)
                    flushBlock();
                break;
            }
        }
    }
    flushBlock();
    return std::move(events_);
}

std::vector<Event> Parser::parseMetadata()
{
    events_.clear();
    splitLines();
    for (const auto &line : lines_)
    {
        if (classify(line) == LineKind::Metadata)
            parseMetadataLine(line);
    }
    return std::move(events_);
}

void Parser::flushBlock()
{
    if (block_.empty())
        return;
    parseStep(block_, blockIsText_);
    block_.clear();
}

//===----------------------------------------------------------------------===//
// Text collection
//===----------------------------------------------------------------------===//

void Parser::appendText(const Token &tok)
{
    switch (tok.kind)
    {
        case TokenKind::LineComment:
        case TokenKind::BlockComment:
            return;
        case TokenKind::Escaped:
            appendText(tok.text.substr(1), tok.span);
            return;
        case TokenKind::Newline:
            while (!text_.text.empty() && (text_.text.back() == ' ' || text_.text.back() == '\t'))
                text_.text.pop_back();
            appendText(" ", tok.span);
            return;
        default:
            appendText(tok.text, tok.span);
            return;
    }
}

void Parser::appendText(std::string_view text, Span span)
{
    if (!text_.active)
    {
        text_.active = true;
        text_.span = span;
    }
    else
    {
        text_.span = Span::merge(text_.span, span);
    }
    text_.text.append(text);
}

void Parser::flushText()
{
    if (!text_.active)
        return;
    if (!text_.text.empty())
        events_.emplace_back(TextEvent{std::move(text_.text), text_.span});
    text_ = PendingText{};
}

std::vector<Event> parseEvents(std::string_view source,
                               uint32_t fileId,
                               Extensions extensions,
                               support::SourceReport &report)
{
    Parser parser(source, fileId, extensions, report);
    return parser.parse();
}

} // namespace sous::parse
