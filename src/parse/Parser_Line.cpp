//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Line.cpp
/// @brief Metadata lines, section lines, steps and text blocks.
///
//===----------------------------------------------------------------------===//

#include "parse/Parser.hpp"

namespace sous::parse
{

using support::DiagCode;
using support::Span;

//===----------------------------------------------------------------------===//
// Metadata and sections
//===----------------------------------------------------------------------===//

bool Parser::parseMetadataLine(const Line &line)
{
    const size_t first = firstVisible(line);
    const size_t last = endVisible(line);
    const Span lineSpan = Span::merge(tokens_[first].span, tokens_[last - 1].span);

    size_t colon = last;
    for (size_t i = first + 1; i < last; ++i)
    {
        if (tokens_[i].is(TokenKind::Colon))
        {
            colon = i;
            break;
        }
    }
    if (colon == last)
    {
        report_.warning(DiagCode::P004_InvalidMetadataLine, lineSpan, "metadata line is missing ':'")
            .withHelp("write metadata as '>> key: value'");
        return false;
    }

    const auto keyTokens = trimTrivia(tokensOf(first + 1, colon));
    if (keyTokens.empty())
    {
        report_.warning(DiagCode::P004_InvalidMetadataLine, lineSpan, "metadata key is empty");
        return false;
    }

    const auto valueTokens = trimTrivia(tokensOf(colon + 1, last));
    MetadataEvent ev;
    ev.key = joinTokens(keyTokens);
    ev.value = joinTokens(valueTokens);
    ev.keySpan = spanOf(keyTokens, tokens_[colon].span);
    ev.valueSpan = spanOf(valueTokens, Span::at(fileId_, tokens_[colon].span.end));
    ev.span = lineSpan;

    if (ev.value.empty())
    {
        report_.warning(DiagCode::P006_EmptyMetadataValue,
                        ev.span,
                        "metadata entry '" + ev.key + "' has no value");
    }
    events_.emplace_back(std::move(ev));
    return true;
}

bool Parser::parseSectionLine(const Line &line)
{
    const size_t first = firstVisible(line);
    const size_t last = endVisible(line);
    const Span lineSpan = Span::merge(tokens_[first].span, tokens_[last - 1].span);

    size_t nameBegin = first;
    while (nameBegin < last && tokens_[nameBegin].is(TokenKind::Eq))
        ++nameBegin;
    size_t nameEnd = last;
    while (nameEnd > nameBegin && tokens_[nameEnd - 1].is(TokenKind::Eq))
        --nameEnd;

    const auto nameTokens = trimTrivia(tokensOf(nameBegin, nameEnd));
    for (const auto &tok : nameTokens)
    {
        if (tok.isOneOf(TokenKind::At, TokenKind::Hash, TokenKind::Tilde))
        {
            report_.warning(DiagCode::P005_InvalidSectionLine, tok.span, "section names cannot contain components")
                .label(lineSpan, "in this section line");
            return false;
        }
    }

    SectionEvent ev;
    if (!nameTokens.empty())
        ev.name = joinTokens(nameTokens);
    ev.span = lineSpan;
    events_.emplace_back(std::move(ev));
    return true;
}

void Parser::emitLineAsText(const Line &line)
{
    const size_t first = firstVisible(line);
    const size_t last = endVisible(line);

    events_.emplace_back(StepStartEvent{false, Span::at(fileId_, tokens_[first].span.begin)});
    for (size_t i = first; i < last; ++i)
        appendText(tokens_[i]);
    flushText();
    events_.emplace_back(StepEndEvent{false, Span::at(fileId_, tokens_[last - 1].span.end)});
}

//===----------------------------------------------------------------------===//
// Steps
//===----------------------------------------------------------------------===//

void Parser::parseStep(const std::vector<Line> &lines, bool isText)
{
    const size_t first = firstVisible(lines.front());
    const size_t last = endVisible(lines.back());

    events_.emplace_back(StepStartEvent{isText, Span::at(fileId_, tokens_[first].span.begin)});
    if (isText)
        parseTextLines(lines);
    else
        parseStepContent(first, last);
    flushText();
    events_.emplace_back(StepEndEvent{isText, Span::at(fileId_, tokens_[last - 1].span.end)});
}

void Parser::parseStepContent(size_t begin, size_t end)
{
    bool lineStart = false;
    size_t i = begin;
    while (i < end)
    {
        const Token &tok = tokens_[i];
        if (lineStart && tok.is(TokenKind::Whitespace))
        {
            ++i;
            continue;
        }
        lineStart = tok.is(TokenKind::Newline);

        if (tok.isOneOf(TokenKind::At, TokenKind::Hash, TokenKind::Tilde))
        {
            const size_t next = parseComponent(i, end);
            if (next != i)
            {
                i = next;
                continue;
            }
        }
        appendText(tok);
        ++i;
    }
}

void Parser::parseTextLines(const std::vector<Line> &lines)
{
    bool firstLine = true;
    for (const auto &line : lines)
    {
        const size_t marker = firstVisible(line);
        const auto content = trimTrivia(tokensOf(marker + 1, endVisible(line)));
        if (content.empty())
            continue;
        if (!firstLine && text_.active)
            appendText(" ", Span::at(fileId_, content.front().span.begin));
        for (const auto &tok : content)
            appendText(tok);
        firstLine = false;
    }
}

} // namespace sous::parse
