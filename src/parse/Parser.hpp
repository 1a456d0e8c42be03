//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser.hpp
/// @brief Event parser for recipe markup.
///
/// @details The parser works line by line.  Each line is classified by its
/// first visible token:
///
///   `>>`        metadata line
///   `=`         section line (Sections extension)
///   `>`         text block line (TextSteps extension)
///   blank       ends the current step
///   otherwise   step content
///
/// With MultilineSteps, consecutive step lines (or text block lines) form one
/// paragraph; otherwise every line is its own step.
///
/// ## Recovery
///
/// The parser never fails.  Malformed metadata and section lines become a step
/// holding their text; malformed components become text over the same span.
/// Each recovery raises a P-coded warning.  Warnings raised while trying to
/// read a component are only kept when the component is accepted.
///
/// @see Event.hpp for the emitted events.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "parse/Event.hpp"
#include "parse/Extensions.hpp"
#include "parse/Lexer.hpp"
#include "parse/QuantityParser.hpp"
#include "support/diagnostics.hpp"

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sous::parse
{

class Parser
{
  public:
    /// @param source Recipe text; must outlive the parser.
    Parser(std::string_view source,
           uint32_t fileId,
           Extensions extensions,
           support::SourceReport &report);

    /// @brief Parse the whole recipe into events.
    std::vector<Event> parse();

    /// @brief Parse only metadata lines, skipping everything else.
    std::vector<Event> parseMetadata();

  private:
    /// @brief Token range [begin, end) of one line, newline excluded.
    struct Line
    {
        size_t begin;
        size_t end;
    };

    enum class LineKind
    {
        Blank,
        Comment,
        Metadata,
        Section,
        Text,
        Step
    };

    /// @brief Text being collected for the next Text event.
    struct PendingText
    {
        std::string text;
        support::Span span;
        bool active = false;
    };

    //===------------------------------------------------------------------===//
    // Lines (Parser.cpp)
    //===------------------------------------------------------------------===//

    void splitLines();
    LineKind classify(const Line &line) const;
    size_t firstVisible(const Line &line) const;
    size_t endVisible(const Line &line) const;
    std::span<const Token> tokensOf(size_t begin, size_t end) const;
    void flushBlock();

    //===------------------------------------------------------------------===//
    // Line kinds (Parser_Line.cpp)
    //===------------------------------------------------------------------===//

    bool parseMetadataLine(const Line &line);
    bool parseSectionLine(const Line &line);
    void emitLineAsText(const Line &line);
    void parseStep(const std::vector<Line> &lines, bool isText);
    void parseStepContent(size_t begin, size_t end);
    void parseTextLines(const std::vector<Line> &lines);

    //===------------------------------------------------------------------===//
    // Text collection
    //===------------------------------------------------------------------===//

    void appendText(const Token &tok);
    void appendText(std::string_view text, support::Span span);
    void flushText();

    //===------------------------------------------------------------------===//
    // Components (Parser_Component.cpp)
    //===------------------------------------------------------------------===//

    /// @brief Try to read a component whose sigil is at @p pos.
    /// @return Index just past the consumed tokens, or @p pos when the sigil
    ///         is plain text.
    size_t parseComponent(size_t pos, size_t end);

    size_t parseModifiers(size_t pos,
                          size_t end,
                          TokenKind sigil,
                          Component &comp,
                          support::SourceReport &pending);

    size_t parseIntermediate(size_t pos, size_t end, Component &comp, support::SourceReport &pending);

    /// @brief Index past the single-word name starting at @p pos.
    size_t scanSingleWordName(size_t pos, size_t end, support::SourceReport &pending);

    /// @brief Index of the `{` ending a multi-word name, or @p end.
    size_t findNameBrace(size_t pos, size_t end) const;

    void splitAlias(std::span<const Token> nameTokens,
                    TokenKind sigil,
                    Component &comp,
                    support::SourceReport &pending);

    /// @brief Emit tokens [begin, end) as text with a warning.
    /// @return @p end.
    size_t degrade(size_t begin, size_t end, support::DiagCode code, std::string message);

    /// @brief Attach the trailing `*` and `(note)` of a component.
    size_t parseSuffix(size_t pos, size_t end, TokenKind sigil, Component &comp);

    std::string_view source_;
    uint32_t fileId_;
    Extensions extensions_;
    support::SourceReport &report_;
    QuantityParser quantities_;

    std::vector<Token> tokens_;
    std::vector<Line> lines_;
    std::vector<Event> events_;
    PendingText text_;

    /// Lines of the step or text block being collected.
    std::vector<Line> block_;
    bool blockIsText_ = false;
};

/// @brief Parse @p source into events, reporting warnings to @p report.
std::vector<Event> parseEvents(std::string_view source,
                               uint32_t fileId,
                               Extensions extensions,
                               support::SourceReport &report);

} // namespace sous::parse
