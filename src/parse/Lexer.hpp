//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Lexer class, which splits recipe markup into tokens
// for the event parser.
//
// Key Responsibilities:
// - Covers the whole input without gaps; every byte belongs to some token
// - Never fails: bytes with no markup meaning become words or punctuation
// - Tracks line and column for each token
//
// Design Notes:
// - The lexer does not own the source buffer; callers must ensure the buffer
//   remains valid for the lexer's lifetime and the tokens it produced
// - Tokens are produced lazily by next(); reset() restarts the sequence
//
// Usage:
//   Lexer lex(sourceText, fileId);
//   Token tok;
//   while ((tok = lex.next()).kind != TokenKind::Eof) {
//     // Process token
//   }
//
//===----------------------------------------------------------------------===//
#pragma once

#include "parse/Token.hpp"

#include <string_view>
#include <vector>

namespace sous::parse
{

class Lexer
{
  public:
    Lexer(std::string_view src, uint32_t file_id);

    /// @brief Produce the next token; returns Eof repeatedly at the end.
    Token next();

    /// @brief Restart tokenization from the first byte.
    void reset();

    /// @brief Tokenize the remaining input, including the final Eof token.
    std::vector<Token> tokenize();

  private:
    char peek(size_t ahead = 0) const;

    char get();

    bool eof() const;

    Token make(TokenKind kind, size_t start, uint32_t line, uint32_t column) const;

    Token lexNumber(size_t start, uint32_t line, uint32_t column);

    Token lexWord(size_t start, uint32_t line, uint32_t column);

    Token lexWhitespace(size_t start, uint32_t line, uint32_t column);

    Token lexLineComment(size_t start, uint32_t line, uint32_t column);

    Token lexBlockComment(size_t start, uint32_t line, uint32_t column);

    std::string_view src_; ///< Recipe text being tokenized.
    size_t pos_ = 0;       ///< Current index into the source buffer.
    uint32_t file_id_;
    uint32_t line_ = 1;   ///< 1-based line number of current character.
    uint32_t column_ = 1; ///< 1-based column number of current character.
};

/// @brief Bytes that form words: letters, '_' and any non-ASCII byte.
bool isWordByte(char c);

} // namespace sous::parse
