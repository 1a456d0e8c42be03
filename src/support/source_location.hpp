//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Declares byte spans and resolved line/column locations for recipe sources.
// Key invariants: file_id == 0 denotes an unknown source; spans are half-open
//                 with begin <= end.
// Ownership/Lifetime: Value types with no dynamic ownership.
// Links: support/source_manager.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace sous::support
{

/// @brief Resolved position within a source text.
/// @invariant line and column are 1-based when valid; 0 means unknown.
struct SourceLoc
{
    /// @brief Identifier assigned by SourceManager; 0 denotes invalid location.
    uint32_t file_id = 0;

    /// @brief One-based line number; 0 when unknown.
    uint32_t line = 0;

    /// @brief One-based column number counted in bytes; 0 when unknown.
    uint32_t column = 0;

    [[nodiscard]] bool isValid() const;

    [[nodiscard]] bool hasLine() const
    {
        return line != 0;
    }

    [[nodiscard]] bool hasColumn() const
    {
        return column != 0;
    }
};

/// @brief Half-open byte range [begin, end) inside one source text.
/// @details Every token, parse event and diagnostic carries a span. Line and
///          column information is derived on demand by SourceManager::locate.
struct Span
{
    uint32_t file_id = 0;
    uint32_t begin = 0;
    uint32_t end = 0;

    /// @brief Number of bytes covered.
    [[nodiscard]] uint32_t size() const
    {
        return end - begin;
    }

    [[nodiscard]] bool empty() const
    {
        return begin == end;
    }

    /// @brief Smallest span covering both @p a and @p b.
    /// @details The file of @p a wins when the two disagree.
    static Span merge(const Span &a, const Span &b);

    /// @brief Span of @p len bytes starting at @p begin in @p file_id.
    static Span at(uint32_t file_id, uint32_t begin, uint32_t len = 0);

    bool operator==(const Span &other) const = default;
};

} // namespace sous::support
