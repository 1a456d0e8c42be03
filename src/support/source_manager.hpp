//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Declares the registry of recipe sources used to render diagnostics.
// Key invariants: File ID 0 is invalid; registered text never changes.
// Ownership/Lifetime: Manager owns source names, texts and line tables.
// Links: support/diagnostics.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <vector>

namespace sous::support
{

/// @brief Tracks recipe sources by numeric identifier.
/// @details Unlike a path-only registry the manager also keeps the text of
///          each source so byte spans can be turned into line/column pairs and
///          so diagnostics can quote the offending line.
class SourceManager
{
  public:
    /// @brief Register a source named @p name with contents @p text.
    /// @return New file identifier (>0 on success, 0 on overflow).
    uint32_t addSource(std::string name, std::string text);

    /// @brief Display name for @p file_id, empty when unknown.
    std::string_view getPath(uint32_t file_id) const;

    /// @brief Registered text for @p file_id, empty when unknown.
    std::string_view getText(uint32_t file_id) const;

    /// @brief Resolve the start of @p span into a 1-based line and column.
    SourceLoc locate(const Span &span) const;

    /// @brief Resolve byte @p offset of @p file_id.
    SourceLoc locate(uint32_t file_id, uint32_t offset) const;

    /// @brief Text of 1-based @p line without its line terminator.
    std::string_view lineText(uint32_t file_id, uint32_t line) const;

    /// @brief Byte offset at which 1-based @p line starts.
    uint32_t lineStart(uint32_t file_id, uint32_t line) const;

  private:
    struct Entry
    {
        std::string name;
        std::string text;
        std::vector<uint32_t> lineStarts; ///< Offsets of each line start.
    };

    const Entry *find(uint32_t file_id) const;

    std::deque<Entry> files_;
};
} // namespace sous::support
