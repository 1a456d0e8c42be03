//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the SourceManager that hands out file identifiers for recipe
// sources.  Each registered text gets a line-start table computed once so that
// span-to-location lookups are a binary search.
//
//===----------------------------------------------------------------------===//

#include "support/source_manager.hpp"

#include "support/debug_log.hpp"

#include <algorithm>
#include <limits>

namespace sous::support
{

uint32_t SourceManager::addSource(std::string name, std::string text)
{
    if (files_.size() >= std::numeric_limits<uint32_t>::max() - 1)
    {
        debugLog("source", "source manager exhausted file identifier space");
        return 0;
    }

    Entry entry;
    entry.name = std::move(name);
    entry.text = std::move(text);
    entry.lineStarts.push_back(0);
    for (size_t i = 0; i < entry.text.size(); ++i)
    {
        if (entry.text[i] == '\n')
            entry.lineStarts.push_back(static_cast<uint32_t>(i + 1));
    }
    files_.push_back(std::move(entry));
    return static_cast<uint32_t>(files_.size());
}

const SourceManager::Entry *SourceManager::find(uint32_t file_id) const
{
    if (file_id == 0 || file_id > files_.size())
        return nullptr;
    return &files_[file_id - 1];
}

std::string_view SourceManager::getPath(uint32_t file_id) const
{
    const Entry *e = find(file_id);
    return e ? std::string_view(e->name) : std::string_view();
}

std::string_view SourceManager::getText(uint32_t file_id) const
{
    const Entry *e = find(file_id);
    return e ? std::string_view(e->text) : std::string_view();
}

SourceLoc SourceManager::locate(const Span &span) const
{
    return locate(span.file_id, span.begin);
}

SourceLoc SourceManager::locate(uint32_t file_id, uint32_t offset) const
{
    const Entry *e = find(file_id);
    if (!e)
        return {};

    offset = std::min<uint32_t>(offset, static_cast<uint32_t>(e->text.size()));
    auto it = std::upper_bound(e->lineStarts.begin(), e->lineStarts.end(), offset);
    const auto lineIndex = static_cast<uint32_t>(std::distance(e->lineStarts.begin(), it) - 1);
    const uint32_t column = offset - e->lineStarts[lineIndex] + 1;
    return SourceLoc{file_id, lineIndex + 1, column};
}

uint32_t SourceManager::lineStart(uint32_t file_id, uint32_t line) const
{
    const Entry *e = find(file_id);
    if (!e || line == 0 || line > e->lineStarts.size())
        return 0;
    return e->lineStarts[line - 1];
}

std::string_view SourceManager::lineText(uint32_t file_id, uint32_t line) const
{
    const Entry *e = find(file_id);
    if (!e || line == 0 || line > e->lineStarts.size())
        return {};

    std::string_view text(e->text);
    const uint32_t begin = e->lineStarts[line - 1];
    size_t end = text.find('\n', begin);
    if (end == std::string_view::npos)
        end = text.size();
    std::string_view result = text.substr(begin, end - begin);
    if (!result.empty() && result.back() == '\r')
        result.remove_suffix(1);
    return result;
}
} // namespace sous::support
