//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Out-of-line helpers for the location value types.  A location is valid once
// it names a registered source; spans are merged by taking the outer bounds.
//
//===----------------------------------------------------------------------===//

#include "support/source_location.hpp"

#include <algorithm>

namespace sous::support
{
bool SourceLoc::isValid() const
{
    return file_id != 0;
}

Span Span::merge(const Span &a, const Span &b)
{
    return Span{a.file_id, std::min(a.begin, b.begin), std::max(a.end, b.end)};
}

Span Span::at(uint32_t file_id, uint32_t begin, uint32_t len)
{
    return Span{file_id, begin, begin + len};
}
} // namespace sous::support
