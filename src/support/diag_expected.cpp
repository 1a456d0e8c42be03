//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers and the single routine
// that renders a diagnostic as text.  SourceReport::print and the standalone
// converter errors both go through printDiag so every stage reports in the same
// format.
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"

#include "support/source_manager.hpp"

#include <algorithm>
#include <string_view>

namespace sous::support
{
Expected<void>::Expected(Diag diag) : error_(std::move(diag))
{
}

bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

Expected<void>::operator bool() const
{
    return hasValue();
}

const Diag &Expected<void>::error() const &
{
    return *error_;
}

namespace detail
{
const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace detail

Diag makeError(DiagCode code, Span span, std::string msg)
{
    return Diag{Severity::Error, code, std::move(msg), span, {}, {}};
}

Diag makeWarning(DiagCode code, Span span, std::string msg)
{
    return Diag{Severity::Warning, code, std::move(msg), span, {}, {}};
}

namespace
{
/// @brief Write "path:line:col: " for @p span when it can be resolved.
void printLocation(std::ostream &os, const Span &span, const SourceManager *sm)
{
    if (!sm || span.file_id == 0)
        return;
    auto path = sm->getPath(span.file_id);
    if (path.empty())
        return;
    const SourceLoc loc = sm->locate(span);
    os << path;
    if (loc.hasLine())
    {
        os << ':' << loc.line;
        if (loc.hasColumn())
            os << ':' << loc.column;
    }
    os << ": ";
}

/// @brief Quote the first line of @p span and underline it with carets.
void printSnippet(std::ostream &os, const Span &span, const SourceManager &sm)
{
    const SourceLoc loc = sm.locate(span);
    if (!loc.hasLine())
        return;
    std::string_view line = sm.lineText(span.file_id, loc.line);
    os << line << '\n';

    const uint32_t indent = loc.column - 1;
    uint32_t caretLen = span.size();
    const uint32_t available =
        line.size() > indent ? static_cast<uint32_t>(line.size()) - indent : 0;
    caretLen = std::min(caretLen, available);
    if (caretLen == 0)
        caretLen = 1;
    os << std::string(indent, ' ') << std::string(caretLen, '^') << '\n';
}
} // namespace

void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm)
{
    printLocation(os, diag.span, sm);
    os << detail::diagSeverityToString(diag.severity) << '[' << diagCodeStr(diag.code)
       << "]: " << diag.message << '\n';
    if (!sm || sm->getText(diag.span.file_id).empty())
    {
        for (const auto &l : diag.labels)
            os << "note: " << l.message << '\n';
    }
    else
    {
        printSnippet(os, diag.span, *sm);
        for (const auto &l : diag.labels)
        {
            printLocation(os, l.span, sm);
            os << "note: " << l.message << '\n';
            printSnippet(os, l.span, *sm);
        }
    }
    if (!diag.help.empty())
        os << "help: " << diag.help << '\n';
}
} // namespace sous::support
