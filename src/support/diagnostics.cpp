/**
 * @file diagnostics.cpp
 * @brief Implements the SourceReport that collects pipeline diagnostics.
 * @copyright
 *     GNU GPL v3. See the LICENSE file in the project root for full terms.
 * @details
 *     The report aggregates diagnostics emitted by every stage of a parse and
 *     keeps track of severity counts.  Diagnostics are stored until callers
 *     explicitly print, filter or merge them.
 */

#include "support/diagnostics.hpp"
#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>

namespace sous::support
{

Diagnostic &Diagnostic::label(Span s, std::string msg)
{
    labels.push_back(DiagLabel{s, std::move(msg)});
    return *this;
}

Diagnostic &Diagnostic::withHelp(std::string text)
{
    help = std::move(text);
    return *this;
}

/**
 * @brief Adds a diagnostic to the report and updates severity counters.
 *
 * @param d Diagnostic to record; moved into the report's storage.
 */
void SourceReport::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    else
        ++warnings_;
    diags_.push_back(std::move(d));
}

Diagnostic &SourceReport::error(DiagCode code, Span span, std::string message)
{
    report(makeError(code, span, std::move(message)));
    return diags_.back();
}

Diagnostic &SourceReport::warning(DiagCode code, Span span, std::string message)
{
    report(makeWarning(code, span, std::move(message)));
    return diags_.back();
}

void SourceReport::append(const SourceReport &other)
{
    for (const auto &d : other.diags_)
        report(d);
}

std::vector<Diagnostic> SourceReport::errors() const
{
    std::vector<Diagnostic> out;
    std::copy_if(diags_.begin(),
                 diags_.end(),
                 std::back_inserter(out),
                 [](const Diagnostic &d) { return d.severity == Severity::Error; });
    return out;
}

std::vector<Diagnostic> SourceReport::warnings() const
{
    std::vector<Diagnostic> out;
    std::copy_if(diags_.begin(),
                 diags_.end(),
                 std::back_inserter(out),
                 [](const Diagnostic &d) { return d.severity == Severity::Warning; });
    return out;
}

size_t SourceReport::errorCount() const
{
    return errors_;
}

size_t SourceReport::warningCount() const
{
    return warnings_;
}

size_t SourceReport::count(DiagCode code) const
{
    return static_cast<size_t>(std::count_if(
        diags_.begin(), diags_.end(), [code](const Diagnostic &d) { return d.code == code; }));
}

SourceReport SourceReport::removeWarnings() const
{
    SourceReport out;
    for (const auto &d : diags_)
    {
        if (d.severity == Severity::Error)
            out.report(d);
    }
    return out;
}

/**
 * @brief Merges two reports while keeping each source's diagnostics together.
 *
 * Sources appear in the order they are first seen, scanning this report before
 * @p other.  For each source the diagnostics of this report come first,
 * followed by those of @p other, each preserving emission order.
 */
SourceReport SourceReport::zip(const SourceReport &other) const
{
    std::vector<uint32_t> order;
    auto noteSource = [&order](const Diagnostic &d)
    {
        if (std::find(order.begin(), order.end(), d.span.file_id) == order.end())
            order.push_back(d.span.file_id);
    };
    for (const auto &d : diags_)
        noteSource(d);
    for (const auto &d : other.diags_)
        noteSource(d);

    SourceReport out;
    for (uint32_t fileId : order)
    {
        for (const auto &d : diags_)
        {
            if (d.span.file_id == fileId)
                out.report(d);
        }
        for (const auto &d : other.diags_)
        {
            if (d.span.file_id == fileId)
                out.report(d);
        }
    }
    return out;
}

std::string SourceReport::format(const SourceManager &sm) const
{
    std::ostringstream os;
    print(os, &sm);
    return os.str();
}

/**
 * @brief Writes all stored diagnostics to the provided output stream.
 *
 * Formatting is delegated to `printDiag`, which knows how to render caret
 * lines when a SourceManager is supplied.
 */
void SourceReport::print(std::ostream &os, const SourceManager *sm) const
{
    for (const auto &d : diags_)
        printDiag(d, os, sm);
}

} // namespace sous::support
