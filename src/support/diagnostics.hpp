//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Declares diagnostics and the per-parse SourceReport that collects them.
// Key invariants: Counts reflect reported diagnostics; diagnostics keep
//                 emission order and are never dropped by a query.
// Ownership/Lifetime: Report owns collected diagnostics.
// Links: support/diag_codes.hpp, support/diag_expected.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_codes.hpp"
#include "support/source_location.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace sous::support
{

class SourceManager;

/// @brief Severity levels for diagnostics.
enum class Severity
{
    Warning,
    Error
};

/// @brief Secondary span with an explanatory message.
struct DiagLabel
{
    Span span;
    std::string message;
};

/// @brief Single diagnostic message with location.
struct Diagnostic
{
    Severity severity;             ///< Message severity
    DiagCode code;                 ///< Stable diagnostic code
    std::string message;           ///< Human-readable text
    Span span{};                   ///< Primary source span
    std::vector<DiagLabel> labels; ///< Secondary spans
    std::string help;              ///< Optional hint, empty when absent

    /// @brief Attach a labeled secondary span; returns *this for chaining.
    Diagnostic &label(Span s, std::string msg);

    /// @brief Set the hint text; returns *this for chaining.
    Diagnostic &withHelp(std::string text);
};

/// @brief Ordered collection of diagnostics for one or more recipe sources.
/// @details Every pipeline stage appends to the same report.  Filtering and
///          merging return new reports so the original stays intact.
class SourceReport
{
  public:
    /// @brief Record diagnostic @p d.
    void report(Diagnostic d);

    /// @brief Record an error and return it for labeling.
    Diagnostic &error(DiagCode code, Span span, std::string message);

    /// @brief Record a warning and return it for labeling.
    Diagnostic &warning(DiagCode code, Span span, std::string message);

    /// @brief Append every diagnostic of @p other in order.
    void append(const SourceReport &other);

    /// @brief All diagnostics in emission order.
    const std::vector<Diagnostic> &diagnostics() const
    {
        return diags_;
    }

    /// @brief Diagnostics with severity Error, in emission order.
    std::vector<Diagnostic> errors() const;

    /// @brief Diagnostics with severity Warning, in emission order.
    std::vector<Diagnostic> warnings() const;

    size_t errorCount() const;
    size_t warningCount() const;

    [[nodiscard]] bool hasErrors() const
    {
        return errors_ != 0;
    }

    [[nodiscard]] bool empty() const
    {
        return diags_.empty();
    }

    /// @brief Number of diagnostics carrying @p code.
    size_t count(DiagCode code) const;

    /// @brief Copy of this report retaining only errors.
    SourceReport removeWarnings() const;

    /// @brief Merge with @p other.
    /// @details Diagnostics are grouped by source in first-seen order; within a
    ///          source this report's diagnostics precede @p other's and each
    ///          side keeps its relative order.
    SourceReport zip(const SourceReport &other) const;

    /// @brief Render all diagnostics with caret lines.
    std::string format(const SourceManager &sm) const;

    /// @brief Print all diagnostics to @p os.
    /// @param sm Optional source manager for locations and source lines.
    void print(std::ostream &os, const SourceManager *sm = nullptr) const;

  private:
    std::vector<Diagnostic> diags_;
    size_t errors_ = 0;
    size_t warnings_ = 0;
};

} // namespace sous::support
