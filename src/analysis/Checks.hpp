//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Checks.hpp
/// @brief Caller-supplied hooks consulted during analysis.
///
/// @details A MetadataValidator sees every metadata entry after the built-in
/// keys are interpreted.  A RecipeRefChecker resolves ingredients that name
/// another recipe.  Both are optional; an empty std::function accepts
/// everything.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sous::analysis
{

enum class CheckResult
{
    Accept,
    Reject, ///< Reported as a warning
    Error   ///< Reported as an error
};

struct CheckOutcome
{
    CheckResult result = CheckResult::Accept;
    std::string reason;

    static CheckOutcome accept()
    {
        return {};
    }

    static CheckOutcome reject(std::string reason)
    {
        return {CheckResult::Reject, std::move(reason)};
    }

    static CheckOutcome error(std::string reason)
    {
        return {CheckResult::Error, std::move(reason)};
    }
};

/// @brief Inspect one metadata entry: (key, value) -> outcome.
using MetadataValidator = std::function<CheckOutcome(std::string_view key, std::string_view value)>;

struct RecipeRefResult
{
    enum class Kind
    {
        Found,
        NotFound,
        Ambiguous
    };

    Kind kind = Kind::Found;
    std::string message;                                    ///< NotFound: replaces the default text
    std::vector<std::string> hints;                         ///< NotFound: shown as help
    support::Severity severity = support::Severity::Warning; ///< NotFound
    std::vector<std::string> candidates;                    ///< Ambiguous

    static RecipeRefResult found()
    {
        return {};
    }

    static RecipeRefResult notFound(std::string message,
                                    std::vector<std::string> hints = {},
                                    support::Severity severity = support::Severity::Warning)
    {
        RecipeRefResult r;
        r.kind = Kind::NotFound;
        r.message = std::move(message);
        r.hints = std::move(hints);
        r.severity = severity;
        return r;
    }

    static RecipeRefResult ambiguous(std::vector<std::string> candidates)
    {
        RecipeRefResult r;
        r.kind = Kind::Ambiguous;
        r.candidates = std::move(candidates);
        return r;
    }
};

/// @brief Resolve a referenced recipe name.
using RecipeRefChecker = std::function<RecipeRefResult(std::string_view name)>;

} // namespace sous::analysis
