//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Pipeline.cpp
/// @brief Parse, analyze and report a recipe in one call.
///
//===----------------------------------------------------------------------===//

#include "pipeline/Pipeline.hpp"

#include "parse/Parser.hpp"
#include "support/debug_log.hpp"
#include "units/Converter.hpp"

#include <string>

namespace sous
{

namespace
{

/// @brief Register the source unless the caller already did.
uint32_t registerSource(const ParseInput &input, support::SourceManager &sm)
{
    if (input.fileId)
        return *input.fileId;
    const std::string_view path = input.path.empty() ? std::string_view("<input>") : input.path;
    return sm.addSource(std::string(path), std::string(input.source));
}

/// @brief Text to parse: the manager's copy when registered.
std::string_view sourceText(const ParseInput &input, uint32_t fileId, const support::SourceManager &sm)
{
    if (fileId == 0 || input.fileId)
        return input.source;
    return sm.getText(fileId);
}

} // namespace

bool ParseResult::succeeded() const
{
    return !report.hasErrors();
}

ParseResult parseRecipe(const ParseInput &input,
                        const units::Converter &converter,
                        support::SourceManager &sm,
                        const ParseOptions &options,
                        analysis::MetadataValidator validator,
                        analysis::RecipeRefChecker checker)
{
    ParseResult result;
    result.fileId = registerSource(input, sm);
    const std::string_view text = sourceText(input, result.fileId, sm);

    parse::Parser parser(text, result.fileId, options.extensions, result.report);
    auto events = parser.parse();
    if (support::isDebugLoggingEnabled())
    {
        support::debugLog("parse",
                          std::to_string(events.size()) + " events, " +
                              std::to_string(result.report.warningCount()) + " warnings");
    }

    analysis::Sema sema(converter, result.report, options.analysis, std::move(validator), std::move(checker));
    result.recipe = sema.analyze(events);
    if (support::isDebugLoggingEnabled())
    {
        support::debugLog("pipeline",
                          std::to_string(result.report.errorCount()) + " errors, " +
                              std::to_string(result.report.warningCount()) + " warnings");
    }
    return result;
}

ParseResult parseMetadata(const ParseInput &input,
                          const units::Converter &converter,
                          support::SourceManager &sm,
                          const ParseOptions &options,
                          analysis::MetadataValidator validator)
{
    ParseResult result;
    result.fileId = registerSource(input, sm);
    const std::string_view text = sourceText(input, result.fileId, sm);

    parse::Parser parser(text, result.fileId, options.extensions, result.report);
    auto events = parser.parseMetadata();
    if (support::isDebugLoggingEnabled())
        support::debugLog("parse", std::to_string(events.size()) + " metadata entries");

    analysis::Sema sema(converter, result.report, options.analysis, std::move(validator));
    result.recipe = sema.analyze(events);
    return result;
}

} // namespace sous
