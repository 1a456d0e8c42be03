//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//===----------------------------------------------------------------------===//

#pragma once

#include "analysis/Checks.hpp"
#include "analysis/Sema.hpp"
#include "model/Recipe.hpp"
#include "parse/Extensions.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <optional>
#include <string_view>

namespace sous::units
{
class Converter;
}

namespace sous
{

struct ParseOptions
{
    /// @brief Syntax extensions accepted by the parser.
    parse::Extensions extensions = parse::Extensions::All;

    /// @brief Settings for the semantic analyzer.
    analysis::AnalysisOptions analysis{};
};

struct ParseInput
{
    /// @brief Recipe text.
    std::string_view source;

    /// @brief Name used for diagnostics; defaults to "<input>" when empty.
    std::string_view path{"<input>"};

    /// @brief Existing file id within the supplied source manager, if any.
    std::optional<uint32_t> fileId{};
};

struct ParseResult
{
    model::ScalableRecipe recipe{};

    /// @brief Diagnostics from parsing and analysis.
    support::SourceReport report{};

    /// @brief File identifier used for the recipe source.
    uint32_t fileId{0};

    /// @brief True when no errors were reported.
    [[nodiscard]] bool succeeded() const;
};

/// @brief Parse and analyze one recipe.
/// @details The source is registered with @p sm unless @p input names an
///          existing file id, so reported spans can be rendered afterwards.
ParseResult parseRecipe(const ParseInput &input,
                        const units::Converter &converter,
                        support::SourceManager &sm,
                        const ParseOptions &options = {},
                        analysis::MetadataValidator validator = {},
                        analysis::RecipeRefChecker checker = {});

/// @brief Parse only the metadata lines of one recipe.
/// @details Special keys are interpreted and validated as in parseRecipe;
///          steps, sections and components are skipped.
ParseResult parseMetadata(const ParseInput &input,
                          const units::Converter &converter,
                          support::SourceManager &sm,
                          const ParseOptions &options = {},
                          analysis::MetadataValidator validator = {});

} // namespace sous
