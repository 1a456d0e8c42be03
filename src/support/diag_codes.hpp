//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file diag_codes.hpp
/// @brief Stable diagnostic codes for every stage of the recipe pipeline.
///
/// @details Each diagnostic has:
///   - A code ("P001", "A006", "U001") shown in formatted reports
///   - A slug name ("unterminated-component", ...) for filtering and tests
///   - A kind telling which stage raised it
///
/// P codes come from the event parser, A codes from semantic analysis and U
/// codes from the unit converter.
///
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace sous::support
{

/// @brief Stage that raised a diagnostic.
enum class DiagKind
{
    Syntax,
    Semantic,
    Conversion
};

/// @brief Individual diagnostic codes.
enum class DiagCode : uint16_t
{
    // Event parser.
    P001_UnterminatedComponent = 1,
    P002_AmbiguousDecimalName,
    P003_BadName,
    P004_InvalidMetadataLine,
    P005_InvalidSectionLine,
    P006_EmptyMetadataValue,
    P007_ComponentPartIgnored,
    P008_DuplicateModifier,
    P009_ConflictingModifiers,
    P010_EmptyComponent,
    P011_InvalidNumber,
    P012_DivisionByZero,
    P013_InvertedRange,
    P014_InvalidIntermediateReference,
    P015_UnterminatedBlockComment,

    // Semantic analysis.
    A001_EmptyUnit,
    A002_UnknownUnit,
    A003_ReferenceNotFound,
    A004_IntermediateOutOfRange,
    A005_IntermediateNotBefore,
    A006_ConflictingServings,
    A007_InvalidSpecialMetadata,
    A008_MetadataRejected,
    A009_MetadataError,
    A010_RecipeNotFound,
    A011_AmbiguousRecipeReference,
    A012_RedundantTimeOverride,
    A013_DuplicateMetadataKey,
    A014_TimerUnitNotTime,
    A015_TimerMissingUnit,
    A016_RedundantServings,

    // Unit conversion.
    U001_IncompatibleUnits,
    U002_UnknownUnit,
    U003_NoUnit,
    U004_TextValue,
    U005_BestUnitNotFound,
    U006_DuplicateUnit,
    U007_InvalidUnitsFile,
};

/// @brief Total number of defined diagnostic codes.
inline constexpr uint16_t kDiagCodeCount = 38;

/// @brief Code string for @p code (e.g. "P001"); "????" when unknown.
const char *diagCodeStr(DiagCode code);

/// @brief Slug name for @p code (e.g. "bad-name"); "unknown" when unknown.
const char *diagCodeName(DiagCode code);

/// @brief Stage that owns @p code.
DiagKind diagKind(DiagCode code);

/// @brief Parse a code from either its code string or its slug name.
std::optional<DiagCode> parseDiagCode(std::string_view name);

} // namespace sous::support
