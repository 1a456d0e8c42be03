//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file diag_codes.cpp
/// @brief Diagnostic code tables.
///
//===----------------------------------------------------------------------===//

#include "support/diag_codes.hpp"

namespace sous::support
{

namespace
{

struct DiagCodeInfo
{
    DiagCode code;
    const char *codeStr; ///< e.g., "P001"
    const char *name;    ///< e.g., "unterminated-component"
};

/// @brief Indexed by (code - 1). Must be kept in sync with DiagCode.
constexpr DiagCodeInfo kDiagTable[] = {
    {DiagCode::P001_UnterminatedComponent, "P001", "unterminated-component"},
    {DiagCode::P002_AmbiguousDecimalName, "P002", "ambiguous-decimal-name"},
    {DiagCode::P003_BadName, "P003", "bad-name"},
    {DiagCode::P004_InvalidMetadataLine, "P004", "invalid-metadata-line"},
    {DiagCode::P005_InvalidSectionLine, "P005", "invalid-section-line"},
    {DiagCode::P006_EmptyMetadataValue, "P006", "empty-metadata-value"},
    {DiagCode::P007_ComponentPartIgnored, "P007", "component-part-ignored"},
    {DiagCode::P008_DuplicateModifier, "P008", "duplicate-modifier"},
    {DiagCode::P009_ConflictingModifiers, "P009", "conflicting-modifiers"},
    {DiagCode::P010_EmptyComponent, "P010", "empty-component"},
    {DiagCode::P011_InvalidNumber, "P011", "invalid-number"},
    {DiagCode::P012_DivisionByZero, "P012", "division-by-zero"},
    {DiagCode::P013_InvertedRange, "P013", "inverted-range"},
    {DiagCode::P014_InvalidIntermediateReference, "P014", "invalid-intermediate-reference"},
    {DiagCode::P015_UnterminatedBlockComment, "P015", "unterminated-block-comment"},
    {DiagCode::A001_EmptyUnit, "A001", "empty-unit"},
    {DiagCode::A002_UnknownUnit, "A002", "unknown-unit"},
    {DiagCode::A003_ReferenceNotFound, "A003", "reference-not-found"},
    {DiagCode::A004_IntermediateOutOfRange, "A004", "intermediate-out-of-range"},
    {DiagCode::A005_IntermediateNotBefore, "A005", "intermediate-not-before"},
    {DiagCode::A006_ConflictingServings, "A006", "conflicting-servings"},
    {DiagCode::A007_InvalidSpecialMetadata, "A007", "invalid-special-metadata"},
    {DiagCode::A008_MetadataRejected, "A008", "metadata-rejected"},
    {DiagCode::A009_MetadataError, "A009", "metadata-error"},
    {DiagCode::A010_RecipeNotFound, "A010", "recipe-not-found"},
    {DiagCode::A011_AmbiguousRecipeReference, "A011", "ambiguous-recipe-reference"},
    {DiagCode::A012_RedundantTimeOverride, "A012", "redundant-time-override"},
    {DiagCode::A013_DuplicateMetadataKey, "A013", "duplicate-metadata-key"},
    {DiagCode::A014_TimerUnitNotTime, "A014", "timer-unit-not-time"},
    {DiagCode::A015_TimerMissingUnit, "A015", "timer-missing-unit"},
    {DiagCode::A016_RedundantServings, "A016", "redundant-servings"},
    {DiagCode::U001_IncompatibleUnits, "U001", "incompatible-units"},
    {DiagCode::U002_UnknownUnit, "U002", "unknown-unit"},
    {DiagCode::U003_NoUnit, "U003", "no-unit"},
    {DiagCode::U004_TextValue, "U004", "text-value"},
    {DiagCode::U005_BestUnitNotFound, "U005", "best-unit-not-found"},
    {DiagCode::U006_DuplicateUnit, "U006", "duplicate-unit"},
    {DiagCode::U007_InvalidUnitsFile, "U007", "invalid-units-file"},
};

static_assert(sizeof(kDiagTable) / sizeof(kDiagTable[0]) == kDiagCodeCount,
              "kDiagTable must have exactly kDiagCodeCount entries");

const DiagCodeInfo *lookupInfo(DiagCode code)
{
    auto idx = static_cast<uint16_t>(code);
    if (idx < 1 || idx > kDiagCodeCount)
        return nullptr;
    return &kDiagTable[idx - 1];
}

} // namespace

const char *diagCodeStr(DiagCode code)
{
    const auto *info = lookupInfo(code);
    return info ? info->codeStr : "????";
}

const char *diagCodeName(DiagCode code)
{
    const auto *info = lookupInfo(code);
    return info ? info->name : "unknown";
}

DiagKind diagKind(DiagCode code)
{
    switch (diagCodeStr(code)[0])
    {
        case 'P':
            return DiagKind::Syntax;
        case 'U':
            return DiagKind::Conversion;
        default:
            return DiagKind::Semantic;
    }
}

std::optional<DiagCode> parseDiagCode(std::string_view name)
{
    for (const auto &entry : kDiagTable)
    {
        if (name == entry.codeStr)
            return entry.code;
    }

    // "unknown-unit" exists in both A and U ranges; the analysis code wins.
    for (const auto &entry : kDiagTable)
    {
        if (name == entry.name)
            return entry.code;
    }

    return std::nullopt;
}

} // namespace sous::support
