//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/sous/Sous.hpp
// Purpose: Umbrella header for the recipe parsing, analysis and scaling API.
// Key invariants: Includes only public entry points.
// Ownership/Lifetime: Header only.
// Links: src/pipeline/Pipeline.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "analysis/Checks.hpp"
#include "analysis/Sema.hpp"
#include "model/Metadata.hpp"
#include "model/Recipe.hpp"
#include "parse/Event.hpp"
#include "parse/Extensions.hpp"
#include "parse/Parser.hpp"
#include "pipeline/Pipeline.hpp"
#include "scale/Scaler.hpp"
#include "support/diag_codes.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"
#include "units/Converter.hpp"
#include "units/GroupedQuantity.hpp"
#include "units/Quantity.hpp"
#include "units/UnitsFile.hpp"
