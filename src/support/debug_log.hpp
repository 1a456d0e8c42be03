//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/debug_log.hpp
// Purpose: Environment-gated developer tracing for the recipe pipeline.
// Key invariants: Tracing is decided once per process from SOUS_DEBUG.
// Ownership/Lifetime: Stateless; writes directly to stderr.
// Links: pipeline/Pipeline.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>

namespace sous::support
{

/// @brief True when SOUS_DEBUG is set to a non-empty value.
bool isDebugLoggingEnabled() noexcept;

/// @brief Print "[DEBUG][component] message" to stderr when tracing is on.
void debugLog(std::string_view component, std::string_view message);

} // namespace sous::support
