//===----------------------------------------------------------------------===//
//
// Part of the avrokit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Declares the diagnostic value reported by schema verification.
// Key invariants: None.
// Ownership/Lifetime: Diagnostics own their message text.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <string>

namespace avrokit::support
{

/// @brief Severity levels for diagnostics.
enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief Single diagnostic message with location.
struct Diagnostic
{
    Severity severity;   ///< Message severity
    std::string message; ///< Human-readable text
    SourceLoc loc;       ///< Optional source location
};

} // namespace avrokit::support
