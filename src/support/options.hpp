//===----------------------------------------------------------------------===//
//
// Part of the avrokit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/options.hpp
// Purpose: Declares the settings that influence schema verification.
// Key invariants: None.
// Ownership/Lifetime: Caller owns option values.
//
//===----------------------------------------------------------------------===//

#pragma once

namespace avrokit::support
{

/// @brief Settings that control how a schema is verified.
/// @invariant Flags are independent booleans.
/// @ownership Value type.
struct Options
{
    /// @brief Emit a trace line for every named type the verifier visits.
    bool trace = false;

    /// @brief Stop at the first failure instead of reporting every failure.
    bool failFast = true;
};
} // namespace avrokit::support
