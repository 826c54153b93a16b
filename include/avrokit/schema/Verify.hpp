//===----------------------------------------------------------------------===//
//
// Part of the avrokit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/avrokit/schema/Verify.hpp
// Purpose: Stable façade exposing schema verifier entry points.
// Key invariants: Mirrors avrokit::verify::SchemaVerifier public API only.
// Ownership/Lifetime: Caller retains ownership of schemas and diagnostic sinks.
#pragma once

#include "schema/verify/SchemaVerifier.hpp"

/// @file include/avrokit/schema/Verify.hpp
/// @brief Public forwarding header providing whole-schema verification.
