//===----------------------------------------------------------------------===//
//
// Part of the avrokit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/avrokit/schema/Names.hpp
// Purpose: Stable façade exposing the type model and the name resolver.
// Key invariants: Mirrors schema/core/Type.hpp and schema/names/Names.hpp only.
// Ownership/Lifetime: Callers own every type description they build.
#pragma once

#include "schema/core/Type.hpp"
#include "schema/names/Names.hpp"

/// @file include/avrokit/schema/Names.hpp
/// @brief Public forwarding header providing type descriptions and name
///        resolution without requiring downstreams to include src/ paths.
