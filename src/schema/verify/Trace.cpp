//===----------------------------------------------------------------------===//
//
// Part of the avrokit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/schema/verify/Trace.cpp
// Purpose: Emit one trace line per named type visited by the schema verifier.
// Key invariants: Each call produces at most one flushed line and honours
//                 TraceConfig::mode.
// Ownership/Lifetime: The sink borrows the destination stream.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Verifier tracing.
/// @details Lines have the form
///          "[NAMES] record com.acme.Point (name=Point ns=com.acme enclosing=)"
///          and show, for every named type, the raw fields alongside the
///          namespace it inherited and the fullname it resolved to. This is
///          usually the quickest way to see why a reference fails to resolve.

#include "schema/verify/Trace.hpp"

#include "schema/names/Names.hpp"

#include <iostream>

namespace avrokit::verify
{

bool TraceConfig::enabled() const
{
    return mode != Off;
}

TraceSink::TraceSink(TraceConfig cfg) : cfg_(cfg) {}

std::ostream &TraceSink::stream() const
{
    return cfg_.out ? *cfg_.out : std::cerr;
}

void TraceSink::onNamedType(const schema::Type &type,
                            std::string_view enclosingNs,
                            std::string_view fullname)
{
    if (!cfg_.enabled())
        return;

    std::ostream &os = stream();
    os << "[NAMES] " << schema::kindToString(type.kind()) << ' ' << fullname
       << " (name=" << schema::typeName(type) << " ns=" << schema::typeNamespace(type)
       << " enclosing=" << enclosingNs << ")\n"
       << std::flush;
}

} // namespace avrokit::verify
