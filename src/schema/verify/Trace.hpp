// File: src/schema/verify/Trace.hpp
// Purpose: Declare tracing configuration and sink for schema verification.
// Key invariants: Trace output is deterministic and line-oriented.
// Ownership/Lifetime: Sink holds configuration by value; the stream is borrowed.
#pragma once

#include "schema/core/Type.hpp"

#include <ostream>
#include <string_view>

namespace avrokit::verify
{

/// @brief Configuration for verifier tracing.
struct TraceConfig
{
    /// @brief Tracing modes.
    enum Mode
    {
        Off,  ///< Tracing disabled
        Names ///< One line per visited named type
    } mode{Off};

    /// @brief Destination stream; std::cerr when null.
    std::ostream *out = nullptr;

    /// @brief Check whether tracing is enabled.
    bool enabled() const;
};

/// @brief Sink that formats and emits trace lines.
class TraceSink
{
  public:
    explicit TraceSink(TraceConfig cfg = {});

    /// @brief Record that a named type resolved to @p fullname under @p enclosingNs.
    void onNamedType(const schema::Type &type, std::string_view enclosingNs, std::string_view fullname);

  private:
    std::ostream &stream() const;

    TraceConfig cfg_;
};

} // namespace avrokit::verify
