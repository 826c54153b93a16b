//===----------------------------------------------------------------------===//
//
// Part of the avrokit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the SchemaVerifier, which validates a whole type tree
// rather than a single type description.
//
// The walk carries the enclosing namespace downwards. A named type's resolved
// namespace becomes the enclosing namespace of everything nested inside it;
// arrays, maps and unions pass their enclosing namespace through unchanged.
// At every named type the verifier runs the per-type name checks, confirms the
// stored fullname matches the one resolved in context, and records the
// fullname in a table so a second definition under the same fullname is
// reported. A named type shared through the same TypePtr in several places is
// one definition: it is checked where it first appears and skipped afterwards. Record field names, enum symbols and union members are checked
// along the way.
//
// In fail-fast mode the walk stops at the first failure. Otherwise every
// failure is reported to the sink and the first one is returned, so a caller
// can present every problem in a schema at once.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "schema/core/Type.hpp"
#include "schema/verify/DiagSink.hpp"
#include "schema/verify/Trace.hpp"
#include "support/diag_expected.hpp"
#include "support/options.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace avrokit::verify
{

/// @brief Validates names throughout an Avro type tree.
class SchemaVerifier
{
  public:
    using NameMap = std::unordered_map<std::string, const schema::Type *>;

    /// @brief Create a verifier.
    /// @param opts Verification settings.
    /// @param traceOut Trace destination used when @c opts.trace is set; std::cerr when null.
    explicit SchemaVerifier(support::Options opts = {}, std::ostream *traceOut = nullptr);

    /// @brief Verify @p root, stopping at the first failure.
    /// @return Empty Expected on success; the first diagnostic otherwise.
    [[nodiscard]] static support::Expected<void> verify(const schema::Type &root,
                                                        const support::Options &opts = {});

    /// @brief Verify @p root and report failures to @p sink.
    /// @return Empty Expected on success; the first diagnostic otherwise.
    support::Expected<void> run(const schema::Type &root, DiagSink &sink);

    /// @brief Named types defined by the last run, keyed by fullname.
    /// @details Pointers refer into the verified tree and are valid while it lives.
    [[nodiscard]] const NameMap &names() const;

  private:
    /// @brief Walk @p type; returns false once the walk must stop.
    bool visit(const schema::Type &type, std::string_view enclosingNs);
    bool visitChild(const schema::TypePtr &child, std::string_view enclosingNs, support::SourceLoc loc);
    bool visitNamed(const schema::Type &type, support::SourceLoc loc, std::string_view enclosingNs, std::string &ns);
    bool visitRecord(const schema::RecordType &record, std::string_view ns);
    bool visitEnum(const schema::EnumType &enumType);
    bool visitUnion(const schema::UnionType &unionType, std::string_view enclosingNs);

    /// @brief Record @p type as visited; false when the walk reached it before.
    bool firstVisit(const schema::Type &type);

    /// @brief Report @p diag; returns whether the walk may continue.
    bool fail(support::Diag diag);

    support::Options opts_;
    TraceSink trace_;
    NameMap names_;
    std::unordered_set<const schema::Type *> visited_;
    DiagSink *sink_ = nullptr;
    std::optional<support::Diag> first_;
};

} // namespace avrokit::verify
