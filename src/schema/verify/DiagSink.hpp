//===----------------------------------------------------------------------===//
//
// Part of the avrokit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the diagnostic plumbing of the schema verifier: the
// structured codes identifying each kind of failure, helpers that build
// diagnostics carrying those codes, and the sink interface the verifier reports
// through.
//
// A sink decouples the walk over a schema from what happens to its findings.
// The verifier itself only decides whether to keep going after a failure; a
// collaborator loading many schemas may keep every diagnostic, forward them to
// an editor, or stop at the first one.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "schema/names/Names.hpp"
#include "support/diag_expected.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace avrokit::verify
{

/// @brief Identifier for structured verifier diagnostics.
enum class VerifyDiagCode
{
    Unknown = 0,         ///< Unclassified diagnostic.
    NameInvalid,         ///< Name, namespace or fullname violates the naming grammar.
    NameReserved,        ///< Canonical short name is a reserved type token.
    FullnameMismatch,    ///< Stored fullname differs from the resolved one.
    NameDuplicate,       ///< Two named types share a fullname.
    FieldInvalid,        ///< Record field name violates the simple-name grammar.
    FieldDuplicate,      ///< Record declares the same field name twice.
    EnumSymbolInvalid,   ///< Enum symbol violates the simple-name grammar.
    EnumSymbolDuplicate, ///< Enum declares the same symbol twice.
    UnionNested,         ///< Union directly contains another union.
    UnionDuplicate,      ///< Union contains two members of the same type.
    TypeMissing,         ///< Child type handle is null.
    PrimitiveUnknown     ///< Primitive carries a name that is not a primitive token.
};

/// @brief Convert a verifier diagnostic code to its textual prefix.
/// @return Stable string view such as "verify.name.invalid"; empty for Unknown.
std::string_view toString(VerifyDiagCode code);

/// @brief Construct a diagnostic tagged with a verifier code.
/// @param code Structured diagnostic code.
/// @param severity Diagnostic severity classification.
/// @param loc Optional source location associated with the diagnostic.
/// @param message Human readable payload appended after the code prefix.
support::Diag makeVerifierDiag(VerifyDiagCode code,
                               support::Severity severity,
                               support::SourceLoc loc,
                               std::string message);

/// @brief Convenience wrapper that constructs an error diagnostic.
support::Diag makeVerifierError(VerifyDiagCode code, support::SourceLoc loc, std::string message);

/// @brief Convert a name verification failure into a diagnostic at @p loc.
support::Diag toDiag(const schema::NameError &error, support::SourceLoc loc);

/// @brief Interface for verifier components to report diagnostics without coupling to storage.
class DiagSink
{
  public:
    virtual ~DiagSink() = default;

    /// @brief Report a diagnostic to the sink.
    virtual void report(support::Diag diag) = 0;
};

/// @brief Concrete sink that stores diagnostics in-memory for later inspection.
class CollectingDiagSink : public DiagSink
{
  public:
    void report(support::Diag diag) override;

    /// @brief Access the accumulated diagnostics in arrival order.
    [[nodiscard]] const std::vector<support::Diag> &diagnostics() const;

    /// @brief Remove all stored diagnostics.
    void clear();

  private:
    std::vector<support::Diag> diags_;
};

} // namespace avrokit::verify
