//===----------------------------------------------------------------------===//
//
// Part of the avrokit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic helpers shared by the schema verifier: code to
// prefix translation, diagnostic construction and the collecting sink.
//
//===----------------------------------------------------------------------===//

#include "schema/verify/DiagSink.hpp"

#include <utility>

namespace
{
/// @brief Map a verifier diagnostic code to its string prefix.
/// @details Prefixes are grouped by the construct they concern
///          ("verify.name.*", "verify.field.*", ...) and are part of the
///          user-visible message, so they must stay stable.
std::string_view diagCodeToPrefix(avrokit::verify::VerifyDiagCode code)
{
    using avrokit::verify::VerifyDiagCode;
    switch (code)
    {
        case VerifyDiagCode::Unknown:
            return {};
        case VerifyDiagCode::NameInvalid:
            return "verify.name.invalid";
        case VerifyDiagCode::NameReserved:
            return "verify.name.reserved";
        case VerifyDiagCode::FullnameMismatch:
            return "verify.name.fullname";
        case VerifyDiagCode::NameDuplicate:
            return "verify.name.duplicate";
        case VerifyDiagCode::FieldInvalid:
            return "verify.field.invalid";
        case VerifyDiagCode::FieldDuplicate:
            return "verify.field.duplicate";
        case VerifyDiagCode::EnumSymbolInvalid:
            return "verify.enum.invalid";
        case VerifyDiagCode::EnumSymbolDuplicate:
            return "verify.enum.duplicate";
        case VerifyDiagCode::UnionNested:
            return "verify.union.nested";
        case VerifyDiagCode::UnionDuplicate:
            return "verify.union.duplicate";
        case VerifyDiagCode::TypeMissing:
            return "verify.type.missing";
        case VerifyDiagCode::PrimitiveUnknown:
            return "verify.type.primitive";
    }
    return {};
}
} // namespace

namespace avrokit::verify
{

std::string_view toString(VerifyDiagCode code)
{
    return diagCodeToPrefix(code);
}

/// @brief Construct a diagnostic value tagged with a verifier code.
/// @details Prepends "<prefix>: " to the message when the code has a prefix;
///          an empty message becomes the bare prefix.
support::Diag makeVerifierDiag(VerifyDiagCode code,
                               support::Severity severity,
                               support::SourceLoc loc,
                               std::string message)
{
    const std::string_view prefix = diagCodeToPrefix(code);
    if (!prefix.empty())
    {
        if (!message.empty())
        {
            message.insert(0, ": ");
            message.insert(0, prefix);
        }
        else
        {
            message.assign(prefix);
        }
    }
    return {severity, std::move(message), loc};
}

support::Diag makeVerifierError(VerifyDiagCode code, support::SourceLoc loc, std::string message)
{
    return makeVerifierDiag(code, support::Severity::Error, loc, std::move(message));
}

support::Diag toDiag(const schema::NameError &error, support::SourceLoc loc)
{
    switch (error.kind)
    {
        case schema::NameErrorKind::InvalidName:
            return makeVerifierError(VerifyDiagCode::NameInvalid, loc, "invalid name '" + error.name + "'");
        case schema::NameErrorKind::ReservedNameUsed:
            return makeVerifierError(
                VerifyDiagCode::NameReserved, loc, "reserved name '" + error.name + "' used for type name");
    }
    return makeVerifierError(VerifyDiagCode::Unknown, loc, error.name);
}

void CollectingDiagSink::report(support::Diag diag)
{
    diags_.push_back(std::move(diag));
}

const std::vector<support::Diag> &CollectingDiagSink::diagnostics() const
{
    return diags_;
}

void CollectingDiagSink::clear()
{
    diags_.clear();
}

} // namespace avrokit::verify
