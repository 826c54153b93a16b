//===----------------------------------------------------------------------===//
//
// Part of the avrokit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the name resolver for Avro type descriptions: accessors
// for the raw name fields of each kind, canonicalization of short names,
// namespaces and fullnames, the Avro naming grammar, and per-type verification.
//
// A named type's namespace can come from three places. In order of precedence:
// a dotted name carries its own namespace (everything before the last dot); an
// explicit namespace applies to an undotted name; otherwise the namespace of
// the lexically enclosing named type is inherited. Fullnames join namespace
// and short name with a dot, or are the bare short name when the namespace is
// empty.
//
// Verification runs the grammar checks before canonicalization. Splitting at
// the last dot only yields meaningful parts for well-formed input, so a name
// must be known to be grammatical before its short name is extracted and
// compared against the reserved type names.
//
// Every function here is pure and may be called concurrently.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "schema/core/Type.hpp"
#include "support/result.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace avrokit::schema
{

/// @brief Short name and namespace of a type.
struct SplitName
{
    std::string name; ///< Unqualified short name.
    std::string ns;   ///< Namespace; empty when the name is unqualified.

    bool operator==(const SplitName &) const = default;
};

/// @brief Failure categories of per-type name verification.
enum class NameErrorKind
{
    InvalidName,     ///< Name, namespace or fullname violates the grammar.
    ReservedNameUsed ///< Canonical short name is a built-in type token.
};

/// @brief Verification failure with the string that caused it.
struct NameError
{
    NameErrorKind kind;
    std::string name; ///< Offending string, or the reserved short name.

    bool operator==(const NameError &) const = default;
};

/// @brief Outcome of verifyType.
using NameResult = support::Result<void, NameError>;

/// @brief True for kinds that carry a user-assigned name (record, enum, fixed).
[[nodiscard]] bool isNamedType(const Type &type);

/// @brief Name field as stored for named kinds, the intrinsic name for
///        primitives, or the kind token for array, map and union.
[[nodiscard]] std::string_view typeName(const Type &type);

/// @brief Namespace field as stored; empty for every kind that has none.
[[nodiscard]] std::string_view typeNamespace(const Type &type);

/// @brief Stored fullname of named kinds; the name itself for other kinds.
/// @note Not recomputed: callers must have resolved the type first.
[[nodiscard]] std::string_view typeFullname(const Type &type);

/// @brief Split @p fullname at its last dot into short name and namespace.
/// @return std::nullopt when @p fullname contains no dot.
[[nodiscard]] std::optional<SplitName> splitFullname(std::string_view fullname);

/// @brief Resolve the canonical short name and namespace of a type name.
/// @param name Raw name; a dotted name overrides both namespaces.
/// @param ns Explicit namespace, used when non-empty.
/// @param enclosingNs Namespace inherited from the enclosing type.
[[nodiscard]] SplitName resolveName(std::string_view name, std::string_view ns, std::string_view enclosingNs);

/// @brief Resolve using the name and namespace stored in @p type.
[[nodiscard]] SplitName resolveName(const Type &type, std::string_view enclosingNs);

/// @brief Canonical fullname for @p name in the given namespaces.
[[nodiscard]] std::string buildFullname(std::string_view name, std::string_view ns, std::string_view enclosingNs);

/// @brief Canonical fullname using the name and namespace stored in @p type.
[[nodiscard]] std::string buildFullname(const Type &type, std::string_view enclosingNs);

/// @brief Check a single name segment: [A-Za-z_][A-Za-z0-9_]*.
/// @details Applies to record field names, enum symbols and each component of
///          a dotted name.
[[nodiscard]] bool isCorrectName(std::string_view name);

/// @brief Check a name whose dot-separated components are all correct names.
[[nodiscard]] bool isCorrectDottedName(std::string_view name);

/// @brief Check whether @p shortName is one of the reserved type tokens.
[[nodiscard]] bool isReservedName(std::string_view shortName);

/// @brief Verify the name, namespace and fullname of a type.
/// @return Success for non-named kinds or valid names; the first failure
///         otherwise.
[[nodiscard]] NameResult verifyType(const Type &type);

} // namespace avrokit::schema
