//===----------------------------------------------------------------------===//
//
// Part of the avrokit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements name resolution and name verification for Avro type
// descriptions. The accessors dispatch over the type variant; everything else
// works on plain strings.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Canonicalization and grammar checks for Avro type names.
/// @details splitFullname always splits at the rightmost dot. The dotted-name
///          grammar is defined in terms of that split, so a malformed name such
///          as "a..b" splits into "b" and "a." and is rejected when the "a."
///          remainder is checked in turn.

#include "schema/names/Names.hpp"

#include <array>

namespace avrokit::schema
{
namespace
{
using support::kErrorTag;

/// The format's built-in primitive and collection type tokens.
constexpr std::array<std::string_view, 11> kReservedNames = {kNullName,
                                                             kBooleanName,
                                                             kIntName,
                                                             kLongName,
                                                             kFloatName,
                                                             kDoubleName,
                                                             kBytesName,
                                                             kStringName,
                                                             kArrayName,
                                                             kMapName,
                                                             kUnionName};

bool isNameStart(char c)
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_';
}

bool isNameChar(char c)
{
    return isNameStart(c) || (c >= '0' && c <= '9');
}

std::string makeFullname(std::string_view name, std::string_view ns)
{
    if (ns.empty())
        return std::string(name);
    std::string full;
    full.reserve(ns.size() + 1 + name.size());
    full.append(ns);
    full.push_back('.');
    full.append(name);
    return full;
}

NameResult invalidName(std::string_view name)
{
    return NameResult(kErrorTag, NameError{NameErrorKind::InvalidName, std::string(name)});
}
} // namespace

bool isNamedType(const Type &type)
{
    return std::visit(Overload{[](const RecordType &) { return true; },
                               [](const EnumType &) { return true; },
                               [](const FixedType &) { return true; },
                               [](const PrimitiveType &) { return false; },
                               [](const ArrayType &) { return false; },
                               [](const MapType &) { return false; },
                               [](const UnionType &) { return false; }},
                      type.v);
}

std::string_view typeName(const Type &type)
{
    return std::visit(Overload{[](const PrimitiveType &t) -> std::string_view { return t.name; },
                               [](const RecordType &t) -> std::string_view { return t.name; },
                               [](const EnumType &t) -> std::string_view { return t.name; },
                               [](const FixedType &t) -> std::string_view { return t.name; },
                               [](const ArrayType &) { return kArrayName; },
                               [](const MapType &) { return kMapName; },
                               [](const UnionType &) { return kUnionName; }},
                      type.v);
}

std::string_view typeNamespace(const Type &type)
{
    return std::visit(Overload{[](const PrimitiveType &) { return std::string_view(); },
                               [](const RecordType &t) -> std::string_view { return t.ns; },
                               [](const EnumType &t) -> std::string_view { return t.ns; },
                               [](const FixedType &t) -> std::string_view { return t.ns; },
                               [](const ArrayType &) { return std::string_view(); },
                               [](const MapType &) { return std::string_view(); },
                               [](const UnionType &) { return std::string_view(); }},
                      type.v);
}

std::string_view typeFullname(const Type &type)
{
    return std::visit(Overload{[](const PrimitiveType &t) -> std::string_view { return t.name; },
                               [](const RecordType &t) -> std::string_view { return t.fullname; },
                               [](const EnumType &t) -> std::string_view { return t.fullname; },
                               [](const FixedType &t) -> std::string_view { return t.fullname; },
                               [](const ArrayType &) { return kArrayName; },
                               [](const MapType &) { return kMapName; },
                               [](const UnionType &) { return kUnionName; }},
                      type.v);
}

std::optional<SplitName> splitFullname(std::string_view fullname)
{
    const auto dot = fullname.rfind('.');
    if (dot == std::string_view::npos)
        return std::nullopt;
    return SplitName{std::string(fullname.substr(dot + 1)), std::string(fullname.substr(0, dot))};
}

/// @brief Resolve short name and namespace.
/// @details Precedence is self-qualification, then the explicit namespace,
///          then the enclosing namespace. A dotted @p name ignores both
///          namespace arguments entirely.
SplitName resolveName(std::string_view name, std::string_view ns, std::string_view enclosingNs)
{
    if (auto split = splitFullname(name))
        return *std::move(split);
    return SplitName{std::string(name), std::string(ns.empty() ? enclosingNs : ns)};
}

SplitName resolveName(const Type &type, std::string_view enclosingNs)
{
    return resolveName(typeName(type), typeNamespace(type), enclosingNs);
}

std::string buildFullname(std::string_view name, std::string_view ns, std::string_view enclosingNs)
{
    const SplitName resolved = resolveName(name, ns, enclosingNs);
    return makeFullname(resolved.name, resolved.ns);
}

std::string buildFullname(const Type &type, std::string_view enclosingNs)
{
    return buildFullname(typeName(type), typeNamespace(type), enclosingNs);
}

bool isCorrectName(std::string_view name)
{
    if (name.empty() || !isNameStart(name.front()))
        return false;
    for (char c : name.substr(1))
    {
        if (!isNameChar(c))
            return false;
    }
    return true;
}

bool isCorrectDottedName(std::string_view name)
{
    const auto split = splitFullname(name);
    if (!split)
        return isCorrectName(name);
    return isCorrectName(split->name) && isCorrectDottedName(split->ns);
}

bool isReservedName(std::string_view shortName)
{
    for (std::string_view reserved : kReservedNames)
    {
        if (reserved == shortName)
            return true;
    }
    return false;
}

/// @brief Verify a type's names in three steps.
/// @details Non-named kinds pass. Otherwise the raw name, the namespace (when
///          present) and the stored fullname must each be correct dotted names,
///          checked in that order. Only then is the short name resolved, with
///          no enclosing namespace since only the short name matters, and
///          compared against the reserved tokens.
NameResult verifyType(const Type &type)
{
    if (!isNamedType(type))
        return NameResult::success();

    const std::string_view name = typeName(type);
    const std::string_view ns = typeNamespace(type);
    const std::string_view fullname = typeFullname(type);

    if (!isCorrectDottedName(name))
        return invalidName(name);
    if (!ns.empty() && !isCorrectDottedName(ns))
        return invalidName(ns);
    if (!isCorrectDottedName(fullname))
        return invalidName(fullname);

    SplitName canonical = resolveName(name, ns, "");
    if (isReservedName(canonical.name))
        return NameResult::failure(NameError{NameErrorKind::ReservedNameUsed, std::move(canonical.name)});

    return NameResult::success();
}

} // namespace avrokit::schema
