//===----------------------------------------------------------------------===//
//
// Part of the avrokit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/schema/core/Type.cpp
// Purpose: Kind reporting, Avro spellings and factories for type descriptions.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Helpers shared by every consumer of the type description variant.
/// @details Factories are the programmatic equivalent of a schema parser: they
///          fill in the fullname of named kinds using the same resolution rules
///          the verifier later checks against.

#include "schema/core/Type.hpp"

#include "schema/names/Names.hpp"

#include <array>
#include <utility>

namespace avrokit::schema
{

Type::Kind Type::kind() const
{
    return std::visit(Overload{[](const PrimitiveType &) { return Kind::Primitive; },
                               [](const RecordType &) { return Kind::Record; },
                               [](const EnumType &) { return Kind::Enum; },
                               [](const FixedType &) { return Kind::Fixed; },
                               [](const ArrayType &) { return Kind::Array; },
                               [](const MapType &) { return Kind::Map; },
                               [](const UnionType &) { return Kind::Union; }},
                      v);
}

std::string_view kindToString(Type::Kind k)
{
    switch (k)
    {
        case Type::Kind::Primitive:
            return "primitive";
        case Type::Kind::Record:
            return kRecordName;
        case Type::Kind::Enum:
            return kEnumName;
        case Type::Kind::Fixed:
            return kFixedName;
        case Type::Kind::Array:
            return kArrayName;
        case Type::Kind::Map:
            return kMapName;
        case Type::Kind::Union:
            return kUnionName;
    }
    return "";
}

bool isPrimitiveName(std::string_view name)
{
    static constexpr std::array<std::string_view, 8> kPrimitives = {
        kNullName, kBooleanName, kIntName, kLongName, kFloatName, kDoubleName, kBytesName, kStringName};
    for (std::string_view p : kPrimitives)
    {
        if (p == name)
            return true;
    }
    return false;
}

TypePtr makePrimitive(std::string_view name)
{
    return std::make_shared<const Type>(Type{PrimitiveType{std::string(name)}});
}

TypePtr makeRecord(std::string name,
                   std::string ns,
                   std::string_view enclosingNs,
                   std::vector<RecordField> fields,
                   support::SourceLoc loc)
{
    std::string fullname = buildFullname(name, ns, enclosingNs);
    return std::make_shared<const Type>(Type{RecordType{
        std::move(name), std::move(ns), std::move(fullname), std::move(fields), loc}});
}

TypePtr makeEnum(std::string name,
                 std::string ns,
                 std::string_view enclosingNs,
                 std::vector<std::string> symbols,
                 support::SourceLoc loc)
{
    std::string fullname = buildFullname(name, ns, enclosingNs);
    return std::make_shared<const Type>(Type{
        EnumType{std::move(name), std::move(ns), std::move(fullname), std::move(symbols), loc}});
}

TypePtr makeFixed(std::string name,
                  std::string ns,
                  std::string_view enclosingNs,
                  uint32_t size,
                  support::SourceLoc loc)
{
    std::string fullname = buildFullname(name, ns, enclosingNs);
    return std::make_shared<const Type>(
        Type{FixedType{std::move(name), std::move(ns), std::move(fullname), size, loc}});
}

TypePtr makeArray(TypePtr items)
{
    return std::make_shared<const Type>(Type{ArrayType{std::move(items)}});
}

TypePtr makeMap(TypePtr values)
{
    return std::make_shared<const Type>(Type{MapType{std::move(values)}});
}

TypePtr makeUnion(std::vector<TypePtr> branches)
{
    return std::make_shared<const Type>(Type{UnionType{std::move(branches)}});
}

} // namespace avrokit::schema
