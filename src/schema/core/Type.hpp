//===----------------------------------------------------------------------===//
//
// Part of the avrokit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: schema/core/Type.hpp
// Purpose: Declares the closed set of Avro type descriptions.
// Key invariants: Named kinds (record, enum, fixed) carry name, namespace and
//                 fullname; unnamed kinds use fixed Avro tokens; primitives
//                 carry only their intrinsic name.
// Ownership/Lifetime: Types are immutable values; children are shared through
//                     TypePtr so subtrees can be reused across schemas.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace avrokit::schema
{

/// Avro type tokens. The first eleven also form the reserved-name table.
inline constexpr std::string_view kNullName = "null";
inline constexpr std::string_view kBooleanName = "boolean";
inline constexpr std::string_view kIntName = "int";
inline constexpr std::string_view kLongName = "long";
inline constexpr std::string_view kFloatName = "float";
inline constexpr std::string_view kDoubleName = "double";
inline constexpr std::string_view kBytesName = "bytes";
inline constexpr std::string_view kStringName = "string";
inline constexpr std::string_view kArrayName = "array";
inline constexpr std::string_view kMapName = "map";
inline constexpr std::string_view kUnionName = "union";
inline constexpr std::string_view kRecordName = "record";
inline constexpr std::string_view kEnumName = "enum";
inline constexpr std::string_view kFixedName = "fixed";

struct Type;

/// @brief Shared handle to an immutable type description.
using TypePtr = std::shared_ptr<const Type>;

/// @brief Built-in scalar type; its fullname is its name.
struct PrimitiveType
{
    std::string name; ///< One of the eight primitive tokens.
};

/// @brief Single field of a record.
struct RecordField
{
    std::string name; ///< Field name; must be a simple (undotted) name.
    TypePtr type;     ///< Field type.
};

/// @brief Named product type.
struct RecordType
{
    std::string name;                ///< Raw name as written; may be dotted.
    std::string ns;                  ///< Explicit namespace; may be empty.
    std::string fullname;            ///< Canonical dotted name once resolved.
    std::vector<RecordField> fields; ///< Fields in declaration order.
    support::SourceLoc loc{};        ///< Where the record was defined.
};

/// @brief Named enumeration.
struct EnumType
{
    std::string name;
    std::string ns;
    std::string fullname;
    std::vector<std::string> symbols; ///< Symbols in declaration order.
    support::SourceLoc loc{};
};

/// @brief Named fixed-size byte sequence.
struct FixedType
{
    std::string name;
    std::string ns;
    std::string fullname;
    uint32_t size = 0; ///< Number of bytes.
    support::SourceLoc loc{};
};

struct ArrayType
{
    TypePtr items;
};

struct MapType
{
    TypePtr values; ///< Value type; map keys are always strings.
};

struct UnionType
{
    std::vector<TypePtr> branches;
};

/// @brief Type description: exactly one of the kinds above.
/// @details Consumers dispatch with std::visit so that adding a kind breaks
///          every switch that forgets to handle it.
struct Type
{
    /// @brief Enumerates the kinds in variant order.
    enum class Kind
    {
        Primitive,
        Record,
        Enum,
        Fixed,
        Array,
        Map,
        Union
    };

    using Variant =
        std::variant<PrimitiveType, RecordType, EnumType, FixedType, ArrayType, MapType, UnionType>;

    Variant v; ///< Active kind and its payload.

    /// @brief Report the active kind.
    [[nodiscard]] Kind kind() const;
};

/// @brief Convert kind @p k to its Avro spelling ("record", "array", ...).
/// @details Primitives have no single spelling and map to "primitive".
std::string_view kindToString(Type::Kind k);

/// @brief Provide an overload set for visiting Type::Variant.
template <typename... Ts> struct Overload : Ts...
{
    using Ts::operator()...;
};

template <typename... Ts> Overload(Ts...) -> Overload<Ts...>;

/// @brief Check whether @p name is one of the eight primitive tokens.
[[nodiscard]] bool isPrimitiveName(std::string_view name);

/// @name Factories
/// Named factories store the raw name and namespace as given and compute the
/// fullname against @p enclosingNs. None of them validate.
/// @{
TypePtr makePrimitive(std::string_view name);
TypePtr makeRecord(std::string name,
                   std::string ns,
                   std::string_view enclosingNs,
                   std::vector<RecordField> fields,
                   support::SourceLoc loc = {});
TypePtr makeEnum(std::string name,
                 std::string ns,
                 std::string_view enclosingNs,
                 std::vector<std::string> symbols,
                 support::SourceLoc loc = {});
TypePtr makeFixed(std::string name,
                  std::string ns,
                  std::string_view enclosingNs,
                  uint32_t size,
                  support::SourceLoc loc = {});
TypePtr makeArray(TypePtr items);
TypePtr makeMap(TypePtr values);
TypePtr makeUnion(std::vector<TypePtr> branches);
/// @}

} // namespace avrokit::schema
