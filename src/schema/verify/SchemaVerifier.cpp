//===----------------------------------------------------------------------===//
//
// Part of the avrokit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the recursive schema verifier. Per-type name checks come from the
// name resolver; this file adds what only makes sense across a tree:
// namespace inheritance, fullname consistency, fullname uniqueness, and the
// member checks of records, enums and unions.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Whole-schema name verification.
/// @details The walk is depth-first in declaration order, so diagnostics come
///          out in the order a reader of the schema would meet them.

#include "schema/verify/SchemaVerifier.hpp"

#include "schema/names/Names.hpp"

#include <unordered_set>
#include <utility>

using namespace avrokit::schema;

namespace avrokit::verify
{
namespace
{
using support::Diag;
using support::Expected;
using support::SourceLoc;

std::string quoted(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('\'');
    out.append(s);
    out.push_back('\'');
    return out;
}

/// @brief Identity of a union member: resolved fullname for named kinds,
///        the type token for everything else.
std::string unionMemberKey(const Type &member, std::string_view enclosingNs)
{
    if (isNamedType(member))
        return buildFullname(member, enclosingNs);
    return std::string(typeName(member));
}
} // namespace

SchemaVerifier::SchemaVerifier(support::Options opts, std::ostream *traceOut)
    : opts_(opts), trace_(TraceConfig{opts.trace ? TraceConfig::Names : TraceConfig::Off, traceOut})
{
}

Expected<void> SchemaVerifier::verify(const Type &root, const support::Options &opts)
{
    support::Options failFast = opts;
    failFast.failFast = true;
    SchemaVerifier verifier(failFast);
    CollectingDiagSink sink;
    return verifier.run(root, sink);
}

const SchemaVerifier::NameMap &SchemaVerifier::names() const
{
    return names_;
}

Expected<void> SchemaVerifier::run(const Type &root, DiagSink &sink)
{
    names_.clear();
    visited_.clear();
    first_.reset();
    sink_ = &sink;

    visit(root, "");

    sink_ = nullptr;
    if (first_)
        return Expected<void>{std::move(*first_)};
    return {};
}

bool SchemaVerifier::fail(Diag diag)
{
    if (!first_)
        first_ = diag;
    if (sink_)
        sink_->report(std::move(diag));
    return !opts_.failFast;
}

bool SchemaVerifier::firstVisit(const Type &type)
{
    return visited_.insert(&type).second;
}

bool SchemaVerifier::visit(const Type &type, std::string_view enclosingNs)
{
    return std::visit(Overload{[&](const PrimitiveType &t)
                               {
                                   if (isPrimitiveName(t.name))
                                       return true;
                                   return fail(makeVerifierError(VerifyDiagCode::PrimitiveUnknown,
                                                                 {},
                                                                 "unknown primitive type " + quoted(t.name)));
                               },
                               [&](const RecordType &t)
                               {
                                   if (!firstVisit(type))
                                       return true;
                                   std::string ns;
                                   return visitNamed(type, t.loc, enclosingNs, ns) && visitRecord(t, ns);
                               },
                               [&](const EnumType &t)
                               {
                                   if (!firstVisit(type))
                                       return true;
                                   std::string ns;
                                   return visitNamed(type, t.loc, enclosingNs, ns) && visitEnum(t);
                               },
                               [&](const FixedType &t)
                               {
                                   if (!firstVisit(type))
                                       return true;
                                   std::string ns;
                                   return visitNamed(type, t.loc, enclosingNs, ns);
                               },
                               [&](const ArrayType &t) { return visitChild(t.items, enclosingNs, {}); },
                               [&](const MapType &t) { return visitChild(t.values, enclosingNs, {}); },
                               [&](const UnionType &t) { return visitUnion(t, enclosingNs); }},
                      type.v);
}

bool SchemaVerifier::visitChild(const TypePtr &child, std::string_view enclosingNs, SourceLoc loc)
{
    if (!child)
        return fail(makeVerifierError(VerifyDiagCode::TypeMissing, loc, "type is missing"));
    return visit(*child, enclosingNs);
}

/// @brief Check one named type and compute the namespace its children inherit.
/// @details @p ns receives the resolved namespace, or @p enclosingNs when the
///          name is malformed and cannot be resolved. Fullname consistency and
///          uniqueness are only checked for well-formed names.
bool SchemaVerifier::visitNamed(const Type &type,
                                SourceLoc loc,
                                std::string_view enclosingNs,
                                std::string &ns)
{
    ns.assign(enclosingNs);

    if (const NameResult checked = verifyType(type); !checked)
        return fail(toDiag(checked.error(), loc));

    SplitName resolved = resolveName(type, enclosingNs);
    const std::string fullname = buildFullname(resolved.name, resolved.ns, "");
    ns = std::move(resolved.ns);

    trace_.onNamedType(type, enclosingNs, fullname);

    if (const std::string_view stored = typeFullname(type); stored != fullname)
    {
        if (!fail(makeVerifierError(VerifyDiagCode::FullnameMismatch,
                                    loc,
                                    "fullname " + quoted(stored) + " does not match resolved fullname " +
                                        quoted(fullname))))
            return false;
    }

    if (!names_.emplace(fullname, &type).second)
        return fail(makeVerifierError(
            VerifyDiagCode::NameDuplicate, loc, "duplicate definition of " + quoted(fullname)));

    return true;
}

bool SchemaVerifier::visitRecord(const RecordType &record, std::string_view ns)
{
    std::unordered_set<std::string_view> seen;
    for (const RecordField &field : record.fields)
    {
        if (!isCorrectName(field.name))
        {
            if (!fail(makeVerifierError(VerifyDiagCode::FieldInvalid,
                                        record.loc,
                                        "invalid field name " + quoted(field.name) + " in record " +
                                            quoted(record.fullname))))
                return false;
        }
        else if (!seen.insert(field.name).second)
        {
            if (!fail(makeVerifierError(VerifyDiagCode::FieldDuplicate,
                                        record.loc,
                                        "duplicate field " + quoted(field.name) + " in record " +
                                            quoted(record.fullname))))
                return false;
        }

        if (!visitChild(field.type, ns, record.loc))
            return false;
    }
    return true;
}

bool SchemaVerifier::visitEnum(const EnumType &enumType)
{
    std::unordered_set<std::string_view> seen;
    for (const std::string &symbol : enumType.symbols)
    {
        if (!isCorrectName(symbol))
        {
            if (!fail(makeVerifierError(VerifyDiagCode::EnumSymbolInvalid,
                                        enumType.loc,
                                        "invalid symbol " + quoted(symbol) + " in enum " +
                                            quoted(enumType.fullname))))
                return false;
        }
        else if (!seen.insert(symbol).second)
        {
            if (!fail(makeVerifierError(VerifyDiagCode::EnumSymbolDuplicate,
                                        enumType.loc,
                                        "duplicate symbol " + quoted(symbol) + " in enum " +
                                            quoted(enumType.fullname))))
                return false;
        }
    }
    return true;
}

bool SchemaVerifier::visitUnion(const UnionType &unionType, std::string_view enclosingNs)
{
    std::unordered_set<std::string> seen;
    for (const TypePtr &member : unionType.branches)
    {
        if (!member)
        {
            if (!fail(makeVerifierError(VerifyDiagCode::TypeMissing, {}, "union member is missing")))
                return false;
            continue;
        }

        if (member->kind() == Type::Kind::Union)
        {
            if (!fail(makeVerifierError(
                    VerifyDiagCode::UnionNested, {}, "union may not immediately contain another union")))
                return false;
        }
        else if (std::string key = unionMemberKey(*member, enclosingNs); !seen.insert(key).second)
        {
            if (!fail(makeVerifierError(
                    VerifyDiagCode::UnionDuplicate, {}, "union contains more than one " + quoted(key))))
                return false;
        }

        if (!visit(*member, enclosingNs))
            return false;
    }
    return true;
}

} // namespace avrokit::verify
