// File: tests/unit/test_schema_verify_type.cpp
// Purpose: Verify per-type name verification.
// Key invariants: Grammar failures report the offending string; reserved
//                 short names are rejected even when namespaced.

#include <gtest/gtest.h>

#include "schema/core/Type.hpp"
#include "schema/names/Names.hpp"
#include "schema/verify/DiagSink.hpp"

using namespace avrokit::schema;

namespace
{
TypePtr testType(std::string name, std::string ns)
{
    return makeFixed(std::move(name), std::move(ns), "", 16);
}

/// @brief Fixed type with every field set directly, bypassing resolution.
Type rawFixed(std::string name, std::string ns, std::string fullname)
{
    return Type{FixedType{std::move(name), std::move(ns), std::move(fullname), 8, {}}};
}
} // namespace

TEST(SchemaVerifyType, AcceptsWellFormedNames)
{
    EXPECT_TRUE(verifyType(*testType("tname", "name.space")).isOk());
    EXPECT_TRUE(verifyType(*testType("tname", "")).isOk());
    EXPECT_TRUE(verifyType(*testType("a.b.tname", "")).isOk());
}

TEST(SchemaVerifyType, RejectsEmptyName)
{
    for (const char *ns : {"", "name.space"})
    {
        auto result = verifyType(*testType("", ns));
        ASSERT_FALSE(result.isOk()) << ns;
        EXPECT_EQ(result.error().kind, NameErrorKind::InvalidName);
        EXPECT_EQ(result.error().name, "");
    }
}

TEST(SchemaVerifyType, ReportsOffendingNamespace)
{
    auto result = verifyType(*testType("tname", "bad..ns"));
    ASSERT_FALSE(result.isOk());
    EXPECT_EQ(result.error(), (NameError{NameErrorKind::InvalidName, "bad..ns"}));
}

TEST(SchemaVerifyType, ChecksNameBeforeNamespace)
{
    auto result = verifyType(*testType("1bad", "2bad"));
    ASSERT_FALSE(result.isOk());
    EXPECT_EQ(result.error().name, "1bad");
}

TEST(SchemaVerifyType, ReportsOffendingStoredFullname)
{
    auto result = verifyType(rawFixed("tname", "ns", "ns..tname"));
    ASSERT_FALSE(result.isOk());
    EXPECT_EQ(result.error(), (NameError{NameErrorKind::InvalidName, "ns..tname"}));

    auto unresolved = verifyType(rawFixed("tname", "ns", ""));
    ASSERT_FALSE(unresolved.isOk());
    EXPECT_EQ(unresolved.error().kind, NameErrorKind::InvalidName);
}

TEST(SchemaVerifyType, RejectsReservedShortNames)
{
    auto plain = verifyType(*testType("int", ""));
    ASSERT_FALSE(plain.isOk());
    EXPECT_EQ(plain.error(), (NameError{NameErrorKind::ReservedNameUsed, "int"}));

    auto namespaced = verifyType(*testType("int", "a.b"));
    ASSERT_FALSE(namespaced.isOk());
    EXPECT_EQ(namespaced.error().kind, NameErrorKind::ReservedNameUsed);

    auto dotted = verifyType(*makeRecord("com.acme.map", "", "", {}));
    ASSERT_FALSE(dotted.isOk());
    EXPECT_EQ(dotted.error(), (NameError{NameErrorKind::ReservedNameUsed, "map"}));
}

TEST(SchemaVerifyType, ReservedTokenInNamespaceIsAllowed)
{
    EXPECT_TRUE(verifyType(*testType("Value", "int.string")).isOk());
}

TEST(SchemaVerifyType, UnnamedKindsAlwaysPass)
{
    EXPECT_TRUE(verifyType(*makePrimitive(kIntName)).isOk());
    EXPECT_TRUE(verifyType(*makeArray(makePrimitive(kIntName))).isOk());
    EXPECT_TRUE(verifyType(*makeMap(makePrimitive(kIntName))).isOk());
    EXPECT_TRUE(verifyType(*makeUnion({})).isOk());
}

TEST(SchemaVerifyType, ConvertsFailuresToDiagnostics)
{
    using avrokit::verify::toDiag;
    const avrokit::support::SourceLoc loc{3, 7, 2};

    auto invalid = toDiag(NameError{NameErrorKind::InvalidName, "a..b"}, loc);
    EXPECT_EQ(invalid.severity, avrokit::support::Severity::Error);
    EXPECT_EQ(invalid.message, "verify.name.invalid: invalid name 'a..b'");
    EXPECT_EQ(invalid.loc.line, 7u);

    auto reserved = toDiag(NameError{NameErrorKind::ReservedNameUsed, "int"}, {});
    EXPECT_EQ(reserved.message, "verify.name.reserved: reserved name 'int' used for type name");
}
