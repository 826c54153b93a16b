// File: tests/unit/test_schema_names_grammar.cpp
// Purpose: Verify the simple and dotted Avro naming grammar.
// Key invariants: Simple names match [A-Za-z_][A-Za-z0-9_]*; dotted names are
//                 dot-joined simple names with no empty component.

#include <gtest/gtest.h>

#include "schema/names/Names.hpp"

#include <string>
#include <vector>

using namespace avrokit::schema;

TEST(SchemaNameGrammar, AcceptsSimpleNames)
{
    for (const char *name : {"_", "a", "Aa1", "a_A"})
        EXPECT_TRUE(isCorrectName(name)) << name;
}

TEST(SchemaNameGrammar, RejectsMalformedSimpleNames)
{
    for (const char *name : {"", "1", " a", "a ", " a ", ".", "a.b.c"})
        EXPECT_FALSE(isCorrectName(name)) << '"' << name << '"';
}

TEST(SchemaNameGrammar, RejectsNonAsciiLetters)
{
    EXPECT_FALSE(isCorrectName("caf\xc3\xa9"));
    EXPECT_FALSE(isCorrectName("a-b"));
    EXPECT_FALSE(isCorrectName("a$"));
}

TEST(SchemaNameGrammar, AcceptsDottedNames)
{
    for (const char *name : {"_", "a", "A._1", "a1.b2.c3"})
        EXPECT_TRUE(isCorrectDottedName(name)) << name;
}

TEST(SchemaNameGrammar, RejectsMalformedDottedNames)
{
    for (const char *name :
         {"", "1", " a.b.c", "a.b.c ", " a.b.c ", "a..b", ".a.b", "a.1.b", "!", "-", "a. b.c"})
        EXPECT_FALSE(isCorrectDottedName(name)) << '"' << name << '"';
}

TEST(SchemaNameGrammar, DottedGrammarAgreesWithSimpleGrammarWithoutDots)
{
    const std::vector<std::string> samples = {"", "_", "x", "X9", "9x", "a b", "a_b_c", "!", "\t"};
    for (const std::string &s : samples)
        EXPECT_EQ(isCorrectDottedName(s), isCorrectName(s)) << '"' << s << '"';
}

TEST(SchemaNameGrammar, RejectsEmptyComponents)
{
    for (const char *name : {"a..b", ".a", "a.", "..", "a.b..c", "a.b.", ".a.b.c"})
        EXPECT_FALSE(isCorrectDottedName(name)) << '"' << name << '"';
}

TEST(SchemaNameGrammar, ReservedNamesAreTheBuiltinTypeTokens)
{
    for (const char *name :
         {"null", "boolean", "int", "long", "float", "double", "bytes", "string", "array", "map", "union"})
        EXPECT_TRUE(isReservedName(name)) << name;

    EXPECT_FALSE(isReservedName("record"));
    EXPECT_FALSE(isReservedName("enum"));
    EXPECT_FALSE(isReservedName("fixed"));
    EXPECT_FALSE(isReservedName("Int"));
    EXPECT_FALSE(isReservedName("a.int"));
}
