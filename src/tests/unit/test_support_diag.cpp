// File: tests/unit/test_support_diag.cpp
// Purpose: Verify diagnostic printing, source manager ids and result containers.
// Key invariants: File id 0 is never assigned; locations print as path:line:col.

#include <gtest/gtest.h>

#include "support/diag_expected.hpp"
#include "support/result.hpp"
#include "support/source_manager.hpp"

#include <sstream>
#include <string>

using namespace avrokit::support;

TEST(SupportSourceManager, AssignsStableIdsToNormalizedPaths)
{
    SourceManager sm;
    const uint32_t first = sm.addFile("schemas/./order.avsc");
    const uint32_t again = sm.addFile("schemas/order.avsc");
    const uint32_t other = sm.addFile("schemas/line.avsc");

    EXPECT_NE(first, 0u);
    EXPECT_EQ(first, again);
    EXPECT_NE(first, other);
    EXPECT_EQ(sm.fileCount(), 2u);
    EXPECT_EQ(sm.getPath(first), "schemas/order.avsc");
    EXPECT_TRUE(sm.getPath(0).empty());
    EXPECT_TRUE(sm.getPath(99).empty());
}

TEST(SupportPrintDiag, PrefixesResolvedLocation)
{
    SourceManager sm;
    const uint32_t id = sm.addFile("order.avsc");

    std::ostringstream out;
    printDiag(makeError({id, 12, 5}, "invalid name 'a..b'"), out, &sm);
    EXPECT_EQ(out.str(), "order.avsc:12:5: error: invalid name 'a..b'\n");
}

TEST(SupportPrintDiag, OmitsUnknownLocationParts)
{
    SourceManager sm;
    const uint32_t id = sm.addFile("order.avsc");

    std::ostringstream lineOnly;
    printDiag(makeError({id, 3, 0}, "m"), lineOnly, &sm);
    EXPECT_EQ(lineOnly.str(), "order.avsc:3: error: m\n");

    std::ostringstream noManager;
    printDiag(Diag{Severity::Warning, "w", {id, 3, 1}}, noManager);
    EXPECT_EQ(noManager.str(), "warning: w\n");

    std::ostringstream unknown;
    printDiag(Diag{Severity::Note, "n", {}}, unknown, &sm);
    EXPECT_EQ(unknown.str(), "note: n\n");
}

TEST(SupportExpected, HoldsValueOrDiagnostic)
{
    Expected<std::string> ok(std::string("Point"));
    ASSERT_TRUE(ok.hasValue());
    EXPECT_EQ(ok.value(), "Point");

    Expected<std::string> bad(makeError({}, "boom"));
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().message, "boom");

    Expected<void> done;
    EXPECT_TRUE(done.hasValue());
    Expected<void> failed(makeError({}, "nope"));
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().severity, Severity::Error);
}

TEST(SupportResult, CarriesTypedError)
{
    auto ok = Result<int, std::string>::success(42);
    ASSERT_TRUE(ok.isOk());
    EXPECT_EQ(ok.value(), 42);

    auto bad = Result<int, std::string>::failure("bad");
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error(), "bad");

    auto voidOk = Result<void, int>::success();
    EXPECT_TRUE(voidOk.isOk());
    auto voidBad = Result<void, int>::failure(7);
    ASSERT_FALSE(voidBad.isOk());
    EXPECT_EQ(voidBad.error(), 7);
}
