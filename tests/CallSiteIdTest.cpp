#include <gtest/gtest.h>

#include <string>
#include <unordered_set>

#include "CallSite.hpp"
#include "FirstTime.hpp"

namespace fc {
namespace {

TEST(CallSiteIdTest, LocationKeepsItsParts) {
    CallSiteId id = CallSiteId::fromLocation("src/Screen.cpp", 42, 7);
    EXPECT_EQ(id.kind(), CallSiteId::Kind::Location);
    EXPECT_EQ(id.name(), "src/Screen.cpp");
    EXPECT_EQ(id.line(), 42u);
    EXPECT_EQ(id.column(), 7u);
}

TEST(CallSiteIdTest, TokenHasNoLineOrColumn) {
    CallSiteId id = CallSiteId::fromToken("settings:onboarding");
    EXPECT_EQ(id.kind(), CallSiteId::Kind::Token);
    EXPECT_EQ(id.name(), "settings:onboarding");
    EXPECT_EQ(id.line(), 0u);
    EXPECT_EQ(id.column(), 0u);
}

TEST(CallSiteIdTest, NullFileBecomesEmptyName) {
    CallSiteId id = CallSiteId::fromLocation(static_cast<const char*>(nullptr), 3, 4);
    EXPECT_EQ(id.name(), "");
    EXPECT_EQ(id, CallSiteId::fromLocation(std::string(), 3, 4));
}

TEST(CallSiteIdTest, NaiveConcatenationCollisionsStayDistinct) {
    CallSiteId a = CallSiteId::fromLocation("a", 1, 23);
    CallSiteId b = CallSiteId::fromLocation("a1", 2, 3);
    CallSiteId c = CallSiteId::fromLocation("a", 12, 3);
    EXPECT_NE(a, b);
    EXPECT_NE(a, c);
    EXPECT_NE(b, c);

    std::unordered_set<CallSiteId, CallSiteIdHash> set{a, b, c};
    EXPECT_EQ(set.size(), 3u);
}

TEST(CallSiteIdTest, TokenNeverEqualsLocation) {
    EXPECT_NE(CallSiteId::fromToken("f"), CallSiteId::fromLocation("f", 0, 0));
}

TEST(CallSiteIdTest, EqualIdsHashEqually) {
    CallSiteId a = CallSiteId::fromLocation("x.cpp", 10, 2);
    CallSiteId b = CallSiteId::fromLocation(std::string("x.cpp"), 10, 2);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.hash(), b.hash());
    EXPECT_EQ(CallSiteIdHash{}(a), a.hash());
}

TEST(CallSiteIdTest, CurrentUsesSourceLocation) {
    const std::source_location loc = std::source_location::current();
    CallSiteId id = CallSiteId::current(loc);
    EXPECT_EQ(id.kind(), CallSiteId::Kind::Location);
    EXPECT_EQ(id.name(), std::string(loc.file_name()));
    EXPECT_EQ(id.line(), loc.line());
    EXPECT_EQ(id.column(), loc.column());
}

TEST(CallSiteIdTest, MacroCapturesDistinctLines) {
    CallSiteId first = FC_CALLSITE();
    CallSiteId second = FC_CALLSITE();
    EXPECT_NE(first, second);
    EXPECT_EQ(first.line() + 1, second.line());
}

TEST(CallSiteIdTest, DescribeFormats) {
    EXPECT_EQ(describe(CallSiteId::fromLocation("a.cpp", 3, 9)), "a.cpp:3:9");
    EXPECT_EQ(describe(CallSiteId::fromToken("boot")), "token:boot");
}

} // namespace
} // namespace fc
