#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include "cpr/foundation/error_code.hpp"
#include "cpr/plugin/version_constraint.hpp"
#include "cpr/plugin/version_resolver.hpp"

using namespace cpr::plugin;
using cpr::foundation::ErrorCode;

namespace {

SemVersion V(const char* text) {
    return ParseSemVersion(text).value();
}

bool Accepts(const char* range, const char* version) {
    auto r = VersionRange::Parse(range);
    EXPECT_TRUE(r.hasValue()) << range;
    return r.hasValue() && r.value().IsSatisfiedBy(V(version));
}

DependencySpec Dep(const char* id, const char* range) {
    return DependencySpec{id, VersionRange::Parse(range).value()};
}

}  // namespace

// ===========================================================================
// SemVersion
// ===========================================================================

TEST(SemVersionTest, ParsesFullVersion) {
    auto v = ParseSemVersion("1.2.3-beta.1+build.5");
    ASSERT_TRUE(v.hasValue()) << v.error().message();
    EXPECT_EQ(v.value().major, 1u);
    EXPECT_EQ(v.value().minor, 2u);
    EXPECT_EQ(v.value().patch, 3u);
    ASSERT_EQ(v.value().prerelease.size(), 2u);
    EXPECT_EQ(v.value().prerelease[0], "beta");
    EXPECT_EQ(v.value().build, "build.5");
    EXPECT_EQ(v.value().ToString(), "1.2.3-beta.1+build.5");
}

TEST(SemVersionTest, RejectsNonStrictForms) {
    for (const char* bad : {"", "1", "1.2", "1.2.x", "01.2.3", "1.2.3.4", "v1.2.3", "1.2.3-"}) {
        auto v = ParseSemVersion(bad);
        ASSERT_TRUE(v.hasError()) << bad;
        EXPECT_EQ(v.error().code(), ErrorCode::InvalidArgument);
    }
}

TEST(SemVersionTest, PrecedenceFollowsSemver) {
    EXPECT_LT(V("1.0.0-alpha"), V("1.0.0-alpha.1"));
    EXPECT_LT(V("1.0.0-alpha.1"), V("1.0.0-alpha.beta"));
    EXPECT_LT(V("1.0.0-beta.2"), V("1.0.0-beta.11"));
    EXPECT_LT(V("1.0.0-rc.1"), V("1.0.0"));
    EXPECT_LT(V("1.9.9"), V("1.10.0"));
    EXPECT_EQ(V("1.0.0+a"), V("1.0.0+b"));
}

// ===========================================================================
// VersionRange
// ===========================================================================

TEST(VersionRangeTest, ExactPin) {
    EXPECT_TRUE(Accepts("1.2.3", "1.2.3"));
    EXPECT_TRUE(Accepts("==1.2.3", "1.2.3"));
    EXPECT_FALSE(Accepts("=1.2.3", "1.2.4"));
}

TEST(VersionRangeTest, Comparators) {
    EXPECT_TRUE(Accepts(">=1.0.0 <2.0.0", "1.9.9"));
    EXPECT_FALSE(Accepts(">=1.0.0 <2.0.0", "2.0.0"));
    EXPECT_TRUE(Accepts(">= 1.0.0, < 2.0.0", "1.0.0"));
    EXPECT_FALSE(Accepts(">1.0.0", "1.0.0"));
    EXPECT_TRUE(Accepts("<=2.1", "2.1.7"));
    EXPECT_FALSE(Accepts("<=2.1", "2.2.0"));
}

TEST(VersionRangeTest, Caret) {
    EXPECT_TRUE(Accepts("^1.2.0", "1.9.0"));
    EXPECT_FALSE(Accepts("^1.2.0", "2.0.0"));
    EXPECT_FALSE(Accepts("^1.2.0", "1.1.9"));
    EXPECT_TRUE(Accepts("^0.2.3", "0.2.9"));
    EXPECT_FALSE(Accepts("^0.2.3", "0.3.0"));
    EXPECT_FALSE(Accepts("^0.0.3", "0.0.4"));
}

TEST(VersionRangeTest, TildeAndCompatibleRelease) {
    EXPECT_TRUE(Accepts("~1.2.0", "1.2.9"));
    EXPECT_FALSE(Accepts("~1.2.0", "1.3.0"));
    EXPECT_TRUE(Accepts("~=1.5", "1.9.0"));
    EXPECT_FALSE(Accepts("~=1.5", "2.0.0"));
    EXPECT_FALSE(Accepts("~=1.5", "1.4.0"));
}

TEST(VersionRangeTest, Wildcards) {
    EXPECT_TRUE(Accepts("*", "0.0.1"));
    EXPECT_TRUE(Accepts("1.x", "1.7.2"));
    EXPECT_FALSE(Accepts("1.x", "2.0.0"));
    EXPECT_TRUE(Accepts("1.2.*", "1.2.5"));
    EXPECT_FALSE(Accepts("1.2.*", "1.3.0"));
}

TEST(VersionRangeTest, Alternatives) {
    EXPECT_TRUE(Accepts(">=1.0.0 <2.0.0 || ^3.0.0", "3.4.0"));
    EXPECT_TRUE(Accepts(">=1.0.0 <2.0.0 || ^3.0.0", "1.5.0"));
    EXPECT_FALSE(Accepts(">=1.0.0 <2.0.0 || ^3.0.0", "2.5.0"));
}

TEST(VersionRangeTest, UpperBoundsExcludeTheirPrereleases) {
    EXPECT_FALSE(Accepts("^1.0.0", "2.0.0-alpha"));
    EXPECT_FALSE(Accepts("<2.0.0", "2.0.0-rc.1"));
    EXPECT_FALSE(Accepts("~1.2.0", "1.3.0-beta"));
    EXPECT_FALSE(Accepts(">=1.0.0 <2.0.0", "1.5.0-beta"));
}

TEST(VersionRangeTest, PrereleaseMatchesSameTupleComparator) {
    EXPECT_TRUE(Accepts(">=1.2.3-alpha", "1.2.3-beta"));
    EXPECT_TRUE(Accepts("^1.2.3-alpha.1", "1.2.3-alpha.2"));
    EXPECT_FALSE(Accepts(">=1.2.3-alpha", "1.2.4-alpha"));
    EXPECT_TRUE(Accepts(">=1.2.3-alpha", "1.2.4"));
    EXPECT_TRUE(Accepts("<1.0.0 || >=2.0.0-rc.1", "2.0.0-rc.2"));
    EXPECT_TRUE(Accepts("*", "3.0.0-dev"));
}

TEST(VersionRangeTest, DefaultAcceptsEverything) {
    VersionRange any;
    EXPECT_TRUE(any.IsSatisfiedBy(V("99.0.0")));
    EXPECT_EQ(any.Text(), "*");
}

TEST(VersionRangeTest, MalformedRangesAreRejected) {
    for (const char* bad : {">", "^a.b", "1.2.3.4", ">=1.0.0 <", "~="}) {
        auto r = VersionRange::Parse(bad);
        ASSERT_TRUE(r.hasError()) << bad;
        EXPECT_EQ(r.error().code(), ErrorCode::InvalidArgument);
    }
}

// ===========================================================================
// VersionResolver::Resolve
// ===========================================================================

TEST(VersionResolverTest, AllSatisfied) {
    std::unordered_map<std::string, SemVersion> available{{"core", V("1.4.0")},
                                                          {"text", V("2.0.0")}};
    auto report = VersionResolver::Resolve(available, {Dep("core", "^1.0.0"), Dep("text", ">=2")});
    EXPECT_TRUE(report.AllSatisfied());
    EXPECT_TRUE(report.DescribeUnsatisfied().empty());
    ASSERT_EQ(report.results.size(), 2u);
    EXPECT_EQ(report.results[0].found->ToString(), "1.4.0");
}

TEST(VersionResolverTest, MissingAndMismatchAreDistinguished) {
    std::unordered_map<std::string, SemVersion> available{{"core", V("2.1.0")}};
    auto report = VersionResolver::Resolve(available, {Dep("core", "^1.0.0"), Dep("text", "*")});

    EXPECT_FALSE(report.AllSatisfied());
    ASSERT_EQ(report.results.size(), 2u);
    EXPECT_EQ(report.results[0].status, DependencyResolution::Status::VersionMismatch);
    EXPECT_EQ(report.results[1].status, DependencyResolution::Status::Missing);

    auto text = report.DescribeUnsatisfied();
    EXPECT_NE(text.find("2.1.0"), std::string::npos);
    EXPECT_NE(text.find("'text'"), std::string::npos);
}

TEST(VersionResolverTest, NoDependenciesIsSatisfied) {
    auto report = VersionResolver::Resolve({}, {});
    EXPECT_TRUE(report.AllSatisfied());
}

// ===========================================================================
// VersionResolver::StartupOrder
// ===========================================================================

TEST(StartupOrderTest, DependenciesComeFirst) {
    std::map<std::string, std::vector<std::string>> graph{
        {"app", {"db", "log"}}, {"db", {"log"}}, {"log", {}}};
    auto plan = VersionResolver::StartupOrder(graph);

    ASSERT_EQ(plan.order, (std::vector<std::string>{"log", "db", "app"}));
    EXPECT_TRUE(plan.blocked.empty());
    EXPECT_TRUE(plan.cyclePath.empty());
}

TEST(StartupOrderTest, TiesBrokenById) {
    std::map<std::string, std::vector<std::string>> graph{{"c", {}}, {"a", {}}, {"b", {}}};
    auto plan = VersionResolver::StartupOrder(graph);
    EXPECT_EQ(plan.order, (std::vector<std::string>{"a", "b", "c"}));
}

TEST(StartupOrderTest, EdgesToUnknownIdsAreIgnored) {
    std::map<std::string, std::vector<std::string>> graph{{"a", {"elsewhere"}}};
    auto plan = VersionResolver::StartupOrder(graph);
    EXPECT_EQ(plan.order, (std::vector<std::string>{"a"}));
}

TEST(StartupOrderTest, CycleBlocksMembersAndDependents) {
    std::map<std::string, std::vector<std::string>> graph{
        {"a", {"b"}}, {"b", {"a"}}, {"c", {"a"}}, {"d", {}}};
    auto plan = VersionResolver::StartupOrder(graph);

    EXPECT_EQ(plan.order, (std::vector<std::string>{"d"}));
    auto blocked = plan.blocked;
    std::sort(blocked.begin(), blocked.end());
    EXPECT_EQ(blocked, (std::vector<std::string>{"a", "b", "c"}));

    ASSERT_GE(plan.cyclePath.size(), 3u);
    EXPECT_EQ(plan.cyclePath.front(), plan.cyclePath.back());
}
