#include <gtest/gtest.h>

#include "cpr/foundation/error_code.hpp"
#include "cpr/plugin/host_policy.hpp"

#include "../../fixtures/test_support.hpp"

using namespace cpr::plugin;
using cpr::foundation::ErrorCode;

namespace {

const char* kTieredPolicy = R"(
default_tier: trusted
tiers:
  trusted:
    permissions: ["*"]
  untrusted:
    permissions: ["state.*", "events.publish"]
    isolated: true
    limits: { cpu_time_ms: 2000, memory_bytes: 268435456, wall_clock_ms: 5000 }
extensions:
  com.example.greeter:
    tier: untrusted
    limits: { max_output_bytes: 65536 }
  com.example.pinned:
    permissions: [events.subscribe]
    limits: { max_concurrency: 2 }
)";

}  // namespace

TEST(HostPolicyTest, DefaultIsPermissive) {
    HostPolicy policy;
    auto resolved = policy.Resolve("anything");
    EXPECT_EQ(resolved.tier, "trusted");
    EXPECT_TRUE(resolved.Allows("net.http"));
    EXPECT_FALSE(resolved.isolated);
    EXPECT_FALSE(resolved.limits.HasCpuLimit());
    EXPECT_FALSE(resolved.limits.HasWallClockLimit());
}

TEST(HostPolicyTest, TierAndOverridesResolveFieldByField) {
    auto policy = HostPolicy::FromString(kTieredPolicy);
    ASSERT_TRUE(policy.hasValue()) << policy.error().message();

    auto greeter = policy.value().Resolve("com.example.greeter");
    EXPECT_EQ(greeter.tier, "untrusted");
    EXPECT_TRUE(greeter.isolated);
    EXPECT_TRUE(greeter.Allows("state.write"));
    EXPECT_TRUE(greeter.Allows("events.publish"));
    EXPECT_FALSE(greeter.Allows("events.subscribe"));
    EXPECT_EQ(greeter.limits.cpuTime, std::chrono::milliseconds(2000));
    EXPECT_EQ(greeter.limits.memoryBytes, 268435456u);
    EXPECT_EQ(greeter.limits.wallClock, std::chrono::milliseconds(5000));
    EXPECT_EQ(greeter.limits.maxOutputBytes, 65536u);

    auto pinned = policy.value().Resolve("com.example.pinned");
    EXPECT_EQ(pinned.tier, "trusted");
    EXPECT_EQ(pinned.allowedPermissions, (std::vector<std::string>{"events.subscribe"}));
    EXPECT_EQ(pinned.limits.maxConcurrency, 2u);
    EXPECT_FALSE(pinned.isolated);

    auto other = policy.value().Resolve("com.example.unknown");
    EXPECT_EQ(other.tier, "trusted");
    EXPECT_TRUE(other.Allows("anything.at.all"));
}

TEST(HostPolicyTest, SingleTierBecomesDefault) {
    auto policy = HostPolicy::FromString("tiers:\n  sandbox:\n    isolated: true\n");
    ASSERT_TRUE(policy.hasValue());
    EXPECT_EQ(policy.value().DefaultTier(), "sandbox");
    EXPECT_TRUE(policy.value().Resolve("x").isolated);
    EXPECT_FALSE(policy.value().Resolve("x").Allows("state.read"));
}

TEST(HostPolicyTest, PermissionMatches) {
    EXPECT_TRUE(HostPolicy::PermissionMatches("*", "state.write"));
    EXPECT_TRUE(HostPolicy::PermissionMatches("state.*", "state.write"));
    EXPECT_TRUE(HostPolicy::PermissionMatches("state.*", "state.write.deep"));
    EXPECT_FALSE(HostPolicy::PermissionMatches("state.*", "state"));
    EXPECT_FALSE(HostPolicy::PermissionMatches("state.*", "statement"));
    EXPECT_TRUE(HostPolicy::PermissionMatches("events.publish", "events.publish"));
    EXPECT_FALSE(HostPolicy::PermissionMatches("events.publish", "events.subscribe"));
}

TEST(HostPolicyTest, InvalidDocumentsAreRejected) {
    const char* cases[] = {
        "- just\n- a list\n",
        "tiers: [a, b]\n",
        "tiers:\n  a: {permissions: state.write}\n",
        "tiers:\n  a: {limits: {cpu_time_ms: -1}}\n",
        "default_tier: missing\ntiers:\n  a: {}\n",
        "tiers:\n  a: {}\nextensions:\n  x: {tier: nope}\n",
        "tiers:\n  a: {limits: {memory_bytes: lots}}\n",
        "{ unterminated",
    };
    for (const auto* text : cases) {
        auto r = HostPolicy::FromString(text);
        ASSERT_TRUE(r.hasError()) << text;
        EXPECT_EQ(r.error().code(), ErrorCode::PolicyInvalid) << text;
    }
}

TEST(HostPolicyTest, LoadFromFile) {
    cpr::test::TempDir tmp;
    cpr::test::WriteFile(tmp.path() / "policy.yaml", kTieredPolicy);

    auto loaded = HostPolicy::Load(tmp.path() / "policy.yaml");
    ASSERT_TRUE(loaded.hasValue());
    EXPECT_TRUE(loaded.value().HasTier("untrusted"));

    auto missing = HostPolicy::Load(tmp.path() / "absent.yaml");
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error().code(), ErrorCode::ConfigLoadFailed);
}
