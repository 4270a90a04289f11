/// @file isolation_test.cpp
/// @brief Isolated execution: the echo extension runs in cpr_extension_worker
///        under the sandbox tier, with rlimits and a host-side wall clock.

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include "cpr/foundation/error_code.hpp"
#include "cpr/plugin/extension_runtime.hpp"

#include "../../fixtures/test_support.hpp"

using namespace cpr::plugin;
using cpr::foundation::ErrorCode;
using cpr::foundation::RuntimeError;
using cpr::test::EchoManifest;
using cpr::test::TempDir;
using cpr::test::WriteExtension;

namespace {

const char* kSandboxPolicy = R"(
default_tier: sandbox
tiers:
  sandbox:
    permissions: ["state.*", "events.*"]
    isolated: true
extensions:
  iso-slow: {limits: {wall_clock_ms: 500}}
  iso-cpu:  {limits: {cpu_time_ms: 500}}
  iso-mem:  {limits: {memory_bytes: 1073741824}}
)";

YAML::Node input(const std::string& yaml) {
    return YAML::Load(yaml);
}

std::string limitOf(const RuntimeError& error) {
    const auto* limit = error.context<std::string>();
    return limit != nullptr ? *limit : "";
}

}  // namespace

// ============================================================================
// Through the runtime
// ============================================================================

class IsolationTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto root = tmp_.path() / "extensions";
        for (const char* id : {"iso", "iso-slow", "iso-cpu", "iso-mem", "iso-noinit", "iso-nostart"}) {
            WriteExtension(root, id, EchoManifest(id));
        }
        cpr::test::WriteFile(root / "iso-noinit" / "refuse-init", "");
        cpr::test::WriteFile(root / "iso-nostart" / "refuse-start", "");
        WriteExtension(root, "iso-static", cpr::test::RecorderManifest("iso-static"));
        WriteExtension(root, "iso-liar", EchoManifest("iso-liar", "1.0.0", "  - name: dance\n"));
        cpr::test::WriteFile(tmp_.path() / "policy.yaml", kSandboxPolicy);

        RuntimeOptions options;
        options.pluginDirs = {root};
        options.stateDir = tmp_.path() / "state";
        options.policyFile = tmp_.path() / "policy.yaml";
        options.workerPath = cpr::test::kWorkerPath;
        runtime_ = std::make_unique<ExtensionRuntime>(std::move(options));
        ASSERT_TRUE(runtime_->Init().hasValue());
        ASSERT_TRUE(runtime_->Scan().hasValue());
    }

    void Launch(const std::string& id) {
        ASSERT_TRUE(runtime_->Initialize(id).hasValue()) << id;
        ASSERT_TRUE(runtime_->Start(id).hasValue()) << id;
    }

    TempDir tmp_;
    std::unique_ptr<ExtensionRuntime> runtime_;
};

TEST_F(IsolationTest, IsolatedEntriesHaveNoHostInstance) {
    auto entry = runtime_->GetRegistry().Find("iso");
    ASSERT_NE(entry, nullptr);
    EXPECT_TRUE(entry->IsIsolated());
    EXPECT_EQ(entry->instance, nullptr);
    EXPECT_EQ(entry->state.load(), LifecycleState::Registered);
}

TEST_F(IsolationTest, StaticEntryCannotBeIsolated) {
    auto entry = runtime_->GetRegistry().Find("iso-static");
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->state.load(), LifecycleState::Error);
    ASSERT_TRUE(entry->LastError().has_value());
    EXPECT_EQ(entry->LastError()->code(), ErrorCode::ExtensionLoadFailed);
}

TEST_F(IsolationTest, UnsupportedDeclaredActionFailsLoad) {
    auto entry = runtime_->GetRegistry().Find("iso-liar");
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->state.load(), LifecycleState::Error);
    EXPECT_NE(std::string(entry->LastError()->message()).find("dance"), std::string::npos);
}

TEST_F(IsolationTest, InitializeRunsHookInWorker) {
    std::vector<std::string> seen;
    runtime_->Bus().Subscribe("extension.*", [&](const Event& e) { seen.push_back(e.type); });

    auto r = runtime_->Initialize("iso-noinit");
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::ExtensionInitFailed);
    EXPECT_EQ(runtime_->Lifecycle().GetState("iso-noinit").value(), LifecycleState::Error);
    EXPECT_EQ(seen, (std::vector<std::string>{"extension.error"}));
}

TEST_F(IsolationTest, StartRunsHookInWorker) {
    ASSERT_TRUE(runtime_->Initialize("iso-nostart").hasValue());
    EXPECT_EQ(runtime_->Lifecycle().GetState("iso-nostart").value(),
              LifecycleState::Initialized);

    auto r = runtime_->Start("iso-nostart");
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::ExtensionStartFailed);
    EXPECT_EQ(runtime_->Lifecycle().GetState("iso-nostart").value(), LifecycleState::Error);
    EXPECT_TRUE(runtime_->Invoke("iso-nostart", "echo", input("x")).hasError());
}

TEST_F(IsolationTest, EchoRunsInWorker) {
    Launch("iso");
    auto r = runtime_->Invoke("iso", "echo", input("{greeting: hi, list: [1, 2]}"));
    ASSERT_TRUE(r.hasValue()) << r.error().message();
    EXPECT_EQ(r.value().value()["greeting"].as<std::string>(), "hi");
    EXPECT_EQ(r.value().value()["list"].size(), 2u);
}

TEST_F(IsolationTest, StreamPullsChunksFromWorker) {
    Launch("iso");
    auto r = runtime_->Invoke("iso", "count", input("{n: 5}"));
    ASSERT_TRUE(r.hasValue()) << r.error().message();
    ASSERT_TRUE(r.value().IsStream());
    auto stream = r.value().stream();

    std::vector<int> seen;
    for (auto chunk = stream->Next(); chunk.hasValue() && chunk.value(); chunk = stream->Next()) {
        seen.push_back(chunk.value()->as<int>());
    }
    EXPECT_EQ(seen, (std::vector<int>{0, 1, 2, 3, 4}));
    EXPECT_EQ(stream->State(), StreamState::Completed);
}

TEST_F(IsolationTest, CancelledStreamTerminatesWorker) {
    Launch("iso");
    auto stream = runtime_->Invoke("iso", "count", input("{n: 1000}")).value().stream();
    ASSERT_TRUE(stream->Next().hasValue());
    stream->Cancel();
    EXPECT_EQ(stream->State(), StreamState::Cancelled);

    // A fresh worker serves the next invocation.
    EXPECT_TRUE(runtime_->Invoke("iso", "echo", input("again")).hasValue());
}

TEST_F(IsolationTest, StreamFailureInWorker) {
    Launch("iso");
    auto stream = runtime_->Invoke("iso", "fail_after", input("{n: 1}")).value().stream();
    EXPECT_EQ(stream->Next().value()->as<int>(), 0);

    auto failed = stream->Next();
    ASSERT_TRUE(failed.hasError());
    EXPECT_EQ(failed.error().code(), ErrorCode::StreamConsumptionFailed);
    EXPECT_NE(std::string(failed.error().message()).find("producer broke"), std::string::npos);
}

TEST_F(IsolationTest, EventsAreForwardedToHostBus) {
    Launch("iso");
    std::vector<std::string> seen;
    runtime_->Bus().Subscribe("echo.published", [&](const Event& e) {
        seen.push_back(e.source + ":" + e.payload["tag"].as<std::string>());
    });

    auto r = runtime_->Invoke("iso", "publish", input("{tag: forwarded}"));
    ASSERT_TRUE(r.hasValue()) << r.error().message();
    EXPECT_EQ(seen, (std::vector<std::string>{"iso:forwarded"}));
}

TEST_F(IsolationTest, SubscribeIsRejectedInWorker) {
    Launch("iso");
    auto r = runtime_->Invoke("iso", "subscribe", input("{pattern: \"host.*\"}"));
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::SubscriptionUnavailable);
    EXPECT_NE(std::string(r.error().message()).find("isolated"), std::string::npos);
}

TEST_F(IsolationTest, StatePersistsAcrossWorkers) {
    Launch("iso");
    ASSERT_TRUE(runtime_->Invoke("iso", "save", input("{key: visits, value: 7}")).hasValue());

    auto loaded = runtime_->Invoke("iso", "load", input("{key: visits}"));
    ASSERT_TRUE(loaded.hasValue()) << loaded.error().message();
    EXPECT_EQ(loaded.value().value().as<int>(), 7);
    EXPECT_EQ(runtime_->Store().Load("iso", "visits").value().as<int>(), 7);
}

TEST_F(IsolationTest, CrashIsIsolationFailure) {
    Launch("iso");
    auto r = runtime_->Invoke("iso", "crash");
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::IsolationFailure);

    // The host and the entry survive.
    EXPECT_EQ(runtime_->Lifecycle().GetState("iso").value(), LifecycleState::Started);
    EXPECT_TRUE(runtime_->Invoke("iso", "echo", input("still here")).hasValue());
}

TEST_F(IsolationTest, WallClockKillsWorker) {
    Launch("iso-slow");
    auto r = runtime_->Invoke("iso-slow", "slow", input("{ms: 5000}"));
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::ResourceLimitExceeded);
    EXPECT_EQ(limitOf(r.error()), "wall_clock");
    EXPECT_EQ(runtime_->GetRegistry().Find("iso-slow")->violations.load(), 1u);

    EXPECT_TRUE(runtime_->Invoke("iso-slow", "slow", input("{ms: 1}")).hasValue());
}

TEST_F(IsolationTest, CpuLimitEndsWorker) {
    Launch("iso-cpu");
    auto r = runtime_->Invoke("iso-cpu", "burn", input("{ms: 10000}"));
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::ResourceLimitExceeded);
    EXPECT_EQ(limitOf(r.error()), "cpu_time");
}

TEST_F(IsolationTest, KillUnderCpuLimitIsNotCpuTime) {
    Launch("iso-cpu");
    auto r = runtime_->Invoke("iso-cpu", "crash", input("{signal: 9}"));
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::IsolationFailure);
    EXPECT_NE(std::string(r.error().message()).find("signal 9"), std::string::npos);
    EXPECT_EQ(runtime_->GetRegistry().Find("iso-cpu")->violations.load(), 0u);
}

TEST_F(IsolationTest, MemoryLimitIsReported) {
    Launch("iso-mem");
    EXPECT_TRUE(runtime_->Invoke("iso-mem", "alloc", input("{mb: 8}")).hasValue());

    auto r = runtime_->Invoke("iso-mem", "alloc", input("{mb: 2048}"));
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::ResourceLimitExceeded);
    EXPECT_EQ(limitOf(r.error()), "memory");
}

// ============================================================================
// IsolatedExecutor directly
// ============================================================================

TEST(IsolatedExecutorTest, DescribeListsSupportedActions) {
    IsolatedExecutor executor(cpr::test::kWorkerPath);
    auto actions = executor.Describe(cpr::test::kEchoLibrary, CPR_EXTENSION_FACTORY_SYMBOL, {});
    ASSERT_TRUE(actions.hasValue()) << actions.error().message();
    EXPECT_NE(std::find(actions.value().begin(), actions.value().end(), "count"),
              actions.value().end());
}

TEST(IsolatedExecutorTest, MissingWorkerBinary) {
    IsolatedExecutor executor("/nonexistent/cpr_extension_worker");
    auto actions = executor.Describe(cpr::test::kEchoLibrary, CPR_EXTENSION_FACTORY_SYMBOL, {});
    ASSERT_TRUE(actions.hasError());
    EXPECT_EQ(actions.error().code(), ErrorCode::IsolationFailure);
}

TEST(IsolatedExecutorTest, BadLibraryIsReported) {
    TempDir tmp;
    cpr::test::WriteFile(tmp.path() / "libbroken.so", "garbage");
    IsolatedExecutor executor(cpr::test::kWorkerPath);
    auto actions =
        executor.Describe(tmp.path() / "libbroken.so", CPR_EXTENSION_FACTORY_SYMBOL, {});
    ASSERT_TRUE(actions.hasError());
}
