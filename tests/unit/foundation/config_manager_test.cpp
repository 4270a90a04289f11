#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "cpr/foundation/config_manager.hpp"
#include "cpr/foundation/error_code.hpp"
#include "cpr/plugin/extension_runtime.hpp"

#include "../../fixtures/test_support.hpp"

using namespace cpr::foundation;
using cpr::plugin::RuntimeOptions;
using cpr::test::TempDir;
using cpr::test::WriteFile;

// ===========================================================================
// ConfigManager
// ===========================================================================

TEST(ConfigManagerTest, DottedKeysFromNestedMaps) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("runtime:\n"
                                  "  state_dir: /var/lib/cpr\n"
                                  "  stream_idle_timeout_ms: 1500\n")
                    .hasValue());

    EXPECT_EQ(config.get<std::string>("runtime.state_dir").value(), "/var/lib/cpr");
    EXPECT_EQ(config.get<int>("runtime.stream_idle_timeout_ms").value(), 1500);
    EXPECT_TRUE(config.hasKey("runtime.state_dir"));
    EXPECT_FALSE(config.hasKey("runtime"));
}

TEST(ConfigManagerTest, SequencesAreLeaves) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("runtime:\n  plugin_dirs: [a, b, c]\n").hasValue());

    auto dirs = config.get<std::vector<std::string>>("runtime.plugin_dirs");
    ASSERT_TRUE(dirs.hasValue());
    EXPECT_EQ(dirs.value(), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(ConfigManagerTest, MissingKeyAndTypeMismatch) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("logging:\n  level: info\n").hasValue());

    auto missing = config.get<std::string>("logging.file");
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error().code(), ErrorCode::ConfigKeyNotFound);

    auto mistyped = config.get<int>("logging.level");
    ASSERT_TRUE(mistyped.hasError());
    EXPECT_EQ(mistyped.error().code(), ErrorCode::ConfigTypeMismatch);

    EXPECT_EQ(config.getOr<int>("logging.level", 3), 3);
}

TEST(ConfigManagerTest, SetOverridesLoadedValue) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("runtime:\n  state_dir: a\n").hasValue());
    config.set<std::string>("runtime.state_dir", "b");
    EXPECT_EQ(config.get<std::string>("runtime.state_dir").value(), "b");
}

TEST(ConfigManagerTest, LoadFailures) {
    ConfigManager config;
    auto missing = config.load("/nonexistent/cpr/config.yaml");
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error().code(), ErrorCode::ConfigLoadFailed);

    auto notMap = config.loadString("- just\n- a list\n");
    ASSERT_TRUE(notMap.hasError());
    EXPECT_EQ(notMap.error().code(), ErrorCode::ConfigLoadFailed);

    auto malformed = config.loadString("runtime: [unclosed\n");
    ASSERT_TRUE(malformed.hasError());
}

TEST(ConfigManagerTest, LoadFromFile) {
    TempDir tmp;
    auto path = tmp.path() / "config.yaml";
    WriteFile(path, "runtime:\n  discovery_threads: 4\n");

    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());
    EXPECT_EQ(config.get<unsigned int>("runtime.discovery_threads").value(), 4u);
}

// ===========================================================================
// RuntimeOptions::FromConfig
// ===========================================================================

TEST(RuntimeOptionsTest, DefaultsWhenKeysAbsent) {
    ConfigManager config;
    auto options = RuntimeOptions::FromConfig(config);
    EXPECT_TRUE(options.pluginDirs.empty());
    EXPECT_EQ(options.stateDir, std::filesystem::path("state"));
    EXPECT_FALSE(options.policyFile.has_value());
    EXPECT_EQ(options.streamIdleTimeout.count(), 30000);
}

TEST(RuntimeOptionsTest, ReadsRuntimeSection) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("runtime:\n"
                                  "  plugin_dirs: [/opt/ext, /home/ext]\n"
                                  "  state_dir: /var/lib/cpr\n"
                                  "  policy_file: /etc/cpr/policy.yaml\n"
                                  "  worker_path: /usr/libexec/cpr_extension_worker\n"
                                  "  stream_idle_timeout_ms: 500\n"
                                  "  discovery_threads: 3\n")
                    .hasValue());

    auto options = RuntimeOptions::FromConfig(config);
    ASSERT_EQ(options.pluginDirs.size(), 2u);
    EXPECT_EQ(options.pluginDirs[1], std::filesystem::path("/home/ext"));
    EXPECT_EQ(options.stateDir, std::filesystem::path("/var/lib/cpr"));
    ASSERT_TRUE(options.policyFile.has_value());
    EXPECT_EQ(*options.policyFile, std::filesystem::path("/etc/cpr/policy.yaml"));
    EXPECT_EQ(options.workerPath, std::filesystem::path("/usr/libexec/cpr_extension_worker"));
    EXPECT_EQ(options.streamIdleTimeout.count(), 500);
    EXPECT_EQ(options.discoveryThreads, 3u);
}
