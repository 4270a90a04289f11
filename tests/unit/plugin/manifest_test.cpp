#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "cpr/foundation/error_code.hpp"
#include "cpr/plugin/manifest.hpp"

#include "../../fixtures/test_support.hpp"

using namespace cpr::plugin;
using cpr::foundation::ErrorCode;
using cpr::test::TempDir;
using cpr::test::WriteFile;

namespace {

const char* kGreeterJson = R"({
  "id": "com.example.greeter",
  "version": "1.2.0",
  "name": "Greeter",
  "description": "Says hello",
  "entry_reference": "libgreeter.so",
  "declared_permissions": ["events.publish", "state.write"],
  "dependencies": [
    {"plugin_id": "com.example.core", "version_range": "^1.0.0"}
  ],
  "actions": [
    {
      "name": "greet",
      "description": "Greets someone",
      "permissions": ["events.publish"],
      "input_schema": {
        "type": "object",
        "required": ["name"],
        "properties": {"name": {"type": "string"}, "times": {"type": "integer"}}
      }
    },
    {"name": "ticker", "streams_output": true}
  ]
})";

std::vector<std::string> Problems(const cpr::foundation::RuntimeError& error) {
    const auto* problems = error.context<std::vector<std::string>>();
    return problems != nullptr ? *problems : std::vector<std::string>{};
}

bool Mentions(const std::vector<std::string>& problems, const std::string& needle) {
    for (const auto& p : problems) {
        if (p.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

}  // namespace

// ===========================================================================
// Parsing
// ===========================================================================

TEST(ManifestParseTest, ParsesCompleteJsonManifest) {
    auto result = ParseManifestText(kGreeterJson);
    ASSERT_TRUE(result.hasValue()) << result.error().message();
    const auto& m = result.value();

    EXPECT_EQ(m.id, "com.example.greeter");
    EXPECT_EQ(m.version, "1.2.0");
    EXPECT_EQ(m.parsedVersion.minor, 2u);
    EXPECT_EQ(m.name, "Greeter");
    EXPECT_EQ(m.entryReference, "libgreeter.so");
    EXPECT_EQ(m.declaredPermissions.size(), 2u);

    ASSERT_EQ(m.dependencies.size(), 1u);
    EXPECT_EQ(m.dependencies[0].pluginId, "com.example.core");
    EXPECT_EQ(m.dependencies[0].range.Text(), "^1.0.0");

    ASSERT_EQ(m.actions.size(), 2u);
    EXPECT_EQ(m.ActionNames(), (std::vector<std::string>{"greet", "ticker"}));
    const auto* greet = m.FindAction("greet");
    ASSERT_NE(greet, nullptr);
    EXPECT_FALSE(greet->streamsOutput);
    EXPECT_TRUE(greet->inputSchema.IsMap());
    EXPECT_EQ(greet->permissions, (std::vector<std::string>{"events.publish"}));
    EXPECT_TRUE(m.FindAction("ticker")->streamsOutput);
    EXPECT_EQ(m.FindAction("missing"), nullptr);
}

TEST(ManifestParseTest, ParsesYamlManifest) {
    auto result = ParseManifestText("id: tiny\nversion: 0.1.0\nentry_reference: static:tiny\n");
    ASSERT_TRUE(result.hasValue()) << result.error().message();
    EXPECT_TRUE(result.value().actions.empty());
    EXPECT_TRUE(result.value().dependencies.empty());
}

TEST(ManifestParseTest, MissingRequiredFieldsAreAllReported) {
    auto result = ParseManifestText("name: nothing useful\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ManifestInvalid);

    auto problems = Problems(result.error());
    EXPECT_TRUE(Mentions(problems, "id is required"));
    EXPECT_TRUE(Mentions(problems, "version is required"));
    EXPECT_TRUE(Mentions(problems, "entry_reference is required"));
}

TEST(ManifestParseTest, RejectsBadVersionAndId) {
    auto result = ParseManifestText("id: -bad id\nversion: 1.0\nentry_reference: x.so\n");
    ASSERT_TRUE(result.hasError());
    auto problems = Problems(result.error());
    EXPECT_TRUE(Mentions(problems, "id '-bad id'"));
    EXPECT_TRUE(Mentions(problems, "invalid semantic version"));
}

TEST(ManifestParseTest, ActionPermissionMustBeDeclared) {
    auto result = ParseManifestText(
        "id: a\nversion: 1.0.0\nentry_reference: a.so\n"
        "declared_permissions: [state.write]\n"
        "actions:\n  - name: go\n    permissions: [net.http]\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_TRUE(Mentions(Problems(result.error()), "'net.http' is not listed"));
}

TEST(ManifestParseTest, DuplicateActionsAndDependencies) {
    auto result = ParseManifestText(
        "id: a\nversion: 1.0.0\nentry_reference: a.so\n"
        "dependencies:\n  - plugin_id: b\n  - plugin_id: b\n  - plugin_id: a\n"
        "actions:\n  - name: go\n  - name: go\n");
    ASSERT_TRUE(result.hasError());
    auto problems = Problems(result.error());
    EXPECT_TRUE(Mentions(problems, "dependency on 'b' is declared more than once"));
    EXPECT_TRUE(Mentions(problems, "must not name the extension itself"));
    EXPECT_TRUE(Mentions(problems, "action 'go' is declared more than once"));
}

TEST(ManifestParseTest, BadRangeAndSchema) {
    auto result = ParseManifestText(
        "id: a\nversion: 1.0.0\nentry_reference: a.so\n"
        "dependencies:\n  - plugin_id: b\n    version_range: '>>1'\n"
        "actions:\n  - name: go\n    input_schema: {type: tuple}\n");
    ASSERT_TRUE(result.hasError());
    auto problems = Problems(result.error());
    EXPECT_TRUE(Mentions(problems, "version_range"));
    EXPECT_TRUE(Mentions(problems, "input_schema.type must be one of"));
}

TEST(ManifestParseTest, MalformedTextIsManifestInvalid) {
    auto result = ParseManifestText("{ not: [valid");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ManifestInvalid);

    auto scalar = ParseManifestText("just a string");
    ASSERT_TRUE(scalar.hasError());
    EXPECT_EQ(scalar.error().code(), ErrorCode::ManifestInvalid);
}

TEST(ManifestParseTest, MissingFileIsManifestNotFound) {
    auto result = ParseManifestFile("/nonexistent/manifest.json");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ManifestNotFound);
}

// ===========================================================================
// Identifiers
// ===========================================================================

TEST(ManifestIdentifierTest, ExtensionIds) {
    EXPECT_TRUE(IsValidExtensionId("com.example.greeter"));
    EXPECT_TRUE(IsValidExtensionId("a-b_c.1"));
    EXPECT_FALSE(IsValidExtensionId(""));
    EXPECT_FALSE(IsValidExtensionId(".hidden"));
    EXPECT_FALSE(IsValidExtensionId("has space"));
    EXPECT_FALSE(IsValidExtensionId("../escape"));
}

TEST(ManifestIdentifierTest, ActionNames) {
    EXPECT_TRUE(IsValidActionName("greet"));
    EXPECT_TRUE(IsValidActionName("_private.op-2"));
    EXPECT_FALSE(IsValidActionName("2fast"));
    EXPECT_FALSE(IsValidActionName(""));
    EXPECT_FALSE(IsValidActionName("bad name"));
}

// ===========================================================================
// FindManifestFile
// ===========================================================================

TEST(FindManifestFileTest, PrefersManifestJson) {
    TempDir tmp;
    WriteFile(tmp.path() / "plugin.json", "{}");
    WriteFile(tmp.path() / "manifest.json", "{}");
    auto found = FindManifestFile(tmp.path());
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->filename(), "manifest.json");
}

TEST(FindManifestFileTest, FallsBackToSuffixedJson) {
    TempDir tmp;
    WriteFile(tmp.path() / "b.manifest.json", "{}");
    WriteFile(tmp.path() / "a.manifest.json", "{}");
    auto found = FindManifestFile(tmp.path());
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->filename(), "a.manifest.json");
}

TEST(FindManifestFileTest, NoneFound) {
    TempDir tmp;
    WriteFile(tmp.path() / "README.md", "hello");
    EXPECT_FALSE(FindManifestFile(tmp.path()).has_value());
}

// ===========================================================================
// Input validation
// ===========================================================================

class InputValidationTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto m = ParseManifestText(kGreeterJson);
        ASSERT_TRUE(m.hasValue());
        schema_ = m.value().FindAction("greet")->inputSchema;
    }

    YAML::Node schema_;
};

TEST_F(InputValidationTest, AcceptsValidInput) {
    EXPECT_TRUE(ValidateInput(schema_, YAML::Load("{name: Ada, times: 2}")).hasValue());
}

TEST_F(InputValidationTest, MissingRequiredField) {
    auto r = ValidateInput(schema_, YAML::Load("{times: 2}"));
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::ActionInputInvalid);
    EXPECT_NE(std::string(r.error().message()).find("input.name is required"), std::string::npos);
}

TEST_F(InputValidationTest, MissingObjectInputReadsAsEmptyObject) {
    auto r = ValidateInput(schema_, YAML::Node());
    ASSERT_TRUE(r.hasError());
    EXPECT_NE(std::string(r.error().message()).find("name"), std::string::npos);
}

TEST_F(InputValidationTest, WrongPropertyType) {
    auto r = ValidateInput(schema_, YAML::Load("{name: Ada, times: many}"));
    ASSERT_TRUE(r.hasError());
    EXPECT_NE(std::string(r.error().message()).find("input.times must be of type integer"),
              std::string::npos);
}

TEST_F(InputValidationTest, WrongTopLevelType) {
    auto r = ValidateInput(schema_, YAML::Load("[1, 2]"));
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::ActionInputInvalid);
}

TEST(InputValidationArrayTest, ItemsAreChecked) {
    auto schema = YAML::Load("{type: array, items: {type: number}}");
    EXPECT_TRUE(ValidateInput(schema, YAML::Load("[1, 2.5]")).hasValue());
    auto r = ValidateInput(schema, YAML::Load("[1, x]"));
    ASSERT_TRUE(r.hasError());
    EXPECT_NE(std::string(r.error().message()).find("[1]"), std::string::npos);
}

TEST(InputValidationArrayTest, NoSchemaAcceptsAnything) {
    EXPECT_TRUE(ValidateInput(YAML::Node(), YAML::Load("{anything: [1, 2]}")).hasValue());
}
