#pragma once

/// @file manifest.hpp
/// @brief Extension manifest model, parsing, validation and input-schema checks.

#include "cpr/foundation/runtime_result.hpp"
#include "cpr/plugin/version_constraint.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cpr::plugin {

/// File names probed in an extension directory, in priority order.
/// A `*.manifest.json` file is accepted when none of these exist.
inline constexpr const char* kManifestFileNames[] = {
    "manifest.json", "plugin.json", "manifest.yaml"};

/// Declared signature of one action.
struct ActionSpec {
    std::string name;
    std::string description;
    YAML::Node inputSchema;                ///< Null when the action takes free-form input.
    bool streamsOutput = false;
    std::vector<std::string> permissions;  ///< Subset of declared_permissions needed to invoke.
};

/// Immutable descriptor of an extension.
struct Manifest {
    std::string id;
    std::string version;       ///< As written in the manifest.
    SemVersion parsedVersion;
    std::string name;
    std::string description;
    std::string entryReference;
    std::vector<std::string> declaredPermissions;
    std::vector<DependencySpec> dependencies;
    std::vector<ActionSpec> actions;

    /// Find an action by name (nullptr if not declared).
    [[nodiscard]] const ActionSpec* FindAction(std::string_view actionName) const;

    /// Names of all declared actions, in declaration order.
    [[nodiscard]] std::vector<std::string> ActionNames() const;
};

/// Parse and validate a manifest document.
///
/// Every problem found is collected; the ManifestInvalid error message
/// joins them and the context holds them as std::vector<std::string>.
[[nodiscard]] cpr::foundation::RuntimeResult<Manifest> ParseManifest(const YAML::Node& doc);

/// Parse and validate manifest text (JSON or YAML).
[[nodiscard]] cpr::foundation::RuntimeResult<Manifest> ParseManifestText(std::string_view text);

/// Read, parse and validate a manifest file.
[[nodiscard]] cpr::foundation::RuntimeResult<Manifest>
ParseManifestFile(const std::filesystem::path& path);

/// Locate the manifest inside an extension directory (nullopt if none).
[[nodiscard]] std::optional<std::filesystem::path>
FindManifestFile(const std::filesystem::path& directory);

/// True if @p id is a well-formed extension id.
[[nodiscard]] bool IsValidExtensionId(std::string_view id);

/// True if @p name is a well-formed action name.
[[nodiscard]] bool IsValidActionName(std::string_view name);

/// Check that @p schema is a well-formed input schema.
/// @param where Location used in error messages (e.g. "actions[0].input_schema").
[[nodiscard]] cpr::foundation::RuntimeResult<void>
ValidateSchema(const YAML::Node& schema, const std::string& where);

/// Check @p input against @p schema.
/// @return Success, or ActionInputInvalid naming the offending path.
[[nodiscard]] cpr::foundation::RuntimeResult<void>
ValidateInput(const YAML::Node& schema, const YAML::Node& input);

}  // namespace cpr::plugin
