/// @file manifest.cpp
/// @brief Manifest parsing, validation and input-schema checking.

#include "cpr/plugin/manifest.hpp"

#include <algorithm>
#include <fstream>
#include <set>
#include <sstream>

#include "cpr/foundation/error_code.hpp"

using cpr::foundation::ErrorCode;
using cpr::foundation::RuntimeError;
using cpr::foundation::RuntimeResult;

namespace cpr::plugin {

namespace {

constexpr std::string_view kSchemaTypes[] = {
    "object", "array", "string", "integer", "number", "boolean", "null"};

bool isAlnum(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

/// Collects validation problems for one manifest.
class Problems {
public:
    void add(std::string msg) { items_.push_back(std::move(msg)); }
    [[nodiscard]] bool empty() const noexcept { return items_.empty(); }

    [[nodiscard]] RuntimeError toError() const {
        std::string msg = "invalid manifest: ";
        for (std::size_t i = 0; i < items_.size(); ++i) {
            if (i > 0) {
                msg += "; ";
            }
            msg += items_[i];
        }
        return RuntimeError(ErrorCode::ManifestInvalid, std::move(msg), items_);
    }

private:
    std::vector<std::string> items_;
};

/// Read a required non-empty scalar string field.
std::optional<std::string> requireString(const YAML::Node& node, const char* key,
                                         const std::string& where, Problems& problems) {
    auto field = node[key];
    if (!field || field.IsNull()) {
        problems.add(where + key + " is required");
        return std::nullopt;
    }
    if (!field.IsScalar() || field.Scalar().empty()) {
        problems.add(where + key + " must be a non-empty string");
        return std::nullopt;
    }
    return field.Scalar();
}

std::string optionalString(const YAML::Node& node, const char* key, const std::string& where,
                           Problems& problems) {
    auto field = node[key];
    if (!field || field.IsNull()) {
        return {};
    }
    if (!field.IsScalar()) {
        problems.add(where + key + " must be a string");
        return {};
    }
    return field.Scalar();
}

/// Parse a list of unique, non-empty permission tokens.
std::vector<std::string> parseTokens(const YAML::Node& node, const std::string& where,
                                     Problems& problems) {
    std::vector<std::string> tokens;
    if (!node || node.IsNull()) {
        return tokens;
    }
    if (!node.IsSequence()) {
        problems.add(where + " must be a list of strings");
        return tokens;
    }
    std::set<std::string> seen;
    for (std::size_t i = 0; i < node.size(); ++i) {
        const auto& item = node[i];
        if (!item.IsScalar() || item.Scalar().empty()) {
            problems.add(where + "[" + std::to_string(i) + "] must be a non-empty string");
            continue;
        }
        if (!seen.insert(item.Scalar()).second) {
            problems.add(where + " lists '" + item.Scalar() + "' more than once");
            continue;
        }
        tokens.push_back(item.Scalar());
    }
    return tokens;
}

bool readBool(const YAML::Node& node, const std::string& where, Problems& problems) {
    if (!node || node.IsNull()) {
        return false;
    }
    try {
        return node.as<bool>();
    } catch (const YAML::Exception&) {
        problems.add(where + " must be a boolean");
        return false;
    }
}

std::string pathJoin(const std::string& base, const std::string& child) {
    return base.empty() ? child : base + "." + child;
}

bool scalarIs(const YAML::Node& n, std::string_view type) {
    if (type == "string") {
        return n.IsScalar();
    }
    if (n.IsNull() || !n.IsScalar()) {
        return false;
    }
    try {
        if (type == "integer") {
            (void)n.as<long long>();
            return true;
        }
        if (type == "number") {
            (void)n.as<double>();
            return true;
        }
        if (type == "boolean") {
            (void)n.as<bool>();
            return true;
        }
    } catch (const YAML::Exception&) {
        return false;
    }
    return false;
}

RuntimeResult<void> inputError(const std::string& path, const std::string& why) {
    return RuntimeResult<void>::err(RuntimeError(
        ErrorCode::ActionInputInvalid,
        "input" + (path.empty() ? std::string() : "." + path) + " " + why));
}

RuntimeResult<void> validateNode(const YAML::Node& schema, const YAML::Node& input,
                                 const std::string& path) {
    if (!schema || schema.IsNull()) {
        return RuntimeResult<void>::ok();
    }

    std::string type;
    if (schema["type"]) {
        type = schema["type"].Scalar();
    }

    // A missing object input reads as an empty object.
    bool treatAsEmptyObject = type == "object" && (!input || input.IsNull());

    if (!type.empty() && !treatAsEmptyObject) {
        bool ok = false;
        if (type == "object") {
            ok = input.IsMap();
        } else if (type == "array") {
            ok = input.IsSequence();
        } else if (type == "null") {
            ok = !input || input.IsNull();
        } else {
            ok = input && scalarIs(input, type);
        }
        if (!ok) {
            return inputError(path, "must be of type " + type);
        }
    }

    if (auto required = schema["required"]; required && required.IsSequence()) {
        for (const auto& key : required) {
            if (treatAsEmptyObject || !input.IsMap() || !input[key.Scalar()]) {
                return inputError(pathJoin(path, key.Scalar()), "is required");
            }
        }
    }

    if (auto properties = schema["properties"]; properties && properties.IsMap() && input &&
                                                input.IsMap()) {
        for (auto it = properties.begin(); it != properties.end(); ++it) {
            auto key = it->first.as<std::string>();
            auto child = input[key];
            if (!child) {
                continue;
            }
            auto result = validateNode(it->second, child, pathJoin(path, key));
            if (!result) {
                return result;
            }
        }
    }

    if (auto items = schema["items"]; items && items.IsMap() && input && input.IsSequence()) {
        for (std::size_t i = 0; i < input.size(); ++i) {
            auto result = validateNode(items, input[i], path + "[" + std::to_string(i) + "]");
            if (!result) {
                return result;
            }
        }
    }

    return RuntimeResult<void>::ok();
}

void collectSchemaProblems(const YAML::Node& schema, const std::string& where,
                           Problems& problems) {
    if (!schema.IsMap()) {
        problems.add(where + " must be a mapping");
        return;
    }
    if (auto type = schema["type"]) {
        bool known = type.IsScalar() &&
                     std::find(std::begin(kSchemaTypes), std::end(kSchemaTypes), type.Scalar()) !=
                         std::end(kSchemaTypes);
        if (!known) {
            problems.add(where + ".type must be one of object, array, string, integer, number, "
                                 "boolean, null");
        }
    }
    if (auto properties = schema["properties"]) {
        if (!properties.IsMap()) {
            problems.add(where + ".properties must be a mapping");
        } else {
            for (auto it = properties.begin(); it != properties.end(); ++it) {
                collectSchemaProblems(it->second,
                                      where + ".properties." + it->first.as<std::string>(),
                                      problems);
            }
        }
    }
    if (auto required = schema["required"]) {
        bool ok = required.IsSequence() &&
                  std::all_of(required.begin(), required.end(),
                              [](const YAML::Node& n) { return n.IsScalar(); });
        if (!ok) {
            problems.add(where + ".required must be a list of strings");
        }
    }
    if (auto items = schema["items"]) {
        collectSchemaProblems(items, where + ".items", problems);
    }
}

}  // namespace

// ── Manifest ────────────────────────────────────────────────────────────

const ActionSpec* Manifest::FindAction(std::string_view actionName) const {
    auto it = std::find_if(actions.begin(), actions.end(),
                           [&](const ActionSpec& a) { return a.name == actionName; });
    return it == actions.end() ? nullptr : &*it;
}

std::vector<std::string> Manifest::ActionNames() const {
    std::vector<std::string> names;
    names.reserve(actions.size());
    for (const auto& a : actions) {
        names.push_back(a.name);
    }
    return names;
}

// ── Identifier rules ────────────────────────────────────────────────────

bool IsValidExtensionId(std::string_view id) {
    if (id.empty() || !isAlnum(id.front())) {
        return false;
    }
    return std::all_of(id.begin(), id.end(),
                       [](char c) { return isAlnum(c) || c == '.' || c == '_' || c == '-'; });
}

bool IsValidActionName(std::string_view name) {
    if (name.empty() || !(isAlnum(name.front()) || name.front() == '_') ||
        (name.front() >= '0' && name.front() <= '9')) {
        return false;
    }
    return std::all_of(name.begin(), name.end(),
                       [](char c) { return isAlnum(c) || c == '.' || c == '_' || c == '-'; });
}

// ── Schema ──────────────────────────────────────────────────────────────

RuntimeResult<void> ValidateSchema(const YAML::Node& schema, const std::string& where) {
    Problems problems;
    collectSchemaProblems(schema, where, problems);
    if (!problems.empty()) {
        return RuntimeResult<void>::err(problems.toError());
    }
    return RuntimeResult<void>::ok();
}

RuntimeResult<void> ValidateInput(const YAML::Node& schema, const YAML::Node& input) {
    return validateNode(schema, input, "");
}

// ── Parsing ─────────────────────────────────────────────────────────────

RuntimeResult<Manifest> ParseManifest(const YAML::Node& doc) {
    if (!doc || !doc.IsMap()) {
        return RuntimeResult<Manifest>::err(
            RuntimeError(ErrorCode::ManifestInvalid, "invalid manifest: document must be a mapping"));
    }

    Problems problems;
    Manifest m;

    if (auto id = requireString(doc, "id", "", problems)) {
        m.id = *id;
        if (!IsValidExtensionId(m.id)) {
            problems.add("id '" + m.id + "' must match [A-Za-z0-9][A-Za-z0-9._-]*");
        }
    }
    if (auto version = requireString(doc, "version", "", problems)) {
        m.version = *version;
        auto parsed = ParseSemVersion(m.version);
        if (parsed) {
            m.parsedVersion = parsed.value();
        } else {
            problems.add(std::string(parsed.error().message()));
        }
    }
    if (auto entry = requireString(doc, "entry_reference", "", problems)) {
        m.entryReference = *entry;
    }
    m.name = optionalString(doc, "name", "", problems);
    m.description = optionalString(doc, "description", "", problems);
    m.declaredPermissions = parseTokens(doc["declared_permissions"], "declared_permissions", problems);

    // Dependencies.
    if (auto deps = doc["dependencies"]; deps && !deps.IsNull()) {
        if (!deps.IsSequence()) {
            problems.add("dependencies must be a list");
        } else {
            std::set<std::string> seen;
            for (std::size_t i = 0; i < deps.size(); ++i) {
                auto where = "dependencies[" + std::to_string(i) + "].";
                const auto& dep = deps[i];
                if (!dep.IsMap()) {
                    problems.add(where.substr(0, where.size() - 1) + " must be a mapping");
                    continue;
                }
                auto target = requireString(dep, "plugin_id", where, problems);
                if (!target) {
                    continue;
                }
                if (*target == m.id) {
                    problems.add(where + "plugin_id must not name the extension itself");
                    continue;
                }
                if (!seen.insert(*target).second) {
                    problems.add("dependency on '" + *target + "' is declared more than once");
                    continue;
                }
                auto rangeText = optionalString(dep, "version_range", where, problems);
                auto range = VersionRange::Parse(rangeText);
                if (!range) {
                    problems.add(where + "version_range: " + std::string(range.error().message()));
                    continue;
                }
                m.dependencies.push_back(DependencySpec{*target, std::move(range).value()});
            }
        }
    }

    // Actions.
    if (auto actions = doc["actions"]; actions && !actions.IsNull()) {
        if (!actions.IsSequence()) {
            problems.add("actions must be a list");
        } else {
            std::set<std::string> seen;
            std::set<std::string> declared(m.declaredPermissions.begin(),
                                           m.declaredPermissions.end());
            for (std::size_t i = 0; i < actions.size(); ++i) {
                auto where = "actions[" + std::to_string(i) + "].";
                const auto& node = actions[i];
                if (!node.IsMap()) {
                    problems.add(where.substr(0, where.size() - 1) + " must be a mapping");
                    continue;
                }
                ActionSpec action;
                auto name = requireString(node, "name", where, problems);
                if (!name) {
                    continue;
                }
                action.name = *name;
                if (!IsValidActionName(action.name)) {
                    problems.add(where + "name '" + action.name +
                                 "' must match [A-Za-z_][A-Za-z0-9_.-]*");
                }
                if (!seen.insert(action.name).second) {
                    problems.add("action '" + action.name + "' is declared more than once");
                }
                action.description = optionalString(node, "description", where, problems);
                action.streamsOutput = readBool(node["streams_output"], where + "streams_output", problems);
                if (auto schema = node["input_schema"]; schema && !schema.IsNull()) {
                    collectSchemaProblems(schema, where + "input_schema", problems);
                    action.inputSchema = YAML::Clone(schema);
                }
                action.permissions = parseTokens(node["permissions"], where + "permissions", problems);
                for (const auto& perm : action.permissions) {
                    if (declared.count(perm) == 0) {
                        problems.add(where + "permissions: '" + perm +
                                     "' is not listed in declared_permissions");
                    }
                }
                m.actions.push_back(std::move(action));
            }
        }
    }

    if (!problems.empty()) {
        return RuntimeResult<Manifest>::err(problems.toError());
    }
    return RuntimeResult<Manifest>::ok(std::move(m));
}

RuntimeResult<Manifest> ParseManifestText(std::string_view text) {
    try {
        return ParseManifest(YAML::Load(std::string(text)));
    } catch (const YAML::Exception& e) {
        return RuntimeResult<Manifest>::err(RuntimeError(
            ErrorCode::ManifestInvalid, std::string("invalid manifest: parse error: ") + e.what()));
    }
}

RuntimeResult<Manifest> ParseManifestFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return RuntimeResult<Manifest>::err(
            RuntimeError(ErrorCode::ManifestNotFound, "cannot read manifest: " + path.string()));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return ParseManifestText(buffer.str());
}

std::optional<std::filesystem::path> FindManifestFile(const std::filesystem::path& directory) {
    std::error_code ec;
    for (const char* name : kManifestFileNames) {
        auto candidate = directory / name;
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }

    std::vector<std::filesystem::path> suffixed;
    for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
        auto filename = entry.path().filename().string();
        if (entry.is_regular_file(ec) && filename.size() > 14 &&
            filename.ends_with(".manifest.json")) {
            suffixed.push_back(entry.path());
        }
    }
    if (suffixed.empty()) {
        return std::nullopt;
    }
    std::sort(suffixed.begin(), suffixed.end());
    return suffixed.front();
}

}  // namespace cpr::plugin
