#include "cpr/foundation/config_manager.hpp"

namespace cpr::foundation {

RuntimeResult<void> ConfigManager::load(const std::filesystem::path& path) {
    try {
        return adopt(YAML::LoadFile(path.string()));
    } catch (const YAML::BadFile&) {
        return RuntimeResult<void>::err(
            RuntimeError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return RuntimeResult<void>::err(
            RuntimeError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

RuntimeResult<void> ConfigManager::loadString(std::string_view yaml) {
    try {
        return adopt(YAML::Load(std::string(yaml)));
    } catch (const YAML::ParserException& e) {
        return RuntimeResult<void>::err(
            RuntimeError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

RuntimeResult<void> ConfigManager::adopt(const YAML::Node& root) {
    if (root && !root.IsNull() && !root.IsMap()) {
        return RuntimeResult<void>::err(
            RuntimeError(ErrorCode::ConfigLoadFailed, "config root must be a mapping"));
    }
    std::lock_guard lock(mutex_);
    entries_.clear();
    if (root && root.IsMap()) {
        flatten("", root);
    }
    return RuntimeResult<void>::ok();
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

std::vector<std::string> ConfigManager::keys() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& [key, node] : entries_) {
        out.push_back(key);
    }
    return out;
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else {
        entries_[prefix] = YAML::Clone(node);
    }
}

}  // namespace cpr::foundation
