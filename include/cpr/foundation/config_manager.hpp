#pragma once

/// @file config_manager.hpp
/// @brief YAML-based runtime configuration with typed dotted-key access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "cpr/foundation/runtime_result.hpp"

namespace cpr::foundation {

/// YAML-based configuration manager providing typed access to config values.
///
/// Supports loading from a file or an in-memory document, dotted-key
/// access (e.g., "runtime.state_dir") and runtime overrides.
/// Internally flattens the YAML tree into a key-value map to avoid
/// yaml-cpp reference-semantic pitfalls. Sequences are leaves, so
/// "runtime.plugin_dirs" reads back as std::vector<std::string>.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    /// @return Success or ConfigLoadFailed error.
    RuntimeResult<void> load(const std::filesystem::path& path);

    /// Load configuration from YAML text, replacing current entries.
    RuntimeResult<void> loadString(std::string_view yaml);

    /// Retrieve a typed value by dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    RuntimeResult<T> get(std::string_view key) const;

    /// Retrieve a typed value, or @p fallback when absent or mistyped.
    template <typename T>
    [[nodiscard]] T getOr(std::string_view key, T fallback) const {
        auto result = get<T>(key);
        return result ? std::move(result).value() : std::move(fallback);
    }

    /// Set a value by dotted key.
    template <typename T>
    void set(std::string_view key, const T& value);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// Dotted keys currently loaded (unordered).
    [[nodiscard]] std::vector<std::string> keys() const;

private:
    RuntimeResult<void> adopt(const YAML::Node& root);
    void flatten(const std::string& prefix, const YAML::Node& node);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
};

// --- Template implementations ---

template <typename T>
RuntimeResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return RuntimeResult<T>::err(
            RuntimeError(ErrorCode::ConfigKeyNotFound,
                         std::string("config key not found: ") + std::string(key)));
    }
    try {
        return RuntimeResult<T>::ok(it->second.as<T>());
    } catch (const YAML::Exception&) {
        return RuntimeResult<T>::err(
            RuntimeError(ErrorCode::ConfigTypeMismatch,
                         std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    std::lock_guard lock(mutex_);
    entries_[std::string(key)] = YAML::Node(value);
}

} // namespace cpr::foundation
