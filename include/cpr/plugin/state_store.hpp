#pragma once

/// @file state_store.hpp
/// @brief Durable, namespaced key/value state for extensions.

#include "cpr/foundation/runtime_result.hpp"

#include <yaml-cpp/yaml.h>

#include <atomic>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace cpr::plugin {

/// File-backed state store.
///
/// Layout: `<root>/<namespace>/<encoded-key>.yaml`, one YAML document per
/// key.  Keys are percent-encoded so that any two distinct keys map to
/// distinct file names and no key can escape its namespace directory.
/// Encodings too long for a file name are cut to a prefix plus a digest
/// of the key; those documents store the key beside the value.
///
/// Save is atomic per key: the value is serialized first, written to a
/// unique temporary file in the same directory, flushed, and renamed over
/// the target.  Readers see either the old or the new document.  There is
/// no cross-key transaction.
class StateStore {
public:
    explicit StateStore(std::filesystem::path root);

    /// Create the root directory.
    /// @return StorageUnavailable if it cannot be created or is not a directory.
    [[nodiscard]] cpr::foundation::RuntimeResult<void> Init();

    /// Persist @p value under (@p ns, @p key).
    [[nodiscard]] cpr::foundation::RuntimeResult<void>
    Save(std::string_view ns, std::string_view key, const YAML::Node& value);

    /// Read (@p ns, @p key), returning @p defaultValue if it was never
    /// written or has been deleted.  Never creates files.
    [[nodiscard]] cpr::foundation::RuntimeResult<YAML::Node>
    Load(std::string_view ns, std::string_view key,
         const YAML::Node& defaultValue = YAML::Node()) const;

    /// Remove (@p ns, @p key). Deleting a missing key succeeds.
    [[nodiscard]] cpr::foundation::RuntimeResult<void>
    Delete(std::string_view ns, std::string_view key);

    /// All keys stored in @p ns, sorted.
    [[nodiscard]] cpr::foundation::RuntimeResult<std::vector<std::string>>
    Keys(std::string_view ns) const;

    /// Remove the entire namespace directory. Missing namespaces succeed.
    [[nodiscard]] cpr::foundation::RuntimeResult<void> DropNamespace(std::string_view ns);

    [[nodiscard]] std::filesystem::path NamespaceDir(std::string_view ns) const;

    [[nodiscard]] const std::filesystem::path& Root() const noexcept { return root_; }

    /// Percent-encode a key into a file-name-safe stem of bounded length.
    [[nodiscard]] static std::string EncodeKey(std::string_view key);

    /// Inverse of EncodeKey (empty string on malformed input or a digest stem).
    [[nodiscard]] static std::string DecodeKey(std::string_view stem);

private:
    std::filesystem::path root_;
    std::atomic<uint64_t> tempCounter_{0};
};

/// Namespace-bound view of the StateStore handed to one extension.
///
/// The extension sees only save/load/delete (plus key listing); the
/// namespace, path and file format stay hidden.
class StateHandle {
public:
    StateHandle(StateStore& store, std::string ns) : store_(&store), ns_(std::move(ns)) {}

    [[nodiscard]] cpr::foundation::RuntimeResult<void>
    Save(std::string_view key, const YAML::Node& value) {
        return store_->Save(ns_, key, value);
    }

    [[nodiscard]] cpr::foundation::RuntimeResult<YAML::Node>
    Load(std::string_view key, const YAML::Node& defaultValue = YAML::Node()) const {
        return store_->Load(ns_, key, defaultValue);
    }

    [[nodiscard]] cpr::foundation::RuntimeResult<void> Delete(std::string_view key) {
        return store_->Delete(ns_, key);
    }

    [[nodiscard]] cpr::foundation::RuntimeResult<std::vector<std::string>> Keys() const {
        return store_->Keys(ns_);
    }

private:
    StateStore* store_;
    std::string ns_;
};

}  // namespace cpr::plugin
