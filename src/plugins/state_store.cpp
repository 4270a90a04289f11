/// @file state_store.cpp
/// @brief StateStore implementation: per-key YAML documents with atomic replace.

#include "cpr/plugin/state_store.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>

#include <unistd.h>

#include "cpr/foundation/error_code.hpp"
#include "cpr/foundation/runtime_logger.hpp"
#include "cpr/plugin/manifest.hpp"

using cpr::foundation::ErrorCode;
using cpr::foundation::LogCategory;
using cpr::foundation::RuntimeError;
using cpr::foundation::RuntimeResult;

namespace cpr::plugin {

namespace {

constexpr const char* kStateSuffix = ".yaml";

// Encoded stems longer than this are shortened to a prefix plus a digest,
// keeping file and temp names well under NAME_MAX.
constexpr std::size_t kMaxStem = 180;
constexpr std::size_t kDigestPrefix = 160;
constexpr char kDigestMarker = '~';  // never produced by percent-encoding

/// Documents behind a digest stem carry their key next to the value.
constexpr const char* kKeyField = "key";
constexpr const char* kValueField = "value";

uint64_t fnv1a(std::string_view text) {
    uint64_t hash = 0xcbf29ce484222325ULL;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }
    return hash;
}

bool isDigestStem(std::string_view stem) {
    return stem.find(kDigestMarker) != std::string_view::npos;
}

RuntimeError stateError(std::string msg) {
    return RuntimeError(ErrorCode::StateStoreError, std::move(msg));
}

/// Reject values that cannot be written out faithfully.
bool isSerializable(const YAML::Node& node) {
    if (!node.IsDefined()) {
        return false;
    }
    if (node.IsSequence()) {
        return std::all_of(node.begin(), node.end(),
                           [](const YAML::Node& child) { return isSerializable(child); });
    }
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            if (!it->first.IsScalar() || !isSerializable(it->second)) {
                return false;
            }
        }
    }
    return true;
}

RuntimeResult<void> checkNames(std::string_view ns, std::string_view key) {
    if (!IsValidExtensionId(ns)) {
        return RuntimeResult<void>::err(stateError("invalid state namespace '" + std::string(ns) + "'"));
    }
    if (key.empty()) {
        return RuntimeResult<void>::err(stateError("state key must not be empty"));
    }
    return RuntimeResult<void>::ok();
}

/// Key recorded inside a digest-named document (empty if unreadable).
std::string storedKey(const std::filesystem::path& path) {
    try {
        auto document = YAML::LoadFile(path.string());
        if (document.IsMap() && document[kKeyField]) {
            return document[kKeyField].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        CPR_LOG_WARN(LogCategory::State, "unreadable state file " + path.string() + ": " + e.what());
    }
    return {};
}

}  // namespace

StateStore::StateStore(std::filesystem::path root) : root_(std::move(root)) {}

RuntimeResult<void> StateStore::Init() {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec || !std::filesystem::is_directory(root_, ec)) {
        return RuntimeResult<void>::err(RuntimeError(
            ErrorCode::StorageUnavailable,
            "state root '" + root_.string() + "' is unavailable" + (ec ? ": " + ec.message() : "")));
    }
    return RuntimeResult<void>::ok();
}

std::filesystem::path StateStore::NamespaceDir(std::string_view ns) const {
    return root_ / std::string(ns);
}

// ── Key encoding ────────────────────────────────────────────────────────

std::string StateStore::EncodeKey(std::string_view key) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(key.size());
    for (unsigned char c : key) {
        bool plain = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                     c == '_' || c == '-';
        if (plain) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0F];
        }
    }
    if (out.size() > kMaxStem) {
        out.resize(kDigestPrefix);
        out += kDigestMarker;
        auto hash = fnv1a(key);
        for (int shift = 60; shift >= 0; shift -= 4) {
            out += kHex[(hash >> shift) & 0x0F];
        }
    }
    return out;
}

std::string StateStore::DecodeKey(std::string_view stem) {
    auto hexValue = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        return -1;
    };
    if (isDigestStem(stem)) {
        return {};
    }
    std::string out;
    for (std::size_t i = 0; i < stem.size(); ++i) {
        if (stem[i] != '%') {
            out += stem[i];
            continue;
        }
        if (i + 2 >= stem.size()) {
            return {};
        }
        int hi = hexValue(stem[i + 1]);
        int lo = hexValue(stem[i + 2]);
        if (hi < 0 || lo < 0) {
            return {};
        }
        out += static_cast<char>((hi << 4) | lo);
        i += 2;
    }
    return out;
}

// ── Operations ──────────────────────────────────────────────────────────

RuntimeResult<void> StateStore::Save(std::string_view ns, std::string_view key,
                                     const YAML::Node& value) {
    auto names = checkNames(ns, key);
    if (!names) {
        return names;
    }

    // Serialize before touching the filesystem.
    if (!isSerializable(value)) {
        return RuntimeResult<void>::err(RuntimeError(
            ErrorCode::StateNotSerializable,
            "value for key '" + std::string(key) + "' is not serializable"));
    }
    auto encoded = EncodeKey(key);
    YAML::Emitter emitter;
    if (isDigestStem(encoded)) {
        emitter << YAML::BeginMap << YAML::Key << kKeyField << YAML::Value << std::string(key)
                << YAML::Key << kValueField << YAML::Value << value << YAML::EndMap;
    } else {
        emitter << value;
    }
    if (!emitter.good()) {
        return RuntimeResult<void>::err(stateError("failed to serialize key '" + std::string(key) +
                                                   "': " + emitter.GetLastError()));
    }
    std::string document = emitter.c_str();
    document += '\n';

    auto dir = NamespaceDir(ns);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return RuntimeResult<void>::err(
            stateError("cannot create state directory " + dir.string() + ": " + ec.message()));
    }

    auto target = dir / (encoded + kStateSuffix);
    auto temp = dir / ("." + encoded + ".tmp." + std::to_string(::getpid()) + "." +
                       std::to_string(tempCounter_.fetch_add(1, std::memory_order_relaxed)));

    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file) {
            return RuntimeResult<void>::err(stateError("cannot open " + temp.string() + " for writing"));
        }
        file.write(document.data(), static_cast<std::streamsize>(document.size()));
        file.flush();
        if (!file) {
            file.close();
            std::filesystem::remove(temp, ec);
            return RuntimeResult<void>::err(stateError("failed to write state for key '" +
                                                       std::string(key) + "'"));
        }
    }

    std::filesystem::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        return RuntimeResult<void>::err(
            stateError("failed to commit state for key '" + std::string(key) + "': " + ec.message()));
    }
    return RuntimeResult<void>::ok();
}

RuntimeResult<YAML::Node> StateStore::Load(std::string_view ns, std::string_view key,
                                           const YAML::Node& defaultValue) const {
    auto names = checkNames(ns, key);
    if (!names) {
        return RuntimeResult<YAML::Node>::err(names.error());
    }

    auto stem = EncodeKey(key);
    auto path = NamespaceDir(ns) / (stem + kStateSuffix);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return RuntimeResult<YAML::Node>::ok(YAML::Clone(defaultValue));
    }

    try {
        auto document = YAML::LoadFile(path.string());
        if (!isDigestStem(stem)) {
            return RuntimeResult<YAML::Node>::ok(document);
        }
        if (!document.IsMap() || !document[kKeyField] ||
            document[kKeyField].as<std::string>() != key) {
            return RuntimeResult<YAML::Node>::err(
                stateError("state file for key '" + std::string(key) + "' belongs to another key"));
        }
        return RuntimeResult<YAML::Node>::ok(document[kValueField]);
    } catch (const YAML::Exception& e) {
        return RuntimeResult<YAML::Node>::err(
            stateError("failed to read state for key '" + std::string(key) + "': " + e.what()));
    }
}

RuntimeResult<void> StateStore::Delete(std::string_view ns, std::string_view key) {
    auto names = checkNames(ns, key);
    if (!names) {
        return names;
    }
    std::error_code ec;
    std::filesystem::remove(NamespaceDir(ns) / (EncodeKey(key) + kStateSuffix), ec);
    if (ec) {
        return RuntimeResult<void>::err(
            stateError("failed to delete key '" + std::string(key) + "': " + ec.message()));
    }
    return RuntimeResult<void>::ok();
}

RuntimeResult<std::vector<std::string>> StateStore::Keys(std::string_view ns) const {
    std::vector<std::string> keys;
    if (!IsValidExtensionId(ns)) {
        return RuntimeResult<std::vector<std::string>>::err(
            stateError("invalid state namespace '" + std::string(ns) + "'"));
    }
    auto dir = NamespaceDir(ns);
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return RuntimeResult<std::vector<std::string>>::ok(std::move(keys));
    }
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        auto name = entry.path().filename().string();
        if (!entry.is_regular_file() || name.starts_with(".") || !name.ends_with(kStateSuffix)) {
            continue;
        }
        auto stem = name.substr(0, name.size() - std::char_traits<char>::length(kStateSuffix));
        auto decoded = isDigestStem(stem) ? storedKey(entry.path()) : DecodeKey(stem);
        if (!decoded.empty()) {
            keys.push_back(std::move(decoded));
        }
    }
    if (ec) {
        return RuntimeResult<std::vector<std::string>>::err(
            stateError("failed to list namespace '" + std::string(ns) + "': " + ec.message()));
    }
    std::sort(keys.begin(), keys.end());
    return RuntimeResult<std::vector<std::string>>::ok(std::move(keys));
}

RuntimeResult<void> StateStore::DropNamespace(std::string_view ns) {
    if (!IsValidExtensionId(ns)) {
        return RuntimeResult<void>::err(stateError("invalid state namespace '" + std::string(ns) + "'"));
    }
    std::error_code ec;
    auto removed = std::filesystem::remove_all(NamespaceDir(ns), ec);
    if (ec) {
        return RuntimeResult<void>::err(
            stateError("failed to drop namespace '" + std::string(ns) + "': " + ec.message()));
    }
    CPR_LOG_INFO(LogCategory::State, "dropped state namespace '" + std::string(ns) + "' (" +
                                         std::to_string(removed) + " entries)");
    return RuntimeResult<void>::ok();
}

}  // namespace cpr::plugin
