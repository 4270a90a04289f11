#pragma once

/// @file loader.hpp
/// @brief Resolves entry references, opens shared libraries and instantiates extensions.

#include "cpr/foundation/runtime_result.hpp"
#include "cpr/plugin/extension.hpp"
#include "cpr/plugin/manifest.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace cpr::plugin {

/// Parsed form of a manifest's entry_reference.
///
///   static:<name>          → compile-time registry (CPR_EXTENSION_REGISTER)
///   <path.so>              → shared library, factory CprCreateExtension
///   <path.so>#<symbol>     → shared library, custom factory symbol
struct EntryReference {
    enum class Kind : uint8_t { Static, SharedLibrary };

    Kind kind = Kind::SharedLibrary;
    std::string staticName;
    std::filesystem::path libraryPath;  ///< Relative paths are resolved against the extension dir.
    std::string factorySymbol;

    [[nodiscard]] static cpr::foundation::RuntimeResult<EntryReference>
    Parse(std::string_view text, const std::filesystem::path& extensionDir);
};

/// RAII handle over a dlopen'ed library.
class SharedLibrary {
public:
    /// Open @p path with RTLD_NOW | RTLD_LOCAL.
    [[nodiscard]] static cpr::foundation::RuntimeResult<std::shared_ptr<SharedLibrary>>
    Open(const std::filesystem::path& path);

    ~SharedLibrary();

    SharedLibrary(const SharedLibrary&) = delete;
    SharedLibrary& operator=(const SharedLibrary&) = delete;

    /// Look up a symbol (nullptr if absent).
    [[nodiscard]] void* Symbol(const std::string& name) const;

    [[nodiscard]] const std::filesystem::path& Path() const noexcept { return path_; }

private:
    SharedLibrary(void* handle, std::filesystem::path path)
        : handle_(handle), path_(std::move(path)) {}

    void* handle_;
    std::filesystem::path path_;
};

/// Deleter that keeps the owning library open until the instance is gone.
struct ExtensionDeleter {
    using DestroyFunc = void (*)(IExtension*);

    std::shared_ptr<SharedLibrary> library;
    DestroyFunc destroy = nullptr;

    void operator()(IExtension* extension) const {
        if (destroy != nullptr) {
            destroy(extension);
        } else {
            delete extension;
        }
    }
};

using ExtensionPtr = std::unique_ptr<IExtension, ExtensionDeleter>;

/// Dynamically loads extensions and validates their capability interface.
///
/// Libraries are cached by canonical path; every instance holds a shared
/// reference so a library is closed only when its last instance is
/// destroyed.
class ExtensionLoader {
public:
    /// Instantiate the extension described by @p manifest.
    ///
    /// @return ExtensionLoadFailed if the unit cannot be opened, the
    ///         factory is missing or returns null, the API version does not
    ///         match, or the instance does not support every declared action.
    [[nodiscard]] cpr::foundation::RuntimeResult<ExtensionPtr>
    Load(const Manifest& manifest, const std::filesystem::path& extensionDir);

    /// Instantiate from an already parsed entry reference.
    [[nodiscard]] cpr::foundation::RuntimeResult<ExtensionPtr>
    Instantiate(const EntryReference& entry, const Manifest& manifest);

    /// Open (or reuse) the library at @p path.
    [[nodiscard]] cpr::foundation::RuntimeResult<std::shared_ptr<SharedLibrary>>
    OpenLibrary(const std::filesystem::path& path);

    /// Number of libraries currently open through this loader.
    [[nodiscard]] std::size_t CachedLibraryCount() const;

    /// Check that @p instance supports every action @p manifest declares.
    [[nodiscard]] static cpr::foundation::RuntimeResult<void>
    ValidateInterface(const IExtension& instance, const Manifest& manifest);

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::weak_ptr<SharedLibrary>> cache_;
};

}  // namespace cpr::plugin
