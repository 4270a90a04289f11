/// @file loader.cpp
/// @brief ExtensionLoader implementation: dlopen, factory lookup, interface checks.

#include "cpr/plugin/loader.hpp"

#include "cpr/foundation/error_code.hpp"
#include "cpr/foundation/runtime_logger.hpp"
#include "cpr/plugin/extension_export.hpp"

#include <algorithm>
#include <set>

#include <dlfcn.h>

using cpr::foundation::ErrorCode;
using cpr::foundation::LogCategory;
using cpr::foundation::RuntimeError;
using cpr::foundation::RuntimeResult;

namespace cpr::plugin {

namespace {

constexpr std::string_view kStaticPrefix = "static:";
constexpr const char* kApiVersionSymbol = "CprExtensionApiVersion";
constexpr const char* kDestroySymbol = "CprDestroyExtension";

using ApiVersionFunc = uint32_t (*)();
using CreateFunc = IExtension* (*)();

RuntimeResult<ExtensionPtr> loadFailed(const Manifest& manifest, std::string reason) {
    return RuntimeResult<ExtensionPtr>::err(RuntimeError(
        ErrorCode::ExtensionLoadFailed, "cannot load '" + manifest.id + "': " + reason));
}

}  // namespace

// ── EntryReference ──────────────────────────────────────────────────────

RuntimeResult<EntryReference> EntryReference::Parse(std::string_view text,
                                                    const std::filesystem::path& extensionDir) {
    EntryReference ref;
    if (text.starts_with(kStaticPrefix)) {
        ref.kind = Kind::Static;
        ref.staticName = std::string(text.substr(kStaticPrefix.size()));
        if (ref.staticName.empty()) {
            return RuntimeResult<EntryReference>::err(
                RuntimeError(ErrorCode::ExtensionLoadFailed, "empty static entry name"));
        }
        return RuntimeResult<EntryReference>::ok(std::move(ref));
    }

    std::string_view pathPart = text;
    ref.factorySymbol = CPR_EXTENSION_FACTORY_SYMBOL;
    if (auto hash = text.find('#'); hash != std::string_view::npos) {
        pathPart = text.substr(0, hash);
        ref.factorySymbol = std::string(text.substr(hash + 1));
        if (ref.factorySymbol.empty()) {
            return RuntimeResult<EntryReference>::err(RuntimeError(
                ErrorCode::ExtensionLoadFailed, "empty factory symbol in '" + std::string(text) + "'"));
        }
    }
    if (pathPart.empty()) {
        return RuntimeResult<EntryReference>::err(
            RuntimeError(ErrorCode::ExtensionLoadFailed, "empty library path"));
    }

    std::filesystem::path lib{std::string(pathPart)};
    ref.kind = Kind::SharedLibrary;
    ref.libraryPath = lib.is_absolute() ? lib : extensionDir / lib;
    return RuntimeResult<EntryReference>::ok(std::move(ref));
}

// ── SharedLibrary ───────────────────────────────────────────────────────

RuntimeResult<std::shared_ptr<SharedLibrary>> SharedLibrary::Open(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return RuntimeResult<std::shared_ptr<SharedLibrary>>::err(RuntimeError(
            ErrorCode::ExtensionLoadFailed, "library not found: " + path.string()));
    }

    void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (handle == nullptr) {
        const char* reason = dlerror();
        return RuntimeResult<std::shared_ptr<SharedLibrary>>::err(RuntimeError(
            ErrorCode::ExtensionLoadFailed, reason != nullptr ? reason : "dlopen failed"));
    }
    return RuntimeResult<std::shared_ptr<SharedLibrary>>::ok(
        std::shared_ptr<SharedLibrary>(new SharedLibrary(handle, path)));
}

SharedLibrary::~SharedLibrary() {
    if (handle_ != nullptr) {
        dlclose(handle_);
    }
}

void* SharedLibrary::Symbol(const std::string& name) const {
    return dlsym(handle_, name.c_str());
}

// ── ExtensionLoader ─────────────────────────────────────────────────────

RuntimeResult<ExtensionPtr> ExtensionLoader::Load(const Manifest& manifest,
                                                  const std::filesystem::path& extensionDir) {
    auto entry = EntryReference::Parse(manifest.entryReference, extensionDir);
    if (entry.hasError()) {
        return loadFailed(manifest, std::string(entry.error().message()));
    }
    return Instantiate(entry.value(), manifest);
}

RuntimeResult<ExtensionPtr> ExtensionLoader::Instantiate(const EntryReference& entry,
                                                         const Manifest& manifest) {
    ExtensionPtr instance;

    try {
        if (entry.kind == EntryReference::Kind::Static) {
            const auto& registry = StaticExtensionRegistry();
            auto it = std::find_if(registry.begin(), registry.end(),
                                   [&](const StaticExtensionEntry& e) {
                                       return e.name == entry.staticName;
                                   });
            if (it == registry.end()) {
                return loadFailed(manifest, "no static extension named '" + entry.staticName + "'");
            }
            instance = ExtensionPtr(it->factory().release(), ExtensionDeleter{});
        } else {
            auto lib = OpenLibrary(entry.libraryPath);
            if (lib.hasError()) {
                return loadFailed(manifest, std::string(lib.error().message()));
            }
            auto library = lib.value();

            auto apiFn = reinterpret_cast<ApiVersionFunc>(library->Symbol(kApiVersionSymbol));
            if (apiFn == nullptr) {
                return loadFailed(manifest, std::string("missing symbol ") + kApiVersionSymbol);
            }
            if (auto v = apiFn(); v != kExtensionApiVersion) {
                return loadFailed(manifest, "API version " + std::to_string(v) +
                                                " does not match runtime version " +
                                                std::to_string(kExtensionApiVersion));
            }

            auto createFn = reinterpret_cast<CreateFunc>(library->Symbol(entry.factorySymbol));
            if (createFn == nullptr) {
                return loadFailed(manifest, "missing factory symbol " + entry.factorySymbol);
            }
            auto destroyFn =
                reinterpret_cast<ExtensionDeleter::DestroyFunc>(library->Symbol(kDestroySymbol));

            instance = ExtensionPtr(createFn(), ExtensionDeleter{library, destroyFn});
        }
    } catch (const std::exception& e) {
        return loadFailed(manifest, std::string("factory threw: ") + e.what());
    }

    if (!instance) {
        return loadFailed(manifest, "factory returned null");
    }

    if (auto check = ValidateInterface(*instance, manifest); check.hasError()) {
        return loadFailed(manifest, std::string(check.error().message()));
    }

    CPR_LOG_DEBUG(LogCategory::Loader, "instantiated extension '" + manifest.id + "'");
    return RuntimeResult<ExtensionPtr>::ok(std::move(instance));
}

RuntimeResult<std::shared_ptr<SharedLibrary>> ExtensionLoader::OpenLibrary(
    const std::filesystem::path& path) {
    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(path, ec);
    const std::string key = ec ? path.string() : canonical.string();

    std::lock_guard lock(mutex_);
    if (auto it = cache_.find(key); it != cache_.end()) {
        if (auto cached = it->second.lock()) {
            return RuntimeResult<std::shared_ptr<SharedLibrary>>::ok(std::move(cached));
        }
    }

    auto opened = SharedLibrary::Open(ec ? path : canonical);
    if (opened.hasError()) {
        return opened;
    }
    cache_[key] = opened.value();
    CPR_LOG_DEBUG(LogCategory::Loader, "opened library " + key);
    return opened;
}

std::size_t ExtensionLoader::CachedLibraryCount() const {
    std::lock_guard lock(mutex_);
    return static_cast<std::size_t>(std::count_if(
        cache_.begin(), cache_.end(), [](const auto& kv) { return !kv.second.expired(); }));
}

RuntimeResult<void> ExtensionLoader::ValidateInterface(const IExtension& instance,
                                                       const Manifest& manifest) {
    std::vector<std::string> supported;
    try {
        supported = instance.SupportedActions();
    } catch (const std::exception& e) {
        return RuntimeResult<void>::err(RuntimeError(
            ErrorCode::InterfaceMismatch, std::string("SupportedActions() threw: ") + e.what()));
    }

    std::set<std::string> available(supported.begin(), supported.end());
    std::vector<std::string> missing;
    for (const auto& action : manifest.actions) {
        if (available.count(action.name) == 0) {
            missing.push_back(action.name);
        }
    }
    if (missing.empty()) {
        return RuntimeResult<void>::ok();
    }

    std::string joined;
    for (const auto& m : missing) {
        joined += (joined.empty() ? "" : ", ") + m;
    }
    return RuntimeResult<void>::err(RuntimeError(
        ErrorCode::InterfaceMismatch, "declared actions not supported: " + joined, missing));
}

}  // namespace cpr::plugin
