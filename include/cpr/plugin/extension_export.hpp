#pragma once

/// @file extension_export.hpp
/// @brief Macros for exporting and registering extensions.
///
/// Shared-library extensions use CPR_EXTENSION_EXPORT to generate the C
/// entry points the loader resolves via dlsym.  Extensions linked into
/// the host use CPR_EXTENSION_REGISTER and are referenced from their
/// manifest as `static:<name>`.

#include "cpr/plugin/extension.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

/// Name of the default factory symbol.
#define CPR_EXTENSION_FACTORY_SYMBOL "CprCreateExtension"

// ── Dynamic extension export ────────────────────────────────────────────

/// Generate C-linkage entry points for a dynamically loaded extension.
///
/// Usage (in a .cpp file compiled into a shared library):
/// @code
///   class MyExtension : public cpr::plugin::IExtension { ... };
///   CPR_EXTENSION_EXPORT(MyExtension)
/// @endcode
#define CPR_EXTENSION_EXPORT(ExtensionClass)                          \
    extern "C" {                                                      \
    uint32_t CprExtensionApiVersion() {                               \
        return ::cpr::plugin::kExtensionApiVersion;                   \
    }                                                                 \
    ::cpr::plugin::IExtension* CprCreateExtension() {                 \
        return new ExtensionClass();                                  \
    }                                                                 \
    void CprDestroyExtension(::cpr::plugin::IExtension* extension) {  \
        delete extension;                                             \
    }                                                                 \
    }

// ── Static extension registration ───────────────────────────────────────

namespace cpr::plugin {

/// Factory function type for creating a static extension instance.
using ExtensionFactory = std::function<std::unique_ptr<IExtension>()>;

/// Entry in the static extension registry.
struct StaticExtensionEntry {
    std::string name;
    ExtensionFactory factory;
};

/// Global registry of statically linked extensions.
///
/// Populated at static-init time by CPR_EXTENSION_REGISTER.
inline std::vector<StaticExtensionEntry>& StaticExtensionRegistry() {
    static std::vector<StaticExtensionEntry> registry;
    return registry;
}

namespace detail {

/// RAII helper that registers a factory on construction.
struct StaticExtensionRegistrar {
    StaticExtensionRegistrar(const char* name, ExtensionFactory factory) {
        StaticExtensionRegistry().push_back({name, std::move(factory)});
    }
};

}  // namespace detail
}  // namespace cpr::plugin

/// Register an extension for static linking.
///
/// Usage (in a .cpp file linked into the host):
/// @code
///   class Greeter : public cpr::plugin::IExtension { ... };
///   CPR_EXTENSION_REGISTER(Greeter, "greeter")
/// @endcode
#define CPR_EXTENSION_REGISTER(ExtensionClass, ExtensionName)                                         \
    static ::cpr::plugin::detail::StaticExtensionRegistrar                                            \
    cpr_static_extension_##ExtensionClass##_registrar(ExtensionName,                                  \
                                                      []() -> std::unique_ptr<::cpr::plugin::IExtension> { \
                                                          return std::make_unique<ExtensionClass>();  \
                                                      })
