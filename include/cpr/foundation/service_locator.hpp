#pragma once

/// @file service_locator.hpp
/// @brief Type-safe registry of host services exposed to extensions.

#include <any>
#include <memory>
#include <typeindex>
#include <unordered_map>

namespace cpr::foundation {

/// Host-side service registry handed to extensions through their context.
///
/// The host registers shared services (e.g. the ConfigManager) by type;
/// extensions look them up without linking against host internals.
/// Services are held as shared_ptr so the host may keep its own handle.
///
/// Example:
/// @code
///   ServiceLocator services;
///   services.add<ConfigManager>(config);
///
///   if (auto* cfg = ctx.services->get<ConfigManager>()) { ... }
/// @endcode
class ServiceLocator {
public:
    ServiceLocator() = default;

    ServiceLocator(const ServiceLocator&) = delete;
    ServiceLocator& operator=(const ServiceLocator&) = delete;

    /// Register a service by type T, replacing any previous one.
    template <typename T>
    void add(std::shared_ptr<T> service) {
        services_[std::type_index(typeid(T))] = std::move(service);
    }

    /// Retrieve a registered service (nullptr if not found).
    template <typename T>
    [[nodiscard]] T* get() const {
        auto it = services_.find(std::type_index(typeid(T)));
        if (it == services_.end()) {
            return nullptr;
        }
        auto ptr = std::any_cast<std::shared_ptr<T>>(&it->second);
        return ptr ? ptr->get() : nullptr;
    }

    template <typename T>
    [[nodiscard]] bool has() const {
        return services_.count(std::type_index(typeid(T))) > 0;
    }

    [[nodiscard]] std::size_t size() const noexcept { return services_.size(); }

private:
    std::unordered_map<std::type_index, std::any> services_;
};

} // namespace cpr::foundation
