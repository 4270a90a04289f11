/// @file registry.cpp
/// @brief Registry implementation.

#include "cpr/plugin/registry.hpp"

#include "cpr/foundation/error_code.hpp"

#include <algorithm>

using cpr::foundation::ErrorCode;
using cpr::foundation::RuntimeError;
using cpr::foundation::RuntimeResult;

namespace cpr::plugin {

std::string_view LifecycleStateName(LifecycleState state) {
    switch (state) {
        case LifecycleState::Registered:
            return "REGISTERED";
        case LifecycleState::Initialized:
            return "INITIALIZED";
        case LifecycleState::Started:
            return "STARTED";
        case LifecycleState::Stopped:
            return "STOPPED";
        case LifecycleState::Unloaded:
            return "UNLOADED";
        case LifecycleState::Error:
            return "ERROR";
    }
    return "UNKNOWN";
}

// ── RegistryEntry ───────────────────────────────────────────────────────

void RegistryEntry::SetLastError(RuntimeError error) {
    std::lock_guard lock(errorMutex_);
    lastError_ = std::move(error);
}

void RegistryEntry::ClearLastError() {
    std::lock_guard lock(errorMutex_);
    lastError_.reset();
}

std::optional<RuntimeError> RegistryEntry::LastError() const {
    std::lock_guard lock(errorMutex_);
    return lastError_;
}

// ── Registry ────────────────────────────────────────────────────────────

RuntimeResult<void> Registry::Register(std::shared_ptr<RegistryEntry> entry) {
    const std::string id = entry->manifest.id;

    std::unique_lock lock(mutex_);
    if (auto it = entries_.find(id); it != entries_.end()) {
        if (it->second->state.load() != LifecycleState::Unloaded) {
            return RuntimeResult<void>::err(RuntimeError(
                ErrorCode::DuplicateExtensionId,
                "extension '" + id + "' is already registered from " +
                    it->second->extensionDir.string()));
        }
        order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    }

    entries_[id] = std::move(entry);
    order_.push_back(id);
    return RuntimeResult<void>::ok();
}

std::shared_ptr<RegistryEntry> Registry::Find(std::string_view id) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(std::string(id));
    return it != entries_.end() ? it->second : nullptr;
}

std::vector<std::shared_ptr<RegistryEntry>> Registry::Entries() const {
    std::shared_lock lock(mutex_);
    std::vector<std::shared_ptr<RegistryEntry>> out;
    out.reserve(order_.size());
    for (const auto& id : order_) {
        out.push_back(entries_.at(id));
    }
    return out;
}

std::unordered_map<std::string, SemVersion> Registry::ActiveVersions() const {
    std::shared_lock lock(mutex_);
    std::unordered_map<std::string, SemVersion> out;
    for (const auto& [id, entry] : entries_) {
        auto state = entry->state.load();
        if (state == LifecycleState::Initialized || state == LifecycleState::Started) {
            out.emplace(id, entry->manifest.parsedVersion);
        }
    }
    return out;
}

std::vector<EntrySnapshot> Registry::Snapshot() const {
    std::vector<EntrySnapshot> out;
    for (const auto& entry : Entries()) {
        EntrySnapshot snap;
        snap.id = entry->manifest.id;
        snap.version = entry->manifest.version;
        snap.state = entry->state.load();
        snap.extensionDir = entry->extensionDir;
        if (auto err = entry->LastError()) {
            snap.lastError = err->describe();
        }
        snap.violations = entry->violations.load();
        snap.isolated = entry->IsIsolated();
        out.push_back(std::move(snap));
    }
    return out;
}

std::size_t Registry::Size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

}  // namespace cpr::plugin
