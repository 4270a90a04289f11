#pragma once

/// @file host_policy.hpp
/// @brief Host-wide permission and resource-limit policy, keyed by trust tier and extension id.

#include "cpr/foundation/runtime_result.hpp"

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cpr::plugin {

/// Per-extension resource ceilings.  Zero means unlimited.
struct ResourceLimits {
    std::chrono::milliseconds cpuTime{0};
    uint64_t memoryBytes = 0;
    std::chrono::milliseconds wallClock{0};
    uint64_t maxOutputBytes = 0;
    uint32_t maxConcurrency = 0;

    [[nodiscard]] bool HasCpuLimit() const noexcept { return cpuTime.count() > 0; }
    [[nodiscard]] bool HasWallClockLimit() const noexcept { return wallClock.count() > 0; }
};

/// One policy block (a tier or an extension override).  Unset fields
/// inherit from the block below.
struct PolicyRule {
    std::optional<std::vector<std::string>> permissions;
    std::optional<bool> isolated;
    std::optional<int64_t> cpuTimeMs;
    std::optional<uint64_t> memoryBytes;
    std::optional<int64_t> wallClockMs;
    std::optional<uint64_t> maxOutputBytes;
    std::optional<uint32_t> maxConcurrency;
};

/// Effective policy for one extension.
struct ResolvedPolicy {
    std::string tier;
    std::vector<std::string> allowedPermissions;  ///< Patterns: exact, `prefix.*` or `*`.
    bool isolated = false;
    ResourceLimits limits;

    /// True if @p token is allowed by any pattern.
    [[nodiscard]] bool Allows(std::string_view token) const;
};

/// Host policy read once at startup.
///
/// Policy file format:
/// @code
///   default_tier: trusted
///   tiers:
///     trusted:
///       permissions: ["*"]
///     untrusted:
///       permissions: ["state.*", "events.publish"]
///       isolated: true
///       limits: { cpu_time_ms: 2000, memory_bytes: 268435456, wall_clock_ms: 5000 }
///   extensions:
///     com.example.greeter:
///       tier: untrusted
///       limits: { max_output_bytes: 65536 }
/// @endcode
///
/// Resolution: the extension's tier (or default_tier) is applied, then
/// the extension's own keys override field by field.
class HostPolicy {
public:
    /// Permissive default used when no policy is configured: everything
    /// allowed, in-process, unlimited.
    HostPolicy();

    /// Parse a policy file.
    /// @return PolicyInvalid on malformed content, ConfigLoadFailed if unreadable.
    [[nodiscard]] static cpr::foundation::RuntimeResult<HostPolicy>
    Load(const std::filesystem::path& path);

    /// Parse policy YAML text.
    [[nodiscard]] static cpr::foundation::RuntimeResult<HostPolicy> FromString(std::string_view yaml);

    /// Build from a parsed document.
    [[nodiscard]] static cpr::foundation::RuntimeResult<HostPolicy> Parse(const YAML::Node& root);

    /// Effective policy for @p extensionId.
    [[nodiscard]] ResolvedPolicy Resolve(std::string_view extensionId) const;

    [[nodiscard]] const std::string& DefaultTier() const noexcept { return defaultTier_; }
    [[nodiscard]] bool HasTier(std::string_view tier) const;

    /// `*` matches anything; `prefix.*` matches `prefix.` and below; otherwise exact.
    [[nodiscard]] static bool PermissionMatches(std::string_view pattern, std::string_view token);

private:
    std::string defaultTier_;
    std::map<std::string, PolicyRule, std::less<>> tiers_;
    std::map<std::string, PolicyRule, std::less<>> extensions_;
    std::map<std::string, std::string, std::less<>> extensionTiers_;
};

}  // namespace cpr::plugin
