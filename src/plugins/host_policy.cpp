/// @file host_policy.cpp
/// @brief HostPolicy parsing and per-extension resolution.

#include "cpr/plugin/host_policy.hpp"

#include "cpr/foundation/error_code.hpp"

#include <fstream>
#include <sstream>

using cpr::foundation::ErrorCode;
using cpr::foundation::RuntimeError;
using cpr::foundation::RuntimeResult;

namespace cpr::plugin {

namespace {

constexpr const char* kPermissiveTier = "trusted";

RuntimeResult<HostPolicy> invalid(const std::string& message) {
    return RuntimeResult<HostPolicy>::err(RuntimeError(ErrorCode::PolicyInvalid, message));
}

/// Parse one policy block; @p where names it in errors.
RuntimeResult<PolicyRule> parseRule(const YAML::Node& node, const std::string& where) {
    auto fail = [&](const std::string& what) {
        return RuntimeResult<PolicyRule>::err(
            RuntimeError(ErrorCode::PolicyInvalid, where + ": " + what));
    };
    if (!node.IsMap()) {
        return fail("must be a mapping");
    }

    PolicyRule rule;
    try {
        if (auto perms = node["permissions"]) {
            if (!perms.IsSequence()) {
                return fail("permissions must be a list");
            }
            std::vector<std::string> list;
            for (const auto& p : perms) {
                auto token = p.as<std::string>();
                if (token.empty()) {
                    return fail("empty permission pattern");
                }
                list.push_back(std::move(token));
            }
            rule.permissions = std::move(list);
        }
        if (auto iso = node["isolated"]) {
            rule.isolated = iso.as<bool>();
        }
        if (auto limits = node["limits"]) {
            if (!limits.IsMap()) {
                return fail("limits must be a mapping");
            }
            if (auto v = limits["cpu_time_ms"]) rule.cpuTimeMs = v.as<int64_t>();
            if (auto v = limits["memory_bytes"]) rule.memoryBytes = v.as<uint64_t>();
            if (auto v = limits["wall_clock_ms"]) rule.wallClockMs = v.as<int64_t>();
            if (auto v = limits["max_output_bytes"]) rule.maxOutputBytes = v.as<uint64_t>();
            if (auto v = limits["max_concurrency"]) rule.maxConcurrency = v.as<uint32_t>();
            if ((rule.cpuTimeMs && *rule.cpuTimeMs < 0) ||
                (rule.wallClockMs && *rule.wallClockMs < 0)) {
                return fail("time limits must not be negative");
            }
        }
    } catch (const YAML::Exception& e) {
        return fail(e.what());
    }
    return RuntimeResult<PolicyRule>::ok(std::move(rule));
}

void applyRule(const PolicyRule& rule, ResolvedPolicy& out) {
    if (rule.permissions) out.allowedPermissions = *rule.permissions;
    if (rule.isolated) out.isolated = *rule.isolated;
    if (rule.cpuTimeMs) out.limits.cpuTime = std::chrono::milliseconds(*rule.cpuTimeMs);
    if (rule.memoryBytes) out.limits.memoryBytes = *rule.memoryBytes;
    if (rule.wallClockMs) out.limits.wallClock = std::chrono::milliseconds(*rule.wallClockMs);
    if (rule.maxOutputBytes) out.limits.maxOutputBytes = *rule.maxOutputBytes;
    if (rule.maxConcurrency) out.limits.maxConcurrency = *rule.maxConcurrency;
}

}  // namespace

bool ResolvedPolicy::Allows(std::string_view token) const {
    for (const auto& pattern : allowedPermissions) {
        if (HostPolicy::PermissionMatches(pattern, token)) {
            return true;
        }
    }
    return false;
}

HostPolicy::HostPolicy() : defaultTier_(kPermissiveTier) {
    PolicyRule permissive;
    permissive.permissions = std::vector<std::string>{"*"};
    permissive.isolated = false;
    tiers_.emplace(kPermissiveTier, std::move(permissive));
}

RuntimeResult<HostPolicy> HostPolicy::Load(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return RuntimeResult<HostPolicy>::err(RuntimeError(
            ErrorCode::ConfigLoadFailed, "cannot read policy file: " + path.string()));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return FromString(buffer.str());
}

RuntimeResult<HostPolicy> HostPolicy::FromString(std::string_view yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml));
    } catch (const YAML::Exception& e) {
        return invalid(std::string("policy parse error: ") + e.what());
    }
    return Parse(root);
}

RuntimeResult<HostPolicy> HostPolicy::Parse(const YAML::Node& root) {
    if (!root.IsMap()) {
        return invalid("policy root must be a mapping");
    }

    HostPolicy policy;
    policy.tiers_.clear();

    try {
        if (auto tiers = root["tiers"]) {
            if (!tiers.IsMap()) {
                return invalid("tiers must be a mapping");
            }
            for (const auto& kv : tiers) {
                auto name = kv.first.as<std::string>();
                auto rule = parseRule(kv.second, "tiers." + name);
                if (rule.hasError()) {
                    return RuntimeResult<HostPolicy>::err(rule.error());
                }
                policy.tiers_.emplace(std::move(name), std::move(rule).value());
            }
        }

        if (auto def = root["default_tier"]) {
            policy.defaultTier_ = def.as<std::string>();
        } else if (policy.tiers_.size() == 1) {
            policy.defaultTier_ = policy.tiers_.begin()->first;
        } else {
            policy.defaultTier_.clear();
        }

        if (!policy.defaultTier_.empty() && !policy.HasTier(policy.defaultTier_)) {
            return invalid("default_tier '" + policy.defaultTier_ + "' is not defined");
        }

        if (auto exts = root["extensions"]) {
            if (!exts.IsMap()) {
                return invalid("extensions must be a mapping");
            }
            for (const auto& kv : exts) {
                auto id = kv.first.as<std::string>();
                auto rule = parseRule(kv.second, "extensions." + id);
                if (rule.hasError()) {
                    return RuntimeResult<HostPolicy>::err(rule.error());
                }
                if (auto tier = kv.second["tier"]) {
                    auto tierName = tier.as<std::string>();
                    if (!policy.HasTier(tierName)) {
                        return invalid("extensions." + id + ": unknown tier '" + tierName + "'");
                    }
                    policy.extensionTiers_.emplace(id, std::move(tierName));
                }
                policy.extensions_.emplace(std::move(id), std::move(rule).value());
            }
        }
    } catch (const YAML::Exception& e) {
        return invalid(std::string("policy error: ") + e.what());
    }

    return RuntimeResult<HostPolicy>::ok(std::move(policy));
}

ResolvedPolicy HostPolicy::Resolve(std::string_view extensionId) const {
    ResolvedPolicy out;

    std::string tierName = defaultTier_;
    if (auto it = extensionTiers_.find(extensionId); it != extensionTiers_.end()) {
        tierName = it->second;
    }
    out.tier = tierName;

    if (auto it = tiers_.find(tierName); it != tiers_.end()) {
        applyRule(it->second, out);
    }
    if (auto it = extensions_.find(extensionId); it != extensions_.end()) {
        applyRule(it->second, out);
    }
    return out;
}

bool HostPolicy::HasTier(std::string_view tier) const {
    return tiers_.find(tier) != tiers_.end();
}

bool HostPolicy::PermissionMatches(std::string_view pattern, std::string_view token) {
    if (pattern == "*") {
        return true;
    }
    if (pattern.size() >= 2 && pattern.ends_with(".*")) {
        auto prefix = pattern.substr(0, pattern.size() - 1);  // keeps the dot
        return token.starts_with(prefix) && token.size() > prefix.size();
    }
    return pattern == token;
}

}  // namespace cpr::plugin
