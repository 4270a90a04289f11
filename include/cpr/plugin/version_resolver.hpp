#pragma once

/// @file version_resolver.hpp
/// @brief Pure dependency resolution and dependency-ordered startup planning.

#include "cpr/foundation/runtime_result.hpp"
#include "cpr/plugin/version_constraint.hpp"

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cpr::plugin {

/// Outcome for one declared dependency.
struct DependencyResolution {
    enum class Status : uint8_t { Satisfied, Missing, VersionMismatch };

    std::string pluginId;
    std::string range;
    Status status = Status::Missing;
    std::optional<SemVersion> found;  ///< Version present, if any.

    [[nodiscard]] bool satisfied() const noexcept { return status == Status::Satisfied; }

    /// One-line human-readable description.
    [[nodiscard]] std::string Describe() const;
};

/// Per-dependency resolution results, in declaration order.
struct ResolutionReport {
    std::vector<DependencyResolution> results;

    [[nodiscard]] bool AllSatisfied() const noexcept;

    /// Unsatisfied dependencies joined by "; " (empty when all satisfied).
    [[nodiscard]] std::string DescribeUnsatisfied() const;
};

/// Result of planning a dependency-ordered start.
struct StartupPlan {
    /// Ids in an order where every dependency precedes its dependents.
    std::vector<std::string> order;

    /// Ids that could not be ordered because they sit on or behind a cycle.
    std::vector<std::string> blocked;

    /// One concrete cycle, closed ("a -> b -> a"), empty when acyclic.
    std::vector<std::string> cyclePath;
};

/// Stateless dependency resolver.
///
/// Only one version of each id is ever registered, so resolution is a
/// single lookup per dependency: O(dependencies) and deterministic.
class VersionResolver {
public:
    /// Resolve @p deps against the currently available (id -> version) set.
    [[nodiscard]] static ResolutionReport Resolve(
        const std::unordered_map<std::string, SemVersion>& available,
        const std::vector<DependencySpec>& deps);

    /// Order the nodes of @p graph (id -> ids it depends on) topologically.
    ///
    /// Edges to ids absent from @p graph are ignored.  Ties are broken by
    /// id so the plan is reproducible.
    [[nodiscard]] static StartupPlan StartupOrder(
        const std::map<std::string, std::vector<std::string>>& graph);
};

}  // namespace cpr::plugin
