/// @file version_resolver.cpp
/// @brief Dependency resolution, topological ordering and cycle detection.

#include "cpr/plugin/version_resolver.hpp"

#include <algorithm>
#include <functional>
#include <set>

namespace cpr::plugin {

// ── Resolution ──────────────────────────────────────────────────────────

std::string DependencyResolution::Describe() const {
    switch (status) {
        case Status::Satisfied:
            return pluginId + " " + range + " satisfied by " + found->ToString();
        case Status::Missing:
            return "requires '" + pluginId + "' (" + range + ") but it is not available";
        case Status::VersionMismatch:
            return "requires '" + pluginId + "' " + range + " but available version is " +
                   found->ToString();
    }
    return pluginId;
}

bool ResolutionReport::AllSatisfied() const noexcept {
    return std::all_of(results.begin(), results.end(),
                       [](const DependencyResolution& r) { return r.satisfied(); });
}

std::string ResolutionReport::DescribeUnsatisfied() const {
    std::string msg;
    for (const auto& r : results) {
        if (r.satisfied()) {
            continue;
        }
        if (!msg.empty()) {
            msg += "; ";
        }
        msg += r.Describe();
    }
    return msg;
}

ResolutionReport VersionResolver::Resolve(
    const std::unordered_map<std::string, SemVersion>& available,
    const std::vector<DependencySpec>& deps) {
    ResolutionReport report;
    report.results.reserve(deps.size());

    for (const auto& dep : deps) {
        DependencyResolution res;
        res.pluginId = dep.pluginId;
        res.range = dep.range.Text();

        auto it = available.find(dep.pluginId);
        if (it == available.end()) {
            res.status = DependencyResolution::Status::Missing;
        } else {
            res.found = it->second;
            res.status = dep.IsSatisfiedBy(it->second)
                             ? DependencyResolution::Status::Satisfied
                             : DependencyResolution::Status::VersionMismatch;
        }
        report.results.push_back(std::move(res));
    }
    return report;
}

// ── Startup ordering ────────────────────────────────────────────────────

StartupPlan VersionResolver::StartupOrder(
    const std::map<std::string, std::vector<std::string>>& graph) {
    StartupPlan plan;

    // dependency -> dependents, and remaining in-degree per node.
    std::map<std::string, std::vector<std::string>> dependents;
    std::map<std::string, std::size_t> inDegree;
    for (const auto& [id, deps] : graph) {
        inDegree.emplace(id, 0);
        std::set<std::string> unique(deps.begin(), deps.end());
        for (const auto& dep : unique) {
            if (graph.count(dep) == 0 || dep == id) {
                continue;
            }
            dependents[dep].push_back(id);
            ++inDegree[id];
        }
    }

    // Kahn's algorithm with an ordered ready set for determinism.
    std::set<std::string> ready;
    for (const auto& [id, degree] : inDegree) {
        if (degree == 0) {
            ready.insert(id);
        }
    }
    while (!ready.empty()) {
        auto current = *ready.begin();
        ready.erase(ready.begin());
        plan.order.push_back(current);

        auto it = dependents.find(current);
        if (it == dependents.end()) {
            continue;
        }
        for (const auto& dependent : it->second) {
            if (--inDegree[dependent] == 0) {
                ready.insert(dependent);
            }
        }
    }

    if (plan.order.size() == graph.size()) {
        return plan;
    }

    for (const auto& [id, degree] : inDegree) {
        if (degree > 0) {
            plan.blocked.push_back(id);
        }
    }

    // DFS over the blocked subgraph to report one concrete cycle.
    enum class Color : uint8_t { White, Gray, Black };
    std::map<std::string, Color> color;
    for (const auto& id : plan.blocked) {
        color[id] = Color::White;
    }
    std::vector<std::string> stack;

    std::function<bool(const std::string&)> dfs = [&](const std::string& node) -> bool {
        color[node] = Color::Gray;
        stack.push_back(node);
        for (const auto& dep : graph.at(node)) {
            auto c = color.find(dep);
            if (c == color.end()) {
                continue;
            }
            if (c->second == Color::Gray) {
                auto start = std::find(stack.begin(), stack.end(), dep);
                plan.cyclePath.assign(start, stack.end());
                plan.cyclePath.push_back(dep);
                return true;
            }
            if (c->second == Color::White && dfs(dep)) {
                return true;
            }
        }
        stack.pop_back();
        color[node] = Color::Black;
        return false;
    };

    for (const auto& id : plan.blocked) {
        if (color[id] == Color::White && dfs(id)) {
            break;
        }
    }
    return plan;
}

}  // namespace cpr::plugin
