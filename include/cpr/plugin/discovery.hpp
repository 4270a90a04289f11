#pragma once

/// @file discovery.hpp
/// @brief Scans extension roots for manifests and builds the candidate catalog.

#include "cpr/foundation/job_scheduler.hpp"
#include "cpr/foundation/runtime_error.hpp"
#include "cpr/plugin/manifest.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace cpr::plugin {

/// A manifest that passed validation and won its id.
struct DiscoveredExtension {
    Manifest manifest;
    std::filesystem::path directory;
    std::filesystem::path manifestPath;
};

/// A manifest that failed to parse or validate.
struct RejectedManifest {
    std::filesystem::path path;
    cpr::foundation::RuntimeError error;
};

/// Two manifests declaring the same id; the first in discovery order is kept.
struct DuplicateConflict {
    std::string id;
    std::string keptVersion;
    std::filesystem::path keptPath;
    std::string ignoredVersion;
    std::filesystem::path ignoredPath;
};

struct DiscoveryReport {
    std::vector<DiscoveredExtension> accepted;
    std::vector<RejectedManifest> rejected;
    std::vector<DuplicateConflict> duplicates;
};

/// Finds one manifest per extension directory.
///
/// Discovery order is: roots in the order given, then each root's
/// immediate subdirectories sorted by name.  Manifests are parsed in
/// parallel on the job scheduler when one is supplied; the catalog is
/// then committed sequentially in discovery order, so the first manifest
/// for an id always wins.  A bad manifest is logged and skipped and never
/// aborts the pass.
class Discovery {
public:
    /// @param scheduler Optional pool used to parse manifests in parallel.
    explicit Discovery(cpr::foundation::JobScheduler* scheduler = nullptr)
        : scheduler_(scheduler) {}

    [[nodiscard]] DiscoveryReport Scan(const std::vector<std::filesystem::path>& roots) const;

    /// Extension directories under @p roots, in discovery order.
    [[nodiscard]] static std::vector<std::filesystem::path>
    CandidateDirectories(const std::vector<std::filesystem::path>& roots);

private:
    cpr::foundation::JobScheduler* scheduler_;
};

}  // namespace cpr::plugin
