/// @file discovery.cpp
/// @brief Discovery implementation: directory walk, parallel parsing, first-wins commit.

#include "cpr/plugin/discovery.hpp"

#include "cpr/foundation/error_code.hpp"
#include "cpr/foundation/runtime_logger.hpp"

#include <algorithm>
#include <optional>
#include <unordered_map>

using cpr::foundation::ErrorCode;
using cpr::foundation::JobScheduler;
using cpr::foundation::LogCategory;
using cpr::foundation::RuntimeError;
using cpr::foundation::RuntimeResult;

namespace cpr::plugin {

namespace {

struct Candidate {
    std::filesystem::path directory;
    std::filesystem::path manifestPath;
    std::optional<RuntimeResult<Manifest>> parsed;
};

}  // namespace

std::vector<std::filesystem::path> Discovery::CandidateDirectories(
    const std::vector<std::filesystem::path>& roots) {
    std::vector<std::filesystem::path> out;

    for (const auto& root : roots) {
        std::error_code ec;
        if (!std::filesystem::is_directory(root, ec)) {
            CPR_LOG_WARN(LogCategory::Discovery,
                         "extension root " + root.string() + " does not exist; skipped");
            continue;
        }

        std::vector<std::filesystem::path> dirs;
        for (auto it = std::filesystem::directory_iterator(root, ec);
             !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
            if (it->is_directory(ec)) {
                dirs.push_back(it->path());
            }
        }
        if (ec) {
            CPR_LOG_WARN(LogCategory::Discovery,
                         "cannot list " + root.string() + ": " + ec.message());
        }

        std::sort(dirs.begin(), dirs.end(),
                  [](const auto& a, const auto& b) { return a.filename() < b.filename(); });
        out.insert(out.end(), dirs.begin(), dirs.end());
    }
    return out;
}

DiscoveryReport Discovery::Scan(const std::vector<std::filesystem::path>& roots) const {
    std::vector<Candidate> candidates;
    for (const auto& dir : CandidateDirectories(roots)) {
        auto manifestPath = FindManifestFile(dir);
        if (!manifestPath) {
            CPR_LOG_DEBUG(LogCategory::Discovery, "no manifest in " + dir.string());
            continue;
        }
        candidates.push_back({dir, *manifestPath, std::nullopt});
    }

    // Parse independently; each job writes only its own slot.
    std::vector<JobScheduler::JobFunc> jobs;
    jobs.reserve(candidates.size());
    for (auto& candidate : candidates) {
        jobs.emplace_back([&candidate] { candidate.parsed = ParseManifestFile(candidate.manifestPath); });
    }

    if (scheduler_ != nullptr) {
        if (auto ran = scheduler_->runAll(std::move(jobs)); ran.hasError()) {
            CPR_LOG_WARN(LogCategory::Discovery,
                         "parallel manifest parsing reported: " + ran.error().describe());
        }
    } else {
        for (auto& job : jobs) {
            job();
        }
    }

    // Commit sequentially in discovery order.
    DiscoveryReport report;
    std::unordered_map<std::string, std::size_t> byId;

    for (auto& candidate : candidates) {
        if (!candidate.parsed) {
            report.rejected.push_back(
                {candidate.manifestPath,
                 RuntimeError(ErrorCode::DiscoveryFailed, "manifest was not parsed")});
            continue;
        }

        auto& parsed = *candidate.parsed;
        if (parsed.hasError()) {
            CPR_LOG_WARN(LogCategory::Discovery, "rejected manifest " +
                                                     candidate.manifestPath.string() + ": " +
                                                     std::string(parsed.error().message()));
            report.rejected.push_back({candidate.manifestPath, parsed.error()});
            continue;
        }

        auto& manifest = parsed.value();
        if (auto it = byId.find(manifest.id); it != byId.end()) {
            const auto& kept = report.accepted[it->second];
            CPR_LOG_WARN(LogCategory::Discovery,
                         "duplicate extension id '" + manifest.id + "': keeping " +
                             kept.manifest.version + " at " + kept.directory.string() +
                             ", ignoring " + manifest.version + " at " +
                             candidate.directory.string());
            report.duplicates.push_back({manifest.id, kept.manifest.version, kept.directory,
                                         manifest.version, candidate.directory});
            continue;
        }

        byId.emplace(manifest.id, report.accepted.size());
        report.accepted.push_back(
            {std::move(manifest), candidate.directory, candidate.manifestPath});
    }

    CPR_LOG_INFO(LogCategory::Discovery,
                 "discovery found " + std::to_string(report.accepted.size()) + " extension(s), " +
                     std::to_string(report.rejected.size()) + " rejected, " +
                     std::to_string(report.duplicates.size()) + " duplicate(s)");
    return report;
}

}  // namespace cpr::plugin
