#pragma once

/// @file job_scheduler.hpp
/// @brief JobScheduler wrapping kcenon thread_system for parallel runtime work.

#include "cpr/foundation/runtime_result.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

namespace cpr::foundation {

/// Priority levels for scheduled jobs.
///
/// Maps to kcenon::thread::job_priority internally:
///   High -> high, Normal -> normal, Low -> low
enum class JobPriority { High, Normal, Low };

/// Job scheduler wrapping kcenon's thread_system.
///
/// Used by discovery to parse manifests concurrently. Uses PIMPL to hide
/// thread_system details from the public API.
///
/// Example:
/// @code
///   JobScheduler scheduler(4);
///   auto id = scheduler.schedule([] { parseOne(); });
///   scheduler.wait(id.value());
/// @endcode
class JobScheduler {
public:
    using JobId = uint64_t;
    using JobFunc = std::function<void()>;

    /// Construct a scheduler backed by a thread pool with @p numThreads workers.
    explicit JobScheduler(std::size_t numThreads = std::thread::hardware_concurrency());

    ~JobScheduler();

    JobScheduler(const JobScheduler&) = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;
    JobScheduler(JobScheduler&&) noexcept;
    JobScheduler& operator=(JobScheduler&&) noexcept;

    /// Schedule a job with the given priority.
    /// @return The assigned JobId on success, or JobScheduleFailed.
    RuntimeResult<JobId> schedule(JobFunc job, JobPriority priority = JobPriority::Normal);

    /// Block until the job identified by @p id completes, then forget it.
    /// @return Success, JobNotFound, or ThreadError if the job threw.
    RuntimeResult<void> wait(JobId id);

    /// Schedule every job and wait for all of them.
    /// Jobs that cannot be enqueued run inline on the calling thread.
    /// @return The first failure observed, after every job has finished.
    RuntimeResult<void> runAll(std::vector<JobFunc> jobs);

    /// Number of worker threads.
    [[nodiscard]] std::size_t workerCount() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace cpr::foundation
