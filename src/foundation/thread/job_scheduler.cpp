/// @file job_scheduler.cpp
/// @brief JobScheduler implementation wrapping kcenon thread_system.

#include "cpr/foundation/job_scheduler.hpp"

// kcenon thread_system headers (hidden behind PIMPL)
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>
#include <kcenon/thread/core/job_builder.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace cpr::foundation {

// ---------------------------------------------------------------------------
// Priority mapping: CPR -> kcenon
// ---------------------------------------------------------------------------
static kcenon::thread::job_priority mapPriority(JobPriority p) {
    switch (p) {
        case JobPriority::High:   return kcenon::thread::job_priority::high;
        case JobPriority::Normal: return kcenon::thread::job_priority::normal;
        case JobPriority::Low:    return kcenon::thread::job_priority::low;
    }
    return kcenon::thread::job_priority::normal;
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct JobScheduler::Impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::size_t workers = 0;
    std::atomic<uint64_t> nextJobId{1};

    // JobId -> shared_future for wait() support
    std::unordered_map<JobId, std::shared_future<void>> futures;
    std::mutex mutex;
};

JobScheduler::JobScheduler(std::size_t numThreads)
    : impl_(std::make_unique<Impl>())
{
    impl_->workers = std::max<std::size_t>(1, numThreads);
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>("cpr_job_scheduler");

    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(impl_->workers);
    for (std::size_t i = 0; i < impl_->workers; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(workers));
    impl_->pool->start();
}

JobScheduler::~JobScheduler() {
    if (impl_ && impl_->pool) {
        impl_->pool->stop(false); // graceful: wait for running jobs
    }
}

JobScheduler::JobScheduler(JobScheduler&&) noexcept = default;
JobScheduler& JobScheduler::operator=(JobScheduler&&) noexcept = default;

// ---------------------------------------------------------------------------
// schedule()
// ---------------------------------------------------------------------------
RuntimeResult<JobScheduler::JobId> JobScheduler::schedule(JobFunc job, JobPriority priority) {
    auto id = impl_->nextJobId.fetch_add(1, std::memory_order_relaxed);
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future().share();

    auto threadJob = kcenon::thread::job_builder()
        .name("cpr_job_" + std::to_string(id))
        .priority(mapPriority(priority))
        .work([fn = std::move(job), promise]() -> kcenon::common::VoidResult {
            try {
                fn();
                promise->set_value();
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
            return kcenon::common::VoidResult::ok(std::monostate{});
        })
        .build();

    auto enqResult = impl_->pool->enqueue(std::move(threadJob));
    if (enqResult.is_err()) {
        return RuntimeResult<JobId>::err(
            RuntimeError(ErrorCode::JobScheduleFailed, "failed to enqueue job"));
    }

    std::lock_guard lock(impl_->mutex);
    impl_->futures[id] = future;
    return RuntimeResult<JobId>::ok(id);
}

// ---------------------------------------------------------------------------
// wait()
// ---------------------------------------------------------------------------
RuntimeResult<void> JobScheduler::wait(JobId id) {
    std::shared_future<void> future;
    {
        std::lock_guard lock(impl_->mutex);
        auto it = impl_->futures.find(id);
        if (it == impl_->futures.end()) {
            return RuntimeResult<void>::err(
                RuntimeError(ErrorCode::JobNotFound, "job not found"));
        }
        future = it->second;
        impl_->futures.erase(it);
    }

    try {
        future.get();
    } catch (const std::exception& e) {
        return RuntimeResult<void>::err(
            RuntimeError(ErrorCode::ThreadError, std::string("job execution failed: ") + e.what()));
    } catch (...) {
        return RuntimeResult<void>::err(
            RuntimeError(ErrorCode::ThreadError, "job execution failed"));
    }
    return RuntimeResult<void>::ok();
}

// ---------------------------------------------------------------------------
// runAll()
// ---------------------------------------------------------------------------
RuntimeResult<void> JobScheduler::runAll(std::vector<JobFunc> jobs) {
    std::vector<JobId> ids;
    ids.reserve(jobs.size());
    std::optional<RuntimeError> firstError;

    for (auto& job : jobs) {
        auto inlineCopy = job;
        auto id = schedule(std::move(job));
        if (id) {
            ids.push_back(id.value());
            continue;
        }
        try {
            inlineCopy();
        } catch (const std::exception& e) {
            if (!firstError) {
                firstError = RuntimeError(ErrorCode::ThreadError,
                                          std::string("job execution failed: ") + e.what());
            }
        }
    }

    for (auto id : ids) {
        auto result = wait(id);
        if (!result && !firstError) {
            firstError = result.error();
        }
    }

    if (firstError) {
        return RuntimeResult<void>::err(std::move(*firstError));
    }
    return RuntimeResult<void>::ok();
}

std::size_t JobScheduler::workerCount() const noexcept {
    return impl_->workers;
}

} // namespace cpr::foundation
