/// @file action_stream.cpp
/// @brief ActionStream pull/cancel/expiry semantics and the idle-stream supervisor.

#include "cpr/plugin/action_stream.hpp"

#include <algorithm>
#include <exception>

#include "cpr/foundation/error_code.hpp"
#include "cpr/foundation/runtime_logger.hpp"

using cpr::foundation::Clock;
using cpr::foundation::ErrorCode;
using cpr::foundation::LogCategory;
using cpr::foundation::LogContext;
using cpr::foundation::LogLevel;
using cpr::foundation::RuntimeError;
using cpr::foundation::RuntimeLogger;

namespace cpr::plugin {

std::string_view StreamStateName(StreamState state) {
    switch (state) {
        case StreamState::Open:      return "open";
        case StreamState::Completed: return "completed";
        case StreamState::Failed:    return "failed";
        case StreamState::Cancelled: return "cancelled";
        case StreamState::Expired:   return "expired";
    }
    return "unknown";
}

// ── ActionStream ────────────────────────────────────────────────────────

ActionStream::ActionStream(cpr::foundation::StreamId id, std::string extensionId,
                           std::string action, std::unique_ptr<ChunkProducer> producer,
                           CloseHook onClose)
    : id_(id),
      extensionId_(std::move(extensionId)),
      action_(std::move(action)),
      producer_(std::move(producer)),
      onClose_(std::move(onClose)),
      lastActivity_(Clock::now()) {}

ActionStream::~ActionStream() {
    Cancel();
}

ChunkResult ActionStream::Next() {
    std::lock_guard lock(mutex_);

    switch (state_) {
        case StreamState::Open:
            break;
        case StreamState::Completed:
        case StreamState::Cancelled:
            return ChunkResult::ok(std::nullopt);
        case StreamState::Failed:
            return ChunkResult::err(*failure_);
        case StreamState::Expired:
            return ChunkResult::err(RuntimeError(
                ErrorCode::StreamTimedOut,
                "stream " + std::to_string(id_.value()) + " expired after being idle"));
    }

    lastActivity_ = Clock::now();

    std::optional<ChunkResult> pulled;
    try {
        pulled.emplace(producer_->Next());
    } catch (const std::exception& e) {
        pulled.emplace(ChunkResult::err(
            RuntimeError(ErrorCode::StreamConsumptionFailed, std::string("producer threw: ") + e.what())));
    }
    lastActivity_ = Clock::now();

    if (pulled->hasError()) {
        const auto& err = pulled->error();
        if (err.code() == ErrorCode::ResourceLimitExceeded ||
            err.code() == ErrorCode::StreamConsumptionFailed) {
            failure_ = err;
        } else {
            failure_ = RuntimeError(ErrorCode::StreamConsumptionFailed,
                                    "stream failed after " + std::to_string(delivered_) +
                                        " chunk(s): " + std::string(err.message()));
        }
        LogContext ctx;
        ctx.extensionId = extensionId_;
        ctx.action = action_;
        ctx.streamId = id_.value();
        RuntimeLogger::instance().logWithContext(LogLevel::Warning, LogCategory::Stream,
                                                 std::string(failure_->message()), ctx);
        closeLocked(StreamState::Failed);
        return ChunkResult::err(*failure_);
    }

    if (!pulled->value().has_value()) {
        closeLocked(StreamState::Completed);
        return ChunkResult::ok(std::nullopt);
    }

    ++delivered_;
    return std::move(*pulled);
}

void ActionStream::Cancel() {
    std::lock_guard lock(mutex_);
    if (state_ != StreamState::Open) {
        return;
    }
    CPR_LOG_DEBUG(LogCategory::Stream, "stream " + std::to_string(id_.value()) + " of " +
                                           extensionId_ + "." + action_ + " cancelled after " +
                                           std::to_string(delivered_) + " chunk(s)");
    closeLocked(StreamState::Cancelled);
}

bool ActionStream::ExpireIfIdle(Clock::time_point now, std::chrono::milliseconds idleTimeout) {
    std::unique_lock lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return false;  // a pull is in progress
    }
    if (state_ != StreamState::Open || now - lastActivity_ < idleTimeout) {
        return false;
    }
    CPR_LOG_WARN(LogCategory::Stream, "stream " + std::to_string(id_.value()) + " of " +
                                          extensionId_ + "." + action_ + " expired after " +
                                          std::to_string(idleTimeout.count()) + "ms idle");
    closeLocked(StreamState::Expired);
    return true;
}

StreamState ActionStream::State() const {
    std::lock_guard lock(mutex_);
    return state_;
}

std::size_t ActionStream::Delivered() const {
    std::lock_guard lock(mutex_);
    return delivered_;
}

void ActionStream::closeLocked(StreamState finalState) {
    state_ = finalState;
    if (producer_) {
        try {
            producer_->Release();
        } catch (const std::exception& e) {
            CPR_LOG_ERROR(LogCategory::Stream, "producer release for " + extensionId_ + "." +
                                                   action_ + " threw: " + e.what());
        }
        producer_.reset();
    }
    if (onClose_) {
        auto hook = std::move(onClose_);
        onClose_ = nullptr;
        hook(finalState);
    }
}

// ── StreamSupervisor ────────────────────────────────────────────────────

StreamSupervisor::StreamSupervisor(std::chrono::milliseconds idleTimeout)
    : idleTimeout_(idleTimeout) {}

StreamSupervisor::~StreamSupervisor() {
    Stop();
}

void StreamSupervisor::Start() {
    std::lock_guard lock(mutex_);
    if (running_ || idleTimeout_.count() <= 0) {
        return;
    }
    running_ = true;
    thread_ = std::thread([this] { run(); });
}

void StreamSupervisor::Stop() {
    {
        std::lock_guard lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    wake_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void StreamSupervisor::Track(const std::shared_ptr<ActionStream>& stream) {
    std::lock_guard lock(mutex_);
    streams_.push_back(stream);
}

std::size_t StreamSupervisor::Sweep(Clock::time_point now) {
    std::vector<std::shared_ptr<ActionStream>> live;
    {
        std::lock_guard lock(mutex_);
        streams_.erase(std::remove_if(streams_.begin(), streams_.end(),
                                      [&](const std::weak_ptr<ActionStream>& weak) {
                                          auto s = weak.lock();
                                          if (!s || !s->IsOpen()) {
                                              return true;
                                          }
                                          live.push_back(std::move(s));
                                          return false;
                                      }),
                       streams_.end());
    }

    // Expire outside the lock: closing runs producer and slot-release hooks.
    std::size_t expired = 0;
    for (const auto& stream : live) {
        if (stream->ExpireIfIdle(now, idleTimeout_)) {
            ++expired;
        }
    }
    return expired;
}

std::size_t StreamSupervisor::TrackedCount() const {
    std::lock_guard lock(mutex_);
    return static_cast<std::size_t>(
        std::count_if(streams_.begin(), streams_.end(),
                      [](const std::weak_ptr<ActionStream>& w) { return !w.expired(); }));
}

void StreamSupervisor::run() {
    auto interval = std::max(idleTimeout_ / 4, std::chrono::milliseconds(10));
    std::unique_lock lock(mutex_);
    while (running_) {
        wake_.wait_for(lock, interval, [this] { return !running_; });
        if (!running_) {
            break;
        }
        lock.unlock();
        Sweep();
        lock.lock();
    }
}

}  // namespace cpr::plugin
