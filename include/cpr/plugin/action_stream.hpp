#pragma once

/// @file action_stream.hpp
/// @brief Pull-based, finite, cancellable streams of action output chunks.

#include "cpr/foundation/runtime_result.hpp"
#include "cpr/foundation/types.hpp"

#include <yaml-cpp/yaml.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace cpr::plugin {

/// Outcome of one pull: a chunk, end of stream (nullopt), or an error.
using ChunkResult = cpr::foundation::RuntimeResult<std::optional<YAML::Node>>;

/// Producer side of a stream, implemented by extensions.
///
/// The runtime calls Next() only when the consumer pulls, so a producer
/// does work between pulls and never buffers ahead.  Release() is called
/// exactly once when the stream closes for any reason, after which
/// Next() is never called again.
class ChunkProducer {
public:
    virtual ~ChunkProducer() = default;

    /// Produce the next chunk, nullopt at the end, or an error.
    virtual ChunkResult Next() = 0;

    /// Free resources held by the producer.
    virtual void Release() {}
};

/// ChunkProducer built from callables.
///
/// Example:
/// @code
///   int i = 0;
///   auto producer = MakeGenerator([i]() mutable -> ChunkResult {
///       if (i == 3) return ChunkResult::ok(std::nullopt);
///       return ChunkResult::ok(YAML::Node(i++));
///   });
/// @endcode
class GeneratorProducer final : public ChunkProducer {
public:
    using NextFn = std::function<ChunkResult()>;
    using ReleaseFn = std::function<void()>;

    explicit GeneratorProducer(NextFn next, ReleaseFn release = {})
        : next_(std::move(next)), release_(std::move(release)) {}

    ChunkResult Next() override { return next_(); }

    void Release() override {
        if (release_) {
            release_();
        }
    }

private:
    NextFn next_;
    ReleaseFn release_;
};

[[nodiscard]] inline std::unique_ptr<ChunkProducer>
MakeGenerator(GeneratorProducer::NextFn next, GeneratorProducer::ReleaseFn release = {}) {
    return std::make_unique<GeneratorProducer>(std::move(next), std::move(release));
}

/// Terminal and non-terminal stream states.
enum class StreamState : uint8_t {
    Open,       ///< More chunks may follow.
    Completed,  ///< Producer signalled the end.
    Failed,     ///< Producer or enforcement reported an error.
    Cancelled,  ///< Consumer cancelled.
    Expired     ///< No pull within the idle timeout.
};

[[nodiscard]] std::string_view StreamStateName(StreamState state);

/// Consumer handle for a streamed action result.
///
/// Next() pulls one chunk from the producer.  Chunks already returned
/// stay valid whatever happens later.  Once the stream leaves the Open
/// state the producer is released and:
///   - Completed and Cancelled streams return nullopt,
///   - Failed streams return the failure again,
///   - Expired streams return StreamTimedOut.
/// A producer error surfaces as StreamConsumptionFailed unless it is a
/// ResourceLimitExceeded, which is passed through.
class ActionStream {
public:
    using CloseHook = std::function<void(StreamState)>;

    ActionStream(cpr::foundation::StreamId id, std::string extensionId, std::string action,
                 std::unique_ptr<ChunkProducer> producer, CloseHook onClose = {});

    /// Cancels the stream if still open.
    ~ActionStream();

    ActionStream(const ActionStream&) = delete;
    ActionStream& operator=(const ActionStream&) = delete;

    /// Pull the next chunk.
    ChunkResult Next();

    /// Stop consuming early and release the producer. Idempotent.
    void Cancel();

    /// Expire the stream if no pull happened within @p idleTimeout of @p now.
    /// A pull in progress counts as activity.
    /// @return true if this call expired the stream.
    bool ExpireIfIdle(cpr::foundation::Clock::time_point now, std::chrono::milliseconds idleTimeout);

    [[nodiscard]] StreamState State() const;
    [[nodiscard]] bool IsOpen() const { return State() == StreamState::Open; }
    [[nodiscard]] std::size_t Delivered() const;
    [[nodiscard]] cpr::foundation::StreamId Id() const noexcept { return id_; }
    [[nodiscard]] const std::string& ExtensionId() const noexcept { return extensionId_; }
    [[nodiscard]] const std::string& Action() const noexcept { return action_; }

private:
    void closeLocked(StreamState finalState);

    const cpr::foundation::StreamId id_;
    const std::string extensionId_;
    const std::string action_;

    mutable std::mutex mutex_;
    std::unique_ptr<ChunkProducer> producer_;
    CloseHook onClose_;
    StreamState state_ = StreamState::Open;
    std::optional<cpr::foundation::RuntimeError> failure_;
    std::size_t delivered_ = 0;
    cpr::foundation::Clock::time_point lastActivity_;
};

/// Expires streams nobody has pulled from within the idle timeout.
///
/// Streams are tracked weakly; a stream dropped by its consumer is
/// cancelled by its own destructor and simply disappears from the list.
class StreamSupervisor {
public:
    explicit StreamSupervisor(std::chrono::milliseconds idleTimeout);
    ~StreamSupervisor();

    StreamSupervisor(const StreamSupervisor&) = delete;
    StreamSupervisor& operator=(const StreamSupervisor&) = delete;

    /// Start the background sweep thread. No-op if already running.
    void Start();

    /// Stop and join the sweep thread.
    void Stop();

    void Track(const std::shared_ptr<ActionStream>& stream);

    /// Expire idle streams now and forget closed ones.
    /// @return Number of streams expired by this sweep.
    std::size_t Sweep(cpr::foundation::Clock::time_point now = cpr::foundation::Clock::now());

    [[nodiscard]] std::size_t TrackedCount() const;

    [[nodiscard]] std::chrono::milliseconds IdleTimeout() const noexcept { return idleTimeout_; }

private:
    void run();

    const std::chrono::milliseconds idleTimeout_;
    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::vector<std::weak_ptr<ActionStream>> streams_;
    std::thread thread_;
    bool running_ = false;
};

/// Result of an action invocation: a terminal value or a stream.
class InvocationResult {
public:
    static InvocationResult Value(YAML::Node value) {
        InvocationResult r;
        r.value_ = std::move(value);
        return r;
    }

    static InvocationResult Stream(std::shared_ptr<ActionStream> stream) {
        InvocationResult r;
        r.stream_ = std::move(stream);
        return r;
    }

    [[nodiscard]] bool IsStream() const noexcept { return stream_ != nullptr; }

    /// The terminal value (Null for streams).
    [[nodiscard]] const YAML::Node& value() const noexcept { return value_; }

    /// The stream handle (nullptr for values).
    [[nodiscard]] const std::shared_ptr<ActionStream>& stream() const noexcept { return stream_; }

private:
    YAML::Node value_;
    std::shared_ptr<ActionStream> stream_;
};

}  // namespace cpr::plugin
