#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "cpr/foundation/error_code.hpp"
#include "cpr/plugin/action_stream.hpp"

using namespace cpr::plugin;
using cpr::foundation::Clock;
using cpr::foundation::ErrorCode;
using cpr::foundation::RuntimeError;
using cpr::foundation::StreamId;

namespace {

struct ProducerLog {
    int pulls = 0;
    int releases = 0;
};

/// Producer yielding [0, n), then either ending or failing with @p failWith.
std::unique_ptr<ChunkProducer> counting(ProducerLog& log, int n,
                                        std::optional<RuntimeError> failWith = std::nullopt) {
    auto i = std::make_shared<int>(0);
    return MakeGenerator(
        [&log, i, n, failWith]() -> ChunkResult {
            ++log.pulls;
            if (*i >= n) {
                if (failWith) {
                    return ChunkResult::err(*failWith);
                }
                return ChunkResult::ok(std::nullopt);
            }
            return ChunkResult::ok(YAML::Node((*i)++));
        },
        [&log] { ++log.releases; });
}

std::shared_ptr<ActionStream> makeStream(std::unique_ptr<ChunkProducer> producer,
                                         ActionStream::CloseHook hook = {}) {
    return std::make_shared<ActionStream>(StreamId(7), "com.example.ticker", "ticks",
                                          std::move(producer), std::move(hook));
}

}  // namespace

// ===========================================================================
// Pulling
// ===========================================================================

TEST(ActionStreamTest, YieldsChunksThenCompletes) {
    ProducerLog log;
    std::vector<StreamState> closes;
    auto stream = makeStream(counting(log, 3), [&](StreamState s) { closes.push_back(s); });

    std::vector<int> seen;
    while (true) {
        auto chunk = stream->Next();
        ASSERT_TRUE(chunk.hasValue());
        if (!chunk.value()) {
            break;
        }
        seen.push_back(chunk.value()->as<int>());
    }

    EXPECT_EQ(seen, (std::vector<int>{0, 1, 2}));
    EXPECT_EQ(stream->State(), StreamState::Completed);
    EXPECT_EQ(stream->Delivered(), 3u);
    EXPECT_EQ(log.releases, 1);
    EXPECT_EQ(closes, (std::vector<StreamState>{StreamState::Completed}));

    // Further pulls keep reporting the end without touching the producer.
    EXPECT_FALSE(stream->Next().value().has_value());
    EXPECT_EQ(log.pulls, 4);
}

TEST(ActionStreamTest, ProducerRunsOnlyOnPull) {
    ProducerLog log;
    auto stream = makeStream(counting(log, 100));
    EXPECT_EQ(log.pulls, 0);

    ASSERT_TRUE(stream->Next().hasValue());
    ASSERT_TRUE(stream->Next().hasValue());
    EXPECT_EQ(log.pulls, 2);
}

TEST(ActionStreamTest, CancelReleasesOnceAndEndsStream) {
    ProducerLog log;
    auto stream = makeStream(counting(log, 100));
    ASSERT_TRUE(stream->Next().hasValue());

    stream->Cancel();
    stream->Cancel();
    EXPECT_EQ(stream->State(), StreamState::Cancelled);
    EXPECT_EQ(log.releases, 1);

    auto after = stream->Next();
    ASSERT_TRUE(after.hasValue());
    EXPECT_FALSE(after.value().has_value());
    EXPECT_EQ(log.pulls, 1);
}

TEST(ActionStreamTest, DestructorCancelsOpenStream) {
    ProducerLog log;
    StreamState closedWith = StreamState::Open;
    {
        auto stream = makeStream(counting(log, 5), [&](StreamState s) { closedWith = s; });
        ASSERT_TRUE(stream->Next().hasValue());
    }
    EXPECT_EQ(log.releases, 1);
    EXPECT_EQ(closedWith, StreamState::Cancelled);
}

// ===========================================================================
// Failures
// ===========================================================================

TEST(ActionStreamTest, ProducerErrorBecomesConsumptionFailure) {
    ProducerLog log;
    auto stream =
        makeStream(counting(log, 2, RuntimeError(ErrorCode::ActionFailed, "disk gone")));

    EXPECT_EQ(stream->Next().value()->as<int>(), 0);
    EXPECT_EQ(stream->Next().value()->as<int>(), 1);

    auto failed = stream->Next();
    ASSERT_TRUE(failed.hasError());
    EXPECT_EQ(failed.error().code(), ErrorCode::StreamConsumptionFailed);
    EXPECT_NE(std::string(failed.error().message()).find("disk gone"), std::string::npos);
    EXPECT_EQ(stream->State(), StreamState::Failed);
    EXPECT_EQ(log.releases, 1);

    // Chunks delivered before the failure stay counted; the error repeats.
    EXPECT_EQ(stream->Delivered(), 2u);
    auto again = stream->Next();
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::StreamConsumptionFailed);
}

TEST(ActionStreamTest, ResourceLimitErrorIsPassedThrough) {
    ProducerLog log;
    auto stream = makeStream(counting(
        log, 0,
        RuntimeError(ErrorCode::ResourceLimitExceeded, "too slow", std::string("wall_clock"))));

    auto r = stream->Next();
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::ResourceLimitExceeded);
    ASSERT_NE(r.error().context<std::string>(), nullptr);
    EXPECT_EQ(*r.error().context<std::string>(), "wall_clock");
}

TEST(ActionStreamTest, ThrowingProducerFailsStream) {
    auto stream = makeStream(MakeGenerator([]() -> ChunkResult {
        throw std::runtime_error("boom");
    }));

    auto r = stream->Next();
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::StreamConsumptionFailed);
    EXPECT_EQ(stream->State(), StreamState::Failed);
}

// ===========================================================================
// Idle expiry
// ===========================================================================

TEST(ActionStreamTest, ExpireIfIdle) {
    ProducerLog log;
    auto stream = makeStream(counting(log, 10));
    auto now = Clock::now();

    EXPECT_FALSE(stream->ExpireIfIdle(now, std::chrono::hours(1)));
    EXPECT_TRUE(stream->IsOpen());

    EXPECT_TRUE(stream->ExpireIfIdle(now + std::chrono::seconds(5), std::chrono::seconds(1)));
    EXPECT_EQ(stream->State(), StreamState::Expired);
    EXPECT_EQ(log.releases, 1);

    auto r = stream->Next();
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::StreamTimedOut);

    // Already closed.
    EXPECT_FALSE(stream->ExpireIfIdle(now + std::chrono::seconds(10), std::chrono::seconds(1)));
}

TEST(ActionStreamTest, StateNames) {
    EXPECT_EQ(StreamStateName(StreamState::Open), "open");
    EXPECT_EQ(StreamStateName(StreamState::Expired), "expired");
}

// ===========================================================================
// StreamSupervisor
// ===========================================================================

TEST(StreamSupervisorTest, SweepExpiresIdleAndForgetsClosed) {
    StreamSupervisor supervisor(std::chrono::milliseconds(50));
    ProducerLog idleLog;
    ProducerLog doneLog;

    auto idle = makeStream(counting(idleLog, 10));
    auto done = makeStream(counting(doneLog, 0));
    supervisor.Track(idle);
    supervisor.Track(done);
    EXPECT_EQ(supervisor.TrackedCount(), 2u);

    ASSERT_FALSE(done->Next().value().has_value());

    EXPECT_EQ(supervisor.Sweep(Clock::now() + std::chrono::seconds(1)), 1u);
    EXPECT_EQ(idle->State(), StreamState::Expired);

    supervisor.Sweep();
    EXPECT_EQ(supervisor.TrackedCount(), 0u);
}

TEST(StreamSupervisorTest, DroppedStreamsDisappear) {
    StreamSupervisor supervisor(std::chrono::milliseconds(50));
    ProducerLog log;
    {
        auto stream = makeStream(counting(log, 3));
        supervisor.Track(stream);
        EXPECT_EQ(supervisor.TrackedCount(), 1u);
    }
    EXPECT_EQ(supervisor.TrackedCount(), 0u);
    EXPECT_EQ(log.releases, 1);
}

TEST(StreamSupervisorTest, BackgroundThreadExpiresStreams) {
    StreamSupervisor supervisor(std::chrono::milliseconds(40));
    supervisor.Start();

    ProducerLog log;
    auto stream = makeStream(counting(log, 10));
    supervisor.Track(stream);

    auto deadline = Clock::now() + std::chrono::seconds(5);
    while (stream->IsOpen() && Clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    supervisor.Stop();

    EXPECT_EQ(stream->State(), StreamState::Expired);
}
