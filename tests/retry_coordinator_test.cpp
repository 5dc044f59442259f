#include "../core/retry_coordinator.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <memory>

using namespace qrreceive;
using namespace qrreceive::test_support;
using namespace std::chrono_literals;

class RetryCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ErrorManager::instance().clear_stats();

        original = pattern(60, 21);
        envelopes = make_envelopes(original, original, 20);
        raw = serialize_all(envelopes);

        retry_config.max_retries = 5;
        retry_config.base_delay = 1000ms;
        retry_config.max_delay = 30000ms;
        retry_config.backoff_factor = 2.0;
        retry_config.jitter_max = 0ms;
        retry_config.max_concurrent = 3;

        store = std::make_unique<ChunkStore>(ChunkStoreConfig{});
        generation = store->begin_transfer(TransferInfo::from_header(envelopes[0]), clock.now());
    }

    std::unique_ptr<RetryCoordinator> make_coordinator() {
        auto coordinator = std::make_unique<RetryCoordinator>(retry_config, *store, capture, clock.fn(), 1234u);
        coordinator->begin(generation, static_cast<uint32_t>(envelopes.size()));

        RetryCoordinator::Callbacks callbacks;
        callbacks.on_retry = [this](uint32_t index, uint32_t attempt) {
            retried.emplace_back(index, attempt);
        };
        callbacks.on_success = [this](uint32_t index, uint32_t, const AddOutcome&) {
            recovered.push_back(index);
        };
        callbacks.on_failure = [this](uint32_t index, uint32_t, const ErrorInfo&) {
            failures.push_back(index);
        };
        callbacks.on_permanent_failure = [this](uint32_t index, const ErrorInfo& error) {
            permanent.push_back(index);
            EXPECT_EQ(error.code, ErrorCode::RETRY_CEILING_EXCEEDED);
        };
        coordinator->set_callbacks(std::move(callbacks));
        return coordinator;
    }

    std::vector<uint8_t> original;
    std::vector<Envelope> envelopes;
    std::vector<std::string> raw;

    RetryConfig retry_config;
    FakeClock clock;
    FakeCaptureSource capture;
    std::unique_ptr<ChunkStore> store;
    uint64_t generation = 0;

    std::vector<std::pair<uint32_t, uint32_t>> retried;
    std::vector<uint32_t> recovered;
    std::vector<uint32_t> failures;
    std::vector<uint32_t> permanent;
};

TEST_F(RetryCoordinatorTest, BackoffGrowsAndIsClamped) {
    std::chrono::milliseconds previous{0};
    for (uint32_t attempt = 1; attempt <= 20; ++attempt) {
        const auto d = RetryCoordinator::backoff(retry_config, attempt);
        EXPECT_GE(d, previous);
        EXPECT_LE(d, retry_config.max_delay);
        previous = d;
    }
    EXPECT_EQ(RetryCoordinator::backoff(retry_config, 1), 1000ms);
    EXPECT_EQ(RetryCoordinator::backoff(retry_config, 3), 4000ms);
    EXPECT_EQ(RetryCoordinator::backoff(retry_config, 10), 30000ms);
}

TEST_F(RetryCoordinatorTest, JitterStaysWithinBound) {
    retry_config.jitter_max = 1000ms;
    auto coordinator = make_coordinator();
    for (int i = 0; i < 200; ++i) {
        const auto d = coordinator->delay(12);
        EXPECT_GE(d, 30000ms);
        EXPECT_LE(d, 31000ms);
    }
}

TEST_F(RetryCoordinatorTest, NotifyMissingCreatesOneTicket) {
    auto coordinator = make_coordinator();
    EXPECT_TRUE(coordinator->notify_missing(1));
    EXPECT_FALSE(coordinator->notify_missing(1));
    EXPECT_FALSE(coordinator->notify_missing(99));

    auto ticket = coordinator->ticket(1);
    ASSERT_TRUE(ticket);
    EXPECT_EQ(ticket->attempt, 1u);
    EXPECT_EQ(ticket->delay, 1000ms);
    EXPECT_EQ(ticket->eligible_at, clock.now() + 1000ms);
    EXPECT_FALSE(ticket->active);
    EXPECT_EQ(coordinator->stats().queued, 1u);
}

TEST_F(RetryCoordinatorTest, WaitsForEligibility) {
    auto coordinator = make_coordinator();
    capture.provide(1, raw[1]);
    coordinator->notify_missing(1);

    clock.advance(999ms);
    EXPECT_EQ(coordinator->poll(), 0u);
    EXPECT_TRUE(capture.requests().empty());

    clock.advance(1ms);
    EXPECT_EQ(coordinator->poll(), 1u);
    EXPECT_EQ(store->state(1), BlockState::RECEIVED);
    EXPECT_EQ(recovered, std::vector<uint32_t>{1});
    EXPECT_FALSE(coordinator->ticket(1));
    EXPECT_EQ(coordinator->stats().succeeded, 1u);
}

TEST_F(RetryCoordinatorTest, BlockThatNeverArrivesFailsAfterCeiling) {
    auto coordinator = make_coordinator();
    ASSERT_TRUE(store->add_chunk(0, envelopes[0].payload).success());
    ASSERT_TRUE(store->add_chunk(2, envelopes[2].payload).success());
    coordinator->notify_missing(1);

    std::vector<std::chrono::milliseconds> delays;
    for (uint32_t attempt = 1; attempt <= retry_config.max_retries; ++attempt) {
        auto ticket = coordinator->ticket(1);
        ASSERT_TRUE(ticket) << "attempt " << attempt;
        EXPECT_EQ(ticket->attempt, attempt);
        delays.push_back(ticket->delay);
        clock.advance(ticket->delay);
        EXPECT_EQ(coordinator->poll(), 1u);
    }

    EXPECT_EQ(delays, (std::vector<std::chrono::milliseconds>{1000ms, 2000ms, 4000ms, 8000ms, 16000ms}));
    EXPECT_EQ(capture.requests().size(), 5u);
    EXPECT_EQ(failures.size(), 4u);
    EXPECT_EQ(permanent, std::vector<uint32_t>{1});
    EXPECT_EQ(store->state(1), BlockState::FAILED);
    EXPECT_FALSE(coordinator->ticket(1));
    EXPECT_EQ(coordinator->stats().permanently_failed, 1u);

    // No further attempts
    clock.advance(60s);
    EXPECT_EQ(coordinator->poll(), 0u);
    EXPECT_EQ(capture.requests().size(), 5u);

    Result<AssembledFile> assembled = store->assemble();
    ASSERT_FALSE(assembled.success());
    EXPECT_EQ(assembled.error().code, ErrorCode::TRANSFER_INCOMPLETE);
}

TEST_F(RetryCoordinatorTest, RespectsConcurrencyBound) {
    retry_config.max_concurrent = 2;
    auto coordinator = make_coordinator();
    capture.set_deferred(true);
    for (uint32_t index = 0; index < 3; ++index) {
        coordinator->notify_missing(index);
    }

    clock.advance(1s);
    EXPECT_EQ(coordinator->poll(), 2u);
    EXPECT_EQ(coordinator->stats().active, 2u);
    EXPECT_EQ(coordinator->poll(), 0u);
    EXPECT_EQ(store->state(0), BlockState::RETRYING);
    EXPECT_EQ(store->state(2), BlockState::PENDING);

    capture.provide(0, raw[0]);
    EXPECT_EQ(capture.complete_pending(), 2u);
    EXPECT_EQ(store->state(0), BlockState::RECEIVED);
    EXPECT_EQ(store->state(1), BlockState::AWAITING_RETRY);
    EXPECT_EQ(coordinator->stats().active, 0u);

    EXPECT_EQ(coordinator->poll(), 1u);
    EXPECT_EQ(capture.requests().back(), 2u);
}

TEST_F(RetryCoordinatorTest, SkipsBlocksThatArrivedMeanwhile) {
    auto coordinator = make_coordinator();
    coordinator->notify_missing(2);
    ASSERT_TRUE(store->add_chunk(2, envelopes[2].payload).success());

    clock.advance(5s);
    EXPECT_EQ(coordinator->poll(), 0u);
    EXPECT_TRUE(capture.requests().empty());
    EXPECT_FALSE(coordinator->ticket(2));
}

TEST_F(RetryCoordinatorTest, WrongBlockFromCaptureCountsAsFailure) {
    auto coordinator = make_coordinator();
    capture.provide(1, raw[2]);
    coordinator->notify_missing(1);

    clock.advance(1s);
    EXPECT_EQ(coordinator->poll(), 1u);
    EXPECT_EQ(failures, std::vector<uint32_t>{1});
    auto ticket = coordinator->ticket(1);
    ASSERT_TRUE(ticket);
    EXPECT_EQ(ticket->attempt, 2u);
    ASSERT_TRUE(ticket->last_error);
    EXPECT_EQ(ticket->last_error->code, ErrorCode::CAPTURE_FAILED);
    EXPECT_EQ(store->state(2), BlockState::PENDING);
}

TEST_F(RetryCoordinatorTest, BlockFromAnotherTransferCountsAsFailure) {
    // Same shape and filename, different content
    std::vector<Envelope> other = make_envelopes(pattern(60, 99), pattern(60, 99), 20);
    capture.provide(1, ProtocolCodec::serialize(other[1]));
    auto coordinator = make_coordinator();
    coordinator->notify_missing(1);

    clock.advance(1s);
    EXPECT_EQ(coordinator->poll(), 1u);
    EXPECT_EQ(failures, std::vector<uint32_t>{1});
    auto ticket = coordinator->ticket(1);
    ASSERT_TRUE(ticket);
    EXPECT_EQ(ticket->attempt, 2u);
    EXPECT_FALSE(ticket->active);
    ASSERT_TRUE(ticket->last_error);
    EXPECT_EQ(ticket->last_error->code, ErrorCode::STALE_TRANSFER);
    EXPECT_EQ(store->state(1), BlockState::AWAITING_RETRY);

    for (uint32_t attempt = 2; attempt <= retry_config.max_retries; ++attempt) {
        ticket = coordinator->ticket(1);
        ASSERT_TRUE(ticket) << "attempt " << attempt;
        clock.advance(ticket->delay);
        EXPECT_EQ(coordinator->poll(), 1u);
    }
    EXPECT_EQ(permanent, std::vector<uint32_t>{1});
    EXPECT_EQ(store->state(1), BlockState::FAILED);
    EXPECT_FALSE(coordinator->ticket(1));
    EXPECT_EQ(coordinator->stats().active, 0u);
}

TEST_F(RetryCoordinatorTest, ResultArrivingAfterDestructionIsIgnored) {
    capture.set_deferred(true);
    capture.provide(1, raw[1]);
    {
        auto coordinator = make_coordinator();
        coordinator->notify_missing(1);
        clock.advance(1s);
        ASSERT_EQ(coordinator->poll(), 1u);
    }
    ASSERT_EQ(capture.pending(), 1u);

    EXPECT_EQ(capture.complete_pending(), 1u);
    EXPECT_EQ(store->state(1), BlockState::RETRYING);
    EXPECT_TRUE(recovered.empty());
    EXPECT_TRUE(failures.empty());
}

TEST_F(RetryCoordinatorTest, ResultsForSupersededTransferAreDropped) {
    auto coordinator = make_coordinator();
    capture.set_deferred(true);
    capture.provide(1, raw[1]);
    coordinator->notify_missing(1);
    clock.advance(1s);
    ASSERT_EQ(coordinator->poll(), 1u);

    // Same transfer restarted: block 1 of the new generation must not be filled by the old request
    coordinator->reset();
    generation = store->begin_transfer(TransferInfo::from_header(envelopes[0]), clock.now());
    coordinator->begin(generation, static_cast<uint32_t>(envelopes.size()));

    EXPECT_EQ(capture.complete_pending(), 1u);
    EXPECT_EQ(store->state(1), BlockState::PENDING);
    EXPECT_TRUE(recovered.empty());
    EXPECT_TRUE(failures.empty());
}

TEST_F(RetryCoordinatorTest, PauseStopsIssuing) {
    auto coordinator = make_coordinator();
    capture.provide(1, raw[1]);
    coordinator->notify_missing(1);
    clock.advance(1s);

    coordinator->pause();
    EXPECT_TRUE(coordinator->paused());
    EXPECT_EQ(coordinator->poll(), 0u);

    coordinator->resume();
    EXPECT_EQ(coordinator->poll(), 1u);
    EXPECT_EQ(store->state(1), BlockState::RECEIVED);
}

TEST_F(RetryCoordinatorTest, StatsReportAttemptsNearCeiling) {
    retry_config.max_retries = 3;
    auto coordinator = make_coordinator();
    coordinator->notify_missing(0);
    coordinator->notify_missing(1);

    clock.advance(1s);
    EXPECT_EQ(coordinator->poll(), 2u);

    RetryStats stats = coordinator->stats();
    EXPECT_EQ(stats.queued, 2u);
    EXPECT_EQ(stats.active, 0u);
    EXPECT_DOUBLE_EQ(stats.average_attempts, 2.0);
    EXPECT_EQ(stats.near_ceiling, 2u);
}
