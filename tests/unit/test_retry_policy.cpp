#include <gtest/gtest.h>
#include <mapreducer/mapreducer.hpp>

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

using namespace mapreducer;
using namespace std::chrono_literals;

// ===========================================================================
// Helpers
// ===========================================================================

class RecordingMonitor : public Monitor {
public:
    void on_event(const MonitorEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events.push_back(event);
    }
    std::vector<MonitorEvent> events;

private:
    std::mutex mutex_;
};

static RetryConfig fast_retry(int max_retries = 7) {
    RetryConfig cfg;
    cfg.max_retries = max_retries;
    cfg.base_delay = 1ms;
    cfg.max_delay = 4ms;
    return cfg;
}

// ===========================================================================
// Classification and delays
// ===========================================================================

TEST(RetryPolicyTest, Classify) {
    EXPECT_EQ(RetryPolicy::classify(429), FailureKind::RateLimited);
    EXPECT_EQ(RetryPolicy::classify(500), FailureKind::ServerError);
    EXPECT_EQ(RetryPolicy::classify(503), FailureKind::ServerError);
    EXPECT_EQ(RetryPolicy::classify(400), FailureKind::Fatal);
    EXPECT_EQ(RetryPolicy::classify(401), FailureKind::Fatal);
    EXPECT_EQ(RetryPolicy::classify(404), FailureKind::Fatal);
}

TEST(RetryPolicyTest, BackoffDoublesUpToCap) {
    RetryPolicy policy;
    EXPECT_EQ(policy.backoff_delay(1), Duration(2000ms));
    EXPECT_EQ(policy.backoff_delay(2), Duration(4000ms));
    EXPECT_EQ(policy.backoff_delay(3), Duration(8000ms));
    EXPECT_EQ(policy.backoff_delay(4), Duration(8000ms));
    EXPECT_EQ(policy.backoff_delay(60), Duration(8000ms));
}

TEST(RetryPolicyTest, RetryAfterOverridesBackoffForRateLimits) {
    RetryPolicy policy;
    EXPECT_EQ(policy.retry_delay(FailureKind::RateLimited, 1, 1.5), Duration(1500ms));
    EXPECT_EQ(policy.retry_delay(FailureKind::RateLimited, 3, 0.0), Duration::zero());
    EXPECT_EQ(policy.retry_delay(FailureKind::RateLimited, 2, std::nullopt), Duration(4000ms));
    // Negative hints are ignored
    EXPECT_EQ(policy.retry_delay(FailureKind::RateLimited, 1, -3.0), Duration(2000ms));
    // Server errors never use the hint
    EXPECT_EQ(policy.retry_delay(FailureKind::ServerError, 1, 1.5), Duration(2000ms));
}

TEST(RetryPolicyTest, MaxAttemptsIsRetriesPlusOne) {
    EXPECT_EQ(RetryPolicy().max_attempts(), 8);
    EXPECT_EQ(RetryPolicy(fast_retry(2)).max_attempts(), 3);
}

// ===========================================================================
// execute
// ===========================================================================

TEST(RetryPolicyTest, RateLimitedThenSuccess_RetriesExactlyKTimes) {
    RetryPolicy policy(fast_retry());
    auto monitor = std::make_shared<RecordingMonitor>();
    policy.set_monitor(monitor);

    int calls = 0;
    int result = policy.execute([&] {
        ++calls;
        if (calls <= 3) {
            throw ProviderException(429, "slow down", 0.0);
        }
        return 42;
    });

    EXPECT_EQ(result, 42);
    EXPECT_EQ(calls, 4);
    ASSERT_EQ(monitor->events.size(), 3u);
    for (std::size_t i = 0; i < monitor->events.size(); ++i) {
        EXPECT_EQ(monitor->events[i].type, EventType::RetryScheduled);
        EXPECT_EQ(monitor->events[i].status.value_or(0), 429);
        EXPECT_EQ(monitor->events[i].attempt.value_or(0), static_cast<int>(i + 1));
    }
}

TEST(RetryPolicyTest, ClientErrorPropagatesImmediately) {
    RetryPolicy policy(fast_retry());
    int calls = 0;

    try {
        policy.execute([&]() -> int {
            ++calls;
            throw ProviderException(400, "bad request");
        });
        FAIL() << "Expected ProviderException";
    } catch (const ProviderException& e) {
        EXPECT_EQ(e.status(), 400);
    }
    EXPECT_EQ(calls, 1);
}

TEST(RetryPolicyTest, ServerErrorsExhaustRetries) {
    RetryPolicy policy(fast_retry(3));
    auto monitor = std::make_shared<RecordingMonitor>();
    policy.set_monitor(monitor);
    int calls = 0;

    try {
        policy.execute([&]() -> int {
            ++calls;
            throw ProviderException(503, "unavailable");
        });
        FAIL() << "Expected RetriesExhaustedException";
    } catch (const RetriesExhaustedException& e) {
        EXPECT_EQ(e.attempts(), 4);
        EXPECT_EQ(e.last_status().value_or(0), 503);
    }
    EXPECT_EQ(calls, 4);
    ASSERT_FALSE(monitor->events.empty());
    EXPECT_EQ(monitor->events.back().type, EventType::RetriesExhausted);
}

TEST(RetryPolicyTest, ZeroRetriesMeansSingleAttempt) {
    RetryPolicy policy(fast_retry(0));
    int calls = 0;
    EXPECT_THROW(policy.execute([&]() -> int {
        ++calls;
        throw ProviderException(500, "boom");
    }), RetriesExhaustedException);
    EXPECT_EQ(calls, 1);
}

TEST(RetryPolicyTest, OtherExceptionsPassThrough) {
    RetryPolicy policy(fast_retry());
    int calls = 0;
    EXPECT_THROW(policy.execute([&]() -> int {
        ++calls;
        throw std::logic_error("not a provider failure");
    }), std::logic_error);
    EXPECT_EQ(calls, 1);
}

TEST(RetryPolicyTest, CancelledTokenStopsBeforeFirstAttempt) {
    RetryPolicy policy(fast_retry());
    CancellationToken token;
    token.cancel();
    int calls = 0;

    EXPECT_THROW(policy.execute([&] { ++calls; return 1; }, token), CancelledException);
    EXPECT_EQ(calls, 0);
}

TEST(RetryPolicyTest, CancellationInterruptsBackoff) {
    RetryConfig cfg;
    cfg.base_delay = 10s;
    cfg.max_delay = 10s;
    RetryPolicy policy(cfg);
    CancellationToken token;

    std::thread canceller([&] {
        std::this_thread::sleep_for(50ms);
        token.cancel();
    });

    std::atomic<int> calls{0};
    auto start = Clock::now();
    EXPECT_THROW(policy.execute([&]() -> int {
        ++calls;
        throw ProviderException(500, "down");
    }, token), CancelledException);
    EXPECT_LT(Clock::now() - start, 5s);
    EXPECT_EQ(calls.load(), 1);
    canceller.join();
}

TEST(RetryPolicyTest, EventsCarryCallContext) {
    RetryPolicy policy(fast_retry());
    auto monitor = std::make_shared<RecordingMonitor>();
    policy.set_monitor(monitor);

    MonitorEvent context;
    context.phase = Phase::Map;
    context.segment = 4;

    int calls = 0;
    policy.execute([&] {
        if (++calls == 1) throw ProviderException(500, "flaky");
        return std::string("ok");
    }, CancellationToken{}, context);

    ASSERT_EQ(monitor->events.size(), 1u);
    EXPECT_EQ(monitor->events[0].phase, Phase::Map);
    EXPECT_EQ(monitor->events[0].segment, SegmentIndex{4});
}
