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

// Manually advanced clock shared with the tracker under test
class FakeClock {
public:
    Timestamp now() {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }
    void advance(Duration d) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += d;
    }
    TimeSource source() {
        return [this] { return now(); };
    }

private:
    std::mutex mutex_;
    Timestamp now_{Clock::now()};
};

class RecordingMonitor : public Monitor {
public:
    void on_event(const MonitorEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events.push_back(event);
    }
    std::size_t count(EventType type) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t n = 0;
        for (auto& e : events) {
            if (e.type == type) ++n;
        }
        return n;
    }

    std::vector<MonitorEvent> events;

private:
    std::mutex mutex_;
};

// ===========================================================================
// Admission arithmetic
// ===========================================================================

TEST(TokenBudgetTrackerTest, InitialRemainingEqualsCapacity) {
    TokenBudgetTracker tracker(1000, 60s);
    EXPECT_EQ(tracker.remaining(), 1000);
    EXPECT_EQ(tracker.used(), 0);
    EXPECT_EQ(tracker.capacity(), 1000);
    EXPECT_EQ(tracker.window_duration(), Duration(60s));
}

TEST(TokenBudgetTrackerTest, CanUse_ExactBoundary) {
    TokenBudgetTracker tracker(100, 60s);
    tracker.use(60);

    EXPECT_TRUE(tracker.can_use(40));
    EXPECT_FALSE(tracker.can_use(41));
    EXPECT_TRUE(tracker.can_use(0));
}

TEST(TokenBudgetTrackerTest, CanUse_DoesNotConsume) {
    TokenBudgetTracker tracker(100, 60s);
    EXPECT_TRUE(tracker.can_use(80));
    EXPECT_TRUE(tracker.can_use(80));
    EXPECT_EQ(tracker.used(), 0);
}

TEST(TokenBudgetTrackerTest, Use_NeverClampsAndRemainingNeverNegative) {
    TokenBudgetTracker tracker(100, 60s);
    tracker.use(70);
    tracker.use(80);

    EXPECT_EQ(tracker.used(), 150);
    EXPECT_EQ(tracker.remaining(), 0);
    EXPECT_FALSE(tracker.can_use(1));
}

TEST(TokenBudgetTrackerTest, InvalidConstructionThrows) {
    EXPECT_THROW(TokenBudgetTracker(0, 60s), std::invalid_argument);
    EXPECT_THROW(TokenBudgetTracker(-5, 60s), std::invalid_argument);
    EXPECT_THROW(TokenBudgetTracker(100, Duration::zero()), std::invalid_argument);
}

// ===========================================================================
// Window expiry (fake clock)
// ===========================================================================

TEST(TokenBudgetTrackerTest, WindowResetsOnlyAfterFullDuration) {
    FakeClock clock;
    TokenBudgetTracker tracker(100, 60s, clock.source());
    tracker.use(100);

    clock.advance(59s);
    EXPECT_EQ(tracker.remaining(), 0);

    clock.advance(1s);
    EXPECT_EQ(tracker.remaining(), 100);
    EXPECT_EQ(tracker.used(), 0);
}

TEST(TokenBudgetTrackerTest, WindowRestartsAtObservation) {
    FakeClock clock;
    TokenBudgetTracker tracker(100, 60s, clock.source());
    tracker.use(50);

    // Expiry observed 90s in: the new window starts there, not at 60s.
    clock.advance(90s);
    tracker.use(30);
    clock.advance(50s);
    EXPECT_EQ(tracker.used(), 30);
    clock.advance(10s);
    EXPECT_EQ(tracker.used(), 0);
}

TEST(TokenBudgetTrackerTest, OvershootIsForgivenByReset) {
    FakeClock clock;
    TokenBudgetTracker tracker(100, 10s, clock.source());
    tracker.use(250);
    EXPECT_FALSE(tracker.can_use(1));

    clock.advance(10s);
    EXPECT_TRUE(tracker.can_use(100));
}

// ===========================================================================
// wait_for
// ===========================================================================

TEST(TokenBudgetTrackerTest, WaitFor_AdmitsImmediatelyWhenItFits) {
    TokenBudgetTracker tracker(100, 60s);
    CancellationToken token;

    auto start = Clock::now();
    EXPECT_TRUE(tracker.wait_for(50, 1s, 10ms, token));
    EXPECT_LT(Clock::now() - start, 500ms);
}

TEST(TokenBudgetTrackerTest, WaitFor_TimesOutWhenWindowNeverResets) {
    FakeClock clock;  // never advanced
    TokenBudgetTracker tracker(100, 60s, clock.source());
    tracker.use(100);
    CancellationToken token;

    auto start = Clock::now();
    EXPECT_FALSE(tracker.wait_for(10, 100ms, 10ms, token));
    EXPECT_GE(Clock::now() - start, 100ms);
}

TEST(TokenBudgetTrackerTest, WaitFor_AdmitsAfterWindowExpiry) {
    TokenBudgetTracker tracker(100, 100ms);
    tracker.use(100);
    CancellationToken token;

    auto start = Clock::now();
    EXPECT_TRUE(tracker.wait_for(50, 5s, 1s, token));
    auto elapsed = Clock::now() - start;
    EXPECT_GE(elapsed, 50ms);
    EXPECT_LT(elapsed, 2s);
}

TEST(TokenBudgetTrackerTest, WaitFor_AdmitsWhenFakeClockAdvances) {
    FakeClock clock;
    TokenBudgetTracker tracker(100, 60s, clock.source());
    tracker.use(100);
    CancellationToken token;

    std::thread advancer([&] {
        std::this_thread::sleep_for(50ms);
        clock.advance(60s);
    });

    EXPECT_TRUE(tracker.wait_for(40, 5s, 10ms, token));
    advancer.join();
}

TEST(TokenBudgetTrackerTest, WaitFor_ThrowsWhenCancelled) {
    FakeClock clock;
    TokenBudgetTracker tracker(100, 60s, clock.source());
    tracker.use(100);
    CancellationToken token;

    std::thread canceller([&] {
        std::this_thread::sleep_for(50ms);
        token.cancel();
    });

    auto start = Clock::now();
    EXPECT_THROW(tracker.wait_for(10, 10s, 5s, token), CancelledException);
    EXPECT_LT(Clock::now() - start, 2s);
    canceller.join();
}

// ===========================================================================
// Reservations
// ===========================================================================

TEST(TokenBudgetTrackerTest, Reserve_HoldsEstimateUntilSettled) {
    TokenBudgetTracker tracker(1000, 60s);
    CancellationToken token;

    EXPECT_TRUE(tracker.reserve(600, 1s, 10ms, token));
    EXPECT_EQ(tracker.reserved(), 600);
    EXPECT_EQ(tracker.used(), 0);
    EXPECT_EQ(tracker.remaining(), 400);
    EXPECT_FALSE(tracker.can_use(600));

    // A second call of the same size must not be admitted alongside
    EXPECT_FALSE(tracker.reserve(600, 50ms, 10ms, token));
    EXPECT_EQ(tracker.reserved(), 600);
}

TEST(TokenBudgetTrackerTest, Commit_SwapsReservationForActualUsage) {
    TokenBudgetTracker tracker(1000, 60s);
    CancellationToken token;

    ASSERT_TRUE(tracker.reserve(600, 1s, 10ms, token));
    tracker.commit(600, 25);
    EXPECT_EQ(tracker.reserved(), 0);
    EXPECT_EQ(tracker.used(), 25);
    EXPECT_EQ(tracker.remaining(), 975);
}

TEST(TokenBudgetTrackerTest, Release_ReturnsReservationWithoutUsage) {
    TokenBudgetTracker tracker(1000, 60s);
    CancellationToken token;

    ASSERT_TRUE(tracker.reserve(600, 1s, 10ms, token));
    tracker.release(600);
    EXPECT_EQ(tracker.reserved(), 0);
    EXPECT_EQ(tracker.used(), 0);
    EXPECT_TRUE(tracker.can_use(1000));
}

TEST(TokenBudgetTrackerTest, WaiterAdmittedWhenReservationSettles) {
    FakeClock clock;  // never advanced; only the settle can free room
    TokenBudgetTracker tracker(1000, 60s, clock.source());
    CancellationToken token;
    ASSERT_TRUE(tracker.reserve(600, 1s, 10ms, token));

    std::thread settler([&] {
        std::this_thread::sleep_for(50ms);
        tracker.commit(600, 100);
    });

    auto start = Clock::now();
    EXPECT_TRUE(tracker.reserve(600, 5s, 1s, token));
    EXPECT_LT(Clock::now() - start, 900ms);
    settler.join();
    EXPECT_EQ(tracker.used(), 100);
    EXPECT_EQ(tracker.reserved(), 600);
}

TEST(TokenBudgetTrackerTest, ConcurrentReservationsNeverExceedCapacity) {
    TokenBudgetTracker tracker(1000, 60s);
    CancellationToken token;
    std::atomic<TokenCount> held{0};
    std::atomic<TokenCount> peak{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 6; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 5; ++i) {
                ASSERT_TRUE(tracker.reserve(300, 5s, 5ms, token));
                auto now_held = held.fetch_add(300) + 300;
                auto prev = peak.load();
                while (now_held > prev && !peak.compare_exchange_weak(prev, now_held)) {}
                std::this_thread::sleep_for(2ms);
                held.fetch_sub(300);
                tracker.release(300);
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_LE(peak.load(), 900);
    EXPECT_EQ(tracker.reserved(), 0);
}

TEST(TokenBudgetTrackerTest, ReservationGuardReleasesUnlessCommitted) {
    TokenBudgetTracker tracker(1000, 60s);
    CancellationToken token;

    ASSERT_TRUE(tracker.reserve(400, 1s, 10ms, token));
    {
        TokenReservation hold(tracker, 400);
    }
    EXPECT_EQ(tracker.reserved(), 0);
    EXPECT_EQ(tracker.used(), 0);

    ASSERT_TRUE(tracker.reserve(400, 1s, 10ms, token));
    {
        TokenReservation hold(tracker, 400);
        hold.commit(50);
        EXPECT_TRUE(hold.settled());
    }
    EXPECT_EQ(tracker.reserved(), 0);
    EXPECT_EQ(tracker.used(), 50);
}

// ===========================================================================
// Events and concurrency
// ===========================================================================

TEST(TokenBudgetTrackerTest, EmitsWaitAndAdmitEvents) {
    FakeClock clock;
    TokenBudgetTracker tracker(100, 60s, clock.source());
    auto monitor = std::make_shared<RecordingMonitor>();
    tracker.set_monitor(monitor);

    tracker.use(90);
    EXPECT_EQ(monitor->count(EventType::TokensRecorded), 1u);

    std::thread advancer([&] {
        std::this_thread::sleep_for(30ms);
        clock.advance(60s);
    });
    CancellationToken token;
    EXPECT_TRUE(tracker.wait_for(50, 5s, 10ms, token));
    advancer.join();

    EXPECT_EQ(monitor->count(EventType::BudgetWaiting), 1u);
    EXPECT_EQ(monitor->count(EventType::BudgetAdmitted), 1u);
    EXPECT_EQ(monitor->count(EventType::BudgetWindowReset), 1u);

    for (auto& e : monitor->events) {
        if (e.type == EventType::BudgetAdmitted) {
            EXPECT_TRUE(e.delay.has_value());
            EXPECT_EQ(e.tokens.value_or(0), 50);
        }
    }
}

TEST(TokenBudgetTrackerTest, ConcurrentUseIsSerialized) {
    TokenBudgetTracker tracker(1'000'000, 600s);
    constexpr int THREADS = 8;
    constexpr int USES = 1000;

    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < USES; ++i) {
                tracker.use(1);
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(tracker.used(), THREADS * USES);
}
