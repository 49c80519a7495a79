#include <gtest/gtest.h>
#include "progress_throttle.h"
#include "transfer_fakes.h"

#include <chrono>
#include <thread>

using namespace std::chrono_literals;

// ── Construction ───────────────────────────────────────────

TEST(ProgressThrottleTest, StartsWithNothingPending) {
    ManualClock clock;
    ProgressThrottle throttle(1000ms, clock.source());

    EXPECT_EQ(throttle.pending(), 0u);
    EXPECT_EQ(throttle.interval(), 1000ms);
    EXPECT_FALSE(throttle.drain().has_value());
}

// ── record() inside the window ─────────────────────────────

TEST(ProgressThrottleTest, HoldsBytesUntilIntervalElapses) {
    ManualClock clock;
    ProgressThrottle throttle(1000ms, clock.source());

    EXPECT_FALSE(throttle.record(100).has_value());
    clock.advance(400ms);
    EXPECT_FALSE(throttle.record(200).has_value());
    clock.advance(599ms);
    EXPECT_FALSE(throttle.record(300).has_value());

    EXPECT_EQ(throttle.pending(), 600u);
}

TEST(ProgressThrottleTest, ReleasesAccumulatedBytesAtInterval) {
    ManualClock clock;
    ProgressThrottle throttle(1000ms, clock.source());

    throttle.record(100);
    clock.advance(1000ms);
    auto released = throttle.record(50);

    ASSERT_TRUE(released.has_value());
    EXPECT_EQ(*released, 150u);
    EXPECT_EQ(throttle.pending(), 0u);
}

TEST(ProgressThrottleTest, TimerRestartsAfterRelease) {
    ManualClock clock;
    ProgressThrottle throttle(1000ms, clock.source());

    clock.advance(1500ms);
    ASSERT_TRUE(throttle.record(10).has_value());

    // Only 900ms since the last release
    clock.advance(900ms);
    EXPECT_FALSE(throttle.record(10).has_value());

    clock.advance(100ms);
    auto released = throttle.record(10);
    ASSERT_TRUE(released.has_value());
    EXPECT_EQ(*released, 20u);
}

TEST(ProgressThrottleTest, RestartMovesWindowAndKeepsPending) {
    ManualClock clock;
    ProgressThrottle throttle(1000ms, clock.source());

    throttle.record(5);
    clock.advance(900ms);
    throttle.restart();

    clock.advance(900ms);
    EXPECT_FALSE(throttle.record(5).has_value());
    EXPECT_EQ(throttle.pending(), 10u);

    clock.advance(100ms);
    auto released = throttle.record(5);
    ASSERT_TRUE(released.has_value());
    EXPECT_EQ(*released, 15u);
}

// ── Zero-byte records ──────────────────────────────────────

TEST(ProgressThrottleTest, ZeroBytesNeverRelease) {
    ManualClock clock;
    ProgressThrottle throttle(1000ms, clock.source());

    clock.advance(5000ms);
    EXPECT_FALSE(throttle.record(0).has_value());
    EXPECT_FALSE(throttle.drain().has_value());
}

// ── drain() ────────────────────────────────────────────────

TEST(ProgressThrottleTest, DrainReturnsResidualOnce) {
    ManualClock clock;
    ProgressThrottle throttle(1000ms, clock.source());

    throttle.record(42);
    auto residual = throttle.drain();
    ASSERT_TRUE(residual.has_value());
    EXPECT_EQ(*residual, 42u);
    EXPECT_FALSE(throttle.drain().has_value());
}

// ── Rate bound ─────────────────────────────────────────────

TEST(ProgressThrottleTest, AtMostOneReleasePerInterval) {
    ManualClock clock;
    ProgressThrottle throttle(1000ms, clock.source());

    // 10 seconds of 1-byte chunks every 10ms
    int releases = 0;
    uint64_t released_total = 0;
    for (int i = 0; i < 1000; ++i) {
        clock.advance(10ms);
        if (auto r = throttle.record(1)) {
            ++releases;
            released_total += *r;
        }
    }
    if (auto r = throttle.drain()) {
        released_total += *r;
    }

    EXPECT_LE(releases, 10);
    EXPECT_GE(releases, 9);
    EXPECT_EQ(released_total, 1000u);
}

// ── Default clock ──────────────────────────────────────────

TEST(ProgressThrottleTest, RealClockReleasesAfterShortInterval) {
    ProgressThrottle throttle(20ms);

    EXPECT_FALSE(throttle.record(1).has_value());
    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    auto released = throttle.record(1);

    ASSERT_TRUE(released.has_value());
    EXPECT_EQ(*released, 2u);
}
