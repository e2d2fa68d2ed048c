/// @file tests/stats/test_window_stats.cpp
/// @brief Unit tests for RollingWindow and WindowStatisticsTracker.
///
/// Test categories:
///   - Eviction example: five 10s then 100 → mean 28
///   - Incremental stats match exact population stats after many updates
///   - Low-confidence flag below min_samples
///   - last_two / last_time ordering across ring wrap-around
///   - Independent streams, idle eviction, concurrent updates

#include <gtest/gtest.h>
#include "aqs/window_stats.hpp"

#include <chrono>
#include <cmath>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace aqs;
using namespace aqs::stats;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

double exact_mean(const std::vector<double>& v) {
    double sum = 0.0;
    for (double x : v) sum += x;
    return sum / static_cast<double>(v.size());
}

/// Population standard deviation.
double exact_stddev(const std::vector<double>& v) {
    const double m = exact_mean(v);
    double sq = 0.0;
    for (double x : v) { const double d = x - m; sq += d * d; }
    return std::sqrt(sq / static_cast<double>(v.size()));
}

config::WindowConfig window_of(std::size_t size, std::size_t min_samples = 1) {
    config::WindowConfig cfg;
    cfg.window_size                = size;
    cfg.min_samples_for_confidence = min_samples;
    return cfg;
}

}  // namespace

// ─── RollingWindow ───────────────────────────────────────────────────────────

TEST(RollingWindow, ConstantSeriesHasZeroStddev) {
    RollingWindow w(5);
    for (int i = 0; i < 5; ++i) w.push(10.0, i);
    const auto s = w.stats(1);
    EXPECT_EQ(s.count, 5u);
    EXPECT_DOUBLE_EQ(s.mean, 10.0);
    EXPECT_NEAR(s.stddev, 0.0, 1e-12);
}

TEST(RollingWindow, SixthValueEvictsOldest) {
    RollingWindow w(5);
    for (int i = 0; i < 5; ++i) w.push(10.0, i);
    w.push(100.0, 5);
    const auto s = w.stats(1);
    EXPECT_EQ(s.count, 5u);
    EXPECT_NEAR(s.mean, 28.0, 1e-9);
    EXPECT_NEAR(s.stddev, exact_stddev({10, 10, 10, 10, 100}), 1e-9);
}

TEST(RollingWindow, EmptyWindowStats) {
    RollingWindow w(10);
    const auto s = w.stats(3);
    EXPECT_EQ(s.count, 0u);
    EXPECT_DOUBLE_EQ(s.mean, 0.0);
    EXPECT_DOUBLE_EQ(s.stddev, 0.0);
    EXPECT_TRUE(s.low_confidence);
    EXPECT_TRUE(w.empty());
}

TEST(RollingWindow, MatchesExactStatsOverLongRandomSeries) {
    std::mt19937 rng(7);
    std::normal_distribution<double> dist(50.0, 5.0);
    RollingWindow w(37);
    std::vector<double> all;
    for (int i = 0; i < 2000; ++i) {
        const double v = dist(rng);
        all.push_back(v);
        w.push(v, i);

        const std::size_t n = std::min<std::size_t>(all.size(), 37);
        std::vector<double> tail(all.end() - static_cast<std::ptrdiff_t>(n), all.end());
        const auto s = w.stats(1);
        ASSERT_EQ(s.count, n);
        ASSERT_NEAR(s.mean, exact_mean(tail), 1e-9);
        ASSERT_NEAR(s.stddev, exact_stddev(tail), 1e-7);
    }
}

TEST(RollingWindow, LargeOffsetValuesStayAccurate) {
    RollingWindow w(20);
    std::vector<double> all;
    for (int i = 0; i < 500; ++i) {
        const double v = 1.0e6 + (i % 7);
        all.push_back(v);
        w.push(v, i);
    }
    std::vector<double> tail(all.end() - 20, all.end());
    const auto s = w.stats(1);
    EXPECT_NEAR(s.mean, exact_mean(tail), 1e-6);
    EXPECT_NEAR(s.stddev, exact_stddev(tail), 1e-6);
}

TEST(RollingWindow, ValuesAreOldestFirstAfterWrap) {
    RollingWindow w(3);
    for (int i = 1; i <= 5; ++i) w.push(i, i);
    EXPECT_EQ(w.values(), (std::vector<double>{3.0, 4.0, 5.0}));
}

TEST(RollingWindow, LastTwoRequiresTwoSamples) {
    RollingWindow w(4);
    EXPECT_FALSE(w.last_two().has_value());
    EXPECT_FALSE(w.last_time().has_value());
    w.push(1.0, 100.0);
    EXPECT_FALSE(w.last_two().has_value());
    ASSERT_TRUE(w.last_time().has_value());
    EXPECT_DOUBLE_EQ(*w.last_time(), 100.0);
}

TEST(RollingWindow, LastTwoOrderedAcrossWrap) {
    RollingWindow w(3);
    for (int i = 1; i <= 7; ++i) w.push(i * 10.0, i);
    const auto two = w.last_two();
    ASSERT_TRUE(two.has_value());
    EXPECT_DOUBLE_EQ((*two)[0].value, 60.0);
    EXPECT_DOUBLE_EQ((*two)[0].time, 6.0);
    EXPECT_DOUBLE_EQ((*two)[1].value, 70.0);
    EXPECT_DOUBLE_EQ((*two)[1].time, 7.0);
    EXPECT_DOUBLE_EQ(*w.last_time(), 7.0);
}

TEST(RollingWindow, CapacityOneKeepsLatest) {
    RollingWindow w(1);
    w.push(3.0, 0);
    w.push(9.0, 1);
    const auto s = w.stats(1);
    EXPECT_EQ(s.count, 1u);
    EXPECT_DOUBLE_EQ(s.mean, 9.0);
    EXPECT_DOUBLE_EQ(s.stddev, 0.0);
}

TEST(RollingWindow, ZeroCapacityIsClampedToOne) {
    RollingWindow w(0);
    EXPECT_EQ(w.capacity(), 1u);
}

TEST(RollingWindow, ResyncPreservesStats) {
    RollingWindow w(8);
    for (int i = 0; i < 5; ++i) w.push(i * 1.5, i);
    const auto before = w.stats(1);
    w.resync();
    const auto after = w.stats(1);
    EXPECT_NEAR(before.mean, after.mean, 1e-12);
    EXPECT_NEAR(before.stddev, after.stddev, 1e-12);
}

// ─── WindowStatisticsTracker ─────────────────────────────────────────────────

TEST(WindowStatisticsTracker, UpdateReturnsRunningStats) {
    WindowStatisticsTracker tracker(window_of(5));
    WindowStats s;
    for (int i = 0; i < 5; ++i) s = tracker.update("m1", 10.0, i);
    EXPECT_DOUBLE_EQ(s.mean, 10.0);
    s = tracker.update("m1", 100.0, 5);
    EXPECT_NEAR(s.mean, 28.0, 1e-9);
    EXPECT_EQ(s.count, 5u);
}

TEST(WindowStatisticsTracker, LowConfidenceBelowMinimum) {
    WindowStatisticsTracker tracker(window_of(600, 30));
    WindowStats s;
    for (int i = 0; i < 29; ++i) {
        s = tracker.update("m1", 1.0 + i, i);
        EXPECT_TRUE(s.low_confidence);
    }
    s = tracker.update("m1", 42.0, 29);
    EXPECT_FALSE(s.low_confidence);
    EXPECT_EQ(s.count, 30u);
}

TEST(WindowStatisticsTracker, StreamsAreIndependent) {
    WindowStatisticsTracker tracker(window_of(10));
    tracker.update("a", 1.0, 0);
    tracker.update("b", 100.0, 0);
    EXPECT_DOUBLE_EQ(tracker.stats("a")->mean, 1.0);
    EXPECT_DOUBLE_EQ(tracker.stats("b")->mean, 100.0);
    EXPECT_EQ(tracker.stream_count(), 2u);
    EXPECT_FALSE(tracker.stats("c").has_value());
}

TEST(WindowStatisticsTracker, EvictsIdleStreams) {
    auto cfg = window_of(10);
    cfg.stream_idle_timeout_s = 60.0;
    WindowStatisticsTracker tracker(cfg);

    const auto t0 = SteadyClock::now();
    tracker.update("stale", 1.0, 0, t0);
    tracker.update("fresh", 1.0, 0, t0 + std::chrono::seconds(50));

    EXPECT_EQ(tracker.evict_idle(t0 + std::chrono::seconds(61)), 1u);
    EXPECT_EQ(tracker.stream_count(), 1u);
    EXPECT_FALSE(tracker.stats("stale").has_value());
    EXPECT_TRUE(tracker.stats("fresh").has_value());
}

TEST(WindowStatisticsTracker, CallbackWithoutPushLeavesStreamIdle) {
    auto cfg = window_of(10);
    cfg.stream_idle_timeout_s = 60.0;
    WindowStatisticsTracker tracker(cfg);

    const auto t0 = SteadyClock::now();
    tracker.update("s", 1.0, 0, t0);
    // Readings rejected under the lock do not count as activity.
    tracker.with_stream("s", [](RollingWindow&) {}, t0 + std::chrono::seconds(50));

    EXPECT_EQ(tracker.evict_idle(t0 + std::chrono::seconds(61)), 1u);
    EXPECT_EQ(tracker.stream_count(), 0u);
}

TEST(WindowStatisticsTracker, CallbackThatPushesRefreshesActivity) {
    auto cfg = window_of(10);
    cfg.stream_idle_timeout_s = 60.0;
    WindowStatisticsTracker tracker(cfg);

    const auto t0 = SteadyClock::now();
    tracker.update("s", 1.0, 0, t0);
    tracker.with_stream("s", [](RollingWindow& w) { w.push(2.0, 1.0); },
                        t0 + std::chrono::seconds(50));

    EXPECT_EQ(tracker.evict_idle(t0 + std::chrono::seconds(61)), 0u);
    EXPECT_EQ(tracker.stats("s")->count, 2u);
}

TEST(RollingWindow, TotalPushedCountsEvictedSamples) {
    RollingWindow w(2);
    for (int i = 0; i < 5; ++i) w.push(static_cast<double>(i), static_cast<double>(i));
    EXPECT_EQ(w.size(), 2u);
    EXPECT_EQ(w.total_pushed(), 5u);
}

TEST(WindowStatisticsTracker, WithStreamReturnsCallbackResult) {
    WindowStatisticsTracker tracker(window_of(4));
    tracker.update("s", 2.0, 1.0);
    tracker.update("s", 4.0, 2.0);
    const auto n = tracker.with_stream("s", [](RollingWindow& w) { return w.size(); });
    EXPECT_EQ(n, 2u);
}

TEST(WindowStatisticsTracker, ConcurrentUpdatesOnSameStreamAreSerialised) {
    WindowStatisticsTracker tracker(window_of(100000));
    constexpr int kThreads = 4;
    constexpr int kPerThread = 2500;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&tracker, t] {
            for (int i = 0; i < kPerThread; ++i) {
                tracker.update("shared", 5.0, t * kPerThread + i);
                tracker.update("own-" + std::to_string(t), 1.0, i);
            }
        });
    }
    for (auto& th : threads) th.join();

    const auto s = tracker.stats("shared");
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->count, static_cast<std::size_t>(kThreads * kPerThread));
    EXPECT_NEAR(s->mean, 5.0, 1e-9);
    EXPECT_EQ(tracker.stream_count(), static_cast<std::size_t>(kThreads + 1));
}
