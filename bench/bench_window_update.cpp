/**
 * @file  bench/bench_window_update.cpp
 * @brief Google Benchmark suite for per-reading statistics and classification.
 *
 * Benchmarks
 * ----------
 *   BM_RollingWindow_Push         — O(1) Welford add/remove at window size N
 *   BM_RollingWindow_Stats        — stats() read at window size N
 *   BM_Tracker_Update_Streams     — tracker update spread over K streams
 *   BM_Validate_Classify          — validator + detector on one reading
 *
 * Build (CMake):
 *   cmake -DAQS_BENCH=ON ..
 *   cmake --build build --target bench_window_update
 *   ./build/bench_window_update --benchmark_format=json
 *
 * Throughput units: items/second (readings processed).
 */

#include "benchmark/benchmark.h"

#include "aqs/anomaly.hpp"
#include "aqs/validator.hpp"
#include "aqs/window_stats.hpp"

#include <cstddef>
#include <random>
#include <string>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// N flow readings around 50 with 10 % gaussian noise.
static std::vector<double> make_series(std::size_t n) {
    std::mt19937 rng(42);
    std::normal_distribution<double> noise(50.0, 5.0);
    std::vector<double> v(n);
    for (auto& x : v) x = noise(rng);
    return v;
}

// ── RollingWindow ──────────────────────────────────────────────────────────────

static void BM_RollingWindow_Push(benchmark::State& state) {
    const auto window = static_cast<std::size_t>(state.range(0));
    const auto series = make_series(4096);
    aqs::stats::RollingWindow w(window);
    std::size_t i = 0;
    for (auto _ : state) {
        w.push(series[i & 4095], static_cast<double>(i));
        ++i;
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_RollingWindow_Push)->RangeMultiplier(4)->Range(16, 4096);

static void BM_RollingWindow_Stats(benchmark::State& state) {
    const auto window = static_cast<std::size_t>(state.range(0));
    const auto series = make_series(window);
    aqs::stats::RollingWindow w(window);
    for (std::size_t i = 0; i < window; ++i) w.push(series[i], static_cast<double>(i));
    for (auto _ : state) {
        benchmark::DoNotOptimize(w.stats(30));
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_RollingWindow_Stats)->Arg(600);

// ── Tracker ────────────────────────────────────────────────────────────────────

static void BM_Tracker_Update_Streams(benchmark::State& state) {
    const auto streams = static_cast<std::size_t>(state.range(0));
    std::vector<std::string> ids;
    for (std::size_t k = 0; k < streams; ++k) ids.push_back("meter_" + std::to_string(k));
    const auto series = make_series(4096);

    aqs::stats::WindowStatisticsTracker tracker;
    std::size_t i = 0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(
            tracker.update(ids[i % streams], series[i & 4095], static_cast<double>(i)));
        ++i;
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Tracker_Update_Streams)->Arg(1)->Arg(64)->Arg(1024);

// ── Validate + classify ────────────────────────────────────────────────────────

static void BM_Validate_Classify(benchmark::State& state) {
    const aqs::validation::ReadingValidator validator;
    const aqs::anomaly::AnomalyDetector     detector;
    aqs::stats::RollingWindow window(600);
    const auto series = make_series(600);
    for (std::size_t i = 0; i < series.size(); ++i) {
        window.push(series[i], static_cast<double>(i));
    }

    aqs::RawReading raw;
    raw.topic            = "sensor/water_meter_001/data";
    raw.sensor_id        = "water_meter_001";
    raw.category         = aqs::Category::Flow;
    raw.wall_time        = 1000.0;
    raw.received_wall    = 1000.0;
    raw.value            = 57.5;
    raw.reported_quality = 0.95;

    for (auto _ : state) {
        const auto res = validator.validate(raw, aqs::validation::StreamContext::of(window));
        benchmark::DoNotOptimize(detector.classify(*res.reading, window.stats(30)));
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Validate_Classify);

BENCHMARK_MAIN();
