/**
 * @file  bench/bench_pipeline_throughput.cpp
 * @brief Google Benchmark suite for end-to-end pipeline throughput.
 *
 * Benchmarks
 * ----------
 *   BM_Parse_Payload            — JSON payload → RawReading
 *   BM_Process_Sync             — PipelineCoordinator::process on one thread
 *   BM_Submit_Drain/workers     — submit a generator batch, stop() drains it
 *
 * Build (CMake):
 *   cmake -DAQS_BENCH=ON ..
 *   cmake --build build --target bench_pipeline_throughput
 *   ./build/bench_pipeline_throughput --benchmark_format=json
 *
 * Custom counter "readings_per_sec" = readings processed per wall second.
 */

#include "benchmark/benchmark.h"

#include "aqs/load_generator.hpp"
#include "aqs/logging.hpp"
#include "aqs/payload.hpp"
#include "aqs/pipeline.hpp"

#include <cstddef>
#include <string>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

static void silence_logs() {
    aqs::config::LoggingConfig cfg;
    cfg.level = "off";
    aqs::logging::configure(cfg);
}

static std::vector<aqs::sim::Message> make_messages(std::size_t n) {
    aqs::sim::GeneratorConfig cfg;
    cfg.seed = 42;
    aqs::sim::LoadGenerator gen(cfg);
    std::vector<aqs::sim::Message> out;
    while (out.size() < n) {
        for (auto& m : gen.next()) out.push_back(std::move(m));
    }
    out.resize(n);
    return out;
}

// ── Parse ──────────────────────────────────────────────────────────────────────

static void BM_Parse_Payload(benchmark::State& state) {
    const auto msgs = make_messages(1024);
    const aqs::ingest::PayloadParser parser;
    std::size_t i = 0;
    for (auto _ : state) {
        const auto& m = msgs[i++ & 1023];
        benchmark::DoNotOptimize(parser.parse(m.topic, m.payload));
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Parse_Payload);

// ── Synchronous flow ───────────────────────────────────────────────────────────

static void BM_Process_Sync(benchmark::State& state) {
    silence_logs();
    const auto msgs = make_messages(4096);
    const aqs::ingest::PayloadParser parser;
    std::vector<aqs::RawReading> raws;
    raws.reserve(msgs.size());
    for (const auto& m : msgs) raws.push_back(parser.parse(m.topic, m.payload));

    aqs::pipeline::PipelineCoordinator p;
    std::size_t i = 0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(p.process(raws[i++ & 4095]));
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Process_Sync);

// ── Worker pool ────────────────────────────────────────────────────────────────

static void BM_Submit_Drain(benchmark::State& state) {
    silence_logs();
    const auto msgs = make_messages(5000);
    aqs::config::PipelineConfig cfg;
    cfg.worker_count              = static_cast<std::size_t>(state.range(0));
    cfg.buffer.capacity           = msgs.size();
    cfg.monitor.report_interval_s = 3600.0;
    cfg.drain_timeout_ms          = 60000.0;

    for (auto _ : state) {
        aqs::pipeline::PipelineCoordinator p(cfg);
        p.start();
        for (const auto& m : msgs) {
            benchmark::DoNotOptimize(p.submit(m.topic, m.payload));
        }
        benchmark::DoNotOptimize(p.stop());
    }
    const double total = static_cast<double>(state.iterations()) * static_cast<double>(msgs.size());
    state.SetItemsProcessed(static_cast<int64_t>(total));
    state.counters["readings_per_sec"] = benchmark::Counter(total, benchmark::Counter::kIsRate);
}
BENCHMARK(BM_Submit_Drain)->Arg(1)->Arg(2)->Arg(4)->Unit(benchmark::kMillisecond)->UseRealTime();

BENCHMARK_MAIN();
