/**
 * @file  fuzz_validator.cpp
 * @brief libFuzzer target for ReadingValidator + AnomalyDetector on raw doubles
 *
 * Build:
 *   cmake -DAQS_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_validator
 *
 * Run for 60 seconds:
 *   ./fuzz_validator -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any IEEE 754 bit pattern.
 *   2. An accepted reading's value lies inside its category's range.
 *   3. An accepted reading is never earlier than the stream's last time.
 *   4. quality_score ∈ [0, 1] and z_score is finite.
 *   5. Window statistics stay finite after every accepted push.
 *
 * Fuzzer strategy:
 *   Input bytes are read as (value, timestamp, quality) triples of raw
 *   doubles; a NaN value stands for a missing value so the interpolation
 *   path is reached.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>

#include "aqs/anomaly.hpp"
#include "aqs/validator.hpp"
#include "aqs/window_stats.hpp"

using namespace aqs;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    constexpr size_t TRIPLE = 3 * sizeof(double);

    const validation::ReadingValidator validator;
    const anomaly::AnomalyDetector     detector;
    stats::RollingWindow               window(16);

    for (size_t off = 0; off + TRIPLE <= size; off += TRIPLE) {
        double v{}, t{}, q{};
        std::memcpy(&v, data + off, sizeof(double));
        std::memcpy(&t, data + off + sizeof(double), sizeof(double));
        std::memcpy(&q, data + off + 2 * sizeof(double), sizeof(double));

        RawReading raw;
        raw.topic            = "sensors/water/flow/m1";
        raw.sensor_id        = "m1";
        raw.category         = Category::Flow;
        raw.wall_time        = t;
        raw.reported_quality = q;
        raw.received_wall    = t;
        if (!std::isnan(v)) {
            raw.value = v;
        }

        const auto ctx = validation::StreamContext::of(window);
        const auto res = validator.validate(raw, ctx);
        if (res.rejected()) {
            continue;
        }

        const auto& r = *res.reading;
        assert(validator.config().flow_range.contains(r.value));
        if (ctx.last_time) {
            assert(r.timestamp.wall >= *ctx.last_time);
        }

        const auto verdict = detector.classify(r, window.stats(4));
        assert(verdict.quality_score >= 0.0 && verdict.quality_score <= 1.0);
        assert(std::isfinite(verdict.z_score));

        if (anomaly::AnomalyDetector::feeds_window(verdict.classification)) {
            window.push(r.value, r.timestamp.wall);
            const auto s = window.stats(1);
            assert(std::isfinite(s.mean));
            assert(std::isfinite(s.stddev));
        }
    }
    return 0;
}
