/**
 * @file  prop_quarantine_isolation.cpp
 * @brief Property: ∀ reading stream: a quarantined reading never changes the
 *        stream's window statistics, and a normal or anomalous one always
 *        adds exactly one sample.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_quarantine_isolation
 *
 * Each generated step is a (value, reported quality) pair run
 * synchronously through PipelineCoordinator::process().
 */

#include <rapidcheck.h>

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

#include "aqs/logging.hpp"
#include "aqs/pipeline.hpp"

using namespace aqs;

int main() {
    config::LoggingConfig quiet;
    quiet.level = "off";
    logging::configure(quiet);

    rc::check(
        "quarantine_isolation: quarantined readings leave the window untouched",
        []() {
            const auto steps = *rc::gen::container<std::vector<std::pair<int, int>>>(
                rc::gen::pair(rc::gen::inRange(0, 20000), rc::gen::inRange(0, 101)));

            config::PipelineConfig cfg;
            cfg.delivery.backoff_ms = 0.0;
            pipeline::PipelineCoordinator p(cfg);

            const double t0 = 1738922400.0;
            for (std::size_t i = 0; i < steps.size(); ++i) {
                RawReading raw;
                raw.topic            = "sensor/m1/data";
                raw.sensor_id        = "m1";
                raw.category         = Category::Flow;
                raw.wall_time        = t0 + static_cast<double>(i);
                raw.received_wall    = *raw.wall_time;
                raw.value            = static_cast<double>(steps[i].first) / 4.0;
                raw.reported_quality = static_cast<double>(steps[i].second) / 100.0;

                const auto before = p.tracker().stats("m1");
                const auto res    = p.process(raw);
                const auto after  = p.tracker().stats("m1");
                RC_ASSERT(res.verdict.has_value());
                RC_ASSERT(after.has_value());

                const std::size_t prior = before ? before->count : 0;
                if (res.verdict->classification == Classification::Quarantined) {
                    RC_ASSERT(after->count == prior);
                    if (before) {
                        RC_ASSERT(after->mean == before->mean);
                        RC_ASSERT(after->stddev == before->stddev);
                    }
                } else {
                    RC_ASSERT(after->count == std::min<std::size_t>(prior + 1,
                                                                    cfg.window.window_size));
                }
            }
        }
    );

    return 0;
}
