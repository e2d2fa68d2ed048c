/**
 * @file  prop_validator_passthrough.cpp
 * @brief Property: ∀ well-formed, in-range, in-order reading: validation
 *        accepts it and leaves value, timestamp and identity unchanged.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_validator_passthrough
 *
 * Companion properties:
 *   • any value outside the category's physical range is OutOfRange
 *   • a reading later than the tolerance is OutOfOrder, within it the
 *     timestamp is clamped to the stream's last time
 */

#include <rapidcheck.h>

#include <cmath>
#include <string>

#include "aqs/validator.hpp"

using namespace aqs;
using namespace aqs::validation;

namespace {

RawReading reading(double value, double wall, Category category) {
    RawReading r;
    r.sequence         = 3;
    r.topic            = "sensors/water/flow/m1";
    r.sensor_id        = "m1";
    r.category         = category;
    r.wall_time        = wall;
    r.value            = value;
    r.reported_quality = 1.0;
    r.received_wall    = wall;
    return r;
}

Category pick_category(int k) {
    switch (((k % 3) + 3) % 3) {
        case 0:  return Category::Flow;
        case 1:  return Category::Quality;
        default: return Category::Weather;
    }
}

}  // namespace

int main() {
    const ReadingValidator validator;
    const auto& cfg = validator.config();

    rc::check(
        "validator_passthrough: valid readings are accepted unchanged",
        [&](int k) {
            const Category c = pick_category(k);
            const auto& range = cfg.range_for(c);
            const double frac = *rc::gen::inRange(0, 1000001) / 1.0e6;
            const double value = range.min + frac * (range.max - range.min);
            const double wall  = 1.6e9 + *rc::gen::inRange(0, 100000000) / 1000.0;

            const auto res = validator.validate(reading(value, wall, c));
            RC_ASSERT(res.accepted());
            RC_ASSERT(res.reading->value == value);
            RC_ASSERT(res.reading->timestamp.wall == wall);
            RC_ASSERT(res.reading->sensor_id == "m1");
            RC_ASSERT(res.reading->category == c);
            RC_ASSERT(!res.reading->interpolated);
            RC_ASSERT(!res.reading->late);
        }
    );

    rc::check(
        "validator_passthrough: out-of-range values are rejected",
        [&](int k, bool below) {
            const Category c = pick_category(k);
            const auto& range = cfg.range_for(c);
            const double excess = 1.0 + *rc::gen::inRange(0, 1000000);
            const double value  = below ? range.min - excess : range.max + excess;

            const auto res = validator.validate(reading(value, 1.7e9, c));
            RC_ASSERT(res.rejected());
            RC_ASSERT(res.reason == ErrorKind::OutOfRange);
        }
    );

    rc::check(
        "validator_passthrough: lateness is clamped within tolerance, rejected beyond",
        []() {
            const ReadingValidator v;
            const double last = 1.7e9;
            const double lag  = *rc::gen::inRange(1, 20000) / 1000.0;

            StreamContext ctx;
            ctx.last_time = last;
            const auto res = v.validate(reading(10.0, last - lag, Category::Flow), ctx);
            if (lag > v.config().lateness_tolerance_s) {
                RC_ASSERT(res.rejected());
                RC_ASSERT(res.reason == ErrorKind::OutOfOrder);
            } else {
                RC_ASSERT(res.accepted());
                RC_ASSERT(res.reading->late);
                RC_ASSERT(res.reading->timestamp.wall == last);
            }
        }
    );

    return 0;
}
