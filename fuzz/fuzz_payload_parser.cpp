/**
 * @file  fuzz_payload_parser.cpp
 * @brief libFuzzer target for PayloadParser::parse and parse_iso8601
 *
 * Build:
 *   cmake -DAQS_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_payload_parser
 *
 * Run for 60 seconds:
 *   ./fuzz_payload_parser -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. parse() never throws, crashes or aborts on arbitrary bytes.
 *   2. A parsed reading either carries a parse_error or none of the
 *      structural fields are garbage: a present value is finite or the
 *      reading is later rejected by structural validation.
 *   3. A parsed ISO-8601 timestamp is finite.
 *
 * Fuzzer strategy:
 *   The first byte selects a topic family so category resolution from
 *   topic rules is exercised; the rest of the input is the payload.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "aqs/payload.hpp"
#include "aqs/validator.hpp"

using namespace aqs;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    static const char* const topics[] = {
        "sensors/water/flow/m1",
        "sensors/water/quality/p7",
        "sensors/weather/station_3",
        "sensor/water_meter_001/data",
        "unrouted/topic",
    };

    std::string_view topic = topics[0];
    if (size > 0) {
        topic = topics[data[0] % (sizeof(topics) / sizeof(topics[0]))];
        ++data;
        --size;
    }
    const std::string_view payload(reinterpret_cast<const char*>(data), size);

    static const ingest::PayloadParser parser;
    const RawReading raw = parser.parse(topic, payload);
    assert(raw.topic == topic);

    const validation::ReadingValidator validator;
    const auto structural = validator.validate_structure(raw);
    if (raw.parse_error) {
        assert(structural.has_value());
    }
    if (!structural && raw.value) {
        assert(std::isfinite(*raw.value));
    }

    if (const auto t = ingest::parse_iso8601(payload)) {
        assert(std::isfinite(*t));
    }
    return 0;
}
