/// @file tests/sim/test_load_generator.cpp
/// @brief Unit tests for LoadGenerator.
///
/// Test categories:
///   - Determinism by seed
///   - Payload shape per message kind
///   - Burst and spike-sequence expansion
///   - Virtual clock monotonicity
///   - Mix proportions over many draws

#include <gtest/gtest.h>
#include "aqs/load_generator.hpp"
#include "aqs/payload.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

using namespace aqs;
using namespace aqs::sim;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

constexpr double T0 = 1738922400.0;

GeneratorConfig fixed(std::uint32_t seed = 42) {
    GeneratorConfig cfg;
    cfg.seed       = seed;
    cfg.start_time = T0;
    return cfg;
}

std::vector<Message> draw(LoadGenerator& g, int draws) {
    std::vector<Message> out;
    for (int i = 0; i < draws; ++i) {
        auto batch = g.next();
        out.insert(out.end(), batch.begin(), batch.end());
    }
    return out;
}

}  // namespace

// ─── Determinism ─────────────────────────────────────────────────────────────

TEST(LoadGenerator, SameSeedSameStream) {
    LoadGenerator a(fixed(7));
    LoadGenerator b(fixed(7));
    const auto ma = draw(a, 200);
    const auto mb = draw(b, 200);
    ASSERT_EQ(ma.size(), mb.size());
    for (std::size_t i = 0; i < ma.size(); ++i) {
        EXPECT_EQ(ma[i].payload, mb[i].payload);
    }
}

TEST(LoadGenerator, DifferentSeedDifferentStream) {
    LoadGenerator a(fixed(1));
    LoadGenerator b(fixed(2));
    const auto ma = draw(a, 50);
    const auto mb = draw(b, 50);
    bool differs = ma.size() != mb.size();
    for (std::size_t i = 0; !differs && i < ma.size(); ++i) {
        differs = ma[i].payload != mb[i].payload;
    }
    EXPECT_TRUE(differs);
}

// ─── Payload shape ───────────────────────────────────────────────────────────

TEST(LoadGenerator, PayloadShapes) {
    LoadGenerator g(fixed());

    const auto normal = nlohmann::json::parse(g.make(MessageKind::Normal).payload);
    EXPECT_EQ(normal.at("sensor_id"), "water_meter_001");
    EXPECT_EQ(normal.at("type"), "normal");
    EXPECT_TRUE(normal.at("value").is_number());
    EXPECT_GE(normal.at("quality_score").get<double>(), 0.8);
    EXPECT_TRUE(ingest::parse_iso8601(normal.at("timestamp").get<std::string>()).has_value());

    const auto anomaly = nlohmann::json::parse(g.make(MessageKind::Anomaly).payload);
    EXPECT_GE(anomaly.at("value").get<double>(), 400.0);
    EXPECT_LE(anomaly.at("value").get<double>(), 750.0);

    const auto missing = nlohmann::json::parse(g.make(MessageKind::Missing).payload);
    EXPECT_TRUE(missing.at("value").is_null());
    EXPECT_EQ(missing.at("type"), "missing_data");

    const auto corrupt = nlohmann::json::parse(g.make(MessageKind::Corrupt).payload);
    EXPECT_EQ(corrupt.at("value"), "invalid_value");
    EXPECT_LE(corrupt.at("quality_score").get<double>(), 0.5);

    const auto burst = g.make(MessageKind::Burst);
    EXPECT_EQ(burst.topic, "sensor/water_meter_001/data");
    EXPECT_EQ(burst.kind, MessageKind::Burst);
}

TEST(LoadGenerator, ParsedByPayloadParser) {
    LoadGenerator g(fixed());
    ingest::PayloadParser parser;
    const auto m   = g.make(MessageKind::Corrupt);
    const auto raw = parser.parse(m.topic, m.payload);
    EXPECT_FALSE(raw.parse_error.has_value());
    EXPECT_TRUE(raw.value_malformed);
    EXPECT_EQ(raw.metadata.at("type"), "corrupt_data");
}

// ─── Expansion ───────────────────────────────────────────────────────────────

TEST(LoadGenerator, BurstsAndSpikeSequencesExpand) {
    LoadGenerator g(fixed());
    bool saw_burst = false;
    bool saw_spikes = false;
    for (int i = 0; i < 2000 && !(saw_burst && saw_spikes); ++i) {
        const auto batch = g.next();
        if (batch.front().kind == MessageKind::Burst) {
            EXPECT_EQ(batch.size(), 50u);
            saw_burst = true;
        } else if (batch.front().kind == MessageKind::AnomalySequence) {
            ASSERT_EQ(batch.size(), 6u);
            EXPECT_EQ(batch.back().kind, MessageKind::Anomaly);
            saw_spikes = true;
        } else {
            EXPECT_EQ(batch.size(), 1u);
        }
    }
    EXPECT_TRUE(saw_burst);
    EXPECT_TRUE(saw_spikes);
}

TEST(LoadGenerator, ClockAdvancesMonotonically) {
    LoadGenerator g(fixed());
    EXPECT_DOUBLE_EQ(g.clock(), T0);
    double last = 0.0;
    for (const auto& m : draw(g, 300)) {
        const auto t = ingest::parse_iso8601(nlohmann::json::parse(m.payload)
                                                 .at("timestamp").get<std::string>());
        ASSERT_TRUE(t.has_value());
        EXPECT_GE(*t, last);
        last = *t;
    }
    EXPECT_GT(g.clock(), T0 + 29.0);
}

TEST(LoadGenerator, MixRoughlyMatchesWeights) {
    LoadGenerator g(fixed(123));
    std::map<MessageKind, int> first_kind;
    constexpr int DRAWS = 20000;
    for (int i = 0; i < DRAWS; ++i) {
        auto kind = g.next().front().kind;
        if (kind == MessageKind::AnomalySequence) kind = MessageKind::Anomaly;
        ++first_kind[kind];
    }
    EXPECT_NEAR(first_kind[MessageKind::Normal] / double(DRAWS), 0.50, 0.02);
    EXPECT_NEAR(first_kind[MessageKind::Anomaly] / double(DRAWS), 0.15, 0.02);
    EXPECT_NEAR(first_kind[MessageKind::Noise] / double(DRAWS), 0.15, 0.02);
    EXPECT_NEAR(first_kind[MessageKind::Missing] / double(DRAWS), 0.10, 0.02);
    EXPECT_NEAR(first_kind[MessageKind::Corrupt] / double(DRAWS), 0.05, 0.02);
    EXPECT_NEAR(first_kind[MessageKind::Burst] / double(DRAWS), 0.05, 0.02);
}

TEST(LoadGenerator, KindNames) {
    EXPECT_STREQ(to_string(MessageKind::Missing), "missing_data");
    EXPECT_STREQ(to_string(MessageKind::AnomalySequence), "anomaly_sequence");
}
