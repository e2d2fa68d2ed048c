/// @file tests/anomaly/test_anomaly_detector.cpp
/// @brief Unit tests for AnomalyDetector.
///
/// Test categories:
///   - Guarded z-score (empty / flat windows)
///   - Warning vs critical severity
///   - Quarantine on low quality regardless of z
///   - Low-confidence windows never raise anomalies
///   - Quality score components (interpolation, staleness, reported quality)

#include <gtest/gtest.h>
#include "aqs/anomaly.hpp"

#include <cmath>

using namespace aqs;
using namespace aqs::anomaly;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

CleanedReading reading(double value, double quality = 1.0) {
    CleanedReading r;
    r.sequence         = 11;
    r.sensor_id        = "water_meter_001";
    r.value            = value;
    r.reported_quality = quality;
    r.timestamp.wall   = 1000.0;
    r.received_wall    = 1000.2;
    return r;
}

stats::WindowStats window(double mean, double stddev, std::size_t count = 100) {
    return stats::WindowStats{mean, stddev, count, false};
}

}  // namespace

// ─── z-score ─────────────────────────────────────────────────────────────────

TEST(AnomalyDetector, ZScoreBasic) {
    EXPECT_DOUBLE_EQ(AnomalyDetector::z_score(60.0, window(50.0, 5.0)), 2.0);
    EXPECT_DOUBLE_EQ(AnomalyDetector::z_score(40.0, window(50.0, 5.0)), -2.0);
}

TEST(AnomalyDetector, ZeroStddevGivesZeroZ) {
    EXPECT_DOUBLE_EQ(AnomalyDetector::z_score(1e6, window(10.0, 0.0)), 0.0);
    EXPECT_DOUBLE_EQ(AnomalyDetector::z_score(10.0, window(10.0, 1e-12)), 0.0);
}

TEST(AnomalyDetector, EmptyWindowGivesZeroZ) {
    EXPECT_DOUBLE_EQ(AnomalyDetector::z_score(5.0, stats::WindowStats{}), 0.0);
}

TEST(AnomalyDetector, FlatStreamNeverRaisesAnomaly) {
    AnomalyDetector d;
    const auto v = d.classify(reading(100.0), window(10.0, 0.0));
    EXPECT_EQ(v.classification, Classification::Normal);
    EXPECT_EQ(v.severity, Severity::None);
    EXPECT_DOUBLE_EQ(v.z_score, 0.0);
}

// ─── Classification ──────────────────────────────────────────────────────────

TEST(AnomalyDetector, WithinThresholdIsNormal) {
    AnomalyDetector d;
    const auto v = d.classify(reading(62.5), window(50.0, 5.0));  // z = 2.5, not > 2.5
    EXPECT_EQ(v.classification, Classification::Normal);
}

TEST(AnomalyDetector, AboveThresholdIsWarning) {
    AnomalyDetector d;
    const auto v = d.classify(reading(65.0), window(50.0, 5.0));  // z = 3
    EXPECT_EQ(v.classification, Classification::Anomaly);
    EXPECT_EQ(v.severity, Severity::Warning);
    EXPECT_EQ(v.sequence, 11u);
    EXPECT_EQ(v.sensor_id, "water_meter_001");
}

TEST(AnomalyDetector, AboveTwiceThresholdIsCritical) {
    AnomalyDetector d;
    const auto v = d.classify(reading(80.0), window(50.0, 5.0));  // z = 6
    EXPECT_EQ(v.classification, Classification::Anomaly);
    EXPECT_EQ(v.severity, Severity::Critical);
}

TEST(AnomalyDetector, NegativeDeviationIsAnomalyToo) {
    AnomalyDetector d;
    const auto v = d.classify(reading(20.0), window(50.0, 5.0));  // z = -6
    EXPECT_EQ(v.classification, Classification::Anomaly);
    EXPECT_EQ(v.severity, Severity::Critical);
}

TEST(AnomalyDetector, LowQualityIsQuarantinedRegardlessOfZ) {
    AnomalyDetector d;
    for (double value : {50.0, 65.0, 500.0}) {
        const auto v = d.classify(reading(value, 0.5), window(50.0, 5.0));
        EXPECT_EQ(v.classification, Classification::Quarantined);
        EXPECT_EQ(v.severity, Severity::None);
        EXPECT_DOUBLE_EQ(v.quality_score, 0.5);
    }
}

TEST(AnomalyDetector, QualityAtThresholdIsNotQuarantined) {
    AnomalyDetector d;
    const auto v = d.classify(reading(50.0, 0.8), window(50.0, 5.0));
    EXPECT_EQ(v.classification, Classification::Normal);
}

TEST(AnomalyDetector, LowConfidenceWindowSuppressesAnomaly) {
    AnomalyDetector d;
    stats::WindowStats w{50.0, 5.0, 10, true};
    const auto v = d.classify(reading(500.0), w);
    EXPECT_EQ(v.classification, Classification::Normal);
    EXPECT_TRUE(v.low_confidence);
    EXPECT_GT(std::abs(v.z_score), 2.5);
}

TEST(AnomalyDetector, LowConfidenceWindowStillQuarantines) {
    AnomalyDetector d;
    stats::WindowStats w{50.0, 5.0, 3, true};
    EXPECT_EQ(d.classify(reading(50.0, 0.1), w).classification, Classification::Quarantined);
}

TEST(AnomalyDetector, CustomThresholds) {
    config::DetectorConfig cfg;
    cfg.z_score_threshold = 1.0;
    cfg.quality_threshold = 0.2;
    const auto v = AnomalyDetector::classify(reading(56.0, 0.3), window(50.0, 5.0), cfg);
    EXPECT_EQ(v.classification, Classification::Anomaly);
    EXPECT_EQ(v.severity, Severity::Warning);  // z = 1.2, not above 2.0
}

// ─── Quality score ───────────────────────────────────────────────────────────

TEST(AnomalyDetector, InterpolatedReadingScoresLower) {
    config::DetectorConfig cfg;
    auto r = reading(50.0);
    r.confidence   = cfg.interpolation_confidence;
    r.interpolated = true;
    EXPECT_DOUBLE_EQ(AnomalyDetector::quality_score(r, cfg), 0.85);

    // A fully trusted interpolated reading still clears the default threshold.
    AnomalyDetector d(cfg);
    EXPECT_EQ(d.classify(r, window(50.0, 5.0)).classification, Classification::Normal);

    r.reported_quality = 0.9;
    EXPECT_EQ(d.classify(r, window(50.0, 5.0)).classification, Classification::Quarantined);
}

TEST(AnomalyDetector, RecencyDecaysPastHorizon) {
    config::DetectorConfig cfg;
    EXPECT_DOUBLE_EQ(AnomalyDetector::recency(0.0, cfg), 1.0);
    EXPECT_DOUBLE_EQ(AnomalyDetector::recency(300.0, cfg), 1.0);
    EXPECT_NEAR(AnomalyDetector::recency(300.0 + 1650.0, cfg), 0.5, 1e-12);
    EXPECT_DOUBLE_EQ(AnomalyDetector::recency(3600.0, cfg), 0.0);
    EXPECT_DOUBLE_EQ(AnomalyDetector::recency(1e9, cfg), 0.0);
}

TEST(AnomalyDetector, FutureTimestampCountsAsFresh) {
    config::DetectorConfig cfg;
    EXPECT_DOUBLE_EQ(AnomalyDetector::recency(-30.0, cfg), 1.0);
}

TEST(AnomalyDetector, StaleReadingIsQuarantined) {
    AnomalyDetector d;
    auto r = reading(50.0);
    r.received_wall = r.timestamp.wall + 3000.0;
    const auto v = d.classify(r, window(50.0, 5.0));
    EXPECT_LT(v.quality_score, 0.8);
    EXPECT_EQ(v.classification, Classification::Quarantined);
}

TEST(AnomalyDetector, QualityMultipliesComponents) {
    config::DetectorConfig cfg;
    auto r = reading(50.0, 0.9);
    r.confidence = 0.5;
    EXPECT_NEAR(AnomalyDetector::quality_score(r, cfg), 0.45, 1e-12);
}

TEST(AnomalyDetector, OnlyQuarantineStaysOutOfWindow) {
    EXPECT_TRUE(AnomalyDetector::feeds_window(Classification::Normal));
    EXPECT_TRUE(AnomalyDetector::feeds_window(Classification::Anomaly));
    EXPECT_FALSE(AnomalyDetector::feeds_window(Classification::Quarantined));
}
