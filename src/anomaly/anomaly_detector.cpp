/// @file src/anomaly/anomaly_detector.cpp
/// @brief AnomalyDetector — guarded z-score, quality score and classification.

#include "aqs/anomaly.hpp"

#include <algorithm>
#include <cmath>

namespace aqs::anomaly {

// ─── z_score ──────────────────────────────────────────────────────────────────

double AnomalyDetector::z_score(double value, const stats::WindowStats& window) noexcept {
    if (window.count == 0 || window.stddev < constants::FLAT_STDDEV_THRESHOLD) {
        // Empty or flat series: no variance to measure against.
        return 0.0;
    }
    return (value - window.mean) / window.stddev;
}

// ─── quality ──────────────────────────────────────────────────────────────────

double AnomalyDetector::recency(double age_s, const config::DetectorConfig& cfg) noexcept {
    if (!(age_s > cfg.staleness_horizon_s)) {
        return 1.0;
    }
    if (cfg.staleness_decay_s <= 0.0) {
        return 0.0;
    }
    const double over = age_s - cfg.staleness_horizon_s;
    return std::clamp(1.0 - over / cfg.staleness_decay_s, 0.0, 1.0);
}

double AnomalyDetector::quality_score(const CleanedReading& reading,
                                      const config::DetectorConfig& cfg) noexcept {
    const double age   = reading.received_wall - reading.timestamp.wall;
    const double score = reading.reported_quality * reading.confidence * recency(age, cfg);
    return std::isfinite(score) ? std::clamp(score, 0.0, 1.0) : 0.0;
}

// ─── classify ─────────────────────────────────────────────────────────────────

AnomalyVerdict AnomalyDetector::classify(const CleanedReading& reading,
                                         const stats::WindowStats& window) const {
    return classify(reading, window, cfg_);
}

AnomalyVerdict AnomalyDetector::classify(const CleanedReading& reading,
                                         const stats::WindowStats& window,
                                         const config::DetectorConfig& cfg) {
    AnomalyVerdict v;
    v.sequence       = reading.sequence;
    v.sensor_id      = reading.sensor_id;
    v.z_score        = z_score(reading.value, window);
    v.quality_score  = quality_score(reading, cfg);
    v.low_confidence = window.low_confidence;

    if (v.quality_score < cfg.quality_threshold) {
        v.classification = Classification::Quarantined;
        return v;
    }

    const double abs_z = std::abs(v.z_score);
    if (!window.low_confidence && abs_z > cfg.z_score_threshold) {
        v.classification = Classification::Anomaly;
        v.severity = (abs_z > 2.0 * cfg.z_score_threshold) ? Severity::Critical
                                                           : Severity::Warning;
    }
    return v;
}

}  // namespace aqs::anomaly
