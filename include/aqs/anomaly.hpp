#pragma once

/// @file include/aqs/anomaly.hpp
/// @brief AnomalyDetector — z-score / quality-score classification.
///
/// # Module: Anomaly Detector
///
/// ## Responsibility
/// Classify a cleaned reading against its stream's window statistics.
///
/// ## Classification Rule
/// ```
/// quality_score < quality_threshold            → Quarantined
/// |z| > z_threshold and window confident       → Anomaly
///     severity = Critical if |z| > 2·z_threshold, else Warning
/// otherwise                                    → Normal
/// ```
/// `z = (value − mean) / stddev`, with `z = 0` for an empty window or a
/// flat one (stddev below FLAT_STDDEV_THRESHOLD).
///
/// ## Quality Score
/// `reported_quality × confidence × recency`, where recency is 1 up to the
/// staleness horizon and then decays linearly to 0 over the decay span.
/// The age is measured from the source timestamp to local receipt.
///
/// ## Guarantees
/// - Pure: no state, no side effects, safe to call from any thread
/// - Only Normal and Anomaly readings may feed the rolling window

#include "aqs/config.hpp"
#include "aqs/types.hpp"
#include "aqs/window_stats.hpp"

namespace aqs::anomaly {

class AnomalyDetector {
public:
    explicit AnomalyDetector(config::DetectorConfig cfg = {}) noexcept : cfg_(cfg) {}

    [[nodiscard]] AnomalyVerdict classify(const CleanedReading& reading,
                                          const stats::WindowStats& window) const;

    [[nodiscard]] static AnomalyVerdict classify(const CleanedReading& reading,
                                                 const stats::WindowStats& window,
                                                 const config::DetectorConfig& cfg);

    /// Guarded z-score of `value` against the window.
    [[nodiscard]] static double z_score(double value,
                                        const stats::WindowStats& window) noexcept;

    /// Recency factor in [0, 1] for a reading `age_s` seconds old.
    [[nodiscard]] static double recency(double age_s,
                                        const config::DetectorConfig& cfg) noexcept;

    /// Quality score in [0, 1].
    [[nodiscard]] static double quality_score(const CleanedReading& reading,
                                              const config::DetectorConfig& cfg) noexcept;

    /// True if a reading of this classification updates the window.
    [[nodiscard]] static constexpr bool feeds_window(Classification c) noexcept {
        return c != Classification::Quarantined;
    }

    [[nodiscard]] const config::DetectorConfig& config() const noexcept { return cfg_; }

private:
    config::DetectorConfig cfg_;
};

}  // namespace aqs::anomaly
