#pragma once

#include <cstddef>

/// @file include/aqs/constants.hpp
/// @brief Default thresholds and sizes for the AquaStream pipeline.
///
/// Every value here is a default only; the live value comes from
/// config::PipelineConfig.

namespace aqs::constants {

// ─── Anomaly Detection ────────────────────────────────────────────────────────

/// |z| above this marks an anomaly (critical above twice this).
static constexpr double DEFAULT_Z_SCORE_THRESHOLD = 2.5;

/// Readings scoring below this quality are quarantined.
static constexpr double DEFAULT_QUALITY_THRESHOLD = 0.8;

/// Confidence assigned to a value reconstructed by interpolation. Kept at or
/// above DEFAULT_QUALITY_THRESHOLD so a trusted interpolated reading is delivered.
static constexpr double DEFAULT_INTERPOLATION_CONFIDENCE = 0.85;

/// Age (seconds) after which a reading's quality starts to decay.
static constexpr double DEFAULT_STALENESS_HORIZON_S = 300.0;

/// Seconds over which recency decays from 1 to 0 past the horizon.
static constexpr double DEFAULT_STALENESS_DECAY_S = 3300.0;

/// Standard deviations below this are treated as a flat series (z = 0).
static constexpr double FLAT_STDDEV_THRESHOLD = 1e-9;

// ─── Rolling Windows ──────────────────────────────────────────────────────────

/// Samples retained per sensor stream (10 minutes at 1 Hz).
static constexpr std::size_t DEFAULT_WINDOW_SIZE = 600;

/// Below this many samples the window is low-confidence.
static constexpr std::size_t DEFAULT_MIN_SAMPLES_FOR_CONFIDENCE = 30;

/// Stream state is evicted after this long without data.
static constexpr double DEFAULT_STREAM_IDLE_TIMEOUT_S = 3600.0;

// ─── Ingestion ────────────────────────────────────────────────────────────────

static constexpr std::size_t DEFAULT_BUFFER_CAPACITY = 1000;

/// Upper bounds accepted by the configuration loader.
static constexpr std::size_t MAX_WINDOW_SIZE     = 1'000'000;
static constexpr std::size_t MAX_BUFFER_CAPACITY = 10'000'000;
static constexpr std::size_t MAX_AUDIT_CAPACITY  = 1'000'000;
static constexpr std::size_t MAX_WORKER_COUNT    = 256;

/// Late readings within this many seconds are clamped, older ones dropped.
static constexpr double DEFAULT_LATENESS_TOLERANCE_S = 5.0;

/// Readings dated further than this ahead of their receipt are rejected.
static constexpr double DEFAULT_MAX_FUTURE_SKEW_S = 300.0;

// ─── Performance Monitor ──────────────────────────────────────────────────────

static constexpr double DEFAULT_MONITOR_WINDOW_S        = 300.0;
static constexpr double DEFAULT_LATENCY_TARGET_MS       = 120.0;
static constexpr double DEFAULT_LATENCY_P95_TARGET_MS   = 200.0;
static constexpr double DEFAULT_LATENCY_ALERT_MS        = 250.0;
static constexpr double DEFAULT_ERROR_RATE_TARGET       = 0.01;
static constexpr double DEFAULT_ERROR_RATE_WARNING      = 0.02;
static constexpr double DEFAULT_ERROR_RATE_CRITICAL     = 0.05;
static constexpr double DEFAULT_BUFFER_WARNING_PCT      = 80.0;
static constexpr double DEFAULT_BUFFER_CRITICAL_PCT     = 95.0;
static constexpr double DEFAULT_ALERT_COOLDOWN_S        = 5.0;
static constexpr double DEFAULT_REPORT_INTERVAL_S       = 60.0;

/// Newest samples kept per timing / occupancy series.
static constexpr std::size_t DEFAULT_MONITOR_MAX_SAMPLES = 4096;
static constexpr std::size_t MAX_MONITOR_MAX_SAMPLES     = 1'000'000;

// ─── Coordinator / Delivery ───────────────────────────────────────────────────

static constexpr std::size_t DEFAULT_WORKER_COUNT       = 2;
static constexpr double      DEFAULT_DRAIN_TIMEOUT_MS   = 5000.0;
static constexpr double      DEFAULT_ENQUEUE_WAIT_MS    = 10.0;
static constexpr unsigned    DEFAULT_DELIVERY_ATTEMPTS  = 3;
static constexpr double      DEFAULT_DELIVERY_BACKOFF_MS = 5.0;
static constexpr std::size_t DEFAULT_AUDIT_CAPACITY     = 10000;

// ─── Transport ────────────────────────────────────────────────────────────────

static constexpr unsigned DEFAULT_CONNECT_ATTEMPTS       = 5;
static constexpr double   DEFAULT_CONNECT_BACKOFF_MS     = 100.0;
static constexpr double   DEFAULT_CONNECT_BACKOFF_MAX_MS = 5000.0;

}  // namespace aqs::constants
