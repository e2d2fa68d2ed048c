#pragma once

/// @file include/aqs/config.hpp
/// @brief PipelineConfig — every tunable of the AquaStream pipeline.
///
/// # Module: Configuration
///
/// ## Responsibility
/// Hold the configuration surface as plain aggregates with defaults, and
/// load it from a JSON document.
///
/// ## JSON Layout
/// Keys are flat, named after the fields below:
/// ```json
/// {
///   "sensor_id": "water_meter_001",
///   "z_score_threshold": 2.5,
///   "window_size": 600,
///   "buffer_capacity": 1000,
///   "backpressure": "drop",
///   "subscriptions": ["sensors/water/flow/#"],
///   "topic_categories": [{"pattern": "sensors/water/flow/#", "category": "flow"}],
///   "physical_ranges": {"flow": {"min": 0, "max": 100000}},
///   "logging": {"level": "info", "file": "aqs.log"}
/// }
/// ```
///
/// ## Guarantees
/// - Loading never throws; failures return `nullopt` and are logged
/// - A type mismatch on any recognised key rejects the whole document
/// - Unrecognised keys are ignored

#include "aqs/constants.hpp"
#include "aqs/types.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace aqs::config {

// ─── Validation ───────────────────────────────────────────────────────────────

/// Inclusive physical bounds for a category's values.
struct PhysicalRange {
    double min;
    double max;

    [[nodiscard]] bool contains(double v) const noexcept { return v >= min && v <= max; }
};

struct ValidatorConfig {
    /// Single expected sensor. Empty means "any well-formed id" unless
    /// known_sensors is non-empty.
    std::string sensor_id;

    /// Allow-list of sensor ids. Union with sensor_id when both are set.
    std::vector<std::string> known_sensors;

    PhysicalRange flow_range{0.0, 1.0e5};
    PhysicalRange quality_range{0.0, 1.0e4};
    PhysicalRange weather_range{-100.0, 1.0e4};

    double lateness_tolerance_s = constants::DEFAULT_LATENESS_TOLERANCE_S;
    double max_future_skew_s    = constants::DEFAULT_MAX_FUTURE_SKEW_S;

    [[nodiscard]] const PhysicalRange& range_for(Category c) const noexcept;
};

// ─── Statistics / Detection ───────────────────────────────────────────────────

struct WindowConfig {
    std::size_t window_size                = constants::DEFAULT_WINDOW_SIZE;
    std::size_t min_samples_for_confidence = constants::DEFAULT_MIN_SAMPLES_FOR_CONFIDENCE;
    double      stream_idle_timeout_s      = constants::DEFAULT_STREAM_IDLE_TIMEOUT_S;
};

struct DetectorConfig {
    double z_score_threshold        = constants::DEFAULT_Z_SCORE_THRESHOLD;
    double quality_threshold        = constants::DEFAULT_QUALITY_THRESHOLD;
    double interpolation_confidence = constants::DEFAULT_INTERPOLATION_CONFIDENCE;
    double staleness_horizon_s      = constants::DEFAULT_STALENESS_HORIZON_S;
    double staleness_decay_s        = constants::DEFAULT_STALENESS_DECAY_S;
};

// ─── Ingestion ────────────────────────────────────────────────────────────────

/// What the producer does when the buffer is full.
enum class BackpressurePolicy {
    Drop,  ///< Drop the reading immediately and count it
    Wait,  ///< Wait up to enqueue_wait_ms for space, then drop
};

[[nodiscard]] const char* to_string(BackpressurePolicy p) noexcept;

struct BufferConfig {
    std::size_t        capacity        = constants::DEFAULT_BUFFER_CAPACITY;
    BackpressurePolicy backpressure    = BackpressurePolicy::Drop;
    double             enqueue_wait_ms = constants::DEFAULT_ENQUEUE_WAIT_MS;
};

// ─── Monitoring ───────────────────────────────────────────────────────────────

struct MonitorConfig {
    double window_s              = constants::DEFAULT_MONITOR_WINDOW_S;
    double latency_target_ms     = constants::DEFAULT_LATENCY_TARGET_MS;
    double latency_p95_target_ms = constants::DEFAULT_LATENCY_P95_TARGET_MS;
    double latency_alert_ms      = constants::DEFAULT_LATENCY_ALERT_MS;
    double error_rate_target     = constants::DEFAULT_ERROR_RATE_TARGET;
    double error_rate_warning    = constants::DEFAULT_ERROR_RATE_WARNING;
    double error_rate_critical   = constants::DEFAULT_ERROR_RATE_CRITICAL;
    double buffer_warning_pct    = constants::DEFAULT_BUFFER_WARNING_PCT;
    double buffer_critical_pct   = constants::DEFAULT_BUFFER_CRITICAL_PCT;
    double alert_cooldown_s      = constants::DEFAULT_ALERT_COOLDOWN_S;
    double report_interval_s     = constants::DEFAULT_REPORT_INTERVAL_S;
    std::size_t max_samples      = constants::DEFAULT_MONITOR_MAX_SAMPLES;  ///< Per series
};

// ─── Delivery ─────────────────────────────────────────────────────────────────

struct DeliveryConfig {
    unsigned    attempts       = constants::DEFAULT_DELIVERY_ATTEMPTS;
    double      backoff_ms     = constants::DEFAULT_DELIVERY_BACKOFF_MS;
    std::size_t audit_capacity = constants::DEFAULT_AUDIT_CAPACITY;
};

// ─── Transport ────────────────────────────────────────────────────────────────

/// Maps an MQTT-style topic pattern (`+` / `#` wildcards) to a category.
struct TopicRule {
    std::string pattern;
    Category    category;
};

struct TransportConfig {
    std::vector<std::string> subscriptions{
        "sensors/water/flow/#",
        "sensors/water/quality/#",
        "sensors/weather/#",
        "sensor/+/data",
    };
    std::vector<TopicRule> topic_categories{
        {"sensors/water/flow/#",    Category::Flow},
        {"sensors/water/quality/#", Category::Quality},
        {"sensors/weather/#",       Category::Weather},
        {"sensor/+/data",           Category::Flow},
    };
    unsigned connect_attempts       = constants::DEFAULT_CONNECT_ATTEMPTS;
    double   connect_backoff_ms     = constants::DEFAULT_CONNECT_BACKOFF_MS;
    double   connect_backoff_max_ms = constants::DEFAULT_CONNECT_BACKOFF_MAX_MS;
};

// ─── Logging ──────────────────────────────────────────────────────────────────

struct LoggingConfig {
    std::string level   = "info";  ///< trace|debug|info|warn|error|critical|off
    std::string pattern = "%Y-%m-%d %H:%M:%S.%e [%n] %^%l%$ %v";
    std::optional<std::string> file;         ///< Rotating log file, if set
    std::size_t max_file_bytes = 5 * 1024 * 1024;
    std::size_t max_files      = 3;
};

// ─── PipelineConfig ───────────────────────────────────────────────────────────

struct PipelineConfig {
    ValidatorConfig validator{};
    WindowConfig    window{};
    DetectorConfig  detector{};
    BufferConfig    buffer{};
    MonitorConfig   monitor{};
    DeliveryConfig  delivery{};
    TransportConfig transport{};
    LoggingConfig   logging{};

    std::size_t worker_count     = constants::DEFAULT_WORKER_COUNT;
    double      drain_timeout_ms = constants::DEFAULT_DRAIN_TIMEOUT_MS;
};

/// Check cross-field consistency (positive sizes, ordered thresholds, …).
///
/// # Returns
/// `nullopt` if the configuration is usable, otherwise a description of
/// the first problem found.
[[nodiscard]] std::optional<std::string> check(const PipelineConfig& cfg);

/// Build a configuration from a parsed JSON object, starting from defaults.
[[nodiscard]] std::optional<PipelineConfig> from_json(const nlohmann::json& j) noexcept;

/// Parse a JSON document held in memory.
[[nodiscard]] std::optional<PipelineConfig> parse_string(const std::string& text) noexcept;

/// Load a JSON configuration file from disk.
[[nodiscard]] std::optional<PipelineConfig> load_file(const std::string& path) noexcept;

/// Serialise a configuration (round-trips through from_json).
[[nodiscard]] nlohmann::json to_json(const PipelineConfig& cfg);

}  // namespace aqs::config
