#pragma once

/// @file include/aqs/monitor.hpp
/// @brief PerformanceMonitor — trailing-window latency, rate and occupancy metrics.
///
/// # Module: Performance Monitor
///
/// ## Responsibility
/// Observe every pipeline stage's timing, reading outcomes and buffer
/// occupancy; aggregate them over a trailing window (default 5 minutes);
/// evaluate alert thresholds.
///
/// ## Thresholds
/// | Kind              | Warning                         | Critical             |
/// |-------------------|---------------------------------|----------------------|
/// | ProcessingLatency | p95 > 200 ms or mean > 120 ms   | p95 > 250 ms         |
/// | ErrorRate         | > 2 %                           | > 5 %                |
/// | BufferOccupancy   | ≥ 80 %                          | ≥ 95 %               |
/// | Connectivity      |                                 | retry budget spent   |
///
/// Latency alerts use `Stage::Process` (validation through delivery). Time
/// spent queued is reported separately as `Stage::Queue`, and end-to-end
/// time as `Stage::Total`.
///
/// An alert kind is not re-emitted within `alert_cooldown_s`.
///
/// ## Memory
/// Each timing and occupancy series keeps at most `max_samples` entries
/// (the newest), so latency aggregates describe the most recent samples
/// inside the window. Outcomes are counted exactly in one-second buckets;
/// a bucket leaves the window once its whole second lies before the cutoff.
///
/// ## Concurrency
/// Writers append under a short-held mutex; counters are atomics.
/// snapshot() copies the bounded series and the buckets under the mutex
/// and does all sorting and aggregation on the copy. Alerting is advisory:
/// the monitor never throttles the pipeline.

#include "aqs/config.hpp"
#include "aqs/types.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace aqs::monitor {

// ─── Vocabulary ───────────────────────────────────────────────────────────────

enum class Stage {
    Parse,
    Queue,     ///< Time spent waiting in the ingestion buffer
    Validate,
    Classify,  ///< Window lookup + classification + window update
    Deliver,
    Process,   ///< Validation through delivery; drives latency alerts
    Total,     ///< Enqueue → delivered (end-to-end)
};

inline constexpr std::size_t STAGE_COUNT = 7;

enum class Outcome {
    Normal,
    Anomaly,
    Quarantined,
    Error,    ///< Rejected by validation or failed processing
    Dropped,  ///< Never processed (buffer full, shutdown timeout)
};

inline constexpr std::size_t OUTCOME_COUNT = 5;

enum class AlertKind {
    ProcessingLatency,
    ErrorRate,
    BufferOccupancy,
    Connectivity,
    CriticalAnomaly,
};

[[nodiscard]] const char* to_string(Stage s) noexcept;
[[nodiscard]] const char* to_string(Outcome o) noexcept;
[[nodiscard]] const char* to_string(AlertKind k) noexcept;

/// Map a verdict classification onto a monitor outcome.
[[nodiscard]] Outcome outcome_of(Classification c) noexcept;

// ─── Alert ────────────────────────────────────────────────────────────────────

struct Alert {
    AlertKind   kind;
    Severity    severity;
    double      value;      ///< Observed value that crossed the threshold
    double      threshold;
    std::string message;
    double      wall_time;  ///< Seconds since the Unix epoch

    [[nodiscard]] nlohmann::json to_json() const;
    [[nodiscard]] std::string    to_string() const;
};

// ─── MetricsSnapshot ──────────────────────────────────────────────────────────

/// Point-in-time aggregation over the trailing window.
struct MetricsSnapshot {
    double window_s = 0.0;

    std::uint64_t processed   = 0;  ///< Normal + anomaly + quarantined + error
    std::uint64_t normal      = 0;
    std::uint64_t anomalies   = 0;
    std::uint64_t quarantined = 0;
    std::uint64_t errors      = 0;
    std::uint64_t dropped     = 0;

    std::size_t latency_samples = 0;  ///< Stage::Process samples aggregated below
    double mean_latency_ms = 0.0;
    double p95_latency_ms  = 0.0;
    double max_latency_ms  = 0.0;
    std::array<double, STAGE_COUNT> stage_mean_ms{};

    double current_occupancy_pct = 0.0;
    double max_occupancy_pct     = 0.0;
    double mean_occupancy_pct    = 0.0;

    double error_rate      = 0.0;
    double anomaly_rate    = 0.0;
    double quarantine_rate = 0.0;

    // Lifetime totals.
    std::uint64_t delivery_failures   = 0;
    std::uint64_t connectivity_errors = 0;
    std::map<std::string, std::uint64_t> errors_by_kind;

    std::size_t active_streams = 0;

    [[nodiscard]] nlohmann::json to_json() const;

    /// Multi-line table for terminals.
    [[nodiscard]] std::string to_string() const;
};

/// Linear-interpolated percentile (q in [0, 1]) of unsorted samples.
[[nodiscard]] double percentile(std::vector<double> samples, double q);

// ─── PerformanceMonitor ───────────────────────────────────────────────────────

class PerformanceMonitor {
public:
    explicit PerformanceMonitor(config::MonitorConfig cfg = {});

    PerformanceMonitor(const PerformanceMonitor&)            = delete;
    PerformanceMonitor& operator=(const PerformanceMonitor&) = delete;

    void record(Stage stage, Millis duration, SteadyTime now = SteadyClock::now());
    void record_buffer_occupancy(double pct, SteadyTime now = SteadyClock::now());
    void record_outcome(Outcome outcome, SteadyTime now = SteadyClock::now());

    /// Error outcome plus a lifetime count under the error's kind.
    void record_error(ErrorKind kind, SteadyTime now = SteadyClock::now());

    void record_delivery_failure() noexcept;
    void record_connectivity_error() noexcept;

    /// Queue a critical Connectivity alert for the next check_thresholds().
    void raise_connectivity_alert(std::string message);

    void set_active_streams(std::size_t n) noexcept;

    [[nodiscard]] MetricsSnapshot snapshot(SteadyTime now = SteadyClock::now()) const;

    /// Evaluate thresholds; returns the alerts not suppressed by cooldown.
    [[nodiscard]] std::vector<Alert> check_thresholds(SteadyTime now = SteadyClock::now());

    /// Forget every sample, counter and cooldown.
    void reset();

    /// Entries currently held: timing and occupancy samples plus outcome buckets.
    [[nodiscard]] std::size_t retained_entries() const;

    [[nodiscard]] const config::MonitorConfig& config() const noexcept { return cfg_; }

private:
    struct TimedValue {
        SteadyTime at;
        double     value;
    };
    /// Outcome counts for the second starting at `start`.
    struct OutcomeBucket {
        SteadyTime at;
        std::array<std::uint64_t, OUTCOME_COUNT> counts{};
    };

    /// Caller holds mutex_.
    void prune_locked(SteadyTime now);
    void push_sample_locked(std::deque<TimedValue>& series, TimedValue sample);
    void count_outcome_locked(Outcome outcome, SteadyTime now);

    [[nodiscard]] bool cooled_down(AlertKind kind, SteadyTime now) const;

    config::MonitorConfig cfg_;
    SteadyClock::duration window_;

    mutable std::mutex mutex_;
    std::array<std::deque<TimedValue>, STAGE_COUNT> stages_;
    std::deque<OutcomeBucket> outcomes_;
    std::deque<TimedValue>   occupancy_;
    std::map<std::string, std::uint64_t> errors_by_kind_;
    std::optional<std::string> pending_connectivity_;
    std::map<AlertKind, SteadyTime> last_emitted_;

    std::atomic<double>        current_occupancy_{0.0};
    std::atomic<std::uint64_t> delivery_failures_{0};
    std::atomic<std::uint64_t> connectivity_errors_{0};
    std::atomic<std::size_t>   active_streams_{0};
};

}  // namespace aqs::monitor
