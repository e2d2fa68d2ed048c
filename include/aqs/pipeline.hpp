#pragma once

/// @file include/aqs/pipeline.hpp
/// @brief PipelineCoordinator — owns the stages and runs the per-reading flow.
///
/// # Module: Pipeline Coordinator
///
/// ## Responsibility
/// Wire buffer → validator → window → detector → collaborators into one
/// flow, run it on a pool of worker threads, and expose lifecycle and
/// metrics.
///
/// ## State Machine
/// ```
/// Stopped ──start()──▶ Starting ──▶ Running ──stop()──▶ Draining ──▶ Stopped
/// ```
///
/// ## Per-Reading Flow
/// 1. Structural validation (no stream lock)
/// 2. Under the stream's lock: validate against the window, classify
///    against the window statistics *before* the reading, then add the
///    reading to the window unless it is quarantined
/// 3. Normal / anomaly → every ReadingSink (bounded retry)
///    Quarantined / rejected → audit trail and AuditSinks
///    Critical anomaly → also an Alert to every AlertSink
///
/// ## Guarantees
/// - Each coordinator owns its own buffer, tracker and monitor; several
///   pipelines may run side by side in one process
/// - An exception escaping any step of one reading is logged and recorded
///   as a ProcessingFailure; the worker carries on
/// - stop() wakes every blocked worker; buffered readings are processed
///   until `drain_timeout_ms`, any left after that are dropped and counted
/// - A reading is dequeued by exactly one worker, so it is delivered at
///   most once

#include "aqs/anomaly.hpp"
#include "aqs/collaborators.hpp"
#include "aqs/config.hpp"
#include "aqs/ingestion_buffer.hpp"
#include "aqs/monitor.hpp"
#include "aqs/payload.hpp"
#include "aqs/types.hpp"
#include "aqs/validator.hpp"
#include "aqs/window_stats.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <thread>
#include <vector>

namespace aqs::pipeline {

enum class PipelineState {
    Stopped,
    Starting,
    Running,
    Draining,
};

[[nodiscard]] const char* to_string(PipelineState s) noexcept;

/// What happened to one reading.
struct ProcessResult {
    std::optional<AnomalyVerdict> verdict;  ///< Set unless rejected
    std::optional<ErrorKind>      error;    ///< Set when rejected
    std::size_t                   delivered = 0;  ///< Sinks that accepted it
};

class PipelineCoordinator {
public:
    explicit PipelineCoordinator(config::PipelineConfig cfg = {},
                                 Collaborators collaborators = {});
    ~PipelineCoordinator();

    PipelineCoordinator(const PipelineCoordinator&)            = delete;
    PipelineCoordinator& operator=(const PipelineCoordinator&) = delete;

    /// Stopped → Running. Returns false if not currently Stopped.
    bool start();

    /// Running → Draining → Stopped.
    ///
    /// # Returns
    /// `true` if every buffered reading was processed within the drain
    /// timeout (or the pipeline was already stopped), `false` if leftovers
    /// had to be dropped.
    bool stop();

    /// Assign a sequence number and buffer the reading, applying the
    /// configured backpressure policy. Never blocks longer than
    /// `enqueue_wait_ms`. Rejected enqueues are counted as dropped.
    [[nodiscard]] ingest::EnqueueStatus enqueue(RawReading reading);

    /// Parse a transport message and enqueue it.
    [[nodiscard]] ingest::EnqueueStatus submit(std::string_view topic,
                                               std::string_view payload);

    /// Run one reading through the flow on the calling thread. Workers use
    /// this; it is public for tools and tests that need synchronous runs.
    ProcessResult process(const RawReading& raw, SteadyTime origin = SteadyClock::now());

    [[nodiscard]] PipelineState state() const noexcept;

    [[nodiscard]] monitor::MetricsSnapshot metrics_snapshot() const;

    /// Sample buffer occupancy, evaluate monitor thresholds and publish the
    /// resulting alerts.
    std::vector<monitor::Alert> check_alerts();

    [[nodiscard]] std::vector<AuditRecord> audit_trail() const;

    [[nodiscard]] std::uint64_t delivered_count() const noexcept;

    [[nodiscard]] monitor::PerformanceMonitor&       monitor() noexcept { return monitor_; }
    [[nodiscard]] stats::WindowStatisticsTracker&    tracker() noexcept { return tracker_; }
    [[nodiscard]] const ingest::IngestionBuffer&     buffer() const noexcept { return buffer_; }
    [[nodiscard]] const config::PipelineConfig&      config() const noexcept { return cfg_; }

private:
    void worker_loop();
    void reporter_loop();
    void report_once();
    std::vector<monitor::Alert> publish_threshold_alerts();

    void process_entry(ingest::BufferEntry entry);

    /// Record processing time since `started` and end-to-end time since `origin`.
    void record_finish(SteadyTime started, SteadyTime origin);
    void reject(const RawReading& raw, ErrorKind kind, const std::string& detail);
    void quarantine(const CleanedReading& reading, const AnomalyVerdict& verdict,
                    const std::string& topic);
    void publish_alert(const monitor::Alert& alert);
    void audit(AuditRecord record);

    config::PipelineConfig cfg_;
    Collaborators          collaborators_;

    ingest::PayloadParser            parser_;
    ingest::IngestionBuffer          buffer_;
    validation::ReadingValidator     validator_;
    stats::WindowStatisticsTracker   tracker_;
    anomaly::AnomalyDetector         detector_;
    monitor::PerformanceMonitor      monitor_;
    AuditTrail                       audit_;

    std::atomic<PipelineState> state_{PipelineState::Stopped};
    std::atomic<std::uint64_t> next_sequence_{1};
    std::atomic<std::uint64_t> delivered_{0};
    std::atomic<bool>          full_reported_{false};

    std::mutex               lifecycle_mutex_;
    std::vector<std::thread> workers_;
    std::mutex               workers_mutex_;
    std::condition_variable  workers_done_;
    std::size_t              active_workers_ = 0;

    std::thread              reporter_;
    std::mutex               reporter_mutex_;
    std::condition_variable  reporter_wake_;
    bool                     reporter_stop_ = false;
};

}  // namespace aqs::pipeline
