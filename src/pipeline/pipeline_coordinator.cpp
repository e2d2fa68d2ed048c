/// @file src/pipeline/pipeline_coordinator.cpp
/// @brief PipelineCoordinator — lifecycle, worker pool and per-reading flow.

#include "aqs/pipeline.hpp"

#include "aqs/logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <string>
#include <utility>

namespace aqs::pipeline {

using monitor::Outcome;
using monitor::Stage;

const char* to_string(PipelineState s) noexcept {
    switch (s) {
        case PipelineState::Stopped:  return "Stopped";
        case PipelineState::Starting: return "Starting";
        case PipelineState::Running:  return "Running";
        case PipelineState::Draining: return "Draining";
    }
    return "Unknown";
}

// ─── Construction ─────────────────────────────────────────────────────────────

PipelineCoordinator::PipelineCoordinator(config::PipelineConfig cfg,
                                         Collaborators collaborators)
    : cfg_(std::move(cfg)),
      collaborators_(std::move(collaborators)),
      parser_(cfg_.transport.topic_categories),
      buffer_(cfg_.buffer.capacity),
      validator_(cfg_.validator, cfg_.detector.interpolation_confidence),
      tracker_(cfg_.window),
      detector_(cfg_.detector),
      monitor_(cfg_.monitor),
      audit_(cfg_.delivery.audit_capacity) {}

PipelineCoordinator::~PipelineCoordinator() {
    try {
        stop();
    } catch (const std::exception& e) {
        logging::get("pipeline")->error("shutdown failed: {}", e.what());
    }
}

// ─── Lifecycle ────────────────────────────────────────────────────────────────

bool PipelineCoordinator::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    PipelineState expected = PipelineState::Stopped;
    if (!state_.compare_exchange_strong(expected, PipelineState::Starting)) {
        return false;
    }

    buffer_.reopen();
    monitor_.reset();
    full_reported_.store(false);

    const std::size_t n = std::max<std::size_t>(1, cfg_.worker_count);
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        active_workers_ = n;
    }
    {
        std::lock_guard<std::mutex> lock(reporter_mutex_);
        reporter_stop_ = false;
    }
    workers_.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        workers_.emplace_back(&PipelineCoordinator::worker_loop, this);
    }
    reporter_ = std::thread(&PipelineCoordinator::reporter_loop, this);

    state_.store(PipelineState::Running);
    logging::get("pipeline")->info("running: {} worker(s), buffer capacity {}, backpressure {}",
                                   n, buffer_.capacity(),
                                   config::to_string(cfg_.buffer.backpressure));
    return true;
}

bool PipelineCoordinator::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    PipelineState expected = PipelineState::Running;
    if (!state_.compare_exchange_strong(expected, PipelineState::Draining)) {
        return state_.load() == PipelineState::Stopped;
    }

    auto log = logging::get("pipeline");
    log->info("draining {} buffered reading(s)", buffer_.size());
    buffer_.close();

    bool finished = false;
    {
        std::unique_lock<std::mutex> lock(workers_mutex_);
        finished = workers_done_.wait_for(
            lock, Millis(cfg_.drain_timeout_ms), [this] { return active_workers_ == 0; });
    }

    bool drained = true;
    if (!finished) {
        buffer_.abort();
        const auto leftovers = buffer_.drain_remaining();
        for (std::size_t i = 0; i < leftovers.size(); ++i) {
            monitor_.record_outcome(Outcome::Dropped);
        }
        if (!leftovers.empty()) {
            drained = false;
            log->warn("drain timeout ({:.0f}ms): dropped {} buffered reading(s)",
                      cfg_.drain_timeout_ms, leftovers.size());
        }
    }

    // In-flight readings complete before their worker exits.
    for (auto& w : workers_) {
        if (w.joinable()) {
            w.join();
        }
    }
    workers_.clear();

    {
        std::lock_guard<std::mutex> lock(reporter_mutex_);
        reporter_stop_ = true;
    }
    reporter_wake_.notify_all();
    if (reporter_.joinable()) {
        reporter_.join();
    }

    monitor_.record_buffer_occupancy(buffer_.occupancy_percent());
    monitor_.set_active_streams(tracker_.stream_count());
    state_.store(PipelineState::Stopped);
    log->info("stopped ({} deliveries)", delivered_.load());
    return drained;
}

PipelineState PipelineCoordinator::state() const noexcept {
    return state_.load();
}

// ─── Intake ───────────────────────────────────────────────────────────────────

ingest::EnqueueStatus PipelineCoordinator::enqueue(RawReading reading) {
    if (state_.load() != PipelineState::Running) {
        monitor_.record_outcome(Outcome::Dropped);
        return ingest::EnqueueStatus::Closed;
    }

    reading.sequence = next_sequence_.fetch_add(1);
    if (reading.received == SteadyTime{}) {
        reading.received = SteadyClock::now();
    }
    if (reading.received_wall == 0.0) {
        reading.received_wall = ingest::wall_now();
    }

    const auto status =
        cfg_.buffer.backpressure == config::BackpressurePolicy::Wait
            ? buffer_.enqueue_for(std::move(reading),
                                  std::chrono::milliseconds(
                                      static_cast<long long>(cfg_.buffer.enqueue_wait_ms)))
            : buffer_.enqueue(std::move(reading));
    monitor_.record_buffer_occupancy(buffer_.occupancy_percent());

    switch (status) {
        case ingest::EnqueueStatus::Accepted:
            if (full_reported_.exchange(false)) {
                logging::get("buffer")->info("buffer accepting readings again");
            }
            break;
        case ingest::EnqueueStatus::BufferFull:
            monitor_.record_outcome(Outcome::Dropped);
            if (!full_reported_.exchange(true)) {
                logging::get("buffer")->warn("buffer full ({} entries); dropping readings",
                                             buffer_.capacity());
            }
            break;
        case ingest::EnqueueStatus::Closed:
            monitor_.record_outcome(Outcome::Dropped);
            break;
    }
    return status;
}

ingest::EnqueueStatus PipelineCoordinator::submit(std::string_view topic,
                                                  std::string_view payload) {
    const auto t0  = SteadyClock::now();
    RawReading raw = parser_.parse(topic, payload);
    monitor_.record(Stage::Parse, Millis(SteadyClock::now() - t0));
    return enqueue(std::move(raw));
}

// ─── Workers ──────────────────────────────────────────────────────────────────

void PipelineCoordinator::worker_loop() {
    while (auto entry = buffer_.dequeue()) {
        process_entry(std::move(*entry));
    }
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        --active_workers_;
    }
    workers_done_.notify_all();
}

void PipelineCoordinator::process_entry(ingest::BufferEntry entry) {
    const auto now = SteadyClock::now();
    monitor_.record(Stage::Queue, Millis(now - entry.enqueued_at), now);
    try {
        process(entry.reading, entry.enqueued_at);
    } catch (const std::exception& e) {
        logging::get("pipeline")->error("processing seq={} failed: {}",
                                        entry.reading.sequence, e.what());
        monitor_.record_error(ErrorKind::ProcessingFailure);
    }
}

ProcessResult PipelineCoordinator::process(const RawReading& raw, SteadyTime origin) {
    ProcessResult result;
    const auto t0 = SteadyClock::now();

    if (auto err = validator_.validate_structure(raw)) {
        monitor_.record(Stage::Validate, Millis(SteadyClock::now() - t0));
        reject(raw, err->kind, err->detail);
        result.error = err->kind;
        record_finish(t0, origin);
        return result;
    }

    validation::ValidationResult validated;
    std::optional<AnomalyVerdict> verdict;
    Millis validate_ms{0.0};
    Millis classify_ms{0.0};

    tracker_.with_stream(
        *raw.sensor_id,
        [&](stats::RollingWindow& window) {
            const auto v0 = SteadyClock::now();
            validated = validator_.validate(raw, validation::StreamContext::of(window));
            const auto v1 = SteadyClock::now();
            validate_ms = v1 - v0;
            if (validated.rejected()) {
                return;
            }
            // Classify against the window as it was before this reading.
            verdict = detector_.classify(*validated.reading, tracker_.stats_of(window));
            if (anomaly::AnomalyDetector::feeds_window(verdict->classification)) {
                window.push(validated.reading->value, validated.reading->timestamp.wall);
            }
            classify_ms = SteadyClock::now() - v1;
        },
        t0);

    monitor_.record(Stage::Validate, validate_ms);
    if (validated.rejected()) {
        reject(raw, validated.reason, validated.detail);
        result.error = validated.reason;
        record_finish(t0, origin);
        return result;
    }
    monitor_.record(Stage::Classify, classify_ms);

    const CleanedReading& reading = *validated.reading;
    monitor_.record_outcome(monitor::outcome_of(verdict->classification));

    if (verdict->classification == Classification::Quarantined) {
        quarantine(reading, *verdict, raw.topic);
    } else {
        const auto d0 = SteadyClock::now();
        for (const auto& sink : collaborators_.readings) {
            if (deliver_with_retry(*sink, reading, *verdict, cfg_.delivery, monitor_)) {
                ++result.delivered;
            }
        }
        delivered_.fetch_add(result.delivered);
        monitor_.record(Stage::Deliver, Millis(SteadyClock::now() - d0));

        if (verdict->classification == Classification::Anomaly) {
            auto log = logging::get("detector");
            if (verdict->severity == Severity::Critical) {
                log->warn("critical anomaly seq={} sensor={} value={:.3f} z={:.2f}",
                          reading.sequence, reading.sensor_id, reading.value,
                          verdict->z_score);
                const double limit = 2.0 * detector_.config().z_score_threshold;
                publish_alert(monitor::Alert{
                    monitor::AlertKind::CriticalAnomaly, Severity::Critical,
                    std::abs(verdict->z_score), limit,
                    fmt::format("sensor {} value {:.3f} at z={:.2f}", reading.sensor_id,
                                reading.value, verdict->z_score),
                    ingest::wall_now()});
            } else {
                log->info("anomaly seq={} sensor={} value={:.3f} z={:.2f}",
                          reading.sequence, reading.sensor_id, reading.value,
                          verdict->z_score);
            }
        }
    }

    record_finish(t0, origin);
    result.verdict = std::move(verdict);
    return result;
}

// ─── Rejection / quarantine / alerts ─────────────────────────────────────────

void PipelineCoordinator::record_finish(SteadyTime started, SteadyTime origin) {
    const auto end = SteadyClock::now();
    monitor_.record(Stage::Process, Millis(end - started), end);
    monitor_.record(Stage::Total, Millis(end - origin), end);
}

void PipelineCoordinator::reject(const RawReading& raw, ErrorKind kind,
                                 const std::string& detail) {
    monitor_.record_error(kind);
    logging::get("validator")->warn("rejected seq={} topic='{}' sensor='{}': {} ({})",
                                    raw.sequence, raw.topic, raw.sensor_id.value_or(""),
                                    aqs::to_string(kind), detail);
    AuditRecord record;
    record.sequence  = raw.sequence;
    record.sensor_id = raw.sensor_id.value_or("");
    record.topic     = raw.topic;
    record.reason    = kind;
    record.value     = raw.value;
    record.detail    = detail;
    record.wall_time = ingest::wall_now();
    audit(std::move(record));
}

void PipelineCoordinator::quarantine(const CleanedReading& reading,
                                     const AnomalyVerdict& verdict,
                                     const std::string& topic) {
    logging::get("detector")->debug("quarantined seq={} sensor={} quality={:.3f}",
                                    reading.sequence, reading.sensor_id,
                                    verdict.quality_score);
    AuditRecord record;
    record.sequence       = reading.sequence;
    record.sensor_id      = reading.sensor_id;
    record.topic          = topic;
    record.classification = Classification::Quarantined;
    record.verdict        = verdict;
    record.value          = reading.value;
    record.detail         = fmt::format("quality {:.3f} below {:.3f}", verdict.quality_score,
                                        detector_.config().quality_threshold);
    record.wall_time      = ingest::wall_now();
    audit(std::move(record));
}

void PipelineCoordinator::audit(AuditRecord record) {
    for (const auto& sink : collaborators_.audit) {
        try {
            sink->record(record);
        } catch (const std::exception& e) {
            logging::get("pipeline")->warn("audit sink failed on seq={}: {}",
                                           record.sequence, e.what());
        }
    }
    audit_.append(std::move(record));
}

void PipelineCoordinator::publish_alert(const monitor::Alert& alert) {
    for (const auto& sink : collaborators_.alerts) {
        try {
            sink->publish(alert);
        } catch (const std::exception& e) {
            logging::get("pipeline")->warn("alert sink failed on {}: {}",
                                           monitor::to_string(alert.kind), e.what());
        }
    }
}

// ─── Reporting ────────────────────────────────────────────────────────────────

void PipelineCoordinator::reporter_loop() {
    const auto interval =
        std::chrono::duration<double>(std::max(0.01, cfg_.monitor.report_interval_s));
    std::unique_lock<std::mutex> lock(reporter_mutex_);
    while (!reporter_stop_) {
        if (reporter_wake_.wait_for(lock, interval, [this] { return reporter_stop_; })) {
            break;
        }
        lock.unlock();
        try {
            report_once();
        } catch (const std::exception& e) {
            logging::get("monitor")->error("periodic report failed: {}", e.what());
        }
        lock.lock();
    }
}

void PipelineCoordinator::report_once() {
    tracker_.evict_idle();
    monitor_.record_buffer_occupancy(buffer_.occupancy_percent());
    monitor_.set_active_streams(tracker_.stream_count());
    logging::get("monitor")->info("performance report: {}",
                                  monitor_.snapshot().to_json().dump());
    publish_threshold_alerts();
}

std::vector<monitor::Alert> PipelineCoordinator::check_alerts() {
    // Occupancy is otherwise sampled only on enqueue and by the reporter.
    monitor_.record_buffer_occupancy(buffer_.occupancy_percent());
    return publish_threshold_alerts();
}

std::vector<monitor::Alert> PipelineCoordinator::publish_threshold_alerts() {
    auto alerts = monitor_.check_thresholds();
    for (const auto& a : alerts) {
        publish_alert(a);
    }
    return alerts;
}

monitor::MetricsSnapshot PipelineCoordinator::metrics_snapshot() const {
    auto snap = monitor_.snapshot();
    snap.active_streams = tracker_.stream_count();
    return snap;
}

std::vector<AuditRecord> PipelineCoordinator::audit_trail() const {
    return audit_.records();
}

std::uint64_t PipelineCoordinator::delivered_count() const noexcept {
    return delivered_.load();
}

}  // namespace aqs::pipeline
