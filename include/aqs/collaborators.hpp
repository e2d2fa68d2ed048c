#pragma once

/// @file include/aqs/collaborators.hpp
/// @brief Capability interfaces for downstream consumers, plus the audit trail.
///
/// # Module: Collaborators
///
/// ## Responsibility
/// The narrow contracts through which the pipeline hands results to the
/// systems it does not own (optimisation, forecasting, storage, alerting,
/// ledger). Implementations are injected into the PipelineCoordinator.
///
/// ## Contract
/// - Sinks may be called concurrently from several workers
/// - A ReadingSink reports failure by returning `false` or throwing a
///   `std::exception`; either way the pipeline retries a bounded number of
///   times, then logs, counts and drops the delivery
/// - Nothing a sink does can stop ingestion

#include "aqs/config.hpp"
#include "aqs/monitor.hpp"
#include "aqs/types.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace aqs::pipeline {

// ─── Interfaces ───────────────────────────────────────────────────────────────

/// Receives every normal or anomalous (cleaned reading, verdict) pair.
class ReadingSink {
public:
    virtual ~ReadingSink() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    /// Returns false if the consumer could not accept the pair.
    virtual bool deliver(const CleanedReading& reading, const AnomalyVerdict& verdict) = 0;
};

/// Receives threshold alerts and critical anomaly notifications.
class AlertSink {
public:
    virtual ~AlertSink() = default;
    virtual void publish(const monitor::Alert& alert) = 0;
};

/// A reading that was kept out of the statistics and the downstream flow.
struct AuditRecord {
    std::uint64_t sequence = 0;
    std::string   sensor_id;  ///< Empty if the payload carried none
    std::string   topic;
    Classification            classification = Classification::Quarantined;
    std::optional<ErrorKind>  reason;   ///< Set for rejected readings
    std::optional<AnomalyVerdict> verdict;  ///< Set for quarantined readings
    std::optional<double>     value;
    std::string detail;
    double      wall_time = 0.0;

    [[nodiscard]] bool rejected() const noexcept { return reason.has_value(); }
    [[nodiscard]] nlohmann::json to_json() const;
};

/// Ledger / audit consumer.
class AuditSink {
public:
    virtual ~AuditSink() = default;
    virtual void record(const AuditRecord& record) = 0;
};

/// Everything injected into a coordinator. Any list may be empty.
struct Collaborators {
    std::vector<std::shared_ptr<ReadingSink>> readings;
    std::vector<std::shared_ptr<AlertSink>>   alerts;
    std::vector<std::shared_ptr<AuditSink>>   audit;
};

// ─── Function adapters ────────────────────────────────────────────────────────

using DeliverFn = std::function<bool(const CleanedReading&, const AnomalyVerdict&)>;
using PublishFn = std::function<void(const monitor::Alert&)>;
using RecordFn  = std::function<void(const AuditRecord&)>;

[[nodiscard]] std::shared_ptr<ReadingSink> make_reading_sink(std::string name, DeliverFn fn);
[[nodiscard]] std::shared_ptr<AlertSink>   make_alert_sink(PublishFn fn);
[[nodiscard]] std::shared_ptr<AuditSink>   make_audit_sink(RecordFn fn);

// ─── AuditTrail ───────────────────────────────────────────────────────────────

/// Bounded, thread-safe, in-memory audit trail. The oldest record is
/// evicted once capacity is reached.
class AuditTrail {
public:
    explicit AuditTrail(std::size_t capacity = constants::DEFAULT_AUDIT_CAPACITY);

    void append(AuditRecord record);

    /// Copy of the retained records, oldest first.
    [[nodiscard]] std::vector<AuditRecord> records() const;

    [[nodiscard]] std::size_t   size() const;
    [[nodiscard]] std::uint64_t total_appended() const;
    [[nodiscard]] std::size_t   capacity() const noexcept { return capacity_; }

    void clear();

private:
    std::size_t             capacity_;
    mutable std::mutex      mutex_;
    std::deque<AuditRecord> records_;
    std::uint64_t           appended_ = 0;
};

// ─── Delivery ─────────────────────────────────────────────────────────────────

/// Hand one pair to a sink with bounded retries.
///
/// Attempt `k` (0-based) that fails is followed by a wait of
/// `backoff_ms · 2^k` before the next. After the last failed attempt the
/// failure is logged and recorded on the monitor.
///
/// # Returns
/// `true` if some attempt succeeded.
bool deliver_with_retry(ReadingSink& sink,
                        const CleanedReading& reading,
                        const AnomalyVerdict& verdict,
                        const config::DeliveryConfig& cfg,
                        monitor::PerformanceMonitor& monitor,
                        const Sleeper& sleep = thread_sleep);

}  // namespace aqs::pipeline
