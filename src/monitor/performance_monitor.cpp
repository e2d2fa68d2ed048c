/// @file src/monitor/performance_monitor.cpp
/// @brief PerformanceMonitor — trailing-window aggregation and threshold alerts.

#include "aqs/monitor.hpp"

#include "aqs/logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iterator>
#include <numeric>
#include <utility>

namespace aqs::monitor {

namespace {

double wall_seconds() noexcept {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

double ratio(std::uint64_t num, std::uint64_t den) noexcept {
    return den == 0 ? 0.0 : static_cast<double>(num) / static_cast<double>(den);
}

}  // namespace

// ─── to_string ────────────────────────────────────────────────────────────────

const char* to_string(Stage s) noexcept {
    switch (s) {
        case Stage::Parse:    return "parse";
        case Stage::Queue:    return "queue";
        case Stage::Validate: return "validate";
        case Stage::Classify: return "classify";
        case Stage::Deliver:  return "deliver";
        case Stage::Process:  return "process";
        case Stage::Total:    return "total";
    }
    return "unknown";
}

const char* to_string(Outcome o) noexcept {
    switch (o) {
        case Outcome::Normal:      return "normal";
        case Outcome::Anomaly:     return "anomaly";
        case Outcome::Quarantined: return "quarantined";
        case Outcome::Error:       return "error";
        case Outcome::Dropped:     return "dropped";
    }
    return "unknown";
}

const char* to_string(AlertKind k) noexcept {
    switch (k) {
        case AlertKind::ProcessingLatency: return "processing_latency";
        case AlertKind::ErrorRate:         return "error_rate";
        case AlertKind::BufferOccupancy:   return "buffer_occupancy";
        case AlertKind::Connectivity:      return "connectivity";
        case AlertKind::CriticalAnomaly:   return "critical_anomaly";
    }
    return "unknown";
}

Outcome outcome_of(Classification c) noexcept {
    switch (c) {
        case Classification::Normal:      return Outcome::Normal;
        case Classification::Anomaly:     return Outcome::Anomaly;
        case Classification::Quarantined: return Outcome::Quarantined;
    }
    return Outcome::Error;
}

// ─── Alert ────────────────────────────────────────────────────────────────────

nlohmann::json Alert::to_json() const {
    return nlohmann::json{
        {"kind", monitor::to_string(kind)},
        {"severity", aqs::to_string(severity)},
        {"value", value},
        {"threshold", threshold},
        {"message", message},
        {"wall_time", wall_time},
    };
}

std::string Alert::to_string() const {
    return fmt::format("[{}] {}: {} (value={:.3f} threshold={:.3f})",
                       aqs::to_string(severity), monitor::to_string(kind),
                       message, value, threshold);
}

// ─── MetricsSnapshot ──────────────────────────────────────────────────────────

nlohmann::json MetricsSnapshot::to_json() const {
    nlohmann::json stages = nlohmann::json::object();
    for (std::size_t i = 0; i < STAGE_COUNT; ++i) {
        stages[monitor::to_string(static_cast<Stage>(i))] = stage_mean_ms[i];
    }
    return nlohmann::json{
        {"window_s", window_s},
        {"processed", processed},
        {"normal", normal},
        {"anomalies", anomalies},
        {"quarantined", quarantined},
        {"errors", errors},
        {"dropped", dropped},
        {"latency_ms", {{"samples", latency_samples},
                        {"mean", mean_latency_ms},
                        {"p95", p95_latency_ms},
                        {"max", max_latency_ms}}},
        {"stage_mean_ms", stages},
        {"buffer_occupancy_pct", {{"current", current_occupancy_pct},
                                  {"max", max_occupancy_pct},
                                  {"mean", mean_occupancy_pct}}},
        {"error_rate", error_rate},
        {"anomaly_rate", anomaly_rate},
        {"quarantine_rate", quarantine_rate},
        {"delivery_failures", delivery_failures},
        {"connectivity_errors", connectivity_errors},
        {"errors_by_kind", errors_by_kind},
        {"active_streams", active_streams},
    };
}

std::string MetricsSnapshot::to_string() const {
    return fmt::format(
        "┌──────────────────────────────────────────────┐\n"
        "│ AquaStream metrics (trailing {:6.0f}s)         │\n"
        "├──────────────────────┬───────────────────────┤\n"
        "│ Processed            │ {:>21} │\n"
        "│ Normal / Anomaly     │ {:>10} / {:>8} │\n"
        "│ Quarantined          │ {:>21} │\n"
        "│ Errors / Dropped     │ {:>10} / {:>8} │\n"
        "│ Latency mean (ms)    │ {:>21.3f} │\n"
        "│ Latency p95 (ms)     │ {:>21.3f} │\n"
        "│ Latency max (ms)     │ {:>21.3f} │\n"
        "│ Buffer now / max (%) │ {:>10.1f} / {:>8.1f} │\n"
        "│ Error rate           │ {:>20.2f}% │\n"
        "│ Anomaly rate         │ {:>20.2f}% │\n"
        "│ Quarantine rate      │ {:>20.2f}% │\n"
        "│ Delivery failures    │ {:>21} │\n"
        "│ Connectivity errors  │ {:>21} │\n"
        "│ Active streams       │ {:>21} │\n"
        "└──────────────────────┴───────────────────────┘\n",
        window_s, processed, normal, anomalies, quarantined, errors, dropped,
        mean_latency_ms, p95_latency_ms, max_latency_ms,
        current_occupancy_pct, max_occupancy_pct,
        error_rate * 100.0, anomaly_rate * 100.0, quarantine_rate * 100.0,
        delivery_failures, connectivity_errors, active_streams);
}

// ─── percentile ───────────────────────────────────────────────────────────────

double percentile(std::vector<double> samples, double q) {
    if (samples.empty()) {
        return 0.0;
    }
    std::sort(samples.begin(), samples.end());
    const double rank = std::clamp(q, 0.0, 1.0) * static_cast<double>(samples.size() - 1);
    const auto   lo   = static_cast<std::size_t>(std::floor(rank));
    const auto   hi   = static_cast<std::size_t>(std::ceil(rank));
    return samples[lo] + (samples[hi] - samples[lo]) * (rank - static_cast<double>(lo));
}

// ─── PerformanceMonitor ───────────────────────────────────────────────────────

PerformanceMonitor::PerformanceMonitor(config::MonitorConfig cfg)
    : cfg_(cfg),
      window_(std::chrono::duration_cast<SteadyClock::duration>(
          std::chrono::duration<double>(cfg.window_s))) {
    cfg_.max_samples = std::max<std::size_t>(1, cfg_.max_samples);
}

void PerformanceMonitor::prune_locked(SteadyTime now) {
    const SteadyTime cutoff = now - window_;
    auto drop_old = [cutoff](auto& dq) {
        while (!dq.empty() && dq.front().at < cutoff) {
            dq.pop_front();
        }
    };
    for (auto& dq : stages_) {
        drop_old(dq);
    }
    drop_old(occupancy_);
    while (!outcomes_.empty() && outcomes_.front().at + std::chrono::seconds(1) <= cutoff) {
        outcomes_.pop_front();
    }
}

void PerformanceMonitor::push_sample_locked(std::deque<TimedValue>& series, TimedValue sample) {
    series.push_back(sample);
    while (series.size() > cfg_.max_samples) {
        series.pop_front();
    }
}

void PerformanceMonitor::count_outcome_locked(Outcome outcome, SteadyTime now) {
    const SteadyTime second{std::chrono::duration_cast<SteadyClock::duration>(
        std::chrono::floor<std::chrono::seconds>(now.time_since_epoch()))};
    const auto slot = static_cast<std::size_t>(outcome);

    // Buckets stay ordered by start; a late timestamp lands in its own second.
    auto it = outcomes_.end();
    while (it != outcomes_.begin() && std::prev(it)->at > second) {
        --it;
    }
    if (it != outcomes_.begin() && std::prev(it)->at == second) {
        ++std::prev(it)->counts[slot];
        return;
    }
    OutcomeBucket bucket{second, {}};
    ++bucket.counts[slot];
    outcomes_.insert(it, bucket);
}

void PerformanceMonitor::record(Stage stage, Millis duration, SteadyTime now) {
    std::lock_guard<std::mutex> lock(mutex_);
    push_sample_locked(stages_[static_cast<std::size_t>(stage)],
                       TimedValue{now, duration.count()});
    prune_locked(now);
}

void PerformanceMonitor::record_buffer_occupancy(double pct, SteadyTime now) {
    current_occupancy_.store(pct, std::memory_order_relaxed);
    std::lock_guard<std::mutex> lock(mutex_);
    push_sample_locked(occupancy_, TimedValue{now, pct});
    prune_locked(now);
}

void PerformanceMonitor::record_outcome(Outcome outcome, SteadyTime now) {
    std::lock_guard<std::mutex> lock(mutex_);
    count_outcome_locked(outcome, now);
    prune_locked(now);
}

void PerformanceMonitor::record_error(ErrorKind kind, SteadyTime now) {
    std::lock_guard<std::mutex> lock(mutex_);
    count_outcome_locked(Outcome::Error, now);
    ++errors_by_kind_[aqs::to_string(kind)];
    prune_locked(now);
}

void PerformanceMonitor::record_delivery_failure() noexcept {
    delivery_failures_.fetch_add(1, std::memory_order_relaxed);
}

void PerformanceMonitor::record_connectivity_error() noexcept {
    connectivity_errors_.fetch_add(1, std::memory_order_relaxed);
}

void PerformanceMonitor::raise_connectivity_alert(std::string message) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_connectivity_ = std::move(message);
}

void PerformanceMonitor::set_active_streams(std::size_t n) noexcept {
    active_streams_.store(n, std::memory_order_relaxed);
}

// ─── snapshot ─────────────────────────────────────────────────────────────────

MetricsSnapshot PerformanceMonitor::snapshot(SteadyTime now) const {
    std::array<std::deque<TimedValue>, STAGE_COUNT> stages;
    std::deque<OutcomeBucket> outcomes;
    std::deque<TimedValue>    occupancy;
    MetricsSnapshot s;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stages           = stages_;
        outcomes         = outcomes_;
        occupancy        = occupancy_;
        s.errors_by_kind = errors_by_kind_;
    }

    const SteadyTime cutoff = now - window_;
    s.window_s = cfg_.window_s;

    for (const auto& b : outcomes) {
        if (b.at + std::chrono::seconds(1) <= cutoff) continue;
        s.normal      += b.counts[static_cast<std::size_t>(Outcome::Normal)];
        s.anomalies   += b.counts[static_cast<std::size_t>(Outcome::Anomaly)];
        s.quarantined += b.counts[static_cast<std::size_t>(Outcome::Quarantined)];
        s.errors      += b.counts[static_cast<std::size_t>(Outcome::Error)];
        s.dropped     += b.counts[static_cast<std::size_t>(Outcome::Dropped)];
    }
    s.processed = s.normal + s.anomalies + s.quarantined + s.errors;

    for (std::size_t i = 0; i < STAGE_COUNT; ++i) {
        double      sum = 0.0;
        std::size_t n   = 0;
        for (const auto& tv : stages[i]) {
            if (tv.at < cutoff) continue;
            sum += tv.value;
            ++n;
        }
        s.stage_mean_ms[i] = n == 0 ? 0.0 : sum / static_cast<double>(n);
    }

    const auto& processing = stages[static_cast<std::size_t>(Stage::Process)];
    std::vector<double> total;
    total.reserve(processing.size());
    for (const auto& tv : processing) {
        if (tv.at >= cutoff) total.push_back(tv.value);
    }
    s.latency_samples = total.size();
    if (!total.empty()) {
        s.mean_latency_ms = std::accumulate(total.begin(), total.end(), 0.0) /
                            static_cast<double>(total.size());
        s.max_latency_ms  = *std::max_element(total.begin(), total.end());
        s.p95_latency_ms  = percentile(std::move(total), 0.95);
    }

    double      occ_sum = 0.0;
    std::size_t occ_n   = 0;
    for (const auto& tv : occupancy) {
        if (tv.at < cutoff) continue;
        occ_sum += tv.value;
        s.max_occupancy_pct = std::max(s.max_occupancy_pct, tv.value);
        ++occ_n;
    }
    s.mean_occupancy_pct    = occ_n == 0 ? 0.0 : occ_sum / static_cast<double>(occ_n);
    s.current_occupancy_pct = current_occupancy_.load(std::memory_order_relaxed);

    s.error_rate      = ratio(s.errors, s.processed);
    s.anomaly_rate    = ratio(s.anomalies, s.processed);
    s.quarantine_rate = ratio(s.quarantined, s.processed);

    s.delivery_failures   = delivery_failures_.load(std::memory_order_relaxed);
    s.connectivity_errors = connectivity_errors_.load(std::memory_order_relaxed);
    s.active_streams      = active_streams_.load(std::memory_order_relaxed);
    return s;
}

// ─── check_thresholds ─────────────────────────────────────────────────────────

bool PerformanceMonitor::cooled_down(AlertKind kind, SteadyTime now) const {
    const auto it = last_emitted_.find(kind);
    if (it == last_emitted_.end()) {
        return true;
    }
    return std::chrono::duration<double>(now - it->second).count() >= cfg_.alert_cooldown_s;
}

std::vector<Alert> PerformanceMonitor::check_thresholds(SteadyTime now) {
    const MetricsSnapshot s    = snapshot(now);
    const double          wall = wall_seconds();

    std::vector<Alert> candidates;

    if (s.latency_samples > 0) {
        if (s.p95_latency_ms > cfg_.latency_alert_ms) {
            candidates.push_back(Alert{
                AlertKind::ProcessingLatency, Severity::Critical, s.p95_latency_ms,
                cfg_.latency_alert_ms,
                fmt::format("p95 processing latency {:.1f}ms exceeds {:.1f}ms",
                            s.p95_latency_ms, cfg_.latency_alert_ms),
                wall});
        } else if (s.p95_latency_ms > cfg_.latency_p95_target_ms) {
            candidates.push_back(Alert{
                AlertKind::ProcessingLatency, Severity::Warning, s.p95_latency_ms,
                cfg_.latency_p95_target_ms,
                fmt::format("p95 processing latency {:.1f}ms above target {:.1f}ms",
                            s.p95_latency_ms, cfg_.latency_p95_target_ms),
                wall});
        } else if (s.mean_latency_ms > cfg_.latency_target_ms) {
            candidates.push_back(Alert{
                AlertKind::ProcessingLatency, Severity::Warning, s.mean_latency_ms,
                cfg_.latency_target_ms,
                fmt::format("mean processing latency {:.1f}ms above target {:.1f}ms",
                            s.mean_latency_ms, cfg_.latency_target_ms),
                wall});
        }
    }

    if (s.processed > 0) {
        if (s.error_rate > cfg_.error_rate_critical) {
            candidates.push_back(Alert{
                AlertKind::ErrorRate, Severity::Critical, s.error_rate,
                cfg_.error_rate_critical,
                fmt::format("error rate {:.2f}% exceeds {:.2f}%",
                            s.error_rate * 100.0, cfg_.error_rate_critical * 100.0),
                wall});
        } else if (s.error_rate > cfg_.error_rate_warning) {
            candidates.push_back(Alert{
                AlertKind::ErrorRate, Severity::Warning, s.error_rate,
                cfg_.error_rate_warning,
                fmt::format("error rate {:.2f}% exceeds {:.2f}%",
                            s.error_rate * 100.0, cfg_.error_rate_warning * 100.0),
                wall});
        }
    }

    if (s.current_occupancy_pct >= cfg_.buffer_critical_pct) {
        candidates.push_back(Alert{
            AlertKind::BufferOccupancy, Severity::Critical, s.current_occupancy_pct,
            cfg_.buffer_critical_pct,
            fmt::format("ingestion buffer {:.1f}% full", s.current_occupancy_pct),
            wall});
    } else if (s.current_occupancy_pct >= cfg_.buffer_warning_pct) {
        candidates.push_back(Alert{
            AlertKind::BufferOccupancy, Severity::Warning, s.current_occupancy_pct,
            cfg_.buffer_warning_pct,
            fmt::format("ingestion buffer {:.1f}% full", s.current_occupancy_pct),
            wall});
    }

    std::vector<Alert> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pending_connectivity_) {
            candidates.push_back(Alert{
                AlertKind::Connectivity, Severity::Critical,
                static_cast<double>(s.connectivity_errors), 0.0,
                *pending_connectivity_, wall});
        }
        for (auto& a : candidates) {
            if (!cooled_down(a.kind, now)) {
                continue;
            }
            last_emitted_[a.kind] = now;
            if (a.kind == AlertKind::Connectivity) {
                pending_connectivity_.reset();
            }
            out.push_back(std::move(a));
        }
    }

    auto log = logging::get("monitor");
    for (const auto& a : out) {
        if (a.severity == Severity::Critical) {
            log->error("{}", a.to_string());
        } else {
            log->warn("{}", a.to_string());
        }
    }
    return out;
}

void PerformanceMonitor::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& dq : stages_) {
        dq.clear();
    }
    outcomes_.clear();
    occupancy_.clear();
    errors_by_kind_.clear();
    pending_connectivity_.reset();
    last_emitted_.clear();
    current_occupancy_.store(0.0, std::memory_order_relaxed);
    delivery_failures_.store(0, std::memory_order_relaxed);
    connectivity_errors_.store(0, std::memory_order_relaxed);
    active_streams_.store(0, std::memory_order_relaxed);
}

std::size_t PerformanceMonitor::retained_entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t n = occupancy_.size() + outcomes_.size();
    for (const auto& dq : stages_) {
        n += dq.size();
    }
    return n;
}

}  // namespace aqs::monitor
