/// @file src/pipeline/delivery.cpp
/// @brief Function-backed sinks, AuditTrail and bounded-retry delivery.

#include "aqs/collaborators.hpp"

#include "aqs/logging.hpp"

#include <chrono>
#include <cmath>
#include <exception>
#include <utility>

namespace aqs::pipeline {

namespace {

class FunctionReadingSink final : public ReadingSink {
public:
    FunctionReadingSink(std::string name, DeliverFn fn)
        : name_(std::move(name)), fn_(std::move(fn)) {}

    std::string name() const override { return name_; }

    bool deliver(const CleanedReading& reading, const AnomalyVerdict& verdict) override {
        return fn_(reading, verdict);
    }

private:
    std::string name_;
    DeliverFn   fn_;
};

class FunctionAlertSink final : public AlertSink {
public:
    explicit FunctionAlertSink(PublishFn fn) : fn_(std::move(fn)) {}
    void publish(const monitor::Alert& alert) override { fn_(alert); }

private:
    PublishFn fn_;
};

class FunctionAuditSink final : public AuditSink {
public:
    explicit FunctionAuditSink(RecordFn fn) : fn_(std::move(fn)) {}
    void record(const AuditRecord& record) override { fn_(record); }

private:
    RecordFn fn_;
};

}  // namespace

std::shared_ptr<ReadingSink> make_reading_sink(std::string name, DeliverFn fn) {
    return std::make_shared<FunctionReadingSink>(std::move(name), std::move(fn));
}

std::shared_ptr<AlertSink> make_alert_sink(PublishFn fn) {
    return std::make_shared<FunctionAlertSink>(std::move(fn));
}

std::shared_ptr<AuditSink> make_audit_sink(RecordFn fn) {
    return std::make_shared<FunctionAuditSink>(std::move(fn));
}

// ─── AuditRecord ──────────────────────────────────────────────────────────────

nlohmann::json AuditRecord::to_json() const {
    nlohmann::json j{
        {"sequence", sequence},
        {"sensor_id", sensor_id},
        {"topic", topic},
        {"classification", rejected() ? "rejected" : aqs::to_string(classification)},
        {"detail", detail},
        {"wall_time", wall_time},
    };
    j["value"] = value ? nlohmann::json(*value) : nlohmann::json(nullptr);
    if (reason) {
        j["reason"] = aqs::to_string(*reason);
    }
    if (verdict) {
        j["z_score"]       = verdict->z_score;
        j["quality_score"] = verdict->quality_score;
    }
    return j;
}

// ─── AuditTrail ───────────────────────────────────────────────────────────────

AuditTrail::AuditTrail(std::size_t capacity) : capacity_(capacity < 1 ? 1 : capacity) {}

void AuditTrail::append(AuditRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (records_.size() >= capacity_) {
        records_.pop_front();
    }
    records_.push_back(std::move(record));
    ++appended_;
}

std::vector<AuditRecord> AuditTrail::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {records_.begin(), records_.end()};
}

std::size_t AuditTrail::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

std::uint64_t AuditTrail::total_appended() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return appended_;
}

void AuditTrail::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
}

// ─── deliver_with_retry ───────────────────────────────────────────────────────

bool deliver_with_retry(ReadingSink& sink,
                        const CleanedReading& reading,
                        const AnomalyVerdict& verdict,
                        const config::DeliveryConfig& cfg,
                        monitor::PerformanceMonitor& monitor,
                        const Sleeper& sleep) {
    auto log = logging::get("delivery");
    const unsigned attempts = cfg.attempts < 1 ? 1 : cfg.attempts;

    for (unsigned k = 0; k < attempts; ++k) {
        try {
            if (sink.deliver(reading, verdict)) {
                return true;
            }
            log->debug("sink '{}' refused seq={} (attempt {}/{})",
                       sink.name(), reading.sequence, k + 1, attempts);
        } catch (const std::exception& e) {
            log->warn("sink '{}' threw on seq={} (attempt {}/{}): {}",
                      sink.name(), reading.sequence, k + 1, attempts, e.what());
        }
        if (k + 1 < attempts && cfg.backoff_ms > 0.0) {
            const double wait_ms = cfg.backoff_ms * std::pow(2.0, static_cast<double>(k));
            sleep(std::chrono::milliseconds(static_cast<long long>(std::llround(wait_ms))));
        }
    }

    monitor.record_delivery_failure();
    log->error("delivery of seq={} from '{}' to '{}' dropped after {} attempt(s)",
               reading.sequence, reading.sensor_id, sink.name(), attempts);
    return false;
}

}  // namespace aqs::pipeline
