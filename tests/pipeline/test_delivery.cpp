/// @file tests/pipeline/test_delivery.cpp
/// @brief Unit tests for bounded-retry delivery and the audit trail.
///
/// Test categories:
///   - deliver_with_retry: success, refusal, exceptions, backoff schedule
///   - AuditTrail: bounded retention, ordering, JSON export
///   - Function adapters

#include <gtest/gtest.h>
#include "aqs/collaborators.hpp"

#include <chrono>
#include <stdexcept>
#include <vector>

using namespace aqs;
using namespace aqs::pipeline;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

CleanedReading sample_reading() {
    CleanedReading r;
    r.sequence  = 11;
    r.sensor_id = "water_meter_001";
    r.value     = 50.0;
    return r;
}

struct RecordingSleeper {
    std::vector<long long> waits;
    Sleeper fn() {
        return [this](std::chrono::milliseconds d) { waits.push_back(d.count()); };
    }
};

/// Fails the first `failures` calls, by refusal or by throwing.
std::shared_ptr<ReadingSink> flaky_sink(int failures, bool throws, int& calls) {
    return make_reading_sink("flaky", [failures, throws, &calls](const CleanedReading&,
                                                                 const AnomalyVerdict&) {
        ++calls;
        if (calls <= failures) {
            if (throws) throw std::runtime_error("downstream unavailable");
            return false;
        }
        return true;
    });
}

}  // namespace

// ─── deliver_with_retry ──────────────────────────────────────────────────────

TEST(DeliverWithRetry, FirstAttemptSucceeds) {
    int calls = 0;
    auto sink = flaky_sink(0, false, calls);
    monitor::PerformanceMonitor mon;
    RecordingSleeper sleeper;
    EXPECT_TRUE(deliver_with_retry(*sink, sample_reading(), AnomalyVerdict{},
                                   config::DeliveryConfig{}, mon, sleeper.fn()));
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(sleeper.waits.empty());
    EXPECT_EQ(mon.snapshot().delivery_failures, 0u);
}

TEST(DeliverWithRetry, RecoversAfterRefusals) {
    int calls = 0;
    auto sink = flaky_sink(2, false, calls);
    monitor::PerformanceMonitor mon;
    RecordingSleeper sleeper;
    config::DeliveryConfig cfg;
    cfg.attempts   = 3;
    cfg.backoff_ms = 5.0;
    EXPECT_TRUE(deliver_with_retry(*sink, sample_reading(), AnomalyVerdict{}, cfg, mon,
                                   sleeper.fn()));
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(sleeper.waits, (std::vector<long long>{5, 10}));
}

TEST(DeliverWithRetry, ExceptionsCountAsFailures) {
    int calls = 0;
    auto sink = flaky_sink(1, true, calls);
    monitor::PerformanceMonitor mon;
    RecordingSleeper sleeper;
    EXPECT_TRUE(deliver_with_retry(*sink, sample_reading(), AnomalyVerdict{},
                                   config::DeliveryConfig{}, mon, sleeper.fn()));
    EXPECT_EQ(calls, 2);
}

TEST(DeliverWithRetry, ExhaustionIsRecordedNotThrown) {
    int calls = 0;
    auto sink = flaky_sink(100, true, calls);
    monitor::PerformanceMonitor mon;
    RecordingSleeper sleeper;
    config::DeliveryConfig cfg;
    cfg.attempts   = 4;
    cfg.backoff_ms = 1.0;
    EXPECT_FALSE(deliver_with_retry(*sink, sample_reading(), AnomalyVerdict{}, cfg, mon,
                                    sleeper.fn()));
    EXPECT_EQ(calls, 4);
    EXPECT_EQ(sleeper.waits, (std::vector<long long>{1, 2, 4}));
    EXPECT_EQ(mon.snapshot().delivery_failures, 1u);
}

TEST(DeliverWithRetry, ZeroAttemptsStillTriesOnce) {
    int calls = 0;
    auto sink = flaky_sink(0, false, calls);
    monitor::PerformanceMonitor mon;
    config::DeliveryConfig cfg;
    cfg.attempts = 0;
    EXPECT_TRUE(deliver_with_retry(*sink, sample_reading(), AnomalyVerdict{}, cfg, mon,
                                   [](std::chrono::milliseconds) {}));
    EXPECT_EQ(calls, 1);
}

// ─── AuditTrail ──────────────────────────────────────────────────────────────

TEST(AuditTrail, EvictsOldestBeyondCapacity) {
    AuditTrail trail(3);
    for (std::uint64_t i = 1; i <= 5; ++i) {
        AuditRecord r;
        r.sequence = i;
        trail.append(r);
    }
    const auto records = trail.records();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records.front().sequence, 3u);
    EXPECT_EQ(records.back().sequence, 5u);
    EXPECT_EQ(trail.total_appended(), 5u);

    trail.clear();
    EXPECT_EQ(trail.size(), 0u);
}

TEST(AuditTrail, ZeroCapacityKeepsOne) {
    AuditTrail trail(0);
    EXPECT_EQ(trail.capacity(), 1u);
}

TEST(AuditRecord, JsonDistinguishesRejectedFromQuarantined) {
    AuditRecord rejected;
    rejected.reason = ErrorKind::OutOfRange;
    rejected.value  = -5.0;
    const auto rj = rejected.to_json();
    EXPECT_EQ(rj.at("classification"), "rejected");
    EXPECT_EQ(rj.at("reason"), "OutOfRange");
    EXPECT_DOUBLE_EQ(rj.at("value").get<double>(), -5.0);

    AuditRecord quarantined;
    quarantined.verdict = AnomalyVerdict{};
    quarantined.verdict->quality_score = 0.4;
    const auto qj = quarantined.to_json();
    EXPECT_EQ(qj.at("classification"), "quarantined");
    EXPECT_FALSE(qj.contains("reason"));
    EXPECT_TRUE(qj.at("value").is_null());
    EXPECT_DOUBLE_EQ(qj.at("quality_score").get<double>(), 0.4);
}

// ─── Adapters ────────────────────────────────────────────────────────────────

TEST(FunctionAdapters, ForwardToCallables) {
    int alerts = 0;
    int audits = 0;
    auto alert_sink = make_alert_sink([&](const monitor::Alert&) { ++alerts; });
    auto audit_sink = make_audit_sink([&](const AuditRecord&) { ++audits; });
    alert_sink->publish(monitor::Alert{monitor::AlertKind::ErrorRate, Severity::Warning,
                                       0.03, 0.02, "x", 0.0});
    audit_sink->record(AuditRecord{});
    EXPECT_EQ(alerts, 1);
    EXPECT_EQ(audits, 1);

    int calls = 0;
    auto reading_sink = flaky_sink(0, false, calls);
    EXPECT_EQ(reading_sink->name(), "flaky");
}
