/// @file src/transport/subscription.cpp
/// @brief RetryPolicy, SubscriptionManager and the ingest bridge.

#include "aqs/transport.hpp"

#include "aqs/logging.hpp"
#include "aqs/pipeline.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace aqs::transport {

// ─── RetryPolicy ──────────────────────────────────────────────────────────────

std::chrono::milliseconds RetryPolicy::backoff_for(unsigned attempt) const noexcept {
    const double base   = static_cast<double>(initial_backoff.count());
    const double scaled = base * std::pow(std::max(1.0, multiplier), static_cast<double>(attempt));
    const double capped = std::min(scaled, static_cast<double>(max_backoff.count()));
    return std::chrono::milliseconds(static_cast<long long>(std::llround(capped)));
}

RetryPolicy RetryPolicy::from(const config::TransportConfig& cfg) noexcept {
    RetryPolicy p;
    p.max_attempts    = cfg.connect_attempts < 1 ? 1 : cfg.connect_attempts;
    p.initial_backoff = std::chrono::milliseconds(
        static_cast<long long>(std::llround(cfg.connect_backoff_ms)));
    p.max_backoff     = std::chrono::milliseconds(
        static_cast<long long>(std::llround(cfg.connect_backoff_max_ms)));
    return p;
}

// ─── SubscriptionManager ──────────────────────────────────────────────────────

SubscriptionManager::SubscriptionManager(Transport& transport, RetryPolicy policy,
                                         monitor::PerformanceMonitor& monitor,
                                         Sleeper sleep)
    : transport_(transport), policy_(policy), monitor_(monitor), sleep_(std::move(sleep)) {}

template <typename Attempt>
bool SubscriptionManager::retry(std::string_view what, Attempt&& attempt) {
    auto log = logging::get("transport");
    const unsigned budget = std::max(1u, policy_.max_attempts);

    for (unsigned k = 0; k < budget; ++k) {
        if (attempt()) {
            if (k > 0) {
                log->info("{} succeeded after {} attempt(s)", what, k + 1);
            }
            return true;
        }
        monitor_.record_connectivity_error();
        if (k + 1 < budget) {
            const auto wait = policy_.backoff_for(k);
            log->warn("{} failed (attempt {}/{}); retrying in {}ms",
                      what, k + 1, budget, wait.count());
            sleep_(wait);
        }
    }

    const std::string message = fmt::format("{} failed after {} attempt(s)", what, budget);
    log->error("{}", message);
    monitor_.raise_connectivity_alert(message);
    return false;
}

bool SubscriptionManager::connect_with_retry() {
    return retry("connect", [this] { return transport_.connect(); });
}

bool SubscriptionManager::subscribe_with_retry(const std::string& pattern) {
    return retry(fmt::format("subscribe '{}'", pattern),
                 [this, &pattern] { return transport_.subscribe(pattern); });
}

bool SubscriptionManager::establish(const std::vector<std::string>& patterns) {
    if (!transport_.connected() && !connect_with_retry()) {
        return false;
    }
    for (const auto& p : patterns) {
        if (!subscribe_with_retry(p)) {
            return false;
        }
    }
    logging::get("transport")->info("subscribed to {} topic pattern(s)", patterns.size());
    return true;
}

// ─── Ingest bridge ────────────────────────────────────────────────────────────

MessageHandler make_ingest_handler(pipeline::PipelineCoordinator& coordinator) {
    return [&coordinator](std::string_view topic, std::string_view payload) {
        // BufferFull / Closed are counted by the coordinator.
        (void)coordinator.submit(topic, payload);
    };
}

}  // namespace aqs::transport
