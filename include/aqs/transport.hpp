#pragma once

/// @file include/aqs/transport.hpp
/// @brief Transport contract, connect/subscribe retry and an in-process transport.
///
/// # Module: Transport
///
/// ## Responsibility
/// The publish/subscribe broker is an external collaborator. This module
/// only defines what the pipeline needs from it, drives connection and
/// subscription with bounded exponential backoff, and bridges delivered
/// messages into a PipelineCoordinator.
///
/// ## Failure Policy
/// Each failed connect or subscribe attempt is recorded as a connectivity
/// error on the monitor. When the retry budget is spent the monitor is
/// told to raise a critical Connectivity alert; the process keeps running.

#include "aqs/config.hpp"
#include "aqs/monitor.hpp"
#include "aqs/types.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace aqs::pipeline {
class PipelineCoordinator;
}

namespace aqs::transport {

/// Called once per delivered message, on the transport's thread.
using MessageHandler = std::function<void(std::string_view topic, std::string_view payload)>;

/// Minimal broker client contract.
class Transport {
public:
    virtual ~Transport() = default;

    virtual bool connect() = 0;
    virtual bool subscribe(const std::string& pattern) = 0;
    virtual void set_handler(MessageHandler handler) = 0;
    virtual void disconnect() = 0;
    [[nodiscard]] virtual bool connected() const = 0;
};

// ─── RetryPolicy ──────────────────────────────────────────────────────────────

struct RetryPolicy {
    unsigned                  max_attempts    = constants::DEFAULT_CONNECT_ATTEMPTS;
    std::chrono::milliseconds initial_backoff{100};
    std::chrono::milliseconds max_backoff{5000};
    double                    multiplier      = 2.0;

    /// Wait after failed attempt `attempt` (0-based), capped at max_backoff.
    [[nodiscard]] std::chrono::milliseconds backoff_for(unsigned attempt) const noexcept;

    [[nodiscard]] static RetryPolicy from(const config::TransportConfig& cfg) noexcept;
};

// ─── SubscriptionManager ──────────────────────────────────────────────────────

class SubscriptionManager {
public:
    SubscriptionManager(Transport& transport, RetryPolicy policy,
                        monitor::PerformanceMonitor& monitor,
                        Sleeper sleep = thread_sleep);

    /// Connect, then subscribe to every pattern. Returns false as soon as
    /// one step exhausts its retry budget.
    bool establish(const std::vector<std::string>& patterns);

    bool connect_with_retry();
    bool subscribe_with_retry(const std::string& pattern);

private:
    template <typename Attempt>
    bool retry(std::string_view what, Attempt&& attempt);

    Transport&                   transport_;
    RetryPolicy                  policy_;
    monitor::PerformanceMonitor& monitor_;
    Sleeper                      sleep_;
};

// ─── LoopbackTransport ────────────────────────────────────────────────────────

/// In-process broker: publish() hands the message straight to the handler
/// when a subscription matches. Failure injection supports tests and the
/// CLI's simulation mode.
class LoopbackTransport final : public Transport {
public:
    bool connect() override;
    bool subscribe(const std::string& pattern) override;
    void set_handler(MessageHandler handler) override;
    void disconnect() override;
    [[nodiscard]] bool connected() const override;

    /// Deliver a message. Returns false if not connected or no
    /// subscription matches `topic`.
    bool publish(std::string_view topic, std::string_view payload);

    void fail_next_connects(unsigned n);
    void fail_next_subscribes(unsigned n);

    [[nodiscard]] std::vector<std::string> subscriptions() const;
    [[nodiscard]] std::size_t connect_calls() const;

private:
    mutable std::mutex       mutex_;
    MessageHandler           handler_;
    std::vector<std::string> patterns_;
    bool                     connected_         = false;
    unsigned                 failing_connects_   = 0;
    unsigned                 failing_subscribes_ = 0;
    std::size_t              connect_calls_      = 0;
};

/// Handler that submits every message to `coordinator`.
[[nodiscard]] MessageHandler make_ingest_handler(pipeline::PipelineCoordinator& coordinator);

}  // namespace aqs::transport
