/// @file src/core/config.cpp
/// @brief PipelineConfig JSON loading and consistency checks.

#include "aqs/config.hpp"
#include "aqs/logging.hpp"

#include <nlohmann/json.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <type_traits>

namespace aqs::config {

using nlohmann::json;

// ─── Internal helpers ─────────────────────────────────────────────────────────

namespace {

/// Overwrite `out` with j[key] when the key is present. Throws json::type_error
/// on a type mismatch, and std::invalid_argument when an unsigned field holds
/// anything but a non-negative integer; from_json rejects the document on both.
template <typename T>
void read(const json& j, const char* key, T& out) {
    if (auto it = j.find(key); it != j.end() && !it->is_null()) {
        if constexpr (std::is_unsigned_v<T> && !std::is_same_v<T, bool>) {
            if (!it->is_number_unsigned()) {
                throw std::invalid_argument(
                    fmt::format("'{}' must be a non-negative integer, got {}", key, it->dump()));
            }
        }
        out = it->get<T>();
    }
}

/// Top-level keys from_json understands. Anything else is logged and ignored.
constexpr std::array<std::string_view, 39> kRecognisedKeys{
    "sensor_id", "known_sensors", "lateness_tolerance_s", "max_future_skew_s",
    "physical_ranges", "window_size", "min_samples_for_confidence",
    "stream_idle_timeout_s", "z_score_threshold", "quality_threshold",
    "interpolation_confidence", "staleness_horizon_s", "staleness_decay_s",
    "buffer_capacity", "enqueue_wait_ms", "backpressure", "monitor_window_s",
    "latency_target_ms", "latency_p95_target_ms", "latency_alert_ms",
    "error_rate_target", "error_rate_warning", "error_rate_critical",
    "buffer_warning_pct", "buffer_critical_pct", "alert_cooldown_s",
    "report_interval_s", "monitor_max_samples", "delivery_attempts",
    "delivery_backoff_ms", "audit_capacity", "worker_count", "drain_timeout_ms",
    "subscriptions", "connect_attempts", "connect_backoff_ms",
    "connect_backoff_max_ms", "topic_categories", "logging",
};

constexpr std::array<std::string_view, 5> kRecognisedLoggingKeys{
    "level", "pattern", "file", "max_file_bytes", "max_files",
};

template <std::size_t N>
void log_unrecognised(const json& j, const std::array<std::string_view, N>& known,
                      std::string_view scope) {
    for (const auto& item : j.items()) {
        const std::string_view key = item.key();
        if (std::find(known.begin(), known.end(), key) == known.end()) {
            logging::get("config")->debug("ignoring unrecognised key '{}{}'", scope, key);
        }
    }
}

std::optional<BackpressurePolicy> policy_from_string(const std::string& s) noexcept {
    if (s == "drop") return BackpressurePolicy::Drop;
    if (s == "wait") return BackpressurePolicy::Wait;
    return std::nullopt;
}

void read_range(const json& ranges, const char* key, PhysicalRange& out) {
    if (auto it = ranges.find(key); it != ranges.end()) {
        read(*it, "min", out.min);
        read(*it, "max", out.max);
    }
}

}  // anonymous namespace

// ─── ValidatorConfig / BackpressurePolicy ─────────────────────────────────────

const PhysicalRange& ValidatorConfig::range_for(Category c) const noexcept {
    switch (c) {
        case Category::Flow:    return flow_range;
        case Category::Quality: return quality_range;
        case Category::Weather: return weather_range;
    }
    return flow_range;
}

const char* to_string(BackpressurePolicy p) noexcept {
    switch (p) {
        case BackpressurePolicy::Drop: return "drop";
        case BackpressurePolicy::Wait: return "wait";
    }
    return "unknown";
}

// ─── check ────────────────────────────────────────────────────────────────────

std::optional<std::string> check(const PipelineConfig& cfg) {
    if (cfg.window.window_size < 1)   return "window_size must be >= 1";
    if (cfg.buffer.capacity < 1)      return "buffer_capacity must be >= 1";
    if (cfg.worker_count < 1)         return "worker_count must be >= 1";
    if (cfg.window.window_size > constants::MAX_WINDOW_SIZE) {
        return fmt::format("window_size must be <= {}", constants::MAX_WINDOW_SIZE);
    }
    if (cfg.buffer.capacity > constants::MAX_BUFFER_CAPACITY) {
        return fmt::format("buffer_capacity must be <= {}", constants::MAX_BUFFER_CAPACITY);
    }
    if (cfg.worker_count > constants::MAX_WORKER_COUNT) {
        return fmt::format("worker_count must be <= {}", constants::MAX_WORKER_COUNT);
    }
    if (cfg.delivery.audit_capacity > constants::MAX_AUDIT_CAPACITY) {
        return fmt::format("audit_capacity must be <= {}", constants::MAX_AUDIT_CAPACITY);
    }
    if (!(cfg.detector.z_score_threshold > 0.0)) {
        return "z_score_threshold must be > 0";
    }
    if (!(cfg.detector.quality_threshold >= 0.0 && cfg.detector.quality_threshold <= 1.0)) {
        return "quality_threshold must lie in [0, 1]";
    }
    if (!(cfg.detector.interpolation_confidence >= 0.0 &&
          cfg.detector.interpolation_confidence <= 1.0)) {
        return "interpolation_confidence must lie in [0, 1]";
    }
    if (cfg.detector.staleness_decay_s <= 0.0) return "staleness_decay_s must be > 0";
    if (cfg.validator.lateness_tolerance_s < 0.0) return "lateness_tolerance_s must be >= 0";
    if (!(cfg.validator.max_future_skew_s >= 0.0)) return "max_future_skew_s must be >= 0";

    for (auto c : {Category::Flow, Category::Quality, Category::Weather}) {
        const auto& r = cfg.validator.range_for(c);
        if (!std::isfinite(r.min) || !std::isfinite(r.max) || r.min > r.max) {
            return std::string("invalid physical range for ") + to_string(c);
        }
    }

    const auto& m = cfg.monitor;
    if (m.window_s <= 0.0) return "monitor_window_s must be > 0";
    if (m.report_interval_s <= 0.0) return "report_interval_s must be > 0";
    if (m.max_samples < 1 || m.max_samples > constants::MAX_MONITOR_MAX_SAMPLES) {
        return fmt::format("monitor_max_samples must lie in [1, {}]",
                           constants::MAX_MONITOR_MAX_SAMPLES);
    }
    if (!(m.latency_p95_target_ms <= m.latency_alert_ms)) {
        return "latency_p95_target_ms must not exceed latency_alert_ms";
    }
    if (!(m.error_rate_warning <= m.error_rate_critical)) {
        return "error_rate_warning must not exceed error_rate_critical";
    }
    if (!(m.buffer_warning_pct <= m.buffer_critical_pct)) {
        return "buffer_warning_pct must not exceed buffer_critical_pct";
    }
    if (cfg.delivery.attempts < 1)            return "delivery_attempts must be >= 1";
    if (cfg.transport.connect_attempts < 1)   return "connect_attempts must be >= 1";
    if (cfg.drain_timeout_ms < 0.0)           return "drain_timeout_ms must be >= 0";
    return std::nullopt;
}

// ─── from_json ────────────────────────────────────────────────────────────────

std::optional<PipelineConfig> from_json(const json& j) noexcept {
    auto log = logging::get("config");
    if (!j.is_object()) {
        log->error("configuration root must be a JSON object");
        return std::nullopt;
    }

    PipelineConfig cfg;
    try {
        // Validation
        read(j, "sensor_id", cfg.validator.sensor_id);
        read(j, "known_sensors", cfg.validator.known_sensors);
        read(j, "lateness_tolerance_s", cfg.validator.lateness_tolerance_s);
        read(j, "max_future_skew_s", cfg.validator.max_future_skew_s);
        if (auto it = j.find("physical_ranges"); it != j.end()) {
            read_range(*it, "flow",    cfg.validator.flow_range);
            read_range(*it, "quality", cfg.validator.quality_range);
            read_range(*it, "weather", cfg.validator.weather_range);
        }

        // Statistics / detection
        read(j, "window_size", cfg.window.window_size);
        read(j, "min_samples_for_confidence", cfg.window.min_samples_for_confidence);
        read(j, "stream_idle_timeout_s", cfg.window.stream_idle_timeout_s);
        read(j, "z_score_threshold", cfg.detector.z_score_threshold);
        read(j, "quality_threshold", cfg.detector.quality_threshold);
        read(j, "interpolation_confidence", cfg.detector.interpolation_confidence);
        read(j, "staleness_horizon_s", cfg.detector.staleness_horizon_s);
        read(j, "staleness_decay_s", cfg.detector.staleness_decay_s);

        // Ingestion
        read(j, "buffer_capacity", cfg.buffer.capacity);
        read(j, "enqueue_wait_ms", cfg.buffer.enqueue_wait_ms);
        if (auto it = j.find("backpressure"); it != j.end()) {
            auto policy = policy_from_string(it->get<std::string>());
            if (!policy) {
                log->error("unknown backpressure policy '{}'", it->get<std::string>());
                return std::nullopt;
            }
            cfg.buffer.backpressure = *policy;
        }

        // Monitoring
        read(j, "monitor_window_s", cfg.monitor.window_s);
        read(j, "latency_target_ms", cfg.monitor.latency_target_ms);
        read(j, "latency_p95_target_ms", cfg.monitor.latency_p95_target_ms);
        read(j, "latency_alert_ms", cfg.monitor.latency_alert_ms);
        read(j, "error_rate_target", cfg.monitor.error_rate_target);
        read(j, "error_rate_warning", cfg.monitor.error_rate_warning);
        read(j, "error_rate_critical", cfg.monitor.error_rate_critical);
        read(j, "buffer_warning_pct", cfg.monitor.buffer_warning_pct);
        read(j, "buffer_critical_pct", cfg.monitor.buffer_critical_pct);
        read(j, "alert_cooldown_s", cfg.monitor.alert_cooldown_s);
        read(j, "report_interval_s", cfg.monitor.report_interval_s);
        read(j, "monitor_max_samples", cfg.monitor.max_samples);

        // Delivery / coordinator
        read(j, "delivery_attempts", cfg.delivery.attempts);
        read(j, "delivery_backoff_ms", cfg.delivery.backoff_ms);
        read(j, "audit_capacity", cfg.delivery.audit_capacity);
        read(j, "worker_count", cfg.worker_count);
        read(j, "drain_timeout_ms", cfg.drain_timeout_ms);

        // Transport
        read(j, "subscriptions", cfg.transport.subscriptions);
        read(j, "connect_attempts", cfg.transport.connect_attempts);
        read(j, "connect_backoff_ms", cfg.transport.connect_backoff_ms);
        read(j, "connect_backoff_max_ms", cfg.transport.connect_backoff_max_ms);
        if (auto it = j.find("topic_categories"); it != j.end()) {
            std::vector<TopicRule> rules;
            for (const auto& entry : *it) {
                const auto name = entry.at("category").get<std::string>();
                auto category = category_from_string(name);
                if (!category) {
                    log->error("unknown category '{}' in topic_categories", name);
                    return std::nullopt;
                }
                rules.push_back(TopicRule{entry.at("pattern").get<std::string>(), *category});
            }
            cfg.transport.topic_categories = std::move(rules);
        }

        // Logging
        if (auto it = j.find("logging"); it != j.end()) {
            read(*it, "level", cfg.logging.level);
            read(*it, "pattern", cfg.logging.pattern);
            read(*it, "max_file_bytes", cfg.logging.max_file_bytes);
            read(*it, "max_files", cfg.logging.max_files);
            if (auto f = it->find("file"); f != it->end() && !f->is_null()) {
                cfg.logging.file = f->get<std::string>();
            }
        }
    } catch (const json::exception& ex) {
        log->error("invalid configuration: {}", ex.what());
        return std::nullopt;
    } catch (const std::invalid_argument& ex) {
        log->error("invalid configuration: {}", ex.what());
        return std::nullopt;
    }

    if (auto problem = check(cfg)) {
        log->error("invalid configuration: {}", *problem);
        return std::nullopt;
    }

    log_unrecognised(j, kRecognisedKeys, "");
    if (auto it = j.find("logging"); it != j.end() && it->is_object()) {
        log_unrecognised(*it, kRecognisedLoggingKeys, "logging.");
    }
    if (cfg.detector.interpolation_confidence < cfg.detector.quality_threshold) {
        log->warn("interpolation_confidence {} is below quality_threshold {}; "
                  "interpolated readings will always be quarantined",
                  cfg.detector.interpolation_confidence, cfg.detector.quality_threshold);
    }
    return cfg;
}

// ─── parse_string / load_file ─────────────────────────────────────────────────

std::optional<PipelineConfig> parse_string(const std::string& text) noexcept {
    const json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        logging::get("config")->error("configuration is not valid JSON");
        return std::nullopt;
    }
    return from_json(j);
}

std::optional<PipelineConfig> load_file(const std::string& path) noexcept {
    std::ifstream file(path);
    if (!file.is_open()) {
        logging::get("config")->error("cannot open configuration file '{}'", path);
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    auto cfg = parse_string(contents.str());
    if (cfg) {
        logging::get("config")->info("loaded configuration from '{}'", path);
    }
    return cfg;
}

// ─── to_json ──────────────────────────────────────────────────────────────────

json to_json(const PipelineConfig& cfg) {
    json rules = json::array();
    for (const auto& rule : cfg.transport.topic_categories) {
        rules.push_back({{"pattern", rule.pattern}, {"category", to_string(rule.category)}});
    }
    auto range = [](const PhysicalRange& r) { return json{{"min", r.min}, {"max", r.max}}; };

    json j = {
        {"sensor_id", cfg.validator.sensor_id},
        {"known_sensors", cfg.validator.known_sensors},
        {"lateness_tolerance_s", cfg.validator.lateness_tolerance_s},
        {"max_future_skew_s", cfg.validator.max_future_skew_s},
        {"physical_ranges", {
            {"flow", range(cfg.validator.flow_range)},
            {"quality", range(cfg.validator.quality_range)},
            {"weather", range(cfg.validator.weather_range)},
        }},
        {"window_size", cfg.window.window_size},
        {"min_samples_for_confidence", cfg.window.min_samples_for_confidence},
        {"stream_idle_timeout_s", cfg.window.stream_idle_timeout_s},
        {"z_score_threshold", cfg.detector.z_score_threshold},
        {"quality_threshold", cfg.detector.quality_threshold},
        {"interpolation_confidence", cfg.detector.interpolation_confidence},
        {"staleness_horizon_s", cfg.detector.staleness_horizon_s},
        {"staleness_decay_s", cfg.detector.staleness_decay_s},
        {"buffer_capacity", cfg.buffer.capacity},
        {"backpressure", to_string(cfg.buffer.backpressure)},
        {"enqueue_wait_ms", cfg.buffer.enqueue_wait_ms},
        {"monitor_window_s", cfg.monitor.window_s},
        {"latency_target_ms", cfg.monitor.latency_target_ms},
        {"latency_p95_target_ms", cfg.monitor.latency_p95_target_ms},
        {"latency_alert_ms", cfg.monitor.latency_alert_ms},
        {"error_rate_target", cfg.monitor.error_rate_target},
        {"error_rate_warning", cfg.monitor.error_rate_warning},
        {"error_rate_critical", cfg.monitor.error_rate_critical},
        {"buffer_warning_pct", cfg.monitor.buffer_warning_pct},
        {"buffer_critical_pct", cfg.monitor.buffer_critical_pct},
        {"alert_cooldown_s", cfg.monitor.alert_cooldown_s},
        {"report_interval_s", cfg.monitor.report_interval_s},
        {"monitor_max_samples", cfg.monitor.max_samples},
        {"delivery_attempts", cfg.delivery.attempts},
        {"delivery_backoff_ms", cfg.delivery.backoff_ms},
        {"audit_capacity", cfg.delivery.audit_capacity},
        {"worker_count", cfg.worker_count},
        {"drain_timeout_ms", cfg.drain_timeout_ms},
        {"subscriptions", cfg.transport.subscriptions},
        {"topic_categories", rules},
        {"connect_attempts", cfg.transport.connect_attempts},
        {"connect_backoff_ms", cfg.transport.connect_backoff_ms},
        {"connect_backoff_max_ms", cfg.transport.connect_backoff_max_ms},
        {"logging", {
            {"level", cfg.logging.level},
            {"pattern", cfg.logging.pattern},
            {"max_file_bytes", cfg.logging.max_file_bytes},
            {"max_files", cfg.logging.max_files},
        }},
    };
    if (cfg.logging.file) {
        j["logging"]["file"] = *cfg.logging.file;
    }
    return j;
}

}  // namespace aqs::config
