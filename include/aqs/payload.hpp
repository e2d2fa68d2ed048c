#pragma once

/// @file include/aqs/payload.hpp
/// @brief PayloadParser — transport bytes → RawReading.
///
/// # Module: Payload Parser
///
/// ## Responsibility
/// Turn a `(topic, payload)` pair delivered by the transport into an
/// untrusted RawReading. The parser recovers what it can and records
/// what it cannot; judging the reading is the validator's job.
///
/// ## Payload Format
/// ```json
/// {"sensor_id": "water_meter_001",
///  "timestamp": "2025-02-07T10:00:00.250Z",
///  "value": 51.2,
///  "quality_score": 0.93,
///  "metadata": {"site": "north"},
///  "type": "normal"}
/// ```
/// - `timestamp`: ISO-8601 UTC string or epoch seconds
/// - `value`: number; `null` or absent means "missing"; anything else is
///   recorded as malformed
/// - `category`: optional, overrides the topic-derived category
///
/// ## Guarantees
/// - parse() never throws and accepts arbitrary bytes
/// - Non-JSON input yields a RawReading with `parse_error` set

#include "aqs/config.hpp"
#include "aqs/types.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace aqs::ingest {

// ─── Topic helpers ────────────────────────────────────────────────────────────

/// MQTT-style topic filter match.
///
/// `+` matches exactly one level, `#` (last level only) matches zero or
/// more trailing levels. `sensors/#` matches `sensors` and `sensors/a/b`.
[[nodiscard]] bool topic_matches(std::string_view pattern, std::string_view topic) noexcept;

/// First rule whose pattern matches `topic`, if any.
[[nodiscard]] std::optional<Category>
category_for_topic(std::string_view topic,
                   std::span<const config::TopicRule> rules) noexcept;

// ─── Timestamp helpers ────────────────────────────────────────────────────────

/// Parse `YYYY-MM-DDTHH:MM:SS[.fff][Z|±HH:MM]` into epoch seconds.
/// A missing zone designator is read as UTC.
[[nodiscard]] std::optional<double> parse_iso8601(std::string_view text) noexcept;

/// Format epoch seconds as `YYYY-MM-DDTHH:MM:SS.mmmZ`.
[[nodiscard]] std::string format_iso8601(double epoch_seconds);

/// Wall clock now, seconds since the Unix epoch.
[[nodiscard]] double wall_now() noexcept;

// ─── PayloadParser ────────────────────────────────────────────────────────────

class PayloadParser {
public:
    explicit PayloadParser(std::vector<config::TopicRule> rules =
                               config::TransportConfig{}.topic_categories);

    /// Parse one transport message. Receipt times are stamped here.
    [[nodiscard]] RawReading parse(std::string_view topic,
                                   std::string_view payload) const noexcept;

private:
    std::vector<config::TopicRule> rules_;
};

// ─── Serialisation ────────────────────────────────────────────────────────────

/// One JSON line describing a delivered (reading, verdict) pair.
[[nodiscard]] std::string to_json_line(const CleanedReading& reading,
                                       const AnomalyVerdict& verdict);

}  // namespace aqs::ingest
