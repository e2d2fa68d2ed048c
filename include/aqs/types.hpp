#pragma once

/// @file include/aqs/types.hpp
/// @brief Shared value types for the AquaStream telemetry pipeline.
///
/// Every pipeline module includes this file. It defines the reading types
/// that flow between stages, the verdict emitted by the anomaly detector,
/// and the error / outcome vocabularies shared by the monitor and the
/// coordinator.
///
/// Lifecycle of a reading:
///   RawReading (untrusted) → CleanedReading (validated) → AnomalyVerdict
///
/// A RawReading carries no invariants. A CleanedReading always holds a
/// finite value inside the physical range of its category and a timestamp
/// that is non-decreasing within its sensor stream.

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace aqs {

using SteadyClock = std::chrono::steady_clock;
using SteadyTime  = SteadyClock::time_point;

/// Milliseconds as a floating-point duration (latency bookkeeping).
using Millis = std::chrono::duration<double, std::milli>;

/// Blocking wait used by retry loops. Tests inject a recording no-op.
using Sleeper = std::function<void(std::chrono::milliseconds)>;

/// std::this_thread::sleep_for.
void thread_sleep(std::chrono::milliseconds d);

// ─── Category ─────────────────────────────────────────────────────────────────

/// Telemetry family a reading belongs to. Determines its physical range.
enum class Category {
    Flow,     ///< Water flow rate
    Quality,  ///< Water quality probe (turbidity, chlorine, …)
    Weather,  ///< Weather station channel
};

[[nodiscard]] const char* to_string(Category c) noexcept;

/// Parse "flow" / "quality" / "weather" (case-sensitive).
[[nodiscard]] std::optional<Category> category_from_string(std::string_view s) noexcept;

// ─── Timestamps ───────────────────────────────────────────────────────────────

/// Dual timestamp attached to every accepted reading.
struct Timestamp {
    SteadyTime monotonic;  ///< Local receipt time on the steady clock
    double     wall;       ///< Source wall clock, seconds since the Unix epoch
};

// ─── RawReading ───────────────────────────────────────────────────────────────

/// A reading exactly as recovered from a transport payload.
///
/// Every field that comes from the payload is optional: the parser records
/// what it could recover and leaves the judgement to the validator.
struct RawReading {
    std::uint64_t sequence = 0;                   ///< Assigned at enqueue
    std::string   topic;                          ///< Transport topic
    std::optional<std::string> sensor_id;         ///< Payload "sensor_id"
    std::optional<Category>    category;          ///< From topic or payload
    std::optional<double>      wall_time;         ///< Parsed source timestamp
    std::optional<double>      value;             ///< Numeric value if present
    bool                       value_malformed = false; ///< Present but not a number
    std::optional<double>      reported_quality;  ///< Sensor self-reported quality
    std::map<std::string, std::string> metadata;  ///< Free-form metadata
    std::optional<std::string> parse_error;       ///< Set when structure is unusable
    SteadyTime received{};                        ///< Local receipt (steady)
    double     received_wall = 0.0;               ///< Local receipt (wall)
};

// ─── CleanedReading ───────────────────────────────────────────────────────────

/// A reading that passed validation (possibly repaired by interpolation).
struct CleanedReading {
    std::uint64_t sequence = 0;
    std::string   sensor_id;
    Category      category = Category::Flow;
    Timestamp     timestamp{};
    double        value = 0.0;
    double        reported_quality = 1.0;  ///< Sensor self-reported, in [0, 1]
    double        confidence = 1.0;        ///< Validator confidence, in [0, 1]
    bool          interpolated = false;    ///< Value reconstructed from the window
    bool          late = false;            ///< Timestamp clamped within tolerance
    double        received_wall = 0.0;
    std::map<std::string, std::string> metadata;
};

// ─── Anomaly verdict ──────────────────────────────────────────────────────────

enum class Classification {
    Normal,
    Anomaly,
    Quarantined,  ///< Excluded from statistics and downstream optimisation
};

enum class Severity {
    None,
    Warning,
    Critical,
};

[[nodiscard]] const char* to_string(Classification c) noexcept;
[[nodiscard]] const char* to_string(Severity s) noexcept;

/// Result of classifying one cleaned reading. Never mutated after emission.
struct AnomalyVerdict {
    std::uint64_t  sequence = 0;       ///< Reference to the classified reading
    std::string    sensor_id;
    double         z_score = 0.0;
    double         quality_score = 1.0;
    Classification classification = Classification::Normal;
    Severity       severity = Severity::None;
    bool           low_confidence = false;  ///< Window below minimum sample count
};

// ─── Error taxonomy ───────────────────────────────────────────────────────────

enum class ErrorKind {
    Malformed,                  ///< Unparseable payload / missing required field
    InsufficientContext,        ///< Missing value with no interpolation context
    OutOfRange,                 ///< Value violates physical bounds
    OutOfOrder,                 ///< Older than the lateness tolerance
    UnknownSensor,              ///< Sensor id well-formed but not allow-listed
    BufferFull,                 ///< Backpressure condition
    LowConfidenceWindow,        ///< Advisory only
    DownstreamDeliveryFailure,  ///< Collaborator unreachable
    ProcessingFailure,          ///< Exception escaped a processing step
    Connectivity,               ///< Transport retry budget exhausted
};

[[nodiscard]] const char* to_string(ErrorKind e) noexcept;

}  // namespace aqs
