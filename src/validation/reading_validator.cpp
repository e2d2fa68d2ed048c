/// @file src/validation/reading_validator.cpp
/// @brief ReadingValidator — structural, ordering, interpolation and range checks.

#include "aqs/validator.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace aqs::validation {

// ─── StreamContext / ValidationResult ─────────────────────────────────────────

StreamContext StreamContext::of(const stats::RollingWindow& window) noexcept {
    return StreamContext{window.last_two(), window.last_time()};
}

ValidationResult ValidationResult::accept(CleanedReading r) {
    ValidationResult out;
    out.reading = std::move(r);
    return out;
}

ValidationResult ValidationResult::reject(ErrorKind kind, std::string why) {
    ValidationResult out;
    out.reason = kind;
    out.detail = std::move(why);
    return out;
}

// ─── Sensor ids ───────────────────────────────────────────────────────────────

bool is_well_formed_sensor_id(std::string_view id) noexcept {
    if (id.empty() || id.size() > 64) {
        return false;
    }
    return std::all_of(id.begin(), id.end(), [](char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
               (c >= '0' && c <= '9') || c == '_' || c == '.' || c == '-';
    });
}

// ─── ReadingValidator ─────────────────────────────────────────────────────────

ReadingValidator::ReadingValidator(config::ValidatorConfig cfg,
                                   double interpolation_confidence)
    : cfg_(std::move(cfg)),
      interpolation_confidence_(std::clamp(interpolation_confidence, 0.0, 1.0)) {}

bool ReadingValidator::is_known_sensor(std::string_view id) const noexcept {
    if (cfg_.sensor_id.empty() && cfg_.known_sensors.empty()) {
        return true;
    }
    if (id == cfg_.sensor_id) {
        return true;
    }
    return std::find(cfg_.known_sensors.begin(), cfg_.known_sensors.end(), id) !=
           cfg_.known_sensors.end();
}

std::optional<StructuralError>
ReadingValidator::validate_structure(const RawReading& raw) const {
    if (raw.parse_error) {
        return StructuralError{ErrorKind::Malformed, *raw.parse_error};
    }
    if (!raw.sensor_id || raw.sensor_id->empty()) {
        return StructuralError{ErrorKind::Malformed, "missing sensor_id"};
    }
    if (!is_well_formed_sensor_id(*raw.sensor_id)) {
        return StructuralError{ErrorKind::Malformed,
                               fmt::format("malformed sensor_id '{}'", *raw.sensor_id)};
    }
    if (!is_known_sensor(*raw.sensor_id)) {
        return StructuralError{ErrorKind::UnknownSensor,
                               fmt::format("sensor '{}' is not configured", *raw.sensor_id)};
    }
    if (!raw.category) {
        return StructuralError{ErrorKind::Malformed,
                               fmt::format("no category for topic '{}'", raw.topic)};
    }
    if (!raw.wall_time || !std::isfinite(*raw.wall_time)) {
        return StructuralError{ErrorKind::Malformed, "timestamp missing or unparseable"};
    }
    if (raw.value_malformed) {
        return StructuralError{ErrorKind::Malformed, "value is not numeric"};
    }
    if (raw.value && !std::isfinite(*raw.value)) {
        return StructuralError{ErrorKind::Malformed, "value is not finite"};
    }
    return std::nullopt;
}

ValidationResult ReadingValidator::validate(const RawReading& raw,
                                            const StreamContext& ctx) const {
    if (auto err = validate_structure(raw)) {
        return ValidationResult::reject(err->kind, std::move(err->detail));
    }

    const Category category = *raw.category;
    const config::PhysicalRange& range = cfg_.range_for(category);

    // Ordering: clamp within tolerance, reject beyond it.
    double wall = *raw.wall_time;
    bool   late = false;
    if (raw.received_wall > 0.0 && wall > raw.received_wall + cfg_.max_future_skew_s) {
        return ValidationResult::reject(
            ErrorKind::OutOfOrder,
            fmt::format("reading is {:.3f}s ahead of its receipt time (limit {:.3f}s)",
                        wall - raw.received_wall, cfg_.max_future_skew_s));
    }
    if (ctx.last_time && wall < *ctx.last_time) {
        const double lag = *ctx.last_time - wall;
        if (lag > cfg_.lateness_tolerance_s) {
            return ValidationResult::reject(
                ErrorKind::OutOfOrder,
                fmt::format("reading is {:.3f}s behind the stream (tolerance {:.3f}s)",
                            lag, cfg_.lateness_tolerance_s));
        }
        wall = *ctx.last_time;
        late = true;
    }

    double value        = 0.0;
    bool   interpolated = false;
    if (raw.value) {
        value = *raw.value;
        if (!range.contains(value)) {
            return ValidationResult::reject(
                ErrorKind::OutOfRange,
                fmt::format("{} value {} outside [{}, {}]",
                            to_string(category), value, range.min, range.max));
        }
    } else {
        if (!ctx.last_two) {
            return ValidationResult::reject(ErrorKind::InsufficientContext,
                                            "missing value and fewer than two prior samples");
        }
        const stats::Sample& a = (*ctx.last_two)[0];
        const stats::Sample& b = (*ctx.last_two)[1];
        const double span = b.time - a.time;
        value = (span > 0.0) ? a.value + (b.value - a.value) * (wall - a.time) / span
                             : b.value;
        if (!std::isfinite(value)) {
            return ValidationResult::reject(ErrorKind::InsufficientContext,
                                            "interpolation produced a non-finite value");
        }
        // Extrapolation may leave the physical range; keep the estimate inside it.
        value        = std::clamp(value, range.min, range.max);
        interpolated = true;
    }

    double reported = raw.reported_quality.value_or(1.0);
    reported = std::isfinite(reported) ? std::clamp(reported, 0.0, 1.0) : 0.0;

    CleanedReading out;
    out.sequence         = raw.sequence;
    out.sensor_id        = *raw.sensor_id;
    out.category         = category;
    out.timestamp        = Timestamp{raw.received, wall};
    out.value            = value;
    out.reported_quality = reported;
    out.confidence       = interpolated ? interpolation_confidence_ : 1.0;
    out.interpolated     = interpolated;
    out.late             = late;
    out.received_wall    = raw.received_wall;
    out.metadata         = raw.metadata;
    return ValidationResult::accept(std::move(out));
}

}  // namespace aqs::validation
