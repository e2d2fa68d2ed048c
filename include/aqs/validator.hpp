#pragma once

/// @file include/aqs/validator.hpp
/// @brief ReadingValidator — RawReading → CleanedReading | Rejected.
///
/// # Module: Reading Validator
///
/// ## Responsibility
/// Decide whether an untrusted RawReading may enter the pipeline, and
/// repair it where that is possible.
///
/// ## Checks (in order)
/// 1. Structure: parse error, sensor id present / well-formed /
///    allow-listed, category known, timestamp present and finite, value
///    numeric when present
/// 2. Ordering: a timestamp more than `max_future_skew_s` ahead of the
///    receipt time is rejected as OutOfOrder (an unknown receipt time,
///    `received_wall == 0`, skips this check). A timestamp older than the
///    stream's newest sample is clamped when within `lateness_tolerance_s`,
///    rejected otherwise
/// 3. Missing value: linear interpolation in source time from the two
///    newest samples of the stream's window
/// 4. Physical range of the category
///
/// ## Guarantees
/// - A valid, in-order, in-range reading passes through with identical
///   value and timestamp
/// - An accepted reading always has a finite in-range value
/// - Never throws on bad input; every rejection carries an ErrorKind

#include "aqs/config.hpp"
#include "aqs/types.hpp"
#include "aqs/window_stats.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace aqs::validation {

/// What the validator needs to know about the reading's stream.
struct StreamContext {
    std::optional<std::array<stats::Sample, 2>> last_two;
    std::optional<double> last_time;

    [[nodiscard]] static StreamContext of(const stats::RollingWindow& window) noexcept;
};

/// Outcome of validating one reading.
struct ValidationResult {
    std::optional<CleanedReading> reading;
    ErrorKind   reason = ErrorKind::Malformed;  ///< Meaningful only when rejected
    std::string detail;

    [[nodiscard]] bool accepted() const noexcept { return reading.has_value(); }
    [[nodiscard]] bool rejected() const noexcept { return !reading.has_value(); }

    [[nodiscard]] static ValidationResult accept(CleanedReading r);
    [[nodiscard]] static ValidationResult reject(ErrorKind kind, std::string why);
};

/// A structural problem found by validate_structure().
struct StructuralError {
    ErrorKind   kind;
    std::string detail;
};

/// `[A-Za-z0-9_.-]{1,64}`
[[nodiscard]] bool is_well_formed_sensor_id(std::string_view id) noexcept;

class ReadingValidator {
public:
    explicit ReadingValidator(config::ValidatorConfig cfg = {},
                              double interpolation_confidence =
                                  constants::DEFAULT_INTERPOLATION_CONFIDENCE);

    /// Context-free checks only.
    [[nodiscard]] std::optional<StructuralError> validate_structure(const RawReading& raw) const;

    /// Full validation against the stream's current window.
    [[nodiscard]] ValidationResult validate(const RawReading& raw,
                                            const StreamContext& ctx = {}) const;

    /// True if `id` is allowed by the configured sensor allow-list.
    [[nodiscard]] bool is_known_sensor(std::string_view id) const noexcept;

    [[nodiscard]] const config::ValidatorConfig& config() const noexcept { return cfg_; }

private:
    config::ValidatorConfig cfg_;
    double interpolation_confidence_;
};

}  // namespace aqs::validation
