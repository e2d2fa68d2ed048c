/// @file src/core/types.cpp
/// @brief String conversions for the shared enums.

#include "aqs/types.hpp"

#include <thread>

namespace aqs {

const char* to_string(Category c) noexcept {
    switch (c) {
        case Category::Flow:    return "flow";
        case Category::Quality: return "quality";
        case Category::Weather: return "weather";
    }
    return "unknown";
}

std::optional<Category> category_from_string(std::string_view s) noexcept {
    if (s == "flow")    return Category::Flow;
    if (s == "quality") return Category::Quality;
    if (s == "weather") return Category::Weather;
    return std::nullopt;
}

const char* to_string(Classification c) noexcept {
    switch (c) {
        case Classification::Normal:      return "normal";
        case Classification::Anomaly:     return "anomaly";
        case Classification::Quarantined: return "quarantined";
    }
    return "unknown";
}

const char* to_string(Severity s) noexcept {
    switch (s) {
        case Severity::None:     return "none";
        case Severity::Warning:  return "warning";
        case Severity::Critical: return "critical";
    }
    return "unknown";
}

const char* to_string(ErrorKind e) noexcept {
    switch (e) {
        case ErrorKind::Malformed:                 return "Malformed";
        case ErrorKind::InsufficientContext:       return "InsufficientContext";
        case ErrorKind::OutOfRange:                return "OutOfRange";
        case ErrorKind::OutOfOrder:                return "OutOfOrder";
        case ErrorKind::UnknownSensor:             return "UnknownSensor";
        case ErrorKind::BufferFull:                return "BufferFull";
        case ErrorKind::LowConfidenceWindow:       return "LowConfidenceWindow";
        case ErrorKind::DownstreamDeliveryFailure: return "DownstreamDeliveryFailure";
        case ErrorKind::ProcessingFailure:         return "ProcessingFailure";
        case ErrorKind::Connectivity:              return "Connectivity";
    }
    return "Unknown";
}

void thread_sleep(std::chrono::milliseconds d) {
    std::this_thread::sleep_for(d);
}

}  // namespace aqs
