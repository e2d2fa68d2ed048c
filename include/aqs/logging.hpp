#pragma once

/// @file include/aqs/logging.hpp
/// @brief Named spdlog loggers shared by every pipeline component.
///
/// All loggers write through one distributing sink, so a later call to
/// configure() re-targets loggers that components already hold.

#include "aqs/config.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace aqs::logging {

/// Apply level, pattern and optional rotating file output.
void configure(const config::LoggingConfig& cfg);

/// Fetch (or lazily create) the logger for a component.
[[nodiscard]] std::shared_ptr<spdlog::logger> get(const std::string& name);

}  // namespace aqs::logging
