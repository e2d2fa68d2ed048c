/// @file src/core/logging.cpp
/// @brief spdlog wiring: one dist_sink fanned out to stderr and an optional file.

#include "aqs/logging.hpp"

#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <optional>
#include <vector>

namespace aqs::logging {

namespace {

struct LoggingState {
    std::mutex mutex;
    std::shared_ptr<spdlog::sinks::dist_sink_mt> sink;
    spdlog::level::level_enum level = spdlog::level::info;
    std::string pattern = config::LoggingConfig{}.pattern;
};

LoggingState& state() {
    static LoggingState instance;
    return instance;
}

// Caller holds state().mutex.
std::shared_ptr<spdlog::sinks::dist_sink_mt> shared_sink(LoggingState& s) {
    if (!s.sink) {
        s.sink = std::make_shared<spdlog::sinks::dist_sink_mt>();
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_pattern(s.pattern);
        s.sink->add_sink(console);
    }
    return s.sink;
}

}  // anonymous namespace

// ─── configure ────────────────────────────────────────────────────────────────

void configure(const config::LoggingConfig& cfg) {
    std::optional<std::string> file_error;
    {
        auto& s = state();
        std::lock_guard<std::mutex> guard(s.mutex);

        s.level   = spdlog::level::from_str(cfg.level);
        s.pattern = cfg.pattern;

        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (cfg.file) {
            try {
                sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    *cfg.file, cfg.max_file_bytes, cfg.max_files));
            } catch (const spdlog::spdlog_ex& ex) {
                file_error = ex.what();
            }
        }
        for (auto& sink : sinks) {
            sink->set_pattern(s.pattern);
        }

        shared_sink(s)->set_sinks(std::move(sinks));
        spdlog::set_level(s.level);
    }

    if (file_error) {
        get("logging")->error("cannot open log file '{}': {} (console only)",
                              cfg.file.value_or(""), *file_error);
    }
}

// ─── get ──────────────────────────────────────────────────────────────────────

std::shared_ptr<spdlog::logger> get(const std::string& name) {
    auto& s = state();
    std::lock_guard<std::mutex> guard(s.mutex);

    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    auto logger = std::make_shared<spdlog::logger>(name, shared_sink(s));
    logger->set_level(s.level);
    spdlog::register_logger(logger);
    return logger;
}

}  // namespace aqs::logging
