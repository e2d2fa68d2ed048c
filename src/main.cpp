/// @file src/main.cpp
/// @brief AquaStream CLI entry point.
///
/// Usage:
///   aqs [--config <file>] --stream              Read "<topic> <json>" lines from stdin
///   aqs [--config <file>] --simulate <seconds>  Run the synthetic load generator
///   aqs --help                                  Print usage

#include "aqs/config.hpp"
#include "aqs/load_generator.hpp"
#include "aqs/logging.hpp"
#include "aqs/payload.hpp"
#include "aqs/pipeline.hpp"
#include "aqs/transport.hpp"

#include <fmt/core.h>

#include <charconv>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  aqs [options] --stream              Read telemetry from stdin\n"
        "  aqs [options] --simulate <seconds>  Drive the pipeline with synthetic load\n"
        "  aqs --help                          Show this help\n"
        "\n"
        "Options:\n"
        "  --config <file>   JSON configuration file\n"
        "  --rate <n>        Simulation draws per second (default 10)\n"
        "  --seed <n>        Simulation seed (default 42)\n"
        "\n"
        "Stream format (one message per line):\n"
        "  <topic> <json-payload>\n"
        "  sensor/water_meter_001/data {{\"sensor_id\":\"water_meter_001\",\"value\":51.2,...}}\n"
    );
}

/// Writes every delivered pair to stdout as one JSON line.
class ConsoleReadingSink final : public aqs::pipeline::ReadingSink {
public:
    std::string name() const override { return "console"; }

    bool deliver(const aqs::CleanedReading& reading,
                 const aqs::AnomalyVerdict& verdict) override {
        const std::string line = aqs::ingest::to_json_line(reading, verdict);
        std::lock_guard<std::mutex> lock(mutex_);
        fmt::print("{}\n", line);
        return true;
    }

private:
    std::mutex mutex_;
};

/// Writes alerts to stderr.
class ConsoleAlertSink final : public aqs::pipeline::AlertSink {
public:
    void publish(const aqs::monitor::Alert& alert) override {
        std::lock_guard<std::mutex> lock(mutex_);
        fmt::print(stderr, "ALERT {}\n", alert.to_string());
    }

private:
    std::mutex mutex_;
};

aqs::pipeline::Collaborators console_collaborators() {
    aqs::pipeline::Collaborators c;
    c.readings.push_back(std::make_shared<ConsoleReadingSink>());
    c.alerts.push_back(std::make_shared<ConsoleAlertSink>());
    return c;
}

template <typename T>
std::optional<T> parse_number(const std::string& text) {
    T value{};
    const auto* first = text.data();
    const auto* last  = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

/// Stop the pipeline and print the final metrics table.
void finish(aqs::pipeline::PipelineCoordinator& pipeline) {
    const bool drained = pipeline.stop();
    const auto alerts  = pipeline.check_alerts();
    if (!alerts.empty()) {
        fmt::print(stderr, "{} alert(s) raised at shutdown\n", alerts.size());
    }
    fmt::print(stderr, "{}", pipeline.metrics_snapshot().to_string());
    if (!drained) {
        fmt::print(stderr, "Warning: drain timeout, buffered readings were dropped\n");
    }
}

/// Read "<topic> <json>" lines from stdin into the pipeline.
int run_stream(const aqs::config::PipelineConfig& cfg) {
    aqs::pipeline::PipelineCoordinator pipeline(cfg, console_collaborators());
    pipeline.start();

    std::string line;
    std::size_t lines = 0;
    std::size_t refused = 0;
    while (std::getline(std::cin, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }
        const auto space = line.find(' ');
        if (space == std::string::npos) {
            fmt::print(stderr, "Skipping line without payload: {}\n", line);
            continue;
        }
        ++lines;
        const auto status = pipeline.submit(std::string_view(line).substr(0, space),
                                            std::string_view(line).substr(space + 1));
        if (status != aqs::ingest::EnqueueStatus::Accepted) {
            ++refused;
        }
    }

    fmt::print(stderr, "Read {} message(s), {} refused at intake.\n", lines, refused);
    finish(pipeline);
    return 0;
}

/// Drive the pipeline from the load generator through a loopback transport.
int run_simulate(const aqs::config::PipelineConfig& cfg, double seconds,
                 double rate, std::uint32_t seed) {
    aqs::pipeline::PipelineCoordinator pipeline(cfg, console_collaborators());
    pipeline.start();

    aqs::transport::LoopbackTransport transport;
    transport.set_handler(aqs::transport::make_ingest_handler(pipeline));
    aqs::transport::SubscriptionManager subscriptions(
        transport, aqs::transport::RetryPolicy::from(cfg.transport), pipeline.monitor());
    if (!subscriptions.establish(cfg.transport.subscriptions)) {
        fmt::print(stderr, "Error: could not subscribe to the loopback transport\n");
        finish(pipeline);
        return 1;
    }

    aqs::sim::GeneratorConfig gen_cfg;
    gen_cfg.seed       = seed;
    gen_cfg.interval_s = 1.0 / rate;
    aqs::sim::LoadGenerator generator(gen_cfg);

    const auto period   = std::chrono::duration<double>(1.0 / rate);
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                              std::chrono::duration<double>(seconds));
    std::size_t published = 0;
    std::size_t unrouted  = 0;
    auto next_tick = std::chrono::steady_clock::now();
    while (std::chrono::steady_clock::now() < deadline) {
        for (const auto& msg : generator.next()) {
            if (transport.publish(msg.topic, msg.payload)) {
                ++published;
            } else {
                ++unrouted;
            }
        }
        next_tick += std::chrono::duration_cast<std::chrono::steady_clock::duration>(period);
        std::this_thread::sleep_until(next_tick);
    }
    transport.disconnect();

    fmt::print(stderr, "Published {} message(s) ({} unrouted) in {:.1f}s.\n",
               published, unrouted, seconds);
    finish(pipeline);
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::optional<std::string> config_path;
    std::optional<std::string> mode;
    double        sim_seconds = 0.0;
    double        rate        = 10.0;
    std::uint32_t seed        = 42;

    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        const bool has_value = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        }
        if (arg == "--stream") {
            mode = arg;
        } else if (arg == "--config" && has_value) {
            config_path = argv[++i];
        } else if (arg == "--simulate" && has_value) {
            auto s = parse_number<double>(argv[++i]);
            if (!s || *s <= 0.0) {
                fmt::print(stderr, "Error: --simulate requires a positive duration\n");
                return 1;
            }
            mode        = arg;
            sim_seconds = *s;
        } else if (arg == "--rate" && has_value) {
            auto r = parse_number<double>(argv[++i]);
            if (!r || *r <= 0.0) {
                fmt::print(stderr, "Error: --rate requires a positive number\n");
                return 1;
            }
            rate = *r;
        } else if (arg == "--seed" && has_value) {
            auto s = parse_number<std::uint32_t>(argv[++i]);
            if (!s) {
                fmt::print(stderr, "Error: --seed requires an unsigned integer\n");
                return 1;
            }
            seed = *s;
        } else {
            fmt::print(stderr, "Error: unknown or incomplete option '{}'\n", arg);
            print_usage();
            return 1;
        }
    }

    aqs::config::PipelineConfig cfg;
    if (config_path) {
        auto loaded = aqs::config::load_file(*config_path);
        if (!loaded) {
            fmt::print(stderr, "Error: cannot load configuration '{}'\n", *config_path);
            return 1;
        }
        cfg = std::move(*loaded);
    }
    aqs::logging::configure(cfg.logging);

    if (!mode) {
        print_usage();
        return 1;
    }
    if (*mode == "--stream") {
        return run_stream(cfg);
    }
    return run_simulate(cfg, sim_seconds, rate, seed);
}
