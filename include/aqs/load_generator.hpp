#pragma once

/// @file include/aqs/load_generator.hpp
/// @brief LoadGenerator — deterministic synthetic water-meter telemetry.
///
/// Message mix per draw (weights):
///
/// | Kind    | Weight | Payload                                          |
/// |---------|--------|--------------------------------------------------|
/// | Normal  | 0.50   | base ± N(0, noise·base), quality U(0.8, 1.0)     |
/// | Anomaly | 0.15   | base · U(8, 15); 20 % chance of 5 extra spikes   |
/// | Noise   | 0.15   | base ± N(0, base), quality U(0.6, 0.8)           |
/// | Missing | 0.10   | value null, quality 0                            |
/// | Corrupt | 0.05   | value "invalid_value", quality U(0, 0.5)         |
/// | Burst   | 0.05   | 50 messages at base · U(0.5, 1.5)                |
///
/// Source timestamps advance on a virtual clock, so a given seed always
/// produces the same byte stream.

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace aqs::sim {

enum class MessageKind {
    Normal,
    Anomaly,
    AnomalySequence,  ///< One of the extra spikes following an anomaly
    Noise,
    Missing,
    Corrupt,
    Burst,
};

[[nodiscard]] const char* to_string(MessageKind k) noexcept;

struct GeneratorConfig {
    std::string   sensor_id    = "water_meter_001";
    std::string   topic        = "sensor/water_meter_001/data";
    double        base_flow    = 50.0;
    double        noise_factor = 0.1;
    std::uint32_t seed         = 42;

    double start_time = 0.0;  ///< Epoch seconds of the first message; 0 = now
    double interval_s = 0.1;  ///< Virtual time between draws

    std::size_t burst_size        = 50;
    std::size_t spike_sequence    = 5;
    double      spike_probability = 0.2;
};

struct Message {
    std::string topic;
    std::string payload;
    MessageKind kind;
};

class LoadGenerator {
public:
    explicit LoadGenerator(GeneratorConfig cfg = {});

    /// One draw from the mix: a single message, an anomaly followed by its
    /// spike sequence, or a whole burst.
    [[nodiscard]] std::vector<Message> next();

    /// A single message of the given kind.
    [[nodiscard]] Message make(MessageKind kind);

    /// Current virtual source time (epoch seconds).
    [[nodiscard]] double clock() const noexcept { return clock_; }

    [[nodiscard]] const GeneratorConfig& config() const noexcept { return cfg_; }

private:
    [[nodiscard]] MessageKind draw_kind();
    [[nodiscard]] double uniform(double lo, double hi);
    [[nodiscard]] double normal(double mean, double stddev);

    GeneratorConfig cfg_;
    std::mt19937    rng_;
    std::discrete_distribution<int> mix_;
    double          clock_;
};

}  // namespace aqs::sim
