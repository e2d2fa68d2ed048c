/// @file src/sim/load_generator.cpp
/// @brief LoadGenerator — seeded message mix rendered as JSON payloads.

#include "aqs/load_generator.hpp"

#include "aqs/payload.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace aqs::sim {

const char* to_string(MessageKind k) noexcept {
    switch (k) {
        case MessageKind::Normal:          return "normal";
        case MessageKind::Anomaly:         return "anomaly";
        case MessageKind::AnomalySequence: return "anomaly_sequence";
        case MessageKind::Noise:           return "noise";
        case MessageKind::Missing:         return "missing_data";
        case MessageKind::Corrupt:         return "corrupt_data";
        case MessageKind::Burst:           return "burst";
    }
    return "unknown";
}

LoadGenerator::LoadGenerator(GeneratorConfig cfg)
    : cfg_(std::move(cfg)),
      rng_(cfg_.seed),
      mix_({50, 15, 15, 10, 5, 5}),
      clock_(cfg_.start_time > 0.0 ? cfg_.start_time : ingest::wall_now()) {}

double LoadGenerator::uniform(double lo, double hi) {
    return std::uniform_real_distribution<double>(lo, hi)(rng_);
}

double LoadGenerator::normal(double mean, double stddev) {
    return std::normal_distribution<double>(mean, stddev)(rng_);
}

MessageKind LoadGenerator::draw_kind() {
    static constexpr MessageKind order[] = {
        MessageKind::Normal,  MessageKind::Anomaly, MessageKind::Noise,
        MessageKind::Missing, MessageKind::Corrupt, MessageKind::Burst,
    };
    return order[mix_(rng_)];
}

Message LoadGenerator::make(MessageKind kind) {
    const double base = cfg_.base_flow;
    nlohmann::json j{
        {"sensor_id", cfg_.sensor_id},
        {"timestamp", ingest::format_iso8601(clock_)},
        {"type", to_string(kind)},
    };

    switch (kind) {
        case MessageKind::Normal:
            j["value"]         = base + normal(0.0, cfg_.noise_factor * base);
            j["quality_score"] = uniform(0.8, 1.0);
            break;
        case MessageKind::Anomaly:
            j["value"]         = base * uniform(8.0, 15.0);
            j["quality_score"] = uniform(0.8, 1.0);
            break;
        case MessageKind::AnomalySequence:
            j["value"]         = base * uniform(5.0, 20.0);
            j["quality_score"] = uniform(0.8, 1.0);
            break;
        case MessageKind::Noise:
            j["value"]         = base + normal(0.0, base);
            j["quality_score"] = uniform(0.6, 0.8);
            break;
        case MessageKind::Missing:
            j["value"]         = nullptr;
            j["quality_score"] = 0.0;
            break;
        case MessageKind::Corrupt:
            j["value"]         = "invalid_value";
            j["quality_score"] = uniform(0.0, 0.5);
            break;
        case MessageKind::Burst:
            j["value"]         = base * uniform(0.5, 1.5);
            j["quality_score"] = uniform(0.7, 0.9);
            break;
    }
    return Message{cfg_.topic, j.dump(), kind};
}

std::vector<Message> LoadGenerator::next() {
    std::vector<Message> out;
    const MessageKind kind = draw_kind();

    if (kind == MessageKind::Burst) {
        out.reserve(cfg_.burst_size);
        const double step = cfg_.interval_s / static_cast<double>(cfg_.burst_size + 1);
        for (std::size_t i = 0; i < cfg_.burst_size; ++i) {
            out.push_back(make(MessageKind::Burst));
            clock_ += step;
        }
    } else if (kind == MessageKind::Anomaly && uniform(0.0, 1.0) < cfg_.spike_probability) {
        const double step = cfg_.interval_s / static_cast<double>(cfg_.spike_sequence + 2);
        for (std::size_t i = 0; i < cfg_.spike_sequence; ++i) {
            out.push_back(make(MessageKind::AnomalySequence));
            clock_ += step;
        }
        out.push_back(make(MessageKind::Anomaly));
    } else {
        out.push_back(make(kind));
    }

    clock_ += cfg_.interval_s;
    return out;
}

}  // namespace aqs::sim
