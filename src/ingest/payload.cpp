/// @file src/ingest/payload.cpp
/// @brief PayloadParser — JSON payloads to RawReading, topic/timestamp helpers.

#include "aqs/payload.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <charconv>
#include <chrono>
#include <cmath>

namespace aqs::ingest {

using nlohmann::json;

// ─── topic_matches ────────────────────────────────────────────────────────────

bool topic_matches(std::string_view pattern, std::string_view topic) noexcept {
    std::size_t p = 0;
    std::size_t t = 0;

    while (true) {
        const std::size_t p_end = pattern.find('/', p);
        const std::string_view p_level = pattern.substr(p, p_end == std::string_view::npos
                                                               ? std::string_view::npos
                                                               : p_end - p);
        if (p_level == "#") {
            // Multi-level wildcard must be the final level.
            return p_end == std::string_view::npos;
        }

        const std::size_t t_end = topic.find('/', t);
        const std::string_view t_level = topic.substr(t, t_end == std::string_view::npos
                                                             ? std::string_view::npos
                                                             : t_end - t);

        if (p_level != "+" && p_level != t_level) {
            return false;
        }

        const bool p_last = (p_end == std::string_view::npos);
        const bool t_last = (t_end == std::string_view::npos);
        if (p_last || t_last) {
            if (p_last && t_last) return true;
            // "a/#" matches "a": the remaining pattern level is a lone '#'.
            if (t_last && !p_last) {
                return pattern.substr(p_end + 1) == "#";
            }
            return false;
        }
        p = p_end + 1;
        t = t_end + 1;
    }
}

std::optional<Category>
category_for_topic(std::string_view topic,
                   std::span<const config::TopicRule> rules) noexcept {
    for (const auto& rule : rules) {
        if (topic_matches(rule.pattern, topic)) {
            return rule.category;
        }
    }
    return std::nullopt;
}

// ─── Timestamps ───────────────────────────────────────────────────────────────

namespace {

/// Parse exactly `width` decimal digits at text[pos].
std::optional<int> digits(std::string_view text, std::size_t pos, std::size_t width) noexcept {
    if (pos + width > text.size()) return std::nullopt;
    for (std::size_t i = pos; i < pos + width; ++i) {
        if (text[i] < '0' || text[i] > '9') return std::nullopt;
    }
    int value = 0;
    const char* first = text.data() + pos;
    const char* last  = first + width;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    return value;
}

}  // anonymous namespace

std::optional<double> parse_iso8601(std::string_view text) noexcept {
    using namespace std::chrono;

    // YYYY-MM-DDTHH:MM:SS is 19 characters.
    if (text.size() < 19) return std::nullopt;
    if (text[4] != '-' || text[7] != '-' || (text[10] != 'T' && text[10] != ' ') ||
        text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }

    const auto yy = digits(text, 0, 4);
    const auto mo = digits(text, 5, 2);
    const auto dd = digits(text, 8, 2);
    const auto hh = digits(text, 11, 2);
    const auto mi = digits(text, 14, 2);
    const auto ss = digits(text, 17, 2);
    if (!yy || !mo || !dd || !hh || !mi || !ss) return std::nullopt;
    if (*hh > 23 || *mi > 59 || *ss > 60) return std::nullopt;

    const year_month_day ymd{year{*yy}, month{static_cast<unsigned>(*mo)},
                             day{static_cast<unsigned>(*dd)}};
    if (!ymd.ok()) return std::nullopt;

    std::size_t pos = 19;
    double fraction = 0.0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        double scale = 0.1;
        const std::size_t start = pos;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            fraction += scale * (text[pos] - '0');
            scale *= 0.1;
            ++pos;
        }
        if (pos == start) return std::nullopt;
    }

    double offset_s = 0.0;
    if (pos < text.size()) {
        if (text[pos] == 'Z' || text[pos] == 'z') {
            ++pos;
        } else if (text[pos] == '+' || text[pos] == '-') {
            const double sign = (text[pos] == '-') ? -1.0 : 1.0;
            const auto oh = digits(text, pos + 1, 2);
            if (!oh) return std::nullopt;
            std::size_t mpos = pos + 3;
            if (mpos < text.size() && text[mpos] == ':') ++mpos;
            const auto om = digits(text, mpos, 2);
            if (!om || *oh > 23 || *om > 59) return std::nullopt;
            offset_s = sign * (*oh * 3600.0 + *om * 60.0);
            pos = mpos + 2;
        }
    }
    if (pos != text.size()) return std::nullopt;

    const auto days = sys_days{ymd}.time_since_epoch().count();
    const double seconds = static_cast<double>(days) * 86400.0 +
                           *hh * 3600.0 + *mi * 60.0 + *ss + fraction;
    return seconds - offset_s;
}

std::string format_iso8601(double epoch_seconds) {
    using namespace std::chrono;

    const double whole = std::floor(epoch_seconds);
    auto millis = static_cast<long long>(std::llround((epoch_seconds - whole) * 1000.0));
    auto secs   = static_cast<long long>(whole);
    if (millis >= 1000) {
        millis -= 1000;
        secs += 1;
    }

    const sys_seconds tp{seconds{secs}};
    const auto day_point = floor<days>(tp);
    const year_month_day ymd{day_point};
    const hh_mm_ss hms{tp - day_point};

    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()),
                       hms.hours().count(), hms.minutes().count(),
                       hms.seconds().count(), millis);
}

double wall_now() noexcept {
    using namespace std::chrono;
    return duration<double>(system_clock::now().time_since_epoch()).count();
}

// ─── PayloadParser ────────────────────────────────────────────────────────────

PayloadParser::PayloadParser(std::vector<config::TopicRule> rules)
    : rules_(std::move(rules)) {}

RawReading PayloadParser::parse(std::string_view topic,
                                std::string_view payload) const noexcept {
    RawReading raw;
    raw.topic         = std::string(topic);
    raw.received      = SteadyClock::now();
    raw.received_wall = wall_now();
    raw.category      = category_for_topic(topic, rules_);

    const json doc = json::parse(payload.begin(), payload.end(), nullptr,
                                 /*allow_exceptions=*/false);
    if (doc.is_discarded()) {
        raw.parse_error = "payload is not valid JSON";
        return raw;
    }
    if (!doc.is_object()) {
        raw.parse_error = "payload is not a JSON object";
        return raw;
    }

    try {
        if (auto it = doc.find("sensor_id"); it != doc.end() && it->is_string()) {
            raw.sensor_id = it->get<std::string>();
        }

        if (auto it = doc.find("category"); it != doc.end() && it->is_string()) {
            if (auto c = category_from_string(it->get<std::string>())) {
                raw.category = c;
            }
        }

        if (auto it = doc.find("timestamp"); it != doc.end()) {
            if (it->is_number()) {
                raw.wall_time = it->get<double>();
            } else if (it->is_string()) {
                raw.wall_time = parse_iso8601(it->get<std::string>());
            }
        }

        if (auto it = doc.find("value"); it != doc.end() && !it->is_null()) {
            if (it->is_number()) {
                raw.value = it->get<double>();
            } else {
                raw.value_malformed = true;
            }
        }

        if (auto it = doc.find("quality_score"); it != doc.end() && it->is_number()) {
            raw.reported_quality = it->get<double>();
        }

        if (auto it = doc.find("metadata"); it != doc.end() && it->is_object()) {
            for (const auto& [key, val] : it->items()) {
                raw.metadata[key] = val.is_string() ? val.get<std::string>() : val.dump();
            }
        }
        if (auto it = doc.find("type"); it != doc.end() && it->is_string()) {
            raw.metadata["type"] = it->get<std::string>();
        }
    } catch (const json::exception& ex) {
        raw.parse_error = ex.what();
    }

    return raw;
}

// ─── to_json_line ─────────────────────────────────────────────────────────────

std::string to_json_line(const CleanedReading& reading, const AnomalyVerdict& verdict) {
    const json j = {
        {"sequence", reading.sequence},
        {"sensor_id", reading.sensor_id},
        {"category", to_string(reading.category)},
        {"timestamp", format_iso8601(reading.timestamp.wall)},
        {"value", reading.value},
        {"interpolated", reading.interpolated},
        {"z_score", verdict.z_score},
        {"quality_score", verdict.quality_score},
        {"classification", to_string(verdict.classification)},
        {"severity", to_string(verdict.severity)},
        {"low_confidence", verdict.low_confidence},
    };
    return j.dump();
}

}  // namespace aqs::ingest
