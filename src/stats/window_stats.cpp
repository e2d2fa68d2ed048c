/// @file src/stats/window_stats.cpp
/// @brief RollingWindow (Eigen ring + Welford) and WindowStatisticsTracker.
///
/// Update path for a full window:
///   1. Welford-remove the sample about to be overwritten
///   2. Overwrite its slot and Welford-add the new sample
///   3. Every `capacity` updates, recompute mean and M2 from the ring

#include "aqs/window_stats.hpp"

#include "aqs/logging.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace aqs::stats {

// ─── RollingWindow ────────────────────────────────────────────────────────────

RollingWindow::RollingWindow(std::size_t capacity)
    : capacity_(capacity < 1 ? 1 : capacity),
      values_(Eigen::VectorXd::Zero(static_cast<Eigen::Index>(capacity_))),
      times_(Eigen::VectorXd::Zero(static_cast<Eigen::Index>(capacity_))) {}

std::size_t RollingWindow::index_of(std::size_t i) const noexcept {
    // Oldest sample sits at head_ once the ring is full, at 0 before that.
    const std::size_t oldest = (count_ == capacity_) ? head_ : 0;
    return (oldest + i) % capacity_;
}

void RollingWindow::add(double value) noexcept {
    ++count_;
    const double delta = value - mean_;
    mean_ += delta / static_cast<double>(count_);
    m2_   += delta * (value - mean_);
}

void RollingWindow::remove(double value) noexcept {
    if (count_ <= 1) {
        count_ = 0;
        mean_  = 0.0;
        m2_    = 0.0;
        return;
    }
    const double mean_old = mean_;
    const double n        = static_cast<double>(count_);
    mean_ = mean_old - (value - mean_old) / (n - 1.0);
    m2_  -= (value - mean_old) * (value - mean_);
    m2_   = std::max(m2_, 0.0);
    --count_;
}

void RollingWindow::push(double value, double time) noexcept {
    const auto slot = static_cast<Eigen::Index>(head_);
    if (count_ == capacity_) {
        remove(values_[slot]);
    }
    values_[slot] = value;
    times_[slot]  = time;
    add(value);
    head_ = (head_ + 1) % capacity_;
    ++pushed_;

    if (++since_resync_ >= capacity_) {
        resync();
    }
}

void RollingWindow::resync() noexcept {
    since_resync_ = 0;
    if (count_ == 0) {
        mean_ = 0.0;
        m2_   = 0.0;
        return;
    }
    // Before the ring wraps the live samples occupy slots [0, count_);
    // afterwards every slot is live. Either way head(count_) covers them.
    const auto live = values_.head(static_cast<Eigen::Index>(count_));
    mean_ = live.mean();
    m2_   = (live.array() - mean_).square().sum();
}

WindowStats RollingWindow::stats(std::size_t min_samples) const noexcept {
    WindowStats s;
    s.count          = count_;
    s.low_confidence = count_ < min_samples;
    if (count_ == 0) {
        return s;
    }
    s.mean   = mean_;
    s.stddev = std::sqrt(m2_ / static_cast<double>(count_));
    return s;
}

std::optional<std::array<Sample, 2>> RollingWindow::last_two() const noexcept {
    if (count_ < 2) {
        return std::nullopt;
    }
    const auto older = static_cast<Eigen::Index>(index_of(count_ - 2));
    const auto newer = static_cast<Eigen::Index>(index_of(count_ - 1));
    return std::array<Sample, 2>{
        Sample{values_[older], times_[older]},
        Sample{values_[newer], times_[newer]},
    };
}

std::optional<double> RollingWindow::last_time() const noexcept {
    if (count_ == 0) {
        return std::nullopt;
    }
    return times_[static_cast<Eigen::Index>(index_of(count_ - 1))];
}

std::vector<double> RollingWindow::values() const {
    std::vector<double> out;
    out.reserve(count_);
    for (std::size_t i = 0; i < count_; ++i) {
        out.push_back(values_[static_cast<Eigen::Index>(index_of(i))]);
    }
    return out;
}

// ─── WindowStatisticsTracker ──────────────────────────────────────────────────

WindowStatisticsTracker::WindowStatisticsTracker(config::WindowConfig cfg)
    : cfg_(cfg) {
    if (cfg_.window_size < 1) {
        cfg_.window_size = 1;
    }
}

WindowStatisticsTracker::StreamState*
WindowStatisticsTracker::find_locked(const std::string& stream_id) const {
    const auto it = streams_.find(stream_id);
    return it == streams_.end() ? nullptr : it->second.get();
}

WindowStats WindowStatisticsTracker::stats_of(const RollingWindow& window) const noexcept {
    return window.stats(cfg_.min_samples_for_confidence);
}

WindowStats WindowStatisticsTracker::update(const std::string& stream_id,
                                            double value, double time,
                                            SteadyTime now) {
    return with_stream(
        stream_id,
        [&](RollingWindow& window) {
            window.push(value, time);
            return stats_of(window);
        },
        now);
}

std::optional<WindowStats>
WindowStatisticsTracker::stats(const std::string& stream_id) const {
    std::shared_lock<std::shared_mutex> reader(map_mutex_);
    StreamState* state = find_locked(stream_id);
    if (state == nullptr) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> stream_lock(state->mutex);
    return stats_of(state->window);
}

std::size_t WindowStatisticsTracker::evict_idle(SteadyTime now) {
    const auto timeout = std::chrono::duration_cast<SteadyClock::duration>(
        std::chrono::duration<double>(cfg_.stream_idle_timeout_s));

    std::size_t evicted = 0;
    {
        std::unique_lock<std::shared_mutex> writer(map_mutex_);
        for (auto it = streams_.begin(); it != streams_.end();) {
            if (now - it->second->last_update > timeout) {
                it = streams_.erase(it);
                ++evicted;
            } else {
                ++it;
            }
        }
    }
    if (evicted > 0) {
        logging::get("window")->debug("evicted {} idle stream(s)", evicted);
    }
    return evicted;
}

std::size_t WindowStatisticsTracker::stream_count() const {
    std::shared_lock<std::shared_mutex> reader(map_mutex_);
    return streams_.size();
}

}  // namespace aqs::stats
