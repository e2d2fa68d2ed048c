#pragma once

/// @file include/aqs/window_stats.hpp
/// @brief RollingWindow and WindowStatisticsTracker — per-stream rolling stats.
///
/// # Module: Window Statistics
///
/// ## Responsibility
/// Keep the last N cleaned values of every sensor stream and their running
/// mean and population standard deviation.
///
/// ## Guarantees
/// - O(1) per update: Welford add plus the matching Welford removal of the
///   evicted sample
/// - Every `window_size` updates the running sums are recomputed exactly
///   from the stored samples, bounding floating-point drift
/// - `mean` / `stddev` equal the population statistics of the last
///   `min(window_size, count)` values within floating-point tolerance
/// - Windows with fewer than `min_samples_for_confidence` samples are
///   flagged `low_confidence`
///
/// ## Concurrency
/// The tracker guards its stream map with a shared mutex and every stream
/// with its own mutex. `with_stream` holds the stream lock for the whole
/// callback, so validate → classify → update runs serialised per stream
/// while different streams proceed in parallel.

#include "aqs/config.hpp"
#include "aqs/types.hpp"

#include <Eigen/Dense>

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace aqs::stats {

/// Snapshot of one stream's window statistics.
struct WindowStats {
    double      mean   = 0.0;
    double      stddev = 0.0;   ///< Population standard deviation
    std::size_t count  = 0;
    bool        low_confidence = true;
};

/// One stored sample: value and its source wall time (epoch seconds).
struct Sample {
    double value;
    double time;
};

// ─── RollingWindow ────────────────────────────────────────────────────────────

/// Fixed-capacity FIFO of samples with incremental mean / variance.
///
/// Samples live in two Eigen ring buffers (values and times). Not
/// thread-safe; the tracker serialises access.
class RollingWindow {
public:
    explicit RollingWindow(std::size_t capacity = constants::DEFAULT_WINDOW_SIZE);

    /// Append a sample, evicting the oldest one when full.
    void push(double value, double time) noexcept;

    /// Current statistics. `low_confidence` is `count < min_samples`.
    [[nodiscard]] WindowStats stats(std::size_t min_samples) const noexcept;

    /// The two most recent samples, older first. `nullopt` if fewer than two.
    [[nodiscard]] std::optional<std::array<Sample, 2>> last_two() const noexcept;

    /// Source time of the newest sample.
    [[nodiscard]] std::optional<double> last_time() const noexcept;

    /// Stored values, oldest first.
    [[nodiscard]] std::vector<double> values() const;

    /// Recompute mean and M2 exactly from the stored samples.
    void resync() noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return count_; }
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] bool        empty() const noexcept { return count_ == 0; }

    /// Samples pushed over the window's lifetime, evicted ones included.
    [[nodiscard]] std::uint64_t total_pushed() const noexcept { return pushed_; }

private:
    void add(double value) noexcept;
    void remove(double value) noexcept;

    /// Ring index of the i-th oldest sample.
    [[nodiscard]] std::size_t index_of(std::size_t i) const noexcept;

    std::size_t     capacity_;
    Eigen::VectorXd values_;
    Eigen::VectorXd times_;
    std::size_t     head_  = 0;   ///< Slot the next sample is written to
    std::size_t     count_ = 0;
    std::size_t     since_resync_ = 0;
    std::uint64_t   pushed_       = 0;
    double          mean_ = 0.0;
    double          m2_   = 0.0;  ///< Sum of squared deviations from mean_
};

// ─── WindowStatisticsTracker ──────────────────────────────────────────────────

class WindowStatisticsTracker {
public:
    explicit WindowStatisticsTracker(config::WindowConfig cfg = {});

    WindowStatisticsTracker(const WindowStatisticsTracker&)            = delete;
    WindowStatisticsTracker& operator=(const WindowStatisticsTracker&) = delete;

    /// Run `fn(RollingWindow&)` with the stream's lock held, creating the
    /// stream on first use. Marks the stream active at `now` only when the
    /// callback pushed a sample, so a stream that keeps rejecting readings
    /// still ages out through evict_idle().
    template <typename Fn>
    decltype(auto) with_stream(const std::string& stream_id, Fn&& fn,
                               SteadyTime now = SteadyClock::now());

    /// Add one value to a stream and return the updated statistics.
    WindowStats update(const std::string& stream_id, double value, double time,
                       SteadyTime now = SteadyClock::now());

    /// Current statistics of a stream, `nullopt` if it is not tracked.
    [[nodiscard]] std::optional<WindowStats> stats(const std::string& stream_id) const;

    /// Statistics of a window under this tracker's confidence threshold.
    [[nodiscard]] WindowStats stats_of(const RollingWindow& window) const noexcept;

    /// Drop streams idle for longer than `stream_idle_timeout_s`.
    /// Returns the number of evicted streams.
    std::size_t evict_idle(SteadyTime now = SteadyClock::now());

    [[nodiscard]] std::size_t stream_count() const;

    [[nodiscard]] const config::WindowConfig& config() const noexcept { return cfg_; }

private:
    struct StreamState {
        StreamState(std::size_t capacity, SteadyTime created)
            : window(capacity), last_update(created) {}

        std::mutex    mutex;
        RollingWindow window;
        SteadyTime    last_update{};
    };

    /// Caller holds map_mutex_ (shared). Returns nullptr if absent.
    [[nodiscard]] StreamState* find_locked(const std::string& stream_id) const;

    config::WindowConfig cfg_;
    mutable std::shared_mutex map_mutex_;
    std::unordered_map<std::string, std::unique_ptr<StreamState>> streams_;
};

// ─── Template implementation ──────────────────────────────────────────────────

template <typename Fn>
decltype(auto) WindowStatisticsTracker::with_stream(const std::string& stream_id,
                                                    Fn&& fn, SteadyTime now) {
    // The shared lock is held for the whole callback so eviction cannot
    // remove the state underneath it. Insertion needs the exclusive lock.
    std::shared_lock<std::shared_mutex> reader(map_mutex_);
    StreamState* state = find_locked(stream_id);
    while (state == nullptr) {
        reader.unlock();
        {
            std::unique_lock<std::shared_mutex> writer(map_mutex_);
            streams_.try_emplace(stream_id,
                                 std::make_unique<StreamState>(cfg_.window_size, now));
        }
        reader.lock();
        state = find_locked(stream_id);
    }
    std::lock_guard<std::mutex> stream_lock(state->mutex);

    // Runs after the callback returns, still under the stream lock.
    struct ActivityMark {
        StreamState&  state;
        std::uint64_t pushed_before;
        SteadyTime    now;
        ~ActivityMark() {
            if (state.window.total_pushed() != pushed_before) {
                state.last_update = now;
            }
        }
    } mark{*state, state->window.total_pushed(), now};

    return std::forward<Fn>(fn)(state->window);
}

}  // namespace aqs::stats
