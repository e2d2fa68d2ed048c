#pragma once

/// @file include/aqs/ingestion_buffer.hpp
/// @brief IngestionBuffer — bounded FIFO between the transport and the workers.
///
/// # Module: Ingestion Buffer
///
/// ## Responsibility
/// Absorb bursts between the transport callback (single producer) and the
/// processing workers (one or more consumers). It is the only shared mutable
/// structure between producer and workers.
///
/// ## Contract
/// - `enqueue` never blocks: it fails with `BufferFull` at capacity
/// - `enqueue_for` waits at most the given duration for space
/// - `dequeue` blocks until an item is available, or returns `nullopt`
///   once the buffer is closed and empty, or immediately after `abort()`
/// - Items come out in strict FIFO order
/// - `occupancy_percent` is a lock-free, side-effect-free read
///
/// The buffer only reports its fill level. Turning occupancy into a
/// WARNING (≥ 80 %) or CRITICAL (≥ 95 %) signal is the monitor's job.

#include "aqs/constants.hpp"
#include "aqs/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace aqs::ingest {

/// A reading waiting in the buffer.
struct BufferEntry {
    RawReading reading;
    SteadyTime enqueued_at;
};

enum class EnqueueStatus {
    Accepted,
    BufferFull,  ///< At capacity; caller applies its backpressure policy
    Closed,      ///< Buffer closed (pipeline draining or stopped)
};

[[nodiscard]] const char* to_string(EnqueueStatus s) noexcept;

class IngestionBuffer {
public:
    explicit IngestionBuffer(std::size_t capacity = constants::DEFAULT_BUFFER_CAPACITY);

    IngestionBuffer(const IngestionBuffer&)            = delete;
    IngestionBuffer& operator=(const IngestionBuffer&) = delete;

    /// Append without waiting.
    [[nodiscard]] EnqueueStatus enqueue(RawReading reading);

    /// Append, waiting up to `wait` for a free slot.
    [[nodiscard]] EnqueueStatus enqueue_for(RawReading reading,
                                            std::chrono::milliseconds wait);

    /// Block until an entry is available. `nullopt` means "no more work":
    /// the buffer is closed and empty, or was aborted.
    [[nodiscard]] std::optional<BufferEntry> dequeue();

    /// As dequeue(), but gives up after `timeout`.
    [[nodiscard]] std::optional<BufferEntry> dequeue_for(std::chrono::milliseconds timeout);

    /// Non-blocking dequeue.
    [[nodiscard]] std::optional<BufferEntry> try_dequeue();

    /// Stop accepting entries. Buffered entries remain dequeueable.
    void close() noexcept;

    /// Close and wake every waiter; dequeue returns `nullopt` from now on.
    void abort() noexcept;

    /// Reopen after close()/abort(). Leftover entries are kept.
    void reopen() noexcept;

    /// Remove and return everything still buffered (used after abort()).
    [[nodiscard]] std::vector<BufferEntry> drain_remaining();

    [[nodiscard]] double      occupancy_percent() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] std::size_t capacity() const noexcept;
    [[nodiscard]] bool        is_closed() const noexcept;

private:
    /// Caller holds mutex_.
    [[nodiscard]] BufferEntry pop_front_locked();

    const std::size_t        capacity_;
    mutable std::mutex       mutex_;
    std::condition_variable  not_empty_;
    std::condition_variable  not_full_;
    std::deque<BufferEntry>  queue_;
    std::atomic<std::size_t> size_{0};
    std::atomic<bool>        closed_{false};
    bool                     aborted_ = false;
};

}  // namespace aqs::ingest
