/// @file src/ingest/ingestion_buffer.cpp
/// @brief IngestionBuffer — mutex + condition-variable bounded FIFO.

#include "aqs/ingestion_buffer.hpp"

namespace aqs::ingest {

const char* to_string(EnqueueStatus s) noexcept {
    switch (s) {
        case EnqueueStatus::Accepted:   return "Accepted";
        case EnqueueStatus::BufferFull: return "BufferFull";
        case EnqueueStatus::Closed:     return "Closed";
    }
    return "Unknown";
}

// ─── Constructor ──────────────────────────────────────────────────────────────

IngestionBuffer::IngestionBuffer(std::size_t capacity)
    : capacity_(capacity < 1 ? 1 : capacity) {}

// ─── enqueue ──────────────────────────────────────────────────────────────────

EnqueueStatus IngestionBuffer::enqueue(RawReading reading) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_.load(std::memory_order_relaxed)) {
            return EnqueueStatus::Closed;
        }
        if (queue_.size() >= capacity_) {
            return EnqueueStatus::BufferFull;
        }
        queue_.push_back(BufferEntry{std::move(reading), SteadyClock::now()});
        size_.store(queue_.size(), std::memory_order_release);
    }
    not_empty_.notify_one();
    return EnqueueStatus::Accepted;
}

EnqueueStatus IngestionBuffer::enqueue_for(RawReading reading,
                                           std::chrono::milliseconds wait) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        const bool has_room = not_full_.wait_for(lock, wait, [this] {
            return closed_.load(std::memory_order_relaxed) || queue_.size() < capacity_;
        });
        if (closed_.load(std::memory_order_relaxed)) {
            return EnqueueStatus::Closed;
        }
        if (!has_room) {
            return EnqueueStatus::BufferFull;
        }
        queue_.push_back(BufferEntry{std::move(reading), SteadyClock::now()});
        size_.store(queue_.size(), std::memory_order_release);
    }
    not_empty_.notify_one();
    return EnqueueStatus::Accepted;
}

// ─── dequeue ──────────────────────────────────────────────────────────────────

BufferEntry IngestionBuffer::pop_front_locked() {
    BufferEntry entry = std::move(queue_.front());
    queue_.pop_front();
    size_.store(queue_.size(), std::memory_order_release);
    return entry;
}

std::optional<BufferEntry> IngestionBuffer::dequeue() {
    std::optional<BufferEntry> entry;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] {
            return aborted_ || !queue_.empty() || closed_.load(std::memory_order_relaxed);
        });
        if (aborted_ || queue_.empty()) {
            return std::nullopt;
        }
        entry = pop_front_locked();
    }
    not_full_.notify_one();
    return entry;
}

std::optional<BufferEntry> IngestionBuffer::dequeue_for(std::chrono::milliseconds timeout) {
    std::optional<BufferEntry> entry;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_for(lock, timeout, [this] {
            return aborted_ || !queue_.empty() || closed_.load(std::memory_order_relaxed);
        });
        if (aborted_ || queue_.empty()) {
            return std::nullopt;
        }
        entry = pop_front_locked();
    }
    not_full_.notify_one();
    return entry;
}

std::optional<BufferEntry> IngestionBuffer::try_dequeue() {
    std::optional<BufferEntry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (aborted_ || queue_.empty()) {
            return std::nullopt;
        }
        entry = pop_front_locked();
    }
    not_full_.notify_one();
    return entry;
}

// ─── Lifecycle ────────────────────────────────────────────────────────────────

void IngestionBuffer::close() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_.store(true, std::memory_order_relaxed);
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

void IngestionBuffer::abort() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_.store(true, std::memory_order_relaxed);
        aborted_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

void IngestionBuffer::reopen() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_.store(false, std::memory_order_relaxed);
    aborted_ = false;
}

std::vector<BufferEntry> IngestionBuffer::drain_remaining() {
    std::vector<BufferEntry> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out.reserve(queue_.size());
        while (!queue_.empty()) {
            out.push_back(pop_front_locked());
        }
    }
    not_full_.notify_all();
    return out;
}

// ─── Observers ────────────────────────────────────────────────────────────────

double IngestionBuffer::occupancy_percent() const noexcept {
    return 100.0 * static_cast<double>(size_.load(std::memory_order_acquire)) /
           static_cast<double>(capacity_);
}

std::size_t IngestionBuffer::size() const noexcept {
    return size_.load(std::memory_order_acquire);
}

std::size_t IngestionBuffer::capacity() const noexcept {
    return capacity_;
}

bool IngestionBuffer::is_closed() const noexcept {
    return closed_.load(std::memory_order_acquire);
}

}  // namespace aqs::ingest
