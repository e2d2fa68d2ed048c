/// @file tests/ingest/test_ingestion_buffer.cpp
/// @brief Unit tests for IngestionBuffer.
///
/// Test categories:
///   - Capacity: the entry past capacity is BufferFull at exactly 100 %
///   - FIFO order, single and multi-threaded
///   - close(): no new entries, remaining entries still drain
///   - abort(): blocked consumers wake, drain_remaining returns leftovers
///   - Timed enqueue / dequeue

#include <gtest/gtest.h>
#include "aqs/ingestion_buffer.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace aqs;
using namespace aqs::ingest;
using namespace std::chrono_literals;

namespace {

RawReading numbered(std::uint64_t seq) {
    RawReading r;
    r.sequence = seq;
    return r;
}

}  // namespace

// ─── Capacity ────────────────────────────────────────────────────────────────

TEST(IngestionBuffer, OverflowIsBufferFullAtHundredPercent) {
    IngestionBuffer buf(1000);
    for (std::uint64_t i = 0; i < 1000; ++i) {
        ASSERT_EQ(buf.enqueue(numbered(i)), EnqueueStatus::Accepted);
    }
    EXPECT_EQ(buf.enqueue(numbered(1000)), EnqueueStatus::BufferFull);
    EXPECT_DOUBLE_EQ(buf.occupancy_percent(), 100.0);
    EXPECT_EQ(buf.size(), 1000u);
}

TEST(IngestionBuffer, OccupancyTracksSize) {
    IngestionBuffer buf(8);
    EXPECT_DOUBLE_EQ(buf.occupancy_percent(), 0.0);
    for (int i = 0; i < 2; ++i) ASSERT_EQ(buf.enqueue(numbered(i)), EnqueueStatus::Accepted);
    EXPECT_DOUBLE_EQ(buf.occupancy_percent(), 25.0);
    (void)buf.try_dequeue();
    EXPECT_DOUBLE_EQ(buf.occupancy_percent(), 12.5);
}

TEST(IngestionBuffer, ZeroCapacityIsClampedToOne) {
    IngestionBuffer buf(0);
    EXPECT_EQ(buf.capacity(), 1u);
    EXPECT_EQ(buf.enqueue(numbered(1)), EnqueueStatus::Accepted);
    EXPECT_EQ(buf.enqueue(numbered(2)), EnqueueStatus::BufferFull);
}

TEST(IngestionBuffer, EnqueueStampsTime) {
    IngestionBuffer buf(2);
    const auto before = SteadyClock::now();
    ASSERT_EQ(buf.enqueue(numbered(1)), EnqueueStatus::Accepted);
    const auto e = buf.try_dequeue();
    ASSERT_TRUE(e.has_value());
    EXPECT_GE(e->enqueued_at, before);
}

// ─── FIFO ────────────────────────────────────────────────────────────────────

TEST(IngestionBuffer, DequeuesInFifoOrder) {
    IngestionBuffer buf(16);
    for (std::uint64_t i = 0; i < 10; ++i) ASSERT_EQ(buf.enqueue(numbered(i)), EnqueueStatus::Accepted);
    for (std::uint64_t i = 0; i < 10; ++i) {
        auto e = buf.try_dequeue();
        ASSERT_TRUE(e.has_value());
        EXPECT_EQ(e->reading.sequence, i);
    }
    EXPECT_FALSE(buf.try_dequeue().has_value());
}

TEST(IngestionBuffer, ProducerConsumerPreservesOrder) {
    IngestionBuffer buf(32);
    constexpr std::uint64_t kCount = 5000;

    std::thread producer([&buf] {
        for (std::uint64_t i = 0; i < kCount;) {
            if (buf.enqueue(numbered(i)) == EnqueueStatus::Accepted) {
                ++i;
            } else {
                std::this_thread::yield();
            }
        }
        buf.close();
    });

    std::vector<std::uint64_t> seen;
    while (auto e = buf.dequeue()) {
        seen.push_back(e->reading.sequence);
    }
    producer.join();

    ASSERT_EQ(seen.size(), kCount);
    for (std::uint64_t i = 0; i < kCount; ++i) {
        ASSERT_EQ(seen[i], i);
    }
}

// ─── close / abort ───────────────────────────────────────────────────────────

TEST(IngestionBuffer, CloseRefusesNewEntriesButDrains) {
    IngestionBuffer buf(4);
    ASSERT_EQ(buf.enqueue(numbered(1)), EnqueueStatus::Accepted);
    ASSERT_EQ(buf.enqueue(numbered(2)), EnqueueStatus::Accepted);
    buf.close();
    EXPECT_TRUE(buf.is_closed());
    EXPECT_EQ(buf.enqueue(numbered(3)), EnqueueStatus::Closed);

    EXPECT_EQ(buf.dequeue()->reading.sequence, 1u);
    EXPECT_EQ(buf.dequeue()->reading.sequence, 2u);
    EXPECT_FALSE(buf.dequeue().has_value());
}

TEST(IngestionBuffer, CloseWakesBlockedConsumer) {
    IngestionBuffer buf(4);
    std::atomic<bool> returned{false};
    std::thread consumer([&] {
        auto e = buf.dequeue();
        EXPECT_FALSE(e.has_value());
        returned = true;
    });
    std::this_thread::sleep_for(20ms);
    buf.close();
    consumer.join();
    EXPECT_TRUE(returned);
}

TEST(IngestionBuffer, AbortStopsDequeueAndKeepsLeftovers) {
    IngestionBuffer buf(4);
    for (int i = 0; i < 3; ++i) ASSERT_EQ(buf.enqueue(numbered(i)), EnqueueStatus::Accepted);
    buf.abort();
    EXPECT_FALSE(buf.dequeue().has_value());
    EXPECT_FALSE(buf.try_dequeue().has_value());

    const auto rest = buf.drain_remaining();
    ASSERT_EQ(rest.size(), 3u);
    EXPECT_EQ(rest.front().reading.sequence, 0u);
    EXPECT_EQ(buf.size(), 0u);
}

TEST(IngestionBuffer, ReopenAcceptsAgain) {
    IngestionBuffer buf(2);
    buf.abort();
    EXPECT_EQ(buf.enqueue(numbered(1)), EnqueueStatus::Closed);
    buf.reopen();
    EXPECT_EQ(buf.enqueue(numbered(1)), EnqueueStatus::Accepted);
    EXPECT_EQ(buf.dequeue()->reading.sequence, 1u);
}

// ─── Timed operations ────────────────────────────────────────────────────────

TEST(IngestionBuffer, EnqueueForTimesOutWhenFull) {
    IngestionBuffer buf(1);
    ASSERT_EQ(buf.enqueue(numbered(1)), EnqueueStatus::Accepted);
    const auto t0 = SteadyClock::now();
    EXPECT_EQ(buf.enqueue_for(numbered(2), 20ms), EnqueueStatus::BufferFull);
    EXPECT_GE(SteadyClock::now() - t0, 15ms);
}

TEST(IngestionBuffer, EnqueueForSucceedsWhenSpaceFrees) {
    IngestionBuffer buf(1);
    ASSERT_EQ(buf.enqueue(numbered(1)), EnqueueStatus::Accepted);
    std::thread consumer([&buf] {
        std::this_thread::sleep_for(10ms);
        (void)buf.dequeue();
    });
    EXPECT_EQ(buf.enqueue_for(numbered(2), 2s), EnqueueStatus::Accepted);
    consumer.join();
    EXPECT_EQ(buf.try_dequeue()->reading.sequence, 2u);
}

TEST(IngestionBuffer, DequeueForTimesOutWhenEmpty) {
    IngestionBuffer buf(1);
    EXPECT_FALSE(buf.dequeue_for(10ms).has_value());
}

TEST(IngestionBuffer, EnqueueStatusNames) {
    EXPECT_STREQ(to_string(EnqueueStatus::Accepted), "Accepted");
    EXPECT_STREQ(to_string(EnqueueStatus::BufferFull), "BufferFull");
    EXPECT_STREQ(to_string(EnqueueStatus::Closed), "Closed");
}
