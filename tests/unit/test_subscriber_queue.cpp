/**
 * @file test_subscriber_queue.cpp
 * @brief Unit tests for the bounded per-subscriber queue
 *
 * Tests cover:
 * - FIFO delivery
 * - Drop-oldest overflow and statistics
 * - Close semantics and waking blocked readers
 */

#include <gtest/gtest.h>

#include "hub/SubscriberQueue.hpp"

#include <chrono>
#include <thread>

using namespace lanwatch::hub;
using namespace std::chrono_literals;

class SubscriberQueueTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

// =============================================================================
// Basic Operations
// =============================================================================

TEST_F(SubscriberQueueTest, DeliversInOrder) {
    SubscriberQueue<int> queue(8);

    EXPECT_EQ(queue.Enqueue(1), EnqueueResult::Enqueued);
    EXPECT_EQ(queue.Enqueue(2), EnqueueResult::Enqueued);
    EXPECT_EQ(queue.Enqueue(3), EnqueueResult::Enqueued);

    EXPECT_EQ(queue.TryDequeue(), std::optional<int>(1));
    EXPECT_EQ(queue.TryDequeue(), std::optional<int>(2));
    EXPECT_EQ(queue.TryDequeue(), std::optional<int>(3));
    EXPECT_FALSE(queue.TryDequeue().has_value());
}

TEST_F(SubscriberQueueTest, ZeroLimitIsClampedToOne) {
    SubscriberQueue<int> queue(0);

    queue.Enqueue(1);
    EXPECT_EQ(queue.Enqueue(2), EnqueueResult::DroppedOldest);
    EXPECT_EQ(queue.Size(), 1u);
    EXPECT_EQ(queue.TryDequeue(), std::optional<int>(2));
}

// =============================================================================
// Overflow
// =============================================================================

TEST_F(SubscriberQueueTest, DropsOldestWhenFull) {
    SubscriberQueue<int> queue(3);

    for (int i = 1; i <= 5; ++i)
        queue.Enqueue(i);

    auto stats = queue.GetStats();
    EXPECT_EQ(stats.current_depth, 3u);
    EXPECT_EQ(stats.limit, 3u);
    EXPECT_EQ(stats.total_enqueued, 5u);
    EXPECT_EQ(stats.dropped_oldest, 2u);
    EXPECT_EQ(stats.high_watermark, 3u);

    EXPECT_EQ(queue.TryDequeue(), std::optional<int>(3));
    EXPECT_EQ(queue.TryDequeue(), std::optional<int>(4));
    EXPECT_EQ(queue.TryDequeue(), std::optional<int>(5));
    EXPECT_EQ(queue.GetStats().total_delivered, 3u);
}

// =============================================================================
// Close
// =============================================================================

TEST_F(SubscriberQueueTest, ClosedQueueRejectsButDrains) {
    SubscriberQueue<int> queue(4);
    queue.Enqueue(7);
    queue.Close();

    EXPECT_TRUE(queue.IsClosed());
    EXPECT_EQ(queue.Enqueue(8), EnqueueResult::Disconnected);
    EXPECT_EQ(queue.WaitDequeue(10ms), std::optional<int>(7));
    EXPECT_FALSE(queue.WaitDequeue(10ms).has_value());
}

TEST_F(SubscriberQueueTest, CloseWakesBlockedReader) {
    SubscriberQueue<int> queue(4);

    auto start = std::chrono::steady_clock::now();
    std::thread closer([&queue]() {
        std::this_thread::sleep_for(50ms);
        queue.Close();
    });

    auto value = queue.WaitDequeue(5000ms);
    closer.join();

    EXPECT_FALSE(value.has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 4000ms);
}

TEST_F(SubscriberQueueTest, WaitReturnsEntryFromProducer) {
    SubscriberQueue<int> queue(4);

    std::thread producer([&queue]() {
        std::this_thread::sleep_for(20ms);
        queue.Enqueue(99);
    });

    auto value = queue.WaitDequeue(2000ms);
    producer.join();

    EXPECT_EQ(value, std::optional<int>(99));
}
