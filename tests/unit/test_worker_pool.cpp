/**
 * @file test_worker_pool.cpp
 * @brief Unit tests for the worker pool and per-target exclusion
 *
 * Tests cover:
 * - Job execution and futures
 * - Exceptions carried through futures
 * - Stop draining queued jobs and rejecting new ones
 * - TargetLock try-acquire and token release
 */

#include <gtest/gtest.h>

#include "monitor/TargetLock.hpp"
#include "monitor/WorkerPool.hpp"

#include <atomic>
#include <stdexcept>
#include <vector>

using namespace lanwatch::monitor;
using namespace std::chrono_literals;

class WorkerPoolTest : public ::testing::Test {
protected:
    void SetUp() override { pool.Start(); }
    void TearDown() override { pool.Stop(); }

    WorkerPool pool{4};
};

// =============================================================================
// Execution
// =============================================================================

TEST_F(WorkerPoolTest, RunsAllJobs) {
    std::atomic<int> count{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 100; ++i)
        futures.push_back(pool.Submit([&count]() { count++; }));

    for (auto &f : futures)
        f.get();

    EXPECT_EQ(count.load(), 100);
    EXPECT_EQ(pool.ThreadCount(), 4u);
}

TEST_F(WorkerPoolTest, JobsRunConcurrently) {
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 4; ++i) {
        futures.push_back(pool.Submit([&]() {
            int now = ++running;
            int expected = peak.load();
            while (now > expected && !peak.compare_exchange_weak(expected, now)) {
            }
            std::this_thread::sleep_for(50ms);
            --running;
        }));
    }
    for (auto &f : futures)
        f.get();

    EXPECT_GT(peak.load(), 1);
}

TEST_F(WorkerPoolTest, ExceptionReachesFuture) {
    auto future = pool.Submit([]() { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);

    auto next = pool.Submit([]() {});
    EXPECT_NO_THROW(next.get());
}

TEST_F(WorkerPoolTest, StopFinishesQueuedJobs) {
    WorkerPool single(1);
    single.Start();

    std::atomic<int> done{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 5; ++i) {
        futures.push_back(single.Submit([&done]() {
            std::this_thread::sleep_for(5ms);
            done++;
        }));
    }
    single.Stop();

    EXPECT_EQ(done.load(), 5);
    EXPECT_THROW(single.Submit([]() {}), std::runtime_error);
}

// =============================================================================
// TargetLock
// =============================================================================

TEST(TargetLockTest, SecondAcquireFailsWhileHeld) {
    TargetLock lock;

    auto token = lock.TryAcquire("10.0.0.5");
    ASSERT_TRUE(token.has_value());
    EXPECT_EQ(token->Key(), "10.0.0.5");
    EXPECT_TRUE(lock.IsHeld("10.0.0.5"));

    EXPECT_FALSE(lock.TryAcquire("10.0.0.5").has_value());
    EXPECT_TRUE(lock.TryAcquire("10.0.0.6").has_value());
}

TEST(TargetLockTest, TokenReleasesOnDestruction) {
    TargetLock lock;
    {
        auto token = lock.TryAcquire("dev");
        ASSERT_TRUE(token.has_value());
    }
    EXPECT_FALSE(lock.IsHeld("dev"));
    EXPECT_TRUE(lock.TryAcquire("dev").has_value());
}

TEST(TargetLockTest, MovedTokenKeepsTheLock) {
    TargetLock lock;
    auto token = lock.TryAcquire("dev");
    ASSERT_TRUE(token.has_value());

    TargetLock::Token moved = std::move(*token);
    token.reset();

    EXPECT_TRUE(lock.IsHeld("dev"));
    EXPECT_EQ(moved.Key(), "dev");
}
