#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace lanwatch::hub
{
    enum class EnqueueResult
    {
        Enqueued,
        DroppedOldest,  // enqueued after evicting the oldest entry
        Disconnected    // queue closed, nothing enqueued
    };

    struct QueueStats
    {
        size_t current_depth = 0;
        size_t limit = 0;
        uint64_t total_enqueued = 0;
        uint64_t total_delivered = 0;
        uint64_t dropped_oldest = 0;
        size_t high_watermark = 0;
    };

    // Bounded per-subscriber queue. Enqueue never blocks: when full the oldest entry is evicted.
    template <typename T>
    class SubscriberQueue
    {
    public:
        explicit SubscriberQueue(size_t limit) : m_limit(limit == 0 ? 1 : limit) {}

        ~SubscriberQueue() { Close(); }

        SubscriberQueue(const SubscriberQueue &) = delete;
        SubscriberQueue &operator=(const SubscriberQueue &) = delete;

        EnqueueResult Enqueue(T value)
        {
            if (m_closed.load())
                return EnqueueResult::Disconnected;

            EnqueueResult result = EnqueueResult::Enqueued;
            {
                std::lock_guard<std::mutex> lock(m_mutex);

                if (m_items.size() >= m_limit)
                {
                    m_items.pop_front();
                    m_stats.dropped_oldest++;
                    result = EnqueueResult::DroppedOldest;
                }

                m_items.push_back(std::move(value));
                m_stats.total_enqueued++;
                if (m_items.size() > m_stats.high_watermark)
                    m_stats.high_watermark = m_items.size();
            }
            m_cv.notify_one();
            return result;
        }

        std::optional<T> TryDequeue()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return PopLocked();
        }

        // Waits up to timeout for an entry. Returns nullopt on timeout or once closed and drained.
        std::optional<T> WaitDequeue(std::chrono::milliseconds timeout)
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait_for(lock, timeout, [this]
                          { return !m_items.empty() || m_closed.load(); });
            return PopLocked();
        }

        QueueStats GetStats() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            QueueStats result = m_stats;
            result.current_depth = m_items.size();
            result.limit = m_limit;
            return result;
        }

        size_t Size() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_items.size();
        }

        void Close()
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_closed.store(true);
            }
            m_cv.notify_all();
        }

        bool IsClosed() const { return m_closed.load(); }

    private:
        std::optional<T> PopLocked()
        {
            if (m_items.empty())
                return std::nullopt;

            T value = std::move(m_items.front());
            m_items.pop_front();
            m_stats.total_delivered++;
            return value;
        }

        size_t m_limit;
        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        std::deque<T> m_items;
        std::atomic<bool> m_closed{false};
        QueueStats m_stats;
    };
}
