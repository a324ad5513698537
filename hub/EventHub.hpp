#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "../common/Event.hpp"
#include "SubscriberQueue.hpp"

namespace lanwatch::hub
{
    class EventHub;

    // One observer's view of the hub. Closing it (or dropping the last reference)
    // detaches it; the hub notices on its next publish and releases its slot.
    class Subscription
    {
    public:
        Subscription(std::uint64_t id, size_t queue_limit);

        std::uint64_t Id() const { return m_id; }

        std::optional<common::Event> Next(std::chrono::milliseconds timeout);
        std::optional<common::Event> TryNext();

        void Close() { m_queue.Close(); }
        bool IsClosed() const { return m_queue.IsClosed(); }

        QueueStats Stats() const { return m_queue.GetStats(); }

    private:
        friend class EventHub;

        std::uint64_t m_id;
        SubscriberQueue<common::Event> m_queue;
    };

    using SubscriptionPtr = std::shared_ptr<Subscription>;

    class EventHub
    {
    public:
        explicit EventHub(size_t queue_limit = 1024);
        ~EventHub();

        EventHub(const EventHub &) = delete;
        EventHub &operator=(const EventHub &) = delete;

        SubscriptionPtr Subscribe();
        void Unsubscribe(const SubscriptionPtr &subscription);

        // Delivers to every live subscriber without waiting for any of them.
        // Returns the number of subscribers that received the event.
        size_t Publish(const common::Event &event);

        // Registered slots, including closed ones not yet released by a publish.
        size_t SubscriberCount() const;

        // Closes every subscription, e.g. on shutdown.
        void CloseAll();

    private:
        void Reap(const std::vector<std::weak_ptr<Subscription>> &dead);

        size_t m_queue_limit;
        mutable std::mutex m_mutex;
        std::vector<std::weak_ptr<Subscription>> m_subscribers;
        std::uint64_t m_next_id = 1;
    };
}
