#include "EventHub.hpp"

#include <algorithm>
#include <iostream>

namespace lanwatch::hub
{
    Subscription::Subscription(std::uint64_t id, size_t queue_limit)
        : m_id(id), m_queue(queue_limit)
    {
    }

    std::optional<common::Event> Subscription::Next(std::chrono::milliseconds timeout)
    {
        return m_queue.WaitDequeue(timeout);
    }

    std::optional<common::Event> Subscription::TryNext()
    {
        return m_queue.TryDequeue();
    }

    EventHub::EventHub(size_t queue_limit) : m_queue_limit(queue_limit)
    {
    }

    EventHub::~EventHub()
    {
        CloseAll();
    }

    SubscriptionPtr EventHub::Subscribe()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto subscription = std::make_shared<Subscription>(m_next_id++, m_queue_limit);
        m_subscribers.push_back(subscription);
        std::cout << "[Hub] Subscriber " << subscription->Id() << " attached. Total: " << m_subscribers.size() << "\n";
        return subscription;
    }

    void EventHub::Unsubscribe(const SubscriptionPtr &subscription)
    {
        if (!subscription)
            return;

        subscription->Close();

        std::lock_guard<std::mutex> lock(m_mutex);
        m_subscribers.erase(
            std::remove_if(m_subscribers.begin(), m_subscribers.end(),
                           [&](const std::weak_ptr<Subscription> &w)
                           {
                               auto s = w.lock();
                               return !s || s == subscription;
                           }),
            m_subscribers.end());
        std::cout << "[Hub] Subscriber " << subscription->Id() << " detached. Total: " << m_subscribers.size() << "\n";
    }

    size_t EventHub::Publish(const common::Event &event)
    {
        std::vector<std::weak_ptr<Subscription>> targets;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            targets = m_subscribers;
        }

        size_t delivered = 0;
        std::vector<std::weak_ptr<Subscription>> dead;

        for (const auto &weak : targets)
        {
            auto subscription = weak.lock();
            if (!subscription)
            {
                dead.push_back(weak);
                continue;
            }

            EnqueueResult result = subscription->m_queue.Enqueue(event);
            if (result == EnqueueResult::Disconnected)
            {
                dead.push_back(weak);
                continue;
            }

            ++delivered;
        }

        if (!dead.empty())
            Reap(dead);

        return delivered;
    }

    void EventHub::Reap(const std::vector<std::weak_ptr<Subscription>> &dead)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        size_t before = m_subscribers.size();

        m_subscribers.erase(
            std::remove_if(m_subscribers.begin(), m_subscribers.end(),
                           [&](const std::weak_ptr<Subscription> &w)
                           {
                               return std::any_of(dead.begin(), dead.end(),
                                                  [&](const std::weak_ptr<Subscription> &d)
                                                  {
                                                      return !w.owner_before(d) && !d.owner_before(w);
                                                  });
                           }),
            m_subscribers.end());

        size_t removed = before - m_subscribers.size();
        if (removed > 0)
            std::cout << "[Hub] Released " << removed << " disconnected subscriber(s). Total: " << m_subscribers.size() << "\n";
    }

    size_t EventHub::SubscriberCount() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_subscribers.size();
    }

    void EventHub::CloseAll()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto &weak : m_subscribers)
        {
            if (auto subscription = weak.lock())
                subscription->Close();
        }
        m_subscribers.clear();
    }
}
