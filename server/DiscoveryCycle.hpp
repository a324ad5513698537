#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "../discovery/DiscoveryOrchestrator.hpp"
#include "../hub/EventHub.hpp"
#include "../identify/IdentificationResolver.hpp"
#include "../monitor/TargetLock.hpp"
#include "../monitor/WorkerPool.hpp"
#include "../storage/InventorySink.hpp"

namespace lanwatch::server
{
    struct CycleOptions
    {
        std::string network_cidr; // empty: range of the interface
        std::string interface;
        std::chrono::milliseconds per_method_timeout{3000};
        size_t max_hosts = common::AddressRange::DEFAULT_MAX_HOSTS;
        std::chrono::seconds interval{600};
        identify::IdentificationFlags flags;
    };

    struct CycleReport
    {
        bool ran = false; // false when a cycle for the same range was still running
        std::string range;
        size_t device_count = 0;
        size_t new_count = 0;
        size_t identified = 0;
        bool degraded = false;
        std::vector<std::string> failed_methods;
    };

    // snapshot -> discover -> identify new/changed -> upsert -> publish device_discovered.
    class DiscoveryCycle
    {
    public:
        using RangeDetector = std::function<common::AddressRange(const std::string &)>;

        // pool may be null; identification then runs on the calling thread.
        DiscoveryCycle(discovery::DiscoveryOrchestrator &orchestrator,
                       identify::IdentificationResolver &resolver,
                       storage::InventorySink &inventory,
                       hub::EventHub &hub,
                       monitor::WorkerPool *pool,
                       CycleOptions options,
                       RangeDetector detect_range);
        ~DiscoveryCycle();

        DiscoveryCycle(const DiscoveryCycle &) = delete;
        DiscoveryCycle &operator=(const DiscoveryCycle &) = delete;

        // Throws std::invalid_argument for a malformed range.
        CycleReport RunOnce();

        // Runs a cycle now and then every interval until Stop().
        void Start();
        void Stop();

    private:
        void Loop();
        void IdentifyAll(std::vector<discovery::DiscoveredDevice *> &targets);

        discovery::DiscoveryOrchestrator &m_orchestrator;
        identify::IdentificationResolver &m_resolver;
        storage::InventorySink &m_inventory;
        hub::EventHub &m_hub;
        monitor::WorkerPool *m_pool;
        CycleOptions m_options;
        RangeDetector m_detect_range;
        monitor::TargetLock m_target_lock;

        std::atomic<bool> m_running{false};
        std::thread m_thread;
        std::mutex m_wait_mutex;
        std::condition_variable m_wait_cv;
    };
}
