#include "DiscoveryCycle.hpp"

#include <future>
#include <iostream>

namespace lanwatch::server
{
    DiscoveryCycle::DiscoveryCycle(discovery::DiscoveryOrchestrator &orchestrator,
                                   identify::IdentificationResolver &resolver,
                                   storage::InventorySink &inventory,
                                   hub::EventHub &hub,
                                   monitor::WorkerPool *pool,
                                   CycleOptions options,
                                   RangeDetector detect_range)
        : m_orchestrator(orchestrator), m_resolver(resolver), m_inventory(inventory), m_hub(hub),
          m_pool(pool), m_options(std::move(options)), m_detect_range(std::move(detect_range))
    {
    }

    DiscoveryCycle::~DiscoveryCycle()
    {
        Stop();
    }

    void DiscoveryCycle::IdentifyAll(std::vector<discovery::DiscoveredDevice *> &targets)
    {
        auto identify_one = [this](discovery::DiscoveredDevice *entry)
        {
            common::Device &device = entry->device;
            auto record = m_resolver.Identify(device.ip, device.mac, m_options.flags);
            identify::ApplyIdentification(device, record);
        };

        if (!m_pool)
        {
            for (auto *entry : targets)
                identify_one(entry);
            return;
        }

        std::vector<std::future<void>> pending;
        for (auto *entry : targets)
            pending.push_back(m_pool->Submit([identify_one, entry]()
                                             { identify_one(entry); }));

        for (size_t i = 0; i < pending.size(); ++i)
        {
            try
            {
                pending[i].get();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Discovery] Identification of " << targets[i]->device.id << " failed: " << e.what() << "\n";
            }
        }
    }

    CycleReport DiscoveryCycle::RunOnce()
    {
        common::AddressRange range = m_options.network_cidr.empty()
                                         ? m_detect_range(m_options.interface)
                                         : common::AddressRange::Parse(m_options.network_cidr);

        CycleReport report;
        report.range = range.ToString();

        auto token = m_target_lock.TryAcquire(report.range);
        if (!token)
        {
            std::cerr << "[Discovery] Cycle for " << report.range << " still running, request rejected\n";
            return report;
        }

        std::vector<common::Device> snapshot = m_inventory.List();
        discovery::DiscoveryBatch batch = m_orchestrator.Discover(range, m_options.interface, m_options.per_method_timeout,
                                                                  snapshot, m_options.max_hosts);

        std::vector<discovery::DiscoveredDevice *> to_identify;
        for (auto &entry : batch.devices)
        {
            if (entry.is_new || entry.changed)
                to_identify.push_back(&entry);
        }
        IdentifyAll(to_identify);

        for (const auto &entry : batch.devices)
        {
            if (!m_inventory.Upsert(entry.device))
            {
                std::cerr << "[Discovery] Failed to store device " << entry.device.id << "\n";
                continue;
            }

            if (entry.is_new)
                m_hub.Publish(common::DeviceDiscovered{entry.device});
        }

        report.ran = true;
        report.device_count = batch.devices.size();
        report.new_count = batch.NewCount();
        report.identified = to_identify.size();
        report.degraded = batch.degraded;
        report.failed_methods = batch.failed_methods;

        std::cout << "[Discovery] Cycle on " << report.range << " done: " << report.device_count << " devices, "
                  << report.new_count << " new, " << report.identified << " identified";
        if (report.degraded)
        {
            std::cout << " (degraded:";
            for (const auto &m : report.failed_methods)
                std::cout << " " << m;
            std::cout << ")";
        }
        std::cout << "\n";
        return report;
    }

    void DiscoveryCycle::Start()
    {
        if (m_running)
            return;
        m_running = true;
        m_thread = std::thread(&DiscoveryCycle::Loop, this);
    }

    void DiscoveryCycle::Stop()
    {
        {
            std::lock_guard<std::mutex> lock(m_wait_mutex);
            if (!m_running)
                return;
            m_running = false;
        }
        m_wait_cv.notify_all();
        if (m_thread.joinable())
            m_thread.join();
    }

    void DiscoveryCycle::Loop()
    {
        while (m_running)
        {
            try
            {
                RunOnce();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Discovery] Cycle failed: " << e.what() << "\n";
            }

            std::unique_lock<std::mutex> lock(m_wait_mutex);
            m_wait_cv.wait_for(lock, m_options.interval, [this]
                               { return !m_running; });
        }
    }
}
