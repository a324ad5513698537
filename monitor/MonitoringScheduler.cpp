#include "MonitoringScheduler.hpp"

#include <future>
#include <iostream>
#include <stdexcept>

namespace lanwatch::monitor
{
    using common::Clock;
    using common::DeviceStatus;

    MonitoringScheduler::MonitoringScheduler(storage::InventorySink &inventory,
                                             storage::MetricsSink &metrics,
                                             hub::EventHub &hub,
                                             ReachabilityProber &prober,
                                             identify::ManagementClient *management,
                                             WorkerPool &pool,
                                             SchedulerOptions options)
        : m_inventory(inventory), m_metrics(metrics), m_hub(hub), m_prober(prober),
          m_management(management), m_pool(pool), m_options(options)
    {
        if (m_options.burst_size < 1)
            throw std::invalid_argument("burst size must be at least 1");
        if (!(m_options.loss_ceiling > 0.0 && m_options.loss_ceiling <= 1.0))
            throw std::invalid_argument("loss ceiling must be in (0, 1]");
    }

    MonitoringScheduler::~MonitoringScheduler()
    {
        Stop();
    }

    void MonitoringScheduler::Tick(const std::vector<std::string> &device_ids)
    {
        std::vector<std::future<void>> pending;
        pending.reserve(device_ids.size());

        for (const auto &id : device_ids)
        {
            pending.push_back(m_pool.Submit([this, id]()
                                            { TickDevice(id); }));
        }

        for (size_t i = 0; i < pending.size(); ++i)
        {
            try
            {
                pending[i].get();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Monitor] Tick for " << device_ids[i] << " failed: " << e.what() << "\n";
            }
        }
    }

    std::vector<HealthSample> MonitoringScheduler::RunBurst(const std::string &ip)
    {
        std::vector<HealthSample> samples;
        samples.reserve(m_options.burst_size);

        for (int i = 0; i < m_options.burst_size; ++i)
        {
            HealthSample sample;
            sample.rtt_ms = m_prober.Probe(ip, m_options.probe_timeout);
            sample.ts = Clock::now();
            samples.push_back(sample);
        }
        return samples;
    }

    TickResult MonitoringScheduler::TickDevice(const std::string &device_id)
    {
        TickResult result;

        auto token = m_target_lock.TryAcquire(device_id);
        if (!token)
        {
            std::cerr << "[Monitor] Tick for " << device_id << " still running, request rejected\n";
            return result;
        }

        auto device = m_inventory.Get(device_id);
        if (!device)
        {
            std::cerr << "[Monitor] Unknown device " << device_id << "\n";
            return result;
        }

        m_bandwidth.BeginTick(device_id);
        result.burst = AggregateBurst(RunBurst(device->ip));
        auto now = Clock::now();

        bool succeeded = result.burst.received > 0 && result.burst.loss < m_options.loss_ceiling;
        result.transition = m_states.Apply(device_id, succeeded);

        // Status change goes out before the latency sample that caused it.
        if (result.transition == Transition::WentUp)
        {
            std::cout << "[Monitor] " << device_id << " is up\n";
            m_hub.Publish(common::DeviceUp{device_id, now});
        }
        else if (result.transition == Transition::WentDown)
        {
            std::cout << "[Monitor] " << device_id << " is down\n";
            m_hub.Publish(common::DeviceDown{device_id, now});
        }

        common::Latency latency;
        latency.device_id = device_id;
        latency.ms = result.burst.avg_ms.value_or(0.0);
        latency.min_ms = result.burst.min_ms.value_or(0.0);
        latency.max_ms = result.burst.max_ms.value_or(0.0);
        latency.loss = result.burst.loss;
        latency.ts = now;
        m_hub.Publish(latency);

        if (!m_metrics.Write("latency", {{"device_id", device_id}},
                             {{"ms", latency.ms}, {"min_ms", latency.min_ms}, {"max_ms", latency.max_ms}, {"loss", latency.loss}},
                             now))
        {
            std::cerr << "[Monitor] Failed to store latency for " << device_id << "\n";
        }

        // Discovery may have rewritten the record during the burst; only status and last_seen are ours.
        std::optional<common::Timestamp> last_seen;
        if (result.burst.received > 0)
            last_seen = now;
        if (!m_inventory.UpdateStatus(device_id, succeeded ? DeviceStatus::Up : DeviceStatus::Down, last_seen))
            std::cerr << "[Monitor] Failed to persist status of " << device_id << "\n";

        if (succeeded && m_management)
        {
            auto current = m_inventory.Get(device_id);
            if (current && current->HasTag("snmp"))
                result.bandwidth_points = PollCounters(*current);
        }

        result.ran = true;
        return result;
    }

    size_t MonitoringScheduler::PollCounters(const common::Device &device)
    {
        size_t points = 0;
        auto interfaces = m_management->InterfaceTable(device.ip);
        auto now = Clock::now();

        for (const auto &entry : interfaces)
        {
            CounterSample sample;
            sample.device_id = device.id;
            sample.if_index = entry.if_index;
            sample.in_octets = entry.in_octets;
            sample.out_octets = entry.out_octets;
            sample.counter_width = entry.counter_width;
            sample.ts = now;

            auto bandwidth = m_bandwidth.Feed(sample);
            if (!bandwidth)
                continue;

            m_hub.Publish(*bandwidth);
            if (!m_metrics.Write("bandwidth",
                                 {{"device_id", device.id}, {"if_index", std::to_string(entry.if_index)}},
                                 {{"in_bps", bandwidth->in_bps}, {"out_bps", bandwidth->out_bps}},
                                 now))
            {
                std::cerr << "[Monitor] Failed to store bandwidth for " << device.id << "\n";
            }
            ++points;
        }
        return points;
    }

    void MonitoringScheduler::Start()
    {
        if (m_running)
            return;
        m_running = true;
        m_thread = std::thread(&MonitoringScheduler::Loop, this);
        std::cout << "[Monitor] Scheduler started, interval " << m_options.interval.count() << " ms\n";
    }

    void MonitoringScheduler::Stop()
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
        std::cout << "[Monitor] Scheduler stopped\n";
    }

    void MonitoringScheduler::Loop()
    {
        while (m_running)
        {
            std::vector<std::string> ids;
            for (const auto &device : m_inventory.List())
                ids.push_back(device.id);

            try
            {
                Tick(ids);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Monitor] Tick failed: " << e.what() << "\n";
            }

            std::unique_lock<std::mutex> lock(m_wait_mutex);
            m_wait_cv.wait_for(lock, m_options.interval, [this]
                               { return !m_running; });
        }
    }
}
