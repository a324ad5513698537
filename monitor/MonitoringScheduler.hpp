#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "../hub/EventHub.hpp"
#include "../identify/ManagementClient.hpp"
#include "../storage/InventorySink.hpp"
#include "../storage/MetricsSink.hpp"
#include "BandwidthEngine.hpp"
#include "DeviceStateMachine.hpp"
#include "PingBurst.hpp"
#include "ReachabilityProber.hpp"
#include "TargetLock.hpp"
#include "WorkerPool.hpp"

namespace lanwatch::monitor
{
    struct SchedulerOptions
    {
        int burst_size = 4;
        std::chrono::milliseconds probe_timeout{2000};
        double loss_ceiling = 1.0;
        std::chrono::milliseconds interval{5000};
    };

    // Outcome of one device tick, mostly for logging and tests.
    struct TickResult
    {
        bool ran = false; // false when the device was unknown or already being ticked
        BurstAggregate burst;
        Transition transition = Transition::None;
        size_t bandwidth_points = 0;
    };

    class MonitoringScheduler
    {
    public:
        // management may be null; interface counters are then never polled.
        // Throws std::invalid_argument for a burst size below 1 or a loss ceiling outside (0, 1].
        MonitoringScheduler(storage::InventorySink &inventory,
                            storage::MetricsSink &metrics,
                            hub::EventHub &hub,
                            ReachabilityProber &prober,
                            identify::ManagementClient *management,
                            WorkerPool &pool,
                            SchedulerOptions options);
        ~MonitoringScheduler();

        MonitoringScheduler(const MonitoringScheduler &) = delete;
        MonitoringScheduler &operator=(const MonitoringScheduler &) = delete;

        // Ticks every device on the worker pool and waits for all of them.
        void Tick(const std::vector<std::string> &device_ids);

        TickResult TickDevice(const std::string &device_id);

        // Ticks every inventory device each interval until Stop().
        void Start();
        void Stop();

        const DeviceStateMachine &States() const { return m_states; }

    private:
        void Loop();
        std::vector<HealthSample> RunBurst(const std::string &ip);
        size_t PollCounters(const common::Device &device);

        storage::InventorySink &m_inventory;
        storage::MetricsSink &m_metrics;
        hub::EventHub &m_hub;
        ReachabilityProber &m_prober;
        identify::ManagementClient *m_management;
        WorkerPool &m_pool;
        SchedulerOptions m_options;

        DeviceStateMachine m_states;
        BandwidthEngine m_bandwidth;
        TargetLock m_target_lock;

        std::atomic<bool> m_running{false};
        std::thread m_thread;
        std::mutex m_wait_mutex;
        std::condition_variable m_wait_cv;
    };
}
