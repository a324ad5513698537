#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

#include "../common/Config.hpp"
#include "../discovery/ArpSweep.hpp"
#include "../discovery/EchoSweep.hpp"
#include "../discovery/MdnsBrowser.hpp"
#include "../identify/OuiTable.hpp"
#include "../identify/SnmpClient.hpp"
#include "../monitor/IcmpProber.hpp"
#include "../monitor/MonitoringScheduler.hpp"
#include "../storage/SqliteStore.hpp"
#include "DiscoveryCycle.hpp"
#include "EventStreamServer.hpp"

namespace
{
    std::atomic<bool> g_shutdown{false};

    void HandleSignal(int)
    {
        g_shutdown = true;
    }

    void PrintUsage()
    {
        std::cerr << "Usage: lanwatchd [--key=value ...]\nKeys:";
        for (const auto &key : lanwatch::common::Config::Keys())
            std::cerr << " " << key;
        std::cerr << "\nEach key can also be set as LANWATCH_<KEY> in the environment.\n";
    }
}

int main(int argc, char *argv[])
{
    using namespace lanwatch;

    common::Config config;
    try
    {
        config.ApplyEnvironment();
        auto unknown = config.ApplyArguments(argc, argv);
        if (!unknown.empty())
        {
            for (const auto &arg : unknown)
                std::cerr << "Unknown option: " << arg << "\n";
            PrintUsage();
            return 2;
        }
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "Invalid configuration: " << e.what() << '\n';
        return 2;
    }

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    try
    {
        storage::SqliteStore store;
        if (!store.Initialize(config.db_path))
        {
            std::cerr << "Fatal: cannot open database " << config.db_path << '\n';
            return -1;
        }

        identify::OuiTable oui;
        if (config.use_vendor)
            oui.LoadFile(config.oui_cache_path);

        identify::SnmpOptions snmp_options;
        snmp_options.community = config.snmp_community;
        snmp_options.port = config.snmp_port;
        snmp_options.timeout = config.snmp_timeout;
        identify::SnmpClient snmp(snmp_options);

        identify::ReverseResolver reverse(config.dns_timeout);
        std::cout << "[Main] Reverse lookups via " << reverse.Nameserver() << "\n";

        identify::IdentificationResolver resolver(&oui, &snmp, &reverse);

        hub::EventHub hub(config.hub_queue_limit);

        monitor::WorkerPool pool(config.worker_count);
        pool.Start();

        discovery::DiscoveryOrchestrator orchestrator(std::make_shared<discovery::ArpSweep>(),
                                                      std::make_shared<discovery::MdnsBrowser>(),
                                                      std::make_shared<discovery::EchoSweep>());

        server::CycleOptions cycle_options;
        cycle_options.network_cidr = config.network_cidr;
        cycle_options.interface = config.interface;
        cycle_options.per_method_timeout = config.discovery_timeout;
        cycle_options.max_hosts = config.max_hosts;
        cycle_options.interval = config.discovery_interval;
        cycle_options.flags.use_vendor = config.use_vendor;
        cycle_options.flags.use_mgmt_protocol = config.use_snmp;
        cycle_options.flags.use_reverse_dns = config.use_reverse_dns;

        server::DiscoveryCycle cycle(orchestrator, resolver, store, hub, &pool, cycle_options,
                                     &discovery::ArpSweep::DetectRange);

        monitor::IcmpProber prober(config.interface);

        monitor::SchedulerOptions scheduler_options;
        scheduler_options.burst_size = config.burst_size;
        scheduler_options.probe_timeout = config.probe_timeout;
        scheduler_options.loss_ceiling = config.loss_ceiling;
        scheduler_options.interval = config.monitor_interval;

        monitor::MonitoringScheduler scheduler(store, store, hub, prober,
                                               config.use_snmp ? &snmp : nullptr,
                                               pool, scheduler_options);

        std::unique_ptr<server::EventStreamServer> stream;
        std::thread stream_thread;
        if (config.stream_port != 0)
        {
            stream = std::make_unique<server::EventStreamServer>(config.stream_port, hub, config.cert_path, config.key_path);
            stream->Init();
            stream_thread = std::thread([&stream]()
                                        { stream->Run(); });
        }

        cycle.Start();
        scheduler.Start();

        std::cout << "[Main] lanwatchd running. Ctrl+C to stop.\n";
        while (!g_shutdown)
            std::this_thread::sleep_for(std::chrono::milliseconds(200));

        std::cout << "[Main] Shutting down...\n";
        scheduler.Stop();
        cycle.Stop();
        if (stream)
        {
            stream->Stop();
            if (stream_thread.joinable())
                stream_thread.join();
        }
        hub.CloseAll();
        pool.Stop();
        store.Shutdown();
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal Server Error: " << e.what() << '\n';
        return -1;
    }

    return 0;
}
