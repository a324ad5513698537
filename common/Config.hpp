#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lanwatch::common
{
    struct Config
    {
        // Discovery
        std::string network_cidr;          // empty: detect from interface
        std::string interface;             // empty: default interface
        std::chrono::milliseconds discovery_timeout{3000};
        std::chrono::seconds discovery_interval{600};
        std::size_t max_hosts = 4096;

        // Identification
        bool use_vendor = true;
        bool use_snmp = true;
        bool use_reverse_dns = true;
        std::string snmp_community = "public";
        std::uint16_t snmp_port = 161;
        std::chrono::milliseconds snmp_timeout{1000};
        std::chrono::milliseconds dns_timeout{2000};
        std::string oui_cache_path = "data/oui_cache.csv";

        // Monitoring
        std::chrono::milliseconds monitor_interval{5000};
        int burst_size = 4;
        std::chrono::milliseconds probe_timeout{2000};
        double loss_ceiling = 1.0;
        std::size_t worker_count = 16;

        // Hub and stream
        std::size_t hub_queue_limit = 1024;
        std::uint16_t stream_port = 8443;  // 0 disables the stream server
        std::string cert_path = "certs/server.crt";
        std::string key_path = "certs/server.key";

        // Storage
        std::string db_path = "data/lanwatch.db";

        // Overlays LANWATCH_<KEY> environment variables. Throws std::invalid_argument on bad values.
        void ApplyEnvironment();

        // Overlays --key=value options; returns arguments that were not recognized.
        std::vector<std::string> ApplyArguments(int argc, char *argv[]);

        // Sets one option by its key (e.g. "network-cidr"). Returns false for an unknown key.
        bool Set(const std::string &key, const std::string &value);

        static std::vector<std::string> Keys();
    };
}
