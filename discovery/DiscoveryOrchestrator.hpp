#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "../common/Device.hpp"
#include "Prober.hpp"

namespace lanwatch::discovery
{
    // Probe results of one identity after merging.
    struct MergedSighting
    {
        std::string ip;
        std::optional<std::string> mac;
        std::optional<std::string> name;
        std::set<std::string> tags;
    };

    // Groups by hardware address, falling back to network address. Address-only results for an
    // address that some result resolved to a hardware address join that group. Fields are
    // first-non-empty-wins in ARP > mDNS > echo order.
    std::vector<MergedSighting> MergeProbeResults(const std::vector<ProbeResult> &results);

    struct DiscoveredDevice
    {
        common::Device device;
        bool is_new = false;
        bool changed = false; // refreshed device whose address, hardware address or hostname moved
    };

    struct DiscoveryBatch
    {
        std::vector<DiscoveredDevice> devices;
        bool degraded = false;
        std::vector<std::string> failed_methods;

        size_t NewCount() const;
    };

    // Classifies merged sightings against an inventory snapshot. Pure; no probing.
    DiscoveryBatch ClassifySightings(const std::vector<MergedSighting> &sightings,
                                     const std::vector<common::Device> &snapshot,
                                     common::Timestamp now);

    // Runs the three probers concurrently and merges their results.
    class DiscoveryOrchestrator
    {
    public:
        // A null slot counts as a failed method. grace is extra waiting on top of each prober's timeout.
        DiscoveryOrchestrator(std::shared_ptr<Prober> arp,
                              std::shared_ptr<Prober> mdns,
                              std::shared_ptr<Prober> echo,
                              std::chrono::milliseconds grace = std::chrono::milliseconds(1000));

        DiscoveryBatch Discover(const common::AddressRange &range,
                                const std::string &interface_name,
                                std::chrono::milliseconds per_method_timeout,
                                const std::vector<common::Device> &snapshot,
                                size_t max_hosts = common::AddressRange::DEFAULT_MAX_HOSTS);

    private:
        std::shared_ptr<Prober> m_slots[3];
        std::chrono::milliseconds m_grace;
    };
}
