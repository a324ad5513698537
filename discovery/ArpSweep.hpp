#pragma once

#include <istream>

#include "Prober.hpp"

namespace lanwatch::discovery
{
    // ARP who-has sweep over libtins, topped up with the kernel neighbour cache.
    class ArpSweep : public Prober
    {
    public:
        ProbeMethod Method() const override { return ProbeMethod::Arp; }
        std::vector<ProbeResult> Probe(const ProbeRequest &request) override;

        // Range of the interface's own address and netmask. Throws std::runtime_error
        // when the interface has no IPv4 configuration.
        static common::AddressRange DetectRange(const std::string &interface_name);
    };

    // True for a well-formed address inside the swept range other than our own.
    bool IsSweepTarget(const std::string &ip, const common::AddressRange &range, const std::string &own_ip);

    // Complete /proc/net/arp entries on the given interface (any interface when empty).
    std::vector<ProbeResult> ParseArpTable(std::istream &in, const std::string &interface_name);
}
