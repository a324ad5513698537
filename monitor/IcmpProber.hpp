#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include "ReachabilityProber.hpp"

namespace lanwatch::monitor
{
    // ICMP echo over libtins. Needs raw socket privileges.
    class IcmpProber : public ReachabilityProber
    {
    public:
        // Empty interface name selects the default interface.
        explicit IcmpProber(std::string interface_name = "");

        std::optional<double> Probe(const std::string &ip, std::chrono::milliseconds timeout) override;

    private:
        std::string m_interface;
        std::uint16_t m_identifier;
        std::atomic<std::uint16_t> m_sequence{0};
    };
}
