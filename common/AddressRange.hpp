#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lanwatch::common
{
    // IPv4 CIDR block. Addresses are host byte order.
    class AddressRange
    {
    public:
        static constexpr size_t DEFAULT_MAX_HOSTS = 4096;

        // Throws std::invalid_argument on malformed input.
        static AddressRange Parse(const std::string &cidr);
        static AddressRange FromInterface(std::uint32_t address, std::uint32_t netmask);

        std::uint32_t Network() const { return m_network; }
        int PrefixLength() const { return m_prefix; }
        std::uint32_t Broadcast() const;
        bool Contains(std::uint32_t address) const;

        // Usable host addresses, truncated to max_hosts.
        std::vector<std::uint32_t> Hosts(size_t max_hosts = DEFAULT_MAX_HOSTS) const;
        size_t HostCount() const;

        std::string ToString() const;

    private:
        AddressRange(std::uint32_t network, int prefix);

        std::uint32_t m_network;
        int m_prefix;
    };

    std::string Ipv4ToString(std::uint32_t address);

    // Throws std::invalid_argument when text is not a dotted quad.
    std::uint32_t Ipv4FromString(const std::string &text);
}
