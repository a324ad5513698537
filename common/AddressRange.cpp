#include "AddressRange.hpp"

#include <arpa/inet.h>
#include <iostream>
#include <stdexcept>

namespace lanwatch::common
{
    namespace
    {
        std::uint32_t MaskFor(int prefix)
        {
            if (prefix == 0)
                return 0;
            return ~std::uint32_t(0) << (32 - prefix);
        }
    }

    std::string Ipv4ToString(std::uint32_t address)
    {
        struct in_addr addr;
        addr.s_addr = htonl(address);
        char buf[INET_ADDRSTRLEN];
        if (inet_ntop(AF_INET, &addr, buf, sizeof(buf)) == nullptr)
            return "";
        return buf;
    }

    std::uint32_t Ipv4FromString(const std::string &text)
    {
        struct in_addr addr;
        if (inet_pton(AF_INET, text.c_str(), &addr) != 1)
            throw std::invalid_argument("Invalid IPv4 address: '" + text + "'");
        return ntohl(addr.s_addr);
    }

    AddressRange::AddressRange(std::uint32_t network, int prefix)
        : m_network(network & MaskFor(prefix)), m_prefix(prefix)
    {
    }

    AddressRange AddressRange::Parse(const std::string &cidr)
    {
        auto slash = cidr.find('/');
        if (slash == std::string::npos)
            throw std::invalid_argument("Address range must be CIDR notation: '" + cidr + "'");

        std::uint32_t address = Ipv4FromString(cidr.substr(0, slash));

        std::string prefix_text = cidr.substr(slash + 1);
        if (prefix_text.empty() || prefix_text.size() > 2 ||
            prefix_text.find_first_not_of("0123456789") != std::string::npos)
            throw std::invalid_argument("Invalid prefix length in '" + cidr + "'");

        int prefix = std::stoi(prefix_text);
        if (prefix < 0 || prefix > 32)
            throw std::invalid_argument("Prefix length out of range in '" + cidr + "'");

        return AddressRange(address, prefix);
    }

    AddressRange AddressRange::FromInterface(std::uint32_t address, std::uint32_t netmask)
    {
        int prefix = 0;
        for (std::uint32_t m = netmask; m & 0x80000000u; m <<= 1)
            ++prefix;
        return AddressRange(address, prefix);
    }

    std::uint32_t AddressRange::Broadcast() const
    {
        return m_network | ~MaskFor(m_prefix);
    }

    bool AddressRange::Contains(std::uint32_t address) const
    {
        return (address & MaskFor(m_prefix)) == m_network;
    }

    size_t AddressRange::HostCount() const
    {
        if (m_prefix == 32)
            return 1;
        if (m_prefix == 31)
            return 2;
        std::uint64_t total = std::uint64_t(1) << (32 - m_prefix);
        return static_cast<size_t>(total - 2);
    }

    std::vector<std::uint32_t> AddressRange::Hosts(size_t max_hosts) const
    {
        std::vector<std::uint32_t> hosts;

        std::uint32_t first = m_network;
        std::uint32_t last = Broadcast();
        if (m_prefix < 31)
        {
            first += 1;
            last -= 1;
        }

        size_t count = HostCount();
        if (count > max_hosts)
        {
            std::cerr << "[AddressRange] " << ToString() << " has " << count
                      << " hosts, truncating to " << max_hosts << "\n";
            count = max_hosts;
        }

        hosts.reserve(count);
        for (std::uint64_t a = first; a <= last && hosts.size() < count; ++a)
            hosts.push_back(static_cast<std::uint32_t>(a));

        return hosts;
    }

    std::string AddressRange::ToString() const
    {
        return Ipv4ToString(m_network) + "/" + std::to_string(m_prefix);
    }
}
