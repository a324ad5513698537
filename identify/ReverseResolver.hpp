#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace lanwatch::identify
{
    class ReverseLookup
    {
    public:
        virtual ~ReverseLookup() = default;

        // PTR name for an IPv4 address, or nullopt.
        virtual std::optional<std::string> Reverse(const std::string &ip) = 0;
    };

    // PTR queries over UDP to a single nameserver.
    class ReverseResolver : public ReverseLookup
    {
    public:
        // Empty nameserver: the first "nameserver" line of /etc/resolv.conf.
        ReverseResolver(std::chrono::milliseconds timeout, std::string nameserver = "");

        std::optional<std::string> Reverse(const std::string &ip) override;

        const std::string &Nameserver() const { return m_nameserver; }

        static std::string SystemNameserver(const std::string &resolv_conf = "/etc/resolv.conf");

    private:
        std::chrono::milliseconds m_timeout;
        std::string m_nameserver;
    };
}
