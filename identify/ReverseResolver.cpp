#include "ReverseResolver.hpp"

#include "../common/DnsMessage.hpp"
#include "../common/UdpSocket.hpp"

#include <fstream>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>

namespace lanwatch::identify
{
    ReverseResolver::ReverseResolver(std::chrono::milliseconds timeout, std::string nameserver)
        : m_timeout(timeout), m_nameserver(std::move(nameserver))
    {
        if (m_nameserver.empty())
            m_nameserver = SystemNameserver();
    }

    std::string ReverseResolver::SystemNameserver(const std::string &resolv_conf)
    {
        std::ifstream file(resolv_conf);
        std::string line;

        while (std::getline(file, line))
        {
            std::stringstream ss(line);
            std::string keyword, address;
            ss >> keyword >> address;
            // IPv4 only
            if (keyword == "nameserver" && address.find(':') == std::string::npos && !address.empty())
                return address;
        }
        return "127.0.0.53";
    }

    std::optional<std::string> ReverseResolver::Reverse(const std::string &ip)
    {
        std::string query_name;
        try
        {
            query_name = common::dns::ReversePointerName(ip);
        }
        catch (const std::invalid_argument &e)
        {
            std::cerr << "[DNS] " << e.what() << "\n";
            return std::nullopt;
        }

        static thread_local std::mt19937 rng{std::random_device{}()};
        std::uint16_t id = static_cast<std::uint16_t>(rng() & 0xFFFF);

        try
        {
            common::UdpSocket socket;
            auto query = common::dns::EncodeQuery(id, {{query_name, common::dns::PTR, common::dns::CLASS_IN}}, true);
            if (!socket.SendTo(m_nameserver, 53, query))
                return std::nullopt;

            auto deadline = std::chrono::steady_clock::now() + m_timeout;
            while (auto dgram = socket.ReceiveUntil(deadline))
            {
                auto msg = common::dns::Decode(dgram->data);
                if (!msg || !msg->IsResponse() || msg->id != id)
                    continue;
                if (msg->rcode != 0)
                    return std::nullopt;

                for (const auto &rr : msg->answers)
                {
                    if (rr.type == common::dns::PTR && !rr.target.empty())
                        return rr.target;
                }
                return std::nullopt;
            }
        }
        catch (const std::exception &e)
        {
            std::cerr << "[DNS] Reverse lookup of " << ip << " failed: " << e.what() << "\n";
        }
        return std::nullopt;
    }
}
