#include "ArpSweep.hpp"

#include <tins/tins.h>
#include <atomic>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <poll.h>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <unistd.h>

#include "../common/Device.hpp"

namespace lanwatch::discovery
{
    namespace
    {
        constexpr int ATF_COMPLETE = 0x2;

        Tins::NetworkInterface ResolveInterface(const std::string &name)
        {
            return name.empty() ? Tins::NetworkInterface::default_interface() : Tins::NetworkInterface(name);
        }
    }

    std::vector<ProbeResult> ParseArpTable(std::istream &in, const std::string &interface_name)
    {
        std::vector<ProbeResult> results;
        std::string line;
        std::getline(in, line); // header

        while (std::getline(in, line))
        {
            std::stringstream ss(line);
            std::string ip, hw_type, flags, mac, mask, dev;
            if (!(ss >> ip >> hw_type >> flags >> mac >> mask >> dev))
                continue;

            if (!interface_name.empty() && dev != interface_name)
                continue;

            int flag_bits = 0;
            try
            {
                flag_bits = std::stoi(flags, nullptr, 16);
            }
            catch (const std::exception &)
            {
                continue;
            }
            if ((flag_bits & ATF_COMPLETE) == 0)
                continue;

            auto normalized = common::NormalizeMac(mac);
            if (!normalized || *normalized == "00:00:00:00:00:00")
                continue;

            ProbeResult result;
            result.ip = ip;
            result.mac = normalized;
            result.source = ProbeMethod::Arp;
            results.push_back(result);
        }
        return results;
    }

    bool IsSweepTarget(const std::string &ip, const common::AddressRange &range, const std::string &own_ip)
    {
        if (ip == own_ip)
            return false;
        try
        {
            return range.Contains(common::Ipv4FromString(ip));
        }
        catch (const std::invalid_argument &)
        {
            return false;
        }
    }

    common::AddressRange ArpSweep::DetectRange(const std::string &interface_name)
    {
        Tins::NetworkInterface iface = ResolveInterface(interface_name);
        Tins::NetworkInterface::Info info = iface.info();

        std::uint32_t address = common::Ipv4FromString(info.ip_addr.to_string());
        std::uint32_t netmask = common::Ipv4FromString(info.netmask.to_string());
        if (address == 0)
            throw std::runtime_error("interface " + iface.name() + " has no IPv4 address");

        return common::AddressRange::FromInterface(address, netmask);
    }

    std::vector<ProbeResult> ArpSweep::Probe(const ProbeRequest &request)
    {
        if (geteuid() != 0)
            throw std::runtime_error("ARP sweep needs raw socket privileges (run as root)");

        Tins::NetworkInterface iface = ResolveInterface(request.interface);
        Tins::NetworkInterface::Info info = iface.info();
        std::string own_ip = info.ip_addr.to_string();

        std::map<std::string, ProbeResult> found;
        std::mutex found_mutex;

        Tins::SnifferConfiguration config;
        config.set_promisc_mode(false);
        config.set_immediate_mode(true);
        config.set_filter("arp");
        config.set_timeout(100);

        Tins::Sniffer sniffer(iface.name(), config);
        Tins::PacketSender sender;
        std::atomic<bool> stop_sniffer(false);

        std::thread sniffer_thread([&]()
                                   {
            while (!stop_sniffer)
            {
                pollfd pfd{sniffer.get_fd(), POLLIN, 0};
                if (::poll(&pfd, 1, 100) <= 0)
                    continue;

                try
                {
                    Tins::PtrPacket captured = sniffer.next_packet();
                    std::unique_ptr<Tins::PDU> pdu(captured.release_pdu());
                    if (!pdu)
                        continue;

                    const Tins::ARP *arp = pdu->find_pdu<Tins::ARP>();
                    if (!arp || arp->opcode() != Tins::ARP::REPLY)
                        continue;

                    ProbeResult result;
                    result.ip = arp->sender_ip_addr().to_string();
                    result.mac = common::NormalizeMac(arp->sender_hw_addr().to_string());
                    result.source = ProbeMethod::Arp;

                    // Replies to other hosts' requests are on the wire too.
                    if (!IsSweepTarget(result.ip, request.range, own_ip))
                        continue;

                    std::lock_guard<std::mutex> lock(found_mutex);
                    found.emplace(result.ip, result);
                }
                catch (const std::exception &e)
                {
                    std::cerr << "[ARP] Capture error: " << e.what() << "\n";
                }
            } });

        auto deadline = std::chrono::steady_clock::now() + request.timeout;
        size_t sent = 0;

        for (std::uint32_t host : request.range.Hosts(request.max_hosts))
        {
            if (std::chrono::steady_clock::now() >= deadline)
                break;

            std::string target = common::Ipv4ToString(host);
            if (target == own_ip)
                continue;

            try
            {
                Tins::EthernetII eth = Tins::EthernetII("ff:ff:ff:ff:ff:ff", info.hw_addr) /
                                       Tins::ARP(Tins::IPv4Address(target), info.ip_addr, Tins::HWAddress<6>("00:00:00:00:00:00"), info.hw_addr);
                sender.send(eth, iface);
                ++sent;
            }
            catch (const std::exception &e)
            {
                std::cerr << "[ARP] Send to " << target << " failed: " << e.what() << "\n";
            }

            std::this_thread::sleep_for(std::chrono::microseconds(300));
        }

        std::this_thread::sleep_until(deadline);
        stop_sniffer = true;
        if (sniffer_thread.joinable())
            sniffer_thread.join();

        std::ifstream arp_file("/proc/net/arp");
        if (arp_file.is_open())
        {
            for (const auto &cached : ParseArpTable(arp_file, iface.name()))
            {
                if (IsSweepTarget(cached.ip, request.range, own_ip))
                    found.emplace(cached.ip, cached);
            }
        }

        std::vector<ProbeResult> results;
        for (auto &kv : found)
            results.push_back(kv.second);

        std::cout << "[ARP] Sent " << sent << " requests on " << iface.name() << ", " << results.size() << " hosts answered\n";
        return results;
    }
}
