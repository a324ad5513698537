#include "EchoSweep.hpp"

#include <tins/tins.h>
#include <atomic>
#include <iostream>
#include <memory>
#include <mutex>
#include <poll.h>
#include <set>
#include <stdexcept>
#include <thread>
#include <unistd.h>

namespace lanwatch::discovery
{
    std::vector<ProbeResult> EchoSweep::Probe(const ProbeRequest &request)
    {
        if (geteuid() != 0)
            throw std::runtime_error("echo sweep needs raw socket privileges (run as root)");

        Tins::NetworkInterface iface = request.interface.empty()
                                           ? Tins::NetworkInterface::default_interface()
                                           : Tins::NetworkInterface(request.interface);
        std::string own_ip = iface.info().ip_addr.to_string();
        const std::uint16_t identifier = static_cast<std::uint16_t>(::getpid() & 0xFFFF);

        std::set<std::string> alive;
        std::mutex alive_mutex;

        Tins::SnifferConfiguration config;
        config.set_promisc_mode(false);
        config.set_immediate_mode(true);
        config.set_filter("icmp and icmp[icmptype] == icmp-echoreply");
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

                    const Tins::IP *ip = pdu->find_pdu<Tins::IP>();
                    const Tins::ICMP *icmp = pdu->find_pdu<Tins::ICMP>();
                    if (!ip || !icmp || icmp->type() != Tins::ICMP::ECHO_REPLY || icmp->id() != identifier)
                        continue;

                    std::lock_guard<std::mutex> lock(alive_mutex);
                    alive.insert(ip->src_addr().to_string());
                }
                catch (const std::exception &e)
                {
                    std::cerr << "[Echo] Capture error: " << e.what() << "\n";
                }
            } });

        auto deadline = std::chrono::steady_clock::now() + request.timeout;
        std::uint16_t sequence = 0;

        for (std::uint32_t host : request.range.Hosts(request.max_hosts))
        {
            if (std::chrono::steady_clock::now() >= deadline)
                break;

            std::string target = common::Ipv4ToString(host);
            if (target == own_ip)
                continue;

            try
            {
                Tins::IP packet = Tins::IP(target) / Tins::ICMP();
                Tins::ICMP &icmp = packet.rfind_pdu<Tins::ICMP>();
                icmp.type(Tins::ICMP::ECHO_REQUEST);
                icmp.id(identifier);
                icmp.sequence(++sequence);
                sender.send(packet);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Echo] Send to " << target << " failed: " << e.what() << "\n";
            }

            std::this_thread::sleep_for(std::chrono::microseconds(300));
        }

        std::this_thread::sleep_until(deadline);
        stop_sniffer = true;
        if (sniffer_thread.joinable())
            sniffer_thread.join();

        std::vector<ProbeResult> results;
        for (const auto &ip : alive)
        {
            if (!request.range.Contains(common::Ipv4FromString(ip)))
                continue;

            ProbeResult result;
            result.ip = ip;
            result.source = ProbeMethod::Echo;
            results.push_back(result);
        }

        std::cout << "[Echo] " << results.size() << " hosts answered\n";
        return results;
    }
}
