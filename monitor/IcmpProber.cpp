#include "IcmpProber.hpp"

#include <tins/tins.h>
#include <iostream>
#include <memory>
#include <poll.h>
#include <unistd.h>

namespace lanwatch::monitor
{
    IcmpProber::IcmpProber(std::string interface_name)
        : m_interface(std::move(interface_name)),
          m_identifier(static_cast<std::uint16_t>(::getpid() & 0xFFFF))
    {
    }

    std::optional<double> IcmpProber::Probe(const std::string &ip, std::chrono::milliseconds timeout)
    {
        std::uint16_t sequence = ++m_sequence;

        try
        {
            Tins::NetworkInterface iface = m_interface.empty()
                                               ? Tins::NetworkInterface::default_interface()
                                               : Tins::NetworkInterface(m_interface);

            Tins::SnifferConfiguration config;
            config.set_promisc_mode(false);
            config.set_immediate_mode(true);
            config.set_filter("icmp[icmptype] == icmp-echoreply and src host " + ip);
            config.set_timeout(50);

            Tins::Sniffer sniffer(iface.name(), config);

            Tins::IP packet = Tins::IP(ip) / Tins::ICMP();
            Tins::ICMP &icmp = packet.rfind_pdu<Tins::ICMP>();
            icmp.type(Tins::ICMP::ECHO_REQUEST);
            icmp.id(m_identifier);
            icmp.sequence(sequence);

            Tins::PacketSender sender;

            auto start = std::chrono::steady_clock::now();
            auto deadline = start + timeout;
            sender.send(packet);

            while (true)
            {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
                if (remaining.count() <= 0)
                    return std::nullopt;

                pollfd pfd{sniffer.get_fd(), POLLIN, 0};
                int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
                if (ready <= 0)
                    return std::nullopt;

                Tins::PtrPacket captured = sniffer.next_packet();
                std::unique_ptr<Tins::PDU> pdu(captured.release_pdu());
                if (!pdu)
                    continue;

                const Tins::ICMP *reply = pdu->find_pdu<Tins::ICMP>();
                if (reply && reply->type() == Tins::ICMP::ECHO_REPLY &&
                    reply->id() == m_identifier && reply->sequence() == sequence)
                {
                    std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - start;
                    return elapsed.count();
                }
            }
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Monitor] Echo probe to " << ip << " failed: " << e.what() << "\n";
        }
        return std::nullopt;
    }
}
