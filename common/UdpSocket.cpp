#include "UdpSocket.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>

namespace lanwatch::common
{
    UdpSocket::UdpSocket()
    {
        m_fd = socket(AF_INET, SOCK_DGRAM, 0);
        if (m_fd < 0)
            throw std::runtime_error(std::string("Failed to create UDP socket: ") + std::strerror(errno));
    }

    UdpSocket::~UdpSocket()
    {
        if (m_fd >= 0)
            close(m_fd);
    }

    void UdpSocket::Bind(std::uint16_t port, bool reuse_address)
    {
        if (reuse_address)
        {
            int opt = 1;
            setsockopt(m_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
#ifdef SO_REUSEPORT
            setsockopt(m_fd, SOL_SOCKET, SO_REUSEPORT, &opt, sizeof(opt));
#endif
        }

        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
        addr.sin_port = htons(port);

        if (bind(m_fd, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) < 0)
            throw std::runtime_error("Failed to bind UDP port " + std::to_string(port) + ": " + std::strerror(errno));
    }

    void UdpSocket::JoinMulticast(const std::string &group)
    {
        struct ip_mreq mreq;
        std::memset(&mreq, 0, sizeof(mreq));
        if (inet_pton(AF_INET, group.c_str(), &mreq.imr_multiaddr) != 1)
            throw std::runtime_error("Invalid multicast group " + group);
        mreq.imr_interface.s_addr = htonl(INADDR_ANY);

        if (setsockopt(m_fd, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) < 0)
            throw std::runtime_error("Failed to join multicast group " + group + ": " + std::strerror(errno));
    }

    void UdpSocket::SetMulticastTtl(int ttl)
    {
        unsigned char value = static_cast<unsigned char>(ttl);
        if (setsockopt(m_fd, IPPROTO_IP, IP_MULTICAST_TTL, &value, sizeof(value)) < 0)
            throw std::runtime_error(std::string("Failed to set multicast TTL: ") + std::strerror(errno));
    }

    bool UdpSocket::SendTo(const std::string &ip, std::uint16_t port, const std::vector<std::uint8_t> &data)
    {
        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1)
            return false;

        ssize_t sent = sendto(m_fd, data.data(), data.size(), 0,
                              reinterpret_cast<const struct sockaddr *>(&addr), sizeof(addr));
        return sent == static_cast<ssize_t>(data.size());
    }

    std::optional<Datagram> UdpSocket::ReceiveUntil(std::chrono::steady_clock::time_point deadline)
    {
        while (true)
        {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0)
                return std::nullopt;

            struct pollfd pfd;
            pfd.fd = m_fd;
            pfd.events = POLLIN;
            pfd.revents = 0;

            int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
            if (ready < 0)
            {
                if (errno == EINTR)
                    continue;
                return std::nullopt;
            }
            if (ready == 0)
                return std::nullopt;

            uint8_t buffer[9000];
            struct sockaddr_in from;
            socklen_t from_len = sizeof(from);
            ssize_t n = recvfrom(m_fd, buffer, sizeof(buffer), 0, reinterpret_cast<struct sockaddr *>(&from), &from_len);
            if (n < 0)
            {
                if (errno == EINTR || errno == EAGAIN)
                    continue;
                return std::nullopt;
            }

            char ip[INET_ADDRSTRLEN] = {0};
            inet_ntop(AF_INET, &from.sin_addr, ip, sizeof(ip));

            Datagram dgram;
            dgram.data.assign(buffer, buffer + n);
            dgram.from_ip = ip;
            dgram.from_port = ntohs(from.sin_port);
            return dgram;
        }
    }
}
